#include "io/XdrFile.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <mutex>
#include <set>
#include <utility>
#include <vector>

#include "util/Logging.hpp"

extern "C" {
#include <xdrfile.h>
#include <xdr_seek.h>
}

namespace xdrtraj {

namespace {

namespace fs = std::filesystem;

// Paths currently held by a Write or Append stream in this process.
class WriterRegistry {
  public:
    static WriterRegistry& instance() {
        static WriterRegistry inst;
        return inst;
    }

    bool acquire(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        return paths_.insert(key).second;
    }

    void release(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        paths_.erase(key);
    }

  private:
    std::mutex mutex_;
    std::set<std::string> paths_;
};

std::string registryKey(const fs::path& path) {
    std::error_code ec;
    fs::path key = fs::weakly_canonical(path, ec);
    if (ec) {
        key = fs::absolute(path, ec).lexically_normal();
        if (ec) {
            key = path.lexically_normal();
        }
    }
    return key.string();
}

const char* modeString(FileMode mode) {
    switch (mode) {
        case FileMode::Read:
            return "r";
        case FileMode::Write:
            return "w";
        case FileMode::Append:
            return "a";
    }
    return "r";
}

}  // namespace

const char* fileModeName(FileMode mode) {
    switch (mode) {
        case FileMode::Read:
            return "read";
        case FileMode::Write:
            return "write";
        case FileMode::Append:
            return "append";
    }
    return "read";
}

XdrFile::~XdrFile() {
    if (file_) {
        Status status = close();
        if (!status.isOk()) {
            logError("Failed to close XDR stream: " + status.toString());
        }
    }
}

XdrFile::XdrFile(XdrFile&& other) noexcept
    : file_(other.file_),
      path_(std::move(other.path_)),
      registryKey_(std::move(other.registryKey_)),
      mode_(other.mode_) {
    other.file_ = nullptr;
    other.registryKey_.clear();
}

XdrFile& XdrFile::operator=(XdrFile&& other) {
    if (this != &other) {
        Status status = close();
        if (!status.isOk()) {
            logError("Failed to close XDR stream: " + status.toString());
        }
        file_ = other.file_;
        path_ = std::move(other.path_);
        registryKey_ = std::move(other.registryKey_);
        mode_ = other.mode_;
        other.file_ = nullptr;
        other.registryKey_.clear();
    }
    return *this;
}

Status XdrFile::open(const std::string& path, FileMode mode) {
    if (file_) {
        return Status::error(ErrorKind::PermissionDenied, "XDR stream is already open").withPath(path_);
    }
    const fs::path p(path);
    std::error_code ec;
    std::string key;
    if (mode == FileMode::Read) {
        if (!fs::exists(p, ec)) {
            return statusFromXdrCode(exdrFILENOTFOUND, "no such trajectory file").withPath(path);
        }
    } else {
        fs::path parent = p.parent_path();
        if (!parent.empty() && !fs::exists(parent, ec)) {
            return statusFromXdrCode(exdrFILENOTFOUND, "directory does not exist").withPath(path);
        }
    }
    if (fs::is_directory(p, ec)) {
        return Status::error(ErrorKind::InvalidFormat, "path is a directory").withPath(path);
    }
    if (mode != FileMode::Read) {
        key = registryKey(p);
        if (!WriterRegistry::instance().acquire(key)) {
            return Status::error(ErrorKind::PermissionDenied, "file is already open for writing in this process")
                .withPath(path);
        }
    }

    errno = 0;
    XDRFILE* handle = xdrfile_open(path.c_str(), modeString(mode));
    if (!handle) {
        const int err = errno;
        if (!key.empty()) {
            WriterRegistry::instance().release(key);
        }
        const std::string reason = err != 0 ? std::strerror(err) : "xdrfile_open failed";
        if (err == EACCES || err == EPERM || err == EROFS) {
            return Status::error(ErrorKind::PermissionDenied, reason).withPath(path);
        }
        if (err == 0 || err == ENOENT || err == ENOTDIR) {
            return statusFromXdrCode(exdrFILENOTFOUND, "cannot open: " + reason).withPath(path);
        }
        return Status::error(ErrorKind::CodecFailure, "cannot open: " + reason).withPath(path);
    }

    file_ = handle;
    path_ = path;
    registryKey_ = key;
    mode_ = mode;
    logDebug(std::string("Opened XDR stream in ") + fileModeName(mode) + " mode: " + path);
    return Status::success();
}

Status XdrFile::close() {
    if (!file_) {
        return Status::success();
    }
    const int rc = xdrfile_close(file_);
    file_ = nullptr;
    release();
    if (rc != exdrOK) {
        return statusFromXdrCode(exdrCLOSE, "failed to close XDR stream").withPath(path_);
    }
    return Status::success();
}

void XdrFile::release() {
    if (!registryKey_.empty()) {
        WriterRegistry::instance().release(registryKey_);
        registryKey_.clear();
    }
}

std::int64_t XdrFile::tell() const {
    if (!file_) {
        return -1;
    }
    return xdr_tell(file_);
}

Status XdrFile::seek(std::int64_t offset) {
    if (!file_) {
        return Status::error(ErrorKind::HandleClosed, "XDR stream is not open").withPath(path_);
    }
    const int code = xdr_seek(file_, offset, SEEK_SET);
    if (code != exdrOK) {
        return statusFromXdrCode(code, "seek to offset " + std::to_string(offset) + " failed").withPath(path_);
    }
    return Status::success();
}

Status XdrFile::skip(std::int64_t bytes) {
    if (!file_) {
        return Status::error(ErrorKind::HandleClosed, "XDR stream is not open").withPath(path_);
    }
    const int code = xdr_seek(file_, bytes, SEEK_CUR);
    if (code != exdrOK) {
        return statusFromXdrCode(code, "skipping " + std::to_string(bytes) + " bytes failed").withPath(path_);
    }
    return Status::success();
}

Status XdrFile::flush() {
    if (!file_) {
        return Status::error(ErrorKind::HandleClosed, "XDR stream is not open").withPath(path_);
    }
    const int code = xdr_flush(file_);
    if (code != exdrOK) {
        return statusFromXdrCode(code, "flush failed").withPath(path_);
    }
    return Status::success();
}

Status XdrFile::truncate(std::int64_t length) {
    Status status = flush();
    if (!status.isOk()) {
        return status;
    }
    std::error_code ec;
    fs::resize_file(path_, static_cast<std::uintmax_t>(length), ec);
    if (ec) {
        return Status::error(ErrorKind::CodecFailure, "cannot truncate to " + std::to_string(length) + " bytes: " +
                                                          ec.message())
            .withPath(path_);
    }
    return seek(length);
}

std::int64_t XdrFile::size() const {
    std::error_code ec;
    const auto bytes = fs::file_size(path_, ec);
    if (ec) {
        return -1;
    }
    return static_cast<std::int64_t>(bytes);
}

bool XdrFile::atEnd() const {
    const std::int64_t total = size();
    return total >= 0 && tell() >= total;
}

int XdrFile::readInts(int* values, int count) {
    return xdrfile_read_int(values, count, file_);
}

int XdrFile::writeInts(const int* values, int count) {
    // libxdrfile takes non-const buffers for both directions; encoding does not modify them.
    return xdrfile_write_int(const_cast<int*>(values), count, file_);
}

int XdrFile::readFloats(float* values, int count) {
    return xdrfile_read_float(values, count, file_);
}

int XdrFile::writeFloats(const float* values, int count) {
    return xdrfile_write_float(const_cast<float*>(values), count, file_);
}

int XdrFile::readDoubles(double* values, int count) {
    return xdrfile_read_double(values, count, file_);
}

int XdrFile::writeDoubles(const double* values, int count) {
    return xdrfile_write_double(const_cast<double*>(values), count, file_);
}

int XdrFile::readString(char* buffer, int maxlen) {
    return xdrfile_read_string(buffer, maxlen, file_);
}

int XdrFile::writeString(const std::string& value) {
    std::vector<char> buffer(value.begin(), value.end());
    buffer.push_back('\0');
    return xdrfile_write_string(buffer.data(), file_);
}

Status XdrFile::readFailure(int code, const std::string& what) const {
    Status status = statusFromXdrCode(code, what);
    if (atEnd() && status.kind() != ErrorKind::Truncated) {
        status = Status::error(ErrorKind::Truncated, what + ": stream ends mid-record").withCode(code);
    }
    return status.withPath(path_);
}

Status XdrFile::writeFailure(int code, const std::string& what) const {
    Status status = statusFromXdrCode(code, "writing " + what + " failed");
    if (status.kind() != ErrorKind::CodecFailure) {
        status = Status::error(ErrorKind::CodecFailure, "writing " + what + " failed").withCode(code);
    }
    return status.withPath(path_);
}

}  // namespace xdrtraj
