#pragma once

#include <cstdint>
#include <string>

#include "io/Status.hpp"

struct XDRFILE;

namespace xdrtraj {

enum class FileMode { Read, Write, Append };

const char* fileModeName(FileMode mode);

// Owns one libxdrfile stream. The XDRFILE also carries the compression
// codec's scratch buffers, so they are released together with the file.
class XdrFile {
  public:
    XdrFile() = default;
    ~XdrFile();

    XdrFile(const XdrFile&) = delete;
    XdrFile& operator=(const XdrFile&) = delete;
    XdrFile(XdrFile&& other) noexcept;
    XdrFile& operator=(XdrFile&& other);

    Status open(const std::string& path, FileMode mode);
    Status close();

    bool isOpen() const { return file_ != nullptr; }
    XDRFILE* get() const { return file_; }
    const std::string& path() const { return path_; }
    FileMode mode() const { return mode_; }
    bool writable() const { return mode_ != FileMode::Read; }

    std::int64_t tell() const;
    Status seek(std::int64_t offset);
    Status skip(std::int64_t bytes);
    Status flush();
    // Cuts the file back to `length` bytes and leaves the cursor there.
    Status truncate(std::int64_t length);

    // Current size on disk, -1 when it cannot be determined.
    std::int64_t size() const;
    bool atEnd() const;

    int readInts(int* values, int count);
    int writeInts(const int* values, int count);
    int readFloats(float* values, int count);
    int writeFloats(const float* values, int count);
    int readDoubles(double* values, int count);
    int writeDoubles(const double* values, int count);
    // Both return the string length including the terminator, 0 on failure.
    int readString(char* buffer, int maxlen);
    int writeString(const std::string& value);

    // Status for a failed primitive read: the mapped kind of `code`, or
    // Truncated when the stream has run out.
    Status readFailure(int code, const std::string& what) const;
    // Status for a failed primitive write: always CodecFailure carrying `code`.
    Status writeFailure(int code, const std::string& what) const;

  private:
    void release();

    XDRFILE* file_{nullptr};
    std::string path_;
    std::string registryKey_;
    FileMode mode_{FileMode::Read};
};

}  // namespace xdrtraj
