#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>

namespace xdrtraj {

// Closed set of outcomes of every trajectory operation. EndOfFile is the
// normal end of a sequential read, not a failure.
enum class ErrorKind {
    Ok,
    NotFound,
    PermissionDenied,
    InvalidFormat,
    Truncated,
    AtomCountMismatch,
    CodecFailure,
    HandleClosed,
    EndOfFile,
};

const char* errorKindName(ErrorKind kind);

class Status {
  public:
    Status() = default;

    static Status success() { return Status(); }
    static Status error(ErrorKind kind, std::string message);
    static Status endOfFile();

    bool isOk() const { return kind_ == ErrorKind::Ok; }
    bool isEndOfFile() const { return kind_ == ErrorKind::EndOfFile; }
    // Anything that is neither success nor a clean end of stream.
    bool isError() const { return !isOk() && !isEndOfFile(); }

    ErrorKind kind() const { return kind_; }
    const std::string& message() const { return message_; }
    const std::string& path() const { return path_; }
    const std::optional<std::size_t>& frameIndex() const { return frameIndex_; }
    const std::optional<int>& code() const { return code_; }

    Status& withPath(const std::string& path);
    Status& withFrame(std::size_t index);
    Status& withCode(int code);

    std::string toString() const;

  private:
    Status(ErrorKind kind, std::string message) : kind_(kind), message_(std::move(message)) {}

    ErrorKind kind_{ErrorKind::Ok};
    std::string message_;
    std::string path_;
    std::optional<std::size_t> frameIndex_;
    std::optional<int> code_;
};

// Maps one libxdrfile return code (exdrOK, exdrMAGIC, ...) to a Status.
// Unknown codes fail closed as CodecFailure carrying the raw code.
Status statusFromXdrCode(int code, const std::string& context);

}  // namespace xdrtraj
