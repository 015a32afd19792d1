#include "io/Status.hpp"

#include <sstream>
#include <utility>

extern "C" {
#include <xdrfile.h>
}

namespace xdrtraj {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Ok:
            return "Ok";
        case ErrorKind::NotFound:
            return "NotFound";
        case ErrorKind::PermissionDenied:
            return "PermissionDenied";
        case ErrorKind::InvalidFormat:
            return "InvalidFormat";
        case ErrorKind::Truncated:
            return "Truncated";
        case ErrorKind::AtomCountMismatch:
            return "AtomCountMismatch";
        case ErrorKind::CodecFailure:
            return "CodecFailure";
        case ErrorKind::HandleClosed:
            return "HandleClosed";
        case ErrorKind::EndOfFile:
            return "EndOfFile";
    }
    return "CodecFailure";
}

Status Status::error(ErrorKind kind, std::string message) {
    return Status(kind, std::move(message));
}

Status Status::endOfFile() {
    return Status(ErrorKind::EndOfFile, "end of file");
}

Status& Status::withPath(const std::string& path) {
    path_ = path;
    return *this;
}

Status& Status::withFrame(std::size_t index) {
    frameIndex_ = index;
    return *this;
}

Status& Status::withCode(int code) {
    code_ = code;
    return *this;
}

std::string Status::toString() const {
    std::ostringstream oss;
    oss << errorKindName(kind_);
    if (!message_.empty()) {
        oss << ": " << message_;
    }
    if (!path_.empty()) {
        oss << " [" << path_;
        if (frameIndex_) {
            oss << ", frame " << *frameIndex_;
        }
        oss << "]";
    } else if (frameIndex_) {
        oss << " [frame " << *frameIndex_ << "]";
    }
    if (code_) {
        oss << " (xdr code " << *code_ << ")";
    }
    return oss.str();
}

Status statusFromXdrCode(int code, const std::string& context) {
    ErrorKind kind = ErrorKind::CodecFailure;
    switch (code) {
        case exdrOK:
            return Status::success();
        case exdrHEADER:
        case exdrSTRING:
        case exdrMAGIC:
            kind = ErrorKind::InvalidFormat;
            break;
        case exdrDOUBLE:
        case exdrINT:
        case exdrFLOAT:
        case exdrUINT:
            kind = ErrorKind::Truncated;
            break;
        case exdr3DX:
        case exdrCLOSE:
        case exdrNOMEM:
            kind = ErrorKind::CodecFailure;
            break;
        case exdrENDOFFILE:
            return Status::endOfFile().withCode(code);
        case exdrFILENOTFOUND:
            kind = ErrorKind::NotFound;
            break;
        default:
            return Status::error(ErrorKind::CodecFailure, context + ": unknown xdr status").withCode(code);
    }
    std::string message = context;
    if (code >= 0 && code < exdrNR && exdr_message[code] != nullptr) {
        message += ": ";
        message += exdr_message[code];
    }
    return Status::error(kind, message).withCode(code);
}

}  // namespace xdrtraj
