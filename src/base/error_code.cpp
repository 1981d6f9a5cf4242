#include "lanshare/base/error_code.h"

namespace lanshare {

namespace {

class LanShareCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "LanShare";
    }

    std::string message(int ev) const override {
        return to_string(static_cast<ErrorCode>(ev));
    }
};

const LanShareCategory& get_category() {
    static LanShareCategory category;
    return category;
}

} // anonymous namespace

std::error_code make_error_code(ErrorCode code) {
    return std::error_code(static_cast<int>(code), get_category());
}

std::string to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::Cancelled: return "Operation cancelled";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::NetworkError: return "Network error";
        case ErrorCode::ConnectionFailed: return "Connection failed";
        case ErrorCode::ConnectionClosed: return "Connection closed";
        case ErrorCode::SendFailed: return "Send failed";
        case ErrorCode::ReceiveFailed: return "Receive failed";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::ProtocolError: return "Protocol error";
        case ErrorCode::MalformedRange: return "Invalid Range header";
        case ErrorCode::RangeNotSatisfiable: return "Requested Range Not Satisfiable";
        case ErrorCode::UnexpectedStatus: return "Unexpected HTTP status";
        case ErrorCode::IntegrityError: return "Integrity error";
        case ErrorCode::SizeMismatch: return "Size mismatch";
        case ErrorCode::ChecksumMismatch: return "Checksum mismatch";
        case ErrorCode::ResourceError: return "Resource error";
        case ErrorCode::FileNotFound: return "File not found";
        case ErrorCode::PermissionDenied: return "Permission denied";
        case ErrorCode::FileTooLarge: return "File too large";
        case ErrorCode::AuthenticationFailed: return "Authentication failed";
        case ErrorCode::AccessDenied: return "Access denied";
        case ErrorCode::RateLimited: return "Rate limit exceeded";
        default: return "Unknown error";
    }
}

std::string to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::General: return "general";
        case ErrorKind::Network: return "network";
        case ErrorKind::Protocol: return "protocol";
        case ErrorKind::Integrity: return "integrity";
        case ErrorKind::Resource: return "resource";
        case ErrorKind::Cancellation: return "cancellation";
        case ErrorKind::Access: return "access";
    }
    return "unknown";
}

ErrorKind kind_of(ErrorCode code) {
    if (code == ErrorCode::Success) return ErrorKind::None;
    if (code == ErrorCode::Cancelled) return ErrorKind::Cancellation;

    switch (static_cast<int>(code) / 1000) {
        case 2: return ErrorKind::Network;
        case 3: return ErrorKind::Protocol;
        case 4: return ErrorKind::Integrity;
        case 5: return ErrorKind::Resource;
        case 6: return ErrorKind::Access;
        default: return ErrorKind::General;
    }
}

LanShareError::LanShareError(ErrorCode code, const std::string& message)
    : code_(code), detail_(message), message_(to_string(code) + ": " + message) {}

const char* LanShareError::what() const noexcept {
    return message_.c_str();
}

} // namespace lanshare
