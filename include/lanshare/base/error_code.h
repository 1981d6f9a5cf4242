#ifndef LANSHARE_BASE_ERROR_CODE_H
#define LANSHARE_BASE_ERROR_CODE_H

#include <string>
#include <system_error>

namespace lanshare {

// Error code categories
enum class ErrorCode {
    Success = 0,

    // General errors (1000-1999)
    InvalidArgument = 1001,
    NotFound = 1002,
    Cancelled = 1003,
    InternalError = 1004,

    // Network errors (2000-2999)
    NetworkError = 2001,
    ConnectionFailed = 2002,
    ConnectionClosed = 2003,
    SendFailed = 2004,
    ReceiveFailed = 2005,
    Timeout = 2006,

    // Protocol errors (3000-3999)
    ProtocolError = 3001,
    MalformedRange = 3002,
    RangeNotSatisfiable = 3003,
    UnexpectedStatus = 3004,

    // Integrity errors (4000-4999)
    IntegrityError = 4001,
    SizeMismatch = 4002,
    ChecksumMismatch = 4003,

    // Resource errors (5000-5999)
    ResourceError = 5001,
    FileNotFound = 5002,
    PermissionDenied = 5003,
    FileTooLarge = 5004,

    // Access errors (6000-6999)
    AuthenticationFailed = 6001,
    AccessDenied = 6002,
    RateLimited = 6003
};

// Coarse taxonomy callers branch on
enum class ErrorKind {
    None,
    General,
    Network,
    Protocol,
    Integrity,
    Resource,
    Cancellation,
    Access
};

std::error_code make_error_code(ErrorCode code);
std::string to_string(ErrorCode code);
std::string to_string(ErrorKind kind);
ErrorKind kind_of(ErrorCode code);

class LanShareError : public std::exception {
public:
    LanShareError(ErrorCode code, const std::string& message);

    ErrorCode code() const { return code_; }
    ErrorKind kind() const { return kind_of(code_); }
    const std::string& detail() const { return detail_; }
    const char* what() const noexcept override;

private:
    ErrorCode code_;
    std::string detail_;
    std::string message_;
};

} // namespace lanshare

#endif // LANSHARE_BASE_ERROR_CODE_H
