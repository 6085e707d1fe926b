#ifndef LANFLOW_BASE_ERROR_CODE_H
#define LANFLOW_BASE_ERROR_CODE_H

#include <string>
#include <system_error>

namespace lanflow {

// Error code categories
enum class ErrorCode {
    Success = 0,

    // General errors (1000-1999)
    InvalidArgument = 1001,
    NotFound = 1002,
    AlreadyExists = 1003,
    Timeout = 1004,
    Cancelled = 1005,
    InternalError = 1006,

    // Transfer errors (2000-2999)
    TransferFailed = 2001,
    TransportError = 2002,
    StallTimeout = 2003,
    ShortTransfer = 2004,
    RetriesExhausted = 2005,

    // Source / chunk errors (3000-3999)
    SourceNotFound = 3001,
    SourceUnavailable = 3002,
    ChunkNotAvailable = 3003,
    NoSourceAvailable = 3004,

    // State errors (4000-4999)
    InvalidState = 4001,
    SerializationError = 4002,
    ConfigError = 4003
};

std::error_code make_error_code(ErrorCode code);
std::string to_string(ErrorCode code);

class LanflowError : public std::exception {
public:
    LanflowError(ErrorCode code, const std::string& message);

    ErrorCode code() const { return code_; }
    const char* what() const noexcept override;

private:
    ErrorCode code_;
    std::string message_;
};

} // namespace lanflow

namespace std {
template <>
struct is_error_code_enum<lanflow::ErrorCode> : true_type {};
} // namespace std

#endif // LANFLOW_BASE_ERROR_CODE_H
