#include "lanflow/base/error_code.h"

namespace lanflow {

namespace {

class LanflowCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "lanflow";
    }

    std::string message(int ev) const override {
        return to_string(static_cast<ErrorCode>(ev));
    }
};

const LanflowCategory& get_category() {
    static LanflowCategory category;
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
        case ErrorCode::AlreadyExists: return "Already exists";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::Cancelled: return "Operation cancelled";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::TransferFailed: return "Transfer failed";
        case ErrorCode::TransportError: return "Transport error";
        case ErrorCode::StallTimeout: return "Transfer stalled";
        case ErrorCode::ShortTransfer: return "Transfer ended before all bytes arrived";
        case ErrorCode::RetriesExhausted: return "Retries exhausted";
        case ErrorCode::SourceNotFound: return "Source not found";
        case ErrorCode::SourceUnavailable: return "Source unavailable";
        case ErrorCode::ChunkNotAvailable: return "Chunk not available";
        case ErrorCode::NoSourceAvailable: return "No source available";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::SerializationError: return "Serialization error";
        case ErrorCode::ConfigError: return "Configuration error";
    }
    return "Unknown error";
}

LanflowError::LanflowError(ErrorCode code, const std::string& message)
    : code_(code), message_(to_string(code) + ": " + message) {}

const char* LanflowError::what() const noexcept {
    return message_.c_str();
}

} // namespace lanflow
