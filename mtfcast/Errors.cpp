#include "Errors.h"

namespace mtfcast {

const char* ErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidTimeframe: return "InvalidTimeframe";
        case ErrorCode::UnsortedInput: return "UnsortedInput";
        case ErrorCode::MalformedBar: return "MalformedBar";
        case ErrorCode::InsufficientRange: return "InsufficientRange";
        case ErrorCode::LeakageViolation: return "LeakageViolation";
        case ErrorCode::FoldExecutionFailure: return "FoldExecutionFailure";
        case ErrorCode::StoreQueryFailure: return "StoreQueryFailure";
        case ErrorCode::ConfigError: return "ConfigError";
    }
    return "Unknown";
}

Error::Error(ErrorCode code, const std::string& message)
    : std::runtime_error(std::string(ErrorCodeName(code)) + ": " + message)
    , m_code(code) {
}

} // namespace mtfcast
