#pragma once

#include <stdexcept>
#include <string>

namespace mtfcast {

enum class ErrorCode {
    InvalidTimeframe,
    UnsortedInput,
    MalformedBar,
    InsufficientRange,
    LeakageViolation,
    FoldExecutionFailure,
    StoreQueryFailure,
    ConfigError
};

const char* ErrorCodeName(ErrorCode code);

// Base of every error raised by the engine. The code survives catch-by-base.
class Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& message);

    ErrorCode code() const { return m_code; }

private:
    ErrorCode m_code;
};

class InvalidTimeframeError : public Error {
public:
    explicit InvalidTimeframeError(const std::string& message)
        : Error(ErrorCode::InvalidTimeframe, message) {}
};

class UnsortedInputError : public Error {
public:
    explicit UnsortedInputError(const std::string& message)
        : Error(ErrorCode::UnsortedInput, message) {}
};

class MalformedBarError : public Error {
public:
    explicit MalformedBarError(const std::string& message)
        : Error(ErrorCode::MalformedBar, message) {}
};

class InsufficientRangeError : public Error {
public:
    explicit InsufficientRangeError(const std::string& message)
        : Error(ErrorCode::InsufficientRange, message) {}
};

// A selected bar closed after the timestamp it was joined to. Always a defect.
class LeakageViolationError : public Error {
public:
    explicit LeakageViolationError(const std::string& message)
        : Error(ErrorCode::LeakageViolation, message) {}
};

class FoldExecutionError : public Error {
public:
    explicit FoldExecutionError(const std::string& message)
        : Error(ErrorCode::FoldExecutionFailure, message) {}
};

class StoreQueryError : public Error {
public:
    explicit StoreQueryError(const std::string& message)
        : Error(ErrorCode::StoreQueryFailure, message) {}
};

class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& message)
        : Error(ErrorCode::ConfigError, message) {}
};

} // namespace mtfcast
