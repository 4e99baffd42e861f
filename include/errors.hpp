#pragma once
#include <stdexcept>
#include <string>

namespace reviewer {

enum class ErrorCode {
    OutsideSandbox,
    NotFound,
    ParseFailure,
    InvalidArguments,
    RateLimitExceeded,
    SessionBusy,
    IncompatibleRecord,
    EngineUnreachable,
    EngineProtocolError,
    Cancelled,
    ConfigError,
    IoError
};

inline const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::OutsideSandbox:      return "OutsideSandbox";
        case ErrorCode::NotFound:            return "NotFound";
        case ErrorCode::ParseFailure:        return "ParseFailure";
        case ErrorCode::InvalidArguments:    return "InvalidArguments";
        case ErrorCode::RateLimitExceeded:   return "RateLimitExceeded";
        case ErrorCode::SessionBusy:         return "SessionBusy";
        case ErrorCode::IncompatibleRecord:  return "IncompatibleRecord";
        case ErrorCode::EngineUnreachable:   return "EngineUnreachable";
        case ErrorCode::EngineProtocolError: return "EngineProtocolError";
        case ErrorCode::Cancelled:           return "Cancelled";
        case ErrorCode::ConfigError:         return "ConfigError";
        case ErrorCode::IoError:             return "IoError";
    }
    return "Unknown";
}

class ReviewerError : public std::runtime_error {
public:
    ReviewerError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

} // namespace reviewer
