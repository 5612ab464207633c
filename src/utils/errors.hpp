#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace kestrel::utils {

enum class ErrorKind {
    kValidation,
    kExecutionTimeout,
    kJobNotFound,
    kConflict,
    kResourceExhausted,
    kPolicyBlocked,
    kExecutionFailed,
    kCancelled,
    kInfrastructure
};

inline const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kValidation: return "ValidationError";
        case ErrorKind::kExecutionTimeout: return "ExecutionTimeout";
        case ErrorKind::kJobNotFound: return "JobNotFound";
        case ErrorKind::kConflict: return "Conflict";
        case ErrorKind::kResourceExhausted: return "ResourceExhausted";
        case ErrorKind::kPolicyBlocked: return "PolicyBlocked";
        case ErrorKind::kExecutionFailed: return "ExecutionFailed";
        case ErrorKind::kCancelled: return "Cancelled";
        case ErrorKind::kInfrastructure: return "InfrastructureError";
    }
    return "UnknownError";
}

// Carries the kind and the offending field so callers can explain a failure
// without re-querying state.
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, std::string field, const std::string& message)
        : std::runtime_error(message)
        , kind_(kind)
        , field_(std::move(field)) {}

    ErrorKind Kind() const { return kind_; }
    const std::string& Field() const { return field_; }

private:
    ErrorKind kind_;
    std::string field_;
};

inline Error ValidationError(const std::string& field, const std::string& message) {
    return Error(ErrorKind::kValidation, field, message);
}

inline Error InfrastructureError(const std::string& field, const std::string& message) {
    return Error(ErrorKind::kInfrastructure, field, message);
}

}  // namespace kestrel::utils
