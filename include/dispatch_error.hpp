#pragma once

#include <stdexcept>
#include <string>

namespace dispatch {

enum class ErrorCode {
    UnsupportedStrategy,
    EmptyPool,
    ProfileNotFound,
    NoConnectionAvailable,
    InvalidProfile
};

struct DispatchError {
    ErrorCode code;
    std::string message;
};

std::string error_code_to_string(ErrorCode code);

// Thrown when a selector is driven outside its contract (e.g. an empty pool).
// This is a bug in the caller, not a recoverable condition.
class PreconditionViolation : public std::logic_error {
public:
    explicit PreconditionViolation(const std::string& what)
        : std::logic_error(what) {}
};

} // namespace dispatch
