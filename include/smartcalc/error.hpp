#pragma once
#include <stdexcept>
#include <string>

namespace smartcalc {

enum class ErrorKind {
    InvalidExpression,
    UnknownVariable,
    DivisionByZero,
    InvalidIdentifier,
    InvalidAssignment,
    ResultOutOfRange,
};

/// Fixed user-facing text for a failure kind, e.g. "Invalid expression".
const char* message(ErrorKind kind);

/// Every failure the calculator reports. what() holds the detail,
/// kind() is what callers branch on.
struct Error : std::runtime_error {
    Error(ErrorKind kind, const std::string& detail)
        : std::runtime_error(detail), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace smartcalc
