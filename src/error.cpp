#include "smartcalc/error.hpp"

namespace smartcalc {

const char* message(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidExpression: return "Invalid expression";
        case ErrorKind::UnknownVariable:   return "Unknown variable";
        case ErrorKind::DivisionByZero:    return "Division by zero";
        case ErrorKind::InvalidIdentifier: return "Invalid identifier";
        case ErrorKind::InvalidAssignment: return "Invalid assignment";
        case ErrorKind::ResultOutOfRange:  return "Result out of range";
    }
    return "Unknown error";
}

} // namespace smartcalc
