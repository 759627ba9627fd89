#pragma once
#include <cstdint>
#include <vector>
#include "smartcalc/token.hpp"

namespace smartcalc {

/// Evaluate a postfix sequence with a value stack.
/// Throws Error(InvalidExpression) if the sequence does not reduce to
/// exactly one value, and whatever apply_operator throws.
std::int64_t eval_postfix(const std::vector<Token>& postfix);

/// a op b over int64.
/// + - * wrap around on overflow. / truncates toward zero and throws
/// Error(DivisionByZero) for b == 0. ^ goes through std::pow and truncates,
/// so negative exponents give 0 unless the base is 1 or -1; a result
/// outside the int64 range throws Error(ResultOutOfRange).
std::int64_t apply_operator(char op, std::int64_t a, std::int64_t b);

} // namespace smartcalc
