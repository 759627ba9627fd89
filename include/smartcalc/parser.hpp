#pragma once
#include <vector>
#include "smartcalc/token.hpp"

namespace smartcalc {

// Shunting-yard: infix tokens -> postfix tokens (no parentheses).
// Throws Error(InvalidExpression) on unbalanced parentheses.
std::vector<Token> to_postfix(const std::vector<Token>& infix);

// + - : 1, * / : 2, ^ : 3
int precedence(char op);

} // namespace smartcalc
