#include <gtest/gtest.h>
#include <smartcalc/error.hpp>
#include <smartcalc/parser.hpp>

#include <stdexcept>
#include <string>
#include <vector>

#include "test_util.hpp"

namespace {

using namespace smartcalc;
using smartcalc_test::failure_of;
using smartcalc_test::msg;

std::string rpn(const std::vector<Token>& infix) {
    return join_tokens(to_postfix(infix));
}

const Token L = lparen_token();
const Token R = rparen_token();
Token n(std::int64_t v) { return number_token(v); }
Token o(char c) { return op_token(c); }

TEST(Postfix, MultiplicationBindsTighter) {
    EXPECT_EQ(rpn({n(1), o('+'), n(2), o('*'), n(3)}), "1 2 3 * +");
    EXPECT_EQ(rpn({n(1), o('*'), n(2), o('+'), n(3)}), "1 2 * 3 +");
}

TEST(Postfix, ParenthesesOverridePrecedence) {
    EXPECT_EQ(rpn({L, n(1), o('+'), n(2), R, o('*'), n(3)}), "1 2 + 3 *");
    EXPECT_EQ(rpn({n(2), o('*'), L, L, n(4), o('+'), n(3), R, o('*'), n(2), R}), "2 4 3 + 2 * *");
}

TEST(Postfix, EqualPrecedenceIsLeftToRight) {
    EXPECT_EQ(rpn({n(1), o('-'), n(2), o('+'), n(3)}), "1 2 - 3 +");
    EXPECT_EQ(rpn({n(8), o('/'), n(4), o('*'), n(2)}), "8 4 / 2 *");
    EXPECT_EQ(rpn({n(2), o('^'), n(3), o('^'), n(2)}), "2 3 ^ 2 ^");
}

TEST(Postfix, PowerAboveProduct) {
    EXPECT_EQ(rpn({n(2), o('*'), n(3), o('^'), n(2)}), "2 3 2 ^ *");
    EXPECT_EQ(rpn({n(3), o('^'), n(2), o('-'), n(1)}), "3 2 ^ 1 -");
}

TEST(Postfix, OutputHasNoParentheses) {
    const auto out = to_postfix({L, L, n(7), R, R});
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0], n(7));
}

TEST(Postfix, EmptyInput) {
    EXPECT_TRUE(to_postfix({}).empty());
}

TEST(Postfix, OperatorsAreNotValidatedHere) {
    // Placement is the normalizer's and evaluator's concern.
    EXPECT_EQ(rpn({n(1), o('+')}), "1 +");
    EXPECT_EQ(rpn({o('*')}), "*");
}

TEST(Postfix, UnmatchedParentheses) {
    EXPECT_EQ(failure_of([] { to_postfix({n(1), R}); }), msg(ErrorKind::InvalidExpression));
    EXPECT_EQ(failure_of([] { to_postfix({L, n(1)}); }), msg(ErrorKind::InvalidExpression));
    EXPECT_EQ(failure_of([] { to_postfix({n(1), o('+'), L, n(2)}); }), msg(ErrorKind::InvalidExpression));
    EXPECT_EQ(failure_of([] { to_postfix({L, n(1), R, R}); }), msg(ErrorKind::InvalidExpression));
}

TEST(Postfix, Precedence) {
    EXPECT_EQ(precedence('+'), 1);
    EXPECT_EQ(precedence('-'), 1);
    EXPECT_EQ(precedence('*'), 2);
    EXPECT_EQ(precedence('/'), 2);
    EXPECT_EQ(precedence('^'), 3);
    EXPECT_THROW(precedence('%'), std::logic_error);
}

} // namespace
