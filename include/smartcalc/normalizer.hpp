#pragma once
#include <string>
#include <string_view>
#include <vector>
#include "smartcalc/scope.hpp"
#include "smartcalc/token.hpp"

namespace smartcalc {

/// Turns one line of raw text into infix tokens.
/// Variable names are resolved through the scope and their decimal text is
/// scanned in their place, runs of unary signs are folded into the number
/// that follows them, and misplaced
/// operators or parentheses throw Error(InvalidExpression).
class Normalizer {
public:
    Normalizer(std::string_view s, const VariableScope& scope) : s_(s), scope_(scope) {}

    std::vector<Token> run();

private:
    enum class State {
        ExpectOperand, // start, after '(' or after * / ^
        InSignRun,
        InNumber,
        AfterOperand, // after a number or ')'
    };

    void feed(char c);
    void flush_name();
    void on_digit(char c);
    void on_sign(char c);
    void on_binary(char c);
    void on_lparen();
    void on_rparen();
    void finish();

    // Closes a sign run in front of a digit or '('; returns true if the
    // run folds into the number as a negative sign.
    bool close_sign_run();
    void close_number();
    char run_sign() const;

    [[noreturn]] void fail(const std::string& what) const;

    std::string_view s_;
    const VariableScope& scope_;
    std::size_t i_{0};

    State state_{State::ExpectOperand};
    std::vector<Token> out_;

    std::string name_;   // variable name being read
    std::string digits_; // literal being read, with its folded sign
    int plus_{0};
    int minus_{0};
    bool binary_run_{false};

    // One entry per open '('; true when a unary '-' wrapped it.
    std::vector<bool> parens_;
};

} // namespace smartcalc
