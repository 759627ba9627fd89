#include "smartcalc/normalizer.hpp"
#include "smartcalc/error.hpp"
#include <cctype>
#include <charconv>
#include <system_error>

namespace smartcalc {

std::vector<Token> Normalizer::run() {
    state_ = State::ExpectOperand;
    out_.clear();
    name_.clear();
    digits_.clear();
    plus_ = minus_ = 0;
    binary_run_ = false;
    parens_.clear();

    for (i_ = 0; i_ < s_.size(); ++i_) feed(s_[i_]);
    finish();
    return std::move(out_);
}

void Normalizer::feed(char c) {
    if (std::isspace(static_cast<unsigned char>(c))) {
        flush_name();
        return;
    }
    if (is_name_char(c)) {
        name_ += c;
        return;
    }

    flush_name();

    if (std::isdigit(static_cast<unsigned char>(c))) {
        on_digit(c);
        return;
    }

    switch (c) {
        case '+':
        case '-': on_sign(c); return;
        case '*':
        case '/':
        case '^': on_binary(c); return;
        case '(': on_lparen(); return;
        case ')': on_rparen(); return;
        default: break;
    }

    fail(std::string("Unexpected character '") + c + "'");
}

void Normalizer::flush_name() {
    if (name_.empty()) return;
    std::string name = std::move(name_);
    name_.clear();

    // The value is read as if its digits had been typed in place of the name:
    // with a = 5, "a5" is 55 and "a+b" with b = -3 is the mixed run "5+-3".
    for (char c : std::to_string(scope_.get(name))) {
        if (c == '-') on_sign(c);
        else on_digit(c);
    }
}

void Normalizer::on_digit(char c) {
    switch (state_) {
        case State::InNumber:
            digits_ += c;
            return;
        case State::AfterOperand:
            fail("Missing operator before number");
        case State::InSignRun:
            digits_ = close_sign_run() ? "-" : "";
            break;
        case State::ExpectOperand:
            digits_.clear();
            break;
    }
    digits_ += c;
    state_ = State::InNumber;
}

void Normalizer::on_sign(char c) {
    if (state_ == State::InNumber) close_number();

    switch (state_) {
        case State::AfterOperand:
        case State::ExpectOperand:
            binary_run_ = (state_ == State::AfterOperand);
            plus_ = minus_ = 0;
            state_ = State::InSignRun;
            break;
        case State::InSignRun:
            if ((c == '+' && minus_ > 0) || (c == '-' && plus_ > 0)) fail("Mixed '+' and '-' in sign run");
            break;
        case State::InNumber:
            break; // closed above
    }
    if (c == '+') ++plus_;
    else ++minus_;
}

void Normalizer::on_binary(char c) {
    if (state_ == State::InNumber) close_number();
    if (state_ != State::AfterOperand) fail(std::string("Operator '") + c + "' needs a left operand");
    out_.push_back(op_token(c));
    state_ = State::ExpectOperand;
}

void Normalizer::on_lparen() {
    switch (state_) {
        case State::InNumber:
        case State::AfterOperand:
            fail("Missing operator before '('");
        case State::InSignRun:
            if (close_sign_run()) {
                // -(x) is read as (0-(x)); the extra ')' follows the match.
                out_.push_back(lparen_token());
                out_.push_back(number_token(0));
                out_.push_back(op_token('-'));
                out_.push_back(lparen_token());
                parens_.push_back(true);
                state_ = State::ExpectOperand;
                return;
            }
            break;
        case State::ExpectOperand:
            break;
    }
    out_.push_back(lparen_token());
    parens_.push_back(false);
    state_ = State::ExpectOperand;
}

void Normalizer::on_rparen() {
    if (state_ == State::InNumber) close_number();
    if (state_ != State::AfterOperand) fail("')' needs an operand before it");

    out_.push_back(rparen_token());
    // An unmatched ')' is left for the converter to report.
    if (!parens_.empty()) {
        const bool wrapped = parens_.back();
        parens_.pop_back();
        if (wrapped) out_.push_back(rparen_token());
    }
}

void Normalizer::finish() {
    flush_name();
    switch (state_) {
        case State::InNumber:
            close_number();
            break;
        case State::InSignRun:
            // Trailing sign: kept as an operator with nothing to its right.
            out_.push_back(op_token(run_sign()));
            plus_ = minus_ = 0;
            state_ = State::ExpectOperand;
            break;
        case State::ExpectOperand:
        case State::AfterOperand:
            break;
    }
}

bool Normalizer::close_sign_run() {
    const char sign = run_sign();
    const bool binary = binary_run_;
    plus_ = minus_ = 0;
    binary_run_ = false;

    if (binary) {
        out_.push_back(op_token(sign));
        return false;
    }
    return sign == '-';
}

void Normalizer::close_number() {
    std::int64_t v = 0;
    const char* first = digits_.data();
    const char* last = first + digits_.size();
    auto [ptr, ec] = std::from_chars(first, last, v);
    if (ec != std::errc() || ptr != last) fail("Number out of range: " + digits_);

    out_.push_back(number_token(v));
    digits_.clear();
    state_ = State::AfterOperand;
}

char Normalizer::run_sign() const {
    if (plus_ > 0) return '+';
    return (minus_ % 2 == 1) ? '-' : '+';
}

void Normalizer::fail(const std::string& what) const {
    throw Error(ErrorKind::InvalidExpression, what + " at position " + std::to_string(i_));
}

} // namespace smartcalc
