#include "smartcalc/eval.hpp"
#include "smartcalc/error.hpp"
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace smartcalc {

static std::int64_t wrap(std::uint64_t v) { return static_cast<std::int64_t>(v); }

static std::int64_t power(std::int64_t a, std::int64_t b) {
    const double r = std::trunc(std::pow(static_cast<double>(a), static_cast<double>(b)));

    // int64 covers [-2^63, 2^63); both bounds are exact doubles.
    constexpr double lo = -9223372036854775808.0;
    constexpr double hi = 9223372036854775808.0;
    if (!std::isfinite(r) || r < lo || r >= hi) {
        throw Error(ErrorKind::ResultOutOfRange,
                    std::to_string(a) + " ^ " + std::to_string(b) + " does not fit in 64 bits");
    }
    return static_cast<std::int64_t>(r);
}

std::int64_t apply_operator(char op, std::int64_t a, std::int64_t b) {
    using U = std::uint64_t;
    switch (op) {
        case '+': return wrap(static_cast<U>(a) + static_cast<U>(b));
        case '-': return wrap(static_cast<U>(a) - static_cast<U>(b));
        case '*': return wrap(static_cast<U>(a) * static_cast<U>(b));
        case '/':
            if (b == 0) throw Error(ErrorKind::DivisionByZero, std::to_string(a) + " / 0");
            if (a == std::numeric_limits<std::int64_t>::min() && b == -1) return a;
            return a / b;
        case '^': return power(a, b);
        default: break;
    }
    throw std::logic_error(std::string("Unknown operator '") + op + "'");
}

std::int64_t eval_postfix(const std::vector<Token>& postfix) {
    std::vector<std::int64_t> st;
    st.reserve(postfix.size());

    auto pop = [&]() -> std::int64_t {
        if (st.empty()) throw Error(ErrorKind::InvalidExpression, "Stack underflow (operator is missing an operand)");
        std::int64_t v = st.back();
        st.pop_back();
        return v;
    };

    for (const auto& t : postfix) {
        switch (t.kind) {
            case TokKind::Number:
                st.push_back(t.number);
                break;

            case TokKind::Operator: {
                std::int64_t b = pop();
                std::int64_t a = pop();
                st.push_back(apply_operator(t.op, a, b));
            } break;

            case TokKind::LParen:
            case TokKind::RParen:
                throw std::logic_error("Parenthesis in postfix sequence");
        }
    }

    if (st.size() != 1) throw Error(ErrorKind::InvalidExpression, "Expression did not reduce to a single value");
    return st.back();
}

} // namespace smartcalc
