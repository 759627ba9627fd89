#include "smartcalc/calculator.hpp"
#include "smartcalc/error.hpp"
#include "smartcalc/eval.hpp"
#include "smartcalc/normalizer.hpp"
#include "smartcalc/parser.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <string>
#include <system_error>

namespace smartcalc {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

std::vector<Token> compile(std::string_view line, const VariableScope& scope) {
    Normalizer norm(line, scope);
    return to_postfix(norm.run());
}

std::int64_t evaluate(std::string_view line, const VariableScope& scope) {
    return eval_postfix(compile(line, scope));
}

bool is_valid_identifier(std::string_view name) {
    return !name.empty() && std::all_of(name.begin(), name.end(), is_name_char);
}

bool is_assignment(std::string_view line) {
    return line.find('=') != std::string_view::npos;
}

// Optional single sign followed by digits, in int64 range.
static bool parse_integer(std::string_view s, std::int64_t& out) {
    bool negative = false;
    if (!s.empty() && (s.front() == '+' || s.front() == '-')) {
        negative = (s.front() == '-');
        s.remove_prefix(1);
    }
    if (s.empty()) return false;
    if (!std::all_of(s.begin(), s.end(), [](char c) { return c >= '0' && c <= '9'; })) return false;

    const std::string text = (negative ? "-" : "") + std::string(s);
    const char* first = text.data();
    const char* last = first + text.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc() && ptr == last;
}

void assign(std::string_view line, VariableScope& scope) {
    const std::size_t eq = line.find('=');
    if (eq == std::string_view::npos) throw Error(ErrorKind::InvalidAssignment, "Missing '=' in assignment");

    const std::string_view lhs = trim(line.substr(0, eq));
    const std::string_view rhs = trim(line.substr(eq + 1));

    if (!is_valid_identifier(lhs)) {
        throw Error(ErrorKind::InvalidIdentifier, "Invalid identifier: '" + std::string(lhs) + "'");
    }

    std::int64_t value = 0;
    if (parse_integer(rhs, value)) {
        scope.set(lhs, value);
        return;
    }
    if (!is_valid_identifier(rhs)) {
        throw Error(ErrorKind::InvalidAssignment, "Cannot assign '" + std::string(rhs) + "' to " + std::string(lhs));
    }
    scope.set(lhs, scope.get(rhs));
}

} // namespace smartcalc
