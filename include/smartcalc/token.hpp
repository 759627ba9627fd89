#pragma once
#include <cstdint>
#include <string>

namespace smartcalc {

enum class TokKind {
    Number,
    Operator, // one of + - * / ^
    LParen,
    RParen,
};

struct Token {
    TokKind kind{TokKind::Number};
    std::int64_t number{0}; // Number
    char op{'\0'};          // Operator symbol
};

inline Token number_token(std::int64_t v) { return Token{TokKind::Number, v, '\0'}; }
inline Token op_token(char op) { return Token{TokKind::Operator, 0, op}; }
inline Token lparen_token() { return Token{TokKind::LParen}; }
inline Token rparen_token() { return Token{TokKind::RParen}; }

bool operator==(const Token& a, const Token& b);
inline bool operator!=(const Token& a, const Token& b) { return !(a == b); }

std::string to_string(const Token& t);

// Space separated rendering, e.g. "1 2 3 * +".
template <class Tokens>
std::string join_tokens(const Tokens& ts) {
    std::string out;
    for (const auto& t : ts) {
        if (!out.empty()) out += ' ';
        out += to_string(t);
    }
    return out;
}

} // namespace smartcalc
