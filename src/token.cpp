#include "smartcalc/token.hpp"

namespace smartcalc {

bool operator==(const Token& a, const Token& b) {
    if (a.kind != b.kind) return false;
    switch (a.kind) {
        case TokKind::Number:   return a.number == b.number;
        case TokKind::Operator: return a.op == b.op;
        case TokKind::LParen:
        case TokKind::RParen:   return true;
    }
    return false;
}

std::string to_string(const Token& t) {
    switch (t.kind) {
        case TokKind::Number:   return std::to_string(t.number);
        case TokKind::Operator: return std::string(1, t.op);
        case TokKind::LParen:   return "(";
        case TokKind::RParen:   return ")";
    }
    return "?";
}

} // namespace smartcalc
