#include "smartcalc/parser.hpp"
#include "smartcalc/error.hpp"
#include <stdexcept>
#include <string>

namespace smartcalc {

int precedence(char op) {
    switch (op) {
        case '^': return 3;
        case '*':
        case '/': return 2;
        case '+':
        case '-': return 1;
        default: break;
    }
    throw std::logic_error(std::string("No precedence for operator '") + op + "'");
}

// Every operator is treated as left associative, ^ included: 2^3^2 == (2^3)^2.
std::vector<Token> to_postfix(const std::vector<Token>& infix) {
    std::vector<Token> output;
    std::vector<Token> opstack;
    output.reserve(infix.size());

    for (const auto& t : infix) {
        switch (t.kind) {
            case TokKind::Number:
                output.push_back(t);
                break;

            case TokKind::LParen:
                opstack.push_back(t);
                break;

            case TokKind::RParen: {
                while (!opstack.empty() && opstack.back().kind != TokKind::LParen) {
                    output.push_back(opstack.back());
                    opstack.pop_back();
                }
                if (opstack.empty()) throw Error(ErrorKind::InvalidExpression, "Mismatched ')'");
                opstack.pop_back(); // discard '('
            } break;

            case TokKind::Operator: {
                const int pcur = precedence(t.op);
                while (!opstack.empty() && opstack.back().kind == TokKind::Operator) {
                    if (precedence(opstack.back().op) < pcur) break;
                    output.push_back(opstack.back());
                    opstack.pop_back();
                }
                opstack.push_back(t);
            } break;
        }
    }

    while (!opstack.empty()) {
        if (opstack.back().kind == TokKind::LParen) throw Error(ErrorKind::InvalidExpression, "Mismatched '('");
        output.push_back(opstack.back());
        opstack.pop_back();
    }
    return output;
}

} // namespace smartcalc
