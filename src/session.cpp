#include "smartcalc/session.hpp"
#include "smartcalc/calculator.hpp"
#include "smartcalc/error.hpp"
#include "smartcalc/eval.hpp"
#include "smartcalc/token.hpp"
#include <utility>
#include <vector>

namespace smartcalc {

Session::Session(std::istream& in, std::ostream& out, std::ostream& diag, SessionOptions opts)
    : in_(in), out_(out), diag_(diag), opts_(std::move(opts)) {}

std::size_t Session::run() {
    std::string line;
    for (;;) {
        if (!opts_.prompt.empty()) out_ << opts_.prompt << std::flush;
        if (!std::getline(in_, line)) break;
        if (!handle_line(line)) break;
    }
    return failures_;
}

bool Session::handle_line(const std::string& raw) {
    const std::string line(trim(raw));
    if (line.empty()) return true;
    if (line.front() == '/') return handle_command(line);

    try {
        if (is_assignment(line)) handle_assignment(line);
        else handle_expression(line);
    } catch (const Error& e) {
        ++failures_;
        out_ << message(e.kind()) << "\n";
        if (opts_.verbose) diag_ << "smartcalc: " << e.what() << "\n";
    }
    return true;
}

bool Session::handle_command(const std::string& cmd) {
    if (cmd == "/exit") {
        out_ << "Bye!\n";
        return false;
    }
    if (cmd == "/help") {
        print_help(out_);
        return true;
    }
    if (cmd == "/vars") {
        for (const auto& [name, value] : scope_) out_ << name << " = " << value << "\n";
        return true;
    }

    ++failures_;
    out_ << "Unknown command\n";
    if (opts_.verbose) diag_ << "smartcalc: unknown command " << cmd << "\n";
    return true;
}

void Session::handle_assignment(const std::string& line) {
    assign(line, scope_);
}

void Session::handle_expression(const std::string& line) {
    const std::vector<Token> postfix = compile(line, scope_);
    if (opts_.echo_tokens) diag_ << "postfix: " << join_tokens(postfix) << "\n";
    out_ << eval_postfix(postfix) << "\n";
}

void Session::print_help(std::ostream& out) {
    out << "The program evaluates integer expressions.\n"
        << "  operators:   + - * / ^ and parentheses, e.g. 3 + 8 * ((4 + 3) * 2 + 1) - 6 / (2 + 1)\n"
        << "  signs:       runs of + or - collapse, e.g. 2 -- 2 is 4 and ---5 is -5\n"
        << "  division:    integer division, truncated toward zero\n"
        << "  variables:   name = 10 or name = other (names use latin letters only)\n"
        << "Commands:\n"
        << "  /help  show this text\n"
        << "  /vars  list variables\n"
        << "  /exit  quit\n";
}

} // namespace smartcalc
