#pragma once
#include <cstddef>
#include <istream>
#include <ostream>
#include <string>
#include "smartcalc/scope.hpp"

namespace smartcalc {

struct SessionOptions {
    std::string prompt{};     // printed before each line is read
    bool verbose{false};      // failure details to the diagnostics stream
    bool echo_tokens{false};  // postfix form of each expression to diagnostics
};

/// Line-oriented driver: commands, assignments and expressions.
class Session {
public:
    Session(std::istream& in, std::ostream& out, std::ostream& diag, SessionOptions opts = {});

    /// Reads until /exit or end of input. Returns the number of failed lines.
    std::size_t run();

    /// Handles one line. Returns false once the session should stop.
    bool handle_line(const std::string& line);

    std::size_t failures() const noexcept { return failures_; }
    const VariableScope& scope() const noexcept { return scope_; }

    static void print_help(std::ostream& out);

private:
    bool handle_command(const std::string& cmd);
    void handle_assignment(const std::string& line);
    void handle_expression(const std::string& line);

    std::istream& in_;
    std::ostream& out_;
    std::ostream& diag_;
    SessionOptions opts_;
    VariableScope scope_;
    std::size_t failures_{0};
};

} // namespace smartcalc
