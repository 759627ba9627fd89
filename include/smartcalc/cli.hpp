#pragma once
#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>
#include "smartcalc/session.hpp"

namespace smartcalc {

struct UsageError : std::runtime_error { using std::runtime_error::runtime_error; };

struct CommandLine {
    SessionOptions session{};
    std::vector<std::string> lines{}; // -e LINE, in order
    bool show_help{false};
};

/// Throws UsageError on an unknown option or a missing option argument.
CommandLine parse_command_line(int argc, const char* const* argv);

void print_usage(std::ostream& os, const char* argv0);

/// Whole program: returns 0, 1 when an -e line failed, 2 on a usage error.
/// Lines are read from `in` unless -e was given.
int run_command_line(int argc, const char* const* argv, std::istream& in, std::ostream& out, std::ostream& err);

} // namespace smartcalc
