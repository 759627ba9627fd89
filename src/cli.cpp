#include "smartcalc/cli.hpp"
#include <sstream>

namespace smartcalc {

CommandLine parse_command_line(int argc, const char* const* argv) {
    CommandLine cl;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            cl.show_help = true;
            continue;
        }
        if (arg == "--verbose") {
            cl.session.verbose = true;
            continue;
        }
        if (arg == "--trace") {
            cl.session.echo_tokens = true;
            continue;
        }
        if (arg == "--prompt" || arg == "-e") {
            if (i + 1 >= argc) throw UsageError(arg + " needs an argument");
            if (arg == "--prompt") cl.session.prompt = argv[++i];
            else cl.lines.emplace_back(argv[++i]);
            continue;
        }
        throw UsageError("unknown option " + arg);
    }
    return cl;
}

void print_usage(std::ostream& os, const char* argv0) {
    os << "usage: " << argv0 << " [--prompt TEXT] [--verbose] [--trace] [-e LINE]...\n"
       << "  --prompt TEXT  print TEXT before reading each line\n"
       << "  --verbose      explain failures on stderr\n"
       << "  --trace        print the postfix form of each expression on stderr\n"
       << "  -e LINE        run LINE instead of reading stdin (repeatable)\n";
}

int run_command_line(int argc, const char* const* argv, std::istream& in, std::ostream& out, std::ostream& err) {
    const char* argv0 = argc > 0 ? argv[0] : "smartcalc";

    CommandLine cl;
    try {
        cl = parse_command_line(argc, argv);
    } catch (const UsageError& e) {
        err << argv0 << ": " << e.what() << "\n";
        print_usage(err, argv0);
        return 2;
    }

    if (cl.show_help) {
        print_usage(out, argv0);
        return 0;
    }

    if (!cl.lines.empty()) {
        std::ostringstream script;
        for (const auto& l : cl.lines) script << l << "\n";
        std::istringstream lines(script.str());
        cl.session.prompt.clear();
        Session session(lines, out, err, cl.session);
        return session.run() == 0 ? 0 : 1;
    }

    Session session(in, out, err, cl.session);
    session.run();
    return 0;
}

} // namespace smartcalc
