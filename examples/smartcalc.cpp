#include <smartcalc/cli.hpp>

#include <iostream>

int main(int argc, char** argv) {
    return smartcalc::run_command_line(argc, argv, std::cin, std::cout, std::cerr);
}
