#include "API/cli/CommandLine.hpp"
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    const std::vector<std::string> args(argv + 1, argv + argc);
    const CommandLine cli;
    return cli.run(args, std::cout);
}
