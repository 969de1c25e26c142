#include <iostream>

#include "cli/command_line.hpp"

int main(int argc, char* argv[]) {
    return sprintgate::cli::run_cli(argc, argv, std::cout);
}
