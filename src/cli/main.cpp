// File: src/cli/main.cpp

#include "cli/generator_cli.hpp"
#include <iostream>

int main(int argc, char** argv) {
    try {
        canforge::GeneratorCli cli;
        return cli.Main(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
