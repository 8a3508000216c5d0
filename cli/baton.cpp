/*
 * baton - Command tool (baton)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "commands.hpp"
#include "baton/logger.hpp"
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

using namespace baton;

int main(int argc, char* argv[]) {
    // Default to WARN for clean piping; BATON_LOG_LEVEL overrides
    if (!std::getenv("BATON_LOG_LEVEL"))
        Logger::setLevel(LogLevel::WARN);

    // Handle --help and --version before anything else
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            cli::printUsage(std::cout, argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << cli::VERSION << "\n";
            return 0;
        }
    }

    std::vector<std::string> args(argv + 1, argv + argc);
    return cli::run(args, std::cout, std::cerr, argv[0]);
}
