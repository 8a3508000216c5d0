/*
 * baton - Command tool commands
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <iosfwd>
#include <string>
#include <vector>

namespace baton::cli {

constexpr const char* VERSION = "0.1.0";

void printUsage(std::ostream& os, const char* progName);

// Runs one command line (arguments after the program name). Command output
// goes to os, human-readable errors to es. Returns the process exit code:
// 0 on success, including a claim that finds no eligible task; 1 otherwise.
[[nodiscard]] int run(const std::vector<std::string>& argv, std::ostream& os, std::ostream& es,
                      const char* progName = "baton");

}
