// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <string>

namespace callguard {

/**
 * @brief Command-line configuration of the demo executable.
 *
 * Settings proper come from the JSON config file (see config_loader.hpp).
 */
struct CliConfig {
    /// Path to JSON config file (required)
    std::filesystem::path config_path;

    /// Path to JSON schema file (required)
    std::filesystem::path schema_path;

    /// Scenario to run (see scenarios.hpp), "all" runs every scenario
    std::string scenario = "all";
};

/**
 * @brief Parse command-line arguments.
 *
 * @param argc Argument count
 * @param argv Argument values
 * @return CliConfig Parsed configuration
 *
 * Exits the process on invalid arguments, --help, or missing config/schema.
 */
CliConfig parse_cli_args(int argc, char* argv[]);

} // namespace callguard
