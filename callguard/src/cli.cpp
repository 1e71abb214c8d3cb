// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "cli.hpp"

#include "scenarios.hpp"
#include "version.hpp"
#include <CLI/CLI.hpp>
#include <iostream>

namespace callguard {

CliConfig parse_cli_args(int argc, char* argv[]) {
    CliConfig config;

    CLI::App app{"callguard demo v" + std::string(VERSION) + " (" + GIT_COMMIT + ")"};

    app.add_option("-c,--config", config.config_path, "Path to JSON configuration file")
        ->check(CLI::ExistingFile);

    app.add_option("-s,--schema", config.schema_path, "Path to JSON schema for configuration")
        ->check(CLI::ExistingFile);

    auto choices = scenario_names();
    choices.push_back("all");
    app.add_option("--scenario", config.scenario, "Scenario to run")
        ->check(CLI::IsMember(choices))
        ->default_str("all");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e));
    }

    if (config.config_path.empty()) {
        std::cerr << "Error: --config is required\n";
        std::exit(1);
    }
    if (config.schema_path.empty()) {
        std::cerr << "Error: --schema is required\n";
        std::exit(1);
    }

    return config;
}

} // namespace callguard
