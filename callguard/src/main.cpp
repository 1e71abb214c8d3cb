// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include <iostream>
#include <string>
#include <vector>

#include "cli.hpp"
#include "config_loader.hpp"
#include "logger.hpp"
#include "scenarios.hpp"
#include "version.hpp"

int main(int argc, char* argv[]) {
    auto cli_config = callguard::parse_cli_args(argc, argv);

    // Load and validate settings from JSON file
    callguard::Settings settings;
    try {
        settings = callguard::load_config(cli_config.config_path, cli_config.schema_path);
    } catch (const std::exception& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    }

    callguard::apply_settings(settings);

    CALLGUARD_LOG_INFO("{} demo {} starting", callguard::NAME, callguard::VERSION);

    std::vector<std::string> scenarios = cli_config.scenario == "all"
                                             ? callguard::scenario_names()
                                             : std::vector<std::string>{cli_config.scenario};

    int exit_code = 0;
    for (const auto& name : scenarios) {
        std::cout << "== " << name << "\n";
        try {
            callguard::run_scenario(name, std::cout);
        } catch (const std::exception& e) {
            CALLGUARD_LOG_ERROR("Scenario '{}' failed: {}", name, e.what());
            exit_code = 1;
        }
    }

    callguard::Logger::shutdown();
    return exit_code;
}
