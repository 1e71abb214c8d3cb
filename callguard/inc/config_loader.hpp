// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "callback_guard.hpp"

#include <filesystem>
#include <string>

namespace callguard {

/**
 * @brief Process-wide settings loaded from JSON config file.
 *
 * Values can be overridden by environment variables with CALLGUARD_ prefix.
 */
struct Settings {
    std::string log_level = "info";
    DoubleInvokePolicy double_invoke = DoubleInvokePolicy::Reject;
};

/// JSON Pointer paths (RFC6901) for extracting Settings values
namespace json {
constexpr char LOG_LEVEL[] = "/observability/logging/level";
constexpr char DOUBLE_INVOKE[] = "/guard/double_invoke";
} // namespace json

/**
 * @brief Load and validate settings from JSON file.
 *
 * Configuration layering (priority: high to low):
 * 1. Environment variables (CALLGUARD_LOG_LEVEL, CALLGUARD_DOUBLE_INVOKE)
 * 2. JSON configuration file
 *
 * @param config_path Path to the JSON configuration file
 * @param schema_path Path to the JSON schema file
 * @return Settings Validated configuration
 *
 * @throws std::runtime_error if config file not found, invalid JSON, or schema validation fails
 */
Settings load_config(const std::filesystem::path& config_path,
                     const std::filesystem::path& schema_path);

/**
 * @brief Parse a double invocation policy name.
 * @throws std::runtime_error unless "reject" or "ignore"
 */
DoubleInvokePolicy parse_double_invoke_policy(const std::string& value, const std::string& source);

[[nodiscard]] const char* to_string(DoubleInvokePolicy policy);

/**
 * @brief Initialise logging and the default double invocation policy.
 */
void apply_settings(const Settings& settings);

} // namespace callguard
