// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "config_loader.hpp"

#include "env_vars.hpp"
#include "logger.hpp"

#include <cstdlib>
#include <fstream>
#include <optional>
#include <stdexcept>

#include <rapidjson/document.h>
#include <rapidjson/istreamwrapper.h>
#include <rapidjson/pointer.h>
#include <rapidjson/schema.h>
#include <rapidjson/stringbuffer.h>

namespace callguard {

namespace {

/**
 * @brief Load and parse JSON schema from file.
 */
rapidjson::SchemaDocument load_schema(const std::filesystem::path& schema_path) {
    std::ifstream ifs(schema_path);
    if (!ifs.is_open()) {
        throw std::runtime_error("Failed to open schema file: " + schema_path.string());
    }

    rapidjson::IStreamWrapper isw(ifs);
    rapidjson::Document schema_doc;
    schema_doc.ParseStream(isw);

    if (schema_doc.HasParseError()) {
        throw std::runtime_error("Failed to parse JSON schema: " + schema_path.string() +
                                 " at offset " + std::to_string(schema_doc.GetErrorOffset()));
    }

    return rapidjson::SchemaDocument(schema_doc);
}

/**
 * @brief Validate JSON document against schema.
 */
void validate_against_schema(const rapidjson::Document& doc,
                             const rapidjson::SchemaDocument& schema,
                             const std::filesystem::path& config_path) {
    rapidjson::SchemaValidator validator(schema);
    if (!doc.Accept(validator)) {
        rapidjson::StringBuffer sb;
        validator.GetInvalidSchemaPointer().StringifyUriFragment(sb);
        throw std::runtime_error("Config validation failed for " + config_path.string() +
                                 " at: " + sb.GetString() +
                                 ", keyword: " + validator.GetInvalidSchemaKeyword());
    }
}

/// String at a JSON pointer path, nullopt if absent or not a string.
std::optional<std::string> get_string(const rapidjson::Value& doc, const char* pointer) {
    const rapidjson::Value* value = rapidjson::Pointer(pointer).Get(doc);
    if (value != nullptr && value->IsString()) {
        return std::string(value->GetString(), value->GetStringLength());
    }
    return std::nullopt;
}

std::optional<std::string> get_env(const char* name) {
    const char* value = std::getenv(name);
    if (value != nullptr) {
        return std::string(value);
    }
    return std::nullopt;
}

/**
 * @brief Parse and validate log level from string.
 * @throws std::runtime_error if invalid log level
 */
std::string parse_log_level(const std::string& level, const std::string& source) {
    if (level == "trace" || level == "debug" || level == "info" || level == "warning" ||
        level == "error") {
        return level;
    }
    throw std::runtime_error("Invalid " + source + ": " + level +
                             " (must be trace|debug|info|warning|error)");
}

} // namespace

DoubleInvokePolicy parse_double_invoke_policy(const std::string& value,
                                              const std::string& source) {
    if (value == "reject") {
        return DoubleInvokePolicy::Reject;
    }
    if (value == "ignore") {
        return DoubleInvokePolicy::Ignore;
    }
    throw std::runtime_error("Invalid " + source + ": " + value + " (must be reject|ignore)");
}

const char* to_string(DoubleInvokePolicy policy) {
    switch (policy) {
        case DoubleInvokePolicy::Reject:
            return "reject";
        case DoubleInvokePolicy::Ignore:
            return "ignore";
    }
    return "unknown";
}

Settings load_config(const std::filesystem::path& config_path,
                     const std::filesystem::path& schema_path) {
    std::ifstream config_ifs(config_path);
    if (!config_ifs.is_open()) {
        throw std::runtime_error("Failed to open config file: " + config_path.string());
    }

    rapidjson::IStreamWrapper config_isw(config_ifs);
    rapidjson::Document config_doc;
    config_doc.ParseStream(config_isw);

    if (config_doc.HasParseError()) {
        throw std::runtime_error("Failed to parse config JSON: " + config_path.string() +
                                 " at offset " + std::to_string(config_doc.GetErrorOffset()));
    }

    auto schema = load_schema(schema_path);
    validate_against_schema(config_doc, schema, config_path);

    // Schema guarantees enum values; absent keys keep the defaults
    Settings settings;
    if (auto level = get_string(config_doc, json::LOG_LEVEL)) {
        settings.log_level = *level;
    }
    if (auto policy = get_string(config_doc, json::DOUBLE_INVOKE)) {
        settings.double_invoke = parse_double_invoke_policy(*policy, config_path.string());
    }

    // Apply environment variable overrides
    if (auto env_log_level = get_env(env::LOG_LEVEL); env_log_level.has_value()) {
        settings.log_level = parse_log_level(env_log_level.value(), env::LOG_LEVEL);
    }

    if (auto env_policy = get_env(env::DOUBLE_INVOKE); env_policy.has_value()) {
        settings.double_invoke = parse_double_invoke_policy(env_policy.value(), env::DOUBLE_INVOKE);
    }

    return settings;
}

void apply_settings(const Settings& settings) {
    Logger::init(settings.log_level);
    set_default_double_invoke_policy(settings.double_invoke);
    CALLGUARD_LOG_INFO("Settings applied: log_level={}, double_invoke={}", settings.log_level,
                       to_string(settings.double_invoke));
}

} // namespace callguard
