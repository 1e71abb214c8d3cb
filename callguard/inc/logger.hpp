// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

namespace callguard {

/**
 * @brief Structured log entry rendered as a single JSON object.
 *
 * Usage:
 *   CALLGUARD_LOG_DEBUG_ENTRY(LogEntry("Fallback fired")
 *                                 .component("guard")
 *                                 .operation("fallback")
 *                                 .field("callable", name));
 */
class LogEntry {
public:
    explicit LogEntry(std::string message) : message_(std::move(message)) {}

    LogEntry& component(std::string value) {
        component_ = std::move(value);
        return *this;
    }

    LogEntry& operation(std::string value) {
        operation_ = std::move(value);
        return *this;
    }

    LogEntry& field(const std::string& key, std::string value) {
        fields_[key] = std::move(value);
        return *this;
    }

    /// JSON text: {"msg":..., "component":..., "operation":..., <fields>}
    [[nodiscard]] std::string to_json() const;

private:
    std::string message_;
    std::optional<std::string> component_;
    std::optional<std::string> operation_;
    std::map<std::string, std::string> fields_;
};

/**
 * @brief Process-wide logger facade over spdlog.
 *
 * Before init() a stderr logger at warning level is used, so the library can
 * log without any setup by the application.
 */
class Logger {
public:
    /**
     * @brief Initialise the logger.
     *
     * @param level One of trace|debug|info|warning|error
     * @throws std::invalid_argument on an unknown level
     */
    static void init(const std::string& level);

    /// Flush and drop the logger; later calls fall back to the default logger.
    static void shutdown();

    [[nodiscard]] static std::shared_ptr<spdlog::logger> get();

    [[nodiscard]] static bool should_log_debug();

    /**
     * @brief Map a configuration level name to an spdlog level.
     * @throws std::invalid_argument on an unknown level
     */
    [[nodiscard]] static spdlog::level::level_enum parse_level(const std::string& level);
};

} // namespace callguard

#define CALLGUARD_LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::callguard::Logger::get(), __VA_ARGS__)
#define CALLGUARD_LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::callguard::Logger::get(), __VA_ARGS__)
#define CALLGUARD_LOG_INFO(...) SPDLOG_LOGGER_INFO(::callguard::Logger::get(), __VA_ARGS__)
#define CALLGUARD_LOG_WARN(...) SPDLOG_LOGGER_WARN(::callguard::Logger::get(), __VA_ARGS__)
#define CALLGUARD_LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::callguard::Logger::get(), __VA_ARGS__)

#define CALLGUARD_LOG_DEBUG_ENTRY(entry)                                                           \
    do {                                                                                           \
        if (::callguard::Logger::should_log_debug()) {                                             \
            CALLGUARD_LOG_DEBUG("{}", (entry).to_json());                                          \
        }                                                                                          \
    } while (0)
#define CALLGUARD_LOG_INFO_ENTRY(entry) CALLGUARD_LOG_INFO("{}", (entry).to_json())
#define CALLGUARD_LOG_WARN_ENTRY(entry) CALLGUARD_LOG_WARN("{}", (entry).to_json())
#define CALLGUARD_LOG_ERROR_ENTRY(entry) CALLGUARD_LOG_ERROR("{}", (entry).to_json())
