// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "logger.hpp"

#include <mutex>
#include <stdexcept>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace callguard {

namespace {

constexpr const char* LOGGER_NAME = "callguard";
constexpr const char* LOG_PATTERN = "%Y-%m-%dT%H:%M:%S.%e %^%l%$ [%n] %v";

std::mutex g_logger_mutex;
std::shared_ptr<spdlog::logger> g_logger;

std::shared_ptr<spdlog::logger> make_logger(spdlog::level::level_enum level) {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, std::move(sink));
    logger->set_pattern(LOG_PATTERN);
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    return logger;
}

void write_pair(rapidjson::Writer<rapidjson::StringBuffer>& writer, const char* key,
                const std::string& value) {
    writer.Key(key);
    writer.String(value.c_str(), static_cast<rapidjson::SizeType>(value.size()));
}

} // namespace

std::string LogEntry::to_json() const {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    writer.StartObject();
    write_pair(writer, "msg", message_);
    if (component_) {
        write_pair(writer, "component", *component_);
    }
    if (operation_) {
        write_pair(writer, "operation", *operation_);
    }
    for (const auto& [key, value] : fields_) {
        write_pair(writer, key.c_str(), value);
    }
    writer.EndObject();

    return buffer.GetString();
}

spdlog::level::level_enum Logger::parse_level(const std::string& level) {
    if (level == "trace") {
        return spdlog::level::trace;
    }
    if (level == "debug") {
        return spdlog::level::debug;
    }
    if (level == "info") {
        return spdlog::level::info;
    }
    if (level == "warning" || level == "warn") {
        return spdlog::level::warn;
    }
    if (level == "error") {
        return spdlog::level::err;
    }
    throw std::invalid_argument("Invalid log level: " + level +
                                " (must be trace|debug|info|warning|error)");
}

void Logger::init(const std::string& level) {
    auto logger = make_logger(parse_level(level));
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    g_logger = std::move(logger);
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (g_logger) {
        g_logger->flush();
        g_logger.reset();
    }
}

std::shared_ptr<spdlog::logger> Logger::get() {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (!g_logger) {
        g_logger = make_logger(spdlog::level::warn);
    }
    return g_logger;
}

bool Logger::should_log_debug() {
    return get()->should_log(spdlog::level::debug);
}

} // namespace callguard
