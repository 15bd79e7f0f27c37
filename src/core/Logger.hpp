/**
 * @file Logger.hpp
 * @brief Logging wrapper around spdlog.
 *
 * This file defines the Logger class which initializes and manages the
 * spdlog instance shared by the recorder, the encoder threads and the CLI.
 * It provides macros for convenient logging with source location
 * information.
 *
 * @section Dependencies
 * - spdlog
 *
 * @section Patterns
 * - Wrapper: Simplifies spdlog usage.
 */

#pragma once
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <memory>
#include <string_view>

namespace evc {

class Logger {
public:
    static void init(std::string_view appName = "evcam-recorder",
                     bool debug = false);
    static void shutdown();

    static std::shared_ptr<spdlog::logger>& get();

private:
    static std::shared_ptr<spdlog::logger> logger_;
};

// Use these instead of calling Logger::get() directly

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(evc::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(evc::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...) SPDLOG_LOGGER_INFO(evc::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...) SPDLOG_LOGGER_WARN(evc::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(evc::Logger::get(), __VA_ARGS__)
#define LOG_CRITICAL(...) \
    SPDLOG_LOGGER_CRITICAL(evc::Logger::get(), __VA_ARGS__)

} // namespace evc
