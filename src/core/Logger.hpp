/**
 * @file Logger.hpp
 * @brief Logging wrapper around spdlog.
 *
 * This file defines the Logger class which initializes and manages the
 * spdlog instance. It provides macros for convenient logging with source
 * location information.
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
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string_view>

namespace mc {

class Logger {
public:
    static void init(std::string_view appName = "meetcap", bool debug = false);
    static void setDebug(bool debug);
    static void shutdown();

    static std::shared_ptr<spdlog::logger>& get();

    // Empty when only the console sink could be created
    static const std::filesystem::path& logPath() {
        return logPath_;
    }

private:
    static constexpr std::size_t kMaxFileSize = 5 * 1024 * 1024;
    static constexpr std::size_t kMaxFiles = 3;

    static std::shared_ptr<spdlog::logger> logger_;
    static std::filesystem::path logPath_;
};

// Use these instead of calling Logger::get() directly

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(mc::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(mc::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...) SPDLOG_LOGGER_INFO(mc::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...) SPDLOG_LOGGER_WARN(mc::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(mc::Logger::get(), __VA_ARGS__)
#define LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(mc::Logger::get(), __VA_ARGS__)

} // namespace mc
