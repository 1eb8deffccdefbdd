/**
 * @file logger.h
 * @brief Library-internal logging, backed by a private spdlog logger
 *
 * playctl never touches spdlog's default logger. Until the host calls initialize(), the
 * first LOG_* statement creates a logger with the default LogConfig (stderr, warn).
 * initialize() may be called at any time, before or after that, and replaces the logger
 * and all of its sinks.
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace playctl {
namespace logging {

enum class LogLevel : std::uint8_t { Trace, Debug, Info, Warn, Error, Off };

struct LogConfig {
    LogLevel level = LogLevel::Warn;
    bool consoleOutput = true;  // stderr
    bool coloredOutput = true;
    std::string filePath;       // rotating file sink when non-empty
    std::size_t maxFileSize = 5 * 1024 * 1024;
    std::size_t maxBackups = 3;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [playctl] [%^%l%$] %v";
};

/**
 * @brief Replace the library logger with one built from `config`.
 *
 * Returns false (and keeps the current logger) if a sink cannot be created, e.g. an
 * unwritable filePath.
 */
bool initialize(const LogConfig& config = LogConfig{});

// Reads the "logging" object of a playctl.json file; a missing file or section means defaults.
bool initializeFromConfig(const std::string& configPath);

// Flushes and drops the logger. The next LOG_* statement recreates the default one.
void shutdown();

// Applies to the logger and every sink
void setLevel(LogLevel level);
LogLevel getLevel();

void flush();

// Never null
std::shared_ptr<spdlog::logger> getLogger();

std::string_view levelToString(LogLevel level);

// Case-insensitive; "warning" and "err" are accepted. Unknown names give Warn.
LogLevel stringToLevel(std::string_view name);

}  // namespace logging
}  // namespace playctl

#define PLAYCTL_LOG_AT(spdlogLevel, ...)                                  \
    do {                                                                  \
        auto playctl_logger_ = ::playctl::logging::getLogger();           \
        if (playctl_logger_->should_log(spdlogLevel)) {                   \
            SPDLOG_LOGGER_CALL(playctl_logger_, spdlogLevel, __VA_ARGS__); \
        }                                                                 \
    } while (0)

#define LOG_TRACE(...) PLAYCTL_LOG_AT(spdlog::level::trace, __VA_ARGS__)
#define LOG_DEBUG(...) PLAYCTL_LOG_AT(spdlog::level::debug, __VA_ARGS__)
#define LOG_INFO(...) PLAYCTL_LOG_AT(spdlog::level::info, __VA_ARGS__)
#define LOG_WARN(...) PLAYCTL_LOG_AT(spdlog::level::warn, __VA_ARGS__)
#define LOG_ERROR(...) PLAYCTL_LOG_AT(spdlog::level::err, __VA_ARGS__)

// Logs the 1st, (n+1)th, (2n+1)th ... pass through this statement. For poll loops.
#define LOG_EVERY_N(level, n, ...)                                              \
    do {                                                                        \
        static std::atomic<std::uint64_t> playctl_every_n_{0};                  \
        if (playctl_every_n_.fetch_add(1, std::memory_order_relaxed) % (n) == 0) { \
            LOG_##level(__VA_ARGS__);                                           \
        }                                                                       \
    } while (0)
