#include "playctl/logging/logger.h"

#include <cctype>
#include <fstream>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace playctl {
namespace logging {

namespace {

struct LevelEntry {
    LogLevel level;
    spdlog::level::level_enum native;
    const char* name;
};

constexpr LevelEntry kLevels[] = {
    {LogLevel::Trace, spdlog::level::trace, "trace"},
    {LogLevel::Debug, spdlog::level::debug, "debug"},
    {LogLevel::Info, spdlog::level::info, "info"},
    {LogLevel::Warn, spdlog::level::warn, "warn"},
    {LogLevel::Error, spdlog::level::err, "error"},
    {LogLevel::Off, spdlog::level::off, "off"},
};

const LevelEntry& entryFor(LogLevel level) {
    for (const auto& entry : kLevels) {
        if (entry.level == level) {
            return entry;
        }
    }
    return kLevels[3];
}

// Serializes replacement of g_logger. Readers use std::atomic_load and never block.
std::mutex g_configMutex;
std::shared_ptr<spdlog::logger> g_logger;

void applyLevel(spdlog::logger& logger, LogLevel level) {
    const auto native = entryFor(level).native;
    logger.set_level(native);
    for (auto& sink : logger.sinks()) {
        sink->set_level(native);
    }
}

// Throws spdlog::spdlog_ex if a sink cannot be opened
std::shared_ptr<spdlog::logger> makeLogger(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    if (config.consoleOutput) {
        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        if (!config.coloredOutput) {
            console->set_color_mode(spdlog::color_mode::never);
        }
        sinks.push_back(std::move(console));
    }
    if (!config.filePath.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.filePath, config.maxFileSize, config.maxBackups));
    }

    auto logger = std::make_shared<spdlog::logger>("playctl", sinks.begin(), sinks.end());
    logger->set_pattern(config.pattern);
    logger->flush_on(spdlog::level::warn);
    applyLevel(*logger, config.level);
    return logger;
}

LogConfig readLoggingSection(const nlohmann::json& section) {
    LogConfig config;
    config.level = stringToLevel(section.value("level", std::string(levelToString(config.level))));
    config.consoleOutput = section.value("consoleOutput", config.consoleOutput);
    config.coloredOutput = section.value("coloredOutput", config.coloredOutput);
    config.filePath = section.value("filePath", config.filePath);
    config.maxFileSize = section.value("maxFileSize", config.maxFileSize);
    config.maxBackups = section.value("maxBackups", config.maxBackups);
    config.pattern = section.value("pattern", config.pattern);
    return config;
}

}  // namespace

bool initialize(const LogConfig& config) {
    std::shared_ptr<spdlog::logger> previous;
    {
        std::lock_guard<std::mutex> lock(g_configMutex);
        std::shared_ptr<spdlog::logger> replacement;
        try {
            replacement = makeLogger(config);
        } catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "playctl: cannot configure logging: " << ex.what() << std::endl;
            return false;
        }
        previous = std::atomic_exchange(&g_logger, replacement);
    }
    if (previous) {
        previous->flush();
    }

    LOG_DEBUG("Logging configured (level={}, file='{}')", levelToString(config.level),
              config.filePath);
    return true;
}

bool initializeFromConfig(const std::string& configPath) {
    LogConfig config;
    std::ifstream file(configPath);
    if (file.is_open()) {
        try {
            nlohmann::json root = nlohmann::json::parse(file);
            auto it = root.find("logging");
            if (it != root.end() && it->is_object()) {
                config = readLoggingSection(*it);
            }
        } catch (const nlohmann::json::exception& ex) {
            std::cerr << "playctl: ignoring logging section of " << configPath << ": "
                      << ex.what() << std::endl;
            config = LogConfig{};
        }
    }
    return initialize(config);
}

void shutdown() {
    std::shared_ptr<spdlog::logger> previous;
    {
        std::lock_guard<std::mutex> lock(g_configMutex);
        previous = std::atomic_exchange(&g_logger, std::shared_ptr<spdlog::logger>());
    }
    if (previous) {
        previous->flush();
    }
}

void setLevel(LogLevel level) {
    applyLevel(*getLogger(), level);
}

LogLevel getLevel() {
    auto logger = std::atomic_load(&g_logger);
    if (!logger) {
        return LogConfig{}.level;
    }
    for (const auto& entry : kLevels) {
        if (entry.native == logger->level()) {
            return entry.level;
        }
    }
    // spdlog's critical has no counterpart here
    return LogLevel::Error;
}

void flush() {
    if (auto logger = std::atomic_load(&g_logger)) {
        logger->flush();
    }
}

std::shared_ptr<spdlog::logger> getLogger() {
    if (auto logger = std::atomic_load(&g_logger)) {
        return logger;
    }

    std::lock_guard<std::mutex> lock(g_configMutex);
    auto logger = std::atomic_load(&g_logger);
    if (!logger) {
        try {
            logger = makeLogger(LogConfig{});
        } catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "playctl: logging disabled: " << ex.what() << std::endl;
            logger = std::make_shared<spdlog::logger>("playctl");
        }
        std::atomic_store(&g_logger, logger);
    }
    return logger;
}

std::string_view levelToString(LogLevel level) {
    return entryFor(level).name;
}

LogLevel stringToLevel(std::string_view name) {
    std::string lower;
    for (char c : name) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (lower == "warning") {
        return LogLevel::Warn;
    }
    if (lower == "err") {
        return LogLevel::Error;
    }
    for (const auto& entry : kLevels) {
        if (lower == entry.name) {
            return entry.level;
        }
    }
    return LogLevel::Warn;
}

}  // namespace logging
}  // namespace playctl
