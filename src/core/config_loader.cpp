#include "playctl/core/config_loader.h"

#include "playctl/logging/logger.h"

#include <algorithm>
#include <fstream>
#include <nlohmann/json.hpp>

namespace playctl {

static int clampTimeoutMs(int value, bool verbose) {
    if (value >= 1) {
        return value;
    }
    if (verbose) {
        LOG_WARN("Config: confirmTimeoutMs must be >= 1 (got {}), using {}", value,
                 ClientConstants::DEFAULT_CONFIRM_TIMEOUT_MS);
    }
    return ClientConstants::DEFAULT_CONFIRM_TIMEOUT_MS;
}

static int clampPollIntervalUs(int value, bool verbose) {
    int clamped = std::clamp(value, 0, ClientConstants::MAX_POLL_INTERVAL_US);
    if (clamped != value && verbose) {
        LOG_WARN("Config: pollIntervalUs out of range [0, {}] (got {}), using {}",
                 ClientConstants::MAX_POLL_INTERVAL_US, value, clamped);
    }
    return clamped;
}

bool loadClientConfig(const std::filesystem::path& configPath, ClientConfig& outConfig,
                      bool verbose) {
    outConfig = ClientConfig{};

    std::ifstream file(configPath);
    if (!file.is_open()) {
        if (verbose) {
            LOG_INFO("Config: {} not found, using defaults", configPath.string());
        }
        return false;
    }

    try {
        nlohmann::json j;
        file >> j;

        if (!j.is_object()) {
            if (verbose) {
                LOG_ERROR("Config: {} is not a JSON object, using defaults", configPath.string());
            }
            return false;
        }

        if (j.contains("commandPath")) {
            outConfig.commandPath = j["commandPath"].get<std::string>();
        }
        if (j.contains("statusPath")) {
            outConfig.statusPath = j["statusPath"].get<std::string>();
        }
        if (j.contains("confirmTimeoutMs")) {
            outConfig.confirmTimeoutMs = clampTimeoutMs(j["confirmTimeoutMs"].get<int>(), verbose);
        }
        if (j.contains("pollIntervalUs")) {
            outConfig.pollIntervalUs = clampPollIntervalUs(j["pollIntervalUs"].get<int>(), verbose);
        }
        if (j.contains("namePrefix")) {
            std::string prefix = j["namePrefix"].get<std::string>();
            if (prefix.empty()) {
                if (verbose) {
                    LOG_WARN("Config: namePrefix must not be empty, using '{}'",
                             ClientConstants::DEFAULT_NAME_PREFIX);
                }
            } else {
                outConfig.namePrefix = prefix;
            }
        }

        if (outConfig.commandPath.empty()) {
            outConfig.commandPath = ClientConstants::DEFAULT_COMMAND_PATH;
        }
        if (outConfig.statusPath.empty()) {
            outConfig.statusPath = ClientConstants::DEFAULT_STATUS_PATH;
        }

        if (verbose) {
            LOG_INFO("Config: Loaded from {}", std::filesystem::absolute(configPath).string());
        }
        return true;
    } catch (const std::exception& e) {
        if (verbose) {
            LOG_ERROR("Config: Failed to parse {}: {}", configPath.string(), e.what());
        }
        outConfig = ClientConfig{};
        return false;
    }
}

}  // namespace playctl
