#ifndef PLAYCTL_CONFIG_LOADER_H
#define PLAYCTL_CONFIG_LOADER_H

#include "playctl/core/client_constants.h"

#include <filesystem>
#include <string>

namespace playctl {

constexpr const char* DEFAULT_CONFIG_FILE = "playctl.json";

// Where the daemon endpoints live and how long build() waits for confirmation.
// The "logging" section of the same file is read by logging::initializeFromConfig().
struct ClientConfig {
    std::string commandPath = ClientConstants::DEFAULT_COMMAND_PATH;
    std::string statusPath = ClientConstants::DEFAULT_STATUS_PATH;
    int confirmTimeoutMs = ClientConstants::DEFAULT_CONFIRM_TIMEOUT_MS;
    int pollIntervalUs = ClientConstants::DEFAULT_POLL_INTERVAL_US;
    std::string namePrefix = ClientConstants::DEFAULT_NAME_PREFIX;
};

// Returns false (and leaves defaults in outConfig) if the file is missing or not valid JSON.
// Out-of-range values are clamped and reported through LOG_WARN when verbose.
bool loadClientConfig(const std::filesystem::path& configPath, ClientConfig& outConfig,
                      bool verbose = true);

}  // namespace playctl

#endif  // PLAYCTL_CONFIG_LOADER_H
