#ifndef PLAYCTL_CLIENT_CONSTANTS_H
#define PLAYCTL_CLIENT_CONSTANTS_H

#include <cstdint>

// Constants shared between the builder, resolver and config loader

namespace playctl {
namespace ClientConstants {

// Filesystem endpoints owned by the playback daemon
constexpr const char* DEFAULT_COMMAND_PATH = "/tmp/audio";
constexpr const char* DEFAULT_STATUS_PATH = "/tmp/audioStatus.json";

// Create-and-confirm polling
constexpr int DEFAULT_CONFIRM_TIMEOUT_MS = 2000;
constexpr int DEFAULT_POLL_INTERVAL_US = 1000;  // 0 = spin without sleeping
constexpr int MAX_POLL_INTERVAL_US = 100000;

// Provisional names are "<prefix><counter>"
constexpr const char* DEFAULT_NAME_PREFIX = "cpp_audio_";

// Builder defaults
constexpr double DEFAULT_VOLUME = 1.0;
constexpr int64_t INFINITE_LOOP_COUNT = -1;

}  // namespace ClientConstants
}  // namespace playctl

#endif  // PLAYCTL_CLIENT_CONSTANTS_H
