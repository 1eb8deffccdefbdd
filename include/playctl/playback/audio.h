#pragma once

#include "playctl/core/config_loader.h"
#include "playctl/playback/command_codec.h"
#include "playctl/playback/source_descriptor.h"
#include "playctl/playback/timestamp.h"

#include <cstdint>
#include <string>

namespace playctl {

class AudioBuilder;

/**
 * @brief Handle to a playing audio source.
 *
 * Obtained from AudioBuilder::build() once the daemon has published the source. Every
 * getter re-reads the status snapshot and throws PlaybackError:
 * - LOOKUP_ID_NOT_FOUND once the daemon has dropped the source (finished or removed)
 * - PARSE_STATUS_FIELD_INVALID if the field is missing or has the wrong type
 * - IO_STATUS_READ_FAILED / PARSE_STATUS_MALFORMED if the snapshot itself is unusable
 *
 * A handle owns nothing on the daemon side; copying or destroying it has no effect there.
 */
class Audio {
   public:
    // Daemon-assigned identity
    uint64_t id() const {
        return id_;
    }

    // Source as submitted to the builder
    const SourceDescriptor& type() const {
        return type_;
    }

    std::string name() const;
    double volume() const;

    // Milliseconds
    uint64_t duration() const;
    uint64_t remaining() const;

    bool isPaused() const;

    // Remaining loop count as reported by the daemon; negative = infinite
    int64_t loopCount() const;

    // Also throws PARSE_TIMESTAMP_INVALID
    Timestamp startTime() const;
    Timestamp endTime() const;

    /**
     * @brief Send an update for this source.
     *
     * Fire-and-forget: returns once the command is appended. The daemon applies it on its
     * own schedule, so an immediate re-query may still show the old values.
     * Throws IO_CHANNEL_OPEN_FAILED / IO_CHANNEL_WRITE_FAILED / IPC_ENCODE_FAILED.
     */
    void update(const AudioUpdate& update);

   private:
    friend class AudioBuilder;

    Audio(uint64_t id, SourceDescriptor type, ClientConfig config);

    nlohmann::json record() const;

    uint64_t id_;
    SourceDescriptor type_;
    ClientConfig config_;
};

// Whether any audio source is currently playing
bool isRunning(const ClientConfig& config = ClientConfig{});

// Whether the daemon has been disabled by the host
bool isDisabled(const ClientConfig& config = ClientConfig{});

}  // namespace playctl
