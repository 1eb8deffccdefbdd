#pragma once

#include "playctl/core/config_loader.h"
#include "playctl/playback/audio.h"
#include "playctl/playback/command_codec.h"
#include "playctl/playback/source_descriptor.h"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace playctl {

class StatusResolver;

/**
 * @brief Describes an audio source and starts it on the daemon.
 *
 * Defaults: volume 1.0, no looping, loop count -1 (forever, once looping is enabled).
 *
 *   auto audio = AudioBuilder(ToneSource{Waveform::Square, 440.0, 2.0}).volume(0.5).build();
 */
class AudioBuilder {
   public:
    explicit AudioBuilder(SourceDescriptor source, ClientConfig config = ClientConfig{});

    /**
     * @brief Use a fixed provisional name instead of a generated one.
     *
     * Not recommended: if two sources share a name, build() attaches to whichever
     * matching record the snapshot lists first.
     */
    AudioBuilder& name(std::string name);

    AudioBuilder& volume(double volume);
    AudioBuilder& doesLoop(bool doesLoop);

    // Only meaningful with doesLoop(true). Negative = loop forever.
    AudioBuilder& loopCount(int64_t loopCount);

    const SourceDescriptor& source() const {
        return source_;
    }
    const PlaybackParams& params() const {
        return params_;
    }
    const ClientConfig& config() const {
        return config_;
    }

    /**
     * @brief Submit a create command and wait until the daemon publishes the source.
     *
     * Blocks for at most config().confirmTimeoutMs. May be called repeatedly; each call
     * starts an independent source under a fresh provisional name (unless name() was set).
     *
     * Throws PlaybackError:
     * - IO_CHANNEL_OPEN_FAILED / IO_CHANNEL_WRITE_FAILED: command could not be submitted
     * - IPC_ENCODE_FAILED: non-finite volume/pitch/duration or unencodable path
     * - IPC_CONFIRM_TIMEOUT: the daemon did not publish the source in time; it may still
     *   start playing later
     */
    Audio build() const;

   private:
    SourceDescriptor source_;
    PlaybackParams params_;
    std::optional<std::string> name_;
    ClientConfig config_;
};

/**
 * @brief Poll the status snapshot until a record named `name` appears.
 *
 * Read, parse and lookup failures count as "not yet". Sleeps `pollInterval` between
 * attempts (zero = spin). Returns the record's ID, or throws IPC_CONFIRM_TIMEOUT once
 * `timeout` has elapsed.
 */
uint64_t waitForSource(const StatusResolver& resolver, const std::string& name,
                       std::chrono::milliseconds timeout, std::chrono::microseconds pollInterval);

}  // namespace playctl
