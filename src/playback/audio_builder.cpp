#include "playctl/playback/audio_builder.h"

#include "playctl/core/error_codes.h"
#include "playctl/logging/logger.h"
#include "playctl/playback/command_channel.h"
#include "playctl/playback/provisional_name.h"
#include "playctl/playback/status_resolver.h"

#include <thread>

namespace playctl {

AudioBuilder::AudioBuilder(SourceDescriptor source, ClientConfig config)
    : source_(std::move(source)), config_(std::move(config)) {
    params_.volume = ClientConstants::DEFAULT_VOLUME;
    params_.doesLoop = false;
    params_.loopCount = ClientConstants::INFINITE_LOOP_COUNT;
}

AudioBuilder& AudioBuilder::name(std::string name) {
    name_ = std::move(name);
    return *this;
}

AudioBuilder& AudioBuilder::volume(double volume) {
    params_.volume = volume;
    return *this;
}

AudioBuilder& AudioBuilder::doesLoop(bool doesLoop) {
    params_.doesLoop = doesLoop;
    return *this;
}

AudioBuilder& AudioBuilder::loopCount(int64_t loopCount) {
    params_.loopCount = loopCount;
    return *this;
}

Audio AudioBuilder::build() const {
    const std::string name =
        name_.has_value() ? *name_ : naming::nextProvisionalName(config_.namePrefix);

    // Encode before touching the channel so a bad descriptor never reaches the daemon
    std::string payload = codec::serialize(codec::buildCreateCommand(name, source_, params_));
    CommandChannel(config_.commandPath).append(payload);
    LOG_DEBUG("Submitted {} source '{}' to {}", codec::sourceTypeName(source_), name,
              config_.commandPath);

    StatusResolver resolver(config_.statusPath);
    uint64_t id = waitForSource(resolver, name, std::chrono::milliseconds(config_.confirmTimeoutMs),
                                std::chrono::microseconds(config_.pollIntervalUs));
    return Audio(id, source_, config_);
}

uint64_t waitForSource(const StatusResolver& resolver, const std::string& name,
                       std::chrono::milliseconds timeout, std::chrono::microseconds pollInterval) {
    const auto start = std::chrono::steady_clock::now();
    uint64_t attempts = 0;

    while (true) {
        ++attempts;
        try {
            nlohmann::json record = resolver.findByName(name);
            uint64_t id = status_fields::getUnsigned(record, "ID");
            LOG_DEBUG("Source '{}' confirmed as id {} after {} polls ({} us)", name, id, attempts,
                      std::chrono::duration_cast<std::chrono::microseconds>(
                          std::chrono::steady_clock::now() - start)
                          .count());
            return id;
        } catch (const PlaybackError& e) {
            // Snapshot missing, mid-write or not yet updated
            LOG_EVERY_N(TRACE, 1000, "Waiting for '{}': {}", name, e.what());
        }

        if (std::chrono::steady_clock::now() - start > timeout) {
            break;
        }
        if (pollInterval.count() > 0) {
            std::this_thread::sleep_for(pollInterval);
        }
    }

    LOG_WARN("Timed out after {} ms waiting for '{}' in {}", timeout.count(), name,
             resolver.path());
    InnerError inner(ErrorCode::IPC_CONFIRM_TIMEOUT,
                     "no record named '" + name + "' after " + std::to_string(attempts) + " polls");
    inner.path = resolver.path();
    throw PlaybackError(ErrorCode::IPC_CONFIRM_TIMEOUT,
                        "Timed out while waiting for " + resolver.path() + " to update.",
                        std::move(inner));
}

}  // namespace playctl
