#include "playctl/playback/audio.h"

#include "playctl/logging/logger.h"
#include "playctl/playback/command_channel.h"
#include "playctl/playback/status_resolver.h"

namespace playctl {

namespace sf = status_fields;

Audio::Audio(uint64_t id, SourceDescriptor type, ClientConfig config)
    : id_(id), type_(std::move(type)), config_(std::move(config)) {}

nlohmann::json Audio::record() const {
    return StatusResolver(config_.statusPath).findById(id_);
}

std::string Audio::name() const {
    return sf::getString(record(), "Name");
}

double Audio::volume() const {
    return sf::getNumber(record(), "Volume");
}

uint64_t Audio::duration() const {
    return sf::getUnsigned(record(), "Duration");
}

uint64_t Audio::remaining() const {
    return sf::getUnsigned(record(), "Remaining");
}

bool Audio::isPaused() const {
    return sf::getBool(record(), "Paused");
}

int64_t Audio::loopCount() const {
    return sf::getInteger(record(), "Loop");
}

Timestamp Audio::startTime() const {
    return parseTimestamp(sf::getString(record(), "StartTime"));
}

Timestamp Audio::endTime() const {
    return parseTimestamp(sf::getString(record(), "EndTime"));
}

void Audio::update(const AudioUpdate& update) {
    std::string payload = codec::serialize(codec::buildUpdateCommand(id_, update));
    CommandChannel(config_.commandPath).append(payload);
    LOG_DEBUG("Sent update for source {} (volume={}, paused={}, loop={}/{})", id_, update.volume,
              update.paused, update.doesLoop, update.loopCount);
}

bool isRunning(const ClientConfig& config) {
    return StatusResolver(config.statusPath).isRunning();
}

bool isDisabled(const ClientConfig& config) {
    return StatusResolver(config.statusPath).isDisabled();
}

}  // namespace playctl
