#include "playctl/playback/command_codec.h"

#include "playctl/core/error_codes.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <stdexcept>

namespace playctl {
namespace codec {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// nlohmann dumps NaN/Inf as null, which the daemon would reject or misread
void requireFinite(double value, const char* field) {
    if (!std::isfinite(value)) {
        throw PlaybackError(ErrorCode::IPC_ENCODE_FAILED,
                            std::string("Cannot encode non-finite ") + field);
    }
}

}  // namespace

// ============================================================
// String conversion utilities
// ============================================================

const char* fileFormatToString(FileFormat format) {
    switch (format) {
    case FileFormat::Wav:
        return "wav";
    case FileFormat::Aiff:
        return "aiff";
    case FileFormat::Mp3:
        return "mp3";
    default:
        return "wav";
    }
}

FileFormat parseFileFormat(const std::string& str) {
    static const std::map<std::string, FileFormat> lookup = {
        {"wav", FileFormat::Wav}, {"aiff", FileFormat::Aiff}, {"mp3", FileFormat::Mp3}};

    auto it = lookup.find(toLower(str));
    if (it != lookup.end()) {
        return it->second;
    }
    throw std::invalid_argument("Unknown file format: " + str);
}

uint8_t waveformCode(Waveform waveform) {
    return static_cast<uint8_t>(waveform);
}

Waveform parseWaveform(int code) {
    switch (code) {
    case 0:
        return Waveform::Sine;
    case 1:
        return Waveform::Triangle;
    case 2:
        return Waveform::Saw;
    case 3:
        return Waveform::Square;
    default:
        throw std::invalid_argument("Unknown waveform code: " + std::to_string(code));
    }
}

const char* sourceTypeName(const SourceDescriptor& source) {
    if (const auto* file = std::get_if<FileSource>(&source)) {
        return fileFormatToString(file->format);
    }
    return "tone";
}

// ============================================================
// Command builders
// ============================================================

Command buildArgs(const SourceDescriptor& source) {
    Command args = Command::object();
    if (const auto* file = std::get_if<FileSource>(&source)) {
        args["Path"] = file->path;
    } else {
        const auto& tone = std::get<ToneSource>(source);
        requireFinite(tone.pitch, "tone pitch");
        requireFinite(tone.duration, "tone duration");
        args["WaveType"] = waveformCode(tone.waveform);
        args["Pitch"] = tone.pitch;
        args["Seconds"] = tone.duration;
    }
    return args;
}

Command buildCreateCommand(const std::string& name, const SourceDescriptor& source,
                           const PlaybackParams& params) {
    requireFinite(params.volume, "volume");

    Command j;
    j["Name"] = name;
    j["Type"] = sourceTypeName(source);
    j["Volume"] = params.volume;
    j["DoesLoop"] = params.doesLoop;
    j["LoopCount"] = params.loopCount;
    j["Args"] = buildArgs(source);
    return j;
}

Command buildUpdateCommand(uint64_t id, const AudioUpdate& update) {
    requireFinite(update.volume, "volume");

    Command j;
    j["ID"] = id;
    j["Volume"] = update.volume;
    j["Paused"] = update.paused;
    j["DoesLoop"] = update.doesLoop;
    j["LoopCount"] = update.loopCount;
    return j;
}

std::string serialize(const Command& command) {
    try {
        return command.dump();
    } catch (const nlohmann::json::type_error& e) {
        throw PlaybackError(ErrorCode::IPC_ENCODE_FAILED,
                            std::string("Cannot serialize command: ") + e.what());
    }
}

}  // namespace codec
}  // namespace playctl
