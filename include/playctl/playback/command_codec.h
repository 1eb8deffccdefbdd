#pragma once

#include "playctl/playback/source_descriptor.h"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace playctl {

// Shared playback parameters of a create command
struct PlaybackParams {
    double volume = 1.0;
    bool doesLoop = false;
    int64_t loopCount = -1;  // negative = loop forever
};

// Fields for mutating a playing source. Use a negative loopCount for an infinite loop.
struct AudioUpdate {
    double volume = 1.0;
    bool paused = false;
    bool doesLoop = false;
    int64_t loopCount = -1;
};

namespace codec {

// Insertion-ordered so the dumped fields appear in the documented order.
using Command = nlohmann::ordered_json;

// "wav", "aiff", "mp3"
const char* fileFormatToString(FileFormat format);

// Inverse of fileFormatToString (case-insensitive). Throws std::invalid_argument.
FileFormat parseFileFormat(const std::string& str);

// Daemon WaveType code (0..3)
uint8_t waveformCode(Waveform waveform);

// Inverse of waveformCode. Throws std::invalid_argument for codes outside 0..3.
Waveform parseWaveform(int code);

// "Type" discriminator: the file format string, or "tone"
const char* sourceTypeName(const SourceDescriptor& source);

// Variant-specific "Args" payload
Command buildArgs(const SourceDescriptor& source);

/**
 * @brief Build the create command for a new source.
 *
 * Format:
 *   {"Name":..., "Type":..., "Volume":..., "DoesLoop":..., "LoopCount":..., "Args":{...}}
 * where Args is {"Path":...} for files and {"WaveType":..., "Pitch":..., "Seconds":...}
 * for tones.
 */
Command buildCreateCommand(const std::string& name, const SourceDescriptor& source,
                           const PlaybackParams& params);

/**
 * @brief Build the update command for an existing source.
 *
 * Format: {"ID":..., "Volume":..., "Paused":..., "DoesLoop":..., "LoopCount":...}
 */
Command buildUpdateCommand(uint64_t id, const AudioUpdate& update);

// Compact serialization written to the command channel. Throws PlaybackError
// (IPC_ENCODE_FAILED) if the command cannot be represented, e.g. invalid UTF-8 in a path.
std::string serialize(const Command& command);

}  // namespace codec
}  // namespace playctl
