#pragma once

#include <cstdint>
#include <string>
#include <variant>

namespace playctl {

// Audio file formats understood by the daemon
enum class FileFormat { Wav, Aiff, Mp3 };

// Tone waveforms; the numeric value is the daemon's WaveType code
enum class Waveform : uint8_t {
    Sine = 0,
    Triangle = 1,
    Saw = 2,
    Square = 3,
};

struct FileSource {
    FileFormat format = FileFormat::Wav;
    std::string path;
};

struct ToneSource {
    Waveform waveform = Waveform::Sine;
    double pitch = 440.0;   // Hz
    double duration = 1.0;  // seconds
};

inline bool operator==(const FileSource& a, const FileSource& b) {
    return a.format == b.format && a.path == b.path;
}
inline bool operator!=(const FileSource& a, const FileSource& b) {
    return !(a == b);
}
inline bool operator==(const ToneSource& a, const ToneSource& b) {
    return a.waveform == b.waveform && a.pitch == b.pitch && a.duration == b.duration;
}
inline bool operator!=(const ToneSource& a, const ToneSource& b) {
    return !(a == b);
}

// What to play: a file or a synthesized tone
using SourceDescriptor = std::variant<FileSource, ToneSource>;

inline bool isTone(const SourceDescriptor& source) {
    return std::holds_alternative<ToneSource>(source);
}

}  // namespace playctl
