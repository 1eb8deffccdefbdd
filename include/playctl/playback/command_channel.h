#pragma once

#include <string>

namespace playctl {

// Append-only writer for the daemon's command file.
//
// Each append() opens the file with O_APPEND (never O_CREAT: the daemon owns the file),
// writes the whole record, and closes it again. Records carry no delimiter.
class CommandChannel {
   public:
    explicit CommandChannel(std::string path);

    const std::string& path() const;

    // Throws PlaybackError: IO_CHANNEL_OPEN_FAILED if the file cannot be opened,
    // IO_CHANNEL_WRITE_FAILED if the record could not be fully written.
    void append(const std::string& record) const;

   private:
    std::string path_;
};

}  // namespace playctl
