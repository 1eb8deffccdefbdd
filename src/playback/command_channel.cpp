#include "playctl/playback/command_channel.h"

#include "playctl/core/error_codes.h"
#include "playctl/logging/logger.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace playctl {

namespace {

PlaybackError channelError(ErrorCode code, const std::string& action, const std::string& path,
                           int err) {
    InnerError inner(code, std::strerror(err));
    inner.path = path;
    inner.sys_errno = err;
    return PlaybackError(code, "Error in " + action + " " + path + ". (" + std::strerror(err) + ")",
                         std::move(inner));
}

}  // namespace

CommandChannel::CommandChannel(std::string path) : path_(std::move(path)) {}

const std::string& CommandChannel::path() const {
    return path_;
}

void CommandChannel::append(const std::string& record) const {
    int fd = open(path_.c_str(), O_WRONLY | O_APPEND | O_CLOEXEC);
    if (fd < 0) {
        int err = errno;
        LOG_ERROR("Cannot open command channel: {} ({})", path_, std::strerror(err));
        throw channelError(ErrorCode::IO_CHANNEL_OPEN_FAILED, "opening", path_, err);
    }

    // A single write(2) keeps the record contiguous for pipes up to PIPE_BUF;
    // loop only on partial writes to regular files.
    const char* data = record.data();
    size_t remaining = record.size();
    while (remaining > 0) {
        ssize_t written = write(fd, data, remaining);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            int err = errno;
            close(fd);
            LOG_ERROR("Cannot write command channel: {} ({})", path_, std::strerror(err));
            throw channelError(ErrorCode::IO_CHANNEL_WRITE_FAILED, "writing to", path_, err);
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }

    if (close(fd) < 0) {
        int err = errno;
        LOG_WARN("Closing command channel {} reported: {}", path_, std::strerror(err));
    }
    LOG_TRACE("Appended {} bytes to {}", record.size(), path_);
}

}  // namespace playctl
