#ifndef PLAYCTL_ERROR_CODES_H
#define PLAYCTL_ERROR_CODES_H

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace playctl {

/**
 * @brief Error codes for the playback client.
 *
 * Categories use upper 4 bits of the low 16 (0xF000 mask):
 * - 0x1xxx: I/O (command channel / status snapshot access)
 * - 0x2xxx: Parse (status document, fields, timestamps)
 * - 0x3xxx: Lookup (no record for identity / name)
 * - 0x4xxx: IPC (create-and-confirm protocol, command encoding)
 * - 0xFxxx: Internal (reserved)
 */
enum class ErrorCode : uint32_t {
    OK = 0,

    // I/O (0x1000)
    IO_CHANNEL_OPEN_FAILED = 0x1001,
    IO_CHANNEL_WRITE_FAILED = 0x1002,
    IO_STATUS_READ_FAILED = 0x1003,

    // Parse (0x2000)
    PARSE_STATUS_MALFORMED = 0x2001,
    PARSE_STATUS_FIELD_INVALID = 0x2002,
    PARSE_TIMESTAMP_INVALID = 0x2003,

    // Lookup (0x3000)
    LOOKUP_ID_NOT_FOUND = 0x3001,
    LOOKUP_NAME_NOT_FOUND = 0x3002,

    // IPC (0x4000)
    IPC_CONFIRM_TIMEOUT = 0x4001,
    IPC_ENCODE_FAILED = 0x4002,

    // Internal (0xF000) - Reserved for fallback
    /** @brief Unknown/unmapped error */
    INTERNAL_UNKNOWN = 0xF001,
};

/**
 * @brief Inner error details from lower layers.
 *
 * Carries the file path and errno of a failed system call, or the message of a
 * failed JSON parse, alongside the outer error code.
 */
struct InnerError {
    std::string cpp_code;              // Error code as hex string (e.g., "0x1003")
    std::string cpp_message;           // Detailed lower-layer message
    std::optional<std::string> path;   // File involved in the failure
    std::optional<int> sys_errno;      // errno of the failed system call

    InnerError() = default;

    // Convenience constructor for simple errors
    InnerError(ErrorCode code, const std::string& message);
};

/**
 * @brief Exception thrown by every fallible client operation.
 *
 * what() returns the human readable message; code() and inner() allow callers to
 * distinguish I/O, parse, lookup and timeout failures.
 */
class PlaybackError : public std::runtime_error {
   public:
    PlaybackError(ErrorCode code, const std::string& message, InnerError inner = {});

    ErrorCode code() const noexcept {
        return code_;
    }
    const InnerError& inner() const noexcept {
        return inner_;
    }

   private:
    ErrorCode code_;
    InnerError inner_;
};

/**
 * @brief Convert ErrorCode to string representation.
 * @param code The error code
 * @return String name (e.g., "LOOKUP_ID_NOT_FOUND"), or "UNKNOWN_ERROR" for unknown codes
 */
const char* errorCodeToString(ErrorCode code);

/**
 * @brief Get the category name for an error code.
 * @param code The error code
 * @return Category name (e.g., "lookup"), or "internal" for unknown codes
 */
const char* getErrorCategory(ErrorCode code);

/**
 * @brief Convert ErrorCode to hex string.
 * @param code The error code
 * @return Hex string (e.g., "0x4001")
 */
std::string errorCodeToHex(ErrorCode code);

/**
 * @brief Convert string to ErrorCode enum.
 * @param str Error code string (e.g., "IPC_CONFIRM_TIMEOUT")
 * @return Corresponding ErrorCode, or INTERNAL_UNKNOWN if not found
 */
ErrorCode stringToErrorCode(const std::string& str);

// Category check helpers
constexpr bool isIoError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x1000;
}
constexpr bool isParseError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x2000;
}
constexpr bool isLookupError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x3000;
}
constexpr bool isIpcError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x4000;
}
constexpr bool isInternalError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0xF000;
}

/**
 * @brief Check if error is retryable.
 * @param code Error code
 * @return true if the caller may reasonably retry the operation
 *
 * Retryable errors:
 * - IPC_CONFIRM_TIMEOUT (daemon may still be busy)
 * - IO_STATUS_READ_FAILED (daemon may not have published the snapshot yet)
 * - PARSE_STATUS_MALFORMED (daemon may be mid-write)
 */
constexpr bool isRetryable(ErrorCode code) {
    return code == ErrorCode::IPC_CONFIRM_TIMEOUT || code == ErrorCode::IO_STATUS_READ_FAILED ||
           code == ErrorCode::PARSE_STATUS_MALFORMED;
}

}  // namespace playctl

#endif  // PLAYCTL_ERROR_CODES_H
