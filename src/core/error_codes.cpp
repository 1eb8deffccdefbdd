#include "playctl/core/error_codes.h"

#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace playctl {

// Error code to string mapping
static const std::unordered_map<ErrorCode, const char*> kErrorCodeStrings = {
    {ErrorCode::OK, "OK"},

    // I/O
    {ErrorCode::IO_CHANNEL_OPEN_FAILED, "IO_CHANNEL_OPEN_FAILED"},
    {ErrorCode::IO_CHANNEL_WRITE_FAILED, "IO_CHANNEL_WRITE_FAILED"},
    {ErrorCode::IO_STATUS_READ_FAILED, "IO_STATUS_READ_FAILED"},

    // Parse
    {ErrorCode::PARSE_STATUS_MALFORMED, "PARSE_STATUS_MALFORMED"},
    {ErrorCode::PARSE_STATUS_FIELD_INVALID, "PARSE_STATUS_FIELD_INVALID"},
    {ErrorCode::PARSE_TIMESTAMP_INVALID, "PARSE_TIMESTAMP_INVALID"},

    // Lookup
    {ErrorCode::LOOKUP_ID_NOT_FOUND, "LOOKUP_ID_NOT_FOUND"},
    {ErrorCode::LOOKUP_NAME_NOT_FOUND, "LOOKUP_NAME_NOT_FOUND"},

    // IPC
    {ErrorCode::IPC_CONFIRM_TIMEOUT, "IPC_CONFIRM_TIMEOUT"},
    {ErrorCode::IPC_ENCODE_FAILED, "IPC_ENCODE_FAILED"},

    // Internal
    {ErrorCode::INTERNAL_UNKNOWN, "INTERNAL_UNKNOWN"},
};

// String to error code mapping (reverse lookup)
static const std::unordered_map<std::string, ErrorCode> kStringToErrorCode = {
    {"OK", ErrorCode::OK},

    // I/O
    {"IO_CHANNEL_OPEN_FAILED", ErrorCode::IO_CHANNEL_OPEN_FAILED},
    {"IO_CHANNEL_WRITE_FAILED", ErrorCode::IO_CHANNEL_WRITE_FAILED},
    {"IO_STATUS_READ_FAILED", ErrorCode::IO_STATUS_READ_FAILED},

    // Parse
    {"PARSE_STATUS_MALFORMED", ErrorCode::PARSE_STATUS_MALFORMED},
    {"PARSE_STATUS_FIELD_INVALID", ErrorCode::PARSE_STATUS_FIELD_INVALID},
    {"PARSE_TIMESTAMP_INVALID", ErrorCode::PARSE_TIMESTAMP_INVALID},

    // Lookup
    {"LOOKUP_ID_NOT_FOUND", ErrorCode::LOOKUP_ID_NOT_FOUND},
    {"LOOKUP_NAME_NOT_FOUND", ErrorCode::LOOKUP_NAME_NOT_FOUND},

    // IPC
    {"IPC_CONFIRM_TIMEOUT", ErrorCode::IPC_CONFIRM_TIMEOUT},
    {"IPC_ENCODE_FAILED", ErrorCode::IPC_ENCODE_FAILED},

    // Internal
    {"INTERNAL_UNKNOWN", ErrorCode::INTERNAL_UNKNOWN},
};

InnerError::InnerError(ErrorCode code, const std::string& message)
    : cpp_code(errorCodeToHex(code)), cpp_message(message) {}

PlaybackError::PlaybackError(ErrorCode code, const std::string& message, InnerError inner)
    : std::runtime_error(message), code_(code), inner_(std::move(inner)) {
    if (inner_.cpp_code.empty()) {
        inner_.cpp_code = errorCodeToHex(code);
    }
    if (inner_.cpp_message.empty()) {
        inner_.cpp_message = message;
    }
}

const char* errorCodeToString(ErrorCode code) {
    auto it = kErrorCodeStrings.find(code);
    if (it != kErrorCodeStrings.end()) {
        return it->second;
    }
    return "UNKNOWN_ERROR";
}

const char* getErrorCategory(ErrorCode code) {
    if (code == ErrorCode::OK) {
        return "ok";
    }
    if (isIoError(code)) {
        return "io";
    }
    if (isParseError(code)) {
        return "parse";
    }
    if (isLookupError(code)) {
        return "lookup";
    }
    if (isIpcError(code)) {
        return "ipc";
    }
    return "internal";
}

std::string errorCodeToHex(ErrorCode code) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setfill('0') << std::setw(4) << static_cast<uint32_t>(code);
    return oss.str();
}

ErrorCode stringToErrorCode(const std::string& str) {
    auto it = kStringToErrorCode.find(str);
    if (it != kStringToErrorCode.end()) {
        return it->second;
    }
    return ErrorCode::INTERNAL_UNKNOWN;
}

}  // namespace playctl
