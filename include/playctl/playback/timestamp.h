#pragma once

#include <chrono>
#include <string>
#include <string_view>

namespace playctl {

using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::nanoseconds>;

// Layout of StartTime / EndTime in the status snapshot
constexpr const char* TIMESTAMP_FORMAT = "YYYY-MM-DDTHH:MM:SS.fffffffffZ";

/**
 * @brief Parse a status snapshot timestamp (UTC).
 *
 * Accepts "YYYY-MM-DDTHH:MM:SS" followed by an optional "." and 1-9 fractional digits,
 * terminated by "Z". Throws PlaybackError (PARSE_TIMESTAMP_INVALID) for anything else,
 * including out-of-range calendar fields.
 */
Timestamp parseTimestamp(std::string_view text);

// Inverse of parseTimestamp; always emits nine fractional digits.
std::string formatTimestamp(Timestamp ts);

}  // namespace playctl
