#include "playctl/playback/timestamp.h"

#include "playctl/core/error_codes.h"

#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace playctl {

namespace {

[[noreturn]] void fail(std::string_view text, const char* reason) {
    throw PlaybackError(ErrorCode::PARSE_TIMESTAMP_INVALID,
                        "Error in parsing time '" + std::string(text) + "'. (" + reason + ")");
}

bool isDigit(char c) {
    return c >= '0' && c <= '9';
}

// Reads exactly `count` digits at `pos`
bool readNumber(std::string_view text, size_t pos, size_t count, int& out) {
    if (pos + count > text.size()) {
        return false;
    }
    int value = 0;
    for (size_t i = 0; i < count; ++i) {
        char c = text[pos + i];
        if (!isDigit(c)) {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    out = value;
    return true;
}

bool isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && isLeapYear(year)) {
        return 29;
    }
    return kDays[month - 1];
}

// Days since 1970-01-01 for a proleptic Gregorian date (H. Hinnant's days_from_civil)
int64_t daysFromCivil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

}  // namespace

Timestamp parseTimestamp(std::string_view text) {
    int year = 0;
    int month = 0;
    int day = 0;
    int hour = 0;
    int minute = 0;
    int second = 0;

    if (text.size() < 20) {
        fail(text, "too short");
    }
    if (!readNumber(text, 0, 4, year) || text[4] != '-' || !readNumber(text, 5, 2, month) ||
        text[7] != '-' || !readNumber(text, 8, 2, day) || text[10] != 'T' ||
        !readNumber(text, 11, 2, hour) || text[13] != ':' || !readNumber(text, 14, 2, minute) ||
        text[16] != ':' || !readNumber(text, 17, 2, second)) {
        fail(text, "expected YYYY-MM-DDTHH:MM:SS");
    }

    if (month < 1 || month > 12) {
        fail(text, "month out of range");
    }
    if (day < 1 || day > daysInMonth(year, month)) {
        fail(text, "day out of range");
    }
    if (hour > 23 || minute > 59 || second > 59) {
        fail(text, "time of day out of range");
    }

    size_t pos = 19;
    int64_t nanos = 0;
    if (text[pos] == '.') {
        ++pos;
        size_t digits = 0;
        while (pos < text.size() && isDigit(text[pos])) {
            if (digits == 9) {
                fail(text, "more than nine fractional digits");
            }
            nanos = nanos * 10 + (text[pos] - '0');
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            fail(text, "missing fractional digits");
        }
        for (size_t i = digits; i < 9; ++i) {
            nanos *= 10;
        }
    }

    if (pos >= text.size() || text[pos] != 'Z' || pos + 1 != text.size()) {
        fail(text, "expected trailing 'Z'");
    }

    const int64_t days =
        daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    const int64_t seconds = days * 86400 + hour * 3600 + minute * 60 + second;
    return Timestamp(std::chrono::seconds(seconds) + std::chrono::nanoseconds(nanos));
}

std::string formatTimestamp(Timestamp ts) {
    const auto secs = std::chrono::floor<std::chrono::seconds>(ts);
    const int64_t nanos = (ts - secs).count();
    const std::time_t time = std::chrono::system_clock::to_time_t(secs);

    std::tm utc{};
    if (gmtime_r(&time, &utc) == nullptr) {
        throw PlaybackError(ErrorCode::PARSE_TIMESTAMP_INVALID,
                            "Error in formatting time. (year out of range)");
    }

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(9) << std::setfill('0')
        << nanos << 'Z';
    return oss.str();
}

}  // namespace playctl
