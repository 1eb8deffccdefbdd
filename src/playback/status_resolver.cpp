#include "playctl/playback/status_resolver.h"

#include "playctl/core/error_codes.h"

#include <cerrno>
#include <cmath>
#include <cstring>
#include <fstream>
#include <iterator>
#include <ios>

using json = nlohmann::json;

namespace playctl {

namespace {

PlaybackError fieldError(const char* key, const char* expected) {
    return PlaybackError(ErrorCode::PARSE_STATUS_FIELD_INVALID,
                         std::string("Status field '") + key + "' is missing or not " + expected);
}

// Integral value of a JSON number, accepting floats such as 2000.0 that some
// encoders emit for whole numbers.
bool integralValue(const json& value, long double& out) {
    if (value.is_number_unsigned()) {
        out = static_cast<long double>(value.get<uint64_t>());
        return true;
    }
    if (value.is_number_integer()) {
        out = static_cast<long double>(value.get<int64_t>());
        return true;
    }
    if (value.is_number_float()) {
        double d = value.get<double>();
        if (std::isfinite(d) && std::floor(d) == d) {
            out = d;
            return true;
        }
    }
    return false;
}

// Exact powers of two, so the range checks hold whatever the width of long double
constexpr long double kTwoPow63 = 9223372036854775808.0L;
constexpr long double kTwoPow64 = 18446744073709551616.0L;

bool idMatches(const json& record, uint64_t id) {
    if (!record.is_object()) {
        return false;
    }
    auto it = record.find("ID");
    if (it == record.end()) {
        return false;
    }
    if (it->is_number_unsigned()) {
        return it->get<uint64_t>() == id;
    }
    long double value = 0;
    return integralValue(*it, value) && value >= 0 && value == static_cast<long double>(id);
}

bool nameMatches(const json& record, const std::string& name) {
    if (!record.is_object()) {
        return false;
    }
    auto it = record.find("Name");
    return it != record.end() && it->is_string() && it->get_ref<const std::string&>() == name;
}

const json* sourcesOf(const json& status) {
    auto it = status.find("Sources");
    if (it == status.end() || !it->is_array()) {
        return nullptr;
    }
    return &(*it);
}

}  // namespace

StatusResolver::StatusResolver(std::string statusPath) : path_(std::move(statusPath)) {}

const std::string& StatusResolver::path() const {
    return path_;
}

json StatusResolver::parseStatus() const {
    std::ifstream file(path_);
    if (!file.is_open()) {
        int err = errno;
        InnerError inner(ErrorCode::IO_STATUS_READ_FAILED, std::strerror(err));
        inner.path = path_;
        inner.sys_errno = err;
        throw PlaybackError(ErrorCode::IO_STATUS_READ_FAILED,
                            "Error in reading " + path_ + ". (" + std::strerror(err) + ")",
                            std::move(inner));
    }

    std::string content;
    errno = 0;
    try {
        content.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    } catch (const std::ios_base::failure& e) {
        // libstdc++ rethrows read(2) failures such as EISDIR out of the streambuf
        int err = errno;
        const char* reason = err != 0 ? std::strerror(err) : e.what();
        InnerError inner(ErrorCode::IO_STATUS_READ_FAILED, reason);
        inner.path = path_;
        if (err != 0) {
            inner.sys_errno = err;
        }
        throw PlaybackError(ErrorCode::IO_STATUS_READ_FAILED,
                            "Error in reading " + path_ + ". (" + reason + ")", std::move(inner));
    }
    if (file.bad()) {
        InnerError inner(ErrorCode::IO_STATUS_READ_FAILED, "stream read failed");
        inner.path = path_;
        throw PlaybackError(ErrorCode::IO_STATUS_READ_FAILED,
                            "Error in reading " + path_ + ". (stream read failed)",
                            std::move(inner));
    }

    json status;
    try {
        status = json::parse(content);
    } catch (const json::parse_error& e) {
        InnerError inner(ErrorCode::PARSE_STATUS_MALFORMED, e.what());
        inner.path = path_;
        throw PlaybackError(ErrorCode::PARSE_STATUS_MALFORMED,
                            std::string("Error in parsing JSON. (") + e.what() + ")",
                            std::move(inner));
    }

    if (!status.is_object()) {
        InnerError inner(ErrorCode::PARSE_STATUS_MALFORMED, "top-level value is not an object");
        inner.path = path_;
        throw PlaybackError(ErrorCode::PARSE_STATUS_MALFORMED,
                            "Error in parsing JSON. (top-level value is not an object)",
                            std::move(inner));
    }
    return status;
}

json StatusResolver::findById(uint64_t id) const {
    json status = parseStatus();
    if (const json* sources = sourcesOf(status)) {
        for (const auto& record : *sources) {
            if (idMatches(record, id)) {
                return record;
            }
        }
    }
    throw PlaybackError(ErrorCode::LOOKUP_ID_NOT_FOUND,
                        "No audio source found with id " + std::to_string(id) + ".");
}

json StatusResolver::findByName(const std::string& name) const {
    json status = parseStatus();
    if (const json* sources = sourcesOf(status)) {
        for (const auto& record : *sources) {
            if (nameMatches(record, name)) {
                return record;
            }
        }
    }
    throw PlaybackError(ErrorCode::LOOKUP_NAME_NOT_FOUND,
                        "No audio source found with name " + name + ".");
}

bool StatusResolver::isRunning() const {
    return status_fields::getBool(parseStatus(), "Running");
}

bool StatusResolver::isDisabled() const {
    return status_fields::getBool(parseStatus(), "Disabled");
}

// ============================================================
// Field extraction
// ============================================================

namespace status_fields {

std::string getString(const json& record, const char* key) {
    auto it = record.find(key);
    if (it == record.end() || !it->is_string()) {
        throw fieldError(key, "a string");
    }
    return it->get<std::string>();
}

double getNumber(const json& record, const char* key) {
    auto it = record.find(key);
    if (it == record.end() || !it->is_number()) {
        throw fieldError(key, "a number");
    }
    return it->get<double>();
}

uint64_t getUnsigned(const json& record, const char* key) {
    auto it = record.find(key);
    if (it == record.end()) {
        throw fieldError(key, "an unsigned integer");
    }
    if (it->is_number_unsigned()) {
        return it->get<uint64_t>();
    }
    long double value = 0;
    if (!integralValue(*it, value) || value < 0 || value >= kTwoPow64) {
        throw fieldError(key, "an unsigned integer");
    }
    return static_cast<uint64_t>(value);
}

int64_t getInteger(const json& record, const char* key) {
    auto it = record.find(key);
    if (it == record.end()) {
        throw fieldError(key, "an integer");
    }
    if (it->is_number_integer() && !it->is_number_unsigned()) {
        return it->get<int64_t>();
    }
    long double value = 0;
    if (!integralValue(*it, value) || value < -kTwoPow63 || value >= kTwoPow63) {
        throw fieldError(key, "an integer");
    }
    return static_cast<int64_t>(value);
}

bool getBool(const json& record, const char* key) {
    auto it = record.find(key);
    if (it == record.end() || !it->is_boolean()) {
        throw fieldError(key, "a boolean");
    }
    return it->get<bool>();
}

}  // namespace status_fields

}  // namespace playctl
