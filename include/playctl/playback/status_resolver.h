#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace playctl {

/**
 * @brief Read-only view of the daemon's status snapshot.
 *
 * The snapshot is re-read and re-parsed on every call. The daemon may rewrite the file
 * at any moment, so nothing is cached between calls.
 *
 * Expected document:
 * {
 *   "Running": bool, "Disabled": bool,
 *   "Sources": [ { "ID": uint, "Name": str, "Volume": num, "Paused": bool, "Loop": int,
 *                  "Duration": ms, "Remaining": ms, "StartTime": ts, "EndTime": ts, ... } ]
 * }
 */
class StatusResolver {
   public:
    explicit StatusResolver(std::string statusPath);

    const std::string& path() const;

    // Throws PlaybackError: IO_STATUS_READ_FAILED if the file is missing or unreadable,
    // PARSE_STATUS_MALFORMED if it is not a JSON object.
    nlohmann::json parseStatus() const;

    // First record whose "ID" equals id. Throws LOOKUP_ID_NOT_FOUND if none.
    nlohmann::json findById(uint64_t id) const;

    // First record whose "Name" equals name. Throws LOOKUP_NAME_NOT_FOUND if none.
    nlohmann::json findByName(const std::string& name) const;

    // Top-level flags. Throw PARSE_STATUS_FIELD_INVALID if the flag is missing or not a bool.
    bool isRunning() const;
    bool isDisabled() const;

   private:
    std::string path_;
};

/**
 * @brief Typed field extraction from a status record.
 *
 * Throws PlaybackError (PARSE_STATUS_FIELD_INVALID) naming the field if it is absent or
 * has the wrong JSON type.
 */
namespace status_fields {

std::string getString(const nlohmann::json& record, const char* key);
double getNumber(const nlohmann::json& record, const char* key);
uint64_t getUnsigned(const nlohmann::json& record, const char* key);
int64_t getInteger(const nlohmann::json& record, const char* key);
bool getBool(const nlohmann::json& record, const char* key);

}  // namespace status_fields

}  // namespace playctl
