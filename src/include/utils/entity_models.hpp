#pragma once
/**
 * @file entity_models.hpp
 * @brief Typed views of the entities served by the remote API.
 *
 * Conversion is lenient in one direction only: `from_json` ignores unknown members and gives a
 * missing or null member its default, but throws `nlohmann::json::type_error` when a member is
 * present with the wrong type. Ids are kept as strings; a numeric id is rendered in decimal.
 *
 * Each model names its cache entity type in `kEntityType`, used by TypedCache<T>.
 */
#include "sd_base.hpp"

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace syncdesk::sync
{

struct Project
{
    static constexpr const char *kEntityType = "projects";

    std::string id;
    std::string name;
    std::string description;
    std::string color;
    std::string client_id;
    std::string organization_id;
    bool is_active{true};
};

struct Client
{
    static constexpr const char *kEntityType = "clients";

    std::string id;
    std::string name;
    std::string email;
    std::string organization_id;
};

struct TimeEntry
{
    static constexpr const char *kEntityType = "time_entries";

    std::string id;
    std::string project_id;
    std::string task_id;
    std::string description;
    /// ISO-8601 as sent by the server; run through ClockNormalizer before display.
    std::string start_time;
    std::string end_time;
    /// Seconds; 0 while the entry is running.
    int64_t duration{0};
    bool is_active{false};
};

struct Screenshot
{
    static constexpr const char *kEntityType = "screenshots";

    std::string id;
    std::string time_entry_id;
    std::string captured_at;
    std::string file_path;
    std::string thumbnail_path;
};

/// The user's settings document; a singleton route.
struct Settings
{
    static constexpr const char *kEntityType = "settings";

    int screenshot_interval{600}; ///< seconds
    int idle_timeout{300};        ///< seconds
    std::string theme{"system"};
    bool notifications_enabled{true};
};

struct Organization
{
    static constexpr const char *kEntityType = "organizations";

    std::string id;
    std::string name;
    std::string slug;
    std::string role;
};

SYNCDESK_UTILS_EXPORT void to_json(nlohmann::json &j, const Project &v);
SYNCDESK_UTILS_EXPORT void from_json(const nlohmann::json &j, Project &v);
SYNCDESK_UTILS_EXPORT void to_json(nlohmann::json &j, const Client &v);
SYNCDESK_UTILS_EXPORT void from_json(const nlohmann::json &j, Client &v);
SYNCDESK_UTILS_EXPORT void to_json(nlohmann::json &j, const TimeEntry &v);
SYNCDESK_UTILS_EXPORT void from_json(const nlohmann::json &j, TimeEntry &v);
SYNCDESK_UTILS_EXPORT void to_json(nlohmann::json &j, const Screenshot &v);
SYNCDESK_UTILS_EXPORT void from_json(const nlohmann::json &j, Screenshot &v);
SYNCDESK_UTILS_EXPORT void to_json(nlohmann::json &j, const Settings &v);
SYNCDESK_UTILS_EXPORT void from_json(const nlohmann::json &j, Settings &v);
SYNCDESK_UTILS_EXPORT void to_json(nlohmann::json &j, const Organization &v);
SYNCDESK_UTILS_EXPORT void from_json(const nlohmann::json &j, Organization &v);

/**
 * @brief Reads the body of `GET /time-entries/current`.
 *
 * `{"active": false}` gives nullopt; `{"active": true, "time_entry": {...}}` gives the entry.
 * Throws nlohmann::json::exception when `active` is set but the entry is missing or malformed.
 */
SYNCDESK_UTILS_EXPORT std::optional<TimeEntry> running_time_entry(const nlohmann::json &body);

} // namespace syncdesk::sync
