#include "utils/entity_models.hpp"

namespace syncdesk::sync
{

namespace
{

// Optional members: absent or null keeps the default already in `out`.
template <typename T> void read_opt(const nlohmann::json &j, const char *key, T &out)
{
    auto it = j.find(key);
    if (it != j.end() && !it->is_null())
        it->get_to(out);
}

void read_id(const nlohmann::json &j, const char *key, std::string &out)
{
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return;
    out = it->is_string() ? it->get<std::string>() : it->dump();
}

// Empty ids and references go out as null, which the API accepts for "none".
nlohmann::json id_or_null(const std::string &id)
{
    return id.empty() ? nlohmann::json() : nlohmann::json(id);
}

// Throws type_error when `j` is not an object.
void require_object(const nlohmann::json &j)
{
    (void)j.get_ref<const nlohmann::json::object_t &>();
}

} // namespace

void to_json(nlohmann::json &j, const Project &v)
{
    j = {{"id", id_or_null(v.id)},
         {"name", v.name},
         {"description", v.description},
         {"color", v.color},
         {"client_id", id_or_null(v.client_id)},
         {"organization_id", id_or_null(v.organization_id)},
         {"is_active", v.is_active}};
}

void from_json(const nlohmann::json &j, Project &v)
{
    require_object(j);
    read_id(j, "id", v.id);
    read_opt(j, "name", v.name);
    read_opt(j, "description", v.description);
    read_opt(j, "color", v.color);
    read_id(j, "client_id", v.client_id);
    read_id(j, "organization_id", v.organization_id);
    read_opt(j, "is_active", v.is_active);
}

void to_json(nlohmann::json &j, const Client &v)
{
    j = {{"id", id_or_null(v.id)},
         {"name", v.name},
         {"email", v.email},
         {"organization_id", id_or_null(v.organization_id)}};
}

void from_json(const nlohmann::json &j, Client &v)
{
    require_object(j);
    read_id(j, "id", v.id);
    read_opt(j, "name", v.name);
    read_opt(j, "email", v.email);
    read_id(j, "organization_id", v.organization_id);
}

void to_json(nlohmann::json &j, const TimeEntry &v)
{
    j = {{"id", id_or_null(v.id)},
         {"project_id", id_or_null(v.project_id)},
         {"task_id", id_or_null(v.task_id)},
         {"description", v.description},
         {"start_time", v.start_time.empty() ? nlohmann::json() : nlohmann::json(v.start_time)},
         {"end_time", v.end_time.empty() ? nlohmann::json() : nlohmann::json(v.end_time)},
         {"duration", v.duration},
         {"is_active", v.is_active}};
}

void from_json(const nlohmann::json &j, TimeEntry &v)
{
    require_object(j);
    read_id(j, "id", v.id);
    read_id(j, "project_id", v.project_id);
    read_id(j, "task_id", v.task_id);
    read_opt(j, "description", v.description);
    read_opt(j, "start_time", v.start_time);
    read_opt(j, "end_time", v.end_time);
    read_opt(j, "duration", v.duration);
    read_opt(j, "is_active", v.is_active);
}

void to_json(nlohmann::json &j, const Screenshot &v)
{
    j = {{"id", id_or_null(v.id)},
         {"time_entry_id", id_or_null(v.time_entry_id)},
         {"captured_at", v.captured_at},
         {"file_path", v.file_path},
         {"thumbnail_path", v.thumbnail_path}};
}

void from_json(const nlohmann::json &j, Screenshot &v)
{
    require_object(j);
    read_id(j, "id", v.id);
    read_id(j, "time_entry_id", v.time_entry_id);
    read_opt(j, "captured_at", v.captured_at);
    read_opt(j, "file_path", v.file_path);
    read_opt(j, "thumbnail_path", v.thumbnail_path);
}

void to_json(nlohmann::json &j, const Settings &v)
{
    j = {{"screenshot_interval", v.screenshot_interval},
         {"idle_timeout", v.idle_timeout},
         {"theme", v.theme},
         {"notifications_enabled", v.notifications_enabled}};
}

void from_json(const nlohmann::json &j, Settings &v)
{
    require_object(j);
    read_opt(j, "screenshot_interval", v.screenshot_interval);
    read_opt(j, "idle_timeout", v.idle_timeout);
    read_opt(j, "theme", v.theme);
    read_opt(j, "notifications_enabled", v.notifications_enabled);
}

void to_json(nlohmann::json &j, const Organization &v)
{
    j = {{"id", id_or_null(v.id)}, {"name", v.name}, {"slug", v.slug}, {"role", v.role}};
}

void from_json(const nlohmann::json &j, Organization &v)
{
    require_object(j);
    read_id(j, "id", v.id);
    read_opt(j, "name", v.name);
    read_opt(j, "slug", v.slug);
    read_opt(j, "role", v.role);
}

std::optional<TimeEntry> running_time_entry(const nlohmann::json &body)
{
    require_object(body);
    if (!body.value("active", false))
        return std::nullopt;
    return body.at("time_entry").get<TimeEntry>();
}

} // namespace syncdesk::sync
