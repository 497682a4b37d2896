#include "utils/remote_endpoints.hpp"

namespace syncdesk::sync
{

const char *to_string(HttpMethod m) noexcept
{
    switch (m)
    {
    case HttpMethod::Get:
        return "GET";
    case HttpMethod::Post:
        return "POST";
    case HttpMethod::Put:
        return "PUT";
    case HttpMethod::Delete:
        return "DELETE";
    }
    return "GET";
}

std::string HttpRequest::route_key() const
{
    std::string key = fmt::format("{} {}", to_string(method), path);
    char sep = '?';
    for (const auto &[k, v] : query)
    {
        key += fmt::format("{}{}={}", sep, k, v);
        sep = '&';
    }
    return key;
}

namespace
{

HttpRequest make(HttpMethod method, std::string path, nlohmann::json body = {})
{
    HttpRequest r;
    r.method = method;
    r.path = std::move(path);
    r.body = std::move(body);
    return r;
}

} // namespace

EndpointCatalog::EndpointCatalog()
{
    set_route("projects", "/projects", false, "project");
    set_route("clients", "/clients", false, "client");
    set_route("time_entries", "/time-entries", false, "time_entry");
    set_route("screenshots", "/screenshots", false, "screenshot");
    set_route("organizations", "/organizations", false, "organization");
    set_route("settings", "/settings", /*singleton=*/true);
    set_route("tasks", "/tasks", false, "task");
}

void EndpointCatalog::set_route(const std::string &entity_type, std::string path, bool singleton,
                                std::string entity_key)
{
    while (path.size() > 1 && path.back() == '/')
        path.pop_back();
    m_routes[entity_type] = Route{std::move(path), singleton, std::move(entity_key)};
}

std::optional<EndpointCatalog::Route> EndpointCatalog::route(const std::string &entity_type) const
{
    auto it = m_routes.find(entity_type);
    if (it == m_routes.end())
        return std::nullopt;
    return it->second;
}

std::optional<HttpRequest> EndpointCatalog::request_for(TaskKind kind,
                                                        const std::string &entity_type,
                                                        const std::string &entity_id,
                                                        const nlohmann::json &payload) const
{
    const auto r = route(entity_type);
    if (!r)
        return std::nullopt;

    if (r->singleton)
    {
        switch (kind)
        {
        case TaskKind::Fetch:
            return make(HttpMethod::Get, r->path);
        case TaskKind::Update:
            return make(HttpMethod::Put, r->path, payload);
        case TaskKind::Create:
        case TaskKind::Delete:
            return std::nullopt;
        }
        return std::nullopt;
    }

    switch (kind)
    {
    case TaskKind::Fetch:
        return make(HttpMethod::Get, r->path);
    case TaskKind::Create:
        return make(HttpMethod::Post, r->path, payload);
    case TaskKind::Update:
        if (entity_id.empty())
            return std::nullopt;
        return make(HttpMethod::Put, fmt::format("{}/{}", r->path, entity_id), payload);
    case TaskKind::Delete:
        if (entity_id.empty())
            return std::nullopt;
        return make(HttpMethod::Delete, fmt::format("{}/{}", r->path, entity_id));
    }
    return std::nullopt;
}

namespace endpoints
{

HttpRequest login(const std::string &email, const std::string &password)
{
    return make(HttpMethod::Post, "/auth/login", {{"email", email}, {"password", password}});
}

HttpRequest refresh()
{
    return make(HttpMethod::Post, "/auth/refresh");
}

HttpRequest logout()
{
    return make(HttpMethod::Post, "/auth/logout");
}

HttpRequest current_user()
{
    return make(HttpMethod::Get, "/auth/user");
}

HttpRequest start_time_entry(const std::string &project_id, const std::string &task_id,
                             const std::string &description)
{
    nlohmann::json body = {{"project_id", project_id}};
    body["task_id"] = task_id.empty() ? nlohmann::json() : nlohmann::json(task_id);
    body["description"] = description.empty() ? nlohmann::json() : nlohmann::json(description);
    return make(HttpMethod::Post, "/time-entries/start", std::move(body));
}

HttpRequest stop_time_entry(const std::string &description)
{
    nlohmann::json body = nlohmann::json::object();
    if (!description.empty())
        body["description"] = description;
    return make(HttpMethod::Post, "/time-entries/stop", std::move(body));
}

HttpRequest current_time_entry()
{
    return make(HttpMethod::Get, "/time-entries/current");
}

HttpRequest list_time_entries(int limit, int offset)
{
    auto r = make(HttpMethod::Get, "/time-entries");
    r.query = {{"limit", std::to_string(limit)}, {"offset", std::to_string(offset)}};
    return r;
}

HttpRequest capture_screenshot(const std::string &time_entry_id)
{
    nlohmann::json body = nlohmann::json::object();
    if (!time_entry_id.empty())
        body["time_entry_id"] = time_entry_id;
    return make(HttpMethod::Post, "/screenshots/capture", std::move(body));
}

HttpRequest list_screenshots(int limit, int offset, const std::string &time_entry_id)
{
    auto r = make(HttpMethod::Get, "/screenshots");
    r.query = {{"limit", std::to_string(limit)}, {"offset", std::to_string(offset)}};
    if (!time_entry_id.empty())
        r.query["time_entry_id"] = time_entry_id;
    return r;
}

HttpRequest screenshot_image(const std::string &screenshot_id)
{
    return make(HttpMethod::Get, fmt::format("/screenshots/{}/image", screenshot_id));
}

HttpRequest screenshot_thumbnail(const std::string &screenshot_id)
{
    return make(HttpMethod::Get, fmt::format("/screenshots/{}/thumbnail", screenshot_id));
}

HttpRequest get_settings()
{
    return make(HttpMethod::Get, "/settings");
}

HttpRequest put_settings(const nlohmann::json &settings)
{
    return make(HttpMethod::Put, "/settings", settings);
}

HttpRequest get_profile()
{
    return make(HttpMethod::Get, "/profile");
}

HttpRequest put_profile(const nlohmann::json &profile)
{
    return make(HttpMethod::Put, "/profile", profile);
}

HttpRequest sync_status()
{
    return make(HttpMethod::Get, "/sync/status");
}

HttpRequest trigger_sync()
{
    return make(HttpMethod::Post, "/sync/all");
}

HttpRequest organization_members(const std::string &org_id)
{
    return make(HttpMethod::Get, fmt::format("/organizations/{}/members", org_id));
}

HttpRequest add_organization_member(const std::string &org_id, const nlohmann::json &member)
{
    return make(HttpMethod::Post, fmt::format("/organizations/{}/members", org_id), member);
}

HttpRequest remove_organization_member(const std::string &org_id, const std::string &user_id)
{
    return make(HttpMethod::Delete, fmt::format("/organizations/{}/members/{}", org_id, user_id));
}

HttpRequest invite_to_organization(const std::string &org_id, const nlohmann::json &invitation)
{
    return make(HttpMethod::Post, fmt::format("/organizations/{}/invitations", org_id),
                invitation);
}

} // namespace endpoints

} // namespace syncdesk::sync
