#pragma once
/**
 * @file remote_endpoints.hpp
 * @brief Where each entity type and each named operation lives on the remote service.
 *
 * CRUD entity types map to a collection path:
 *
 *     Fetch  -> GET    /collection
 *     Create -> POST   /collection
 *     Update -> PUT    /collection/{id}
 *     Delete -> DELETE /collection/{id}
 *
 * A singleton resource (`settings`) has no id: Fetch is GET and Update is PUT on the path
 * itself, and Create/Delete do not exist. Everything else (auth, timers, screenshots, sync,
 * membership) is a named request in `endpoints::`.
 */
#include "utils/remote_transport.hpp"
#include "utils/sync_task.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace syncdesk::sync
{

class SYNCDESK_UTILS_EXPORT EndpointCatalog
{
  public:
    struct Route
    {
        std::string path;
        bool singleton{false};
        /// Member wrapping a single entity in Create/Update responses (`{"project": {...}}`).
        std::string entity_key;
    };

    /// Registers the default routes (projects, clients, time_entries, screenshots,
    /// organizations, settings, tasks).
    EndpointCatalog();

    /// Adds or replaces the route of `entity_type`.
    void set_route(const std::string &entity_type, std::string path, bool singleton = false,
                   std::string entity_key = {});
    [[nodiscard]] std::optional<Route> route(const std::string &entity_type) const;

    /**
     * @brief The request for `kind` on `entity_type`.
     *
     * Returns nullopt for an unknown type, for Update/Delete without an id on a collection,
     * and for Create/Delete on a singleton. Create and Update carry `payload` as the body.
     */
    [[nodiscard]] std::optional<HttpRequest> request_for(TaskKind kind,
                                                         const std::string &entity_type,
                                                         const std::string &entity_id = {},
                                                         const nlohmann::json &payload = {}) const;

  private:
    std::map<std::string, Route> m_routes;
};

/// Named requests for the non-CRUD endpoint families.
namespace endpoints
{

SYNCDESK_UTILS_EXPORT HttpRequest login(const std::string &email, const std::string &password);
SYNCDESK_UTILS_EXPORT HttpRequest refresh();
SYNCDESK_UTILS_EXPORT HttpRequest logout();
SYNCDESK_UTILS_EXPORT HttpRequest current_user();

SYNCDESK_UTILS_EXPORT HttpRequest start_time_entry(const std::string &project_id,
                                                   const std::string &task_id = {},
                                                   const std::string &description = {});
SYNCDESK_UTILS_EXPORT HttpRequest stop_time_entry(const std::string &description = {});
SYNCDESK_UTILS_EXPORT HttpRequest current_time_entry();
SYNCDESK_UTILS_EXPORT HttpRequest list_time_entries(int limit = 100, int offset = 0);

SYNCDESK_UTILS_EXPORT HttpRequest capture_screenshot(const std::string &time_entry_id = {});
SYNCDESK_UTILS_EXPORT HttpRequest list_screenshots(int limit = 100, int offset = 0,
                                                   const std::string &time_entry_id = {});
SYNCDESK_UTILS_EXPORT HttpRequest screenshot_image(const std::string &screenshot_id);
SYNCDESK_UTILS_EXPORT HttpRequest screenshot_thumbnail(const std::string &screenshot_id);

SYNCDESK_UTILS_EXPORT HttpRequest get_settings();
SYNCDESK_UTILS_EXPORT HttpRequest put_settings(const nlohmann::json &settings);
SYNCDESK_UTILS_EXPORT HttpRequest get_profile();
SYNCDESK_UTILS_EXPORT HttpRequest put_profile(const nlohmann::json &profile);

SYNCDESK_UTILS_EXPORT HttpRequest sync_status();
SYNCDESK_UTILS_EXPORT HttpRequest trigger_sync();

SYNCDESK_UTILS_EXPORT HttpRequest organization_members(const std::string &org_id);
SYNCDESK_UTILS_EXPORT HttpRequest add_organization_member(const std::string &org_id,
                                                          const nlohmann::json &member);
SYNCDESK_UTILS_EXPORT HttpRequest remove_organization_member(const std::string &org_id,
                                                             const std::string &user_id);
SYNCDESK_UTILS_EXPORT HttpRequest invite_to_organization(const std::string &org_id,
                                                         const nlohmann::json &invitation);

} // namespace endpoints

} // namespace syncdesk::sync

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
