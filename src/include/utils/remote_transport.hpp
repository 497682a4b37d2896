#pragma once
/**
 * @file remote_transport.hpp
 * @brief Blocking HTTP+JSON exchange with the remote service.
 *
 * `send()` runs on scheduler worker threads, never on an event loop. A transport never throws
 * for network trouble: failures come back as `status == 0` with `error` set.
 */
#include "sd_base.hpp"

#include <map>
#include <string>

#include <nlohmann/json.hpp>

namespace syncdesk::sync
{

enum class HttpMethod
{
    Get,
    Post,
    Put,
    Delete
};

SYNCDESK_UTILS_EXPORT const char *to_string(HttpMethod m) noexcept;

struct HttpRequest
{
    HttpMethod method{HttpMethod::Get};
    /// Relative to the transport's base URL, starting with '/'.
    std::string path;
    std::map<std::string, std::string> query;
    /// Null: no body.
    nlohmann::json body;
    /// Filled in by the scheduler from the AuthSession; empty sends no Authorization header.
    std::string bearer_token;

    /// "GET /projects?limit=10": the identity used to deduplicate fetches.
    [[nodiscard]] std::string route_key() const;
};

struct HttpResponse
{
    /// 0 when no HTTP response was received.
    int status{0};
    nlohmann::json body;
    /// Transport error text when `status == 0`; otherwise empty.
    std::string error;

    [[nodiscard]] bool transport_failed() const noexcept { return status == 0; }
    [[nodiscard]] bool ok() const noexcept { return status >= 200 && status < 300; }
};

class SYNCDESK_UTILS_EXPORT RemoteTransport
{
  public:
    virtual ~RemoteTransport() = default;

    /// Must be safe to call from several threads at once.
    virtual HttpResponse send(const HttpRequest &request) = 0;
};

} // namespace syncdesk::sync
