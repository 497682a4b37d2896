#include "utils/auth_session.hpp"
#include "utils/logger.hpp"
#include "utils/remote_endpoints.hpp"

namespace syncdesk::sync
{

const char *to_string(AuthSession::Decision d) noexcept
{
    switch (d)
    {
    case AuthSession::Decision::ReplayNow:
        return "ReplayNow";
    case AuthSession::Decision::WaitForRefresh:
        return "WaitForRefresh";
    case AuthSession::Decision::Expired:
        return "Expired";
    case AuthSession::Decision::StartRefresh:
        return "StartRefresh";
    }
    return "Unknown";
}

AuthSession::AuthSession(std::chrono::milliseconds refresh_cooldown)
    : m_cooldown(refresh_cooldown)
{
}

void AuthSession::set_token(std::string token)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_token = std::move(token);
    ++m_generation;
}

void AuthSession::clear_token()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_token.empty())
    {
        m_token.clear();
        ++m_generation;
    }
}

std::string AuthSession::token() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_token;
}

bool AuthSession::has_token() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return !m_token.empty();
}

uint64_t AuthSession::generation() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_generation;
}

AuthSession::Decision AuthSession::on_unauthorized(uint64_t sent_generation, bool already_replayed)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (already_replayed)
        return Decision::Expired;
    if (sent_generation < m_generation && !m_token.empty())
        return Decision::ReplayNow;
    if (m_refreshing)
        return Decision::WaitForRefresh;
    if (m_token.empty())
        return Decision::Expired;

    const auto now = std::chrono::steady_clock::now();
    if (m_last_refresh && now - *m_last_refresh < m_cooldown)
    {
        LOGGER_DEBUG("AuthSession: 401 inside the refresh cooldown; not refreshing again");
        return Decision::Expired;
    }
    m_refreshing = true;
    m_last_refresh = now;
    return Decision::StartRefresh;
}

bool AuthSession::complete_refresh(std::optional<std::string> new_token)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_refreshing = false;
    if (new_token && !new_token->empty())
    {
        m_token = std::move(*new_token);
        ++m_generation;
        LOGGER_INFO("AuthSession: token refreshed");
        return true;
    }
    m_token.clear();
    ++m_generation;
    LOGGER_WARN("AuthSession: token refresh failed; session expired");
    return false;
}

bool AuthSession::refresh_in_progress() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_refreshing;
}

void AuthSession::set_on_expired(ExpiredCallback cb)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_on_expired = std::move(cb);
}

void AuthSession::notify_expired() const
{
    ExpiredCallback cb;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        cb = m_on_expired;
    }
    if (!cb)
        return;
    try
    {
        cb();
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("AuthSession: expiry callback threw: {}", e.what());
    }
}

HttpRequest AuthSession::make_refresh_request(const std::string &token)
{
    HttpRequest req = endpoints::refresh();
    req.bearer_token = token;
    return req;
}

std::optional<std::string> AuthSession::parse_refresh_response(const HttpResponse &response)
{
    if (!response.ok() || !response.body.is_object())
        return std::nullopt;

    const auto &body = response.body;
    for (const auto *ptr : {"/data/session/access_token", "/session/access_token", "/access_token"})
    {
        const nlohmann::json::json_pointer p(ptr);
        if (body.contains(p) && body.at(p).is_string())
        {
            auto token = body.at(p).get<std::string>();
            if (!token.empty())
                return token;
        }
    }
    return std::nullopt;
}

} // namespace syncdesk::sync
