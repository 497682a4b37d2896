#pragma once
/**
 * @file auth_session.hpp
 * @brief Bearer token holder and the 401 refresh policy.
 *
 * Every token change bumps a generation counter; a request remembers the generation it was
 * sent with, which tells a stale 401 (a newer token already exists) from a real one.
 *
 * At most one refresh runs at a time and refresh attempts are rate-limited by a cooldown window
 * that is independent of task backoff:
 *
 * | situation when a 401 arrives                         | decision         |
 * |------------------------------------------------------|------------------|
 * | the request was already replayed once                | `Expired`        |
 * | a newer token exists than the one sent               | `ReplayNow`      |
 * | a refresh is running                                 | `WaitForRefresh` |
 * | no token, or the last refresh is inside the cooldown | `Expired`        |
 * | otherwise                                            | `StartRefresh`   |
 *
 * The caller that receives `StartRefresh` performs the refresh request and reports the outcome
 * through `complete_refresh()`. A failed refresh clears the token; `notify_expired()` then runs
 * the expiry callback so the host can ask the user to sign in again.
 */
#include "sd_base.hpp"
#include "utils/remote_transport.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace syncdesk::sync
{

class SYNCDESK_UTILS_EXPORT AuthSession
{
  public:
    enum class Decision
    {
        ReplayNow,
        WaitForRefresh,
        Expired,
        StartRefresh
    };

    using ExpiredCallback = std::function<void()>;

    explicit AuthSession(std::chrono::milliseconds refresh_cooldown = std::chrono::seconds(10));

    void set_token(std::string token);
    void clear_token();
    [[nodiscard]] std::string token() const;
    [[nodiscard]] bool has_token() const;
    [[nodiscard]] uint64_t generation() const;

    Decision on_unauthorized(uint64_t sent_generation, bool already_replayed);

    /**
     * @brief Ends the refresh started by a `StartRefresh` decision.
     * @param new_token The refreshed token, or nullopt if the refresh failed.
     * @return true if a new token was installed.
     */
    bool complete_refresh(std::optional<std::string> new_token);

    [[nodiscard]] bool refresh_in_progress() const;

    void set_on_expired(ExpiredCallback cb);
    /// Runs the expiry callback; exceptions are logged.
    void notify_expired() const;

    [[nodiscard]] static HttpRequest make_refresh_request(const std::string &token);
    /// `data.session.access_token`, `session.access_token` or top-level `access_token`.
    [[nodiscard]] static std::optional<std::string> parse_refresh_response(
        const HttpResponse &response);

  private:
    const std::chrono::milliseconds m_cooldown;
    mutable std::mutex m_mutex;
    std::string m_token;
    uint64_t m_generation{0};
    bool m_refreshing{false};
    std::optional<std::chrono::steady_clock::time_point> m_last_refresh;
    ExpiredCallback m_on_expired;
};

SYNCDESK_UTILS_EXPORT const char *to_string(AuthSession::Decision d) noexcept;

} // namespace syncdesk::sync

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
