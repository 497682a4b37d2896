#pragma once
/**
 * @file active_session.hpp
 * @brief Which start instant the running-timer display ticks from.
 *
 * When the user starts a timer, the local instant of the request is recorded and the display
 * ticks from it at once. When the server confirms, its start time replaces the local one only if
 * the two agree within a tolerance; otherwise the local instant stays the basis for the rest of
 * the session, so the display never jumps. A session learned from the server without a local
 * request (started in another window) ticks from the server time.
 *
 * Thread-safe.
 */
#include "utils/clock_normalizer.hpp"

#include <chrono>
#include <mutex>
#include <optional>
#include <string>

namespace syncdesk::sync
{

enum class DisplayBasis
{
    None,
    Local,
    Server
};

struct ActiveSessionSnapshot
{
    std::string id;
    std::optional<Instant> server_start_time;
    std::optional<Instant> local_start_time;
    bool is_active{false};
    bool awaiting_confirmation{false};
    DisplayBasis basis{DisplayBasis::None};
    /// Final duration of the last stopped session, in seconds.
    std::optional<int64_t> last_duration_s;
};

class SYNCDESK_UTILS_EXPORT ActiveSessionTracker
{
  public:
    explicit ActiveSessionTracker(const ClockNormalizer &clock,
                                  std::chrono::seconds tolerance = std::chrono::seconds(10));

    /// Records the optimistic local start and returns it.
    Instant begin_start_request();

    /**
     * @brief Applies the server's confirmation of the pending start request.
     *
     * `server_start` is passed through the clock normalizer before it is compared. Without a
     * pending request this behaves like adopt_server_session().
     */
    void confirm_start(std::string id, Instant server_start);
    /// Returns false (and changes nothing) if `server_start` does not parse.
    bool confirm_start(std::string id, std::string_view server_start);

    /// The start request failed: the session is cleared.
    void fail_start();

    /**
     * @brief Adopts a session reported by the server (polling, another window).
     *
     * A pending local request is confirmed by it; an active session with the same id is left
     * unchanged; anything else is replaced with a server-based session.
     */
    void adopt_server_session(std::string id, Instant server_start);

    /**
     * @brief Stop confirmed: records the final duration and clears the session.
     * @param server_duration_s Duration reported by the server; the displayed elapsed time is
     *        used when absent.
     * @return The recorded duration in seconds.
     */
    int64_t confirm_stop(std::optional<int64_t> server_duration_s = std::nullopt);

    void clear();

    /// Elapsed seconds of the active session on its display basis; 0 when idle.
    [[nodiscard]] int64_t elapsed_seconds() const;
    [[nodiscard]] std::optional<Instant> display_start() const;
    [[nodiscard]] ActiveSessionSnapshot snapshot() const;

  private:
    [[nodiscard]] int64_t elapsed_locked() const;
    void apply_server_start(std::string id, Instant server_start);

    const ClockNormalizer &m_clock;
    std::chrono::seconds m_tolerance;
    mutable std::mutex m_mutex;
    ActiveSessionSnapshot m_state;
};

} // namespace syncdesk::sync
