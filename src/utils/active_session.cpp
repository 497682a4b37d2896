#include "utils/active_session.hpp"
#include "utils/logger.hpp"

namespace syncdesk::sync
{

ActiveSessionTracker::ActiveSessionTracker(const ClockNormalizer &clock,
                                           std::chrono::seconds tolerance)
    : m_clock(clock), m_tolerance(tolerance)
{
}

Instant ActiveSessionTracker::begin_start_request()
{
    const Instant local = m_clock.now();
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto last = m_state.last_duration_s;
    m_state = ActiveSessionSnapshot{};
    m_state.last_duration_s = last;
    m_state.local_start_time = local;
    m_state.is_active = true;
    m_state.awaiting_confirmation = true;
    m_state.basis = DisplayBasis::Local;
    return local;
}

// Caller holds m_mutex.
void ActiveSessionTracker::apply_server_start(std::string id, Instant server_start)
{
    const Instant adjusted = m_clock.adjust(server_start);
    m_state.id = std::move(id);
    m_state.server_start_time = adjusted;
    m_state.is_active = true;

    if (m_state.awaiting_confirmation && m_state.local_start_time)
    {
        m_state.awaiting_confirmation = false;
        const auto diff = adjusted - *m_state.local_start_time;
        const auto tol = std::chrono::duration_cast<Instant::duration>(m_tolerance);
        if (diff <= tol && diff >= -tol)
        {
            m_state.basis = DisplayBasis::Server;
        }
        else
        {
            LOGGER_INFO("ActiveSession: server start differs from local start by {}s; keeping "
                        "the local basis for session '{}'",
                        std::chrono::duration_cast<std::chrono::seconds>(diff).count(),
                        m_state.id);
            m_state.basis = DisplayBasis::Local;
        }
        return;
    }
    m_state.local_start_time.reset();
    m_state.awaiting_confirmation = false;
    m_state.basis = DisplayBasis::Server;
}

void ActiveSessionTracker::confirm_start(std::string id, Instant server_start)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    apply_server_start(std::move(id), server_start);
}

bool ActiveSessionTracker::confirm_start(std::string id, std::string_view server_start)
{
    const auto parsed = ClockNormalizer::parse_timestamp(server_start);
    if (!parsed)
    {
        LOGGER_WARN("ActiveSession: unparsable server start time '{}'", server_start);
        return false;
    }
    confirm_start(std::move(id), *parsed);
    return true;
}

void ActiveSessionTracker::fail_start()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto last = m_state.last_duration_s;
    m_state = ActiveSessionSnapshot{};
    m_state.last_duration_s = last;
}

void ActiveSessionTracker::adopt_server_session(std::string id, Instant server_start)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state.is_active && !m_state.awaiting_confirmation && m_state.id == id)
        return;
    if (!m_state.awaiting_confirmation)
    {
        const auto last = m_state.last_duration_s;
        m_state = ActiveSessionSnapshot{};
        m_state.last_duration_s = last;
    }
    apply_server_start(std::move(id), server_start);
}

int64_t ActiveSessionTracker::confirm_stop(std::optional<int64_t> server_duration_s)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const int64_t duration =
        server_duration_s && *server_duration_s >= 0 ? *server_duration_s : elapsed_locked();
    m_state = ActiveSessionSnapshot{};
    m_state.last_duration_s = duration;
    return duration;
}

void ActiveSessionTracker::clear()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_state = ActiveSessionSnapshot{};
}

int64_t ActiveSessionTracker::elapsed_locked() const
{
    if (!m_state.is_active)
        return 0;
    switch (m_state.basis)
    {
    case DisplayBasis::Local:
    {
        const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
                                 m_clock.now() - *m_state.local_start_time)
                                 .count();
        return elapsed > 0 ? elapsed : 0;
    }
    case DisplayBasis::Server:
    {
        // Normalized when stored.
        const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
                                 m_clock.now() - *m_state.server_start_time)
                                 .count();
        return elapsed > 0 ? elapsed : 0;
    }
    case DisplayBasis::None:
        break;
    }
    return 0;
}

int64_t ActiveSessionTracker::elapsed_seconds() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return elapsed_locked();
}

std::optional<Instant> ActiveSessionTracker::display_start() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state.basis == DisplayBasis::Local)
        return m_state.local_start_time;
    if (m_state.basis == DisplayBasis::Server)
        return m_state.server_start_time;
    return std::nullopt;
}

ActiveSessionSnapshot ActiveSessionTracker::snapshot() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

} // namespace syncdesk::sync
