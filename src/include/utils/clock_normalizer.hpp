#pragma once
/**
 * @file clock_normalizer.hpp
 * @brief Turns server timestamps into trustworthy local instants.
 *
 * Server clocks and the timestamps they emit are not reliable: values arrive without a UTC
 * marker, or hours off because a local time was stored as UTC. The normalizer treats an
 * unmarked timestamp as UTC and, when the result is further from `now` than the skew threshold,
 * assumes a timezone defect instead of a genuine time:
 *
 * - `SkewPolicy::RebaseWholeHours` removes the whole-hour offset closest to the difference;
 * - `SkewPolicy::ClampFutureToNow` replaces a future value with `now` and trusts past values.
 *
 * Stateless apart from its configuration and clock; safe to share between threads.
 */
#include "sd_base.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace syncdesk::sync
{

using Instant = std::chrono::system_clock::time_point;
using NowFn = std::function<Instant()>;

enum class SkewPolicy
{
    RebaseWholeHours,
    ClampFutureToNow
};

struct ClockConfig
{
    std::chrono::seconds skew_threshold{7 * 3600};
    SkewPolicy policy{SkewPolicy::RebaseWholeHours};
};

class SYNCDESK_UTILS_EXPORT ClockNormalizer
{
  public:
    explicit ClockNormalizer(ClockConfig config = {}, NowFn now = {});

    /**
     * @brief Parses ISO-8601 `YYYY-MM-DD[T ]HH:MM[:SS[.fraction]][Z|±HH:MM|±HHMM]`.
     *
     * Without an offset marker the value is UTC. The fraction may have any number of digits;
     * digits past microseconds are truncated. Returns nullopt for anything else, including
     * out-of-range fields such as February 30.
     */
    [[nodiscard]] static std::optional<Instant> parse_timestamp(std::string_view text) noexcept;

    /// `YYYY-MM-DDTHH:MM:SS.mmmZ`.
    [[nodiscard]] static std::string format_timestamp(Instant t);

    [[nodiscard]] std::optional<Instant> adjust(std::string_view server_timestamp) const;
    [[nodiscard]] Instant adjust(Instant parsed) const;

    /// `max(0, floor((now - adjust(ts)) / 1s))`; 0 when `ts` does not parse.
    [[nodiscard]] int64_t elapsed_seconds(std::string_view server_timestamp) const;
    [[nodiscard]] int64_t elapsed_seconds(Instant start) const;

    [[nodiscard]] Instant now() const;
    [[nodiscard]] const ClockConfig &config() const noexcept { return m_config; }

  private:
    ClockConfig m_config;
    NowFn m_now;
};

} // namespace syncdesk::sync
