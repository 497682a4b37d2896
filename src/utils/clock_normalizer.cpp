#include "utils/clock_normalizer.hpp"
#include "utils/logger.hpp"

#include <charconv>
#include <cmath>

namespace syncdesk::sync
{

using namespace std::chrono;

namespace
{

// Reads exactly `width` digits at `pos`.
bool read_fixed(std::string_view s, size_t &pos, size_t width, int &out) noexcept
{
    if (pos + width > s.size())
        return false;
    for (size_t i = pos; i < pos + width; ++i)
    {
        if (s[i] < '0' || s[i] > '9')
            return false;
    }
    const auto res = std::from_chars(s.data() + pos, s.data() + pos + width, out);
    if (res.ec != std::errc{})
        return false;
    pos += width;
    return true;
}

bool expect(std::string_view s, size_t &pos, char c) noexcept
{
    if (pos < s.size() && s[pos] == c)
    {
        ++pos;
        return true;
    }
    return false;
}

} // namespace

ClockNormalizer::ClockNormalizer(ClockConfig config, NowFn now)
    : m_config(config), m_now(std::move(now))
{
    if (!m_now)
    {
        m_now = [] { return system_clock::now(); };
    }
}

Instant ClockNormalizer::now() const
{
    return m_now();
}

std::optional<Instant> ClockNormalizer::parse_timestamp(std::string_view text) noexcept
{
    const std::string_view s = format_tools::trim_whitespace(text);
    size_t pos = 0;
    int y = 0, mo = 0, d = 0, h = 0, mi = 0, sec = 0;

    if (!read_fixed(s, pos, 4, y) || !expect(s, pos, '-') || !read_fixed(s, pos, 2, mo) ||
        !expect(s, pos, '-') || !read_fixed(s, pos, 2, d))
        return std::nullopt;
    if (!expect(s, pos, 'T') && !expect(s, pos, 't') && !expect(s, pos, ' '))
        return std::nullopt;
    if (!read_fixed(s, pos, 2, h) || !expect(s, pos, ':') || !read_fixed(s, pos, 2, mi))
        return std::nullopt;

    microseconds fraction{0};
    if (expect(s, pos, ':'))
    {
        if (!read_fixed(s, pos, 2, sec))
            return std::nullopt;
        if (expect(s, pos, '.') || expect(s, pos, ','))
        {
            int64_t us = 0;
            int digits = 0;
            while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9')
            {
                if (digits < 6)
                {
                    us = us * 10 + (s[pos] - '0');
                    ++digits;
                }
                ++pos;
            }
            if (digits == 0)
                return std::nullopt;
            for (; digits < 6; ++digits)
                us *= 10;
            fraction = microseconds(us);
        }
    }

    minutes offset{0};
    if (pos < s.size())
    {
        const char marker = s[pos];
        if (marker == 'Z' || marker == 'z')
        {
            ++pos;
        }
        else if (marker == '+' || marker == '-')
        {
            ++pos;
            int oh = 0, om = 0;
            if (!read_fixed(s, pos, 2, oh))
                return std::nullopt;
            expect(s, pos, ':');
            if (!read_fixed(s, pos, 2, om))
                return std::nullopt;
            if (oh > 23 || om > 59)
                return std::nullopt;
            offset = hours(oh) + minutes(om);
            if (marker == '-')
                offset = -offset;
        }
        else
        {
            return std::nullopt;
        }
    }
    if (pos != s.size())
        return std::nullopt;

    if (h > 23 || mi > 59 || sec > 60)
        return std::nullopt;
    const year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)},
                             day{static_cast<unsigned>(d)}};
    if (!ymd.ok())
        return std::nullopt;

    // A leap second (:60) folds into the next second.
    const auto local = sys_days{ymd} + hours(h) + minutes(mi) + seconds(sec) + fraction;
    return time_point_cast<system_clock::duration>(local - offset);
}

std::string ClockNormalizer::format_timestamp(Instant t)
{
    return format_tools::iso8601_utc(t);
}

Instant ClockNormalizer::adjust(Instant parsed) const
{
    const Instant current = now();
    const auto delta = parsed - current;
    const auto threshold = duration_cast<system_clock::duration>(m_config.skew_threshold);
    if (delta <= threshold && delta >= -threshold)
        return parsed;

    if (m_config.policy == SkewPolicy::ClampFutureToNow)
    {
        if (delta > system_clock::duration::zero())
        {
            LOGGER_DEBUG("ClockNormalizer: clamping timestamp {}s in the future to now",
                         duration_cast<seconds>(delta).count());
            return current;
        }
        return parsed;
    }

    const double delta_hours = duration<double, std::ratio<3600>>(delta).count();
    // Ties round toward +inf: -7.5h removes -7h.
    const auto offset_hours = static_cast<int64_t>(std::floor(delta_hours + 0.5));
    LOGGER_DEBUG("ClockNormalizer: timestamp off by {:.2f}h; removing {}h", delta_hours,
                 offset_hours);
    return parsed - hours(offset_hours);
}

std::optional<Instant> ClockNormalizer::adjust(std::string_view server_timestamp) const
{
    const auto parsed = parse_timestamp(server_timestamp);
    if (!parsed)
        return std::nullopt;
    return adjust(*parsed);
}

int64_t ClockNormalizer::elapsed_seconds(Instant start) const
{
    const auto elapsed = duration_cast<seconds>(now() - adjust(start)).count();
    return elapsed > 0 ? elapsed : 0;
}

int64_t ClockNormalizer::elapsed_seconds(std::string_view server_timestamp) const
{
    const auto parsed = parse_timestamp(server_timestamp);
    if (!parsed)
        return 0;
    return elapsed_seconds(*parsed);
}

} // namespace syncdesk::sync
