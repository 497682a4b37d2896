// format_tools.cpp
#include "sd_base.hpp"

namespace syncdesk::format_tools
{

std::string formatted_time(std::chrono::system_clock::time_point timestamp)
{
    // Two-step: whole seconds through fmt/chrono, then the microsecond fraction by hand so the
    // output does not depend on the subsecond support of the installed fmt.
    auto tp_us = std::chrono::time_point_cast<std::chrono::microseconds>(timestamp);
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp_us);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp_us - secs).count();
    int fractional_us = static_cast<int>(us % 1000000);
    if (fractional_us < 0)
        fractional_us += 1000000;
    auto sec_part = fmt::format("{:%Y-%m-%d %H:%M:%S}", fmt::localtime(std::chrono::system_clock::to_time_t(secs)));
    return fmt::format("{}.{:06d}", sec_part, fractional_us);
}

std::string iso8601_utc(std::chrono::system_clock::time_point timestamp)
{
    auto tp_ms = std::chrono::floor<std::chrono::milliseconds>(timestamp);
    auto days = std::chrono::floor<std::chrono::days>(tp_ms);
    std::chrono::year_month_day ymd{days};
    std::chrono::hh_mm_ss<std::chrono::milliseconds> tod{tp_ms - days};
    return fmt::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:03d}Z",
                       static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
                       static_cast<unsigned>(ymd.day()), tod.hours().count(),
                       tod.minutes().count(), tod.seconds().count(), tod.subseconds().count());
}

std::string_view trim_whitespace(std::string_view str) noexcept
{
    constexpr std::string_view whitespace = " \t\n\r\f\v";

    auto first = str.find_first_not_of(whitespace);
    if (first == std::string_view::npos)
    {
        return str.substr(0, 0);
    }
    auto last = str.find_last_not_of(whitespace);
    return str.substr(first, last - first + 1);
}

#if defined(SYNCDESK_PLATFORM_WIN64)

std::wstring s2ws(const std::string &s)
{
    if (s.empty())
        return {};

    int required =
        MultiByteToWideChar(CP_UTF8, MB_ERR_INVALID_CHARS, s.data(), static_cast<int>(s.size()),
                            nullptr, 0);
    if (required <= 0)
        return {};

    std::wstring w(required, L'\0');
    if (MultiByteToWideChar(CP_UTF8, MB_ERR_INVALID_CHARS, s.data(), static_cast<int>(s.size()),
                            w.data(), required) == 0)
        return {};
    return w;
}

std::string ws2s(const std::wstring &w)
{
    if (w.empty())
        return {};

    int required = WideCharToMultiByte(CP_UTF8, WC_ERR_INVALID_CHARS, w.data(),
                                       static_cast<int>(w.size()), nullptr, 0, nullptr, nullptr);
    if (required <= 0)
        return {};

    std::string s(required, '\0');
    if (WideCharToMultiByte(CP_UTF8, WC_ERR_INVALID_CHARS, w.data(), static_cast<int>(w.size()),
                            s.data(), required, nullptr, nullptr) == 0)
        return {};
    return s;
}

#else

// POSIX stubs (not used on POSIX)
std::wstring s2ws([[maybe_unused]] const std::string &str)
{
    return {};
}

std::string ws2s([[maybe_unused]] const std::wstring &wstr)
{
    return {};
}

#endif

} // namespace syncdesk::format_tools
