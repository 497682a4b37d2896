/**
 * @file result.hpp
 * @brief Generic Result<T, E> for operations that can fail in expected ways.
 *
 * - Success (T) and expected failure (E) are distinct alternatives.
 * - No implicit conversion to bool; call sites test is_ok()/is_error().
 * - Move-only, so large payloads are never copied by accident.
 *
 * E is usually an enum class (ProcessError) but may be an aggregate carrying context
 * (SyncError). Operations without a value use `Result<std::monostate, E>`.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace syncdesk::utils
{

/**
 * @class Result
 *
 * @code
 * Result<int, ParseError> parse(std::string_view s);
 *
 * auto r = parse("42");
 * if (r.is_ok())
 *     use(r.content());
 * else
 *     report(r.error(), r.error_code());
 * @endcode
 *
 * Not thread-safe.
 */
template <typename T, typename E>
class Result
{
  public:
    using value_type = T;
    using error_type = E;

    [[nodiscard]] static Result ok(T value)
    {
        Result result;
        result.m_data = std::move(value);
        return result;
    }

    /**
     * @param code Optional detail (errno, HTTP status, ...); 0 when not set.
     */
    [[nodiscard]] static Result error(E err, int code = 0)
    {
        Result result;
        result.m_data = ErrorData{std::move(err), code};
        return result;
    }

    // Default constructed: error state with a value-initialized E.
    Result() : m_data(ErrorData{E{}, 0}) {}

    Result(Result &&) noexcept = default;
    Result &operator=(Result &&) noexcept = default;
    Result(const Result &) = delete;
    Result &operator=(const Result &) = delete;

    [[nodiscard]] bool is_ok() const noexcept { return std::holds_alternative<T>(m_data); }
    [[nodiscard]] bool is_error() const noexcept { return !is_ok(); }

    /**
     * @throws std::logic_error if the Result holds an error.
     */
    [[nodiscard]] T &content() &
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<T>(m_data);
    }

    [[nodiscard]] const T &content() const &
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<T>(m_data);
    }

    [[nodiscard]] T &&content() &&
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<T>(std::move(m_data));
    }

    [[nodiscard]] T value_or(T default_value) const &
    {
        return is_ok() ? std::get<T>(m_data) : std::move(default_value);
    }

    /**
     * @throws std::logic_error if the Result holds a value.
     */
    [[nodiscard]] const E &error() const
    {
        if (is_ok())
        {
            throw std::logic_error("Result::error() called on success state");
        }
        return std::get<ErrorData>(m_data).error_value;
    }

    [[nodiscard]] int error_code() const
    {
        if (is_ok())
        {
            throw std::logic_error("Result::error_code() called on success state");
        }
        return std::get<ErrorData>(m_data).error_code;
    }

    /// Explicit copy for callers that fan one outcome out to several consumers.
    [[nodiscard]] Result clone() const
    {
        Result copy;
        copy.m_data = m_data;
        return copy;
    }

  private:
    struct ErrorData
    {
        E error_value;
        int error_code;
    };

    std::variant<T, ErrorData> m_data;
};

/// Result of an operation that yields no value.
template <typename E> using Status = Result<std::monostate, E>;

} // namespace syncdesk::utils
