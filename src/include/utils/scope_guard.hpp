#pragma once

#include <concepts>
#include <cstdio>
#include <exception>
#include <functional>
#include <type_traits>
#include <utility>

namespace syncdesk::basics
{

/**
 * @class ScopeGuard
 * @brief RAII guard that executes a callable on scope exit (normal or by exception).
 *
 * Movable, not copyable. A moved-from or dismissed guard does nothing.
 *
 * @code
 *  int fd = ::open(path, O_RDONLY);
 *  auto close_fd = syncdesk::basics::make_scope_guard([&]() { ::close(fd); });
 *  read_all(fd);            // may throw; fd is closed regardless
 * @endcode
 *
 * The callable should not throw. An exception escaping it in the destructor or in invoke() is
 * reported on stderr and not propagated; use invoke_and_rethrow() when the caller must see it.
 * Not thread-safe.
 */
template <typename Callable>
requires std::invocable<Callable &>
class ScopeGuard
{
  public:
    static_assert(!std::is_reference_v<Callable>, "ScopeGuard cannot hold a reference to a callable.");

    [[nodiscard]] explicit operator bool() const noexcept { return m_active; }

    explicit ScopeGuard(Callable fn) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(fn))
    {
    }

    ScopeGuard(ScopeGuard &&other) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(other.m_func)), m_active(other.m_active)
    {
        other.dismiss();
    }

    ~ScopeGuard() noexcept { invoke(); }

    ScopeGuard(const ScopeGuard &) = delete;
    ScopeGuard &operator=(const ScopeGuard &) = delete;
    ScopeGuard &operator=(ScopeGuard &&) = delete;

    constexpr void dismiss() noexcept { m_active = false; }

    /**
     * @brief Executes the callable now if still active, then dismisses the guard.
     */
    void invoke() noexcept
    {
        if (m_active)
        {
            m_active = false; // dismiss first: no double execution
            try
            {
                std::invoke(m_func);
            }
            catch (const std::exception &e)
            {
                std::fprintf(stderr, "ScopeGuard: cleanup action threw: %s\n", e.what());
            }
        }
    }

    /**
     * @brief Like invoke(), but lets an exception from the callable propagate.
     */
    void invoke_and_rethrow()
    {
        if (m_active)
        {
            m_active = false;
            std::invoke(m_func);
        }
    }

  private:
    Callable m_func;
    bool m_active{true};
};

/**
 * @brief Creates a ScopeGuard; the callable is stored by value (decayed).
 */
template <typename F> auto make_scope_guard(F &&f) -> ScopeGuard<std::decay_t<F>>
{
    return ScopeGuard<std::decay_t<F>>(std::forward<F>(f));
}

} // namespace syncdesk::basics
