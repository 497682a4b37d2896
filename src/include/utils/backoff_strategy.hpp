#pragma once
/**
 * @file backoff_strategy.hpp
 * @brief Backoff functors for polling loops and retry schedules.
 *
 * Two flavours, both callable with an attempt counter:
 * - sleeping strategies (`ConstantBackoff`) wait in place and are used by polling loops such
 *   as timed lock acquisition;
 * - delay strategies (`CappedExponentialBackoff`) return how long to wait and leave the
 *   waiting to a scheduler, which keeps the retry state inspectable.
 */
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <thread>

namespace syncdesk::utils
{

// ============================================================================
// Sleeping strategies
// ============================================================================

struct ConstantBackoff
{
    std::chrono::microseconds delay;

    explicit ConstantBackoff(std::chrono::microseconds d = std::chrono::microseconds(100))
        : delay(d)
    {
    }

    void operator()(int iteration) const noexcept
    {
        (void)iteration;
        std::this_thread::sleep_for(delay);
    }
};

// ============================================================================
// Delay strategies
// ============================================================================

/**
 * @brief `delay(n) = min(base * 2^n, cap)` for the n-th retry (n starts at 0).
 *
 * The shift saturates, so large n simply yields `cap`.
 */
struct CappedExponentialBackoff
{
    std::chrono::milliseconds base{1000};
    std::chrono::milliseconds cap{16000};

    [[nodiscard]] std::chrono::milliseconds operator()(int retry_count) const noexcept
    {
        if (retry_count < 0)
        {
            retry_count = 0;
        }
        if (base.count() <= 0)
        {
            return std::chrono::milliseconds(0);
        }
        if (retry_count >= 30 || base.count() > (cap.count() >> retry_count))
        {
            return cap;
        }
        return std::min(std::chrono::milliseconds(base.count() << retry_count), cap);
    }
};

/**
 * @brief A retry budget: at most `max_retries` re-attempts after the first try, spaced by
 *        `backoff`.
 */
struct RetryPolicy
{
    CappedExponentialBackoff backoff{};
    int max_retries{3};

    [[nodiscard]] bool can_retry(int retry_count) const noexcept
    {
        return retry_count < max_retries;
    }

    [[nodiscard]] std::chrono::milliseconds delay_for(int retry_count) const noexcept
    {
        return backoff(retry_count);
    }
};

} // namespace syncdesk::utils
