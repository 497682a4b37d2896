#pragma once
/**
 * @file sync_task_scheduler.hpp
 * @brief Runs SyncTasks against the remote service with throttling, deduplication and retry.
 *
 * A pool of `max_concurrent` worker threads takes ready tasks in `next_attempt_at` order and
 * sends them through the RemoteTransport. Responses are classified:
 *
 * | response             | outcome                                                    |
 * |----------------------|------------------------------------------------------------|
 * | 2xx                  | success (mutations pass the stale-response guard first)    |
 * | no response (status 0)| `NetworkError`, retried                                   |
 * | 5xx                  | `ServerError`, retried                                     |
 * | 401                  | handed to the AuthSession (refresh, wait, replay, expire)  |
 * | other 4xx and 1xx/3xx| `ValidationError`, terminal                                |
 *
 * Retries follow `delay = min(base * 2^retry_count, cap)` with separate policies for reads
 * (Fetch) and writes; a task out of budget fails with `RetriesExhausted` carrying the last
 * cause. A Fetch submitted while an identical one is queued or executing shares its result.
 *
 * Results come back through a `std::shared_future<TaskResult>` and, optionally, completion
 * callbacks run on the worker thread just before the future becomes ready.
 */
#include "sd_service.hpp"
#include "utils/auth_session.hpp"
#include "utils/remote_endpoints.hpp"
#include "utils/remote_transport.hpp"
#include "utils/sync_task.hpp"

#include <cstdint>
#include <functional>
#include <future>
#include <memory>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace syncdesk::sync
{

struct SYNCDESK_UTILS_EXPORT SchedulerConfig
{
    int max_concurrent{4};
    utils::RetryPolicy read_policy{{std::chrono::milliseconds(1000), std::chrono::milliseconds(16000)},
                                   5};
    utils::RetryPolicy write_policy{{std::chrono::milliseconds(1000), std::chrono::milliseconds(4000)},
                                    3};

    static SchedulerConfig from_settings(const SyncSettings &settings);
};

struct SchedulerStats
{
    uint64_t submitted{0};
    uint64_t attempts{0};
    uint64_t retries{0};
    uint64_t refreshes{0};
    uint64_t dedup_hits{0};
    uint64_t stale_discards{0};
    uint64_t succeeded{0};
    uint64_t failed{0};
};

class SYNCDESK_UTILS_EXPORT SyncTaskScheduler
{
  public:
    using ResultFuture = std::shared_future<TaskResult>;
    using Completion = std::function<void(const TaskResult &)>;

    /// A null `auth` makes every 401 an immediate `AuthExpired`.
    SyncTaskScheduler(std::shared_ptr<RemoteTransport> transport,
                      std::shared_ptr<AuthSession> auth, EndpointCatalog catalog = {},
                      SchedulerConfig config = {});
    /// Calls shutdown().
    ~SyncTaskScheduler();

    SyncTaskScheduler(const SyncTaskScheduler &) = delete;
    SyncTaskScheduler &operator=(const SyncTaskScheduler &) = delete;

    /**
     * @brief Queues `task`; it becomes eligible at `task.next_attempt_at`.
     *
     * A task whose route cannot be resolved fails at once with `ValidationError`. After
     * shutdown() every submission fails with `NetworkError`.
     */
    ResultFuture submit(SyncTask task, Completion on_done = {});

    /// `submit()` of a Fetch of `entity_type` through the catalogue route.
    ResultFuture fetch(const std::string &entity_type, Completion on_done = {});

    /// `submit()` of an explicit request (named endpoints).
    ResultFuture send(HttpRequest request, TaskKind kind, std::string entity_type = {},
                      Completion on_done = {});

    /// Logical timestamp for a local mutation; strictly increasing.
    [[nodiscard]] uint64_t next_mutation_seq() noexcept;

    /// Stops the workers; tasks not completed fail with `NetworkError` ("scheduler stopped").
    void shutdown();

    [[nodiscard]] SchedulerStats stats() const;
    /// Tasks queued, executing or parked waiting for a token refresh.
    [[nodiscard]] size_t pending() const;
    [[nodiscard]] const EndpointCatalog &catalog() const noexcept;
    [[nodiscard]] const std::shared_ptr<AuthSession> &auth() const noexcept;

  private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace syncdesk::sync

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
