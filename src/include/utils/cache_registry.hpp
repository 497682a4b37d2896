#pragma once
/**
 * @file cache_registry.hpp
 * @brief Per-entity-type snapshots shared by every UI instance.
 *
 * Each entity type ("projects", "time_entries", ...) has one entry holding:
 *
 * - the *confirmed* items: the last server truth, from a fetch, a reconciled mutation or a peer
 *   instance's notification;
 * - the *pending* optimistic mutations, in mutation order;
 * - the *view*: confirmed items with the pending mutations laid over them. This is what
 *   `snapshot()` returns and what listeners receive.
 *
 * Rolling back a failed mutation removes its delta and recomputes the view, so only that entity
 * returns to its pre-mutation state. A fetch that lands while mutations are pending replaces the
 * confirmed items and the pending deltas are laid over them again.
 *
 * Instances coordinate through a CacheChannel. A completed fetch or mutation publishes the
 * confirmed items; other instances adopt them when their own are older or empty, and start no
 * fetch of their own while a peer's fresh in-flight flag is present (unless forced).
 *
 * Thread-safe. Listeners run on the thread that produced the change: a scheduler worker, the
 * channel's delivery thread or the caller of mutate()/invalidate(). Hosts marshal to their UI
 * loop with EventLoop::post.
 */
#include "sd_service.hpp"
#include "utils/cache_channel.hpp"
#include "utils/clock_normalizer.hpp"
#include "utils/sync_task_scheduler.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace syncdesk::sync
{

using Items = std::vector<nlohmann::json>;
using FetchResult = utils::Result<Items, SyncError>;
using FetchFuture = std::shared_future<FetchResult>;

struct EntityOptions
{
    std::string id_field{"id"};
    /// 0: the registry default.
    std::chrono::milliseconds ttl{0};
    /// Member of an object response that holds the array. Empty: the entity type itself
    /// (`{"total": 2, "projects": [...]}`). Tried before "items", "data" and "results".
    std::string collection_key;
    /// Member wrapping the entity in a Create/Update response. Empty: the route's entity key.
    /// "data" is tried after it; a body with neither is the entity itself.
    std::string entity_key;
};

struct SYNCDESK_UTILS_EXPORT RegistryConfig
{
    std::chrono::milliseconds ttl{30000};
    /// A peer's in-flight flag older than this is ignored.
    std::chrono::milliseconds inflight_stale{60000};
    /// How long a fetch waits for a peer's in-flight fetch before returning the current snapshot.
    std::chrono::milliseconds peer_wait{15000};

    static RegistryConfig from_settings(const CacheSettings &settings);
};

struct CacheEntryState
{
    size_t item_count{0};
    std::optional<Instant> last_fetch_at;
    bool fetch_in_flight{false};
    bool waiting_for_peer{false};
    size_t pending_mutations{0};
};

/// Returned synchronously by mutate().
struct MutationHandle
{
    /// The entity as it now appears in the snapshot (for Delete: the removed entity).
    nlohmann::json optimistic;
    /// The reconciled entity on success; the error after rollback on failure.
    std::shared_future<TaskResult> remote;
};

class SYNCDESK_UTILS_EXPORT CacheRegistry
{
  public:
    using ListenerId = uint64_t;
    using Listener = std::function<void(const std::string &entity_type, const Items &snapshot)>;

    /// Subscribes to `channel` and adopts any snapshot already published there.
    CacheRegistry(std::shared_ptr<SyncTaskScheduler> scheduler,
                  std::shared_ptr<CacheChannel> channel, RegistryConfig config = {},
                  NowFn now = {});
    /// Outstanding fetch futures fail with `NetworkError` ("cache registry closed").
    ~CacheRegistry();

    CacheRegistry(const CacheRegistry &) = delete;
    CacheRegistry &operator=(const CacheRegistry &) = delete;

    /// Optional: types are registered with default options on first use.
    void register_entity(const std::string &entity_type, EntityOptions options = {});
    [[nodiscard]] std::vector<std::string> entity_types() const;

    /**
     * @brief Current snapshot, from cache when fresh, from the network otherwise.
     *
     * Order of checks: a fetch of this type already in flight here is joined; unless `force`,
     * a fresh in-flight flag of a peer is waited on (until its data arrives, its flag clears or
     * `peer_wait` passes); unless `force`, a non-empty snapshot younger than the TTL is
     * returned as is; otherwise a Fetch is scheduled. On failure the stale snapshot is kept.
     */
    FetchFuture fetch(const std::string &entity_type, bool force = false);

    /**
     * @brief Applies `payload` optimistically and schedules the matching remote operation.
     *
     * Create inserts (a missing id becomes a client-side id, replaced by the server id on
     * success); Update merges into the entity with the same id (singletons have no id);
     * Delete removes by id. `kind == Fetch` and an Update/Delete without an id are rejected
     * with `std::invalid_argument`.
     */
    MutationHandle mutate(const std::string &entity_type, TaskKind kind, nlohmann::json payload);

    [[nodiscard]] Items snapshot(const std::string &entity_type) const;
    [[nodiscard]] CacheEntryState state(const std::string &entity_type) const;
    /// Marks the snapshot stale so the next fetch goes to the network.
    void invalidate(const std::string &entity_type);

    ListenerId subscribe(const std::string &entity_type, Listener listener);
    void unsubscribe(ListenerId id);

    [[nodiscard]] const std::string &origin() const noexcept;
    [[nodiscard]] SyncTaskScheduler &scheduler() noexcept;

  private:
    struct Impl;
    std::shared_ptr<Impl> pImpl;
    std::unique_ptr<utils::EventLoop> m_timers;
};

} // namespace syncdesk::sync

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
