#pragma once
/**
 * @file cache_channel.hpp
 * @brief Publish/subscribe key-value store shared by cache registries.
 *
 * Every writer identifies itself with an origin obtained from `new_origin()`. A listener is
 * subscribed under an origin and is never told about that origin's own writes. Notifications
 * are delivered asynchronously on a thread owned by the channel, in write order.
 *
 * Keys used by CacheRegistry, per entity type:
 *
 *     cache.<type>.data               {items, fetched_at_ms, updated_at_ms, origin}
 *     cache.<type>.fetch_in_progress  {origin, since_ms}
 *
 * Two implementations:
 * - InProcessCacheChannel: an event bus for several registries inside one process.
 * - FileCacheChannel: one JSON document shared by processes. Writes are read-modify-write under
 *   the document's FileLock; a watcher polls the document and reports entries written by other
 *   processes since the last revision it saw.
 */
#include "sd_service.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>

#include <nlohmann/json.hpp>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace syncdesk::sync
{

[[nodiscard]] SYNCDESK_UTILS_EXPORT std::string cache_data_key(const std::string &entity_type);
[[nodiscard]] SYNCDESK_UTILS_EXPORT std::string cache_inflight_key(const std::string &entity_type);

class SYNCDESK_UTILS_EXPORT CacheChannel
{
  public:
    using SubscriptionId = uint64_t;
    /// `value` is null when the key was erased.
    using Listener = std::function<void(const std::string &key, const nlohmann::json &value,
                                        const std::string &origin)>;

    virtual ~CacheChannel() = default;

    [[nodiscard]] virtual std::optional<nlohmann::json> get(const std::string &key) const = 0;
    virtual void put(const std::string &key, const nlohmann::json &value,
                     const std::string &origin) = 0;
    virtual void erase(const std::string &key, const std::string &origin) = 0;

    virtual SubscriptionId subscribe(const std::string &origin, Listener listener) = 0;
    /// The listener may still be running on the delivery thread when this returns.
    virtual void unsubscribe(SubscriptionId id) = 0;

    /// An origin unique across processes: `<pid>-<n>`.
    [[nodiscard]] virtual std::string new_origin();

  private:
    std::atomic<uint64_t> m_origin_counter{0};
};

/// Subscriber table and ordered delivery on an EventLoop, shared by the implementations.
class SYNCDESK_UTILS_EXPORT LocalDispatch
{
  public:
    explicit LocalDispatch(std::string loop_name);
    ~LocalDispatch();

    CacheChannel::SubscriptionId add(const std::string &origin, CacheChannel::Listener listener);
    void remove(CacheChannel::SubscriptionId id);

    /// Queues delivery of one change to every subscriber whose origin differs from `origin`.
    void publish(const std::string &key, const nlohmann::json &value, const std::string &origin);

    [[nodiscard]] utils::EventLoop &loop() noexcept { return m_loop; }
    /// Stops delivery; pending notifications are dropped.
    void close();

  private:
    struct Subscriber
    {
        std::string origin;
        std::shared_ptr<CacheChannel::Listener> listener;
    };

    std::mutex m_mutex;
    std::map<CacheChannel::SubscriptionId, Subscriber> m_subscribers;
    CacheChannel::SubscriptionId m_next_id{1};
    utils::EventLoop m_loop;
};

class SYNCDESK_UTILS_EXPORT InProcessCacheChannel final : public CacheChannel
{
  public:
    InProcessCacheChannel();
    ~InProcessCacheChannel() override;

    [[nodiscard]] std::optional<nlohmann::json> get(const std::string &key) const override;
    void put(const std::string &key, const nlohmann::json &value,
             const std::string &origin) override;
    void erase(const std::string &key, const std::string &origin) override;
    SubscriptionId subscribe(const std::string &origin, Listener listener) override;
    void unsubscribe(SubscriptionId id) override;

  private:
    mutable std::mutex m_mutex;
    std::map<std::string, nlohmann::json> m_values;
    LocalDispatch m_dispatch;
};

class SYNCDESK_UTILS_EXPORT FileCacheChannel final : public CacheChannel
{
  public:
    /**
     * @param path          The shared document; created on first write.
     * @param poll_interval How often the watcher looks for writes of other processes.
     */
    explicit FileCacheChannel(std::filesystem::path path,
                              std::chrono::milliseconds poll_interval = std::chrono::milliseconds(250));
    ~FileCacheChannel() override;

    [[nodiscard]] std::optional<nlohmann::json> get(const std::string &key) const override;
    void put(const std::string &key, const nlohmann::json &value,
             const std::string &origin) override;
    void erase(const std::string &key, const std::string &origin) override;
    SubscriptionId subscribe(const std::string &origin, Listener listener) override;
    void unsubscribe(SubscriptionId id) override;
    [[nodiscard]] std::string new_origin() override;

    [[nodiscard]] const std::filesystem::path &path() const noexcept { return m_store.path(); }
    /// Revision of the document at the watcher's last poll.
    [[nodiscard]] uint64_t last_seen_revision() const;

  private:
    void write_entry(const std::string &key, const nlohmann::json &value,
                     const std::string &origin, bool deleted);
    void poll();

    utils::JsonStore m_store;
    mutable std::mutex m_mutex;
    uint64_t m_last_seen{0};
    std::set<std::string> m_local_origins;
    LocalDispatch m_dispatch;
    utils::EventLoop::TimerId m_watch_timer{0};
};

} // namespace syncdesk::sync

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
