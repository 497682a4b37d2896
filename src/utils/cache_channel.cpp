#include "utils/cache_channel.hpp"
#include "utils/logger.hpp"

#include <algorithm>
#include <vector>

namespace syncdesk::sync
{

std::string cache_data_key(const std::string &entity_type)
{
    return fmt::format("cache.{}.data", entity_type);
}

std::string cache_inflight_key(const std::string &entity_type)
{
    return fmt::format("cache.{}.fetch_in_progress", entity_type);
}

std::string CacheChannel::new_origin()
{
    return fmt::format("{}-{}", platform::get_pid(),
                       m_origin_counter.fetch_add(1, std::memory_order_relaxed) + 1);
}

// ============================================================================
// LocalDispatch
// ============================================================================

LocalDispatch::LocalDispatch(std::string loop_name) : m_loop(std::move(loop_name)) {}

LocalDispatch::~LocalDispatch()
{
    close();
}

CacheChannel::SubscriptionId LocalDispatch::add(const std::string &origin,
                                                CacheChannel::Listener listener)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto id = m_next_id++;
    m_subscribers.emplace(
        id, Subscriber{origin, std::make_shared<CacheChannel::Listener>(std::move(listener))});
    return id;
}

void LocalDispatch::remove(CacheChannel::SubscriptionId id)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_subscribers.erase(id);
}

void LocalDispatch::publish(const std::string &key, const nlohmann::json &value,
                            const std::string &origin)
{
    m_loop.post(
        [this, key, value, origin]
        {
            std::vector<std::shared_ptr<CacheChannel::Listener>> targets;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                for (const auto &[id, sub] : m_subscribers)
                {
                    if (sub.origin != origin)
                        targets.push_back(sub.listener);
                }
            }
            for (const auto &listener : targets)
            {
                try
                {
                    (*listener)(key, value, origin);
                }
                catch (const std::exception &e)
                {
                    LOGGER_ERROR("CacheChannel: listener for '{}' threw: {}", key, e.what());
                }
            }
        });
}

void LocalDispatch::close()
{
    m_loop.stop();
}

// ============================================================================
// InProcessCacheChannel
// ============================================================================

InProcessCacheChannel::InProcessCacheChannel() : m_dispatch("cache-channel") {}

InProcessCacheChannel::~InProcessCacheChannel()
{
    m_dispatch.close();
}

std::optional<nlohmann::json> InProcessCacheChannel::get(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_values.find(key);
    if (it == m_values.end())
        return std::nullopt;
    return it->second;
}

void InProcessCacheChannel::put(const std::string &key, const nlohmann::json &value,
                                const std::string &origin)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_values[key] = value;
    }
    m_dispatch.publish(key, value, origin);
}

void InProcessCacheChannel::erase(const std::string &key, const std::string &origin)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_values.erase(key) == 0)
            return;
    }
    m_dispatch.publish(key, nullptr, origin);
}

CacheChannel::SubscriptionId InProcessCacheChannel::subscribe(const std::string &origin,
                                                              Listener listener)
{
    return m_dispatch.add(origin, std::move(listener));
}

void InProcessCacheChannel::unsubscribe(SubscriptionId id)
{
    m_dispatch.remove(id);
}

// ============================================================================
// FileCacheChannel
// ============================================================================
//
// Document layout:
//   { "revision": N,
//     "entries": { "<key>": { "value": ..., "origin": "...", "revision": r, "deleted": bool } } }

namespace
{

uint64_t doc_revision(const nlohmann::json &doc)
{
    auto it = doc.find("revision");
    return (it != doc.end() && it->is_number_unsigned()) ? it->get<uint64_t>() : 0;
}

} // namespace

FileCacheChannel::FileCacheChannel(std::filesystem::path path,
                                   std::chrono::milliseconds poll_interval)
    : m_store(std::move(path)), m_dispatch("file-cache-channel")
{
    std::error_code ec;
    std::filesystem::create_directories(m_store.path().parent_path(), ec);

    nlohmann::json doc;
    if (m_store.read(doc, &ec))
        m_last_seen = doc_revision(doc);
    else
        LOGGER_WARN("FileCacheChannel: cannot read '{}': {}", m_store.path().string(),
                    ec.message());

    if (poll_interval < std::chrono::milliseconds(1))
        poll_interval = std::chrono::milliseconds(1);
    m_watch_timer = m_dispatch.loop().schedule_every(poll_interval, [this] { poll(); });
}

FileCacheChannel::~FileCacheChannel()
{
    m_dispatch.loop().cancel(m_watch_timer);
    m_dispatch.close();
}

std::string FileCacheChannel::new_origin()
{
    auto origin = CacheChannel::new_origin();
    std::lock_guard<std::mutex> lock(m_mutex);
    m_local_origins.insert(origin);
    return origin;
}

uint64_t FileCacheChannel::last_seen_revision() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_last_seen;
}

std::optional<nlohmann::json> FileCacheChannel::get(const std::string &key) const
{
    nlohmann::json doc;
    std::error_code ec;
    if (!m_store.read(doc, &ec))
    {
        LOGGER_WARN("FileCacheChannel: read of '{}' failed: {}", m_store.path().string(),
                    ec.message());
        return std::nullopt;
    }
    auto entries = doc.find("entries");
    if (entries == doc.end() || !entries->is_object())
        return std::nullopt;
    auto it = entries->find(key);
    if (it == entries->end() || !it->is_object())
        return std::nullopt;
    const auto &entry = *it;
    if (entry.value("deleted", false))
        return std::nullopt;
    return entry.value("value", nlohmann::json());
}

void FileCacheChannel::write_entry(const std::string &key, const nlohmann::json &value,
                                   const std::string &origin, bool deleted)
{
    std::error_code ec;
    const bool ok = m_store.update(
        [&](nlohmann::json &doc)
        {
            if (!doc.is_object())
                doc = nlohmann::json::object();
            const uint64_t rev = doc_revision(doc) + 1;
            doc["revision"] = rev;
            doc["entries"][key] = {
                {"value", value}, {"origin", origin}, {"revision", rev}, {"deleted", deleted}};
        },
        &ec);
    if (!ok)
    {
        LOGGER_ERROR("FileCacheChannel: write of '{}' to '{}' failed: {}", key,
                     m_store.path().string(), ec.message());
        return;
    }
    // Local subscribers hear about it now; the watcher skips local origins.
    m_dispatch.publish(key, deleted ? nlohmann::json() : value, origin);
}

void FileCacheChannel::put(const std::string &key, const nlohmann::json &value,
                           const std::string &origin)
{
    write_entry(key, value, origin, false);
}

void FileCacheChannel::erase(const std::string &key, const std::string &origin)
{
    write_entry(key, nullptr, origin, true);
}

CacheChannel::SubscriptionId FileCacheChannel::subscribe(const std::string &origin,
                                                         Listener listener)
{
    return m_dispatch.add(origin, std::move(listener));
}

void FileCacheChannel::unsubscribe(SubscriptionId id)
{
    m_dispatch.remove(id);
}

void FileCacheChannel::poll()
{
    nlohmann::json doc;
    std::error_code ec;
    if (!m_store.read(doc, &ec))
    {
        LOGGER_DEBUG("FileCacheChannel: poll of '{}' failed: {}", m_store.path().string(),
                     ec.message());
        return;
    }
    const uint64_t revision = doc_revision(doc);

    struct Change
    {
        uint64_t revision;
        std::string key;
        nlohmann::json value;
        std::string origin;
    };
    std::vector<Change> changes;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (revision < m_last_seen)
        {
            // The document was replaced or removed; start over from its revision.
            LOGGER_INFO("FileCacheChannel: '{}' revision went back from {} to {}",
                        m_store.path().string(), m_last_seen, revision);
            m_last_seen = revision;
            return;
        }
        if (revision == m_last_seen)
            return;

        auto entries = doc.find("entries");
        if (entries != doc.end() && entries->is_object())
        {
            for (const auto &[key, entry] : entries->items())
            {
                const uint64_t rev = entry.value("revision", uint64_t{0});
                const std::string origin = entry.value("origin", std::string());
                if (rev <= m_last_seen || m_local_origins.count(origin) != 0)
                    continue;
                changes.push_back({rev, key,
                                   entry.value("deleted", false)
                                       ? nlohmann::json()
                                       : entry.value("value", nlohmann::json()),
                                   origin});
            }
        }
        m_last_seen = revision;
    }

    std::sort(changes.begin(), changes.end(),
              [](const Change &a, const Change &b) { return a.revision < b.revision; });
    for (auto &c : changes)
        m_dispatch.publish(c.key, c.value, c.origin);
}

} // namespace syncdesk::sync
