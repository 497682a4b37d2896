#include "utils/cache_registry.hpp"
#include "utils/logger.hpp"

#include <algorithm>
#include <map>
#include <mutex>
#include <stdexcept>

namespace syncdesk::sync
{

RegistryConfig RegistryConfig::from_settings(const CacheSettings &settings)
{
    RegistryConfig cfg;
    cfg.ttl = settings.ttl;
    cfg.inflight_stale = settings.inflight_stale;
    cfg.peer_wait = settings.peer_wait;
    return cfg;
}

namespace
{

constexpr std::string_view kKeyPrefix = "cache.";
constexpr std::string_view kDataSuffix = ".data";
constexpr std::string_view kInflightSuffix = ".fetch_in_progress";

int64_t to_ms(Instant t)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

Instant from_ms(int64_t ms)
{
    return Instant(std::chrono::duration_cast<Instant::duration>(std::chrono::milliseconds(ms)));
}

/// Ids compare as strings; numeric ids are rendered without quotes.
std::string id_of(const nlohmann::json &item, const std::string &id_field)
{
    if (!item.is_object())
        return {};
    auto it = item.find(id_field);
    if (it == item.end() || it->is_null())
        return {};
    return it->is_string() ? it->get<std::string>() : it->dump();
}

Items::iterator find_by_id(Items &items, const std::string &id, const std::string &id_field)
{
    return std::find_if(items.begin(), items.end(),
                        [&](const nlohmann::json &i) { return id_of(i, id_field) == id; });
}

FetchFuture ready_fetch(FetchResult result)
{
    std::promise<FetchResult> p;
    auto f = p.get_future().share();
    p.set_value(std::move(result));
    return f;
}

SyncError closed_error(const std::string &type, TaskKind kind)
{
    SyncError err;
    err.kind = SyncErrorKind::NetworkError;
    err.cause = SyncErrorKind::NetworkError;
    err.entity_type = type;
    err.operation = kind;
    err.message = "cache registry closed";
    return err;
}

struct PendingMutation
{
    uint64_t seq{0};
    TaskKind kind{TaskKind::Create};
    std::string id;
    nlohmann::json patch; // Create: the full entity; Update: the changed fields
};

struct Entry
{
    EntityOptions options;
    bool singleton{false};
    std::string route_entity_key;
    Items confirmed;
    Items view;
    std::optional<Instant> last_fetch_at;
    int64_t updated_at_ms{0};
    std::vector<PendingMutation> pending;
    // Highest mutation applied to `confirmed`, per id: older pending deltas are not shown.
    std::map<std::string, uint64_t> confirmed_seq;

    std::shared_ptr<std::promise<FetchResult>> fetch_promise;
    FetchFuture fetch_future;

    std::shared_ptr<std::promise<FetchResult>> peer_promise;
    FetchFuture peer_future;
    utils::EventLoop::TimerId peer_timer{0};
};

} // namespace

struct CacheRegistry::Impl
{
    std::shared_ptr<SyncTaskScheduler> scheduler;
    std::shared_ptr<CacheChannel> channel;
    RegistryConfig config;
    NowFn now;
    std::string origin;
    CacheChannel::SubscriptionId channel_sub{0};
    utils::EventLoop *timers{nullptr};

    mutable std::mutex mutex;
    mutable std::map<std::string, Entry> entries;
    std::map<ListenerId, std::pair<std::string, std::shared_ptr<Listener>>> listeners;
    ListenerId next_listener{1};
    uint64_t next_local_id{1};
    bool closed{false};

    Entry &entry_locked(const std::string &type) const;
    void init_entry(Entry &e, const std::string &type) const;
    void recompute(Entry &e) const;
    bool adopt_locked(Entry &e, const nlohmann::json &data) const;
    nlohmann::json data_doc(const Entry &e) const;
    std::optional<Items> extract_items(const nlohmann::json &body, const std::string &type,
                                       const Entry &e) const;
    const nlohmann::json &unwrap_entity(const nlohmann::json &body, const Entry &e) const;
    [[nodiscard]] std::chrono::milliseconds ttl_for(const Entry &e) const
    {
        return e.options.ttl.count() > 0 ? e.options.ttl : config.ttl;
    }

    void notify(const std::string &type, const Items &view);
    void on_fetch_done(const std::string &type, const TaskResult &result);
    void on_mutation_done(const std::string &type, uint64_t seq, const TaskResult &result,
                          std::promise<TaskResult> &promise);
    void on_channel(const std::string &key, const nlohmann::json &value);
    void end_peer_wait(const std::string &type, const char *why);
};

// ============================================================================
// Entry bookkeeping (caller holds mutex)
// ============================================================================

Entry &CacheRegistry::Impl::entry_locked(const std::string &type) const
{
    auto it = entries.find(type);
    if (it != entries.end())
        return it->second;

    Entry &e = entries[type];
    init_entry(e, type);
    return e;
}

void CacheRegistry::Impl::init_entry(Entry &e, const std::string &type) const
{
    if (auto route = scheduler->catalog().route(type))
    {
        e.singleton = route->singleton;
        e.route_entity_key = route->entity_key;
    }
    if (auto persisted = channel->get(cache_data_key(type)))
    {
        if (adopt_locked(e, *persisted))
            LOGGER_DEBUG("CacheRegistry: adopted {} persisted '{}' item(s)", e.view.size(), type);
    }
}

void CacheRegistry::Impl::recompute(Entry &e) const
{
    const auto &idf = e.options.id_field;
    Items view = e.confirmed;
    for (const auto &pm : e.pending)
    {
        auto applied = e.confirmed_seq.find(pm.id);
        if (applied != e.confirmed_seq.end() && pm.seq < applied->second)
            continue;

        if (e.singleton)
        {
            if (pm.kind == TaskKind::Update)
            {
                if (view.empty())
                    view.push_back(nlohmann::json::object());
                view.front().update(pm.patch);
            }
            continue;
        }

        auto it = find_by_id(view, pm.id, idf);
        switch (pm.kind)
        {
        case TaskKind::Create:
            if (it != view.end())
                *it = pm.patch;
            else
                view.push_back(pm.patch);
            break;
        case TaskKind::Update:
            if (it != view.end())
                it->update(pm.patch);
            break;
        case TaskKind::Delete:
            if (it != view.end())
                view.erase(it);
            break;
        case TaskKind::Fetch:
            break;
        }
    }
    e.view = std::move(view);
}

bool CacheRegistry::Impl::adopt_locked(Entry &e, const nlohmann::json &data) const
{
    if (!data.is_object())
        return false;
    auto items = data.find("items");
    if (items == data.end() || !items->is_array())
        return false;

    const int64_t fetched = data.value("fetched_at_ms", int64_t{0});
    const int64_t updated = data.value("updated_at_ms", fetched);
    if (!e.confirmed.empty() && updated <= e.updated_at_ms)
        return false;

    e.confirmed = items->get<Items>();
    e.updated_at_ms = updated;
    if (fetched > 0)
        e.last_fetch_at = from_ms(fetched);
    recompute(e);
    return true;
}

nlohmann::json CacheRegistry::Impl::data_doc(const Entry &e) const
{
    return {{"items", e.confirmed},
            {"fetched_at_ms", e.last_fetch_at ? to_ms(*e.last_fetch_at) : int64_t{0}},
            {"updated_at_ms", e.updated_at_ms},
            {"origin", origin}};
}

std::optional<Items> CacheRegistry::Impl::extract_items(const nlohmann::json &body,
                                                        const std::string &type,
                                                        const Entry &e) const
{
    if (e.singleton)
    {
        if (body.is_object())
        {
            auto data = body.find("data");
            if (data != body.end() && data->is_object())
                return Items{*data};
            return Items{body};
        }
        return std::nullopt;
    }
    if (body.is_array())
        return body.get<Items>();
    if (body.is_object())
    {
        const std::string &own =
            e.options.collection_key.empty() ? type : e.options.collection_key;
        for (const std::string &key :
             {own, std::string("items"), std::string("data"), std::string("results")})
        {
            if (key.empty())
                continue;
            auto it = body.find(key);
            if (it != body.end() && it->is_array())
                return it->get<Items>();
        }
    }
    return std::nullopt;
}

const nlohmann::json &CacheRegistry::Impl::unwrap_entity(const nlohmann::json &body,
                                                         const Entry &e) const
{
    if (!body.is_object())
        return body;
    const std::string &own =
        e.options.entity_key.empty() ? e.route_entity_key : e.options.entity_key;
    for (const std::string &key : {own, std::string("data")})
    {
        if (key.empty())
            continue;
        auto it = body.find(key);
        if (it != body.end() && it->is_object())
            return *it;
    }
    return body;
}

// ============================================================================
// Change propagation
// ============================================================================

void CacheRegistry::Impl::notify(const std::string &type, const Items &view)
{
    std::vector<std::shared_ptr<Listener>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto &[id, l] : listeners)
        {
            if (l.first == type)
                targets.push_back(l.second);
        }
    }
    for (const auto &l : targets)
    {
        try
        {
            (*l)(type, view);
        }
        catch (const std::exception &ex)
        {
            LOGGER_ERROR("CacheRegistry: listener for '{}' threw: {}", type, ex.what());
        }
    }
}

void CacheRegistry::Impl::on_fetch_done(const std::string &type, const TaskResult &result)
{
    std::shared_ptr<std::promise<FetchResult>> promise;
    std::shared_ptr<std::promise<FetchResult>> peer;
    utils::EventLoop::TimerId peer_timer = 0;
    std::optional<Items> items;
    Items view;
    nlohmann::json doc;
    {
        std::lock_guard<std::mutex> lock(mutex);
        Entry &e = entry_locked(type);
        promise = std::move(e.fetch_promise);
        e.fetch_promise.reset();
        if (result.is_ok())
        {
            items = extract_items(result.content(), type, e);
            if (!items)
            {
                LOGGER_WARN("CacheRegistry: unexpected response shape for '{}'; keeping the "
                            "current snapshot",
                            type);
            }
            else
            {
                e.confirmed = std::move(*items);
                e.last_fetch_at = now();
                e.updated_at_ms = to_ms(*e.last_fetch_at);
                recompute(e);
                view = e.view;
                doc = data_doc(e);
                peer = std::move(e.peer_promise);
                e.peer_promise.reset();
                peer_timer = std::exchange(e.peer_timer, 0);
            }
        }
    }

    // Data before the flag: a waiting peer ends its wait with the new snapshot.
    const bool fetched = result.is_ok() && items.has_value();
    if (fetched)
        channel->put(cache_data_key(type), doc, origin);
    channel->erase(cache_inflight_key(type), origin);

    if (fetched)
    {
        LOGGER_DEBUG("CacheRegistry: fetched {} '{}' item(s)", view.size(), type);
        notify(type, view);
        if (peer)
        {
            if (peer_timer != 0)
                timers->cancel(peer_timer);
            peer->set_value(FetchResult::ok(view));
        }
        if (promise)
            promise->set_value(FetchResult::ok(std::move(view)));
        return;
    }

    if (!promise)
        return;
    if (result.is_ok())
    {
        SyncError err;
        err.kind = err.cause = SyncErrorKind::ValidationError;
        err.entity_type = type;
        err.operation = TaskKind::Fetch;
        err.message = "unexpected response shape";
        promise->set_value(FetchResult::error(std::move(err)));
        return;
    }
    LOGGER_WARN("CacheRegistry: fetch of '{}' failed, keeping the stale snapshot: {}", type,
                result.error().describe());
    promise->set_value(FetchResult::error(result.error(), result.error_code()));
}

void CacheRegistry::Impl::on_mutation_done(const std::string &type, uint64_t seq,
                                           const TaskResult &result,
                                           std::promise<TaskResult> &promise)
{
    Items view;
    nlohmann::json doc;
    nlohmann::json entity;
    bool publish = false;
    bool rolled_back = false;
    {
        std::lock_guard<std::mutex> lock(mutex);
        Entry &e = entry_locked(type);
        const auto &idf = e.options.id_field;
        auto pit = std::find_if(e.pending.begin(), e.pending.end(),
                                [seq](const PendingMutation &p) { return p.seq == seq; });
        if (pit == e.pending.end())
        {
            LOGGER_WARN("CacheRegistry: no pending mutation {} for '{}'", seq, type);
            promise.set_value(result.clone());
            return;
        }
        const PendingMutation pm = *pit;
        e.pending.erase(pit);

        if (result.is_ok())
        {
            const nlohmann::json &server = unwrap_entity(result.content(), e);
            if (e.singleton)
            {
                if (e.confirmed.empty())
                    e.confirmed.push_back(nlohmann::json::object());
                if (server.is_object())
                    e.confirmed.front() = server;
                else
                    e.confirmed.front().update(pm.patch);
                entity = e.confirmed.front();
            }
            else if (pm.kind == TaskKind::Delete)
            {
                auto it = find_by_id(e.confirmed, pm.id, idf);
                if (it != e.confirmed.end())
                {
                    entity = *it;
                    e.confirmed.erase(it);
                }
            }
            else
            {
                auto it = find_by_id(e.confirmed, pm.id, idf);
                if (pm.kind == TaskKind::Create)
                {
                    entity = pm.patch;
                    if (server.is_object())
                        entity.update(server);
                }
                else
                {
                    entity = it != e.confirmed.end() ? *it : nlohmann::json::object();
                    entity.update(pm.patch);
                    if (server.is_object())
                        entity.update(server);
                }
                // A Create's client-side id is replaced by the server's.
                const std::string final_id = id_of(entity, idf);
                if (it != e.confirmed.end())
                    *it = entity;
                else if (auto dup = find_by_id(e.confirmed, final_id, idf);
                         !final_id.empty() && dup != e.confirmed.end())
                    *dup = entity;
                else
                    e.confirmed.push_back(entity);
                if (final_id != pm.id)
                {
                    e.confirmed_seq[final_id] = std::max(e.confirmed_seq[final_id], seq);
                    LOGGER_DEBUG("CacheRegistry: '{}' {} reconciled as {}", type, pm.id,
                                 final_id);
                }
            }
            e.confirmed_seq[pm.id] = std::max(e.confirmed_seq[pm.id], seq);
            e.updated_at_ms = to_ms(now());
            publish = true;
            recompute(e);
            doc = data_doc(e);
        }
        else
        {
            recompute(e);
            if (result.error().kind == SyncErrorKind::SyncConflict)
            {
                auto it = find_by_id(e.view, pm.id, idf);
                entity = it != e.view.end() ? *it : nlohmann::json();
            }
            else
            {
                rolled_back = true;
            }
        }
        view = e.view;
    }

    if (publish)
        channel->put(cache_data_key(type), doc, origin);
    notify(type, view);

    if (result.is_ok() || result.error().kind == SyncErrorKind::SyncConflict)
    {
        promise.set_value(TaskResult::ok(std::move(entity)));
        return;
    }
    if (rolled_back)
        LOGGER_WARN("CacheRegistry: rolled back {} on '{}': {}", to_string(result.error().operation),
                    type, result.error().describe());
    promise.set_value(TaskResult::error(result.error(), result.error_code()));
}

void CacheRegistry::Impl::on_channel(const std::string &key, const nlohmann::json &value)
{
    if (key.size() <= kKeyPrefix.size() || key.compare(0, kKeyPrefix.size(), kKeyPrefix) != 0)
        return;

    auto ends_with = [&](std::string_view suffix)
    {
        return key.size() > kKeyPrefix.size() + suffix.size() &&
               key.compare(key.size() - suffix.size(), suffix.size(), suffix) == 0;
    };

    if (ends_with(kDataSuffix))
    {
        const std::string type =
            key.substr(kKeyPrefix.size(), key.size() - kKeyPrefix.size() - kDataSuffix.size());
        std::shared_ptr<std::promise<FetchResult>> peer;
        utils::EventLoop::TimerId peer_timer = 0;
        Items view;
        bool adopted = false;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (closed)
                return;
            Entry &e = entry_locked(type);
            adopted = adopt_locked(e, value);
            view = e.view;
            if (adopted)
            {
                peer = std::move(e.peer_promise);
                e.peer_promise.reset();
                peer_timer = std::exchange(e.peer_timer, 0);
            }
        }
        if (!adopted)
            return;
        LOGGER_DEBUG("CacheRegistry: adopted {} '{}' item(s) from a peer", view.size(), type);
        notify(type, view);
        if (peer)
        {
            if (peer_timer != 0)
                timers->cancel(peer_timer);
            peer->set_value(FetchResult::ok(std::move(view)));
        }
        return;
    }

    if (ends_with(kInflightSuffix) && value.is_null())
    {
        const std::string type = key.substr(kKeyPrefix.size(), key.size() - kKeyPrefix.size() -
                                                                   kInflightSuffix.size());
        end_peer_wait(type, "peer fetch ended");
    }
}

void CacheRegistry::Impl::end_peer_wait(const std::string &type, const char *why)
{
    std::shared_ptr<std::promise<FetchResult>> peer;
    utils::EventLoop::TimerId peer_timer = 0;
    Items view;
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = entries.find(type);
        if (it == entries.end() || !it->second.peer_promise)
            return;
        peer = std::move(it->second.peer_promise);
        it->second.peer_promise.reset();
        peer_timer = std::exchange(it->second.peer_timer, 0);
        view = it->second.view;
    }
    LOGGER_DEBUG("CacheRegistry: stopped waiting for a peer fetch of '{}' ({})", type, why);
    if (peer_timer != 0)
        timers->cancel(peer_timer);
    peer->set_value(FetchResult::ok(std::move(view)));
}

// ============================================================================
// Public interface
// ============================================================================

CacheRegistry::CacheRegistry(std::shared_ptr<SyncTaskScheduler> scheduler,
                             std::shared_ptr<CacheChannel> channel, RegistryConfig config,
                             NowFn now)
    : pImpl(std::make_shared<Impl>()), m_timers(std::make_unique<utils::EventLoop>("cache-registry"))
{
    if (!scheduler || !channel)
        throw std::invalid_argument("CacheRegistry: scheduler and channel are required");
    pImpl->scheduler = std::move(scheduler);
    pImpl->channel = std::move(channel);
    pImpl->config = config;
    pImpl->now = now ? std::move(now) : NowFn([] { return std::chrono::system_clock::now(); });
    pImpl->origin = pImpl->channel->new_origin();
    pImpl->timers = m_timers.get();

    std::weak_ptr<Impl> weak = pImpl;
    pImpl->channel_sub = pImpl->channel->subscribe(
        pImpl->origin,
        [weak](const std::string &key, const nlohmann::json &value, const std::string &)
        {
            if (auto self = weak.lock())
                self->on_channel(key, value);
        });
    LOGGER_DEBUG("CacheRegistry: created with origin {}", pImpl->origin);
}

CacheRegistry::~CacheRegistry()
{
    std::vector<std::pair<std::string, std::shared_ptr<std::promise<FetchResult>>>> outstanding;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        pImpl->closed = true;
        for (auto &[type, e] : pImpl->entries)
        {
            if (e.fetch_promise)
                outstanding.emplace_back(type, std::move(e.fetch_promise));
            if (e.peer_promise)
                outstanding.emplace_back(type, std::move(e.peer_promise));
            e.fetch_promise.reset();
            e.peer_promise.reset();
            // The timer loop goes away with us; late completions must not touch it.
            e.peer_timer = 0;
        }
    }
    pImpl->channel->unsubscribe(pImpl->channel_sub);
    m_timers->stop();
    for (auto &[type, p] : outstanding)
        p->set_value(FetchResult::error(closed_error(type, TaskKind::Fetch)));
}

void CacheRegistry::register_entity(const std::string &entity_type, EntityOptions options)
{
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto it = pImpl->entries.find(entity_type);
    if (it != pImpl->entries.end())
    {
        it->second.options = std::move(options);
        pImpl->recompute(it->second);
        return;
    }
    // Options first, so an adopted snapshot is keyed with the right id field.
    Entry &e = pImpl->entries[entity_type];
    e.options = std::move(options);
    pImpl->init_entry(e, entity_type);
}

std::vector<std::string> CacheRegistry::entity_types() const
{
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    std::vector<std::string> out;
    for (const auto &[type, e] : pImpl->entries)
        out.push_back(type);
    return out;
}

FetchFuture CacheRegistry::fetch(const std::string &entity_type, bool force)
{
    auto &impl = *pImpl;
    std::unique_lock<std::mutex> lock(impl.mutex);
    if (impl.closed)
        return ready_fetch(FetchResult::error(closed_error(entity_type, TaskKind::Fetch)));

    Entry &e = impl.entry_locked(entity_type);
    if (e.fetch_promise)
    {
        LOGGER_TRACE("CacheRegistry: joining the fetch of '{}' in flight", entity_type);
        return e.fetch_future;
    }

    const Instant now = impl.now();
    if (!force)
    {
        if (e.peer_promise)
            return e.peer_future;

        const auto flag = impl.channel->get(cache_inflight_key(entity_type));
        if (flag && flag->is_object() && flag->value("origin", std::string()) != impl.origin)
        {
            const int64_t since = flag->value("since_ms", int64_t{0});
            const int64_t age = to_ms(now) - since;
            if (age >= 0 && age < impl.config.inflight_stale.count())
            {
                e.peer_promise = std::make_shared<std::promise<FetchResult>>();
                e.peer_future = e.peer_promise->get_future().share();
                std::weak_ptr<Impl> weak = pImpl;
                e.peer_timer = impl.timers->schedule_after(
                    impl.config.peer_wait,
                    [weak, entity_type]
                    {
                        if (auto self = weak.lock())
                            self->end_peer_wait(entity_type, "timed out");
                    });
                LOGGER_DEBUG("CacheRegistry: '{}' is being fetched by {}; waiting for it",
                             entity_type, flag->value("origin", std::string()));
                return e.peer_future;
            }
        }

        if (!e.view.empty() && e.last_fetch_at && now - *e.last_fetch_at < impl.ttl_for(e))
            return ready_fetch(FetchResult::ok(e.view));
    }

    e.fetch_promise = std::make_shared<std::promise<FetchResult>>();
    e.fetch_future = e.fetch_promise->get_future().share();
    FetchFuture future = e.fetch_future;
    lock.unlock();

    impl.channel->put(cache_inflight_key(entity_type),
                      {{"origin", impl.origin}, {"since_ms", to_ms(now)}}, impl.origin);

    std::weak_ptr<Impl> weak = pImpl;
    impl.scheduler->fetch(entity_type,
                          [weak, entity_type](const TaskResult &r)
                          {
                              if (auto self = weak.lock())
                                  self->on_fetch_done(entity_type, r);
                          });
    return future;
}

MutationHandle CacheRegistry::mutate(const std::string &entity_type, TaskKind kind,
                                     nlohmann::json payload)
{
    if (kind == TaskKind::Fetch)
        throw std::invalid_argument("CacheRegistry::mutate: Fetch is not a mutation");

    auto &impl = *pImpl;
    auto promise = std::make_shared<std::promise<TaskResult>>();
    MutationHandle handle;
    handle.remote = promise->get_future().share();

    SyncTask task;
    task.kind = kind;
    task.entity_type = entity_type;
    Items view;
    {
        std::lock_guard<std::mutex> lock(impl.mutex);
        if (impl.closed)
        {
            promise->set_value(TaskResult::error(closed_error(entity_type, kind)));
            return handle;
        }
        Entry &e = impl.entry_locked(entity_type);
        const auto &idf = e.options.id_field;

        PendingMutation pm;
        pm.kind = kind;
        switch (kind)
        {
        case TaskKind::Create:
        {
            if (!payload.is_object())
                throw std::invalid_argument("CacheRegistry::mutate: Create needs an object");
            pm.id = id_of(payload, idf);
            task.payload = payload;
            if (pm.id.empty())
            {
                pm.id = fmt::format("local-{}-{}", impl.origin, impl.next_local_id++);
                payload[idf] = pm.id;
            }
            pm.patch = payload;
            handle.optimistic = payload;
            break;
        }
        case TaskKind::Update:
        {
            if (!payload.is_object())
                throw std::invalid_argument("CacheRegistry::mutate: Update needs an object");
            if (!e.singleton)
            {
                pm.id = id_of(payload, idf);
                if (pm.id.empty())
                    throw std::invalid_argument("CacheRegistry::mutate: Update needs an id");
            }
            pm.patch = payload;
            task.payload = payload;
            break;
        }
        case TaskKind::Delete:
        {
            if (e.singleton)
                throw std::invalid_argument("CacheRegistry::mutate: cannot delete a singleton");
            pm.id = payload.is_string() ? payload.get<std::string>() : id_of(payload, idf);
            if (pm.id.empty())
                throw std::invalid_argument("CacheRegistry::mutate: Delete needs an id");
            auto it = find_by_id(e.view, pm.id, idf);
            handle.optimistic = it != e.view.end() ? *it : payload;
            break;
        }
        case TaskKind::Fetch:
            break;
        }

        pm.seq = impl.scheduler->next_mutation_seq();
        task.entity_id = pm.id;
        task.mutation_seq = pm.seq;
        e.pending.push_back(pm);
        impl.recompute(e);
        if (kind == TaskKind::Update)
        {
            auto it = e.singleton ? e.view.begin() : find_by_id(e.view, pm.id, idf);
            handle.optimistic = it != e.view.end() ? *it : payload;
        }
        view = e.view;
    }

    impl.notify(entity_type, view);

    std::weak_ptr<Impl> weak = pImpl;
    const uint64_t seq = task.mutation_seq;
    impl.scheduler->submit(std::move(task),
                           [weak, entity_type, kind, seq, promise](const TaskResult &r)
                           {
                               if (auto self = weak.lock())
                                   self->on_mutation_done(entity_type, seq, r, *promise);
                               else
                                   promise->set_value(
                                       TaskResult::error(closed_error(entity_type, kind)));
                           });
    return handle;
}

Items CacheRegistry::snapshot(const std::string &entity_type) const
{
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->entry_locked(entity_type).view;
}

CacheEntryState CacheRegistry::state(const std::string &entity_type) const
{
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    const Entry &e = pImpl->entry_locked(entity_type);
    CacheEntryState s;
    s.item_count = e.view.size();
    s.last_fetch_at = e.last_fetch_at;
    s.fetch_in_flight = static_cast<bool>(e.fetch_promise);
    s.waiting_for_peer = static_cast<bool>(e.peer_promise);
    s.pending_mutations = e.pending.size();
    return s;
}

void CacheRegistry::invalidate(const std::string &entity_type)
{
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->entry_locked(entity_type).last_fetch_at.reset();
}

CacheRegistry::ListenerId CacheRegistry::subscribe(const std::string &entity_type,
                                                   Listener listener)
{
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    const auto id = pImpl->next_listener++;
    pImpl->listeners.emplace(
        id, std::make_pair(entity_type, std::make_shared<Listener>(std::move(listener))));
    return id;
}

void CacheRegistry::unsubscribe(ListenerId id)
{
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->listeners.erase(id);
}

const std::string &CacheRegistry::origin() const noexcept
{
    return pImpl->origin;
}

SyncTaskScheduler &CacheRegistry::scheduler() noexcept
{
    return *pImpl->scheduler;
}

} // namespace syncdesk::sync
