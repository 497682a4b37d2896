#pragma once
/**
 * @file typed_cache.hpp
 * @brief Typed facade over one entity type of a CacheRegistry.
 *
 * The registry stores JSON; TypedCache<T> converts with the model's `from_json`/`to_json`.
 * An item that does not convert is logged and left out of the typed snapshot; the JSON snapshot
 * keeps it.
 *
 * Futures returned here are deferred: the conversion runs in the thread that calls `get()`.
 *
 * @code
 * TypedCache<Project> projects(registry);
 * auto result = projects.fetch().get();
 * if (result.is_ok())
 *     show(result.content());
 * @endcode
 */
#include "utils/cache_registry.hpp"
#include "utils/entity_models.hpp"
#include "utils/logger.hpp"

#include <functional>
#include <future>
#include <string>
#include <utility>
#include <vector>

namespace syncdesk::sync
{

template <typename T> class TypedCache
{
  public:
    using Snapshot = std::vector<T>;
    using SnapshotResult = utils::Result<Snapshot, SyncError>;
    using EntityResult = utils::Result<T, SyncError>;

    struct Mutation
    {
        T optimistic;
        std::future<EntityResult> remote;
    };

    explicit TypedCache(CacheRegistry &registry, std::string entity_type = T::kEntityType)
        : m_registry(registry), m_type(std::move(entity_type))
    {
    }

    [[nodiscard]] const std::string &entity_type() const noexcept { return m_type; }

    std::future<SnapshotResult> fetch(bool force = false)
    {
        auto future = m_registry.fetch(m_type, force);
        return std::async(std::launch::deferred,
                          [future, type = m_type]() -> SnapshotResult
                          {
                              const auto &r = future.get();
                              if (!r.is_ok())
                                  return SnapshotResult::error(r.error(), r.error_code());
                              return SnapshotResult::ok(convert(type, r.content()));
                          });
    }

    [[nodiscard]] Snapshot snapshot() const { return convert(m_type, m_registry.snapshot(m_type)); }

    /// An empty id is replaced by a client-side one until the server assigns the real id.
    Mutation create(const T &value)
    {
        nlohmann::json payload = value;
        auto id = payload.find("id");
        if (id != payload.end() && id->is_null())
            payload.erase(id);
        return wrap(m_registry.mutate(m_type, TaskKind::Create, std::move(payload)));
    }

    Mutation update(const T &value)
    {
        return wrap(m_registry.mutate(m_type, TaskKind::Update, nlohmann::json(value)));
    }

    Mutation remove(const std::string &id)
    {
        return wrap(m_registry.mutate(m_type, TaskKind::Delete, nlohmann::json(id)));
    }

    CacheRegistry::ListenerId subscribe(std::function<void(const Snapshot &)> listener)
    {
        return m_registry.subscribe(
            m_type, [listener = std::move(listener)](const std::string &type, const Items &items)
            { listener(convert(type, items)); });
    }

    void unsubscribe(CacheRegistry::ListenerId id) { m_registry.unsubscribe(id); }

    static Snapshot convert(const std::string &type, const Items &items)
    {
        Snapshot out;
        out.reserve(items.size());
        for (const auto &item : items)
        {
            try
            {
                out.push_back(item.get<T>());
            }
            catch (const nlohmann::json::exception &e)
            {
                LOGGER_WARN("TypedCache<{}>: skipping an item that does not convert: {}", type,
                            e.what());
            }
        }
        return out;
    }

  private:
    Mutation wrap(MutationHandle handle)
    {
        Mutation m;
        if (handle.optimistic.is_object())
        {
            try
            {
                m.optimistic = handle.optimistic.get<T>();
            }
            catch (const nlohmann::json::exception &e)
            {
                LOGGER_WARN("TypedCache<{}>: optimistic entity does not convert: {}", m_type,
                            e.what());
            }
        }
        m.remote = std::async(
            std::launch::deferred,
            [remote = std::move(handle.remote), type = m_type]() -> EntityResult
            {
                const auto &r = remote.get();
                if (!r.is_ok())
                    return EntityResult::error(r.error(), r.error_code());
                if (!r.content().is_object())
                    return EntityResult::ok(T{});
                try
                {
                    return EntityResult::ok(r.content().template get<T>());
                }
                catch (const nlohmann::json::exception &e)
                {
                    SyncError err;
                    err.kind = err.cause = SyncErrorKind::ValidationError;
                    err.entity_type = type;
                    err.message = fmt::format("response does not convert: {}", e.what());
                    return EntityResult::error(std::move(err));
                }
            });
        return m;
    }

    CacheRegistry &m_registry;
    std::string m_type;
};

} // namespace syncdesk::sync
