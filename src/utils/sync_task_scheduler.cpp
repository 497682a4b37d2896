#include "utils/sync_task_scheduler.hpp"
#include "utils/logger.hpp"

#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace syncdesk::sync
{

SchedulerConfig SchedulerConfig::from_settings(const SyncSettings &settings)
{
    SchedulerConfig cfg;
    cfg.max_concurrent = settings.max_concurrent;
    cfg.read_policy.backoff = {settings.base_delay, settings.read_cap};
    cfg.read_policy.max_retries = settings.read_max_retries;
    cfg.write_policy.backoff = {settings.base_delay, settings.write_cap};
    cfg.write_policy.max_retries = settings.write_max_retries;
    return cfg;
}

namespace
{

using Clock = std::chrono::steady_clock;

struct Entry
{
    SyncTask task;
    HttpRequest request;
    std::string dedup_key; // non-empty for deduplicated fetches
    std::promise<TaskResult> promise;
    SyncTaskScheduler::ResultFuture future;
    std::vector<SyncTaskScheduler::Completion> callbacks;
    bool replayed{false};
    uint64_t sent_generation{0};
    int attempts{0};
    SyncErrorKind last_cause{SyncErrorKind::NetworkError};
    int last_status{0};
    std::string last_message;
};

using EntryPtr = std::shared_ptr<Entry>;

SyncError make_error(const Entry &e, SyncErrorKind kind, SyncErrorKind cause, int status,
                     std::string message)
{
    SyncError err;
    err.kind = kind;
    err.cause = cause;
    err.http_status = status;
    err.entity_type = e.task.entity_type;
    err.operation = e.task.kind;
    err.message = std::move(message);
    err.attempts = e.attempts;
    return err;
}

std::string response_message(const HttpResponse &resp)
{
    if (resp.transport_failed())
        return resp.error;
    if (resp.body.is_object())
    {
        for (const char *key : {"detail", "message", "error"})
        {
            auto it = resp.body.find(key);
            if (it != resp.body.end() && it->is_string())
                return it->get<std::string>();
        }
    }
    if (resp.body.is_string())
        return resp.body.get<std::string>();
    return {};
}

std::string stale_key(const SyncTask &t)
{
    return t.entity_type + '/' + t.entity_id;
}

} // namespace

struct SyncTaskScheduler::Impl
{
    std::shared_ptr<RemoteTransport> transport;
    std::shared_ptr<AuthSession> auth;
    EndpointCatalog catalog;
    SchedulerConfig config;

    mutable std::mutex mutex;
    std::condition_variable cv;
    bool stopping{false};
    std::multimap<Clock::time_point, EntryPtr> ready;
    std::unordered_map<std::string, EntryPtr> fetches; // by dedup key
    std::vector<EntryPtr> parked;                       // waiting for a token refresh
    size_t executing{0};
    std::unordered_map<std::string, uint64_t> applied_seq;
    SchedulerStats stats;
    std::atomic<uint64_t> next_task_id{1};
    std::atomic<uint64_t> mutation_seq{0};
    std::vector<std::thread> workers;

    void worker_main(size_t index);
    void execute(const EntryPtr &e);
    void on_success(const EntryPtr &e, HttpResponse &&resp);
    void on_retryable(const EntryPtr &e, SyncErrorKind cause, int status, std::string message);
    void on_unauthorized(const EntryPtr &e);
    void run_refresh();

    // Caller holds `mutex`. Callbacks and the promise are settled later by settle().
    void enqueue_locked(const EntryPtr &e, Clock::time_point when);
    void finish_locked(const EntryPtr &e);
    static void settle(const EntryPtr &e, TaskResult result);

    [[nodiscard]] const utils::RetryPolicy &policy_for(TaskKind kind) const noexcept
    {
        return is_write(kind) ? config.write_policy : config.read_policy;
    }
};

void SyncTaskScheduler::Impl::enqueue_locked(const EntryPtr &e, Clock::time_point when)
{
    e->task.next_attempt_at = when;
    ready.emplace(when, e);
    cv.notify_one();
}

void SyncTaskScheduler::Impl::finish_locked(const EntryPtr &e)
{
    if (!e->dedup_key.empty())
    {
        auto it = fetches.find(e->dedup_key);
        if (it != fetches.end() && it->second == e)
            fetches.erase(it);
    }
}

void SyncTaskScheduler::Impl::settle(const EntryPtr &e, TaskResult result)
{
    // No new callbacks can attach: the entry left `fetches` under the lock.
    for (const auto &cb : e->callbacks)
    {
        try
        {
            cb(result);
        }
        catch (const std::exception &ex)
        {
            LOGGER_ERROR("SyncTaskScheduler: completion callback for task {} threw: {}",
                         e->task.id, ex.what());
        }
    }
    e->promise.set_value(std::move(result));
}

void SyncTaskScheduler::Impl::worker_main(size_t index)
{
    LOGGER_TRACE("SyncTaskScheduler: worker {} started", index);
    std::unique_lock<std::mutex> lock(mutex);
    while (!stopping)
    {
        if (ready.empty())
        {
            cv.wait(lock);
            continue;
        }
        auto first = ready.begin();
        if (first->first > Clock::now())
        {
            cv.wait_until(lock, first->first);
            continue;
        }
        EntryPtr e = first->second;
        ready.erase(first);
        ++executing;
        lock.unlock();

        execute(e);

        lock.lock();
        --executing;
    }
    LOGGER_TRACE("SyncTaskScheduler: worker {} exiting", index);
}

void SyncTaskScheduler::Impl::execute(const EntryPtr &e)
{
    HttpRequest req = e->request;
    if (auth)
    {
        // Generation first: a refresh in between then reads as stale and replays.
        e->sent_generation = auth->generation();
        req.bearer_token = auth->token();
    }
    ++e->attempts;
    {
        std::lock_guard<std::mutex> lock(mutex);
        ++stats.attempts;
    }

    HttpResponse resp;
    try
    {
        resp = transport->send(req);
    }
    catch (const std::exception &ex)
    {
        resp = HttpResponse{};
        resp.error = ex.what();
    }

    LOGGER_DEBUG("SyncTaskScheduler: task {} {} {} attempt {} -> {}", e->task.id,
                 to_string(e->task.kind), req.route_key(), e->attempts, resp.status);

    if (resp.ok())
    {
        on_success(e, std::move(resp));
        return;
    }
    if (resp.transport_failed())
    {
        on_retryable(e, SyncErrorKind::NetworkError, 0, resp.error);
        return;
    }
    if (resp.status >= 500)
    {
        on_retryable(e, SyncErrorKind::ServerError, resp.status, response_message(resp));
        return;
    }
    if (resp.status == 401)
    {
        on_unauthorized(e);
        return;
    }

    std::unique_lock<std::mutex> lock(mutex);
    finish_locked(e);
    ++stats.failed;
    lock.unlock();
    auto err = make_error(*e, SyncErrorKind::ValidationError, SyncErrorKind::ValidationError,
                          resp.status, response_message(resp));
    LOGGER_WARN("SyncTaskScheduler: {}", err.describe());
    settle(e, TaskResult::error(std::move(err), resp.status));
}

void SyncTaskScheduler::Impl::on_success(const EntryPtr &e, HttpResponse &&resp)
{
    std::unique_lock<std::mutex> lock(mutex);
    finish_locked(e);

    if (is_write(e->task.kind) && e->task.mutation_seq != 0 && !e->task.entity_id.empty())
    {
        auto &applied = applied_seq[stale_key(e->task)];
        if (e->task.mutation_seq < applied)
        {
            ++stats.stale_discards;
            lock.unlock();
            LOGGER_DEBUG("SyncTaskScheduler: discarding stale response for {} (seq {} < {})",
                         stale_key(e->task), e->task.mutation_seq, applied);
            settle(e, TaskResult::error(make_error(*e, SyncErrorKind::SyncConflict,
                                                   SyncErrorKind::SyncConflict, resp.status,
                                                   "a newer mutation was already applied"),
                                        resp.status));
            return;
        }
        applied = e->task.mutation_seq;
    }
    ++stats.succeeded;
    lock.unlock();
    settle(e, TaskResult::ok(std::move(resp.body)));
}

void SyncTaskScheduler::Impl::on_retryable(const EntryPtr &e, SyncErrorKind cause, int status,
                                           std::string message)
{
    e->last_cause = cause;
    e->last_status = status;
    e->last_message = std::move(message);

    const auto &policy = policy_for(e->task.kind);
    std::unique_lock<std::mutex> lock(mutex);
    if (stopping)
    {
        finish_locked(e);
        ++stats.failed;
        lock.unlock();
        settle(e, TaskResult::error(make_error(*e, SyncErrorKind::NetworkError, cause, status,
                                               "scheduler stopped")));
        return;
    }
    if (policy.can_retry(e->task.retry_count))
    {
        const auto delay = policy.delay_for(e->task.retry_count);
        ++e->task.retry_count;
        ++stats.retries;
        LOGGER_DEBUG("SyncTaskScheduler: task {} {} failed ({}), retry {}/{} in {} ms",
                     e->task.id, e->task.entity_type, to_string(cause), e->task.retry_count,
                     policy.max_retries, delay.count());
        enqueue_locked(e, Clock::now() + delay);
        return;
    }

    finish_locked(e);
    ++stats.failed;
    lock.unlock();
    auto err = make_error(*e, SyncErrorKind::RetriesExhausted, cause, status, e->last_message);
    LOGGER_ERROR("SyncTaskScheduler: {}", err.describe());
    settle(e, TaskResult::error(std::move(err), status));
}

void SyncTaskScheduler::Impl::on_unauthorized(const EntryPtr &e)
{
    auto expire = [this, &e](std::unique_lock<std::mutex> &lock, const char *why)
    {
        finish_locked(e);
        ++stats.failed;
        lock.unlock();
        auto err = make_error(*e, SyncErrorKind::AuthExpired, SyncErrorKind::AuthExpired, 401, why);
        LOGGER_WARN("SyncTaskScheduler: {}", err.describe());
        settle(e, TaskResult::error(std::move(err), 401));
    };

    std::unique_lock<std::mutex> lock(mutex);
    if (!auth)
    {
        expire(lock, "unauthorized");
        return;
    }

    const auto decision = auth->on_unauthorized(e->sent_generation, e->replayed);
    LOGGER_DEBUG("SyncTaskScheduler: task {} got 401 -> {}", e->task.id, to_string(decision));
    switch (decision)
    {
    case AuthSession::Decision::ReplayNow:
        e->replayed = true;
        enqueue_locked(e, Clock::now());
        return;
    case AuthSession::Decision::WaitForRefresh:
        parked.push_back(e);
        return;
    case AuthSession::Decision::Expired:
        expire(lock, e->replayed ? "unauthorized after token refresh" : "session expired");
        return;
    case AuthSession::Decision::StartRefresh:
        parked.push_back(e);
        ++stats.refreshes;
        lock.unlock();
        run_refresh();
        return;
    }
}

void SyncTaskScheduler::Impl::run_refresh()
{
    const HttpRequest req = AuthSession::make_refresh_request(auth->token());
    HttpResponse resp;
    try
    {
        resp = transport->send(req);
    }
    catch (const std::exception &ex)
    {
        resp = HttpResponse{};
        resp.error = ex.what();
    }
    auto token = AuthSession::parse_refresh_response(resp);
    if (!token)
    {
        LOGGER_WARN("SyncTaskScheduler: token refresh failed (HTTP {}{}{})", resp.status,
                    resp.error.empty() ? "" : ": ", resp.error);
    }

    std::vector<EntryPtr> waiting;
    bool refreshed = false;
    {
        std::lock_guard<std::mutex> lock(mutex);
        refreshed = auth->complete_refresh(std::move(token));
        waiting.swap(parked);
        if (refreshed)
        {
            for (const auto &e : waiting)
            {
                e->replayed = true;
                enqueue_locked(e, Clock::now());
            }
            return;
        }
        for (const auto &e : waiting)
        {
            finish_locked(e);
            ++stats.failed;
        }
    }

    for (const auto &e : waiting)
    {
        settle(e, TaskResult::error(make_error(*e, SyncErrorKind::AuthExpired,
                                               SyncErrorKind::AuthExpired, 401,
                                               "token refresh failed"),
                                    401));
    }
    auth->notify_expired();
}

// ============================================================================
// Public interface
// ============================================================================

SyncTaskScheduler::SyncTaskScheduler(std::shared_ptr<RemoteTransport> transport,
                                     std::shared_ptr<AuthSession> auth, EndpointCatalog catalog,
                                     SchedulerConfig config)
    : pImpl(std::make_unique<Impl>())
{
    if (!transport)
        throw std::invalid_argument("SyncTaskScheduler: transport must not be null");
    pImpl->transport = std::move(transport);
    pImpl->auth = std::move(auth);
    pImpl->catalog = std::move(catalog);
    pImpl->config = config;
    if (pImpl->config.max_concurrent < 1)
        pImpl->config.max_concurrent = 1;

    for (int i = 0; i < pImpl->config.max_concurrent; ++i)
    {
        pImpl->workers.emplace_back([impl = pImpl.get(), i] { impl->worker_main(static_cast<size_t>(i)); });
    }
    LOGGER_DEBUG("SyncTaskScheduler: {} workers, read retries {}, write retries {}",
                 pImpl->config.max_concurrent, pImpl->config.read_policy.max_retries,
                 pImpl->config.write_policy.max_retries);
}

SyncTaskScheduler::~SyncTaskScheduler()
{
    shutdown();
}

SyncTaskScheduler::ResultFuture SyncTaskScheduler::submit(SyncTask task, Completion on_done)
{
    auto e = std::make_shared<Entry>();
    e->future = e->promise.get_future().share();
    task.id = pImpl->next_task_id.fetch_add(1, std::memory_order_relaxed);
    e->task = std::move(task);
    if (on_done)
        e->callbacks.push_back(std::move(on_done));

    if (e->task.request)
    {
        e->request = *e->task.request;
    }
    else if (auto req = pImpl->catalog.request_for(e->task.kind, e->task.entity_type,
                                                   e->task.entity_id, e->task.payload))
    {
        e->request = std::move(*req);
    }
    else
    {
        auto err = make_error(*e, SyncErrorKind::ValidationError, SyncErrorKind::ValidationError,
                              0, "no route for this entity type and operation");
        LOGGER_ERROR("SyncTaskScheduler: {}", err.describe());
        Impl::settle(e, TaskResult::error(std::move(err)));
        return e->future;
    }

    std::unique_lock<std::mutex> lock(pImpl->mutex);
    if (pImpl->stopping)
    {
        lock.unlock();
        Impl::settle(e, TaskResult::error(make_error(*e, SyncErrorKind::NetworkError,
                                                     SyncErrorKind::NetworkError, 0,
                                                     "scheduler stopped")));
        return e->future;
    }
    ++pImpl->stats.submitted;

    if (e->task.kind == TaskKind::Fetch && e->request.method == HttpMethod::Get)
    {
        e->dedup_key = e->task.entity_type + '|' + e->request.route_key();
        auto it = pImpl->fetches.find(e->dedup_key);
        if (it != pImpl->fetches.end())
        {
            ++pImpl->stats.dedup_hits;
            if (!e->callbacks.empty())
                it->second->callbacks.push_back(std::move(e->callbacks.front()));
            LOGGER_TRACE("SyncTaskScheduler: fetch {} joins task {}", e->dedup_key,
                         it->second->task.id);
            return it->second->future;
        }
        pImpl->fetches.emplace(e->dedup_key, e);
    }

    const auto when = e->task.next_attempt_at == Clock::time_point{} ? Clock::now()
                                                                     : e->task.next_attempt_at;
    pImpl->enqueue_locked(e, when);
    return e->future;
}

SyncTaskScheduler::ResultFuture SyncTaskScheduler::fetch(const std::string &entity_type,
                                                         Completion on_done)
{
    SyncTask task;
    task.kind = TaskKind::Fetch;
    task.entity_type = entity_type;
    return submit(std::move(task), std::move(on_done));
}

SyncTaskScheduler::ResultFuture SyncTaskScheduler::send(HttpRequest request, TaskKind kind,
                                                        std::string entity_type,
                                                        Completion on_done)
{
    SyncTask task;
    task.kind = kind;
    task.entity_type = std::move(entity_type);
    task.request = std::move(request);
    return submit(std::move(task), std::move(on_done));
}

uint64_t SyncTaskScheduler::next_mutation_seq() noexcept
{
    return pImpl->mutation_seq.fetch_add(1, std::memory_order_relaxed) + 1;
}

void SyncTaskScheduler::shutdown()
{
    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (pImpl->stopping && pImpl->workers.empty())
            return;
        pImpl->stopping = true;
        workers.swap(pImpl->workers);
    }
    pImpl->cv.notify_all();
    for (auto &t : workers)
    {
        if (t.joinable())
            t.join();
    }

    std::vector<EntryPtr> abandoned;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        for (auto &[when, e] : pImpl->ready)
            abandoned.push_back(e);
        pImpl->ready.clear();
        for (auto &e : pImpl->parked)
            abandoned.push_back(e);
        pImpl->parked.clear();
        pImpl->fetches.clear();
        pImpl->stats.failed += abandoned.size();
    }
    if (!abandoned.empty())
        LOGGER_INFO("SyncTaskScheduler: failing {} unfinished task(s) on shutdown", abandoned.size());
    for (const auto &e : abandoned)
    {
        Impl::settle(e, TaskResult::error(make_error(*e, SyncErrorKind::NetworkError,
                                                     SyncErrorKind::NetworkError, 0,
                                                     "scheduler stopped")));
    }
}

SchedulerStats SyncTaskScheduler::stats() const
{
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->stats;
}

size_t SyncTaskScheduler::pending() const
{
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->ready.size() + pImpl->parked.size() + pImpl->executing;
}

const EndpointCatalog &SyncTaskScheduler::catalog() const noexcept
{
    return pImpl->catalog;
}

const std::shared_ptr<AuthSession> &SyncTaskScheduler::auth() const noexcept
{
    return pImpl->auth;
}

} // namespace syncdesk::sync
