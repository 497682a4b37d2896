/**
 * @file test_sync_task_scheduler.cpp
 * @brief Layer 3 tests for SyncTaskScheduler: retry policy, deduplication, throttling, the 401
 *        refresh protocol, the stale-response guard and shutdown.
 *
 * Retry delays are scaled down to milliseconds; the formula is the same.
 */
#include "fake_transport.h"
#include "sd_sync.hpp"
#include "shared_test_helpers.h"
#include "test_patterns.h"

#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <stdexcept>
#include <thread>

using namespace syncdesk::sync;
using namespace syncdesk::tests::helper;
using namespace std::chrono_literals;
using nlohmann::json;

namespace
{

SchedulerConfig fast_config(int max_concurrent = 4)
{
    SchedulerConfig cfg;
    cfg.max_concurrent = max_concurrent;
    cfg.read_policy = {{10ms, 40ms}, 5};
    cfg.write_policy = {{10ms, 20ms}, 3};
    return cfg;
}

/// Returns a copy: a temporary future may hold the last reference to the shared state.
TaskResult get(const SyncTaskScheduler::ResultFuture &f)
{
    EXPECT_EQ(f.wait_for(10s), std::future_status::ready);
    return f.get().clone();
}

SyncTask update_task(const std::string &id, uint64_t seq, json payload)
{
    SyncTask t;
    t.kind = TaskKind::Update;
    t.entity_type = "projects";
    t.entity_id = id;
    t.payload = std::move(payload);
    t.mutation_seq = seq;
    return t;
}

} // namespace

class SyncTaskSchedulerTest : public syncdesk::tests::PureApiTest
{
  protected:
    std::shared_ptr<FakeTransport> transport_ = std::make_shared<FakeTransport>();
    std::shared_ptr<AuthSession> auth_ = std::make_shared<AuthSession>(10s);
};

// ============================================================================
// Basics
// ============================================================================

TEST_F(SyncTaskSchedulerTest, FetchReturnsBody)
{
    transport_->set_handler([](const HttpRequest &)
                            { return http(200, json::array({json{{"id", "p1"}}})); });
    auth_->set_token("tok");
    SyncTaskScheduler sched(transport_, auth_, {}, fast_config());

    const auto &r = get(sched.fetch("projects"));
    ASSERT_TRUE(r.is_ok()) << r.error().describe();
    EXPECT_EQ(r.content()[0]["id"], "p1");

    const auto calls = transport_->calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].request.route_key(), "GET /projects");
    EXPECT_EQ(calls[0].request.bearer_token, "tok");

    const auto stats = sched.stats();
    EXPECT_EQ(stats.submitted, 1u);
    EXPECT_EQ(stats.succeeded, 1u);
    EXPECT_EQ(stats.attempts, 1u);
}

TEST_F(SyncTaskSchedulerTest, MutationsUseCatalogueRoutes)
{
    SyncTaskScheduler sched(transport_, auth_, {}, fast_config());
    SyncTask create;
    create.kind = TaskKind::Create;
    create.entity_type = "clients";
    create.entity_id = "tmp-1";
    create.payload = {{"name", "Acme"}};
    ASSERT_TRUE(get(sched.submit(create)).is_ok());
    ASSERT_TRUE(get(sched.submit(update_task("p7", sched.next_mutation_seq(), {{"a", 1}})))
                    .is_ok());

    EXPECT_EQ(transport_->count("POST /clients"), 1u);
    EXPECT_EQ(transport_->count("PUT /projects/p7"), 1u);
    EXPECT_EQ(transport_->calls()[0].request.body["name"], "Acme");
}

TEST_F(SyncTaskSchedulerTest, UnknownRouteFailsWithoutNetwork)
{
    SyncTaskScheduler sched(transport_, auth_, {}, fast_config());
    const auto &r = get(sched.fetch("invoices"));
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error().kind, SyncErrorKind::ValidationError);
    EXPECT_EQ(r.error().entity_type, "invoices");
    EXPECT_EQ(transport_->total(), 0u);
}

TEST_F(SyncTaskSchedulerTest, NullTransportRejected)
{
    EXPECT_THROW({ SyncTaskScheduler sched(nullptr, auth_); }, std::invalid_argument);
}

TEST_F(SyncTaskSchedulerTest, ConfigFromSettings)
{
    syncdesk::SyncSettings s;
    s.max_concurrent = 2;
    s.base_delay = 500ms;
    s.read_cap = 8000ms;
    s.write_cap = 2000ms;
    s.read_max_retries = 6;
    s.write_max_retries = 1;
    const auto cfg = SchedulerConfig::from_settings(s);
    EXPECT_EQ(cfg.max_concurrent, 2);
    EXPECT_EQ(cfg.read_policy.delay_for(10), 8000ms);
    EXPECT_EQ(cfg.write_policy.delay_for(10), 2000ms);
    EXPECT_EQ(cfg.read_policy.delay_for(0), 500ms);
    EXPECT_EQ(cfg.read_policy.max_retries, 6);
    EXPECT_EQ(cfg.write_policy.max_retries, 1);

    const SchedulerConfig defaults;
    EXPECT_EQ(defaults.read_policy.delay_for(0), 1000ms);
    EXPECT_EQ(defaults.read_policy.delay_for(10), 16000ms);
    EXPECT_EQ(defaults.write_policy.delay_for(10), 4000ms);
    EXPECT_EQ(defaults.read_policy.max_retries, 5);
    EXPECT_EQ(defaults.write_policy.max_retries, 3);
}

// ============================================================================
// Retry policy
// ============================================================================

TEST_F(SyncTaskSchedulerTest, ServerErrorRetriedThenSucceeds)
{
    std::atomic<int> n{0};
    transport_->set_handler(
        [&](const HttpRequest &)
        { return ++n <= 2 ? http(503, {{"detail", "busy"}}) : http(200, json::array()); });
    SyncTaskScheduler sched(transport_, auth_, {}, fast_config());

    const auto &r = get(sched.fetch("projects"));
    EXPECT_TRUE(r.is_ok());
    EXPECT_EQ(transport_->total(), 3u);
    EXPECT_EQ(sched.stats().retries, 2u);
}

TEST_F(SyncTaskSchedulerTest, RetryDelaysFollowCappedExponential)
{
    transport_->set_handler([](const HttpRequest &) { return http(500); });
    auto cfg = fast_config();
    cfg.read_policy = {{20ms, 50ms}, 4};
    SyncTaskScheduler sched(transport_, auth_, {}, cfg);

    const auto &r = get(sched.fetch("projects"));
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error().kind, SyncErrorKind::RetriesExhausted);
    EXPECT_EQ(r.error().cause, SyncErrorKind::ServerError);
    EXPECT_EQ(r.error().http_status, 500);
    EXPECT_EQ(r.error().attempts, 5);
    EXPECT_EQ(r.error().operation, TaskKind::Fetch);
    EXPECT_EQ(r.error().entity_type, "projects");

    const auto calls = transport_->calls();
    ASSERT_EQ(calls.size(), 5u);
    const std::chrono::milliseconds expected[] = {20ms, 40ms, 50ms, 50ms};
    for (size_t i = 1; i < calls.size(); ++i)
    {
        EXPECT_GE(calls[i].at - calls[i - 1].at, expected[i - 1]) << "retry " << i;
        EXPECT_LT(calls[i].at - calls[i - 1].at, expected[i - 1] + 2s) << "retry " << i;
    }
}

TEST_F(SyncTaskSchedulerTest, NetworkErrorUsesWriteBudget)
{
    transport_->set_handler([](const HttpRequest &) { return transport_error("timed out"); });
    SyncTaskScheduler sched(transport_, auth_, {}, fast_config());

    const auto &r = get(sched.submit(update_task("p1", sched.next_mutation_seq(), {})));
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error().kind, SyncErrorKind::RetriesExhausted);
    EXPECT_EQ(r.error().cause, SyncErrorKind::NetworkError);
    EXPECT_EQ(r.error().operation, TaskKind::Update);
    EXPECT_EQ(r.error().message, "timed out");
    EXPECT_EQ(transport_->total(), 4u);
    EXPECT_NE(r.error().describe().find("RetriesExhausted Update on 'projects'"),
              std::string::npos)
        << r.error().describe();
}

TEST_F(SyncTaskSchedulerTest, TransportExceptionIsNetworkError)
{
    std::atomic<int> n{0};
    transport_->set_handler(
        [&](const HttpRequest &) -> HttpResponse
        {
            if (++n == 1)
                throw std::runtime_error("socket closed");
            return http(200, json::array());
        });
    SyncTaskScheduler sched(transport_, auth_, {}, fast_config());
    EXPECT_TRUE(get(sched.fetch("projects")).is_ok());
    EXPECT_EQ(transport_->total(), 2u);
}

TEST_F(SyncTaskSchedulerTest, ClientErrorIsTerminal)
{
    transport_->set_handler([](const HttpRequest &)
                            { return http(422, {{"detail", "name is required"}}); });
    SyncTaskScheduler sched(transport_, auth_, {}, fast_config());

    SyncTask create;
    create.kind = TaskKind::Create;
    create.entity_type = "projects";
    create.entity_id = "tmp-2";
    create.payload = json::object();
    const auto &r = get(sched.submit(create));
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error().kind, SyncErrorKind::ValidationError);
    EXPECT_EQ(r.error().http_status, 422);
    EXPECT_EQ(r.error_code(), 422);
    EXPECT_EQ(r.error().message, "name is required");
    EXPECT_EQ(r.error().attempts, 1);
    EXPECT_EQ(transport_->total(), 1u);
    EXPECT_EQ(sched.stats().retries, 0u);
}

// ============================================================================
// Deduplication and throttling
// ============================================================================

TEST_F(SyncTaskSchedulerTest, IdenticalFetchesShareOneCall)
{
    Gate gate;
    transport_->set_handler(
        [&](const HttpRequest &)
        {
            gate.wait();
            return http(200, json::array({json{{"id", "p1"}}}));
        });
    SyncTaskScheduler sched(transport_, auth_, {}, fast_config());

    std::atomic<int> callbacks{0};
    auto f1 = sched.fetch("projects", [&](const TaskResult &r) { callbacks += r.is_ok(); });
    auto f2 = sched.fetch("projects", [&](const TaskResult &r) { callbacks += r.is_ok(); });
    auto f3 = sched.fetch("projects");
    auto other = sched.fetch("clients");
    gate.open();

    EXPECT_EQ(get(f1).content(), get(f2).content());
    EXPECT_EQ(get(f1).content(), get(f3).content());
    EXPECT_TRUE(get(other).is_ok());
    EXPECT_EQ(callbacks.load(), 2);
    EXPECT_EQ(transport_->count("GET /projects"), 1u);
    EXPECT_EQ(transport_->count("GET /clients"), 1u);
    EXPECT_EQ(sched.stats().dedup_hits, 2u);

    // Once settled, the next fetch goes to the network again.
    EXPECT_TRUE(get(sched.fetch("projects")).is_ok());
    EXPECT_EQ(transport_->count("GET /projects"), 2u);
}

TEST_F(SyncTaskSchedulerTest, NamedGetRequestsDeduplicatedPostsNot)
{
    Gate gate;
    transport_->set_handler(
        [&](const HttpRequest &)
        {
            gate.wait();
            return http(200, json::object());
        });
    SyncTaskScheduler sched(transport_, auth_, {}, fast_config());

    auto a = sched.send(endpoints::current_time_entry(), TaskKind::Fetch, "time_entries");
    auto b = sched.send(endpoints::current_time_entry(), TaskKind::Fetch, "time_entries");
    auto c = sched.send(endpoints::stop_time_entry(), TaskKind::Update, "time_entries");
    auto d = sched.send(endpoints::stop_time_entry(), TaskKind::Update, "time_entries");
    gate.open();
    for (const auto *f : {&a, &b, &c, &d})
        EXPECT_TRUE(get(*f).is_ok());
    EXPECT_EQ(transport_->count("GET /time-entries/current"), 1u);
    EXPECT_EQ(transport_->count("POST /time-entries/stop"), 2u);
}

TEST_F(SyncTaskSchedulerTest, ConcurrencyIsBounded)
{
    std::atomic<int> running{0};
    std::atomic<int> peak{0};
    transport_->set_handler(
        [&](const HttpRequest &)
        {
            const int now = ++running;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now))
            {
            }
            std::this_thread::sleep_for(40ms);
            --running;
            return http(200, json::object());
        });
    SyncTaskScheduler sched(transport_, auth_, {}, fast_config(2));

    std::vector<SyncTaskScheduler::ResultFuture> futures;
    for (int i = 0; i < 6; ++i)
        futures.push_back(sched.send(endpoints::screenshot_thumbnail(std::to_string(i)),
                                     TaskKind::Fetch, "screenshots"));
    for (const auto &f : futures)
        EXPECT_TRUE(get(f).is_ok());
    EXPECT_EQ(peak.load(), 2);
    EXPECT_EQ(transport_->total(), 6u);
}

TEST_F(SyncTaskSchedulerTest, ReadyTasksRunInAttemptTimeOrder)
{
    Gate gate;
    transport_->set_handler(
        [&](const HttpRequest &req)
        {
            if (req.path == "/sync/status")
                gate.wait();
            return http(200, json::object());
        });
    SyncTaskScheduler sched(transport_, auth_, {}, fast_config(1));

    auto blocker = sched.send(endpoints::sync_status(), TaskKind::Fetch, "sync");
    ASSERT_TRUE(wait_until([&] { return transport_->total() == 1; }));

    const auto now = std::chrono::steady_clock::now();
    std::vector<SyncTaskScheduler::ResultFuture> futures;
    for (auto [id, delay] : {std::pair{"c", 60ms}, std::pair{"a", 0ms}, std::pair{"b", 30ms}})
    {
        SyncTask t;
        t.kind = TaskKind::Fetch;
        t.entity_type = "screenshots";
        t.request = endpoints::screenshot_image(id);
        t.next_attempt_at = now + delay;
        futures.push_back(sched.submit(t));
    }
    std::this_thread::sleep_for(80ms);
    gate.open();
    for (const auto &f : futures)
        EXPECT_TRUE(get(f).is_ok());
    EXPECT_TRUE(get(blocker).is_ok());

    const auto calls = transport_->calls();
    ASSERT_EQ(calls.size(), 4u);
    EXPECT_EQ(calls[1].request.path, "/screenshots/a/image");
    EXPECT_EQ(calls[2].request.path, "/screenshots/b/image");
    EXPECT_EQ(calls[3].request.path, "/screenshots/c/image");
}

TEST_F(SyncTaskSchedulerTest, ThrowingCompletionDoesNotLoseResult)
{
    SyncTaskScheduler sched(transport_, auth_, {}, fast_config());
    auto f = sched.fetch("projects", [](const TaskResult &)
                         { throw std::runtime_error("listener failed"); });
    EXPECT_TRUE(get(f).is_ok());
    EXPECT_TRUE(get(sched.fetch("clients")).is_ok());
}

// ============================================================================
// Authentication
// ============================================================================

TEST_F(SyncTaskSchedulerTest, BurstOf401sTriggersOneRefresh)
{
    transport_->set_handler(
        [](const HttpRequest &req)
        {
            if (req.path == "/auth/refresh")
            {
                std::this_thread::sleep_for(50ms);
                return http(200, {{"data", {{"session", {{"access_token", "fresh"}}}}}});
            }
            if (req.bearer_token != "fresh")
                return http(401, {{"detail", "token expired"}});
            return http(200, json::array());
        });
    auth_->set_token("stale");
    SyncTaskScheduler sched(transport_, auth_, {}, fast_config(4));

    std::vector<SyncTaskScheduler::ResultFuture> futures;
    for (const char *type : {"projects", "clients", "tasks", "organizations", "screenshots"})
        futures.push_back(sched.fetch(type));
    for (const auto &f : futures)
    {
        const auto &r = get(f);
        EXPECT_TRUE(r.is_ok()) << (r.is_error() ? r.error().describe() : "");
    }
    EXPECT_EQ(transport_->count("POST /auth/refresh"), 1u);
    EXPECT_EQ(sched.stats().refreshes, 1u);
    EXPECT_EQ(auth_->token(), "fresh");

    const auto calls = transport_->calls();
    const auto refresh = std::find_if(calls.begin(), calls.end(), [](const auto &c)
                                      { return c.request.path == "/auth/refresh"; });
    ASSERT_NE(refresh, calls.end());
    EXPECT_EQ(refresh->request.bearer_token, "stale");
}

TEST_F(SyncTaskSchedulerTest, FailedRefreshExpiresSession)
{
    transport_->set_handler(
        [](const HttpRequest &req)
        {
            if (req.path == "/auth/refresh")
                return http(401, {{"detail", "refresh token revoked"}});
            return http(401);
        });
    auth_->set_token("stale");
    std::atomic<int> expired{0};
    auth_->set_on_expired([&] { ++expired; });
    SyncTaskScheduler sched(transport_, auth_, {}, fast_config());

    auto a = sched.fetch("projects");
    auto b = sched.fetch("clients");
    for (const auto *f : {&a, &b})
    {
        const auto &r = get(*f);
        ASSERT_TRUE(r.is_error());
        EXPECT_EQ(r.error().kind, SyncErrorKind::AuthExpired);
        EXPECT_EQ(r.error().http_status, 401);
    }
    EXPECT_FALSE(auth_->has_token());
    EXPECT_GE(expired.load(), 1);
    EXPECT_EQ(transport_->count("POST /auth/refresh"), 1u);
}

TEST_F(SyncTaskSchedulerTest, ReplayRejectedAgainIsAuthExpired)
{
    transport_->set_handler(
        [](const HttpRequest &req)
        {
            if (req.path == "/auth/refresh")
                return http(200, {{"access_token", "fresh"}});
            return http(401);
        });
    auth_->set_token("stale");
    SyncTaskScheduler sched(transport_, auth_, {}, fast_config());

    const auto &r = get(sched.fetch("projects"));
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error().kind, SyncErrorKind::AuthExpired);
    EXPECT_EQ(transport_->count("GET /projects"), 2u);
    EXPECT_EQ(transport_->count("POST /auth/refresh"), 1u);
    EXPECT_EQ(auth_->token(), "fresh");
}

TEST_F(SyncTaskSchedulerTest, UnauthorizedInsideCooldownExpires)
{
    std::atomic<bool> accept{true};
    transport_->set_handler(
        [&](const HttpRequest &req)
        {
            if (req.path == "/auth/refresh")
                return http(200, {{"access_token", "fresh"}});
            if (req.bearer_token == "fresh" && accept.load())
                return http(200, json::array());
            return http(401);
        });
    auth_->set_token("stale");
    SyncTaskScheduler sched(transport_, auth_, {}, fast_config());

    ASSERT_TRUE(get(sched.fetch("projects")).is_ok());
    accept = false;
    const auto &r = get(sched.fetch("clients"));
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error().kind, SyncErrorKind::AuthExpired);
    EXPECT_EQ(transport_->count("POST /auth/refresh"), 1u);
}

TEST_F(SyncTaskSchedulerTest, WithoutAuthSessionEvery401Expires)
{
    transport_->set_handler([](const HttpRequest &) { return http(401); });
    SyncTaskScheduler sched(transport_, nullptr, {}, fast_config());
    EXPECT_TRUE(sched.auth() == nullptr);
    const auto &r = get(sched.fetch("projects"));
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error().kind, SyncErrorKind::AuthExpired);
    EXPECT_EQ(transport_->total(), 1u);
}

// ============================================================================
// Stale-response guard
// ============================================================================

TEST_F(SyncTaskSchedulerTest, OlderMutationResponseAfterNewerIsDiscarded)
{
    Gate first_gate;
    std::atomic<bool> second_done{false};
    transport_->set_handler(
        [&](const HttpRequest &req)
        {
            if (req.body.value("name", "") == "first")
                first_gate.wait();
            return http(200, req.body);
        });
    SyncTaskScheduler sched(transport_, auth_, {}, fast_config());

    const auto seq1 = sched.next_mutation_seq();
    const auto seq2 = sched.next_mutation_seq();
    ASSERT_LT(seq1, seq2);
    auto first = sched.submit(update_task("p1", seq1, {{"id", "p1"}, {"name", "first"}}));
    ASSERT_TRUE(wait_until([&] { return transport_->total() == 1; }));
    auto second = sched.submit(update_task("p1", seq2, {{"id", "p1"}, {"name", "second"}}),
                               [&](const TaskResult &) { second_done = true; });

    const auto &r2 = get(second);
    ASSERT_TRUE(r2.is_ok());
    EXPECT_EQ(r2.content()["name"], "second");
    ASSERT_TRUE(second_done.load());

    first_gate.open();
    const auto &r1 = get(first);
    ASSERT_TRUE(r1.is_error());
    EXPECT_EQ(r1.error().kind, SyncErrorKind::SyncConflict);
    EXPECT_EQ(sched.stats().stale_discards, 1u);
}

TEST_F(SyncTaskSchedulerTest, InOrderResponsesBothApply)
{
    transport_->set_handler([](const HttpRequest &req) { return http(200, req.body); });
    SyncTaskScheduler sched(transport_, auth_, {}, fast_config());
    EXPECT_TRUE(get(sched.submit(update_task("p1", sched.next_mutation_seq(), {{"v", 1}})))
                    .is_ok());
    EXPECT_TRUE(get(sched.submit(update_task("p1", sched.next_mutation_seq(), {{"v", 2}})))
                    .is_ok());
    // A different id has its own ordering.
    EXPECT_TRUE(get(sched.submit(update_task("p2", 1, {{"v", 3}}))).is_ok());
    EXPECT_EQ(sched.stats().stale_discards, 0u);
}

TEST_F(SyncTaskSchedulerTest, MutationSeqStrictlyIncreasing)
{
    SyncTaskScheduler sched(transport_, auth_, {}, fast_config());
    uint64_t last = 0;
    for (int i = 0; i < 100; ++i)
    {
        const uint64_t seq = sched.next_mutation_seq();
        EXPECT_GT(seq, last);
        last = seq;
    }
}

// ============================================================================
// Shutdown
// ============================================================================

TEST_F(SyncTaskSchedulerTest, ShutdownFailsUnfinishedTasks)
{
    SyncTaskScheduler sched(transport_, auth_, {}, fast_config());
    SyncTask later;
    later.kind = TaskKind::Fetch;
    later.entity_type = "projects";
    later.next_attempt_at = std::chrono::steady_clock::now() + 10s;
    auto f = sched.submit(later);
    EXPECT_EQ(sched.pending(), 1u);

    sched.shutdown();
    const auto &r = get(f);
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error().kind, SyncErrorKind::NetworkError);
    EXPECT_EQ(r.error().message, "scheduler stopped");
    EXPECT_EQ(sched.pending(), 0u);
    EXPECT_EQ(transport_->total(), 0u);

    const auto &after = get(sched.fetch("clients"));
    ASSERT_TRUE(after.is_error());
    EXPECT_EQ(after.error().kind, SyncErrorKind::NetworkError);

    sched.shutdown();
}

TEST_F(SyncTaskSchedulerTest, ShutdownDuringRetryBackoff)
{
    transport_->set_handler([](const HttpRequest &) { return http(503); });
    auto cfg = fast_config();
    cfg.read_policy = {{5s, 5s}, 5};
    SyncTaskScheduler sched(transport_, auth_, {}, cfg);
    auto f = sched.fetch("projects");
    ASSERT_TRUE(wait_until([&] { return transport_->total() == 1; }));

    const auto start = std::chrono::steady_clock::now();
    sched.shutdown();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
    const auto &r = get(f);
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error().kind, SyncErrorKind::NetworkError);
}

TEST_F(SyncTaskSchedulerTest, DestructorSettlesFutures)
{
    SyncTaskScheduler::ResultFuture f;
    {
        SyncTaskScheduler sched(transport_, auth_, {}, fast_config());
        SyncTask later;
        later.kind = TaskKind::Fetch;
        later.entity_type = "projects";
        later.next_attempt_at = std::chrono::steady_clock::now() + 10s;
        f = sched.submit(later);
    }
    ASSERT_EQ(f.wait_for(0s), std::future_status::ready);
    EXPECT_TRUE(f.get().is_error());
}

TEST_F(SyncTaskSchedulerTest, ErrorNames)
{
    EXPECT_STREQ(to_string(SyncErrorKind::SyncConflict), "SyncConflict");
    EXPECT_STREQ(to_string(TaskKind::Delete), "Delete");
    EXPECT_TRUE(is_write(TaskKind::Create));
    EXPECT_FALSE(is_write(TaskKind::Fetch));
}
