/**
 * @file test_entity_models.cpp
 * @brief Layer 3 tests for the entity models and TypedCache.
 */
#include "fake_transport.h"
#include "sd_sync.hpp"
#include "shared_test_helpers.h"
#include "test_patterns.h"

#include <gtest/gtest.h>

#include <memory>
#include <mutex>
#include <vector>

using namespace syncdesk::sync;
using namespace syncdesk::tests::helper;
using namespace std::chrono_literals;
using nlohmann::json;

// ============================================================================
// Conversion
// ============================================================================

TEST(EntityModelsTest, ProjectFromServerJson)
{
    const auto p = json{{"id", 12},
                        {"name", "Website"},
                        {"color", "#ff0000"},
                        {"client_id", nullptr},
                        {"organization_id", "org-1"},
                        {"is_active", false},
                        {"created_at", "2024-01-01T00:00:00Z"}}
                       .get<Project>();
    EXPECT_EQ(p.id, "12") << "numeric ids are kept as decimal strings";
    EXPECT_EQ(p.name, "Website");
    EXPECT_EQ(p.description, "");
    EXPECT_EQ(p.color, "#ff0000");
    EXPECT_EQ(p.client_id, "");
    EXPECT_EQ(p.organization_id, "org-1");
    EXPECT_FALSE(p.is_active);
}

TEST(EntityModelsTest, MissingMembersKeepDefaults)
{
    const auto s = json::object().get<Settings>();
    EXPECT_EQ(s.screenshot_interval, 600);
    EXPECT_EQ(s.idle_timeout, 300);
    EXPECT_EQ(s.theme, "system");
    EXPECT_TRUE(s.notifications_enabled);

    const auto t = json{{"id", "t1"}, {"duration", nullptr}}.get<TimeEntry>();
    EXPECT_EQ(t.duration, 0);
    EXPECT_FALSE(t.is_active);
}

TEST(EntityModelsTest, WrongTypeThrows)
{
    EXPECT_THROW((json{{"name", 42}}.get<Project>()), json::type_error);
    EXPECT_THROW((json{{"duration", "long"}}.get<TimeEntry>()), json::type_error);
    EXPECT_THROW(json::array().get<Client>(), json::type_error);
    EXPECT_THROW(json("screenshot").get<Screenshot>(), json::type_error);
}

TEST(EntityModelsTest, EmptyReferencesGoOutAsNull)
{
    TimeEntry t;
    t.project_id = "p1";
    t.description = "Design review";
    t.start_time = "2024-03-15T09:00:00Z";
    const json j = t;
    EXPECT_TRUE(j["id"].is_null());
    EXPECT_EQ(j["project_id"], "p1");
    EXPECT_TRUE(j["task_id"].is_null());
    EXPECT_EQ(j["start_time"], "2024-03-15T09:00:00Z");
    EXPECT_TRUE(j["end_time"].is_null());
    EXPECT_EQ(j["duration"], 0);

    const auto back = j.get<TimeEntry>();
    EXPECT_EQ(back.project_id, "p1");
    EXPECT_EQ(back.start_time, t.start_time);
    EXPECT_TRUE(back.end_time.empty());
}

TEST(EntityModelsTest, OtherModels)
{
    const auto c = json{{"id", "c1"}, {"name", "Acme"}, {"email", "ops@acme.test"}}.get<Client>();
    EXPECT_EQ(c.email, "ops@acme.test");
    EXPECT_TRUE(c.organization_id.empty());

    const auto sc = json{{"id", 5}, {"time_entry_id", 9}, {"captured_at", "2024-03-15T10:00:00Z"}}
                        .get<Screenshot>();
    EXPECT_EQ(sc.id, "5");
    EXPECT_EQ(sc.time_entry_id, "9");

    const auto o = json{{"id", "o1"}, {"name", "Team"}, {"slug", "team"}, {"role", "owner"}}
                       .get<Organization>();
    EXPECT_EQ(o.role, "owner");
    const json oj = o;
    EXPECT_EQ(oj["slug"], "team");

    Settings s;
    s.theme = "dark";
    const json sj = s;
    EXPECT_FALSE(sj.contains("id"));
    EXPECT_EQ(sj["theme"], "dark");
}

TEST(EntityModelsTest, RunningTimeEntryFromCurrentEndpoint)
{
    EXPECT_FALSE(running_time_entry(json{{"active", false}}).has_value());

    const auto running = running_time_entry(
        json{{"active", true},
             {"time_entry",
              json{{"id", "te-4"}, {"project_id", "p1"}, {"start_time", "2024-03-15T09:00:00"}}}});
    ASSERT_TRUE(running.has_value());
    EXPECT_EQ(running->id, "te-4");
    EXPECT_EQ(running->start_time, "2024-03-15T09:00:00");

    EXPECT_THROW(running_time_entry(json{{"active", true}}), json::out_of_range);
    EXPECT_THROW((running_time_entry(json{{"active", true}, {"time_entry", "te-4"}})),
                 json::type_error);
    EXPECT_THROW(running_time_entry(json::array()), json::type_error);
}

TEST(EntityModelsTest, EntityTypesMatchCatalogueRoutes)
{
    const EndpointCatalog catalog;
    for (const char *type : {Project::kEntityType, Client::kEntityType, TimeEntry::kEntityType,
                             Screenshot::kEntityType, Settings::kEntityType,
                             Organization::kEntityType})
        EXPECT_TRUE(catalog.route(type).has_value()) << type;
    EXPECT_TRUE(catalog.route(Settings::kEntityType)->singleton);
    EXPECT_EQ(catalog.route(Project::kEntityType)->entity_key, "project");
    EXPECT_EQ(catalog.route(TimeEntry::kEntityType)->entity_key, "time_entry");
}

// ============================================================================
// TypedCache
// ============================================================================

class TypedCacheTest : public syncdesk::tests::PureApiTest
{
  protected:
    void SetUp() override
    {
        auth_->set_token("tok");
        SchedulerConfig cfg;
        cfg.read_policy = {{10ms, 20ms}, 1};
        cfg.write_policy = {{10ms, 20ms}, 1};
        scheduler_ = std::make_shared<SyncTaskScheduler>(transport_, auth_, EndpointCatalog{}, cfg);
        registry_ = std::make_unique<CacheRegistry>(scheduler_, channel_);
    }

    void TearDown() override { registry_.reset(); }

    std::shared_ptr<FakeTransport> transport_ = std::make_shared<FakeTransport>();
    std::shared_ptr<AuthSession> auth_ = std::make_shared<AuthSession>(10s);
    std::shared_ptr<SyncTaskScheduler> scheduler_;
    std::shared_ptr<InProcessCacheChannel> channel_ = std::make_shared<InProcessCacheChannel>();
    std::unique_ptr<CacheRegistry> registry_;
};

TEST_F(TypedCacheTest, FetchConvertsAndSkipsBadItems)
{
    transport_->set_handler(
        [](const HttpRequest &)
        {
            return http(200, json::array({json{{"id", "p1"}, {"name", "A"}},
                                          json{{"id", "p2"}, {"name", 7}},
                                          json{{"id", "p3"}, {"name", "C"}}}));
        });
    TypedCache<Project> projects(*registry_);
    EXPECT_EQ(projects.entity_type(), "projects");

    auto result = projects.fetch().get();
    ASSERT_TRUE(result.is_ok()) << result.error().describe();
    const auto &list = result.content();
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0].name, "A");
    EXPECT_EQ(list[1].id, "p3");

    EXPECT_EQ(registry_->snapshot("projects").size(), 3u) << "the JSON snapshot keeps every item";
    EXPECT_EQ(projects.snapshot().size(), 2u);
}

TEST_F(TypedCacheTest, FetchErrorPassesThrough)
{
    transport_->set_handler([](const HttpRequest &) { return http(404); });
    TypedCache<Client> clients(*registry_);
    auto result = clients.fetch().get();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error_code(), 404);
}

TEST_F(TypedCacheTest, CreateUpdateRemove)
{
    transport_->set_handler(
        [](const HttpRequest &req)
        {
            if (req.method == HttpMethod::Post)
            {
                json body = req.body;
                body["id"] = 101;
                return http(201, body);
            }
            if (req.method == HttpMethod::Put)
                return http(200, req.body);
            return http(204);
        });
    TypedCache<Project> projects(*registry_);

    Project p;
    p.name = "New";
    auto created = projects.create(p);
    EXPECT_EQ(created.optimistic.name, "New");
    EXPECT_EQ(created.optimistic.id.rfind("local-", 0), 0u);
    auto made = created.remote.get();
    ASSERT_TRUE(made.is_ok()) << made.error().describe();
    EXPECT_EQ(made.content().id, "101");

    const auto post = transport_->calls().at(0).request;
    EXPECT_FALSE(post.body.contains("id"));

    Project renamed = made.content();
    renamed.name = "Renamed";
    auto updated = projects.update(renamed);
    EXPECT_EQ(updated.optimistic.name, "Renamed");
    ASSERT_TRUE(updated.remote.get().is_ok());
    EXPECT_EQ(transport_->count("PUT /projects/101"), 1u);

    ASSERT_EQ(projects.snapshot().size(), 1u);
    EXPECT_EQ(projects.snapshot()[0].name, "Renamed");

    auto removed = projects.remove("101");
    EXPECT_EQ(removed.optimistic.id, "101");
    EXPECT_TRUE(projects.snapshot().empty());
    ASSERT_TRUE(removed.remote.get().is_ok());
    EXPECT_EQ(transport_->count("DELETE /projects/101"), 1u);
}

TEST_F(TypedCacheTest, UnconvertibleResponseIsValidationError)
{
    transport_->set_handler([](const HttpRequest &) { return http(201, json{{"id", "x"}, {"name", 5}}); });
    TypedCache<Client> clients(*registry_);
    Client c;
    c.name = "Acme";
    auto m = clients.create(c);
    auto r = m.remote.get();
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error().kind, SyncErrorKind::ValidationError);
}

TEST_F(TypedCacheTest, SubscribersReceiveTypedSnapshots)
{
    transport_->set_handler([](const HttpRequest &)
                            { return http(200, json::array({json{{"id", "o1"}, {"name", "Team"}}})); });
    TypedCache<Organization> orgs(*registry_);
    std::mutex mutex;
    std::vector<std::vector<Organization>> seen;
    const auto id = orgs.subscribe(
        [&](const std::vector<Organization> &snap)
        {
            std::lock_guard<std::mutex> lock(mutex);
            seen.push_back(snap);
        });

    ASSERT_TRUE(orgs.fetch().get().is_ok());
    {
        std::lock_guard<std::mutex> lock(mutex);
        ASSERT_EQ(seen.size(), 1u);
        ASSERT_EQ(seen[0].size(), 1u);
        EXPECT_EQ(seen[0][0].name, "Team");
    }

    orgs.unsubscribe(id);
    ASSERT_TRUE(orgs.fetch(/*force=*/true).get().is_ok());
    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(seen.size(), 1u);
}

TEST_F(TypedCacheTest, SingletonSettings)
{
    transport_->set_handler(
        [](const HttpRequest &req)
        {
            if (req.method == HttpMethod::Get)
                return http(200, json{{"screenshot_interval", 300}, {"theme", "dark"}});
            return http(200, req.body);
        });
    TypedCache<Settings> settings(*registry_);
    auto fetched = settings.fetch().get();
    ASSERT_TRUE(fetched.is_ok());
    ASSERT_EQ(fetched.content().size(), 1u);
    EXPECT_EQ(fetched.content()[0].screenshot_interval, 300);
    EXPECT_EQ(fetched.content()[0].idle_timeout, 300);

    Settings s = fetched.content()[0];
    s.notifications_enabled = false;
    auto m = settings.update(s);
    EXPECT_FALSE(m.optimistic.notifications_enabled);
    ASSERT_TRUE(m.remote.get().is_ok());
    EXPECT_FALSE(settings.snapshot().at(0).notifications_enabled);
}
