/**
 * @file test_remote_endpoints.cpp
 * @brief Layer 3 tests for EndpointCatalog, the named endpoints and CurlTransport.
 */
#include "sd_sync.hpp"
#include "test_patterns.h"

#include <gtest/gtest.h>

using namespace syncdesk::sync;
using namespace std::chrono_literals;
using nlohmann::json;

class EndpointCatalogTest : public syncdesk::tests::PureApiTest
{
  protected:
    EndpointCatalog catalog_;
};

TEST_F(EndpointCatalogTest, DefaultRoutes)
{
    const std::pair<const char *, const char *> expected[] = {
        {"projects", "/projects"},         {"clients", "/clients"},
        {"time_entries", "/time-entries"}, {"screenshots", "/screenshots"},
        {"organizations", "/organizations"}, {"settings", "/settings"},
        {"tasks", "/tasks"}};
    for (const auto &[type, path] : expected)
    {
        const auto r = catalog_.route(type);
        ASSERT_TRUE(r.has_value()) << type;
        EXPECT_EQ(r->path, path);
        EXPECT_EQ(r->singleton, std::string(type) == "settings") << type;
    }
    EXPECT_FALSE(catalog_.route("invoices").has_value());
}

TEST_F(EndpointCatalogTest, CollectionCrud)
{
    const json body = {{"name", "Website"}};

    auto fetch = catalog_.request_for(TaskKind::Fetch, "projects");
    ASSERT_TRUE(fetch);
    EXPECT_EQ(fetch->method, HttpMethod::Get);
    EXPECT_EQ(fetch->path, "/projects");
    EXPECT_TRUE(fetch->body.is_null());

    auto create = catalog_.request_for(TaskKind::Create, "projects", "tmp-1", body);
    ASSERT_TRUE(create);
    EXPECT_EQ(create->method, HttpMethod::Post);
    EXPECT_EQ(create->path, "/projects");
    EXPECT_EQ(create->body, body);

    auto update = catalog_.request_for(TaskKind::Update, "time_entries", "42", body);
    ASSERT_TRUE(update);
    EXPECT_EQ(update->method, HttpMethod::Put);
    EXPECT_EQ(update->path, "/time-entries/42");
    EXPECT_EQ(update->body, body);

    auto del = catalog_.request_for(TaskKind::Delete, "clients", "c9");
    ASSERT_TRUE(del);
    EXPECT_EQ(del->method, HttpMethod::Delete);
    EXPECT_EQ(del->path, "/clients/c9");
}

TEST_F(EndpointCatalogTest, UpdateAndDeleteNeedAnId)
{
    EXPECT_FALSE(catalog_.request_for(TaskKind::Update, "projects", "", json::object()));
    EXPECT_FALSE(catalog_.request_for(TaskKind::Delete, "projects"));
    EXPECT_FALSE(catalog_.request_for(TaskKind::Fetch, "unknown"));
}

TEST_F(EndpointCatalogTest, SingletonSettings)
{
    auto fetch = catalog_.request_for(TaskKind::Fetch, "settings");
    ASSERT_TRUE(fetch);
    EXPECT_EQ(fetch->method, HttpMethod::Get);
    EXPECT_EQ(fetch->path, "/settings");

    auto update = catalog_.request_for(TaskKind::Update, "settings", "", {{"theme", "dark"}});
    ASSERT_TRUE(update);
    EXPECT_EQ(update->method, HttpMethod::Put);
    EXPECT_EQ(update->path, "/settings");

    EXPECT_FALSE(catalog_.request_for(TaskKind::Create, "settings", "", json::object()));
    EXPECT_FALSE(catalog_.request_for(TaskKind::Delete, "settings", "x"));
}

TEST_F(EndpointCatalogTest, CustomRouteTrailingSlashTrimmed)
{
    catalog_.set_route("invoices", "/billing/invoices/");
    auto r = catalog_.request_for(TaskKind::Delete, "invoices", "7");
    ASSERT_TRUE(r);
    EXPECT_EQ(r->path, "/billing/invoices/7");

    catalog_.set_route("projects", "/v2/projects");
    EXPECT_EQ(catalog_.route("projects")->path, "/v2/projects");
}

TEST(NamedEndpointsTest, AuthFamily)
{
    const auto login = endpoints::login("a@example.com", "pw");
    EXPECT_EQ(login.method, HttpMethod::Post);
    EXPECT_EQ(login.path, "/auth/login");
    EXPECT_EQ(login.body["email"], "a@example.com");
    EXPECT_EQ(endpoints::refresh().path, "/auth/refresh");
    EXPECT_EQ(endpoints::logout().method, HttpMethod::Post);
    EXPECT_EQ(endpoints::current_user().method, HttpMethod::Get);
}

TEST(NamedEndpointsTest, TimeEntryFamily)
{
    const auto start = endpoints::start_time_entry("p1");
    EXPECT_EQ(start.method, HttpMethod::Post);
    EXPECT_EQ(start.path, "/time-entries/start");
    EXPECT_EQ(start.body["project_id"], "p1");
    EXPECT_TRUE(start.body["task_id"].is_null());
    EXPECT_TRUE(start.body["description"].is_null());

    const auto with_task = endpoints::start_time_entry("p1", "t2", "review");
    EXPECT_EQ(with_task.body["task_id"], "t2");
    EXPECT_EQ(with_task.body["description"], "review");

    EXPECT_EQ(endpoints::stop_time_entry().path, "/time-entries/stop");
    EXPECT_TRUE(endpoints::stop_time_entry().body.is_object());
    EXPECT_EQ(endpoints::current_time_entry().path, "/time-entries/current");

    const auto list = endpoints::list_time_entries(20, 40);
    EXPECT_EQ(list.route_key(), "GET /time-entries?limit=20&offset=40");
}

TEST(NamedEndpointsTest, ScreenshotSyncAndOrganizationFamilies)
{
    EXPECT_EQ(endpoints::capture_screenshot("te1").body["time_entry_id"], "te1");
    EXPECT_EQ(endpoints::list_screenshots(10, 0, "te1").query.at("time_entry_id"), "te1");
    EXPECT_EQ(endpoints::screenshot_image("s1").path, "/screenshots/s1/image");
    EXPECT_EQ(endpoints::screenshot_thumbnail("s1").path, "/screenshots/s1/thumbnail");

    EXPECT_EQ(endpoints::get_settings().route_key(), "GET /settings");
    EXPECT_EQ(endpoints::put_profile({{"name", "A"}}).route_key(), "PUT /profile");
    EXPECT_EQ(endpoints::sync_status().route_key(), "GET /sync/status");
    EXPECT_EQ(endpoints::trigger_sync().method, HttpMethod::Post);

    EXPECT_EQ(endpoints::organization_members("o1").path, "/organizations/o1/members");
    EXPECT_EQ(endpoints::remove_organization_member("o1", "u2").route_key(),
              "DELETE /organizations/o1/members/u2");
    EXPECT_EQ(endpoints::invite_to_organization("o1", {{"email", "b@example.com"}}).path,
              "/organizations/o1/invitations");
}

TEST(HttpRequestTest, RouteKeyIncludesSortedQuery)
{
    HttpRequest r;
    r.path = "/projects";
    r.query = {{"b", "2"}, {"a", "1"}};
    EXPECT_EQ(r.route_key(), "GET /projects?a=1&b=2");
    r.body = {{"ignored", true}};
    EXPECT_EQ(r.route_key(), "GET /projects?a=1&b=2");
}

TEST(HttpResponseTest, StatusClasses)
{
    HttpResponse r;
    EXPECT_TRUE(r.transport_failed());
    EXPECT_FALSE(r.ok());
    r.status = 204;
    EXPECT_TRUE(r.ok());
    r.status = 301;
    EXPECT_FALSE(r.ok());
    EXPECT_FALSE(r.transport_failed());
}

TEST(CurlTransportTest, BuildUrl)
{
    HttpRequest r;
    r.path = "/screenshots";
    r.query = {{"limit", "10"}, {"q", "a b&c"}};
    EXPECT_EQ(CurlTransport::build_url("http://localhost:8000", r),
              "http://localhost:8000/screenshots?limit=10&q=a%20b%26c");

    HttpRequest bare;
    bare.path = "settings";
    EXPECT_EQ(CurlTransport::build_url("http://h", bare), "http://h/settings");
}

TEST(CurlTransportTest, BaseUrlTrailingSlashTrimmed)
{
    CurlTransport t("http://localhost:8000///");
    EXPECT_EQ(t.base_url(), "http://localhost:8000");
}

TEST(CurlTransportTest, UnreachableServerIsTransportFailure)
{
    // Port 1 on loopback: connection refused without touching the network.
    CurlTransport t("http://127.0.0.1:1", 2000ms);
    const auto resp = t.send(endpoints::sync_status());
    EXPECT_EQ(resp.status, 0);
    EXPECT_TRUE(resp.transport_failed());
    EXPECT_FALSE(resp.error.empty());
}
