/**
 * @file test_auth_session.cpp
 * @brief Layer 3 tests for the AuthSession refresh decisions.
 */
#include "sd_sync.hpp"
#include "test_patterns.h"

#include <gtest/gtest.h>

#include <stdexcept>
#include <thread>

using namespace syncdesk::sync;
using namespace std::chrono_literals;
using Decision = AuthSession::Decision;

class AuthSessionTest : public syncdesk::tests::PureApiTest
{
};

TEST_F(AuthSessionTest, TokenChangesBumpGeneration)
{
    AuthSession auth;
    EXPECT_FALSE(auth.has_token());
    const auto g0 = auth.generation();
    auth.set_token("t1");
    EXPECT_EQ(auth.token(), "t1");
    EXPECT_GT(auth.generation(), g0);

    const auto g1 = auth.generation();
    auth.clear_token();
    EXPECT_FALSE(auth.has_token());
    EXPECT_GT(auth.generation(), g1);

    const auto g2 = auth.generation();
    auth.clear_token();
    EXPECT_EQ(auth.generation(), g2);
}

TEST_F(AuthSessionTest, FirstUnauthorizedStartsRefreshOthersWait)
{
    AuthSession auth(10s);
    auth.set_token("t1");
    const auto sent = auth.generation();

    EXPECT_EQ(auth.on_unauthorized(sent, false), Decision::StartRefresh);
    EXPECT_TRUE(auth.refresh_in_progress());
    EXPECT_EQ(auth.on_unauthorized(sent, false), Decision::WaitForRefresh);
    EXPECT_EQ(auth.on_unauthorized(sent, false), Decision::WaitForRefresh);

    EXPECT_TRUE(auth.complete_refresh(std::string("t2")));
    EXPECT_FALSE(auth.refresh_in_progress());
    EXPECT_EQ(auth.token(), "t2");

    // Requests sent with the old token replay with the new one.
    EXPECT_EQ(auth.on_unauthorized(sent, false), Decision::ReplayNow);
}

TEST_F(AuthSessionTest, ReplayedRequestThatFailsAgainExpires)
{
    AuthSession auth;
    auth.set_token("t1");
    EXPECT_EQ(auth.on_unauthorized(auth.generation(), true), Decision::Expired);
    EXPECT_FALSE(auth.refresh_in_progress());
}

TEST_F(AuthSessionTest, NoTokenExpires)
{
    AuthSession auth;
    EXPECT_EQ(auth.on_unauthorized(auth.generation(), false), Decision::Expired);
}

TEST_F(AuthSessionTest, CooldownBlocksSecondRefresh)
{
    AuthSession auth(10s);
    auth.set_token("t1");
    ASSERT_EQ(auth.on_unauthorized(auth.generation(), false), Decision::StartRefresh);
    ASSERT_TRUE(auth.complete_refresh(std::string("t2")));

    // The new token is rejected too, inside the cooldown.
    EXPECT_EQ(auth.on_unauthorized(auth.generation(), false), Decision::Expired);
    EXPECT_TRUE(auth.has_token());
}

TEST_F(AuthSessionTest, RefreshAllowedAgainAfterCooldown)
{
    AuthSession auth(50ms);
    auth.set_token("t1");
    ASSERT_EQ(auth.on_unauthorized(auth.generation(), false), Decision::StartRefresh);
    ASSERT_TRUE(auth.complete_refresh(std::string("t2")));
    std::this_thread::sleep_for(80ms);
    EXPECT_EQ(auth.on_unauthorized(auth.generation(), false), Decision::StartRefresh);
}

TEST_F(AuthSessionTest, FailedRefreshClearsToken)
{
    AuthSession auth;
    auth.set_token("t1");
    ASSERT_EQ(auth.on_unauthorized(auth.generation(), false), Decision::StartRefresh);
    EXPECT_FALSE(auth.complete_refresh(std::nullopt));
    EXPECT_FALSE(auth.has_token());
    EXPECT_FALSE(auth.refresh_in_progress());

    AuthSession empty_token;
    empty_token.set_token("t1");
    ASSERT_EQ(empty_token.on_unauthorized(empty_token.generation(), false),
              Decision::StartRefresh);
    EXPECT_FALSE(empty_token.complete_refresh(std::string()));
    EXPECT_FALSE(empty_token.has_token());
}

TEST_F(AuthSessionTest, ExpiryCallback)
{
    AuthSession auth;
    auth.notify_expired();

    int calls = 0;
    auth.set_on_expired([&] { ++calls; });
    auth.notify_expired();
    EXPECT_EQ(calls, 1);

    auth.set_on_expired([] { throw std::runtime_error("window closed"); });
    auth.notify_expired();
}

TEST_F(AuthSessionTest, RefreshRequestCarriesToken)
{
    const auto req = AuthSession::make_refresh_request("tok");
    EXPECT_EQ(req.method, HttpMethod::Post);
    EXPECT_EQ(req.path, "/auth/refresh");
    EXPECT_EQ(req.bearer_token, "tok");
}

TEST_F(AuthSessionTest, ParseRefreshResponseShapes)
{
    HttpResponse nested;
    nested.status = 200;
    nested.body = {{"data", {{"session", {{"access_token", "n1"}}}}}};
    EXPECT_EQ(AuthSession::parse_refresh_response(nested), "n1");

    HttpResponse session;
    session.status = 200;
    session.body = {{"session", {{"access_token", "s1"}}}};
    EXPECT_EQ(AuthSession::parse_refresh_response(session), "s1");

    HttpResponse top;
    top.status = 200;
    top.body = {{"access_token", "t1"}, {"token_type", "bearer"}};
    EXPECT_EQ(AuthSession::parse_refresh_response(top), "t1");

    HttpResponse rejected = top;
    rejected.status = 401;
    EXPECT_FALSE(AuthSession::parse_refresh_response(rejected));

    HttpResponse wrong_type;
    wrong_type.status = 200;
    wrong_type.body = {{"access_token", 17}};
    EXPECT_FALSE(AuthSession::parse_refresh_response(wrong_type));

    HttpResponse not_object;
    not_object.status = 200;
    not_object.body = "ok";
    EXPECT_FALSE(AuthSession::parse_refresh_response(not_object));
}

TEST_F(AuthSessionTest, DecisionNames)
{
    EXPECT_STREQ(to_string(Decision::WaitForRefresh), "WaitForRefresh");
    EXPECT_STREQ(to_string(Decision::StartRefresh), "StartRefresh");
}
