#include <utility>
#include <boost/asio/detached.hpp>
#include <gtest/gtest.h>
#include <thread>
#include "../../src/core/logger/logger.hpp"
#include "../../src/engine/robots/robots_gate.hpp"
#include "test_support.hpp"

using namespace Trawl;
using namespace Trawl::Engine;
using namespace TrawlTest;
using Network::Http::ErrorType;

class RobotsGateTest : public ::testing::Test {
protected:
    void SetUp() override {
        Core::Logger::set_level(Core::LOG_NONE);
        client = std::make_shared<MockHttpClient>();
        gate   = std::make_shared<RobotsGate>(client, std::chrono::milliseconds(1000));
    }

    void TearDown() override {
        Core::Logger::set_level(Core::LOG_ALL);
    }

    bool allowed(const std::string& url) {
        return run_sync(gate->is_allowed(url, Core::Constants::USER_AGENT));
    }

    std::shared_ptr<MockHttpClient> client;
    std::shared_ptr<RobotsGate>     gate;
};

TEST_F(RobotsGateTest, AppliesRules) {
    client->set("http://a.test/robots.txt",
                status_response(200, "User-agent: *\nDisallow: /private\n"));

    EXPECT_TRUE(allowed("http://a.test/public"));
    EXPECT_FALSE(allowed("http://a.test/private/page"));
    EXPECT_EQ(gate->fetch_count(), 1u);
    EXPECT_EQ(client->calls("http://a.test/robots.txt"), 1);
}

TEST_F(RobotsGateTest, CachedPerOrigin) {
    client->set("http://a.test/robots.txt", status_response(200, "User-agent: *\nDisallow: /x\n"));
    client->set("http://b.test/robots.txt", status_response(200, "User-agent: *\nDisallow: /y\n"));

    EXPECT_FALSE(allowed("http://a.test/x"));
    EXPECT_TRUE(allowed("http://a.test/y"));
    EXPECT_TRUE(allowed("http://b.test/x"));
    EXPECT_FALSE(allowed("http://b.test/y"));
    EXPECT_FALSE(allowed("http://A.test:80/x"));

    EXPECT_EQ(gate->fetch_count(), 2u);
    EXPECT_EQ(gate->cached_origins().size(), 2u);
}

TEST_F(RobotsGateTest, SingleFlightUnderConcurrency) {
    client->set("http://a.test/robots.txt", status_response(200, "User-agent: *\nDisallow: /no\n"));
    client->set_latency(std::chrono::milliseconds(50));

    boost::asio::io_context ioc;
    int                     allowed_count = 0;
    int                     blocked_count = 0;
    for (int i = 0; i < 10; ++i) {
        std::string url = (i % 2 == 0) ? "http://a.test/yes" + std::to_string(i)
                                       : "http://a.test/no" + std::to_string(i);
        boost::asio::co_spawn(
            ioc,
            [this, url, &allowed_count, &blocked_count]() -> boost::asio::awaitable<void> {
                if (co_await gate->is_allowed(url, Core::Constants::USER_AGENT))
                    ++allowed_count;
                else
                    ++blocked_count;
            },
            boost::asio::detached);
    }
    ioc.run();

    EXPECT_EQ(client->calls("http://a.test/robots.txt"), 1);
    EXPECT_EQ(gate->fetch_count(), 1u);
    EXPECT_EQ(allowed_count, 5);
    EXPECT_EQ(blocked_count, 5);
}

TEST_F(RobotsGateTest, FailsOpenOnNetworkError) {
    client->set("http://a.test/robots.txt", error_response(ErrorType::Network, "connection refused"));
    EXPECT_TRUE(allowed("http://a.test/anything"));
}

TEST_F(RobotsGateTest, FailsOpenOnTimeout) {
    client->set("http://a.test/robots.txt", error_response(ErrorType::Timeout, "timeout"));
    EXPECT_TRUE(allowed("http://a.test/anything"));
}

TEST_F(RobotsGateTest, FailsOpenOnServerError) {
    client->set("http://a.test/robots.txt", status_response(503, "User-agent: *\nDisallow: /\n"));
    EXPECT_TRUE(allowed("http://a.test/anything"));
}

TEST_F(RobotsGateTest, MissingRobotsMeansNoRules) {
    // Unset URLs answer 404.
    EXPECT_TRUE(allowed("http://a.test/anything"));
    EXPECT_EQ(gate->fetch_count(), 1u);
}

TEST_F(RobotsGateTest, RobotsFileItselfNeverBlocked) {
    client->set("http://a.test/robots.txt", status_response(200, "User-agent: *\nDisallow: /\n"));
    EXPECT_TRUE(allowed("http://a.test/robots.txt"));
    EXPECT_EQ(client->total_calls(), 0);
    EXPECT_FALSE(allowed("http://a.test/page"));
}

TEST_F(RobotsGateTest, CrawlDelay) {
    client->set("http://a.test/robots.txt",
                status_response(200, "User-agent: *\nCrawl-delay: 2\nDisallow: /x\n"));
    double delay = run_sync(gate->crawl_delay("http://a.test/page", Core::Constants::USER_AGENT));
    EXPECT_DOUBLE_EQ(delay, 2.0);
    EXPECT_EQ(gate->fetch_count(), 1u);
}

TEST_F(RobotsGateTest, UsesConfiguredUserAgentAndTimeout) {
    run_sync(gate->is_allowed("http://a.test/", "CustomBot/3.1"));
    EXPECT_EQ(client->last_options().user_agent, "CustomBot/3.1");
    EXPECT_EQ(client->last_options().timeout, std::chrono::milliseconds(1000));
}

TEST_F(RobotsGateTest, RefetchesOnlyAfterTtlExpires) {
    gate = std::make_shared<RobotsGate>(client, std::chrono::milliseconds(1000), std::chrono::seconds(1));
    client->set("http://a.test/robots.txt", status_response(200, "User-agent: *\nDisallow: /old\n"));

    EXPECT_FALSE(allowed("http://a.test/old"));
    client->set("http://a.test/robots.txt", status_response(200, "User-agent: *\nDisallow: /new\n"));
    EXPECT_FALSE(allowed("http://a.test/old"));
    EXPECT_TRUE(allowed("http://a.test/new"));
    EXPECT_EQ(client->calls("http://a.test/robots.txt"), 1);

    std::this_thread::sleep_for(std::chrono::milliseconds(1100));
    EXPECT_TRUE(allowed("http://a.test/old"));
    EXPECT_FALSE(allowed("http://a.test/new"));
    EXPECT_EQ(client->calls("http://a.test/robots.txt"), 2);
    EXPECT_EQ(gate->fetch_count(), 2u);
}

TEST_F(RobotsGateTest, NonUtf8RobotsFileStillParses) {
    client->set("http://a.test/robots.txt",
                status_response(200, "# caf\xE9 \xFF\nUser-agent: *\nDisallow: /private\n"));
    EXPECT_FALSE(allowed("http://a.test/private"));
    EXPECT_TRUE(allowed("http://a.test/public"));
}
