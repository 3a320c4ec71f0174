#include <gtest/gtest.h>
#include "../../src/codec/json_codec.hpp"
#include "../../src/core/errors/errors.hpp"

using namespace Trawl;
using namespace Trawl::Engine;
using namespace Trawl::Codec;
using nlohmann::json;

TEST(JsonCodecTest, TimeFormatting) {
    Timestamp ts = Timestamp(std::chrono::seconds(1714564800)) + std::chrono::milliseconds(7);
    EXPECT_EQ(format_time(ts), "2024-05-01T12:00:00.007Z");
    EXPECT_EQ(parse_time("2024-05-01T12:00:00.007Z"), ts);
    EXPECT_EQ(parse_time("2024-05-01T12:00:00Z"), Timestamp(std::chrono::seconds(1714564800)));
    EXPECT_THROW(parse_time("yesterday"), std::runtime_error);
}

TEST(JsonCodecTest, ScrapeDefaults) {
    auto request = request_from_json(Mode::Scrape, json{{"url", "https://a.test/"}});
    const auto& r = std::get<ScrapeRequest>(request);
    EXPECT_EQ(r.url, "https://a.test/");
    EXPECT_EQ(r.options.format, Format::Markdown);
    EXPECT_FALSE(r.options.use_browser);
    EXPECT_FALSE(r.options.respect_robots.has_value());
}

TEST(JsonCodecTest, ModeDefaultsForBrowser) {
    auto search = request_from_json(Mode::Search, json{{"url", "https://a.test/"}, {"query", "q"}});
    EXPECT_TRUE(std::get<SearchRequest>(search).options.use_browser);
    EXPECT_EQ(std::get<SearchRequest>(search).top_k, 5);

    auto agent = request_from_json(Mode::Agent, json{{"url", "https://a.test/"}, {"instruction", "i"}});
    EXPECT_TRUE(std::get<AgentRequest>(agent).options.use_browser);

    auto map = request_from_json(Mode::Map, json{{"url", "https://a.test/"}});
    EXPECT_EQ(std::get<MapRequest>(map).max_depth, 2);
    EXPECT_EQ(std::get<MapRequest>(map).max_pages, 50);
}

TEST(JsonCodecTest, CrawlBodyFullyParsed) {
    json body = json::parse(R"({
        "urls": ["https://a.test/", "https://b.test/"],
        "format": "text",
        "include_links": true,
        "respect_robots": false,
        "delay_ms": 250,
        "user_agent": "ShopBot/2.0",
        "batch_size": 4,
        "max_depth": 2,
        "max_pages": 30,
        "same_domain": false,
        "max_duration_seconds": 60,
        "scope": [{"type": "deny", "pattern": "/private"}],
        "selectors": [{"name": "price", "selector": ".price"}, {"name": "img", "selector": "img", "attr": "src"}]
    })");

    const auto& r = std::get<CrawlRequest>(request_from_json(Mode::Crawl, body));
    EXPECT_EQ(r.urls.size(), 2u);
    EXPECT_EQ(r.options.format, Format::Text);
    EXPECT_TRUE(r.options.include_links);
    EXPECT_EQ(r.options.respect_robots, std::optional<bool>(false));
    EXPECT_EQ(r.options.delay_ms, 250);
    EXPECT_EQ(r.options.user_agent, "ShopBot/2.0");
    EXPECT_EQ(r.batch_size, 4);
    EXPECT_EQ(r.max_depth, 2);
    EXPECT_EQ(r.max_pages, 30);
    EXPECT_FALSE(r.same_domain);
    EXPECT_EQ(r.max_duration_seconds, 60);
    ASSERT_EQ(r.scope.size(), 1u);
    EXPECT_EQ(r.scope[0].type, ScopeRule::Type::Deny);
    ASSERT_EQ(r.selectors.size(), 2u);
    EXPECT_EQ(r.selectors[1].attr, "src");
}

TEST(JsonCodecTest, CrawlAcceptsSingleUrl) {
    const auto& r = std::get<CrawlRequest>(request_from_json(Mode::Crawl, json{{"url", "https://a.test/"}}));
    EXPECT_EQ(r.urls, std::vector<std::string>{"https://a.test/"});
}

TEST(JsonCodecTest, MalformedBodiesRejected) {
    EXPECT_THROW(request_from_json(Mode::Scrape, json::array()), Core::JobConfigError);
    EXPECT_THROW(request_from_json(Mode::Scrape, json{{"url", 42}}), Core::JobConfigError);
    EXPECT_THROW(request_from_json(Mode::Scrape, json{{"url", "https://a.test/"}, {"format", "pdf"}}),
                 Core::JobConfigError);
    EXPECT_THROW(request_from_json(Mode::Crawl, json{{"urls", {"https://a.test/"}},
                                                     {"scope", {{{"type", "maybe"}, {"pattern", "x"}}}}}),
                 Core::JobConfigError);
    EXPECT_THROW(request_from_json(json{{"url", "https://a.test/"}}), Core::JobConfigError);
    EXPECT_THROW(request_from_json(json{{"mode", "teleport"}}), Core::JobConfigError);
}

TEST(JsonCodecTest, RequestRoundTrip) {
    AgentRequest agent;
    agent.url                    = "https://a.test/p";
    agent.instruction            = "get the price";
    agent.model                  = "some/model";
    agent.options.respect_robots = true;
    agent.options.user_agent     = "AgentBot/1.0";

    json j = to_json(JobRequest(agent));
    EXPECT_EQ(j["mode"], "agent");

    const auto& back = std::get<AgentRequest>(request_from_json(j));
    EXPECT_EQ(back.url, agent.url);
    EXPECT_EQ(back.instruction, agent.instruction);
    EXPECT_EQ(back.model, agent.model);
    EXPECT_EQ(back.options.respect_robots, std::optional<bool>(true));
    EXPECT_EQ(back.options.user_agent, "AgentBot/1.0");
}

TEST(JsonCodecTest, PageJsonShape) {
    PageResult failed;
    failed.url    = "https://x.test/";
    failed.status = FetchStatus::Timeout;
    failed.error  = "timeout";

    json j = to_json(failed);
    EXPECT_EQ(j["status"], "timeout");
    EXPECT_EQ(j["error"], "timeout");
    EXPECT_FALSE(j["success"].get<bool>());
    EXPECT_FALSE(j.contains("content"));
    EXPECT_FALSE(j.contains("metadata"));

    PageResult searched;
    searched.url          = "https://x.test/";
    searched.ranked       = {{"alpha beta", 1.2345}};
    searched.total_chunks = 3;
    j                     = to_json(searched);
    EXPECT_TRUE(j["success"].get<bool>());
    EXPECT_EQ(j["total_chunks"], 3);
    EXPECT_EQ(j["ranked"][0]["text"], "alpha beta");
    EXPECT_TRUE(j.contains("metadata"));
}

TEST(JsonCodecTest, ResultRoundTripKeepsPagesAndCounts) {
    JobResult result;
    result.id         = "abc";
    result.request    = SearchRequest{"https://a.test/", {}, "coroutines", 3};
    result.status     = JobStatus::Failed;
    result.error      = "store failure: disk full";
    result.created_at = Timestamp(std::chrono::seconds(1700000000));
    result.counts     = {1, 1, 0, 0};

    PageResult page;
    page.url          = "https://a.test/";
    page.status_code  = 200;
    page.attempts     = 1;
    page.fetched_at   = result.created_at;
    page.elapsed      = std::chrono::milliseconds(42);
    page.ranked       = {{"first", 2.5}, {"second", 0.75}};
    page.total_chunks = 9;
    page.extracted    = json{{"price", "$10"}};
    result.pages      = {page};

    auto back = result_from_json(to_json(result));
    EXPECT_EQ(back.id, "abc");
    EXPECT_EQ(back.status, JobStatus::Failed);
    EXPECT_EQ(back.error, result.error);
    EXPECT_EQ(back.created_at, result.created_at);
    EXPECT_FALSE(back.completed_at.has_value());
    EXPECT_EQ(std::get<SearchRequest>(back.request).query, "coroutines");
    ASSERT_EQ(back.pages.size(), 1u);
    EXPECT_EQ(back.pages[0].elapsed.count(), 42);
    EXPECT_EQ(back.pages[0].ranked.size(), 2u);
    EXPECT_EQ(back.pages[0].total_chunks, 9u);
    EXPECT_EQ((*back.pages[0].extracted)["price"], "$10");
}

TEST(JsonCodecTest, MalformedRecordThrowsRuntimeError) {
    EXPECT_THROW(result_from_json(json{{"id", "x"}}), std::runtime_error);
    json bad_request = {{"id", "x"},
                        {"request", {{"mode", "nope"}}},
                        {"status", "completed"},
                        {"created_at", "2024-01-01T00:00:00.000Z"},
                        {"counts", {{"attempted", 0}, {"succeeded", 0}, {"failed", 0}, {"skipped_by_robots", 0}}},
                        {"pages", json::array()}};
    EXPECT_THROW(result_from_json(bad_request), std::runtime_error);
}

TEST(JsonCodecTest, SummaryOmitsPages) {
    JobResult result;
    result.id         = "s1";
    result.request    = ScrapeRequest{"https://a.test/", {}};
    result.status     = JobStatus::Running;
    result.created_at = Clock::now();
    result.pages.push_back(PageResult{});

    auto j = summary_json(result);
    EXPECT_EQ(j["mode"], "scrape");
    EXPECT_EQ(j["status"], "running");
    EXPECT_FALSE(j.contains("pages"));
    EXPECT_FALSE(j.contains("completed_at"));
}
