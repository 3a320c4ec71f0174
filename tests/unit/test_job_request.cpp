#include <gtest/gtest.h>
#include "../../src/core/errors/errors.hpp"
#include "../../src/core/logger/logger.hpp"
#include "../../src/engine/request/job_request.hpp"

using namespace Trawl;
using namespace Trawl::Engine;
using Core::JobConfigError;

class JobRequestTest : public ::testing::Test {
protected:
    void SetUp() override {
        Core::Logger::set_level(Core::LOG_NONE);
    }
    void TearDown() override {
        Core::Logger::set_level(Core::LOG_ALL);
    }
};

TEST_F(JobRequestTest, ModeNamesRoundTrip) {
    for (auto mode : {Mode::Scrape, Mode::Crawl, Mode::Map, Mode::Search, Mode::Agent})
        EXPECT_EQ(parse_mode(to_string(mode)), mode);
    EXPECT_EQ(parse_mode("CRAWL"), Mode::Crawl);
    EXPECT_EQ(parse_format("md"), Format::Markdown);
    EXPECT_THROW(parse_mode("spider"), JobConfigError);
    EXPECT_THROW(parse_format("pdf"), JobConfigError);
}

TEST_F(JobRequestTest, UrlsMustBeHttp) {
    JobRequest empty = ScrapeRequest{"", {}};
    EXPECT_THROW(validate(empty, 20), JobConfigError);

    JobRequest ftp = ScrapeRequest{"ftp://a.test/file", {}};
    EXPECT_THROW(validate(ftp, 20), JobConfigError);

    JobRequest ok = ScrapeRequest{"https://a.test/", {}};
    EXPECT_NO_THROW(validate(ok, 20));
}

TEST_F(JobRequestTest, UserAgentMustBeSingleLine) {
    ScrapeRequest scrape{"https://a.test/", {}};
    scrape.options.user_agent = "Bot/1.0\r\nX-Injected: 1";
    JobRequest injected       = scrape;
    EXPECT_THROW(validate(injected, 20), JobConfigError);

    scrape.options.user_agent = "Bot/1.0 (+https://bot.test)";
    JobRequest ok             = scrape;
    EXPECT_NO_THROW(validate(ok, 20));
}

TEST_F(JobRequestTest, CrawlValidation) {
    CrawlRequest base;
    base.urls = {"https://a.test/"};

    JobRequest no_urls = CrawlRequest{};
    EXPECT_THROW(validate(no_urls, 20), JobConfigError);

    auto negative_depth      = base;
    negative_depth.max_depth = -1;
    JobRequest r1            = negative_depth;
    EXPECT_THROW(validate(r1, 20), JobConfigError);

    auto zero_batch       = base;
    zero_batch.batch_size = 0;
    JobRequest r2         = zero_batch;
    EXPECT_THROW(validate(r2, 20), JobConfigError);

    auto bad_scope  = base;
    bad_scope.scope = {{ScopeRule::Type::Allow, "([unclosed"}};
    JobRequest r3   = bad_scope;
    EXPECT_THROW(validate(r3, 20), JobConfigError);

    auto bad_selector      = base;
    bad_selector.selectors = {{"", "h1", ""}};
    JobRequest r4          = bad_selector;
    EXPECT_THROW(validate(r4, 20), JobConfigError);

    auto bad_delay             = base;
    bad_delay.options.delay_ms = -5;
    JobRequest r5              = bad_delay;
    EXPECT_THROW(validate(r5, 20), JobConfigError);
}

TEST_F(JobRequestTest, BatchSizeClampedToCeiling) {
    CrawlRequest crawl;
    crawl.urls       = {"https://a.test/"};
    crawl.batch_size = 64;
    JobRequest request = crawl;
    validate(request, 20);
    EXPECT_EQ(std::get<CrawlRequest>(request).batch_size, 20);
}

TEST_F(JobRequestTest, SearchAndAgentNeedText) {
    JobRequest search = SearchRequest{"https://a.test/", {}, "   ", 5};
    EXPECT_THROW(validate(search, 20), JobConfigError);

    JobRequest no_top = SearchRequest{"https://a.test/", {}, "query", 0};
    EXPECT_THROW(validate(no_top, 20), JobConfigError);

    JobRequest agent = AgentRequest{"https://a.test/", {}, "", ""};
    EXPECT_THROW(validate(agent, 20), JobConfigError);
}

TEST_F(JobRequestTest, ScrapePlanIsSinglePage) {
    auto plan = make_plan(ScrapeRequest{"https://a.test/", {}}, "default/model");
    EXPECT_EQ(plan.mode, Mode::Scrape);
    EXPECT_EQ(plan.seeds, std::vector<std::string>{"https://a.test/"});
    EXPECT_EQ(plan.pool_size, 1);
    EXPECT_EQ(plan.max_depth, 0);
    EXPECT_FALSE(plan.expand_links);
}

TEST_F(JobRequestTest, CrawlPlanExpandsOnlyWithDepth) {
    CrawlRequest crawl;
    crawl.urls = {"https://a.test/", "https://b.test/"};
    auto flat  = make_plan(crawl, "");
    EXPECT_FALSE(flat.expand_links);
    EXPECT_EQ(flat.pool_size, 5);
    EXPECT_EQ(flat.seeds.size(), 2u);

    crawl.max_depth            = 2;
    crawl.max_duration_seconds = 30;
    auto deep                  = make_plan(crawl, "");
    EXPECT_TRUE(deep.expand_links);
    EXPECT_EQ(deep.max_duration, std::chrono::seconds(30));
}

TEST_F(JobRequestTest, MapPlanDefaults) {
    MapRequest map;
    map.url   = "https://a.test/";
    auto plan = make_plan(map, "");
    EXPECT_EQ(plan.max_depth, 2);
    EXPECT_EQ(plan.max_pages, 50);
    EXPECT_EQ(plan.pool_size, 3);
    EXPECT_TRUE(plan.expand_links);
    EXPECT_FALSE(plan.include_content);
}

TEST_F(JobRequestTest, AgentPlanFallsBackToDefaultModel) {
    AgentRequest agent{"https://a.test/", {}, "extract", ""};
    EXPECT_EQ(make_plan(agent, "default/model").model, "default/model");
    agent.model = "custom/model";
    EXPECT_EQ(make_plan(agent, "default/model").model, "custom/model");
    EXPECT_EQ(make_plan(agent, "").instruction, "extract");
}
