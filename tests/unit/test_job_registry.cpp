#include <gtest/gtest.h>
#include "../../src/core/errors/errors.hpp"
#include "../../src/core/logger/logger.hpp"
#include "../../src/engine/job/job_registry.hpp"
#include "../../src/extract/html_extractor.hpp"
#include "test_support.hpp"

using namespace Trawl;
using namespace Trawl::Engine;
using namespace TrawlTest;
using std::chrono::milliseconds;

class JobRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        Core::Logger::set_level(Core::LOG_NONE);
        runtime = std::make_unique<Core::Runtime>(2, 1);
        runtime->start();
    }

    void TearDown() override {
        registry.reset();
        runtime->shutdown();
        Core::Logger::set_level(Core::LOG_ALL);
    }

    void make_registry(milliseconds latency = milliseconds(0)) {
        renderer = std::make_shared<MockRenderer>(
            [](const std::string& url, int) { return html_response(url, "<h1>Hi</h1><p>text</p>"); },
            latency);
        auto extractor = std::make_shared<Extract::HtmlExtractor>();

        JobServices s;
        s.runtime   = runtime.get();
        s.extractor = extractor;
        s.store     = store;
        s.fetcher   = std::make_shared<Fetcher>(renderer, nullptr, std::make_shared<MockRobots>(),
                                              std::make_shared<HostThrottle>(), extractor);
        s.defaults.backoff_ms = 1;
        registry              = std::make_unique<JobRegistry>(s);
    }

    JobResult finish(const std::string& id) {
        auto job = registry->find(id);
        if (!job) {
            ADD_FAILURE() << "unknown job " << id;
            return {};
        }
        auto result = job->await_completion(std::chrono::seconds(5));
        if (!result) {
            ADD_FAILURE() << "job " << id << " did not finish";
            return job->status();
        }
        return *result;
    }

    std::unique_ptr<Core::Runtime> runtime;
    std::shared_ptr<MemoryStore>   store = std::make_shared<MemoryStore>();
    std::shared_ptr<MockRenderer>  renderer;
    std::unique_ptr<JobRegistry>   registry;
};

TEST_F(JobRegistryTest, SubmitRunsJob) {
    make_registry();
    std::string id = registry->submit(ScrapeRequest{"https://a.test/", {}});
    EXPECT_EQ(id.size(), 36u);

    auto result = finish(id);
    EXPECT_EQ(result.status, JobStatus::Completed);
    EXPECT_EQ(result.id, id);
    EXPECT_EQ(registry->size(), 1u);
}

TEST_F(JobRegistryTest, InvalidRequestRejectedBeforeStart) {
    make_registry();
    EXPECT_THROW(registry->submit(ScrapeRequest{"not a url", {}}), Core::JobConfigError);
    EXPECT_EQ(registry->size(), 0u);
    EXPECT_EQ(renderer->total_calls(), 0);
}

TEST_F(JobRegistryTest, IdsAreUnique) {
    make_registry();
    std::set<std::string> ids;
    for (int i = 0; i < 5; ++i)
        ids.insert(registry->submit(ScrapeRequest{"https://a.test/" + std::to_string(i), {}}));
    EXPECT_EQ(ids.size(), 5u);
    for (const auto& id : ids)
        finish(id);
}

TEST_F(JobRegistryTest, StatusFallsBackToStore) {
    make_registry();
    std::string id = registry->submit(ScrapeRequest{"https://a.test/", {}});
    finish(id);

    EXPECT_EQ(registry->purge(id), PurgeResult::Purged);
    EXPECT_FALSE(registry->status(id).has_value());

    JobResult archived;
    archived.id      = "archived";
    archived.request = ScrapeRequest{"https://old.test/", {}};
    archived.status  = JobStatus::Completed;
    store->save(archived);

    auto found = registry->status("archived");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->status, JobStatus::Completed);
    EXPECT_FALSE(registry->status("missing").has_value());
}

TEST_F(JobRegistryTest, PurgeRefusesRunningJob) {
    make_registry(milliseconds(300));
    std::string id = registry->submit(ScrapeRequest{"https://a.test/", {}});

    EXPECT_EQ(registry->purge(id), PurgeResult::Running);
    finish(id);
    EXPECT_EQ(registry->purge(id), PurgeResult::Purged);
    EXPECT_EQ(registry->purge(id), PurgeResult::NotFound);
    EXPECT_EQ(registry->purge("never-existed"), PurgeResult::NotFound);
}

TEST_F(JobRegistryTest, CancelUnknownAndRunning) {
    make_registry(milliseconds(200));
    EXPECT_FALSE(registry->cancel("nope"));

    CrawlRequest crawl;
    crawl.urls       = {"https://a.test/1", "https://a.test/2", "https://a.test/3", "https://a.test/4"};
    crawl.batch_size = 1;
    std::string id   = registry->submit(crawl);

    EXPECT_TRUE(registry->cancel(id));
    auto result = finish(id);
    EXPECT_EQ(result.status, JobStatus::Cancelled);
    EXPECT_LT(result.counts.attempted, 4u);
}

TEST_F(JobRegistryTest, ListIncludesMemoryAndStore) {
    make_registry();
    std::string id = registry->submit(ScrapeRequest{"https://a.test/", {}});
    finish(id);

    JobResult archived;
    archived.id         = "archived";
    archived.request    = ScrapeRequest{"https://old.test/", {}};
    archived.status     = JobStatus::Completed;
    archived.created_at = Clock::now() - std::chrono::hours(1);
    store->save(archived);

    auto jobs = registry->list();
    ASSERT_EQ(jobs.size(), 2u);
    EXPECT_EQ(jobs[0].id, id);
    EXPECT_EQ(jobs[1].id, "archived");
}

TEST_F(JobRegistryTest, PageCallbackReceivesPages) {
    make_registry();
    std::atomic<int> pages{0};
    std::string      id = registry->submit(ScrapeRequest{"https://a.test/", {}},
                                      [&](const PageResult&) { ++pages; });
    finish(id);
    EXPECT_EQ(pages.load(), 1);
}

TEST_F(JobRegistryTest, ShutdownCancelsAndRejectsNewJobs) {
    make_registry(milliseconds(200));
    CrawlRequest crawl;
    crawl.urls       = {"https://a.test/1", "https://a.test/2", "https://a.test/3"};
    crawl.batch_size = 1;
    std::string id   = registry->submit(crawl);

    registry->shutdown(std::chrono::seconds(5));
    EXPECT_EQ(registry->find(id)->state(), JobStatus::Cancelled);
    EXPECT_THROW(registry->submit(ScrapeRequest{"https://a.test/", {}}), Core::JobInternalError);
}
