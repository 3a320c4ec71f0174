#include <gtest/gtest.h>
#include <thread>
#include "../../src/engine/frontier/frontier.hpp"

using namespace Trawl::Engine;

class FrontierTest : public ::testing::Test {
protected:
    FrontierPolicy policy(int max_depth, bool same_domain = true) {
        FrontierPolicy p;
        p.max_depth   = max_depth;
        p.same_domain = same_domain;
        return p;
    }
};

TEST_F(FrontierTest, PushDepthCheck) {
    Frontier frontier(policy(1));
    ASSERT_TRUE(frontier.seed("http://example.com/a"));

    EXPECT_TRUE(frontier.push("http://example.com/b", 1, "http://example.com/a"));
    EXPECT_EQ(frontier.size(), 2u);

    // Beyond max_depth
    EXPECT_FALSE(frontier.push("http://example.com/c", 2, "http://example.com/b"));
    EXPECT_EQ(frontier.size(), 2u);
}

TEST_F(FrontierTest, PushDomainCheck) {
    Frontier frontier(policy(2));
    frontier.seed("http://example.com/");

    EXPECT_TRUE(frontier.push("http://example.com/path", 1, ""));
    EXPECT_FALSE(frontier.push("http://google.com/path", 1, ""));
    EXPECT_FALSE(frontier.push("http://sub.example.com/path", 1, ""));
    EXPECT_EQ(frontier.size(), 2u);
}

TEST_F(FrontierTest, CrossDomainAllowedWhenNotRestricted) {
    Frontier frontier(policy(2, false));
    frontier.seed("http://example.com/");
    EXPECT_TRUE(frontier.push("http://google.com/path", 1, ""));
}

TEST_F(FrontierTest, EveryNormalizedUrlAdmittedOnce) {
    Frontier frontier(policy(3));
    EXPECT_TRUE(frontier.seed("http://a.test/x"));
    EXPECT_FALSE(frontier.seed("HTTP://A.TEST/x/"));
    EXPECT_FALSE(frontier.push("http://a.test:80/x#frag", 1, ""));
    EXPECT_FALSE(frontier.push("http://a.test/y/../x", 2, ""));
    EXPECT_EQ(frontier.size(), 1u);
    EXPECT_EQ(frontier.seen_count(), 1u);

    // Popping does not forget the URL.
    frontier.pop();
    EXPECT_FALSE(frontier.push("http://a.test/x", 1, ""));
}

TEST_F(FrontierTest, NonHttpRejected) {
    Frontier frontier(policy(2));
    EXPECT_FALSE(frontier.seed("ftp://a.test/file"));
    EXPECT_FALSE(frontier.seed("/relative"));
    EXPECT_FALSE(frontier.seed(""));
    EXPECT_TRUE(frontier.empty());
}

TEST_F(FrontierTest, PopsBreadthFirstThenInsertionOrder) {
    Frontier frontier(policy(3));
    frontier.seed("http://a.test/");
    frontier.push("http://a.test/d2", 2, "");
    frontier.push("http://a.test/d1-first", 1, "");
    frontier.push("http://a.test/d1-second", 1, "");

    EXPECT_EQ(frontier.peek_depth(), 0);
    EXPECT_EQ(frontier.pop()->url, "http://a.test/");
    EXPECT_EQ(frontier.pop()->url, "http://a.test/d1-first");
    EXPECT_EQ(frontier.pop()->url, "http://a.test/d1-second");
    auto last = frontier.pop();
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->depth, 2);
    EXPECT_FALSE(frontier.pop().has_value());
    EXPECT_FALSE(frontier.peek_depth().has_value());
}

TEST_F(FrontierTest, SequenceIsMonotonic) {
    Frontier frontier(policy(1));
    frontier.seed("http://a.test/");
    frontier.push_all({"http://a.test/1", "http://a.test/2", "http://a.test/1"}, 1, "http://a.test/");

    auto root   = frontier.pop();
    auto first  = frontier.pop();
    auto second = frontier.pop();
    ASSERT_TRUE(root && first && second);
    EXPECT_LT(root->sequence, first->sequence);
    EXPECT_LT(first->sequence, second->sequence);
    EXPECT_EQ(first->parent, "http://a.test/");
    EXPECT_TRUE(frontier.empty());
}

TEST_F(FrontierTest, ScopeRules) {
    FrontierPolicy p = policy(2);
    p.scope          = {{ScopeRule::Type::Allow, "/docs/"}, {ScopeRule::Type::Deny, "/docs/old/"}};
    Frontier frontier(p);

    // Seeds bypass scope.
    EXPECT_TRUE(frontier.seed("http://a.test/"));
    EXPECT_TRUE(frontier.push("http://a.test/docs/intro", 1, ""));
    EXPECT_FALSE(frontier.push("http://a.test/docs/old/intro", 1, ""));
    EXPECT_FALSE(frontier.push("http://a.test/blog/post", 1, ""));
    EXPECT_TRUE(frontier.in_scope("http://a.test/docs/x"));
    EXPECT_FALSE(frontier.in_scope("http://a.test/other"));
}

TEST_F(FrontierTest, DenyOnlyScope) {
    FrontierPolicy p = policy(2);
    p.scope          = {{ScopeRule::Type::Deny, "\\.pdf$"}};
    Frontier frontier(p);
    frontier.seed("http://a.test/");
    EXPECT_TRUE(frontier.push("http://a.test/page", 1, ""));
    EXPECT_FALSE(frontier.push("http://a.test/file.pdf", 1, ""));
}

TEST_F(FrontierTest, ClearDropsQueueButKeepsSeen) {
    Frontier frontier(policy(1));
    frontier.seed("http://a.test/");
    frontier.push("http://a.test/x", 1, "");
    frontier.clear();
    EXPECT_TRUE(frontier.empty());
    EXPECT_EQ(frontier.seen_count(), 2u);
}

TEST_F(FrontierTest, ConcurrentPushesAdmitEachUrlOnce) {
    Frontier frontier(policy(1));
    frontier.seed("http://a.test/");

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&frontier]() {
            for (int i = 0; i < 100; ++i)
                frontier.push("http://a.test/p" + std::to_string(i), 1, "");
        });
    }
    for (auto& t : threads)
        t.join();

    EXPECT_EQ(frontier.size(), 101u);
}
