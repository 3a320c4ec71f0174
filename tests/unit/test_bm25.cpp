#include <gtest/gtest.h>
#include "../../src/extract/bm25.hpp"
#include "../../src/utils/text/string_utils.hpp"

using namespace Trawl::Extract;
using Trawl::Utils::Text::tokenize;

namespace {

std::vector<std::vector<std::string>> corpus(const std::vector<std::string>& docs) {
    std::vector<std::vector<std::string>> out;
    for (const auto& d : docs)
        out.push_back(tokenize(d));
    return out;
}

}  // namespace

TEST(Bm25Test, MatchingDocumentScoresHighest) {
    Bm25 bm25(corpus({"the cat sat on the mat", "dogs chase cats", "a quick brown fox"}));
    auto scores = bm25.scores(tokenize("quick fox"));
    ASSERT_EQ(scores.size(), 3u);
    EXPECT_GT(scores[2], 0.0);
    EXPECT_EQ(scores[0], 0.0);
    EXPECT_EQ(scores[1], 0.0);
}

TEST(Bm25Test, RareTermsWeighMore) {
    Bm25 bm25(corpus({"apple banana", "apple cherry", "apple durian", "banana split"}));
    EXPECT_GT(bm25.idf("cherry"), bm25.idf("banana"));
    EXPECT_EQ(bm25.idf("unknown"), 0.0);
}

TEST(Bm25Test, CommonTermsGetEpsilonFloor) {
    Bm25 bm25(corpus({"apple one", "apple two", "apple three", "four", "five"}));
    EXPECT_GT(bm25.idf("apple"), 0.0);
    EXPECT_LT(bm25.idf("apple"), bm25.idf("one"));
}

TEST(Bm25Test, ShorterDocumentPreferredAtEqualFrequency) {
    Bm25 bm25(corpus({"engine", "engine with many other unrelated words around it", "nothing"}));
    auto scores = bm25.scores({"engine"});
    EXPECT_GT(scores[0], scores[1]);
}

TEST(Bm25Test, EmptyCorpus) {
    Bm25 bm25(std::vector<std::vector<std::string>>{});
    EXPECT_TRUE(bm25.scores({"anything"}).empty());
}
