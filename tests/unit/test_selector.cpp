#include <gtest/gtest.h>
#include "../../src/core/errors/errors.hpp"
#include "../../src/extract/dom.hpp"
#include "../../src/extract/selector.hpp"

using namespace Trawl::Extract;

namespace {

const char* PAGE = R"html(
<html><body>
  <div id="main" class="content wide">
    <h2 class="title">First</h2>
    <p>Intro <span class="note">one</span></p>
    <section>
      <h2 class="title sub">Second</h2>
      <a href="/x" data-kind="internal">x</a>
      <a href="https://y.test/">y</a>
    </section>
  </div>
  <h2>Outside</h2>
</body></html>)html";

std::vector<std::string> texts(const std::string& selector) {
    Document                 doc(PAGE);
    std::vector<std::string> out;
    for (auto* node : Selector::parse(selector).select(doc.root()))
        out.push_back(text_of(node));
    return out;
}

}  // namespace

TEST(SelectorTest, TypeSelector) {
    EXPECT_EQ(texts("h2"), (std::vector<std::string>{"First", "Second", "Outside"}));
}

TEST(SelectorTest, ClassAndCompound) {
    EXPECT_EQ(texts(".title"), (std::vector<std::string>{"First", "Second"}));
    EXPECT_EQ(texts("h2.title.sub"), std::vector<std::string>{"Second"});
    EXPECT_EQ(texts("span.note"), std::vector<std::string>{"one"});
}

TEST(SelectorTest, IdSelector) {
    EXPECT_EQ(texts("#main > h2"), std::vector<std::string>{"First"});
    EXPECT_EQ(texts("#main h2"), (std::vector<std::string>{"First", "Second"}));
}

TEST(SelectorTest, AttributePresenceAndValue) {
    EXPECT_EQ(texts("a[href]").size(), 2u);
    EXPECT_EQ(texts("a[data-kind=internal]"), std::vector<std::string>{"x"});
    EXPECT_EQ(texts("a[href=\"https://y.test/\"]"), std::vector<std::string>{"y"});
    EXPECT_TRUE(texts("a[href='/nope']").empty());
}

TEST(SelectorTest, GroupsKeepDocumentOrder) {
    EXPECT_EQ(texts("span, h2.sub"), (std::vector<std::string>{"one", "Second"}));
}

TEST(SelectorTest, ChildCombinatorIsStrict) {
    EXPECT_TRUE(texts("div > a").empty());
    EXPECT_EQ(texts("section > a").size(), 2u);
}

TEST(SelectorTest, UniversalAndCaseInsensitiveTags) {
    EXPECT_EQ(texts("SECTION > *").size(), 3u);
}

TEST(SelectorTest, UnsupportedSyntaxThrows) {
    EXPECT_THROW(Selector::parse("a:hover"), Trawl::Core::ExtractionError);
    EXPECT_THROW(Selector::parse(""), Trawl::Core::ExtractionError);
    EXPECT_THROW(Selector::parse("> a"), Trawl::Core::ExtractionError);
    EXPECT_THROW(Selector::parse("a[href"), Trawl::Core::ExtractionError);
    EXPECT_THROW(Selector::parse("a,"), Trawl::Core::ExtractionError);
    EXPECT_THROW(Selector::parse("a[title='x]"), Trawl::Core::ExtractionError);
}
