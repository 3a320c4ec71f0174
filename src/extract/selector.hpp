#pragma once
#include <gumbo.h>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Trawl {
namespace Extract {

// CSS selector subset: type, #id, .class, [attr], [attr=value], the
// descendant and child combinators, and comma-separated groups.
class Selector {
public:
    // Throws Core::ExtractionError on unsupported syntax.
    static Selector parse(const std::string& text);

    // Matching elements in document order.
    std::vector<GumboNode*> select(GumboNode* root) const;

    bool matches(const GumboNode* node) const;

private:
    struct Compound {
        std::string                                                     tag;
        std::string                                                     id;
        std::vector<std::string>                                        classes;
        std::vector<std::pair<std::string, std::optional<std::string>>> attrs;
    };

    enum class Combinator { Descendant, Child };

    struct Step {
        Compound   compound;
        Combinator combinator = Combinator::Descendant;  // relation to the previous step
    };

    using Chain = std::vector<Step>;

    std::vector<Chain> groups_;

    static bool matches_compound(const Compound& compound, const GumboNode* node);
    static bool matches_chain(const Chain& chain, std::size_t index, const GumboNode* node);
};

}  // namespace Extract
}  // namespace Trawl
