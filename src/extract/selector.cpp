#include "selector.hpp"
#include <cctype>
#include "../core/errors/errors.hpp"
#include "../utils/text/string_utils.hpp"
#include "dom.hpp"

namespace Trawl {
namespace Extract {

using Core::ExtractionError;

namespace {

bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
}

class Parser {
public:
    explicit Parser(const std::string& text) : text_(text) {
    }

    bool done() const {
        return pos_ >= text_.size();
    }
    char peek() const {
        return done() ? '\0' : text_[pos_];
    }
    char next() {
        return text_[pos_++];
    }

    bool skip_space() {
        bool skipped = false;
        while (!done() && std::isspace(static_cast<unsigned char>(peek()))) {
            ++pos_;
            skipped = true;
        }
        return skipped;
    }

    std::string name() {
        std::string out;
        while (!done() && is_name_char(peek()))
            out += next();
        if (out.empty())
            fail("expected a name");
        return out;
    }

    std::string value() {
        if (peek() == '"' || peek() == '\'') {
            char        quote = next();
            std::string out;
            while (!done() && peek() != quote)
                out += next();
            if (done())
                fail("unterminated string");
            ++pos_;
            return out;
        }
        std::string out;
        while (!done() && peek() != ']')
            out += next();
        return Utils::Text::trim(out);
    }

    [[noreturn]] void fail(const std::string& what) const {
        throw ExtractionError("invalid selector '" + text_ + "': " + what + " at " +
                              std::to_string(pos_));
    }

private:
    const std::string& text_;
    std::size_t        pos_ = 0;
};

}  // namespace

Selector Selector::parse(const std::string& text) {
    Selector selector;
    Parser   p(text);

    Chain      chain;
    Step       step;
    bool       in_compound = false;
    Combinator pending     = Combinator::Descendant;

    auto close_compound = [&]() {
        if (!in_compound)
            return;
        step.combinator = pending;
        chain.push_back(step);
        step        = Step{};
        in_compound = false;
        pending     = Combinator::Descendant;
    };
    auto close_chain = [&]() {
        close_compound();
        if (chain.empty())
            p.fail("empty selector");
        selector.groups_.push_back(std::move(chain));
        chain.clear();
    };

    p.skip_space();
    while (!p.done()) {
        char c = p.peek();
        if (std::isspace(static_cast<unsigned char>(c))) {
            close_compound();
            p.skip_space();
            continue;
        }
        if (c == '>') {
            close_compound();
            if (chain.empty())
                p.fail("combinator without left side");
            p.next();
            pending = Combinator::Child;
            p.skip_space();
            continue;
        }
        if (c == ',') {
            p.next();
            close_chain();
            p.skip_space();
            continue;
        }

        in_compound = true;
        if (c == '#') {
            p.next();
            step.compound.id = p.name();
        }
        else if (c == '.') {
            p.next();
            step.compound.classes.push_back(p.name());
        }
        else if (c == '[') {
            p.next();
            p.skip_space();
            std::string attr_name = Utils::Text::to_lower(p.name());
            p.skip_space();
            std::optional<std::string> attr_value;
            if (p.peek() == '=') {
                p.next();
                p.skip_space();
                attr_value = p.value();
                p.skip_space();
            }
            if (p.peek() != ']')
                p.fail("expected ]");
            p.next();
            step.compound.attrs.emplace_back(attr_name, attr_value);
        }
        else if (c == '*') {
            p.next();
        }
        else if (is_name_char(c)) {
            step.compound.tag = Utils::Text::to_lower(p.name());
        }
        else {
            p.fail(std::string("unsupported character '") + c + "'");
        }
    }
    close_chain();
    return selector;
}

bool Selector::matches_compound(const Compound& compound, const GumboNode* node) {
    if (!is_element(node))
        return false;
    if (!compound.tag.empty() && tag_name(node) != compound.tag)
        return false;
    if (!compound.id.empty()) {
        const char* id = attr(node, "id");
        if (!id || compound.id != id)
            return false;
    }
    if (!compound.classes.empty()) {
        const char* cls = attr(node, "class");
        if (!cls)
            return false;
        std::vector<std::string> tokens = Utils::Text::split(Utils::Text::collapse_whitespace(cls), ' ');
        for (const auto& wanted : compound.classes) {
            bool found = false;
            for (const auto& token : tokens)
                found = found || token == wanted;
            if (!found)
                return false;
        }
    }
    for (const auto& [name, value] : compound.attrs) {
        const char* actual = attr(node, name.c_str());
        if (!actual)
            return false;
        if (value && *value != actual)
            return false;
    }
    return true;
}

bool Selector::matches_chain(const Chain& chain, std::size_t index, const GumboNode* node) {
    if (!matches_compound(chain[index].compound, node))
        return false;
    if (index == 0)
        return true;

    const GumboNode* parent = node->parent;
    if (chain[index].combinator == Combinator::Child)
        return is_element(parent) && matches_chain(chain, index - 1, parent);

    for (; is_element(parent); parent = parent->parent) {
        if (matches_chain(chain, index - 1, parent))
            return true;
    }
    return false;
}

bool Selector::matches(const GumboNode* node) const {
    for (const auto& chain : groups_) {
        if (matches_chain(chain, chain.size() - 1, node))
            return true;
    }
    return false;
}

std::vector<GumboNode*> Selector::select(GumboNode* root) const {
    std::vector<GumboNode*> found;
    walk(root, [&](GumboNode* node) {
        if (matches(node))
            found.push_back(node);
        return true;
    });
    return found;
}

}  // namespace Extract
}  // namespace Trawl
