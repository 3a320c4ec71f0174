#include "html_extractor.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <unordered_set>
#include "../core/errors/errors.hpp"
#include "../core/types/constants.hpp"
#include "../utils/text/string_utils.hpp"
#include "../utils/url/url.hpp"
#include "bm25.hpp"
#include "dom.hpp"
#include "html2md.h"
#include "selector.hpp"

namespace Trawl {
namespace Extract {

using namespace Trawl::Core;
using namespace Trawl::Utils;

namespace {

bool is_noise_tag(GumboTag tag) {
    switch (tag) {
        case GUMBO_TAG_SCRIPT:
        case GUMBO_TAG_STYLE:
        case GUMBO_TAG_NAV:
        case GUMBO_TAG_FOOTER:
        case GUMBO_TAG_HEADER:
        case GUMBO_TAG_ASIDE:
        case GUMBO_TAG_IFRAME:
        case GUMBO_TAG_NOSCRIPT:
            return true;
        default:
            return false;
    }
}

// Class tokens are split on '-' and '_' so "ad-slot" and "cookie_notice" match
// while "header" or "shadow" do not.
bool has_noise_class(const GumboNode* node) {
    static const std::unordered_set<std::string> words = {
        "ad", "ads", "advert", "advertisement", "banner", "cookie", "cookies", "popup",
        "subscription"};

    const char* cls = attr(node, "class");
    if (!cls)
        return false;
    for (const auto& token : Text::split(Text::collapse_whitespace(Text::to_lower(cls)), ' ')) {
        if (token == "login-modal")
            return true;
        std::string part;
        for (char c : token + "-") {
            if (c == '-' || c == '_') {
                if (words.count(part))
                    return true;
                part.clear();
            }
            else {
                part += c;
            }
        }
    }
    return false;
}

bool is_void(GumboTag tag) {
    switch (tag) {
        case GUMBO_TAG_AREA:
        case GUMBO_TAG_BASE:
        case GUMBO_TAG_BR:
        case GUMBO_TAG_COL:
        case GUMBO_TAG_EMBED:
        case GUMBO_TAG_HR:
        case GUMBO_TAG_IMG:
        case GUMBO_TAG_INPUT:
        case GUMBO_TAG_LINK:
        case GUMBO_TAG_META:
        case GUMBO_TAG_PARAM:
        case GUMBO_TAG_SOURCE:
        case GUMBO_TAG_TRACK:
        case GUMBO_TAG_WBR:
            return true;
        default:
            return false;
    }
}

std::string escape(const std::string& text, bool in_attribute) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&':
                out += "&amp;";
                break;
            case '<':
                out += "&lt;";
                break;
            case '>':
                out += "&gt;";
                break;
            case '"':
                out += in_attribute ? "&quot;" : "\"";
                break;
            default:
                out += c;
        }
    }
    return out;
}

struct CleanRules {
    bool drop_noise_classes = true;
    bool keep_links         = false;
    bool keep_images        = false;
};

void serialize(const GumboNode* node, const CleanRules& rules, std::string& out);

void serialize_children(const GumboVector* children, const CleanRules& rules, std::string& out) {
    for (unsigned int i = 0; i < children->length; ++i) {
        serialize(static_cast<const GumboNode*>(children->data[i]), rules, out);
    }
}

void serialize(const GumboNode* node, const CleanRules& rules, std::string& out) {
    switch (node->type) {
        case GUMBO_NODE_DOCUMENT:
            serialize_children(&node->v.document.children, rules, out);
            return;
        case GUMBO_NODE_TEXT:
        case GUMBO_NODE_WHITESPACE:
            out += escape(node->v.text.text, false);
            return;
        case GUMBO_NODE_CDATA:
            out += escape(node->v.text.text, false);
            return;
        case GUMBO_NODE_COMMENT:
            return;
        default:
            break;
    }
    if (!is_element(node))
        return;

    GumboTag tag = node->v.element.tag;
    if (is_noise_tag(tag))
        return;
    if (rules.drop_noise_classes && has_noise_class(node))
        return;
    if (tag == GUMBO_TAG_INPUT)
        return;
    if (tag == GUMBO_TAG_IMG && !rules.keep_images)
        return;

    // Unwrapped: children stay, the tag goes.
    if ((tag == GUMBO_TAG_A && !rules.keep_links) || tag == GUMBO_TAG_BUTTON ||
        tag == GUMBO_TAG_FORM) {
        serialize_children(&node->v.element.children, rules, out);
        return;
    }

    std::string name = tag_name(node);
    out += "<" + name;
    const GumboVector* attrs = &node->v.element.attributes;
    for (unsigned int i = 0; i < attrs->length; ++i) {
        const auto* a = static_cast<const GumboAttribute*>(attrs->data[i]);
        out += " ";
        out += a->name;
        out += "=\"" + escape(a->value, true) + "\"";
    }
    out += ">";
    if (is_void(tag))
        return;
    serialize_children(&node->v.element.children, rules, out);
    out += "</" + name + ">";
}

std::string absolute(const std::string& base_url, const std::string& href) {
    std::string trimmed = Text::trim(href);
    if (trimmed.empty())
        return "";
    if (Text::starts_with(trimmed, "http"))
        return trimmed;
    return Url::resolve(base_url, trimmed);
}

const char* meta_content(GumboNode* root, const char* key, const char* value) {
    const char* content = nullptr;
    walk(root, [&](GumboNode* node) {
        if (content)
            return false;
        if (node->v.element.tag == GUMBO_TAG_META) {
            const char* v = attr(node, key);
            if (v && Text::to_lower(v) == value)
                content = attr(node, "content");
        }
        return true;
    });
    return content;
}

}  // namespace

HtmlExtractor::HtmlExtractor(std::shared_ptr<LlmInstructor> instructor)
    : instructor_(std::move(instructor)) {
}

std::string HtmlExtractor::clean_html(const std::string& html, const ConvertOptions& options) const {
    Document   doc(html);
    CleanRules rules;
    rules.keep_links  = options.include_links;
    rules.keep_images = options.include_images;

    std::string out;
    out.reserve(html.size());
    serialize(doc.root(), rules, out);
    return out;
}

std::string HtmlExtractor::to_markdown(const std::string& html, const ConvertOptions& options) const {
    std::string markdown = html2md::Convert(clean_html(html, options));
    return Text::trim(Text::collapse_blank_lines(markdown));
}

std::string HtmlExtractor::to_text(const std::string& html) const {
    Document   doc(html);
    CleanRules rules;
    rules.drop_noise_classes = false;
    rules.keep_links         = true;
    rules.keep_images        = true;

    std::string cleaned;
    serialize(doc.root(), rules, cleaned);
    Document stripped(cleaned);
    return text_of(stripped.root());
}

std::string HtmlExtractor::convert(const std::string&    html,
                                   Engine::Format        format,
                                   const ConvertOptions& options) const {
    switch (format) {
        case Engine::Format::Markdown:
            return to_markdown(html, options);
        case Engine::Format::Text:
            return to_text(html);
        case Engine::Format::Html:
            return html;
    }
    throw ExtractionError("unsupported format");
}

Fields HtmlExtractor::extract_selectors(const std::string&                       html,
                                        const std::vector<Engine::SelectorSpec>& selectors) const {
    Document doc(html);
    Fields   fields;
    for (const auto& spec : selectors) {
        Selector selector = Selector::parse(spec.selector);
        auto&    values   = fields[spec.name];
        for (GumboNode* node : selector.select(doc.root())) {
            if (spec.attr.empty()) {
                values.push_back(text_of(node));
            }
            else if (const char* value = attr(node, spec.attr.c_str())) {
                values.emplace_back(value);
            }
        }
    }
    return fields;
}

std::vector<Engine::RankedChunk> HtmlExtractor::rank(const std::vector<std::string>& chunks,
                                                     const std::string&              query,
                                                     int                             top_k) const {
    std::vector<std::vector<std::string>> corpus;
    corpus.reserve(chunks.size());
    for (const auto& chunk : chunks)
        corpus.push_back(Text::tokenize(chunk));

    Bm25                bm25(corpus);
    std::vector<double> scores = bm25.scores(Text::tokenize(query));

    std::vector<std::size_t> order(chunks.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
        return scores[a] > scores[b];
    });

    std::vector<Engine::RankedChunk> ranked;
    for (std::size_t i = 0; i < order.size() && static_cast<int>(i) < top_k; ++i) {
        double score = scores[order[i]];
        if (score <= 0.0)
            continue;
        ranked.push_back({chunks[order[i]], std::round(score * 10000.0) / 10000.0});
    }
    return ranked;
}

boost::asio::awaitable<nlohmann::json> HtmlExtractor::instruct(const std::string& content,
                                                               const std::string& instruction,
                                                               const std::string& model) {
    if (!instructor_)
        throw ExtractionError("no language model configured");
    co_return co_await instructor_->instruct(content, instruction, model);
}

std::vector<Engine::Link> HtmlExtractor::extract_links(const std::string& html,
                                                       const std::string& base_url) const {
    Document                        doc(html);
    std::vector<Engine::Link>       links;
    std::unordered_set<std::string> seen;

    walk(doc.root(), [&](GumboNode* node) {
        if (node->v.element.tag != GUMBO_TAG_A)
            return true;
        const char* href = attr(node, "href");
        if (!href)
            return true;
        std::string url = absolute(base_url, href);
        if (url.empty() || !seen.insert(url).second)
            return true;
        std::string text = text_of(node);
        if (text.empty())
            text = url;
        links.push_back({url, Text::truncate_utf8(text, Constants::MAX_LINK_TEXT_LENGTH)});
        return true;
    });
    return links;
}

std::vector<Engine::Image> HtmlExtractor::extract_images(const std::string& html,
                                                         const std::string& base_url) const {
    Document                   doc(html);
    std::vector<Engine::Image> images;
    walk(doc.root(), [&](GumboNode* node) {
        if (node->v.element.tag != GUMBO_TAG_IMG)
            return true;
        const char* src = attr(node, "src");
        if (!src || Text::trim(src).empty())
            return true;
        const char* alt   = attr(node, "alt");
        const char* title = attr(node, "title");
        images.push_back({absolute(base_url, src),
                          alt ? Text::trim(alt) : "",
                          title ? Text::trim(title) : ""});
        return true;
    });
    return images;
}

Engine::PageMetadata HtmlExtractor::metadata(const std::string& html,
                                             const std::string& base_url) const {
    Document             doc(html);
    Engine::PageMetadata meta;

    if (GumboNode* title = find_first(doc.root(), GUMBO_TAG_TITLE))
        meta.title = text_of(title);
    if (meta.title.empty()) {
        if (const char* og = meta_content(doc.root(), "property", "og:title"))
            meta.title = Text::trim(og);
    }

    if (const char* desc = meta_content(doc.root(), "name", "description"))
        meta.description = Text::trim(desc);
    else if (const char* og = meta_content(doc.root(), "property", "og:description"))
        meta.description = Text::trim(og);

    if (const char* author = meta_content(doc.root(), "name", "author"))
        meta.author = Text::trim(author);
    if (const char* keywords = meta_content(doc.root(), "name", "keywords"))
        meta.keywords = Text::trim(keywords);

    walk(doc.root(), [&](GumboNode* node) {
        if (!meta.favicon.empty())
            return false;
        if (node->v.element.tag != GUMBO_TAG_LINK)
            return true;
        const char* rel  = attr(node, "rel");
        const char* href = attr(node, "href");
        if (rel && href) {
            for (const auto& token : Text::split(Text::to_lower(rel), ' ')) {
                if (token == "icon") {
                    meta.favicon = absolute(base_url, href);
                    break;
                }
            }
        }
        return true;
    });
    return meta;
}

std::vector<std::string> HtmlExtractor::paragraphs(const std::string& html) const {
    Document                 doc(html);
    std::vector<std::string> chunks;
    walk(doc.root(), [&](GumboNode* node) {
        switch (node->v.element.tag) {
            case GUMBO_TAG_P:
            case GUMBO_TAG_LI:
            case GUMBO_TAG_H1:
            case GUMBO_TAG_H2:
            case GUMBO_TAG_H3:
            case GUMBO_TAG_TD: {
                std::string text = text_of(node);
                if (text.size() > Constants::MIN_PARAGRAPH_LENGTH)
                    chunks.push_back(std::move(text));
                break;
            }
            default:
                break;
        }
        return true;
    });

    if (chunks.empty()) {
        std::string whole = text_of(doc.root());
        if (!whole.empty())
            chunks.push_back(std::move(whole));
    }
    return chunks;
}

}  // namespace Extract
}  // namespace Trawl
