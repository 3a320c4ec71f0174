#include "dom.hpp"
#include "../core/errors/errors.hpp"
#include "../utils/text/string_utils.hpp"

namespace Trawl {
namespace Extract {

Document::Document(const std::string& html) : html_(html), output_(gumbo_parse(html_.c_str())) {
    if (!output_)
        throw Core::ExtractionError("HTML parser returned no document");
}

bool is_element(const GumboNode* node) {
    return node && (node->type == GUMBO_NODE_ELEMENT || node->type == GUMBO_NODE_TEMPLATE);
}

std::string tag_name(const GumboNode* node) {
    if (!is_element(node))
        return "";
    if (node->v.element.tag != GUMBO_TAG_UNKNOWN)
        return gumbo_normalized_tagname(node->v.element.tag);

    GumboStringPiece piece = node->v.element.original_tag;
    gumbo_tag_from_original_text(&piece);
    return Utils::Text::to_lower(std::string(piece.data, piece.length));
}

const char* attr(const GumboNode* node, const char* name) {
    if (!is_element(node))
        return nullptr;
    GumboAttribute* a = gumbo_get_attribute(&node->v.element.attributes, name);
    return a ? a->value : nullptr;
}

namespace {

bool breaks_text(GumboTag tag) {
    switch (tag) {
        case GUMBO_TAG_BR:
        case GUMBO_TAG_P:
        case GUMBO_TAG_DIV:
        case GUMBO_TAG_LI:
        case GUMBO_TAG_TD:
        case GUMBO_TAG_TH:
        case GUMBO_TAG_TR:
        case GUMBO_TAG_H1:
        case GUMBO_TAG_H2:
        case GUMBO_TAG_H3:
        case GUMBO_TAG_H4:
        case GUMBO_TAG_H5:
        case GUMBO_TAG_H6:
        case GUMBO_TAG_SECTION:
        case GUMBO_TAG_ARTICLE:
        case GUMBO_TAG_TITLE:
            return true;
        default:
            return false;
    }
}

void collect_text(const GumboNode* node, std::string& out) {
    if (node->type == GUMBO_NODE_TEXT || node->type == GUMBO_NODE_WHITESPACE ||
        node->type == GUMBO_NODE_CDATA) {
        out += node->v.text.text;
        return;
    }
    if (!is_element(node) && node->type != GUMBO_NODE_DOCUMENT)
        return;
    if (is_element(node) && (node->v.element.tag == GUMBO_TAG_SCRIPT ||
                             node->v.element.tag == GUMBO_TAG_STYLE))
        return;

    bool block = is_element(node) && breaks_text(node->v.element.tag);
    if (block)
        out += ' ';

    const GumboVector* children = node->type == GUMBO_NODE_DOCUMENT
                                      ? &node->v.document.children
                                      : &node->v.element.children;
    for (unsigned int i = 0; i < children->length; ++i) {
        collect_text(static_cast<const GumboNode*>(children->data[i]), out);
    }
    if (block)
        out += ' ';
}

}  // namespace

std::string text_of(const GumboNode* node) {
    std::string raw;
    collect_text(node, raw);
    return Utils::Text::collapse_whitespace(raw);
}

void walk(GumboNode* node, const std::function<bool(GumboNode*)>& fn) {
    if (node->type == GUMBO_NODE_DOCUMENT) {
        for (unsigned int i = 0; i < node->v.document.children.length; ++i)
            walk(static_cast<GumboNode*>(node->v.document.children.data[i]), fn);
        return;
    }
    if (!is_element(node))
        return;
    if (!fn(node))
        return;

    const GumboVector* children = &node->v.element.children;
    for (unsigned int i = 0; i < children->length; ++i) {
        walk(static_cast<GumboNode*>(children->data[i]), fn);
    }
}

GumboNode* find_first(GumboNode* node, GumboTag tag) {
    GumboNode* found = nullptr;
    walk(node, [&](GumboNode* n) {
        if (found)
            return false;
        if (n->v.element.tag == tag) {
            found = n;
            return false;
        }
        return true;
    });
    return found;
}

}  // namespace Extract
}  // namespace Trawl
