#pragma once
#include <gumbo.h>
#include <functional>
#include <memory>
#include <string>

namespace Trawl {
namespace Extract {

// Owns a gumbo parse tree.
class Document {
public:
    explicit Document(const std::string& html);

    Document(const Document&)            = delete;
    Document& operator=(const Document&) = delete;

    GumboNode* root() const {
        return output_->root;
    }

private:
    struct Deleter {
        void operator()(GumboOutput* output) const {
            gumbo_destroy_output(&kGumboDefaultOptions, output);
        }
    };

    std::string                           html_;
    std::unique_ptr<GumboOutput, Deleter> output_;
};

bool        is_element(const GumboNode* node);
std::string tag_name(const GumboNode* node);
const char* attr(const GumboNode* node, const char* name);

// Concatenated text of the subtree, whitespace collapsed.
std::string text_of(const GumboNode* node);

// Pre-order walk over element nodes. Returning false from fn skips the subtree.
void walk(GumboNode* node, const std::function<bool(GumboNode*)>& fn);

GumboNode* find_first(GumboNode* node, GumboTag tag);

}  // namespace Extract
}  // namespace Trawl
