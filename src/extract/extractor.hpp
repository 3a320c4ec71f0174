#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "../engine/types.hpp"

namespace Trawl {
namespace Extract {

struct ConvertOptions {
    bool include_links  = false;
    bool include_images = false;
};

using Fields = std::map<std::string, std::vector<std::string>>;

// Content extraction. All operations except instruct() are CPU-bound and
// thread-safe; they throw Core::ExtractionError when the input cannot be processed.
class Extractor {
public:
    virtual ~Extractor() = default;

    virtual std::string convert(const std::string&    html,
                                Engine::Format        format,
                                const ConvertOptions& options) const = 0;

    virtual Fields extract_selectors(const std::string&                       html,
                                     const std::vector<Engine::SelectorSpec>& selectors) const = 0;

    // Top `top_k` chunks by BM25 score against `query`, positive scores only.
    virtual std::vector<Engine::RankedChunk> rank(const std::vector<std::string>& chunks,
                                                  const std::string&              query,
                                                  int                             top_k) const = 0;

    virtual boost::asio::awaitable<nlohmann::json> instruct(const std::string& content,
                                                            const std::string& instruction,
                                                            const std::string& model) = 0;

    // Absolute, deduplicated, in document order.
    virtual std::vector<Engine::Link>  extract_links(const std::string& html,
                                                     const std::string& base_url) const  = 0;
    virtual std::vector<Engine::Image> extract_images(const std::string& html,
                                                      const std::string& base_url) const = 0;
    virtual Engine::PageMetadata       metadata(const std::string& html,
                                                const std::string& base_url) const       = 0;
    virtual std::vector<std::string>   paragraphs(const std::string& html) const         = 0;
};

}  // namespace Extract
}  // namespace Trawl
