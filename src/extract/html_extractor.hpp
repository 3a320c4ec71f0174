#pragma once
#include <memory>
#include "extractor.hpp"
#include "llm_instructor.hpp"

namespace Trawl {
namespace Extract {

// gumbo for parsing, html2md for markdown, BM25 for ranking and an
// LlmInstructor for instruction-following extraction.
class HtmlExtractor : public Extractor {
public:
    // Without an instructor, instruct() throws ExtractionError.
    explicit HtmlExtractor(std::shared_ptr<LlmInstructor> instructor = nullptr);
    ~HtmlExtractor() override = default;

    std::string convert(const std::string&    html,
                        Engine::Format        format,
                        const ConvertOptions& options) const override;

    Fields extract_selectors(const std::string&                       html,
                             const std::vector<Engine::SelectorSpec>& selectors) const override;

    std::vector<Engine::RankedChunk> rank(const std::vector<std::string>& chunks,
                                          const std::string&              query,
                                          int                             top_k) const override;

    boost::asio::awaitable<nlohmann::json> instruct(const std::string& content,
                                                    const std::string& instruction,
                                                    const std::string& model) override;

    std::vector<Engine::Link>  extract_links(const std::string& html,
                                             const std::string& base_url) const override;
    std::vector<Engine::Image> extract_images(const std::string& html,
                                              const std::string& base_url) const override;
    Engine::PageMetadata       metadata(const std::string& html,
                                        const std::string& base_url) const override;
    std::vector<std::string>   paragraphs(const std::string& html) const override;

    // Noise-stripped HTML handed to the markdown converter.
    std::string clean_html(const std::string& html, const ConvertOptions& options) const;
    std::string to_markdown(const std::string& html, const ConvertOptions& options) const;
    std::string to_text(const std::string& html) const;

private:
    std::shared_ptr<LlmInstructor> instructor_;
};

}  // namespace Extract
}  // namespace Trawl
