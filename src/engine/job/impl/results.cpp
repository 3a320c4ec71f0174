#include "../../../core/errors/errors.hpp"
#include "../../../core/logger/logger.hpp"
#include "../../../utils/text/string_utils.hpp"
#include "../job_coordinator.hpp"

namespace Trawl {
namespace Engine {

using namespace Trawl::Core;

PageResult JobCoordinator::build_page(const FrontierEntry& entry, const FetchOutcome& outcome) const {
    PageResult page;
    page.url         = entry.url;
    page.depth       = entry.depth;
    page.parent      = entry.parent;
    page.sequence    = entry.sequence;
    page.status      = outcome.status;
    page.status_code = outcome.status_code;
    page.attempts    = outcome.attempts;
    page.fetched_at  = outcome.fetched_at;
    page.elapsed     = outcome.elapsed;
    page.format      = plan_.options.format;
    page.error       = outcome.error;

    if (!outcome.ok())
        return page;

    const auto&               html = outcome.content;
    const std::string&        base = outcome.effective_url.empty() ? entry.url : outcome.effective_url;
    const Extract::Extractor& extractor = *services_.extractor;
    Extract::ConvertOptions   convert_options{plan_.options.include_links,
                                            plan_.options.include_images};

    try {
        page.metadata = extractor.metadata(html, base);
        auto links    = extractor.extract_links(html, base);
        page.links_count = links.size();

        switch (plan_.mode) {
            case Mode::Scrape:
            case Mode::Crawl:
                page.content = extractor.convert(html, plan_.options.format, convert_options);
                if (plan_.options.include_links)
                    page.links = std::move(links);
                if (plan_.options.include_images)
                    page.images = extractor.extract_images(html, base);
                if (!plan_.selectors.empty())
                    page.fields = extractor.extract_selectors(html, plan_.selectors);
                break;
            case Mode::Map:
                if (plan_.include_content)
                    page.content = extractor.convert(html, plan_.options.format, convert_options);
                break;
            case Mode::Search: {
                auto chunks       = extractor.paragraphs(html);
                page.total_chunks = chunks.size();
                page.ranked       = extractor.rank(chunks, plan_.query, plan_.top_k);
                break;
            }
            case Mode::Agent: {
                std::string markdown = extractor.convert(html, Format::Markdown, convert_options);
                if (Utils::Text::trim(markdown).empty())
                    markdown = extractor.convert(html, Format::Text, convert_options);
                if (Utils::Text::trim(markdown).empty()) {
                    page.error = "No content extracted from URL";
                    break;
                }
                page.content = Utils::Text::truncate_utf8(markdown, Constants::AGENT_CONTENT_LIMIT);
                break;
            }
        }
    } catch (const ExtractionError& e) {
        page.error = std::string("extraction failed: ") + e.what();
        Logger::warn(entry.url + ": " + page.error);
    }
    return page;
}

boost::asio::awaitable<void> JobCoordinator::run_instruction(PageResult&        page,
                                                             const std::string& markdown) {
    try {
        page.extracted =
            co_await services_.extractor->instruct(markdown, plan_.instruction, plan_.model);
    } catch (const ExtractionError& e) {
        page.error = std::string("extraction failed: ") + e.what();
        Logger::warn(page.url + ": " + page.error);
    }
}

void JobCoordinator::record_page(PageResult                      page,
                                 const std::vector<std::string>& links,
                                 int                             depth) {
    PageCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (page.status == FetchStatus::Ok && !links.empty() && !cancel_requested_) {
            std::size_t admitted = frontier_.push_all(links, depth + 1, page.url);
            if (admitted > 0)
                Logger::info("Discovered " + std::to_string(admitted) + " new URL(s) on " + page.url);
        }

        ++counts_.attempted;
        if (page.status == FetchStatus::BlockedByRobots)
            ++counts_.skipped_by_robots;
        else if (page.succeeded())
            ++counts_.succeeded;
        else
            ++counts_.failed;

        results_[page.url] = page;
        callback           = page_callback_;
    }
    if (!callback)
        return;
    try {
        callback(page);
    } catch (const std::exception& e) {
        Logger::warn("Job " + id_ + ": page listener failed: " + e.what());
    }
}

}  // namespace Engine
}  // namespace Trawl
