#pragma once
#include <chrono>
#include <cstddef>
#include <string>

namespace Trawl {
namespace Core {

struct Constants {
    static constexpr int         DEFAULT_THREADS        = 4;  // IO Threads
    static constexpr int         DEFAULT_WORKER_THREADS = 2;  // CPU Threads (extraction)
    static constexpr const char* VERSION                = "0.3.0";

    static constexpr int DEFAULT_POOL_SIZE = 3;
    static constexpr int MAX_POOL_SIZE     = 20;

    static constexpr int         MAX_ATTEMPTS             = 3;
    static constexpr int         BACKOFF_BASE_MS          = 1000;
    static constexpr int         REQUEST_TIMEOUT_SECONDS  = 30;
    static constexpr int         ROBOTS_TIMEOUT_SECONDS   = 10;
    static constexpr int         MAX_REDIRECTS            = 5;
    static constexpr const char* USER_AGENT               = "Trawl-Crawler/1.0";
    static constexpr const char* DEFAULT_HOST             = "127.0.0.1";
    static constexpr int         DEFAULT_PORT             = 8000;
    static constexpr const char* DEFAULT_STORE_DIR        = "trawl_jobs";
    static constexpr int         DEFAULT_POLITENESS_MS    = 0;
    static constexpr int         WORKER_POLL_INTERVAL_MS  = 50;
    static constexpr int         SINGLE_FLIGHT_POLL_MS    = 10;

    static constexpr int DEFAULT_CRAWL_BATCH_SIZE = 5;
    static constexpr int DEFAULT_MAP_MAX_DEPTH    = 2;
    static constexpr int DEFAULT_MAP_MAX_PAGES    = 50;
    static constexpr int DEFAULT_SEARCH_TOP_K     = 5;
    static constexpr int DEFAULT_RESULTS_LIMIT    = 100;

    static constexpr std::size_t AGENT_CONTENT_LIMIT   = 8000;
    static constexpr std::size_t MIN_PARAGRAPH_LENGTH  = 20;
    static constexpr std::size_t MAX_LINK_TEXT_LENGTH  = 100;

    static constexpr const char* LLM_ENDPOINT     = "https://openrouter.ai/api/v1/chat/completions";
    static constexpr const char* LLM_API_KEY_ENV  = "OPENROUTER_API_KEY";
    static constexpr const char* LLM_MODEL        = "anthropic/claude-3.5-sonnet";
    static constexpr double      LLM_TEMPERATURE  = 0.3;
    static constexpr int         LLM_MAX_TOKENS   = 2048;
};

inline std::chrono::milliseconds get_backoff_time(int attempt, int base_ms = Constants::BACKOFF_BASE_MS) {
    if (attempt <= 0)
        return std::chrono::milliseconds(0);
    return std::chrono::milliseconds(static_cast<long long>(base_ms) * (1LL << (attempt - 1)));
}

}  // namespace Core
}  // namespace Trawl
