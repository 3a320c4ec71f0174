#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include "../core/types/constants.hpp"
#include "../network/http/http_client.hpp"

namespace Trawl {
namespace Extract {

struct LlmSettings {
    std::string               endpoint    = Core::Constants::LLM_ENDPOINT;
    std::string               api_key_env = Core::Constants::LLM_API_KEY_ENV;
    double                    temperature = Core::Constants::LLM_TEMPERATURE;
    int                       max_tokens  = Core::Constants::LLM_MAX_TOKENS;
    std::chrono::milliseconds timeout{60000};
};

// Instruction-following extraction through an OpenAI-compatible chat
// completions endpoint (OpenRouter by default).
class LlmInstructor {
public:
    LlmInstructor(std::shared_ptr<Network::Http::HttpClient> client, LlmSettings settings);

    // Throws Core::ExtractionError if the key is missing or the call fails.
    boost::asio::awaitable<nlohmann::json> instruct(const std::string& content,
                                                    const std::string& instruction,
                                                    const std::string& model);

    // JSON answer as-is, else the outermost {...} block, else {"raw_response": text}.
    static nlohmann::json parse_answer(const std::string& text);

    static std::string build_prompt(const std::string& content, const std::string& instruction);

private:
    std::shared_ptr<Network::Http::HttpClient> client_;
    LlmSettings                                settings_;
};

}  // namespace Extract
}  // namespace Trawl
