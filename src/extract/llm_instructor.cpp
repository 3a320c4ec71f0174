#include "llm_instructor.hpp"
#include <cstdlib>
#include "../codec/json_codec.hpp"
#include "../core/errors/errors.hpp"
#include "../core/logger/logger.hpp"
#include "../utils/text/string_utils.hpp"

namespace Trawl {
namespace Extract {

using namespace Trawl::Core;

namespace {

constexpr const char* SYSTEM_PROMPT =
    "You are a precise data extraction expert. "
    "Extract ONLY the requested information. "
    "Return valid JSON. Be accurate and concise.";

}  // namespace

LlmInstructor::LlmInstructor(std::shared_ptr<Network::Http::HttpClient> client, LlmSettings settings)
    : client_(std::move(client)), settings_(std::move(settings)) {
}

std::string LlmInstructor::build_prompt(const std::string& content, const std::string& instruction) {
    return "Extract Information Request\n"
           "==========================================\n"
           "Task: " +
           instruction +
           "\n\n"
           "Content to analyze:\n" +
           content +
           "\n\n"
           "Guidelines:\n"
           "1. Extract ONLY what was requested\n"
           "2. Return valid JSON format\n"
           "3. If information not found, indicate as null\n"
           "4. Be precise and accurate\n"
           "5. Use the exact structure requested";
}

nlohmann::json LlmInstructor::parse_answer(const std::string& text) {
    if (Utils::Text::trim(text).empty())
        return nlohmann::json::object();

    auto whole = nlohmann::json::parse(text, nullptr, false);
    if (!whole.is_discarded())
        return whole;

    auto start = text.find('{');
    auto end   = text.rfind('}');
    if (start != std::string::npos && end != std::string::npos && end > start) {
        auto block = nlohmann::json::parse(text.substr(start, end - start + 1), nullptr, false);
        if (!block.is_discarded())
            return block;
    }
    return {{"raw_response", text}};
}

boost::asio::awaitable<nlohmann::json> LlmInstructor::instruct(const std::string& content,
                                                               const std::string& instruction,
                                                               const std::string& model) {
    const char* key = std::getenv(settings_.api_key_env.c_str());
    if (!key || std::string(key).empty())
        throw ExtractionError(settings_.api_key_env + " environment variable not set");

    nlohmann::json body = {
        {"model", model},
        {"temperature", settings_.temperature},
        {"max_tokens", settings_.max_tokens},
        {"messages",
         {{{"role", "system"}, {"content", SYSTEM_PROMPT}},
          {{"role", "user"}, {"content", build_prompt(content, instruction)}}}}};

    Network::Http::RequestOptions options;
    options.timeout      = settings_.timeout;
    options.content_type = "application/json";
    options.headers.emplace_back("Authorization", std::string("Bearer ") + key);
    options.headers.emplace_back("X-Title", "Trawl");

    Logger::info("Agent: asking " + model);
    Response res = co_await client_->post(settings_.endpoint, Codec::dump(body), options);
    if (!res.error.empty())
        throw ExtractionError("LLM request failed: " + res.error);
    if (res.status_code >= 400) {
        throw ExtractionError("LLM HTTP " + std::to_string(res.status_code) + ": " +
                              Utils::Text::truncate_utf8(res.body, 300));
    }

    auto reply = nlohmann::json::parse(res.body, nullptr, false);
    if (reply.is_discarded())
        throw ExtractionError("LLM returned malformed JSON");
    try {
        const auto& message = reply.at("choices").at(0).at("message");
        co_return parse_answer(message.value("content", ""));
    } catch (const nlohmann::json::exception& e) {
        throw ExtractionError(std::string("LLM reply missing choices: ") + e.what());
    }
}

}  // namespace Extract
}  // namespace Trawl
