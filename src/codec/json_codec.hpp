#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include "../engine/types.hpp"

namespace Trawl {
namespace Codec {

// ISO-8601 UTC with milliseconds, e.g. 2024-05-01T12:00:00.123Z.
std::string       format_time(Engine::Timestamp ts);
Engine::Timestamp parse_time(const std::string& text);

nlohmann::json to_json(const Engine::JobRequest& request);

// Builds a request of the given mode from an API body. Missing fields take the
// mode's defaults. Throws Core::JobConfigError on wrong types or unknown values.
Engine::JobRequest request_from_json(Engine::Mode mode, const nlohmann::json& body);

// Same, with the mode read from the body's "mode" field.
Engine::JobRequest request_from_json(const nlohmann::json& body);

nlohmann::json to_json(const Engine::PageResult& page);
nlohmann::json to_json(const Engine::PageCounts& counts);
nlohmann::json to_json(const Engine::JobResult& result);

// Inverse of to_json(JobResult). Throws std::runtime_error on malformed records.
Engine::JobResult result_from_json(const nlohmann::json& j);

// Id, mode, status, counts and timestamps only.
nlohmann::json summary_json(const Engine::JobResult& result);

// Serializes with invalid UTF-8 replaced by U+FFFD instead of throwing.
std::string dump(const nlohmann::json& j, int indent = -1);

}  // namespace Codec
}  // namespace Trawl
