#pragma once
#include <stdexcept>
#include <string>

namespace Trawl {
namespace Core {

// Renderer produced no usable document. Retryable up to the attempt bound.
class RenderError : public std::runtime_error {
public:
    explicit RenderError(const std::string& what) : std::runtime_error(what) {
    }
};

// The page was fetched but content extraction failed.
class ExtractionError : public std::runtime_error {
public:
    explicit ExtractionError(const std::string& what) : std::runtime_error(what) {
    }
};

// Invalid job request. Raised before the job starts.
class JobConfigError : public std::runtime_error {
public:
    explicit JobConfigError(const std::string& what) : std::runtime_error(what) {
    }
};

// A collaborator the whole job depends on is gone. Fails the job.
class JobInternalError : public std::runtime_error {
public:
    explicit JobInternalError(const std::string& what) : std::runtime_error(what) {
    }
};

}  // namespace Core
}  // namespace Trawl
