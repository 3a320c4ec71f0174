#include "frontier.hpp"
#include "../../utils/url/url.hpp"

namespace Trawl {
namespace Engine {

Frontier::Frontier(FrontierPolicy policy) : policy_(std::move(policy)) {
    for (const auto& rule : policy_.scope) {
        rules_.push_back({rule.type, std::regex(rule.pattern)});
    }
}

bool Frontier::in_scope(const std::string& url) const {
    bool has_allow = false;
    bool allowed   = false;
    for (const auto& rule : rules_) {
        bool matches = std::regex_search(url, rule.pattern);
        if (rule.type == ScopeRule::Type::Deny) {
            if (matches)
                return false;
        }
        else {
            has_allow = true;
            allowed   = allowed || matches;
        }
    }
    return !has_allow || allowed;
}

bool Frontier::seed(const std::string& url) {
    std::string normalized = Utils::Url::normalize(url);
    if (normalized.empty() || !Utils::Url::is_http(normalized))
        return false;

    std::lock_guard<std::mutex> lock(mutex_);
    seed_hosts_.insert(Utils::Url::host(normalized));
    if (!seen_.insert(normalized).second)
        return false;
    queue_.push(FrontierEntry{normalized, 0, "", next_sequence_++});
    return true;
}

bool Frontier::push_locked(const std::string& url, int depth, const std::string& parent) {
    if (depth < 0 || depth > policy_.max_depth)
        return false;

    std::string normalized = Utils::Url::normalize(url);
    if (normalized.empty() || !Utils::Url::is_http(normalized))
        return false;
    if (seen_.count(normalized))
        return false;
    if (policy_.same_domain && !seed_hosts_.count(Utils::Url::host(normalized)))
        return false;
    if (!in_scope(normalized))
        return false;

    seen_.insert(normalized);
    queue_.push(FrontierEntry{normalized, depth, parent, next_sequence_++});
    return true;
}

bool Frontier::push(const std::string& url, int depth, const std::string& parent) {
    std::lock_guard<std::mutex> lock(mutex_);
    return push_locked(url, depth, parent);
}

std::size_t
Frontier::push_all(const std::vector<std::string>& urls, int depth, const std::string& parent) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t                 admitted = 0;
    for (const auto& url : urls) {
        if (push_locked(url, depth, parent))
            ++admitted;
    }
    return admitted;
}

std::optional<FrontierEntry> Frontier::pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty())
        return std::nullopt;
    FrontierEntry entry = queue_.top();
    queue_.pop();
    return entry;
}

std::optional<int> Frontier::peek_depth() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty())
        return std::nullopt;
    return queue_.top().depth;
}

std::size_t Frontier::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

std::size_t Frontier::seen_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return seen_.size();
}

bool Frontier::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.empty();
}

void Frontier::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_ = {};
}

}  // namespace Engine
}  // namespace Trawl
