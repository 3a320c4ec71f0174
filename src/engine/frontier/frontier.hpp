#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <queue>
#include <regex>
#include <string>
#include <unordered_set>
#include <vector>
#include "../types.hpp"

namespace Trawl {
namespace Engine {

struct FrontierPolicy {
    int                    max_depth   = 0;
    bool                   same_domain = true;
    std::vector<ScopeRule> scope;
};

// Work queue of one job. Entries pop in (depth, sequence) order; a normalized
// URL is admitted at most once. Thread-safe.
class Frontier {
public:
    explicit Frontier(FrontierPolicy policy);

    // Depth-0 entry. Registers the host for same_domain checks and bypasses scope rules.
    bool seed(const std::string& url);

    bool        push(const std::string& url, int depth, const std::string& parent);
    std::size_t push_all(const std::vector<std::string>& urls, int depth, const std::string& parent);

    std::optional<FrontierEntry> pop();
    std::optional<int>           peek_depth() const;

    std::size_t size() const;
    std::size_t seen_count() const;
    bool        empty() const;
    void        clear();

    bool in_scope(const std::string& url) const;

private:
    struct Later {
        bool operator()(const FrontierEntry& a, const FrontierEntry& b) const {
            if (a.depth != b.depth)
                return a.depth > b.depth;
            return a.sequence > b.sequence;
        }
    };

    struct CompiledRule {
        ScopeRule::Type type;
        std::regex      pattern;
    };

    FrontierPolicy            policy_;
    std::vector<CompiledRule> rules_;

    mutable std::mutex                                                      mutex_;
    std::priority_queue<FrontierEntry, std::vector<FrontierEntry>, Later>   queue_;
    std::unordered_set<std::string>                                         seen_;
    std::unordered_set<std::string>                                         seed_hosts_;
    std::uint64_t                                                           next_sequence_ = 0;

    bool push_locked(const std::string& url, int depth, const std::string& parent);
};

}  // namespace Engine
}  // namespace Trawl
