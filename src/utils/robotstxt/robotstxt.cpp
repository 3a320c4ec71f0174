/**
 * WRAPPER AROUND GOOGLE ROBOTSTXT PARSER (https://github.com/google/robotstxt)
 */
#include "robotstxt.hpp"
#include <optional>
#include <vector>
#include "../../core/logger/logger.hpp"
#include "absl/strings/match.h"
#include "robots.h"

namespace Trawl {
namespace Utils {

RobotsTxt RobotsTxt::parse(const std::string& content) {
    RobotsTxt robots;
    robots.content_ = content;
    return robots;
}

RobotsTxt RobotsTxt::allow_all() {
    return RobotsTxt{};
}

bool RobotsTxt::is_allowed(const std::string& user_agent, const std::string& url) const {
    if (content_.empty())
        return true;

    // The matcher only looks at the path of a full URL; give bare paths a dummy origin.
    std::string target = url;
    if (target.empty() || target[0] == '/')
        target = "http://robots.local" + (target.empty() ? std::string("/") : target);

    // Matching is done on the product token, "Trawl-Crawler/1.0" -> "Trawl-Crawler".
    std::string agent = user_agent.substr(0, user_agent.find('/'));

    googlebot::RobotsMatcher matcher;
    return matcher.OneAgentAllowedByRobots(content_, agent, target);
}

namespace {
class CrawlDelayMatcher : public googlebot::RobotsMatcher {
public:
    explicit CrawlDelayMatcher(const std::vector<std::string>& user_agents) {
        InitUserAgentsAndPath(&user_agents, "/");
    }

    double GetDelay(const std::string& content) {
        googlebot::ParseRobotsTxt(content, this);
        if (specific_delay_)
            return *specific_delay_;
        if (global_delay_)
            return *global_delay_;
        return 0.0;
    }

protected:
    void
    HandleUnknownAction(int line_num, absl::string_view action, absl::string_view value) override {
        if (absl::EqualsIgnoreCase(action, "Crawl-delay")) {
            try {
                double delay = std::stod(std::string(value));
                if (seen_specific_agent_)
                    specific_delay_ = delay;
                else if (seen_global_agent_)
                    global_delay_ = delay;
            } catch (const std::exception&) {
                Core::Logger::warn("Ignoring malformed Crawl-delay on line " +
                                   std::to_string(line_num));
            }
        }
        googlebot::RobotsMatcher::HandleUnknownAction(line_num, action, value);
    }

private:
    std::optional<double> global_delay_;
    std::optional<double> specific_delay_;
};
}  // namespace

double RobotsTxt::get_crawl_delay(const std::string& user_agent) const {
    if (content_.empty())
        return 0.0;
    std::vector<std::string> ua_list{user_agent.substr(0, user_agent.find('/'))};
    CrawlDelayMatcher        matcher(ua_list);
    return matcher.GetDelay(content_);
}

}  // namespace Utils
}  // namespace Trawl
