/**
 * WRAPPER AROUND GOOGLE ROBOTSTXT PARSER (https://github.com/google/robotstxt)
 */
#pragma once

#include <string>

namespace Trawl {
namespace Utils {

class RobotsTxt {
public:
    RobotsTxt() = default;

    static RobotsTxt parse(const std::string& content);

    // Rules that never disallow anything (missing or 4xx robots.txt).
    static RobotsTxt allow_all();

    // Accepts a full URL or a bare path.
    bool   is_allowed(const std::string& user_agent, const std::string& url) const;
    double get_crawl_delay(const std::string& user_agent) const;

    const std::string& content() const {
        return content_;
    }

private:
    std::string content_;
};

}  // namespace Utils
}  // namespace Trawl
