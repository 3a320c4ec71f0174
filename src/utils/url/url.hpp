#pragma once
#include <string>

namespace Trawl {
namespace Utils {

struct UrlParsed {
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
    std::string query;
    std::string fragment;
    std::string start_url;
};

class Url {
public:
    static UrlParsed   parse(const std::string& url);
    static std::string resolve(const std::string& base, const std::string& relative);
    static bool        is_same_domain(const std::string& url1, const std::string& url2);
    static bool        is_image(const std::string& url);
    static bool        is_http(const std::string& url);

    // Canonical form used for dedup: lowercase scheme and host, default port
    // dropped, dot segments resolved, trailing slash removed (except "/"),
    // query parameters sorted, fragment stripped. Empty if the URL has no host.
    static std::string normalize(const std::string& url);

    // scheme://host[:port] with the default port omitted.
    static std::string origin(const std::string& url);
    static std::string host(const std::string& url);
    static std::string default_port(const std::string& scheme);
};

}  // namespace Utils
}  // namespace Trawl
