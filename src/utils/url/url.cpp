#include "url.hpp"
#include <algorithm>
#include <sstream>
#include <string_view>
#include <vector>
#include "../text/string_utils.hpp"

namespace Trawl {
namespace Utils {

namespace {

const std::vector<std::string>& get_image_extensions() {
    static const std::vector<std::string> extensions = {
        ".jpg", ".jpeg", ".png", ".gif", ".bmp", ".webp", ".svg", ".ico", ".tiff", ".avif"};
    return extensions;
}

std::string clean_host(std::string h) {
    if (!h.empty() && h.back() == '.')
        h.pop_back();
    return Text::to_lower(h);
}

std::string remove_dot_segments(const std::string& path) {
    std::vector<std::string> segments;
    std::stringstream        ss(path);
    std::string              segment;
    while (std::getline(ss, segment, '/')) {
        if (segment == "." || segment.empty())
            continue;
        if (segment == "..") {
            if (!segments.empty())
                segments.pop_back();
            continue;
        }
        segments.push_back(segment);
    }

    std::string normalized_path = "/";
    for (size_t i = 0; i < segments.size(); ++i) {
        normalized_path += segments[i];
        if (i < segments.size() - 1)
            normalized_path += "/";
    }
    if (path.length() > 1 && path.back() == '/' && normalized_path.back() != '/') {
        normalized_path += "/";
    }
    return normalized_path;
}

}  // namespace

UrlParsed Url::parse(const std::string& url) {
    UrlParsed parsed;
    parsed.start_url = url;

    if (url.empty()) {
        parsed.path = "/";
        return parsed;
    }

    std::string_view sv = url;

    size_t colon       = sv.find(':');
    size_t first_slash = sv.find('/');
    size_t first_q     = sv.find('?');
    size_t first_h     = sv.find('#');
    bool   has_scheme  = (colon != std::string_view::npos);
    if (has_scheme && first_slash != std::string_view::npos && colon > first_slash)
        has_scheme = false;
    if (has_scheme && first_q != std::string_view::npos && colon > first_q)
        has_scheme = false;
    if (has_scheme && first_h != std::string_view::npos && colon > first_h)
        has_scheme = false;

    if (has_scheme) {
        parsed.scheme = std::string(sv.substr(0, colon));
        sv.remove_prefix(colon + 1);
    }

    if (sv.size() >= 2 && sv[0] == '/' && sv[1] == '/') {
        sv.remove_prefix(2);
        size_t      end_auth  = sv.find_first_of("/?#");
        std::string authority = std::string(sv.substr(0, end_auth));

        if (end_auth != std::string_view::npos) {
            sv.remove_prefix(end_auth);
        }
        else {
            sv = "";
        }

        if (!authority.empty()) {
            size_t      at = authority.find_last_of('@');
            std::string host_port =
                (at != std::string::npos) ? authority.substr(at + 1) : authority;

            if (!host_port.empty() && host_port[0] == '[') {
                size_t end_bracket = host_port.find(']');
                if (end_bracket != std::string::npos) {
                    parsed.host    = host_port.substr(0, end_bracket + 1);
                    size_t p_colon = host_port.find(':', end_bracket + 1);
                    if (p_colon != std::string::npos) {
                        parsed.port = host_port.substr(p_colon + 1);
                    }
                }
                else {
                    parsed.host = host_port;
                }
            }
            else {
                size_t p_colon = host_port.find_last_of(':');
                if (p_colon != std::string::npos) {
                    parsed.host = host_port.substr(0, p_colon);
                    parsed.port = host_port.substr(p_colon + 1);
                }
                else {
                    parsed.host = host_port;
                }
            }
        }
    }

    size_t h_pos = sv.find('#');
    if (h_pos != std::string_view::npos) {
        parsed.fragment = std::string(sv.substr(h_pos + 1));
        sv              = sv.substr(0, h_pos);
    }

    size_t q_pos = sv.find('?');
    if (q_pos != std::string_view::npos) {
        parsed.query = std::string(sv.substr(q_pos + 1));
        sv           = sv.substr(0, q_pos);
    }

    parsed.path = std::string(sv);

    if (parsed.path.empty())
        parsed.path = "/";
    return parsed;
}

std::string Url::resolve(const std::string& base, const std::string& relative) {
    if (relative.empty())
        return base;

    if (relative[0] == '#') {
        size_t frag = base.find('#');
        if (frag == std::string::npos)
            return base + relative;
        return base.substr(0, frag) + relative;
    }

    if (relative[0] == '?') {
        size_t q   = base.find_first_of("?#");
        return (q == std::string::npos ? base : base.substr(0, q)) + relative;
    }

    if (relative.find("://") != std::string::npos)
        return relative;

    size_t colon_pos = relative.find(':');
    size_t slash_pos = relative.find('/');
    if (colon_pos != std::string::npos
        && (slash_pos == std::string::npos || colon_pos < slash_pos))
        return "";  // mailto:, javascript:, tel: ...

    UrlParsed   baseParsed = parse(base);
    std::string auth       = baseParsed.host;
    if (!baseParsed.port.empty())
        auth += ":" + baseParsed.port;

    if (relative.substr(0, 2) == "//") {
        return baseParsed.scheme + ":" + relative;
    }

    std::string result;
    if (relative[0] == '/') {
        result = baseParsed.scheme + "://" + auth + relative;
    }
    else {
        std::string dir       = baseParsed.path;
        size_t      lastSlash = dir.find_last_of('/');
        dir = (lastSlash != std::string::npos) ? dir.substr(0, lastSlash + 1) : "/";
        result = baseParsed.scheme + "://" + auth + dir + relative;
    }

    size_t scheme_end = result.find("://");
    size_t domain_end = (scheme_end == std::string::npos) ? 0 : result.find('/', scheme_end + 3);
    if (domain_end == std::string::npos)
        domain_end = result.length();

    std::string path = result.substr(domain_end);
    std::string query_frag;
    size_t      qf = path.find_first_of("?#");
    if (qf != std::string::npos) {
        query_frag = path.substr(qf);
        path       = path.substr(0, qf);
    }

    return result.substr(0, domain_end) + remove_dot_segments(path) + query_frag;
}

bool Url::is_same_domain(const std::string& url1, const std::string& url2) {
    return clean_host(parse(url1).host) == clean_host(parse(url2).host);
}

bool Url::is_image(const std::string& url) {
    std::string path = Text::to_lower(parse(url).path);
    for (const auto& ext : get_image_extensions()) {
        if (Text::ends_with(path, ext))
            return true;
    }
    return false;
}

bool Url::is_http(const std::string& url) {
    UrlParsed   p      = parse(url);
    std::string scheme = Text::to_lower(p.scheme);
    return (scheme == "http" || scheme == "https") && !p.host.empty();
}

std::string Url::default_port(const std::string& scheme) {
    if (scheme == "http")
        return "80";
    if (scheme == "https")
        return "443";
    return "";
}

std::string Url::normalize(const std::string& url) {
    UrlParsed p = parse(Text::trim(url));
    if (p.host.empty())
        return "";

    std::string scheme = Text::to_lower(p.scheme);
    std::string result = scheme + "://" + clean_host(p.host);
    if (!p.port.empty() && p.port != default_port(scheme))
        result += ":" + p.port;

    std::string path = remove_dot_segments(p.path);
    if (path.size() > 1 && path.back() == '/')
        path.pop_back();
    result += path;

    if (!p.query.empty()) {
        std::vector<std::string> params;
        std::stringstream        ss(p.query);
        std::string              param;
        while (std::getline(ss, param, '&')) {
            if (!param.empty())
                params.push_back(param);
        }
        std::sort(params.begin(), params.end());
        for (size_t i = 0; i < params.size(); ++i) {
            result += (i == 0 ? "?" : "&") + params[i];
        }
    }
    return result;
}

std::string Url::origin(const std::string& url) {
    UrlParsed   p      = parse(url);
    std::string scheme = Text::to_lower(p.scheme);
    std::string result = scheme + "://" + clean_host(p.host);
    if (!p.port.empty() && p.port != default_port(scheme))
        result += ":" + p.port;
    return result;
}

std::string Url::host(const std::string& url) {
    return clean_host(parse(url).host);
}

}  // namespace Utils
}  // namespace Trawl
