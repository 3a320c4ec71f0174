#include "string_utils.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace Trawl {
namespace Utils {
namespace Text {

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (std::string::npos == first) {
        return "";
    }
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, (last - first + 1));
}

std::string to_lower(const std::string& str) {
    std::string lower = str;
    std::transform(
        lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
    return lower;
}

bool starts_with(const std::string& str, const std::string& prefix) {
    return str.rfind(prefix, 0) == 0;
}

bool ends_with(const std::string& str, const std::string& suffix) {
    if (suffix.size() > str.size())
        return false;
    return std::equal(suffix.rbegin(), suffix.rend(), str.rbegin());
}

std::string collapse_whitespace(const std::string& str) {
    std::string out;
    out.reserve(str.size());
    bool pending_space = false;
    for (unsigned char c : str) {
        if (std::isspace(c)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out += ' ';
            pending_space = false;
        }
        out += static_cast<char>(c);
    }
    return out;
}

std::string collapse_blank_lines(const std::string& str) {
    std::string out;
    out.reserve(str.size());
    size_t newlines = 0;
    for (char c : str) {
        if (c == '\n') {
            if (++newlines > 2)
                continue;
        }
        else if (c != '\r') {
            newlines = 0;
        }
        out += c;
    }
    return out;
}

std::vector<std::string> split(const std::string& str, char delim) {
    std::vector<std::string> parts;
    std::stringstream        ss(str);
    std::string              part;
    while (std::getline(ss, part, delim)) {
        parts.push_back(part);
    }
    return parts;
}

std::vector<std::string> tokenize(const std::string& str) {
    std::vector<std::string> tokens;
    std::string              current;
    for (unsigned char c : str) {
        if (!std::isspace(c)) {
            current += static_cast<char>(std::tolower(c));
        }
        else if (!current.empty()) {
            tokens.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty())
        tokens.push_back(std::move(current));
    return tokens;
}

std::string truncate_utf8(const std::string& str, size_t max_len) {
    if (str.size() <= max_len)
        return str;
    size_t cut = max_len;
    while (cut > 0 && (static_cast<unsigned char>(str[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return str.substr(0, cut);
}

std::string sanitize_utf8(const std::string& str) {
    static const char REPLACEMENT[] = "\xEF\xBF\xBD";

    std::string out;
    out.reserve(str.size());
    size_t i = 0;
    while (i < str.size()) {
        unsigned char c   = static_cast<unsigned char>(str[i]);
        size_t        len = 0;
        unsigned char lo  = 0x80, hi = 0xBF;
        if (c < 0x80) {
            out += static_cast<char>(c);
            ++i;
            continue;
        } else if (c >= 0xC2 && c <= 0xDF) {
            len = 2;
        } else if (c >= 0xE0 && c <= 0xEF) {
            len = 3;
            if (c == 0xE0)
                lo = 0xA0;
            else if (c == 0xED)
                hi = 0x9F;
        } else if (c >= 0xF0 && c <= 0xF4) {
            len = 4;
            if (c == 0xF0)
                lo = 0x90;
            else if (c == 0xF4)
                hi = 0x8F;
        }

        bool valid = len > 0 && i + len <= str.size();
        for (size_t k = 1; valid && k < len; ++k) {
            unsigned char cc = static_cast<unsigned char>(str[i + k]);
            if (k == 1 ? (cc < lo || cc > hi) : (cc & 0xC0) != 0x80)
                valid = false;
        }
        if (valid) {
            out.append(str, i, len);
            i += len;
        } else {
            out += REPLACEMENT;
            ++i;
        }
    }
    return out;
}

}  // namespace Text
}  // namespace Utils
}  // namespace Trawl
