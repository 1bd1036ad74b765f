#pragma once
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace api {

inline std::string get_env(const char* key, const std::string& fallback) {
    const char* value = std::getenv(key);
    if (!value) return fallback;
    return std::string(value);
}

inline std::string trim_right_slash(std::string s) {
    while (!s.empty() && s.back() == '/') s.pop_back();
    return s;
}

inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

inline std::string trim(const std::string& s) {
    auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

// True for absolute http:// or https:// URLs with a non-empty host part.
inline bool is_http_url(const std::string& url) {
    std::string lower = to_lower(url.substr(0, 8));
    std::size_t scheme = 0;
    if (lower.rfind("http://", 0) == 0) {
        scheme = 7;
    } else if (lower.rfind("https://", 0) == 0) {
        scheme = 8;
    } else {
        return false;
    }
    return url.size() > scheme && url[scheme] != '/';
}

} // namespace api
