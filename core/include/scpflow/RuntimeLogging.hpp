// Log redaction policy for the core.
// Host names, user names and directory parts of paths stay out of the log
// unless SCPFLOW_ENV names a development environment and
// SCPFLOW_LOG_SENSITIVE is set. Redacted values keep their shape (hop count,
// file name) so logs remain useful.
#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace scpflow {

namespace detail {

inline std::string envLower(const char *name) {
    const char *raw = std::getenv(name);
    std::string v = raw ? raw : "";
    v.erase(std::remove_if(v.begin(), v.end(),
                           [](unsigned char c) { return std::isspace(c); }),
            v.end());
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return v;
}

} // namespace detail

inline bool sensitiveLoggingEnabled() {
    const std::string env = detail::envLower("SCPFLOW_ENV");
    if (env != "dev" && env != "development" && env != "local")
        return false;
    const std::string flag = detail::envLower("SCPFLOW_LOG_SENSITIVE");
    return flag == "1" || flag == "true" || flag == "yes" || flag == "on";
}

// "alice@a:22>bob@b:2222" -> "hop0>hop1"
inline std::string redactedIdentity(const std::string& key) {
    if (sensitiveLoggingEnabled())
        return key;
    const auto hops = std::count(key.begin(), key.end(), '>') + 1;
    std::string out;
    for (long i = 0; i < hops; ++i) {
        if (i > 0)
            out += '>';
        out += "hop" + std::to_string(i);
    }
    return out;
}

// "/srv/www/index.html" -> ".../index.html"
inline std::string redactedPath(const std::string& path) {
    if (sensitiveLoggingEnabled())
        return path;
    const auto slash = path.find_last_of("/\\");
    if (slash == std::string::npos)
        return path;
    return ".../" + path.substr(slash + 1);
}

} // namespace scpflow
