// Small path helpers for POSIX-style remote paths and shell commands.
#pragma once
#include <string>

namespace scpflow {

inline std::string joinRemotePath(const std::string& base,
                                  const std::string& name) {
    if (base.empty())
        return std::string("/") + name;
    if (base.back() == '/')
        return base + name;
    return base + "/" + name;
}

// "/a/b/c.txt" -> "/a/b"; "c.txt" -> ""; "/c.txt" -> "/"
inline std::string remoteParent(const std::string& path) {
    const auto pos = path.find_last_of('/');
    if (pos == std::string::npos)
        return {};
    if (pos == 0)
        return "/";
    return path.substr(0, pos);
}

inline std::string remoteBaseName(const std::string& path) {
    const auto pos = path.find_last_of('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

// Lower-cased extension including the dot ("" when there is none).
std::string lowerExtension(const std::string& path);

// Quotes an argument for a POSIX shell: 'it'\''s'
std::string shellQuote(const std::string& arg);

} // namespace scpflow
