// Helpers shared by every RemoteSession backend.
#include "scpflow/RemoteSession.hpp"
#include "scpflow/PathUtils.hpp"

#include <cctype>
#include <sstream>

namespace scpflow {

std::string lowerExtension(const std::string& path) {
    const std::string base = remoteBaseName(path);
    const auto dot = base.find_last_of('.');
    if (dot == std::string::npos || dot == 0)
        return {};
    std::string ext = base.substr(dot);
    for (char& c : ext)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return ext;
}

std::string shellQuote(const std::string& arg) {
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'')
            out += "'\\''";
        else
            out += c;
    }
    out += "'";
    return out;
}

bool ensureRemoteDir(RemoteSession& s, const std::string& remote_dir,
                     std::string& err) {
    if (remote_dir.empty() || remote_dir == "/")
        return true;
    std::string cur = remote_dir.front() == '/' ? "" : ".";
    std::stringstream parts(remote_dir);
    std::string part;
    while (std::getline(parts, part, '/')) {
        if (part.empty())
            continue;
        cur = cur.empty() ? "/" + part : cur + "/" + part;
        bool isDir = false;
        std::string e;
        const bool ex = s.exists(cur, isDir, e);
        if (!e.empty()) {
            err = e;
            return false;
        }
        if (ex) {
            if (!isDir) {
                err = "Not a directory: " + cur;
                return false;
            }
            continue;
        }
        if (!s.mkdir(cur, err, 0755))
            return false;
    }
    return true;
}

} // namespace scpflow
