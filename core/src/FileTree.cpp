#include "scpflow/FileTree.hpp"
#include "scpflow/LocalFs.hpp"
#include "scpflow/Log.hpp"
#include "scpflow/PathUtils.hpp"
#include "scpflow/RuntimeLogging.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace scpflow {

namespace {

std::string joinRelative(const std::string& base, const std::string& name) {
    return base.empty() ? name : base + "/" + name;
}

void walkLocalDir(const fs::path& root, const std::string& rel, FileTree& tree,
                  const CancelFn& shouldCancel) {
    std::error_code ec;
    fs::directory_iterator it(rel.empty() ? root : root / rel, ec);
    if (ec) {
        tree.errors.push_back({rel, ec.message()});
        return;
    }
    std::vector<std::string> subdirs;
    const fs::directory_iterator end{};
    for (; it != end; it.increment(ec)) {
        if (ec) {
            tree.errors.push_back({rel, ec.message()});
            break;
        }
        if (shouldCancel && shouldCancel())
            return;
        const std::string name = it->path().filename().string();
        std::error_code sec;
        const auto status = it->status(sec);
        if (sec)
            continue;
        if (fs::is_directory(status)) {
            subdirs.push_back(joinRelative(rel, name));
            continue;
        }
        if (!fs::is_regular_file(status))
            continue;
        FileInfo fi;
        fi.name = joinRelative(rel, name);
        fi.size = it->file_size(sec);
        if (sec)
            continue;
        fi.mtime_ms = epochMsFromFileTime(it->last_write_time(sec));
        fi.mode = static_cast<std::uint32_t>(status.permissions());
        tree.files.emplace(fi.name, std::move(fi));
    }
    for (const auto& d : subdirs)
        walkLocalDir(root, d, tree, shouldCancel);
}

void walkRemoteDir(RemoteSession& session, const std::string& root,
                   const std::string& rel, FileTree& tree,
                   const CancelFn& shouldCancel) {
    if (shouldCancel && shouldCancel())
        return;
    std::vector<FileInfo> entries;
    std::string err;
    const std::string dir = rel.empty() ? root : joinRemotePath(root, rel);
    if (!session.list(dir, entries, err)) {
        SCPFLOW_LOGW("skipping unreadable remote directory %s: %s",
                     redactedPath(dir).c_str(), err.c_str());
        tree.errors.push_back({rel, err});
        return;
    }
    for (auto& e : entries) {
        const std::string childRel = joinRelative(rel, e.name);
        if (e.is_dir) {
            walkRemoteDir(session, root, childRel, tree, shouldCancel);
            continue;
        }
        e.name = childRel;
        tree.files.emplace(childRel, std::move(e));
    }
}

} // namespace

FileTree walkLocalTree(const std::string& root, const CancelFn& shouldCancel) {
    FileTree tree;
    walkLocalDir(fs::path(root), std::string(), tree, shouldCancel);
    return tree;
}

FileTree walkRemoteTree(RemoteSession& session, const std::string& root,
                        const CancelFn& shouldCancel) {
    FileTree tree;
    walkRemoteDir(session, root, std::string(), tree, shouldCancel);
    return tree;
}

} // namespace scpflow
