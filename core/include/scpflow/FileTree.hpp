// Recursive snapshots of a local or remote directory tree.
// A snapshot holds files only, keyed by path relative to the root, plus the
// subtrees that could not be read.
#pragma once
#include "RemoteSession.hpp"
#include "SftpTypes.hpp"

#include <map>
#include <string>
#include <vector>

namespace scpflow {

struct TreeWalkError {
    std::string path; // relative directory that could not be read ("" = root)
    std::string message;
};

struct FileTree {
    std::map<std::string, FileInfo> files;
    std::vector<TreeWalkError> errors;

    bool complete() const { return errors.empty(); }
};

// Depth-first walk of a local directory. Unreadable directories are recorded
// in `errors` and skipped.
FileTree walkLocalTree(const std::string& root,
                       const CancelFn& shouldCancel = {});

// Depth-first walk of a remote directory. A failed listing omits that subtree
// and never aborts the scan.
FileTree walkRemoteTree(RemoteSession& session, const std::string& root,
                        const CancelFn& shouldCancel = {});

} // namespace scpflow
