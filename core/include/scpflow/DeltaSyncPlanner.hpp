// Delta sync planning: compares a local and a remote snapshot and decides
// which files to upload, delete or leave alone. Pure: no I/O.
#pragma once
#include "FileTree.hpp"

#include <functional>
#include <string>
#include <vector>

namespace scpflow {

enum class CompareMethod { Mtime, Checksum };

enum class UploadReason { New, SizeMismatch, MtimeNewer, ChecksumMismatch };
enum class DeleteReason { DeletedLocally };

const char *uploadReasonName(UploadReason r);
const char *deleteReasonName(DeleteReason r);

std::vector<std::string> defaultExcludePatterns();

struct SyncOptions {
    bool delete_remote = false;
    std::vector<std::string> exclude_patterns = defaultExcludePatterns();
    CompareMethod compare_method = CompareMethod::Mtime;
    // Set the remote mtime to the local one after each upload.
    bool preserve_timestamps = false;
    // Copy local permission bits to each uploaded file.
    bool preserve_permissions = false;
    // Checksum method only: returns true when contents of a same-size pair
    // differ. Without it the method falls back to the mtime rule.
    std::function<bool(const std::string& relativePath)> content_differs;
};

struct UploadEntry {
    std::string path;
    UploadReason reason = UploadReason::New;
    std::uint64_t size = 0;
};

struct DeleteEntry {
    std::string path;
    DeleteReason reason = DeleteReason::DeletedLocally;
};

struct SyncDiff {
    std::vector<UploadEntry> to_upload;
    std::vector<DeleteEntry> to_delete;
    std::vector<std::string> unchanged;

    bool empty() const { return to_upload.empty() && to_delete.empty(); }
    std::uint64_t uploadBytes() const;
};

// Modification tolerance between local and remote clocks.
constexpr std::int64_t kMtimeToleranceMs = 1000;

// Size difference, or mtimes further apart than the tolerance.
bool isModified(const FileInfo& local, const FileInfo& remote);

// Pattern semantics: regular expression searched anywhere in the relative
// path; a '*' not preceded by '.' is widened to ".*". Invalid expressions
// fall back to a substring test.
bool isExcluded(const std::string& relativePath,
                const std::vector<std::string>& patterns);

SyncDiff planSync(const FileTree& local, const FileTree& remote,
                  const SyncOptions& options);

} // namespace scpflow
