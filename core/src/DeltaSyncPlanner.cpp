#include "scpflow/DeltaSyncPlanner.hpp"

#include <cstdlib>
#include <regex>

namespace scpflow {

namespace {

struct CompiledPattern {
    std::string raw;
    std::regex re;
    bool valid = false;
};

// A '*' not already preceded by '.' is widened to ".*" (glob style).
std::string widenStars(const std::string& pattern) {
    std::string out;
    out.reserve(pattern.size() + 4);
    for (std::size_t i = 0; i < pattern.size(); ++i) {
        if (pattern[i] == '*' && (i == 0 || pattern[i - 1] != '.'))
            out += ".*";
        else
            out += pattern[i];
    }
    return out;
}

std::vector<CompiledPattern>
compilePatterns(const std::vector<std::string>& patterns) {
    std::vector<CompiledPattern> out;
    out.reserve(patterns.size());
    for (const auto& p : patterns) {
        if (p.empty())
            continue;
        CompiledPattern cp;
        cp.raw = p;
        try {
            cp.re = std::regex(widenStars(p), std::regex::ECMAScript);
            cp.valid = true;
        } catch (const std::regex_error&) {
            cp.valid = false;
        }
        out.push_back(std::move(cp));
    }
    return out;
}

bool matchesAny(const std::string& path,
                const std::vector<CompiledPattern>& patterns) {
    for (const auto& p : patterns) {
        if (p.valid ? std::regex_search(path, p.re)
                    : path.find(p.raw) != std::string::npos)
            return true;
    }
    return false;
}

} // namespace

const char *uploadReasonName(UploadReason r) {
    switch (r) {
    case UploadReason::New:
        return "new";
    case UploadReason::SizeMismatch:
        return "size_mismatch";
    case UploadReason::MtimeNewer:
        return "mtime_newer";
    case UploadReason::ChecksumMismatch:
        return "checksum_mismatch";
    }
    return "unknown";
}

const char *deleteReasonName(DeleteReason) { return "deleted_locally"; }

std::vector<std::string> defaultExcludePatterns() {
    return {"node_modules", "\\.git", "\\.vscode", ".*\\.log"};
}

std::uint64_t SyncDiff::uploadBytes() const {
    std::uint64_t total = 0;
    for (const auto& u : to_upload)
        total += u.size;
    return total;
}

bool isModified(const FileInfo& local, const FileInfo& remote) {
    if (local.size != remote.size)
        return true;
    return std::llabs(local.mtime_ms - remote.mtime_ms) > kMtimeToleranceMs;
}

bool isExcluded(const std::string& relativePath,
                const std::vector<std::string>& patterns) {
    return matchesAny(relativePath, compilePatterns(patterns));
}

SyncDiff planSync(const FileTree& local, const FileTree& remote,
                  const SyncOptions& options) {
    const auto patterns = compilePatterns(options.exclude_patterns);
    const bool byContent = options.compare_method == CompareMethod::Checksum &&
                           static_cast<bool>(options.content_differs);
    SyncDiff diff;

    for (const auto& kv : local.files) {
        const std::string& path = kv.first;
        const FileInfo& lf = kv.second;
        if (matchesAny(path, patterns))
            continue;
        auto rit = remote.files.find(path);
        if (rit == remote.files.end()) {
            diff.to_upload.push_back({path, UploadReason::New, lf.size});
            continue;
        }
        const FileInfo& rf = rit->second;
        if (lf.size != rf.size) {
            diff.to_upload.push_back({path, UploadReason::SizeMismatch, lf.size});
        } else if (byContent) {
            if (options.content_differs(path))
                diff.to_upload.push_back(
                    {path, UploadReason::ChecksumMismatch, lf.size});
            else
                diff.unchanged.push_back(path);
        } else if (isModified(lf, rf) && lf.mtime_ms > rf.mtime_ms) {
            diff.to_upload.push_back({path, UploadReason::MtimeNewer, lf.size});
        } else {
            diff.unchanged.push_back(path);
        }
    }

    if (options.delete_remote) {
        for (const auto& kv : remote.files) {
            if (local.files.count(kv.first) || matchesAny(kv.first, patterns))
                continue;
            diff.to_delete.push_back({kv.first, DeleteReason::DeletedLocally});
        }
    }
    return diff;
}

} // namespace scpflow
