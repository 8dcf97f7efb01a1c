// Local filesystem helpers used by the executor and the tree walker.
#pragma once
#include <cstdint>
#include <filesystem>
#include <string>

namespace scpflow {

std::int64_t epochMsFromFileTime(std::filesystem::file_time_type t);

bool setLocalMtimeMs(const std::string& path, std::int64_t mtime_ms,
                     std::string& err);

// Permission bits (mode & 0777) of a local file.
bool localPermissions(const std::string& path, std::uint32_t& mode,
                      std::string& err);
bool setLocalPermissions(const std::string& path, std::uint32_t mode,
                         std::string& err);

// Creates the parent directories of `path` when missing.
bool ensureLocalParentDir(const std::string& path, std::string& err);

// Creates or truncates `path` and sets its length to `size`, so chunk
// writers can open it without truncation.
bool preallocateLocalFile(const std::string& path, std::uint64_t size,
                          std::string& err);

} // namespace scpflow
