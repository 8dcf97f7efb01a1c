// Abstract interface for one connected remote session (SFTP + exec).
// Concrete backends (libssh2, in-memory mock) implement this API so the
// transfer engine stays decoupled from the transport.
#pragma once
#include "SftpTypes.hpp"
#include "TransferError.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <optional>

namespace scpflow {

class RemoteSession {
public:
    virtual ~RemoteSession() = default;

    // Establishes the full hop chain. On failure err.kind is Connect and
    // err.hop_index names the hop that could not be reached.
    virtual bool connect(const HostIdentity& id, TransferError& err) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    // Remote directory listing ("." and ".." are skipped).
    virtual bool list(const std::string& remote_path,
                      std::vector<FileInfo>& out, std::string& err) = 0;

    // Detailed metadata. Returns false with an empty err when the path does
    // not exist.
    virtual bool stat(const std::string& remote_path, FileInfo& info,
                      std::string& err) = 0;

    // Existence check (leaves err empty when the path does not exist).
    virtual bool exists(const std::string& remote_path, bool& isDir,
                        std::string& err) = 0;

    // Download a remote file. With a range, `local` is opened without
    // truncation and the bytes land at range->offset. Without a range the
    // whole file is copied; resume=true continues a partial local file.
    virtual bool get(const std::string& remote, const std::string& local,
                     std::string& err, ProgressFn progress = {},
                     CancelFn shouldCancel = {},
                     std::optional<ByteRange> range = std::nullopt,
                     bool resume = false) = 0;

    // Upload a local file. Same range/resume semantics as get().
    virtual bool put(const std::string& local, const std::string& remote,
                     std::string& err, ProgressFn progress = {},
                     CancelFn shouldCancel = {},
                     std::optional<ByteRange> range = std::nullopt,
                     bool resume = false) = 0;

    // Sets the remote file size, creating the file when missing.
    virtual bool truncate(const std::string& remote_path, std::uint64_t size,
                          std::string& err) = 0;

    // Adjust remote atime/mtime (seconds).
    virtual bool setTimes(const std::string& remote_path, std::uint64_t atime,
                          std::uint64_t mtime, std::string& err) = 0;

    // Sets the permission bits of a remote file (only mode & 0777 is sent).
    virtual bool setPermissions(const std::string& remote_path,
                                std::uint32_t mode, std::string& err) = 0;

    virtual bool mkdir(const std::string& remote_dir, std::string& err,
                       unsigned int mode = 0755) = 0;

    virtual bool removeFile(const std::string& remote_path,
                            std::string& err) = 0;

    virtual bool removeDir(const std::string& remote_dir,
                           std::string& err) = 0;

    virtual bool rename(const std::string& from, const std::string& to,
                        std::string& err, bool overwrite = false) = 0;

    // Runs a shell command on the target. Returns false only when the command
    // could not be run or completed (channel error, timeout, cancel); a
    // nonzero exit status is reported through `out`.
    virtual bool exec(const std::string& command, ExecResult& out,
                      std::string& err,
                      std::chrono::milliseconds timeout =
                          std::chrono::minutes(5),
                      CancelFn shouldCancel = {}) = 0;

    // Asks the operation running on another thread to stop at its next
    // checkpoint. Every get/put/exec starts with the request cleared, and the
    // session stays usable afterwards.
    virtual void interrupt() = 0;
};

using SessionFactory = std::function<std::unique_ptr<RemoteSession>()>;

// Creates missing directories of `remote_dir` one component at a time.
bool ensureRemoteDir(RemoteSession& s, const std::string& remote_dir,
                     std::string& err);

} // namespace scpflow
