// Chunked transfer executor: moves one file (or a directory, file by file)
// over sessions leased from a SessionPool. Large files are split into byte
// ranges moved in parallel, each range over its own session.
#pragma once
#include "CompressionStrategy.hpp"
#include "SessionPool.hpp"
#include "TransferError.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace scpflow {

struct ChunkSettings {
    bool enabled = true;
    // Files at or above this size are chunked.
    std::uint64_t threshold = 100ull * 1024 * 1024;
    std::uint64_t chunk_size = 10ull * 1024 * 1024;
    // Chunks in flight per file.
    int max_concurrent = 5;
    // In-place retries of a failing chunk or stream.
    int chunk_retries = 3;
    // Minimum spacing of progress callbacks (completion is always reported).
    std::chrono::milliseconds progress_interval{5000};

    bool validate(std::string& err) const;
};

enum class ChunkStatus { Pending, Active, Done, Failed };

struct ChunkRecord {
    int index = 0;
    std::uint64_t offset = 0;
    std::uint64_t length = 0;
    std::uint64_t transferred = 0;
    ChunkStatus status = ChunkStatus::Pending;
    int attempts = 0;
};

// Contiguous, non-overlapping ranges covering [0, fileSize). The last chunk
// may be shorter. A zero-byte file yields no chunks.
std::vector<ChunkRecord> splitIntoChunks(std::uint64_t fileSize,
                                         std::uint64_t chunkSize);

// Cancellation handle shared between the owner of a transfer and the threads
// doing it. cancel() also interrupts every session currently attached.
class TransferControl {
public:
    void cancel();
    bool cancelled() const { return cancelled_.load(); }

    void attach(RemoteSession *s);
    void detach(RemoteSession *s);

private:
    std::atomic<bool> cancelled_{false};
    std::mutex mtx_;
    std::vector<RemoteSession *> sessions_;
};

struct TransferOptions {
    // Overrides ChunkSettings::chunk_retries when >= 0.
    int retries = -1;
    bool allow_compression = true;
    // Continue a partial single-stream transfer.
    bool resume = false;
    // Uploads: set the remote mtime to the local one. Downloads always keep
    // the remote mtime.
    bool preserve_timestamps = false;
    // Copy the source permission bits (mode & 0777) to the destination.
    bool preserve_permissions = false;
    TransferControl *control = nullptr;
};

struct TransferResult {
    bool ok = false;
    TransferError error;
    std::uint64_t bytes = 0;
    bool chunked = false;
    bool compressed = false;
    std::size_t chunk_count = 0;
};

// Directory progress: the file in flight plus totals over the whole tree.
using DirectoryProgressFn = std::function<void(
    const std::string & /*relativePath*/, std::uint64_t /*fileDone*/,
    std::uint64_t /*fileTotal*/, std::uint64_t /*overallDone*/,
    std::uint64_t /*overallTotal*/)>;

class ChunkedTransferExecutor {
public:
    ChunkedTransferExecutor(SessionPool& pool, ChunkSettings settings = {},
                            const CompressionStrategy *compression = nullptr);

    const ChunkSettings& settings() const { return settings_; }

    bool shouldChunk(std::uint64_t size) const;

    TransferResult transferFile(const HostIdentity& identity,
                                const std::string& localPath,
                                const std::string& remotePath,
                                TransferDirection direction,
                                const TransferOptions& options = {},
                                const ProgressFn& progress = {},
                                const CancelFn& shouldCancel = {});

    // Recurses file by file, creating directories on the destination side.
    // Stops at the first failing file.
    TransferResult transferDirectory(const HostIdentity& identity,
                                     const std::string& localDir,
                                     const std::string& remoteDir,
                                     TransferDirection direction,
                                     const TransferOptions& options = {},
                                     const DirectoryProgressFn& progress = {},
                                     const CancelFn& shouldCancel = {});

private:
    struct Job;

    bool leaseFor(const Job& job, SessionLease& lease, TransferError& err,
                  const CancelFn& extraCancel = {});
    bool prepareTarget(Job& job, const std::string& target, TransferError& err);
    bool runSingle(Job& job, const std::string& source,
                   const std::string& target, TransferError& err);
    bool runChunked(Job& job, const std::string& source,
                    const std::string& target, TransferError& err);
    bool moveBytes(Job& job, const std::string& source,
                   const std::string& target, TransferError& err);
    // Returns false with err.ok() when the remote cannot gunzip.
    bool uploadCompressed(Job& job, TransferError& err);
    void applyTimestamps(Job& job);
    void applyPermissions(Job& job);

    SessionPool& pool_;
    ChunkSettings settings_;
    const CompressionStrategy *compression_;
};

} // namespace scpflow
