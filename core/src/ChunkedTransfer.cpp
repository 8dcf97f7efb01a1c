// Chunked transfer executor: single-stream and ranged parallel transfers over
// pooled sessions, with per-chunk retry and throttled progress.
#include "scpflow/ChunkedTransfer.hpp"
#include "scpflow/FileTree.hpp"
#include "scpflow/LocalFs.hpp"
#include "scpflow/Log.hpp"
#include "scpflow/PathUtils.hpp"
#include "scpflow/RuntimeLogging.hpp"

#include <algorithm>
#include <deque>
#include <filesystem>
#include <thread>

namespace fs = std::filesystem;

namespace scpflow {

namespace {

// Spaces progress callbacks at least `interval` apart; the first report and
// the completion report always go through.
class ProgressThrottle {
public:
    ProgressThrottle(ProgressFn fn, std::chrono::milliseconds interval)
        : fn_(std::move(fn)), interval_(interval) {}

    void report(std::uint64_t done, std::uint64_t total) {
        if (!fn_)
            return;
        const auto now = std::chrono::steady_clock::now();
        const bool complete = done >= total;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (complete) {
                if (completeSent_)
                    return;
                completeSent_ = true;
            } else if (started_ && now - last_ < interval_) {
                return;
            }
            started_ = true;
            last_ = now;
        }
        fn_(done, total);
    }

private:
    ProgressFn fn_;
    std::chrono::milliseconds interval_;
    std::mutex mtx_;
    std::chrono::steady_clock::time_point last_{};
    bool started_ = false;
    bool completeSent_ = false;
};

// Keeps a leased session reachable by TransferControl::cancel().
struct AttachGuard {
    AttachGuard(TransferControl *c, RemoteSession *s) : control(c), session(s) {
        if (control && session)
            control->attach(session);
    }
    ~AttachGuard() {
        if (control && session)
            control->detach(session);
    }
    AttachGuard(const AttachGuard&) = delete;
    AttachGuard& operator=(const AttachGuard&) = delete;

    TransferControl *control;
    RemoteSession *session;
};

// Temporary gzip artifact, removed whatever the outcome.
struct ArtifactGuard {
    std::string path;
    ~ArtifactGuard() {
        if (path.empty())
            return;
        std::error_code ec;
        fs::remove(path, ec);
        if (ec)
            SCPFLOW_LOGW("could not remove artifact %s: %s", path.c_str(),
                         ec.message().c_str());
    }
};

std::uint64_t scaled(std::uint64_t done, std::uint64_t of, std::uint64_t to) {
    if (of == 0 || of == to)
        return done;
    return static_cast<std::uint64_t>(static_cast<long double>(done) * to / of);
}

} // namespace

bool ChunkSettings::validate(std::string& err) const {
    if (chunk_size == 0) {
        err = "Chunk size must be positive";
        return false;
    }
    if (max_concurrent < 1) {
        err = "At least one chunk must be allowed in flight";
        return false;
    }
    if (chunk_retries < 0) {
        err = "Chunk retries cannot be negative";
        return false;
    }
    if (progress_interval.count() < 0) {
        err = "Progress interval cannot be negative";
        return false;
    }
    return true;
}

std::vector<ChunkRecord> splitIntoChunks(std::uint64_t fileSize,
                                         std::uint64_t chunkSize) {
    std::vector<ChunkRecord> out;
    if (chunkSize == 0)
        return out;
    out.reserve(static_cast<std::size_t>((fileSize + chunkSize - 1) / chunkSize));
    for (std::uint64_t off = 0; off < fileSize; off += chunkSize) {
        ChunkRecord c;
        c.index = static_cast<int>(out.size());
        c.offset = off;
        c.length = std::min(chunkSize, fileSize - off);
        out.push_back(c);
    }
    return out;
}

// ------------------------------------------------------------ TransferControl

void TransferControl::cancel() {
    cancelled_ = true;
    std::lock_guard<std::mutex> lk(mtx_);
    for (RemoteSession *s : sessions_)
        s->interrupt();
}

void TransferControl::attach(RemoteSession *s) {
    std::lock_guard<std::mutex> lk(mtx_);
    sessions_.push_back(s);
    if (cancelled_)
        s->interrupt();
}

void TransferControl::detach(RemoteSession *s) {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = std::find(sessions_.begin(), sessions_.end(), s);
    if (it != sessions_.end())
        sessions_.erase(it);
}

// ---------------------------------------------------- ChunkedTransferExecutor

struct ChunkedTransferExecutor::Job {
    Job(const HostIdentity& id, ProgressFn fn, std::chrono::milliseconds every)
        : identity(id), throttle(std::move(fn), every) {}

    const HostIdentity& identity;
    std::string local;
    std::string remote;
    TransferDirection direction = TransferDirection::Upload;
    TransferOptions options;
    int retries = 0;
    CancelFn cancel;

    // Size of the file as the caller sees it, and of the bytes actually moved
    // (smaller for a gzip artifact).
    std::uint64_t size = 0;
    std::uint64_t payload_size = 0;
    std::int64_t source_mtime_ms = 0;
    std::uint32_t source_mode = 0;

    ProgressThrottle throttle;
    TransferResult result;

    bool upload() const { return direction == TransferDirection::Upload; }

    void report(std::uint64_t payloadDone) {
        throttle.report(scaled(payloadDone, payload_size, size), size);
    }
};

ChunkedTransferExecutor::ChunkedTransferExecutor(
    SessionPool& pool, ChunkSettings settings,
    const CompressionStrategy *compression)
    : pool_(pool), settings_(settings), compression_(compression) {}

bool ChunkedTransferExecutor::shouldChunk(std::uint64_t size) const {
    return settings_.enabled && size > 0 && size >= settings_.threshold;
}

bool ChunkedTransferExecutor::leaseFor(const Job& job, SessionLease& lease,
                                       TransferError& err,
                                       const CancelFn& extraCancel) {
    const bool ok = pool_.lease(job.identity, lease, err, [&] {
        return job.cancel() || (extraCancel && extraCancel());
    });
    if (!ok && job.cancel())
        err.set(ErrorKind::Cancelled, "Transfer cancelled");
    return ok;
}

bool ChunkedTransferExecutor::prepareTarget(Job& job, const std::string& target,
                                            TransferError& err) {
    std::string e;
    if (!job.upload()) {
        if (!ensureLocalParentDir(target, e) ||
            !preallocateLocalFile(target, job.payload_size, e)) {
            err.set(ErrorKind::LocalIo, e);
            return false;
        }
        return true;
    }
    SessionLease lease;
    if (!leaseFor(job, lease, err))
        return false;
    const std::string parent = remoteParent(target);
    if (!parent.empty() && !ensureRemoteDir(*lease, parent, e)) {
        err.set(ErrorKind::Transport, e);
        return false;
    }
    if (!lease->truncate(target, job.payload_size, e)) {
        lease.markBroken();
        err.set(ErrorKind::Transport, "Could not size remote file: " + e);
        return false;
    }
    return true;
}

bool ChunkedTransferExecutor::runSingle(Job& job, const std::string& source,
                                        const std::string& target,
                                        TransferError& err) {
    std::string e;
    if (!job.upload() && !ensureLocalParentDir(target, e)) {
        err.set(ErrorKind::LocalIo, e);
        return false;
    }
    // A resumed stream reports against the bytes still missing.
    auto onProgress = [&job](std::uint64_t done, std::uint64_t remaining) {
        const std::uint64_t skipped =
            remaining < job.payload_size ? job.payload_size - remaining : 0;
        job.report(skipped + done);
    };
    for (int attempt = 0;; ++attempt) {
        SessionLease lease;
        if (!leaseFor(job, lease, err))
            return false;
        if (job.upload()) {
            const std::string parent = remoteParent(target);
            if (!parent.empty() && !ensureRemoteDir(*lease, parent, e)) {
                err.set(ErrorKind::Transport, e);
                return false;
            }
        }
        AttachGuard attached(job.options.control, lease.get());
        const bool resume = job.options.resume || attempt > 0;
        e.clear();
        const bool ok =
            job.upload()
                ? lease->put(source, target, e, onProgress, job.cancel,
                             std::nullopt, resume)
                : lease->get(source, target, e, onProgress, job.cancel,
                             std::nullopt, resume);
        if (ok)
            return true;
        if (job.cancel()) {
            err.set(ErrorKind::Cancelled, "Transfer cancelled");
            return false;
        }
        lease.markBroken();
        if (attempt >= job.retries) {
            err.set(ErrorKind::Transport, e);
            return false;
        }
        SCPFLOW_LOGW("%s of %s failed (attempt %d of %d), retrying: %s",
                     directionName(job.direction), redactedPath(target).c_str(),
                     attempt + 1, job.retries + 1, e.c_str());
    }
}

bool ChunkedTransferExecutor::runChunked(Job& job, const std::string& source,
                                         const std::string& target,
                                         TransferError& err) {
    if (!prepareTarget(job, target, err))
        return false;

    std::vector<ChunkRecord> chunks =
        splitIntoChunks(job.payload_size, settings_.chunk_size);
    job.result.chunked = true;
    job.result.chunk_count = chunks.size();

    std::mutex mtx;
    std::deque<int> queue;
    for (const auto& c : chunks)
        queue.push_back(c.index);
    const int workerCount = static_cast<int>(std::min<std::size_t>(
        static_cast<std::size_t>(settings_.max_concurrent), chunks.size()));
    int alive = workerCount;
    TransferError failure;
    std::atomic<bool> abort{false};

    auto fail = [&](const TransferError& why) {
        std::lock_guard<std::mutex> lk(mtx);
        if (failure.ok())
            failure = why;
        abort = true;
    };
    auto cancelled = [&] {
        if (!job.cancel())
            return false;
        TransferError why;
        why.set(ErrorKind::Cancelled, "Transfer cancelled");
        fail(why);
        return true;
    };
    auto queueEmpty = [&] {
        std::lock_guard<std::mutex> lk(mtx);
        return queue.empty();
    };
    const CancelFn stopChunk = [&] { return abort.load() || job.cancel(); };

    SCPFLOW_LOGI("%s of %s in %zu chunks, %d in flight",
                 directionName(job.direction), redactedPath(target).c_str(),
                 chunks.size(), workerCount);

    auto worker = [&] {
        SessionLease lease;
        for (;;) {
            if (cancelled() || abort)
                break;
            if (!lease) {
                TransferError le;
                if (!leaseFor(job, lease, le,
                              [&] { return abort.load() || queueEmpty(); })) {
                    if (cancelled() || abort || queueEmpty())
                        break;
                    // Other workers carry on; the last one reports the error.
                    std::lock_guard<std::mutex> lk(mtx);
                    if (--alive == 0 && !queue.empty()) {
                        if (failure.ok())
                            failure = le;
                        abort = true;
                    } else {
                        SCPFLOW_LOGW("chunk worker could not connect: %s",
                                     le.describe().c_str());
                    }
                    return;
                }
            }
            int idx = -1;
            {
                std::lock_guard<std::mutex> lk(mtx);
                if (queue.empty())
                    break;
                idx = queue.front();
                queue.pop_front();
                chunks[idx].status = ChunkStatus::Active;
                chunks[idx].transferred = 0;
                ++chunks[idx].attempts;
            }
            const ByteRange range{chunks[idx].offset, chunks[idx].length};
            auto onProgress = [&, idx](std::uint64_t done, std::uint64_t) {
                std::uint64_t sum = 0;
                {
                    std::lock_guard<std::mutex> lk(mtx);
                    chunks[idx].transferred = done;
                    for (const auto& c : chunks)
                        sum += c.transferred;
                }
                job.report(sum);
            };
            std::string e;
            bool ok = false;
            {
                AttachGuard attached(job.options.control, lease.get());
                ok = job.upload() ? lease->put(source, target, e, onProgress,
                                               stopChunk, range)
                                  : lease->get(source, target, e, onProgress,
                                               stopChunk, range);
            }
            bool exhausted = false;
            {
                std::lock_guard<std::mutex> lk(mtx);
                ChunkRecord& chunk = chunks[idx];
                if (ok) {
                    chunk.status = ChunkStatus::Done;
                    chunk.transferred = chunk.length;
                    continue;
                }
                chunk.status = ChunkStatus::Pending;
                chunk.transferred = 0;
                if (job.cancel() || abort)
                    break;
                if (chunk.attempts > job.retries) {
                    chunk.status = ChunkStatus::Failed;
                    if (failure.ok())
                        failure.set(ErrorKind::Transport,
                                    "chunk " + std::to_string(idx) +
                                        " at offset " +
                                        std::to_string(chunk.offset) +
                                        " failed after " +
                                        std::to_string(chunk.attempts) +
                                        " attempts: " + e);
                    abort = true;
                    exhausted = true;
                } else {
                    SCPFLOW_LOGW("chunk %d failed (attempt %d), retrying: %s",
                                 idx, chunk.attempts, e.c_str());
                    queue.push_front(idx);
                }
            }
            // The pool takes its own lock, so the chunk lock is dropped first.
            lease.markBroken();
            lease.release();
            if (exhausted)
                break;
        }
        std::lock_guard<std::mutex> lk(mtx);
        --alive;
    };

    std::vector<std::thread> threads;
    threads.reserve(static_cast<std::size_t>(workerCount));
    for (int i = 0; i < workerCount; ++i)
        threads.emplace_back(worker);
    for (auto& t : threads)
        t.join();

    if (job.cancel()) {
        err.set(ErrorKind::Cancelled, "Transfer cancelled");
        return false;
    }
    if (!failure.ok()) {
        err = failure;
        return false;
    }
    for (const auto& c : chunks) {
        if (c.status != ChunkStatus::Done) {
            err.set(ErrorKind::Transport,
                    "chunk " + std::to_string(c.index) + " did not complete");
            return false;
        }
    }
    return true;
}

bool ChunkedTransferExecutor::moveBytes(Job& job, const std::string& source,
                                        const std::string& target,
                                        TransferError& err) {
    if (shouldChunk(job.payload_size))
        return runChunked(job, source, target, err);
    return runSingle(job, source, target, err);
}

bool ChunkedTransferExecutor::uploadCompressed(Job& job, TransferError& err) {
    {
        SessionLease lease;
        if (!leaseFor(job, lease, err))
            return false;
        TransferError checkErr;
        const bool available = compression_->remoteCanDecompress(*lease, checkErr);
        if (!checkErr.ok()) {
            lease.markBroken();
            err = checkErr;
            return false;
        }
        if (!available)
            return false;
    }

    ArtifactGuard artifact;
    if (!compression_->compressFile(job.local, artifact.path, err, job.cancel))
        return false;
    std::error_code ec;
    const std::uint64_t packed = fs::file_size(artifact.path, ec);
    if (ec) {
        err.set(ErrorKind::LocalIo, "Cannot size compressed artifact: " +
                                        ec.message());
        return false;
    }
    SCPFLOW_LOGI("compressed %s: %llu -> %llu bytes",
                 redactedPath(job.local).c_str(),
                 static_cast<unsigned long long>(job.size),
                 static_cast<unsigned long long>(packed));

    const std::string remoteGz = CompressionStrategy::compressedName(job.remote);
    job.payload_size = packed;
    if (!moveBytes(job, artifact.path, remoteGz, err))
        return false;

    SessionLease lease;
    if (!leaseFor(job, lease, err))
        return false;
    if (!compression_->decompressRemote(*lease, remoteGz, err, job.cancel)) {
        if (err.kind == ErrorKind::Transport)
            lease.markBroken();
        std::string e;
        if (lease->isConnected() && !lease->removeFile(remoteGz, e))
            SCPFLOW_LOGW("could not remove %s: %s", redactedPath(remoteGz).c_str(),
                         e.c_str());
        return false;
    }
    job.result.compressed = true;
    return true;
}

void ChunkedTransferExecutor::applyTimestamps(Job& job) {
    if (job.source_mtime_ms <= 0)
        return;
    std::string e;
    if (!job.upload()) {
        if (!setLocalMtimeMs(job.local, job.source_mtime_ms, e))
            SCPFLOW_LOGW("failed to set mtime of %s: %s",
                         redactedPath(job.local).c_str(), e.c_str());
        return;
    }
    SessionLease lease;
    TransferError le;
    if (!leaseFor(job, lease, le)) {
        SCPFLOW_LOGW("failed to set remote mtime: %s", le.describe().c_str());
        return;
    }
    const auto secs = static_cast<std::uint64_t>(job.source_mtime_ms / 1000);
    if (!lease->setTimes(job.remote, secs, secs, e))
        SCPFLOW_LOGW("failed to set mtime of %s: %s",
                     redactedPath(job.remote).c_str(), e.c_str());
}

void ChunkedTransferExecutor::applyPermissions(Job& job) {
    if (job.source_mode == 0)
        return;
    std::string e;
    if (!job.upload()) {
        if (!setLocalPermissions(job.local, job.source_mode, e))
            SCPFLOW_LOGW("failed to set mode of %s: %s",
                         redactedPath(job.local).c_str(), e.c_str());
        return;
    }
    SessionLease lease;
    TransferError le;
    if (!leaseFor(job, lease, le)) {
        SCPFLOW_LOGW("failed to set remote mode: %s", le.describe().c_str());
        return;
    }
    if (!lease->setPermissions(job.remote, job.source_mode, e))
        SCPFLOW_LOGW("failed to set mode of %s: %s",
                     redactedPath(job.remote).c_str(), e.c_str());
}

TransferResult ChunkedTransferExecutor::transferFile(
    const HostIdentity& identity, const std::string& localPath,
    const std::string& remotePath, TransferDirection direction,
    const TransferOptions& options, const ProgressFn& progress,
    const CancelFn& shouldCancel) {
    Job job(identity, progress, settings_.progress_interval);
    job.local = localPath;
    job.remote = remotePath;
    job.direction = direction;
    job.options = options;
    job.retries = options.retries >= 0 ? options.retries : settings_.chunk_retries;
    TransferControl *control = options.control;
    job.cancel = [shouldCancel, control] {
        return (control && control->cancelled()) ||
               (shouldCancel && shouldCancel());
    };

    TransferError& err = job.result.error;
    if (job.upload()) {
        std::error_code ec;
        job.size = fs::file_size(localPath, ec);
        if (ec) {
            err.set(ErrorKind::LocalIo,
                    "Cannot read local file " + localPath + ": " + ec.message());
            return job.result;
        }
        const auto mtime = fs::last_write_time(localPath, ec);
        if (!ec)
            job.source_mtime_ms = epochMsFromFileTime(mtime);
        std::string e;
        if (options.preserve_permissions &&
            !localPermissions(localPath, job.source_mode, e))
            SCPFLOW_LOGW("%s", e.c_str());
    } else {
        SessionLease lease;
        if (!leaseFor(job, lease, err))
            return job.result;
        FileInfo info;
        std::string e;
        if (!lease->stat(remotePath, info, e)) {
            err.set(ErrorKind::Transport,
                    e.empty() ? "Remote file not found: " + remotePath : e);
            return job.result;
        }
        if (info.is_dir) {
            err.set(ErrorKind::InvalidArgument,
                    remotePath + " is a directory");
            return job.result;
        }
        job.size = info.size;
        job.source_mtime_ms = info.mtime_ms;
        job.source_mode = info.mode & 0777;
    }
    job.payload_size = job.size;

    bool ok = false;
    bool done = false;
    if (job.upload() && options.allow_compression && compression_ &&
        compression_->isEligible(localPath, job.size)) {
        ok = uploadCompressed(job, err);
        done = ok || !err.ok();
        if (!done) {
            SCPFLOW_LOGI("remote cannot gunzip, uploading %s uncompressed",
                         redactedPath(localPath).c_str());
            job.payload_size = job.size;
        }
    }
    if (!done) {
        ok = job.upload() ? moveBytes(job, localPath, remotePath, err)
                          : moveBytes(job, remotePath, localPath, err);
    }
    if (!ok) {
        if (err.ok())
            err.set(ErrorKind::Transport, "Transfer failed");
        return job.result;
    }
    if (options.preserve_timestamps || !job.upload())
        applyTimestamps(job);
    if (options.preserve_permissions)
        applyPermissions(job);
    job.throttle.report(job.size, job.size);
    job.result.ok = true;
    job.result.bytes = job.size;
    return job.result;
}

TransferResult ChunkedTransferExecutor::transferDirectory(
    const HostIdentity& identity, const std::string& localDir,
    const std::string& remoteDir, TransferDirection direction,
    const TransferOptions& options, const DirectoryProgressFn& progress,
    const CancelFn& shouldCancel) {
    TransferResult total;
    TransferControl *control = options.control;
    const CancelFn cancel = [shouldCancel, control] {
        return (control && control->cancelled()) ||
               (shouldCancel && shouldCancel());
    };

    FileTree tree;
    {
        SessionLease lease;
        if (!pool_.lease(identity, lease, total.error, cancel)) {
            if (cancel())
                total.error.set(ErrorKind::Cancelled, "Transfer cancelled");
            return total;
        }
        std::string e;
        if (direction == TransferDirection::Upload) {
            tree = walkLocalTree(localDir, cancel);
            if (!tree.complete()) {
                total.error.set(ErrorKind::LocalIo,
                                "Cannot read local directory " +
                                    tree.errors.front().path + ": " +
                                    tree.errors.front().message);
                return total;
            }
            if (!ensureRemoteDir(*lease, remoteDir, e)) {
                total.error.set(ErrorKind::Transport, e);
                return total;
            }
        } else {
            tree = walkRemoteTree(*lease, remoteDir, cancel);
            if (!tree.complete()) {
                total.error.set(ErrorKind::Transport,
                                "Cannot read remote directory " +
                                    tree.errors.front().path + ": " +
                                    tree.errors.front().message);
                return total;
            }
            std::error_code ec;
            fs::create_directories(localDir, ec);
            if (ec) {
                total.error.set(ErrorKind::LocalIo,
                                "Could not create " + localDir + ": " +
                                    ec.message());
                return total;
            }
        }
    }

    std::uint64_t overallTotal = 0;
    for (const auto& kv : tree.files)
        overallTotal += kv.second.size;
    std::uint64_t overallDone = 0;

    for (const auto& kv : tree.files) {
        const std::string& rel = kv.first;
        if (cancel()) {
            total.error.set(ErrorKind::Cancelled, "Transfer cancelled");
            return total;
        }
        const std::string local = (fs::path(localDir) / rel).string();
        const std::string remote = joinRemotePath(remoteDir, rel);
        ProgressFn fileProgress;
        if (progress) {
            fileProgress = [&](std::uint64_t done, std::uint64_t fileTotal) {
                progress(rel, done, fileTotal, overallDone + done, overallTotal);
            };
        }
        TransferResult r = transferFile(identity, local, remote, direction,
                                        options, fileProgress, shouldCancel);
        if (!r.ok) {
            total.error = r.error;
            if (r.error.kind != ErrorKind::Cancelled)
                total.error.message = rel + ": " + r.error.message;
            return total;
        }
        overallDone += kv.second.size;
        total.bytes += r.bytes;
        total.chunk_count += r.chunk_count;
        total.chunked = total.chunked || r.chunked;
        total.compressed = total.compressed || r.compressed;
    }
    if (progress)
        progress(std::string(), 0, 0, overallDone, overallTotal);
    total.ok = true;
    return total;
}

} // namespace scpflow
