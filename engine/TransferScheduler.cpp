// Queue implementation: a dispatcher thread admits pending tasks by priority
// and launches one worker thread per running task. Workers move bytes through
// the chunked executor over pooled sessions.
#include "TransferScheduler.hpp"
#include "EngineLogging.hpp"
#include "scpflow/DeltaSyncPlanner.hpp"
#include "scpflow/FileTree.hpp"
#include "scpflow/PathUtils.hpp"

#include <QDateTime>
#include <QFileInfo>
#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

namespace scpflow {

namespace {

EngineSettings checkedSettings(EngineSettings s) {
    std::string err;
    if (s.validate(err))
        return s;
    qCWarning(sfXfer) << "Invalid engine settings, using defaults:"
                      << QString::fromStdString(err);
    return EngineSettings();
}

TransferDirection directionOf(const TransferTask& t) {
    return t.type == TransferTask::Type::Upload ? TransferDirection::Upload
                                                : TransferDirection::Download;
}

bool isBefore(const TransferTask& a, const TransferTask& b) {
    if (a.priority != b.priority)
        return static_cast<int>(a.priority) < static_cast<int>(b.priority);
    if (a.createdAtMs != b.createdAtMs)
        return a.createdAtMs < b.createdAtMs;
    return a.id < b.id;
}

TransferError cancelledError() {
    TransferError e;
    e.set(ErrorKind::Cancelled, "Transfer cancelled");
    return e;
}

} // namespace

TransferScheduler::TransferScheduler(SessionPool& pool, EngineSettings settings,
                                     QObject *parent)
    : QObject(parent), pool_(pool), settings_(checkedSettings(std::move(settings))),
      compression_(settings_.compression), verifier_(settings_.verification),
      executor_(pool_, settings_.chunks,
                settings_.compression.file_level_enabled ? &compression_
                                                         : nullptr) {
    maxConcurrent_ = settings_.maxConcurrent;
    dispatcher_ = std::thread(&TransferScheduler::dispatchLoop, this);
}

TransferScheduler::~TransferScheduler() {
    std::vector<std::shared_ptr<TransferControl>> controls;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        stopping_ = true;
        paused_ = true;
        const qint64 nowMs = QDateTime::currentMSecsSinceEpoch();
        for (auto& t : tasks_) {
            if (t.isTerminal())
                continue;
            canceledTasks_.insert(t.id);
            t.status = TransferTask::Status::Cancelled;
            t.speed = 0.0;
            t.completedAtMs = nowMs;
        }
        for (auto& kv : controls_)
            controls.push_back(kv.second);
    }
    for (auto& c : controls)
        c->cancel();
    cv_.notify_all();
    if (dispatcher_.joinable())
        dispatcher_.join();

    std::unordered_map<quint64, std::thread> workersToJoin;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        workersToJoin.swap(workers_);
    }
    for (auto& kv : workersToJoin) {
        if (kv.second.joinable())
            kv.second.join();
    }
    std::lock_guard<std::mutex> lk(subsMtx_);
    for (auto& w : subscribers_) {
        if (auto ch = w.lock())
            ch->close();
    }
}

void TransferScheduler::setMaxConcurrent(int n) {
    if (n < 1)
        n = 1;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        maxConcurrent_ = n;
    }
    cv_.notify_all();
}

quint64 TransferScheduler::submitTask(const TransferRequest& req, QString *err) {
    auto fail = [err](const QString& msg) -> quint64 {
        if (err)
            *err = msg;
        qCWarning(sfXfer) << "submitTask rejected:" << msg;
        return 0;
    };
    if (req.localPath.isEmpty() || req.remotePath.isEmpty())
        return fail(QStringLiteral("Local and remote paths are required"));
    if (req.identity.target.host.empty() || req.identity.target.username.empty())
        return fail(QStringLiteral("Host and user are required"));

    TransferTask t;
    t.type = req.type;
    t.identity = req.identity;
    t.hostName = req.hostName.isEmpty()
                     ? QString::fromStdString(req.identity.target.host)
                     : req.hostName;
    t.localPath = req.localPath;
    t.remotePath = req.remotePath;
    if (req.type == TransferTask::Type::Upload) {
        const QFileInfo fi(req.localPath);
        if (!fi.exists())
            return fail(QStringLiteral("Local path does not exist: %1")
                            .arg(req.localPath));
        t.isDirectory = fi.isDir();
        t.size = t.isDirectory ? 0 : quint64(fi.size());
        t.fileName = fi.fileName();
    } else {
        t.isDirectory = req.isDirectory;
        t.size = req.size;
        t.fileName = QString::fromStdString(
            remoteBaseName(req.remotePath.toStdString()));
    }
    // Delta sync only applies to directory uploads.
    t.deltaSync =
        req.deltaSync && t.isDirectory && t.type == TransferTask::Type::Upload;
    t.priority = req.priority.value_or(priorityForSize(t.size, t.isDirectory));
    t.maxRetries =
        req.maxRetries >= 0 ? req.maxRetries : settings_.retry.maxRetries;
    t.createdAtMs = QDateTime::currentMSecsSinceEpoch();
    {
        std::lock_guard<std::mutex> lk(mtx_);
        t.id = nextId_++;
        tasks_.push_back(t);
        publishState(t);
    }
    cv_.notify_all();
    qCInfo(sfXfer) << "Task submitted"
                   << "taskId=" << t.id << "type=" << transferTypeName(t.type)
                   << "priority=" << transferPriorityName(t.priority)
                   << "size=" << t.size << "dir=" << t.isDirectory;
    emit tasksChanged();
    return t.id;
}

// --------------------------------------------------------------- dispatch

int TransferScheduler::pickNextLocked(qint64 nowMs, qint64& wakeAtMs) const {
    int best = -1;
    for (int i = 0; i < tasks_.size(); ++i) {
        const auto& t = tasks_[i];
        if (t.status != TransferTask::Status::Pending)
            continue;
        // One worker per task: wait for the previous one to be joined.
        if (workers_.count(t.id) > 0)
            continue;
        if (t.nextRetryAtMs > nowMs) {
            if (wakeAtMs == 0 || t.nextRetryAtMs < wakeAtMs)
                wakeAtMs = t.nextRetryAtMs;
            continue;
        }
        if (best < 0 || isBefore(t, tasks_[best]))
            best = i;
    }
    return best;
}

void TransferScheduler::launchLocked(int index) {
    auto& t = tasks_[index];
    t.status = TransferTask::Status::Running;
    t.startedAtMs = QDateTime::currentMSecsSinceEpoch();
    t.completedAtMs = 0;
    t.nextRetryAtMs = 0;
    t.speed = 0.0;
    auto control = std::make_shared<TransferControl>();
    controls_[t.id] = control;
    ++running_;
    workers_[t.id] = std::thread(&TransferScheduler::runWorker, this, t, control);
    publishState(t);
    qCInfo(sfXfer) << "Task admitted"
                   << "taskId=" << t.id << "attempt=" << (t.retryCount + 1)
                   << "running=" << running_;
}

void TransferScheduler::dispatchLoop() {
    std::unique_lock<std::mutex> lk(mtx_);
    while (!stopping_) {
        if (!finishedWorkers_.empty()) {
            std::vector<quint64> ids;
            ids.swap(finishedWorkers_);
            std::vector<std::thread> done;
            for (quint64 id : ids) {
                auto it = workers_.find(id);
                if (it == workers_.end())
                    continue;
                done.push_back(std::move(it->second));
                workers_.erase(it);
            }
            lk.unlock();
            for (auto& th : done) {
                if (th.joinable())
                    th.join();
            }
            lk.lock();
            cv_.notify_all();
            continue;
        }
        const qint64 nowMs = QDateTime::currentMSecsSinceEpoch();
        qint64 wakeAtMs = 0;
        bool launched = false;
        while (!paused_ && running_ < maxConcurrent_.load()) {
            const int idx = pickNextLocked(nowMs, wakeAtMs);
            if (idx < 0)
                break;
            launchLocked(idx);
            launched = true;
        }
        if (launched) {
            lk.unlock();
            emit tasksChanged();
            lk.lock();
            continue;
        }
        if (wakeAtMs > 0) {
            cv_.wait_for(lk, std::chrono::milliseconds(
                                 std::max<qint64>(1, wakeAtMs - nowMs)));
        } else {
            cv_.wait(lk);
        }
    }
}

// ----------------------------------------------------------------- workers

void TransferScheduler::runWorker(TransferTask t,
                                  std::shared_ptr<TransferControl> control) {
    using clock = std::chrono::steady_clock;
    const quint64 taskId = t.id;
    quint64 lastDone = 0;
    auto lastTick = clock::now();
    // Chunk workers report concurrently; the tick state is only touched
    // under mtx_.
    ProgressFn progress = [this, taskId, lastDone,
                           lastTick](std::uint64_t done,
                                     std::uint64_t total) mutable {
        TransferEvent ev;
        ev.kind = TransferEvent::Kind::Progress;
        ev.task_id = taskId;
        ev.status = transferStatusName(TransferTask::Status::Running);
        ev.transferred = done;
        ev.total = total;
        ev.timestamp_ms = QDateTime::currentMSecsSinceEpoch();
        {
            std::lock_guard<std::mutex> lk(mtx_);
            const int i = indexForId(taskId);
            if (i < 0 || tasks_[i].status != TransferTask::Status::Running)
                return;
            const auto now = clock::now();
            const double elapsedSec =
                std::chrono::duration_cast<std::chrono::duration<double>>(
                    now - lastTick)
                    .count();
            if (elapsedSec > 0.000001 && done > lastDone)
                tasks_[i].speed = double(done - lastDone) / elapsedSec;
            lastTick = now;
            lastDone = done;
            tasks_[i].transferred = done;
            if (total > 0)
                tasks_[i].size = total;
            ev.speed = tasks_[i].speed;
        }
        publish(std::move(ev));
        emit tasksChanged();
    };

    Outcome outcome;
    if (!t.isDirectory)
        outcome = runFile(t, *control, progress);
    else if (t.deltaSync)
        outcome = runDeltaSync(t, *control, progress);
    else
        outcome = runDirectory(t, *control, progress);
    finishWorker(taskId, outcome);
}

TransferScheduler::Outcome
TransferScheduler::runFile(const TransferTask& t, TransferControl& control,
                           const ProgressFn& progress) {
    TransferOptions opt;
    opt.retries = settings_.chunks.chunk_retries;
    opt.resume = t.resumeHint;
    opt.preserve_timestamps = settings_.sync.preserve_timestamps;
    opt.preserve_permissions = settings_.sync.preserve_permissions;
    opt.control = &control;
    const TransferResult r = executor_.transferFile(
        t.identity, t.localPath.toStdString(), t.remotePath.toStdString(),
        directionOf(t), opt, progress);
    Outcome out;
    out.bytes = r.bytes;
    if (!r.ok) {
        out.error = r.error;
        return out;
    }
    if (!verifyFile(t, control, out.error))
        return out;
    out.ok = true;
    return out;
}

bool TransferScheduler::verifyFile(const TransferTask& t,
                                   TransferControl& control,
                                   TransferError& err) {
    if (!settings_.verification.enabled)
        return true;
    const QFileInfo fi(t.localPath);
    if (!verifier_.shouldVerify(quint64(fi.size())))
        return true;
    const CancelFn cancel = [&control] { return control.cancelled(); };
    SessionLease lease;
    if (!pool_.lease(t.identity, lease, err, cancel)) {
        if (control.cancelled())
            err = cancelledError();
        return false;
    }
    control.attach(lease.get());
    const bool ok =
        verifier_.verify(directionOf(t), t.localPath.toStdString(),
                         t.remotePath.toStdString(), *lease, err, cancel);
    control.detach(lease.get());
    if (!ok && control.cancelled()) {
        err = cancelledError();
        return false;
    }
    if (!ok && !lease->isConnected())
        lease.markBroken();
    if (ok)
        qCInfo(sfXfer) << "Integrity verified"
                       << "taskId=" << t.id << "algorithm="
                       << digestAlgorithmName(settings_.verification.algorithm);
    return ok;
}

TransferScheduler::Outcome
TransferScheduler::runDirectory(const TransferTask& t, TransferControl& control,
                                const ProgressFn& progress) {
    TransferOptions opt;
    opt.retries = settings_.chunks.chunk_retries;
    opt.preserve_timestamps = settings_.sync.preserve_timestamps;
    opt.preserve_permissions = settings_.sync.preserve_permissions;
    opt.control = &control;
    DirectoryProgressFn dirProgress =
        [&progress](const std::string&, std::uint64_t, std::uint64_t,
                    std::uint64_t overallDone, std::uint64_t overallTotal) {
            if (progress)
                progress(overallDone, overallTotal);
        };
    const TransferResult r = executor_.transferDirectory(
        t.identity, t.localPath.toStdString(), t.remotePath.toStdString(),
        directionOf(t), opt, dirProgress);
    Outcome out;
    out.ok = r.ok;
    out.error = r.error;
    out.bytes = r.bytes;
    return out;
}

// Uploads every planned file first and deletes remote leftovers only when all
// of them succeeded.
TransferScheduler::Outcome
TransferScheduler::runDeltaSync(const TransferTask& t, TransferControl& control,
                                const ProgressFn& progress) {
    Outcome out;
    const CancelFn cancel = [&control] { return control.cancelled(); };
    const std::string localRoot = t.localPath.toStdString();
    const std::string remoteRoot = t.remotePath.toStdString();

    const FileTree localTree = walkLocalTree(localRoot, cancel);
    if (cancel()) {
        out.error = cancelledError();
        return out;
    }
    if (!localTree.complete()) {
        out.error.set(ErrorKind::LocalIo,
                      "Cannot read local directory " +
                          localTree.errors.front().path + ": " +
                          localTree.errors.front().message);
        return out;
    }

    SyncDiff diff;
    {
        SessionLease lease;
        if (!pool_.lease(t.identity, lease, out.error, cancel)) {
            if (cancel())
                out.error = cancelledError();
            return out;
        }
        control.attach(lease.get());
        struct Detach {
            TransferControl& c;
            RemoteSession *s;
            ~Detach() { c.detach(s); }
        } detach{control, lease.get()};

        FileTree remoteTree;
        bool isDir = false;
        std::string e;
        if (lease->exists(remoteRoot, isDir, e)) {
            if (!isDir) {
                out.error.set(ErrorKind::InvalidArgument,
                              remoteRoot + " is not a directory");
                return out;
            }
            remoteTree = walkRemoteTree(*lease, remoteRoot, cancel);
            for (const auto& we : remoteTree.errors)
                qCWarning(sfXfer) << "Remote subtree skipped"
                                  << "taskId=" << t.id << "path="
                                  << QString::fromStdString(we.path)
                                  << "error=" << QString::fromStdString(we.message);
        } else if (!e.empty()) {
            lease.markBroken();
            out.error.set(ErrorKind::Transport, e);
            return out;
        }
        if (cancel()) {
            out.error = cancelledError();
            return out;
        }

        SyncOptions opts = settings_.sync;
        if (opts.compare_method == CompareMethod::Checksum) {
            RemoteSession& session = *lease;
            const DigestAlgorithm algo = settings_.verification.algorithm;
            opts.content_differs = [&, algo](const std::string& rel) {
                std::string localHex, remoteHex, le;
                TransferError re;
                const std::string local = (fs::path(localRoot) / rel).string();
                if (!digestFile(algo, local, localHex, le, cancel) ||
                    !verifier_.remoteDigest(session, joinRemotePath(remoteRoot, rel),
                                            remoteHex, re, cancel)) {
                    // Unknown contents are treated as different.
                    qCWarning(sfXfer) << "Checksum compare failed"
                                      << "path=" << QString::fromStdString(rel)
                                      << QString::fromStdString(
                                             le.empty() ? re.describe() : le);
                    return true;
                }
                return localHex != remoteHex;
            };
        }
        diff = planSync(localTree, remoteTree, opts);
    }
    qCInfo(sfXfer) << "Delta sync planned"
                   << "taskId=" << t.id << "upload=" << diff.to_upload.size()
                   << "delete=" << diff.to_delete.size()
                   << "unchanged=" << diff.unchanged.size();

    const std::uint64_t total = diff.uploadBytes();
    std::uint64_t done = 0;
    TransferOptions opt;
    opt.retries = settings_.chunks.chunk_retries;
    opt.preserve_timestamps = settings_.sync.preserve_timestamps;
    opt.preserve_permissions = settings_.sync.preserve_permissions;
    opt.control = &control;
    bool allUploaded = true;
    for (const auto& up : diff.to_upload) {
        if (cancel()) {
            out.error = cancelledError();
            return out;
        }
        ProgressFn fileProgress = [&](std::uint64_t d, std::uint64_t) {
            if (progress)
                progress(done + d, total);
        };
        const TransferResult r = executor_.transferFile(
            t.identity, (fs::path(localRoot) / up.path).string(),
            joinRemotePath(remoteRoot, up.path), TransferDirection::Upload, opt,
            fileProgress);
        if (!r.ok) {
            if (r.error.kind == ErrorKind::Cancelled) {
                out.error = r.error;
                return out;
            }
            qCWarning(sfXfer) << "Sync upload failed"
                              << "taskId=" << t.id << "path="
                              << QString::fromStdString(up.path)
                              << QString::fromStdString(r.error.describe());
            if (allUploaded) {
                out.error = r.error;
                out.error.message = up.path + ": " + r.error.message;
            }
            allUploaded = false;
            continue;
        }
        done += up.size;
        out.bytes += r.bytes;
    }
    if (!allUploaded) {
        if (!diff.to_delete.empty())
            qCWarning(sfXfer) << "Remote deletions skipped after failed uploads"
                              << "taskId=" << t.id
                              << "pending=" << diff.to_delete.size();
        return out;
    }

    if (!diff.to_delete.empty()) {
        SessionLease lease;
        if (!pool_.lease(t.identity, lease, out.error, cancel)) {
            if (cancel())
                out.error = cancelledError();
            return out;
        }
        for (const auto& del : diff.to_delete) {
            if (cancel()) {
                out.error = cancelledError();
                return out;
            }
            std::string e;
            if (!lease->removeFile(joinRemotePath(remoteRoot, del.path), e)) {
                out.error.set(ErrorKind::Transport,
                              "Could not delete " + del.path + ": " + e);
                return out;
            }
        }
    }
    if (progress)
        progress(total, total);
    out.ok = true;
    return out;
}

void TransferScheduler::finishWorker(quint64 id, const Outcome& outcome) {
    TransferTask snapshot;
    bool found = false;
    bool terminal = false;
    bool explicitlyCanceled = false;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        controls_.erase(id);
        if (running_ > 0)
            --running_;
        finishedWorkers_.push_back(id);
        const int i = indexForId(id);
        if (i >= 0) {
            found = true;
            auto& t = tasks_[i];
            t.speed = 0.0;
            const qint64 nowMs = QDateTime::currentMSecsSinceEpoch();
            explicitlyCanceled = canceledTasks_.count(id) > 0;
            if (explicitlyCanceled || t.status != TransferTask::Status::Running) {
                // Cancelled, paused or resumed while unwinding: the request
                // that stopped the worker already set the state.
            } else if (outcome.ok) {
                t.status = TransferTask::Status::Completed;
                if (t.size == 0)
                    t.size = outcome.bytes;
                t.transferred = std::max<quint64>(t.size, outcome.bytes);
                t.lastError.clear();
                t.lastErrorKind = ErrorKind::None;
                t.resumeHint = false;
                t.completedAtMs = nowMs;
                terminal = true;
            } else if (outcome.error.kind == ErrorKind::Cancelled) {
                t.status = TransferTask::Status::Paused;
                t.resumeHint = true;
            } else {
                t.retryCount += 1;
                t.lastError = QString::fromStdString(outcome.error.describe());
                t.lastErrorKind = outcome.error.kind;
                t.resumeHint = false;
                if (settings_.retry.shouldRetry(t.retryCount, t.maxRetries,
                                                outcome.error.kind)) {
                    const auto delay = settings_.retry.delayFor(t.retryCount);
                    t.status = TransferTask::Status::Pending;
                    t.nextRetryAtMs = nowMs + delay.count();
                    qCInfo(sfXfer) << "Retry scheduled"
                                   << "taskId=" << id
                                   << "retryCount=" << t.retryCount
                                   << "delayMs=" << qint64(delay.count())
                                   << "error=" << t.lastError;
                } else {
                    t.status = TransferTask::Status::Failed;
                    t.completedAtMs = nowMs;
                    terminal = true;
                }
            }
            if (terminal)
                archiveLocked(t);
            snapshot = t;
            if (!explicitlyCanceled)
                publishState(t, t.lastError);
        }
    }
    cv_.notify_all();
    if (!found)
        return;
    qCInfo(sfXfer) << "Worker finished"
                   << "taskId=" << id
                   << "status=" << transferStatusName(snapshot.status)
                   << "bytes=" << outcome.bytes;
    if (terminal)
        emit taskFinished(id, QString::fromLatin1(transferStatusName(snapshot.status)));
    emit tasksChanged();
}

// ------------------------------------------------------------ user actions

int TransferScheduler::indexForId(quint64 id) const {
    for (int i = 0; i < tasks_.size(); ++i)
        if (tasks_[i].id == id)
            return i;
    return -1;
}

void TransferScheduler::interruptTask(quint64 id) {
    std::shared_ptr<TransferControl> control;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = controls_.find(id);
        if (it != controls_.end())
            control = it->second;
    }
    if (control) {
        qCInfo(sfXfer) << "Interrupting worker" << "taskId=" << id;
        control->cancel();
    }
}

bool TransferScheduler::pauseTask(quint64 id) {
    bool changed = false;
    bool wasRunning = false;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        const int i = indexForId(id);
        if (i >= 0 && (tasks_[i].status == TransferTask::Status::Pending ||
                       tasks_[i].status == TransferTask::Status::Running)) {
            wasRunning = tasks_[i].status == TransferTask::Status::Running;
            tasks_[i].status = TransferTask::Status::Paused;
            tasks_[i].speed = 0.0;
            publishState(tasks_[i]);
            changed = true;
        }
    }
    if (!changed)
        return false;
    qCInfo(sfXfer) << "Pause requested" << "taskId=" << id
                   << "wasRunning=" << wasRunning;
    if (wasRunning)
        interruptTask(id);
    emit tasksChanged();
    return true;
}

bool TransferScheduler::resumeTask(quint64 id) {
    bool changed = false;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        const int i = indexForId(id);
        if (i >= 0 && tasks_[i].status == TransferTask::Status::Paused) {
            tasks_[i].status = TransferTask::Status::Pending;
            tasks_[i].resumeHint = true;
            tasks_[i].nextRetryAtMs = 0;
            publishState(tasks_[i]);
            changed = true;
        }
    }
    if (!changed)
        return false;
    cv_.notify_all();
    qCInfo(sfXfer) << "Resume queued" << "taskId=" << id;
    emit tasksChanged();
    return true;
}

bool TransferScheduler::cancelTask(quint64 id) {
    bool transitioned = false;
    TransferTask::Status previous = TransferTask::Status::Pending;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        const int i = indexForId(id);
        if (i >= 0 && !tasks_[i].isTerminal()) {
            auto& t = tasks_[i];
            previous = t.status;
            canceledTasks_.insert(id);
            t.status = TransferTask::Status::Cancelled;
            t.speed = 0.0;
            t.completedAtMs = QDateTime::currentMSecsSinceEpoch();
            archiveLocked(t);
            publishState(t);
            transitioned = true;
        }
    }
    qCInfo(sfXfer) << "cancelTask requested"
                   << "taskId=" << id
                   << "prevStatus=" << transferStatusName(previous)
                   << "transitioned=" << transitioned;
    if (!transitioned)
        return false;
    interruptTask(id);
    cv_.notify_all();
    emit taskFinished(id, QString::fromLatin1(transferStatusName(
                              TransferTask::Status::Cancelled)));
    emit tasksChanged();
    return true;
}

bool TransferScheduler::retryTask(quint64 id) {
    bool changed = false;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        const int i = indexForId(id);
        if (i >= 0 && (tasks_[i].status == TransferTask::Status::Failed ||
                       tasks_[i].status == TransferTask::Status::Cancelled)) {
            auto& t = tasks_[i];
            t.status = TransferTask::Status::Pending;
            t.retryCount = 0;
            t.transferred = 0;
            t.speed = 0.0;
            t.resumeHint = false;
            t.lastError.clear();
            t.lastErrorKind = ErrorKind::None;
            t.startedAtMs = 0;
            t.completedAtMs = 0;
            t.nextRetryAtMs = 0;
            canceledTasks_.erase(id);
            publishState(t);
            changed = true;
        }
    }
    if (!changed)
        return false;
    cv_.notify_all();
    emit tasksChanged();
    return true;
}

void TransferScheduler::pauseAll() {
    std::vector<quint64> running;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        paused_ = true;
        for (auto& t : tasks_) {
            if (t.status == TransferTask::Status::Running) {
                t.status = TransferTask::Status::Paused;
                t.speed = 0.0;
                publishState(t);
                running.push_back(t.id);
            }
        }
    }
    qCInfo(sfXfer) << "pauseAll requested" << "runningTasks=" << running.size();
    for (quint64 id : running)
        interruptTask(id);
    emit tasksChanged();
}

void TransferScheduler::resumeAll() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        paused_ = false;
        for (auto& t : tasks_) {
            if (t.status == TransferTask::Status::Paused) {
                t.status = TransferTask::Status::Pending;
                t.resumeHint = true;
                t.nextRetryAtMs = 0;
                publishState(t);
            }
        }
    }
    cv_.notify_all();
    emit tasksChanged();
}

void TransferScheduler::cancelAll() {
    std::vector<quint64> affected;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        const qint64 nowMs = QDateTime::currentMSecsSinceEpoch();
        for (auto& t : tasks_) {
            if (t.isTerminal())
                continue;
            canceledTasks_.insert(t.id);
            t.status = TransferTask::Status::Cancelled;
            t.speed = 0.0;
            t.completedAtMs = nowMs;
            archiveLocked(t);
            publishState(t);
            affected.push_back(t.id);
        }
    }
    qCInfo(sfXfer) << "cancelAll requested" << "affectedTasks=" << affected.size();
    for (quint64 id : affected)
        interruptTask(id);
    cv_.notify_all();
    for (quint64 id : affected)
        emit taskFinished(id, QString::fromLatin1(transferStatusName(
                                  TransferTask::Status::Cancelled)));
    emit tasksChanged();
}

int TransferScheduler::clearCompleted() {
    int removed = 0;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        QVector<TransferTask> next;
        next.reserve(tasks_.size());
        for (const auto& t : tasks_) {
            if (t.status == TransferTask::Status::Completed) {
                ++removed;
                continue;
            }
            next.push_back(t);
        }
        tasks_.swap(next);
    }
    if (removed > 0)
        emit tasksChanged();
    return removed;
}

// ----------------------------------------------------------- introspection

TransferStats TransferScheduler::stats() const {
    TransferStats s;
    double speedSum = 0.0;
    std::lock_guard<std::mutex> lk(mtx_);
    for (const auto& t : tasks_) {
        switch (t.status) {
        case TransferTask::Status::Pending:
            ++s.pending;
            break;
        case TransferTask::Status::Running:
            ++s.running;
            speedSum += t.speed;
            break;
        case TransferTask::Status::Paused:
            ++s.paused;
            break;
        case TransferTask::Status::Completed:
            ++s.completed;
            break;
        case TransferTask::Status::Failed:
            ++s.failed;
            break;
        case TransferTask::Status::Cancelled:
            ++s.cancelled;
            break;
        }
        s.totalBytes += t.size;
        s.transferredBytes += t.transferred;
    }
    s.total = static_cast<int>(tasks_.size());
    if (s.running > 0)
        s.averageSpeed = speedSum / s.running;
    return s;
}

QVector<TransferTask> TransferScheduler::tasksSnapshot() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return tasks_;
}

std::optional<TransferTask> TransferScheduler::task(quint64 id) const {
    std::lock_guard<std::mutex> lk(mtx_);
    const int i = indexForId(id);
    if (i < 0)
        return std::nullopt;
    return tasks_[i];
}

std::shared_ptr<EventChannel> TransferScheduler::subscribe(std::size_t capacity) {
    auto ch = std::make_shared<EventChannel>(capacity);
    std::lock_guard<std::mutex> lk(subsMtx_);
    subscribers_.push_back(ch);
    return ch;
}

bool TransferScheduler::waitForIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(mtx_);
    return cv_.wait_for(lk, timeout, [this] {
        if (!workers_.empty() || !finishedWorkers_.empty())
            return false;
        for (const auto& t : tasks_) {
            if (t.status == TransferTask::Status::Pending ||
                t.status == TransferTask::Status::Running)
                return false;
        }
        return true;
    });
}

// ------------------------------------------------------------------ events

void TransferScheduler::archiveLocked(const TransferTask& t) {
    history_.add(TransferHistoryRecord::fromTask(t));
}

void TransferScheduler::publish(TransferEvent ev) {
    std::lock_guard<std::mutex> lk(subsMtx_);
    for (auto it = subscribers_.begin(); it != subscribers_.end();) {
        auto ch = it->lock();
        if (!ch) {
            it = subscribers_.erase(it);
            continue;
        }
        ch->publish(ev);
        ++it;
    }
}

void TransferScheduler::publishState(const TransferTask& t,
                                     const QString& message) {
    TransferEvent ev;
    ev.kind = t.isTerminal() ? TransferEvent::Kind::Terminal
                             : TransferEvent::Kind::StateChanged;
    ev.task_id = t.id;
    ev.status = transferStatusName(t.status);
    ev.transferred = t.transferred;
    ev.total = t.size;
    ev.speed = t.speed;
    ev.message = message.toStdString();
    ev.timestamp_ms = QDateTime::currentMSecsSinceEpoch();
    publish(std::move(ev));
}

} // namespace scpflow
