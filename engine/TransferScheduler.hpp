// Transfer queue with concurrent workers, priority admission, retry with
// backoff, pause/resume and cancellation.
#pragma once
#include "EngineSettings.hpp"
#include "TransferHistory.hpp"
#include "TransferTask.hpp"
#include "scpflow/ChunkedTransfer.hpp"
#include "scpflow/CompressionStrategy.hpp"
#include "scpflow/EventChannel.hpp"
#include "scpflow/IntegrityVerifier.hpp"
#include "scpflow/SessionPool.hpp"

#include <QObject>
#include <QString>
#include <QVector>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace scpflow {

class TransferScheduler : public QObject {
    Q_OBJECT
public:
    // The pool is not owned and must outlive the scheduler.
    explicit TransferScheduler(SessionPool& pool,
                               EngineSettings settings = EngineSettings(),
                               QObject *parent = nullptr);
    ~TransferScheduler() override;

    const EngineSettings& settings() const { return settings_; }

    void setMaxConcurrent(int n);
    int maxConcurrent() const { return maxConcurrent_.load(); }

    // Returns the new task id, or 0 when the request is invalid (err set).
    quint64 submitTask(const TransferRequest& req, QString *err = nullptr);

    bool pauseTask(quint64 id);
    bool resumeTask(quint64 id);
    // Accepted from any non-terminal state.
    bool cancelTask(quint64 id);
    // Manual retry of a failed or cancelled task: counters start over.
    bool retryTask(quint64 id);

    void pauseAll();
    void resumeAll();
    void cancelAll();

    // Drops completed tasks from the queue. Returns how many were removed.
    int clearCompleted();

    TransferStats stats() const;
    QVector<TransferTask> tasksSnapshot() const;
    std::optional<TransferTask> task(quint64 id) const;
    QVector<TransferHistoryRecord> history() const { return history_.records(); }

    // New observer channel; it receives every event published from now on.
    std::shared_ptr<EventChannel> subscribe(std::size_t capacity = 256);

    // Waits until no task is pending or running and every worker has
    // exited. Paused tasks do not keep the queue busy.
    bool waitForIdle(std::chrono::milliseconds timeout);

signals:
    // Emitted whenever the task list or a task's state changes
    void tasksChanged();
    void taskFinished(quint64 id, const QString& status);

private:
    struct Outcome {
        bool ok = false;
        TransferError error;
        quint64 bytes = 0;
    };

    void dispatchLoop();
    // Caller holds mtx_. Returns the index of the next task to admit or -1;
    // `wakeAtMs` receives the earliest pending retry time.
    int pickNextLocked(qint64 nowMs, qint64& wakeAtMs) const;
    void launchLocked(int index);

    void runWorker(TransferTask t, std::shared_ptr<TransferControl> control);
    Outcome runFile(const TransferTask& t, TransferControl& control,
                    const ProgressFn& progress);
    Outcome runDirectory(const TransferTask& t, TransferControl& control,
                         const ProgressFn& progress);
    Outcome runDeltaSync(const TransferTask& t, TransferControl& control,
                         const ProgressFn& progress);
    bool verifyFile(const TransferTask& t, TransferControl& control,
                    TransferError& err);
    void finishWorker(quint64 id, const Outcome& outcome);

    int indexForId(quint64 id) const;
    void interruptTask(quint64 id);
    void archiveLocked(const TransferTask& t);
    void publish(TransferEvent ev);
    void publishState(const TransferTask& t, const QString& message = QString());

    SessionPool& pool_;
    const EngineSettings settings_;
    const CompressionStrategy compression_;
    const IntegrityVerifier verifier_;
    ChunkedTransferExecutor executor_;

    std::atomic<int> maxConcurrent_{2};
    std::atomic<bool> paused_{false};

    // mtx_ protects tasks_, canceledTasks_, controls_ and workers_
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    QVector<TransferTask> tasks_;
    std::unordered_set<quint64> canceledTasks_;
    std::unordered_map<quint64, std::shared_ptr<TransferControl>> controls_;
    std::unordered_map<quint64, std::thread> workers_;
    std::vector<quint64> finishedWorkers_;
    int running_ = 0;
    quint64 nextId_ = 1;
    bool stopping_ = false;

    TransferHistory history_;

    std::mutex subsMtx_;
    std::vector<std::weak_ptr<EventChannel>> subscribers_;

    std::thread dispatcher_;
};

} // namespace scpflow
