// Transfer queue element and the request used to create one.
// Represents an upload or download (file or directory) with its state,
// counters and retry bookkeeping.
#pragma once
#include "scpflow/SftpTypes.hpp"
#include "scpflow/TransferError.hpp"

#include <QString>
#include <QtGlobal>
#include <optional>

namespace scpflow {

struct TransferTask {
    enum class Type { Upload, Download };
    enum class Priority { High, Normal, Low };
    // Task state:
    //  - Pending: queued, waiting for admission (or for its retry delay)
    //  - Running: a worker owns it
    //  - Paused: stopped by the user, resumable
    //  - Completed / Failed / Cancelled: terminal
    enum class Status { Pending, Running, Paused, Completed, Failed, Cancelled };

    quint64 id = 0; // stable id for cross-thread updates
    Type type = Type::Upload;
    Priority priority = Priority::Normal;
    HostIdentity identity;
    QString hostName; // display name
    QString localPath;
    QString remotePath;
    QString fileName;
    quint64 size = 0;
    bool isDirectory = false;
    bool deltaSync = false;

    Status status = Status::Pending;
    quint64 transferred = 0;
    double speed = 0.0; // bytes/s, last measured
    int retryCount = 0;
    int maxRetries = 3;
    bool resumeHint = false; // continue a partial stream on the next run
    QString lastError;
    ErrorKind lastErrorKind = ErrorKind::None;

    qint64 createdAtMs = 0;
    qint64 startedAtMs = 0;
    qint64 completedAtMs = 0;
    qint64 nextRetryAtMs = 0; // 0 = eligible now

    bool isTerminal() const {
        return status == Status::Completed || status == Status::Failed ||
               status == Status::Cancelled;
    }
};

const char *transferStatusName(TransferTask::Status st);
const char *transferPriorityName(TransferTask::Priority p);
const char *transferTypeName(TransferTask::Type t);

// Size classes: < 1 MiB high, < 100 MiB normal, otherwise low. Directories
// are normal.
TransferTask::Priority priorityForSize(quint64 size, bool isDirectory);

struct TransferRequest {
    TransferTask::Type type = TransferTask::Type::Upload;
    HostIdentity identity;
    QString hostName;
    QString localPath;
    QString remotePath;
    // Uploads read both from the local path; downloads take them as given.
    quint64 size = 0;
    bool isDirectory = false;
    // Directory uploads only: plan against the remote tree first.
    bool deltaSync = false;
    std::optional<TransferTask::Priority> priority;
    // < 0: RetryPolicy::maxRetries
    int maxRetries = -1;
};

struct TransferStats {
    int pending = 0;
    int running = 0;
    int paused = 0;
    int completed = 0;
    int failed = 0;
    int cancelled = 0;
    int total = 0;
    quint64 totalBytes = 0;
    quint64 transferredBytes = 0;
    double averageSpeed = 0.0; // mean of running tasks, bytes/s
};

} // namespace scpflow
