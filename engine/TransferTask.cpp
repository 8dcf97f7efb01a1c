#include "TransferTask.hpp"

namespace scpflow {

const char *transferStatusName(TransferTask::Status st) {
    switch (st) {
    case TransferTask::Status::Pending:
        return "pending";
    case TransferTask::Status::Running:
        return "running";
    case TransferTask::Status::Paused:
        return "paused";
    case TransferTask::Status::Completed:
        return "completed";
    case TransferTask::Status::Failed:
        return "failed";
    case TransferTask::Status::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

const char *transferPriorityName(TransferTask::Priority p) {
    switch (p) {
    case TransferTask::Priority::High:
        return "high";
    case TransferTask::Priority::Normal:
        return "normal";
    case TransferTask::Priority::Low:
        return "low";
    }
    return "normal";
}

const char *transferTypeName(TransferTask::Type t) {
    return t == TransferTask::Type::Upload ? "upload" : "download";
}

TransferTask::Priority priorityForSize(quint64 size, bool isDirectory) {
    if (isDirectory)
        return TransferTask::Priority::Normal;
    if (size < 1024ull * 1024)
        return TransferTask::Priority::High;
    if (size < 100ull * 1024 * 1024)
        return TransferTask::Priority::Normal;
    return TransferTask::Priority::Low;
}

} // namespace scpflow
