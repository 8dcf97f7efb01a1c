#include "TransferHistory.hpp"

#include <QDateTime>
#include <QTimeZone>

namespace scpflow {

QString isoTimestamp(qint64 epochMs) {
    if (epochMs <= 0)
        return QString();
    return QDateTime::fromMSecsSinceEpoch(epochMs, QTimeZone::utc())
        .toString(Qt::ISODateWithMs);
}

TransferHistoryRecord TransferHistoryRecord::fromTask(const TransferTask& t) {
    TransferHistoryRecord r;
    r.id = t.id;
    r.type = QString::fromLatin1(transferTypeName(t.type));
    r.status = QString::fromLatin1(transferStatusName(t.status));
    r.priority = QString::fromLatin1(transferPriorityName(t.priority));
    r.hostName = t.hostName;
    r.localPath = t.localPath;
    r.remotePath = t.remotePath;
    r.fileName = t.fileName;
    r.size = t.size;
    r.isDirectory = t.isDirectory;
    r.createdAt = isoTimestamp(t.createdAtMs);
    r.completedAt = isoTimestamp(t.completedAtMs);
    // Never started (cancelled while pending): no duration.
    if (t.startedAtMs > 0 && t.completedAtMs >= t.startedAtMs)
        r.durationMs = t.completedAtMs - t.startedAtMs;
    if (r.durationMs > 0)
        r.averageSpeed = double(t.transferred) * 1000.0 / double(r.durationMs);
    r.error = t.lastError;
    return r;
}

QJsonObject TransferHistoryRecord::toJson() const {
    QJsonObject o;
    o["id"] = QString::number(id);
    o["type"] = type;
    o["status"] = status;
    o["priority"] = priority;
    o["hostName"] = hostName;
    o["localPath"] = localPath;
    o["remotePath"] = remotePath;
    o["fileName"] = fileName;
    o["size"] = double(size);
    o["isDirectory"] = isDirectory;
    o["createdAt"] = createdAt;
    o["completedAt"] = completedAt;
    o["durationMs"] = double(durationMs);
    o["averageSpeed"] = averageSpeed;
    if (!error.isEmpty())
        o["error"] = error;
    return o;
}

void TransferHistory::add(TransferHistoryRecord record) {
    std::lock_guard<std::mutex> lk(mtx_);
    records_.prepend(std::move(record));
    while (records_.size() > capacity_)
        records_.removeLast();
}

QVector<TransferHistoryRecord> TransferHistory::records() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return records_;
}

void TransferHistory::clear() {
    std::lock_guard<std::mutex> lk(mtx_);
    records_.clear();
}

} // namespace scpflow
