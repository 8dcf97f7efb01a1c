// In-memory record of finished tasks, newest first, bounded in size.
// Persisting it is left to the caller (see toJson()).
#pragma once
#include "TransferTask.hpp"

#include <QJsonObject>
#include <QString>
#include <QVector>
#include <mutex>

namespace scpflow {

struct TransferHistoryRecord {
    quint64 id = 0;
    QString type;
    QString status;
    QString priority;
    QString hostName;
    QString localPath;
    QString remotePath;
    QString fileName;
    quint64 size = 0;
    bool isDirectory = false;
    QString createdAt;   // ISO-8601, UTC
    QString completedAt; // ISO-8601, UTC
    qint64 durationMs = 0;
    double averageSpeed = 0.0; // bytes/s over the last run
    QString error;

    static TransferHistoryRecord fromTask(const TransferTask& t);
    QJsonObject toJson() const;
};

// ISO-8601 (UTC, milliseconds) of an epoch-ms value; empty for 0.
QString isoTimestamp(qint64 epochMs);

class TransferHistory {
public:
    static constexpr int kDefaultCapacity = 100;

    explicit TransferHistory(int capacity = kDefaultCapacity)
        : capacity_(capacity < 1 ? 1 : capacity) {}

    void add(TransferHistoryRecord record);
    QVector<TransferHistoryRecord> records() const;
    void clear();
    int capacity() const { return capacity_; }

private:
    const int capacity_;
    mutable std::mutex mtx_;
    QVector<TransferHistoryRecord> records_;
};

} // namespace scpflow
