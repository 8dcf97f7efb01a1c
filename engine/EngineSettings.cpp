#include "EngineSettings.hpp"

#include <QSettings>
#include <QString>
#include <QStringList>

namespace scpflow {

namespace {

QStringList toQStringList(const std::vector<std::string>& v) {
    QStringList out;
    out.reserve(static_cast<int>(v.size()));
    for (const auto& s : v)
        out << QString::fromStdString(s);
    return out;
}

std::vector<std::string> toStdStrings(const QStringList& l) {
    std::vector<std::string> out;
    out.reserve(static_cast<std::size_t>(l.size()));
    for (const QString& s : l) {
        const QString t = s.trimmed();
        if (!t.isEmpty())
            out.push_back(t.toStdString());
    }
    return out;
}

quint64 u64(const QSettings& s, const char *key, quint64 def) {
    return s.value(key, def).toULongLong();
}

qint64 i64(const QSettings& s, const char *key, qint64 def) {
    return s.value(key, def).toLongLong();
}

} // namespace

bool EngineSettings::validate(std::string& err) const {
    if (maxConcurrent < 1) {
        err = "At least one task must be allowed to run";
        return false;
    }
    if (connect.handshake_timeout.count() <= 0) {
        err = "Handshake timeout must be positive";
        return false;
    }
    if (verification.command_timeout.count() <= 0) {
        err = "Checksum command timeout must be positive";
        return false;
    }
    return pool.validate(err) && chunks.validate(err) &&
           compression.validate(err) && retry.validate(err);
}

EngineSettings EngineSettings::load(QSettings& s) {
    EngineSettings e;
    e.maxConcurrent = s.value("Transfer/maxConcurrent", e.maxConcurrent).toInt();

    e.connect.handshake_timeout = std::chrono::milliseconds(
        i64(s, "Connection/handshakeTimeoutMs", e.connect.handshake_timeout.count()));
    e.connect.keepalive_interval_sec =
        s.value("Connection/keepaliveSec", e.connect.keepalive_interval_sec).toInt();

    e.pool.max_sessions_per_identity = static_cast<std::size_t>(
        u64(s, "Pool/maxSessionsPerHost", e.pool.max_sessions_per_identity));
    e.pool.idle_timeout = std::chrono::milliseconds(
        i64(s, "Pool/idleTimeoutMs", e.pool.idle_timeout.count()));
    e.pool.cleanup_interval = std::chrono::milliseconds(
        i64(s, "Pool/cleanupIntervalMs", e.pool.cleanup_interval.count()));

    e.chunks.enabled = s.value("Parallel/enabled", e.chunks.enabled).toBool();
    e.chunks.threshold = u64(s, "Parallel/thresholdBytes", e.chunks.threshold);
    e.chunks.chunk_size = u64(s, "Parallel/chunkSizeBytes", e.chunks.chunk_size);
    e.chunks.max_concurrent =
        s.value("Parallel/maxConcurrentChunks", e.chunks.max_concurrent).toInt();
    e.chunks.chunk_retries =
        s.value("Parallel/chunkRetries", e.chunks.chunk_retries).toInt();
    e.chunks.progress_interval = std::chrono::milliseconds(
        i64(s, "Parallel/progressIntervalMs", e.chunks.progress_interval.count()));

    e.compression.file_level_enabled =
        s.value("Compression/fileLevel", e.compression.file_level_enabled).toBool();
    e.compression.threshold =
        u64(s, "Compression/thresholdBytes", e.compression.threshold);
    e.compression.level = s.value("Compression/level", e.compression.level).toInt();
    if (s.contains("Compression/extensions"))
        e.compression.extensions =
            toStdStrings(s.value("Compression/extensions").toStringList());

    e.verification.enabled =
        s.value("Verification/enabled", e.verification.enabled).toBool();
    const QString algo = s.value("Verification/algorithm",
                                 digestAlgorithmName(e.verification.algorithm))
                             .toString()
                             .toLower();
    e.verification.algorithm =
        algo == "md5" ? DigestAlgorithm::Md5 : DigestAlgorithm::Sha256;
    e.verification.threshold =
        u64(s, "Verification/thresholdBytes", e.verification.threshold);

    e.sync.delete_remote =
        s.value("Sync/deleteRemote", e.sync.delete_remote).toBool();
    if (s.contains("Sync/excludePatterns"))
        e.sync.exclude_patterns =
            toStdStrings(s.value("Sync/excludePatterns").toStringList());
    e.sync.compare_method =
        s.value("Sync/compareMethod", "mtime").toString().toLower() == "checksum"
            ? CompareMethod::Checksum
            : CompareMethod::Mtime;
    e.sync.preserve_timestamps =
        s.value("Sync/preserveTimestamps", e.sync.preserve_timestamps).toBool();
    e.sync.preserve_permissions =
        s.value("Sync/preservePermissions", e.sync.preserve_permissions).toBool();

    e.retry.enabled = s.value("Retry/enabled", e.retry.enabled).toBool();
    e.retry.maxRetries = s.value("Retry/maxRetries", e.retry.maxRetries).toInt();
    e.retry.baseDelay = std::chrono::milliseconds(
        i64(s, "Retry/baseDelayMs", e.retry.baseDelay.count()));
    e.retry.multiplier = s.value("Retry/multiplier", e.retry.multiplier).toDouble();
    e.retry.maxDelay = std::chrono::milliseconds(
        i64(s, "Retry/maxDelayMs", e.retry.maxDelay.count()));
    e.retry.retryVerificationMismatch =
        s.value("Retry/retryVerificationMismatch",
                e.retry.retryVerificationMismatch)
            .toBool();
    return e;
}

void EngineSettings::save(QSettings& s) const {
    s.setValue("Transfer/maxConcurrent", maxConcurrent);

    s.setValue("Connection/handshakeTimeoutMs",
               static_cast<qint64>(connect.handshake_timeout.count()));
    s.setValue("Connection/keepaliveSec", connect.keepalive_interval_sec);

    s.setValue("Pool/maxSessionsPerHost",
               static_cast<quint64>(pool.max_sessions_per_identity));
    s.setValue("Pool/idleTimeoutMs", static_cast<qint64>(pool.idle_timeout.count()));
    s.setValue("Pool/cleanupIntervalMs",
               static_cast<qint64>(pool.cleanup_interval.count()));

    s.setValue("Parallel/enabled", chunks.enabled);
    s.setValue("Parallel/thresholdBytes", static_cast<quint64>(chunks.threshold));
    s.setValue("Parallel/chunkSizeBytes", static_cast<quint64>(chunks.chunk_size));
    s.setValue("Parallel/maxConcurrentChunks", chunks.max_concurrent);
    s.setValue("Parallel/chunkRetries", chunks.chunk_retries);
    s.setValue("Parallel/progressIntervalMs",
               static_cast<qint64>(chunks.progress_interval.count()));

    s.setValue("Compression/fileLevel", compression.file_level_enabled);
    s.setValue("Compression/thresholdBytes",
               static_cast<quint64>(compression.threshold));
    s.setValue("Compression/level", compression.level);
    s.setValue("Compression/extensions", toQStringList(compression.extensions));

    s.setValue("Verification/enabled", verification.enabled);
    s.setValue("Verification/algorithm",
               QString::fromLatin1(digestAlgorithmName(verification.algorithm)));
    s.setValue("Verification/thresholdBytes",
               static_cast<quint64>(verification.threshold));

    s.setValue("Sync/deleteRemote", sync.delete_remote);
    s.setValue("Sync/excludePatterns", toQStringList(sync.exclude_patterns));
    s.setValue("Sync/compareMethod", sync.compare_method == CompareMethod::Checksum
                                         ? QStringLiteral("checksum")
                                         : QStringLiteral("mtime"));
    s.setValue("Sync/preserveTimestamps", sync.preserve_timestamps);
    s.setValue("Sync/preservePermissions", sync.preserve_permissions);

    s.setValue("Retry/enabled", retry.enabled);
    s.setValue("Retry/maxRetries", retry.maxRetries);
    s.setValue("Retry/baseDelayMs", static_cast<qint64>(retry.baseDelay.count()));
    s.setValue("Retry/multiplier", retry.multiplier);
    s.setValue("Retry/maxDelayMs", static_cast<qint64>(retry.maxDelay.count()));
    s.setValue("Retry/retryVerificationMismatch", retry.retryVerificationMismatch);
}

} // namespace scpflow
