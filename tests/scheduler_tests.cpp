// Transfer queue tests: admission order, retry backoff, pause/resume, cancel,
// delta sync, history and settings persistence (run via CTest).
#include "EngineLogging.hpp"
#include "EngineSettings.hpp"
#include "RetryPolicy.hpp"
#include "TransferHistory.hpp"
#include "TransferScheduler.hpp"
#include "scpflow/LocalFs.hpp"
#include "scpflow/Log.hpp"
#include "scpflow/MockSession.hpp"

#include <QCoreApplication>
#include <QJsonObject>
#include <QtGlobal>
#include <QSettings>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <iterator>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using scpflow::TransferEvent;
using scpflow::TransferScheduler;
using scpflow::TransferTask;

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string& msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }

    void checkContains(const std::string& haystack, const std::string& needle,
                       const std::string& msg) {
        check(haystack.find(needle) != std::string::npos, msg);
    }
};

struct TempDir {
    fs::path path;
    explicit TempDir(const std::string& tag) {
        const auto stamp =
            std::chrono::steady_clock::now().time_since_epoch().count();
        path = fs::temp_directory_path() /
               ("scpflow-sched-" + tag + "-" + std::to_string(stamp));
        fs::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
    QString file(const std::string& name) const {
        return QString::fromStdString((path / name).string());
    }
};

scpflow::HostIdentity targetIdentity() {
    scpflow::HostIdentity id;
    id.target.host = "example.test";
    id.target.username = "alice";
    return id;
}

scpflow::PoolSettings poolOf(std::size_t cap) {
    scpflow::PoolSettings ps;
    ps.max_sessions_per_identity = cap;
    ps.cleanup_interval = std::chrono::milliseconds(0);
    return ps;
}

// Quick settings for tests: no throttling, short backoff.
scpflow::EngineSettings fastSettings() {
    scpflow::EngineSettings s;
    s.chunks.progress_interval = std::chrono::milliseconds(0);
    s.retry.baseDelay = std::chrono::milliseconds(20);
    return s;
}

std::string patterned(std::size_t n) {
    std::string s(n, '\0');
    for (std::size_t i = 0; i < n; ++i)
        s[i] = static_cast<char>('A' + (i * 11 + i / 17) % 26);
    return s;
}

void writeFile(const QString& p, const std::string& data) {
    std::ofstream out(p.toStdString(), std::ios::binary | std::ios::trunc);
    out << data;
}

std::string remoteText(const scpflow::MockRemoteFs& server,
                       const std::string& path) {
    std::string out;
    server.readFile(path, out);
    return out;
}

scpflow::TransferRequest uploadRequest(const QString& local,
                                       const QString& remote) {
    scpflow::TransferRequest req;
    req.type = TransferTask::Type::Upload;
    req.identity = targetIdentity();
    req.localPath = local;
    req.remotePath = remote;
    return req;
}

// Reads events until `pred` accepts one or the timeout expires. Every event
// read is appended to `seen`.
bool waitForEvent(scpflow::EventChannel& ch, std::vector<TransferEvent>& seen,
                  const std::function<bool(const TransferEvent&)>& pred,
                  std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        TransferEvent ev;
        if (!ch.next(ev, std::chrono::milliseconds(20)))
            continue;
        seen.push_back(ev);
        if (pred(ev))
            return true;
    }
    return false;
}

std::vector<TransferEvent> stateEvents(const std::vector<TransferEvent>& all,
                                       quint64 id, const std::string& status) {
    std::vector<TransferEvent> out;
    for (const auto& ev : all) {
        if (ev.task_id == id && ev.kind != TransferEvent::Kind::Progress &&
            ev.status == status)
            out.push_back(ev);
    }
    return out;
}

TransferTask::Status statusOf(const TransferScheduler& s, quint64 id) {
    const auto t = s.task(id);
    return t ? t->status : TransferTask::Status::Pending;
}

std::mutex capturedMtx;
std::vector<std::pair<std::string, std::string>> capturedMessages;

void captureMessage(QtMsgType, const QMessageLogContext& ctx,
                    const QString& msg) {
    std::lock_guard<std::mutex> lk(capturedMtx);
    capturedMessages.emplace_back(ctx.category ? ctx.category : "",
                                  msg.toStdString());
}

void test_core_log_bridge(TestContext& t) {
    const QtMessageHandler previous = qInstallMessageHandler(captureMessage);
    scpflow::installQtLogBridge();
    SCPFLOW_LOGW("pool: retired session %d", 42);
    scpflow::removeQtLogBridge();
    qInstallMessageHandler(previous);

    std::lock_guard<std::mutex> lk(capturedMtx);
    bool found = false;
    for (const auto& m : capturedMessages) {
        if (m.first == "scpflow.core" &&
            m.second.find("retired session 42") != std::string::npos)
            found = true;
    }
    t.check(found, "core log lines reach the scpflow.core category");
    capturedMessages.clear();
}

void test_retry_policy(TestContext& t) {
    scpflow::RetryPolicy p;
    t.check(p.delayFor(1).count() == 2000, "first retry waits the base delay");
    t.check(p.delayFor(2).count() == 4000, "second retry doubles it");
    t.check(p.delayFor(3).count() == 8000, "third retry doubles again");

    p.baseDelay = std::chrono::milliseconds(1000);
    p.multiplier = 10.0;
    p.maxDelay = std::chrono::milliseconds(5000);
    t.check(p.delayFor(3).count() == 5000, "delay is capped");
    t.check(p.delayFor(400).count() == 5000, "huge exponents stay capped");

    t.check(p.shouldRetry(1, 3, scpflow::ErrorKind::Transport),
            "transport failure below the budget retries");
    t.check(!p.shouldRetry(3, 3, scpflow::ErrorKind::Transport),
            "budget exhausted at retryCount == maxRetries");
    t.check(!p.shouldRetry(1, 3, scpflow::ErrorKind::Cancelled),
            "cancellation never retries");
    t.check(!p.shouldRetry(1, 3, scpflow::ErrorKind::InvalidArgument),
            "invalid requests never retry");
    t.check(!p.shouldRetry(1, 3, scpflow::ErrorKind::VerificationMismatch),
            "digest mismatches do not retry by default");
    p.retryVerificationMismatch = true;
    t.check(p.shouldRetry(1, 3, scpflow::ErrorKind::VerificationMismatch),
            "digest mismatches retry when allowed");
    p.enabled = false;
    t.check(!p.shouldRetry(1, 3, scpflow::ErrorKind::Transport),
            "disabled policy never retries");

    std::string err;
    p.multiplier = 0.5;
    t.check(!p.validate(err), "shrinking backoff is rejected");
}

void test_priority_for_size(TestContext& t) {
    t.check(scpflow::priorityForSize(1024, false) == TransferTask::Priority::High,
            "small files are high priority");
    t.check(scpflow::priorityForSize(1024ull * 1024, false) ==
                TransferTask::Priority::Normal,
            "1 MiB is normal priority");
    t.check(scpflow::priorityForSize(100ull * 1024 * 1024, false) ==
                TransferTask::Priority::Low,
            "100 MiB is low priority");
    t.check(scpflow::priorityForSize(0, true) == TransferTask::Priority::Normal,
            "directories are normal priority");
}

void test_history_bounded_newest_first(TestContext& t) {
    scpflow::TransferHistory h;
    for (quint64 i = 1; i <= 105; ++i) {
        scpflow::TransferHistoryRecord r;
        r.id = i;
        h.add(r);
    }
    const auto recs = h.records();
    t.check(recs.size() == 100, "history keeps the newest 100 records");
    t.check(!recs.isEmpty() && recs.front().id == 105, "newest record first");
    t.check(!recs.isEmpty() && recs.back().id == 6, "oldest records dropped");

    t.check(scpflow::isoTimestamp(0).isEmpty(), "zero time has no timestamp");
    t.check(scpflow::isoTimestamp(1700000000000) ==
                QStringLiteral("2023-11-14T22:13:20.000Z"),
            "timestamps are ISO-8601 UTC with milliseconds");

    TransferTask task;
    task.id = 7;
    task.status = TransferTask::Status::Completed;
    task.transferred = 4000;
    task.size = 4000;
    task.startedAtMs = 1700000000000;
    task.completedAtMs = 1700000002000;
    const auto rec = scpflow::TransferHistoryRecord::fromTask(task);
    t.check(rec.durationMs == 2000, "duration spans the last run");
    t.check(rec.averageSpeed > 1999.0 && rec.averageSpeed < 2001.0,
            "average speed is bytes per second");
    const QJsonObject json = rec.toJson();
    t.check(json.value("status").toString() == QStringLiteral("completed"),
            "json carries the status name");
    t.check(!json.contains("error"), "no error key for a clean run");
}

void test_settings_round_trip(TestContext& t) {
    TempDir dir("settings");
    const QString ini = dir.file("scpflow.ini");
    {
        scpflow::EngineSettings s;
        s.maxConcurrent = 4;
        s.pool.max_sessions_per_identity = 3;
        s.chunks.threshold = 1234;
        s.chunks.chunk_retries = 1;
        s.compression.level = 9;
        s.compression.extensions = {".txt", ".csv"};
        s.verification.enabled = true;
        s.verification.algorithm = scpflow::DigestAlgorithm::Md5;
        s.sync.delete_remote = true;
        s.sync.compare_method = scpflow::CompareMethod::Checksum;
        s.sync.exclude_patterns = {"build", "*.tmp"};
        s.sync.preserve_permissions = true;
        s.retry.baseDelay = std::chrono::milliseconds(150);
        s.retry.multiplier = 3.0;
        QSettings qs(ini, QSettings::IniFormat);
        s.save(qs);
        qs.sync();
    }
    QSettings qs(ini, QSettings::IniFormat);
    const scpflow::EngineSettings l = scpflow::EngineSettings::load(qs);
    t.check(l.maxConcurrent == 4, "maxConcurrent persists");
    t.check(l.pool.max_sessions_per_identity == 3, "pool cap persists");
    t.check(l.chunks.threshold == 1234 && l.chunks.chunk_retries == 1,
            "chunk settings persist");
    t.check(l.compression.level == 9 && l.compression.extensions.size() == 2,
            "compression settings persist");
    t.check(l.verification.enabled &&
                l.verification.algorithm == scpflow::DigestAlgorithm::Md5,
            "verification settings persist");
    t.check(l.sync.delete_remote &&
                l.sync.compare_method == scpflow::CompareMethod::Checksum &&
                l.sync.exclude_patterns.size() == 2 &&
                l.sync.preserve_permissions,
            "sync settings persist");
    t.check(!qs.contains("Compression/sessionLevel"),
            "transport compression is not a stored setting");
    t.check(l.retry.baseDelay.count() == 150 && l.retry.multiplier == 3.0,
            "retry settings persist");
    std::string err;
    t.check(l.validate(err), "loaded settings validate");

    QSettings empty(dir.file("empty.ini"), QSettings::IniFormat);
    const scpflow::EngineSettings d = scpflow::EngineSettings::load(empty);
    t.check(d.maxConcurrent == 2 && d.retry.maxRetries == 3 &&
                d.chunks.max_concurrent == 5 && !d.verification.enabled,
            "missing keys keep the defaults");
    t.check(d.sync.exclude_patterns.size() == 4,
            "default exclusion patterns survive a load");

    scpflow::EngineSettings bad;
    bad.maxConcurrent = 0;
    t.check(!bad.validate(err), "zero concurrency is rejected");
    auto server = std::make_shared<scpflow::MockRemoteFs>();
    scpflow::SessionPool pool(scpflow::MockSession::factory(server), poolOf(1));
    TransferScheduler sched(pool, bad);
    t.check(sched.maxConcurrent() == 2,
            "invalid settings fall back to the defaults");
}

void test_submit_validation_and_priority(TestContext& t) {
    TempDir dir("submit");
    auto server = std::make_shared<scpflow::MockRemoteFs>();
    scpflow::SessionPool pool(scpflow::MockSession::factory(server), poolOf(1));
    TransferScheduler sched(pool, fastSettings());
    sched.pauseAll();

    QString err;
    t.check(sched.submitTask(uploadRequest(QString(), "/x"), &err) == 0,
            "empty local path is rejected");
    t.check(!err.isEmpty(), "rejection carries a reason");
    t.check(sched.submitTask(uploadRequest(dir.file("missing.bin"), "/x"), &err) ==
                0,
            "missing local file is rejected");
    scpflow::TransferRequest noHost = uploadRequest(dir.file("a"), "/a");
    noHost.identity.target.host.clear();
    t.check(sched.submitTask(noHost, &err) == 0, "missing host is rejected");

    writeFile(dir.file("small.txt"), "tiny");
    fs::create_directories(dir.path / "tree");
    const quint64 small =
        sched.submitTask(uploadRequest(dir.file("small.txt"), "/in/small.txt"));
    const quint64 tree =
        sched.submitTask(uploadRequest(dir.file("tree"), "/in/tree"));
    scpflow::TransferRequest big;
    big.type = TransferTask::Type::Download;
    big.identity = targetIdentity();
    big.localPath = dir.file("big.iso");
    big.remotePath = "/isos/big.iso";
    big.size = 200ull * 1024 * 1024;
    const quint64 bigId = sched.submitTask(big);

    t.check(small != 0 && tree != 0 && bigId != 0, "valid requests get ids");
    t.check(small != tree && tree != bigId, "ids are unique");
    const auto s = sched.task(small);
    const auto d = sched.task(tree);
    const auto b = sched.task(bigId);
    t.check(s && s->priority == TransferTask::Priority::High &&
                s->size == 4 && s->fileName == QStringLiteral("small.txt"),
            "upload size and priority come from the local file");
    t.check(d && d->isDirectory && d->priority == TransferTask::Priority::Normal,
            "directories are detected and normal priority");
    t.check(b && b->priority == TransferTask::Priority::Low &&
                b->fileName == QStringLiteral("big.iso"),
            "download priority comes from the announced size");
    t.check(s && s->maxRetries == 3, "task budget defaults to the policy");

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    t.check(sched.stats().pending == 3, "nothing runs while the queue is paused");
    t.check(sched.waitForIdle(std::chrono::milliseconds(50)) == false,
            "pending tasks keep the queue busy");
    sched.cancelAll();
    t.check(sched.stats().cancelled == 3, "cancelAll reaches pending tasks");
    t.check(sched.waitForIdle(std::chrono::seconds(2)), "queue drains");
    t.check(server->connects() == 0, "cancelled pending tasks never connect");
}

void test_retry_backoff_then_failure(TestContext& t) {
    TempDir dir("backoff");
    auto server = std::make_shared<scpflow::MockRemoteFs>();
    server->failNextPuts(3);
    scpflow::SessionPool pool(scpflow::MockSession::factory(server), poolOf(1));
    scpflow::EngineSettings s = fastSettings();
    s.chunks.chunk_retries = 0;
    s.retry.maxRetries = 3;
    s.retry.baseDelay = std::chrono::milliseconds(100);
    s.retry.multiplier = 2.0;
    TransferScheduler sched(pool, s);
    auto events = sched.subscribe(1024);

    std::mutex finishedMtx;
    std::vector<std::pair<quint64, QString>> finished;
    QObject::connect(&sched, &TransferScheduler::taskFinished,
                     [&](quint64 id, const QString& status) {
                         std::lock_guard<std::mutex> lk(finishedMtx);
                         finished.emplace_back(id, status);
                     });

    writeFile(dir.file("flaky.txt"), patterned(300));
    const quint64 id =
        sched.submitTask(uploadRequest(dir.file("flaky.txt"), "/in/flaky.txt"));
    t.check(sched.waitForIdle(std::chrono::seconds(10)), "retries settle");

    const auto task = sched.task(id);
    t.check(task && task->status == TransferTask::Status::Failed,
            "third failure is terminal");
    t.check(task && task->retryCount == 3, "retryCount counts every failure");
    t.check(task && task->lastErrorKind == scpflow::ErrorKind::Transport,
            "last error kind is kept");
    t.check(task && task->lastError.contains(QStringLiteral("Remote write failed")),
            "last error message is kept");
    t.check(server->putCalls() == 3, "exactly three attempts were made");

    const auto all = events->drain();
    const auto runs = stateEvents(all, id, "running");
    t.check(runs.size() == 3, "task was admitted three times");
    if (runs.size() == 3) {
        const qint64 gap1 = runs[1].timestamp_ms - runs[0].timestamp_ms;
        const qint64 gap2 = runs[2].timestamp_ms - runs[1].timestamp_ms;
        t.check(gap1 >= 95 && gap1 < 190, "first backoff is about 100 ms");
        t.check(gap2 >= 195 && gap2 < 390, "second backoff is about 200 ms");
    }
    const auto pendings = stateEvents(all, id, "pending");
    t.check(pendings.size() == 3, "submitted once and requeued twice");
    t.check(stateEvents(all, id, "failed").size() == 1 &&
                stateEvents(all, id, "failed")[0].kind ==
                    TransferEvent::Kind::Terminal,
            "failure is published as a terminal event");

    std::lock_guard<std::mutex> lk(finishedMtx);
    t.check(finished.size() == 1 && finished[0].first == id &&
                finished[0].second == QStringLiteral("failed"),
            "taskFinished fires once with the final status");
}

void test_retry_recovers(TestContext& t) {
    TempDir dir("recover");
    auto server = std::make_shared<scpflow::MockRemoteFs>();
    server->failNextPuts(1);
    scpflow::SessionPool pool(scpflow::MockSession::factory(server), poolOf(1));
    scpflow::EngineSettings s = fastSettings();
    s.chunks.chunk_retries = 0;
    TransferScheduler sched(pool, s);

    const std::string data = patterned(500);
    writeFile(dir.file("ok.txt"), data);
    const quint64 id =
        sched.submitTask(uploadRequest(dir.file("ok.txt"), "/in/ok.txt"));
    t.check(sched.waitForIdle(std::chrono::seconds(5)), "queue settles");
    const auto task = sched.task(id);
    t.check(task && task->status == TransferTask::Status::Completed,
            "task completes after one retry");
    t.check(task && task->retryCount == 1, "the failed attempt is counted");
    t.check(task && task->transferred == 500, "completed task is fully counted");
    t.check(remoteText(*server, "/in/ok.txt") == data, "content arrived intact");

    const auto hist = sched.history();
    t.check(hist.size() == 1 && hist.front().status == QStringLiteral("completed"),
            "completed task is archived");
    t.check(sched.clearCompleted() == 1, "clearCompleted drops completed tasks");
    t.check(!sched.task(id).has_value(), "cleared task is gone from the queue");
    t.check(sched.history().size() == 1, "history survives clearCompleted");
}

void test_cancel_mid_chunked_transfer(TestContext& t) {
    TempDir dir("cancel");
    auto server = std::make_shared<scpflow::MockRemoteFs>();
    server->setBlockSize(10);
    server->setBlockDelay(std::chrono::milliseconds(10));
    scpflow::SessionPool pool(scpflow::MockSession::factory(server), poolOf(2));
    scpflow::EngineSettings s = fastSettings();
    s.chunks.threshold = 100;
    s.chunks.chunk_size = 100;
    s.chunks.max_concurrent = 2;
    TransferScheduler sched(pool, s);
    auto events = sched.subscribe(1024);

    writeFile(dir.file("slow.bin"), patterned(1000));
    const quint64 id =
        sched.submitTask(uploadRequest(dir.file("slow.bin"), "/in/slow.bin"));
    std::vector<TransferEvent> seen;
    t.check(waitForEvent(*events, seen,
                         [&](const TransferEvent& ev) {
                             return ev.task_id == id &&
                                    ev.kind == TransferEvent::Kind::Progress &&
                                    ev.transferred > 0;
                         },
                         std::chrono::seconds(5)),
            "chunked transfer makes progress");
    t.check(sched.cancelTask(id), "cancel is accepted while running");
    t.check(!sched.cancelTask(id), "cancelling twice is refused");
    t.check(sched.waitForIdle(std::chrono::seconds(5)), "worker unwinds");

    const auto task = sched.task(id);
    t.check(task && task->status == TransferTask::Status::Cancelled,
            "task ends cancelled");
    t.check(task && task->retryCount == 0, "cancellation is not a failure");
    const std::size_t writes = server->rangePuts().size();
    t.check(writes < 10, "not every chunk was written");
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    t.check(server->rangePuts().size() == writes,
            "no chunk writes start after cancel");
    const scpflow::PoolStats st = pool.stats();
    t.check(st.active == 0 && st.idle == st.total,
            "borrowed sessions are back to idle");

    const auto rest = events->drain();
    seen.insert(seen.end(), rest.begin(), rest.end());
    const auto cancelled = stateEvents(seen, id, "cancelled");
    t.check(cancelled.size() == 1 &&
                cancelled[0].kind == TransferEvent::Kind::Terminal,
            "cancellation is published once as terminal");
    const auto hist = sched.history();
    t.check(!hist.isEmpty() && hist.front().status == QStringLiteral("cancelled"),
            "cancelled task is archived");
    t.check(sched.retryTask(id), "cancelled task can be retried by hand");
    t.check(sched.waitForIdle(std::chrono::seconds(10)), "manual retry settles");
    t.check(statusOf(sched, id) == TransferTask::Status::Completed,
            "manual retry completes the transfer");
    t.check(remoteText(*server, "/in/slow.bin") == patterned(1000),
            "retried transfer wrote the whole file");
}

void test_priority_admission_order(TestContext& t) {
    TempDir dir("order");
    auto server = std::make_shared<scpflow::MockRemoteFs>();
    scpflow::SessionPool pool(scpflow::MockSession::factory(server), poolOf(1));
    scpflow::EngineSettings s = fastSettings();
    s.maxConcurrent = 1;
    TransferScheduler sched(pool, s);
    auto events = sched.subscribe(1024);
    sched.pauseAll();

    writeFile(dir.file("f.txt"), "payload");
    auto req = uploadRequest(dir.file("f.txt"), "/in/low.txt");
    req.priority = TransferTask::Priority::Low;
    const quint64 low = sched.submitTask(req);
    req.remotePath = "/in/normal.txt";
    req.priority = TransferTask::Priority::Normal;
    const quint64 normal = sched.submitTask(req);
    req.remotePath = "/in/high.txt";
    req.priority = TransferTask::Priority::High;
    const quint64 high = sched.submitTask(req);
    req.remotePath = "/in/high2.txt";
    const quint64 high2 = sched.submitTask(req);

    sched.resumeAll();
    t.check(sched.waitForIdle(std::chrono::seconds(5)), "queue drains");

    std::vector<quint64> order;
    for (const auto& ev : events->drain()) {
        if (ev.kind == TransferEvent::Kind::StateChanged && ev.status == "running")
            order.push_back(ev.task_id);
    }
    t.check(order == std::vector<quint64>({high, high2, normal, low}),
            "admission follows priority then creation order");
    t.check(sched.stats().completed == 4, "every task completed");
}

void test_concurrency_limit(TestContext& t) {
    TempDir dir("limit");
    auto server = std::make_shared<scpflow::MockRemoteFs>();
    server->setBlockSize(50);
    server->setBlockDelay(std::chrono::milliseconds(10));
    scpflow::SessionPool pool(scpflow::MockSession::factory(server), poolOf(4));
    scpflow::EngineSettings s = fastSettings();
    s.maxConcurrent = 2;
    TransferScheduler sched(pool, s);

    writeFile(dir.file("f.bin"), patterned(500));
    std::vector<quint64> ids;
    for (int i = 0; i < 4; ++i)
        ids.push_back(sched.submitTask(uploadRequest(
            dir.file("f.bin"),
            QStringLiteral("/in/f%1.bin").arg(i))));
    int peakRunning = 0;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (std::chrono::steady_clock::now() < deadline) {
        const auto st = sched.stats();
        peakRunning = std::max(peakRunning, st.running);
        if (st.completed == 4)
            break;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    t.check(peakRunning == 2, "two tasks run at once");
    t.check(server->peakInflightTransfers() <= 2,
            "never more streams than running tasks");
    t.check(sched.waitForIdle(std::chrono::seconds(5)) &&
                sched.stats().completed == 4,
            "every task completes");
}

void test_pause_and_resume(TestContext& t) {
    TempDir dir("pause");
    auto server = std::make_shared<scpflow::MockRemoteFs>();
    server->setBlockSize(10);
    server->setBlockDelay(std::chrono::milliseconds(10));
    scpflow::SessionPool pool(scpflow::MockSession::factory(server), poolOf(1));
    TransferScheduler sched(pool, fastSettings());
    auto events = sched.subscribe(4096);

    const std::string data = patterned(800);
    writeFile(dir.file("p.bin"), data);
    const quint64 id =
        sched.submitTask(uploadRequest(dir.file("p.bin"), "/in/p.bin"));
    std::vector<TransferEvent> seen;
    t.check(waitForEvent(*events, seen,
                         [&](const TransferEvent& ev) {
                             return ev.task_id == id &&
                                    ev.kind == TransferEvent::Kind::Progress &&
                                    ev.transferred >= 200;
                         },
                         std::chrono::seconds(5)),
            "upload is under way");
    t.check(sched.pauseTask(id), "running task can be paused");
    t.check(sched.waitForIdle(std::chrono::seconds(5)),
            "paused task does not keep the queue busy");

    const auto paused = sched.task(id);
    t.check(paused && paused->status == TransferTask::Status::Paused,
            "task stays paused after its worker unwinds");
    t.check(paused && paused->retryCount == 0, "pause is not a failure");
    const quint64 kept = paused ? paused->transferred : 0;
    t.check(kept >= 200 && kept < 800, "partial progress is kept");
    std::string partial;
    server->readFile("/in/p.bin", partial);
    t.check(partial.size() >= 200 && partial.size() < 800,
            "remote holds the partial file");
    t.check(pool.stats().active == 0, "paused task returned its session");

    events->drain();
    t.check(sched.resumeTask(id), "paused task can be resumed");
    t.check(!sched.resumeTask(id), "resuming a pending task is refused");
    seen.clear();
    t.check(waitForEvent(*events, seen,
                         [&](const TransferEvent& ev) {
                             return ev.task_id == id &&
                                    ev.kind == TransferEvent::Kind::Progress;
                         },
                         std::chrono::seconds(5)),
            "resumed upload reports progress");
    t.check(!seen.empty() && seen.back().transferred >= partial.size(),
            "resumed progress continues from the partial bytes");
    t.check(sched.waitForIdle(std::chrono::seconds(10)), "resumed upload settles");
    t.check(statusOf(sched, id) == TransferTask::Status::Completed,
            "resumed task completes");
    t.check(remoteText(*server, "/in/p.bin") == data,
            "resumed upload produces the exact file");
    t.check(!sched.pauseTask(id), "completed task cannot be paused");
}

void test_delta_sync_upload(TestContext& t) {
    TempDir dir("sync");
    auto server = std::make_shared<scpflow::MockRemoteFs>();
    scpflow::SessionPool pool(scpflow::MockSession::factory(server), poolOf(1));
    scpflow::EngineSettings s = fastSettings();
    s.sync.delete_remote = true;
    TransferScheduler sched(pool, s);

    fs::create_directories(dir.path / "site" / "css");
    fs::create_directories(dir.path / "site" / "node_modules");
    writeFile(dir.file("site/index.html"), "<html>new</html>");
    writeFile(dir.file("site/css/app.css"), "body{}");
    writeFile(dir.file("site/node_modules/dep.js"), "ignored");
    const std::int64_t cssMtime = scpflow::epochMsFromFileTime(
        fs::last_write_time(dir.path / "site" / "css" / "app.css"));
    server->putFile("/www/css/app.css", "body{}", cssMtime);
    server->putFile("/www/old.html", "stale", cssMtime);
    server->putFile("/www/node_modules/keep.js", "remote only", cssMtime);

    auto req = uploadRequest(dir.file("site"), "/www");
    req.deltaSync = true;
    const quint64 id = sched.submitTask(req);
    t.check(sched.waitForIdle(std::chrono::seconds(5)), "sync settles");
    const auto task = sched.task(id);
    t.check(task && task->status == TransferTask::Status::Completed,
            "sync completes");
    t.check(remoteText(*server, "/www/index.html") == "<html>new</html>",
            "new file is uploaded");
    t.check(server->putCalls() == 1, "unchanged and excluded files are skipped");
    t.check(!server->hasFile("/www/old.html"), "remote leftover is deleted");
    t.check(server->hasFile("/www/node_modules/keep.js"),
            "excluded remote files are never deleted");
    t.check(!server->hasFile("/www/node_modules/dep.js"),
            "excluded local files are never uploaded");

    // A failed upload keeps every remote file in place.
    writeFile(dir.file("site/extra.txt"), "more");
    server->putFile("/www/old2.html", "stale too", cssMtime);
    server->failNextPuts(1);
    auto again = uploadRequest(dir.file("site"), "/www");
    again.deltaSync = true;
    again.maxRetries = 0;
    const quint64 failing = sched.submitTask(again);
    t.check(sched.waitForIdle(std::chrono::seconds(5)), "failing sync settles");
    const auto failed = sched.task(failing);
    t.check(failed && failed->status == TransferTask::Status::Failed,
            "sync with a failed upload fails");
    t.check(failed && failed->lastError.contains(QStringLiteral("extra.txt")),
            "error names the file that failed");
    t.check(server->hasFile("/www/old2.html"),
            "deletions are skipped when an upload failed");
}

void test_delta_sync_into_missing_root(TestContext& t) {
    TempDir dir("fresh");
    auto server = std::make_shared<scpflow::MockRemoteFs>();
    scpflow::SessionPool pool(scpflow::MockSession::factory(server), poolOf(1));
    TransferScheduler sched(pool, fastSettings());

    fs::create_directories(dir.path / "docs" / "guide");
    writeFile(dir.file("docs/readme.md"), "# readme");
    writeFile(dir.file("docs/guide/intro.md"), "intro");
    auto req = uploadRequest(dir.file("docs"), "/srv/docs");
    req.deltaSync = true;
    const quint64 id = sched.submitTask(req);
    t.check(sched.waitForIdle(std::chrono::seconds(5)), "sync settles");
    t.check(statusOf(sched, id) == TransferTask::Status::Completed,
            "sync into a missing remote root completes");
    t.check(remoteText(*server, "/srv/docs/guide/intro.md") == "intro",
            "nested files are uploaded with their directories");

    server->putFile("/srv/blocker", "file");
    auto bad = uploadRequest(dir.file("docs"), "/srv/blocker");
    bad.deltaSync = true;
    const quint64 badId = sched.submitTask(bad);
    t.check(sched.waitForIdle(std::chrono::seconds(5)), "bad sync settles");
    const auto failed = sched.task(badId);
    t.check(failed && failed->status == TransferTask::Status::Failed &&
                failed->lastErrorKind == scpflow::ErrorKind::InvalidArgument,
            "a file at the remote root fails without retry");
    t.check(failed && failed->retryCount == 1, "invalid request fails at once");
}

void test_verification_mismatch_fails(TestContext& t) {
    TempDir dir("verify");
    auto server = std::make_shared<scpflow::MockRemoteFs>();
    server->setExecHandler([](const std::string& cmd, scpflow::ExecResult& out) {
        if (cmd.find("sha256sum") == std::string::npos)
            return false;
        out.exit_status = 0;
        out.stdout_text = std::string(64, '0') + "  /in/v.bin\n";
        return true;
    });
    scpflow::SessionPool pool(scpflow::MockSession::factory(server), poolOf(1));
    scpflow::EngineSettings s = fastSettings();
    s.verification.enabled = true;
    s.verification.threshold = 0;
    TransferScheduler sched(pool, s);

    writeFile(dir.file("v.bin"), patterned(256));
    const quint64 id =
        sched.submitTask(uploadRequest(dir.file("v.bin"), "/in/v.bin"));
    t.check(sched.waitForIdle(std::chrono::seconds(5)), "verification settles");
    const auto task = sched.task(id);
    t.check(task && task->status == TransferTask::Status::Failed,
            "digest mismatch fails the task");
    t.check(task && task->retryCount == 1, "mismatch is not retried");
    t.check(task && task->lastErrorKind ==
                        scpflow::ErrorKind::VerificationMismatch,
            "error kind is VerificationMismatch");

    server->setExecHandler({});
    t.check(sched.retryTask(id), "failed task can be retried by hand");
    t.check(sched.waitForIdle(std::chrono::seconds(5)), "manual retry settles");
    const auto retried = sched.task(id);
    t.check(retried && retried->status == TransferTask::Status::Completed,
            "retry with a good digest completes");
    t.check(retried && retried->retryCount == 0 && retried->lastError.isEmpty(),
            "manual retry starts with fresh counters");
}

void test_download_task(TestContext& t) {
    TempDir dir("download");
    auto server = std::make_shared<scpflow::MockRemoteFs>();
    const std::string data = patterned(700);
    server->putFile("/pub/data.bin", data, 1700000000000);
    scpflow::SessionPool pool(scpflow::MockSession::factory(server), poolOf(1));
    TransferScheduler sched(pool, fastSettings());

    scpflow::TransferRequest req;
    req.type = TransferTask::Type::Download;
    req.identity = targetIdentity();
    req.localPath = dir.file("out/data.bin");
    req.remotePath = "/pub/data.bin";
    const quint64 id = sched.submitTask(req);
    t.check(sched.waitForIdle(std::chrono::seconds(5)), "download settles");
    const auto task = sched.task(id);
    t.check(task && task->status == TransferTask::Status::Completed,
            "download completes");
    t.check(task && task->size == 700, "size is learned from the remote file");
    std::ifstream in((dir.path / "out" / "data.bin").string(), std::ios::binary);
    const std::string got((std::istreambuf_iterator<char>(in)),
                          std::istreambuf_iterator<char>());
    t.check(got == data, "downloaded bytes match");
}

void test_destructor_cancels_running_work(TestContext& t) {
    TempDir dir("shutdown");
    auto server = std::make_shared<scpflow::MockRemoteFs>();
    server->setBlockSize(10);
    server->setBlockDelay(std::chrono::milliseconds(20));
    scpflow::SessionPool pool(scpflow::MockSession::factory(server), poolOf(1));
    std::shared_ptr<scpflow::EventChannel> events;
    const auto start = std::chrono::steady_clock::now();
    {
        TransferScheduler sched(pool, fastSettings());
        events = sched.subscribe();
        writeFile(dir.file("long.bin"), patterned(5000));
        sched.submitTask(uploadRequest(dir.file("long.bin"), "/in/long.bin"));
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    t.check(std::chrono::steady_clock::now() - start < std::chrono::seconds(3),
            "destroying the queue interrupts running transfers");
    t.check(pool.stats().active == 0, "every session was returned");
    t.check(events->closed(), "subscriber channels are closed");
}

} // namespace

int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);
    TestContext t;
    test_core_log_bridge(t);
    test_retry_policy(t);
    test_priority_for_size(t);
    test_history_bounded_newest_first(t);
    test_settings_round_trip(t);
    test_submit_validation_and_priority(t);
    test_retry_backoff_then_failure(t);
    test_retry_recovers(t);
    test_cancel_mid_chunked_transfer(t);
    test_priority_admission_order(t);
    test_concurrency_limit(t);
    test_pause_and_resume(t);
    test_delta_sync_upload(t);
    test_delta_sync_into_missing_root(t);
    test_verification_mismatch_fails(t);
    test_download_task(t);
    test_destructor_cancels_running_work(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] scpflow_scheduler_tests\n";
    return EXIT_SUCCESS;
}
