// Core unit tests without external framework (run via CTest).
#include "scpflow/EventChannel.hpp"
#include "scpflow/IntegrityVerifier.hpp"
#include "scpflow/Log.hpp"
#include "scpflow/MockSession.hpp"
#include "scpflow/PathUtils.hpp"
#include "scpflow/RuntimeLogging.hpp"
#include "scpflow/SessionPool.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

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

scpflow::HostIdentity targetIdentity(const std::string& host = "example.test") {
    scpflow::HostIdentity id;
    id.target.host = host;
    id.target.username = "alice";
    id.target.password = std::string("secret");
    return id;
}

scpflow::PoolSettings quietPool(std::size_t cap = 1) {
    scpflow::PoolSettings ps;
    ps.max_sessions_per_identity = cap;
    ps.cleanup_interval = std::chrono::milliseconds(0);
    return ps;
}

fs::path makeTempDir(const std::string& tag) {
    const auto stamp =
        std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path dir = fs::temp_directory_path() /
                   ("scpflow-core-" + tag + "-" + std::to_string(stamp));
    fs::create_directories(dir);
    return dir;
}

void writeFile(const fs::path& p, const std::string& data) {
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    out << data;
}

std::string readLocal(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in),
                       std::istreambuf_iterator<char>());
}

scpflow::TransferEvent progressEvent(std::uint64_t id, std::uint64_t done) {
    scpflow::TransferEvent ev;
    ev.kind = scpflow::TransferEvent::Kind::Progress;
    ev.task_id = id;
    ev.transferred = done;
    return ev;
}

scpflow::TransferEvent stateEvent(std::uint64_t id, const std::string& status,
                                  bool terminal = false) {
    scpflow::TransferEvent ev;
    ev.kind = terminal ? scpflow::TransferEvent::Kind::Terminal
                       : scpflow::TransferEvent::Kind::StateChanged;
    ev.task_id = id;
    ev.status = status;
    return ev;
}

void test_identity_key_and_hops(TestContext& t) {
    scpflow::HostIdentity id = targetIdentity("db.internal");
    id.target.port = 2222;
    scpflow::HopIdentity bastion;
    bastion.host = "bastion.test";
    bastion.username = "jump";
    id.jumps.push_back(bastion);

    t.check(id.key() == "jump@bastion.test:22>alice@db.internal:2222",
            "identity key should chain every hop label ending in the target");
    t.check(id.hopCount() == 2, "one jump plus the target is two hops");
    t.check(id.hop(0).host == "bastion.test", "hop 0 should be the first jump");
    t.check(id.hop(1).host == "db.internal", "last hop should be the target");

    scpflow::HostIdentity direct = targetIdentity("db.internal");
    direct.target.port = 2222;
    t.check(direct.key() != id.key(),
            "a direct identity must not share the key of a tunnelled one");
    t.check(scpflow::HopIdentity().known_hosts_policy ==
                scpflow::KnownHostsPolicy::Strict,
            "known_hosts policy should default to Strict");
}

void test_mock_connect_validation(TestContext& t) {
    auto server = std::make_shared<scpflow::MockRemoteFs>();
    scpflow::MockSession s(server);
    scpflow::TransferError err;

    scpflow::HostIdentity bad = targetIdentity("");
    t.check(!s.connect(bad, err), "connect should fail when host is empty");
    t.check(err.kind == scpflow::ErrorKind::Connect,
            "empty host should report a Connect error");
    t.check(err.hop_index == 0, "empty target host fails at hop 0");

    err.clear();
    t.check(s.connect(targetIdentity(), err),
            "connect should succeed with host+username");
    t.check(s.isConnected(), "session should report connected");
    t.check(server->liveSessions() == 1, "one live session after connect");
    s.disconnect();
    t.check(!s.isConnected(), "disconnect should flip isConnected to false");
    t.check(server->liveSessions() == 0, "no live session after disconnect");

    std::vector<scpflow::FileInfo> out;
    std::string e;
    t.check(!s.list("/", out, e), "list should fail when disconnected");
}

void test_connect_failure_names_hop(TestContext& t) {
    auto server = std::make_shared<scpflow::MockRemoteFs>();
    server->failConnectAtHop(1);
    scpflow::HostIdentity id = targetIdentity("db.internal");
    scpflow::HopIdentity j1;
    j1.host = "edge.test";
    j1.username = "ops";
    scpflow::HopIdentity j2;
    j2.host = "inner.test";
    j2.username = "ops";
    id.jumps = {j1, j2};

    scpflow::MockSession s(server);
    scpflow::TransferError err;
    t.check(!s.connect(id, err), "connect should fail at the scripted hop");
    t.check(err.kind == scpflow::ErrorKind::Connect, "kind should be Connect");
    t.check(err.hop_index == 1, "failure should point at the second jump");
    t.checkContains(err.describe(), "(hop 1)",
                    "describe() should mention the failing hop");
    t.check(!s.isConnected(), "failed chain must leave no connection behind");
    t.check(server->connects() == 0, "failed chain must not count as connected");
}

void test_mock_list_and_stat(TestContext& t) {
    auto server = std::make_shared<scpflow::MockRemoteFs>();
    server->putFile("/data/b.txt", "bbb", 2000);
    server->putFile("/data/a.txt", "a", 1000);
    server->makeDir("/data/sub");

    scpflow::MockSession s(server);
    scpflow::TransferError cerr;
    t.check(s.connect(targetIdentity(), cerr), "connect for listing");

    std::vector<scpflow::FileInfo> out;
    std::string err;
    t.check(s.list("/data", out, err), "list of an existing directory");
    t.check(out.size() == 3, "listing should hold two files and a directory");
    bool sawSub = false;
    for (const auto& f : out) {
        if (f.name == "sub")
            sawSub = f.is_dir;
    }
    t.check(sawSub, "subdirectory should be listed as a directory");

    scpflow::FileInfo info;
    t.check(s.stat("/data/b.txt", info, err), "stat of an existing file");
    t.check(info.size == 3 && info.mtime_ms == 2000,
            "stat should report size and mtime");

    err.clear();
    t.check(!s.stat("/data/missing", info, err), "stat of a missing path");
    t.check(err.empty(), "a missing path leaves err empty");

    bool isDir = false;
    t.check(s.exists("/data/sub", isDir, err) && isDir,
            "exists should see the directory");

    server->failListing("/data");
    out.clear();
    t.check(!s.list("/data", out, err), "scripted listing failure");
    t.checkContains(err, "Permission denied", "listing failure message");
}

void test_mock_range_put_and_get(TestContext& t) {
    auto server = std::make_shared<scpflow::MockRemoteFs>();
    server->makeDir("/up");
    const fs::path dir = makeTempDir("range");
    const fs::path local = dir / "src.bin";
    writeFile(local, "0123456789");

    scpflow::MockSession s(server);
    scpflow::TransferError cerr;
    t.check(s.connect(targetIdentity(), cerr), "connect for ranges");

    std::string err;
    t.check(s.truncate("/up/dst.bin", 10, err), "truncate creates the target");
    t.check(s.put(local.string(), "/up/dst.bin", err, {}, {},
                  scpflow::ByteRange{5, 5}),
            "range put of the second half");
    t.check(s.put(local.string(), "/up/dst.bin", err, {}, {},
                  scpflow::ByteRange{0, 5}),
            "range put of the first half");
    std::string remote;
    t.check(server->readFile("/up/dst.bin", remote) && remote == "0123456789",
            "ranges written out of order should assemble the file");
    t.check(server->rangePuts().size() == 2, "mock should record both ranges");

    const fs::path back = dir / "back.bin";
    writeFile(back, std::string(10, 'x'));
    t.check(s.get("/up/dst.bin", back.string(), err, {}, {},
                  scpflow::ByteRange{3, 4}),
            "range get into an existing local file");
    t.check(readLocal(back) == "xxx3456xxx",
            "range get should write only its slice");

    std::string missingErr;
    t.check(!s.put(local.string(), "/nope/dst.bin", missingErr),
            "put into a missing parent should fail");

    std::error_code ec;
    fs::remove_all(dir, ec);
}

void test_mock_interrupt_stops_transfer(TestContext& t) {
    auto server = std::make_shared<scpflow::MockRemoteFs>();
    server->setBlockSize(4);
    server->makeDir("/up");
    const fs::path dir = makeTempDir("interrupt");
    const fs::path local = dir / "src.bin";
    writeFile(local, std::string(64, 'z'));

    scpflow::MockSession s(server);
    scpflow::TransferError cerr;
    t.check(s.connect(targetIdentity(), cerr), "connect for interrupt");

    std::string err;
    int calls = 0;
    const bool ok = s.put(local.string(), "/up/z.bin", err,
                          [&](std::uint64_t, std::uint64_t) {
                              if (++calls == 2)
                                  s.interrupt();
                          });
    t.check(!ok, "interrupted put should fail");
    t.checkContains(err, "Cancelled", "interrupt reports a cancel");
    t.check(s.isConnected(), "session stays usable after an interrupt");
    err.clear();
    t.check(s.put(local.string(), "/up/z.bin", err),
            "next put starts with the interrupt cleared");

    std::error_code ec;
    fs::remove_all(dir, ec);
}

void test_mock_exec_emulation(TestContext& t) {
    auto server = std::make_shared<scpflow::MockRemoteFs>();
    server->putFile("/srv/it's.txt", "hello");
    scpflow::MockSession s(server);
    scpflow::TransferError cerr;
    t.check(s.connect(targetIdentity(), cerr), "connect for exec");

    scpflow::ExecResult res;
    std::string err;
    t.check(s.exec("command -v gunzip", res, err), "gunzip lookup runs");
    t.check(res.exit_status == 0, "gunzip is available by default");

    res = scpflow::ExecResult{};
    t.check(s.exec(scpflow::remoteDigestCommand(scpflow::DigestAlgorithm::Sha256,
                                                "/srv/it's.txt"),
                   res, err),
            "checksum command runs");
    std::string expected;
    std::string derr;
    t.check(scpflow::digestBytes(scpflow::DigestAlgorithm::Sha256, "hello",
                                 expected, derr),
            "local digest of a buffer");
    t.checkContains(res.stdout_text, expected,
                    "remote digest should match the stored bytes");

    res = scpflow::ExecResult{};
    t.check(s.exec("frobnicate", res, err), "unknown commands still complete");
    t.check(res.exit_status == 127, "unknown command exits 127");

    server->setExecHandler([](const std::string& cmd, scpflow::ExecResult& out) {
        if (cmd != "sleep 600")
            return false;
        out.timed_out = true;
        return true;
    });
    res = scpflow::ExecResult{};
    t.check(!s.exec("sleep 600", res, err), "timed out command fails");
    t.check(res.timed_out, "timeout flag is reported");
}

void test_ensure_remote_dir(TestContext& t) {
    auto server = std::make_shared<scpflow::MockRemoteFs>();
    server->putFile("/srv/file", "x");
    scpflow::MockSession s(server);
    scpflow::TransferError cerr;
    t.check(s.connect(targetIdentity(), cerr), "connect for mkdir -p");

    std::string err;
    t.check(scpflow::ensureRemoteDir(s, "/srv/a/b/c", err),
            "ensureRemoteDir creates every missing component");
    t.check(server->hasDir("/srv/a") && server->hasDir("/srv/a/b/c"),
            "intermediate directories should exist");
    t.check(scpflow::ensureRemoteDir(s, "/srv/a/b/c", err),
            "ensureRemoteDir is idempotent");
    t.check(!scpflow::ensureRemoteDir(s, "/srv/file/x", err),
            "a file in the way fails");
    t.checkContains(err, "Not a directory", "file in the way message");
}

void test_pool_reuses_idle_session(TestContext& t) {
    auto server = std::make_shared<scpflow::MockRemoteFs>();
    scpflow::SessionPool pool(scpflow::MockSession::factory(server), quietPool());
    const auto id = targetIdentity();

    scpflow::TransferError err;
    std::uint64_t first = 0;
    {
        scpflow::SessionLease lease;
        t.check(pool.lease(id, lease, err), "first lease connects");
        first = lease.sessionId();
        t.check(pool.stats().active == 1, "leased session is active");
    }
    t.check(pool.stats().idle == 1, "released session returns to idle");

    scpflow::SessionLease again;
    t.check(pool.lease(id, again, err), "second lease succeeds");
    t.check(again.sessionId() == first, "idle session should be reused");
    t.check(server->connects() == 1, "reuse must not open a new connection");
}

void test_pool_concurrent_leases_are_distinct(TestContext& t) {
    auto server = std::make_shared<scpflow::MockRemoteFs>();
    scpflow::SessionPool pool(scpflow::MockSession::factory(server), quietPool(2));
    const auto id = targetIdentity();

    scpflow::TransferError err;
    scpflow::SessionLease a;
    scpflow::SessionLease b;
    t.check(pool.lease(id, a, err) && pool.lease(id, b, err),
            "two leases fit under a cap of 2");
    t.check(a.sessionId() != b.sessionId() && a.get() != b.get(),
            "held leases never share a session");
    const std::uint64_t released = b.sessionId();
    b.release();
    scpflow::SessionLease c;
    t.check(pool.lease(id, c, err) && c.sessionId() == released,
            "a released session is reused");
    t.check(server->connects() == 2, "only two connections were opened");
}

void test_pool_cap_makes_callers_wait(TestContext& t) {
    auto server = std::make_shared<scpflow::MockRemoteFs>();
    scpflow::SessionPool pool(scpflow::MockSession::factory(server), quietPool(1));
    const auto id = targetIdentity();

    scpflow::TransferError err;
    scpflow::SessionLease held;
    t.check(pool.lease(id, held, err), "lease up to the cap");

    std::atomic<bool> got{false};
    std::thread waiter([&] {
        scpflow::SessionLease l;
        scpflow::TransferError e;
        if (pool.lease(id, l, e))
            got = true;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    t.check(!got.load(), "a lease above the cap should wait");
    t.check(pool.stats().total == 1, "the cap bounds physical connections");

    held.release();
    waiter.join();
    t.check(got.load(), "waiter gets the session once it is released");
    t.check(server->connects() == 1, "waiter reused the released connection");

    scpflow::SessionLease busy;
    t.check(pool.lease(id, busy, err), "lease again to block the pool");
    scpflow::SessionLease never;
    scpflow::TransferError cancelErr;
    t.check(!pool.lease(id, never, cancelErr, [] { return true; }),
            "a cancelled wait gives up");
    t.check(cancelErr.kind == scpflow::ErrorKind::Cancelled,
            "cancelled wait reports Cancelled");
}

void test_pool_cancel_callback_runs_unlocked(TestContext& t) {
    auto server = std::make_shared<scpflow::MockRemoteFs>();
    scpflow::SessionPool pool(scpflow::MockSession::factory(server), quietPool(1));
    const auto id = targetIdentity();

    scpflow::TransferError err;
    scpflow::SessionLease held;
    t.check(pool.lease(id, held, err), "lease up to the cap");

    // The callback reads pool state, which needs the pool's own lock.
    std::atomic<int> polls{0};
    std::atomic<bool> done{false};
    bool granted = false;
    std::thread waiter([&] {
        scpflow::SessionLease l;
        scpflow::TransferError e;
        granted = pool.lease(id, l, e, [&] {
            ++polls;
            return pool.stats().total == 0;
        });
        done = true;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    t.check(polls.load() > 0, "the waiter polls its cancel callback");
    t.check(!done.load(), "the waiter is still parked at the cap");
    held.release();
    waiter.join();
    t.check(done.load() && granted,
            "the waiter gets the session once it is released");
    t.check(pool.stats().total == 1, "the released session was reused");
}

void test_pool_separates_identities(TestContext& t) {
    auto server = std::make_shared<scpflow::MockRemoteFs>();
    scpflow::SessionPool pool(scpflow::MockSession::factory(server), quietPool(1));

    scpflow::TransferError err;
    scpflow::SessionLease a;
    scpflow::SessionLease b;
    t.check(pool.lease(targetIdentity("one.test"), a, err), "lease host one");
    t.check(pool.lease(targetIdentity("two.test"), b, err),
            "the cap is per identity");
    b.release();

    const scpflow::PoolStats st = pool.stats();
    t.check(st.total == 2 && st.active == 1 && st.idle == 1,
            "stats should count active and idle sessions");
    t.check(st.per_identity.size() == 2, "stats should break down per identity");
    const auto it = st.per_identity.find(targetIdentity("one.test").key());
    t.check(it != st.per_identity.end() && it->second.active == 1,
            "host one should have one active session");
    t.check(st.sessions.size() == 2, "stats should list every session");
    for (const auto& s : st.sessions)
        t.check(s.created_ms > 0 && s.last_used_ms >= s.created_ms,
                "session timestamps should be filled");
}

void test_pool_retires_broken_sessions(TestContext& t) {
    auto server = std::make_shared<scpflow::MockRemoteFs>();
    scpflow::SessionPool pool(scpflow::MockSession::factory(server), quietPool());
    const auto id = targetIdentity();

    scpflow::TransferError err;
    {
        scpflow::SessionLease lease;
        t.check(pool.lease(id, lease, err), "lease before markBroken");
        lease.markBroken();
    }
    t.check(pool.stats().total == 0, "broken lease must not go back to idle");
    t.check(server->liveSessions() == 0, "broken session should be disconnected");

    {
        scpflow::SessionLease lease;
        t.check(pool.lease(id, lease, err), "lease after a retirement");
        static_cast<scpflow::MockSession *>(lease.get())->breakTransport();
    }
    t.check(pool.stats().total == 0,
            "a session that lost its transport is retired on release");
    t.check(server->connects() == 2, "each retirement forces a new connection");
}

void test_pool_connect_failure_not_pooled(TestContext& t) {
    auto server = std::make_shared<scpflow::MockRemoteFs>();
    server->failConnectAtHop(0);
    scpflow::SessionPool pool(scpflow::MockSession::factory(server), quietPool());

    scpflow::SessionLease lease;
    scpflow::TransferError err;
    t.check(!pool.lease(targetIdentity(), lease, err),
            "lease fails when the connect fails");
    t.check(err.kind == scpflow::ErrorKind::Connect && err.hop_index == 0,
            "connect error keeps its hop index");
    t.check(!lease, "failed lease leaves an empty handle");
    t.check(pool.stats().total == 0, "failed connection is not pooled");

    server->failConnectAtHop(-1);
    err.clear();
    t.check(pool.lease(targetIdentity(), lease, err),
            "the slot is free again after a failed connect");
}

void test_pool_evicts_idle_sessions(TestContext& t) {
    auto server = std::make_shared<scpflow::MockRemoteFs>();
    scpflow::SessionPool pool(scpflow::MockSession::factory(server), quietPool(2));
    const auto id = targetIdentity();

    scpflow::TransferError err;
    scpflow::SessionLease busy;
    {
        scpflow::SessionLease idle;
        t.check(pool.lease(id, idle, err), "lease the soon idle session");
        t.check(pool.lease(id, busy, err), "lease a second session");
    }
    t.check(pool.evictIdle(std::chrono::hours(1)) == 0,
            "recently used sessions survive the sweep");
    t.check(pool.evictIdle(std::chrono::milliseconds(0)) == 1,
            "only the idle session is evicted");
    t.check(pool.stats().total == 1, "busy session stays in the pool");
    t.check(server->liveSessions() == 1, "evicted session was disconnected");
}

void test_pool_background_sweep(TestContext& t) {
    auto server = std::make_shared<scpflow::MockRemoteFs>();
    scpflow::PoolSettings ps;
    ps.idle_timeout = std::chrono::milliseconds(20);
    ps.cleanup_interval = std::chrono::milliseconds(30);
    scpflow::SessionPool pool(scpflow::MockSession::factory(server), ps);

    scpflow::TransferError err;
    {
        scpflow::SessionLease lease;
        t.check(pool.lease(targetIdentity(), lease, err), "lease for sweep");
    }
    const auto deadline =
        std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (pool.stats().total != 0 &&
           std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    t.check(pool.stats().total == 0, "sweeper closes sessions past idle timeout");
}

void test_pool_close_all(TestContext& t) {
    auto server = std::make_shared<scpflow::MockRemoteFs>();
    scpflow::SessionPool pool(scpflow::MockSession::factory(server), quietPool(2));
    const auto id = targetIdentity();

    scpflow::TransferError err;
    scpflow::SessionLease busy;
    {
        scpflow::SessionLease idle;
        t.check(pool.lease(id, idle, err), "lease idle-to-be");
        t.check(pool.lease(id, busy, err), "lease busy");
    }
    pool.closeAll();
    t.check(server->liveSessions() == 1, "closeAll closes idle sessions at once");

    scpflow::SessionLease late;
    t.check(!pool.lease(id, late, err), "closed pool rejects new leases");
    t.check(err.kind == scpflow::ErrorKind::InvalidArgument,
            "closed pool reports InvalidArgument");

    busy.release();
    t.check(server->liveSessions() == 0, "busy session closes when returned");
}

void test_pool_settings_validation(TestContext& t) {
    std::string err;
    scpflow::PoolSettings ps;
    t.check(ps.validate(err), "default pool settings are valid");
    t.check(ps.max_sessions_per_identity == 1,
            "pool defaults to one session per identity");
    ps.max_sessions_per_identity = 0;
    t.check(!ps.validate(err), "zero sessions per identity is rejected");
    ps.max_sessions_per_identity = 2;
    ps.idle_timeout = std::chrono::milliseconds(0);
    t.check(!ps.validate(err), "zero idle timeout is rejected");
}

void test_pool_logs_redact_hosts(TestContext& t) {
    std::vector<std::string> lines;
    std::mutex mtx;
    scpflow::setLogSink([&](scpflow::LogLevel, const std::string& line) {
        std::lock_guard<std::mutex> lk(mtx);
        lines.push_back(line);
    });
    {
        auto server = std::make_shared<scpflow::MockRemoteFs>();
        server->failConnectAtHop(0);
        scpflow::SessionPool pool(scpflow::MockSession::factory(server),
                                  quietPool());
        scpflow::SessionLease lease;
        scpflow::TransferError err;
        t.check(!pool.lease(targetIdentity("secret-host.test"), lease, err),
                "scripted connect failure");
    }
    scpflow::setLogSink({});

    std::string all;
    for (const auto& l : lines)
        all += l + "\n";
    t.checkContains(all, "connect failed", "connect failure should be logged");
    t.check(all.find("secret-host.test") == std::string::npos,
            "host names stay out of the log by default");
}

void test_event_channel_drops_oldest_progress(TestContext& t) {
    scpflow::EventChannel ch(3);
    ch.publish(progressEvent(1, 10));
    ch.publish(progressEvent(1, 20));
    ch.publish(stateEvent(1, "running"));
    ch.publish(progressEvent(1, 30));
    t.check(ch.size() == 3, "channel stays at capacity");
    t.check(ch.dropped() == 1, "one progress event was dropped");

    ch.publish(stateEvent(1, "completed", true));
    const auto events = ch.drain();
    t.check(events.size() == 3, "terminal event made room by dropping progress");
    t.check(events.front().kind == scpflow::TransferEvent::Kind::StateChanged,
            "oldest progress events go first");
    t.check(events.back().kind == scpflow::TransferEvent::Kind::Terminal,
            "terminal event is delivered");
    t.check(events[1].transferred == 30, "newest progress survives");

    scpflow::EventChannel full(2);
    full.publish(stateEvent(2, "pending"));
    full.publish(stateEvent(2, "running"));
    full.publish(stateEvent(2, "failed", true));
    t.check(full.size() == 3, "state changes are never dropped");
    full.publish(progressEvent(2, 1));
    t.check(full.size() == 3 && full.dropped() == 1,
            "progress is dropped when only state changes are queued");
}

void test_event_channel_close(TestContext& t) {
    scpflow::EventChannel ch;
    ch.publish(progressEvent(1, 5));
    ch.close();
    ch.publish(progressEvent(1, 6));
    scpflow::TransferEvent ev;
    t.check(ch.next(ev, std::chrono::milliseconds(10)) && ev.transferred == 5,
            "queued events are still delivered after close");
    const auto start = std::chrono::steady_clock::now();
    t.check(!ch.next(ev, std::chrono::seconds(5)),
            "closed and empty channel returns false");
    t.check(std::chrono::steady_clock::now() - start < std::chrono::seconds(1),
            "closed channel does not wait for the timeout");
}

void test_log_redaction(TestContext& t) {
    unsetenv("SCPFLOW_ENV");
    unsetenv("SCPFLOW_LOG_SENSITIVE");
    t.check(!scpflow::sensitiveLoggingEnabled(), "redaction is on by default");
    t.check(scpflow::redactedIdentity("alice@jump:22>bob@db:2222") == "hop0>hop1",
            "identity keeps its hop count only");
    t.check(scpflow::redactedPath("/srv/www/index.html") == ".../index.html",
            "path keeps its file name only");

    setenv("SCPFLOW_LOG_SENSITIVE", "1", 1);
    t.check(!scpflow::sensitiveLoggingEnabled(),
            "sensitive flag alone is not enough");
    setenv("SCPFLOW_ENV", " Dev ", 1);
    t.check(scpflow::sensitiveLoggingEnabled(),
            "development environment honours the flag");
    t.check(scpflow::redactedPath("/srv/www/index.html") == "/srv/www/index.html",
            "sensitive logging keeps full paths");
    unsetenv("SCPFLOW_ENV");
    unsetenv("SCPFLOW_LOG_SENSITIVE");
}

void test_path_helpers(TestContext& t) {
    t.check(scpflow::joinRemotePath("/srv", "a.txt") == "/srv/a.txt",
            "joinRemotePath adds a separator");
    t.check(scpflow::joinRemotePath("/srv/", "a.txt") == "/srv/a.txt",
            "joinRemotePath keeps a single separator");
    t.check(scpflow::joinRemotePath("", "a.txt") == "/a.txt",
            "joinRemotePath roots an empty base");
    t.check(scpflow::remoteParent("/a/b/c.txt") == "/a/b", "remoteParent");
    t.check(scpflow::remoteParent("/c.txt") == "/", "remoteParent of a root file");
    t.check(scpflow::remoteParent("c.txt").empty(), "remoteParent of a bare name");
    t.check(scpflow::remoteBaseName("/a/b/c.txt") == "c.txt", "remoteBaseName");
    t.check(scpflow::lowerExtension("/x/Report.JSON") == ".json",
            "lowerExtension lowers the suffix");
    t.check(scpflow::lowerExtension("/x/.bashrc").empty(),
            "dotfiles have no extension");
    t.check(scpflow::shellQuote("it's") == "'it'\\''s'",
            "shellQuote escapes single quotes");
}

void test_error_describe(TestContext& t) {
    scpflow::TransferError e;
    t.check(e.ok(), "default error is ok");
    e.set(scpflow::ErrorKind::Decompression, "gunzip failed");
    e.exit_status = 1;
    e.stderr_text = "not in gzip format";
    const std::string d = e.describe();
    t.checkContains(d, "decompression: gunzip failed", "kind and message");
    t.checkContains(d, "[exit 1]", "exit status");
    t.checkContains(d, "not in gzip format", "stderr text");
}

} // namespace

int main() {
    TestContext t;
    test_identity_key_and_hops(t);
    test_mock_connect_validation(t);
    test_connect_failure_names_hop(t);
    test_mock_list_and_stat(t);
    test_mock_range_put_and_get(t);
    test_mock_interrupt_stops_transfer(t);
    test_mock_exec_emulation(t);
    test_ensure_remote_dir(t);
    test_pool_reuses_idle_session(t);
    test_pool_concurrent_leases_are_distinct(t);
    test_pool_cap_makes_callers_wait(t);
    test_pool_cancel_callback_runs_unlocked(t);
    test_pool_separates_identities(t);
    test_pool_retires_broken_sessions(t);
    test_pool_connect_failure_not_pooled(t);
    test_pool_evicts_idle_sessions(t);
    test_pool_background_sweep(t);
    test_pool_close_all(t);
    test_pool_settings_validation(t);
    test_pool_logs_redact_hosts(t);
    test_event_channel_drops_oldest_progress(t);
    test_event_channel_close(t);
    test_log_redaction(t);
    test_path_helpers(t);
    test_error_describe(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] scpflow_core_tests\n";
    return EXIT_SUCCESS;
}
