// Pool of connected sessions keyed by host identity (hop chain).
// A session is leased to exactly one caller at a time and returned to the
// idle set on release, unless the lease was marked broken.
#pragma once
#include "RemoteSession.hpp"
#include "TransferError.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace scpflow {

struct PoolSettings {
    // Physical connections allowed per identity; extra lease calls wait.
    std::size_t max_sessions_per_identity = 1;
    std::chrono::milliseconds idle_timeout = std::chrono::minutes(5);
    // Period of the background idle sweep; zero disables the sweeper thread.
    std::chrono::milliseconds cleanup_interval = std::chrono::minutes(2);

    bool validate(std::string& err) const;
};

struct PooledSessionInfo {
    std::uint64_t id = 0;
    std::string identity;
    std::int64_t created_ms = 0;   // epoch milliseconds
    std::int64_t last_used_ms = 0; // epoch milliseconds
    bool busy = false;
};

struct PoolStats {
    struct Counts {
        std::size_t total = 0;
        std::size_t active = 0;
        std::size_t idle = 0;
    };
    std::size_t total = 0;
    std::size_t active = 0;
    std::size_t idle = 0;
    std::map<std::string, Counts> per_identity;
    std::vector<PooledSessionInfo> sessions;
};

class SessionPool;

// Move-only handle to a leased session. Returns the session to its pool when
// released or destroyed.
class SessionLease {
public:
    SessionLease() = default;
    ~SessionLease() { release(); }

    SessionLease(SessionLease&& other) noexcept { *this = std::move(other); }
    SessionLease& operator=(SessionLease&& other) noexcept;
    SessionLease(const SessionLease&) = delete;
    SessionLease& operator=(const SessionLease&) = delete;

    explicit operator bool() const { return session_ != nullptr; }
    RemoteSession *get() const { return session_; }
    RemoteSession *operator->() const { return session_; }
    RemoteSession& operator*() const { return *session_; }
    std::uint64_t sessionId() const { return id_; }

    // The last operation ended in a channel-level error: retire on release.
    void markBroken() { broken_ = true; }
    void release();

private:
    friend class SessionPool;

    SessionPool *pool_ = nullptr;
    std::string key_;
    std::uint64_t id_ = 0;
    RemoteSession *session_ = nullptr;
    bool broken_ = false;
};

class SessionPool {
public:
    explicit SessionPool(SessionFactory factory, PoolSettings settings = {});
    ~SessionPool();

    SessionPool(const SessionPool&) = delete;
    SessionPool& operator=(const SessionPool&) = delete;

    // Blocks until an idle session is free, a new connection is made, or
    // shouldCancel returns true. Connect failures are not retried here.
    bool lease(const HostIdentity& identity, SessionLease& out,
               TransferError& err, const CancelFn& shouldCancel = {});

    void release(SessionLease& lease);

    // Closes idle sessions unused for at least maxIdleAge. Returns the count.
    std::size_t evictIdle(std::chrono::milliseconds maxIdleAge);

    // Closes every idle session and rejects further leases. Busy sessions are
    // closed as they come back.
    void closeAll();

    PoolStats stats() const;
    const PoolSettings& settings() const { return settings_; }

private:
    using Clock = std::chrono::steady_clock;

    struct Entry {
        std::uint64_t id = 0;
        std::unique_ptr<RemoteSession> session;
        Clock::time_point last_used;
        std::int64_t created_ms = 0;
        std::int64_t last_used_ms = 0;
        bool busy = false;
    };

    struct Bucket {
        std::vector<std::unique_ptr<Entry>> entries;
        std::size_t connecting = 0;
    };

    void sweepLoop();

    SessionFactory factory_;
    PoolSettings settings_;

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::map<std::string, Bucket> buckets_; // std::map: stable references
    std::uint64_t nextId_ = 1;
    bool closed_ = false;

    std::mutex sweepMtx_;
    std::condition_variable sweepCv_;
    bool stopSweep_ = false;
    std::thread sweeper_;
};

} // namespace scpflow
