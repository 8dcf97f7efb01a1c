// Session pool: per-identity idle lists, connects outside the lock and a
// periodic idle sweep.
#include "scpflow/SessionPool.hpp"
#include "scpflow/Log.hpp"
#include "scpflow/RuntimeLogging.hpp"

#include <algorithm>

namespace scpflow {

namespace {

std::int64_t nowEpochMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

} // namespace

bool PoolSettings::validate(std::string& err) const {
    if (max_sessions_per_identity < 1) {
        err = "Pool needs at least one session per identity";
        return false;
    }
    if (idle_timeout.count() <= 0) {
        err = "Idle timeout must be positive";
        return false;
    }
    if (cleanup_interval.count() < 0) {
        err = "Cleanup interval cannot be negative";
        return false;
    }
    return true;
}

// ---------------------------------------------------------------- SessionLease

SessionLease& SessionLease::operator=(SessionLease&& other) noexcept {
    if (this != &other) {
        release();
        pool_ = other.pool_;
        key_ = std::move(other.key_);
        id_ = other.id_;
        session_ = other.session_;
        broken_ = other.broken_;
        other.pool_ = nullptr;
        other.id_ = 0;
        other.session_ = nullptr;
        other.broken_ = false;
    }
    return *this;
}

void SessionLease::release() {
    if (pool_)
        pool_->release(*this);
}

// ----------------------------------------------------------------- SessionPool

SessionPool::SessionPool(SessionFactory factory, PoolSettings settings)
    : factory_(std::move(factory)), settings_(settings) {
    if (settings_.max_sessions_per_identity < 1)
        settings_.max_sessions_per_identity = 1;
    if (settings_.cleanup_interval.count() > 0)
        sweeper_ = std::thread([this] { sweepLoop(); });
}

SessionPool::~SessionPool() {
    {
        std::lock_guard<std::mutex> lk(sweepMtx_);
        stopSweep_ = true;
    }
    sweepCv_.notify_all();
    if (sweeper_.joinable())
        sweeper_.join();
    closeAll();
}

void SessionPool::sweepLoop() {
    std::unique_lock<std::mutex> lk(sweepMtx_);
    while (!stopSweep_) {
        sweepCv_.wait_for(lk, settings_.cleanup_interval,
                          [this] { return stopSweep_; });
        if (stopSweep_)
            break;
        lk.unlock();
        const std::size_t n = evictIdle(settings_.idle_timeout);
        if (n > 0)
            SCPFLOW_LOGI("pool sweep closed %zu idle session(s)", n);
        lk.lock();
    }
}

bool SessionPool::lease(const HostIdentity& identity, SessionLease& out,
                        TransferError& err, const CancelFn& shouldCancel) {
    out.release();
    const std::string key = identity.key();
    std::unique_lock<std::mutex> lk(mtx_, std::defer_lock);
    for (;;) {
        // Caller code may take its own locks, so it never runs under mtx_.
        if (shouldCancel && shouldCancel()) {
            err.set(ErrorKind::Cancelled, "Cancelled while waiting for a session");
            return false;
        }
        lk.lock();
        if (closed_) {
            err.set(ErrorKind::InvalidArgument, "Session pool is closed");
            return false;
        }
        Bucket& b = buckets_[key];
        // Most recently used idle session first.
        Entry *pick = nullptr;
        for (auto& e : b.entries) {
            if (!e->busy && (!pick || e->last_used > pick->last_used))
                pick = e.get();
        }
        if (pick) {
            pick->busy = true;
            pick->last_used = Clock::now();
            pick->last_used_ms = nowEpochMs();
            out.pool_ = this;
            out.key_ = key;
            out.id_ = pick->id;
            out.session_ = pick->session.get();
            return true;
        }
        if (b.entries.size() + b.connecting <
            settings_.max_sessions_per_identity) {
            ++b.connecting;
            break;
        }
        cv_.wait_for(lk, std::chrono::milliseconds(50));
        lk.unlock();
    }
    lk.unlock();

    std::unique_ptr<RemoteSession> session = factory_ ? factory_() : nullptr;
    bool ok = false;
    if (!session) {
        err.set(ErrorKind::Connect, "Session factory returned no session");
    } else {
        ok = session->connect(identity, err);
    }

    lk.lock();
    Bucket& b = buckets_[key];
    --b.connecting;
    if (!ok || closed_) {
        lk.unlock();
        cv_.notify_all();
        if (ok) {
            session->disconnect();
            err.set(ErrorKind::InvalidArgument, "Session pool is closed");
        } else {
            SCPFLOW_LOGW("connect failed for %s: %s",
                         redactedIdentity(key).c_str(), err.describe().c_str());
        }
        return false;
    }
    auto entry = std::make_unique<Entry>();
    entry->id = nextId_++;
    entry->session = std::move(session);
    entry->last_used = Clock::now();
    entry->created_ms = nowEpochMs();
    entry->last_used_ms = entry->created_ms;
    entry->busy = true;
    out.pool_ = this;
    out.key_ = key;
    out.id_ = entry->id;
    out.session_ = entry->session.get();
    SCPFLOW_LOGD("pool opened session %llu for %s",
                 static_cast<unsigned long long>(entry->id),
                 redactedIdentity(key).c_str());
    b.entries.push_back(std::move(entry));
    return true;
}

void SessionPool::release(SessionLease& lease) {
    if (lease.pool_ != this)
        return;
    const std::string key = std::move(lease.key_);
    const std::uint64_t id = lease.id_;
    const bool broken = lease.broken_;
    lease.pool_ = nullptr;
    lease.session_ = nullptr;
    lease.id_ = 0;
    lease.broken_ = false;
    lease.key_.clear();

    std::unique_ptr<RemoteSession> retired;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto bit = buckets_.find(key);
        if (bit == buckets_.end())
            return;
        auto& entries = bit->second.entries;
        auto it = std::find_if(entries.begin(), entries.end(),
                               [&](const std::unique_ptr<Entry>& e) {
                                   return e->id == id;
                               });
        if (it == entries.end())
            return;
        Entry& e = **it;
        if (broken || closed_ || !e.session->isConnected()) {
            retired = std::move(e.session);
            entries.erase(it);
            SCPFLOW_LOGD("pool retired session %llu",
                         static_cast<unsigned long long>(id));
        } else {
            e.busy = false;
            e.last_used = Clock::now();
            e.last_used_ms = nowEpochMs();
        }
    }
    if (retired)
        retired->disconnect();
    cv_.notify_all();
}

std::size_t SessionPool::evictIdle(std::chrono::milliseconds maxIdleAge) {
    std::vector<std::unique_ptr<RemoteSession>> victims;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        const auto now = Clock::now();
        for (auto bit = buckets_.begin(); bit != buckets_.end();) {
            auto& entries = bit->second.entries;
            for (auto it = entries.begin(); it != entries.end();) {
                if (!(*it)->busy && now - (*it)->last_used >= maxIdleAge) {
                    victims.push_back(std::move((*it)->session));
                    it = entries.erase(it);
                } else {
                    ++it;
                }
            }
            if (entries.empty() && bit->second.connecting == 0)
                bit = buckets_.erase(bit);
            else
                ++bit;
        }
    }
    for (auto& s : victims)
        s->disconnect();
    if (!victims.empty())
        cv_.notify_all();
    return victims.size();
}

void SessionPool::closeAll() {
    std::vector<std::unique_ptr<RemoteSession>> victims;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        closed_ = true;
        for (auto& kv : buckets_) {
            auto& entries = kv.second.entries;
            for (auto it = entries.begin(); it != entries.end();) {
                if (!(*it)->busy) {
                    victims.push_back(std::move((*it)->session));
                    it = entries.erase(it);
                } else {
                    ++it;
                }
            }
        }
    }
    for (auto& s : victims)
        s->disconnect();
    cv_.notify_all();
}

PoolStats SessionPool::stats() const {
    PoolStats st;
    std::lock_guard<std::mutex> lk(mtx_);
    for (const auto& kv : buckets_) {
        if (kv.second.entries.empty())
            continue;
        PoolStats::Counts& c = st.per_identity[kv.first];
        for (const auto& e : kv.second.entries) {
            ++c.total;
            ++st.total;
            if (e->busy) {
                ++c.active;
                ++st.active;
            } else {
                ++c.idle;
                ++st.idle;
            }
            PooledSessionInfo info;
            info.id = e->id;
            info.identity = kv.first;
            info.created_ms = e->created_ms;
            info.last_used_ms = e->last_used_ms;
            info.busy = e->busy;
            st.sessions.push_back(std::move(info));
        }
    }
    return st;
}

} // namespace scpflow
