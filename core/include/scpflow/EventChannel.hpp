// Bounded queue of transfer events handed to observers.
// On overflow the oldest progress event is dropped; state changes and
// terminal events are always delivered.
#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <iterator>
#include <mutex>
#include <string>
#include <vector>

namespace scpflow {

struct TransferEvent {
    enum class Kind { Progress, StateChanged, Terminal };

    Kind kind = Kind::Progress;
    std::uint64_t task_id = 0;
    std::string status;
    std::uint64_t transferred = 0;
    std::uint64_t total = 0;
    double speed = 0.0; // bytes/s
    std::string message;
    std::int64_t timestamp_ms = 0;
};

class EventChannel {
public:
    explicit EventChannel(std::size_t capacity = 256)
        : capacity_(capacity < 1 ? 1 : capacity) {}

    void publish(TransferEvent ev) {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (closed_)
                return;
            if (queue_.size() >= capacity_ && !makeRoom()) {
                if (ev.kind == TransferEvent::Kind::Progress) {
                    ++dropped_;
                    return;
                }
            }
            queue_.push_back(std::move(ev));
        }
        cv_.notify_one();
    }

    // Waits up to `timeout`; false when nothing arrived or the channel is
    // closed and empty.
    bool next(TransferEvent& out, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lk(mtx_);
        cv_.wait_for(lk, timeout, [this] { return !queue_.empty() || closed_; });
        if (queue_.empty())
            return false;
        out = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    std::vector<TransferEvent> drain() {
        std::lock_guard<std::mutex> lk(mtx_);
        std::vector<TransferEvent> out(std::make_move_iterator(queue_.begin()),
                                       std::make_move_iterator(queue_.end()));
        queue_.clear();
        return out;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return closed_;
    }

    std::size_t dropped() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return dropped_;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return queue_.size();
    }

private:
    bool makeRoom() {
        for (auto it = queue_.begin(); it != queue_.end(); ++it) {
            if (it->kind == TransferEvent::Kind::Progress) {
                queue_.erase(it);
                ++dropped_;
                return true;
            }
        }
        return false;
    }

    const std::size_t capacity_;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<TransferEvent> queue_;
    std::size_t dropped_ = 0;
    bool closed_ = false;
};

} // namespace scpflow
