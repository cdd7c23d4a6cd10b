#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <thread>

namespace panxfer {

/// Cooperative cancellation signal. A token may be linked to a parent so a
/// session-scoped token also fires when the caller's token fires.
class CancelToken {
public:
    explicit CancelToken(const CancelToken* parent = nullptr) : parent_(parent) {}

    CancelToken(const CancelToken&) = delete;
    CancelToken& operator=(const CancelToken&) = delete;

    void cancel() {
        {
            std::lock_guard lock(mutex_);
            cancelled_ = true;
        }
        cv_.notify_all();
    }

    bool cancelled() const {
        return cancelled_.load() || (parent_ && parent_->cancelled());
    }

    /// Sleep up to `duration`. Returns false if cancelled before it elapsed.
    /// Parent cancellation is noticed within one polling slice.
    template <typename Rep, typename Period>
    bool sleep_for(std::chrono::duration<Rep, Period> duration) const {
        auto deadline = std::chrono::steady_clock::now() + duration;
        std::unique_lock lock(mutex_);
        while (!cancelled()) {
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) return true;
            auto slice = std::min<std::chrono::steady_clock::duration>(
                deadline - now, std::chrono::milliseconds(50));
            cv_.wait_for(lock, slice);
        }
        return false;
    }

private:
    const CancelToken* parent_;
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

inline bool is_cancelled(const CancelToken* token) { return token && token->cancelled(); }

/// Sleep that honours an optional cancel token. Returns false when cancelled.
template <typename Rep, typename Period>
bool cancellable_sleep(const CancelToken* token, std::chrono::duration<Rep, Period> duration) {
    if (token) return token->sleep_for(duration);
    std::this_thread::sleep_for(duration);
    return true;
}

/// Unbounded multi-producer queue with close semantics. pop() blocks until an
/// item arrives or the channel is closed and drained.
template <typename T>
class Channel {
public:
    void push(T item) {
        {
            std::lock_guard lock(mutex_);
            if (closed_) return;
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
    }

    std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this] { return closed_ || !items_.empty(); });
        if (items_.empty()) return std::nullopt;
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    std::optional<T> try_pop() {
        std::lock_guard lock(mutex_);
        if (items_.empty()) return std::nullopt;
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    void close() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    size_t size() const {
        std::lock_guard lock(mutex_);
        return items_.size();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> items_;
    bool closed_ = false;
};

/// Counting gate bounding how many operations of one kind run at once
/// (upload sessions, downloads). acquire() can be abandoned via a CancelToken.
class ConcurrencyGate {
public:
    explicit ConcurrencyGate(size_t limit) : limit_(limit == 0 ? 1 : limit) {}

    bool acquire(const CancelToken* cancel = nullptr) {
        std::unique_lock lock(mutex_);
        while (active_ >= limit_) {
            if (is_cancelled(cancel)) return false;
            cv_.wait_for(lock, std::chrono::milliseconds(50));
        }
        if (is_cancelled(cancel)) return false;
        ++active_;
        return true;
    }

    void release() {
        {
            std::lock_guard lock(mutex_);
            if (active_ > 0) --active_;
        }
        cv_.notify_one();
    }

    size_t active() const {
        std::lock_guard lock(mutex_);
        return active_;
    }

    size_t limit() const { return limit_; }

    /// RAII slot; check held() before proceeding.
    class Slot {
    public:
        Slot(ConcurrencyGate& gate, const CancelToken* cancel)
            : gate_(gate), held_(gate.acquire(cancel)) {}
        ~Slot() {
            if (held_) gate_.release();
        }
        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;
        bool held() const { return held_; }

    private:
        ConcurrencyGate& gate_;
        bool held_;
    };

private:
    const size_t limit_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    size_t active_ = 0;
};

}  // namespace panxfer
