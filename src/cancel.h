#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

#include "errors.h"

namespace mbk {

// Cooperative cancellation, checked at every suspension point
// (store walk, block read, stream receive, backoff sleep).
class CancelToken {
public:
    void cancel() {
        {
            std::lock_guard<std::mutex> lk(mu_);
            cancelled_.store(true, std::memory_order_release);
        }
        cv_.notify_all();
    }

    bool cancelled() const { return cancelled_.load(std::memory_order_acquire); }

    void throw_if_cancelled() const {
        if (cancelled()) throw CancelledError();
    }

    // Sleeps for d unless cancelled first. Returns false when cancelled.
    template <typename Rep, typename Period>
    bool wait_for(std::chrono::duration<Rep, Period> d) {
        std::unique_lock<std::mutex> lk(mu_);
        return !cv_.wait_for(lk, d, [this] { return cancelled_.load(std::memory_order_acquire); });
    }

private:
    std::atomic<bool>       cancelled_{false};
    std::mutex              mu_;
    std::condition_variable cv_;
};

} // namespace mbk
