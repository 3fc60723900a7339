#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <mutex>
#include <thread>
#include <utility>

#include "logging.h"

namespace mbk {

// Bounded-concurrency stage that runs jobs in parallel but hands their
// results to the sink strictly in submission order.
//
// Each submit() takes the next ticket and starts the job right away; at
// most `depth` tickets are in flight, further submits block. A single
// drain thread waits on tickets in order and calls the sink.
template <typename R>
class OrderedPipeline {
public:
    using Job  = std::function<R()>;
    using Sink = std::function<void(R&&)>;

    OrderedPipeline(size_t depth, Sink sink)
        : depth_(depth ? depth : 1), sink_(std::move(sink)) {
        drain_ = std::thread([this] { drain_loop(); });
    }

    ~OrderedPipeline() {
        try {
            close();
        } catch (const std::exception& e) {
            LOG_ERROR(std::string("ordered pipeline: ") + e.what());
        }
    }

    OrderedPipeline(const OrderedPipeline&) = delete;
    OrderedPipeline& operator=(const OrderedPipeline&) = delete;

    // Returns the ticket assigned to the job.
    uint64_t submit(Job job) {
        std::unique_lock<std::mutex> lk(mu_);
        space_cv_.wait(lk, [this] { return inflight_.size() < depth_; });
        uint64_t ticket = next_ticket_++;
        inflight_.emplace_back(ticket, std::async(std::launch::async, std::move(job)));
        ready_cv_.notify_one();
        return ticket;
    }

    // Waits for every submitted job to be drained. Rethrows the first
    // exception raised by a job or the sink.
    void close() {
        {
            std::lock_guard<std::mutex> lk(mu_);
            closed_ = true;
        }
        ready_cv_.notify_all();
        if (drain_.joinable()) drain_.join();
        if (error_) {
            std::exception_ptr e = error_;
            error_ = nullptr;
            std::rethrow_exception(e);
        }
    }

    uint64_t drained() const { return drained_; }

private:
    void drain_loop() {
        while (true) {
            std::future<R> next;
            {
                std::unique_lock<std::mutex> lk(mu_);
                ready_cv_.wait(lk, [this] { return !inflight_.empty() || closed_; });
                if (inflight_.empty()) return;
                next = std::move(inflight_.front().second);
            }

            try {
                R result = next.get();
                if (!error_) sink_(std::move(result));
            } catch (const std::exception&) {
                if (!error_) error_ = std::current_exception();
            }

            {
                std::lock_guard<std::mutex> lk(mu_);
                inflight_.pop_front();
                drained_++;
            }
            space_cv_.notify_one();
        }
    }

    size_t depth_;
    Sink sink_;
    std::mutex mu_;
    std::condition_variable space_cv_;
    std::condition_variable ready_cv_;
    std::deque<std::pair<uint64_t, std::future<R>>> inflight_;
    uint64_t next_ticket_{0};
    std::atomic<uint64_t> drained_{0};
    bool closed_{false};
    std::exception_ptr error_;
    std::thread drain_;
};

} // namespace mbk
