#pragma once

/**
 * @file FifoMutex.hpp
 * @brief Ticket lock that admits waiters in arrival order
 *
 * std::mutex makes no fairness promise; engine commands must run in the
 * order callers asked for them.
 */

#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace tether {

class FifoMutex {
  public:
    void lock() {
        std::unique_lock<std::mutex> guard(mutex_);
        const uint64_t ticket = next_ticket_++;
        cv_.wait(guard, [&] { return now_serving_ == ticket; });
    }

    void unlock() {
        {
            std::lock_guard<std::mutex> guard(mutex_);
            ++now_serving_;
        }
        cv_.notify_all();
    }

    /// Number of callers holding or waiting for the lock
    [[nodiscard]] uint64_t QueueDepth() const {
        std::lock_guard<std::mutex> guard(mutex_);
        return next_ticket_ - now_serving_;
    }

  private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    uint64_t next_ticket_ = 0;
    uint64_t now_serving_ = 0;
};

} // namespace tether
