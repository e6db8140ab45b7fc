#pragma once

/**
 * @file AsyncExecutor.hpp
 * @brief Non-blocking front for Session::Execute
 *
 * One worker thread takes submissions in FIFO order and runs them one at a
 * time; the caller gets a future. Session::Execute stays a blocking call and
 * is never entered twice from here.
 */

#include <tether/core/Error.hpp>
#include <tether/session/Session.hpp>

#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace tether {

class AsyncExecutor {
  public:
    explicit AsyncExecutor(Session &session) : session_(session) {
        worker_ = std::thread([this] { WorkerLoop(); });
    }

    /// Finishes the command in flight; queued commands fail with SessionError
    ~AsyncExecutor() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
        }
        cv_.notify_all();
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    AsyncExecutor(const AsyncExecutor &) = delete;
    AsyncExecutor &operator=(const AsyncExecutor &) = delete;

    /**
     * @brief Queue a command
     *
     * Exceptions from Session::Execute (NotReady) are delivered through the future.
     */
    std::future<Transaction>
    Submit(std::string command, std::optional<std::chrono::milliseconds> timeout = std::nullopt) {
        Job job{std::move(command), timeout, {}};
        auto future = job.promise.get_future();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) {
                job.promise.set_exception(std::make_exception_ptr(
                    SessionError(SessionErrorKind::NotReady, "executor is shutting down")));
                return future;
            }
            jobs_.push_back(std::move(job));
        }
        cv_.notify_one();
        return future;
    }

    /// Submissions not yet picked up by the worker
    [[nodiscard]] std::size_t Pending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return jobs_.size();
    }

  private:
    struct Job {
        std::string command;
        std::optional<std::chrono::milliseconds> timeout;
        std::promise<Transaction> promise;
    };

    void WorkerLoop() {
        for (;;) {
            Job job;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return stopping_ || !jobs_.empty(); });
                if (stopping_) {
                    break;
                }
                job = std::move(jobs_.front());
                jobs_.pop_front();
            }
            try {
                job.promise.set_value(session_.Execute(job.command, job.timeout));
            } catch (...) {
                job.promise.set_exception(std::current_exception());
            }
        }

        std::lock_guard<std::mutex> lock(mutex_);
        for (auto &job : jobs_) {
            job.promise.set_exception(std::make_exception_ptr(SessionError(
                SessionErrorKind::NotReady, "executor stopped before '" + job.command + "' ran")));
        }
        jobs_.clear();
    }

    Session &session_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Job> jobs_;
    bool stopping_ = false;
    std::thread worker_;
};

} // namespace tether
