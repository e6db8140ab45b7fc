#pragma once

/**
 * @file FakeEngine.hpp
 * @brief Scripted in-process engine for Session tests
 *
 * Usage:
 * @code
 * auto engine = std::make_shared<FakeEngine>();
 * engine->On("puts hi", "hi");
 * Session session(config, engine->Factory());
 * @endcode
 *
 * Every write is recorded with a timestamp so tests can check ordering.
 */

#include <tether/session/Channel.hpp>

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tether::testing {

using Clock = std::chrono::steady_clock;
using std::chrono::milliseconds;

/// What the engine does with one command line
struct FakeReply {
    std::string output;
    milliseconds delay{0};
    bool prompt = true; ///< false = never finishes (hang)
    bool exit = false;  ///< process exits after the output

    static FakeReply Text(std::string out, milliseconds delay = milliseconds{0}) {
        FakeReply r;
        r.output = std::move(out);
        r.delay = delay;
        return r;
    }
    static FakeReply Hang(std::string partial = "") {
        FakeReply r;
        r.output = std::move(partial);
        r.prompt = false;
        return r;
    }
    static FakeReply Exit(std::string out = "") {
        FakeReply r;
        r.output = std::move(out);
        r.prompt = false;
        r.exit = true;
        return r;
    }
};

class FakeEngine : public std::enable_shared_from_this<FakeEngine> {
  public:
    struct WriteRecord {
        std::string line;
        Clock::time_point at;
    };

    std::string prompt = "Vivado% ";
    std::string banner = "****** Vivado v2023.2 (64-bit)\n";
    bool echo = false;
    bool start_prompt = true;
    bool start_exits = false;
    milliseconds start_delay{0};

    /// Emit a fresh prompt when interrupted while a command hangs
    bool prompt_on_interrupt = true;

    /// Fallback for commands without an exact script entry
    std::function<FakeReply(const std::string &)> handler = [](const std::string &) {
        return FakeReply::Text("");
    };

    void On(const std::string &command, FakeReply reply) { script_[command] = std::move(reply); }
    void On(const std::string &command, const std::string &output) {
        script_[command] = FakeReply::Text(output);
    }

    /// Queue text as if the engine printed it on its own
    void Emit(const std::string &text, milliseconds delay = milliseconds{0}) {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.push_back({Clock::now() + delay, text, false});
        cv_.notify_all();
    }

    [[nodiscard]] std::vector<WriteRecord> Writes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return writes_;
    }

    [[nodiscard]] std::vector<std::string> Commands() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> out;
        for (const auto &w : writes_) {
            out.push_back(w.line);
        }
        return out;
    }

    [[nodiscard]] int Spawns() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return spawns_;
    }
    [[nodiscard]] int Interrupts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return interrupts_;
    }
    [[nodiscard]] bool Alive() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return alive_;
    }
    [[nodiscard]] LaunchSpec LastLaunch() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_launch_;
    }

    /// Kill the fake process from outside
    void Crash() {
        std::lock_guard<std::mutex> lock(mutex_);
        alive_ = false;
        cv_.notify_all();
    }

    ChannelFactory Factory() {
        auto self = shared_from_this();
        return [self](const LaunchSpec &spec) -> std::unique_ptr<Channel> {
            self->Spawn(spec);
            return std::make_unique<Handle>(self);
        };
    }

  private:
    struct Chunk {
        Clock::time_point ready_at;
        std::string text;
        bool exit_after;
    };

    class Handle : public Channel {
      public:
        explicit Handle(std::shared_ptr<FakeEngine> engine) : engine_(std::move(engine)) {}
        void Write(const std::string &data) override { engine_->OnWrite(data); }
        ReadResult Read(milliseconds timeout) override { return engine_->OnRead(timeout); }
        bool IsAlive() override { return engine_->Alive(); }
        void Interrupt() override { engine_->OnInterrupt(); }
        void Signal(int /*signo*/) override { engine_->Crash(); }
        void Terminate(milliseconds /*grace*/) override { engine_->Crash(); }

      private:
        std::shared_ptr<FakeEngine> engine_;
    };

    void Spawn(const LaunchSpec &spec) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++spawns_;
        last_launch_ = spec;
        alive_ = true;
        hung_ = false;
        pending_.clear();
        line_buffer_.clear();
        const auto at = Clock::now() + start_delay;
        if (start_exits) {
            pending_.push_back({at, banner, true});
        } else {
            pending_.push_back({at, banner + (start_prompt ? prompt : ""), false});
        }
    }

    void OnWrite(const std::string &data) {
        std::lock_guard<std::mutex> lock(mutex_);
        line_buffer_ += data;
        std::size_t pos;
        while ((pos = line_buffer_.find('\n')) != std::string::npos) {
            const std::string line = line_buffer_.substr(0, pos);
            line_buffer_.erase(0, pos + 1);
            writes_.push_back({line, Clock::now()});
            if (!alive_) {
                continue;
            }

            FakeReply reply;
            if (line == "exit") {
                reply = FakeReply::Exit();
            } else if (auto it = script_.find(line); it != script_.end()) {
                reply = it->second;
            } else {
                reply = handler(line);
            }

            std::string text = echo ? line + "\n" : "";
            if (!reply.output.empty()) {
                text += reply.output + "\n";
            }
            if (reply.prompt) {
                text += prompt;
            } else if (!reply.exit) {
                hung_ = true;
            }
            pending_.push_back({Clock::now() + reply.delay, text, reply.exit});
        }
        cv_.notify_all();
    }

    ReadResult OnRead(milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        const auto deadline = Clock::now() + timeout;
        while (true) {
            if (!pending_.empty() && pending_.front().ready_at <= Clock::now()) {
                Chunk chunk = std::move(pending_.front());
                pending_.pop_front();
                if (chunk.exit_after) {
                    alive_ = false;
                    pending_.clear();
                }
                if (!chunk.text.empty()) {
                    return {ReadStatus::Data, chunk.text};
                }
                continue;
            }
            if (!alive_) {
                return {ReadStatus::Eof, {}};
            }
            auto wake = deadline;
            if (!pending_.empty() && pending_.front().ready_at < wake) {
                wake = pending_.front().ready_at;
            }
            if (Clock::now() >= deadline) {
                return {ReadStatus::Timeout, {}};
            }
            cv_.wait_until(lock, wake);
        }
    }

    void OnInterrupt() {
        std::lock_guard<std::mutex> lock(mutex_);
        ++interrupts_;
        if (hung_ && prompt_on_interrupt) {
            hung_ = false;
            pending_.push_back({Clock::now(), "\n" + prompt, false});
            cv_.notify_all();
        }
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<std::string, FakeReply> script_;
    std::deque<Chunk> pending_;
    std::vector<WriteRecord> writes_;
    std::string line_buffer_;
    LaunchSpec last_launch_;
    bool alive_ = false;
    bool hung_ = false;
    int spawns_ = 0;
    int interrupts_ = 0;
};

} // namespace tether::testing
