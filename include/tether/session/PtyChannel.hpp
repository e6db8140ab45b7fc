#pragma once

/**
 * @file PtyChannel.hpp
 * @brief Channel backed by a child process on a pseudo-terminal
 *
 * The engine switches to block buffering when its stdout is not a terminal,
 * which would stall prompt detection. forkpty() gives it a real tty; local
 * echo is disabled on the slave so commands are not reflected back.
 */

#include <tether/session/Channel.hpp>

#include <atomic>
#include <sys/types.h>

namespace tether {

class PtyChannel : public Channel {
  public:
    /// Fork and exec. @throws SessionError::SpawnFailed
    explicit PtyChannel(const LaunchSpec &spec);
    ~PtyChannel() override;

    PtyChannel(const PtyChannel &) = delete;
    PtyChannel &operator=(const PtyChannel &) = delete;
    PtyChannel(PtyChannel &&) = delete;
    PtyChannel &operator=(PtyChannel &&) = delete;

    void Write(const std::string &data) override;
    ReadResult Read(std::chrono::milliseconds timeout) override;
    [[nodiscard]] bool IsAlive() override;
    void Interrupt() override;
    void Signal(int signo) override;
    void Terminate(std::chrono::milliseconds grace) override;
    [[nodiscard]] int Pid() const override { return static_cast<int>(pid_); }

    /// Factory suitable for Session
    static ChannelFactory Factory();

  private:
    bool Reap(bool block);

    int master_fd_ = -1;
    pid_t pid_ = -1;
    std::atomic<bool> exited_{false};
};

} // namespace tether
