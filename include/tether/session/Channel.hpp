#pragma once

/**
 * @file Channel.hpp
 * @brief Byte channel to an interactive engine process
 *
 * The Session owns exactly one Channel. Production code uses PtyChannel;
 * tests inject scripted channels through a ChannelFactory.
 */

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace tether {

/**
 * @brief What a process should be launched with
 */
struct LaunchSpec {
    std::string executable;
    std::vector<std::string> args;
};

/**
 * @brief Outcome of a single bounded read
 */
enum class ReadStatus {
    Data,    ///< At least one byte was read
    Timeout, ///< Nothing arrived within the wait budget
    Eof      ///< The process closed its side / exited
};

struct ReadResult {
    ReadStatus status = ReadStatus::Timeout;
    std::string data;
};

/**
 * @brief Abstract bidirectional channel to the engine
 *
 * Implementations must allow Interrupt(), Signal() and IsAlive() to be called
 * from a thread other than the one blocked in Read().
 */
class Channel {
  public:
    virtual ~Channel() = default;

    /// Write all bytes. @throws IOError on failure
    virtual void Write(const std::string &data) = 0;

    /// Wait up to `timeout` for output
    virtual ReadResult Read(std::chrono::milliseconds timeout) = 0;

    [[nodiscard]] virtual bool IsAlive() = 0;

    /// Send the terminal interrupt character (Ctrl-C)
    virtual void Interrupt() = 0;

    /// Deliver a signal to the process
    virtual void Signal(int signo) = 0;

    /// Terminate: wait `grace` for a voluntary exit, then kill
    virtual void Terminate(std::chrono::milliseconds grace) = 0;

    /// Process id, or -1 when not backed by a process
    [[nodiscard]] virtual int Pid() const { return -1; }
};

/// Creates a started channel. @throws SessionError::SpawnFailed
using ChannelFactory = std::function<std::unique_ptr<Channel>(const LaunchSpec &)>;

} // namespace tether
