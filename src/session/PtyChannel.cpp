/**
 * @file PtyChannel.cpp
 * @brief forkpty-based engine channel
 */

#include <tether/session/PtyChannel.hpp>

#include <tether/core/Error.hpp>
#include <tether/io/LogService.hpp>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <pty.h>
#include <sys/wait.h>
#include <termios.h>
#include <unistd.h>

namespace tether {

PtyChannel::PtyChannel(const LaunchSpec &spec) {
    struct termios tio {};
    ::cfmakeraw(&tio);
    // Keep output post-processing so the engine's newlines look normal, but
    // never echo our writes back.
    tio.c_oflag |= OPOST | ONLCR;
    tio.c_lflag |= ISIG | ICANON;
    tio.c_lflag &= ~static_cast<tcflag_t>(ECHO | ECHOE | ECHOK | ECHONL);
    tio.c_iflag |= ICRNL;
    tio.c_cc[VINTR] = 0x03;
    tio.c_cc[VMIN] = 1;
    tio.c_cc[VTIME] = 0;

    struct winsize ws {};
    ws.ws_row = 50;
    ws.ws_col = 512; // wide enough that report tables are not wrapped

    // argv is built before the fork; the child only calls exec, write and _exit
    std::vector<char *> argv;
    argv.reserve(spec.args.size() + 2);
    argv.push_back(const_cast<char *>(spec.executable.c_str()));
    for (const auto &arg : spec.args) {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);
    static const char kExecFailed[] = "tether: exec failed\n";

    int master = -1;
    const pid_t pid = ::forkpty(&master, nullptr, &tio, &ws);
    if (pid < 0) {
        throw SessionError::SpawnFailed(spec.executable, std::strerror(errno));
    }

    if (pid == 0) {
        ::execvp(argv[0], argv.data());
        // Only reached when exec failed; 127 mirrors the shell convention
        [[maybe_unused]] auto n = ::write(STDERR_FILENO, kExecFailed, sizeof(kExecFailed) - 1);
        ::_exit(127);
    }

    master_fd_ = master;
    pid_ = pid;
    ::fcntl(master_fd_, F_SETFL, ::fcntl(master_fd_, F_GETFL) | O_NONBLOCK);
    ::fcntl(master_fd_, F_SETFD, FD_CLOEXEC);

    GetLogService().Debug("spawned '" + spec.executable + "' pid=" + std::to_string(pid_));
}

PtyChannel::~PtyChannel() {
    if (!exited_.load()) {
        Terminate(std::chrono::milliseconds{0});
    }
    if (master_fd_ >= 0) {
        ::close(master_fd_);
    }
}

void PtyChannel::Write(const std::string &data) {
    std::size_t written = 0;
    while (written < data.size()) {
        const ssize_t n = ::write(master_fd_, data.data() + written, data.size() - written);
        if (n > 0) {
            written += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
            struct pollfd pfd {
                master_fd_, POLLOUT, 0
            };
            ::poll(&pfd, 1, 100);
            continue;
        }
        throw IOError("write", "pty", std::strerror(errno));
    }
}

ReadResult PtyChannel::Read(std::chrono::milliseconds timeout) {
    struct pollfd pfd {
        master_fd_, POLLIN, 0
    };
    const int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (ready < 0) {
        if (errno == EINTR) {
            return {ReadStatus::Timeout, {}};
        }
        throw IOError("poll", "pty", std::strerror(errno));
    }
    if (ready == 0) {
        return {IsAlive() ? ReadStatus::Timeout : ReadStatus::Eof, {}};
    }

    char buffer[4096];
    const ssize_t n = ::read(master_fd_, buffer, sizeof(buffer));
    if (n > 0) {
        return {ReadStatus::Data, std::string(buffer, static_cast<std::size_t>(n))};
    }
    if (n < 0 && (errno == EAGAIN || errno == EINTR)) {
        return {ReadStatus::Timeout, {}};
    }
    // EIO on Linux once the slave side is closed
    return {ReadStatus::Eof, {}};
}

bool PtyChannel::Reap(bool block) {
    if (exited_.load()) {
        return true;
    }
    int status = 0;
    const pid_t r = ::waitpid(pid_, &status, block ? 0 : WNOHANG);
    if (r == pid_ || (r < 0 && errno == ECHILD)) {
        exited_.store(true);
        return true;
    }
    return false;
}

bool PtyChannel::IsAlive() { return !Reap(false); }

void PtyChannel::Interrupt() {
    const char ctrl_c = 0x03;
    if (::write(master_fd_, &ctrl_c, 1) != 1) {
        Signal(SIGINT);
    }
}

void PtyChannel::Signal(int signo) {
    if (pid_ > 0 && !exited_.load()) {
        ::kill(pid_, signo);
    }
}

void PtyChannel::Terminate(std::chrono::milliseconds grace) {
    if (pid_ <= 0 || Reap(false)) {
        return;
    }
    const auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (Reap(false)) {
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{20});
    }
    ::kill(pid_, SIGTERM);
    for (int i = 0; i < 25; ++i) {
        if (Reap(false)) {
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{20});
    }
    ::kill(pid_, SIGKILL);
    Reap(true);
}

ChannelFactory PtyChannel::Factory() {
    return [](const LaunchSpec &spec) -> std::unique_ptr<Channel> {
        return std::make_unique<PtyChannel>(spec);
    };
}

} // namespace tether
