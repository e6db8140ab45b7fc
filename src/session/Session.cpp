/**
 * @file Session.cpp
 * @brief Engine process lifecycle and command execution
 */

#include <tether/session/Session.hpp>

#include <tether/core/ErrorLogging.hpp>
#include <tether/session/PtyChannel.hpp>

#include <algorithm>

namespace tether {

namespace {

using Clock = std::chrono::steady_clock;
using std::chrono::duration_cast;
using std::chrono::milliseconds;

constexpr milliseconds kReadSlice{50};
constexpr const char *kHealthToken = "TETHER_HEALTH_OK";

std::string JoinProblems(const std::vector<std::string> &problems) {
    std::string joined;
    for (const auto &p : problems) {
        joined += (joined.empty() ? "" : "; ") + p;
    }
    return joined;
}

std::string Preview(const std::string &text, std::size_t n = 120) {
    std::string one_line = text.substr(0, n);
    std::replace(one_line.begin(), one_line.end(), '\n', ' ');
    return text.size() > n ? one_line + "..." : one_line;
}

} // namespace

Session::Session(SessionConfig config, ChannelFactory factory)
    : config_(std::move(config)), factory_(factory ? std::move(factory) : PtyChannel::Factory()),
      framer_(config_.prompt, config_.error_markers) {
    auto problems = config_.Validate();
    if (!problems.empty()) {
        throw ConfigError(JoinProblems(problems));
    }
}

Session::~Session() {
    try {
        Stop();
    } catch (const Error &e) {
        LogError(e);
    }
}

// =============================================================================
// Lifecycle
// =============================================================================

void Session::Start(const std::string &executable,
                    std::optional<milliseconds> startup_timeout,
                    const std::vector<std::string> &extra_args) {
    std::unique_lock<FifoMutex> lock(exec_lock_);
    LogContextManager::ScopedContext ctx("session");

    const auto current = state_.load();
    if (current != SessionState::Uninitialized) {
        TETHER_THROW_LOG(SessionError::AlreadyStarted(SessionStateName(current)));
    }
    state_ = SessionState::Starting;

    LaunchSpec spec;
    spec.executable = executable.empty() ? config_.executable : executable;
    spec.args = config_.args;
    spec.args.insert(spec.args.end(), extra_args.begin(), extra_args.end());
    const auto budget = startup_timeout.value_or(config_.startup_timeout);

    GetLogService().Info("starting '" + spec.executable + "' (startup timeout " +
                         std::to_string(budget.count()) + " ms)");

    std::unique_ptr<Channel> channel;
    try {
        channel = factory_(spec);
    } catch (const SessionError &e) {
        state_ = SessionState::Uninitialized;
        LogError(e);
        throw;
    }
    {
        std::lock_guard<std::mutex> guard(channel_mutex_);
        channel_ = std::move(channel);
    }

    // Wait for the optional banner, then for a prompt at end of stream
    framer_.Begin("");
    const auto deadline = Clock::now() + budget;
    bool banner_seen = config_.startup_banner.empty();
    bool ready = false;
    bool exited = false;
    while (!ready && !exited) {
        const auto remaining = duration_cast<milliseconds>(deadline - Clock::now());
        if (remaining.count() <= 0) {
            break;
        }
        auto result = channel_->Read(std::min(remaining, kReadSlice));
        switch (result.status) {
        case ReadStatus::Data:
            framer_.Feed(result.data);
            if (!banner_seen) {
                banner_seen =
                    framer_.Buffer().find(config_.startup_banner) != std::string::npos;
            }
            ready = banner_seen && framer_.Complete();
            break;
        case ReadStatus::Eof:
            exited = true;
            break;
        case ReadStatus::Timeout:
            break;
        }
    }

    if (!ready) {
        const std::string output = framer_.Buffer();
        Teardown(milliseconds{0});
        state_ = SessionState::Uninitialized;
        if (exited) {
            TETHER_THROW_LOG(SessionError::ProcessExited("startup"));
        }
        TETHER_THROW_LOG(SessionError::StartupTimeout(
            std::chrono::duration<double>(budget).count(), output));
    }

    GetLogService().Debug("startup output: " + Preview(framer_.Text(), 400));

    const auto now_wall = std::chrono::system_clock::now();
    started_wall_ns_ = NowNs(now_wall);
    started_steady_ns_ = Clock::now().time_since_epoch().count();
    resync_pending_ = false;
    abort_ = false;
    {
        std::lock_guard<std::mutex> guard(info_mutex_);
        executable_ = spec.executable;
        last_start_ = StartParams{executable, startup_timeout, extra_args};
    }
    const auto gen = ++generation_;
    state_ = SessionState::Ready;
    GetLogService().Event("session ready (generation " + std::to_string(gen) + ", pid " +
                          std::to_string(channel_->Pid()) + ")");
}

void Session::Stop() {
    if (state_.load() == SessionState::Uninitialized) {
        return;
    }

    // Ask an in-flight command to give up before queueing behind it
    abort_ = true;
    std::unique_lock<FifoMutex> lock(exec_lock_);
    LogContextManager::ScopedContext ctx("session");

    if (state_.load() == SessionState::Uninitialized) {
        abort_ = false;
        return;
    }
    const bool failed = state_.load() == SessionState::Failed;
    state_ = SessionState::Stopping;

    milliseconds grace{0};
    if (channel_ && channel_->IsAlive() && !failed) {
        if (resync_pending_.load()) {
            // Engine is still busy with a timed-out command and will not read
            // the exit command; interrupt first.
            channel_->Interrupt();
        }
        try {
            channel_->Write(config_.exit_command + config_.line_terminator);
            grace = config_.exit_grace;
        } catch (const IOError &e) {
            GetLogService().Debug(std::string("exit command not delivered: ") + e.what());
        }
    }
    Teardown(grace);

    started_wall_ns_ = 0;
    started_steady_ns_ = 0;
    resync_pending_ = false;
    abort_ = false;
    state_ = SessionState::Uninitialized;
    GetLogService().Event("session stopped");
}

void Session::Teardown(milliseconds grace) {
    std::unique_ptr<Channel> channel;
    {
        std::lock_guard<std::mutex> guard(channel_mutex_);
        channel = std::move(channel_);
    }
    if (channel) {
        channel->Terminate(grace);
    }
}

void Session::Restart() {
    std::optional<StartParams> params;
    {
        std::lock_guard<std::mutex> guard(info_mutex_);
        params = last_start_;
    }
    Stop();
    if (params) {
        Start(params->executable, params->startup_timeout, params->extra_args);
    } else {
        Start();
    }
}

// =============================================================================
// Execution
// =============================================================================

Session::DrainResult Session::ReadUntilPrompt(milliseconds budget, bool inactivity) {
    auto deadline = Clock::now() + budget;
    while (!framer_.Complete()) {
        if (abort_.load()) {
            return DrainResult::Aborted;
        }
        const auto remaining = duration_cast<milliseconds>(deadline - Clock::now());
        if (remaining.count() <= 0) {
            return DrainResult::Timeout;
        }
        auto result = channel_->Read(std::min(remaining, kReadSlice));
        switch (result.status) {
        case ReadStatus::Data:
            GetLogService().Trace("recv " + std::to_string(result.data.size()) + " bytes");
            framer_.Feed(result.data);
            if (inactivity) {
                deadline = Clock::now() + budget;
            }
            break;
        case ReadStatus::Eof:
            return DrainResult::Exited;
        case ReadStatus::Timeout:
            break;
        }
    }
    return DrainResult::Prompt;
}

Transaction Session::Execute(const std::string &command, std::optional<milliseconds> timeout) {
    {
        const auto current = state_.load();
        if (current != SessionState::Ready && current != SessionState::Busy) {
            TETHER_THROW_LOG(SessionError::NotReady(SessionStateName(current)));
        }
    }

    std::unique_lock<FifoMutex> lock(exec_lock_);
    {
        // Re-check: the session may have stopped or failed while we queued
        const auto current = state_.load();
        if (current != SessionState::Ready || abort_.load()) {
            TETHER_THROW_LOG(SessionError::NotReady(
                abort_.load() ? "Stopping" : SessionStateName(current)));
        }
    }

    Transaction tx;
    tx.id = ++command_count_;
    tx.command = command;
    LogContextManager::ScopedContext ctx("session", tx.id);
    state_ = SessionState::Busy;

    const auto budget = timeout.value_or(config_.command_timeout);
    const bool inactivity = config_.timeout_mode == TimeoutMode::Inactivity;
    const auto started = Clock::now();

    auto finish = [&](CompletionKind kind) {
        tx.completion = kind;
        tx.elapsed = duration_cast<milliseconds>(Clock::now() - started);
        FinishCommand(tx);
        return tx;
    };
    auto exited = [&]() {
        state_ = SessionState::Failed;
        GetLogService().Error(abort_.load() ? "command aborted by stop"
                                            : "engine process exited during command");
        return finish(CompletionKind::ProcessExited);
    };

    // Resynchronize after an earlier timeout
    if (resync_pending_.load()) {
        framer_.Begin("");
        const auto drain_budget = timeout.value_or(config_.resync_timeout);
        const auto drained = ReadUntilPrompt(drain_budget, false);
        tx.stale_output = framer_.Text();
        if (drained == DrainResult::Exited || drained == DrainResult::Aborted) {
            tx.command_sent = false;
            return exited();
        }
        if (drained == DrainResult::Timeout) {
            tx.command_sent = false;
            state_ = SessionState::Ready;
            GetLogService().Warning("previous command still running; '" + Preview(command, 60) +
                                    "' not sent");
            return finish(CompletionKind::Timeout);
        }
        resync_pending_ = false;
        GetLogService().Warning("drained " + std::to_string(tx.stale_output.size()) +
                                " chars of stale output from a timed-out command");
    }

    framer_.Begin(command);
    GetLogService().Debug("send: " + Preview(command));
    try {
        channel_->Write(command + config_.line_terminator);
    } catch (const IOError &e) {
        if (!channel_->IsAlive()) {
            tx.command_sent = false;
            return exited();
        }
        state_ = SessionState::Ready;
        LogError(e);
        throw;
    }

    switch (ReadUntilPrompt(budget, inactivity)) {
    case DrainResult::Prompt:
        break;
    case DrainResult::Exited:
    case DrainResult::Aborted:
        tx.raw = framer_.Text();
        return exited();
    case DrainResult::Timeout:
        tx.raw = framer_.Text();
        resync_pending_ = true;
        if (config_.interrupt_on_timeout) {
            channel_->Interrupt();
        }
        state_ = SessionState::Ready;
        GetLogService().Warning("no prompt within " + std::to_string(budget.count()) +
                                " ms; engine may still be running '" + Preview(command, 60) + "'");
        return finish(CompletionKind::Timeout);
    }

    tx.raw = framer_.Text();
    tx.error_messages = framer_.DetectErrors(tx.raw);
    state_ = SessionState::Ready;
    if (!tx.error_messages.empty()) {
        GetLogService().Warning("engine error: " + Preview(tx.error_messages.front()));
        return finish(CompletionKind::ErrorDetected);
    }
    return finish(CompletionKind::PromptMatched);
}

void Session::FinishCommand(const Transaction &tx) {
    total_command_ms_ += tx.elapsed.count();
    if (tx.completion == CompletionKind::ErrorDetected) {
        ++error_count_;
    } else if (tx.completion == CompletionKind::Timeout) {
        ++timeout_count_;
    }
    const auto now = std::chrono::system_clock::now();
    last_command_wall_ns_ = NowNs(now);

    GetLogService().Debug(std::string("done: ") + CompletionKindName(tx.completion) + " in " +
                          std::to_string(tx.elapsed.count()) + " ms");

    std::lock_guard<std::mutex> guard(info_mutex_);
    history_.push_back({tx.id, tx.command, tx.completion, tx.elapsed, now});
    while (history_.size() > config_.history_limit) {
        history_.pop_front();
    }
}

// =============================================================================
// Health and control
// =============================================================================

bool Session::IsHealthy(milliseconds timeout) {
    // A Busy session is checked after the in-flight command, like any caller
    const auto current = state_.load();
    if (current != SessionState::Ready && current != SessionState::Busy) {
        return false;
    }
    try {
        const auto tx = Execute(std::string("puts {") + kHealthToken + "}", timeout);
        return tx.Completed() && tx.raw.find(kHealthToken) != std::string::npos;
    } catch (const SessionError &e) {
        GetLogService().Debug(std::string("health check rejected: ") + e.what());
        return false;
    }
}

bool Session::EnsureHealthy(milliseconds check_timeout) {
    if (IsHealthy(check_timeout)) {
        return true;
    }
    if (!EngineGone()) {
        // Still running: either busy or finishing a timed-out command
        GetLogService().Warning("health check failed but the engine is alive; not restarting");
        return false;
    }
    GetLogService().Warning("session unhealthy; restarting");
    Restart();
    return IsHealthy(check_timeout);
}

bool Session::EngineGone() {
    const auto current = state_.load();
    if (current == SessionState::Failed || current == SessionState::Uninitialized) {
        return true;
    }
    std::lock_guard<std::mutex> guard(channel_mutex_);
    return !channel_ || !channel_->IsAlive();
}

void Session::Interrupt() {
    std::lock_guard<std::mutex> guard(channel_mutex_);
    if (channel_) {
        channel_->Interrupt();
        GetLogService().Info("interrupt sent");
    }
}

SessionStatus Session::Status() const {
    SessionStatus status;
    status.state = state_.load();
    status.generation = generation_.load();
    status.command_count = command_count_.load();
    status.error_count = error_count_.load();
    status.timeout_count = timeout_count_.load();
    status.total_command_seconds = static_cast<double>(total_command_ms_.load()) / 1000.0;
    if (status.command_count > 0) {
        status.average_command_seconds =
            status.total_command_seconds / static_cast<double>(status.command_count);
    }
    status.resync_pending = resync_pending_.load();
    status.queue_depth = exec_lock_.QueueDepth();

    const auto started_wall = started_wall_ns_.load();
    if (started_wall != 0) {
        status.started_at = std::chrono::system_clock::time_point(
            duration_cast<std::chrono::system_clock::duration>(
                std::chrono::nanoseconds(started_wall)));
        const Clock::time_point started_steady{Clock::duration(started_steady_ns_.load())};
        status.uptime_seconds =
            std::chrono::duration<double>(Clock::now() - started_steady).count();
    }
    const auto last = last_command_wall_ns_.load();
    if (last != 0) {
        status.last_command_at = std::chrono::system_clock::time_point(
            duration_cast<std::chrono::system_clock::duration>(std::chrono::nanoseconds(last)));
    }

    std::lock_guard<std::mutex> guard(info_mutex_);
    status.executable = executable_;
    status.history.assign(history_.begin(), history_.end());
    return status;
}

} // namespace tether
