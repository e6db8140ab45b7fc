/**
 * @file test_session.cpp
 * @brief Session lifecycle, execution and serialization tests
 */

#include <tether/core/Error.hpp>
#include <tether/session/Session.hpp>

#include "testing/FakeEngine.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <thread>

using namespace tether;
using tether::testing::FakeEngine;
using tether::testing::FakeReply;
using std::chrono::milliseconds;

namespace {

SessionConfig FastConfig() {
    SessionConfig config;
    config.startup_timeout = milliseconds{1000};
    config.command_timeout = milliseconds{1000};
    config.resync_timeout = milliseconds{300};
    config.exit_grace = milliseconds{50};
    return config;
}

} // namespace

class SessionTest : public ::testing::Test {
  protected:
    void SetUp() override {
        engine = std::make_shared<FakeEngine>();
        engine->handler = [](const std::string &cmd) { return FakeReply::Text("out:" + cmd); };
    }

    std::unique_ptr<Session> MakeSession(SessionConfig config = FastConfig()) {
        return std::make_unique<Session>(config, engine->Factory());
    }

    std::shared_ptr<FakeEngine> engine;
};

// =============================================================================
// Lifecycle
// =============================================================================

TEST_F(SessionTest, StartsUninitialized) {
    auto session = MakeSession();
    EXPECT_EQ(session->State(), SessionState::Uninitialized);
    EXPECT_EQ(session->Generation(), 0u);
    EXPECT_FALSE(session->Status().Running());
}

TEST_F(SessionTest, StartReachesReady) {
    auto session = MakeSession();
    session->Start();
    EXPECT_EQ(session->State(), SessionState::Ready);
    EXPECT_EQ(session->Generation(), 1u);
    EXPECT_EQ(engine->Spawns(), 1);

    auto launch = engine->LastLaunch();
    EXPECT_EQ(launch.executable, "vivado");
    ASSERT_EQ(launch.args.size(), 4u);
    EXPECT_EQ(launch.args[0], "-mode");
    EXPECT_EQ(launch.args[1], "tcl");
}

TEST_F(SessionTest, StartAppendsExtraArgs) {
    auto session = MakeSession();
    session->Start("/opt/vivado/bin/vivado", std::nullopt, {"-source", "init.tcl"});
    auto launch = engine->LastLaunch();
    EXPECT_EQ(launch.executable, "/opt/vivado/bin/vivado");
    EXPECT_EQ(launch.args.back(), "init.tcl");
    EXPECT_EQ(session->Status().executable, "/opt/vivado/bin/vivado");
}

TEST_F(SessionTest, StartTwiceThrowsAlreadyStarted) {
    auto session = MakeSession();
    session->Start();
    try {
        session->Start();
        FAIL() << "expected SessionError";
    } catch (const SessionError &e) {
        EXPECT_EQ(e.kind(), SessionErrorKind::AlreadyStarted);
    }
    EXPECT_EQ(session->State(), SessionState::Ready);
}

TEST_F(SessionTest, StartupTimeoutTearsDown) {
    engine->start_prompt = false;
    auto session = MakeSession();
    auto begin = std::chrono::steady_clock::now();
    try {
        session->Start("", milliseconds{200});
        FAIL() << "expected SessionError";
    } catch (const SessionError &e) {
        EXPECT_EQ(e.kind(), SessionErrorKind::StartupTimeout);
        EXPECT_EQ(e.severity(), Severity::FATAL);
    }
    auto waited = std::chrono::steady_clock::now() - begin;
    EXPECT_LT(waited, milliseconds{1500});
    EXPECT_EQ(session->State(), SessionState::Uninitialized);
    EXPECT_FALSE(engine->Alive());
}

TEST_F(SessionTest, StartupExitReportsProcessExited) {
    engine->start_exits = true;
    auto session = MakeSession();
    try {
        session->Start();
        FAIL() << "expected SessionError";
    } catch (const SessionError &e) {
        EXPECT_EQ(e.kind(), SessionErrorKind::ProcessExited);
    }
    EXPECT_EQ(session->State(), SessionState::Uninitialized);
}

TEST_F(SessionTest, StartupBannerMustAppearBeforePrompt) {
    auto config = FastConfig();
    config.startup_banner = "Start of session";
    engine->banner = "loading...\n";
    auto session = MakeSession(config);
    EXPECT_THROW(session->Start("", milliseconds{200}), SessionError);

    engine->banner = "Start of session at: today\n";
    session->Start();
    EXPECT_TRUE(session->IsReady());
}

TEST_F(SessionTest, StopIsIdempotent) {
    auto session = MakeSession();
    EXPECT_NO_THROW(session->Stop());
    EXPECT_EQ(session->State(), SessionState::Uninitialized);

    session->Start();
    EXPECT_NO_THROW(session->Stop());
    EXPECT_NO_THROW(session->Stop());
    EXPECT_EQ(session->State(), SessionState::Uninitialized);

    auto commands = engine->Commands();
    EXPECT_EQ(std::count(commands.begin(), commands.end(), "exit"), 1);
}

TEST_F(SessionTest, RestartBumpsGeneration) {
    auto session = MakeSession();
    session->Start("", std::nullopt, {"-source", "a.tcl"});
    session->Restart();
    EXPECT_EQ(session->Generation(), 2u);
    EXPECT_EQ(engine->Spawns(), 2);
    EXPECT_EQ(engine->LastLaunch().args.back(), "a.tcl");
    EXPECT_TRUE(session->IsReady());
}

TEST(SessionConfigValidation, RejectsEmptyPrompt) {
    SessionConfig config;
    config.prompt = "";
    EXPECT_THROW(Session{config}, ConfigError);
}

// =============================================================================
// Execute
// =============================================================================

TEST_F(SessionTest, ExecuteBeforeStartThrowsNotReady) {
    auto session = MakeSession();
    try {
        (void)session->Execute("puts hi");
        FAIL() << "expected SessionError";
    } catch (const SessionError &e) {
        EXPECT_EQ(e.kind(), SessionErrorKind::NotReady);
    }
    EXPECT_TRUE(engine->Commands().empty());
}

TEST_F(SessionTest, ExecuteReturnsResponseWithoutPrompt) {
    auto session = MakeSession();
    session->Start();
    auto tx = session->Execute("version");
    EXPECT_EQ(tx.completion, CompletionKind::PromptMatched);
    EXPECT_EQ(tx.raw, "out:version");
    EXPECT_EQ(tx.command, "version");
    EXPECT_TRUE(tx.command_sent);
    EXPECT_EQ(session->State(), SessionState::Ready);
}

TEST_F(SessionTest, EchoedCommandIsStripped) {
    engine->echo = true;
    auto session = MakeSession();
    session->Start();
    auto tx = session->Execute("get_property NAME [current_project]");
    EXPECT_EQ(tx.raw, "out:get_property NAME [current_project]");
}

TEST_F(SessionTest, PromptTextInsideOutputIsNotABoundary) {
    engine->On("puts tricky", FakeReply::Text("Vivado% is the prompt\nsee Vivado%\nVivado%"));
    auto session = MakeSession();
    session->Start();
    auto tx = session->Execute("puts tricky");
    EXPECT_TRUE(tx.Ok());
    EXPECT_EQ(tx.raw, "Vivado% is the prompt\nsee Vivado%\nVivado%");
}

TEST_F(SessionTest, EngineErrorStillCompletes) {
    engine->On("synth_design -top nope",
               FakeReply::Text("ERROR: [Synth 8-439] module 'nope' not found\nINFO: done"));
    auto session = MakeSession();
    session->Start();
    auto tx = session->Execute("synth_design -top nope");
    EXPECT_EQ(tx.completion, CompletionKind::ErrorDetected);
    ASSERT_EQ(tx.error_messages.size(), 1u);
    EXPECT_NE(tx.error_messages[0].find("Synth 8-439"), std::string::npos);
    EXPECT_NE(tx.raw.find("INFO: done"), std::string::npos);
    EXPECT_EQ(session->State(), SessionState::Ready);
    EXPECT_EQ(session->Status().error_count, 1u);
}

TEST_F(SessionTest, TimeoutIsBoundedAndLeavesSessionReady) {
    engine->On("launch_runs synth_1", FakeReply::Hang("Launched synth_1..."));
    auto session = MakeSession();
    session->Start();

    auto begin = std::chrono::steady_clock::now();
    auto tx = session->Execute("launch_runs synth_1", milliseconds{200});
    auto waited = std::chrono::steady_clock::now() - begin;

    EXPECT_EQ(tx.completion, CompletionKind::Timeout);
    EXPECT_EQ(tx.raw, "Launched synth_1...");
    EXPECT_GE(waited, milliseconds{200});
    EXPECT_LT(waited, milliseconds{700});
    EXPECT_EQ(session->State(), SessionState::Ready);
    EXPECT_TRUE(session->Status().resync_pending);
    EXPECT_EQ(session->Status().timeout_count, 1u);
}

TEST_F(SessionTest, LateOutputIsDrainedAsStale) {
    engine->On("slow", FakeReply::Text("slow result", milliseconds{250}));
    auto session = MakeSession();
    session->Start();

    auto first = session->Execute("slow", milliseconds{50});
    ASSERT_TRUE(first.TimedOut());

    auto second = session->Execute("fast", milliseconds{1000});
    EXPECT_TRUE(second.Ok());
    EXPECT_TRUE(second.command_sent);
    EXPECT_EQ(second.stale_output, "slow result");
    EXPECT_EQ(second.raw, "out:fast");
    EXPECT_FALSE(session->Status().resync_pending);
}

TEST_F(SessionTest, ResyncFailureDoesNotSendCommand) {
    engine->On("forever", FakeReply::Hang());
    engine->prompt_on_interrupt = false;
    auto session = MakeSession();
    session->Start();

    ASSERT_TRUE(session->Execute("forever", milliseconds{50}).TimedOut());
    auto tx = session->Execute("next", milliseconds{100});
    EXPECT_TRUE(tx.TimedOut());
    EXPECT_FALSE(tx.command_sent);

    auto commands = engine->Commands();
    EXPECT_EQ(std::count(commands.begin(), commands.end(), "next"), 0);
    EXPECT_TRUE(session->Status().resync_pending);
}

TEST_F(SessionTest, InterruptOnTimeoutRecoversPrompt) {
    auto config = FastConfig();
    config.interrupt_on_timeout = true;
    engine->On("forever", FakeReply::Hang());
    auto session = MakeSession(config);
    session->Start();

    ASSERT_TRUE(session->Execute("forever", milliseconds{50}).TimedOut());
    EXPECT_EQ(engine->Interrupts(), 1);

    auto tx = session->Execute("after");
    EXPECT_TRUE(tx.Ok());
    EXPECT_EQ(tx.raw, "out:after");
}

TEST_F(SessionTest, InactivityTimeoutExtendsWhileOutputFlows) {
    auto config = FastConfig();
    config.timeout_mode = TimeoutMode::Inactivity;
    engine->On("chatty", FakeReply::Hang("step 0"));
    auto session = MakeSession(config);
    session->Start();

    std::thread feeder([&] {
        for (int i = 1; i <= 4; ++i) {
            std::this_thread::sleep_for(milliseconds{80});
            engine->Emit("step " + std::to_string(i) + "\n");
        }
        engine->Emit(engine->prompt, milliseconds{80});
    });
    auto tx = session->Execute("chatty", milliseconds{200});
    feeder.join();

    EXPECT_TRUE(tx.Ok());
    EXPECT_NE(tx.raw.find("step 4"), std::string::npos);
}

TEST_F(SessionTest, ProcessExitDuringCommandFails) {
    engine->On("exit_now", FakeReply::Exit("segfault"));
    auto session = MakeSession();
    session->Start();

    auto tx = session->Execute("exit_now");
    EXPECT_EQ(tx.completion, CompletionKind::ProcessExited);
    EXPECT_EQ(session->State(), SessionState::Failed);
    EXPECT_THROW((void)session->Execute("puts hi"), SessionError);

    session->Stop();
    EXPECT_EQ(session->State(), SessionState::Uninitialized);
}

TEST_F(SessionTest, StopAbortsInFlightCommand) {
    engine->On("forever", FakeReply::Hang());
    engine->prompt_on_interrupt = false;
    auto session = MakeSession();
    session->Start();

    Transaction tx;
    std::thread runner([&] { tx = session->Execute("forever", milliseconds{5000}); });
    std::this_thread::sleep_for(milliseconds{100});
    auto begin = std::chrono::steady_clock::now();
    session->Stop();
    runner.join();

    EXPECT_LT(std::chrono::steady_clock::now() - begin, milliseconds{2000});
    EXPECT_EQ(tx.completion, CompletionKind::ProcessExited);
    EXPECT_EQ(session->State(), SessionState::Uninitialized);
}

// =============================================================================
// Concurrency
// =============================================================================

TEST_F(SessionTest, ConcurrentCallersAreSerialized) {
    engine->handler = [](const std::string &cmd) {
        return FakeReply::Text("out:" + cmd, milliseconds{30});
    };
    auto session = MakeSession();
    session->Start();

    constexpr int kCallers = 6;
    std::vector<std::thread> threads;
    std::vector<Transaction> results(kCallers);
    for (int i = 0; i < kCallers; ++i) {
        threads.emplace_back([&, i] { results[i] = session->Execute("cmd" + std::to_string(i)); });
    }
    for (auto &t : threads) {
        t.join();
    }

    for (int i = 0; i < kCallers; ++i) {
        EXPECT_TRUE(results[i].Ok());
        EXPECT_EQ(results[i].raw, "out:cmd" + std::to_string(i));
    }

    // Each write happens only after the previous reply (30 ms) was framed
    auto writes = engine->Writes();
    ASSERT_EQ(writes.size(), static_cast<std::size_t>(kCallers));
    for (std::size_t i = 1; i < writes.size(); ++i) {
        EXPECT_GE(writes[i].at - writes[i - 1].at, milliseconds{25});
    }
}

TEST_F(SessionTest, StatusDoesNotBlockOnInFlightCommand) {
    engine->On("long", FakeReply::Text("done", milliseconds{400}));
    auto session = MakeSession();
    session->Start();

    std::thread runner([&] { (void)session->Execute("long"); });
    std::this_thread::sleep_for(milliseconds{50});
    auto begin = std::chrono::steady_clock::now();
    auto status = session->Status();
    EXPECT_LT(std::chrono::steady_clock::now() - begin, milliseconds{50});
    EXPECT_EQ(status.state, SessionState::Busy);
    runner.join();
}

// =============================================================================
// Status, health
// =============================================================================

TEST_F(SessionTest, StatusTracksHistory) {
    auto config = FastConfig();
    config.history_limit = 2;
    auto session = MakeSession(config);
    session->Start();
    (void)session->Execute("a");
    (void)session->Execute("b");
    (void)session->Execute("c");

    auto status = session->Status();
    EXPECT_EQ(status.command_count, 3u);
    ASSERT_EQ(status.history.size(), 2u);
    EXPECT_EQ(status.history[0].command, "b");
    EXPECT_EQ(status.history[1].command, "c");
    EXPECT_TRUE(status.started_at.has_value());
    EXPECT_TRUE(status.last_command_at.has_value());
    EXPECT_GE(status.uptime_seconds, 0.0);
}

TEST_F(SessionTest, HealthCheckRoundTrip) {
    engine->handler = [](const std::string &cmd) {
        if (cmd.rfind("puts {", 0) == 0) {
            return FakeReply::Text(cmd.substr(6, cmd.size() - 7));
        }
        return FakeReply::Text("");
    };
    auto session = MakeSession();
    EXPECT_FALSE(session->IsHealthy());
    session->Start();
    EXPECT_TRUE(session->IsHealthy());
}

namespace {

FakeReply EchoPuts(const std::string &cmd) {
    if (cmd.rfind("puts {", 0) == 0) {
        return FakeReply::Text(cmd.substr(6, cmd.size() - 7));
    }
    return FakeReply::Text("");
}

} // namespace

TEST_F(SessionTest, EnsureHealthyRestartsDeadEngine) {
    engine->handler = EchoPuts;
    auto session = MakeSession();
    session->Start();
    engine->Crash();

    EXPECT_TRUE(session->EnsureHealthy(milliseconds{200}));
    EXPECT_EQ(session->Generation(), 2u);
    EXPECT_EQ(engine->Spawns(), 2);
}

TEST_F(SessionTest, EnsureHealthyWaitsBehindRunningCommand) {
    engine->handler = EchoPuts;
    engine->On("synth_design", FakeReply::Text("done", milliseconds{400}));
    auto session = MakeSession();
    session->Start();

    Transaction synth;
    std::thread runner([&] { synth = session->Execute("synth_design"); });
    std::this_thread::sleep_for(milliseconds{100});

    EXPECT_TRUE(session->EnsureHealthy(milliseconds{1000}));
    runner.join();

    EXPECT_EQ(synth.completion, CompletionKind::PromptMatched);
    EXPECT_EQ(synth.raw, "done");
    EXPECT_EQ(engine->Spawns(), 1);
    EXPECT_EQ(session->Generation(), 1u);
}

TEST_F(SessionTest, EnsureHealthyLeavesTimedOutCommandRunning) {
    engine->handler = EchoPuts;
    engine->On("route_design", FakeReply::Hang());
    engine->prompt_on_interrupt = false;
    auto session = MakeSession();
    session->Start();

    auto route = session->Execute("route_design", milliseconds{50});
    ASSERT_TRUE(route.TimedOut());

    EXPECT_FALSE(session->EnsureHealthy(milliseconds{100}));
    EXPECT_EQ(engine->Spawns(), 1);
    EXPECT_EQ(session->State(), SessionState::Ready);
    EXPECT_TRUE(session->Status().resync_pending);
}
