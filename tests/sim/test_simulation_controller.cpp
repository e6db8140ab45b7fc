/**
 * @file test_simulation_controller.cpp
 * @brief Simulation phase tracking, breakpoints and signal access
 */

#include <tether/core/Error.hpp>
#include <tether/session/Session.hpp>
#include <tether/sim/SimulationController.hpp>

#include "testing/FakeEngine.hpp"

#include <gtest/gtest.h>

#include <algorithm>

using namespace tether;
using tether::testing::FakeEngine;
using tether::testing::FakeReply;
using std::chrono::milliseconds;

namespace {

bool StartsWith(const std::string &s, const std::string &prefix) {
    return s.rfind(prefix, 0) == 0;
}

const char *kBadPath = "ERROR: [Simtcl 6-50] Object '/tb/missing' not found";

} // namespace

class SimulationControllerTest : public ::testing::Test {
  protected:
    void SetUp() override {
        engine = std::make_shared<FakeEngine>();
        engine->On("current_time", "1000 ns");
        engine->handler = [](const std::string &cmd) {
            if (cmd.find("/tb/missing") != std::string::npos) {
                return FakeReply::Text(kBadPath);
            }
            if (StartsWith(cmd, "get_value -radix hex {/tb/dut/count}")) {
                return FakeReply::Text("0a");
            }
            if (StartsWith(cmd, "get_value -radix bin")) {
                return FakeReply::Text("1");
            }
            if (StartsWith(cmd, "get_objects -filter {TYPE == signal || TYPE == port}")) {
                return FakeReply::Text("/tb/clk /tb/rst {/tb/data[0]}");
            }
            if (StartsWith(cmd, "get_objects")) {
                return FakeReply::Text("/tb/dut/clk /tb/dut/count");
            }
            if (StartsWith(cmd, "get_scopes")) {
                return FakeReply::Text("/tb/dut /tb/mon");
            }
            return FakeReply::Text("");
        };

        SessionConfig config;
        config.startup_timeout = milliseconds{1000};
        config.command_timeout = milliseconds{1000};
        config.resync_timeout = milliseconds{300};
        config.exit_grace = milliseconds{50};
        session = std::make_unique<Session>(config, engine->Factory());
        session->Start();
        sim = std::make_unique<SimulationController>(*session);
    }

    /// Commands sent after the last occurrence of `marker`
    std::vector<std::string> CommandsAfter(const std::string &marker) const {
        auto cmds = engine->Commands();
        auto it = std::find(cmds.rbegin(), cmds.rend(), marker);
        if (it == cmds.rend()) {
            return {};
        }
        return {it.base(), cmds.end()};
    }

    std::shared_ptr<FakeEngine> engine;
    std::unique_ptr<Session> session;
    std::unique_ptr<SimulationController> sim;
};

// =============================================================================
// Phase transitions
// =============================================================================

TEST_F(SimulationControllerTest, StartsNotStarted) {
    EXPECT_EQ(sim->Phase(), SimPhase::NotStarted);
    EXPECT_TRUE(sim->State().breakpoints.empty());
}

TEST_F(SimulationControllerTest, OperationsBeforeLaunchThrowInvalidPhase) {
    const auto before = engine->Commands().size();
    try {
        sim->Run("100ns");
        FAIL() << "expected SimulationError";
    } catch (const SimulationError &e) {
        EXPECT_EQ(e.kind(), SimulationErrorKind::InvalidPhase);
        EXPECT_EQ(e.category(), "simulation");
    }
    EXPECT_THROW(sim->Step(), SimulationError);
    EXPECT_THROW(sim->Restart(), SimulationError);
    EXPECT_THROW(sim->GetSignalValue("/tb/clk"), SimulationError);
    EXPECT_THROW(sim->AddBreakpoint("/tb/clk"), SimulationError);

    // Nothing reached the engine
    EXPECT_EQ(engine->Commands().size(), before);
}

TEST_F(SimulationControllerTest, LaunchRunClose) {
    auto launch = sim->Launch(SimMode::Behavioral, std::string("tb_top"));
    ASSERT_TRUE(launch.Ok());
    EXPECT_EQ(sim->Phase(), SimPhase::Running);

    auto cmds = engine->Commands();
    const std::string set_top = "set_property top {tb_top} [get_filesets {sim_1}]";
    EXPECT_NE(std::find(cmds.begin(), cmds.end(), set_top), cmds.end());
    EXPECT_EQ(cmds.back(), "launch_simulation -mode behav");

    auto run = sim->Run("1us");
    ASSERT_TRUE(run.Ok());
    EXPECT_EQ(run.command, "run 1us");
    auto state = sim->State();
    EXPECT_EQ(state.phase, SimPhase::Paused);
    EXPECT_DOUBLE_EQ(state.current_time_ns, 1000.0);
    EXPECT_EQ(state.current_time_text, "1000 ns");
    EXPECT_EQ(state.top_module.value(), "tb_top");

    sim->Close();
    state = sim->State();
    EXPECT_EQ(state.phase, SimPhase::Closed);
    EXPECT_DOUBLE_EQ(state.current_time_ns, 0.0);
    EXPECT_EQ(state.top_module.value(), "tb_top");
}

TEST_F(SimulationControllerTest, RelaunchAfterCloseResetsTime) {
    sim->Launch();
    sim->Run("500ns");
    sim->Close();

    ASSERT_TRUE(sim->Launch(SimMode::PostSynthFunc).Ok());
    auto state = sim->State();
    EXPECT_EQ(state.phase, SimPhase::Running);
    EXPECT_DOUBLE_EQ(state.current_time_ns, 0.0);
    EXPECT_EQ(state.mode.value(), SimMode::PostSynthFunc);
    EXPECT_EQ(engine->Commands().back(), "launch_simulation -mode synth -type func");
}

TEST_F(SimulationControllerTest, LaunchTwiceThrows) {
    sim->Launch();
    EXPECT_THROW(sim->Launch(), SimulationError);
}

TEST_F(SimulationControllerTest, FailedLaunchStaysNotStarted) {
    engine->On("launch_simulation -mode behav",
               "ERROR: [Vivado 12-4473] Detected error while running simulation.");
    auto tx = sim->Launch();
    EXPECT_TRUE(tx.HasError());
    EXPECT_EQ(sim->Phase(), SimPhase::NotStarted);
}

TEST_F(SimulationControllerTest, RunAllAndStep) {
    sim->Launch();
    EXPECT_EQ(sim->Run("forever").command, "run -all");
    EXPECT_EQ(sim->Step(3).command, "step 3");
    EXPECT_EQ(sim->Phase(), SimPhase::Paused);
}

TEST_F(SimulationControllerTest, TimedOutRunStaysRunning) {
    engine->On("run 10ms", FakeReply::Hang());
    sim->Launch();
    auto tx = sim->Run("10ms", milliseconds{100});
    EXPECT_TRUE(tx.TimedOut());
    EXPECT_EQ(sim->Phase(), SimPhase::Running);
}

TEST_F(SimulationControllerTest, RestartFromClosedRelaunches) {
    sim->Launch(SimMode::PostImplTiming);
    sim->Close();
    ASSERT_TRUE(sim->Restart().Ok());
    EXPECT_EQ(sim->Phase(), SimPhase::Running);
    EXPECT_EQ(engine->Commands().back(), "launch_simulation -mode impl -type timing");
}

// =============================================================================
// Breakpoints
// =============================================================================

TEST_F(SimulationControllerTest, BreakpointsSurviveRestart) {
    sim->Launch();
    sim->AddBreakpoint("/tb/dut/count", BreakCondition::Posedge);
    sim->AddBreakpoint("/tb/dut/done");
    sim->Run("100ns");

    ASSERT_TRUE(sim->Restart().Ok());
    EXPECT_DOUBLE_EQ(sim->State().current_time_ns, 0.0);

    const auto after = CommandsAfter("restart");
    ASSERT_EQ(after.size(), 3u);
    EXPECT_EQ(after[0], "remove_bps -all");
    EXPECT_NE(std::find(after.begin(), after.end(), "add_bp -posedge {/tb/dut/count}"),
              after.end());
    EXPECT_NE(std::find(after.begin(), after.end(), "add_bp {/tb/dut/done}"), after.end());
    EXPECT_EQ(sim->State().breakpoints.size(), 2u);
}

TEST_F(SimulationControllerTest, BreakpointsReinstalledAfterRelaunch) {
    sim->Launch();
    sim->AddBreakpoint("/tb/dut/done", BreakCondition::Negedge);
    sim->Close();
    sim->Launch();

    const auto after = CommandsAfter("launch_simulation -mode behav");
    ASSERT_EQ(after.size(), 2u);
    EXPECT_EQ(after[1], "add_bp -negedge {/tb/dut/done}");
}

TEST_F(SimulationControllerTest, RejectedBreakpointPathThrowsInvalidScope) {
    sim->Launch();
    try {
        sim->AddBreakpoint("/tb/missing");
        FAIL() << "expected SimulationError";
    } catch (const SimulationError &e) {
        EXPECT_EQ(e.kind(), SimulationErrorKind::InvalidScope);
    }
    EXPECT_TRUE(sim->State().breakpoints.empty());
}

TEST_F(SimulationControllerTest, DuplicateBreakpointTrackedOnce) {
    sim->Launch();
    sim->AddBreakpoint("/tb/dut/done");
    sim->AddBreakpoint("/tb/dut/done");
    EXPECT_EQ(sim->State().breakpoints.size(), 1u);
}

TEST_F(SimulationControllerTest, RemoveBreakpointsWithoutSimulationOnlyClearsTracking) {
    sim->Launch();
    sim->AddBreakpoint("/tb/dut/done");
    sim->Close();

    const auto before = engine->Commands().size();
    auto tx = sim->RemoveBreakpoints();
    EXPECT_FALSE(tx.command_sent);
    EXPECT_EQ(engine->Commands().size(), before);
    EXPECT_TRUE(sim->State().breakpoints.empty());
}

TEST_F(SimulationControllerTest, RemoveBreakpointsWhileActive) {
    sim->Launch();
    sim->AddBreakpoint("/tb/dut/done");
    auto tx = sim->RemoveBreakpoints();
    EXPECT_TRUE(tx.command_sent);
    EXPECT_EQ(engine->Commands().back(), "remove_bps -all");
    EXPECT_TRUE(sim->State().breakpoints.empty());
}

TEST_F(SimulationControllerTest, UnreadableTimeStillPausesRun) {
    engine->On("current_time", "1e999 ns");
    sim->Launch();
    auto run = sim->Run("100ns");
    ASSERT_TRUE(run.Ok());

    const auto state = sim->State();
    EXPECT_EQ(state.phase, SimPhase::Paused);
    EXPECT_EQ(state.current_time_text, "1e999 ns");
    EXPECT_DOUBLE_EQ(state.current_time_ns, 0.0);
}

// =============================================================================
// Signals and scopes
// =============================================================================

TEST_F(SimulationControllerTest, ReadsSignalValue) {
    sim->Launch();
    auto value = sim->GetSignalValue("/tb/dut/count");
    EXPECT_EQ(value.value, "0a");
    EXPECT_EQ(value.radix, "hex");
}

TEST_F(SimulationControllerTest, UnknownSignalThrowsInvalidScope) {
    sim->Launch();
    try {
        (void)sim->GetSignalValue("/tb/missing");
        FAIL() << "expected SimulationError";
    } catch (const SimulationError &e) {
        EXPECT_EQ(e.kind(), SimulationErrorKind::InvalidScope);
    }
}

TEST_F(SimulationControllerTest, SignalReadTimeoutIsNotInvalidScope) {
    engine->On("get_value -radix hex {/tb/dut/slow}", FakeReply::Hang());
    engine->prompt_on_interrupt = false;
    sim->Launch();

    SignalValue value;
    EXPECT_NO_THROW(value = sim->GetSignalValue("/tb/dut/slow"));
    EXPECT_EQ(value.completion, CompletionKind::Timeout);
    EXPECT_TRUE(value.value.empty());
    EXPECT_EQ(sim->Phase(), SimPhase::Running);
}

TEST_F(SimulationControllerTest, ReadsValuesForPattern) {
    sim->Launch();
    auto values = sim->GetSignalValues("/tb/*", "bin");
    EXPECT_EQ(values.matched, 3u);
    EXPECT_FALSE(values.truncated);
    ASSERT_EQ(values.values.size(), 3u);
    EXPECT_EQ(values.values[2].path, "/tb/data[0]");
    EXPECT_EQ(values.values[2].value, "1");
}

TEST_F(SimulationControllerTest, ListObjectsAndScopes) {
    sim->Launch();
    auto objects = sim->ListObjects("/tb/dut", "signals");
    EXPECT_EQ(engine->Commands().back(), "get_objects -filter {TYPE == signal} {/tb/dut/*}");
    EXPECT_EQ(objects.size(), 2u);

    auto scopes = sim->ListScopes("/tb/");
    EXPECT_EQ(engine->Commands().back(), "get_scopes {/tb/*}");
    EXPECT_EQ(scopes, (std::vector<std::string>{"/tb/dut", "/tb/mon"}));
    EXPECT_EQ(sim->State().active_scope.value(), "/tb/");
}

TEST_F(SimulationControllerTest, AddToWaveReportsEachSignal) {
    sim->Launch();
    auto results = sim->AddToWave({"/tb/dut/count", "/tb/missing"});
    ASSERT_EQ(results.size(), 2u);
    EXPECT_TRUE(results[0].success);
    EXPECT_FALSE(results[1].success);
}

// =============================================================================
// Session restarts
// =============================================================================

TEST_F(SimulationControllerTest, SessionRestartResetsState) {
    sim->Launch(SimMode::Behavioral, std::string("tb_top"));
    sim->AddBreakpoint("/tb/dut/done");
    sim->Run("100ns");

    session->Stop();
    session->Start();

    auto state = sim->State();
    EXPECT_EQ(state.phase, SimPhase::NotStarted);
    EXPECT_FALSE(state.top_module.has_value());
    EXPECT_TRUE(state.breakpoints.empty());
    EXPECT_THROW(sim->Run("100ns"), SimulationError);
    EXPECT_TRUE(sim->Launch().Ok());
}

// =============================================================================
// Name mapping
// =============================================================================

TEST(SimulationNames, ParseSimTime) {
    EXPECT_DOUBLE_EQ(ParseSimTimeNs("1200 ns").value(), 1200.0);
    EXPECT_DOUBLE_EQ(ParseSimTimeNs("1.5us").value(), 1500.0);
    EXPECT_DOUBLE_EQ(ParseSimTimeNs("250 ps").value(), 0.25);
    EXPECT_DOUBLE_EQ(ParseSimTimeNs("0").value(), 0.0);
    EXPECT_FALSE(ParseSimTimeNs("no time here").has_value());
    EXPECT_FALSE(ParseSimTimeNs("1e999 ns").has_value());
    EXPECT_FALSE(ParseSimTimeNs("1e300 s").has_value());
}

TEST(SimulationNames, ModesAndConditions) {
    EXPECT_EQ(ParseSimMode("post_impl_timing").value(), SimMode::PostImplTiming);
    EXPECT_FALSE(ParseSimMode("gate_level").has_value());
    EXPECT_STREQ(SimModeArgs(SimMode::PostSynthTiming), "synth -type timing");
    EXPECT_EQ(ParseBreakCondition("negedge").value(), BreakCondition::Negedge);
    EXPECT_FALSE(ParseBreakCondition("rising").has_value());
    EXPECT_STREQ(SimPhaseName(SimPhase::Paused), "Paused");
}
