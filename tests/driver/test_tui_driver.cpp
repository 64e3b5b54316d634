#include <gtest/gtest.h>
#include "core/error.h"
#include "driver/tui_driver.h"
#include "support/fakes.h"

#include <type_traits>

using namespace easel;
using namespace easel::testing;
using namespace std::chrono_literals;

namespace {

const std::vector<std::string> EMPTY_BOX{"╭──────────────────────╮", "│ > Try \"write a test\" │",
                                         "╰──────────────────────╯"};
const std::vector<std::string> BUSY{"✻ Working… (esc to interrupt)", "╭────╮", "│ >  │", "╰────╯"};
const std::vector<std::string> IDLE{"● Added the function.", "╭────╮", "│ >  │", "╰────╯"};

}

class TuiDriverTest : public ::testing::Test {
protected:
    void SetUp() override {
        driver = std::make_shared<TuiAutomationDriver>(transport, loop, DriverConfig{}, &registry);
        driver->add_listener([this](const DriverEvent& event) {
            std::visit([this](auto&& e) {
                using T = std::decay_t<decltype(e)>;
                if constexpr (std::is_same_v<T, TaskStarted>) events.push_back("started");
                else if constexpr (std::is_same_v<T, TaskCompleted>) events.push_back("completed");
                else if constexpr (std::is_same_v<T, TaskFailed>) events.push_back("failed:" + e.message);
                else if constexpr (std::is_same_v<T, SessionReady>) events.push_back("ready");
            }, event);
        });
    }

    void advance(std::chrono::milliseconds delta) {
        clock->advance(delta);
        loop.poll();
    }

    // Starts a task and walks the driver through its shell probes.
    std::string launch(const std::string& prompt = "add a function") {
        std::string ready_terminal;
        driver->start_task(LocalSession{"/work/app"}, prompt,
                           [&](const std::string& id) { ready_terminal = id; });
        advance(1000ms);
        advance(1000ms);
        advance(500ms);
        return ready_terminal;
    }

    // Shows the input box, lets the prompt settle and runs it to idle.
    void run_to_idle(const std::string& terminal) {
        transport.show(terminal, EMPTY_BOX);
        advance(500ms);
        transport.show(terminal, BUSY);
        transport.show(terminal, IDLE);
    }

    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>();
    EventLoop loop{clock};
    FakeTransport transport;
    ProcessRegistry registry;
    std::shared_ptr<TuiAutomationDriver> driver;
    std::vector<std::string> events;
};

TEST_F(TuiDriverTest, LaunchSequenceProbesThenStartsTool) {
    std::string terminal = launch();

    EXPECT_EQ(terminal, transport.last_terminal);
    const auto& spec = transport.specs[terminal];
    EXPECT_EQ(working_directory(spec.session), "/work/app");
    EXPECT_GE(spec.lines, 24);
    EXPECT_GE(spec.cols, 80);

    auto sent = transport.sent(terminal);
    ASSERT_EQ(sent.size(), 3u);
    EXPECT_EQ(sent[0], "command -v claude\r");
    EXPECT_EQ(sent[1], "pwd\r");
    EXPECT_EQ(sent[2], "clear; claude\r");
    EXPECT_EQ(events, (std::vector<std::string>{"started"}));
    EXPECT_TRUE(driver->is_task_running());
}

TEST_F(TuiDriverTest, NothingIsSentBeforeWarmup) {
    driver->start_task(LocalSession{"/w"}, "p", nullptr);
    advance(999ms);

    EXPECT_TRUE(transport.sent(transport.last_terminal).empty());
}

TEST_F(TuiDriverTest, SmallTerminalSizesAreRaised) {
    DriverConfig config;
    config.rows = 10;
    config.cols = 40;
    auto small = std::make_shared<TuiAutomationDriver>(transport, loop, config);
    small->start_task(LocalSession{"/w"}, "p", nullptr);

    EXPECT_EQ(transport.specs[transport.last_terminal].lines, 24);
    EXPECT_EQ(transport.specs[transport.last_terminal].cols, 80);
}

TEST_F(TuiDriverTest, PromptIsTypedThenSubmitted) {
    std::string terminal = launch("rename foo to bar");

    transport.show(terminal, EMPTY_BOX);
    auto sent = transport.sent(terminal);
    ASSERT_EQ(sent.size(), 4u);
    EXPECT_EQ(sent.back(), "rename foo to bar");

    advance(499ms);
    EXPECT_EQ(transport.sent(terminal).size(), 4u);
    advance(1ms);
    EXPECT_EQ(transport.sent(terminal).back(), "\r");
}

TEST_F(TuiDriverTest, IdleAfterWorkCompletesTheTask) {
    std::string terminal = launch();
    run_to_idle(terminal);

    EXPECT_EQ(transport.count_sent(terminal, keys::CTRL_D), 0u);
    advance(2000ms);

    EXPECT_EQ(transport.count_sent(terminal, keys::CTRL_D), 2u);
    EXPECT_EQ(events, (std::vector<std::string>{"started", "completed", "ready"}));
    EXPECT_FALSE(driver->is_task_running());
    EXPECT_TRUE(driver->is_session_ready());
}

TEST_F(TuiDriverTest, TypedPromptInsideBoxIsNotCompletion) {
    std::string terminal = launch("do it");
    transport.show(terminal, EMPTY_BOX);
    advance(500ms);
    transport.show(terminal, {"╭────────╮", "│ > do it │", "╰────────╯"});
    advance(5000ms);

    EXPECT_EQ(transport.count_sent(terminal, keys::CTRL_D), 0u);
    EXPECT_TRUE(driver->is_task_running());
}

TEST_F(TuiDriverTest, BusyAgainDuringGraceWithdrawsCompletion) {
    std::string terminal = launch();
    run_to_idle(terminal);
    advance(1000ms);
    transport.show(terminal, BUSY);
    advance(1000ms);

    EXPECT_EQ(transport.count_sent(terminal, keys::CTRL_D), 0u);
    EXPECT_TRUE(driver->is_task_running());
}

TEST_F(TuiDriverTest, TrustPromptIsAnsweredOncePerScreen) {
    std::string terminal = launch();
    std::vector<std::string> trust{"Do you trust the files in this folder?", " 1. Yes, proceed",
                                   "Enter to confirm · Esc to exit"};

    transport.show(terminal, trust);
    transport.show(terminal, trust);

    EXPECT_EQ(transport.count_sent(terminal, keys::ENTER), 1u);
}

TEST_F(TuiDriverTest, DontAskAgainSwitchesMode) {
    std::string terminal = launch();
    transport.show(terminal, {"Edit file?", " 2. Yes, and don't ask again this session (shift+tab)"});

    EXPECT_EQ(transport.count_sent(terminal, keys::SHIFT_TAB), 1u);
}

TEST_F(TuiDriverTest, ScreensBeforeLaunchAreIgnored) {
    driver->start_task(LocalSession{"/w"}, "p", nullptr);
    transport.show(transport.last_terminal, EMPTY_BOX);

    EXPECT_TRUE(transport.sent(transport.last_terminal).empty());
}

TEST_F(TuiDriverTest, SecondStartWhileActiveThrows) {
    launch();
    EXPECT_THROW(driver->start_task(LocalSession{"/w"}, "again", nullptr), AlreadyRunningError);
}

TEST_F(TuiDriverTest, ReadySessionIsReused) {
    std::string terminal = launch();
    run_to_idle(terminal);
    advance(2000ms);
    events.clear();

    std::string second;
    driver->start_task(LocalSession{"/work/app"}, "next", [&](const std::string& id) { second = id; });
    loop.poll();

    EXPECT_EQ(second, terminal);
    EXPECT_EQ(transport.specs.size(), 1u);
    EXPECT_EQ(transport.count_sent(terminal, "clear; claude\r"), 2u);
    EXPECT_EQ(transport.count_sent(terminal, "command -v claude\r"), 1u);
    EXPECT_EQ(events, (std::vector<std::string>{"started"}));

    transport.show(terminal, EMPTY_BOX);
    EXPECT_EQ(transport.sent(terminal).back(), "next");
}

TEST_F(TuiDriverTest, StopInterruptsAndNextStartOpensFreshTerminal) {
    std::string terminal = launch();
    driver->stop_task();

    EXPECT_EQ(transport.count_sent(terminal, keys::CTRL_C), 1u);
    EXPECT_FALSE(driver->is_task_running());
    EXPECT_FALSE(driver->is_session_ready());

    driver->start_task(LocalSession{"/w"}, "p", nullptr);
    EXPECT_NE(transport.last_terminal, terminal);
    ASSERT_EQ(transport.killed.size(), 1u);
    EXPECT_EQ(transport.killed[0], terminal);
}

TEST_F(TuiDriverTest, StoppedRunIgnoresPendingTimers) {
    driver->start_task(LocalSession{"/w"}, "p", nullptr);
    std::string terminal = transport.last_terminal;
    driver->stop_task();
    advance(5000ms);

    EXPECT_EQ(transport.count_sent(terminal, "command -v claude\r"), 0u);
}

TEST_F(TuiDriverTest, DisconnectDuringTaskFails) {
    std::string terminal = launch();
    transport.disconnect(terminal);

    EXPECT_EQ(events.back(), "failed:terminal disconnected");
    EXPECT_FALSE(driver->is_task_running());
    EXPECT_EQ(driver->terminal_id(), "");
}

TEST_F(TuiDriverTest, DisconnectWhileIdleIsQuiet) {
    std::string terminal = launch();
    run_to_idle(terminal);
    advance(2000ms);
    events.clear();

    transport.disconnect(terminal);
    EXPECT_TRUE(events.empty());
    EXPECT_FALSE(driver->is_session_ready());
}

TEST_F(TuiDriverTest, ConnectFailureReportsAndRethrows) {
    transport.fail_connect = true;

    EXPECT_THROW(driver->start_task(LocalSession{"/w"}, "p", nullptr), TransportError);
    EXPECT_EQ(events, (std::vector<std::string>{"failed:cannot open pty"}));
    EXPECT_FALSE(driver->is_task_running());
}

TEST_F(TuiDriverTest, CleanupInterruptsKillsAndUnregisters) {
    registry.register_process("proc-1", driver);
    std::string terminal = launch();

    driver->cleanup(false);

    EXPECT_EQ(transport.count_sent(terminal, keys::CTRL_C), 1u);
    EXPECT_EQ(transport.killed, (std::vector<std::string>{terminal}));
    EXPECT_EQ(registry.get("proc-1"), nullptr);
    EXPECT_EQ(driver->terminal_id(), "");
    EXPECT_EQ(driver->liveness(), std::optional<bool>(false));
}

TEST_F(TuiDriverTest, ForcedCleanupSkipsInterrupt) {
    std::string terminal = launch();
    driver->cleanup(true);

    EXPECT_EQ(transport.count_sent(terminal, keys::CTRL_C), 0u);
}

TEST_F(TuiDriverTest, RemovedListenerHearsNothing) {
    int heard = 0;
    auto id = driver->add_listener([&](const DriverEvent&) { ++heard; });
    driver->remove_listener(id);

    launch();
    EXPECT_EQ(heard, 0);
}

TEST_F(TuiDriverTest, CurrentScreenTracksTerminal) {
    std::string terminal = launch();
    transport.show(terminal, {"hello", "world"});

    auto tail = driver->current_screen(2);
    ASSERT_EQ(tail.size(), 2u);
    EXPECT_EQ(tail[1], "world");
}

TEST_F(TuiDriverTest, ScreenDeliveredWhileSubscribingIsKept) {
    transport.screen_on_subscribe = {"$ ", "first paint"};

    driver->start_task(LocalSession{"/work/app"}, "add a function", nullptr);

    auto tail = driver->current_screen(2);
    ASSERT_EQ(tail.size(), 2u);
    EXPECT_EQ(tail[1], "first paint");
}
