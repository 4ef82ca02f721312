#include "test_helpers.hpp"
#include <cli/monitor.hpp>
#include <pty.h>
#include <termios.h>
#include <future>
#include <vector>

class MonitorTest : public ScratchDirTest {
protected:
    int master = -1;
    int slave = -1;
    MonitorSettings settings;
    CapturedOutput log_out;
    CapturedOutput status_out;
    std::mutex transitions_mutex;
    std::vector<std::string> transitions;

    void SetUp() override {
        ScratchDirTest::SetUp();
        ASSERT_EQ(openpty(&master, &slave, nullptr, nullptr, nullptr), 0);

        settings.control_file = control.string();
        settings.logs_dir = logs.string();
        settings.handoff_timeout_ms = 2000;
        settings.handoff_poll_ms = 10;
        settings.log_appear_ms = 200;
        settings.follow_poll_ms = 10;
        settings.key_poll_ms = 10;
    }

    void TearDown() override {
        if (slave >= 0) close(slave);
        if (master >= 0) close(master);
        ScratchDirTest::TearDown();
    }

    SessionIO make_io(int input_fd) {
        SessionIO io;
        io.input_fd = input_fd;
        io.log_out = std::ref(log_out);
        io.status_out = std::ref(status_out);
        io.capture_signals = false;
        return io;
    }

    void record(Monitor& monitor) {
        monitor.on_transition([this](SessionState, SessionState to) {
            std::lock_guard<std::mutex> lock(transitions_mutex);
            transitions.push_back(session_state_name(to));
        });
    }

    std::vector<std::string> seen() {
        std::lock_guard<std::mutex> lock(transitions_mutex);
        return transitions;
    }

    void press(char key) {
        ASSERT_EQ(write(master, &key, 1), 1);
    }

    tcflag_t lflag() const {
        struct termios t;
        EXPECT_EQ(tcgetattr(slave, &t), 0);
        return t.c_lflag;
    }
};

TEST_F(MonitorTest, DismissKeyEndsSessionAndCleansUp) {
    StubDispatcher stub(control, logs);
    stub.set_initial_log("ready\n");
    stub.start();

    tcflag_t before = lflag();
    ControlChannel channel(control.string(), HandoffOptions::from(settings));
    Monitor monitor(channel, settings, make_io(slave));
    record(monitor);

    auto session = std::async(std::launch::async, [&] { return monitor.submit("status"); });

    // Raw mode is on before the dump, so the key is not lost to TCSAFLUSH
    ASSERT_TRUE(eventually([&] { return log_out.text() == "ready\n"; }));
    append_text(stub.last_log(), "working\n");
    ASSERT_TRUE(eventually([&] { return log_out.text() == "ready\nworking\n"; }));
    press('n');

    ASSERT_EQ(session.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    SessionOutcome outcome = session.get();

    EXPECT_TRUE(outcome.ok()) << outcome.message;
    EXPECT_EQ(outcome.stop, StopReason::DismissKey);
    EXPECT_EQ(outcome.log_path, stub.last_log().string());
    EXPECT_TRUE(outcome.log_removed);
    EXPECT_FALSE(fs::exists(stub.last_log()));
    EXPECT_EQ(stub.last_command(), "status");
    EXPECT_EQ(monitor.state(), SessionState::Idle);
    EXPECT_EQ(lflag(), before);

    std::vector<std::string> expected = {
        "AwaitingCommand", "SendingCommand", "Following", "Terminating", "Idle"};
    EXPECT_EQ(seen(), expected);
}

TEST_F(MonitorTest, OtherKeysKeepFollowing) {
    StubDispatcher stub(control, logs);
    stub.set_initial_log("ready\n");
    stub.start();

    ControlChannel channel(control.string(), HandoffOptions::from(settings));
    Monitor monitor(channel, settings, make_io(slave));

    auto session = std::async(std::launch::async, [&] { return monitor.submit("status"); });
    ASSERT_TRUE(eventually([&] { return monitor.state() == SessionState::Following &&
                                        log_out.text() == "ready\n"; }));

    press('x');
    press('N');
    EXPECT_EQ(session.wait_for(std::chrono::milliseconds(150)), std::future_status::timeout);
    EXPECT_EQ(monitor.state(), SessionState::Following);

    press('n');
    ASSERT_EQ(session.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_EQ(session.get().stop, StopReason::DismissKey);
}

TEST_F(MonitorTest, CtrlCByteInterruptsAndCleansUp) {
    StubDispatcher stub(control, logs);
    stub.set_initial_log("ready\n");
    stub.start();

    ControlChannel channel(control.string(), HandoffOptions::from(settings));
    Monitor monitor(channel, settings, make_io(slave));

    auto session = std::async(std::launch::async, [&] { return monitor.submit("status"); });
    ASSERT_TRUE(eventually([&] { return log_out.text() == "ready\n"; }));
    press(0x03);

    ASSERT_EQ(session.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    SessionOutcome outcome = session.get();
    EXPECT_EQ(outcome.stop, StopReason::Interrupted);
    EXPECT_TRUE(outcome.log_removed);
    EXPECT_TRUE(lflag() & ICANON);
}

TEST_F(MonitorTest, LostLogEndsSession) {
    StubDispatcher stub(control, logs);
    stub.set_initial_log("ready\n");
    stub.start();

    ControlChannel channel(control.string(), HandoffOptions::from(settings));
    Monitor monitor(channel, settings, make_io(slave));

    auto session = std::async(std::launch::async, [&] { return monitor.submit("status"); });
    ASSERT_TRUE(eventually([&] { return log_out.text() == "ready\n"; }));
    fs::remove(stub.last_log());

    ASSERT_EQ(session.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    SessionOutcome outcome = session.get();
    EXPECT_EQ(outcome.error, ErrorCode::LogLost);
    EXPECT_EQ(outcome.stop, StopReason::LogLost);
    EXPECT_TRUE(outcome.log_removed);
    EXPECT_EQ(monitor.state(), SessionState::Idle);
}

TEST_F(MonitorTest, EmptyCommandReturnsToIdleWithoutSending) {
    ControlChannel channel(control.string(), HandoffOptions::from(settings));
    Monitor monitor(channel, settings, make_io(slave));
    record(monitor);

    SessionOutcome outcome = monitor.submit("  ");

    EXPECT_EQ(outcome.error, ErrorCode::EmptyCommand);
    EXPECT_EQ(monitor.state(), SessionState::Idle);
    EXPECT_FALSE(fs::exists(control));

    std::vector<std::string> expected = {"AwaitingCommand", "Idle"};
    EXPECT_EQ(seen(), expected);
}

TEST_F(MonitorTest, HandoffTimeoutAbortsSession) {
    StubDispatcher stub(control, logs, StubDispatcher::Mode::Silent);
    stub.start();

    settings.handoff_timeout_ms = 100;
    ControlChannel channel(control.string(), HandoffOptions::from(settings));
    Monitor monitor(channel, settings, make_io(slave));
    record(monitor);

    SessionOutcome outcome = monitor.submit("status");

    EXPECT_EQ(outcome.error, ErrorCode::ChannelTimeout);
    EXPECT_TRUE(outcome.log_path.empty());
    EXPECT_EQ(monitor.state(), SessionState::Idle);

    std::vector<std::string> expected = {"AwaitingCommand", "SendingCommand", "Idle"};
    EXPECT_EQ(seen(), expected);
}

TEST_F(MonitorTest, NonTerminalInputFailsButStillDeletesLog) {
    StubDispatcher stub(control, logs);
    stub.set_initial_log("ready\n");
    stub.start();

    int fds[2];
    ASSERT_EQ(pipe(fds), 0);

    ControlChannel channel(control.string(), HandoffOptions::from(settings));
    Monitor monitor(channel, settings, make_io(fds[0]));
    SessionOutcome outcome = monitor.submit("status");

    close(fds[0]);
    close(fds[1]);

    EXPECT_EQ(outcome.error, ErrorCode::TerminalMode);
    EXPECT_TRUE(outcome.log_removed);
    EXPECT_FALSE(fs::exists(stub.last_log()));
    EXPECT_EQ(monitor.state(), SessionState::Idle);
}

TEST_F(MonitorTest, ConsecutiveSessionsReuseTheChannel) {
    StubDispatcher stub(control, logs);
    stub.set_initial_log("ready\n");
    stub.start();

    ControlChannel channel(control.string(), HandoffOptions::from(settings));
    Monitor monitor(channel, settings, make_io(slave));

    for (int i = 0; i < 2; i++) {
        auto session = std::async(std::launch::async, [&] { return monitor.submit("status"); });
        ASSERT_TRUE(eventually([&] { return stub.commands_seen() == i + 1 &&
                                            monitor.state() == SessionState::Following; }));
        ASSERT_TRUE(eventually([&] { return fs::exists(stub.last_log()) &&
                                            log_out.text().size() == 6u * (i + 1); }));
        press('n');
        ASSERT_EQ(session.wait_for(std::chrono::seconds(5)), std::future_status::ready);
        EXPECT_TRUE(session.get().ok());
    }
    EXPECT_EQ(stub.commands_seen(), 2);
}

TEST(RemoveLogFileTest, MissingFileCountsAsRemoved) {
    EXPECT_TRUE(remove_log_file((fs::temp_directory_path() / "hpsmon_no_such.log").string()));
}
