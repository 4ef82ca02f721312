#include <gtest/gtest.h>
#include <managers/key_listener.hpp>
#include <core/constants.hpp>
#include <unistd.h>

// Pipe standing in for a terminal already in no-echo mode.
class KeyListenerTest : public ::testing::Test {
protected:
    int fds[2] = {-1, -1};

    void SetUp() override {
        ASSERT_EQ(pipe(fds), 0);
    }

    void TearDown() override {
        close_writer();
        if (fds[0] >= 0) close(fds[0]);
    }

    void send(const std::string& bytes) {
        ASSERT_EQ(write(fds[1], bytes.data(), bytes.size()),
                  static_cast<ssize_t>(bytes.size()));
    }

    void close_writer() {
        if (fds[1] >= 0) {
            close(fds[1]);
            fds[1] = -1;
        }
    }
};

TEST_F(KeyListenerTest, ClassifiesKeys) {
    KeyListener listener(fds[0], 'n', 10);
    EXPECT_EQ(listener.classify('n'), StopReason::DismissKey);
    EXPECT_EQ(listener.classify(CTRL_C), StopReason::Interrupted);
    EXPECT_EQ(listener.classify('N'), StopReason::None);
    EXPECT_EQ(listener.classify('\n'), StopReason::None);
    EXPECT_EQ(listener.classify('q'), StopReason::None);
}

TEST_F(KeyListenerTest, CustomDismissKey) {
    KeyListener listener(fds[0], 'q', 10);
    EXPECT_EQ(listener.classify('q'), StopReason::DismissKey);
    EXPECT_EQ(listener.classify('n'), StopReason::None);
}

TEST_F(KeyListenerTest, OtherKeysAreIgnored) {
    KeyListener listener(fds[0], 'n', 10);
    CancelToken token;
    listener.start(token);

    send("xyz\n");
    EXPECT_FALSE(token.wait_for(100));
    EXPECT_EQ(listener.ignored_keys(), 4);

    token.request(StopReason::Shutdown);
    listener.join();
    EXPECT_EQ(token.reason(), StopReason::Shutdown);
}

TEST_F(KeyListenerTest, DismissKeyStopsFollowing) {
    KeyListener listener(fds[0], 'n', 10);
    CancelToken token;
    listener.start(token);

    send("abn");
    EXPECT_TRUE(token.wait_for(2000));
    listener.join();

    EXPECT_EQ(token.reason(), StopReason::DismissKey);
    EXPECT_EQ(listener.ignored_keys(), 2);
}

TEST_F(KeyListenerTest, CtrlCByteInterrupts) {
    KeyListener listener(fds[0], 'n', 10);
    CancelToken token;
    listener.start(token);

    send(std::string(1, CTRL_C));
    EXPECT_TRUE(token.wait_for(2000));
    listener.join();

    EXPECT_EQ(token.reason(), StopReason::Interrupted);
}

TEST_F(KeyListenerTest, EndOfInputStops) {
    KeyListener listener(fds[0], 'n', 10);
    CancelToken token;
    listener.start(token);

    close_writer();
    EXPECT_TRUE(token.wait_for(2000));
    listener.join();

    EXPECT_EQ(token.reason(), StopReason::InputClosed);
}

TEST_F(KeyListenerTest, ExternalStopEndsListener) {
    KeyListener listener(fds[0], 'n', 10);
    CancelToken token;
    listener.start(token);

    token.request(StopReason::LogLost);
    listener.join();
    EXPECT_EQ(token.reason(), StopReason::LogLost);
}
