#include "test_helpers.hpp"
#include <managers/log_result.hpp>

TEST(LogResultTest, EmptyLogIsPending) {
    auto r = parse_log_result("");
    EXPECT_FALSE(r.complete);
    EXPECT_EQ(r.status, "");
}

TEST(LogResultTest, RunningWithoutResultIsPending) {
    auto r = parse_log_result("1\nresolving example.hps\n");
    EXPECT_FALSE(r.complete);
    EXPECT_EQ(r.status, "1");
    EXPECT_EQ(r.message, "resolving example.hps");
}

TEST(LogResultTest, SuccessfulResult) {
    auto r = parse_log_result("1\naddress 10.0.0.7\n1\n");
    EXPECT_TRUE(r.complete);
    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.message, "address 10.0.0.7");
}

TEST(LogResultTest, FailedResult) {
    auto r = parse_log_result("1\nno route\n0\n");
    EXPECT_TRUE(r.complete);
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.message, "no route");
}

TEST(LogResultTest, FailedStatusCompletesImmediately) {
    auto r = parse_log_result("0\nunknown command\n");
    EXPECT_TRUE(r.complete);
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.message, "unknown command");
}

TEST(LogResultTest, MultiLineMessageKept) {
    auto r = parse_log_result("1\npeer a\npeer b\r\n1\n\n");
    EXPECT_TRUE(r.complete);
    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.message, "peer a\npeer b");
}

class WaitForLogResultTest : public ScratchDirTest {};

TEST_F(WaitForLogResultTest, ReturnsOnceResultIsWritten) {
    fs::path log = logs / "exec.log";
    write_text(log, "1\nworking\n");

    std::thread controller([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        write_text(log, "1\ndone\n1\n");
    });
    auto r = wait_for_log_result(log.string(), 2000, 10);
    controller.join();

    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_TRUE(r.value.success);
    EXPECT_EQ(r.value.message, "done");
}

TEST_F(WaitForLogResultTest, MessageEndingInFlagIsNotMistakenForResult) {
    fs::path log = logs / "exec.log";
    // Status and message written; the message's last line happens to be "1"
    write_text(log, "1\npeers online:\n1\n");

    std::thread controller([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        append_text(log, "0\n");
    });
    auto r = wait_for_log_result(log.string(), 2000, 50);
    controller.join();

    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_FALSE(r.value.success);
    EXPECT_EQ(r.value.message, "peers online:\n1");
}

TEST_F(WaitForLogResultTest, StableResultIsAccepted) {
    fs::path log = logs / "exec.log";
    write_text(log, "1\ndone\n1\n");

    auto r = wait_for_log_result(log.string(), 2000, 10);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_TRUE(r.value.success);
}

TEST_F(WaitForLogResultTest, TimesOut) {
    fs::path log = logs / "exec.log";
    write_text(log, "1\nworking\n");

    auto r = wait_for_log_result(log.string(), 50, 10);
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::ChannelTimeout);
}

TEST_F(WaitForLogResultTest, MissingLogIsLost) {
    auto r = wait_for_log_result((logs / "gone.log").string(), 1000, 10);
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::LogLost);
}
