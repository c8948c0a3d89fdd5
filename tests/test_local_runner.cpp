#include <gtest/gtest.h>
#include <cluster/local_runner.hpp>
#include <core/cancel_token.hpp>
#include <core/constants.hpp>
#include <atomic>
#include <chrono>
#include <thread>

using namespace std::chrono_literals;

static std::string read_all(ByteStream& stream, std::string* error = nullptr) {
    std::string out;
    char buf[64];
    while (true) {
        auto n = stream.read(buf, sizeof(buf));
        if (n.is_err()) {
            if (error) *error = n.error;
            break;
        }
        if (n.value == 0) break;
        out.append(buf, n.value);
    }
    return out;
}

TEST(LocalRunner, CapturesStdout) {
    LocalRunner runner;
    auto r = runner.run({"/bin/sh", "-c", "echo hello; echo world"}, 5);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value, "hello\nworld\n");
}

TEST(LocalRunner, NonZeroExitCarriesStderr) {
    LocalRunner runner;
    auto r = runner.run({"/bin/sh", "-c", "echo nope >&2; exit 3"}, 5);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error, "/bin/sh exited with status 3: nope");
}

TEST(LocalRunner, MissingProgram) {
    LocalRunner runner;
    auto r = runner.run({"/nonexistent/kubectl", "version"}, 5);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error, "failed to execute /nonexistent/kubectl");
}

TEST(LocalRunner, EmptyCommand) {
    LocalRunner runner;
    EXPECT_TRUE(runner.run({}, 5).is_err());
    EXPECT_TRUE(runner.open_stream({}).is_err());
}

TEST(LocalRunner, Timeout) {
    LocalRunner runner;
    auto start = std::chrono::steady_clock::now();
    auto r = runner.run({"/bin/sh", "-c", "sleep 30"}, 1);
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error, "/bin/sh timed out after 1s");
    EXPECT_LT(elapsed, 10s);
}

TEST(LocalRunner, StreamReadsUntilExit) {
    LocalRunner runner;
    auto s = runner.open_stream({"/bin/sh", "-c", "printf 'a\\nb\\n'"});
    ASSERT_TRUE(s.is_ok()) << s.error;

    std::string error;
    EXPECT_EQ(read_all(*s.value, &error), "a\nb\n");
    EXPECT_EQ(error, "");
}

TEST(LocalRunner, StreamFailingExitIsAnError) {
    LocalRunner runner;
    auto s = runner.open_stream({"/bin/sh", "-c", "echo partial; echo broken >&2; exit 1"});
    ASSERT_TRUE(s.is_ok()) << s.error;

    std::string error;
    EXPECT_EQ(read_all(*s.value, &error), "partial\n");
    EXPECT_EQ(error, "/bin/sh exited with status 1: broken");
}

TEST(LocalRunner, StreamCancelUnblocksRead) {
    LocalRunner runner;
    auto s = runner.open_stream({"/bin/sh", "-c", "exec sleep 30"});
    ASSERT_TRUE(s.is_ok()) << s.error;
    ByteStream& stream = *s.value;

    std::thread canceller([&stream] {
        std::this_thread::sleep_for(100ms);
        stream.cancel();
    });

    auto start = std::chrono::steady_clock::now();
    std::string error;
    EXPECT_EQ(read_all(stream, &error), "");
    auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    EXPECT_EQ(error, "");
    EXPECT_LT(elapsed, 10s);
}

TEST(LocalRunner, Describe) {
    LocalRunner runner;
    EXPECT_EQ(runner.describe(), "local");
}

// ── stderr handling and cancellation ────────────────────────

TEST(LocalRunner, StreamSurvivesStderrFlood) {
    LocalRunner runner;
    auto s = runner.open_stream(
        {"/bin/sh", "-c", "head -c 200000 /dev/zero | tr '\\0' w >&2; echo hello"});
    ASSERT_TRUE(s.is_ok()) << s.error;
    ByteStream& stream = *s.value;

    // A stalled child would block forever; cancel it as a backstop
    std::atomic<bool> done{false};
    std::thread watchdog([&stream, &done] {
        for (int i = 0; i < 100 && !done.load(); i++) std::this_thread::sleep_for(100ms);
        if (!done.load()) stream.cancel();
    });

    std::string error;
    std::string out = read_all(stream, &error);
    done.store(true);
    watchdog.join();

    EXPECT_EQ(out, "hello\n");
    EXPECT_EQ(error, "");
}

TEST(LocalRunner, StreamStderrTailIsBounded) {
    LocalRunner runner;
    auto s = runner.open_stream(
        {"/bin/sh", "-c", "head -c 200000 /dev/zero | tr '\\0' w >&2; echo last >&2; exit 2"});
    ASSERT_TRUE(s.is_ok()) << s.error;

    std::string error;
    EXPECT_EQ(read_all(*s.value, &error), "");

    const std::string prefix = "/bin/sh exited with status 2: ";
    ASSERT_EQ(error.rfind(prefix, 0), 0u) << error.substr(0, 80);
    EXPECT_LE(error.size(), prefix.size() + STDERR_TAIL_BYTES);
    EXPECT_EQ(error.substr(error.size() - 5), "wlast");
}

TEST(LocalRunner, RunSurvivesStderrFlood) {
    LocalRunner runner;
    auto r = runner.run({"/bin/sh", "-c", "head -c 200000 /dev/zero | tr '\\0' w >&2; exit 4"}, 10);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.rfind("/bin/sh exited with status 4: ", 0), 0u);
    EXPECT_LE(r.error.size(), std::string("/bin/sh exited with status 4: ").size() + STDERR_TAIL_BYTES);
}

TEST(LocalRunner, CancelTokenStopsRun) {
    CancelToken cancel;
    LocalRunner runner(&cancel);

    std::thread canceller([&cancel] {
        std::this_thread::sleep_for(100ms);
        cancel.cancel();
    });

    auto start = std::chrono::steady_clock::now();
    auto r = runner.run({"/bin/sh", "-c", "sleep 30"}, 60);
    auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error, "/bin/sh cancelled");
    EXPECT_LT(elapsed, 10s);
}

TEST(LocalRunner, CancelledTokenRefusesToWait) {
    CancelToken cancel;
    cancel.cancel();
    LocalRunner runner(&cancel);

    auto r = runner.run({"/bin/sh", "-c", "sleep 30"}, 60);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error, "/bin/sh cancelled");
}
