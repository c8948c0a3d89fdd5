#include "local_runner.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <poll.h>
#include <unistd.h>
#include <cerrno>

static std::string exit_error(const std::string& program, int code, std::string err) {
    trim(err);
    if (code == 127 && err.empty()) {
        return fmt::format("failed to execute {}", program);
    }
    if (err.empty()) {
        return fmt::format("{} exited with status {}", program, code);
    }
    return fmt::format("{} exited with status {}: {}", program, code, err);
}

// Keep only the last STDERR_TAIL_BYTES of a command's stderr
static void append_tail(std::string& tail, const char* data, size_t len) {
    tail.append(data, len);
    if (tail.size() > STDERR_TAIL_BYTES) tail.erase(0, tail.size() - STDERR_TAIL_BYTES);
}

// ── ProcessStream ───────────────────────────────────────────

// stdout of a child process. stderr is drained alongside it so the child can
// never block on a full pipe. cancel() terminates the child, which closes
// the pipe and lets a blocked read() return.
class ProcessStream : public ByteStream {
public:
    ProcessStream(std::string program, platform::ProcessHandle proc)
        : program_(std::move(program)), proc_(std::move(proc)),
          err_fd_(proc_.stderr_fd()) {}

    ~ProcessStream() override {
        std::lock_guard<std::mutex> lock(mutex_);
        proc_.close_pipes();
        proc_.terminate();
    }

    Result<size_t> read(char* buf, size_t len) override {
        char errbuf[STREAM_READ_BUF_SIZE];

        while (!cancelled_.load()) {
            struct pollfd fds[2];
            fds[0].fd = proc_.stdout_fd();
            fds[0].events = POLLIN;
            fds[0].revents = 0;
            fds[1].fd = err_fd_;
            fds[1].events = POLLIN;
            fds[1].revents = 0;

            int ret = poll(fds, 2, CMD_POLL_SLICE_MS);
            if (ret < 0) {
                if (errno == EINTR) continue;
                return Result<size_t>::Err("poll on " + program_ + ": " + platform::last_error());
            }
            if (ret == 0) continue;

            if (fds[1].revents != 0) {
                ssize_t n = ::read(err_fd_, errbuf, sizeof(errbuf));
                if (n > 0) {
                    append_tail(err_tail_, errbuf, static_cast<size_t>(n));
                } else if (n == 0 || errno != EINTR) {
                    err_fd_ = -1;
                }
            }

            if (fds[0].revents == 0) continue;

            ssize_t n = ::read(proc_.stdout_fd(), buf, len);
            if (n < 0 && errno == EINTR) continue;
            if (cancelled_.load()) break;
            if (n > 0) return Result<size_t>::Ok(static_cast<size_t>(n));
            if (n < 0) {
                return Result<size_t>::Err("read from " + program_ + ": " + platform::last_error());
            }
            return finish();
        }
        return Result<size_t>::Ok(0);
    }

    void cancel() override {
        cancelled_.store(true);
        std::lock_guard<std::mutex> lock(mutex_);
        proc_.signal_terminate();
    }

private:
    // EOF: the command closed its stdout. A failing exit is a stream error.
    Result<size_t> finish() {
        int code = reap();
        if (cancelled_.load() || code == 0) return Result<size_t>::Ok(0);

        if (err_fd_ >= 0) {
            std::string rest;
            if (!platform::drain_fd(err_fd_, rest)) {
                logtap_debug("read stderr of " + program_ + ": " + platform::last_error());
            }
            append_tail(err_tail_, rest.data(), rest.size());
            err_fd_ = -1;
        }
        return Result<size_t>::Err(exit_error(program_, code, err_tail_));
    }

    int reap() {
        while (true) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (!proc_.running()) return proc_.wait(0);
            }
            platform::sleep_ms(20);
        }
    }

    std::string program_;
    platform::ProcessHandle proc_;
    int err_fd_;
    std::string err_tail_;
    std::mutex mutex_;          // guards signalling vs. reaping the child
    std::atomic<bool> cancelled_{false};
};

// ── LocalRunner ─────────────────────────────────────────────

LocalRunner::LocalRunner(const CancelToken* cancel) : cancel_(cancel) {}

Result<std::string> LocalRunner::run(const std::vector<std::string>& argv,
                                     int timeout_secs) {
    if (argv.empty()) return Result<std::string>::Err("empty command");

    std::vector<std::string> args(argv.begin() + 1, argv.end());
    auto proc = platform::spawn(argv[0], args);
    if (!proc.valid()) {
        return Result<std::string>::Err("failed to spawn " + argv[0] + ": " + platform::last_error());
    }

    int effective_timeout = (timeout_secs > 0) ? timeout_secs : KUBECTL_CMD_TIMEOUT_SECS;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(effective_timeout);

    // Read both pipes together so neither can fill up and stall the child
    std::string out, err;
    struct pollfd fds[2];
    fds[0].fd = proc.stdout_fd();
    fds[0].events = POLLIN;
    fds[1].fd = proc.stderr_fd();
    fds[1].events = POLLIN;
    int open_fds = 2;
    char buf[STREAM_READ_BUF_SIZE];

    while (open_fds > 0) {
        if (cancel_ && cancel_->cancelled()) {
            proc.terminate();
            return Result<std::string>::Err(argv[0] + " cancelled");
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            proc.terminate();
            return Result<std::string>::Err(
                fmt::format("{} timed out after {}s", argv[0], effective_timeout));
        }

        // Short slices so a cancel is noticed without waiting out the timeout
        int slice = static_cast<int>(std::min<long long>(remaining, CMD_POLL_SLICE_MS));
        int ret = poll(fds, 2, slice);
        if (ret < 0) {
            if (errno == EINTR) continue;
            proc.terminate();
            return Result<std::string>::Err("poll: " + platform::last_error());
        }
        if (ret == 0) continue;

        for (int i = 0; i < 2; i++) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            ssize_t n = ::read(fds[i].fd, buf, sizeof(buf));
            if (n > 0 && i == 0) {
                out.append(buf, static_cast<size_t>(n));
            } else if (n > 0) {
                append_tail(err, buf, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                fds[i].fd = -1;
                open_fds--;
            }
        }
    }

    int code = proc.wait();
    if (code != 0) {
        return Result<std::string>::Err(exit_error(argv[0], code, err));
    }
    return Result<std::string>::Ok(std::move(out));
}

Result<std::unique_ptr<ByteStream>> LocalRunner::open_stream(
    const std::vector<std::string>& argv) {
    using R = Result<std::unique_ptr<ByteStream>>;
    if (argv.empty()) return R::Err("empty command");

    std::vector<std::string> args(argv.begin() + 1, argv.end());
    auto proc = platform::spawn(argv[0], args);
    if (!proc.valid()) {
        return R::Err("failed to spawn " + argv[0] + ": " + platform::last_error());
    }

    logtap_debug(fmt::format("local: streaming pid {}: {}", proc.native_handle(), shell_join(argv)));
    return R::Ok(std::make_unique<ProcessStream>(argv[0], std::move(proc)));
}
