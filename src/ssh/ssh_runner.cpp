#include "ssh_runner.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <libssh2.h>
#include <atomic>
#include <chrono>

static std::string exit_error(const std::string& program, int code, std::string err) {
    trim(err);
    if (err.empty()) return fmt::format("remote {} exited with status {}", program, code);
    return fmt::format("remote {} exited with status {}: {}", program, code, err);
}

// Drain whatever stderr is buffered on the channel.
static std::string read_stderr(SessionManager& session, const ExecChannel& ch) {
    std::string err;
    char buf[SSH_READ_BUF_SIZE];
    while (true) {
        ssize_t n = session.read(ch, buf, sizeof(buf), true);
        if (n <= 0) break;
        err.append(buf, static_cast<size_t>(n));
    }
    return err;
}

// ── SshStream ───────────────────────────────────────────────

// stdout of a remote command. Reads poll the session socket in short slices
// so cancel() is noticed without touching the channel from another thread.
class SshStream : public ByteStream {
public:
    SshStream(std::string program, std::shared_ptr<SessionManager> session, ExecChannel ch)
        : program_(std::move(program)), session_(std::move(session)), ch_(ch) {}

    ~SshStream() override {
        session_->close_channel(ch_);
    }

    Result<size_t> read(char* buf, size_t len) override {
        while (!cancelled_.load()) {
            ssize_t n = session_->read(ch_, buf, len);
            if (n > 0) return Result<size_t>::Ok(static_cast<size_t>(n));

            if (n == 0 || n == LIBSSH2_ERROR_EAGAIN) {
                if (session_->eof(ch_)) return finish();
                session_->wait_socket(100);
                continue;
            }
            return Result<size_t>::Err(fmt::format("SSH channel read error ({}) on {}",
                                                   n, session_->get_target()));
        }
        return Result<size_t>::Ok(0);
    }

    void cancel() override {
        cancelled_.store(true);
    }

private:
    // Remote side closed stdout; a failing exit status is a stream error
    Result<size_t> finish() {
        std::string err = read_stderr(*session_, ch_);
        int code = session_->close_channel(ch_);
        if (code > 0 && !cancelled_.load()) {
            return Result<size_t>::Err(exit_error(program_, code, err));
        }
        return Result<size_t>::Ok(0);
    }

    std::string program_;
    std::shared_ptr<SessionManager> session_;
    ExecChannel ch_;
    std::atomic<bool> cancelled_{false};
};

// ── SshRunner ───────────────────────────────────────────────

SshRunner::SshRunner(const BastionConfig& config, const CancelToken* cancel)
    : config_(config), session_(std::make_shared<SessionManager>(config)), cancel_(cancel) {}

std::string SshRunner::describe() const {
    return config_.user + "@" + config_.host;
}

Result<ExecChannel> SshRunner::start(const std::vector<std::string>& argv) {
    if (argv.empty()) return Result<ExecChannel>::Err("empty command");

    // A session that died since the last command is re-opened here, not
    // discovered by a failing exec
    if (!session_->check_alive()) {
        auto est = session_->establish([](const std::string& msg) { logtap_debug("ssh: " + msg); });
        if (est.is_err()) return Result<ExecChannel>::Err(est.error);
    }

    std::string command = shell_join(argv);
    logtap_debug(fmt::format("ssh {}: {}", describe(), command));
    return session_->exec(command);
}

Result<std::string> SshRunner::run(const std::vector<std::string>& argv, int timeout_secs) {
    auto started = start(argv);
    if (started.is_err()) return Result<std::string>::Err(started.error);
    ExecChannel ch = started.value;

    std::string output;
    char buf[SSH_READ_BUF_SIZE];
    int effective_timeout = (timeout_secs > 0) ? timeout_secs : KUBECTL_CMD_TIMEOUT_SECS;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(effective_timeout);

    // Stderr is drained alongside stdout so a chatty command cannot stall on
    // a full window
    std::string err;
    while (true) {
        if (cancel_ && cancel_->cancelled()) {
            session_->close_channel(ch);
            return Result<std::string>::Err("remote " + argv[0] + " cancelled");
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            session_->close_channel(ch);
            return Result<std::string>::Err(
                fmt::format("remote {} timed out after {}s", argv[0], effective_timeout));
        }

        ssize_t n = session_->read(ch, buf, sizeof(buf));
        if (n > 0) {
            output.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n != 0 && n != LIBSSH2_ERROR_EAGAIN) {
            session_->close_channel(ch);
            return Result<std::string>::Err("SSH channel read error on " + describe());
        }

        err += read_stderr(*session_, ch);
        if (session_->eof(ch)) break;
        session_->wait_socket(SSH_EAGAIN_SLEEP_MS * 10);
    }

    err += read_stderr(*session_, ch);
    int code = session_->close_channel(ch);
    if (code != 0) return Result<std::string>::Err(exit_error(argv[0], code, err));
    return Result<std::string>::Ok(std::move(output));
}

Result<std::unique_ptr<ByteStream>> SshRunner::open_stream(const std::vector<std::string>& argv) {
    using R = Result<std::unique_ptr<ByteStream>>;
    auto started = start(argv);
    if (started.is_err()) return R::Err(started.error);
    return R::Ok(std::make_unique<SshStream>(argv[0], session_, started.value));
}
