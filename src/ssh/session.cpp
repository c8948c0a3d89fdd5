#include "session.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <fmt/format.h>
#include <libssh2.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <netdb.h>
#include <cstring>
#include <cerrno>

// Data passed to keyboard-interactive callback via session abstract pointer
struct KbdAuthData {
    std::string password;
    int prompt_round;
};

// libssh2 keyboard-interactive callback: answer every prompt with the password
static void kbd_callback(const char* /*name*/, int /*name_len*/,
                         const char* /*instruction*/, int /*instruction_len*/,
                         int num_prompts,
                         const LIBSSH2_USERAUTH_KBDINT_PROMPT* /*prompts*/,
                         LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                         void** abstract) {
    KbdAuthData* data = static_cast<KbdAuthData*>(*abstract);
    for (int i = 0; i < num_prompts; i++) {
        responses[i].text = strdup(data->password.c_str());
        responses[i].length = static_cast<unsigned int>(data->password.length());
    }
    data->prompt_round++;
}

SessionManager::SessionManager(const BastionConfig& target)
    : target_(target), session_(nullptr), sock_(-1), active_(false),
      io_mutex_(std::make_shared<std::mutex>()) {
}

SessionManager::~SessionManager() {
    close();
    if (lib_initialized_) libssh2_exit();
}

Result<void> SessionManager::establish(StatusCallback callback) {
    std::lock_guard<std::mutex> lock(*io_mutex_);
    if (active_) return Result<void>::Ok();

    // One init per manager, released in the destructor
    if (!lib_initialized_) {
        if (libssh2_init(0) != 0) {
            return Result<void>::Err("failed to initialize libssh2");
        }
        lib_initialized_ = true;
    }

    auto sock_result = connect_socket(callback);
    if (sock_result.is_err()) return sock_result;

    if (callback) callback("TCP connected, starting SSH handshake...");

    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        teardown("init failed");
        return Result<void>::Err("failed to create SSH session");
    }

    libssh2_session_set_blocking(session_, 0);

    // SSH handshake (key exchange)
    int ret;
    while ((ret = libssh2_session_handshake(session_, sock_)) == LIBSSH2_ERROR_EAGAIN) {
        platform::poll_socket(sock_, POLLIN | POLLOUT, 100);
    }
    if (ret != 0) {
        teardown("Handshake failed");
        return Result<void>::Err("SSH handshake failed with " + target_.host);
    }

    // Long-lived log streams sit idle for minutes. wait_socket() sends the
    // SSH keepalives configured here.
    int tcp_keepalive = 1;
    setsockopt(sock_, SOL_SOCKET, SO_KEEPALIVE, &tcp_keepalive, sizeof(tcp_keepalive));
#ifdef TCP_KEEPIDLE
    int keepidle = 60;
    setsockopt(sock_, IPPROTO_TCP, TCP_KEEPIDLE, &keepidle, sizeof(keepidle));
#endif
    libssh2_keepalive_config(session_, 1, 30);

    if (callback) callback("SSH handshake complete, authenticating...");

    auto auth_result = ssh_userauth(callback);
    if (auth_result.is_err()) {
        teardown("Authentication failed");
        return auth_result;
    }

    active_ = true;
    target_str_ = target_.user + "@" + target_.host;
    logtap_log("ssh: connected to " + target_str_);
    return Result<void>::Ok();
}

Result<void> SessionManager::connect_socket(StatusCallback callback) {
    if (callback) callback("Connecting to " + target_.host + "...");

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    std::string port = std::to_string(target_.port);
    int gai = getaddrinfo(target_.host.c_str(), port.c_str(), &hints, &res);
    if (gai != 0 || !res) {
        return Result<void>::Err(fmt::format("failed to resolve host {}: {}",
                                             target_.host, gai_strerror(gai)));
    }

    std::string last_err = "no addresses";
    for (struct addrinfo* ai = res; ai; ai = ai->ai_next) {
        sock_ = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock_ < 0) {
            last_err = platform::last_error();
            continue;
        }

        // Non-blocking connect so the timeout is ours, not the kernel's
        platform::set_nonblocking(sock_);
        int ret = connect(sock_, ai->ai_addr, ai->ai_addrlen);
        if (ret < 0 && errno == EINPROGRESS) {
            int timeout = target_.timeout > 0 ? target_.timeout : SSH_CONNECT_TIMEOUT_SECS;
            int revents = platform::poll_socket(sock_, POLLOUT, timeout * 1000);
            if (revents == 0) {
                last_err = "connection timed out";
                ret = -1;
            } else {
                int sock_err = 0;
                socklen_t err_len = sizeof(sock_err);
                getsockopt(sock_, SOL_SOCKET, SO_ERROR, &sock_err, &err_len);
                if (sock_err != 0) {
                    last_err = std::strerror(sock_err);
                    ret = -1;
                } else {
                    ret = 0;
                }
            }
        } else if (ret < 0) {
            last_err = platform::last_error();
        }

        if (ret == 0) {
            freeaddrinfo(res);
            return Result<void>::Ok();
        }
        platform::close_socket(sock_);
        sock_ = -1;
    }

    freeaddrinfo(res);
    return Result<void>::Err(fmt::format("failed to connect to {}:{}: {}",
                                         target_.host, target_.port, last_err));
}

Result<void> SessionManager::ssh_userauth(StatusCallback callback) {
    int ret;

    // Public key first when configured; the password doubles as passphrase
    if (target_.ssh_key_path && !target_.ssh_key_path->empty()) {
        if (callback) callback("Using public key auth...");
        const char* passphrase = target_.password ? target_.password->c_str() : nullptr;
        while ((ret = libssh2_userauth_publickey_fromfile(session_, target_.user.c_str(),
                    nullptr, target_.ssh_key_path->c_str(), passphrase)) == LIBSSH2_ERROR_EAGAIN) {
            platform::poll_socket(sock_, POLLIN | POLLOUT, 100);
        }
        if (ret == 0) return Result<void>::Ok();
        logtap_log("ssh: public key auth failed for " + target_.user + "@" + target_.host);
    }

    if (!target_.password) {
        return Result<void>::Err("authentication failed (no usable key or password for "
                                 + target_.user + "@" + target_.host + ")");
    }

    // Check what auth methods the server supports
    char* auth_list = nullptr;
    while ((auth_list = libssh2_userauth_list(session_, target_.user.c_str(),
                                              static_cast<unsigned int>(target_.user.length()))) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) break;
        platform::poll_socket(sock_, POLLIN | POLLOUT, 100);
    }
    std::string methods = auth_list ? auth_list : "";

    if (methods.find("keyboard-interactive") != std::string::npos) {
        if (callback) callback("Using keyboard-interactive auth...");

        KbdAuthData kbd_data;
        kbd_data.password = *target_.password;
        kbd_data.prompt_round = 0;
        *libssh2_session_abstract(session_) = &kbd_data;

        while ((ret = libssh2_userauth_keyboard_interactive(session_,
                target_.user.c_str(), kbd_callback)) == LIBSSH2_ERROR_EAGAIN) {
            platform::poll_socket(sock_, POLLIN | POLLOUT, 100);
        }
        *libssh2_session_abstract(session_) = nullptr;
        if (ret == 0) return Result<void>::Ok();
    }

    if (methods.empty() || methods.find("password") != std::string::npos) {
        if (callback) callback("Using password auth...");
        while ((ret = libssh2_userauth_password(session_,
                target_.user.c_str(), target_.password->c_str())) == LIBSSH2_ERROR_EAGAIN) {
            platform::poll_socket(sock_, POLLIN | POLLOUT, 100);
        }
        if (ret == 0) return Result<void>::Ok();
    }

    return Result<void>::Err("authentication failed (check username/password)");
}

Result<ExecChannel> SessionManager::exec(const std::string& command) {
    std::lock_guard<std::mutex> lock(*io_mutex_);
    if (!active_ || !session_) return Result<ExecChannel>::Err("SSH session not connected");

    LIBSSH2_CHANNEL* channel = nullptr;
    while ((channel = libssh2_channel_open_session(session_)) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
            // A session that cannot open channels is dead; reconnect next time
            teardown("Failed to open channel");
            return Result<ExecChannel>::Err("failed to open exec channel on " + target_str_);
        }
        platform::poll_socket(sock_, POLLIN | POLLOUT, SSH_EAGAIN_SLEEP_MS);
    }

    int rc;
    while ((rc = libssh2_channel_exec(channel, command.c_str())) == LIBSSH2_ERROR_EAGAIN) {
        platform::poll_socket(sock_, POLLIN | POLLOUT, SSH_EAGAIN_SLEEP_MS);
    }
    if (rc != 0) {
        libssh2_channel_free(channel);
        return Result<ExecChannel>::Err("failed to exec command on " + target_str_);
    }

    ExecChannel ch;
    ch.channel = channel;
    ch.generation = generation_;
    return Result<ExecChannel>::Ok(ch);
}

bool SessionManager::live(const ExecChannel& ch) const {
    return ch.channel && session_ && ch.generation == generation_;
}

bool SessionManager::is_transport_error(ssize_t rc) {
    if (rc >= 0 || rc == LIBSSH2_ERROR_EAGAIN) return false;
    switch (rc) {
        // Scoped to one channel; the session itself is still usable
        case LIBSSH2_ERROR_CHANNEL_OUTOFORDER:
        case LIBSSH2_ERROR_CHANNEL_FAILURE:
        case LIBSSH2_ERROR_CHANNEL_REQUEST_DENIED:
        case LIBSSH2_ERROR_CHANNEL_UNKNOWN:
        case LIBSSH2_ERROR_CHANNEL_WINDOW_EXCEEDED:
        case LIBSSH2_ERROR_CHANNEL_PACKET_EXCEEDED:
        case LIBSSH2_ERROR_CHANNEL_CLOSED:
        case LIBSSH2_ERROR_CHANNEL_EOF_SENT:
            return false;
        default:
            return true;
    }
}

ssize_t SessionManager::read(const ExecChannel& ch, char* buf, size_t len, bool from_stderr) {
    std::lock_guard<std::mutex> lock(*io_mutex_);
    if (!live(ch)) return LIBSSH2_ERROR_SOCKET_DISCONNECT;
    ssize_t n = from_stderr ? libssh2_channel_read_stderr(ch.channel, buf, len)
                            : libssh2_channel_read(ch.channel, buf, len);
    // A dead transport is dropped now so the next command reconnects
    if (is_transport_error(n)) {
        logtap_log(fmt::format("ssh: read on {} failed ({}), dropping session", target_str_, n));
        teardown("Transport error");
    }
    return n;
}

bool SessionManager::eof(const ExecChannel& ch) {
    std::lock_guard<std::mutex> lock(*io_mutex_);
    if (!live(ch)) return true;
    int rc = libssh2_channel_eof(ch.channel);
    if (rc < 0 && is_transport_error(rc)) {
        teardown("Transport error");
        return true;
    }
    return rc > 0;
}

void SessionManager::send_keepalive() {
    if (!active_ || !session_) return;
    int seconds_to_next = 0;
    int rc = libssh2_keepalive_send(session_, &seconds_to_next);
    if (is_transport_error(rc)) {
        logtap_log(fmt::format("ssh: keepalive to {} failed ({}), dropping session", target_str_, rc));
        teardown("Keepalive failed");
    }
}

bool SessionManager::check_alive() {
    std::lock_guard<std::mutex> lock(*io_mutex_);
    if (!active_ || !session_ || sock_ < 0) return false;

    send_keepalive();
    if (!active_) return false;

    int revents = platform::poll_socket(sock_, POLLIN, 0);
    if (revents & (POLLERR | POLLHUP | POLLNVAL)) {
        teardown("Socket closed");
        return false;
    }
    return true;
}

void SessionManager::wait_socket(int timeout_ms) {
    int sock;
    {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        // libssh2 only sends keepalives when asked; it skips the send until
        // the configured interval has passed
        send_keepalive();
        sock = sock_;
    }
    if (sock < 0) {
        platform::sleep_ms(timeout_ms);
        return;
    }
    platform::poll_socket(sock, POLLIN, timeout_ms);
}

int SessionManager::close_channel(ExecChannel& ch) {
    std::lock_guard<std::mutex> lock(*io_mutex_);
    int exit_status = -1;
    if (live(ch)) {
        int rc;
        while ((rc = libssh2_channel_close(ch.channel)) == LIBSSH2_ERROR_EAGAIN) {
            platform::poll_socket(sock_, POLLIN | POLLOUT, SSH_EAGAIN_SLEEP_MS);
        }
        if (rc == 0) exit_status = libssh2_channel_get_exit_status(ch.channel);
        libssh2_channel_free(ch.channel);
    }
    // Channels of a torn-down session were freed with it
    ch.channel = nullptr;
    return exit_status;
}

void SessionManager::teardown(const char* reason) {
    active_ = false;
    generation_++;
    if (session_) {
        libssh2_session_disconnect(session_, reason);
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ >= 0) {
        platform::close_socket(sock_);
        sock_ = -1;
    }
}

void SessionManager::close() {
    std::lock_guard<std::mutex> lock(*io_mutex_);
    teardown("Normal disconnection");
}

bool SessionManager::is_active() const {
    std::lock_guard<std::mutex> lock(*io_mutex_);
    return active_;
}
