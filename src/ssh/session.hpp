#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <sys/types.h>
#include <core/types.hpp>

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// An exec channel tagged with the session it was opened on. Channels from a
// session that has since been torn down are dead and never touched again.
struct ExecChannel {
    LIBSSH2_CHANNEL* channel = nullptr;
    uint64_t generation = 0;
};

// Authenticated, non-blocking SSH session to the bastion host. Commands run
// on their own exec channels; every libssh2 call is made under io_mutex_.
class SessionManager {
public:
    explicit SessionManager(const BastionConfig& target);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    Result<void> establish(StatusCallback callback = nullptr);
    void close();
    bool is_active() const;

    // Open an exec channel running `command`. The caller releases it with
    // close_channel().
    Result<ExecChannel> exec(const std::string& command);

    // Non-blocking read of stdout (or stderr). Returns bytes read, 0 or
    // LIBSSH2_ERROR_EAGAIN when nothing is buffered, another negative
    // libssh2 code on error.
    ssize_t read(const ExecChannel& ch, char* buf, size_t len, bool from_stderr = false);
    bool eof(const ExecChannel& ch);

    // Send a keepalive if one is due, then block until the socket is
    // readable or timeout_ms passes.
    void wait_socket(int timeout_ms);

    // Keepalive round plus socket check. Drops the session if either fails.
    bool check_alive();

    // True for libssh2 codes that mean the whole session is unusable, as
    // opposed to EAGAIN or an error scoped to one channel.
    static bool is_transport_error(ssize_t rc);

    // Close and free the channel. Returns the remote exit status, or -1 if
    // it is unknown.
    int close_channel(ExecChannel& ch);

    const std::string& get_target() const { return target_str_; }

private:
    BastionConfig target_;
    LIBSSH2_SESSION* session_;
    int sock_;
    bool active_;
    bool lib_initialized_ = false;
    uint64_t generation_ = 0;
    std::string target_str_;
    std::shared_ptr<std::mutex> io_mutex_;

    Result<void> connect_socket(StatusCallback callback);
    Result<void> ssh_userauth(StatusCallback callback);
    void teardown(const char* reason);
    void send_keepalive();      // io_mutex_ held
    bool live(const ExecChannel& ch) const;
};
