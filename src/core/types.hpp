#pragma once

#include <string>
#include <optional>
#include <functional>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Prefix an error with the operation that produced it: "getting pods: <err>".
inline std::string wrap_error(const std::string& context, const std::string& err) {
    if (err.empty()) return context;
    return context + ": " + err;
}

// Configuration structures
struct KubectlConfig {
    std::string path = "kubectl";
    std::string context;
    std::string kubeconfig;
    int timeout = 30;                            // seconds, non-streaming commands
};

struct BastionConfig {
    std::string host;
    int port = 22;
    std::string user;
    std::optional<std::string> password;
    std::optional<std::string> ssh_key_path;
    int timeout = 30;
};

struct StreamConfig {
    int retry_limit = 5;
    int retry_delay_ms = 1000;
    int ready_timeout = 600;                     // seconds
    int ready_poll_ms = 1000;
};

struct LogConfig {
    std::string path;                            // "" = temp file, "-" = stderr
    bool verbose = false;
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
