#include "log.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <atomic>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>

static std::mutex g_log_mutex;
static std::string g_log_path;
static std::atomic<bool> g_verbose{false};

static std::string default_log_path() {
    static std::string path = (platform::temp_dir() / DEBUG_LOG_NAME).string();
    return path;
}

std::string logtap_log_path() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    return g_log_path.empty() ? default_log_path() : g_log_path;
}

void set_log_path(const std::string& path) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_path = path;
}

void set_log_verbose(bool verbose) {
    g_verbose.store(verbose);
}

bool log_verbose() {
    return g_verbose.load();
}

static std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    return fmt::format("{:02}:{:02}:{:02}.{:03}",
                       tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                       static_cast<int>(ms.count()));
}

static void write_line(const char* level, const std::string& msg) {
    std::string line = fmt::format("[{}] {} {}\n", timestamp(), level, msg);

    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_path == "-") {
        std::cerr << line << std::flush;
        return;
    }
    std::ofstream out(g_log_path.empty() ? default_log_path() : g_log_path,
                      std::ios::app);
    if (!out) return;
    out << line;
}

void logtap_log(const std::string& msg) {
    write_line("INFO", msg);
}

void logtap_debug(const std::string& msg) {
    if (!g_verbose.load()) return;
    write_line("DEBUG", msg);
}
