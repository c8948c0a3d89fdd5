#pragma once

#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <thread>
#include <vector>
#include <core/cancel_token.hpp>
#include <core/config.hpp>
#include <core/types.hpp>
#include <cluster/cluster_client.hpp>
#include <managers/log_aggregator.hpp>

struct CliOptions {
    std::string image;
    std::optional<std::filesystem::path> config_path;
    std::optional<std::string> context;
    std::optional<int> retries;
    std::optional<int> retry_delay_ms;
    bool verbose = false;
    bool show_help = false;
    bool show_version = false;
};

// Parse argv (without the program name).
Result<CliOptions> parse_args(const std::vector<std::string>& args);

// Reads mute/unmute/status/quit commands from a file descriptor (stdin)
// on a background thread.
class ControlLoop {
public:
    ControlLoop(Muter& muter, CancelToken& cancel, std::ostream& status_out, int fd = 0);
    ~ControlLoop();

    void start();
    void stop();

    // Apply one command line. Returns false for an unknown command.
    bool handle_command(const std::string& line);

private:
    void loop();

    Muter& muter_;
    CancelToken& cancel_;
    std::ostream& status_out_;
    int fd_;
    std::atomic<bool> running_{false};
    std::thread thread_;
};

class LogtapCLI {
public:
    explicit LogtapCLI(CliOptions opts);

    // Returns the process exit code
    int run();

    static void print_usage(std::ostream& out);

private:
    Result<Config> load_config() const;
    // Runners abort in-flight kubectl commands once `cancel` fires
    std::unique_ptr<ClusterClient> make_client(const Config& config,
                                               const CancelToken* cancel) const;
    static AggregatorOptions aggregator_options(const Config& config);

    CliOptions opts_;
};
