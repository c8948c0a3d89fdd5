#include "logtap_cli.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <cluster/kubectl_client.hpp>
#include <cluster/local_runner.hpp>
#include <platform/socket_util.hpp>
#include <ssh/ssh_runner.hpp>
#include <fmt/format.h>
#include <iostream>
#include <unistd.h>
#include <cerrno>

// ── Argument parsing ────────────────────────────────────────

Result<CliOptions> parse_args(const std::vector<std::string>& args) {
    CliOptions opts;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& a = args[i];

        if (a == "--help" || a == "-h") {
            opts.show_help = true;
        } else if (a == "--version") {
            opts.show_version = true;
        } else if (a == "--verbose" || a == "-v") {
            opts.verbose = true;
        } else if (a == "--config" || a == "--context" || a == "--retries" || a == "--retry-delay") {
            if (i + 1 >= args.size()) return Result<CliOptions>::Err("Missing value for " + a);
            const std::string& v = args[++i];

            if (a == "--config") {
                opts.config_path = v;
            } else if (a == "--context") {
                opts.context = v;
            } else {
                int n = safe_stoi(v, -1);
                if (n < 0 || (a == "--retries" && n < 1)) {
                    return Result<CliOptions>::Err(fmt::format("Invalid value for {}: {}", a, v));
                }
                if (a == "--retries") opts.retries = n;
                else opts.retry_delay_ms = n;
            }
        } else if (!a.empty() && a[0] == '-') {
            return Result<CliOptions>::Err("Unknown option: " + a);
        } else if (opts.image.empty()) {
            opts.image = a;
        } else {
            return Result<CliOptions>::Err("Unexpected argument: " + a);
        }
    }

    if (opts.image.empty() && !opts.show_help && !opts.show_version) {
        return Result<CliOptions>::Err("Missing image reference.");
    }
    return Result<CliOptions>::Ok(opts);
}

// ── ControlLoop ─────────────────────────────────────────────

ControlLoop::ControlLoop(Muter& muter, CancelToken& cancel, std::ostream& status_out, int fd)
    : muter_(muter), cancel_(cancel), status_out_(status_out), fd_(fd) {}

ControlLoop::~ControlLoop() {
    stop();
}

void ControlLoop::start() {
    if (running_) return;
    running_ = true;
    thread_ = std::thread(&ControlLoop::loop, this);
}

void ControlLoop::stop() {
    running_ = false;
    if (thread_.joinable()) thread_.join();
}

bool ControlLoop::handle_command(const std::string& raw) {
    std::string line = raw;
    trim(line);
    if (line.empty()) return true;

    if (line == "mute" || line == "m") {
        muter_.mute();
        status_out_ << theme::info("muted") << std::flush;
    } else if (line == "unmute" || line == "u") {
        muter_.unmute();
        status_out_ << theme::info("unmuted") << std::flush;
    } else if (line == "status" || line == "s") {
        status_out_ << theme::info(muter_.is_muted() ? "muted" : "unmuted") << std::flush;
    } else if (line == "quit" || line == "q") {
        status_out_ << theme::step("stopping...") << std::flush;
        cancel_.cancel();
    } else {
        status_out_ << theme::fail("Unknown command: " + line)
                    << theme::step("Commands: mute, unmute, status, quit") << std::flush;
        return false;
    }
    return true;
}

void ControlLoop::loop() {
    std::string pending;
    char buf[256];

    // Poll so stop() can join without waiting for a keypress
    while (running_) {
        int revents = platform::poll_socket(fd_, POLLIN, 200);
        if (revents == 0) continue;

        ssize_t n = ::read(fd_, buf, sizeof(buf));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            // stdin closed: keep streaming, just stop listening
            if (!pending.empty()) handle_command(pending);
            logtap_debug("control: input closed");
            return;
        }

        pending.append(buf, static_cast<size_t>(n));
        size_t nl;
        while ((nl = pending.find('\n')) != std::string::npos) {
            handle_command(pending.substr(0, nl));
            pending.erase(0, nl + 1);
        }
    }
}

// ── LogtapCLI ───────────────────────────────────────────────

LogtapCLI::LogtapCLI(CliOptions opts) : opts_(std::move(opts)) {}

void LogtapCLI::print_usage(std::ostream& out) {
    out << theme::section("Usage");
    out << theme::usage_row("logtap <image>", "Stream logs of the first container running <image>");
    out << "\n";
    out << theme::usage_row("--config <path>", "Config file (default ~/.logtap/config.yaml)");
    out << theme::usage_row("--context <name>", "kubectl context");
    out << theme::usage_row("--retries <n>", "Stream attempts (default 5)");
    out << theme::usage_row("--retry-delay <ms>", "Pause between attempts (default 1000)");
    out << theme::usage_row("--verbose", "Debug diagnostics");
    out << theme::usage_row("--version", "Show version");
    out << theme::section("While streaming");
    out << theme::usage_row("mute | m", "Drop lines until unmuted");
    out << theme::usage_row("unmute | u", "Resume forwarding");
    out << theme::usage_row("status | s", "Show mute state");
    out << theme::usage_row("quit | q", "Stop streaming");
    out << "\n";
}

Result<Config> LogtapCLI::load_config() const {
    auto loaded = Config::load(opts_.config_path);
    if (loaded.is_err()) return loaded;

    Config config = loaded.value;
    if (opts_.context) config.set_context(*opts_.context);
    if (opts_.retries) config.set_retry_limit(*opts_.retries);
    if (opts_.retry_delay_ms) config.set_retry_delay_ms(*opts_.retry_delay_ms);
    if (opts_.verbose) config.set_verbose(true);

    auto valid = config.validate();
    if (valid.is_err()) return Result<Config>::Err(valid.error);
    return Result<Config>::Ok(config);
}

std::unique_ptr<ClusterClient> LogtapCLI::make_client(const Config& config,
                                                      const CancelToken* cancel) const {
    std::shared_ptr<CommandRunner> runner;
    if (config.bastion()) {
        runner = std::make_shared<SshRunner>(*config.bastion(), cancel);
    } else {
        runner = std::make_shared<LocalRunner>(cancel);
    }
    logtap_log("Using kubectl via " + runner->describe());
    return std::make_unique<KubectlClient>(config.kubectl(), runner);
}

AggregatorOptions LogtapCLI::aggregator_options(const Config& config) {
    AggregatorOptions opts;
    opts.retry_limit = config.stream().retry_limit;
    opts.retry_delay = std::chrono::milliseconds(config.stream().retry_delay_ms);

    ReadinessOptions ready;
    ready.poll_interval = std::chrono::milliseconds(config.stream().ready_poll_ms);
    ready.timeout = std::chrono::seconds(config.stream().ready_timeout);
    opts.readiness = make_readiness_check(ready);
    return opts;
}

int LogtapCLI::run() {
    if (opts_.show_help) {
        print_usage(std::cout);
        return 0;
    }
    if (opts_.show_version) {
        std::cout << "logtap version " << LOGTAP_VERSION << "\n";
        return 0;
    }

    auto config = load_config();
    if (config.is_err()) {
        std::cerr << theme::fail(config.error);
        return 1;
    }

    set_log_path(config.value.log().path);
    set_log_verbose(config.value.log().verbose);

    CancelToken cancel;
    auto client = make_client(config.value, &cancel);
    LogAggregator aggregator(std::cout, aggregator_options(config.value));

    std::cerr << theme::step(fmt::format("Streaming logs for {} (diagnostics: {})",
                                         opts_.image, logtap_log_path()));

    ControlLoop control(aggregator, cancel, std::cerr, STDIN_FILENO);
    control.start();
    aggregator.stream_logs(*client, opts_.image, &cancel);
    control.stop();

    return 0;
}
