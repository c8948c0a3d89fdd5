#include "config.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>

namespace fs = std::filesystem;

fs::path get_global_config_dir() {
    return platform::home_dir() / CONFIG_DIR_NAME;
}

fs::path get_global_config_path() {
    return get_global_config_dir() / CONFIG_FILE_NAME;
}

static KubectlConfig parse_kubectl_config(const YAML::Node& node) {
    KubectlConfig kc;
    kc.path = node["path"].as<std::string>("kubectl");
    kc.context = node["context"].as<std::string>("");
    kc.kubeconfig = node["kubeconfig"].as<std::string>("");
    kc.timeout = node["timeout"].as<int>(KUBECTL_CMD_TIMEOUT_SECS);
    return kc;
}

static BastionConfig parse_bastion_config(const YAML::Node& node) {
    BastionConfig b;
    b.host = node["host"].as<std::string>("");
    b.port = node["port"].as<int>(22);
    b.user = node["user"].as<std::string>("");
    b.timeout = node["timeout"].as<int>(SSH_CONNECT_TIMEOUT_SECS);

    if (node["password"] && !node["password"].as<std::string>("").empty()) {
        b.password = node["password"].as<std::string>();
    }
    if (node["ssh_key_path"] && !node["ssh_key_path"].as<std::string>("").empty()) {
        b.ssh_key_path = node["ssh_key_path"].as<std::string>();
    }
    return b;
}

static StreamConfig parse_stream_config(const YAML::Node& node) {
    StreamConfig s;
    s.retry_limit = node["retry_limit"].as<int>(DEFAULT_RETRY_LIMIT);
    s.retry_delay_ms = node["retry_delay_ms"].as<int>(DEFAULT_RETRY_DELAY_MS);
    s.ready_timeout = node["ready_timeout"].as<int>(READY_TIMEOUT_SECS);
    s.ready_poll_ms = node["ready_poll_ms"].as<int>(READY_POLL_MS);
    return s;
}

static LogConfig parse_log_config(const YAML::Node& node) {
    LogConfig l;
    l.path = node["path"].as<std::string>("");
    l.verbose = node["verbose"].as<bool>(false);
    return l;
}

Result<void> Config::validate() const {
    if (stream_.retry_limit < 1) {
        return Result<void>::Err(fmt::format("stream.retry_limit must be at least 1 (got {})",
                                             stream_.retry_limit));
    }
    if (stream_.retry_delay_ms < 0) {
        return Result<void>::Err("stream.retry_delay_ms must not be negative");
    }
    if (stream_.ready_timeout < 0 || stream_.ready_poll_ms < 0) {
        return Result<void>::Err("stream.ready_timeout and stream.ready_poll_ms must not be negative");
    }
    if (kubectl_.timeout < 0) {
        return Result<void>::Err("kubectl.timeout must not be negative");
    }
    if (kubectl_.path.empty()) {
        return Result<void>::Err("kubectl.path must not be empty");
    }
    if (bastion_) {
        if (bastion_->host.empty() || bastion_->user.empty()) {
            return Result<void>::Err("bastion requires both host and user");
        }
        if (bastion_->port <= 0 || bastion_->port > 65535) {
            return Result<void>::Err(fmt::format("bastion.port out of range: {}", bastion_->port));
        }
    }
    return Result<void>::Ok();
}

Result<Config> Config::load_file(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err("Config not found at " + path.string());
    }

    Config config;
    try {
        YAML::Node root = YAML::LoadFile(path.string());

        config.kubectl_ = parse_kubectl_config(root["kubectl"] ? root["kubectl"] : YAML::Node());
        config.stream_ = parse_stream_config(root["stream"] ? root["stream"] : YAML::Node());
        config.log_ = parse_log_config(root["log"] ? root["log"] : YAML::Node());

        // An empty bastion block means "run kubectl locally"
        if (root["bastion"] && root["bastion"].IsMap()) {
            auto bastion = parse_bastion_config(root["bastion"]);
            if (!bastion.host.empty()) config.bastion_ = bastion;
        }
    } catch (const std::exception& e) {
        return Result<Config>::Err(fmt::format("Failed to parse config {}: {}", path.string(), e.what()));
    }

    auto valid = config.validate();
    if (valid.is_err()) {
        return Result<Config>::Err(fmt::format("Invalid config {}: {}", path.string(), valid.error));
    }
    return Result<Config>::Ok(config);
}

Result<Config> Config::load_default() {
    fs::path path = get_global_config_path();
    if (!fs::exists(path)) return Result<Config>::Ok(Config());
    return load_file(path);
}

Result<Config> Config::load(const std::optional<fs::path>& path) {
    if (path) return load_file(*path);
    return load_default();
}
