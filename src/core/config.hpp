#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load ~/.logtap/config.yaml; defaults if the file does not exist
    static Result<Config> load_default();

    // Load an explicit config file; it must exist
    static Result<Config> load_file(const fs::path& path);

    // Explicit path if given, otherwise the default location
    static Result<Config> load(const std::optional<fs::path>& path = std::nullopt);

    // Accessors
    const KubectlConfig& kubectl() const { return kubectl_; }
    const std::optional<BastionConfig>& bastion() const { return bastion_; }
    const StreamConfig& stream() const { return stream_; }
    const LogConfig& log() const { return log_; }

    // Command-line overrides
    void set_context(const std::string& context) { kubectl_.context = context; }
    void set_retry_limit(int n) { stream_.retry_limit = n; }
    void set_retry_delay_ms(int ms) { stream_.retry_delay_ms = ms; }
    void set_verbose(bool v) { log_.verbose = v; }

    // Checks value ranges; load_* already call this
    Result<void> validate() const;

    Config() = default;

private:
    KubectlConfig kubectl_;
    std::optional<BastionConfig> bastion_;
    StreamConfig stream_;
    LogConfig log_;
};

fs::path get_global_config_dir();
fs::path get_global_config_path();
