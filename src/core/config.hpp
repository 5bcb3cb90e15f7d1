#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load ~/.rally/config.yaml. A missing file yields defaults.
    static Result<Config> load();

    // Load a specific file. A missing file yields defaults.
    static Result<Config> load_from(const fs::path& path);

    // Parse YAML text. Used by load_from and by tests.
    static Result<Config> parse(const std::string& yaml_text);

    // Accessors
    const fs::path& logs_dir() const { return logs_dir_; }
    fs::path template_path() const;
    const AssistantConfig& assistant() const { return assistant_; }
    const TimeoutConfig& timeouts() const { return timeouts_; }
    const PtyConfig& pty() const { return pty_; }
    const PreflightConfig& preflight() const { return preflight_; }

    // Per-run overrides from the command line
    void set_logs_dir(const fs::path& dir) { logs_dir_ = dir; }
    void set_template_path(const fs::path& path) { template_path_ = path; }

public:
    Config();

private:
    // RALLY_LOGS_DIR wins over the file.
    void apply_env_overrides();

    fs::path logs_dir_;
    std::optional<fs::path> template_path_;
    AssistantConfig assistant_;
    TimeoutConfig timeouts_;
    PtyConfig pty_;
    PreflightConfig preflight_;
};

bool global_config_exists();

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();
fs::path default_logs_dir();

// Create default global config (never overwrites)
Result<void> create_default_global_config();
