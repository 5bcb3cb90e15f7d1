#include "config.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <limits>

namespace fs = std::filesystem;

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

fs::path get_global_config_dir() {
    return platform::home_dir() / ".rally";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

fs::path default_logs_dir() {
    return get_global_config_dir() / "logs";
}

Result<void> create_default_global_config() {
    fs::path config_path = get_global_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    std::error_code ec;
    fs::create_directories(config_path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err(ErrorCode::IoError,
            fmt::format("Failed to create {}: {}", config_path.parent_path().string(), ec.message()));
    }

    const char* default_config = R"(# rally configuration
# Every key is optional; missing keys use the values shown here.

logs_dir: "~/.rally/logs"      # RALLY_LOGS_DIR overrides this
template: ""                   # empty: <logs_dir>/_TEMPLATE.md

# Assistant CLI, launched as: <runner> --yes <package> ...
runner: "npx"
package: "@openai/codex"

timeouts:
  run_ms: 600000               # batch wall-clock limit
  idle_ms: 30000               # PTY reply is complete after this much silence
  poll_ms: 1000
  kill_grace_ms: 5000          # SIGTERM -> SIGKILL

pty:
  cols: 120
  rows: 30
  startup_wait_ms: 8000
  spawn_grace_ms: 2000

preflight:
  min_node: "22.0.0"
  cache_ttl_hours: 24
)";

    try {
        std::ofstream out(config_path);
        if (!out) {
            return Result<void>::Err(ErrorCode::IoError,
                "Failed to create config file at " + config_path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err(ErrorCode::IoError,
            "Failed to write config file: " + std::string(e.what()));
    }
}

Config::Config() : logs_dir_(default_logs_dir()) {}

fs::path Config::template_path() const {
    if (template_path_) return *template_path_;
    return logs_dir_ / "_TEMPLATE.md";
}

void Config::apply_env_overrides() {
    const char* env = std::getenv("RALLY_LOGS_DIR");
    if (env && *env) {
        logs_dir_ = platform::expand_home(env);
    }
}

static TimeoutConfig parse_timeouts(const YAML::Node& node) {
    TimeoutConfig t;
    t.run_ms = node["run_ms"].as<int>(DEFAULT_RUN_TIMEOUT_MS);
    t.idle_ms = node["idle_ms"].as<int>(DEFAULT_IDLE_TIMEOUT_MS);
    t.poll_ms = node["poll_ms"].as<int>(DEFAULT_POLL_INTERVAL_MS);
    t.kill_grace_ms = node["kill_grace_ms"].as<int>(KILL_GRACE_MS);
    return t;
}

static PtyConfig parse_pty(const YAML::Node& node) {
    PtyConfig p;
    p.cols = node["cols"].as<int>(PTY_COLS);
    p.rows = node["rows"].as<int>(PTY_ROWS);
    p.startup_wait_ms = node["startup_wait_ms"].as<int>(PTY_STARTUP_WAIT_MS);
    p.spawn_grace_ms = node["spawn_grace_ms"].as<int>(PTY_SPAWN_GRACE_MS);
    return p;
}

static PreflightConfig parse_preflight(const YAML::Node& node) {
    PreflightConfig p;
    p.min_node = node["min_node"].as<std::string>(MIN_NODE_VERSION);
    p.cache_ttl_hours = node["cache_ttl_hours"].as<int>(PREFLIGHT_CACHE_TTL_HOURS);
    return p;
}

// Numeric settings must lie in [min, max]; cols/rows end up in a winsize.
static Result<void> check_range(const char* key, int value, int min, int max) {
    if (value >= min && value <= max) return Result<void>::Ok();
    return Result<void>::Err(ErrorCode::InvalidArgument,
        fmt::format("Invalid config value {}: {} (expected {}..{})", key, value, min, max));
}

static Result<void> check_ranges(const TimeoutConfig& t, const PtyConfig& p,
                                 const PreflightConfig& pf) {
    struct Bound { const char* key; int value; int min; int max; };
    const int NO_MAX = std::numeric_limits<int>::max();
    const Bound bounds[] = {
        {"timeouts.run_ms", t.run_ms, 1, NO_MAX},
        {"timeouts.idle_ms", t.idle_ms, 1, NO_MAX},
        {"timeouts.poll_ms", t.poll_ms, 1, NO_MAX},
        {"timeouts.kill_grace_ms", t.kill_grace_ms, 0, NO_MAX},
        {"pty.cols", p.cols, 1, 65535},
        {"pty.rows", p.rows, 1, 65535},
        {"pty.startup_wait_ms", p.startup_wait_ms, 0, NO_MAX},
        {"pty.spawn_grace_ms", p.spawn_grace_ms, 0, NO_MAX},
        {"preflight.cache_ttl_hours", pf.cache_ttl_hours, 1, NO_MAX},
    };
    for (const auto& b : bounds) {
        auto r = check_range(b.key, b.value, b.min, b.max);
        if (r.is_err()) return r;
    }
    return Result<void>::Ok();
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);

        Config config;
        if (!root || root.IsNull()) {
            config.apply_env_overrides();
            return Result<Config>::Ok(config);
        }
        if (!root.IsMap()) {
            return Result<Config>::Err(ErrorCode::IoError,
                "Failed to parse config: top level must be a mapping");
        }

        std::string logs = root["logs_dir"].as<std::string>("");
        if (!logs.empty()) config.logs_dir_ = platform::expand_home(logs);

        std::string tmpl = root["template"].as<std::string>("");
        if (!tmpl.empty()) config.template_path_ = platform::expand_home(tmpl);

        config.assistant_.runner = root["runner"].as<std::string>(DEFAULT_RUNNER);
        config.assistant_.package = root["package"].as<std::string>(DEFAULT_PACKAGE);

        config.timeouts_ = parse_timeouts(root["timeouts"] ? root["timeouts"] : YAML::Node());
        config.pty_ = parse_pty(root["pty"] ? root["pty"] : YAML::Node());
        config.preflight_ = parse_preflight(root["preflight"] ? root["preflight"] : YAML::Node());

        auto ranges = check_ranges(config.timeouts_, config.pty_, config.preflight_);
        if (ranges.is_err()) return Result<Config>::Err(ranges);

        config.apply_env_overrides();
        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(ErrorCode::IoError,
            std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load_from(const fs::path& path) {
    if (!fs::exists(path)) {
        Config config;
        config.apply_env_overrides();
        return Result<Config>::Ok(config);
    }

    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err(ErrorCode::IoError, "Cannot read " + path.string());
    }
    std::stringstream ss;
    ss << in.rdbuf();

    auto result = parse(ss.str());
    if (result.is_err()) {
        result.error = fmt::format("{} ({})", result.error, path.string());
    }
    return result;
}

Result<Config> Config::load() {
    return load_from(get_global_config_path());
}
