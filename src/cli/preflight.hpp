#pragma once

#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <ctime>
#include <filesystem>
#include <core/types.hpp>

class Config;

namespace fs = std::filesystem;

struct ToolVersions {
    std::optional<std::string> node;
    std::optional<std::string> npx;
    std::optional<std::string> assistant;

    bool operator==(const ToolVersions& o) const {
        return node == o.node && npx == o.npx && assistant == o.assistant;
    }
};

struct PreflightReport {
    bool success = false;
    bool cached = false;
    bool node_ok = false;
    bool npx_ok = false;
    bool assistant_ok = false;
    ToolVersions versions;
    std::string error;
};

// Runs `program args...` and returns its trimmed stdout, or nullopt if it
// could not be run, failed, or timed out.
using VersionProbe = std::function<std::optional<std::string>(
    const std::string& program, const std::vector<std::string>& args)>;

// Default probe: BatchRunner without echo, VERSION_PROBE_TIMEOUT_MS limit.
std::optional<std::string> probe_version(const std::string& program,
                                         const std::vector<std::string>& args);

// Trim and drop a leading 'v' ("v22.3.0" -> "22.3.0").
std::string normalize_version(const std::string& raw);

ToolVersions discover_versions(const Config& config, const VersionProbe& probe);

// ── Cache: <logs_dir>/.preflight_ok ──────────────────────────

struct PreflightCache {
    std::time_t checked_at = 0;
    ToolVersions versions;
};

std::optional<PreflightCache> load_preflight_cache(const fs::path& path);
Result<void> save_preflight_cache(const fs::path& path, const PreflightCache& cache);

// Check node / npx / assistant CLI. A cache entry younger than the TTL is
// reused only if every freshly probed version still matches it. Passing
// results refresh the cache.
PreflightReport run_preflight(const Config& config,
                              const VersionProbe& probe = probe_version,
                              std::time_t now = std::time(nullptr));
