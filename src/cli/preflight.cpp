#include "preflight.hpp"
#include <core/config.hpp>
#include <core/utils.hpp>
#include <core/debug_log.hpp>
#include <runner/batch_runner.hpp>
#include <util/string_utils.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>

std::string normalize_version(const std::string& raw) {
    std::string v = StringUtils::trim(raw);
    if (!v.empty() && (v[0] == 'v' || v[0] == 'V')) v.erase(0, 1);
    return v;
}

std::optional<std::string> probe_version(const std::string& program,
                                         const std::vector<std::string>& args) {
    BatchOptions opts;
    opts.timeout_ms = VERSION_PROBE_TIMEOUT_MS;
    opts.grace_ms = 1000;
    opts.echo = false;

    auto result = BatchRunner(opts).run(program, args);
    if (result.is_err()) {
        rally_log(fmt::format("preflight: {} failed: {}", program, result.error));
        return std::nullopt;
    }
    if (result.value.exit_code != 0) return std::nullopt;

    std::string v = normalize_version(result.value.output);
    if (v.empty()) return std::nullopt;
    return v;
}

ToolVersions discover_versions(const Config& config, const VersionProbe& probe) {
    const auto& cli = config.assistant();
    ToolVersions v;
    v.node = probe("node", {"-v"});
    v.npx = probe("npx", {"-v"});
    v.assistant = probe(cli.runner, {"--yes", cli.package, "--version"});
    return v;
}

// ── Cache ────────────────────────────────────────────────────

static std::optional<std::string> optional_string(const YAML::Node& node) {
    if (!node || node.IsNull()) return std::nullopt;
    std::string s = node.as<std::string>("");
    if (s.empty()) return std::nullopt;
    return s;
}

std::optional<PreflightCache> load_preflight_cache(const fs::path& path) {
    if (!fs::exists(path)) return std::nullopt;

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        if (!root.IsMap() || !root["versions"]) return std::nullopt;

        PreflightCache cache;
        cache.checked_at = parse_iso_time(root["checked_at"].as<std::string>(""));
        if (cache.checked_at == 0) return std::nullopt;

        YAML::Node v = root["versions"];
        cache.versions.node = optional_string(v["node"]);
        cache.versions.npx = optional_string(v["npx"]);
        cache.versions.assistant = optional_string(v["assistant"]);
        return cache;
    } catch (const std::exception& e) {
        // Corrupted cache file: check again from scratch
        rally_log(std::string("preflight: ignoring cache: ") + e.what());
        return std::nullopt;
    }
}

Result<void> save_preflight_cache(const fs::path& path, const PreflightCache& cache) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err(ErrorCode::IoError,
            fmt::format("Failed to create {}: {}", path.parent_path().string(), ec.message()));
    }

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "checked_at" << YAML::Value << iso_time(cache.checked_at);
    out << YAML::Key << "versions" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "node" << YAML::Value << cache.versions.node.value_or("");
    out << YAML::Key << "npx" << YAML::Value << cache.versions.npx.value_or("");
    out << YAML::Key << "assistant" << YAML::Value << cache.versions.assistant.value_or("");
    out << YAML::EndMap;
    out << YAML::EndMap;

    std::ofstream fout(path.string());
    if (!fout) {
        return Result<void>::Err(ErrorCode::IoError, "Cannot write " + path.string());
    }
    fout << out.c_str() << "\n";
    return Result<void>::Ok();
}

// ── Preflight ────────────────────────────────────────────────

PreflightReport run_preflight(const Config& config, const VersionProbe& probe, std::time_t now) {
    fs::path cache_path = config.logs_dir() / PREFLIGHT_CACHE_FILE;

    PreflightReport report;
    report.versions = discover_versions(config, probe);
    report.node_ok = report.versions.node &&
                     compare_versions(*report.versions.node, config.preflight().min_node) >= 0;
    report.npx_ok = report.versions.npx.has_value();
    report.assistant_ok = report.versions.assistant.has_value();
    report.success = report.node_ok && report.npx_ok && report.assistant_ok;

    auto cached = load_preflight_cache(cache_path);
    if (cached && report.success) {
        double age = std::difftime(now, cached->checked_at);
        double ttl = static_cast<double>(config.preflight().cache_ttl_hours) * 3600.0;
        if (age >= 0 && age < ttl && cached->versions == report.versions) {
            report.cached = true;
            return report;
        }
    }

    if (!report.node_ok) {
        report.error = fmt::format("Node.js {} or newer required, found {}",
                                   config.preflight().min_node,
                                   report.versions.node.value_or("not installed"));
    } else if (!report.npx_ok) {
        report.error = "npx not found";
    } else if (!report.assistant_ok) {
        report.error = fmt::format("Assistant CLI not found. Run: npm install -g {}",
                                   config.assistant().package);
    }

    if (report.success) {
        auto saved = save_preflight_cache(cache_path, PreflightCache{now, report.versions});
        if (saved.is_err()) rally_log("preflight: " + saved.error);
    }
    return report;
}
