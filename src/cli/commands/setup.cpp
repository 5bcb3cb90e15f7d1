#include "../base_cli.hpp"
#include "../preflight.hpp"
#include "../theme.hpp"
#include <log/log_template.hpp>
#include <iostream>
#include <fmt/format.h>

static int do_setup(BaseCLI& cli, const std::vector<std::string>& args) {
    auto location = parse_location(args);
    if (location.is_err()) return cli.fail(location);

    bool had_config = global_config_exists();
    auto wrote_config = create_default_global_config();
    if (wrote_config.is_err()) return cli.fail(wrote_config);

    auto config = cli.load_config(location.value);
    if (config.is_err()) return cli.fail(config);

    std::error_code ec;
    fs::create_directories(config.value.logs_dir(), ec);
    if (ec) {
        return cli.fail(fmt::format("Failed to create {}: {}",
                                    config.value.logs_dir().string(), ec.message()),
                        ErrorCode::IoError);
    }

    auto tmpl = install_default_template(config.value.template_path());
    if (tmpl.is_err()) return cli.fail(tmpl);

    std::cerr << (had_config ? theme::info("Config kept: " + get_global_config_path().string())
                             : theme::ok("Config written: " + get_global_config_path().string()));
    std::cerr << theme::ok("Logs:   " + config.value.logs_dir().string());
    std::cerr << (tmpl.value ? theme::ok("Template written: " + config.value.template_path().string())
                             : theme::info("Template kept: " + config.value.template_path().string()));

    YAML::Node doc = success_doc();
    doc["config_path"] = get_global_config_path().string();
    doc["config_created"] = !had_config;
    doc["logs_dir"] = config.value.logs_dir().string();
    doc["template"] = config.value.template_path().string();
    doc["template_created"] = tmpl.value;
    print_doc(doc);
    return EXIT_OK;
}

static YAML::Node check_node(bool ok, const std::optional<std::string>& version) {
    YAML::Node node;
    node["ok"] = ok;
    if (version) {
        node["version"] = *version;
    } else {
        node["version"] = YAML::Null;
    }
    return node;
}

static int do_preflight(BaseCLI& cli, const std::vector<std::string>& args) {
    auto location = parse_location(args);
    if (location.is_err()) return cli.fail(location);

    auto config = cli.load_config(location.value);
    if (config.is_err()) return cli.fail(config);

    cli.status("Checking node, npx and the assistant CLI");
    PreflightReport report = run_preflight(config.value);

    YAML::Node doc;
    doc["success"] = report.success;
    doc["cached"] = report.cached;
    YAML::Node checks;
    checks["node"] = check_node(report.node_ok, report.versions.node);
    checks["npx"] = check_node(report.npx_ok, report.versions.npx);
    checks["assistant"] = check_node(report.assistant_ok, report.versions.assistant);
    doc["checks"] = checks;

    if (!report.success) {
        std::cerr << theme::fail(report.error);
        doc["error"] = report.error;
        doc["kind"] = error_code_name(ErrorCode::NotFound);
        print_doc(doc);
        return EXIT_RECOVERABLE;
    }

    std::cerr << theme::ok(fmt::format("node {}, npx {}, assistant {}{}",
                                       report.versions.node.value_or("?"),
                                       report.versions.npx.value_or("?"),
                                       report.versions.assistant.value_or("?"),
                                       report.cached ? " (cached)" : ""));
    print_doc(doc);
    return EXIT_OK;
}

void register_setup_commands(BaseCLI& cli) {
    cli.add_command("setup", do_setup, "[--logs-dir <dir>] [--template <file>]",
                    "Write default config and log template (never overwrites)");
    cli.add_command("preflight", do_preflight, "[--logs-dir <dir>]",
                    "Check node, npx and assistant CLI versions");
}
