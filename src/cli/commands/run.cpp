#include "../base_cli.hpp"
#include "../theme.hpp"
#include <service/rally_service.hpp>
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <iostream>
#include <fmt/format.h>

// Shared tail of run / continue: session id on stderr, structured result
// after the streamed output, child's exit code as ours.
static int finish(BaseCLI& cli, const RunOutcome& outcome, const std::string& started) {
    cli.status(fmt::format("Assistant finished in {} (exit {})",
                           format_duration(started), outcome.exit_code));
    for (const auto& w : outcome.warnings) cli.warn(w);
    if (outcome.session_id) {
        std::cerr << "SESSION_ID=" << *outcome.session_id << std::endl;
    }

    YAML::Node doc;
    doc["success"] = outcome.exit_code == 0;
    doc["exit_code"] = outcome.exit_code;
    doc["rally"] = outcome.rally;
    if (outcome.session_id) {
        doc["session_id"] = *outcome.session_id;
    } else {
        doc["session_id"] = YAML::Null;
    }
    doc["log_updated"] = outcome.log_updated;
    print_doc(doc, true);
    return outcome.exit_code;
}

static StatusCallback status_to(BaseCLI& cli) {
    return [&cli](const std::string& msg) { cli.status(msg); };
}

static int do_run(BaseCLI& cli, const std::vector<std::string>& args) {
    auto req = parse_run(args);
    if (req.is_err()) return cli.fail(req);

    auto config = cli.load_config();
    if (config.is_err()) return cli.fail(config);

    RallyService service(config.value, status_to(cli));
    std::string started = now_iso();
    auto outcome = service.run(req.value);
    if (outcome.is_err()) return cli.fail(outcome, true);

    // Batch output was already streamed; the PTY reply is printed here
    if (req.value.search) std::cout << outcome.value.output << std::endl;
    return finish(cli, outcome.value, started);
}

static int do_continue(BaseCLI& cli, const std::vector<std::string>& args) {
    auto req = parse_continue(args);
    if (req.is_err()) return cli.fail(req);

    auto config = cli.load_config();
    if (config.is_err()) return cli.fail(config);

    RallyService service(config.value, status_to(cli));
    std::string started = now_iso();
    auto outcome = service.resume(req.value);
    if (outcome.is_err()) return cli.fail(outcome, true);
    return finish(cli, outcome.value, started);
}

void register_run_commands(BaseCLI& cli) {
    cli.add_command("run", do_run,
                    "--mode <m> --log <path> [--cd <dir>] [--search] [--update-log] "
                    "[--reasoning-effort <e>] [--timeout <ms>] <prompt>",
                    "Run one assistant turn against a log");
    cli.add_command("continue", do_continue,
                    "--log <path> [--reasoning-effort <e>] [--timeout <ms>] <prompt>",
                    "Resume a discussion from its log and record the new turn");
}
