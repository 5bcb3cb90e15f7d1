#include "../base_cli.hpp"
#include "../theme.hpp"
#include <log/conversation_log.hpp>
#include <service/rally_service.hpp>
#include <iostream>
#include <ctime>

static int do_init_log(BaseCLI& cli, const std::vector<std::string>& args) {
    auto cmd = parse_init_log(args);
    if (cmd.is_err()) return cli.fail(cmd);

    auto config = cli.load_config(cmd.value.location);
    if (config.is_err()) return cli.fail(config);

    auto path = create_log(config.value.logs_dir(), config.value.template_path(),
                           cmd.value.log, std::time(nullptr));
    if (path.is_err()) return cli.fail(path);

    std::cerr << theme::ok("Log file created: " + path.value.string());

    YAML::Node doc = success_doc();
    doc["log_path"] = path.value.string();
    doc["message"] = "Log file created: " + path.value.string();
    print_doc(doc);
    return EXIT_OK;
}

static int do_get_session(BaseCLI& cli, const std::vector<std::string>& args) {
    auto log = parse_get_session(args);
    if (log.is_err()) return cli.fail(log);

    auto config = cli.load_config();
    if (config.is_err()) return cli.fail(config);

    RallyService service(config.value);
    auto info = service.get_session(log.value);
    if (info.is_err()) return cli.fail(info);

    YAML::Node doc = success_doc();
    doc["session_id"] = info.value.session_id;
    if (info.value.working_dir.empty()) {
        doc["cd"] = YAML::Null;
    } else {
        doc["cd"] = info.value.working_dir;
    }
    if (info.value.isolation.empty()) {
        doc["sandbox"] = YAML::Null;
    } else {
        doc["sandbox"] = info.value.isolation;
    }
    doc["rally"] = info.value.rally;
    doc["pending"] = info.value.pending;
    print_doc(doc);
    return EXIT_OK;
}

void register_log_commands(BaseCLI& cli) {
    cli.add_command("init-log", do_init_log,
                    "--topic <t> [--purpose <p>] [--cd <dir>] [--sandbox <s>] [--ref a,b]",
                    "Create a conversation log from the template");
    cli.add_command("get-session", do_get_session, "--log <path>",
                    "Show the session id, working dir and sandbox of a log");
}
