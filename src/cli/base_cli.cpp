#include "base_cli.hpp"
#include "theme.hpp"
#include <core/debug_log.hpp>
#include <iostream>
#include <fmt/format.h>

int exit_code_for(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:
            return EXIT_OK;
        case ErrorCode::SpawnError:
        case ErrorCode::TemplateMissing:
        case ErrorCode::IoError:
            return EXIT_FATAL;
        case ErrorCode::Interrupted:
            return EXIT_INTERRUPTED;
        case ErrorCode::Timeout:
        case ErrorCode::InvalidMode:
        case ErrorCode::InvalidReasoningEffort:
        case ErrorCode::IncompatibleOption:
        case ErrorCode::MissingWorkingDirectory:
        case ErrorCode::MissingArgument:
        case ErrorCode::InvalidArgument:
        case ErrorCode::NotFound:
        case ErrorCode::MalformedHeader:
        case ErrorCode::NoPendingRequest:
            return EXIT_RECOVERABLE;
    }
    return EXIT_RECOVERABLE;
}

YAML::Node success_doc() {
    YAML::Node doc;
    doc["success"] = true;
    return doc;
}

YAML::Node failure_doc(const std::string& message, ErrorCode code) {
    YAML::Node doc;
    doc["success"] = false;
    doc["error"] = message;
    doc["kind"] = error_code_name(code);
    return doc;
}

void print_doc(const YAML::Node& doc, bool separate) {
    YAML::Emitter out;
    out << doc;
    if (separate) std::cout << "---\n";
    std::cout << out.c_str() << std::endl;
}

void BaseCLI::add_command(const std::string& name,
                          CommandHandler handler,
                          const std::string& usage,
                          const std::string& help) {
    if (!commands_.count(name)) order_.push_back(name);
    commands_[name] = {std::move(handler), usage, help};
}

int BaseCLI::execute_command(const std::string& command, const std::vector<std::string>& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        return fail(fmt::format("Unknown subcommand: {}. Use --help for usage", command),
                    ErrorCode::InvalidArgument);
    }

    rally_log(fmt::format("cli: {} ({} args)", command, args.size()));
    try {
        return it->second.handler(*this, args);
    } catch (const std::exception& e) {
        return fail(std::string(e.what()), ErrorCode::IoError);
    }
}

void BaseCLI::print_help() const {
    std::cerr << theme::section("Commands");
    for (const auto& name : order_) {
        const auto& cmd = commands_.at(name);
        std::cerr << theme::kv(name, cmd.help);
        if (!cmd.usage.empty()) {
            std::cerr << theme::dim(fmt::format("      rally {} {}", name, cmd.usage)) << "\n";
        }
    }
    std::cerr << "\n";
}

Result<Config> BaseCLI::load_config(const LocationOptions& location) const {
    auto config = Config::load();
    if (config.is_err()) return config;
    if (location.logs_dir) config.value.set_logs_dir(*location.logs_dir);
    if (location.template_path) config.value.set_template_path(*location.template_path);
    return config;
}

int BaseCLI::fail(const std::string& message, ErrorCode code, bool separate) const {
    rally_log(fmt::format("cli: failed {}: {}", error_code_name(code), message));
    std::cerr << theme::fail(message);
    print_doc(failure_doc(message, code), separate);
    return exit_code_for(code);
}

void BaseCLI::status(const std::string& msg) const {
    std::cerr << theme::info(msg);
}

void BaseCLI::warn(const std::string& msg) const {
    std::cerr << theme::warn(msg);
}
