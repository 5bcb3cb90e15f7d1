#pragma once

#include <string>
#include <vector>
#include <map>
#include <functional>
#include <optional>
#include <yaml-cpp/yaml.h>
#include <core/config.hpp>
#include "options.hpp"

// Exit code for a failure class: 1 recoverable, 2 fatal, 3 interrupted.
int exit_code_for(ErrorCode code);

// Structured result documents printed on stdout.
YAML::Node success_doc();
YAML::Node failure_doc(const std::string& message, ErrorCode code);

// `separate` starts the document with "---" so it stays parseable after
// streamed assistant output.
void print_doc(const YAML::Node& doc, bool separate = false);

class BaseCLI {
public:
    BaseCLI() = default;
    virtual ~BaseCLI() = default;

    using CommandHandler = std::function<int(BaseCLI&, const std::vector<std::string>&)>;

    void add_command(const std::string& name,
                     CommandHandler handler,
                     const std::string& usage,
                     const std::string& help);

    // Runs a handler and returns its exit code. Exceptions escaping a
    // handler are reported as IoError.
    int execute_command(const std::string& command, const std::vector<std::string>& args);

    void print_help() const;

    // ~/.rally/config.yaml plus command-line overrides.
    Result<Config> load_config(const LocationOptions& location = LocationOptions()) const;

    // Print the failure to stderr and as a structured document, and map it
    // to an exit code.
    int fail(const std::string& message, ErrorCode code, bool separate = false) const;

    template <typename T>
    int fail(const Result<T>& result, bool separate = false) const {
        return fail(result.error, result.code, separate);
    }

    // Progress line on stderr.
    void status(const std::string& msg) const;
    void warn(const std::string& msg) const;

protected:
    struct Command {
        CommandHandler handler;
        std::string usage;
        std::string help;
    };
    std::map<std::string, Command> commands_;
    std::vector<std::string> order_;
};
