#pragma once

#include <string>
#include <vector>
#include <map>
#include <set>
#include <optional>
#include <filesystem>
#include <core/types.hpp>
#include <log/conversation_log.hpp>
#include <service/rally_service.hpp>

namespace fs = std::filesystem;

// Raw split of a subcommand's arguments.
//   --key value | --key=value   option
//   --flag                      boolean flag (only names in `flags`)
//   --                          everything after is positional
struct ParsedArgs {
    std::map<std::string, std::string> options;
    std::set<std::string> flags;
    std::vector<std::string> positional;

    std::optional<std::string> get(const std::string& key) const;
    bool has_flag(const std::string& name) const { return flags.count(name) > 0; }

    // Positional arguments joined with single spaces.
    std::string joined_positional() const;
};

// `flags` names the boolean options; `--search` additionally accepts an
// explicit true/false value. Unknown options fail with InvalidArgument.
Result<ParsedArgs> parse_args(const std::vector<std::string>& args,
                              const std::set<std::string>& options,
                              const std::set<std::string>& flags);

// Strictly positive integer, e.g. --timeout.
Result<int> parse_positive_int(const std::string& name, const std::string& value);

// Options shared by commands that touch the logs directory.
struct LocationOptions {
    std::optional<fs::path> logs_dir;
    std::optional<fs::path> template_path;
};

struct InitLogCommand {
    LogCreateOptions log;
    LocationOptions location;
};

Result<InitLogCommand> parse_init_log(const std::vector<std::string>& args);
Result<RunRequest> parse_run(const std::vector<std::string>& args);
Result<ResumeRequest> parse_continue(const std::vector<std::string>& args);
Result<fs::path> parse_get_session(const std::vector<std::string>& args);
Result<LocationOptions> parse_location(const std::vector<std::string>& args);
