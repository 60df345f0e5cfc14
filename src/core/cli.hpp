#pragma once

#include <iosfwd>
#include <string>
#include <vector>

class Config;

class CLI {
public:
    /// Parse argv and dispatch to subcommand. Returns the process exit code.
    static int run(int argc, char* argv[]);

    struct Options {
        std::string config_path;  // --config <path>, empty = default lookup
        bool verbose = false;     // -v / --verbose
        std::vector<std::string> args;  // command and its operands
    };

    /// Split global flags from the command words. Returns false on a
    /// malformed flag (e.g. --config without a value).
    static bool parse_options(int argc, char* argv[], Options& opts);

    /// Last `lines` lines of a file. Returns false if it cannot be opened.
    static bool tail_file(const std::string& path, int lines, std::vector<std::string>& out);

    /// "self-bot" -> "Self-Bot"
    static std::string title_case(const std::string& name);

private:
    static int cmd_help(const Options& opts, std::ostream& os);
    static int cmd_version();
    static int cmd_start(const Options& opts);
    static int cmd_stop(const Options& opts);
    static int cmd_restart(const Options& opts);
    static int cmd_status(const Options& opts);
    static int cmd_logs(const Options& opts);

    /// Load and validate the configuration, reporting problems on stderr
    static bool load_config(const Options& opts, Config& config);

    /// Parse the optional "random" modifier of start/stop/restart
    static bool parse_random(const Options& opts, bool& random);

    static int usage_error(const std::string& message);
};
