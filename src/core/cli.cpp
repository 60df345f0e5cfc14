#include "core/cli.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"
#include "supervisor/lock.hpp"
#include "supervisor/supervisor.hpp"

#include <cctype>
#include <cstdlib>
#include <cstring>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>

#ifndef BOTCTL_VERSION
#define BOTCTL_VERSION "unknown"
#endif

namespace fs = std::filesystem;

static const int DEFAULT_LOG_LINES = 50;

// ── Option parsing ──────────────────────────────────────────

bool CLI::parse_options(int argc, char* argv[], Options& opts) {
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (std::strcmp(arg, "-v") == 0 || std::strcmp(arg, "--verbose") == 0) {
            opts.verbose = true;
        } else if (std::strcmp(arg, "--config") == 0 || std::strcmp(arg, "-c") == 0) {
            if (i + 1 >= argc) return false;
            opts.config_path = argv[++i];
        } else if (std::strncmp(arg, "--config=", 9) == 0) {
            opts.config_path = arg + 9;
            if (opts.config_path.empty()) return false;
        } else {
            opts.args.emplace_back(arg);
        }
    }
    return true;
}

// ── Subcommand dispatch ─────────────────────────────────────

int CLI::run(int argc, char* argv[]) {
    Options opts;
    if (!parse_options(argc, argv, opts)) {
        return usage_error("--config requires a path");
    }
    if (opts.args.empty()) {
        cmd_help(opts, std::cerr);
        return 1;
    }

    const std::string& cmd = opts.args[0];

    if (cmd == "help" || cmd == "--help" || cmd == "-h") {
        return cmd_help(opts, std::cout);
    }
    if (cmd == "version" || cmd == "--version") {
        return cmd_version();
    }
    if (cmd == "start") {
        return cmd_start(opts);
    }
    if (cmd == "stop") {
        return cmd_stop(opts);
    }
    if (cmd == "restart") {
        return cmd_restart(opts);
    }
    if (cmd == "status") {
        return cmd_status(opts);
    }
    if (cmd == "logs") {
        return cmd_logs(opts);
    }

    std::cerr << "Unknown command: " << cmd << "\n";
    std::cerr << "Run 'botctl help' for usage.\n";
    return 1;
}

int CLI::usage_error(const std::string& message) {
    std::cerr << message << "\n";
    std::cerr << "Run 'botctl help' for usage.\n";
    return 1;
}

// ── help ────────────────────────────────────────────────────

int CLI::cmd_help(const Options& opts, std::ostream& os) {
    os <<
        "botctl - start, stop and watch the bots\n"
        "\n"
        "Usage:\n"
        "  botctl [options] {start|stop|restart|status|logs} [args]\n"
        "\n"
        "Commands:\n"
        "  start [random]            Start all bots\n"
        "  stop [random]             Stop all bots\n"
        "  restart [random]          Stop, pause, then start all bots\n"
        "  status                    Check which bots are running\n"
        "  logs [bot] [lines]        Show log tails\n"
        "  version                   Show version\n"
        "  help                      Show this help\n"
        "\n"
        "Options:\n"
        "  random                    Wait a random delay before acting\n"
        "  -c, --config <path>       Use this config file instead of botctl.yaml\n"
        "  -v, --verbose             Log lock and PID file bookkeeping\n"
        "\n"
        "Logs usage:\n"
        "  botctl logs [bot] [lines]\n"
        "    bot:   a bot alias (self, normal), manager, or all (default: all)\n"
        "    lines: number of lines to show (default: 50)\n"
        "\n"
        "Examples:\n"
        "  botctl start\n"
        "  botctl start random\n"
        "  botctl stop random\n"
        "  botctl restart\n"
        "  botctl status\n"
        "  botctl logs self 100\n";

    Config config;
    if (load_config(opts, config)) {
        os << "\nLog files are stored in: " << config.data().log_dir << "\n";
    }
    return 0;
}

// ── version ─────────────────────────────────────────────────

int CLI::cmd_version() {
    std::cout << "botctl " << BOTCTL_VERSION << "\n";
    return 0;
}

// ── Config ──────────────────────────────────────────────────

bool CLI::load_config(const Options& opts, Config& config) {
    if (!opts.config_path.empty()) {
        std::error_code ec;
        if (!fs::exists(opts.config_path, ec)) {
            std::cerr << "Config file not found: " << opts.config_path << "\n";
            return false;
        }
        // Relative paths in an explicit config resolve against its directory
        fs::path dir = fs::absolute(opts.config_path, ec).parent_path();
        config = Config(dir.string());
        if (!config.load(opts.config_path)) {
            std::cerr << "Invalid config: " << config.error() << "\n";
            return false;
        }
    } else if (!config.load() && !config.error().empty()) {
        std::cerr << "Invalid config: " << config.error() << "\n";
        return false;
    }

    if (!config.validate()) {
        std::cerr << "Invalid config: " << config.error() << "\n";
        return false;
    }
    return true;
}

bool CLI::parse_random(const Options& opts, bool& random) {
    random = false;
    if (opts.args.size() == 1) return true;
    if (opts.args.size() == 2 && opts.args[1] == "random") {
        random = true;
        return true;
    }
    return false;
}

// ── start / stop / restart / status ─────────────────────────

namespace {

int run_locked(const Config& config, bool verbose, const std::function<int(Supervisor&)>& op) {
    Logging::init(config.manager_log_path(), verbose);

    const auto& t = config.data().timing;
    SupervisorLock lock(config.lock_dir_path(), t.lock_wait_ms, t.lock_poll_ms);
    if (lock.acquire() != SupervisorLock::Status::Acquired) {
        return 1;
    }

    Supervisor supervisor(config);
    return op(supervisor);
}

}  // namespace

int CLI::cmd_start(const Options& opts) {
    bool random = false;
    if (!parse_random(opts, random)) return usage_error("Usage: botctl start [random]");

    Config config;
    if (!load_config(opts, config)) return 1;

    return run_locked(config, opts.verbose, [random](Supervisor& s) {
        return s.start(random).success() ? 0 : 1;
    });
}

int CLI::cmd_stop(const Options& opts) {
    bool random = false;
    if (!parse_random(opts, random)) return usage_error("Usage: botctl stop [random]");

    Config config;
    if (!load_config(opts, config)) return 1;

    // stop is idempotent and succeeds once the lock is held
    return run_locked(config, opts.verbose, [random](Supervisor& s) {
        s.stop(random);
        return 0;
    });
}

int CLI::cmd_restart(const Options& opts) {
    bool random = false;
    if (!parse_random(opts, random)) return usage_error("Usage: botctl restart [random]");

    Config config;
    if (!load_config(opts, config)) return 1;

    return run_locked(config, opts.verbose, [random](Supervisor& s) {
        return s.restart(random).success() ? 0 : 1;
    });
}

int CLI::cmd_status(const Options& opts) {
    if (opts.args.size() > 1) return usage_error("Usage: botctl status");

    Config config;
    if (!load_config(opts, config)) return 1;

    return run_locked(config, opts.verbose, [](Supervisor& s) {
        s.status();
        return 0;
    });
}

// ── logs ────────────────────────────────────────────────────

bool CLI::tail_file(const std::string& path, int lines, std::vector<std::string>& out) {
    out.clear();
    std::ifstream fin(path);
    if (!fin.is_open()) return false;

    std::deque<std::string> window;
    std::string line;
    while (std::getline(fin, line)) {
        window.push_back(std::move(line));
        while (static_cast<int>(window.size()) > lines) {
            window.pop_front();
        }
    }
    out.assign(window.begin(), window.end());
    return true;
}

std::string CLI::title_case(const std::string& name) {
    std::string result = name;
    bool word_start = true;
    for (auto& c : result) {
        if (word_start && std::isalpha(static_cast<unsigned char>(c))) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        word_start = (c == '-' || c == '_' || c == ' ');
    }
    return result;
}

int CLI::cmd_logs(const Options& opts) {
    if (opts.args.size() > 3) return usage_error("Usage: botctl logs [bot] [lines]");

    std::string selector = opts.args.size() >= 2 ? opts.args[1] : "all";
    int lines = DEFAULT_LOG_LINES;
    if (opts.args.size() >= 3) {
        const std::string& n = opts.args[2];
        char* end = nullptr;
        long value = std::strtol(n.c_str(), &end, 10);
        if (n.empty() || *end != '\0' || value <= 0 || value > 1000000) {
            return usage_error("Invalid line count: " + n);
        }
        lines = static_cast<int>(value);
    }

    Config config;
    if (!load_config(opts, config)) return 1;

    struct Source {
        std::string title;
        std::string label;
        std::string path;
    };
    std::vector<Source> all;
    all.push_back({"Manager", "manager", config.manager_log_path()});
    for (const auto& bot : config.data().bots) {
        all.push_back({title_case(bot.name), bot.name, config.bot_log_path(bot)});
    }

    std::vector<std::string> out;

    if (selector == "all") {
        bool first = true;
        for (const auto& src : all) {
            if (!first) std::cout << "\n";
            first = false;
            std::cout << "=== " << src.title << " Logs ===\n";
            if (!tail_file(src.path, lines, out)) {
                std::cout << "No " << src.label << " logs\n";
                continue;
            }
            for (const auto& l : out) std::cout << l << "\n";
        }
        return 0;
    }

    std::string path;
    if (selector == "manager") {
        path = config.manager_log_path();
    } else {
        for (const auto& bot : config.data().bots) {
            if (selector == bot.alias || selector == bot.name) {
                path = config.bot_log_path(bot);
                break;
            }
        }
    }

    if (path.empty()) {
        std::cerr << "Unknown bot: " << selector << "\n";
        std::cerr << "Use:";
        for (const auto& bot : config.data().bots) std::cerr << " " << bot.alias << ",";
        std::cerr << " manager, or all\n";
        return 1;
    }

    if (!tail_file(path, lines, out)) {
        std::cerr << "Cannot open log file: " << path << "\n";
        return 1;
    }
    for (const auto& l : out) std::cout << l << "\n";
    return 0;
}
