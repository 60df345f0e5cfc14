#include "core/config.hpp"

#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <fstream>
#include <cstdlib>
#include <set>
#include <system_error>

namespace fs = std::filesystem;

std::string Config::expand_home(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

std::string Config::root_dir() {
    const char* home = std::getenv("BOTCTL_HOME");
    if (home && home[0] != '\0') {
        return expand_home(home);
    }

    // Linux: /proc/self/exe is a symlink to the running binary
    std::error_code ec;
    fs::path exe = fs::canonical("/proc/self/exe", ec);
    if (!ec) {
        return exe.parent_path().string();
    }
    return fs::current_path(ec).string();
}

std::string Config::config_path() {
    return root_dir() + "/botctl.yaml";
}

std::vector<BotDescriptor> Config::default_bots(const std::string& root) {
    BotDescriptor self_bot;
    self_bot.name = "self-bot";
    self_bot.alias = "self";
    self_bot.working_dir = root + "/self-bot";
    self_bot.command = {"./venv/bin/python", "self_bot.py"};
    self_bot.requires_paths = {"venv/bin/python"};
    self_bot.match = "self_bot.py";

    BotDescriptor normal_bot;
    normal_bot.name = "normal-bot";
    normal_bot.alias = "normal";
    normal_bot.working_dir = root + "/normal-bot";
    normal_bot.command = {"./venv/bin/python", "normal_bot.py"};
    normal_bot.requires_paths = {"venv/bin/python"};
    normal_bot.match = "normal_bot.py";

    return {self_bot, normal_bot};
}

Config::Config() : Config(root_dir()) {}

Config::Config(const std::string& root) {
    config_.root_dir = root;
    config_.state_dir = root;
    config_.log_dir = root + "/logs";
    config_.bots = default_bots(root);
}

Config::~Config() = default;

std::string Config::resolve(const std::string& path) const {
    std::string expanded = expand_home(path);
    if (expanded.empty()) return expanded;
    fs::path p(expanded);
    if (!p.is_absolute()) p = fs::path(config_.root_dir) / p;
    p = p.lexically_normal();
    // "dir/." normalizes to "dir/"; drop the trailing separator
    if (!p.has_filename() && p.has_relative_path()) p = p.parent_path();
    return p.string();
}

bool Config::load() {
    return load(config_path());
}

bool Config::load(const std::string& path) {
    error_.clear();
    std::error_code ec;
    if (path.empty() || !fs::exists(path, ec)) {
        return false;
    }

    try {
        YAML::Node root = YAML::LoadFile(path);

        // Paths section
        if (auto paths = root["paths"]) {
            if (paths["root"]) {
                config_.root_dir = resolve(paths["root"].as<std::string>());
                config_.state_dir = config_.root_dir;
                config_.log_dir = config_.root_dir + "/logs";
                config_.bots = default_bots(config_.root_dir);
            }
            if (paths["state_dir"]) config_.state_dir = resolve(paths["state_dir"].as<std::string>());
            if (paths["log_dir"]) config_.log_dir = resolve(paths["log_dir"].as<std::string>());
        }

        // Timing section
        if (auto timing = root["timing"]) {
            auto& t = config_.timing;
            t.lock_wait_ms = timing["lock_wait_ms"].as<int>(t.lock_wait_ms);
            t.lock_poll_ms = timing["lock_poll_ms"].as<int>(t.lock_poll_ms);
            t.settle_ms = timing["settle_ms"].as<int>(t.settle_ms);
            t.stop_timeout_ms = timing["stop_timeout_ms"].as<int>(t.stop_timeout_ms);
            t.stop_poll_ms = timing["stop_poll_ms"].as<int>(t.stop_poll_ms);
            t.restart_pause_ms = timing["restart_pause_ms"].as<int>(t.restart_pause_ms);
            t.random_delay_max_s = timing["random_delay_max_s"].as<int>(t.random_delay_max_s);
        }

        // Bots section replaces the built-in pair
        if (auto bots = root["bots"]) {
            config_.bots.clear();
            for (const auto& node : bots) {
                BotDescriptor bot;
                bot.name = node["name"].as<std::string>("");
                bot.alias = node["alias"].as<std::string>(bot.name);
                bot.working_dir = resolve(node["working_dir"].as<std::string>("."));
                if (auto cmd = node["command"]) {
                    for (const auto& arg : cmd) bot.command.push_back(arg.as<std::string>());
                }
                if (auto req = node["requires"]) {
                    for (const auto& p : req) bot.requires_paths.push_back(p.as<std::string>());
                }
                bot.match = node["match"].as<std::string>("");
                if (bot.match.empty() && !bot.command.empty()) {
                    bot.match = bot.command.back();
                }
                config_.bots.push_back(std::move(bot));
            }
        }
    } catch (const YAML::Exception& e) {
        error_ = "cannot parse " + path + ": " + e.what();
        return false;
    }

    return true;
}

bool Config::validate() {
    error_.clear();

    if (config_.bots.empty()) {
        error_ = "no bots configured";
        return false;
    }

    std::set<std::string> names;
    std::set<std::string> aliases;
    for (const auto& bot : config_.bots) {
        if (bot.name.empty()) {
            error_ = "bot without a name";
            return false;
        }
        if (bot.name == "manager" || bot.alias == "manager" || bot.alias == "all") {
            error_ = "bot name/alias is reserved: " + bot.name;
            return false;
        }
        if (!names.insert(bot.name).second) {
            error_ = "duplicate bot name: " + bot.name;
            return false;
        }
        if (!bot.alias.empty() && !aliases.insert(bot.alias).second) {
            error_ = "duplicate bot alias: " + bot.alias;
            return false;
        }
        if (bot.command.empty() || bot.command.front().empty()) {
            error_ = "empty command for bot " + bot.name;
            return false;
        }
    }

    const auto& t = config_.timing;
    if (t.lock_wait_ms < 0 || t.settle_ms < 0 || t.stop_timeout_ms < 0 ||
        t.restart_pause_ms < 0 || t.random_delay_max_s < 0) {
        error_ = "timing values must not be negative";
        return false;
    }
    if (t.lock_poll_ms <= 0 || t.stop_poll_ms <= 0) {
        error_ = "poll intervals must be positive";
        return false;
    }

    return true;
}

bool Config::save() const {
    return save(config_path());
}

bool Config::save(const std::string& path) const {
    if (path.empty()) return false;

    YAML::Emitter out;
    out << YAML::BeginMap;

    // Paths section
    out << YAML::Key << "paths" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "state_dir" << YAML::Value << config_.state_dir;
    out << YAML::Key << "log_dir" << YAML::Value << config_.log_dir;
    out << YAML::EndMap;

    // Timing section
    const auto& t = config_.timing;
    out << YAML::Key << "timing" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "lock_wait_ms" << YAML::Value << t.lock_wait_ms;
    out << YAML::Key << "lock_poll_ms" << YAML::Value << t.lock_poll_ms;
    out << YAML::Key << "settle_ms" << YAML::Value << t.settle_ms;
    out << YAML::Key << "stop_timeout_ms" << YAML::Value << t.stop_timeout_ms;
    out << YAML::Key << "stop_poll_ms" << YAML::Value << t.stop_poll_ms;
    out << YAML::Key << "restart_pause_ms" << YAML::Value << t.restart_pause_ms;
    out << YAML::Key << "random_delay_max_s" << YAML::Value << t.random_delay_max_s;
    out << YAML::EndMap;

    // Bots section
    out << YAML::Key << "bots" << YAML::Value << YAML::BeginSeq;
    for (const auto& bot : config_.bots) {
        out << YAML::BeginMap;
        out << YAML::Key << "name" << YAML::Value << bot.name;
        out << YAML::Key << "alias" << YAML::Value << bot.alias;
        out << YAML::Key << "working_dir" << YAML::Value << bot.working_dir;
        out << YAML::Key << "command" << YAML::Value << YAML::Flow << bot.command;
        out << YAML::Key << "requires" << YAML::Value << YAML::Flow << bot.requires_paths;
        out << YAML::Key << "match" << YAML::Value << bot.match;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::EndMap;

    std::error_code ec;
    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) return false;
    }

    // Atomic write: write to temp file, then rename
    std::string tmp = path + ".tmp";
    std::ofstream fout(tmp);
    if (!fout.is_open()) return false;
    fout << out.c_str() << "\n";
    fout.close();
    if (fout.fail()) return false;
    fs::rename(tmp, path, ec);
    return !ec;
}

AppConfig& Config::data() { return config_; }
const AppConfig& Config::data() const { return config_; }

const std::string& Config::error() const { return error_; }

std::string Config::pid_file_path() const {
    return config_.state_dir + "/.bot_pids";
}

std::string Config::lock_dir_path() const {
    return config_.state_dir + "/.bot_manager.lock";
}

std::string Config::bot_log_path(const BotDescriptor& bot) const {
    return config_.log_dir + "/" + bot.name + ".log";
}

std::string Config::manager_log_path() const {
    return config_.log_dir + "/manager.log";
}
