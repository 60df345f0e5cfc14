#pragma once

#include <string>
#include <vector>

struct BotDescriptor {
    std::string name;                   // "self-bot", also the log file stem
    std::string alias;                  // "self", selector for `botctl logs`
    std::string working_dir;            // absolute after Config::load()
    std::vector<std::string> command;   // argv, e.g. {"./venv/bin/python", "self_bot.py"}
    std::vector<std::string> requires_paths; // relative to working_dir
    std::string match;                  // command substring for fallback discovery
};

struct TimingConfig {
    int lock_wait_ms = 5000;
    int lock_poll_ms = 1000;
    int settle_ms = 1000;
    int stop_timeout_ms = 5000;
    int stop_poll_ms = 1000;
    int restart_pause_ms = 2000;
    int random_delay_max_s = 3600;
};

struct AppConfig {
    // Paths
    std::string root_dir;
    std::string state_dir;
    std::string log_dir;

    TimingConfig timing;

    std::vector<BotDescriptor> bots;
};

class Config {
public:
    /// Defaults rooted at root_dir() (or the given directory)
    Config();
    explicit Config(const std::string& root);
    ~Config();

    /// Load from config_path(). Returns false if the file is absent
    /// (defaults stay in place) or could not be parsed (see error()).
    bool load();
    bool load(const std::string& path);
    bool save() const;
    bool save(const std::string& path) const;

    /// Check the loaded values; fills error() on failure
    bool validate();

    AppConfig& data();
    const AppConfig& data() const;

    /// Last load/validate error, empty if none
    const std::string& error() const;

    std::string pid_file_path() const;
    std::string lock_dir_path() const;
    std::string bot_log_path(const BotDescriptor& bot) const;
    std::string manager_log_path() const;

    static std::string root_dir();
    static std::string config_path();
    static std::string expand_home(const std::string& path);
    static std::vector<BotDescriptor> default_bots(const std::string& root);

private:
    AppConfig config_;
    std::string error_;

    std::string resolve(const std::string& path) const;
};
