#pragma once

#include <string>

class Logging {
public:
    /// Install the "manager" logger (stdout + appending file sink) as the
    /// spdlog default. If the file cannot be opened the logger keeps only
    /// the stdout sink and warns.
    static void init(const std::string& manager_log_path, bool verbose);

    /// Flush and drop all registered loggers
    static void shutdown();

    static constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S] [%l] %v";
};
