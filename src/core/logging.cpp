#include "core/logging.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>

#include <filesystem>
#include <memory>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

void Logging::init(const std::string& manager_log_path, bool verbose) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());

    bool file_ok = true;
    std::string file_error;
    try {
        std::error_code ec;
        fs::create_directories(fs::path(manager_log_path).parent_path(), ec);
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(manager_log_path, false));
    } catch (const spdlog::spdlog_ex& e) {
        file_ok = false;
        file_error = e.what();
    }

    spdlog::drop("manager");
    auto logger = std::make_shared<spdlog::logger>("manager", sinks.begin(), sinks.end());
    logger->set_pattern(kPattern);
    logger->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
    logger->flush_on(spdlog::level::debug);
    spdlog::set_default_logger(logger);

    if (!file_ok) {
        spdlog::warn("Manager log unavailable ({}), logging to stdout only", file_error);
    }
}

void Logging::shutdown() {
    spdlog::shutdown();
}
