#pragma once

#include "core/config.hpp"

#include <string>
#include <vector>
#include <sys/types.h>

class ProcessManager {
public:
    struct LaunchResult {
        bool success = false;
        pid_t pid = -1;
        std::string error;
    };

    /// Fork a detached child (own session, stdin from /dev/null, stdout and
    /// stderr appended to log_path, no other inherited descriptors) running
    /// bot.command in bot.working_dir.
    /// The caller keeps only the pid; the child is never waited on beyond
    /// the liveness check.
    static LaunchResult launch(const BotDescriptor& bot, const std::string& log_path);

    enum class StopOutcome {
        NotRunning,   // nothing to signal
        Graceful,     // exited after SIGTERM
        Forced,       // needed SIGKILL
        Failed        // could not signal (e.g. EPERM)
    };

    /// Send SIGTERM, poll every poll_ms for up to timeout_ms, then SIGKILL
    static StopOutcome terminate(pid_t pid, int timeout_ms, int poll_ms);

    /// Check if a process exists and is not a zombie. Reaps the pid first
    /// if it is an exited child of this process.
    static bool is_running(pid_t pid);

    /// Pids whose command line contains needle, excluding this process
    static std::vector<pid_t> find_by_command(const std::string& needle);

    /// Paths from bot.requires_paths that do not exist
    static std::vector<std::string> missing_prerequisites(const BotDescriptor& bot);

    /// Descriptor numbers currently open in this process
    static std::vector<int> open_descriptors();
};

const char* to_string(ProcessManager::StopOutcome outcome);
