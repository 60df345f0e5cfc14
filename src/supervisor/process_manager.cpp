#include "supervisor/process_manager.hpp"

#include <dirent.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <thread>

namespace fs = std::filesystem;

ProcessManager::LaunchResult ProcessManager::launch(const BotDescriptor& bot, const std::string& log_path) {
    LaunchResult result;

    if (bot.command.empty()) {
        result.error = "empty command";
        return result;
    }

    std::error_code ec;
    fs::create_directories(fs::path(log_path).parent_path(), ec);

    // Open the log in the parent so a bad path is reported here, not lost in the child
    int log_fd = open(log_path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (log_fd < 0) {
        result.error = "cannot open " + log_path + ": " + std::strerror(errno);
        return result;
    }

    // Build argv before forking; only async-signal-safe calls after fork()
    std::vector<const char*> argv;
    for (const auto& arg : bot.command) {
        argv.push_back(arg.c_str());
    }
    argv.push_back(nullptr);
    const char* workdir = bot.working_dir.c_str();

    // Descriptors the child must not keep (e.g. the manager log, whose
    // FILE* was opened without O_CLOEXEC)
    std::vector<int> inherited = open_descriptors();

    pid_t pid = fork();
    if (pid < 0) {
        result.error = std::string("fork failed: ") + std::strerror(errno);
        close(log_fd);
        return result;
    }

    if (pid == 0) {
        // Child process: detach from the supervisor's session and terminal
        setsid();

        int null_fd = open("/dev/null", O_RDONLY);
        if (null_fd >= 0) {
            dup2(null_fd, STDIN_FILENO);
            close(null_fd);
        }
        dup2(log_fd, STDOUT_FILENO);
        dup2(log_fd, STDERR_FILENO);
        for (int fd : inherited) {
            if (fd > STDERR_FILENO) close(fd);
        }

        if (chdir(workdir) != 0) {
            _exit(126);
        }

        // Replace child process with the bot
        execvp(argv[0], const_cast<char* const*>(argv.data()));

        // If execvp returns, it failed
        _exit(127);
    }

    // Parent process
    close(log_fd);
    result.success = true;
    result.pid = pid;
    return result;
}

ProcessManager::StopOutcome ProcessManager::terminate(pid_t pid, int timeout_ms, int poll_ms) {
    if (!is_running(pid)) {
        return StopOutcome::NotRunning;
    }

    // Send SIGTERM first
    if (kill(pid, SIGTERM) != 0) {
        return errno == ESRCH ? StopOutcome::NotRunning : StopOutcome::Failed;
    }

    // Wait for graceful exit
    for (int waited = 0; waited < timeout_ms; waited += poll_ms) {
        if (!is_running(pid)) {
            return StopOutcome::Graceful;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(poll_ms));
    }
    if (!is_running(pid)) {
        return StopOutcome::Graceful;
    }

    // Force kill if still running
    if (kill(pid, SIGKILL) != 0 && errno != ESRCH) {
        return StopOutcome::Failed;
    }
    for (int i = 0; i < 10 && is_running(pid); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return StopOutcome::Forced;
}

std::vector<int> ProcessManager::open_descriptors() {
    std::vector<int> fds;
    DIR* dir = opendir("/proc/self/fd");
    if (!dir) return fds;
    const int own = dirfd(dir);
    while (struct dirent* entry = readdir(dir)) {
        char* end = nullptr;
        long fd = std::strtol(entry->d_name, &end, 10);
        if (end == entry->d_name || *end != '\0' || fd == own) continue;
        fds.push_back(static_cast<int>(fd));
    }
    closedir(dir);
    return fds;
}

bool ProcessManager::is_running(pid_t pid) {
    if (pid <= 0) return false;

    // Our own exited children linger as zombies until reaped
    int status;
    if (waitpid(pid, &status, WNOHANG) == pid) {
        return false;
    }

    // Check if process exists without sending a signal
    if (kill(pid, 0) != 0 && errno == ESRCH) {
        return false;
    }

    // Zombies of other parents still answer kill(0)
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    if (stat.is_open()) {
        std::string line;
        std::getline(stat, line);
        auto close_paren = line.rfind(')');
        if (close_paren != std::string::npos && close_paren + 2 < line.size()) {
            char state = line[close_paren + 2];
            if (state == 'Z' || state == 'X') return false;
        }
    }
    return true;
}

std::vector<pid_t> ProcessManager::find_by_command(const std::string& needle) {
    std::vector<pid_t> pids;
    if (needle.empty()) return pids;

    DIR* proc = opendir("/proc");
    if (!proc) return pids;

    const pid_t self = getpid();
    while (struct dirent* entry = readdir(proc)) {
        char* end = nullptr;
        long value = std::strtol(entry->d_name, &end, 10);
        if (value <= 0 || *end != '\0') continue;
        pid_t pid = static_cast<pid_t>(value);
        if (pid == self) continue;

        std::ifstream fin("/proc/" + std::string(entry->d_name) + "/cmdline", std::ios::binary);
        if (!fin.is_open()) continue;
        std::string cmdline((std::istreambuf_iterator<char>(fin)), std::istreambuf_iterator<char>());
        if (cmdline.empty()) continue;  // kernel thread or zombie
        for (auto& c : cmdline) {
            if (c == '\0') c = ' ';
        }
        if (cmdline.find(needle) != std::string::npos) {
            pids.push_back(pid);
        }
    }
    closedir(proc);
    return pids;
}

std::vector<std::string> ProcessManager::missing_prerequisites(const BotDescriptor& bot) {
    std::vector<std::string> missing;
    std::error_code ec;
    if (!fs::is_directory(bot.working_dir, ec)) {
        missing.push_back(bot.working_dir);
        return missing;
    }
    for (const auto& rel : bot.requires_paths) {
        fs::path p = fs::path(bot.working_dir) / rel;
        if (!fs::exists(p, ec)) {
            missing.push_back(p.string());
        }
    }
    return missing;
}

const char* to_string(ProcessManager::StopOutcome outcome) {
    switch (outcome) {
        case ProcessManager::StopOutcome::NotRunning: return "not running";
        case ProcessManager::StopOutcome::Graceful:   return "stopped gracefully";
        case ProcessManager::StopOutcome::Forced:     return "force killed";
        case ProcessManager::StopOutcome::Failed:     return "could not be signalled";
    }
    return "unknown";
}
