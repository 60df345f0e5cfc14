#include "supervisor/lock.hpp"

#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <signal.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iterator>
#include <string>
#include <thread>
#include <utility>

namespace fs = std::filesystem;

namespace {

// Attempts per poll when the holder file is swapped under us by a release
constexpr int kOpenAttempts = 5;

const int kCleanupSignals[] = {SIGINT, SIGTERM, SIGHUP};

// Signal-time cleanup state; paths are copied so the handler only touches
// plain buffers and async-signal-safe calls.
char g_lock_dir[PATH_MAX];
char g_lock_pid[PATH_MAX];
volatile sig_atomic_t g_lock_armed = 0;
struct sigaction g_previous[3];

void release_on_signal(int sig) {
    if (g_lock_armed) {
        g_lock_armed = 0;
        // The kernel drops the flock when we die; only the files are ours to clear
        unlink(g_lock_pid);
        rmdir(g_lock_dir);
    }
    // SA_RESETHAND restored the default action; re-deliver once we return
    raise(sig);
}

pid_t parse_pid(const std::string& text) {
    char* end = nullptr;
    long pid = std::strtol(text.c_str(), &end, 10);
    if (end == text.c_str() || pid <= 0 || pid > INT_MAX) return -1;
    return static_cast<pid_t>(pid);
}

std::string read_fd(int fd) {
    std::string text;
    char buf[64];
    ssize_t n;
    off_t offset = 0;
    while ((n = pread(fd, buf, sizeof(buf), offset)) > 0) {
        text.append(buf, static_cast<size_t>(n));
        offset += n;
    }
    return text;
}

}  // namespace

SupervisorLock::SupervisorLock(std::string lock_dir, int wait_ms, int poll_ms)
    : lock_dir_(std::move(lock_dir)),
      pid_path_(lock_dir_ + "/pid"),
      wait_ms_(wait_ms),
      poll_ms_(poll_ms > 0 ? poll_ms : 1) {}

SupervisorLock::~SupervisorLock() {
    release();
}

bool SupervisorLock::try_lock() {
    error_.clear();

    for (int attempt = 0; attempt < kOpenAttempts; ++attempt) {
        std::error_code ec;
        fs::create_directories(lock_dir_, ec);
        if (ec) {
            error_ = "cannot create lock " + lock_dir_ + ": " + ec.message();
            return false;
        }

        int fd = open(pid_path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
        if (fd < 0) {
            // A releasing holder removed the directory between the two calls
            if (errno == ENOENT) continue;
            error_ = "cannot open lock " + pid_path_ + ": " + std::strerror(errno);
            return false;
        }

        if (flock(fd, LOCK_EX | LOCK_NB) != 0) {
            int err = errno;
            close(fd);
            if (err == EWOULDBLOCK || err == EINTR) return false;
            error_ = "cannot lock " + pid_path_ + ": " + std::strerror(err);
            return false;
        }

        // The previous holder unlinks the file on release; a lock on that
        // orphaned inode guards nothing, so only the file at the path counts
        struct stat by_fd;
        struct stat by_path;
        if (fstat(fd, &by_fd) != 0 || stat(pid_path_.c_str(), &by_path) != 0 ||
            by_fd.st_ino != by_path.st_ino || by_fd.st_dev != by_path.st_dev) {
            close(fd);
            continue;
        }

        pid_t previous = parse_pid(read_fd(fd));
        if (previous > 0 && previous != getpid()) {
            spdlog::warn("Removing stale lock from PID {}", previous);
        }

        std::string record = std::to_string(getpid()) + "\n";
        if (ftruncate(fd, 0) != 0 ||
            pwrite(fd, record.data(), record.size(), 0) != static_cast<ssize_t>(record.size())) {
            error_ = "cannot write lock holder file " + pid_path_ + ": " + std::strerror(errno);
            close(fd);
            return false;
        }

        fd_ = fd;
        return true;
    }
    return false;
}

pid_t SupervisorLock::holder() const {
    int fd = open(pid_path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) return -1;
    pid_t pid = parse_pid(read_fd(fd));
    close(fd);
    return pid;
}

bool SupervisorLock::is_stale() const {
    struct stat st;
    if (stat(lock_dir_.c_str(), &st) != 0) return false;

    int fd = open(pid_path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) return errno == ENOENT;

    // Nobody holds the kernel lock: whatever pid is recorded is gone
    bool stale = flock(fd, LOCK_SH | LOCK_NB) == 0;
    close(fd);
    return stale;
}

SupervisorLock::Status SupervisorLock::acquire() {
    if (held_) return Status::Acquired;

    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + std::chrono::milliseconds(wait_ms_);

    while (true) {
        if (try_lock()) {
            held_ = true;
            install_signal_cleanup();
            spdlog::debug("Acquired lock {}", lock_dir_);
            return Status::Acquired;
        }
        if (!error_.empty()) {
            spdlog::error("{}", error_);
            return Status::Error;
        }

        auto now = clock::now();
        if (now >= deadline) break;
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(remaining, std::chrono::milliseconds(poll_ms_)));
    }

    spdlog::error("Another botctl instance is already running (lock held by PID {})", holder());
    spdlog::error("If you're sure no other instance is running, remove: {}", lock_dir_);
    return Status::Busy;
}

void SupervisorLock::release() {
    if (!held_) return;
    remove_signal_cleanup();

    // Unlink while still locked so a waiter never inherits a dead inode
    if (unlink(pid_path_.c_str()) != 0 && errno != ENOENT) {
        spdlog::warn("Could not remove lock holder file {}: {}", pid_path_, std::strerror(errno));
    }
    close(fd_);
    fd_ = -1;
    held_ = false;

    // A waiter may already have recreated the holder file
    if (rmdir(lock_dir_.c_str()) != 0 && errno != ENOENT && errno != ENOTEMPTY && errno != EEXIST) {
        spdlog::warn("Could not remove lock {}: {}", lock_dir_, std::strerror(errno));
    } else {
        spdlog::debug("Released lock {}", lock_dir_);
    }
}

void SupervisorLock::install_signal_cleanup() {
    std::strncpy(g_lock_dir, lock_dir_.c_str(), sizeof(g_lock_dir) - 1);
    g_lock_dir[sizeof(g_lock_dir) - 1] = '\0';
    std::strncpy(g_lock_pid, pid_path_.c_str(), sizeof(g_lock_pid) - 1);
    g_lock_pid[sizeof(g_lock_pid) - 1] = '\0';
    g_lock_armed = 1;

    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = release_on_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESETHAND;
    for (size_t i = 0; i < std::size(kCleanupSignals); ++i) {
        sigaction(kCleanupSignals[i], &sa, &g_previous[i]);
    }
}

void SupervisorLock::remove_signal_cleanup() {
    g_lock_armed = 0;
    for (size_t i = 0; i < std::size(kCleanupSignals); ++i) {
        sigaction(kCleanupSignals[i], &g_previous[i], nullptr);
    }
}
