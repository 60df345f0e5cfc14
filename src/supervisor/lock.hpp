#pragma once

#include <string>
#include <sys/types.h>

/// Lock guarding one supervisor invocation.
///
/// The holder keeps an exclusive flock(2) on `<lock_dir>/pid`, a file that
/// also records its process id. The kernel drops the flock when the holder
/// dies, so a leftover directory from a crashed run is simply taken over.
/// The files are removed by the destructor and, while held, by a
/// SIGINT/SIGTERM/SIGHUP handler before the signal's default action runs.
/// Only one SupervisorLock per process may be held at a time.
class SupervisorLock {
public:
    enum class Status {
        Acquired,
        Busy,     // a live holder kept it for the whole wait ceiling
        Error     // could not create or lock the holder file at all
    };

    SupervisorLock(std::string lock_dir, int wait_ms, int poll_ms);
    ~SupervisorLock();

    SupervisorLock(const SupervisorLock&) = delete;
    SupervisorLock& operator=(const SupervisorLock&) = delete;

    Status acquire();
    void release();

    bool held() const { return held_; }
    const std::string& path() const { return lock_dir_; }
    const std::string& error() const { return error_; }

    /// Pid recorded in the lock directory, -1 if absent or unreadable
    pid_t holder() const;

    /// True if a lock directory exists but nobody holds the flock on it
    bool is_stale() const;

private:
    std::string lock_dir_;
    std::string pid_path_;
    int wait_ms_;
    int poll_ms_;
    bool held_ = false;
    int fd_ = -1;
    std::string error_;

    bool try_lock();
    void install_signal_cleanup();
    void remove_signal_cleanup();
};
