#include "supervisor/supervisor.hpp"
#include "supervisor/process_manager.hpp"

#include <spdlog/spdlog.h>

#include <signal.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <random>
#include <thread>

const char* to_string(SupervisorError error) {
    switch (error) {
        case SupervisorError::None:                return "ok";
        case SupervisorError::LockBusy:            return "lock busy";
        case SupervisorError::AlreadyRunning:      return "already running";
        case SupervisorError::PrerequisiteMissing: return "prerequisite missing";
        case SupervisorError::LaunchFailed:        return "launch failed";
        case SupervisorError::PartialFailure:      return "partial failure";
        case SupervisorError::TotalFailure:        return "total failure";
        case SupervisorError::StateError:          return "state error";
    }
    return "unknown";
}

Supervisor::Supervisor(const Config& config)
    : config_(config), registry_(config.pid_file_path()) {}

void Supervisor::sleep_ms(int ms) {
    if (ms > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(ms));
    }
}

void Supervisor::apply_random_delay() {
    int max_s = config_.data().timing.random_delay_max_s;
    if (max_s <= 0) return;

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<int> dist(0, max_s - 1);
    int delay = dist(gen);

    spdlog::info("Waiting for random delay: {} seconds ({} minutes)", delay, delay / 60);
    std::this_thread::sleep_for(std::chrono::seconds(delay));
}

bool Supervisor::load_registry() {
    if (!registry_.load()) return false;
    size_t expected = config_.data().bots.size();
    if (registry_.slots().size() != expected) {
        spdlog::warn("PID file has {} entries for {} bots, adjusting",
                     registry_.slots().size(), expected);
        registry_.resize(expected);
    }
    return true;
}

bool Supervisor::any_active() {
    if (!registry_.exists() || !load_registry()) return false;
    for (const auto& entry : registry_.slots()) {
        if (entry.state == SlotState::Pending) return true;
        if (entry.state == SlotState::Running && ProcessManager::is_running(entry.pid)) return true;
    }
    return false;
}

bool Supervisor::persist_slot(size_t slot, const SlotEntry& entry) {
    registry_.slots()[slot] = entry;
    if (!registry_.save()) {
        spdlog::error("Could not write PID file {}", registry_.path());
        return false;
    }
    return true;
}

// ── start ───────────────────────────────────────────────────

BotLaunchReport Supervisor::start_bot(size_t slot) {
    const BotDescriptor& bot = config_.data().bots[slot];
    const std::string log_path = config_.bot_log_path(bot);

    BotLaunchReport report;
    report.name = bot.name;

    auto missing = ProcessManager::missing_prerequisites(bot);
    if (!missing.empty()) {
        report.error = SupervisorError::PrerequisiteMissing;
        report.detail = missing.front();
        spdlog::error("Prerequisite not found for {}: {}", bot.name, missing.front());
        if (!persist_slot(slot, SlotEntry::vacant())) report.detail += "; PID file not updated";
        return report;
    }

    spdlog::info("Starting {}...", bot.name);
    auto launched = ProcessManager::launch(bot, log_path);
    if (!launched.success) {
        report.error = SupervisorError::LaunchFailed;
        report.detail = launched.error;
        spdlog::error("{} could not be launched: {}", bot.name, launched.error);
        if (!persist_slot(slot, SlotEntry::vacant())) report.detail += "; PID file not updated";
        return report;
    }

    // An immediate crash shows up within the settle interval
    sleep_ms(config_.data().timing.settle_ms);
    if (!ProcessManager::is_running(launched.pid)) {
        report.error = SupervisorError::LaunchFailed;
        report.detail = "exited during startup";
        spdlog::error("{} failed to start. Check {} for details.", bot.name, log_path);
        if (!persist_slot(slot, SlotEntry::vacant())) report.detail += "; PID file not updated";
        return report;
    }

    report.started = true;
    report.pid = launched.pid;
    spdlog::info("{} started successfully with PID: {}", bot.name, launched.pid);
    if (!persist_slot(slot, SlotEntry::running(launched.pid))) {
        report.detail = "PID not recorded";
    }
    return report;
}

StartResult Supervisor::start(bool random_delay) {
    spdlog::info("=== Starting bots ===");
    StartResult result;
    const size_t count = config_.data().bots.size();

    if (registry_.exists()) {
        spdlog::warn("PID file exists. Checking if bots are already running...");
        if (any_active()) {
            spdlog::error("Bots are already running or another instance is starting them.");
            spdlog::error("Use 'status' to check, 'stop' to stop them, or 'restart' instead.");
            result.error = SupervisorError::AlreadyRunning;
            return result;
        }
        spdlog::info("Removing stale PID file");
        if (!registry_.remove()) {
            spdlog::error("Could not remove stale PID file {}", registry_.path());
            result.error = SupervisorError::StateError;
            return result;
        }
    }

    // Reserve every slot before launching anything
    registry_.reserve(count);
    if (!registry_.save()) {
        spdlog::error("Could not reserve bot slots in {}", registry_.path());
        result.error = SupervisorError::StateError;
        return result;
    }
    spdlog::info("Reserved bot slots (preventing concurrent starts)");

    if (random_delay) {
        apply_random_delay();
    }

    for (size_t slot = 0; slot < count; ++slot) {
        auto report = start_bot(slot);
        if (report.started) ++result.started;
        result.bots.push_back(std::move(report));
    }

    if (result.started == static_cast<int>(count)) {
        spdlog::info("All bots started successfully!");
    } else if (result.started > 0) {
        spdlog::warn("Only {} of {} bots started successfully.", result.started, count);
        result.error = SupervisorError::PartialFailure;
    } else {
        spdlog::error("Failed to start bots.");
        if (!registry_.remove()) {
            spdlog::error("Could not remove PID file {}", registry_.path());
        }
        result.error = SupervisorError::TotalFailure;
    }
    return result;
}

// ── stop ────────────────────────────────────────────────────

StopResult Supervisor::stop(bool random_delay) {
    spdlog::info("=== Stopping bots ===");
    if (random_delay) {
        apply_random_delay();
    }

    StopResult result;
    const auto& bots = config_.data().bots;
    const auto& timing = config_.data().timing;

    if (!registry_.exists() || !load_registry()) {
        // Degraded mode: nothing tracked, look for the bots by command line
        result.used_fallback = true;
        spdlog::info("No PID file found. Attempting to find and stop bot processes...");
        for (const auto& bot : bots) {
            for (pid_t pid : ProcessManager::find_by_command(bot.match)) {
                if (kill(pid, SIGTERM) == 0) {
                    spdlog::info("Sent SIGTERM to {} process {}", bot.name, pid);
                    ++result.signalled;
                } else if (errno != ESRCH) {
                    spdlog::warn("Could not signal {} process {}: {}", bot.name, pid, std::strerror(errno));
                    ++result.failed;
                }
            }
        }
        if (result.signalled == 0 && result.failed == 0) {
            spdlog::info("No bot processes found, nothing to stop");
        }
        // A PID file that exists but could not be read is cleared too
        if (registry_.exists()) {
            spdlog::warn("PID file {} is unreadable, removing it", registry_.path());
            if (!registry_.remove()) {
                spdlog::error("Could not remove PID file {}", registry_.path());
            }
        }
        return result;
    }

    const auto& slots = registry_.slots();
    for (size_t i = 0; i < slots.size(); ++i) {
        const auto& entry = slots[i];
        const std::string& name = bots[i].name;

        if (entry.state == SlotState::Pending) {
            spdlog::warn("{} slot is still PENDING (orphaned reservation), clearing it", name);
            ++result.skipped;
            continue;
        }
        if (entry.state == SlotState::Vacant) {
            spdlog::debug("{} has no PID recorded, skipping", name);
            ++result.skipped;
            continue;
        }
        if (!ProcessManager::is_running(entry.pid)) {
            spdlog::info("Process {} ({}) not found (already stopped)", entry.pid, name);
            ++result.already_stopped;
            continue;
        }

        spdlog::info("Stopping {} (PID {})...", name, entry.pid);
        auto outcome = ProcessManager::terminate(entry.pid, timing.stop_timeout_ms, timing.stop_poll_ms);
        switch (outcome) {
            case ProcessManager::StopOutcome::Graceful:
                spdlog::info("Process {} stopped gracefully", entry.pid);
                ++result.graceful;
                break;
            case ProcessManager::StopOutcome::Forced:
                spdlog::warn("Process {} did not exit within {} ms, force killed", entry.pid, timing.stop_timeout_ms);
                ++result.forced;
                break;
            case ProcessManager::StopOutcome::NotRunning:
                spdlog::info("Process {} ({}) exited before it was signalled", entry.pid, name);
                ++result.already_stopped;
                break;
            case ProcessManager::StopOutcome::Failed:
                spdlog::error("Could not stop process {} ({}): {}", entry.pid, name, to_string(outcome));
                ++result.failed;
                break;
        }
    }

    // Tracking state is always cleared, even if a kill failed
    if (!registry_.remove()) {
        spdlog::error("Could not remove PID file {}", registry_.path());
    }
    spdlog::info("Bots stopped successfully!");
    return result;
}

// ── status ──────────────────────────────────────────────────

StatusResult Supervisor::status() {
    spdlog::info("=== Checking bot status ===");
    StatusResult result;

    if (!registry_.exists() || !load_registry()) {
        spdlog::info("No bots running (no PID file found)");
        return result;
    }
    result.registry_found = true;

    const auto& bots = config_.data().bots;
    const auto& slots = registry_.slots();
    for (size_t i = 0; i < slots.size(); ++i) {
        SlotStatus st;
        st.name = bots[i].name;
        st.entry = slots[i];

        switch (st.entry.state) {
            case SlotState::Pending:
                spdlog::warn("{} slot is still PENDING (orphaned reservation)", st.name);
                ++result.pending;
                break;
            case SlotState::Running:
                st.alive = ProcessManager::is_running(st.entry.pid);
                if (st.alive) {
                    spdlog::info("{} (PID {}) is running", st.name, st.entry.pid);
                    ++result.running;
                } else {
                    spdlog::info("{} (PID {}) is NOT running", st.name, st.entry.pid);
                }
                break;
            case SlotState::Vacant:
                spdlog::info("{} is NOT running (no PID recorded)", st.name);
                break;
        }
        result.slots.push_back(std::move(st));
    }

    if (result.running == 0 && result.pending == 0) {
        spdlog::info("No bots are running. Cleaning up PID file...");
        result.registry_removed = registry_.remove();
    } else if (result.pending > 0) {
        spdlog::warn("{} orphaned reservation(s) from an interrupted start; run 'stop' to clear them",
                     result.pending);
    } else {
        spdlog::info("{} of {} bots are running", result.running, bots.size());
    }
    return result;
}

// ── restart ─────────────────────────────────────────────────

StartResult Supervisor::restart(bool random_delay) {
    stop(false);
    // Let ports and files held by the old processes go
    sleep_ms(config_.data().timing.restart_pause_ms);
    return start(random_delay);
}
