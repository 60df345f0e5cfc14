#pragma once

#include "core/config.hpp"
#include "supervisor/registry.hpp"

#include <string>
#include <vector>
#include <sys/types.h>

enum class SupervisorError {
    None,
    LockBusy,             // another invocation holds a live lock
    AlreadyRunning,       // start requested while bots are tracked
    PrerequisiteMissing,  // a bot's runtime environment is absent
    LaunchFailed,         // child exited before the settle check
    PartialFailure,       // some but not all bots launched
    TotalFailure,         // no bot launched
    StateError            // registry or lock could not be written
};

const char* to_string(SupervisorError error);

struct BotLaunchReport {
    std::string name;
    bool started = false;
    pid_t pid = -1;
    SupervisorError error = SupervisorError::None;
    std::string detail;
};

struct StartResult {
    SupervisorError error = SupervisorError::None;
    std::vector<BotLaunchReport> bots;
    int started = 0;

    /// Full or partial success
    bool success() const {
        return error == SupervisorError::None || error == SupervisorError::PartialFailure;
    }
};

struct StopResult {
    bool used_fallback = false;  // no registry; processes found by command line
    int signalled = 0;           // fallback mode only
    int graceful = 0;
    int forced = 0;
    int already_stopped = 0;
    int skipped = 0;             // pending or vacant slots
    int failed = 0;
};

struct SlotStatus {
    std::string name;
    SlotEntry entry;
    bool alive = false;
};

struct StatusResult {
    bool registry_found = false;
    std::vector<SlotStatus> slots;
    int running = 0;
    int pending = 0;
    bool registry_removed = false;
};

/// Start/stop/status/restart over the configured bots. The caller must hold
/// the SupervisorLock for the whole operation.
class Supervisor {
public:
    explicit Supervisor(const Config& config);

    StartResult start(bool random_delay = false);
    StopResult stop(bool random_delay = false);
    StatusResult status();
    StartResult restart(bool random_delay = false);

    /// Registry exists and has a live pid or a pending reservation
    bool any_active();

    Registry& registry() { return registry_; }

private:
    const Config& config_;
    Registry registry_;

    BotLaunchReport start_bot(size_t slot);
    bool persist_slot(size_t slot, const SlotEntry& entry);
    void apply_random_delay();
    bool load_registry();
    static void sleep_ms(int ms);
};
