#pragma once

#include <string>
#include <vector>
#include <sys/types.h>

enum class SlotState {
    Pending,   // reserved by a start that has not launched this bot yet
    Running,   // launched, pid recorded
    Vacant     // launch failed or never happened
};

struct SlotEntry {
    SlotState state = SlotState::Vacant;
    pid_t pid = -1;

    static SlotEntry pending() { return {SlotState::Pending, -1}; }
    static SlotEntry running(pid_t pid) { return {SlotState::Running, pid}; }
    static SlotEntry vacant() { return {SlotState::Vacant, -1}; }

    bool operator==(const SlotEntry& other) const {
        return state == other.state && pid == other.pid;
    }
};

/// Ordered per-bot tracking entries persisted as one line per slot:
/// "PENDING", "VACANT" or a decimal pid. Slot i belongs to bot i.
class Registry {
public:
    explicit Registry(std::string path);

    const std::string& path() const { return path_; }

    bool exists() const;

    /// Read the file into slots(). Returns false if it is missing or
    /// unreadable; unparsable lines are read as vacant.
    bool load();

    /// Persist all slots atomically (temp file + rename)
    bool save() const;

    /// Delete the file. Missing file counts as success.
    bool remove() const;

    /// Replace all slots with n pending reservations
    void reserve(size_t n);

    /// Pad with vacant slots or drop surplus ones; returns true if changed
    bool resize(size_t n);

    std::vector<SlotEntry>& slots() { return slots_; }
    const std::vector<SlotEntry>& slots() const { return slots_; }

    static constexpr const char* kPendingToken = "PENDING";
    static constexpr const char* kVacantToken = "VACANT";

    static SlotEntry parse_line(const std::string& line);
    static std::string format_entry(const SlotEntry& entry);

private:
    std::string path_;
    std::vector<SlotEntry> slots_;
};
