#include "supervisor/registry.hpp"

#include <cctype>
#include <climits>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

Registry::Registry(std::string path) : path_(std::move(path)) {}

bool Registry::exists() const {
    std::error_code ec;
    return fs::exists(path_, ec);
}

SlotEntry Registry::parse_line(const std::string& line) {
    // Trim surrounding whitespace
    size_t begin = 0;
    size_t end = line.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(line[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(line[end - 1]))) --end;
    std::string token = line.substr(begin, end - begin);

    if (token == kPendingToken) return SlotEntry::pending();
    if (token.empty() || token == kVacantToken) return SlotEntry::vacant();

    for (char c : token) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return SlotEntry::vacant();
    }
    if (token.size() > 10) return SlotEntry::vacant();
    long long pid = std::strtoll(token.c_str(), nullptr, 10);
    if (pid <= 0 || pid > INT_MAX) return SlotEntry::vacant();
    return SlotEntry::running(static_cast<pid_t>(pid));
}

std::string Registry::format_entry(const SlotEntry& entry) {
    switch (entry.state) {
        case SlotState::Pending: return kPendingToken;
        case SlotState::Running: return std::to_string(entry.pid);
        case SlotState::Vacant:  return kVacantToken;
    }
    return kVacantToken;
}

bool Registry::load() {
    slots_.clear();
    std::error_code ec;
    if (!fs::is_regular_file(path_, ec)) return false;
    std::ifstream fin(path_);
    if (!fin.is_open()) return false;

    std::string line;
    while (std::getline(fin, line)) {
        slots_.push_back(parse_line(line));
    }
    return !fin.bad();
}

bool Registry::save() const {
    std::error_code ec;
    fs::path parent = fs::path(path_).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) return false;
    }

    // Atomic write: write to temp file, then rename
    std::string tmp = path_ + ".tmp";
    std::ofstream fout(tmp, std::ios::trunc);
    if (!fout.is_open()) return false;
    for (const auto& entry : slots_) {
        fout << format_entry(entry) << "\n";
    }
    fout.close();
    if (fout.fail()) {
        fs::remove(tmp, ec);
        return false;
    }
    fs::rename(tmp, path_, ec);
    return !ec;
}

bool Registry::remove() const {
    std::error_code ec;
    fs::remove(path_, ec);
    return !ec;
}

void Registry::reserve(size_t n) {
    slots_.assign(n, SlotEntry::pending());
}

bool Registry::resize(size_t n) {
    if (slots_.size() == n) return false;
    slots_.resize(n, SlotEntry::vacant());
    return true;
}
