#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace migrator {

using Version   = uint64_t;
using TimePoint = std::chrono::system_clock::time_point;

enum class Direction { Up, Down };
enum class Status { Pending, Applied, Missing };

struct Migration {
    Version     version = 0;
    std::string name;

    bool operator==(const Migration&) const = default;
};

// A migration found in the migrations directory.
struct Description {
    Migration migration;
    bool      can_undo = false; // a .down script exists

    bool operator==(const Description&) const = default;
};

// One row of the application log, in the order it was recorded.
struct LogEntry {
    Migration migration;
    Direction direction = Direction::Up;
    TimePoint applied_at {};

    bool operator==(const LogEntry&) const = default;
};

struct State {
    Description description;
    Status      status = Status::Pending;
    TimePoint   applied_at {}; // zero unless status == Applied (or Missing after an Up)

    Version version() const { return description.migration.version; }
    bool operator==(const State&) const = default;
};

struct ValidationResult {
    std::vector<State> migrations; // ascending by version
    unsigned applied_count = 0;
    unsigned pending_count = 0;
    unsigned missing_count = 0;
};

std::string to_string(Status status);

// 'u' / 'd', as stored in the log table
char direction_code(Direction dir);
bool direction_from_code(char code, Direction& dir);

// "YYYY-MM-DD HH:MM:SS" in UTC, sub-second part dropped
std::string format_time(TimePoint tp);

// Inverse of format_time; also accepts a ".fraction" suffix (ignored).
// Anything else fails and leaves @p tp untouched.
bool parse_time(const std::string& text, TimePoint& tp);

} // namespace migrator
