#include "migration.hpp"
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace migrator {

std::string to_string(Status status) {
    switch (status) {
        case Status::Pending: return "pending";
        case Status::Applied: return "applied";
        case Status::Missing: return "missing";
    }
    return "unknown";
}

char direction_code(Direction dir) {
    return dir == Direction::Up ? 'u' : 'd';
}

bool direction_from_code(char code, Direction& dir) {
    switch (code) {
        case 'u': case 'U': dir = Direction::Up;   return true;
        case 'd': case 'D': dir = Direction::Down; return true;
    }
    return false;
}

std::string format_time(TimePoint tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

bool parse_time(const std::string& text, TimePoint& tp) {
    std::tm tm{};
    std::istringstream ss(text);
    ss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
    if (ss.fail()) return false;

    // PostgreSQL TIMESTAMP text may carry microseconds
    std::string rest;
    std::getline(ss, rest);
    if (!rest.empty()) {
        if (rest.size() < 2 || rest[0] != '.') return false;
        if (!std::all_of(rest.begin() + 1, rest.end(), [](char c) { return c >= '0' && c <= '9'; })) return false;
    }
    tp = std::chrono::system_clock::from_time_t(timegm(&tm));
    return true;
}

} // namespace migrator
