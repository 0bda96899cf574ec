#pragma once
#include <vector>
#include "migration.hpp"

namespace migrator {

// Where the application log lives.
class LogDriver {
public:
    virtual ~LogDriver() = default;

    // Every recorded application event, in recording order.
    virtual std::vector<LogEntry> list_migrations_log() = 0;
};

} // namespace migrator
