#pragma once
#include <optional>
#include <string>
#include <vector>
#include "driver.hpp"
#include "sqlconnection.hpp"

namespace migrator {

struct LogTableConfig {
    std::string schema;                     // optional: Postgres schema / SQLite attached database
    std::string table = "schema_migrations";
};

/**
 * @brief Application log kept in a SQL table.
 *
 * Table layout (one row per applied / reverted migration):
 *   id, version, migration_name, direction ('u' | 'd'), start_time, end_time
 * Rows are replayed by ascending id.
 */
class SqlLogDriver final : public LogDriver {
public:
    // The connection must already be connected and outlive the driver.
    SqlLogDriver(SQLConnection& conn, LogTableConfig config);

    std::vector<LogEntry> list_migrations_log() override;

    /**
     * @brief Records one event.
     *
     * Without @p applied_at the database stamps the row with its current UTC
     * time. start_time has second precision: sub-second parts are dropped.
     */
    void append(const Migration& mig, Direction dir, std::optional<TimePoint> applied_at = std::nullopt);

    // Records @p entry with its own applied_at, the zero time point included.
    void append(const LogEntry& entry);

    // CREATE TABLE IF NOT EXISTS for the configured dialect.
    void ensure_table();

    const std::string& table_name() const { return table_name_; }

private:
    SQLConnection& conn_;
    std::string table_name_; // quoted, schema-qualified
};

// "name" with embedded quotes doubled; throws ConfigError on empty / NUL.
std::string quote_identifier(const std::string& name);

} // namespace migrator
