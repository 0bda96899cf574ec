#include "sql_driver.hpp"
#include "lib.hpp"
#include "logger.hpp"

#define ER_LIST "failed to list applied versions from %s: %s"

namespace migrator {

namespace {

    std::string create_table_sql(Dialect dialect, const std::string& table) {
        if (dialect == Dialect::Postgres) {
            return "CREATE TABLE IF NOT EXISTS " + table + " ("
                "id             BIGSERIAL PRIMARY KEY, "
                "version        BIGINT NOT NULL, "
                "migration_name VARCHAR(100) NULL, "
                "direction      CHAR(1) NULL, " // 'u' or 'd'
                "start_time     TIMESTAMP NOT NULL DEFAULT (now() AT TIME ZONE 'utc'), "
                "end_time       TIMESTAMP NULL)";
        }
        return "CREATE TABLE IF NOT EXISTS " + table + " ("
            "id             INTEGER PRIMARY KEY AUTOINCREMENT, "
            "version        BIGINT NOT NULL, "
            "migration_name VARCHAR(100) NULL, "
            "direction      CHAR(1) NULL, " // 'u' or 'd'
            "start_time     TEXT NOT NULL DEFAULT CURRENT_TIMESTAMP, "
            "end_time       TEXT NULL)";
    }

    LogEntry read_row(const SQLStatement& row) {
        LogEntry entry;

        if (row.is_null(0)) THROW_AS(InvalidLogTableError, "log row has no version");
        int64_t version = row.int64(0);
        if (version < 0) {
            THROW_AS(InvalidLogTableError, "log row has a negative version %lld", static_cast<long long>(version));
        }
        entry.migration.version = static_cast<Version>(version);
        entry.migration.name = row.text(1);

        std::string dir = row.text(2);
        if (dir.size() != 1 || !direction_from_code(dir[0], entry.direction)) {
            THROW_AS(InvalidLogTableError, "direction \"%s\" is unknown", dir.c_str());
        }

        // an unreadable timestamp leaves the zero time point
        if (!parse_time(row.text(3), entry.applied_at)) {
            logger()->warn("Log row for version {} has an unreadable start_time '{}'",
                entry.migration.version, row.text(3));
            entry.applied_at = TimePoint{};
        }
        return entry;
    }
}

std::string quote_identifier(const std::string& name) {
    if (name.empty()) THROW_AS(ConfigError, "empty SQL identifier");
    std::string out = "\"";
    for (char c : name) {
        if (c == '\0') THROW_AS(ConfigError, "SQL identifier contains a NUL character");
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

SqlLogDriver::SqlLogDriver(SQLConnection& conn, LogTableConfig config)
    : conn_(conn) {
    table_name_ = config.schema.empty()
        ? quote_identifier(config.table)
        : quote_identifier(config.schema) + "." + quote_identifier(config.table);
}

void SqlLogDriver::ensure_table() {
    try {
        conn_.prepare(create_table_sql(conn_.dialect(), table_name_))->exec();
    } catch (const std::exception& e) {
        THROW_AS(LogError, "failed to create migrations table %s: %s", table_name_.c_str(), e.what());
    }
}

std::vector<LogEntry> SqlLogDriver::list_migrations_log() {
    ensure_table();

    std::vector<LogEntry> log;
    try {
        auto stmt = conn_.prepare(
            "SELECT version, migration_name, direction, start_time FROM " + table_name_ + " ORDER BY id");
        while (stmt->next()) {
            log.push_back(read_row(*stmt));
        }
    } catch (const InvalidLogTableError&) {
        throw;
    } catch (const std::exception& e) {
        THROW_AS(LogError, ER_LIST, table_name_.c_str(), e.what());
    }
    logger()->debug("Read {} log row(s) from {}", log.size(), table_name_);
    return log;
}

void SqlLogDriver::append(const LogEntry& entry) {
    append(entry.migration, entry.direction, entry.applied_at);
}

void SqlLogDriver::append(const Migration& mig, Direction dir, std::optional<TimePoint> applied_at) {
    ensure_table();

    const bool stamped = applied_at.has_value();
    std::string sql = "INSERT INTO " + table_name_ + " (version, migration_name, direction";
    sql += stamped ? ", start_time, end_time) VALUES (" : ") VALUES (";
    sql += conn_.placeholder(1) + ", " + conn_.placeholder(2) + ", " + conn_.placeholder(3);
    sql += stamped ? ", " + conn_.placeholder(4) + ", " + conn_.placeholder(4) + ")" : ")";

    try {
        auto stmt = conn_.prepare(sql);
        stmt->bind(1, static_cast<int64_t>(mig.version));
        stmt->bind(2, mig.name);
        stmt->bind(3, std::string(1, direction_code(dir)));
        if (stamped) stmt->bind(4, format_time(*applied_at));
        stmt->exec();
    } catch (const std::exception& e) {
        THROW_AS(LogError, "failed to record migration %llu in %s: %s",
            static_cast<unsigned long long>(mig.version), table_name_.c_str(), e.what());
    }
}

} // namespace migrator
