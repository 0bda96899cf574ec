#pragma once
#include <string>
#include "jsonhlp.hpp"
#include "sql_driver.hpp"
#include "sqlconnection.hpp"

/****************** CONFIG KEYS */
#define CFG_MIGRATIONS_DIR "migrations_dir"
#define CFG_DIALECT        "dialect"
#define CFG_DSN            "dsn"
#define CFG_LOG_TABLE      "log_table"
#define CFG_DATABASE       "database"
#define CFG_LOG_LEVEL      "log_level"
#define CFG_OUTPUT         "output"

namespace migrator {

enum class OutputFormat { Text, Json };

struct MigratorConfig {
    std::string    migrations_dir;               // required
    Dialect        dialect   = Dialect::SQLite;
    std::string    dsn;                          // required: SQLite file / Postgres conninfo
    LogTableConfig log_table;
    std::string    log_level = "info";
    OutputFormat   output    = OutputFormat::Text;

    // Throws ConfigError on missing / invalid keys.
    static MigratorConfig from_json(const jval& j);
    static MigratorConfig from_string(const std::string& text);
    static MigratorConfig from_file(const std::string& path);
};

Dialect dialect_from_string(const std::string& name);

} // namespace migrator
