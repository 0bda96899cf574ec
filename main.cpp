#include <iostream>
#include <exception>
#include "config.hpp"
#include "files_source.hpp"
#include "logger.hpp"
#include "migrator.hpp"
#include "report.hpp"
#include "sql_driver.hpp"

using namespace migrator;

static PSQLConnection open_connection(const MigratorConfig& cfg) {
    PSQLConnection conn;
    switch (cfg.dialect) {
    case Dialect::SQLite:
        conn = make_sqlite_connection();
        break;
    case Dialect::Postgres:
#if HAVE_POSTGRESQL
        conn = make_postgres_connection();
#else
        throw ConfigError("PostgreSQL support not built in");
#endif
        break;
    }
    conn->connect(cfg.dsn);
    return conn;
}

static void print_error(const std::exception& e, int depth = 0) {
    std::cerr << std::string(depth * 2, ' ') << (depth ? "caused by: " : "error: ") << e.what() << std::endl;
    try {
        std::rethrow_if_nested(e);
    } catch (const std::exception& inner) {
        print_error(inner, depth + 1);
    }
}

// Usage: migrator [config.json]
// Exit codes: 0 consistent, 2 some migrations missing, 1 error.
int main(int argc, char** argv)
{
    std::string config_path = argc > 1 ? argv[1] : "migrator.json";
    try {
        MigratorConfig cfg = MigratorConfig::from_file(config_path);
        set_log_level(cfg.log_level);

        FilesSource source(cfg.migrations_dir);
        PSQLConnection conn = open_connection(cfg);
        SqlLogDriver driver(*conn, cfg.log_table);

        Migrator mig(source, driver);
        ValidationResult result = mig.validate();

        if (cfg.output == OutputFormat::Json) {
            std::cout << render_json(result, true) << std::endl;
        } else {
            std::cout << "[*] Migrations in " << cfg.migrations_dir << ":" << std::endl;
            std::cout << render_text(result);
        }
        return result.missing_count > 0 ? 2 : 0;
    } catch (const std::exception& e) {
        print_error(e);
        return 1;
    }
}
