#include "migrator.hpp"
#include <exception>
#include "lib.hpp"
#include "logger.hpp"
#include "reconciler.hpp"

namespace migrator {

ValidationResult Migrator::validate() {
    std::vector<Description> available;
    try {
        available = source_.available_migrations();
    } catch (const std::exception& e) {
        std::throw_with_nested(SourceError(std::string("failed to get the list of available migrations: ") + e.what()));
    }

    std::vector<LogEntry> log;
    try {
        log = driver_.list_migrations_log();
    } catch (const std::exception& e) {
        std::throw_with_nested(LogError(std::string("failed to get the list of applied migrations: ") + e.what()));
    }

    ValidationResult result = reconcile(available, log);
    logger()->info("Migrations: {} applied, {} pending, {} missing",
        result.applied_count, result.pending_count, result.missing_count);
    if (result.missing_count > 0) {
        logger()->warn("{} applied migration(s) have no definition in the migrations directory", result.missing_count);
    }
    return result;
}

} // namespace migrator
