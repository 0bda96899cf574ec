#pragma once
#include "driver.hpp"
#include "migration.hpp"
#include "source.hpp"

namespace migrator {

/**
 * Ties a migration source to an application log.
 *
 * Both collaborators are borrowed and must outlive the Migrator. Every call
 * re-reads both; nothing is cached between calls.
 */
class Migrator {
public:
    Migrator(MigrationSource& source, LogDriver& driver)
        : source_(source), driver_(driver) { }

    /**
     * @brief Report the status of every known migration.
     *
     * Collaborator failures are rethrown as SourceError / LogError with the
     * original exception nested; no partial result is returned.
     */
    ValidationResult validate();

private:
    MigrationSource& source_;
    LogDriver& driver_;
};

} // namespace migrator
