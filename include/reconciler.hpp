#pragma once
#include <map>
#include <vector>
#include "migration.hpp"

namespace migrator {

using FoldedLog = std::map<Version, State>;

/**
 * @brief Replay the application log into the last known state of each version.
 *
 * Entries are replayed in the given (recorded) order, never by timestamp.
 * The last entry of a version wins:
 *  - Up   => Applied, applied_at = entry time
 *  - Down => Pending, applied_at = zero
 */
FoldedLog fold_log(const std::vector<LogEntry>& log);

/**
 * @brief Classify every known version as pending, applied or missing.
 *
 * This method performs the following steps:
 * 1. fold the log (see fold_log)
 * 2. for each catalog Description: fold status, or Pending when never logged
 * 3. versions logged but absent from the catalog are Missing, can_undo = false
 * 4. sort everything ascending by version
 *
 * @param catalog output of build_catalog, ascending by version
 * @param log application log, in recorded order
 */
ValidationResult reconcile(const std::vector<Description>& catalog, const std::vector<LogEntry>& log);

} // namespace migrator
