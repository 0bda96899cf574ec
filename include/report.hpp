#pragma once
#include <string>
#include "migration.hpp"

namespace migrator {

// One line per migration: version, status, applied_at, undo flag, name; then the counts.
std::string render_text(const ValidationResult& result);

// {"migrations":[{"version":..,"name":..,"status":..,"can_undo":..,"applied_at":..}],
//  "applied":n,"pending":n,"missing":n}
std::string render_json(const ValidationResult& result, bool pretty = false);

} // namespace migrator
