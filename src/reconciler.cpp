#include "reconciler.hpp"
#include <algorithm>
#include <unordered_set>

namespace migrator {

FoldedLog fold_log(const std::vector<LogEntry>& log) {
    FoldedLog folded;
    for (const auto& entry : log) {
        State st;
        st.description = Description{entry.migration, false};
        if (entry.direction == Direction::Up) {
            st.status = Status::Applied;
            st.applied_at = entry.applied_at;
        } else {
            st.status = Status::Pending;
            st.applied_at = TimePoint{};
        }
        folded[entry.migration.version] = std::move(st); // replaces whatever came before
    }
    return folded;
}

ValidationResult reconcile(const std::vector<Description>& catalog, const std::vector<LogEntry>& log) {
    const FoldedLog folded = fold_log(log);

    ValidationResult result;
    result.migrations.reserve(catalog.size() + folded.size());

    std::unordered_set<Version> known;
    known.reserve(catalog.size());

    for (const auto& descr : catalog) {
        known.insert(descr.migration.version);

        State st;
        st.description = descr; // catalog can_undo wins over the log
        auto it = folded.find(descr.migration.version);
        if (it != folded.end()) {
            st.status = it->second.status;
            st.applied_at = it->second.applied_at;
        }

        if (st.status == Status::Pending) result.pending_count++;
        else result.applied_count++;

        result.migrations.push_back(std::move(st));
    }

    // orphans: logged but the definition is gone
    for (const auto& [version, logged] : folded) {
        if (known.count(version)) continue;
        State st = logged;
        st.description.can_undo = false;
        st.status = Status::Missing;
        result.migrations.push_back(std::move(st));
        result.missing_count++;
    }

    std::stable_sort(result.migrations.begin(), result.migrations.end(),
        [](const State& a, const State& b) { return a.version() < b.version(); });
    return result;
}

} // namespace migrator
