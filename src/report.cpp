#include "report.hpp"
#include <iomanip>
#include <sstream>
#include "jsonhlp.hpp"

namespace migrator {

namespace {
    // applied rows always carry a real time, the epoch included
    bool has_time(const State& st) {
        return st.status == Status::Applied || st.applied_at != TimePoint{};
    }
}

std::string render_text(const ValidationResult& result) {
    std::ostringstream ss;
    for (const auto& st : result.migrations) {
        std::string at = has_time(st) ? format_time(st.applied_at) : "";
        ss << std::setw(14) << std::setfill('0') << st.version() << std::setfill(' ')
           << "  " << std::left << std::setw(8) << to_string(st.status)
           << "  " << std::setw(19) << (at.empty() ? "-" : at)
           << "  " << (st.description.can_undo ? "undo" : "    ")
           << "  " << st.description.migration.name << std::right << "\n";
    }
    ss << result.applied_count << " applied, "
       << result.pending_count << " pending, "
       << result.missing_count << " missing\n";
    return ss.str();
}

std::string render_json(const ValidationResult& result, bool pretty) {
    jdoc doc;
    doc.SetObject();
    auto& a = doc.GetAllocator();

    jval list(rapidjson::kArrayType);
    for (const auto& st : result.migrations) {
        jval item(rapidjson::kObjectType);
        jhlp::set<uint64_t>(item, "version", st.version(), a);
        jhlp::set<std::string>(item, "name", st.description.migration.name, a);
        jhlp::set<std::string>(item, "status", to_string(st.status), a);
        jhlp::set<bool>(item, "can_undo", st.description.can_undo, a);
        if (!has_time(st)) {
            jval null(rapidjson::kNullType);
            item.AddMember("applied_at", null, a);
        } else {
            jhlp::set<std::string>(item, "applied_at", format_time(st.applied_at), a);
        }
        list.PushBack(item, a);
    }
    doc.AddMember("migrations", list, a);
    jhlp::set<unsigned>(doc, "applied", result.applied_count, a);
    jhlp::set<unsigned>(doc, "pending", result.pending_count, a);
    jhlp::set<unsigned>(doc, "missing", result.missing_count, a);

    return jhlp::stringify(doc, pretty);
}

} // namespace migrator
