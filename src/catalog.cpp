#include "catalog.hpp"
#include <algorithm>
#include <charconv>
#include <map>
#include "lib.hpp"
#include "logger.hpp"

#define ER_DUPLICATE "version %llu has conflicting names: \"%s\" and \"%s\""

namespace migrator {

namespace {

    bool ends_with(std::string_view s, std::string_view suffix) {
        return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
    }

    // Merges one parsed file into the per-version accumulator.
    void merge(std::map<Version, Description>& acc, const ParsedName& parsed) {
        const Migration& mig = parsed.migration;
        auto it = acc.find(mig.version);
        if (it == acc.end()) {
            acc.emplace(mig.version, Description{mig, parsed.direction == Direction::Down});
            return;
        }
        Description& known = it->second;
        if (known.migration.name != mig.name) {
            logger()->error("Duplicate migration version {}: '{}' and '{}'",
                mig.version, known.migration.name, mig.name);
            THROW_AS(DuplicateVersionError, ER_DUPLICATE,
                static_cast<unsigned long long>(mig.version),
                known.migration.name.c_str(), mig.name.c_str());
        }
        if (parsed.direction == Direction::Down) known.can_undo = true; // never reset by an up file
    }
}

std::optional<ParsedName> parse_file_name(std::string_view file_name) {
    if (file_name.substr(0, kVersionPrefix.size()) != kVersionPrefix) return std::nullopt;
    std::string_view rest = file_name.substr(kVersionPrefix.size());

    ParsedName parsed;
    if (ends_with(rest, kUpSuffix)) {
        parsed.direction = Direction::Up;
        rest.remove_suffix(kUpSuffix.size());
    } else if (ends_with(rest, kDownSuffix)) {
        parsed.direction = Direction::Down;
        rest.remove_suffix(kDownSuffix.size());
    } else {
        return std::nullopt;
    }

    // version digits, '_' and at least one character of name
    if (rest.size() < kVersionLength + 1) return std::nullopt;

    std::string_view digits = rest.substr(0, kVersionLength);
    if (!std::all_of(digits.begin(), digits.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        return std::nullopt;
    }
    Version version = 0;
    auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), version, 10);
    if (ec != std::errc() || end != digits.data() + digits.size()) return std::nullopt;

    if (rest[kVersionLength] != '_') return std::nullopt;

    std::string_view name = rest.substr(kVersionLength + 1);
    if (name.empty()) return std::nullopt;

    parsed.migration.version = version;
    parsed.migration.name = std::string(name);
    return parsed;
}

std::string file_name_for(const Migration& mig, Direction dir) {
    std::string digits = std::to_string(mig.version);
    if (digits.size() < kVersionLength) digits.insert(0, kVersionLength - digits.size(), '0');
    std::string name(kVersionPrefix);
    name += digits + "_" + mig.name;
    name += dir == Direction::Up ? kUpSuffix : kDownSuffix;
    return name;
}

std::vector<Description> build_catalog(const std::vector<DirEntry>& entries) {
    std::map<Version, Description> acc; // keyed by version, iterates ascending

    for (const auto& entry : entries) {
        if (entry.is_directory || !entry.is_regular_file) continue;

        auto parsed = parse_file_name(entry.name);
        if (!parsed) {
            logger()->debug("Skipping '{}': not a migration file name", entry.name);
            continue;
        }
        merge(acc, *parsed);
    }

    std::vector<Description> catalog;
    catalog.reserve(acc.size());
    for (auto& [version, descr] : acc) {
        catalog.push_back(std::move(descr));
    }
    return catalog;
}

} // namespace migrator
