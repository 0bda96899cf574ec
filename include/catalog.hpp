#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "migration.hpp"

namespace migrator {

/****************** NAMING CONVENTION: V<14-digit version>_<name>.<up|down>.sql */
inline constexpr std::string_view kVersionPrefix = "V";
inline constexpr std::string_view kUpSuffix      = ".up.sql";
inline constexpr std::string_view kDownSuffix    = ".down.sql";
inline constexpr std::size_t      kVersionLength = 14;

// One entry of a directory listing, as reported by a DirectoryLister.
struct DirEntry {
    std::string name;
    bool is_directory    = false;
    bool is_regular_file = false;
};

struct ParsedName {
    Migration migration;
    Direction direction = Direction::Up;
};

/**
 * @brief Parse a migration file name.
 *
 * Accepts exactly V<14 decimal digits>_<name>.up.sql and the .down.sql
 * counterpart. Any violation gives std::nullopt; a bad name is never an error.
 */
std::optional<ParsedName> parse_file_name(std::string_view file_name);

// File name for a migration script (inverse of parse_file_name).
std::string file_name_for(const Migration& mig, Direction dir);

/**
 * @brief Build the migration catalog from a directory listing.
 *
 * This method performs the following steps:
 * 1. skip everything that is not a regular file
 * 2. skip files whose name does not follow the naming convention
 * 3. merge up / down files by version, in listing order
 *       3.1. the first file of a version seeds the Description (can_undo = is down)
 *       3.2. a down file for a known version sets can_undo
 *       3.3. a known version with another name throws DuplicateVersionError
 * 4. return the Descriptions sorted ascending by version
 *
 * @param entries directory listing, in listing order
 * @return the catalog; nothing on failure (the build is all or nothing)
 */
std::vector<Description> build_catalog(const std::vector<DirEntry>& entries);

} // namespace migrator
