#pragma once
#include <memory>
#include <string>
#include <vector>
#include "catalog.hpp"
#include "migration.hpp"

namespace migrator {

// Lists the entries of the migrations directory.
class DirectoryLister {
public:
    virtual ~DirectoryLister() = default;
    virtual std::vector<DirEntry> list() = 0;
};

// Where migration definitions come from.
class MigrationSource {
public:
    virtual ~MigrationSource() = default;

    // Catalog of available migrations, ascending by version.
    virtual std::vector<Description> available_migrations() = 0;

    // Script text for one direction of a migration.
    virtual std::string read_migration(const Migration& mig, Direction dir) = 0;
};

using PDirectoryLister = std::unique_ptr<DirectoryLister>;

} // namespace migrator
