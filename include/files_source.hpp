#pragma once
#include <filesystem>
#include <string>
#include <vector>
#include "source.hpp"

namespace migrator {

// DirectoryLister over the real filesystem.
class FsDirectoryLister final : public DirectoryLister {
public:
    // Throws ConfigError if @p root is missing or not a directory (devices included).
    explicit FsDirectoryLister(std::filesystem::path root);

    // Entries sorted by name; symlinks are neither directories nor regular files.
    std::vector<DirEntry> list() override;

private:
    std::filesystem::path root_;
};

// Migrations stored as V<version>_<name>.<up|down>.sql files in one directory.
class FilesSource final : public MigrationSource {
public:
    FilesSource(PDirectoryLister lister, std::filesystem::path root);

    // Convenience: FsDirectoryLister on @p root.
    explicit FilesSource(const std::filesystem::path& root);

    std::vector<Description> available_migrations() override;
    std::string read_migration(const Migration& mig, Direction dir) override;

private:
    PDirectoryLister lister_;
    std::filesystem::path root_;
};

} // namespace migrator
