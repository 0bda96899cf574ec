#include "files_source.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>
#include "lib.hpp"
#include "logger.hpp"

namespace fs = std::filesystem;

namespace migrator {

FsDirectoryLister::FsDirectoryLister(fs::path root)
    : root_(std::move(root)) {
    std::error_code ec;
    auto st = fs::status(root_, ec);
    if (ec || !fs::exists(st)) {
        THROW_AS(ConfigError, "migrations directory '%s' does not exist", root_.c_str());
    }
    if (!fs::is_directory(st)) {
        THROW_AS(ConfigError, "migrations directory '%s' is not a directory", root_.c_str());
    }
}

std::vector<DirEntry> FsDirectoryLister::list() {
    std::vector<DirEntry> entries;
    std::error_code ec;
    fs::directory_iterator it(root_, ec);
    if (ec) {
        THROW_AS(SourceError, "failed to read contents of migrations directory '%s': %s",
            root_.c_str(), ec.message().c_str());
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        // symlink_status: a link to a file is not a regular file here
        auto st = it->symlink_status(ec);
        if (ec) break;
        DirEntry e;
        e.name = it->path().filename().string();
        e.is_directory = fs::is_directory(st);
        e.is_regular_file = fs::is_regular_file(st);
        entries.push_back(std::move(e));
    }
    if (ec) {
        THROW_AS(SourceError, "failed to read contents of migrations directory '%s': %s",
            root_.c_str(), ec.message().c_str());
    }
    // directory_iterator order is unspecified
    std::sort(entries.begin(), entries.end(),
        [](const DirEntry& a, const DirEntry& b) { return a.name < b.name; });
    return entries;
}

FilesSource::FilesSource(PDirectoryLister lister, fs::path root)
    : lister_(std::move(lister)), root_(std::move(root)) {
    if (!lister_) THROW_AS(ConfigError, "FilesSource: null directory lister");
}

FilesSource::FilesSource(const fs::path& root)
    : FilesSource(std::make_unique<FsDirectoryLister>(root), root) { }

std::vector<Description> FilesSource::available_migrations() {
    auto catalog = build_catalog(lister_->list());
    logger()->debug("Found {} migration(s) in '{}'", catalog.size(), root_.string());
    return catalog;
}

std::string FilesSource::read_migration(const Migration& mig, Direction dir) {
    fs::path file = root_ / file_name_for(mig, dir);
    std::ifstream ifs(file, std::ios::binary);
    if (!ifs.is_open()) {
        THROW_AS(SourceError, "failed to open migration script '%s'", file.c_str());
    }
    std::ostringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

} // namespace migrator
