#include "catch.hpp"
#include <filesystem>
#include <fstream>
#include <random>
#include "files_source.hpp"
#include "lib.hpp"

namespace fs = std::filesystem;
using namespace migrator;

// Fresh directory under the system temp dir, removed on scope exit.
struct TempDir {
    fs::path path;
    TempDir() {
        std::random_device rd;
        path = fs::temp_directory_path() / ("migrator-test-" + std::to_string(rd()));
        fs::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
    void write(const std::string& name, const std::string& content = "") const {
        std::ofstream(path / name) << content;
    }
};

TEST_CASE("lister refuses a missing root", "[files][config]") {
    TempDir tmp;
    REQUIRE_THROWS_AS(FsDirectoryLister(tmp.path / "nope"), ConfigError);
    REQUIRE_THROWS_AS(FilesSource(tmp.path / "nope"), ConfigError);
}

TEST_CASE("lister refuses a root that is a file", "[files][config]") {
    TempDir tmp;
    tmp.write("plain");
    REQUIRE_THROWS_AS(FsDirectoryLister(tmp.path / "plain"), ConfigError);
}

TEST_CASE("lister refuses a device", "[files][config]") {
    if (!fs::exists("/dev/null")) return;
    REQUIRE_THROWS_AS(FsDirectoryLister("/dev/null"), ConfigError);
}

TEST_CASE("lister reports files and directories sorted by name", "[files]") {
    TempDir tmp;
    tmp.write("b.txt");
    tmp.write("a.txt");
    fs::create_directory(tmp.path / "c");

    FsDirectoryLister lister(tmp.path);
    auto entries = lister.list();
    REQUIRE(entries.size() == 3);
    CHECK(entries[0].name == "a.txt");
    CHECK(entries[0].is_regular_file);
    CHECK_FALSE(entries[0].is_directory);
    CHECK(entries[1].name == "b.txt");
    CHECK(entries[2].name == "c");
    CHECK(entries[2].is_directory);
    CHECK_FALSE(entries[2].is_regular_file);
}

TEST_CASE("files source builds the catalog from a real directory", "[files]") {
    TempDir tmp;
    tmp.write("V20211224081255_initial.up.sql", "CREATE TABLE t(id INT);");
    tmp.write("V20211224091800_add_users_table.up.sql", "CREATE TABLE users(id INT);");
    tmp.write("V20211224091800_add_users_table.down.sql", "DROP TABLE users;");
    tmp.write("notes.md");
    fs::create_directory(tmp.path / "V20211224091801_dir.up.sql");
    fs::create_directory(tmp.path / "archive");
    tmp.write("archive/V20211224091802_nested.up.sql");

    FilesSource source(tmp.path);
    auto catalog = source.available_migrations();
    REQUIRE(catalog.size() == 2);
    CHECK(catalog[0] == Description{Migration{20211224081255, "initial"}, false});
    CHECK(catalog[1] == Description{Migration{20211224091800, "add_users_table"}, true});

    SECTION("unchanged directory, unchanged catalog") {
        CHECK(source.available_migrations() == catalog);
    }

    SECTION("scripts can be read back by direction") {
        CHECK(source.read_migration(catalog[1].migration, Direction::Down) == "DROP TABLE users;");
        CHECK(source.read_migration(catalog[1].migration, Direction::Up) == "CREATE TABLE users(id INT);");
        REQUIRE_THROWS_AS(source.read_migration(catalog[0].migration, Direction::Down), SourceError);
    }
}

TEST_CASE("symlinked migration files are skipped", "[files]") {
    TempDir tmp;
    tmp.write("target.sql");
    std::error_code ec;
    fs::create_symlink(tmp.path / "target.sql", tmp.path / "V20211224091800_link.up.sql", ec);
    if (ec) return; // filesystem without symlinks

    FilesSource source(tmp.path);
    CHECK(source.available_migrations().empty());
}

TEST_CASE("files source reports duplicate versions", "[files][duplicate]") {
    TempDir tmp;
    tmp.write("V20211224091800_add_users_table.up.sql");
    tmp.write("V20211224091800_add_posts_table.up.sql");

    FilesSource source(tmp.path);
    REQUIRE_THROWS_AS(source.available_migrations(), DuplicateVersionError);
}
