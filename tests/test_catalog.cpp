#define CATCH_CONFIG_MAIN
#include "catch.hpp"
#include <algorithm>
#include "catalog.hpp"
#include "lib.hpp"
#include "fakes.hpp"

using namespace migrator;

static Description descr(Version v, const std::string& name, bool undo) {
    return Description{Migration{v, name}, undo};
}

TEST_CASE("parse_file_name accepts up and down files", "[catalog][parse]") {
    auto up = parse_file_name("V20211224091800_add_users_table.up.sql");
    REQUIRE(up);
    CHECK(up->migration.version == 20211224091800ULL);
    CHECK(up->migration.name == "add_users_table");
    CHECK(up->direction == Direction::Up);

    auto down = parse_file_name("V20211224091800_add_users_table.down.sql");
    REQUIRE(down);
    CHECK(down->migration == up->migration);
    CHECK(down->direction == Direction::Down);
}

TEST_CASE("parse_file_name keeps everything after the underscore as name", "[catalog][parse]") {
    auto p = parse_file_name("V00000000000001_a_b.c.up.sql");
    REQUIRE(p);
    CHECK(p->migration.version == 1);
    CHECK(p->migration.name == "a_b.c");
}

TEST_CASE("parse_file_name rejects names off the convention", "[catalog][parse]") {
    CHECK_FALSE(parse_file_name("20211224091800_add_users_table.up.sql"));   // no V
    CHECK_FALSE(parse_file_name("v20211224091800_add_users_table.up.sql"));  // lower case v
    CHECK_FALSE(parse_file_name("V20211224091800_add_users_table.sql"));     // no direction
    CHECK_FALSE(parse_file_name("V20211224091800_add_users_table.up.hmf"));  // other extension
    CHECK_FALSE(parse_file_name("V20211224091800_add_users_table.up"));
    CHECK_FALSE(parse_file_name("V2021122409180_add_users_table.up.sql"));   // 13 digits
    CHECK_FALSE(parse_file_name("VA0211224091800_add_users_table.up.sql"));  // non-digit first
    CHECK_FALSE(parse_file_name("V2021122409180X_add_users_table.up.sql"));  // non-digit last
    CHECK_FALSE(parse_file_name("V+0211224091800_add_users_table.up.sql"));  // sign
    CHECK_FALSE(parse_file_name("V20211224091800add_users_table.up.sql"));   // no underscore
    CHECK_FALSE(parse_file_name("V20211224091800-add_users_table.up.sql"));
    CHECK_FALSE(parse_file_name("V20211224091800_.up.sql"));                 // empty name
    CHECK_FALSE(parse_file_name("V20211224091800.up.sql"));                  // too short
    CHECK_FALSE(parse_file_name("V.up.sql"));
    CHECK_FALSE(parse_file_name(""));
}

TEST_CASE("file_name_for pads the version to 14 digits", "[catalog][parse]") {
    CHECK(file_name_for(Migration{42, "x"}, Direction::Up) == "V00000000000042_x.up.sql");
    CHECK(file_name_for(Migration{20211224091800, "add_users_table"}, Direction::Down)
          == "V20211224091800_add_users_table.down.sql");
}

TEST_CASE("up + down files give one undoable description", "[catalog]") {
    auto catalog = build_catalog({
        file("V20211224091800_add_users_table.up.sql"),
        file("V20211224091800_add_users_table.down.sql"),
    });
    REQUIRE(catalog.size() == 1);
    CHECK(catalog[0] == descr(20211224091800, "add_users_table", true));
}

TEST_CASE("catalog is sorted by version whatever the listing order", "[catalog]") {
    std::vector<DirEntry> entries = {
        file("V20211224091800_add_users_table.up.sql"),
        file("V20211224081255_initial.up.sql"),
        file("V20211224091800_add_users_table.down.sql"),
        file("V00000000000009_nine.up.sql"),
        file("V00000000000010_ten.up.sql"),
    };
    auto catalog = build_catalog(entries);
    REQUIRE(catalog.size() == 4);
    CHECK(catalog[0] == descr(9, "nine", false));
    CHECK(catalog[1] == descr(10, "ten", false)); // numeric, not lexical, order
    CHECK(catalog[2] == descr(20211224081255, "initial", false));
    CHECK(catalog[3] == descr(20211224091800, "add_users_table", true));

    SECTION("rebuilding from the same listing gives the same catalog") {
        CHECK(build_catalog(entries) == catalog);
    }
}

TEST_CASE("can_undo is set by a down file seen before or after the up file", "[catalog]") {
    auto down_first = build_catalog({
        file("V20211224091800_add_users_table.down.sql"),
        file("V20211224091800_add_users_table.up.sql"),
    });
    REQUIRE(down_first.size() == 1);
    CHECK(down_first[0].can_undo);

    auto down_only = build_catalog({ file("V20211224091800_add_users_table.down.sql") });
    REQUIRE(down_only.size() == 1);
    CHECK(down_only[0].can_undo);
}

TEST_CASE("invalid names are skipped, not reported", "[catalog]") {
    auto catalog = build_catalog({
        file("README.md"),
        file("V2021122409180_short.up.sql"),
        file("X20211224091800_add_users_table.up.sql"),
        file("V20211224091800_add_users_table.up.sql"),
        file("V20211224091801_broken.up.txt"),
        file("V20211224091802_.up.sql"),
    });
    REQUIRE(catalog.size() == 1);
    CHECK(catalog[0] == descr(20211224091800, "add_users_table", false));
}

TEST_CASE("directories and special files are excluded", "[catalog]") {
    auto catalog = build_catalog({
        dir("V20211224081255_initial.up.sql"),
        DirEntry{"V20211224081256_link.up.sql", false, false}, // symlink / device
        file("V20211224091800_add_users_table.up.sql"),
    });
    REQUIRE(catalog.size() == 1);
    CHECK(catalog[0].migration.version == 20211224091800ULL);
}

TEST_CASE("same version with another name fails the whole build", "[catalog][duplicate]") {
    std::vector<DirEntry> entries = {
        file("V20211224081255_initial.up.sql"),
        file("V20211224091800_add_users_table.up.sql"),
        file("V20211224091800_add_posts_table.up.sql"),
    };
    REQUIRE_THROWS_AS(build_catalog(entries), DuplicateVersionError);

    SECTION("regardless of listing order") {
        std::reverse(entries.begin(), entries.end());
        REQUIRE_THROWS_AS(build_catalog(entries), DuplicateVersionError);
    }

    SECTION("a conflicting down file counts too") {
        std::vector<DirEntry> mixed = {
            file("V20211224091800_add_users_table.up.sql"),
            file("V20211224091800_add_posts_table.down.sql"),
        };
        REQUIRE_THROWS_WITH(build_catalog(mixed),
            Catch::Contains("20211224091800") && Catch::Contains("add_users_table") && Catch::Contains("add_posts_table"));
    }
}

TEST_CASE("an empty listing gives an empty catalog", "[catalog]") {
    CHECK(build_catalog({}).empty());
}
