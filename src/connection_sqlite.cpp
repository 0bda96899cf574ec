#include "sqlconnection.hpp"
#include <sqlite3.h>
#include <stdexcept>
#include <lib.hpp>

class SQLiteStatement final : public SQLStatement {
public:
    explicit SQLiteStatement(sqlite3_stmt* stmt)
        : stmt_(stmt) { }
    ~SQLiteStatement() override {
        if (stmt_) sqlite3_finalize(stmt_);
    }

    void bind(int idx, const std::string& value) override {
        //handle unicode string UTF-8
        check_(sqlite3_bind_text(stmt_, idx, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT));
    }

    void bind(int idx, int64_t value) override {
        check_(sqlite3_bind_int64(stmt_, idx, value));
    }

    int exec() override {
        int rc = sqlite3_step(stmt_);
        if (rc != SQLITE_DONE && rc != SQLITE_ROW) {
            THROW("SQLite exec failed: %s", errmsg_());
        }
        return sqlite3_changes(sqlite3_db_handle(stmt_));
    }

    bool next() override {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        THROW("SQLite step failed: %s", errmsg_());
    }

    bool is_null(int col) const override {
        return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
    }

    std::string text(int col) const override {
        const unsigned char* t = sqlite3_column_text(stmt_, col);
        if (!t) return {};
        return std::string(reinterpret_cast<const char*>(t), sqlite3_column_bytes(stmt_, col));
    }

    int64_t int64(int col) const override {
        return sqlite3_column_int64(stmt_, col);
    }

private:
    const char* errmsg_() const {
        return sqlite3_errmsg(sqlite3_db_handle(stmt_));
    }

    void check_(int rc) {
        if (rc != SQLITE_OK) THROW("SQLite bind failed: %s", errmsg_());
    }

    sqlite3_stmt* stmt_;
};

class SQLiteConnection final : public SQLConnection {
public:
    ~SQLiteConnection() override { disconnect(); }

    void connect(const std::string& dsn) override {
        disconnect();
        if (sqlite3_open(dsn.c_str(), &db_) != SQLITE_OK) {
            std::string err = db_ ? sqlite3_errmsg(db_) : "out of memory";
            disconnect(); // sqlite3_open allocates a handle even on failure
            THROW("Failed to open SQLite DB '%s': %s", dsn.c_str(), err.c_str());
        }
    }

    void disconnect() override {
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }

    std::unique_ptr<SQLStatement> prepare(const std::string& sql) override {
        if (!db_) THROW("prepare: not connected");
        sqlite3_stmt* stmt = nullptr;
        // (the number of chars where 1 char = 1 byte) + 1 null_terminator
        if (sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size() + 1), &stmt, nullptr) != SQLITE_OK) {
            THROW("SQLite prepare failed: %s [%s]", sqlite3_errmsg(db_), sql.c_str());
        }
        return std::make_unique<SQLiteStatement>(stmt);
    }

    Dialect dialect() const override { return Dialect::SQLite; }

private:
    sqlite3* db_ = nullptr;
};

PSQLConnection make_sqlite_connection() {
    return std::make_unique<SQLiteConnection>();
}
