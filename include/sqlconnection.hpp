#pragma once
#include <cstdint>
#include <memory>
#include <string>

enum class Dialect { SQLite, Postgres };

class SQLStatement {
public:
    virtual ~SQLStatement() = default;

    // Positional parameters, 1-based.
    virtual void bind(int idx, const std::string& value) = 0;
    virtual void bind(int idx, int64_t value) = 0;

    virtual int exec() = 0;  // return rows affected

    // Query cursor: advance to the next row, false when exhausted.
    // Columns are 0-based and valid until the next call to next().
    virtual bool next() = 0;
    virtual bool is_null(int col) const = 0;
    virtual std::string text(int col) const = 0;
    virtual int64_t int64(int col) const = 0;
};

class SQLConnection {
public:
    virtual ~SQLConnection() = default;

    // Connect using a DSN / path (SQLite: filename; Postgres: conninfo).
    virtual void connect(const std::string& dsn) = 0;

    // Safe to call multiple times.
    virtual void disconnect()  = 0;

    virtual std::unique_ptr<SQLStatement> prepare(const std::string& sql) = 0;

    virtual Dialect dialect() const = 0;

    // "?1" for SQLite, "$1" for Postgres
    std::string placeholder(int idx) const {
        return (dialect() == Dialect::Postgres ? "$" : "?") + std::to_string(idx);
    }
};

// Helpers for ownership
using PSQLConnection = std::unique_ptr<SQLConnection>;

PSQLConnection make_sqlite_connection();
#if HAVE_POSTGRESQL
PSQLConnection make_postgres_connection();
#endif
