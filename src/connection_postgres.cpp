// connection_postgres.cpp
#include <charconv>
#include <libpq-fe.h>
#include <string>
#include <vector>
#include <cstdlib>
#include <lib.hpp>
#include "sqlconnection.hpp"

/*=============================  PgStatement  =============================*/
class PgStatement final : public SQLStatement {
public:
    PgStatement(PGconn* conn, std::string sql)
        : conn_(conn), sql_(std::move(sql)) { }

    ~PgStatement() override { clear_(); }

    // Bind positional parameter (1-based); everything travels as text
    void bind(int idx, const std::string& value) override {
        ensure_slot_(idx);
        values_[idx-1] = value;  // own storage, pointers taken at exec time
        nulls_[idx-1]  = false;
    }

    void bind(int idx, int64_t value) override {
        bind(idx, std::to_string(value));
    }

    // Execute and return rows affected (INSERT/UPDATE/DELETE) or row count for SELECT
    int exec() override {
        run_();
        if (PQresultStatus(res_) == PGRES_TUPLES_OK) return PQntuples(res_);
        const char* t = PQcmdTuples(res_);
        return (t && *t) ? std::atoi(t) : 0;
    }

    bool next() override {
        if (!res_) {
            run_();
            row_ = -1;
        }
        if (PQresultStatus(res_) != PGRES_TUPLES_OK) return false;
        return ++row_ < PQntuples(res_);
    }

    bool is_null(int col) const override {
        return PQgetisnull(res_, row_, col) == 1;
    }

    std::string text(int col) const override {
        if (is_null(col)) return {};
        return std::string(PQgetvalue(res_, row_, col), PQgetlength(res_, row_, col));
    }

    int64_t int64(int col) const override {
        if (is_null(col)) return 0;
        const char* v = PQgetvalue(res_, row_, col);
        int64_t out = 0;
        auto [end, ec] = std::from_chars(v, v + PQgetlength(res_, row_, col), out);
        if (ec != std::errc()) THROW("Postgres: column %d is not an integer: '%s'", col, v);
        return out;
    }

private:
    void run_() {
        clear_();
        std::vector<const char*> params(values_.size());
        for (size_t i = 0; i < values_.size(); ++i) {
            params[i] = nulls_[i] ? nullptr : values_[i].c_str();
        }
        const int nParams = static_cast<int>(params.size());
        res_ = PQexecParams(
            conn_,
            sql_.c_str(),
            nParams,
            nullptr,                                   // let server infer types
            (nParams ? params.data() : nullptr),
            nullptr,                                   // text params need no lengths
            nullptr,                                   // all text format
            0                                          // text results
        );
        if (!res_) THROW("Postgres exec failed: %s", PQerrorMessage(conn_));

        auto st = PQresultStatus(res_);
        if (st != PGRES_COMMAND_OK && st != PGRES_TUPLES_OK) {
            std::string err = PQerrorMessage(conn_);
            clear_();
            THROW("Postgres exec failed: %s", err.c_str());
        }
    }

    void clear_() {
        if (res_) {
            PQclear(res_);
            res_ = nullptr;
        }
    }

    void ensure_slot_(int idx) {
        if (idx < 1) THROW("bind: index must be >= 1");
        if (static_cast<size_t>(idx) > values_.size()) {
            values_.resize(idx);
            nulls_.resize(idx, true);
        }
    }

    PGconn* conn_;
    std::string sql_;
    std::vector<std::string> values_;
    std::vector<bool> nulls_;
    PGresult* res_ = nullptr;
    int row_ = -1;
};

/*=============================  PgConnection  =============================*/
class PgConnection final : public SQLConnection {
public:
    ~PgConnection() override { disconnect(); }

    void connect(const std::string& dsn) override {
        disconnect();
        conn_ = PQconnectdb(dsn.c_str());
        if (!conn_ || PQstatus(conn_) != CONNECTION_OK) {
            std::string err = conn_ ? PQerrorMessage(conn_) : "no connection";
            disconnect();
            THROW("Postgres connect failed: %s", err.c_str());
        }
    }

    void disconnect() override {
        if (conn_) {
            PQfinish(conn_);
            conn_ = nullptr;
        }
    }

    std::unique_ptr<SQLStatement> prepare(const std::string& sql) override {
        if (!conn_) THROW("prepare: not connected");
        return std::make_unique<PgStatement>(conn_, sql);
    }

    Dialect dialect() const override { return Dialect::Postgres; }

private:
    PGconn* conn_ = nullptr;
};

PSQLConnection make_postgres_connection() {
    return std::make_unique<PgConnection>();
}
