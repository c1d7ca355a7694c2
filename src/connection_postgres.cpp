// connection_postgres.cpp
#include "sqlconnection.hpp"

#if HAVE_POSTGRESQL
#include <libpq-fe.h>
#include <cstdlib>
#include <vector>

/*=============================  PgStatement  =============================*/
class PgStatement final : public SQLStatement {
public:
    PgStatement(PGconn* conn, std::string sql, std::string name)
        : conn_(conn), sql_(std::move(sql)) { name_ = std::move(name); }

    ~PgStatement() override { clear_(); }

    void bind(int idx, const std::string& value) override {
        ensure_slot_(idx);
        values_[idx-1] = value;          // own storage
        nulls_[idx-1] = false;
    }

    void bind_null(int idx) override {
        ensure_slot_(idx);
        values_[idx-1].clear();
        nulls_[idx-1] = true;
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

    std::string column_text(int col) override {
        check_row_();
        if (PQgetisnull(res_, row_, col)) return "";
        return std::string(PQgetvalue(res_, row_, col), static_cast<size_t>(PQgetlength(res_, row_, col)));
    }

    bool column_null(int col) override {
        check_row_();
        return PQgetisnull(res_, row_, col) == 1;
    }

private:
    void run_() {
        clear_();
        std::vector<const char*> params(values_.size(), nullptr);
        std::vector<int> lengths(values_.size(), 0);
        for (size_t i = 0; i < values_.size(); ++i) {
            if (nulls_[i]) continue;
            params[i] = values_[i].c_str();
            lengths[i] = static_cast<int>(values_[i].size());
        }
        const int nParams = static_cast<int>(params.size());
        res_ = PQexecParams(
            conn_,
            sql_.c_str(),
            nParams,
            nullptr,                                   // let server infer types
            (nParams ? params.data()  : nullptr),
            (nParams ? lengths.data() : nullptr),
            nullptr,                                   // all text format
            0                                          // text results
        );
        if (!res_) THROW_AS(ErrKind::Store, "Postgres exec failed: no result");

        auto st = PQresultStatus(res_);
        if (st != PGRES_COMMAND_OK && st != PGRES_TUPLES_OK) {
            std::string err = PQerrorMessage(conn_);
            clear_();
            THROW_AS(ErrKind::Store, "Postgres exec failed: %s", err.c_str());
        }
    }

    void check_row_() const {
        if (!res_ || row_ < 0 || row_ >= PQntuples(res_)) THROW_AS(ErrKind::Store, "no current row");
    }

    void ensure_slot_(int idx) {
        if (idx < 1) THROW_AS(ErrKind::Store, "bind: index must be >= 1");
        if (static_cast<size_t>(idx) > values_.size()) {
            values_.resize(idx);
            nulls_.resize(idx, true);
        }
    }

    void clear_() {
        if (res_) PQclear(res_);
        res_ = nullptr;
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
            THROW_AS(ErrKind::Store, "Postgres connect failed: %s", err.c_str());
        }
    }

    void disconnect() override {
        if (conn_) {
            PQfinish(conn_);
            conn_ = nullptr;
        }
        tr_started_ = false;
    }

    bool begin() override {
        if (tr_started_) return true;
        execute("BEGIN;");
        tr_started_ = true;
        return true;
    }

    bool commit() override {
        if (!tr_started_) return false;
        execute("COMMIT;");
        tr_started_ = false;
        return true;
    }

    void rollback() override {
        if (!tr_started_) return;
        tr_started_ = false;
        PGresult* res = PQexec(conn_, "ROLLBACK;");
        if (!res || PQresultStatus(res) != PGRES_COMMAND_OK) {
            LOG_ERROR("Postgres rollback failed: %s", PQerrorMessage(conn_));
        }
        if (res) PQclear(res);
    }

    std::unique_ptr<SQLStatement> prepare(const std::string& sql) override {
        if (!conn_) THROW_AS(ErrKind::Store, "prepare: not connected");
        return std::make_unique<PgStatement>(conn_, sql, stmt_name());
    }

    void execute(const std::string& sql) override {
        if (!conn_) THROW_AS(ErrKind::Store, "execute: not connected");
        PGresult* res = PQexec(conn_, sql.c_str());
        if (!res) THROW_AS(ErrKind::Store, "Postgres error executing: %s", sql.c_str());
        if (PQresultStatus(res) != PGRES_COMMAND_OK) {
            std::string err = PQerrorMessage(conn_);
            PQclear(res);
            THROW_AS(ErrKind::Store, "Postgres error: %s", err.c_str());
        }
        PQclear(res);
    }

private:
    PGconn* conn_ = nullptr;
};

PSQLConnection make_postgres_connection() {
    return std::make_unique<PgConnection>();
}
#endif
