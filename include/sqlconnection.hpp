#pragma once
#include <memory>
#include <string>
#include "lib.hpp"

enum class Dialect { SQLite, Postgres };

class SQLStatement {
public:
    virtual ~SQLStatement() = default;

    // 1-based positional parameters
    virtual void bind(int idx, const std::string& value) = 0;
    virtual void bind_null(int idx) = 0;

    virtual int exec() = 0;  // return rows affected

    // Row access for queries: next() runs the statement on first call.
    virtual bool next() = 0;
    virtual std::string column_text(int col) = 0;   // 0-based
    virtual bool column_null(int col) = 0;

    const std::string& name() const { return name_; }

protected:
    std::string name_;
};

class SQLConnection {
public:
    virtual ~SQLConnection() = default;

    // Connect using a DSN / path (SQLite: filename; Postgres: conninfo).
    virtual void connect(const std::string& dsn) = 0;

    // Safe to call multiple times.
    virtual void disconnect()  = 0;

    virtual std::unique_ptr<SQLStatement> prepare(const std::string& sql) = 0;

    // Runs a statement without parameters or results (DDL, pragmas).
    virtual void execute(const std::string& sql) = 0;

    virtual bool begin() = 0;
    virtual bool commit() = 0;
    virtual void rollback() = 0;

    std::string stmt_name() {
        low_++;
        int high = random_.get(1234, 9876);
        return "stmt-" + std::to_string(high) + "." + std::to_string(low_);
    }

protected:
    bool tr_started_ = false;
    Random random_;
    int low_ = 5678;
};

// Helpers for ownership
using PSQLConnection = std::unique_ptr<SQLConnection>;

PSQLConnection make_sqlite_connection();
#if HAVE_POSTGRESQL
PSQLConnection make_postgres_connection();
#endif
