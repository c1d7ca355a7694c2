#include "sqlconnection.hpp"
#include <sqlite3.h>

class SQLiteStatement final : public SQLStatement {
public:
    SQLiteStatement(sqlite3_stmt* stmt, std::string name)
        : stmt_(stmt) { name_ = std::move(name); }
    ~SQLiteStatement() override {
        if (stmt_) sqlite3_finalize(stmt_);
    }

    void bind(int idx, const std::string& value) override {
        // utf-8 text, copied by sqlite
        if (sqlite3_bind_text(stmt_, idx, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT) != SQLITE_OK) {
            THROW_AS(ErrKind::Store, "SQLite bind failed at %d: %s", idx, errmsg());
        }
    }

    void bind_null(int idx) override {
        sqlite3_bind_null(stmt_, idx);
    }

    int exec() override {
        int rc = sqlite3_step(stmt_);
        while (rc == SQLITE_ROW) rc = sqlite3_step(stmt_);
        if (rc != SQLITE_DONE) {
            THROW_AS(ErrKind::Store, "SQLite exec failed: %s", errmsg());
        }
        return sqlite3_changes(sqlite3_db_handle(stmt_));
    }

    bool next() override {
        if (done_) return false;
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        done_ = true;
        if (rc != SQLITE_DONE) THROW_AS(ErrKind::Store, "SQLite query failed: %s", errmsg());
        return false;
    }

    std::string column_text(int col) override {
        const unsigned char* txt = sqlite3_column_text(stmt_, col);
        if (!txt) return "";
        return std::string(reinterpret_cast<const char*>(txt), static_cast<size_t>(sqlite3_column_bytes(stmt_, col)));
    }

    bool column_null(int col) override {
        return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
    }

private:
    const char* errmsg() const { return sqlite3_errmsg(sqlite3_db_handle(stmt_)); }

    sqlite3_stmt* stmt_;
    bool done_ = false;
};

class SQLiteConnection final : public SQLConnection {
public:
    static constexpr int BUSY_TIMEOUT_MS = 5000;

    ~SQLiteConnection() override { disconnect(); }

    void connect(const std::string& dsn) override {
        disconnect();
        if (sqlite3_open(dsn.c_str(), &db_) != SQLITE_OK) {
            std::string err = db_ ? sqlite3_errmsg(db_) : "out of memory";
            disconnect();
            THROW_AS(ErrKind::Store, "Failed to open SQLite DB %s: %s", dsn.c_str(), err.c_str());
        }
        // other pooled connections may hold the write lock
        sqlite3_busy_timeout(db_, BUSY_TIMEOUT_MS);
    }

    void disconnect() override {
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        tr_started_ = false;
    }

    // transaction control
    bool begin() override {
        if (tr_started_) return true;
        // take the write lock up front so the busy timeout applies
        execute("BEGIN IMMEDIATE;");
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
        char* errmsg = nullptr;
        if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, &errmsg) != SQLITE_OK) {
            LOG_ERROR("SQLite rollback failed: %s", errmsg ? errmsg : "unknown");
        }
        sqlite3_free(errmsg);
    }

    std::unique_ptr<SQLStatement> prepare(const std::string& sql) override {
        if (!db_) THROW_AS(ErrKind::Store, "prepare: not connected");
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()) + 1, &stmt, nullptr) != SQLITE_OK) {
            THROW_AS(ErrKind::Store, "SQLite prepare failed: %s (%s)", sqlite3_errmsg(db_), sql.c_str());
        }
        return std::make_unique<SQLiteStatement>(stmt, stmt_name());
    }

    void execute(const std::string& sql) override {
        if (!db_) THROW_AS(ErrKind::Store, "execute: not connected");
        char* errmsg = nullptr;
        if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg) != SQLITE_OK) {
            std::string err = errmsg ? errmsg : "unknown";
            sqlite3_free(errmsg);
            THROW_AS(ErrKind::Store, "SQLite error: %s", err.c_str());
        }
    }

private:
    sqlite3* db_ = nullptr;
};

PSQLConnection make_sqlite_connection() {
    return std::make_unique<SQLiteConnection>();
}
