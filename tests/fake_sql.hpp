#pragma once
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "sqlconnection.hpp"

// ---- SQL test fakes ----

class FakeSQLConnection;

class FakeStatement final : public SQLStatement {
public:
    std::string sql;
    std::map<int, std::string> binds;  // idx -> value, "NULL" for nulls
    FakeSQLConnection* owner{nullptr}; // set by connection::prepare

    void bind(int idx, const std::string& value) override { binds[idx] = value; }
    void bind_null(int idx) override { binds[idx] = "NULL"; }
    int exec() override; // defined after FakeSQLConnection
    bool next() override { return false; }
    std::string column_text(int) override { return ""; }
    bool column_null(int) override { return true; }
};

class FakeSQLConnection final : public SQLConnection {
public:
    explicit FakeSQLConnection(int id = 0) : id_(id) {}
    int id() const { return id_; }

    std::vector<std::string> log;    // connect, begin, commit, rollback, exec <sql>, execute <sql>
    std::string fail_on;             // exec of a statement containing this throws
    std::map<int, std::string> last_binds;

    std::unique_ptr<SQLStatement> prepare(const std::string& sql) override {
        auto stmt = std::make_unique<FakeStatement>();
        stmt->owner = this;
        stmt->sql = sql;
        return stmt;
    }

    void execute(const std::string& sql) override { log.push_back("execute " + sql); }
    void connect(const std::string& dsn) override { log.push_back("connect " + dsn); }
    void disconnect() override {}
    bool begin() override { log.push_back("begin"); tr_started_ = true; return true; }
    bool commit() override { log.push_back("commit"); tr_started_ = false; return true; }
    void rollback() override { log.push_back("rollback"); tr_started_ = false; }

private:
    int id_;
};

inline int FakeStatement::exec() {
    owner->log.push_back("exec " + sql);
    owner->last_binds = binds;
    if (!owner->fail_on.empty() && sql.find(owner->fail_on) != std::string::npos) {
        THROW_AS(ErrKind::Store, "fake failure");
    }
    return 1;
}
