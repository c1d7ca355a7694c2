#pragma once
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "catalog.hpp"
#include "filesystem.hpp"
#include "plan_runner.hpp"

// ---- Test fakes ----

class FakeCatalog final : public Catalog {
public:
    std::vector<TableMeta> tables;
    std::map<std::string, std::vector<PartitionMeta>> partitions; // by db@table
    std::string fail_with;                                        // non-empty: every lookup throws
    int get_table_calls{0};
    int get_partitions_calls{0};

    std::optional<TableMeta> get_table(const std::string& db, const std::string& table) override {
        get_table_calls++;
        if (!fail_with.empty()) throw std::runtime_error(fail_with);
        for (const auto& t : tables) {
            if (t.db == db && t.name == table) return t;
        }
        return std::nullopt;
    }

    std::vector<PartitionMeta> get_partitions(const TableMeta& table) override {
        get_partitions_calls++;
        auto it = partitions.find(table.complete_name());
        return it == partitions.end() ? std::vector<PartitionMeta>{} : it->second;
    }
};

class FakeFileSystem final : public FileSystem {
public:
    std::map<std::string, Permission> dirs;
    std::vector<std::string> ops;           // "mkdirs path", "chmod path", "move a b", "rm path"
    bool fail_mkdirs{false};
    std::string fail_move;                  // source path whose move fails

    Permission stat_permission(const std::string& path) override {
        auto it = dirs.find(path);
        if (it == dirs.end()) THROW_AS(ErrKind::FileSystem, "no such path %s", path.c_str());
        return it->second;
    }

    bool mkdirs(const std::string& path, Permission perm) override {
        ops.push_back("mkdirs " + path);
        if (fail_mkdirs) return false;
        dirs.emplace(path, perm & 0750); // pretend a umask of 027
        return true;
    }

    void set_permission(const std::string& path, Permission perm) override {
        ops.push_back("chmod " + path);
        dirs[path] = perm;
    }

    bool exists(const std::string& path) override {
        return dirs.count(path) > 0;
    }

    void move(const std::string& from, const std::string& to) override {
        ops.push_back("move " + from + " " + to);
        if (from == fail_move) THROW_AS(ErrKind::FileSystem, "cannot move %s", from.c_str());
        auto it = dirs.find(from);
        Permission p = it == dirs.end() ? 0755 : it->second;
        if (it != dirs.end()) dirs.erase(it);
        dirs[to] = p;
    }

    void remove_all(const std::string& path) override {
        ops.push_back("rm " + path);
        dirs.erase(path);
    }
};

class RecordingExecutor final : public StatementExecutor {
public:
    std::vector<std::string> statements;
    std::vector<std::string>* journal{nullptr};   // shared log with a FakeFileSystem, when set
    std::string fail_on;                           // substring that makes execute throw

    void execute(const std::string& statement) override {
        statements.push_back(statement);
        if (journal) journal->push_back("sql " + statement);
        if (!fail_on.empty() && statement.find(fail_on) != std::string::npos) {
            throw std::runtime_error("execution failed");
        }
    }
};

inline bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}
