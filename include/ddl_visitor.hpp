#pragma once
#include <optional>
#include <sstream>
#include <string>
#include <vector>
#include "schema.hpp"

/**
 * Shape of an external columnar table to create.
 * partition_keys holds key -> type in declaration order.
 */
struct TableDef {
    std::string db;
    std::string name;
    std::vector<Column> columns;
    kv_list partition_keys;
    std::vector<std::string> cluster_by;
    std::optional<int> num_buckets;
    std::string location;
    kv_list properties;
};

class DDLVisitor {
public:
    virtual ~DDLVisitor() = default;

    virtual std::string create_table(const TableDef& table) const = 0;
    virtual std::string drop_table(const std::string& db, const std::string& table) const = 0;
    virtual std::string add_partition(const std::string& db, const std::string& table,
                                      const kv_list& spec, const std::string& location) const = 0;
    virtual std::string drop_partition(const std::string& db, const std::string& table,
                                       const kv_list& spec) const = 0;
    virtual std::string add_columns(const std::string& db, const std::string& table,
                                    const std::vector<Column>& columns) const = 0;
    virtual std::string set(const std::string& key, const std::string& value) const = 0;

    // `db`.`table`
    virtual std::string table_ref(const std::string& db, const std::string& table) const = 0;
    virtual std::string quote(const std::string& ident) const = 0;
    virtual std::string literal(const std::string& value) const = 0;

protected:
    // (`k1`='v1', `k2`='v2')
    std::string partition_spec(const kv_list& spec) const;
    std::string column_list(const std::vector<Column>& columns) const;
};

// HiveQL with ORC storage
class HiveDDLVisitor final : public DDLVisitor {
public:
    std::string create_table(const TableDef& table) const override;
    std::string drop_table(const std::string& db, const std::string& table) const override;
    std::string add_partition(const std::string& db, const std::string& table,
                              const kv_list& spec, const std::string& location) const override;
    std::string drop_partition(const std::string& db, const std::string& table,
                               const kv_list& spec) const override;
    std::string add_columns(const std::string& db, const std::string& table,
                            const std::vector<Column>& columns) const override;
    std::string set(const std::string& key, const std::string& value) const override;

    std::string table_ref(const std::string& db, const std::string& table) const override;
    std::string quote(const std::string& ident) const override;   // `ident`
    std::string literal(const std::string& value) const override; // 'value'
};
