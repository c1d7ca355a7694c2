#pragma once
#include <optional>
#include <string>
#include <vector>
#include "ddl_visitor.hpp"

/**
 * Mapping of a source table onto a staging table.
 * - columns are the staging columns; each reads from Column::path() in the source.
 * - source_filter selects the source partition, partition the staging partition.
 * - A column the source lacks becomes CAST(NULL AS type) when evolution is on,
 *   otherwise it is referenced as is and fails when the statement runs.
 */
struct MappingDef {
    std::string source_db;
    std::string source_table;
    const Schema* source_schema = nullptr;
    std::string target_db;
    std::string target_table;
    std::vector<Column> columns;
    kv_list partition;
    kv_list source_filter;
    std::optional<int> row_limit;
    bool evolution_enabled = false;
};

class DMLVisitor {
public:
    explicit DMLVisitor(const DDLVisitor& ddl) : ddl_(ddl) {}
    virtual ~DMLVisitor() = default;

    virtual std::string insert_overwrite(const MappingDef& mapping) const = 0;

protected:
    // select expression of one staging column
    virtual std::string select_expr(const MappingDef& mapping, const Column& column) const = 0;

    const DDLVisitor& ddl_;
};

class HiveDMLVisitor final : public DMLVisitor {
public:
    using DMLVisitor::DMLVisitor;

    std::string insert_overwrite(const MappingDef& mapping) const override;

private:
    std::string select_expr(const MappingDef& mapping, const Column& column) const override;
    std::string quote_path(const std::string& path) const; // a.b -> `a`.`b`
};
