#pragma once
#include <optional>
#include <string>
#include <vector>
#include "catalog.hpp"
#include "ddl_visitor.hpp"

/**
 * Reconciles the target schema with an existing destination table.
 * Only ever adds columns; existing columns keep their names and types.
 */
class SchemaUpdate {
public:
    SchemaUpdate(const Schema& target, const std::optional<TableMeta>& destination, bool evolution_enabled);

    // Additive DDL for the destination, empty when there is nothing to do.
    std::vector<std::string> plan_migration(const DDLVisitor& ddl) const;

    // Target columns missing (by name, case-insensitive) from the destination, in target order.
    std::vector<Column> added_columns() const;

    // Columns the staging and final tables are created with.
    std::vector<Column> table_columns() const;

private:
    const Schema& target_;
    const std::optional<TableMeta>& destination_;
    bool evolution_;
};
