#pragma once
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "schema.hpp"

struct PartitionMeta {
    std::string name;                 // k1=v1/k2=v2
    std::vector<std::string> values;  // same order as TableMeta::partition_keys
    std::string location;
    std::map<std::string, std::string> parameters;
};

struct TableMeta {
    std::string db;
    std::string name;
    std::string location;
    std::vector<Column> columns;        // data columns, partition keys excluded
    std::vector<Column> partition_keys; // empty means not partitioned
    std::map<std::string, std::string> parameters;

    bool is_partitioned() const { return !partition_keys.empty(); }
    std::string complete_name() const { return db + "@" + name; }
};

/**
 * What the catalog knows about the destination table.
 * An absent table is the first-time conversion, not an error.
 */
struct DestinationMeta {
    std::optional<TableMeta> table;
    std::optional<std::vector<PartitionMeta>> partitions; // only for partitioned tables

    bool exists() const { return table.has_value(); }
};

struct CatalogConfig {
    std::string kind = "json"; // only the json snapshot adapter is built in
    std::string uri;           // json: path of the snapshot file

    static CatalogConfig from_json(const jval& doc);
};

/**
 * Metadata service holding tables and partitions. Implemented elsewhere;
 * this is the surface the planner queries.
 *
 * get_table returns std::nullopt when the table does not exist and throws
 * on any other failure.
 */
class Catalog {
public:
    virtual ~Catalog() = default;

    virtual std::optional<TableMeta> get_table(const std::string& db, const std::string& table) = 0;
    virtual std::vector<PartitionMeta> get_partitions(const TableMeta& table) = 0;

    // Explicit fallible initialization, call once per orchestrator. Throws ConvError{Catalog}.
    static std::unique_ptr<Catalog> connect(const CatalogConfig& config);
};

using PCatalog = std::unique_ptr<Catalog>;

/**
 * Catalog backed by a metadata snapshot document:
 * { "tables": [ { "db", "name", "location", "columns": [{name,type}],
 *                 "partitionKeys": [{name,type}], "partitions": [{name,values,location,parameters}] } ] }
 */
class JsonCatalog final : public Catalog {
public:
    explicit JsonCatalog(const std::string& path);
    JsonCatalog(const jval& doc);

    std::optional<TableMeta> get_table(const std::string& db, const std::string& table) override;
    std::vector<PartitionMeta> get_partitions(const TableMeta& table) override;

private:
    void load(const jval& doc);

    struct Entry {
        TableMeta table;
        std::vector<PartitionMeta> partitions;
    };
    std::vector<Entry> entries_;
};

// Looks up the destination table and, when partitioned, its partitions.
// Not-found yields an empty DestinationMeta; other failures throw ConvError{Catalog}.
DestinationMeta fetch_destination(Catalog& catalog, const std::string& db, const std::string& table);

std::vector<Column> columns_from_json(const jval& arr);
