#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "schema.hpp"

/****************** LITERAL CONSTS */
#define KEY_DATASET_URN         "gobblin.datasetUrn"
#define KEY_PARTITION_NAME      "gobblin.partitionName"
#define KEY_WORKUNIT_CREATE_TS  "gobblin.workunitCreateTime"
#define KEY_REPLACED_PARTITIONS "gobblin.replaced.partitions"

#define CFG_DB_NAME             "destinationDbName"
#define CFG_TABLE_NAME          "destinationTableName"
#define CFG_STAGING_NAME        "destinationStagingTableName"
#define CFG_DATA_PATH           "destinationDataPath"
#define CFG_CLUSTER_BY          "clusterBy"
#define CFG_NUM_BUCKETS         "numBuckets"
#define CFG_ROW_LIMIT           "rowLimit"
#define CFG_TABLE_PROPS         "destinationTableProperties"
#define CFG_RUNTIME_PROPS       "hiveRuntimeProperties"
#define CFG_EVOLUTION           "evolutionEnabled"
#define CFG_PATH_IDENTIFIER     "sourceDataPathIdentifier"

#define FINAL_SUBDIR            "final"

enum class OutputFormat { Flattened, Nested };

const char* format_key(OutputFormat format);       // flattenedOrc | nestedOrc
OutputFormat output_format(const std::string& key); // throws on unknown keys

struct SourceTable {
    std::string db;
    std::string name;
    std::string location;
    Schema schema;                      // avro schema of the source records
    std::vector<Column> partition_keys;

    std::string complete_name() const { return db + "@" + name; }
};

struct SourcePartition {
    std::string name;                   // k1=v1/k2=v2
    std::vector<std::string> values;
    std::string location;
    std::map<std::string, std::string> parameters;
    std::string column_types;           // partition_columns.types, e.g. "string" or "string,int"
};

/**
 * One work item: a source table, or one partition of it.
 * statements holds the staging phase, in execution order, once planned.
 */
class ConversionEntity {
public:
    std::string work_unit_id;
    std::string create_time;            // origin timestamp of the work unit, millis
    SourceTable table;
    std::optional<SourcePartition> partition;
    std::vector<std::string> statements;

    bool is_partition() const { return partition.has_value(); }
    std::string partition_complete_name() const;

    static bool from_json(const jval& doc, ConversionEntity& entity);
};

struct ConversionConfig {
    std::string destination_db;
    std::string destination_table;
    std::string staging_table_prefix;
    std::string destination_data_path;
    std::vector<std::string> cluster_by;
    std::optional<int> num_buckets;
    std::optional<int> row_limit;
    kv_list table_properties;
    kv_list runtime_properties;
    bool evolution_enabled = false;
    std::vector<std::string> source_path_identifiers;

    // $DB and $TABLE resolve against the source table
    ConversionConfig resolve(const SourceTable& source) const;

    std::string final_data_location() const;                           // <root>/final
    std::string staging_data_location(const std::string& staging) const; // <root>/<staging>

    static ConversionConfig from_json(const jval& doc);
};

/**
 * Conversion targets of a dataset, one per output format.
 * A format without an entry is not converted.
 */
class DatasetConfig {
public:
    std::map<OutputFormat, ConversionConfig> targets;

    const ConversionConfig* find(OutputFormat format) const;

    static DatasetConfig from_json(const jval& doc);
};
