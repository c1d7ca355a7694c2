#pragma once
#include <string>
#include <vector>
#include "conversion.hpp"
#include "ddl_visitor.hpp"
#include "dml_visitor.hpp"
#include "partition_codec.hpp"
#include "schemaupdate.hpp"

/**
 * Staging phase of one conversion, in execution order:
 * SET statements, staging table DDL, staging partition DDL, mapping DML.
 */
struct StagingPlan {
    TableDef table;                 // staging table as created
    PartitionInfo partition;        // empty for snapshot tables
    std::string partition_dir;      // directory name of the partition under the data roots
    std::vector<std::string> statements;

    bool is_partitioned() const { return !partition.empty(); }
    const std::string& location() const { return table.location; }
    std::string partition_location() const; // <location>/<partition_dir>
};

class StagingPlanBuilder {
public:
    StagingPlanBuilder(const DDLVisitor& ddl, const DMLVisitor& dml) : ddl_(ddl), dml_(dml) {}

    // Partition descriptor of the entity, empty for snapshots. Throws ConvError{Config}.
    static PartitionInfo partition_info(const ConversionEntity& entity);

    // entity.table.schema is the source the mapping DML reads from
    StagingPlan build(const ConversionEntity& entity,
                      const ConversionConfig& config,
                      const SchemaUpdate& update,
                      const std::string& staging_table,
                      const PartitionInfo& partition) const;

private:
    std::vector<std::string> runtime_settings(const ConversionEntity& entity, const ConversionConfig& config) const;

    const DDLVisitor& ddl_;
    const DMLVisitor& dml_;
};
