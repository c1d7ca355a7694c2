#include "staging_plan.hpp"
#include "naming.hpp"

std::string StagingPlan::partition_location() const {
    if (partition_dir.empty()) return table.location;
    return table.location + "/" + partition_dir;
}

std::vector<std::string> StagingPlanBuilder::runtime_settings(const ConversionEntity& entity,
                                                              const ConversionConfig& config) const {
    std::vector<std::string> out;
    for (const auto& kv : config.runtime_properties) {
        out.push_back(ddl_.set(kv.first, kv.second));
    }
    out.push_back(ddl_.set(KEY_DATASET_URN, entity.table.complete_name()));
    if (entity.partition) {
        out.push_back(ddl_.set(KEY_PARTITION_NAME, entity.partition_complete_name()));
    }
    out.push_back(ddl_.set(KEY_WORKUNIT_CREATE_TS, entity.create_time));
    return out;
}

PartitionInfo StagingPlanBuilder::partition_info(const ConversionEntity& entity) {
    if (!entity.partition) return {};
    std::string types = entity.partition->column_types;
    if (strhlp::is_blank(types)) {
        std::vector<std::string> key_types;
        for (const auto& k : entity.table.partition_keys) key_types.push_back(k.type);
        types = strhlp::join(key_types, ",");
    }
    return PartitionInfo::parse(entity.partition->name, types);
}

StagingPlan StagingPlanBuilder::build(const ConversionEntity& entity,
                                      const ConversionConfig& config,
                                      const SchemaUpdate& update,
                                      const std::string& staging_table,
                                      const PartitionInfo& partition) const {
    StagingPlan plan;
    plan.statements = runtime_settings(entity, config);

    if (entity.partition) {
        plan.partition = partition;
        plan.partition_dir = PartitionDirectoryNamer::dir_name(
            config.source_path_identifiers, entity.partition->location, entity.partition->name);
    }

    plan.table.db = config.destination_db;
    plan.table.name = staging_table;
    plan.table.columns = update.table_columns();
    plan.table.partition_keys = plan.partition.ddl;
    plan.table.cluster_by = config.cluster_by;
    plan.table.num_buckets = config.num_buckets;
    plan.table.location = config.staging_data_location(staging_table);
    plan.table.properties = config.table_properties;
    plan.statements.push_back(ddl_.create_table(plan.table));

    if (plan.is_partitioned()) {
        plan.statements.push_back(ddl_.add_partition(plan.table.db, plan.table.name,
            plan.partition.dml, plan.partition_location()));
    }

    MappingDef mapping;
    mapping.source_db = entity.table.db;
    mapping.source_table = entity.table.name;
    mapping.source_schema = &entity.table.schema;
    mapping.target_db = plan.table.db;
    mapping.target_table = plan.table.name;
    mapping.columns = plan.table.columns;
    mapping.partition = plan.partition.dml;
    mapping.source_filter = plan.partition.dml;
    mapping.row_limit = config.row_limit;
    mapping.evolution_enabled = config.evolution_enabled;
    plan.statements.push_back(dml_.insert_overwrite(mapping));

    for (const auto& s : plan.statements) LOG_DEBUG("staging: %s", s.c_str());
    return plan;
}
