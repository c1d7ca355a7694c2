#include "orchestrator.hpp"
#include "naming.hpp"
#include "schemaupdate.hpp"

ConversionOrchestrator::ConversionOrchestrator(DatasetConfig config, PCatalog catalog, PFileSystem fs)
    : config_(std::move(config)), catalog_(std::move(catalog)), fs_(std::move(fs)) {
    if (!catalog_) THROW_AS(ErrKind::Catalog, "orchestrator needs a connected catalog");
    if (!fs_) THROW_AS(ErrKind::FileSystem, "orchestrator needs a filesystem");
}

void ConversionOrchestrator::prepare_destination(const ConversionEntity& entity, const ConversionConfig& config) {
    const std::string& root = config.destination_data_path;
    Permission perm = fs_->stat_permission(entity.table.location);
    if (!fs_->mkdirs(root, perm)) {
        THROW_AS(ErrKind::FileSystem, "Failed to create %s with permission %s", root.c_str(), perm_str(perm).c_str());
    }
    // umask may have narrowed the mode given to mkdirs
    fs_->set_permission(root, perm);
    LOG_INFO("Created %s with permission %s", root.c_str(), perm_str(perm).c_str());
}

ConversionResult ConversionOrchestrator::plan(ConversionEntity entity, const Schema& target, OutputFormat format) {
    const ConversionConfig* found = config_.find(format);
    if (!found) {
        LOG_DEBUG("no %s conversion configured for %s", format_key(format), entity.table.complete_name().c_str());
        return { std::move(entity), std::nullopt };
    }
    ConversionConfig config = found->resolve(entity.table);

    if (entity.table.schema.columns.empty()) entity.table.schema = target;
    Schema columns = format == OutputFormat::Flattened ? target.flattened() : target;

    std::string staging_table = PartitionDirectoryNamer::staging_table_name(config.staging_table_prefix);
    LOG_INFO("planning %s into %s.%s through %s", entity.table.complete_name().c_str(),
        config.destination_db.c_str(), config.destination_table.c_str(), staging_table.c_str());

    // malformed partition metadata must fail before the filesystem is touched
    PartitionInfo partition = StagingPlanBuilder::partition_info(entity);
    std::vector<kv_list> replaced = PartitionKeyCodec::replaced_partitions(entity);

    DestinationMeta destination = fetch_destination(*catalog_, config.destination_db, config.destination_table);
    prepare_destination(entity, config);

    SchemaUpdate update(columns, destination.table, config.evolution_enabled);
    StagingPlan staging = StagingPlanBuilder(ddl_, dml_).build(entity, config, update, staging_table, partition);
    std::vector<std::string> evolution = update.plan_migration(ddl_);
    PublishPlan publish = PublishPlanBuilder(ddl_).build(config, staging, destination, evolution, replaced);

    entity.statements = staging.statements;
    return { std::move(entity), std::move(publish) };
}
