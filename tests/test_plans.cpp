#include <catch2/catch.hpp>
#include "publish_plan.hpp"
#include "staging_plan.hpp"
#include "fakes.hpp"

namespace {

    Column col(const std::string& name, const std::string& type) {
        Column c;
        c.name = name;
        c.type = type;
        return c;
    }

    ConversionConfig config() {
        ConversionConfig cfg;
        cfg.destination_db = "events_orc";
        cfg.destination_table = "pageviews_orc";
        cfg.staging_table_prefix = "pageviews_orc_stg";
        cfg.destination_data_path = "/data/pageviews_orc";
        cfg.source_path_identifiers = { "hourly", "daily" };
        return cfg;
    }

    ConversionEntity snapshot_entity() {
        ConversionEntity e;
        e.work_unit_id = "wu-1";
        e.create_time = "1460000000000";
        e.table.db = "events";
        e.table.name = "pageviews";
        e.table.location = "/data/tracking/pageviews";
        e.table.schema.columns = { col("id", "bigint"), col("url", "string") };
        return e;
    }

    ConversionEntity partition_entity() {
        ConversionEntity e = snapshot_entity();
        e.table.partition_keys = { col("datepartition", "string") };
        SourcePartition p;
        p.name = "datepartition=2016-01-02";
        p.values = { "2016-01-02" };
        p.location = "/data/tracking/daily/pageviews/2016-01-02";
        p.column_types = "string";
        e.partition = p;
        return e;
    }

    size_t index_of(const std::vector<std::string>& xs, const std::string& needle) {
        for (size_t i = 0; i < xs.size(); ++i) {
            if (contains(xs[i], needle)) return i;
        }
        return xs.size();
    }
}

TEST_CASE("Staging plan for a snapshot table", "[staging]") {
    HiveDDLVisitor ddl;
    HiveDMLVisitor dml(ddl);
    ConversionEntity entity = snapshot_entity();
    ConversionConfig cfg = config();
    cfg.runtime_properties = { { "hive.exec.compress.output", "true" } };
    cfg.row_limit = 10;
    std::optional<TableMeta> none;
    SchemaUpdate update(entity.table.schema, none, true);

    auto plan = StagingPlanBuilder(ddl, dml).build(entity, cfg, update, "pageviews_orc_stg_14600000000003",
        StagingPlanBuilder::partition_info(entity));
    REQUIRE(plan.statements.size() == 5);
    CHECK(plan.statements[0] == "SET hive.exec.compress.output=true");
    CHECK(plan.statements[1] == "SET gobblin.datasetUrn=events@pageviews");
    CHECK(plan.statements[2] == "SET gobblin.workunitCreateTime=1460000000000");
    CHECK(contains(plan.statements[3], "CREATE EXTERNAL TABLE IF NOT EXISTS `events_orc`.`pageviews_orc_stg_14600000000003`"));
    CHECK(contains(plan.statements[3], "LOCATION '/data/pageviews_orc/pageviews_orc_stg_14600000000003'"));
    CHECK(contains(plan.statements[4], "INSERT OVERWRITE TABLE `events_orc`.`pageviews_orc_stg_14600000000003`\n"));
    CHECK(contains(plan.statements[4], "FROM `events`.`pageviews`\nLIMIT 10"));
    CHECK_FALSE(plan.is_partitioned());
    CHECK(plan.location() == "/data/pageviews_orc/pageviews_orc_stg_14600000000003");
}

TEST_CASE("Staging plan for a partition", "[staging]") {
    HiveDDLVisitor ddl;
    HiveDMLVisitor dml(ddl);
    ConversionEntity entity = partition_entity();
    ConversionConfig cfg = config();
    std::optional<TableMeta> none;
    SchemaUpdate update(entity.table.schema, none, false);

    auto plan = StagingPlanBuilder(ddl, dml).build(entity, cfg, update, "stg_1",
        StagingPlanBuilder::partition_info(entity));
    REQUIRE(plan.statements.size() == 6);
    CHECK(plan.statements[0] == "SET gobblin.datasetUrn=events@pageviews");
    CHECK(plan.statements[1] == "SET gobblin.partitionName=events@pageviews@datepartition=2016-01-02");
    CHECK(plan.statements[2] == "SET gobblin.workunitCreateTime=1460000000000");
    CHECK(contains(plan.statements[3], "PARTITIONED BY (`datepartition` string)"));
    CHECK(plan.statements[4] ==
        "ALTER TABLE `events_orc`.`stg_1` ADD IF NOT EXISTS PARTITION (`datepartition`='2016-01-02') "
        "LOCATION '/data/pageviews_orc/stg_1/daily_datepartition=2016-01-02'");
    CHECK(contains(plan.statements[5], "PARTITION (`datepartition`='2016-01-02')"));
    CHECK(contains(plan.statements[5], "WHERE `datepartition`='2016-01-02'"));
    CHECK(plan.partition_dir == "daily_datepartition=2016-01-02");
}

TEST_CASE("Partition types fall back on the table partition keys", "[staging]") {
    HiveDDLVisitor ddl;
    HiveDMLVisitor dml(ddl);
    ConversionEntity entity = partition_entity();
    entity.partition->column_types.clear();
    std::optional<TableMeta> none;
    SchemaUpdate update(entity.table.schema, none, false);

    auto plan = StagingPlanBuilder(ddl, dml).build(entity, config(), update, "stg_1",
        StagingPlanBuilder::partition_info(entity));
    CHECK(plan.partition.ddl == kv_list { { "datepartition", "string" } });
}

TEST_CASE("Absent destination: create table comes first, no evolution", "[publish]") {
    HiveDDLVisitor ddl;
    HiveDMLVisitor dml(ddl);
    ConversionEntity entity = snapshot_entity();
    ConversionConfig cfg = config();
    DestinationMeta dest;
    SchemaUpdate update(entity.table.schema, dest.table, true);
    auto staging = StagingPlanBuilder(ddl, dml).build(entity, cfg, update, "stg_1",
        StagingPlanBuilder::partition_info(entity));

    auto plan = PublishPlanBuilder(ddl).build(cfg, staging, dest, update.plan_migration(ddl),
        PartitionKeyCodec::replaced_partitions(entity));
    REQUIRE(plan.publish_statements.size() == 1);
    CHECK(contains(plan.publish_statements[0], "CREATE EXTERNAL TABLE IF NOT EXISTS `events_orc`.`pageviews_orc`"));
    CHECK(contains(plan.publish_statements[0], "LOCATION '/data/pageviews_orc/final'"));
}

TEST_CASE("Snapshot publish swaps one directory", "[publish]") {
    HiveDDLVisitor ddl;
    HiveDMLVisitor dml(ddl);
    ConversionEntity entity = snapshot_entity();
    ConversionConfig cfg = config();
    DestinationMeta dest;
    TableMeta existing;
    existing.db = "events_orc";
    existing.name = "pageviews_orc";
    existing.columns = { col("id", "bigint") };
    dest.table = existing;
    cfg.evolution_enabled = true;
    SchemaUpdate update(entity.table.schema, dest.table, true);
    auto staging = StagingPlanBuilder(ddl, dml).build(entity, cfg, update, "stg_1",
        StagingPlanBuilder::partition_info(entity));

    auto plan = PublishPlanBuilder(ddl).build(cfg, staging, dest, update.plan_migration(ddl),
        PartitionKeyCodec::replaced_partitions(entity));
    REQUIRE(plan.publish_statements.size() == 1);
    CHECK(plan.publish_statements[0] == "ALTER TABLE `events_orc`.`pageviews_orc` ADD COLUMNS (`url` string)");
    REQUIRE(plan.publish_directories.size() == 1);
    CHECK(plan.publish_directories[0] == DirMove { "/data/pageviews_orc/stg_1", "/data/pageviews_orc/final", 1 });
    CHECK(plan.cleanup_statements == std::vector<std::string> { "DROP TABLE IF EXISTS `events_orc`.`stg_1`" });
    CHECK(plan.cleanup_directories == std::vector<std::string> { "/data/pageviews_orc/stg_1" });
}

TEST_CASE("Partition drop precedes its move which precedes its create", "[publish]") {
    HiveDDLVisitor ddl;
    HiveDMLVisitor dml(ddl);
    ConversionEntity entity = partition_entity();
    ConversionConfig cfg = config();

    for (bool exists : { false, true }) {
        DestinationMeta dest;
        if (exists) {
            TableMeta t;
            t.db = cfg.destination_db;
            t.name = cfg.destination_table;
            t.columns = entity.table.schema.columns;
            t.partition_keys = entity.table.partition_keys;
            dest.table = t;
            dest.partitions = std::vector<PartitionMeta> {};
        }
        SchemaUpdate update(entity.table.schema, dest.table, false);
        auto staging = StagingPlanBuilder(ddl, dml).build(entity, cfg, update, "stg_1",
        StagingPlanBuilder::partition_info(entity));
        auto plan = PublishPlanBuilder(ddl).build(cfg, staging, dest, update.plan_migration(ddl),
        PartitionKeyCodec::replaced_partitions(entity));

        size_t drop = index_of(plan.publish_statements, "DROP IF EXISTS PARTITION (`datepartition`='2016-01-02')");
        size_t add = index_of(plan.publish_statements, "ADD IF NOT EXISTS PARTITION (`datepartition`='2016-01-02')");
        REQUIRE(drop < plan.publish_statements.size());
        REQUIRE(add < plan.publish_statements.size());
        REQUIRE(plan.publish_directories.size() == 1);
        const DirMove& move = plan.publish_directories[0];
        CHECK(move.from == "/data/pageviews_orc/stg_1/daily_datepartition=2016-01-02");
        CHECK(move.to == "/data/pageviews_orc/final/daily_datepartition=2016-01-02");
        CHECK(drop < move.after);
        CHECK(move.after <= add);
        CHECK(contains(plan.publish_statements[add], "LOCATION '/data/pageviews_orc/final/daily_datepartition=2016-01-02'"));
        CHECK(plan.cleanup_statements.size() == 1);
        CHECK(plan.cleanup_directories == std::vector<std::string> { "/data/pageviews_orc/stg_1" });
    }
}

TEST_CASE("Replaced partitions are dropped after the main publish statements", "[publish]") {
    HiveDDLVisitor ddl;
    HiveDMLVisitor dml(ddl);
    ConversionEntity entity = partition_entity();
    entity.partition->parameters[KEY_REPLACED_PARTITIONS] =
        "datepartition=2016-01-02-00,datepartition=2016-01-02-01";
    ConversionConfig cfg = config();
    DestinationMeta dest;
    SchemaUpdate update(entity.table.schema, dest.table, false);
    auto staging = StagingPlanBuilder(ddl, dml).build(entity, cfg, update, "stg_1",
        StagingPlanBuilder::partition_info(entity));

    auto plan = PublishPlanBuilder(ddl).build(cfg, staging, dest, {},
        PartitionKeyCodec::replaced_partitions(entity));
    REQUIRE(plan.publish_statements.size() == 5);
    CHECK(contains(plan.publish_statements[0], "CREATE EXTERNAL TABLE"));
    CHECK(contains(plan.publish_statements[1], "DROP IF EXISTS PARTITION (`datepartition`='2016-01-02')"));
    CHECK(contains(plan.publish_statements[2], "ADD IF NOT EXISTS PARTITION"));
    CHECK(plan.publish_statements[3] ==
        "ALTER TABLE `events_orc`.`pageviews_orc` DROP IF EXISTS PARTITION (`datepartition`='2016-01-02-00')");
    CHECK(plan.publish_statements[4] ==
        "ALTER TABLE `events_orc`.`pageviews_orc` DROP IF EXISTS PARTITION (`datepartition`='2016-01-02-01')");
}

TEST_CASE("Publish plan persists as JSON", "[publish][json]") {
    PublishPlan plan;
    plan.publish_statements = { "CREATE x", "ALTER y" };
    plan.publish_directories = { { "/a/stg", "/a/final", 1 } };
    plan.cleanup_statements = { "DROP TABLE IF EXISTS `db`.`stg`" };
    plan.cleanup_directories = { "/a/stg" };

    jdoc doc;
    REQUIRE(jhlp::parse_str(plan.to_json(), doc));
    REQUIRE(doc.HasMember(PLAN_PUBLISH_QUERIES));
    REQUIRE(doc.HasMember(PLAN_PUBLISH_DIRECTORIES));
    CHECK(jhlp::get<uint64_t>(doc[PLAN_PUBLISH_DIRECTORIES][0u], "after") == 1u);
    CHECK(jhlp::get<std::string>(doc[PLAN_PUBLISH_DIRECTORIES][0u], "to") == "/a/final");

    auto back = PublishPlan::from_json(doc);
    CHECK(back.publish_statements == plan.publish_statements);
    CHECK(back.publish_directories == plan.publish_directories);
    CHECK(back.cleanup_statements == plan.cleanup_statements);
    CHECK(back.cleanup_directories == plan.cleanup_directories);
}

TEST_CASE("Malformed persisted plans are rejected", "[publish][json]") {
    CHECK_THROWS_AS(PublishPlan::from_json(std::string("{}")), ConvError);
    CHECK_THROWS_AS(PublishPlan::from_json(std::string("[")), ConvError);
    CHECK_THROWS_AS(PublishPlan::from_json(std::string(
        R"({"publishQueries": [], "publishDirectories": [{"from": "/a", "to": "/b", "after": 3}],
            "cleanupQueries": [], "cleanupDirectories": []})")), ConvError);

    auto legacy = PublishPlan::from_json(std::string(
        R"({"publishQueries": ["A", "B"], "publishDirectories": [{"from": "/a", "to": "/b"}],
            "cleanupQueries": [], "cleanupDirectories": []})"));
    REQUIRE(legacy.publish_directories.size() == 1);
    CHECK(legacy.publish_directories[0].after == 2);
}
