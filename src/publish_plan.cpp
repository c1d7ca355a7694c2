#include "publish_plan.hpp"

namespace {

    std::vector<std::string> required_strings(const jval& doc, const char* key) {
        if (!doc.HasMember(key)) THROW("publish plan misses '%s'", key);
        return jhlp::get_strings(doc, key);
    }
}

std::string PublishPlan::to_json(bool pretty) const {
    jdoc doc;
    doc.SetObject();
    auto& alloc = doc.GetAllocator();

    jhlp::set_strings(doc, PLAN_PUBLISH_QUERIES, publish_statements, alloc);
    jval dirs(rapidjson::kArrayType);
    for (const auto& m : publish_directories) {
        jval o(rapidjson::kObjectType);
        jhlp::set(o, "from", m.from, alloc);
        jhlp::set(o, "to", m.to, alloc);
        jhlp::set(o, "after", m.after, alloc);
        dirs.PushBack(o, alloc);
    }
    doc.AddMember(PLAN_PUBLISH_DIRECTORIES, dirs, alloc);
    jhlp::set_strings(doc, PLAN_CLEANUP_QUERIES, cleanup_statements, alloc);
    jhlp::set_strings(doc, PLAN_CLEANUP_DIRECTORIES, cleanup_directories, alloc);
    return jhlp::stringify(doc, pretty);
}

PublishPlan PublishPlan::from_json(const jval& doc) {
    if (!doc.IsObject()) THROW("publish plan must be an object");
    PublishPlan plan;
    plan.publish_statements = required_strings(doc, PLAN_PUBLISH_QUERIES);
    plan.cleanup_statements = required_strings(doc, PLAN_CLEANUP_QUERIES);
    plan.cleanup_directories = required_strings(doc, PLAN_CLEANUP_DIRECTORIES);

    if (!doc.HasMember(PLAN_PUBLISH_DIRECTORIES) || !doc.FindMember(PLAN_PUBLISH_DIRECTORIES)->value.IsArray()) {
        THROW("publish plan misses '%s'", PLAN_PUBLISH_DIRECTORIES);
    }
    for (const auto& d : doc.FindMember(PLAN_PUBLISH_DIRECTORIES)->value.GetArray()) {
        DirMove m;
        m.from = jhlp::get<std::string>(d, "from");
        m.to = jhlp::get<std::string>(d, "to");
        // a plan without positions runs its moves after all publish statements
        m.after = static_cast<size_t>(jhlp::get<uint64_t>(d, "after", plan.publish_statements.size()));
        if (m.from.empty() || m.to.empty()) THROW("publish directory entry needs 'from' and 'to'");
        if (m.after > plan.publish_statements.size()) THROW("publish directory %s is positioned past the statements", m.from.c_str());
        plan.publish_directories.push_back(m);
    }
    return plan;
}

PublishPlan PublishPlan::from_json(const std::string& json) {
    jdoc doc;
    if (!jhlp::parse_str(json, doc)) THROW("publish plan is not valid JSON");
    return from_json(doc);
}

PublishPlan PublishPlanBuilder::build(const ConversionConfig& config,
                                      const StagingPlan& staging,
                                      const DestinationMeta& destination,
                                      const std::vector<std::string>& evolution,
                                      const std::vector<kv_list>& replaced) const {
    PublishPlan plan;
    const std::string& db = config.destination_db;
    const std::string& table = config.destination_table;
    const std::string final_location = config.final_data_location();

    if (!destination.exists()) {
        TableDef final_table = staging.table;
        final_table.name = table;
        final_table.location = final_location;
        plan.publish_statements.push_back(ddl_.create_table(final_table));
    }
    for (const auto& s : evolution) plan.publish_statements.push_back(s);

    if (!staging.is_partitioned()) {
        plan.publish_directories.push_back({ staging.location(), final_location, plan.publish_statements.size() });
    } else {
        std::string final_partition = final_location + "/" + staging.partition_dir;
        plan.publish_statements.push_back(ddl_.drop_partition(db, table, staging.partition.dml));
        plan.publish_directories.push_back({ staging.partition_location(), final_partition, plan.publish_statements.size() });
        plan.publish_statements.push_back(ddl_.add_partition(db, table, staging.partition.dml, final_partition));
    }

    plan.cleanup_statements.push_back(ddl_.drop_table(staging.table.db, staging.table.name));
    plan.cleanup_directories.push_back(staging.location());

    for (const auto& partition : replaced) {
        plan.publish_statements.push_back(ddl_.drop_partition(db, table, partition));
    }

    for (const auto& s : plan.publish_statements) LOG_DEBUG("publish: %s", s.c_str());
    return plan;
}
