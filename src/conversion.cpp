#include "conversion.hpp"
#include "catalog.hpp"
#include "lib.hpp"

namespace {

    std::string join_path(const std::string& root, const std::string& leaf) {
        if (root.empty()) return leaf;
        if (root.back() == '/') return root + leaf;
        return root + "/" + leaf;
    }

    std::string substitute(const std::string& s, const SourceTable& source) {
        return strhlp::replace_all(strhlp::replace_all(s, "$DB", source.db), "$TABLE", source.name);
    }
}

const char* format_key(OutputFormat format) {
    switch (format) {
        case OutputFormat::Flattened: return "flattenedOrc";
        case OutputFormat::Nested:    return "nestedOrc";
    }
    return "";
}

OutputFormat output_format(const std::string& key) {
    if (key == "flattenedOrc") return OutputFormat::Flattened;
    if (key == "nestedOrc"   ) return OutputFormat::Nested;
    THROW("unknown output format: %s", key.c_str());
}

std::string ConversionEntity::partition_complete_name() const {
    if (!partition) return "";
    return table.complete_name() + "@" + partition->name;
}

bool ConversionEntity::from_json(const jval& doc, ConversionEntity& entity) {
    if (!doc.IsObject() || !doc.HasMember("table")) return false;
    entity.work_unit_id = jhlp::get<std::string>(doc, "workUnitId");
    entity.create_time = jhlp::get<std::string>(doc, "createTime");

    const jval& t = doc.FindMember("table")->value;
    entity.table.db = jhlp::get<std::string>(t, "db");
    entity.table.name = jhlp::get<std::string>(t, "name");
    entity.table.location = jhlp::get<std::string>(t, "location");
    if (entity.table.db.empty() || entity.table.name.empty()) THROW("conversion entity needs table db and name");
    if (t.HasMember("schema")) {
        Schema::from_avro(t.FindMember("schema")->value, entity.table.schema);
    }
    if (t.HasMember("partitionKeys")) {
        entity.table.partition_keys = columns_from_json(t.FindMember("partitionKeys")->value);
    }

    entity.partition.reset();
    if (doc.HasMember("partition") && doc.FindMember("partition")->value.IsObject()) {
        const jval& p = doc.FindMember("partition")->value;
        SourcePartition part;
        part.name = jhlp::get<std::string>(p, "name");
        part.values = jhlp::get_strings(p, "values");
        part.location = jhlp::get<std::string>(p, "location");
        part.column_types = jhlp::get<std::string>(p, "columnTypes");
        for (const auto& kv : jhlp::get_pairs(p, "parameters")) part.parameters[kv.first] = kv.second;
        entity.partition = part;
    }
    entity.statements.clear();
    return true;
}

ConversionConfig ConversionConfig::resolve(const SourceTable& source) const {
    ConversionConfig out = *this;
    out.destination_db = substitute(destination_db, source);
    out.destination_table = substitute(destination_table, source);
    out.staging_table_prefix = substitute(staging_table_prefix, source);
    out.destination_data_path = substitute(destination_data_path, source);
    return out;
}

std::string ConversionConfig::final_data_location() const {
    return join_path(destination_data_path, FINAL_SUBDIR);
}

std::string ConversionConfig::staging_data_location(const std::string& staging) const {
    return join_path(destination_data_path, staging);
}

ConversionConfig ConversionConfig::from_json(const jval& doc) {
    if (!doc.IsObject()) THROW("conversion config must be an object");
    ConversionConfig cfg;
    cfg.destination_db = jhlp::get<std::string>(doc, CFG_DB_NAME);
    cfg.destination_table = jhlp::get<std::string>(doc, CFG_TABLE_NAME);
    cfg.destination_data_path = jhlp::get<std::string>(doc, CFG_DATA_PATH);
    if (cfg.destination_db.empty())        THROW("missing '%s'", CFG_DB_NAME);
    if (cfg.destination_table.empty())     THROW("missing '%s'", CFG_TABLE_NAME);
    if (cfg.destination_data_path.empty()) THROW("missing '%s'", CFG_DATA_PATH);
    cfg.staging_table_prefix = jhlp::get<std::string>(doc, CFG_STAGING_NAME, cfg.destination_table + "_staging");

    cfg.cluster_by = jhlp::get_strings(doc, CFG_CLUSTER_BY);
    cfg.num_buckets = jhlp::get_opt_int(doc, CFG_NUM_BUCKETS);
    cfg.row_limit = jhlp::get_opt_int(doc, CFG_ROW_LIMIT);
    if (cfg.num_buckets && cfg.cluster_by.empty()) THROW("'%s' needs '%s'", CFG_NUM_BUCKETS, CFG_CLUSTER_BY);
    if (cfg.num_buckets && *cfg.num_buckets <= 0) THROW("'%s' must be positive", CFG_NUM_BUCKETS);
    if (cfg.row_limit && *cfg.row_limit < 0) THROW("'%s' must not be negative", CFG_ROW_LIMIT);

    cfg.table_properties = jhlp::get_pairs(doc, CFG_TABLE_PROPS);
    cfg.runtime_properties = jhlp::get_pairs(doc, CFG_RUNTIME_PROPS);
    cfg.evolution_enabled = jhlp::get<bool>(doc, CFG_EVOLUTION, false);
    cfg.source_path_identifiers = jhlp::get_strings(doc, CFG_PATH_IDENTIFIER);
    return cfg;
}

const ConversionConfig* DatasetConfig::find(OutputFormat format) const {
    auto it = targets.find(format);
    return it == targets.end() ? nullptr : &it->second;
}

DatasetConfig DatasetConfig::from_json(const jval& doc) {
    if (!doc.IsObject()) THROW("dataset config must be an object");
    DatasetConfig cfg;
    for (OutputFormat f : { OutputFormat::Flattened, OutputFormat::Nested }) {
        const char* key = format_key(f);
        if (doc.HasMember(key)) {
            cfg.targets.emplace(f, ConversionConfig::from_json(doc.FindMember(key)->value));
        }
    }
    return cfg;
}
