#include "catalog.hpp"
#include "lib.hpp"

std::vector<Column> columns_from_json(const jval& arr) {
    std::vector<Column> out;
    if (!arr.IsArray()) return out;
    for (const auto& c : arr.GetArray()) {
        Column col;
        col.name = jhlp::get<std::string>(c, "name");
        col.type = strhlp::lower(jhlp::get<std::string>(c, "type", "string"));
        col.comment = jhlp::get<std::string>(c, "comment");
        if (col.name.empty()) THROW_AS(ErrKind::Catalog, "catalog column without a name");
        out.push_back(col);
    }
    return out;
}

CatalogConfig CatalogConfig::from_json(const jval& doc) {
    CatalogConfig cfg;
    cfg.kind = jhlp::get<std::string>(doc, "kind", "json");
    cfg.uri = jhlp::get<std::string>(doc, "uri");
    if (cfg.uri.empty()) THROW("catalog config needs an 'uri'");
    return cfg;
}

std::unique_ptr<Catalog> Catalog::connect(const CatalogConfig& config) {
    if (config.kind == "json") {
        return std::make_unique<JsonCatalog>(config.uri);
    }
    THROW_AS(ErrKind::Catalog, "unsupported catalog kind: %s", config.kind.c_str());
}

JsonCatalog::JsonCatalog(const std::string& path) {
    jdoc doc;
    if (!jhlp::parse_file(path, doc)) {
        THROW_AS(ErrKind::Catalog, "cannot load catalog snapshot: %s", path.c_str());
    }
    load(doc);
}

JsonCatalog::JsonCatalog(const jval& doc) {
    load(doc);
}

void JsonCatalog::load(const jval& doc) {
    if (!doc.IsObject() || !doc.HasMember("tables") || !doc.FindMember("tables")->value.IsArray()) {
        THROW_AS(ErrKind::Catalog, "catalog snapshot must hold a 'tables' array");
    }
    for (const auto& t : doc.FindMember("tables")->value.GetArray()) {
        Entry e;
        e.table.db = jhlp::get<std::string>(t, "db");
        e.table.name = jhlp::get<std::string>(t, "name");
        e.table.location = jhlp::get<std::string>(t, "location");
        if (t.HasMember("columns")) e.table.columns = columns_from_json(t.FindMember("columns")->value);
        if (t.HasMember("partitionKeys")) e.table.partition_keys = columns_from_json(t.FindMember("partitionKeys")->value);
        for (const auto& kv : jhlp::get_pairs(t, "parameters")) e.table.parameters[kv.first] = kv.second;

        if (t.HasMember("partitions") && t.FindMember("partitions")->value.IsArray()) {
            for (const auto& p : t.FindMember("partitions")->value.GetArray()) {
                PartitionMeta pm;
                pm.name = jhlp::get<std::string>(p, "name");
                pm.values = jhlp::get_strings(p, "values");
                pm.location = jhlp::get<std::string>(p, "location");
                for (const auto& kv : jhlp::get_pairs(p, "parameters")) pm.parameters[kv.first] = kv.second;
                e.partitions.push_back(pm);
            }
        }
        entries_.push_back(e);
    }
}

std::optional<TableMeta> JsonCatalog::get_table(const std::string& db, const std::string& table) {
    for (const auto& e : entries_) {
        if (strhlp::iequals(e.table.db, db) && strhlp::iequals(e.table.name, table)) return e.table;
    }
    return std::nullopt;
}

std::vector<PartitionMeta> JsonCatalog::get_partitions(const TableMeta& table) {
    for (const auto& e : entries_) {
        if (strhlp::iequals(e.table.db, table.db) && strhlp::iequals(e.table.name, table.name)) return e.partitions;
    }
    return {};
}

DestinationMeta fetch_destination(Catalog& catalog, const std::string& db, const std::string& table) {
    DestinationMeta meta;
    try {
        meta.table = catalog.get_table(db, table);
        if (meta.table && meta.table->is_partitioned()) {
            meta.partitions = catalog.get_partitions(*meta.table);
        }
    } catch (const std::exception& e) {
        THROW_AS(ErrKind::Catalog, "Could not fetch destination table metadata for %s.%s: %s",
            db.c_str(), table.c_str(), e.what());
    }
    if (!meta.exists()) {
        LOG_INFO("Destination table %s.%s does not exist yet", db.c_str(), table.c_str());
    }
    return meta;
}
