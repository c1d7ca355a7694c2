#include "ddl_visitor.hpp"

#define ORC_SERDE         "org.apache.hadoop.hive.ql.io.orc.OrcSerde"
#define ORC_INPUT_FORMAT  "org.apache.hadoop.hive.ql.io.orc.OrcInputFormat"
#define ORC_OUTPUT_FORMAT "org.apache.hadoop.hive.ql.io.orc.OrcOutputFormat"

static std::string hive_escape(const std::string& s) {
    std::string out; out.reserve(s.size() + 4);
    for (char c : s) {
        if (c == '\'' || c == '\\') out += '\\';
        out += c;
    }
    return out;
}

std::string DDLVisitor::partition_spec(const kv_list& spec) const {
    std::ostringstream out;
    out << "(";
    for (size_t i = 0; i < spec.size(); ++i) {
        if (i) out << ", ";
        out << quote(spec[i].first) << "=" << literal(spec[i].second);
    }
    out << ")";
    return out.str();
}

std::string DDLVisitor::column_list(const std::vector<Column>& columns) const {
    std::ostringstream out;
    size_t i = 0, n = columns.size();
    for (const auto& c : columns) {
        out << "  " << quote(c.name) << " " << c.type;
        if (!c.comment.empty()) out << " COMMENT " << literal(c.comment);
        if (++i < n) out << ",\n";
        else out << "\n";
    }
    return out.str();
}

/* ---------- Hive ---------- */

std::string HiveDDLVisitor::quote(const std::string& ident) const {
    std::string out = "`";
    for (char c : ident) {
        if (c == '`') out += '`';
        out += c;
    }
    return out + "`";
}

std::string HiveDDLVisitor::literal(const std::string& value) const {
    return "'" + hive_escape(value) + "'";
}

std::string HiveDDLVisitor::table_ref(const std::string& db, const std::string& table) const {
    return quote(db) + "." + quote(table);
}

std::string HiveDDLVisitor::create_table(const TableDef& table) const {
    if (table.columns.empty()) THROW_AS(ErrKind::Schema, "table %s.%s has no columns", table.db.c_str(), table.name.c_str());
    std::ostringstream ddl;
    ddl << "CREATE EXTERNAL TABLE IF NOT EXISTS " << table_ref(table.db, table.name) << " (\n";
    ddl << column_list(table.columns) << ")";

    if (!table.partition_keys.empty()) {
        ddl << "\nPARTITIONED BY (";
        for (size_t i = 0; i < table.partition_keys.size(); ++i) {
            if (i) ddl << ", ";
            ddl << quote(table.partition_keys[i].first) << " " << table.partition_keys[i].second;
        }
        ddl << ")";
    }

    if (!table.cluster_by.empty()) {
        ddl << "\nCLUSTERED BY (";
        for (size_t i = 0; i < table.cluster_by.size(); ++i) {
            if (i) ddl << ", ";
            ddl << quote(table.cluster_by[i]);
        }
        ddl << ")";
        if (table.num_buckets) ddl << " INTO " << *table.num_buckets << " BUCKETS";
    }

    ddl << "\nROW FORMAT SERDE " << literal(ORC_SERDE)
        << "\nSTORED AS INPUTFORMAT " << literal(ORC_INPUT_FORMAT)
        << "\nOUTPUTFORMAT " << literal(ORC_OUTPUT_FORMAT)
        << "\nLOCATION " << literal(table.location);

    if (!table.properties.empty()) {
        ddl << "\nTBLPROPERTIES (";
        for (size_t i = 0; i < table.properties.size(); ++i) {
            if (i) ddl << ", ";
            ddl << literal(table.properties[i].first) << "=" << literal(table.properties[i].second);
        }
        ddl << ")";
    }
    return ddl.str();
}

std::string HiveDDLVisitor::drop_table(const std::string& db, const std::string& table) const {
    return "DROP TABLE IF EXISTS " + table_ref(db, table);
}

std::string HiveDDLVisitor::add_partition(const std::string& db, const std::string& table,
                                          const kv_list& spec, const std::string& location) const {
    return "ALTER TABLE " + table_ref(db, table) + " ADD IF NOT EXISTS PARTITION "
        + partition_spec(spec) + " LOCATION " + literal(location);
}

std::string HiveDDLVisitor::drop_partition(const std::string& db, const std::string& table,
                                           const kv_list& spec) const {
    return "ALTER TABLE " + table_ref(db, table) + " DROP IF EXISTS PARTITION " + partition_spec(spec);
}

std::string HiveDDLVisitor::add_columns(const std::string& db, const std::string& table,
                                        const std::vector<Column>& columns) const {
    std::ostringstream ddl;
    ddl << "ALTER TABLE " << table_ref(db, table) << " ADD COLUMNS (";
    for (size_t i = 0; i < columns.size(); ++i) {
        if (i) ddl << ", ";
        ddl << quote(columns[i].name) << " " << columns[i].type;
        if (!columns[i].comment.empty()) ddl << " COMMENT " << literal(columns[i].comment);
    }
    ddl << ")";
    return ddl.str();
}

std::string HiveDDLVisitor::set(const std::string& key, const std::string& value) const {
    return "SET " + key + "=" + value;
}
