#include "dml_visitor.hpp"

std::string HiveDMLVisitor::quote_path(const std::string& path) const {
    std::vector<std::string> quoted;
    for (const auto& seg : strhlp::split(path, ".")) quoted.push_back(ddl_.quote(seg));
    return strhlp::join(quoted, ".");
}

std::string HiveDMLVisitor::select_expr(const MappingDef& mapping, const Column& column) const {
    const Column* src = mapping.source_schema ? mapping.source_schema->resolve(column.path()) : nullptr;
    if (!src) {
        if (mapping.evolution_enabled) return "CAST(NULL AS " + column.type + ")";
        LOG_WARN("column %s not found in source %s.%s", column.name.c_str(),
            mapping.source_db.c_str(), mapping.source_table.c_str());
        return quote_path(column.path());
    }
    std::string expr = quote_path(column.path());
    if (!strhlp::iequals(src->type, column.type)) {
        expr = "CAST(" + expr + " AS " + column.type + ")";
    }
    return expr;
}

std::string HiveDMLVisitor::insert_overwrite(const MappingDef& mapping) const {
    if (mapping.columns.empty()) {
        THROW_AS(ErrKind::Schema, "nothing to select into %s.%s", mapping.target_db.c_str(), mapping.target_table.c_str());
    }
    std::ostringstream dml;
    dml << "INSERT OVERWRITE TABLE " << ddl_.table_ref(mapping.target_db, mapping.target_table);
    if (!mapping.partition.empty()) {
        dml << " PARTITION (";
        for (size_t i = 0; i < mapping.partition.size(); ++i) {
            if (i) dml << ", ";
            dml << ddl_.quote(mapping.partition[i].first) << "=" << ddl_.literal(mapping.partition[i].second);
        }
        dml << ")";
    }

    dml << "\nSELECT\n";
    size_t i = 0, n = mapping.columns.size();
    for (const auto& c : mapping.columns) {
        dml << "  " << select_expr(mapping, c) << " AS " << ddl_.quote(c.name);
        if (++i < n) dml << ",\n";
        else dml << "\n";
    }
    dml << "FROM " << ddl_.table_ref(mapping.source_db, mapping.source_table);

    if (!mapping.source_filter.empty()) {
        dml << "\nWHERE ";
        for (size_t j = 0; j < mapping.source_filter.size(); ++j) {
            if (j) dml << " AND ";
            dml << ddl_.quote(mapping.source_filter[j].first) << "=" << ddl_.literal(mapping.source_filter[j].second);
        }
    }
    if (mapping.row_limit) dml << "\nLIMIT " << *mapping.row_limit;
    return dml.str();
}
