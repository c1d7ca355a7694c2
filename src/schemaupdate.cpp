#include "schemaupdate.hpp"

SchemaUpdate::SchemaUpdate(const Schema& target, const std::optional<TableMeta>& destination, bool evolution_enabled)
    : target_(target), destination_(destination), evolution_(evolution_enabled) {}

std::vector<Column> SchemaUpdate::added_columns() const {
    std::vector<Column> added;
    if (!destination_ || !evolution_) return added;
    for (const auto& c : target_.columns) {
        bool present = false;
        for (const auto& d : destination_->columns) {
            if (strhlp::iequals(c.name, d.name)) { present = true; break; }
        }
        if (!present) added.push_back(c);
    }
    return added;
}

std::vector<std::string> SchemaUpdate::plan_migration(const DDLVisitor& ddl) const {
    std::vector<std::string> out;
    auto added = added_columns();
    if (added.empty()) return out;
    LOG_INFO("evolving %s.%s: adding %zu column(s)", destination_->db.c_str(), destination_->name.c_str(), added.size());
    out.push_back(ddl.add_columns(destination_->db, destination_->name, added));
    return out;
}

std::vector<Column> SchemaUpdate::table_columns() const {
    if (!destination_) return target_.columns;

    std::vector<Column> cols;
    for (const auto& d : destination_->columns) {
        Column c = d;
        // keep reading from where the target column reads
        if (const Column* t = target_.find(d.name)) {
            c.source_path = t->source_path;
            if (c.comment.empty()) c.comment = t->comment;
        }
        cols.push_back(c);
    }
    for (const auto& a : added_columns()) cols.push_back(a);
    return cols;
}
