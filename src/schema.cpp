#include "schema.hpp"
#include <optional>
#include <unordered_map>
#include "lib.hpp"

namespace {

    std::optional<std::string> primitive(const std::string& avro) {
        if (avro == "boolean") return std::string("boolean");
        if (avro == "int"    ) return std::string("int");
        if (avro == "long"   ) return std::string("bigint");
        if (avro == "float"  ) return std::string("float");
        if (avro == "double" ) return std::string("double");
        if (avro == "bytes"  ) return std::string("binary");
        if (avro == "string" ) return std::string("string");
        return std::nullopt;
    }

    // Walks an avro schema, keeps named types so later references resolve.
    class AvroReader {
    public:
        Column field(const jval& f) {
            if (!f.IsObject()) THROW_AS(ErrKind::Schema, "avro field must be an object");
            Column col;
            col.name = jhlp::get<std::string>(f, AVRO_NAME);
            if (col.name.empty()) THROW_AS(ErrKind::Schema, "avro field without a name");
            col.comment = jhlp::get<std::string>(f, AVRO_DOC);
            if (!f.HasMember(AVRO_TYPE)) THROW_AS(ErrKind::Schema, "avro field '%s' has no type", col.name.c_str());
            type_of(f.FindMember(AVRO_TYPE)->value, col);
            return col;
        }

        void type_of(const jval& t, Column& col) {
            if (t.IsString()) {
                std::string name = t.GetString();
                if (auto p = primitive(name)) { col.type = *p; return; }
                if (name == "null") THROW_AS(ErrKind::Schema, "field '%s' can only be null", col.name.c_str());
                auto it = named_.find(name);
                if (it == named_.end()) THROW_AS(ErrKind::Schema, "unknown avro type '%s' for field '%s'", name.c_str(), col.name.c_str());
                col.type      = it->second.type;
                col.is_record = it->second.is_record;
                col.children  = it->second.children;
                return;
            }
            if (t.IsArray()) { union_of(t, col); return; }
            if (!t.IsObject()) THROW_AS(ErrKind::Schema, "invalid avro type for field '%s'", col.name.c_str());

            std::string kind = jhlp::get<std::string>(t, AVRO_TYPE);
            if (kind == "record") {
                std::string rname = jhlp::get<std::string>(t, AVRO_NAME);
                if (!t.HasMember(AVRO_FIELDS) || !t.FindMember(AVRO_FIELDS)->value.IsArray())
                    THROW_AS(ErrKind::Schema, "record '%s' has no fields array", rname.c_str());
                col.children.clear();
                for (const auto& f : t.FindMember(AVRO_FIELDS)->value.GetArray()) {
                    col.children.push_back(field(f));
                }
                col.type = struct_type(col.children);
                col.is_record = true;
                remember(t, col);
            } else if (kind == "enum") {
                col.type = "string";
                remember(t, col);
            } else if (kind == "fixed") {
                col.type = "binary";
                remember(t, col);
            } else if (kind == "array") {
                if (!t.HasMember(AVRO_ITEMS)) THROW_AS(ErrKind::Schema, "array without items for '%s'", col.name.c_str());
                Column items; items.name = col.name;
                type_of(t.FindMember(AVRO_ITEMS)->value, items);
                col.type = "array<" + items.type + ">";
            } else if (kind == "map") {
                if (!t.HasMember(AVRO_VALUES)) THROW_AS(ErrKind::Schema, "map without values for '%s'", col.name.c_str());
                Column values; values.name = col.name;
                type_of(t.FindMember(AVRO_VALUES)->value, values);
                col.type = "map<string," + values.type + ">";
            } else if (t.HasMember(AVRO_TYPE)) {
                // primitive with attributes, e.g. {"type":"string","avro.java.string":"String"}
                type_of(t.FindMember(AVRO_TYPE)->value, col);
            } else {
                THROW_AS(ErrKind::Schema, "avro type without 'type' for field '%s'", col.name.c_str());
            }
        }

    private:
        void union_of(const jval& t, Column& col) {
            std::vector<const jval*> branches;
            bool has_null = false;
            for (const auto& b : t.GetArray()) {
                if (b.IsString() && std::string(b.GetString()) == "null") { has_null = true; continue; }
                branches.push_back(&b);
            }
            if (branches.empty()) THROW_AS(ErrKind::Schema, "union of only null for field '%s'", col.name.c_str());
            if (branches.size() == 1) {
                type_of(*branches.front(), col);
                col.nullable = col.nullable || has_null;
                return;
            }
            std::vector<std::string> types;
            for (const jval* b : branches) {
                Column tmp; tmp.name = col.name;
                type_of(*b, tmp);
                types.push_back(tmp.type);
            }
            col.type = "uniontype<" + strhlp::join(types, ",") + ">";
            col.nullable = has_null;
            col.is_record = false;
            col.children.clear();
        }

        void remember(const jval& t, const Column& col) {
            std::string name = jhlp::get<std::string>(t, AVRO_NAME);
            if (name.empty()) return;
            Column named = col;
            named.nullable = false;
            named_[name] = named;
            std::string ns = jhlp::get<std::string>(t, AVRO_NAMESPACE);
            if (!ns.empty()) named_[ns + "." + name] = named;
        }

        std::unordered_map<std::string, Column> named_;
    };

    void flatten_into(const Column& c, const std::string& prefix_name, const std::string& prefix_path,
                      bool parent_nullable, std::vector<Column>& out) {
        std::string name = prefix_name.empty() ? c.name : prefix_name + FLATTEN_SEP + c.name;
        std::string path = prefix_path.empty() ? c.name : prefix_path + "." + c.name;
        if (c.is_record && !c.children.empty()) {
            for (const auto& child : c.children) {
                flatten_into(child, name, path, parent_nullable || c.nullable, out);
            }
            return;
        }
        Column leaf = c;
        leaf.name = name;
        leaf.source_path = path;
        leaf.nullable = c.nullable || parent_nullable;
        out.push_back(leaf);
    }
}

std::string struct_type(const std::vector<Column>& children) {
    std::vector<std::string> parts;
    for (const auto& ch : children) parts.push_back(ch.name + ":" + ch.type);
    return "struct<" + strhlp::join(parts, ",") + ">";
}

const Column* Schema::find(const std::string& column) const {
    for (const auto& c : columns) {
        if (strhlp::iequals(c.name, column)) return &c;
    }
    return nullptr;
}

const Column* Schema::resolve(const std::string& path) const {
    auto segments = strhlp::split(path, ".");
    if (segments.empty()) return nullptr;
    const std::vector<Column>* level = &columns;
    const Column* found = nullptr;
    for (const auto& seg : segments) {
        found = nullptr;
        for (const auto& c : *level) {
            if (strhlp::iequals(c.name, seg)) { found = &c; break; }
        }
        if (!found) return nullptr;
        level = &found->children;
    }
    return found;
}

std::vector<std::string> Schema::names() const {
    std::vector<std::string> out;
    for (const auto& c : columns) out.push_back(c.name);
    return out;
}

Schema Schema::flattened() const {
    Schema out;
    out.name = name;
    out.ns = ns;
    for (const auto& c : columns) flatten_into(c, "", "", false, out.columns);
    return out;
}

bool Schema::from_avro(const jval& doc, Schema& schema) {
    if (!doc.IsObject()) return false;
    if (jhlp::get<std::string>(doc, AVRO_TYPE) != "record") {
        THROW_AS(ErrKind::Schema, "top level avro schema must be a record");
    }
    schema.name = jhlp::get<std::string>(doc, AVRO_NAME);
    schema.ns = jhlp::get<std::string>(doc, AVRO_NAMESPACE);
    schema.columns.clear();

    AvroReader reader;
    Column root;
    root.name = schema.name;
    reader.type_of(doc, root);
    schema.columns = root.children;
    return true;
}

bool Schema::from_avro(const std::string& json, Schema& schema) {
    jdoc doc;
    if (!jhlp::parse_str(json, doc)) return false;
    return from_avro(doc, schema);
}
