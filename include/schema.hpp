#pragma once
#include <string>
#include <vector>
#include "jsonhlp.hpp"

/****************** LITERAL CONSTS */
#define AVRO_TYPE       "type"
#define AVRO_NAME       "name"
#define AVRO_NAMESPACE  "namespace"
#define AVRO_FIELDS     "fields"
#define AVRO_DOC        "doc"
#define AVRO_ITEMS      "items"
#define AVRO_VALUES     "values"
#define AVRO_SYMBOLS    "symbols"

#define FLATTEN_SEP     "__"

struct Column {
    std::string name;        // column name in the columnar table
    std::string type;        // hive type text, e.g. bigint, array<string>, struct<a:int>
    std::string comment;     // avro doc, if any
    std::string source_path; // dotted path of the field in the source record; empty means same as name
    bool        nullable = false;
    bool        is_record = false;     // avro record, candidate for flattening
    std::vector<Column> children;      // fields of a record column

    const std::string& path() const { return source_path.empty() ? name : source_path; }
};

class Schema {
public:
    std::string name;
    std::string ns;
    std::vector<Column> columns;

    // case-insensitive, hive lower-cases column names
    const Column* find(const std::string& column) const;
    bool has(const std::string& column) const { return find(column) != nullptr; }

    // Resolve a dotted source path (a.b.c) through record children.
    const Column* resolve(const std::string& path) const;

    std::vector<std::string> names() const;

    // Expand nested records into top level columns parent__child.
    Schema flattened() const;

    static bool from_avro(const jval& doc, Schema& schema);
    static bool from_avro(const std::string& json, Schema& schema);
};

// hive type text for a record column built from its children
std::string struct_type(const std::vector<Column>& children);
