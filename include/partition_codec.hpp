#pragma once
#include <string>
#include <vector>
#include "lib.hpp"

class ConversionEntity;

/**
 * Codec of the replaced partitions list carried in the partition parameter
 * gobblin.replaced.partitions:
 *   k1=v1,k2=v2|k1=v3,k2=v4
 * Each tuple is an ordered key -> value list.
 */
class PartitionKeyCodec {
public:
    static std::string encode(const std::vector<kv_list>& partitions);

    // Tokens bind by position to declared_keys, n tokens per tuple. A tuple whose
    // values equal current_values is dropped. Malformed input throws ConvError{Config}.
    static std::vector<kv_list> decode(const std::string& encoded,
                                       const std::vector<std::string>& declared_keys,
                                       const std::vector<std::string>& current_values);

    // Decodes the reserved parameter of the entity's partition against the table's keys.
    static std::vector<kv_list> replaced_partitions(const ConversionEntity& entity);
};

/**
 * Partition descriptor split into the column definitions used by DDL
 * (key -> hive type) and the partition spec used by DML (key -> value).
 */
struct PartitionInfo {
    kv_list ddl; // key -> type
    kv_list dml; // key -> value

    bool empty() const { return ddl.empty(); }

    // name: "k1=v1/k2=v2" (or comma separated), types: "string,int" (or colon separated)
    static PartitionInfo parse(const std::string& name, const std::string& types);
};
