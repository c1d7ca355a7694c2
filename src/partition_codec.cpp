#include "partition_codec.hpp"
#include "conversion.hpp"

namespace {

    kv_pair split_token(const std::string& token) {
        auto parts = strhlp::split(token, "=", false, true);
        if (parts.size() != 2 || parts[0].empty()) {
            THROW("malformed partition token '%s', expected key=value", token.c_str());
        }
        return { parts[0], parts[1] };
    }

    bool same_values(const kv_list& tuple, const std::vector<std::string>& values) {
        if (tuple.size() != values.size()) return false;
        for (size_t i = 0; i < tuple.size(); ++i) {
            if (tuple[i].second != values[i]) return false;
        }
        return true;
    }
}

std::string PartitionKeyCodec::encode(const std::vector<kv_list>& partitions) {
    std::vector<std::string> groups;
    for (const auto& p : partitions) {
        std::vector<std::string> tokens;
        for (const auto& kv : p) tokens.push_back(kv.first + "=" + kv.second);
        groups.push_back(strhlp::join(tokens, ","));
    }
    return strhlp::join(groups, "|");
}

std::vector<kv_list> PartitionKeyCodec::decode(const std::string& encoded,
                                               const std::vector<std::string>& declared_keys,
                                               const std::vector<std::string>& current_values) {
    std::vector<kv_list> out;
    if (strhlp::is_blank(encoded)) return out;
    if (declared_keys.empty()) {
        THROW("replaced partitions '%s' given for a table without partition keys", encoded.c_str());
    }

    const size_t n = declared_keys.size();
    for (const auto& segment : strhlp::split(encoded, "|")) {
        auto tokens = strhlp::split(segment, ",");
        if (tokens.size() % n != 0) {
            THROW("replaced partition '%s' does not match the %zu declared partition keys", segment.c_str(), n);
        }
        for (size_t start = 0; start < tokens.size(); start += n) {
            kv_list tuple;
            for (size_t i = 0; i < n; ++i) {
                tuple.emplace_back(declared_keys[i], split_token(tokens[start + i]).second);
            }
            if (same_values(tuple, current_values)) {
                LOG_DEBUG("skipping replaced partition equal to the current one: %s", encode({ tuple }).c_str());
                continue;
            }
            out.push_back(tuple);
        }
    }
    return out;
}

std::vector<kv_list> PartitionKeyCodec::replaced_partitions(const ConversionEntity& entity) {
    if (!entity.partition) return {};
    auto it = entity.partition->parameters.find(KEY_REPLACED_PARTITIONS);
    if (it == entity.partition->parameters.end() || strhlp::is_blank(it->second)) return {};

    std::vector<std::string> keys;
    for (const auto& k : entity.table.partition_keys) keys.push_back(k.name);
    if (keys.empty()) {
        // fall back on the keys spelled in the partition name
        for (const auto& tok : strhlp::split(entity.partition->name, "/,")) keys.push_back(split_token(tok).first);
    }
    return decode(it->second, keys, entity.partition->values);
}

PartitionInfo PartitionInfo::parse(const std::string& name, const std::string& types) {
    PartitionInfo info;
    bool has_name = !strhlp::is_blank(name);
    bool has_types = !strhlp::is_blank(types);
    if (!has_name && !has_types) return info;
    if (has_name != has_types) {
        THROW("partition name and partition types must be given together (name: '%s', types: '%s')",
            name.c_str(), types.c_str());
    }

    auto tokens = strhlp::split(name, "/,");
    auto type_list = strhlp::split(types, ",:");
    if (tokens.size() != type_list.size()) {
        THROW("partition name '%s' has %zu keys but %zu types are declared",
            name.c_str(), tokens.size(), type_list.size());
    }
    for (size_t i = 0; i < tokens.size(); ++i) {
        auto kv = split_token(tokens[i]);
        info.ddl.emplace_back(kv.first, type_list[i]);
        info.dml.push_back(kv);
    }
    return info;
}
