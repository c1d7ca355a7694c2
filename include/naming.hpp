#pragma once
#include <cstdint>
#include <string>
#include <vector>

class PartitionDirectoryNamer {
public:
    // lower(hint) + "_" for every hint found (case-insensitive) in source_location,
    // in hint order, followed by spec_name. Empty spec_name means no partition.
    static std::string dir_name(const std::vector<std::string>& hints,
                                const std::string& source_location,
                                const std::string& spec_name);

    // <prefix>_<epoch millis><one random digit>
    static std::string staging_table_name(const std::string& prefix);
    static std::string staging_table_name(const std::string& prefix, int64_t epoch_millis, int digit);
};
