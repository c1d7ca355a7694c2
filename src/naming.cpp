#include "naming.hpp"
#include <chrono>
#include "lib.hpp"

std::string PartitionDirectoryNamer::dir_name(const std::vector<std::string>& hints,
                                              const std::string& source_location,
                                              const std::string& spec_name) {
    if (spec_name.empty()) return "";
    std::string prefix;
    for (const auto& hint : hints) {
        if (!hint.empty() && strhlp::icontains(source_location, hint)) {
            prefix += strhlp::lower(hint) + "_";
        }
    }
    return prefix + spec_name;
}

std::string PartitionDirectoryNamer::staging_table_name(const std::string& prefix) {
    static thread_local Random random;
    auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return staging_table_name(prefix, static_cast<int64_t>(now), random.get(0, 9));
}

std::string PartitionDirectoryNamer::staging_table_name(const std::string& prefix, int64_t epoch_millis, int digit) {
    return prefix + "_" + std::to_string(epoch_millis) + std::to_string(digit);
}
