#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include "catalog.hpp"
#include "staging_plan.hpp"

/****************** PERSISTED KEYS */
#define PLAN_PUBLISH_QUERIES     "publishQueries"
#define PLAN_PUBLISH_DIRECTORIES "publishDirectories"
#define PLAN_CLEANUP_QUERIES     "cleanupQueries"
#define PLAN_CLEANUP_DIRECTORIES "cleanupDirectories"

// A directory swap; runs once `after` publish statements have run.
struct DirMove {
    std::string from;
    std::string to;
    size_t after = 0;

    bool operator==(const DirMove& o) const { return from == o.from && to == o.to && after == o.after; }
};

class PublishPlan {
public:
    std::vector<std::string> publish_statements;
    std::vector<DirMove> publish_directories; // execution order
    std::vector<std::string> cleanup_statements;
    std::vector<std::string> cleanup_directories;

    std::string to_json(bool pretty = false) const;
    static PublishPlan from_json(const jval& doc);
    static PublishPlan from_json(const std::string& json);
};

class PublishPlanBuilder {
public:
    explicit PublishPlanBuilder(const DDLVisitor& ddl) : ddl_(ddl) {}

    // replaced: decoded partitions to drop once the new data is published
    PublishPlan build(const ConversionConfig& config,
                      const StagingPlan& staging,
                      const DestinationMeta& destination,
                      const std::vector<std::string>& evolution,
                      const std::vector<kv_list>& replaced) const;

private:
    const DDLVisitor& ddl_;
};
