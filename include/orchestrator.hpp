#pragma once
#include <optional>
#include "catalog.hpp"
#include "conversion.hpp"
#include "ddl_visitor.hpp"
#include "dml_visitor.hpp"
#include "filesystem.hpp"
#include "publish_plan.hpp"
#include "staging_plan.hpp"

struct ConversionResult {
    ConversionEntity entity;          // statements hold the staging phase
    std::optional<PublishPlan> plan;  // absent when the format is not converted
};

/**
 * Plans one conversion entity into a staging phase and a publish plan.
 * The only side effect is creating the destination data root.
 */
class ConversionOrchestrator {
public:
    ConversionOrchestrator(DatasetConfig config, PCatalog catalog, PFileSystem fs);

    ConversionResult plan(ConversionEntity entity, const Schema& target, OutputFormat format);

private:
    void prepare_destination(const ConversionEntity& entity, const ConversionConfig& config);

    DatasetConfig config_;
    PCatalog catalog_;
    PFileSystem fs_;
    HiveDDLVisitor ddl_;
    HiveDMLVisitor dml_ { ddl_ };
};
