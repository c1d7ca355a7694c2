#include <catch2/catch.hpp>
#include "plan_runner.hpp"
#include "fakes.hpp"

namespace {

    PublishPlan partition_plan() {
        PublishPlan plan;
        plan.publish_statements = {
            "ALTER TABLE t DROP IF EXISTS PARTITION (p='1')",
            "ALTER TABLE t ADD IF NOT EXISTS PARTITION (p='1') LOCATION '/final/p=1'",
            "ALTER TABLE t DROP IF EXISTS PARTITION (p='0')",
        };
        plan.publish_directories = { { "/stg/p=1", "/final/p=1", 1 } };
        plan.cleanup_statements = { "DROP TABLE IF EXISTS stg" };
        plan.cleanup_directories = { "/stg" };
        return plan;
    }
}

TEST_CASE("Publish runs each move at its recorded position", "[runner]") {
    FakeFileSystem fs;
    fs.dirs["/stg/p=1"] = 0755;
    RecordingExecutor exec;
    exec.journal = &fs.ops;

    PlanRunner(exec, fs).publish(partition_plan());
    CHECK(fs.ops == std::vector<std::string> {
        "sql ALTER TABLE t DROP IF EXISTS PARTITION (p='1')",
        "move /stg/p=1 /final/p=1",
        "sql ALTER TABLE t ADD IF NOT EXISTS PARTITION (p='1') LOCATION '/final/p=1'",
        "sql ALTER TABLE t DROP IF EXISTS PARTITION (p='0')",
    });
    CHECK(fs.exists("/final/p=1"));
}

TEST_CASE("An existing destination is replaced by the move", "[runner]") {
    FakeFileSystem fs;
    fs.dirs["/stg"] = 0755;
    fs.dirs["/final"] = 0755;
    RecordingExecutor exec;
    PublishPlan plan;
    plan.publish_directories = { { "/stg", "/final", 0 } };

    PlanRunner(exec, fs).publish(plan);
    CHECK(fs.ops == std::vector<std::string> { "rm /final", "move /stg /final" });
}

TEST_CASE("Publish stops at the first failing statement", "[runner]") {
    FakeFileSystem fs;
    RecordingExecutor exec;
    exec.journal = &fs.ops;
    exec.fail_on = "DROP IF EXISTS PARTITION (p='1')";

    try {
        PlanRunner(exec, fs).publish(partition_plan());
        FAIL("publish succeeded");
    } catch (const ConvError& e) {
        CHECK(e.kind() == ErrKind::Exec);
    }
    CHECK(fs.ops.size() == 1);
}

TEST_CASE("Publish stops at a failing move", "[runner]") {
    FakeFileSystem fs;
    fs.fail_move = "/stg/p=1";
    RecordingExecutor exec;

    CHECK_THROWS_AS(PlanRunner(exec, fs).publish(partition_plan()), ConvError);
    CHECK(exec.statements.size() == 1);
}

TEST_CASE("Cleanup drops the staging table and deletes its directory", "[runner]") {
    FakeFileSystem fs;
    fs.dirs["/stg"] = 0755;
    RecordingExecutor exec;
    exec.journal = &fs.ops;

    PlanRunner(exec, fs).cleanup(partition_plan());
    CHECK(fs.ops == std::vector<std::string> { "sql DROP TABLE IF EXISTS stg", "rm /stg" });
    CHECK_FALSE(fs.exists("/stg"));
}

TEST_CASE("Dry run records statements", "[runner]") {
    DryRunExecutor exec;
    FakeFileSystem fs;
    PlanRunner(exec, fs).run_statements({ "SET a=1", "SELECT 1" });
    CHECK(exec.executed() == std::vector<std::string> { "SET a=1", "SELECT 1" });
}
