#pragma once
#include <string>
#include <vector>
#include "filesystem.hpp"
#include "publish_plan.hpp"

// Runs generated statements against the query engine. Throws on failure.
class StatementExecutor {
public:
    virtual ~StatementExecutor() = default;
    virtual void execute(const std::string& statement) = 0;
};

// Logs statements instead of running them.
class DryRunExecutor final : public StatementExecutor {
public:
    void execute(const std::string& statement) override;
    const std::vector<std::string>& executed() const { return executed_; }
private:
    std::vector<std::string> executed_;
};

/**
 * Drives a plan onto an executor and a filesystem, stopping at the first failure.
 * Failures surface as ConvError{Exec} or ConvError{FileSystem}; nothing is rolled back.
 */
class PlanRunner {
public:
    PlanRunner(StatementExecutor& executor, FileSystem& fs) : executor_(executor), fs_(fs) {}

    void run_statements(const std::vector<std::string>& statements);

    // publish statements with each directory move run at its recorded position
    void publish(const PublishPlan& plan);
    void cleanup(const PublishPlan& plan);

private:
    void run(const std::string& statement);
    void move(const DirMove& m);

    StatementExecutor& executor_;
    FileSystem& fs_;
};
