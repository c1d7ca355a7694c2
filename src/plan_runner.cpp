#include "plan_runner.hpp"

void DryRunExecutor::execute(const std::string& statement) {
    LOG_INFO("dry-run: %s", statement.c_str());
    executed_.push_back(statement);
}

void PlanRunner::run(const std::string& statement) {
    LOG_DEBUG("executing: %s", statement.c_str());
    try {
        executor_.execute(statement);
    } catch (const ConvError&) {
        throw;
    } catch (const std::exception& e) {
        THROW_AS(ErrKind::Exec, "statement failed: %s: %s", e.what(), statement.c_str());
    }
}

void PlanRunner::move(const DirMove& m) {
    if (fs_.exists(m.to)) {
        LOG_INFO("Deleting %s before publish", m.to.c_str());
        fs_.remove_all(m.to);
    }
    LOG_INFO("Moving %s to %s", m.from.c_str(), m.to.c_str());
    fs_.move(m.from, m.to);
}

void PlanRunner::run_statements(const std::vector<std::string>& statements) {
    for (const auto& s : statements) run(s);
}

void PlanRunner::publish(const PublishPlan& plan) {
    size_t next_move = 0;
    auto moves_due = [&](size_t done) {
        while (next_move < plan.publish_directories.size() && plan.publish_directories[next_move].after <= done) {
            move(plan.publish_directories[next_move++]);
        }
    };
    for (size_t i = 0; i < plan.publish_statements.size(); ++i) {
        moves_due(i);
        run(plan.publish_statements[i]);
    }
    moves_due(plan.publish_statements.size());
    // anything positioned past the end still runs, in order
    while (next_move < plan.publish_directories.size()) move(plan.publish_directories[next_move++]);
}

void PlanRunner::cleanup(const PublishPlan& plan) {
    run_statements(plan.cleanup_statements);
    for (const auto& dir : plan.cleanup_directories) {
        if (!fs_.exists(dir)) continue;
        LOG_INFO("Deleting %s", dir.c_str());
        fs_.remove_all(dir);
    }
}
