#include "plan_store.hpp"
#include <chrono>

namespace {

    ConnFactory factory_for(Dialect dialect) {
        switch (dialect) {
            case Dialect::SQLite:
                return make_sqlite_connection;
            case Dialect::Postgres:
#if HAVE_POSTGRESQL
                return make_postgres_connection;
#else
                THROW_AS(ErrKind::Store, "built without PostgreSQL support");
#endif
        }
        THROW_AS(ErrKind::Store, "unknown dialect");
    }

    std::string now_millis() {
        auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        return std::to_string(now);
    }
}

PlanStore::PlanStore(const std::string& dsn, Dialect dialect, std::size_t capacity)
    : dbpool_(std::make_unique<pool::DbPool>(capacity, dsn, factory_for(dialect))), dialect_(dialect) {}

PlanStore::PlanStore(std::unique_ptr<pool::IDbPool> pool, Dialect dialect)
    : dbpool_(std::move(pool)), dialect_(dialect) {
    if (!dbpool_) THROW_AS(ErrKind::Store, "PlanStore needs a connection pool");
}

std::string PlanStore::ph(size_t index1) const {
    return (dialect_ == Dialect::Postgres ? "$" : "?") + std::to_string(index1);
}

void PlanStore::init() {
    with_conn(pool::DbIntent::Write, [](SQLConnection& conn) {
        conn.execute("CREATE TABLE IF NOT EXISTS publish_plans (\n"
                     " work_unit TEXT PRIMARY KEY,\n"
                     " plan TEXT NOT NULL,\n"
                     " created_at TEXT NOT NULL\n"
                     ");");
    });
}

void PlanStore::save(const std::string& work_unit, const PublishPlan& plan) {
    if (work_unit.empty()) THROW_AS(ErrKind::Store, "cannot store a plan without a work unit id");
    std::string json = plan.to_json();
    std::string sql = "INSERT INTO publish_plans (work_unit, plan, created_at) VALUES ("
        + ph(1) + ", " + ph(2) + ", " + ph(3) + ")"
        " ON CONFLICT (work_unit) DO UPDATE SET plan = excluded.plan, created_at = excluded.created_at";

    with_tr(pool::DbIntent::Write, [&](SQLConnection& conn) {
        auto stmt = conn.prepare(sql);
        stmt->bind(1, work_unit);
        stmt->bind(2, json);
        stmt->bind(3, now_millis());
        stmt->exec();
    });
    LOG_INFO("stored publish plan for %s", work_unit.c_str());
}

std::optional<PublishPlan> PlanStore::load(const std::string& work_unit) {
    std::string sql = "SELECT plan FROM publish_plans WHERE work_unit = " + ph(1);
    auto json = with_conn(pool::DbIntent::Read, [&](SQLConnection& conn) -> std::optional<std::string> {
        auto stmt = conn.prepare(sql);
        stmt->bind(1, work_unit);
        if (!stmt->next()) return std::nullopt;
        return stmt->column_text(0);
    });
    if (!json) return std::nullopt;

    try {
        return PublishPlan::from_json(*json);
    } catch (const ConvError& e) {
        THROW_AS(ErrKind::Store, "stored plan for %s is unreadable: %s", work_unit.c_str(), e.what());
    }
}

bool PlanStore::remove(const std::string& work_unit) {
    std::string sql = "DELETE FROM publish_plans WHERE work_unit = " + ph(1);
    int rows = with_tr(pool::DbIntent::Write, [&](SQLConnection& conn) {
        auto stmt = conn.prepare(sql);
        stmt->bind(1, work_unit);
        return stmt->exec();
    });
    return rows > 0;
}
