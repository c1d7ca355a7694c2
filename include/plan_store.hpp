#pragma once
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include "dbpool.hpp"
#include "publish_plan.hpp"

using namespace std::literals::chrono_literals;

/**
 * Persists publish plans by work unit so planning and publishing can run
 * in different processes. Table publish_plans(work_unit, plan, created_at).
 */
class PlanStore {
public:
    PlanStore(const std::string& dsn, Dialect dialect, std::size_t capacity = 2);
    PlanStore(std::unique_ptr<pool::IDbPool> pool, Dialect dialect);
    ~PlanStore() = default;

    void init();                                                  // create table if missing
    void save(const std::string& work_unit, const PublishPlan& plan); // insert or replace
    std::optional<PublishPlan> load(const std::string& work_unit);
    bool remove(const std::string& work_unit);

    /**
     * @brief run fn with a pooled connection, keeping the lease for the call
     *
     * Throws ConvError{Store} when no connection is available in time.
     */
    template <class F>
    auto with_conn(pool::DbIntent intent, F&& fn) -> std::invoke_result_t<F, SQLConnection&> {
        auto ac = dbpool_->acquire(intent, 1000ms);
        if (!ac.ok) THROW_AS(ErrKind::Store, "no database connection available");
        return std::forward<F>(fn)(ac.lease.conn());
    }

    // Same as with_conn, inside a transaction; rolls back and rethrows on failure.
    template <class F>
    auto with_tr(pool::DbIntent intent, F&& fn) -> std::invoke_result_t<F, SQLConnection&> {
        return with_conn(intent, [&](SQLConnection& conn) {
            if (!conn.begin()) THROW_AS(ErrKind::Store, "begin() failed");
            try {
                if constexpr (std::is_void_v<std::invoke_result_t<F, SQLConnection&>>) {
                    fn(conn);
                    conn.commit();
                } else {
                    auto result = fn(conn);
                    conn.commit();
                    return result;
                }
            } catch (...) {
                conn.rollback();
                throw;
            }
        });
    }

private:
    std::string ph(size_t index1) const; // ?1 or $1

    std::unique_ptr<pool::IDbPool> dbpool_;
    Dialect dialect_;
};
