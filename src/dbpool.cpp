#include "dbpool.hpp"

namespace pool {

DbPool::DbPool(std::size_t capacity, std::string dsn, ConnFactory factory, AcquirePolicy policy)
    : cap_(capacity), dsn_(std::move(dsn)), policy_(policy) {
    if (!factory) THROW_AS(ErrKind::Store, "DbPool: null connection factory");
    if (cap_ == 0) THROW_AS(ErrKind::Store, "DbPool: capacity must be positive");
    for (std::size_t i = 0; i < cap_; ++i) {
        PSQLConnection up = factory();
        if (!up) THROW_AS(ErrKind::Store, "DbPool: factory returned null connection");
        up->connect(dsn_);
        free_.push_back(PConn(std::move(up)));
    }
}

IDbPool::AcquireResult DbPool::acquire(DbIntent intent, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + (timeout.count() ? timeout : policy_.acquire_timeout);

    std::unique_lock<std::mutex> lk(mx_);
    ++waiters_;
    bool ready = cv_.wait_until(lk, deadline, [this] { return shutdown_ || !free_.empty(); });
    --waiters_;

    AcquireResult r;
    if (shutdown_) {
        r.error = PoolAcquireError::Shutdown;
        return r;
    }
    if (!ready) {
        r.error = PoolAcquireError::Timeout;
        return r;
    }

    PConn conn = std::move(free_.front());
    free_.pop_front();
    ++in_use_;
    r.ok = true;
    r.lease = Lease(this, std::move(conn), intent);
    return r;
}

PoolStats DbPool::stats() const {
    std::lock_guard<std::mutex> lk(mx_);
    PoolStats s;
    s.size = cap_;
    s.in_use = in_use_;
    s.waiters = waiters_;
    return s;
}

void DbPool::shutdown() {
    std::lock_guard<std::mutex> lk(mx_);
    shutdown_ = true;
    cv_.notify_all();
}

void DbPool::give_back(PConn conn, DbIntent) {
    std::lock_guard<std::mutex> lk(mx_);
    if (conn && !shutdown_) free_.push_back(std::move(conn));
    if (in_use_) --in_use_;
    cv_.notify_one();
}

} // namespace pool
