#pragma once
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include "sqlconnection.hpp"

using PConn = std::shared_ptr<SQLConnection>;
using ConnFactory = std::function<PSQLConnection()>;

namespace pool {

enum class DbIntent { Read, Write };
enum class PoolAcquireError { Timeout, Shutdown };

struct PoolStats {
    std::size_t size { 0 };
    std::size_t in_use { 0 };
    std::size_t waiters { 0 };
};

struct AcquirePolicy {
    std::chrono::milliseconds acquire_timeout { 1500 }; // never block forever
};

class IDbPool;

// Holds one connection; gives it back to the pool when destroyed.
class Lease {
public:
    Lease() = default;
    Lease(IDbPool* owner, PConn conn, DbIntent intent)
        : owner_(owner), conn_(std::move(conn)), intent_(intent) { }

    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;

    Lease(Lease&& other) noexcept { take(other); }
    Lease& operator=(Lease&& other) noexcept {
        if (this != &other) {
            release();
            take(other);
        }
        return *this;
    }

    ~Lease() { release(); }

    SQLConnection& conn() const { return *conn_; }
    DbIntent intent() const { return intent_; }
    explicit operator bool() const { return !!conn_; }

    void release();

private:
    void take(Lease& o) noexcept {
        owner_ = o.owner_;
        o.owner_ = nullptr;
        conn_ = std::move(o.conn_);
        intent_ = o.intent_;
    }

    IDbPool* owner_ { nullptr };
    PConn conn_ {};
    DbIntent intent_ { DbIntent::Read };
};

class IDbPool {
public:
    virtual ~IDbPool() = default;

    struct AcquireResult {
        bool ok { false };
        Lease lease;
        PoolAcquireError error { PoolAcquireError::Timeout };
    };

    // zero timeout means the policy's timeout
    virtual AcquireResult acquire(DbIntent intent,
        std::chrono::milliseconds timeout = std::chrono::milliseconds::zero()) = 0;

    virtual PoolStats stats() const = 0;
    virtual void shutdown() = 0;

protected:
    virtual void give_back(PConn conn, DbIntent intent) = 0;
    friend class Lease;
};

inline void Lease::release() {
    if (owner_ && conn_) owner_->give_back(conn_, intent_);
    owner_ = nullptr;
    conn_.reset();
}

/**
 * Fixed-size pool; all connections are opened up front against one dsn.
 * Throws ConvError{Store} when a connection cannot be opened.
 */
class DbPool final : public IDbPool {
public:
    DbPool(std::size_t capacity, std::string dsn, ConnFactory factory, AcquirePolicy policy = {});

    AcquireResult acquire(DbIntent intent,
        std::chrono::milliseconds timeout = std::chrono::milliseconds::zero()) override;
    PoolStats stats() const override;
    void shutdown() override;

protected:
    void give_back(PConn conn, DbIntent intent) override;

private:
    std::size_t cap_;
    std::string dsn_;
    AcquirePolicy policy_;

    mutable std::mutex mx_;
    std::condition_variable cv_;
    std::deque<PConn> free_;
    bool shutdown_ { false };
    std::size_t in_use_ { 0 };
    std::size_t waiters_ { 0 };
};

} // namespace pool
