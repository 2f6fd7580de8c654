/**
 * @file database.cpp
 * @brief Implementation of Database
 */

#include "dbmanager/database.hpp"
#include "dbmanager/exceptions.hpp"

namespace dbmanager {

Database::Database(std::shared_ptr<Driver> driver, std::string dsn)
    : driver_(std::move(driver))
    , dsn_(std::move(dsn))
{
    if (!driver_) {
        throw DatabaseException("Database requires a driver");
    }
}

Database::~Database() {
    close();
}

void Database::setMaxIdleConns(int n) {
    std::vector<std::unique_ptr<DriverConnection>> excess;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        maxIdle_ = n < 0 ? 0 : n;
        if (maxOpen_ > 0 && maxIdle_ > maxOpen_) {
            maxIdle_ = maxOpen_;
        }
        while (static_cast<int>(idle_.size()) > maxIdle_) {
            excess.push_back(std::move(idle_.back()));
            idle_.pop_back();
            --numOpen_;
        }
    }
    available_.notify_all();
    // excess connections close here, outside the lock
}

void Database::setMaxOpenConns(int n) {
    int idleLimit = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        maxOpen_ = n < 0 ? 0 : n;
        idleLimit = maxIdle_;
    }
    // Re-applying the idle limit clamps it to the new open limit
    setMaxIdleConns(idleLimit);
}

int Database::maxIdleConns() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return maxIdle_;
}

int Database::maxOpenConns() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return maxOpen_;
}

int Database::openConnections() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return numOpen_;
}

int Database::idleConnections() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(idle_.size());
}

void Database::ping() {
    withConnection([](DriverConnection& conn) { conn.ping(); });
}

void Database::execute(const std::string& sql) {
    withConnection([&sql](DriverConnection& conn) { conn.execute(sql); });
}

void Database::withConnection(const std::function<void(DriverConnection&)>& fn) {
    auto conn = acquire();
    try {
        fn(*conn);
    } catch (const ConnectionException&) {
        release(std::move(conn), false);
        throw;
    } catch (...) {
        release(std::move(conn), true);
        throw;
    }
    release(std::move(conn), true);
}

void Database::close() {
    std::vector<std::unique_ptr<DriverConnection>> toClose;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        numOpen_ -= static_cast<int>(idle_.size());
        toClose.swap(idle_);
    }
    available_.notify_all();
}

bool Database::isClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::string Database::driverName() const {
    return driver_->name();
}

std::unique_ptr<DriverConnection> Database::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
        if (closed_) {
            throw ConnectionException("database '" + dsn_ + "' is closed");
        }
        if (!idle_.empty()) {
            auto conn = std::move(idle_.back());
            idle_.pop_back();
            return conn;
        }
        if (maxOpen_ == 0 || numOpen_ < maxOpen_) {
            break;
        }
        available_.wait(lock);
    }

    // Reserve the slot, then open without holding the lock
    ++numOpen_;
    lock.unlock();

    try {
        auto conn = driver_->open(dsn_);
        if (!conn) {
            throw ConnectionException("driver '" + driver_->name() + "' returned no connection");
        }
        return conn;
    } catch (...) {
        lock.lock();
        --numOpen_;
        lock.unlock();
        available_.notify_one();
        throw;
    }
}

void Database::release(std::unique_ptr<DriverConnection> conn, bool reusable) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (reusable && !closed_ && static_cast<int>(idle_.size()) < maxIdle_) {
            idle_.push_back(std::move(conn));
        } else {
            --numOpen_;
        }
    }
    available_.notify_one();
    // conn, if not pooled, closes here
}

void applyPoolShape(Database& db) {
    db.setMaxIdleConns(0);
    db.setMaxOpenConns(1);
}

} // namespace dbmanager
