// include/market_ingest/data/connection_pool.hpp
#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include "market_ingest/core/error.hpp"

namespace market_ingest {

/**
 * @brief Bounded pool of PostgreSQL connections
 */
class ConnectionPool {
public:
    /**
     * @param connection_string libpq connection string
     * @param max_size Upper bound of open connections
     */
    ConnectionPool(std::string connection_string, size_t max_size);
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    /**
     * @brief Open the initial connections
     * @param initial_size Connections opened eagerly
     * @return Error if not a single connection could be opened
     */
    Result<void> initialize(size_t initial_size);

    /**
     * @brief Returns its connection to the pool when destroyed
     */
    class ConnectionGuard {
    public:
        ConnectionGuard() = default;
        ConnectionGuard(std::shared_ptr<pqxx::connection> connection, ConnectionPool* pool)
            : connection_(std::move(connection)), pool_(pool) {}

        ~ConnectionGuard() {
            release();
        }

        pqxx::connection* get() const {
            return connection_.get();
        }

        explicit operator bool() const {
            return connection_ != nullptr;
        }

        ConnectionGuard(const ConnectionGuard&) = delete;
        ConnectionGuard& operator=(const ConnectionGuard&) = delete;

        ConnectionGuard(ConnectionGuard&& other) noexcept
            : connection_(std::move(other.connection_)), pool_(other.pool_) {
            other.pool_ = nullptr;
        }

        ConnectionGuard& operator=(ConnectionGuard&& other) noexcept {
            if (this != &other) {
                release();
                connection_ = std::move(other.connection_);
                pool_ = other.pool_;
                other.pool_ = nullptr;
            }
            return *this;
        }

    private:
        void release() {
            if (connection_ && pool_) {
                pool_->return_connection(std::move(connection_));
            }
            connection_.reset();
            pool_ = nullptr;
        }

        std::shared_ptr<pqxx::connection> connection_;
        ConnectionPool* pool_{nullptr};
    };

    /**
     * @brief Take a connection, opening a new one while below max_size
     * @param timeout How long to wait for a connection to be returned
     * @return An empty guard if none became available in time
     */
    ConnectionGuard acquire_connection(
        std::chrono::milliseconds timeout = std::chrono::seconds(5));

    void close_all();

    size_t available_connections_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return available_connections_.size();
    }

    size_t total_connections() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return total_connections_;
    }

private:
    void return_connection(std::shared_ptr<pqxx::connection> connection);

    // Only call with mutex_ held
    std::shared_ptr<pqxx::connection> create_new_connection();

    std::string connection_string_;
    size_t max_size_;
    size_t total_connections_{0};
    std::deque<std::shared_ptr<pqxx::connection>> available_connections_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

}  // namespace market_ingest
