// src/data/connection_pool.cpp
#include "market_ingest/data/connection_pool.hpp"
#include <algorithm>
#include "market_ingest/core/logger.hpp"

namespace market_ingest {

ConnectionPool::ConnectionPool(std::string connection_string, size_t max_size)
    : connection_string_(std::move(connection_string)), max_size_(std::max<size_t>(1, max_size)) {}

ConnectionPool::~ConnectionPool() {
    close_all();
}

Result<void> ConnectionPool::initialize(size_t initial_size) {
    std::lock_guard<std::mutex> lock(mutex_);

    size_t target = std::min(initial_size, max_size_);
    std::string last_error;
    while (total_connections_ < target) {
        try {
            available_connections_.push_back(std::make_shared<pqxx::connection>(connection_string_));
            ++total_connections_;
        } catch (const std::exception& e) {
            last_error = e.what();
            break;
        }
    }

    if (total_connections_ == 0) {
        return make_error<void>(ErrorCode::DATABASE_ERROR,
                                "Failed to open any database connection: " + last_error,
                                "ConnectionPool");
    }
    if (total_connections_ < target) {
        WARN("Connection pool opened " << total_connections_ << " of " << target
                                       << " connections: " << last_error);
    }

    INFO("Connection pool initialized with " << total_connections_ << " connections");
    return Result<void>();
}

std::shared_ptr<pqxx::connection> ConnectionPool::create_new_connection() {
    try {
        auto connection = std::make_shared<pqxx::connection>(connection_string_);
        ++total_connections_;
        DEBUG("Created database connection, total " << total_connections_);
        return connection;
    } catch (const std::exception& e) {
        ERROR("Failed to create database connection: " << e.what());
        return nullptr;
    }
}

ConnectionPool::ConnectionGuard ConnectionPool::acquire_connection(
    std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);

    if (available_connections_.empty() && total_connections_ < max_size_) {
        auto connection = create_new_connection();
        if (connection) {
            return ConnectionGuard(connection, this);
        }
    }

    if (!cv_.wait_for(lock, timeout, [this] { return !available_connections_.empty(); })) {
        ERROR("Timed out after " << timeout.count() << "ms waiting for a database connection");
        return ConnectionGuard();
    }

    auto connection = available_connections_.front();
    available_connections_.pop_front();

    if (!connection->is_open()) {
        INFO("Replacing stale database connection");
        --total_connections_;
        connection = create_new_connection();
        if (!connection) {
            return ConnectionGuard();
        }
    }

    return ConnectionGuard(connection, this);
}

void ConnectionPool::return_connection(std::shared_ptr<pqxx::connection> connection) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!connection->is_open()) {
        // Broken connections are dropped, the next acquire opens a new one
        --total_connections_;
    } else {
        available_connections_.push_back(std::move(connection));
    }
    cv_.notify_one();
}

void ConnectionPool::close_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    total_connections_ -= std::min(total_connections_, available_connections_.size());
    available_connections_.clear();
}

}  // namespace market_ingest
