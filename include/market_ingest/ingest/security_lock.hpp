// include/market_ingest/ingest/security_lock.hpp
#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace market_ingest {

/**
 * @brief One mutex per security code
 *
 * Shared by the merger and the metrics engine so that computing a
 * security's metrics never overlaps a merge writing its quotes. Different
 * codes never contend.
 */
class SecurityLockTable {
public:
    std::unique_lock<std::mutex> acquire(const std::string& code) {
        std::mutex* security_mutex = nullptr;
        {
            std::lock_guard<std::mutex> lock(table_mutex_);
            auto& slot = locks_[code];
            if (!slot) {
                slot = std::make_unique<std::mutex>();
            }
            security_mutex = slot.get();
        }
        return std::unique_lock<std::mutex>(*security_mutex);
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(table_mutex_);
        return locks_.size();
    }

private:
    mutable std::mutex table_mutex_;
    std::unordered_map<std::string, std::unique_ptr<std::mutex>> locks_;
};

}  // namespace market_ingest
