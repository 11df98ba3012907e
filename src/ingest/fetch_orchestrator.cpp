// src/ingest/fetch_orchestrator.cpp
#include "market_ingest/ingest/fetch_orchestrator.hpp"
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include "market_ingest/core/logger.hpp"
#include "market_ingest/core/state_manager.hpp"

namespace market_ingest {

RetryPolicy FetchConfig::retry_policy() const {
    RetryPolicy policy;
    policy.max_attempts = std::max(1, max_attempts);
    policy.initial_delay = std::chrono::milliseconds(initial_backoff_ms);
    policy.multiplier = backoff_multiplier;
    policy.max_delay = std::chrono::milliseconds(max_backoff_ms);
    policy.max_jitter = std::chrono::milliseconds(std::min(100, initial_backoff_ms));
    return policy;
}

nlohmann::json FetchConfig::to_json() const {
    return nlohmann::json{{"workers", workers},
                          {"max_attempts", max_attempts},
                          {"initial_backoff_ms", initial_backoff_ms},
                          {"backoff_multiplier", backoff_multiplier},
                          {"max_backoff_ms", max_backoff_ms},
                          {"attempt_timeout_ms", attempt_timeout_ms},
                          {"drain_timeout_ms", drain_timeout_ms}};
}

void FetchConfig::from_json(const nlohmann::json& j) {
    if (j.contains("workers"))
        workers = j.at("workers").get<int>();
    if (j.contains("max_attempts"))
        max_attempts = j.at("max_attempts").get<int>();
    if (j.contains("initial_backoff_ms"))
        initial_backoff_ms = j.at("initial_backoff_ms").get<int>();
    if (j.contains("backoff_multiplier"))
        backoff_multiplier = j.at("backoff_multiplier").get<double>();
    if (j.contains("max_backoff_ms"))
        max_backoff_ms = j.at("max_backoff_ms").get<int>();
    if (j.contains("attempt_timeout_ms"))
        attempt_timeout_ms = j.at("attempt_timeout_ms").get<int>();
    if (j.contains("drain_timeout_ms"))
        drain_timeout_ms = j.at("drain_timeout_ms").get<int>();
}

namespace {

using FetchResult = Result<std::vector<NormalizedRecord>>;

// Source calls in progress, timed-out ones included. Shared with the attempt
// threads, which outlive run() when a source never answers.
class InFlightAttempts {
public:
    explicit InFlightAttempts(size_t limit) : limit_(std::max<size_t>(1, limit)) {}

    // Claims a call slot, waiting at most `timeout` for one to free up
    bool acquire(const FetchTarget& target, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!released_.wait_for(lock, timeout, [this] { return running_.size() < limit_; })) {
            return false;
        }
        running_.push_back(target);
        return true;
    }

    void release(const FetchTarget& target) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = std::find_if(running_.begin(), running_.end(), [&](const FetchTarget& t) {
                return t.code == target.code && t.date == target.date;
            });
            if (it != running_.end()) {
                running_.erase(it);
            }
        }
        released_.notify_all();
    }

    // Targets whose calls are still running once `timeout` has passed
    std::vector<FetchTarget> drain(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        released_.wait_for(lock, timeout, [this] { return running_.empty(); });
        return running_;
    }

private:
    std::mutex mutex_;
    std::condition_variable released_;
    const size_t limit_;
    std::vector<FetchTarget> running_;
};

FetchResult fetch_with_timeout(const std::shared_ptr<const SourceAdapter>& source,
                               const FetchTarget& target, int timeout_ms,
                               const std::shared_ptr<InFlightAttempts>& in_flight) {
    if (timeout_ms <= 0) {
        return source->fetch(target);
    }

    const std::chrono::milliseconds timeout(timeout_ms);
    if (!in_flight->acquire(target, timeout)) {
        return make_error<std::vector<NormalizedRecord>>(
            ErrorCode::TIMEOUT_ERROR,
            "No fetch slot freed for " + target.to_string() + " within " +
                std::to_string(timeout_ms) + "ms",
            source->name());
    }

    // A timed-out call keeps its slot until the source returns
    auto promise = std::make_shared<std::promise<FetchResult>>();
    auto future = promise->get_future();
    std::thread([source, target, in_flight, promise]() {
        promise->set_value(source->fetch(target));
        in_flight->release(target);
    }).detach();

    if (future.wait_for(timeout) == std::future_status::ready) {
        return future.get();
    }
    return make_error<std::vector<NormalizedRecord>>(
        ErrorCode::TIMEOUT_ERROR,
        "Fetch of " + target.to_string() + " exceeded " + std::to_string(timeout_ms) + "ms",
        source->name());
}

}  // namespace

FetchOrchestrator::FetchOrchestrator(FetchConfig config)
    : config_(std::move(config)),
      component_id_(StateManager::make_component_id("FetchOrchestrator")) {
    ComponentInfo info{ComponentType::FETCH_ORCHESTRATOR,
                       ComponentState::INITIALIZED,
                       component_id_,
                       "",
                       std::chrono::system_clock::now(),
                       {}};
    auto registered = StateManager::instance().register_component(info);
    if (registered.is_error()) {
        WARN("Fetch orchestrator state registration failed: " << registered.error()->what());
    }
}

FetchOrchestrator::~FetchOrchestrator() {
    auto unregistered = StateManager::instance().unregister_component(component_id_);
    if (unregistered.is_error()) {
        DEBUG("Fetch orchestrator was not registered: " << unregistered.error()->what());
    }
}

FetchReport FetchOrchestrator::run(const SourceAdapter& source,
                                   const std::vector<FetchTarget>& targets,
                                   const FetchItemHandler& handler) {
    ScopedLogComponent log_component("FetchOrchestrator");

    FetchReport report;
    report.source = source.name();
    report.attempted = targets.size();
    if (targets.empty()) {
        return report;
    }

    auto state = StateManager::instance().update_state(component_id_, ComponentState::RUNNING);
    if (state.is_error()) {
        DEBUG("Fetch orchestrator state not updated: " << state.error()->what());
    }

    INFO("Fetching " << targets.size() << " targets from " << source.name() << " with "
                     << config_.workers << " workers");

    // Per-target slots keep the report independent of worker scheduling
    std::vector<std::optional<std::vector<NormalizedRecord>>> slots(targets.size());
    std::vector<std::optional<FetchFailure>> failures(targets.size());

    auto shared_source = std::make_shared<const SourceAdapter>(source);
    auto in_flight =
        std::make_shared<InFlightAttempts>(static_cast<size_t>(std::max(1, config_.workers)));
    std::atomic<size_t> next_index{0};
    const RetryPolicy policy = config_.retry_policy();
    const std::function<bool(ErrorCode)> should_retry = is_retryable;

    auto worker = [&]() {
        Logger::register_component("FetchOrchestrator");
        while (true) {
            size_t index = next_index.fetch_add(1);
            if (index >= targets.size()) {
                break;
            }
            const auto& target = targets[index];

            int attempts = 0;
            auto result = utils::retry_with_backoff(
                [&]() {
                    return fetch_with_timeout(shared_source, target, config_.attempt_timeout_ms,
                                              in_flight);
                }, policy, should_retry,
                &attempts);

            if (result.is_error()) {
                WARN(source.name() << " failed for " << target.to_string() << " after "
                                   << attempts << " attempt(s): " << result.error()->what());
                failures[index] =
                    FetchFailure{target, result.error()->code(), result.error()->what(), attempts};
                continue;
            }

            auto records = result.take();
            if (handler) {
                handler(target, records);
            }
            slots[index] = std::move(records);
        }
    };

    size_t worker_count =
        std::min(targets.size(), static_cast<size_t>(std::max(1, config_.workers)));
    std::vector<std::thread> threads;
    threads.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i) {
        threads.emplace_back(worker);
    }
    for (auto& thread : threads) {
        thread.join();
    }

    report.outstanding =
        in_flight->drain(std::chrono::milliseconds(std::max(0, config_.drain_timeout_ms)));
    if (!report.outstanding.empty()) {
        WARN(report.outstanding.size() << " " << source.name() << " call(s) still running after "
                                       << config_.drain_timeout_ms << "ms, first "
                                       << report.outstanding.front().to_string());
    }

    for (size_t i = 0; i < targets.size(); ++i) {
        if (slots[i]) {
            for (auto& record : *slots[i]) {
                report.records.push_back(std::move(record));
            }
        }
        if (failures[i]) {
            report.failures.push_back(std::move(*failures[i]));
        }
    }

    INFO(source.name() << ": " << report.succeeded() << "/" << report.attempted
                       << " targets fetched, " << report.records.size() << " records, "
                       << report.failures.size() << " failed");

    auto metrics = StateManager::instance().update_metrics(
        component_id_, {{"attempted", static_cast<double>(report.attempted)},
                        {"failed", static_cast<double>(report.failures.size())},
                        {"records", static_cast<double>(report.records.size())}});
    if (metrics.is_error()) {
        DEBUG("Fetch orchestrator metrics not updated: " << metrics.error()->what());
    }
    return report;
}

}  // namespace market_ingest
