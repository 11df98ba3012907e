// include/market_ingest/ingest/fetch_orchestrator.hpp
#pragma once

#include <functional>
#include <string>
#include <vector>
#include "market_ingest/core/config_base.hpp"
#include "market_ingest/core/retry.hpp"
#include "market_ingest/ingest/source_adapter.hpp"

namespace market_ingest {

/**
 * @brief Worker pool and retry settings for fetch jobs
 */
struct FetchConfig : public ConfigBase {
    int workers{4};
    int max_attempts{3};
    int initial_backoff_ms{500};
    double backoff_multiplier{2.0};
    int max_backoff_ms{30000};
    int attempt_timeout_ms{30000};  // 0 disables the per-attempt timeout
    int drain_timeout_ms{60000};    // wait for timed-out calls before run() returns

    RetryPolicy retry_policy() const;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

struct FetchFailure {
    FetchTarget target;
    ErrorCode code{ErrorCode::FETCH_ERROR};
    std::string reason;
    int attempts{0};
};

/**
 * @brief Outcome of one fetch batch
 *
 * records keeps the order of the targets that produced them.
 */
struct FetchReport {
    std::string source;
    std::vector<NormalizedRecord> records;
    std::vector<FetchFailure> failures;
    std::vector<FetchTarget> outstanding;  // timed-out calls still running at return
    size_t attempted{0};

    size_t succeeded() const {
        return attempted - failures.size();
    }
};

/**
 * @brief Called once per successful target, possibly from several workers at once
 */
using FetchItemHandler =
    std::function<void(const FetchTarget&, const std::vector<NormalizedRecord>&)>;

/**
 * @brief Bounded-parallel fan-out of a source over many targets
 *
 * Every target is fetched independently with retry and exponential backoff
 * on retryable errors. A target that exhausts its attempts is reported in
 * FetchReport::failures and never stops the remaining targets. Nothing is
 * written to the store here.
 *
 * At most `workers` source calls run at once. A call that times out holds
 * its slot until the source returns, so the source must not reference state
 * that dies with the caller of run().
 */
class FetchOrchestrator {
public:
    explicit FetchOrchestrator(FetchConfig config);
    ~FetchOrchestrator();

    FetchOrchestrator(const FetchOrchestrator&) = delete;
    FetchOrchestrator& operator=(const FetchOrchestrator&) = delete;

    FetchReport run(const SourceAdapter& source, const std::vector<FetchTarget>& targets,
                    const FetchItemHandler& handler = nullptr);

    const FetchConfig& config() const {
        return config_;
    }

private:
    FetchConfig config_;
    std::string component_id_;
};

}  // namespace market_ingest
