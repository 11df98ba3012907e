// include/market_ingest/ingest/upsert_merger.hpp
#pragma once

#include <memory>
#include <string>
#include <vector>
#include "market_ingest/data/canonical_store.hpp"
#include "market_ingest/ingest/security_lock.hpp"
#include "market_ingest/ingest/source_adapter.hpp"

namespace market_ingest {

struct RecordFailure {
    RecordKind kind{RecordKind::DAILY_QUOTE};
    std::string key;
    ErrorCode code{ErrorCode::VALIDATION_ERROR};
    std::string reason;
};

/**
 * @brief Per-batch merge counts
 */
struct MergeReport {
    size_t inserted{0};
    size_t updated{0};
    size_t unchanged{0};
    size_t skipped{0};
    size_t rejected{0};      // VALIDATION_ERROR
    size_t conflicts{0};     // CONFLICT_ERROR
    size_t store_errors{0};  // any other store failure
    std::vector<RecordFailure> failures;
    std::vector<QuoteKey> written_quotes;  // daily quotes inserted or updated

    size_t total() const {
        return inserted + updated + unchanged + skipped + rejected + conflicts + store_errors;
    }

    size_t written() const {
        return inserted + updated;
    }

    void count(MergeAction action);
    void add(const MergeReport& other);
    std::string summary() const;
};

/**
 * @brief Check the natural key and mandatory fields of a record
 * @return VALIDATION_ERROR naming the offending field
 */
Result<void> validate_record(const NormalizedRecord& record);

/**
 * @brief Applies normalized records to the canonical store
 *
 * Each record is one atomic store merge under the per-security lock. A
 * rejected or failed record is reported and never blocks the rest of the
 * batch. Re-applying a batch converges to the same stored state.
 */
class UpsertMerger {
public:
    UpsertMerger(std::shared_ptr<CanonicalStore> store, std::shared_ptr<SecurityLockTable> locks);
    ~UpsertMerger();

    MergeReport merge(const std::vector<NormalizedRecord>& records, const MergeContext& ctx);

    MergeReport merge_one(const NormalizedRecord& record, const MergeContext& ctx);

    /**
     * @brief Fill revenue deltas and monthly price range the source left at zero
     *
     * Neighbouring months come from the store; prices from the month's quotes.
     */
    Result<RevenueRecord> enrich_revenue(const RevenueRecord& revenue) const;

private:
    Result<MergeOutcome> apply(const NormalizedRecord& record, const MergeContext& ctx);

    std::shared_ptr<CanonicalStore> store_;
    std::shared_ptr<SecurityLockTable> locks_;
    std::string component_id_;
};

}  // namespace market_ingest
