// include/market_ingest/portfolio/snapshot_engine.hpp
#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "market_ingest/data/canonical_store.hpp"

namespace market_ingest {

/**
 * @brief Aggregate row and per-security details of one member on one date
 */
struct MemberSnapshot {
    DailyMoneyHistory summary;
    std::vector<DailyMoneyHistoryDetail> details;
};

struct SnapshotReport {
    Date date;
    size_t members{0};
    size_t lots{0};
    size_t closed_out{0};      // members written as a zero snapshot
    size_t missing_prices{0};  // lots valued at zero for lack of a close
    std::vector<std::string> failures;

    bool succeeded() const {
        return failures.empty();
    }
};

/**
 * @brief P&L as a percentage of the absolute cost, 0 without cost
 */
double profit_and_loss_percentage(double profit_and_loss, double cost);

/**
 * @brief Value a member's open lots at the given closing prices
 *
 * Lots sharing a code are folded into one detail row. A code without a
 * closing price is valued at zero. previous_day_* fields are copied from
 * the supplied rows, never recomputed.
 *
 * @param closes Closing price per code, on or before the snapshot date
 * @param previous Member's latest snapshot before the date, if any
 * @param previous_details Latest detail row per code before the date
 */
MemberSnapshot build_member_snapshot(
    const std::string& member_id, const Date& date, const std::vector<StockOwnership>& lots,
    const std::map<std::string, Price>& closes, const std::optional<DailyMoneyHistory>& previous,
    const std::map<std::string, DailyMoneyHistoryDetail>& previous_details);

/**
 * @brief Daily portfolio valuation of every member with holdings
 *
 * Writes one aggregate row per (member, date) plus its detail rows in a
 * single store call, so re-running a date overwrites in place. A member
 * whose previous snapshot still carried value but who holds no open lot
 * today receives a zero snapshot.
 */
class SnapshotEngine {
public:
    explicit SnapshotEngine(std::shared_ptr<CanonicalStore> store);
    ~SnapshotEngine();

    Result<std::vector<MemberSnapshot>> compute(const Date& date) const;

    Result<SnapshotReport> run(const Date& date, const MergeContext& ctx);

private:
    Result<std::map<std::string, Price>> closing_prices(const std::vector<StockOwnership>& lots,
                                                        const Date& date) const;

    std::shared_ptr<CanonicalStore> store_;
    std::string component_id_;
};

}  // namespace market_ingest
