// src/portfolio/snapshot_engine.cpp
#include "market_ingest/portfolio/snapshot_engine.hpp"
#include <cmath>
#include <set>
#include "market_ingest/core/logger.hpp"
#include "market_ingest/core/state_manager.hpp"

namespace market_ingest {

namespace {

const char* const COMPONENT = "SnapshotEngine";

}  // namespace

double profit_and_loss_percentage(double profit_and_loss, double cost) {
    if (cost == 0.0) {
        return 0.0;
    }
    return profit_and_loss / std::abs(cost) * 100.0;
}

MemberSnapshot build_member_snapshot(
    const std::string& member_id, const Date& date, const std::vector<StockOwnership>& lots,
    const std::map<std::string, Price>& closes, const std::optional<DailyMoneyHistory>& previous,
    const std::map<std::string, DailyMoneyHistoryDetail>& previous_details) {
    MemberSnapshot snapshot;
    auto& summary = snapshot.summary;
    summary.member_id = member_id;
    summary.date = date;

    std::map<std::string, DailyMoneyHistoryDetail> by_code;
    for (const auto& lot : lots) {
        auto& detail = by_code[lot.code];
        detail.member_id = member_id;
        detail.date = date;
        detail.code = lot.code;

        auto close = closes.find(lot.code);
        const Price price = close != closes.end() ? close->second : 0.0;
        detail.closing_price = price;
        detail.total_shares += lot.share_quantity;
        detail.cost += -static_cast<double>(lot.share_quantity) * lot.share_price_average;
        detail.market_value += static_cast<double>(lot.share_quantity) * price;
    }

    for (auto& [code, detail] : by_code) {
        detail.profit_and_loss = detail.market_value + detail.cost;
        detail.profit_and_loss_percentage =
            profit_and_loss_percentage(detail.profit_and_loss, detail.cost);
        detail.average_unit_price_per_share =
            detail.total_shares != 0
                ? std::abs(detail.cost) / static_cast<double>(detail.total_shares)
                : 0.0;

        auto prior = previous_details.find(code);
        if (prior != previous_details.end()) {
            detail.previous_day_market_value = prior->second.market_value;
            detail.previous_day_profit_and_loss = prior->second.profit_and_loss;
            detail.previous_day_profit_and_loss_percentage =
                prior->second.profit_and_loss_percentage;
        }

        summary.market_value += detail.market_value;
        summary.cost += detail.cost;
    }

    summary.profit_and_loss = summary.market_value + summary.cost;
    summary.profit_and_loss_percentage =
        profit_and_loss_percentage(summary.profit_and_loss, summary.cost);
    if (previous) {
        summary.previous_day_market_value = previous->market_value;
        summary.previous_day_profit_and_loss = previous->profit_and_loss;
        summary.previous_day_profit_and_loss_percentage = previous->profit_and_loss_percentage;
    }

    for (auto& [code, detail] : by_code) {
        detail.ratio =
            summary.market_value > 0.0 ? detail.market_value / summary.market_value * 100.0 : 0.0;
        snapshot.details.push_back(detail);
    }
    return snapshot;
}

SnapshotEngine::SnapshotEngine(std::shared_ptr<CanonicalStore> store)
    : store_(std::move(store)), component_id_(StateManager::make_component_id(COMPONENT)) {
    ComponentInfo info{ComponentType::SNAPSHOT_ENGINE,
                       ComponentState::RUNNING,
                       component_id_,
                       "",
                       std::chrono::system_clock::now(),
                       {}};
    auto registered = StateManager::instance().register_component(info);
    if (registered.is_error()) {
        WARN("Snapshot engine state registration failed: " << registered.error()->what());
    }
}

SnapshotEngine::~SnapshotEngine() {
    auto unregistered = StateManager::instance().unregister_component(component_id_);
    if (unregistered.is_error()) {
        DEBUG("Snapshot engine was not registered: " << unregistered.error()->what());
    }
}

Result<std::map<std::string, Price>> SnapshotEngine::closing_prices(
    const std::vector<StockOwnership>& lots, const Date& date) const {
    std::set<std::string> codes;
    for (const auto& lot : lots) {
        codes.insert(lot.code);
    }

    std::map<std::string, Price> closes;
    for (const auto& code : codes) {
        auto quote = store_->get_latest_quote_on_or_before(code, date);
        if (quote.is_error()) {
            return forward_error<std::map<std::string, Price>>(quote);
        }
        if (quote.value() && quote.value()->close > 0.0) {
            closes[code] = quote.value()->close;
        }
    }
    return Result<std::map<std::string, Price>>(std::move(closes));
}

Result<std::vector<MemberSnapshot>> SnapshotEngine::compute(const Date& date) const {
    auto lots = store_->list_open_lots(date);
    if (lots.is_error()) {
        return forward_error<std::vector<MemberSnapshot>>(lots);
    }
    auto previous = store_->get_latest_money_histories_before(date);
    if (previous.is_error()) {
        return forward_error<std::vector<MemberSnapshot>>(previous);
    }
    auto closes = closing_prices(lots.value(), date);
    if (closes.is_error()) {
        return forward_error<std::vector<MemberSnapshot>>(closes);
    }

    std::map<std::string, std::vector<StockOwnership>> lots_by_member;
    for (const auto& lot : lots.value()) {
        lots_by_member[lot.member_id].push_back(lot);
    }
    std::map<std::string, DailyMoneyHistory> previous_by_member;
    for (const auto& row : previous.value()) {
        previous_by_member[row.member_id] = row;
    }

    // Members that sold out since their last snapshot
    for (const auto& [member_id, row] : previous_by_member) {
        if (lots_by_member.count(member_id) == 0 && row.market_value != 0.0) {
            lots_by_member[member_id];
        }
    }

    std::vector<MemberSnapshot> snapshots;
    for (const auto& [member_id, member_lots] : lots_by_member) {
        std::optional<DailyMoneyHistory> prior;
        auto it = previous_by_member.find(member_id);
        if (it != previous_by_member.end()) {
            prior = it->second;
        }

        std::map<std::string, DailyMoneyHistoryDetail> prior_details;
        for (const auto& lot : member_lots) {
            if (prior_details.count(lot.code) > 0) {
                continue;
            }
            auto detail = store_->get_previous_money_history_detail(member_id, lot.code, date);
            if (detail.is_error()) {
                return forward_error<std::vector<MemberSnapshot>>(detail);
            }
            if (detail.value()) {
                prior_details[lot.code] = *detail.value();
            }
        }

        snapshots.push_back(build_member_snapshot(member_id, date, member_lots, closes.value(),
                                                  prior, prior_details));
    }
    return Result<std::vector<MemberSnapshot>>(std::move(snapshots));
}

Result<SnapshotReport> SnapshotEngine::run(const Date& date, const MergeContext& ctx) {
    ScopedLogComponent log_component(COMPONENT);

    auto computed = compute(date);
    if (computed.is_error()) {
        ERROR("Portfolio snapshot for " << date << " failed: " << computed.error()->to_string());
        auto state = StateManager::instance().update_state(
            component_id_, ComponentState::ERR_STATE, computed.error()->what());
        if (state.is_error()) {
            DEBUG("State update failed: " << state.error()->what());
        }
        return forward_error<SnapshotReport>(computed);
    }

    SnapshotReport report;
    report.date = date;
    for (auto& snapshot : computed.take()) {
        snapshot.summary.updated_time = ctx.now;
        for (auto& detail : snapshot.details) {
            detail.updated_time = ctx.now;
            ++report.lots;
            if (detail.closing_price <= 0.0) {
                ++report.missing_prices;
                WARN("No closing price for " << detail.code << " on or before " << date
                                             << ", valued at zero");
            }
        }
        if (snapshot.details.empty()) {
            ++report.closed_out;
        }

        auto stored = store_->put_money_snapshot(snapshot.summary, snapshot.details);
        if (stored.is_error()) {
            ERROR("Snapshot write failed for member " << snapshot.summary.member_id << ": "
                                                      << stored.error()->to_string());
            report.failures.push_back(snapshot.summary.member_id + ": " +
                                      stored.error()->what());
            continue;
        }
        ++report.members;
    }

    auto metrics = StateManager::instance().update_metrics(
        component_id_, {{"members", static_cast<double>(report.members)},
                        {"lots", static_cast<double>(report.lots)},
                        {"failures", static_cast<double>(report.failures.size())}});
    if (metrics.is_error()) {
        DEBUG("Metrics update failed: " << metrics.error()->what());
    }

    INFO("Portfolio snapshots for " << date << ": " << report.members << " member(s), "
                                    << report.lots << " holding(s), " << report.closed_out
                                    << " closed out");
    return Result<SnapshotReport>(std::move(report));
}

}  // namespace market_ingest
