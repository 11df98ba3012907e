// src/service/quote_service.cpp
#include "market_ingest/service/quote_service.hpp"
#include "market_ingest/core/logger.hpp"
#include "market_ingest/core/state_manager.hpp"

namespace market_ingest {

namespace {

const char* const COMPONENT = "QuoteService";

}  // namespace

QuoteService::QuoteService(std::shared_ptr<CanonicalStore> store,
                           std::shared_ptr<SecurityLockTable> locks,
                           std::shared_ptr<const HolidayCalendar> calendar)
    : store_(store),
      merger_(store, std::move(locks)),
      calendar_(calendar ? std::move(calendar) : std::make_shared<const HolidayCalendar>()),
      component_id_(StateManager::make_component_id(COMPONENT)) {
    ComponentInfo info{ComponentType::SERVICE,
                       ComponentState::RUNNING,
                       component_id_,
                       "",
                       std::chrono::system_clock::now(),
                       {}};
    auto registered = StateManager::instance().register_component(info);
    if (registered.is_error()) {
        WARN("Quote service state registration failed: " << registered.error()->what());
    }
}

QuoteService::~QuoteService() {
    auto unregistered = StateManager::instance().unregister_component(component_id_);
    if (unregistered.is_error()) {
        DEBUG("Quote service was not registered: " << unregistered.error()->what());
    }
}

Result<MergeAction> QuoteService::update_security_info(const SecurityInfoUpdate& update,
                                                       const MergeContext& ctx) {
    ScopedLogComponent log_component(COMPONENT);

    SecurityPatch patch;
    patch.code = update.code;
    patch.name = update.name;
    patch.market_id = update.market_id;
    patch.industry_id = update.industry_id;
    patch.book_value_per_share = update.book_value_per_share;
    patch.suspended = update.suspended;

    auto report = merger_.merge_one(patch, ctx);
    if (!report.failures.empty()) {
        const auto& failure = report.failures.front();
        return make_error<MergeAction>(failure.code, failure.reason, COMPONENT);
    }

    MergeAction action = MergeAction::UNCHANGED;
    if (report.inserted > 0) {
        action = MergeAction::INSERTED;
    } else if (report.updated > 0) {
        action = MergeAction::UPDATED;
    } else if (report.skipped > 0) {
        action = MergeAction::SKIPPED;
    }
    INFO("Security info for " << update.code << ": " << merge_action_to_string(action));
    return Result<MergeAction>(action);
}

Result<std::vector<CurrentQuote>> QuoteService::fetch_current_quotes(
    const std::vector<std::string>& codes) const {
    auto latest = store_->get_latest_quotes(codes);
    if (latest.is_error()) {
        return forward_error<std::vector<CurrentQuote>>(latest);
    }

    std::vector<CurrentQuote> quotes;
    quotes.reserve(latest.value().size());
    for (const auto& q : latest.value()) {
        quotes.push_back(CurrentQuote{q.code, q.close, q.change, q.change_range});
    }
    return Result<std::vector<CurrentQuote>>(std::move(quotes));
}

std::vector<HolidayEntry> QuoteService::fetch_holiday_schedule(int year) const {
    std::vector<HolidayEntry> entries;
    for (const auto& holiday : calendar_->holidays_in_year(year)) {
        entries.push_back(HolidayEntry{holiday.date, holiday.name});
    }
    return entries;
}

}  // namespace market_ingest
