// include/market_ingest/service/quote_service.hpp
#pragma once

#include <memory>
#include <string>
#include <vector>
#include "market_ingest/core/holiday_calendar.hpp"
#include "market_ingest/ingest/upsert_merger.hpp"

namespace market_ingest {

struct SecurityInfoUpdate {
    std::string code;
    std::string name;
    int market_id{0};
    int industry_id{0};
    double book_value_per_share{0.0};
    bool suspended{false};
};

struct CurrentQuote {
    std::string code;
    Price price{0.0};
    Price change{0.0};
    double change_range{0.0};
};

struct HolidayEntry {
    Date date;
    std::string reason;
};

/**
 * @brief Read and correction surface the external service layer calls into
 */
class QuoteService {
public:
    QuoteService(std::shared_ptr<CanonicalStore> store, std::shared_ptr<SecurityLockTable> locks,
                 std::shared_ptr<const HolidayCalendar> calendar);
    ~QuoteService();

    /**
     * @brief Overwrite security metadata through the regular merge rule
     * @return The merge action, VALIDATION_ERROR for an empty code
     */
    Result<MergeAction> update_security_info(const SecurityInfoUpdate& update,
                                             const MergeContext& ctx);

    /**
     * @brief Latest stored quote per code; codes without a quote are omitted
     */
    Result<std::vector<CurrentQuote>> fetch_current_quotes(
        const std::vector<std::string>& codes) const;

    /**
     * @brief Exchange holidays of a year, ordered by date
     */
    std::vector<HolidayEntry> fetch_holiday_schedule(int year) const;

private:
    std::shared_ptr<CanonicalStore> store_;
    UpsertMerger merger_;
    std::shared_ptr<const HolidayCalendar> calendar_;
    std::string component_id_;
};

}  // namespace market_ingest
