// src/data/entities.cpp
#include "market_ingest/data/entities.hpp"
#include <algorithm>

namespace market_ingest {

double* QuoteMetrics::moving_average_slot(int window) {
    switch (window) {
        case 5:
            return &moving_average_5;
        case 10:
            return &moving_average_10;
        case 20:
            return &moving_average_20;
        case 60:
            return &moving_average_60;
        case 120:
            return &moving_average_120;
        case 240:
            return &moving_average_240;
        default:
            return nullptr;
    }
}

double QuoteMetrics::moving_average(int window) const {
    auto* slot = const_cast<QuoteMetrics*>(this)->moving_average_slot(window);
    return slot ? *slot : 0.0;
}

bool is_valid_dividend_period(const std::string& period) {
    return period == "A" || period == "Q1" || period == "Q2" || period == "Q3" ||
           period == "Q4" || period == "H1" || period == "H2";
}

bool is_valid_statement_quarter(const std::string& quarter) {
    return quarter == "A" || quarter == "Q1" || quarter == "Q2" || quarter == "Q3" ||
           quarter == "Q4";
}

std::optional<Date> Dividend::last_payable_date() const {
    if (payable_date_cash && payable_date_stock) {
        return std::max(*payable_date_cash, *payable_date_stock);
    }
    return payable_date_cash ? payable_date_cash : payable_date_stock;
}

ValuationClass classify(Price close, const Triplet& band) {
    if (close <= 0.0 || !band.valid()) {
        return ValuationClass::UNKNOWN;
    }
    if (close <= band.cheap)
        return ValuationClass::UNDERVALUED;
    if (close <= band.fair)
        return ValuationClass::FAIR;
    if (close <= band.expensive)
        return ValuationClass::OVERVALUED;
    return ValuationClass::HIGHLY_OVERVALUED;
}

std::string job_run_status_to_string(JobRunStatus status) {
    switch (status) {
        case JobRunStatus::RUNNING:
            return "RUNNING";
        case JobRunStatus::SUCCEEDED:
            return "SUCCEEDED";
        case JobRunStatus::FAILED:
            return "FAILED";
        default:
            return "UNKNOWN";
    }
}

JobRunStatus string_to_job_run_status(const std::string& status) {
    if (status == "SUCCEEDED")
        return JobRunStatus::SUCCEEDED;
    if (status == "FAILED")
        return JobRunStatus::FAILED;
    return JobRunStatus::RUNNING;
}

}  // namespace market_ingest
