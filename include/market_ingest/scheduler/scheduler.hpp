// include/market_ingest/scheduler/scheduler.hpp
#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "market_ingest/core/config_base.hpp"
#include "market_ingest/core/holiday_calendar.hpp"
#include "market_ingest/data/canonical_store.hpp"

namespace market_ingest {

/**
 * @brief One row of the daily timetable
 */
struct JobSpec {
    std::string name;
    std::string at;  // HH:MM local time
    bool trading_days_only{false};
};

struct ScheduleConfig : public ConfigBase {
    int utc_offset_minutes{480};
    int poll_interval_seconds{30};
    std::string holiday_file{"holidays.json"};
    std::vector<JobSpec> jobs;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Body of a job for one business date
 * @return Short summary stored in the run ledger, or the failure
 */
using JobFunction = std::function<Result<std::string>(const Date&, const MergeContext&)>;

/**
 * @brief Fires named jobs at fixed local times, once per business date
 *
 * Due jobs run one at a time in time order, ties in timetable order. Every
 * run is recorded in the store's job-run ledger keyed by (job, business
 * date); automatic firing skips keys already SUCCEEDED and does not retry a
 * key that failed until the next business date.
 */
class Scheduler {
public:
    Scheduler(std::shared_ptr<CanonicalStore> store, ScheduleConfig config,
              HolidayCalendar calendar);
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /**
     * @brief Validate the timetable
     * @return INVALID_ARGUMENT for a malformed time or a duplicate job name
     */
    Result<void> initialize();

    Result<void> register_job(const std::string& name, JobFunction fn);
    bool has_job(const std::string& name) const;

    /**
     * @brief Run every job due at `now` that has not been attempted today
     * @return Names of the jobs executed, in execution order
     */
    std::vector<std::string> run_pending(Timestamp now);

    /**
     * @brief Execute one job for a business date and record the run
     * @param force Re-execute even if the key already SUCCEEDED
     * @return The recorded run; a failed job is a FAILED run, not an error
     */
    Result<JobRun> run_job(const std::string& name, const Date& business_date,
                           bool force = false);

    /**
     * @brief Poll run_pending on a background thread
     */
    Result<void> start();
    void stop();
    bool is_running() const {
        return running_.load();
    }

    /**
     * @brief Local calendar date of a timestamp under the configured offset
     */
    Date business_date(Timestamp now) const;

    const ScheduleConfig& config() const {
        return config_;
    }
    const HolidayCalendar& calendar() const {
        return calendar_;
    }

private:
    struct Entry {
        JobSpec spec;
        int minute_of_day{0};
    };

    void run_loop();
    Result<JobRun> execute(const std::string& name, const JobFunction& fn,
                           const Date& business_date, int previous_attempts);

    std::shared_ptr<CanonicalStore> store_;
    const ScheduleConfig config_;
    const HolidayCalendar calendar_;
    std::string component_id_;

    std::vector<Entry> timetable_;  // ordered by time, then declaration
    std::map<std::string, JobFunction> jobs_;
    std::map<std::string, Date> last_attempted_;
    mutable std::mutex jobs_mutex_;
    std::mutex run_mutex_;  // one job executes at a time

    std::atomic<bool> running_{false};
    std::thread worker_;
    std::mutex wake_mutex_;
    std::condition_variable wake_;
};

}  // namespace market_ingest
