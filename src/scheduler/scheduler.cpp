// src/scheduler/scheduler.cpp
#include "market_ingest/scheduler/scheduler.hpp"
#include <algorithm>
#include <set>
#include "market_ingest/core/logger.hpp"
#include "market_ingest/core/state_manager.hpp"
#include "market_ingest/core/time_utils.hpp"

namespace market_ingest {

namespace {

const char* const COMPONENT = "Scheduler";

}  // namespace

nlohmann::json ScheduleConfig::to_json() const {
    nlohmann::json j;
    j["utc_offset_minutes"] = utc_offset_minutes;
    j["poll_interval_seconds"] = poll_interval_seconds;
    j["holiday_file"] = holiday_file;
    j["jobs"] = nlohmann::json::array();
    for (const auto& job : jobs) {
        j["jobs"].push_back(
            {{"name", job.name}, {"at", job.at}, {"trading_days_only", job.trading_days_only}});
    }
    return j;
}

void ScheduleConfig::from_json(const nlohmann::json& j) {
    if (j.contains("utc_offset_minutes"))
        utc_offset_minutes = j.at("utc_offset_minutes").get<int>();
    if (j.contains("poll_interval_seconds"))
        poll_interval_seconds = j.at("poll_interval_seconds").get<int>();
    if (j.contains("holiday_file"))
        holiday_file = j.at("holiday_file").get<std::string>();
    if (j.contains("jobs")) {
        jobs.clear();
        for (const auto& job : j.at("jobs")) {
            JobSpec spec;
            spec.name = job.at("name").get<std::string>();
            spec.at = job.at("at").get<std::string>();
            spec.trading_days_only = job.value("trading_days_only", false);
            jobs.push_back(std::move(spec));
        }
    }
}

Scheduler::Scheduler(std::shared_ptr<CanonicalStore> store, ScheduleConfig config,
                     HolidayCalendar calendar)
    : store_(std::move(store)),
      config_(std::move(config)),
      calendar_(std::move(calendar)),
      component_id_(StateManager::make_component_id(COMPONENT)) {
    ComponentInfo info{ComponentType::SCHEDULER,
                       ComponentState::INITIALIZED,
                       component_id_,
                       "",
                       std::chrono::system_clock::now(),
                       {}};
    auto registered = StateManager::instance().register_component(info);
    if (registered.is_error()) {
        WARN("Scheduler state registration failed: " << registered.error()->what());
    }
}

Scheduler::~Scheduler() {
    stop();
    auto unregistered = StateManager::instance().unregister_component(component_id_);
    if (unregistered.is_error()) {
        DEBUG("Scheduler was not registered: " << unregistered.error()->what());
    }
}

Result<void> Scheduler::initialize() {
    std::vector<Entry> timetable;
    std::set<std::string> names;
    for (const auto& spec : config_.jobs) {
        auto minute = core::parse_time_of_day(spec.at);
        if (!minute) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "Job " + spec.name + " has invalid time '" + spec.at + "'",
                                    COMPONENT);
        }
        if (!names.insert(spec.name).second) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "Job " + spec.name + " is scheduled twice", COMPONENT);
        }
        timetable.push_back(Entry{spec, *minute});
    }
    std::stable_sort(timetable.begin(), timetable.end(), [](const Entry& a, const Entry& b) {
        return a.minute_of_day < b.minute_of_day;
    });

    std::lock_guard<std::mutex> lock(jobs_mutex_);
    timetable_ = std::move(timetable);
    INFO("Scheduler timetable has " << timetable_.size() << " job(s), UTC offset "
                                    << config_.utc_offset_minutes << " minutes");
    return Result<void>();
}

Result<void> Scheduler::register_job(const std::string& name, JobFunction fn) {
    if (name.empty() || !fn) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "A job needs a name and a function", COMPONENT);
    }
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    if (jobs_.count(name) > 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Job " + name + " is already registered", COMPONENT);
    }
    jobs_.emplace(name, std::move(fn));
    return Result<void>();
}

bool Scheduler::has_job(const std::string& name) const {
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    return jobs_.count(name) > 0;
}

Date Scheduler::business_date(Timestamp now) const {
    return Date::from_timestamp(now, config_.utc_offset_minutes);
}

std::vector<std::string> Scheduler::run_pending(Timestamp now) {
    ScopedLogComponent log_component(COMPONENT);
    const Date today = business_date(now);
    const int minute = core::minutes_of_day(now, config_.utc_offset_minutes);

    std::vector<std::pair<std::string, JobFunction>> due;
    {
        std::lock_guard<std::mutex> lock(jobs_mutex_);
        for (const auto& entry : timetable_) {
            if (entry.minute_of_day > minute) {
                continue;
            }
            auto attempted = last_attempted_.find(entry.spec.name);
            if (attempted != last_attempted_.end() && attempted->second == today) {
                continue;
            }
            auto job = jobs_.find(entry.spec.name);
            if (job == jobs_.end()) {
                WARN("Job " << entry.spec.name << " is scheduled but not registered");
                last_attempted_[entry.spec.name] = today;
                continue;
            }
            if (entry.spec.trading_days_only && !calendar_.is_trading_day(today)) {
                DEBUG("Job " << entry.spec.name << " skipped, " << today
                             << " is not a trading day");
                last_attempted_[entry.spec.name] = today;
                continue;
            }
            due.emplace_back(entry.spec.name, job->second);
        }
    }

    std::vector<std::string> executed;
    for (const auto& [name, fn] : due) {
        auto previous = store_->get_job_run(name, today);
        if (previous.is_error()) {
            // Store unreachable: leave the key unattempted so the next poll retries
            ERROR("Cannot read run ledger for " << name << ": "
                                                << previous.error()->to_string());
            continue;
        }

        {
            std::lock_guard<std::mutex> lock(jobs_mutex_);
            last_attempted_[name] = today;
        }

        const auto& prior = previous.value();
        if (prior && prior->status == JobRunStatus::SUCCEEDED) {
            DEBUG("Job " << name << " already succeeded for " << today);
            continue;
        }
        if (prior && prior->status == JobRunStatus::FAILED) {
            INFO("Job " << name << " failed earlier for " << today
                        << ", waiting for the next business date");
            continue;
        }

        auto run = execute(name, fn, today, prior ? prior->attempts : 0);
        if (run.is_error()) {
            ERROR("Job " << name << " could not be recorded: " << run.error()->to_string());
        }
        executed.push_back(name);
    }
    return executed;
}

Result<JobRun> Scheduler::run_job(const std::string& name, const Date& business_date,
                                  bool force) {
    ScopedLogComponent log_component(COMPONENT);
    JobFunction fn;
    {
        std::lock_guard<std::mutex> lock(jobs_mutex_);
        auto job = jobs_.find(name);
        if (job == jobs_.end()) {
            return make_error<JobRun>(ErrorCode::NOT_FOUND, "Unknown job: " + name, COMPONENT);
        }
        fn = job->second;
    }

    auto previous = store_->get_job_run(name, business_date);
    if (previous.is_error()) {
        return forward_error<JobRun>(previous);
    }
    const auto& prior = previous.value();
    if (prior && prior->status == JobRunStatus::SUCCEEDED && !force) {
        INFO("Job " << name << " already succeeded for " << business_date
                    << ", use force to re-run");
        return Result<JobRun>(JobRun(*prior));
    }
    return execute(name, fn, business_date, prior ? prior->attempts : 0);
}

Result<JobRun> Scheduler::execute(const std::string& name, const JobFunction& fn,
                                  const Date& business_date, int previous_attempts) {
    std::lock_guard<std::mutex> run_lock(run_mutex_);

    JobRun run;
    run.job_name = name;
    run.business_date = business_date;
    run.status = JobRunStatus::RUNNING;
    run.attempts = previous_attempts + 1;
    run.started_at = std::chrono::system_clock::now();

    auto started = store_->record_job_run(run);
    if (started.is_error()) {
        ERROR("Job " << name << " not started, ledger write failed: "
                     << started.error()->to_string());
        return forward_error<JobRun>(started);
    }
    INFO("Job " << name << " started for " << business_date << " (attempt " << run.attempts
                << ")");

    MergeContext ctx{run.started_at, business_date};
    try {
        auto outcome = fn(business_date, ctx);
        if (outcome.is_error()) {
            run.status = JobRunStatus::FAILED;
            run.summary = outcome.error()->to_string();
        } else {
            run.status = JobRunStatus::SUCCEEDED;
            run.summary = outcome.value();
        }
    } catch (const std::exception& e) {
        run.status = JobRunStatus::FAILED;
        run.summary = std::string("Unhandled exception: ") + e.what();
    }
    run.finished_at = std::chrono::system_clock::now();

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(run.finished_at -
                                                                         run.started_at);
    if (run.status == JobRunStatus::SUCCEEDED) {
        INFO("Job " << name << " succeeded for " << business_date << " in " << elapsed.count()
                    << "ms: " << run.summary);
    } else {
        ERROR("Job " << name << " failed for " << business_date << " after "
                     << elapsed.count() << "ms: " << run.summary);
    }

    auto finished = store_->record_job_run(run);
    if (finished.is_error()) {
        return forward_error<JobRun>(finished);
    }
    return Result<JobRun>(std::move(run));
}

Result<void> Scheduler::start() {
    if (running_.exchange(true)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Scheduler is already running",
                                COMPONENT);
    }
    auto state =
        StateManager::instance().update_state(component_id_, ComponentState::RUNNING);
    if (state.is_error()) {
        DEBUG("State update failed: " << state.error()->what());
    }
    worker_ = std::thread(&Scheduler::run_loop, this);
    INFO("Scheduler started, polling every " << config_.poll_interval_seconds << "s");
    return Result<void>();
}

void Scheduler::stop() {
    {
        // Under the wake mutex so the loop cannot miss the change between
        // its predicate check and its wait
        std::lock_guard<std::mutex> lock(wake_mutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    wake_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    auto state =
        StateManager::instance().update_state(component_id_, ComponentState::STOPPED);
    if (state.is_error()) {
        DEBUG("State update failed: " << state.error()->what());
    }
    INFO("Scheduler stopped");
}

void Scheduler::run_loop() {
    Logger::register_component(COMPONENT);
    const auto interval = std::chrono::seconds(std::max(1, config_.poll_interval_seconds));
    while (running_.load()) {
        run_pending(std::chrono::system_clock::now());

        std::unique_lock<std::mutex> lock(wake_mutex_);
        wake_.wait_for(lock, interval, [this] { return !running_.load(); });
    }
}

}  // namespace market_ingest
