// apps/market_ingest_daemon.cpp
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include "market_ingest/core/config_manager.hpp"
#include "market_ingest/core/holiday_calendar.hpp"
#include "market_ingest/core/logger.hpp"
#include "market_ingest/data/memory_store.hpp"
#include "market_ingest/data/postgres_store.hpp"
#include "market_ingest/ingest/json_file_source.hpp"
#include "market_ingest/scheduler/pipeline_jobs.hpp"
#include "market_ingest/scheduler/scheduler.hpp"

using namespace market_ingest;

namespace {

std::atomic<bool> g_stop_requested{false};

void handle_signal(int) {
    g_stop_requested.store(true);
}

struct Options {
    std::filesystem::path config_dir{"config"};
    std::filesystem::path data_dir{"data"};
    bool memory_store{false};
    std::string run_job;
    std::optional<Date> date;
    bool once{false};
};

void print_usage(const char* program) {
    std::cerr << "Usage: " << program
              << " [--config-dir DIR] [--data-dir DIR] [--memory-store]"
                 " [--run-job NAME] [--date YYYY-MM-DD] [--once]"
              << std::endl;
}

bool parse_options(int argc, char* argv[], Options& options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](const char* flag) -> const char* {
            if (i + 1 >= argc) {
                std::cerr << flag << " requires a value" << std::endl;
                return nullptr;
            }
            return argv[++i];
        };

        if (arg == "--config-dir") {
            const char* value = next("--config-dir");
            if (!value)
                return false;
            options.config_dir = value;
        } else if (arg == "--data-dir") {
            const char* value = next("--data-dir");
            if (!value)
                return false;
            options.data_dir = value;
        } else if (arg == "--memory-store") {
            options.memory_store = true;
        } else if (arg == "--run-job") {
            const char* value = next("--run-job");
            if (!value)
                return false;
            options.run_job = value;
        } else if (arg == "--date") {
            const char* value = next("--date");
            if (!value)
                return false;
            options.date = Date::parse(value);
            if (!options.date) {
                std::cerr << "Invalid date: " << value << std::endl;
                return false;
            }
        } else if (arg == "--once") {
            options.once = true;
        } else {
            std::cerr << "Invalid argument: " << arg << std::endl;
            return false;
        }
    }
    return true;
}

template <typename T>
bool load_config(ConfigType type, T& out) {
    auto config = ConfigManager::instance().get_config<T>(type);
    if (config.is_error()) {
        std::cerr << "Failed to load " << ConfigManager::get_component_name(type)
                  << " config: " << config.error()->what() << std::endl;
        return false;
    }
    out = config.take();
    return true;
}

void bind_file_sources(IngestPipeline& pipeline, const std::filesystem::path& data_dir) {
    const std::pair<const char*, RecordKind> bindings[] = {
        {datasets::QUOTES, RecordKind::DAILY_QUOTE},
        {datasets::INDICES, RecordKind::MARKET_INDEX},
        {datasets::EMERGING_BOOK_VALUE, RecordKind::SECURITY},
        {datasets::QUARTER_FINANCIALS, RecordKind::FINANCIAL_STATEMENT},
        {datasets::ANNUAL_FINANCIALS, RecordKind::FINANCIAL_STATEMENT},
        {datasets::REVENUES, RecordKind::REVENUE},
        {datasets::SECURITY_WEIGHTS, RecordKind::SECURITY},
        {datasets::DIVIDENDS, RecordKind::DIVIDEND},
        {datasets::FOREIGN_HOLDINGS, RecordKind::SECURITY}};

    for (const auto& [dataset, kind] : bindings) {
        pipeline.bind_source(dataset, make_json_file_adapter(data_dir, dataset, kind));
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    Options options;
    if (!parse_options(argc, argv, options)) {
        print_usage(argv[0]);
        return 1;
    }

    Environment env = Environment::DEVELOPMENT;
    if (const char* env_name = std::getenv("MARKET_INGEST_ENV")) {
        env = ConfigManager::string_to_environment(env_name);
    }
    auto config_init = ConfigManager::instance().initialize(options.config_dir, env);
    if (config_init.is_error()) {
        std::cerr << "Configuration failed: " << config_init.error()->what() << std::endl;
        return 1;
    }

    LoggerConfig logger_config;
    DatabaseConfig db_config;
    FetchConfig fetch_config;
    MetricsConfig metrics_config;
    ScheduleConfig schedule_config;
    if (!load_config(ConfigType::LOGGING, logger_config) ||
        !load_config(ConfigType::DATABASE, db_config) ||
        !load_config(ConfigType::FETCH, fetch_config) ||
        !load_config(ConfigType::METRICS, metrics_config) ||
        !load_config(ConfigType::SCHEDULER, schedule_config)) {
        return 1;
    }

    auto logger_init = Logger::instance().initialize(logger_config);
    if (logger_init.is_error()) {
        std::cerr << "Logger initialization failed: " << logger_init.error()->what()
                  << std::endl;
        return 1;
    }
    Logger::register_component("Daemon");

    HolidayCalendar calendar;
    std::filesystem::path holiday_path = schedule_config.holiday_file;
    if (holiday_path.is_relative()) {
        holiday_path = options.config_dir / holiday_path;
    }
    auto loaded = HolidayCalendar::load(holiday_path.string());
    if (loaded.is_error()) {
        WARN("Holiday calendar unavailable, treating only weekends as closed: "
             << loaded.error()->what());
    } else {
        calendar = loaded.take();
    }

    std::shared_ptr<CanonicalStore> store;
    if (options.memory_store) {
        store = std::make_shared<MemoryStore>();
    } else {
        store = std::make_shared<PostgresStore>(db_config);
    }
    auto connected = store->connect();
    if (connected.is_error()) {
        FATAL("Cannot connect to " << store->backend_name() << " store: "
                                   << connected.error()->to_string());
        return 1;
    }
    INFO("Connected to " << store->backend_name() << " store");

    IngestPipeline pipeline(store, fetch_config, metrics_config);
    bind_file_sources(pipeline, options.data_dir);

    Scheduler scheduler(store, schedule_config, calendar);
    auto initialized = scheduler.initialize();
    if (initialized.is_error()) {
        FATAL("Invalid timetable: " << initialized.error()->what());
        return 1;
    }
    auto registered = pipeline.register_jobs(scheduler);
    if (registered.is_error()) {
        FATAL("Job registration failed: " << registered.error()->what());
        return 1;
    }

    int exit_code = 0;
    if (!options.run_job.empty()) {
        Date date = options.date ? *options.date
                                 : scheduler.business_date(std::chrono::system_clock::now());
        auto run = scheduler.run_job(options.run_job, date, true);
        if (run.is_error()) {
            ERROR("Job " << options.run_job << " did not run: " << run.error()->to_string());
            exit_code = 1;
        } else {
            std::cout << run.value().job_name << " " << run.value().business_date << " "
                      << job_run_status_to_string(run.value().status) << ": "
                      << run.value().summary << std::endl;
            exit_code = run.value().status == JobRunStatus::SUCCEEDED ? 0 : 2;
        }
    } else if (options.once) {
        auto executed = scheduler.run_pending(std::chrono::system_clock::now());
        INFO("Single pass executed " << executed.size() << " job(s)");
    } else {
        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);

        auto started = scheduler.start();
        if (started.is_error()) {
            FATAL("Scheduler did not start: " << started.error()->what());
            return 1;
        }
        while (!g_stop_requested.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        INFO("Shutdown requested");
        scheduler.stop();
    }

    store->disconnect();
    return exit_code;
}
