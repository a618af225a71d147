#include "hindsight/core/application.hpp"

#include "hindsight/core/logging/config.hpp"
#include "hindsight/core/service/seed_data.hpp"
#include "hindsight/server/modules/store_stats.hpp"
#include "hindsight/server/modules/ttl_sweep.hpp"

#include <thread>

namespace hindsight::core {
namespace {

const std::vector<std::string> kDefaultFrameworks{"picante", "rapace", "dodeca"};

}  // namespace

Application::Application(ApplicationOptions options)
    : io_work_(std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(io_context_.get_executor())),
      options_(std::move(options)),
      logger_(std::make_shared<logging::Logger>(options_.identity)) {
    logger_->set_level(options_.log_level);
    module_registry_ = std::make_shared<ModuleRegistry>(logger_);
}

Application::~Application() {
    shutdown();
}

void Application::initialize() {
    bool expected = false;
    if (!initialized_.compare_exchange_strong(expected, true)) {
        return;
    }

    log_lifecycle("initializing subsystems");

    load_configuration();
    initialize_logging();
    build_components();
    register_modules();

    bool seed = options_.seed_data.value_or(configuration_.get_bool("hub.seed_data", false));
    if (seed) {
        auto accepted = service::load_seed_data(*service_);
        logger_->info("[app] loaded", accepted, "seed spans");
    }
}

void Application::build_components() {
    auto mode_name = configuration_.get_string("telemetry.mode", "noop");
    auto mode = observability::Telemetry::mode_from_string(mode_name);
    if (!mode) {
        logger_->warn("[app] unknown telemetry.mode '" + mode_name + "', using noop");
    }
    telemetry_ = std::make_shared<observability::Telemetry>(mode.value_or(observability::Telemetry::Mode::noop),
                                                            logger_);

    storage::StoreOptions store_options;
    store_options.ttl = std::chrono::seconds(configuration_.get_uint64("store.ttl_seconds", 3600));
    store_options.shard_count = static_cast<std::size_t>(configuration_.get_uint64("store.shard_count", 16));
    store_ = std::make_shared<storage::TraceStore>(store_options, util::default_clock(), logger_);

    auto frameworks = configuration_.contains("classifier.frameworks")
                          ? configuration_.get_list("classifier.frameworks")
                          : kDefaultFrameworks;
    classifier_ = trace::TraceClassifier::with_prefix_rules(frameworks);

    query_engine_ = std::make_shared<query::QueryEngine>(
        classifier_, static_cast<std::size_t>(configuration_.get_uint64("query.max_limit", 100)));

    broadcaster_ = std::make_shared<events::EventBroadcaster>(
        static_cast<std::size_t>(configuration_.get_uint64("broadcast.queue_capacity", 1024)), logger_);

    capability_registry_ = std::make_shared<discovery::CapabilityRegistry>(
        io_context_, logger_, configuration_.get_milliseconds("discovery.timeout_ms", std::chrono::milliseconds(2000)));

    session_manager_ = std::make_shared<session::ProducerSessionManager>(capability_registry_, telemetry_, logger_);

    service_ = std::make_shared<service::HindsightService>(store_, query_engine_, broadcaster_, capability_registry_,
                                                           logger_);

    logger_->info("[app] store ttl", store_->ttl().count(), "ms across", store_->shard_count(), "shards,",
                  classifier_->rule_count(), "classification rules");
}

void Application::register_modules() {
    if (!module_registry_->empty()) {
        return;
    }
    // Rebind so module failures reach the configured sinks.
    module_registry_ = std::make_shared<ModuleRegistry>(logger_);
    module_registry_->emplace_module<modules::TtlSweepModule>(io_context_, store_, logger_);
    module_registry_->emplace_module<modules::StoreStatsModule>(logger_, store_, broadcaster_, session_manager_);
    module_registry_->configure_all(configuration_);
}

void Application::run() {
    if (!initialized_) {
        initialize();
    }

    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (started_ || stopped_ || stop_requested_) {
            return;
        }
        started_ = true;
        running_ = true;

        log_lifecycle("entering event loop");
        io_thread_ = std::thread([this]() {
            logger_->info("[app] asio io_context started");
            io_context_.run();
            logger_->info("[app] asio io_context stopped");
        });

        log_lifecycle("starting modules");
        module_registry_->start_all();
    }

    while (!stop_requested_.load()) {
        std::this_thread::sleep_for(options_.poll_interval);
    }

    log_lifecycle("event loop exited");
}

void Application::shutdown() {
    request_stop();
    if (!initialized_) {
        return;
    }

    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (stopped_) {
        return;
    }
    stopped_ = true;
    running_ = false;

    log_lifecycle("shutting down subsystems");

    if (started_) {
        log_lifecycle("stopping modules");
        module_registry_->stop_all();
    }

    if (session_manager_) {
        session_manager_->shutdown();
    }
    if (broadcaster_) {
        broadcaster_->shutdown();
    }

    io_work_.reset();
    io_context_.stop();
    if (io_thread_.joinable()) {
        io_thread_.join();
    }

    log_lifecycle("shutdown complete");
    logger_->flush();
}

void Application::log_lifecycle(const std::string& stage) const {
    logger_->info("[" + options_.identity + "] " + stage);
}

void Application::load_configuration() {
    if (options_.config_path.empty()) {
        return;
    }

    try {
        configuration_ = config::Configuration::load_from_file(options_.config_path);
        logger_->info("[app] loaded configuration from " + options_.config_path.string());
    } catch (const std::exception& e) {
        logger_->error(std::string("[app] failed to load configuration, using defaults: ") + e.what());
    }
}

void Application::initialize_logging() {
    if (!configuration_.contains("logging.level") && !configuration_.contains("logging.sinks[0].type")) {
        logger_->set_level(options_.log_level);
        return;
    }

    try {
        logging::initialize_logging(configuration_);
        auto log_config = logging::LogConfig::from_toml(configuration_);
        logger_ = logging::create_logger(options_.identity, log_config);
        logger_->set_level(log_config.level);
    } catch (const std::exception& e) {
        logger_->error(std::string("[app] invalid logging configuration, keeping defaults: ") + e.what());
        logger_->set_level(options_.log_level);
    }
}

}  // namespace hindsight::core
