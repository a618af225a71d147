#include "hindsight/server/modules/store_stats.hpp"

namespace hindsight::modules {

StoreStatsModule::StoreStatsModule(std::shared_ptr<core::logging::Logger> logger,
                                   std::shared_ptr<core::storage::TraceStore> store,
                                   core::events::EventBroadcasterPtr broadcaster,
                                   core::session::ProducerSessionManagerPtr session_manager)
    : logger_(std::move(logger)),
      store_(std::move(store)),
      broadcaster_(std::move(broadcaster)),
      session_manager_(std::move(session_manager)) {}

StoreStatsModule::~StoreStatsModule() {
    stop();
}

void StoreStatsModule::configure(const core::config::Configuration& configuration) {
    auto value = configuration.get_milliseconds("hub.stats_interval_ms", interval_);
    if (value.count() > 0) {
        interval_ = value;
    }
    if (logger_) {
        logger_->debug("[stats] interval set to", interval_.count(), "ms");
    }
}

void StoreStatsModule::start() {
    if (active_.exchange(true)) {
        return;
    }
    worker_thread_ = std::thread(&StoreStatsModule::collect_loop, this);
    if (logger_) {
        logger_->info("[stats] reporting every", interval_.count(), "ms");
    }
}

void StoreStatsModule::stop() {
    if (!active_.exchange(false)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
    }
    wake_.notify_all();
    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }
    if (logger_) {
        logger_->info("[stats] reporter stopped");
    }
}

void StoreStatsModule::report() {
    if (!logger_) {
        return;
    }

    if (store_) {
        auto stats = store_->stats();
        logger_->info("[stats] traces=" + std::to_string(stats.traces),
                      "incomplete=" + std::to_string(stats.incomplete_traces),
                      "spans=" + std::to_string(stats.spans),
                      "evicted=" + std::to_string(stats.evicted_total));
    }

    if (broadcaster_) {
        logger_->info("[stats] subscribers=" + std::to_string(broadcaster_->subscriber_count()),
                      "published=" + std::to_string(broadcaster_->published_total()),
                      "dropped=" + std::to_string(broadcaster_->dropped_total()));
    }

    if (session_manager_) {
        auto sessions = session_manager_->get_active_sessions();
        logger_->info("[stats] snapshot:", sessions.size(), "producer sessions");
        for (const auto& sess : sessions) {
            auto services = sess.capabilities ? sess.capabilities->advertised_service_names.size() : 0;
            logger_->debug("[stats] sess=" + sess.session_id, "endpoint=" + sess.remote_endpoint,
                           "services=" + std::to_string(services));
        }
    }
}

void StoreStatsModule::collect_loop() {
    while (active_) {
        {
            std::unique_lock<std::mutex> lock(wake_mutex_);
            wake_.wait_for(lock, interval_, [this] { return !active_.load(); });
        }
        if (!active_) {
            break;
        }
        report();
    }
}

}  // namespace hindsight::modules
