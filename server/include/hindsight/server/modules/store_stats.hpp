#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "hindsight/core/events/event_broadcaster.hpp"
#include "hindsight/core/logging/logger.hpp"
#include "hindsight/core/module.hpp"
#include "hindsight/core/session/producer_session_manager.hpp"
#include "hindsight/core/storage/trace_store.hpp"

namespace hindsight::modules {

class StoreStatsModule : public core::Module {
public:
    StoreStatsModule(std::shared_ptr<core::logging::Logger> logger,
                     std::shared_ptr<core::storage::TraceStore> store,
                     core::events::EventBroadcasterPtr broadcaster,
                     core::session::ProducerSessionManagerPtr session_manager);
    ~StoreStatsModule() override;

    std::string_view name() const noexcept override { return "store_stats"; }
    void configure(const core::config::Configuration& configuration) override;
    void start() override;
    void stop() override;

    // Logs one snapshot immediately.
    void report();

    [[nodiscard]] std::chrono::milliseconds interval() const noexcept { return interval_; }

private:
    void collect_loop();

    std::shared_ptr<core::logging::Logger> logger_;
    std::shared_ptr<core::storage::TraceStore> store_;
    core::events::EventBroadcasterPtr broadcaster_;
    core::session::ProducerSessionManagerPtr session_manager_;
    std::chrono::milliseconds interval_{10000};

    std::atomic<bool> active_{false};
    std::mutex wake_mutex_;
    std::condition_variable wake_;
    std::thread worker_thread_;
};

}  // namespace hindsight::modules
