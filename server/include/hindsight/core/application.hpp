#pragma once

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "hindsight/core/config/configuration.hpp"
#include "hindsight/core/discovery/capability_registry.hpp"
#include "hindsight/core/events/event_broadcaster.hpp"
#include "hindsight/core/logging/logger.hpp"
#include "hindsight/core/observability/telemetry.hpp"
#include "hindsight/core/query/query_engine.hpp"
#include "hindsight/core/registry.hpp"
#include "hindsight/core/service/hindsight_service.hpp"
#include "hindsight/core/session/producer_session_manager.hpp"
#include "hindsight/core/storage/trace_store.hpp"
#include "hindsight/core/trace/classifier.hpp"

#ifndef HINDSIGHT_SOURCE_DIR
#define HINDSIGHT_SOURCE_DIR "."
#endif

namespace hindsight::core {

inline std::filesystem::path default_config_path() {
    return std::filesystem::path{HINDSIGHT_SOURCE_DIR} / "config" / "hindsight.toml";
}

struct ApplicationOptions {
    std::string identity{"hindsight"};
    std::chrono::milliseconds poll_interval{std::chrono::milliseconds(200)};
    std::filesystem::path config_path{default_config_path()};
    logging::Level log_level{logging::Level::info};
    // Overrides hub.seed_data when set.
    std::optional<bool> seed_data;
};

/**
 * @brief 进程级组件的唯一创建点
 *
 * 存储、分类器、查询、广播、发现与会话管理在 initialize() 中各创建一次，
 * 通过 shared_ptr 显式传递给需要它们的组件，不存在全局访问入口。
 */
class Application {
public:
    explicit Application(ApplicationOptions options = {});
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    void initialize();
    // Blocks until request_stop() or shutdown().
    void run();
    void shutdown();

    // Async-signal-safe.
    void request_stop() noexcept { stop_requested_.store(true); }

    [[nodiscard]] const ApplicationOptions& options() const noexcept { return options_; }
    [[nodiscard]] bool running() const noexcept { return running_.load(); }
    [[nodiscard]] const config::Configuration& configuration() const noexcept { return configuration_; }
    [[nodiscard]] std::shared_ptr<logging::Logger> logger() const noexcept { return logger_; }
    [[nodiscard]] ModuleRegistry& modules() noexcept { return *module_registry_; }
    [[nodiscard]] asio::io_context& io_context() noexcept { return io_context_; }

    [[nodiscard]] const service::HindsightServicePtr& service() const noexcept { return service_; }
    [[nodiscard]] const std::shared_ptr<storage::TraceStore>& store() const noexcept { return store_; }
    [[nodiscard]] const events::EventBroadcasterPtr& broadcaster() const noexcept { return broadcaster_; }
    [[nodiscard]] const session::ProducerSessionManagerPtr& sessions() const noexcept { return session_manager_; }
    [[nodiscard]] const discovery::CapabilityRegistryPtr& capabilities() const noexcept {
        return capability_registry_;
    }

private:
    void initialize_logging();
    void log_lifecycle(const std::string& stage) const;
    void load_configuration();
    void build_components();
    void register_modules();

    asio::io_context io_context_;
    std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> io_work_;
    std::thread io_thread_;

    ApplicationOptions options_{};
    config::Configuration configuration_{};
    std::shared_ptr<logging::Logger> logger_;
    std::shared_ptr<ModuleRegistry> module_registry_;

    observability::TelemetryPtr telemetry_;
    std::shared_ptr<storage::TraceStore> store_;
    trace::TraceClassifierPtr classifier_;
    std::shared_ptr<query::QueryEngine> query_engine_;
    events::EventBroadcasterPtr broadcaster_;
    discovery::CapabilityRegistryPtr capability_registry_;
    session::ProducerSessionManagerPtr session_manager_;
    service::HindsightServicePtr service_;

    std::mutex lifecycle_mutex_;
    bool started_{false};
    bool stopped_{false};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
};

}  // namespace hindsight::core
