#pragma once

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

#include "hindsight/core/logging/logger.hpp"
#include "hindsight/core/module.hpp"
#include "hindsight/core/storage/trace_store.hpp"

namespace hindsight::modules {

/**
 * @brief 后台 TTL 清扫：按固定间隔在 io_context 上调用 TraceStore::sweep_expired()
 *
 * 间隔与请求流量无关，由 store.sweep_interval_ms 配置。
 */
class TtlSweepModule : public core::Module, public std::enable_shared_from_this<TtlSweepModule> {
public:
    TtlSweepModule(asio::io_context& io_context,
                   std::shared_ptr<core::storage::TraceStore> store,
                   std::shared_ptr<core::logging::Logger> logger);

    std::string_view name() const noexcept override { return "ttl_sweep"; }
    void configure(const core::config::Configuration& configuration) override;
    void start() override;
    void stop() override;

    std::size_t sweep_now();

    [[nodiscard]] std::chrono::milliseconds interval() const noexcept { return sweep_interval_; }
    [[nodiscard]] std::uint64_t sweeps_run() const noexcept { return sweeps_run_.load(); }

private:
    void arm();

    asio::io_context& io_context_;
    asio::steady_timer timer_;
    std::shared_ptr<core::storage::TraceStore> store_;
    std::shared_ptr<core::logging::Logger> logger_;
    std::chrono::milliseconds sweep_interval_{5000};
    std::atomic<bool> active_{false};
    std::atomic<std::uint64_t> sweeps_run_{0};
};

}  // namespace hindsight::modules
