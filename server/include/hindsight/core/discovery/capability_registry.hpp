#pragma once

#include <asio.hpp>
#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <system_error>
#include <unordered_map>
#include <vector>

#include "hindsight/core/logging/logger.hpp"
#include "hindsight/core/session/session.hpp"

namespace hindsight::core::discovery {

/**
 * @brief 单个连接上生产者公布的能力集合
 *
 * 发现失败或超时时 advertised_service_names 为空，该生产者按 Generic 处理。
 */
struct CapabilitySet {
    std::string session_id;
    std::set<std::string> advertised_service_names;
    std::chrono::system_clock::time_point discovered_at;
    std::error_code error;

    [[nodiscard]] bool supports(const std::string& service_name) const {
        return advertised_service_names.count(service_name) != 0;
    }
    [[nodiscard]] bool empty() const noexcept { return advertised_service_names.empty(); }
};

/**
 * @brief 按会话缓存生产者能力的注册表
 *
 * - 每个连接只发现一次；重复调用 discover() 返回同一个 future；
 * - 超时由 io_context 上的 steady_timer 驱动，应答与超时先到者生效；
 * - 超时或出错记录为空集合并以 warn 级别记录日志，不向调用方抛出；
 * - forget() 同步丢弃会话状态并取消进行中的发现：等待者立即得到
 *   operation_canceled 的空集合，之后才返回的应答不会再写入。
 *
 * 只接受 ControlSession，因此发现路径上不存在任何跨度发射器。
 */
class CapabilityRegistry : public std::enable_shared_from_this<CapabilityRegistry> {
public:
    CapabilityRegistry(asio::io_context& io_context,
                       std::shared_ptr<logging::Logger> logger,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(2000));
    ~CapabilityRegistry();

    CapabilityRegistry(const CapabilityRegistry&) = delete;
    CapabilityRegistry& operator=(const CapabilityRegistry&) = delete;

    /**
     * @brief 对控制会话发起一次能力发现，不阻塞调用方
     * @return 在应答、出错或超时之后就绪的 future，永不携带异常
     */
    std::shared_future<CapabilitySet> discover(const session::ControlSession& session);

    void forget(const std::string& session_id);

    [[nodiscard]] std::optional<CapabilitySet> find(const std::string& session_id) const;
    [[nodiscard]] bool supports(const std::string& session_id, const std::string& service_name) const;
    [[nodiscard]] bool pending(const std::string& session_id) const;
    [[nodiscard]] std::vector<CapabilitySet> snapshot() const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::chrono::milliseconds timeout() const noexcept { return timeout_; }

private:
    struct Attempt;

    static void finish(const std::weak_ptr<CapabilityRegistry>& registry,
                       const std::shared_ptr<Attempt>& attempt,
                       std::error_code ec,
                       std::vector<std::string> service_names);
    void record(const std::shared_ptr<Attempt>& attempt, const CapabilitySet& capabilities);

    asio::io_context& io_context_;
    std::shared_ptr<logging::Logger> logger_;
    std::chrono::milliseconds timeout_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, CapabilitySet> capabilities_;
    std::unordered_map<std::string, std::shared_ptr<Attempt>> pending_;
};

using CapabilityRegistryPtr = std::shared_ptr<CapabilityRegistry>;

}  // namespace hindsight::core::discovery
