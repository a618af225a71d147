#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "hindsight/core/discovery/capability_registry.hpp"
#include "hindsight/core/logging/logger.hpp"
#include "hindsight/core/observability/telemetry.hpp"
#include "hindsight/core/session/session.hpp"

namespace hindsight::core::session {

/**
 * @brief 会话状态定义
 */
enum class SessionStatus {
    Discovering,
    Active,
};

/**
 * @brief 会话上下文快照
 */
struct SessionContext {
    std::string session_id;
    std::string remote_endpoint;
    SessionStatus status{SessionStatus::Discovering};
    std::chrono::system_clock::time_point connected_at;
    std::optional<discovery::CapabilitySet> capabilities;
};

/**
 * @brief 生产者连接的会话管理器
 *
 * 每个就绪的连接拆分为一个 DataSession（跨度摄取）和一个 ControlSession
 * （能力发现），并立即发起一次非阻塞的能力发现。
 */
class ProducerSessionManager {
public:
    ProducerSessionManager(discovery::CapabilityRegistryPtr registry,
                           observability::TelemetryPtr telemetry,
                           std::shared_ptr<logging::Logger> logger);
    ~ProducerSessionManager();

    ProducerSessionManager(const ProducerSessionManager&) = delete;
    ProducerSessionManager& operator=(const ProducerSessionManager&) = delete;

    /**
     * @brief 处理新的生产者连接，返回用于摄取的数据会话
     */
    DataSessionPtr on_connection_ready(const std::string& remote_endpoint, discovery::CapabilityProbePtr probe);

    /**
     * @brief 连接断开：同步丢弃会话及其能力集合
     */
    void on_disconnect(const std::string& session_id);

    /**
     * @brief 对已连接的会话发起能力发现
     * @return 会话在发现发起后仍然存在时返回 true；否则丢弃其能力状态并返回 false
     */
    bool discover_capabilities(const std::string& session_id);

    [[nodiscard]] DataSessionPtr find_data_session(const std::string& session_id) const;
    [[nodiscard]] std::vector<SessionContext> get_active_sessions() const;
    [[nodiscard]] std::size_t session_count() const;

    void shutdown();

private:
    struct SessionRecord {
        SessionContext context;
        DataSessionPtr data;
        ControlSessionPtr control;
    };

    static std::string generate_session_id();

    discovery::CapabilityRegistryPtr registry_;
    observability::TelemetryPtr telemetry_;
    std::shared_ptr<logging::Logger> logger_;

    mutable std::shared_mutex sessions_mutex_;
    std::unordered_map<std::string, SessionRecord> sessions_;
};

using ProducerSessionManagerPtr = std::shared_ptr<ProducerSessionManager>;

}  // namespace hindsight::core::session
