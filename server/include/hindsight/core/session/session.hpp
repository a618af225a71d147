#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <utility>

#include "hindsight/core/discovery/capability_probe.hpp"
#include "hindsight/core/observability/telemetry.hpp"

namespace hindsight::core::session {

/**
 * @brief 数据会话：生产者推送跨度的通道
 *
 * 可以携带一个 Tracer 用于记录中枢自身的处理过程（只写日志）。
 */
class DataSession {
public:
    DataSession(std::string session_id, std::string endpoint, observability::TracerPtr tracer = nullptr)
        : session_id_(std::move(session_id)), endpoint_(std::move(endpoint)), tracer_(std::move(tracer)) {}

    [[nodiscard]] const std::string& id() const noexcept { return session_id_; }
    [[nodiscard]] const std::string& endpoint() const noexcept { return endpoint_; }
    [[nodiscard]] const observability::TracerPtr& tracer() const noexcept { return tracer_; }

private:
    std::string session_id_;
    std::string endpoint_;
    observability::TracerPtr tracer_;
};

/**
 * @brief 控制会话：中枢主动发起的发现/健康检查通道
 *
 * 该类型没有任何挂载 Tracer 的入口，发现调用因此不可能产生关于自身的跨度。
 */
class ControlSession {
public:
    ControlSession(std::string session_id, std::string endpoint, discovery::CapabilityProbePtr probe)
        : session_id_(std::move(session_id)), endpoint_(std::move(endpoint)), probe_(std::move(probe)) {}

    [[nodiscard]] const std::string& id() const noexcept { return session_id_; }
    [[nodiscard]] const std::string& endpoint() const noexcept { return endpoint_; }
    [[nodiscard]] const discovery::CapabilityProbePtr& probe() const noexcept { return probe_; }

private:
    std::string session_id_;
    std::string endpoint_;
    discovery::CapabilityProbePtr probe_;
};

using DataSessionPtr = std::shared_ptr<const DataSession>;
using ControlSessionPtr = std::shared_ptr<const ControlSession>;

}  // namespace hindsight::core::session
