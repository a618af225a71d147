#pragma once

#include <functional>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace hindsight::core::discovery {

/**
 * @brief 生产者侧的能力枚举调用
 *
 * 由传输层实现：向已连接的生产者发起一次远程调用，列出其暴露的服务名。
 * 回调可以在任意线程上触发，也可能永远不触发（由注册表的超时兜底）。
 */
class CapabilityProbe {
public:
    using Callback = std::function<void(std::error_code ec, std::vector<std::string> service_names)>;

    virtual ~CapabilityProbe() = default;
    virtual void list_services(Callback callback) = 0;
};

using CapabilityProbePtr = std::shared_ptr<CapabilityProbe>;

}  // namespace hindsight::core::discovery
