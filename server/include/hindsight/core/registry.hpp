#pragma once

#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include "hindsight/core/logging/logger.hpp"
#include "hindsight/core/module.hpp"

namespace hindsight::core {

/**
 * @brief 生命周期模块注册表
 *
 * 按注册顺序 configure/start，按逆序 stop。单个模块抛出的异常被记录后跳过。
 */
class ModuleRegistry {
public:
    explicit ModuleRegistry(std::shared_ptr<logging::Logger> logger = nullptr);

    void register_module(ModulePtr module);

    template <typename ModuleType, typename... Args>
    ModuleType& emplace_module(Args&&... args) {
        auto module = std::make_shared<ModuleType>(std::forward<Args>(args)...);
        register_module(module);
        return *module;
    }

    void configure_all(const config::Configuration& configuration);
    void start_all();
    void stop_all();

    [[nodiscard]] bool empty() const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] bool started() const;

private:
    void report(std::string_view stage, const Module& module, const std::exception& error) const;

    std::shared_ptr<logging::Logger> logger_;
    std::vector<ModulePtr> modules_;
    const config::Configuration* configuration_{nullptr};
    bool configured_{false};
    bool started_{false};
    mutable std::mutex mutex_;
};

}  // namespace hindsight::core
