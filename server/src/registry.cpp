#include "hindsight/core/registry.hpp"

#include <stdexcept>
#include <string>

namespace hindsight::core {

ModuleRegistry::ModuleRegistry(std::shared_ptr<logging::Logger> logger) : logger_(std::move(logger)) {}

void ModuleRegistry::register_module(ModulePtr module) {
    if (!module) {
        throw std::invalid_argument("module is null");
    }

    std::lock_guard lock{mutex_};
    if (started_) {
        throw std::runtime_error("Cannot register modules after start");
    }

    modules_.push_back(std::move(module));

    if (configured_ && configuration_) {
        try {
            modules_.back()->configure(*configuration_);
        } catch (const std::exception& e) {
            report("configure", *modules_.back(), e);
        }
    }
}

void ModuleRegistry::configure_all(const config::Configuration& configuration) {
    std::lock_guard lock{mutex_};
    configuration_ = &configuration;
    for (auto& module : modules_) {
        try {
            module->configure(configuration);
        } catch (const std::exception& e) {
            report("configure", *module, e);
        }
    }
    configured_ = true;
}

void ModuleRegistry::start_all() {
    std::lock_guard lock{mutex_};
    if (started_) {
        return;
    }
    for (auto& module : modules_) {
        try {
            module->start();
        } catch (const std::exception& e) {
            report("start", *module, e);
        }
    }
    started_ = true;
}

void ModuleRegistry::stop_all() {
    std::lock_guard lock{mutex_};
    if (!started_) {
        return;
    }
    for (auto it = modules_.rbegin(); it != modules_.rend(); ++it) {
        try {
            (*it)->stop();
        } catch (const std::exception& e) {
            report("stop", **it, e);
        }
    }
    started_ = false;
}

bool ModuleRegistry::empty() const {
    std::lock_guard lock{mutex_};
    return modules_.empty();
}

std::size_t ModuleRegistry::size() const {
    std::lock_guard lock{mutex_};
    return modules_.size();
}

bool ModuleRegistry::started() const {
    std::lock_guard lock{mutex_};
    return started_;
}

void ModuleRegistry::report(std::string_view stage, const Module& module, const std::exception& error) const {
    if (logger_) {
        logger_->error("[modules] " + std::string{module.name()} + " failed to " + std::string{stage} + ":",
                       error.what());
    }
}

}  // namespace hindsight::core
