#include "hindsight/core/discovery/capability_registry.hpp"

#include <atomic>
#include <mutex>

namespace hindsight::core::discovery {

struct CapabilityRegistry::Attempt {
    Attempt(asio::io_context& io_context, std::string id)
        : session_id(std::move(id)), future(promise.get_future().share()), timer(io_context) {}

    std::string session_id;
    std::promise<CapabilitySet> promise;
    std::shared_future<CapabilitySet> future;
    asio::steady_timer timer;
    std::atomic<bool> done{false};
};

CapabilityRegistry::CapabilityRegistry(asio::io_context& io_context,
                                       std::shared_ptr<logging::Logger> logger,
                                       std::chrono::milliseconds timeout)
    : io_context_(io_context), logger_(std::move(logger)), timeout_(timeout) {}

CapabilityRegistry::~CapabilityRegistry() = default;

std::shared_future<CapabilitySet> CapabilityRegistry::discover(const session::ControlSession& session) {
    std::shared_ptr<Attempt> attempt;
    {
        std::unique_lock lock(mutex_);
        auto known = capabilities_.find(session.id());
        if (known != capabilities_.end()) {
            std::promise<CapabilitySet> ready;
            ready.set_value(known->second);
            return ready.get_future().share();
        }
        auto running = pending_.find(session.id());
        if (running != pending_.end()) {
            return running->second->future;
        }
        attempt = std::make_shared<Attempt>(io_context_, session.id());
        pending_.emplace(session.id(), attempt);
    }

    if (logger_) {
        logger_->debug("[discovery] probing session", session.id(), "at", session.endpoint());
    }

    std::weak_ptr<CapabilityRegistry> self = weak_from_this();

    attempt->timer.expires_after(timeout_);
    attempt->timer.async_wait([self, attempt](const std::error_code& ec) {
        if (ec == asio::error::operation_aborted) {
            return;
        }
        finish(self, attempt, std::make_error_code(std::errc::timed_out), {});
    });

    const auto& probe = session.probe();
    if (!probe) {
        finish(self, attempt, std::make_error_code(std::errc::not_supported), {});
        return attempt->future;
    }

    try {
        probe->list_services([self, attempt](std::error_code ec, std::vector<std::string> service_names) {
            finish(self, attempt, ec, std::move(service_names));
        });
    } catch (const std::exception& ex) {
        if (logger_) {
            logger_->warn("[discovery] probe for session", session.id(), "threw:", ex.what());
        }
        finish(self, attempt, std::make_error_code(std::errc::io_error), {});
    }
    return attempt->future;
}

void CapabilityRegistry::finish(const std::weak_ptr<CapabilityRegistry>& registry,
                                const std::shared_ptr<Attempt>& attempt,
                                std::error_code ec,
                                std::vector<std::string> service_names) {
    if (attempt->done.exchange(true)) {
        return;
    }

    CapabilitySet capabilities;
    capabilities.session_id = attempt->session_id;
    capabilities.discovered_at = std::chrono::system_clock::now();
    capabilities.error = ec;
    if (!ec) {
        for (auto& name : service_names) {
            if (!name.empty()) {
                capabilities.advertised_service_names.insert(std::move(name));
            }
        }
    }

    if (auto self = registry.lock()) {
        self->record(attempt, capabilities);
    }
    attempt->promise.set_value(std::move(capabilities));

    // The timer may only be touched from its executor.
    asio::post(attempt->timer.get_executor(), [attempt] { attempt->timer.cancel(); });
}

void CapabilityRegistry::record(const std::shared_ptr<Attempt>& attempt, const CapabilitySet& capabilities) {
    {
        std::unique_lock lock(mutex_);
        auto it = pending_.find(attempt->session_id);
        if (it == pending_.end() || it->second != attempt) {
            // Session was forgotten while discovery was in flight.
            return;
        }
        pending_.erase(it);
        capabilities_[attempt->session_id] = capabilities;
    }

    if (!logger_) {
        return;
    }
    if (capabilities.error) {
        logger_->warn("[discovery] session", capabilities.session_id, "discovery failed:",
                      capabilities.error.message(), "- treating producer as generic");
    } else {
        logger_->info("[discovery] session", capabilities.session_id, "advertises",
                      capabilities.advertised_service_names.size(), "services");
    }
}

void CapabilityRegistry::forget(const std::string& session_id) {
    std::shared_ptr<Attempt> attempt;
    {
        std::unique_lock lock(mutex_);
        auto running = pending_.find(session_id);
        if (running != pending_.end()) {
            attempt = std::move(running->second);
            pending_.erase(running);
        }
        capabilities_.erase(session_id);
    }

    // Resolves waiters now and cancels the timeout; record() no longer finds the attempt.
    if (attempt) {
        finish(weak_from_this(), attempt, std::make_error_code(std::errc::operation_canceled), {});
    }
}

std::optional<CapabilitySet> CapabilityRegistry::find(const std::string& session_id) const {
    std::shared_lock lock(mutex_);
    auto it = capabilities_.find(session_id);
    if (it == capabilities_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool CapabilityRegistry::supports(const std::string& session_id, const std::string& service_name) const {
    std::shared_lock lock(mutex_);
    auto it = capabilities_.find(session_id);
    return it != capabilities_.end() && it->second.supports(service_name);
}

bool CapabilityRegistry::pending(const std::string& session_id) const {
    std::shared_lock lock(mutex_);
    return pending_.count(session_id) != 0;
}

std::vector<CapabilitySet> CapabilityRegistry::snapshot() const {
    std::shared_lock lock(mutex_);
    std::vector<CapabilitySet> result;
    result.reserve(capabilities_.size());
    for (const auto& [_, capabilities] : capabilities_) {
        result.push_back(capabilities);
    }
    return result;
}

std::size_t CapabilityRegistry::size() const {
    std::shared_lock lock(mutex_);
    return capabilities_.size();
}

}  // namespace hindsight::core::discovery
