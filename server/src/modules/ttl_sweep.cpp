#include "hindsight/server/modules/ttl_sweep.hpp"

#include <stdexcept>

namespace hindsight::modules {

TtlSweepModule::TtlSweepModule(asio::io_context& io_context,
                               std::shared_ptr<core::storage::TraceStore> store,
                               std::shared_ptr<core::logging::Logger> logger)
    : io_context_(io_context), timer_(io_context), store_(std::move(store)), logger_(std::move(logger)) {
    if (!store_) {
        throw std::invalid_argument("ttl sweep module requires a trace store");
    }
}

void TtlSweepModule::configure(const core::config::Configuration& configuration) {
    auto value = configuration.get_milliseconds("store.sweep_interval_ms", sweep_interval_);
    if (value.count() <= 0) {
        if (logger_) {
            logger_->warn("[sweep] ignoring non-positive store.sweep_interval_ms");
        }
        return;
    }
    sweep_interval_ = value;
    if (logger_) {
        logger_->debug("[sweep] interval configured to", sweep_interval_.count(), "ms");
    }
}

void TtlSweepModule::start() {
    if (active_.exchange(true)) {
        return;
    }
    std::weak_ptr<TtlSweepModule> self = weak_from_this();
    asio::post(io_context_, [self] {
        if (auto this_ptr = self.lock()) {
            this_ptr->arm();
        }
    });
    if (logger_) {
        logger_->info("[sweep] ttl", store_->ttl().count(), "ms, sweeping every", sweep_interval_.count(), "ms");
    }
}

void TtlSweepModule::stop() {
    if (!active_.exchange(false)) {
        return;
    }
    std::weak_ptr<TtlSweepModule> self = weak_from_this();
    asio::post(io_context_, [self] {
        if (auto this_ptr = self.lock()) {
            this_ptr->timer_.cancel();
        }
    });
    if (logger_) {
        logger_->info("[sweep] stopped after", sweeps_run_.load(), "sweeps");
    }
}

std::size_t TtlSweepModule::sweep_now() {
    auto removed = store_->sweep_expired();
    sweeps_run_.fetch_add(1);
    if (removed > 0 && logger_) {
        logger_->debug("[sweep] evicted", removed, "traces");
    }
    return removed;
}

void TtlSweepModule::arm() {
    if (!active_) {
        return;
    }
    timer_.expires_after(sweep_interval_);
    std::weak_ptr<TtlSweepModule> self = weak_from_this();
    timer_.async_wait([self](std::error_code ec) {
        if (ec) {
            return;
        }
        auto this_ptr = self.lock();
        if (!this_ptr || !this_ptr->active_) {
            return;
        }
        this_ptr->sweep_now();
        this_ptr->arm();
    });
}

}  // namespace hindsight::modules
