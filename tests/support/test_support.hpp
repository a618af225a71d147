#pragma once

#include <asio.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "hindsight/core/discovery/capability_probe.hpp"
#include "hindsight/core/model/span.hpp"

namespace hindsight::test {

inline core::model::TraceId trace_id_of(uint8_t seed) {
    core::model::TraceId id;
    id.bytes[0] = 0x4b;
    id.bytes[15] = seed;
    return id;
}

inline core::model::Span make_span(const core::model::TraceId& trace_id,
                                   uint64_t span_id,
                                   std::optional<uint64_t> parent,
                                   std::string name,
                                   uint64_t start_nanos,
                                   std::optional<uint64_t> end_nanos,
                                   std::string service = "checkout") {
    core::model::Span span;
    span.trace_id = trace_id;
    span.span_id = core::model::SpanId{span_id};
    if (parent) {
        span.parent_span_id = core::model::SpanId{*parent};
    }
    span.name = std::move(name);
    span.service_name = std::move(service);
    span.start_time = core::model::Timestamp{start_nanos};
    if (end_nanos) {
        span.end_time = core::model::Timestamp{*end_nanos};
    }
    return span;
}

// Runs an io_context on a helper thread for the lifetime of the object.
class IoThread {
public:
    IoThread() : guard_(io_.get_executor()), thread_([this] { io_.run(); }) {}
    ~IoThread() {
        guard_.reset();
        io_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    IoThread(const IoThread&) = delete;
    IoThread& operator=(const IoThread&) = delete;

    asio::io_context& context() { return io_; }

    // Returns once every handler posted before the call has run.
    void sync() {
        std::promise<void> done;
        auto ready = done.get_future();
        asio::post(io_, [&done] { done.set_value(); });
        ready.wait();
    }

private:
    asio::io_context io_;
    asio::executor_work_guard<asio::io_context::executor_type> guard_;
    std::thread thread_;
};

// Scripted producer side of capability discovery.
class FakeProbe : public core::discovery::CapabilityProbe {
public:
    enum class Mode { reply, silent, fail, throw_on_call };

    explicit FakeProbe(Mode mode, std::vector<std::string> services = {})
        : mode_(mode), services_(std::move(services)) {}

    // Runs at the start of every list_services() call, before the scripted answer.
    void on_call(std::function<void()> hook) { hook_ = std::move(hook); }

    void list_services(Callback callback) override {
        if (hook_) {
            hook_();
        }
        std::lock_guard<std::mutex> lock(mutex_);
        ++calls_;
        switch (mode_) {
            case Mode::reply:
                callback({}, services_);
                break;
            case Mode::silent:
                pending_ = std::move(callback);
                break;
            case Mode::fail:
                callback(std::make_error_code(std::errc::connection_reset), {});
                break;
            case Mode::throw_on_call:
                throw std::runtime_error("transport closed");
        }
    }

    // Delivers a reply for a silent probe, as a late producer would.
    bool respond() {
        Callback callback;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            callback = std::move(pending_);
            pending_ = nullptr;
        }
        if (!callback) {
            return false;
        }
        callback({}, services_);
        return true;
    }

    int calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

private:
    Mode mode_;
    std::vector<std::string> services_;
    std::function<void()> hook_;
    mutable std::mutex mutex_;
    Callback pending_;
    int calls_{0};
};

// Polls `condition` until it holds or `timeout` elapses.
inline bool wait_until(const std::function<bool()>& condition,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return condition();
}

}  // namespace hindsight::test
