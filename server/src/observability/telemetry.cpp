#include "hindsight/core/observability/telemetry.hpp"

#include <chrono>

namespace hindsight::core::observability {
namespace {

class NoopSpan : public Span {
public:
    void set_attribute(const std::string& /*key*/, std::string_view /*value*/) override {}
    void set_attribute(const std::string& /*key*/, int64_t /*value*/) override {}
    void add_event(const std::string& /*name*/) override {}
    void end() override {}
};

class NoopTracer : public Tracer {
public:
    SpanPtr start_span(const std::string& /*name*/) override {
        return std::make_shared<NoopSpan>();
    }
};

class LogSpan : public Span {
public:
    LogSpan(std::shared_ptr<logging::Logger> logger, std::string tracer, std::string name)
        : logger_(std::move(logger)),
          label_(std::move(tracer) + "/" + std::move(name)),
          started_(std::chrono::steady_clock::now()) {
        logger_->trace("[telemetry] start span", label_);
    }

    ~LogSpan() override { end(); }

    void set_attribute(const std::string& key, std::string_view value) override {
        logger_->trace("[telemetry] span", label_, "attr", key + "=" + std::string{value});
    }

    void set_attribute(const std::string& key, int64_t value) override {
        logger_->trace("[telemetry] span", label_, "attr", key + "=" + std::to_string(value));
    }

    void add_event(const std::string& name) override {
        logger_->trace("[telemetry] span", label_, "event", name);
    }

    void end() override {
        if (ended_) {
            return;
        }
        ended_ = true;
        auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - started_);
        logger_->debug("[telemetry] end span", label_, "after", elapsed.count(), "us");
    }

private:
    std::shared_ptr<logging::Logger> logger_;
    std::string label_;
    std::chrono::steady_clock::time_point started_;
    bool ended_{false};
};

class LogTracer : public Tracer {
public:
    LogTracer(std::shared_ptr<logging::Logger> logger, std::string name)
        : logger_(std::move(logger)), name_(std::move(name)) {}

    SpanPtr start_span(const std::string& name) override {
        return std::make_shared<LogSpan>(logger_, name_, name);
    }

private:
    std::shared_ptr<logging::Logger> logger_;
    std::string name_;
};

}  // namespace

Telemetry::Telemetry(Mode mode, std::shared_ptr<logging::Logger> logger)
    : mode_(mode), logger_(std::move(logger)) {
    if (mode_ == Mode::log && !logger_) {
        logger_ = logging::create_logger("telemetry");
    }
}

TracerPtr Telemetry::get_tracer(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tracers_.find(name);
    if (it != tracers_.end()) {
        return it->second;
    }

    TracerPtr tracer;
    if (mode_ == Mode::log) {
        tracer = std::make_shared<LogTracer>(logger_, name);
    } else {
        tracer = std::make_shared<NoopTracer>();
    }
    tracers_.emplace(name, tracer);
    return tracer;
}

std::optional<Telemetry::Mode> Telemetry::mode_from_string(std::string_view value) {
    if (value == "noop" || value == "off" || value == "none") {
        return Mode::noop;
    }
    if (value == "log") {
        return Mode::log;
    }
    return std::nullopt;
}

}  // namespace hindsight::core::observability
