#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "hindsight/core/logging/logger.hpp"

namespace hindsight::core::observability {

/**
 * @brief 中枢自身的追踪跨度接口
 *
 * 这些跨度只写入日志或直接丢弃，永远不会回流到 TraceStore。
 */
class Span {
public:
    virtual ~Span() = default;
    virtual void set_attribute(const std::string& key, std::string_view value) = 0;
    virtual void set_attribute(const std::string& key, int64_t value) = 0;
    virtual void add_event(const std::string& name) = 0;
    virtual void end() = 0;
};

using SpanPtr = std::shared_ptr<Span>;

/**
 * @brief 追踪器接口 (Tracer Interface)
 */
class Tracer {
public:
    virtual ~Tracer() = default;
    virtual SpanPtr start_span(const std::string& name) = 0;
};

using TracerPtr = std::shared_ptr<Tracer>;

/**
 * @brief 遥测工厂，按名称缓存 Tracer
 *
 * 由 Application 显式创建并持有，不提供全局访问点。
 */
class Telemetry {
public:
    enum class Mode { noop, log };

    explicit Telemetry(Mode mode = Mode::noop, std::shared_ptr<logging::Logger> logger = nullptr);

    TracerPtr get_tracer(const std::string& name);
    [[nodiscard]] Mode mode() const noexcept { return mode_; }

    static std::optional<Mode> mode_from_string(std::string_view value);

private:
    Mode mode_;
    std::shared_ptr<logging::Logger> logger_;
    std::mutex mutex_;
    std::map<std::string, TracerPtr, std::less<>> tracers_;
};

using TelemetryPtr = std::shared_ptr<Telemetry>;

/**
 * @brief 作用域内的 Span 管理器 (RAII)
 */
class ScopedSpan {
public:
    explicit ScopedSpan(SpanPtr span) : span_(std::move(span)) {}
    ~ScopedSpan() {
        if (span_) {
            span_->end();
        }
    }

    ScopedSpan(const ScopedSpan&) = delete;
    ScopedSpan& operator=(const ScopedSpan&) = delete;

    explicit operator bool() const noexcept { return static_cast<bool>(span_); }
    Span* operator->() { return span_.get(); }
    [[nodiscard]] SpanPtr get() const { return span_; }

private:
    SpanPtr span_;
};

}  // namespace hindsight::core::observability
