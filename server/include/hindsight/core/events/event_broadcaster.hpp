#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "hindsight/core/logging/logger.hpp"
#include "hindsight/core/model/span.hpp"

namespace hindsight::core::events {

struct TraceStarted {
    model::TraceId trace_id;
    std::string root_span_name;
    std::string service_name;
};

struct SpanAdded {
    model::TraceId trace_id;
    model::Span span;
};

struct TraceCompleted {
    model::TraceId trace_id;
    std::optional<uint64_t> duration_nanos;
    std::size_t span_count{0};
};

using TraceEvent = std::variant<TraceStarted, SpanAdded, TraceCompleted>;

model::TraceId event_trace_id(const TraceEvent& event);
const char* event_name(const TraceEvent& event);

namespace detail {
class SubscriberQueue;
struct SubscriberRegistry;
}

/**
 * @brief 实时事件订阅句柄
 *
 * 析构或 cancel() 时立即从广播器注销并释放其有界队列。
 * 事件序列不可重启：关闭后 next() 始终返回 std::nullopt。
 */
class Subscription {
public:
    Subscription() = default;
    ~Subscription();

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;
    Subscription(Subscription&& other) noexcept;
    Subscription& operator=(Subscription&& other) noexcept;

    // Blocks until an event arrives or the subscription is closed.
    std::optional<TraceEvent> next();
    std::optional<TraceEvent> next_for(std::chrono::milliseconds timeout);
    std::optional<TraceEvent> try_next();

    void cancel();

    [[nodiscard]] bool active() const;
    [[nodiscard]] uint64_t id() const noexcept { return id_; }
    [[nodiscard]] uint64_t dropped_count() const;
    [[nodiscard]] std::size_t pending() const;

private:
    friend class EventBroadcaster;
    Subscription(uint64_t id,
                 std::shared_ptr<detail::SubscriberQueue> queue,
                 std::weak_ptr<detail::SubscriberRegistry> registry);

    uint64_t id_{0};
    std::shared_ptr<detail::SubscriberQueue> queue_;
    std::weak_ptr<detail::SubscriberRegistry> registry_;
};

/**
 * @brief 追踪事件的发布/订阅广播器
 *
 * 投递契约（有损）：每个订阅者拥有独立的有界队列。队列已满时丢弃该订阅者
 * 最早的未读事件并计数，发布方永不阻塞。实时视图是尽力而为的，不是持久日志。
 *
 * 订阅者列表采用写时复制：只有 subscribe/unsubscribe 加锁，publish 只读取
 * 当前列表快照。单个订阅者内的顺序与发布顺序一致，订阅者之间不保证顺序。
 *
 * 每条追踪的事件顺序：TraceStarted 最多一次且最先到达，随后是 SpanAdded，
 * TraceCompleted 最多一次。根跨度到达之前的跨度不单独发布，而是在
 * TraceStarted 之后随完整快照一起补发。
 */
class EventBroadcaster {
public:
    explicit EventBroadcaster(std::size_t queue_capacity = 1024,
                              std::shared_ptr<logging::Logger> logger = nullptr);
    ~EventBroadcaster();

    EventBroadcaster(const EventBroadcaster&) = delete;
    EventBroadcaster& operator=(const EventBroadcaster&) = delete;

    [[nodiscard]] Subscription subscribe();

    // Returns the number of subscribers the event was queued for.
    std::size_t publish(const TraceEvent& event);

    // Closes every subscription; later subscriptions start closed.
    void shutdown();

    [[nodiscard]] std::size_t subscriber_count() const;
    [[nodiscard]] std::size_t queue_capacity() const noexcept { return queue_capacity_; }
    [[nodiscard]] uint64_t published_total() const noexcept { return published_total_.load(); }
    [[nodiscard]] uint64_t dropped_total() const noexcept { return dropped_total_.load(); }

private:
    std::size_t queue_capacity_;
    std::shared_ptr<logging::Logger> logger_;
    std::shared_ptr<detail::SubscriberRegistry> registry_;
    std::atomic<uint64_t> next_id_{1};
    std::atomic<uint64_t> published_total_{0};
    std::atomic<uint64_t> dropped_total_{0};
};

using EventBroadcasterPtr = std::shared_ptr<EventBroadcaster>;

}  // namespace hindsight::core::events
