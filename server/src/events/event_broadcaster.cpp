#include "hindsight/core/events/event_broadcaster.hpp"

#include <algorithm>
#include <condition_variable>
#include <deque>

namespace hindsight::core::events {

model::TraceId event_trace_id(const TraceEvent& event) {
    return std::visit([](const auto& e) { return e.trace_id; }, event);
}

const char* event_name(const TraceEvent& event) {
    struct Visitor {
        const char* operator()(const TraceStarted&) const { return "trace_started"; }
        const char* operator()(const SpanAdded&) const { return "span_added"; }
        const char* operator()(const TraceCompleted&) const { return "trace_completed"; }
    };
    return std::visit(Visitor{}, event);
}

namespace detail {

class SubscriberQueue {
public:
    SubscriberQueue(uint64_t id, std::size_t capacity)
        : id_(id), capacity_(std::max<std::size_t>(capacity, 1)) {}

    [[nodiscard]] uint64_t id() const noexcept { return id_; }

    enum class PushResult { queued, queued_dropped_oldest, closed };

    PushResult push(const TraceEvent& event) {
        PushResult result = PushResult::queued;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return PushResult::closed;
            }
            if (events_.size() >= capacity_) {
                events_.pop_front();
                ++dropped_;
                result = PushResult::queued_dropped_oldest;
            }
            events_.push_back(event);
        }
        cv_.notify_one();
        return result;
    }

    std::optional<TraceEvent> pop_wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return closed_ || !events_.empty(); });
        return take_locked();
    }

    std::optional<TraceEvent> pop_wait_for(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return closed_ || !events_.empty(); });
        return take_locked();
    }

    std::optional<TraceEvent> try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        return take_locked();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
            std::deque<TraceEvent>{}.swap(events_);
        }
        cv_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    uint64_t dropped() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_.size();
    }

private:
    std::optional<TraceEvent> take_locked() {
        if (closed_ || events_.empty()) {
            return std::nullopt;
        }
        auto event = std::move(events_.front());
        events_.pop_front();
        return event;
    }

    const uint64_t id_;
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<TraceEvent> events_;
    bool closed_{false};
    uint64_t dropped_{0};
};

using SubscriberList = std::vector<std::weak_ptr<SubscriberQueue>>;

struct SubscriberRegistry {
    std::mutex mutex;
    std::shared_ptr<const SubscriberList> subscribers{std::make_shared<const SubscriberList>()};
    bool shut_down{false};

    std::shared_ptr<const SubscriberList> load() const {
        return std::atomic_load(&subscribers);
    }

    // Caller holds `mutex`.
    void store_locked(SubscriberList list) {
        std::atomic_store(&subscribers, std::shared_ptr<const SubscriberList>(
                                            std::make_shared<SubscriberList>(std::move(list))));
    }

    void remove(uint64_t id) {
        std::lock_guard<std::mutex> lock(mutex);
        SubscriberList next;
        for (const auto& weak : *subscribers) {
            auto queue = weak.lock();
            if (queue && queue->id() != id) {
                next.push_back(weak);
            }
        }
        store_locked(std::move(next));
    }
};

}  // namespace detail

Subscription::Subscription(uint64_t id,
                           std::shared_ptr<detail::SubscriberQueue> queue,
                           std::weak_ptr<detail::SubscriberRegistry> registry)
    : id_(id), queue_(std::move(queue)), registry_(std::move(registry)) {}

Subscription::~Subscription() {
    cancel();
}

Subscription::Subscription(Subscription&& other) noexcept
    : id_(other.id_), queue_(std::move(other.queue_)), registry_(std::move(other.registry_)) {
    other.id_ = 0;
}

Subscription& Subscription::operator=(Subscription&& other) noexcept {
    if (this != &other) {
        cancel();
        id_ = other.id_;
        queue_ = std::move(other.queue_);
        registry_ = std::move(other.registry_);
        other.id_ = 0;
    }
    return *this;
}

std::optional<TraceEvent> Subscription::next() {
    if (!queue_) {
        return std::nullopt;
    }
    return queue_->pop_wait();
}

std::optional<TraceEvent> Subscription::next_for(std::chrono::milliseconds timeout) {
    if (!queue_) {
        return std::nullopt;
    }
    return queue_->pop_wait_for(timeout);
}

std::optional<TraceEvent> Subscription::try_next() {
    if (!queue_) {
        return std::nullopt;
    }
    return queue_->try_pop();
}

void Subscription::cancel() {
    if (!queue_) {
        return;
    }
    queue_->close();
    if (auto registry = registry_.lock()) {
        registry->remove(id_);
    }
    queue_.reset();
    registry_.reset();
}

bool Subscription::active() const {
    return queue_ && !queue_->closed();
}

uint64_t Subscription::dropped_count() const {
    return queue_ ? queue_->dropped() : 0;
}

std::size_t Subscription::pending() const {
    return queue_ ? queue_->size() : 0;
}

EventBroadcaster::EventBroadcaster(std::size_t queue_capacity, std::shared_ptr<logging::Logger> logger)
    : queue_capacity_(std::max<std::size_t>(queue_capacity, 1)),
      logger_(std::move(logger)),
      registry_(std::make_shared<detail::SubscriberRegistry>()) {}

EventBroadcaster::~EventBroadcaster() {
    shutdown();
}

Subscription EventBroadcaster::subscribe() {
    auto id = next_id_.fetch_add(1);
    auto queue = std::make_shared<detail::SubscriberQueue>(id, queue_capacity_);

    {
        std::lock_guard<std::mutex> lock(registry_->mutex);
        if (registry_->shut_down) {
            queue->close();
        } else {
            detail::SubscriberList next(*registry_->subscribers);
            next.push_back(queue);
            registry_->store_locked(std::move(next));
        }
    }

    if (logger_) {
        logger_->debug("[broadcast] subscriber", id, "attached");
    }
    return Subscription{id, std::move(queue), registry_};
}

std::size_t EventBroadcaster::publish(const TraceEvent& event) {
    published_total_.fetch_add(1);

    std::size_t delivered = 0;
    auto subscribers = registry_->load();
    for (const auto& weak : *subscribers) {
        auto queue = weak.lock();
        if (!queue) {
            continue;
        }
        switch (queue->push(event)) {
            case detail::SubscriberQueue::PushResult::queued:
                ++delivered;
                break;
            case detail::SubscriberQueue::PushResult::queued_dropped_oldest:
                ++delivered;
                dropped_total_.fetch_add(1);
                break;
            case detail::SubscriberQueue::PushResult::closed:
                break;
        }
    }
    return delivered;
}

void EventBroadcaster::shutdown() {
    std::shared_ptr<const detail::SubscriberList> subscribers;
    {
        std::lock_guard<std::mutex> lock(registry_->mutex);
        if (registry_->shut_down) {
            return;
        }
        registry_->shut_down = true;
        subscribers = registry_->subscribers;
        registry_->store_locked({});
    }

    for (const auto& weak : *subscribers) {
        if (auto queue = weak.lock()) {
            queue->close();
        }
    }
    if (logger_) {
        logger_->info("[broadcast] closed", subscribers->size(), "subscriptions");
    }
}

std::size_t EventBroadcaster::subscriber_count() const {
    auto subscribers = registry_->load();
    return static_cast<std::size_t>(std::count_if(subscribers->begin(), subscribers->end(),
                                                  [](const auto& weak) { return !weak.expired(); }));
}

}  // namespace hindsight::core::events
