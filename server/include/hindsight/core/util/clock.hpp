#pragma once

#include <atomic>
#include <chrono>
#include <memory>

namespace hindsight::core::util {

/**
 * @brief 可注入的单调时钟，用于 TTL 计算
 */
class Clock {
public:
    using duration = std::chrono::steady_clock::duration;
    using time_point = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;
    virtual time_point now() const = 0;
};

using ClockPtr = std::shared_ptr<const Clock>;

class SteadyClock : public Clock {
public:
    time_point now() const override { return std::chrono::steady_clock::now(); }
};

/**
 * @brief 手动推进的时钟，测试中用于精确控制过期时间
 */
class ManualClock : public Clock {
public:
    ManualClock() = default;
    explicit ManualClock(time_point start) : ticks_(start.time_since_epoch().count()) {}

    time_point now() const override { return time_point{duration{ticks_.load()}}; }

    void advance(duration delta) { ticks_.fetch_add(delta.count()); }
    void set(time_point value) { ticks_.store(value.time_since_epoch().count()); }

private:
    std::atomic<duration::rep> ticks_{0};
};

inline ClockPtr default_clock() {
    return std::make_shared<SteadyClock>();
}

}  // namespace hindsight::core::util
