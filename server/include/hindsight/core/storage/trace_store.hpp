#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

#include "hindsight/core/logging/logger.hpp"
#include "hindsight/core/model/span.hpp"
#include "hindsight/core/model/trace.hpp"
#include "hindsight/core/trace/assembler.hpp"
#include "hindsight/core/util/clock.hpp"

namespace hindsight::core::query {
class QueryEngine;
struct TraceFilter;
}

namespace hindsight::core::storage {

struct StoreOptions {
    std::chrono::milliseconds ttl{std::chrono::hours(1)};
    std::size_t shard_count{16};
};

/**
 * @brief 一次 ingest 中单个 trace 的变化
 *
 * started / completed 在每个 trace 的生命周期内各自最多为 true 一次，
 * 由该 trace 的键级锁保证。
 */
struct TraceUpdate {
    model::TraceId trace_id;
    std::vector<model::Span> added_spans;
    model::TraceSnapshot trace;  // nullptr while the root span is missing
    bool started{false};
    bool completed{false};
};

struct IngestReport {
    std::size_t accepted{0};
    std::size_t rejected{0};
    std::vector<std::string> errors;
    std::size_t traces_touched{0};
    std::size_t traces_assembled{0};
};

struct StoreStats {
    std::size_t traces{0};
    std::size_t incomplete_traces{0};
    std::size_t spans{0};
    std::uint64_t evicted_total{0};
};

/**
 * @brief 并发、按 TTL 淘汰的跨度与追踪存储
 *
 * - 表按 TraceId 哈希分片，每个分片一把读写锁，只在查找/插入/删除条目时持有；
 * - 每个 trace 条目有独立的互斥量，同一 TraceId 的写入在该锁下线性化；
 * - 淘汰按分片逐个扫描，不存在覆盖整张表的全局锁；
 * - 过期判定为 now - last_write >= ttl，读路径同样执行该判定，
 *   因此过期后即使尚未被清扫也不可见。
 */
class TraceStore {
public:
    using UpdateObserver = std::function<void(const TraceUpdate&)>;

    explicit TraceStore(StoreOptions options,
                        util::ClockPtr clock = util::default_clock(),
                        std::shared_ptr<logging::Logger> logger = nullptr);
    ~TraceStore();

    TraceStore(const TraceStore&) = delete;
    TraceStore& operator=(const TraceStore&) = delete;

    /**
     * @brief 写入一批跨度；非法跨度计入 rejected，不会中断整批
     * @param observer 在该 trace 的键级锁内同步回调，必须是非阻塞的
     */
    IngestReport ingest(std::vector<model::Span> spans, const UpdateObserver& observer = {});

    /**
     * @brief 返回已组装 trace 的不可变快照；未知、过期或根未到达时返回 nullptr
     */
    [[nodiscard]] model::TraceSnapshot get_trace(const model::TraceId& trace_id) const;

    /**
     * @brief 当前所有未过期且已组装的 trace 快照，每个 TraceId 恰好出现一次
     */
    [[nodiscard]] std::vector<model::TraceSnapshot> snapshot() const;

    /**
     * @brief 在快照上交给 QueryEngine 过滤
     */
    std::error_code list_summaries(const query::QueryEngine& engine,
                                   const query::TraceFilter& filter,
                                   std::vector<model::TraceSummary>& out) const;

    /**
     * @brief 移除所有过期条目，返回移除数量
     */
    std::size_t sweep_expired();

    [[nodiscard]] StoreStats stats() const;
    [[nodiscard]] std::chrono::milliseconds ttl() const noexcept { return options_.ttl; }
    [[nodiscard]] std::size_t shard_count() const noexcept { return shards_.size(); }

private:
    struct Entry;
    struct Shard;

    Shard& shard_for(const model::TraceId& trace_id) const;
    std::shared_ptr<Entry> acquire_entry(const model::TraceId& trace_id);
    bool expired(const Entry& entry, util::Clock::time_point now) const;
    void apply(const model::TraceId& trace_id,
               std::vector<model::Span> spans,
               const UpdateObserver& observer,
               IngestReport& report);

    StoreOptions options_;
    util::ClockPtr clock_;
    std::shared_ptr<logging::Logger> logger_;
    trace::TraceAssembler assembler_;
    std::vector<std::unique_ptr<Shard>> shards_;
    std::atomic<std::uint64_t> evicted_total_{0};
};

}  // namespace hindsight::core::storage
