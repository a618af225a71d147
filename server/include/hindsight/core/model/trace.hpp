#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "hindsight/core/model/ids.hpp"
#include "hindsight/core/model/span.hpp"

namespace hindsight::core::model {

/**
 * @brief 已组装的追踪树
 *
 * spans 按 (start_time, span_id) 排序；children_index 与 orphans
 * 记录的是 spans 中的下标，在每次组装时一次性构建。
 * 存储层持有唯一所有权，读者只通过 TraceSnapshot 读取不可变快照。
 */
struct Trace {
    TraceId trace_id;
    std::vector<Span> spans;
    SpanId root_span_id;
    Timestamp start_time;
    std::optional<Timestamp> end_time;

    std::unordered_map<SpanId, std::vector<std::size_t>, SpanIdHash> children_index;
    // Spans with no parent edge inside this trace, other than the root.
    std::vector<std::size_t> orphans;

    [[nodiscard]] const Span* root() const;
    [[nodiscard]] const Span* find(const SpanId& span_id) const;
    [[nodiscard]] std::vector<const Span*> children_of(const SpanId& span_id) const;
    [[nodiscard]] std::vector<const Span*> orphan_spans() const;

    [[nodiscard]] std::size_t span_count() const noexcept { return spans.size(); }
    [[nodiscard]] std::size_t error_count() const;
    [[nodiscard]] bool is_complete() const noexcept { return end_time.has_value(); }
    [[nodiscard]] std::optional<uint64_t> duration_nanos() const;
};

using TraceSnapshot = std::shared_ptr<const Trace>;

/**
 * @brief 生产框架分类标签
 *
 * framework 为开放字符串，新框架只需注册规则，无需修改该类型。
 */
class TraceType {
public:
    enum class Kind { generic, framework, mixed };

    static TraceType generic() { return TraceType{Kind::generic, {}}; }
    static TraceType framework(std::string kind) { return TraceType{Kind::framework, std::move(kind)}; }
    static TraceType mixed() { return TraceType{Kind::mixed, {}}; }

    [[nodiscard]] Kind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& framework_kind() const noexcept { return framework_; }

    // "Generic", "Framework(picante)", "Mixed"
    [[nodiscard]] std::string to_string() const;

    bool operator==(const TraceType& other) const noexcept {
        return kind_ == other.kind_ && framework_ == other.framework_;
    }
    bool operator!=(const TraceType& other) const noexcept { return !(*this == other); }

private:
    TraceType(Kind kind, std::string framework) : kind_(kind), framework_(std::move(framework)) {}

    Kind kind_{Kind::generic};
    std::string framework_;
};

struct TraceSummary {
    TraceId trace_id;
    std::string root_span_name;
    std::string service_name;
    Timestamp start_time;
    std::optional<uint64_t> duration_nanos;
    std::size_t span_count{0};
    std::size_t error_count{0};
    TraceType trace_type{TraceType::generic()};
};

}  // namespace hindsight::core::model
