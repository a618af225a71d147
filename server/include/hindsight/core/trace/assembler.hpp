#pragma once

#include <optional>
#include <string_view>
#include <vector>

#include "hindsight/core/model/trace.hpp"

namespace hindsight::core::trace {

/**
 * @brief 把同一 TraceId 下无序到达的跨度组装为以根为起点的追踪树
 *
 * 根跨度尚未到达时返回 std::nullopt（不完整，属于正常的暂态），
 * 调用方保留跨度，待后续跨度到达后重试。
 *
 * 组装规则：
 * - 没有父节点的跨度中，按 (start_time, span_id) 最早者为根，其余为孤儿；
 * - 父节点不在集合内的跨度同样记为孤儿，不出现在 children_index 中；
 * - end_time 为所有已结束跨度的最大值；若从根可达的任一跨度仍未结束则为空。
 */
class TraceAssembler {
public:
    [[nodiscard]] std::optional<model::Trace> assemble(const model::TraceId& trace_id,
                                                       std::vector<model::Span> spans) const;
};

inline constexpr std::string_view kDependencyAttribute = "hindsight.depends_on";

struct DependencyEdge {
    enum class Source { parent_child, attribute };

    model::SpanId from;
    model::SpanId to;
    Source source{Source::parent_child};
};

/**
 * @brief 推导跨度之间的依赖边 (from 依赖 to)
 *
 * 默认来自父子关系；若跨度带有 attribute_key 字符串属性（逗号分隔的
 * span id 列表），额外补充显式依赖边。重复的边只保留一条。
 */
std::vector<DependencyEdge> derive_dependency_edges(const model::Trace& trace,
                                                    std::string_view attribute_key = kDependencyAttribute);

}  // namespace hindsight::core::trace
