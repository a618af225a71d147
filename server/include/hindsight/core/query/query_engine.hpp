#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include "hindsight/core/model/trace.hpp"
#include "hindsight/core/trace/classifier.hpp"

namespace hindsight::core::query {

/**
 * @brief 列表查询条件，所有字段可选
 *
 * 时长范围为闭区间；设置了任一时长边界时，尚未结束（无时长）的 trace 不匹配。
 */
struct TraceFilter {
    std::optional<std::string> service_name;
    std::optional<uint64_t> min_duration_nanos;
    std::optional<uint64_t> max_duration_nanos;
    std::optional<bool> has_errors;
    std::optional<std::size_t> limit;
};

// invalid_argument when min > max or limit == 0
std::error_code validate(const TraceFilter& filter);

/**
 * @brief 在存储快照上做过滤、排序与截断
 *
 * 排序：start_time 新者在前，相同时按 TraceId 升序。
 * limit 缺省为 max_limit，调用方请求更多时同样被截断到 max_limit。
 * 分类只对最终返回的条目计算，结果不缓存。
 */
class QueryEngine {
public:
    static constexpr std::size_t kDefaultMaxLimit = 100;

    explicit QueryEngine(trace::TraceClassifierPtr classifier, std::size_t max_limit = kDefaultMaxLimit);

    [[nodiscard]] bool matches(const model::Trace& trace, const TraceFilter& filter) const;
    [[nodiscard]] model::TraceSummary summarize(const model::Trace& trace) const;

    std::error_code run(std::vector<model::TraceSnapshot> traces,
                        const TraceFilter& filter,
                        std::vector<model::TraceSummary>& out) const;

    [[nodiscard]] std::size_t max_limit() const noexcept { return max_limit_; }
    [[nodiscard]] const trace::TraceClassifierPtr& classifier() const noexcept { return classifier_; }

private:
    trace::TraceClassifierPtr classifier_;
    std::size_t max_limit_;
};

using QueryEnginePtr = std::shared_ptr<QueryEngine>;

}  // namespace hindsight::core::query
