#pragma once

#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "hindsight/core/model/span.hpp"
#include "hindsight/core/model/trace.hpp"

namespace hindsight::core::trace {

/**
 * @brief 一条分类规则：属性谓词 -> 框架类型
 *
 * 谓词对类型不符的属性值必须返回 false，而不是抛出异常。
 */
struct ClassificationRule {
    using Predicate = std::function<bool(const std::string& key, const model::AttributeValue& value)>;

    std::string framework_kind;
    Predicate predicate;
};

// Matches any attribute whose key starts with `prefix`.
ClassificationRule key_prefix_rule(std::string framework_kind, std::string prefix);

// Matches attribute `key` only when it holds boolean true.
ClassificationRule bool_marker_rule(std::string framework_kind, std::string key);

// Matches attribute `key` only when it holds exactly the string `expected`.
ClassificationRule string_marker_rule(std::string framework_kind, std::string key, std::string expected);

/**
 * @brief 根据跨度属性为 trace 打上框架标签
 *
 * 对 trace 中所有跨度（不只是根）评估全部规则：
 * 恰好一个框架命中为 Framework(kind)，两个及以上为 Mixed，否则 Generic。
 * 结果是快照的纯函数，不做缓存。规则表可在运行时扩展。
 */
class TraceClassifier {
public:
    TraceClassifier() = default;
    explicit TraceClassifier(std::vector<ClassificationRule> rules);

    // key-prefix rules "<kind>." for each framework name
    static std::shared_ptr<TraceClassifier> with_prefix_rules(const std::vector<std::string>& frameworks);

    void add_rule(ClassificationRule rule);
    [[nodiscard]] std::size_t rule_count() const;

    [[nodiscard]] model::TraceType classify(const model::Trace& trace) const;
    [[nodiscard]] model::TraceType classify(const std::vector<model::Span>& spans) const;

private:
    mutable std::shared_mutex mutex_;
    std::vector<ClassificationRule> rules_;
};

using TraceClassifierPtr = std::shared_ptr<TraceClassifier>;

}  // namespace hindsight::core::trace
