#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "hindsight/core/events/event_broadcaster.hpp"
#include "hindsight/core/model/span.hpp"
#include "hindsight/core/model/trace.hpp"

namespace hindsight::core::codec {

using json = nlohmann::json;

json attribute_to_json(const model::AttributeValue& value);
json attributes_to_json(const model::Attributes& attributes);

json to_json(const model::Span& span);
json to_json(const model::TraceSummary& summary);
json to_json(const model::Trace& trace, const model::TraceType& trace_type);
json to_json(const events::TraceEvent& event);

// {"traces": [...], "total": n}
json summaries_to_json(const std::vector<model::TraceSummary>& summaries);

/**
 * @brief 解码单个生产者跨度
 *
 * 标识必须是十六进制字符串；属性值只接受字符串、整数、浮点与布尔。
 * 失败时返回 std::nullopt 并在 error 中写入原因，不抛出异常。
 */
std::optional<model::Span> span_from_json(const json& value, std::string& error);

struct DecodedSpans {
    std::vector<model::Span> spans;
    std::vector<std::string> errors;
};

// Accepts an array of spans or an object with a "spans" array.
DecodedSpans spans_from_json(const json& value);

}  // namespace hindsight::core::codec
