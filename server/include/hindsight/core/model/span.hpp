#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "hindsight/core/model/ids.hpp"

namespace hindsight::core::model {

using AttributeValue = std::variant<std::string, int64_t, double, bool>;
using Attributes = std::map<std::string, AttributeValue>;

std::string attribute_to_string(const AttributeValue& value);

struct SpanEvent {
    std::string name;
    Timestamp timestamp;
    Attributes attributes;
};

struct SpanStatus {
    enum class Code { ok, error };

    Code code{Code::ok};
    std::string message;

    static SpanStatus ok() { return {}; }
    static SpanStatus error(std::string message) { return {Code::error, std::move(message)}; }

    [[nodiscard]] bool is_error() const noexcept { return code == Code::error; }
};

/**
 * @brief 单个计时操作记录
 *
 * end_time 为空表示跨度仍处于打开状态；parent_span_id 为空表示根跨度。
 */
struct Span {
    TraceId trace_id;
    SpanId span_id;
    std::optional<SpanId> parent_span_id;
    std::string name;
    std::string service_name;
    Timestamp start_time;
    std::optional<Timestamp> end_time;
    Attributes attributes;
    std::vector<SpanEvent> events;
    SpanStatus status;

    [[nodiscard]] bool is_root() const noexcept { return !parent_span_id.has_value(); }
    [[nodiscard]] bool is_open() const noexcept { return !end_time.has_value(); }
    [[nodiscard]] std::optional<uint64_t> duration_nanos() const;
};

/**
 * @brief 校验单个跨度，返回空字符串表示合法，否则返回拒绝原因
 */
std::string validate_span(const Span& span);

}  // namespace hindsight::core::model
