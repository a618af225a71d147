#include "hindsight/core/model/span.hpp"

#include <sstream>

namespace hindsight::core::model {

std::string attribute_to_string(const AttributeValue& value) {
    struct Visitor {
        std::string operator()(const std::string& v) const { return v; }
        std::string operator()(int64_t v) const { return std::to_string(v); }
        std::string operator()(double v) const {
            std::ostringstream oss;
            oss << v;
            return oss.str();
        }
        std::string operator()(bool v) const { return v ? "true" : "false"; }
    };
    return std::visit(Visitor{}, value);
}

std::optional<uint64_t> Span::duration_nanos() const {
    if (!end_time || end_time->nanos < start_time.nanos) {
        return std::nullopt;
    }
    return end_time->nanos - start_time.nanos;
}

std::string validate_span(const Span& span) {
    if (!span.trace_id.is_valid()) {
        return "span " + span.span_id.to_hex() + ": invalid trace id";
    }
    if (!span.span_id.is_valid()) {
        return "trace " + span.trace_id.to_hex() + ": invalid span id";
    }
    if (span.parent_span_id) {
        if (!span.parent_span_id->is_valid()) {
            return "span " + span.span_id.to_hex() + ": invalid parent span id";
        }
        if (*span.parent_span_id == span.span_id) {
            return "span " + span.span_id.to_hex() + ": span is its own parent";
        }
    }
    if (span.end_time && *span.end_time < span.start_time) {
        return "span " + span.span_id.to_hex() + ": end time precedes start time";
    }
    return {};
}

}  // namespace hindsight::core::model
