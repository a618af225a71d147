#include "hindsight/core/codec/json_codec.hpp"

#include <cstdint>
#include <limits>

namespace hindsight::core::codec {
namespace {

json optional_nanos(const std::optional<uint64_t>& value) {
    return value ? json(*value) : json(nullptr);
}

bool attribute_from_json(const json& value, model::AttributeValue& out) {
    if (value.is_string()) {
        out = value.get<std::string>();
    } else if (value.is_boolean()) {
        out = value.get<bool>();
    } else if (value.is_number_unsigned()) {
        auto raw = value.get<uint64_t>();
        if (raw > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return false;
        }
        out = static_cast<int64_t>(raw);
    } else if (value.is_number_integer()) {
        out = value.get<int64_t>();
    } else if (value.is_number_float()) {
        out = value.get<double>();
    } else {
        return false;
    }
    return true;
}

// Object form {"k": v} or list form [{"key": k, "value": v}].
bool attributes_from_json(const json& value, model::Attributes& out, std::string& error) {
    if (value.is_null()) {
        return true;
    }
    if (value.is_object()) {
        for (auto it = value.begin(); it != value.end(); ++it) {
            model::AttributeValue attribute;
            if (!attribute_from_json(it.value(), attribute)) {
                error = "attribute '" + it.key() + "' has an unsupported value type";
                return false;
            }
            out.insert_or_assign(it.key(), std::move(attribute));
        }
        return true;
    }
    if (value.is_array()) {
        for (const auto& item : value) {
            if (!item.is_object() || !item.contains("key") || !item.at("key").is_string() || !item.contains("value")) {
                error = "attribute entries need a string key and a value";
                return false;
            }
            const auto key = item.at("key").get<std::string>();
            model::AttributeValue attribute;
            if (!attribute_from_json(item.at("value"), attribute)) {
                error = "attribute '" + key + "' has an unsupported value type";
                return false;
            }
            out.insert_or_assign(key, std::move(attribute));
        }
        return true;
    }
    error = "attributes must be an object or an array";
    return false;
}

bool read_nanos(const json& object, const char* key, std::optional<model::Timestamp>& out, std::string& error) {
    if (!object.contains(key) || object.at(key).is_null()) {
        out.reset();
        return true;
    }
    const auto& value = object.at(key);
    if (!value.is_number_unsigned() && !(value.is_number_integer() && value.get<int64_t>() >= 0)) {
        error = std::string(key) + " must be a non-negative integer";
        return false;
    }
    out = model::Timestamp{value.get<uint64_t>()};
    return true;
}

std::string read_string(const json& object, const char* key) {
    if (!object.contains(key) || !object.at(key).is_string()) {
        return {};
    }
    return object.at(key).get<std::string>();
}

}  // namespace

json attribute_to_json(const model::AttributeValue& value) {
    return std::visit([](const auto& v) { return json(v); }, value);
}

json attributes_to_json(const model::Attributes& attributes) {
    auto list = json::array();
    for (const auto& [key, value] : attributes) {
        list.push_back({{"key", key}, {"value", attribute_to_json(value)}});
    }
    return list;
}

json to_json(const model::Span& span) {
    auto events = json::array();
    for (const auto& event : span.events) {
        events.push_back({
            {"name", event.name},
            {"timestamp_nanos", event.timestamp.nanos},
            {"attributes", attributes_to_json(event.attributes)},
        });
    }

    json status = {{"code", span.status.is_error() ? "error" : "ok"}};
    if (span.status.is_error()) {
        status["message"] = span.status.message;
    }

    return {
        {"trace_id", span.trace_id.to_hex()},
        {"span_id", span.span_id.to_hex()},
        {"parent_span_id", span.parent_span_id ? json(span.parent_span_id->to_hex()) : json(nullptr)},
        {"name", span.name},
        {"service_name", span.service_name},
        {"start_time_nanos", span.start_time.nanos},
        {"end_time_nanos", span.end_time ? json(span.end_time->nanos) : json(nullptr)},
        {"duration_nanos", optional_nanos(span.duration_nanos())},
        {"attributes", attributes_to_json(span.attributes)},
        {"events", std::move(events)},
        {"status", std::move(status)},
    };
}

json to_json(const model::TraceSummary& summary) {
    return {
        {"trace_id", summary.trace_id.to_hex()},
        {"root_span_name", summary.root_span_name},
        {"service_name", summary.service_name},
        {"start_time_nanos", summary.start_time.nanos},
        {"duration_nanos", optional_nanos(summary.duration_nanos)},
        {"span_count", summary.span_count},
        {"error_count", summary.error_count},
        {"trace_type", summary.trace_type.to_string()},
    };
}

json to_json(const model::Trace& trace, const model::TraceType& trace_type) {
    auto spans = json::array();
    for (const auto& span : trace.spans) {
        spans.push_back(to_json(span));
    }
    return {
        {"trace_id", trace.trace_id.to_hex()},
        {"root_span_id", trace.root_span_id.to_hex()},
        {"start_time_nanos", trace.start_time.nanos},
        {"end_time_nanos", trace.end_time ? json(trace.end_time->nanos) : json(nullptr)},
        {"duration_nanos", optional_nanos(trace.duration_nanos())},
        {"trace_type", trace_type.to_string()},
        {"spans", std::move(spans)},
    };
}

json to_json(const events::TraceEvent& event) {
    struct Visitor {
        json operator()(const events::TraceStarted& e) const {
            return {{"type", "trace_started"},
                    {"trace_id", e.trace_id.to_hex()},
                    {"root_span_name", e.root_span_name},
                    {"service_name", e.service_name}};
        }
        json operator()(const events::SpanAdded& e) const {
            return {{"type", "span_added"}, {"trace_id", e.trace_id.to_hex()}, {"span", to_json(e.span)}};
        }
        json operator()(const events::TraceCompleted& e) const {
            return {{"type", "trace_completed"},
                    {"trace_id", e.trace_id.to_hex()},
                    {"duration_nanos", optional_nanos(e.duration_nanos)},
                    {"span_count", e.span_count}};
        }
    };
    return std::visit(Visitor{}, event);
}

json summaries_to_json(const std::vector<model::TraceSummary>& summaries) {
    auto traces = json::array();
    for (const auto& summary : summaries) {
        traces.push_back(to_json(summary));
    }
    return {{"traces", std::move(traces)}, {"total", summaries.size()}};
}

std::optional<model::Span> span_from_json(const json& value, std::string& error) {
    if (!value.is_object()) {
        error = "span must be a JSON object";
        return std::nullopt;
    }

    model::Span span;

    auto trace_id = model::TraceId::from_hex(read_string(value, "trace_id"));
    if (!trace_id) {
        error = "span has a malformed trace_id";
        return std::nullopt;
    }
    span.trace_id = *trace_id;

    auto span_id = model::SpanId::from_hex(read_string(value, "span_id"));
    if (!span_id) {
        error = "span has a malformed span_id";
        return std::nullopt;
    }
    span.span_id = *span_id;

    if (value.contains("parent_span_id") && !value.at("parent_span_id").is_null()) {
        auto parent = model::SpanId::from_hex(read_string(value, "parent_span_id"));
        if (!parent) {
            error = "span " + span.span_id.to_hex() + " has a malformed parent_span_id";
            return std::nullopt;
        }
        span.parent_span_id = *parent;
    }

    span.name = read_string(value, "name");
    span.service_name = read_string(value, "service_name");

    std::optional<model::Timestamp> start;
    if (!read_nanos(value, "start_time_nanos", start, error)) {
        return std::nullopt;
    }
    span.start_time = start.value_or(model::Timestamp{});
    if (!read_nanos(value, "end_time_nanos", span.end_time, error)) {
        return std::nullopt;
    }

    if (value.contains("attributes") && !attributes_from_json(value.at("attributes"), span.attributes, error)) {
        error = "span " + span.span_id.to_hex() + ": " + error;
        return std::nullopt;
    }

    if (value.contains("events") && value.at("events").is_array()) {
        for (const auto& item : value.at("events")) {
            if (!item.is_object()) {
                error = "span " + span.span_id.to_hex() + ": events must be objects";
                return std::nullopt;
            }
            model::SpanEvent event;
            event.name = read_string(item, "name");
            std::optional<model::Timestamp> at;
            if (!read_nanos(item, "timestamp_nanos", at, error)) {
                return std::nullopt;
            }
            event.timestamp = at.value_or(model::Timestamp{});
            if (item.contains("attributes") && !attributes_from_json(item.at("attributes"), event.attributes, error)) {
                error = "span " + span.span_id.to_hex() + ": " + error;
                return std::nullopt;
            }
            span.events.push_back(std::move(event));
        }
    }

    if (value.contains("status") && value.at("status").is_object()) {
        const auto& status = value.at("status");
        if (read_string(status, "code") == "error") {
            span.status = model::SpanStatus::error(read_string(status, "message"));
        }
    }
    return span;
}

DecodedSpans spans_from_json(const json& value) {
    DecodedSpans decoded;

    const json* items = &value;
    if (value.is_object() && value.contains("spans")) {
        items = &value.at("spans");
    }
    if (!items->is_array()) {
        decoded.errors.emplace_back("expected an array of spans");
        return decoded;
    }

    for (const auto& item : *items) {
        std::string error;
        auto span = span_from_json(item, error);
        if (span) {
            decoded.spans.push_back(std::move(*span));
        } else {
            decoded.errors.push_back(std::move(error));
        }
    }
    return decoded;
}

}  // namespace hindsight::core::codec
