#include "hindsight/core/model/trace.hpp"

#include <algorithm>

namespace hindsight::core::model {

const Span* Trace::root() const {
    return find(root_span_id);
}

const Span* Trace::find(const SpanId& span_id) const {
    auto it = std::find_if(spans.begin(), spans.end(),
                           [&](const Span& span) { return span.span_id == span_id; });
    return it == spans.end() ? nullptr : &*it;
}

std::vector<const Span*> Trace::children_of(const SpanId& span_id) const {
    std::vector<const Span*> children;
    auto it = children_index.find(span_id);
    if (it == children_index.end()) {
        return children;
    }
    children.reserve(it->second.size());
    for (auto index : it->second) {
        children.push_back(&spans[index]);
    }
    return children;
}

std::vector<const Span*> Trace::orphan_spans() const {
    std::vector<const Span*> result;
    result.reserve(orphans.size());
    for (auto index : orphans) {
        result.push_back(&spans[index]);
    }
    return result;
}

std::size_t Trace::error_count() const {
    return static_cast<std::size_t>(
        std::count_if(spans.begin(), spans.end(), [](const Span& span) { return span.status.is_error(); }));
}

std::optional<uint64_t> Trace::duration_nanos() const {
    if (!end_time) {
        return std::nullopt;
    }
    if (end_time->nanos < start_time.nanos) {
        return 0;
    }
    return end_time->nanos - start_time.nanos;
}

std::string TraceType::to_string() const {
    switch (kind_) {
        case Kind::generic:   return "Generic";
        case Kind::framework: return "Framework(" + framework_ + ")";
        case Kind::mixed:     return "Mixed";
    }
    return "Generic";
}

}  // namespace hindsight::core::model
