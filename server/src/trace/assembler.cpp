#include "hindsight/core/trace/assembler.hpp"

#include <algorithm>
#include <deque>
#include <set>
#include <sstream>
#include <unordered_map>
#include <utility>

namespace hindsight::core::trace {
namespace {

std::string_view trim(std::string_view text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

}  // namespace

using model::Span;
using model::SpanId;
using model::SpanIdHash;
using model::Timestamp;
using model::Trace;

std::optional<Trace> TraceAssembler::assemble(const model::TraceId& trace_id, std::vector<Span> spans) const {
    spans.erase(std::remove_if(spans.begin(), spans.end(),
                               [&](const Span& span) { return span.trace_id != trace_id; }),
                spans.end());

    std::sort(spans.begin(), spans.end(), [](const Span& a, const Span& b) {
        if (a.start_time != b.start_time) {
            return a.start_time < b.start_time;
        }
        return a.span_id < b.span_id;
    });

    // Sorted order makes the earliest parentless span the root.
    auto root_it = std::find_if(spans.begin(), spans.end(), [](const Span& span) { return span.is_root(); });
    if (root_it == spans.end()) {
        return std::nullopt;
    }

    Trace trace;
    trace.trace_id = trace_id;
    trace.root_span_id = root_it->span_id;

    std::unordered_map<SpanId, std::size_t, SpanIdHash> positions;
    positions.reserve(spans.size());
    for (std::size_t i = 0; i < spans.size(); ++i) {
        positions.emplace(spans[i].span_id, i);
    }

    for (std::size_t i = 0; i < spans.size(); ++i) {
        const auto& span = spans[i];
        if (span.span_id == trace.root_span_id) {
            continue;
        }
        if (span.parent_span_id && positions.count(*span.parent_span_id) != 0) {
            trace.children_index[*span.parent_span_id].push_back(i);
        } else {
            trace.orphans.push_back(i);
        }
    }

    bool open_reachable = false;
    std::vector<bool> visited(spans.size(), false);
    std::deque<std::size_t> pending{positions.at(trace.root_span_id)};
    while (!pending.empty()) {
        auto index = pending.front();
        pending.pop_front();
        if (visited[index]) {
            continue;
        }
        visited[index] = true;
        if (spans[index].is_open()) {
            open_reachable = true;
            break;
        }
        auto children = trace.children_index.find(spans[index].span_id);
        if (children != trace.children_index.end()) {
            pending.insert(pending.end(), children->second.begin(), children->second.end());
        }
    }

    // Producer clocks are not reconciled; a child may start before its root.
    trace.start_time = root_it->start_time;
    if (!open_reachable) {
        std::optional<Timestamp> latest;
        for (const auto& span : spans) {
            if (span.end_time && (!latest || *latest < *span.end_time)) {
                latest = span.end_time;
            }
        }
        trace.end_time = latest;
    }

    trace.spans = std::move(spans);
    return trace;
}

std::vector<DependencyEdge> derive_dependency_edges(const Trace& trace, std::string_view attribute_key) {
    std::vector<DependencyEdge> edges;
    std::set<std::pair<uint64_t, uint64_t>> seen;

    for (const auto& [parent, children] : trace.children_index) {
        for (auto index : children) {
            const auto& child = trace.spans[index];
            if (seen.emplace(parent.value, child.span_id.value).second) {
                edges.push_back({parent, child.span_id, DependencyEdge::Source::parent_child});
            }
        }
    }

    for (const auto& span : trace.spans) {
        auto attr = span.attributes.find(std::string{attribute_key});
        if (attr == span.attributes.end()) {
            continue;
        }
        const auto* listed = std::get_if<std::string>(&attr->second);
        if (!listed) {
            continue;
        }

        std::istringstream stream(*listed);
        std::string item;
        while (std::getline(stream, item, ',')) {
            auto target = SpanId::from_hex(trim(item));
            if (!target || *target == span.span_id || !trace.find(*target)) {
                continue;
            }
            if (seen.emplace(span.span_id.value, target->value).second) {
                edges.push_back({span.span_id, *target, DependencyEdge::Source::attribute});
            }
        }
    }

    // children_index is unordered; sort for stable output
    std::sort(edges.begin(), edges.end(), [](const DependencyEdge& a, const DependencyEdge& b) {
        if (a.from != b.from) {
            return a.from < b.from;
        }
        return a.to < b.to;
    });
    return edges;
}

}  // namespace hindsight::core::trace
