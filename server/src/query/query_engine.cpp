#include "hindsight/core/query/query_engine.hpp"

#include <algorithm>

namespace hindsight::core::query {

std::error_code validate(const TraceFilter& filter) {
    if (filter.min_duration_nanos && filter.max_duration_nanos &&
        *filter.min_duration_nanos > *filter.max_duration_nanos) {
        return std::make_error_code(std::errc::invalid_argument);
    }
    if (filter.limit && *filter.limit == 0) {
        return std::make_error_code(std::errc::invalid_argument);
    }
    return {};
}

QueryEngine::QueryEngine(trace::TraceClassifierPtr classifier, std::size_t max_limit)
    : classifier_(std::move(classifier)), max_limit_(max_limit == 0 ? kDefaultMaxLimit : max_limit) {
    if (!classifier_) {
        classifier_ = std::make_shared<trace::TraceClassifier>();
    }
}

bool QueryEngine::matches(const model::Trace& trace, const TraceFilter& filter) const {
    if (filter.service_name) {
        const auto* root = trace.root();
        if (!root || root->service_name != *filter.service_name) {
            return false;
        }
    }

    if (filter.min_duration_nanos || filter.max_duration_nanos) {
        auto duration = trace.duration_nanos();
        if (!duration) {
            return false;
        }
        if (filter.min_duration_nanos && *duration < *filter.min_duration_nanos) {
            return false;
        }
        if (filter.max_duration_nanos && *duration > *filter.max_duration_nanos) {
            return false;
        }
    }

    if (filter.has_errors && (trace.error_count() > 0) != *filter.has_errors) {
        return false;
    }
    return true;
}

model::TraceSummary QueryEngine::summarize(const model::Trace& trace) const {
    model::TraceSummary summary;
    summary.trace_id = trace.trace_id;
    if (const auto* root = trace.root()) {
        summary.root_span_name = root->name;
        summary.service_name = root->service_name;
    }
    summary.start_time = trace.start_time;
    summary.duration_nanos = trace.duration_nanos();
    summary.span_count = trace.span_count();
    summary.error_count = trace.error_count();
    summary.trace_type = classifier_->classify(trace);
    return summary;
}

std::error_code QueryEngine::run(std::vector<model::TraceSnapshot> traces,
                                 const TraceFilter& filter,
                                 std::vector<model::TraceSummary>& out) const {
    out.clear();
    if (auto ec = validate(filter)) {
        return ec;
    }

    traces.erase(std::remove_if(traces.begin(), traces.end(),
                                [&](const model::TraceSnapshot& trace) { return !trace || !matches(*trace, filter); }),
                 traces.end());

    std::sort(traces.begin(), traces.end(), [](const model::TraceSnapshot& lhs, const model::TraceSnapshot& rhs) {
        if (lhs->start_time != rhs->start_time) {
            return lhs->start_time > rhs->start_time;
        }
        return lhs->trace_id < rhs->trace_id;
    });

    auto limit = std::min(filter.limit.value_or(max_limit_), max_limit_);
    if (traces.size() > limit) {
        traces.resize(limit);
    }

    out.reserve(traces.size());
    for (const auto& trace : traces) {
        out.push_back(summarize(*trace));
    }
    return {};
}

}  // namespace hindsight::core::query
