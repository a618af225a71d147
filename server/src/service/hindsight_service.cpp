#include "hindsight/core/service/hindsight_service.hpp"

#include <stdexcept>

namespace hindsight::core::service {

HindsightService::HindsightService(std::shared_ptr<storage::TraceStore> store,
                                   std::shared_ptr<query::QueryEngine> query_engine,
                                   events::EventBroadcasterPtr broadcaster,
                                   discovery::CapabilityRegistryPtr capability_registry,
                                   std::shared_ptr<logging::Logger> logger)
    : store_(std::move(store)),
      query_engine_(std::move(query_engine)),
      broadcaster_(std::move(broadcaster)),
      capability_registry_(std::move(capability_registry)),
      logger_(std::move(logger)) {
    if (!store_ || !query_engine_ || !broadcaster_) {
        throw std::invalid_argument("hindsight service requires a store, a query engine and a broadcaster");
    }
}

IngestResult HindsightService::ingest_spans(std::vector<model::Span> spans) {
    auto report = store_->ingest(std::move(spans), [this](const storage::TraceUpdate& update) { publish(update); });

    IngestResult result;
    result.accepted = report.accepted;
    result.rejected = report.rejected;
    result.errors = std::move(report.errors);
    return result;
}

IngestResult HindsightService::ingest_spans(const session::DataSession& session, std::vector<model::Span> spans) {
    observability::SpanPtr span;
    if (session.tracer()) {
        span = session.tracer()->start_span("ingest_spans");
    }
    observability::ScopedSpan scope(span);
    if (scope) {
        scope->set_attribute("session_id", session.id());
        scope->set_attribute("batch_size", static_cast<int64_t>(spans.size()));
    }

    auto result = ingest_spans(std::move(spans));

    if (scope) {
        scope->set_attribute("accepted", static_cast<int64_t>(result.accepted));
        scope->set_attribute("rejected", static_cast<int64_t>(result.rejected));
    }
    if (logger_ && result.rejected > 0) {
        logger_->debug("[service] session", session.id(), "sent", result.rejected, "malformed spans");
    }
    return result;
}

void HindsightService::publish(const storage::TraceUpdate& update) {
    if (update.started && update.trace) {
        events::TraceStarted started;
        started.trace_id = update.trace_id;
        if (const auto* root = update.trace->root()) {
            started.root_span_name = root->name;
            started.service_name = root->service_name;
        }
        broadcaster_->publish(started);

        // Spans held back while the root was missing are announced with it.
        for (const auto& span : update.trace->spans) {
            broadcaster_->publish(events::SpanAdded{update.trace_id, span});
        }
    } else if (update.trace) {
        for (const auto& span : update.added_spans) {
            broadcaster_->publish(events::SpanAdded{update.trace_id, span});
        }
    }

    if (update.completed && update.trace) {
        broadcaster_->publish(
            events::TraceCompleted{update.trace_id, update.trace->duration_nanos(), update.trace->span_count()});
    }
}

model::TraceSnapshot HindsightService::get_trace(const model::TraceId& trace_id) const {
    return store_->get_trace(trace_id);
}

model::TraceType HindsightService::classify(const model::Trace& trace) const {
    return query_engine_->classifier()->classify(trace);
}

std::vector<trace::DependencyEdge> HindsightService::dependency_edges(const model::TraceId& trace_id) const {
    auto trace = store_->get_trace(trace_id);
    if (!trace) {
        return {};
    }
    return trace::derive_dependency_edges(*trace);
}

std::error_code HindsightService::list_traces(const query::TraceFilter& filter,
                                              std::vector<model::TraceSummary>& out) const {
    auto ec = store_->list_summaries(*query_engine_, filter, out);
    if (ec && logger_) {
        logger_->debug("[service] rejected trace filter:", ec.message());
    }
    return ec;
}

events::Subscription HindsightService::subscribe_events() {
    return broadcaster_->subscribe();
}

std::shared_future<discovery::CapabilitySet> HindsightService::discover_capabilities(
    const session::ControlSession& session) {
    if (!capability_registry_) {
        discovery::CapabilitySet empty;
        empty.session_id = session.id();
        empty.discovered_at = std::chrono::system_clock::now();
        empty.error = std::make_error_code(std::errc::not_supported);
        std::promise<discovery::CapabilitySet> ready;
        ready.set_value(std::move(empty));
        return ready.get_future().share();
    }
    return capability_registry_->discover(session);
}

std::optional<discovery::CapabilitySet> HindsightService::capabilities(const std::string& session_id) const {
    if (!capability_registry_) {
        return std::nullopt;
    }
    return capability_registry_->find(session_id);
}

}  // namespace hindsight::core::service
