#include "hindsight/core/storage/trace_store.hpp"

#include <map>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <unordered_map>

#include "hindsight/core/query/query_engine.hpp"

namespace hindsight::core::storage {

using model::Span;
using model::SpanId;
using model::TraceId;
using model::TraceIdHash;

struct TraceStore::Entry {
    std::mutex mutex;
    std::map<SpanId, Span> spans;
    model::TraceSnapshot trace;
    util::Clock::time_point last_write{};
    bool started{false};
    bool completed{false};
    // Set under `mutex` when the sweeper unlinks the entry; writers that
    // raced the sweep retry against a fresh entry.
    bool removed{false};
};

struct TraceStore::Shard {
    mutable std::shared_mutex mutex;
    std::unordered_map<TraceId, std::shared_ptr<Entry>, TraceIdHash> entries;
};

TraceStore::TraceStore(StoreOptions options, util::ClockPtr clock, std::shared_ptr<logging::Logger> logger)
    : options_(options), clock_(std::move(clock)), logger_(std::move(logger)) {
    if (!clock_) {
        throw std::invalid_argument("trace store requires a clock");
    }
    if (options_.shard_count == 0) {
        options_.shard_count = 1;
    }
    shards_.reserve(options_.shard_count);
    for (std::size_t i = 0; i < options_.shard_count; ++i) {
        shards_.push_back(std::make_unique<Shard>());
    }
}

TraceStore::~TraceStore() = default;

TraceStore::Shard& TraceStore::shard_for(const TraceId& trace_id) const {
    return *shards_[TraceIdHash{}(trace_id) % shards_.size()];
}

bool TraceStore::expired(const Entry& entry, util::Clock::time_point now) const {
    return now - entry.last_write >= options_.ttl;
}

std::shared_ptr<TraceStore::Entry> TraceStore::acquire_entry(const TraceId& trace_id) {
    auto& shard = shard_for(trace_id);
    {
        std::shared_lock lock(shard.mutex);
        auto it = shard.entries.find(trace_id);
        if (it != shard.entries.end()) {
            return it->second;
        }
    }

    std::unique_lock lock(shard.mutex);
    auto& slot = shard.entries[trace_id];
    if (!slot) {
        slot = std::make_shared<Entry>();
    }
    return slot;
}

IngestReport TraceStore::ingest(std::vector<Span> spans, const UpdateObserver& observer) {
    IngestReport report;

    std::vector<TraceId> order;
    std::unordered_map<TraceId, std::vector<Span>, TraceIdHash> groups;
    for (auto& span : spans) {
        auto reason = model::validate_span(span);
        if (!reason.empty()) {
            ++report.rejected;
            report.errors.push_back(std::move(reason));
            continue;
        }
        ++report.accepted;
        auto& group = groups[span.trace_id];
        if (group.empty()) {
            order.push_back(span.trace_id);
        }
        group.push_back(std::move(span));
    }

    for (const auto& trace_id : order) {
        apply(trace_id, std::move(groups[trace_id]), observer, report);
    }
    report.traces_touched = order.size();

    if (logger_ && report.rejected > 0) {
        logger_->warn("[store] rejected", report.rejected, "of", report.accepted + report.rejected, "spans");
    }
    return report;
}

void TraceStore::apply(const TraceId& trace_id,
                       std::vector<Span> spans,
                       const UpdateObserver& observer,
                       IngestReport& report) {
    for (;;) {
        auto entry = acquire_entry(trace_id);
        std::unique_lock lock(entry->mutex);
        if (entry->removed) {
            continue;
        }

        auto now = clock_->now();
        if (!entry->spans.empty() && expired(*entry, now)) {
            // Expired but not yet swept: start over as a brand-new trace.
            entry->spans.clear();
            entry->trace.reset();
            entry->started = false;
            entry->completed = false;
        }

        for (const auto& span : spans) {
            entry->spans.insert_or_assign(span.span_id, span);
        }
        entry->last_write = now;

        std::vector<Span> known;
        known.reserve(entry->spans.size());
        for (const auto& [_, span] : entry->spans) {
            known.push_back(span);
        }

        TraceUpdate update;
        update.trace_id = trace_id;
        update.added_spans = std::move(spans);

        if (auto assembled = assembler_.assemble(trace_id, std::move(known))) {
            entry->trace = std::make_shared<const model::Trace>(std::move(*assembled));
            ++report.traces_assembled;
            if (!entry->started) {
                entry->started = true;
                update.started = true;
            }
            if (entry->trace->is_complete() && !entry->completed) {
                entry->completed = true;
                update.completed = true;
            }
        }
        update.trace = entry->trace;

        if (observer) {
            observer(update);
        }
        return;
    }
}

model::TraceSnapshot TraceStore::get_trace(const TraceId& trace_id) const {
    std::shared_ptr<Entry> entry;
    {
        auto& shard = shard_for(trace_id);
        std::shared_lock lock(shard.mutex);
        auto it = shard.entries.find(trace_id);
        if (it == shard.entries.end()) {
            return nullptr;
        }
        entry = it->second;
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    if (entry->removed || expired(*entry, clock_->now())) {
        return nullptr;
    }
    return entry->trace;
}

std::vector<model::TraceSnapshot> TraceStore::snapshot() const {
    std::vector<model::TraceSnapshot> traces;
    auto now = clock_->now();
    for (const auto& shard : shards_) {
        std::shared_lock lock(shard->mutex);
        traces.reserve(traces.size() + shard->entries.size());
        for (const auto& [_, entry] : shard->entries) {
            std::lock_guard<std::mutex> entry_lock(entry->mutex);
            if (entry->trace && !expired(*entry, now)) {
                traces.push_back(entry->trace);
            }
        }
    }
    return traces;
}

std::error_code TraceStore::list_summaries(const query::QueryEngine& engine,
                                           const query::TraceFilter& filter,
                                           std::vector<model::TraceSummary>& out) const {
    return engine.run(snapshot(), filter, out);
}

std::size_t TraceStore::sweep_expired() {
    std::size_t removed = 0;
    auto now = clock_->now();

    for (auto& shard : shards_) {
        std::vector<TraceId> candidates;
        {
            std::shared_lock lock(shard->mutex);
            for (const auto& [trace_id, entry] : shard->entries) {
                // A busy entry is being written right now, so it is not idle.
                std::unique_lock<std::mutex> entry_lock(entry->mutex, std::try_to_lock);
                if (entry_lock.owns_lock() && expired(*entry, now)) {
                    candidates.push_back(trace_id);
                }
            }
        }
        if (candidates.empty()) {
            continue;
        }

        std::unique_lock lock(shard->mutex);
        for (const auto& trace_id : candidates) {
            auto it = shard->entries.find(trace_id);
            if (it == shard->entries.end()) {
                continue;
            }
            auto entry = it->second;
            std::unique_lock<std::mutex> entry_lock(entry->mutex, std::try_to_lock);
            if (!entry_lock.owns_lock() || !expired(*entry, now)) {
                continue;
            }
            entry->removed = true;
            shard->entries.erase(it);
            ++removed;
        }
    }

    if (removed > 0) {
        evicted_total_.fetch_add(removed);
        if (logger_) {
            logger_->debug("[store] evicted", removed, "expired traces");
        }
    }
    return removed;
}

StoreStats TraceStore::stats() const {
    StoreStats stats;
    auto now = clock_->now();
    for (const auto& shard : shards_) {
        std::shared_lock lock(shard->mutex);
        for (const auto& [_, entry] : shard->entries) {
            std::lock_guard<std::mutex> entry_lock(entry->mutex);
            if (expired(*entry, now)) {
                continue;
            }
            if (entry->trace) {
                ++stats.traces;
            } else {
                ++stats.incomplete_traces;
            }
            stats.spans += entry->spans.size();
        }
    }
    stats.evicted_total = evicted_total_.load();
    return stats;
}

}  // namespace hindsight::core::storage
