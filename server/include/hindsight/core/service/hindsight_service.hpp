#pragma once

#include <cstddef>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include "hindsight/core/discovery/capability_registry.hpp"
#include "hindsight/core/events/event_broadcaster.hpp"
#include "hindsight/core/logging/logger.hpp"
#include "hindsight/core/model/trace.hpp"
#include "hindsight/core/query/query_engine.hpp"
#include "hindsight/core/session/session.hpp"
#include "hindsight/core/storage/trace_store.hpp"
#include "hindsight/core/trace/assembler.hpp"

namespace hindsight::core::service {

struct IngestResult {
    std::size_t accepted{0};
    std::size_t rejected{0};
    std::vector<std::string> errors;
};

/**
 * @brief 中枢对外暴露的操作集合，与传输层无关
 *
 * 持有进程内唯一的存储、查询、广播与发现组件（由 Application 创建并注入）。
 * 摄取路径：校验 -> 存储 upsert 与重新组装 -> 在键级锁内发布事件。
 */
class HindsightService {
public:
    HindsightService(std::shared_ptr<storage::TraceStore> store,
                     std::shared_ptr<query::QueryEngine> query_engine,
                     events::EventBroadcasterPtr broadcaster,
                     discovery::CapabilityRegistryPtr capability_registry,
                     std::shared_ptr<logging::Logger> logger);

    IngestResult ingest_spans(std::vector<model::Span> spans);
    IngestResult ingest_spans(const session::DataSession& session, std::vector<model::Span> spans);

    // nullptr when unknown, expired or still waiting for its root span
    [[nodiscard]] model::TraceSnapshot get_trace(const model::TraceId& trace_id) const;
    [[nodiscard]] model::TraceType classify(const model::Trace& trace) const;
    [[nodiscard]] std::vector<trace::DependencyEdge> dependency_edges(const model::TraceId& trace_id) const;

    std::error_code list_traces(const query::TraceFilter& filter, std::vector<model::TraceSummary>& out) const;

    [[nodiscard]] events::Subscription subscribe_events();

    std::shared_future<discovery::CapabilitySet> discover_capabilities(const session::ControlSession& session);
    [[nodiscard]] std::optional<discovery::CapabilitySet> capabilities(const std::string& session_id) const;

    [[nodiscard]] std::string ping() const { return "pong"; }

    [[nodiscard]] const std::shared_ptr<storage::TraceStore>& store() const noexcept { return store_; }
    [[nodiscard]] const events::EventBroadcasterPtr& broadcaster() const noexcept { return broadcaster_; }

private:
    void publish(const storage::TraceUpdate& update);

    std::shared_ptr<storage::TraceStore> store_;
    std::shared_ptr<query::QueryEngine> query_engine_;
    events::EventBroadcasterPtr broadcaster_;
    discovery::CapabilityRegistryPtr capability_registry_;
    std::shared_ptr<logging::Logger> logger_;
};

using HindsightServicePtr = std::shared_ptr<HindsightService>;

}  // namespace hindsight::core::service
