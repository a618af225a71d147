#include "hindsight/core/service/seed_data.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace hindsight::core::service {
namespace {

constexpr uint64_t kMillis = 1'000'000;

class SeedTrace {
public:
    explicit SeedTrace(uint64_t base_nanos) : trace_id_(model::TraceId::random()), base_(base_nanos) {}

    model::SpanId add(std::optional<model::SpanId> parent,
                      std::string name,
                      std::string service,
                      uint64_t offset_ms,
                      std::optional<uint64_t> duration_ms,
                      model::Attributes attributes = {}) {
        model::Span span;
        span.trace_id = trace_id_;
        span.span_id = model::SpanId::random();
        span.parent_span_id = parent;
        span.name = std::move(name);
        span.service_name = std::move(service);
        span.start_time = model::Timestamp{base_ + offset_ms * kMillis};
        if (duration_ms) {
            span.end_time = model::Timestamp{span.start_time.nanos + *duration_ms * kMillis};
        }
        span.attributes = std::move(attributes);
        spans_.push_back(std::move(span));
        return spans_.back().span_id;
    }

    model::Span& last() { return spans_.back(); }

    void append_to(std::vector<model::Span>& out) {
        for (auto& span : spans_) {
            out.push_back(std::move(span));
        }
        spans_.clear();
    }

private:
    model::TraceId trace_id_;
    uint64_t base_;
    std::vector<model::Span> spans_;
};

model::AttributeValue str(const char* value) {
    return std::string{value};
}

model::AttributeValue num(int64_t value) {
    return value;
}

model::AttributeValue flag(bool value) {
    return value;
}

}  // namespace

std::size_t load_seed_data(HindsightService& service, model::Timestamp now) {
    std::vector<model::Span> spans;
    auto ago = [&](uint64_t seconds) { return now.nanos - seconds * 1'000'000'000ULL; };

    {
        SeedTrace t(ago(60));
        auto root = t.add(std::nullopt, "GET /api/users", "api-gateway", 0, 45,
                          {{"http.method", str("GET")}, {"http.url", str("/api/users")},
                           {"http.status_code", num(200)}});
        t.add(root, "db.query users", "api-gateway", 5, 30,
              {{"db.system", str("postgresql")}, {"db.statement", str("SELECT * FROM users LIMIT 10")}});
        t.append_to(spans);
    }

    {
        SeedTrace t(ago(50));
        auto root = t.add(std::nullopt, "POST /api/orders", "order-service", 0, 2300,
                          {{"http.method", str("POST")}, {"http.url", str("/api/orders")},
                           {"http.status_code", num(200)}});
        t.add(root, "db.transaction", "order-service", 10, 2250,
              {{"db.system", str("postgresql")}, {"db.operation", str("INSERT")}});
        model::SpanEvent wait;
        wait.name = "Waiting for lock";
        wait.timestamp = model::Timestamp{t.last().start_time.nanos + 100 * kMillis};
        wait.attributes = {{"lock.type", str("ROW EXCLUSIVE")}};
        t.last().events.push_back(std::move(wait));
        t.append_to(spans);
    }

    {
        SeedTrace t(ago(40));
        t.add(std::nullopt, "GET /api/user/999", "user-service", 0, 12,
              {{"http.method", str("GET")}, {"http.url", str("/api/user/999")},
               {"http.status_code", num(404)}, {"error", flag(true)},
               {"error.message", str("User not found")}});
        model::SpanEvent exception;
        exception.name = "exception";
        exception.timestamp = model::Timestamp{t.last().start_time.nanos + 10 * kMillis};
        exception.attributes = {{"exception.type", str("UserNotFoundException")},
                                {"exception.message", str("No user with ID 999")}};
        t.last().events.push_back(std::move(exception));
        t.last().status = model::SpanStatus::error("User not found");
        t.append_to(spans);
    }

    {
        SeedTrace t(ago(30));
        auto root = t.add(std::nullopt, "POST /api/checkout", "api-gateway", 0, 850,
                          {{"http.method", str("POST")}, {"http.url", str("/api/checkout")}});
        t.add(root, "validate_cart", "cart-service", 5, 40);
        t.add(root, "check_inventory", "inventory-service", 50, 120, {{"items.checked", num(3)}});
        t.add(root, "process_payment", "payment-service", 180, 500,
              {{"payment.provider", str("stripe")}, {"payment.amount", str("99.99")}});
        t.add(root, "create_order", "order-service", 690, 150, {{"order.id", str("ORD-12345")}});
        t.append_to(spans);
    }

    {
        SeedTrace t(ago(20));
        auto root = t.add(std::nullopt, "picante revision", "build-graph", 0, 320,
                          {{"picante.revision", num(42)}});
        auto query = t.add(root, "compile_module", "build-graph", 10, 250,
                           {{"picante.query", flag(true)}, {"picante.query_kind", str("compile_module")}});
        t.add(query, "parse_file", "build-graph", 15, 60,
              {{"picante.query", flag(true)}, {"picante.query_kind", str("parse_file")},
               {"picante.cache_hit", flag(true)}});
        t.append_to(spans);
    }

    {
        SeedTrace t(ago(10));
        auto root = t.add(std::nullopt, "rapace call Catalog.list", "storefront", 0, 35,
                          {{"rapace.service", str("Catalog")}, {"rapace.method", str("list")}});
        t.add(root, "rapace handle Catalog.list", "catalog", 3, 28,
              {{"rapace.service", str("Catalog")}, {"rapace.method", str("list")},
               {"rapace.channel_id", num(7)}});
        t.append_to(spans);
    }

    {
        SeedTrace t(ago(2));
        auto root = t.add(std::nullopt, "GET /api/search", "search-service", 0, std::nullopt,
                          {{"http.method", str("GET")}, {"search.query", str("laptop")}});
        t.add(root, "db.query products", "search-service", 4, 80,
              {{"db.system", str("elasticsearch")}});
        t.append_to(spans);
    }

    auto result = service.ingest_spans(std::move(spans));
    return result.accepted;
}

}  // namespace hindsight::core::service
