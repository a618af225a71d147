#include <catch2/catch_test_macros.hpp>

#include "hindsight/core/query/query_engine.hpp"
#include "hindsight/core/trace/assembler.hpp"
#include "support/test_support.hpp"

using namespace hindsight::core;
using hindsight::test::make_span;
using hindsight::test::trace_id_of;

namespace {

model::TraceSnapshot build(const model::TraceId& trace_id,
                           uint64_t start,
                           std::optional<uint64_t> end,
                           const std::string& service = "checkout",
                           bool failed = false) {
    auto root = make_span(trace_id, 1, std::nullopt, "root", start, end, service);
    if (failed) {
        root.status = model::SpanStatus::error("boom");
    }
    trace::TraceAssembler assembler;
    return std::make_shared<const model::Trace>(*assembler.assemble(trace_id, {root}));
}

model::TraceId numbered(std::size_t n) {
    model::TraceId id;
    id.bytes[0] = 0x4b;
    id.bytes[14] = static_cast<uint8_t>(n >> 8);
    id.bytes[15] = static_cast<uint8_t>(n & 0xff);
    return id;
}

}  // namespace

TEST_CASE("Query results are newest first", "[query]") {
    query::QueryEngine engine(trace::TraceClassifier::with_prefix_rules({"picante"}));
    std::vector<model::TraceSnapshot> traces{
        build(trace_id_of(1), 100, 200),
        build(trace_id_of(2), 300, 400),
        build(trace_id_of(3), 200, 250),
    };

    std::vector<model::TraceSummary> out;
    REQUIRE_FALSE(engine.run(traces, {}, out));
    REQUIRE(out.size() == 3);
    REQUIRE(out[0].trace_id == trace_id_of(2));
    REQUIRE(out[1].trace_id == trace_id_of(3));
    REQUIRE(out[2].trace_id == trace_id_of(1));

    SECTION("Equal start times order by trace id") {
        traces.push_back(build(trace_id_of(9), 300, 310));
        traces.push_back(build(trace_id_of(0x07), 300, 320));
        REQUIRE_FALSE(engine.run(traces, {}, out));
        REQUIRE(out[0].trace_id == trace_id_of(2));
        REQUIRE(out[1].trace_id == trace_id_of(7));
        REQUIRE(out[2].trace_id == trace_id_of(9));
    }
}

TEST_CASE("Query limit is capped", "[query][limit]") {
    query::QueryEngine engine(nullptr);
    REQUIRE(engine.max_limit() == 100);

    std::vector<model::TraceSnapshot> traces;
    for (std::size_t i = 0; i < 150; ++i) {
        traces.push_back(build(numbered(i + 1), 1000 + i, 2000 + i));
    }

    std::vector<model::TraceSummary> out;

    SECTION("Default limit returns the hundred newest") {
        REQUIRE_FALSE(engine.run(traces, {}, out));
        REQUIRE(out.size() == 100);
        REQUIRE(out.front().start_time.nanos == 1149);
        REQUIRE(out.back().start_time.nanos == 1050);
    }

    SECTION("Larger request is clamped") {
        query::TraceFilter filter;
        filter.limit = 500;
        REQUIRE_FALSE(engine.run(traces, filter, out));
        REQUIRE(out.size() == 100);
    }

    SECTION("Smaller request is honoured") {
        query::TraceFilter filter;
        filter.limit = 5;
        REQUIRE_FALSE(engine.run(traces, filter, out));
        REQUIRE(out.size() == 5);
        REQUIRE(out.front().start_time.nanos == 1149);
    }
}

TEST_CASE("Query filters", "[query][filter]") {
    query::QueryEngine engine(nullptr);
    std::vector<model::TraceSnapshot> traces{
        build(trace_id_of(1), 100, 150, "api-gateway"),
        build(trace_id_of(2), 200, 2200, "order-service"),
        build(trace_id_of(3), 300, 400, "api-gateway", true),
        build(trace_id_of(4), 400, std::nullopt, "api-gateway"),
    };
    std::vector<model::TraceSummary> out;

    SECTION("Service name matches the root span") {
        query::TraceFilter filter;
        filter.service_name = "api-gateway";
        REQUIRE_FALSE(engine.run(traces, filter, out));
        REQUIRE(out.size() == 3);
    }

    SECTION("Duration bounds are inclusive and skip open traces") {
        query::TraceFilter filter;
        filter.min_duration_nanos = 50;
        filter.max_duration_nanos = 100;
        REQUIRE_FALSE(engine.run(traces, filter, out));
        REQUIRE(out.size() == 2);
        REQUIRE(out[0].trace_id == trace_id_of(3));
        REQUIRE(out[1].trace_id == trace_id_of(1));

        query::TraceFilter slow;
        slow.min_duration_nanos = 1000;
        REQUIRE_FALSE(engine.run(traces, slow, out));
        REQUIRE(out.size() == 1);
        REQUIRE(out[0].trace_id == trace_id_of(2));
    }

    SECTION("Error filter") {
        query::TraceFilter filter;
        filter.has_errors = true;
        REQUIRE_FALSE(engine.run(traces, filter, out));
        REQUIRE(out.size() == 1);
        REQUIRE(out[0].error_count == 1);

        filter.has_errors = false;
        REQUIRE_FALSE(engine.run(traces, filter, out));
        REQUIRE(out.size() == 3);
    }

    SECTION("Open traces are listed without a duration") {
        REQUIRE_FALSE(engine.run(traces, {}, out));
        REQUIRE(out.size() == 4);
        REQUIRE(out[0].trace_id == trace_id_of(4));
        REQUIRE_FALSE(out[0].duration_nanos.has_value());
    }
}

TEST_CASE("Invalid filters are rejected", "[query][filter]") {
    query::QueryEngine engine(nullptr);
    std::vector<model::TraceSnapshot> traces{build(trace_id_of(1), 100, 150)};
    std::vector<model::TraceSummary> out{model::TraceSummary{}};

    query::TraceFilter inverted;
    inverted.min_duration_nanos = 10;
    inverted.max_duration_nanos = 5;
    REQUIRE(engine.run(traces, inverted, out) == std::errc::invalid_argument);
    REQUIRE(out.empty());

    query::TraceFilter zero;
    zero.limit = 0;
    REQUIRE(query::validate(zero) == std::errc::invalid_argument);
}

TEST_CASE("Summaries carry classification", "[query][classifier]") {
    auto classifier = trace::TraceClassifier::with_prefix_rules({"picante", "rapace"});
    query::QueryEngine engine(classifier);

    auto trace_id = trace_id_of(1);
    auto root = make_span(trace_id, 1, std::nullopt, "GET /api", 100, 500, "api-gateway");
    auto child = make_span(trace_id, 2, 1, "query", 150, 300, "db");
    child.attributes["picante.query"] = model::AttributeValue{true};
    child.status = model::SpanStatus::error("timeout");

    trace::TraceAssembler assembler;
    auto trace = std::make_shared<const model::Trace>(*assembler.assemble(trace_id, {root, child}));

    std::vector<model::TraceSummary> out;
    REQUIRE_FALSE(engine.run({trace}, {}, out));
    REQUIRE(out.size() == 1);
    REQUIRE(out[0].root_span_name == "GET /api");
    REQUIRE(out[0].service_name == "api-gateway");
    REQUIRE(out[0].span_count == 2);
    REQUIRE(out[0].error_count == 1);
    REQUIRE(out[0].duration_nanos == std::optional<uint64_t>{400});
    REQUIRE(out[0].trace_type == model::TraceType::framework("picante"));

    classifier->add_rule(trace::key_prefix_rule("db", "picante."));
    REQUIRE_FALSE(engine.run({trace}, {}, out));
    REQUIRE(out[0].trace_type == model::TraceType::mixed());
}
