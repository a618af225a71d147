#include <catch2/catch_test_macros.hpp>

#include "hindsight/core/codec/json_codec.hpp"
#include "hindsight/core/query/query_engine.hpp"
#include "hindsight/core/trace/assembler.hpp"
#include "support/test_support.hpp"

using namespace hindsight::core;
using hindsight::test::make_span;
using hindsight::test::trace_id_of;

TEST_CASE("Span encoding", "[codec][json]") {
    auto span = make_span(trace_id_of(1), 2, 1, "load_orders", 100, 400, "order-service");
    span.attributes["http.status_code"] = model::AttributeValue{int64_t{200}};
    span.attributes["cache.hit"] = model::AttributeValue{false};
    span.events.push_back({"retry", model::Timestamp{150}, {}});
    span.status = model::SpanStatus::error("deadline exceeded");

    auto encoded = codec::to_json(span);
    REQUIRE(encoded["trace_id"] == trace_id_of(1).to_hex());
    REQUIRE(encoded["span_id"] == "0000000000000002");
    REQUIRE(encoded["parent_span_id"] == "0000000000000001");
    REQUIRE(encoded["duration_nanos"] == 300);
    REQUIRE(encoded["status"]["code"] == "error");
    REQUIRE(encoded["status"]["message"] == "deadline exceeded");
    REQUIRE(encoded["events"].size() == 1);
    REQUIRE(encoded["events"][0]["timestamp_nanos"] == 150);

    // attributes are an ordered key/value list
    REQUIRE(encoded["attributes"].size() == 2);
    REQUIRE(encoded["attributes"][0]["key"] == "cache.hit");
    REQUIRE(encoded["attributes"][0]["value"] == false);
    REQUIRE(encoded["attributes"][1]["value"] == 200);

    span.end_time.reset();
    span.parent_span_id.reset();
    auto open = codec::to_json(span);
    REQUIRE(open["parent_span_id"].is_null());
    REQUIRE(open["end_time_nanos"].is_null());
    REQUIRE(open["duration_nanos"].is_null());
}

TEST_CASE("Summary listing shape", "[codec][json]") {
    auto trace_id = trace_id_of(2);
    auto child = make_span(trace_id, 2, 1, "query", 20, 80);
    child.attributes["rapace.method"] = model::AttributeValue{std::string{"list"}};

    trace::TraceAssembler assembler;
    auto trace = std::make_shared<const model::Trace>(
        *assembler.assemble(trace_id, {make_span(trace_id, 1, std::nullopt, "GET /", 10, 100), child}));

    query::QueryEngine engine(trace::TraceClassifier::with_prefix_rules({"rapace"}));
    std::vector<model::TraceSummary> summaries;
    REQUIRE_FALSE(engine.run({trace}, {}, summaries));

    auto listing = codec::summaries_to_json(summaries);
    REQUIRE(listing["total"] == 1);
    REQUIRE(listing["traces"].size() == 1);
    const auto& entry = listing["traces"][0];
    REQUIRE(entry["root_span_name"] == "GET /");
    REQUIRE(entry["span_count"] == 2);
    REQUIRE(entry["duration_nanos"] == 90);
    REQUIRE(entry["trace_type"] == "Framework(rapace)");

    auto detail = codec::to_json(*trace, engine.classifier()->classify(*trace));
    REQUIRE(detail["root_span_id"] == "0000000000000001");
    REQUIRE(detail["spans"].size() == 2);
    REQUIRE(detail["trace_type"] == "Framework(rapace)");
}

TEST_CASE("Event encoding", "[codec][json]") {
    auto started = codec::to_json(events::TraceEvent{events::TraceStarted{trace_id_of(3), "root", "svc"}});
    REQUIRE(started["type"] == "trace_started");
    REQUIRE(started["service_name"] == "svc");

    auto completed = codec::to_json(events::TraceEvent{events::TraceCompleted{trace_id_of(3), std::nullopt, 4}});
    REQUIRE(completed["type"] == "trace_completed");
    REQUIRE(completed["duration_nanos"].is_null());
    REQUIRE(completed["span_count"] == 4);

    auto added = codec::to_json(
        events::TraceEvent{events::SpanAdded{trace_id_of(3), make_span(trace_id_of(3), 5, 1, "x", 1, 2)}});
    REQUIRE(added["type"] == "span_added");
    REQUIRE(added["span"]["span_id"] == "0000000000000005");
}

TEST_CASE("Span decoding", "[codec][json]") {
    std::string error;

    SECTION("Object attributes") {
        auto value = codec::json::parse(R"({
            "trace_id": "4bf92f3577b34da6a3ce929d0e0e4736",
            "span_id": "00f067aa0ba902b7",
            "parent_span_id": null,
            "name": "GET /api",
            "service_name": "api-gateway",
            "start_time_nanos": 1000,
            "end_time_nanos": 5000,
            "attributes": {"http.method": "GET", "http.status_code": 200, "ratio": 0.5, "picante.query": true},
            "status": {"code": "error", "message": "boom"}
        })");
        auto span = codec::span_from_json(value, error);
        REQUIRE(span.has_value());
        REQUIRE(span->is_root());
        REQUIRE(span->end_time->nanos == 5000);
        REQUIRE(std::get<std::string>(span->attributes.at("http.method")) == "GET");
        REQUIRE(std::get<int64_t>(span->attributes.at("http.status_code")) == 200);
        REQUIRE(std::get<double>(span->attributes.at("ratio")) == 0.5);
        REQUIRE(std::get<bool>(span->attributes.at("picante.query")));
        REQUIRE(span->status.is_error());
    }

    SECTION("Encoded span decodes to the same fields") {
        auto original = make_span(trace_id_of(4), 9, 3, "op", 10, 20, "svc");
        original.attributes["n"] = model::AttributeValue{int64_t{-7}};
        auto span = codec::span_from_json(codec::to_json(original), error);
        REQUIRE(span.has_value());
        REQUIRE(span->parent_span_id == std::optional<model::SpanId>{model::SpanId{3}});
        REQUIRE(std::get<int64_t>(span->attributes.at("n")) == -7);
        REQUIRE(span->service_name == "svc");
    }

    SECTION("Rejections") {
        REQUIRE_FALSE(codec::span_from_json(codec::json::array(), error).has_value());
        REQUIRE_FALSE(codec::span_from_json(codec::json::parse(R"({"trace_id": "xyz", "span_id": "00f067aa0ba902b7"})"),
                                            error)
                          .has_value());
        REQUIRE(error.find("trace_id") != std::string::npos);

        auto nested = codec::json::parse(R"({
            "trace_id": "4bf92f3577b34da6a3ce929d0e0e4736",
            "span_id": "00f067aa0ba902b7",
            "attributes": {"tags": ["a", "b"]}
        })");
        REQUIRE_FALSE(codec::span_from_json(nested, error).has_value());
        REQUIRE(error.find("tags") != std::string::npos);

        auto huge = codec::json::parse(R"({
            "trace_id": "4bf92f3577b34da6a3ce929d0e0e4736",
            "span_id": "00f067aa0ba902b7",
            "attributes": {"big": 18446744073709551615}
        })");
        REQUIRE_FALSE(codec::span_from_json(huge, error).has_value());

        auto negative = codec::json::parse(R"({
            "trace_id": "4bf92f3577b34da6a3ce929d0e0e4736",
            "span_id": "00f067aa0ba902b7",
            "start_time_nanos": -5
        })");
        REQUIRE_FALSE(codec::span_from_json(negative, error).has_value());
    }
}

TEST_CASE("Batch decoding keeps good spans", "[codec][json]") {
    auto batch = codec::json::parse(R"({"spans": [
        {"trace_id": "4bf92f3577b34da6a3ce929d0e0e4736", "span_id": "0000000000000001", "start_time_nanos": 1},
        {"trace_id": "4bf92f3577b34da6a3ce929d0e0e4736", "span_id": "bad"},
        {"trace_id": "4bf92f3577b34da6a3ce929d0e0e4736", "span_id": "0000000000000002",
         "parent_span_id": "0000000000000001", "attributes": [{"key": "k", "value": "v"}]}
    ]})");

    auto decoded = codec::spans_from_json(batch);
    REQUIRE(decoded.spans.size() == 2);
    REQUIRE(decoded.errors.size() == 1);
    REQUIRE(std::get<std::string>(decoded.spans[1].attributes.at("k")) == "v");

    auto wrong = codec::spans_from_json(codec::json::parse(R"({"spans": 3})"));
    REQUIRE(wrong.spans.empty());
    REQUIRE(wrong.errors.size() == 1);
}
