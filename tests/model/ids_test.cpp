#include <catch2/catch_test_macros.hpp>

#include <set>
#include <unordered_set>

#include "hindsight/core/model/ids.hpp"

using namespace hindsight::core::model;

TEST_CASE("TraceId hex encoding", "[model][ids]") {
    SECTION("Round trip preserves bytes") {
        auto parsed = TraceId::from_hex("4bf92f3577b34da6a3ce929d0e0e4736");
        REQUIRE(parsed.has_value());
        REQUIRE(parsed->bytes[0] == 0x4b);
        REQUIRE(parsed->bytes[15] == 0x36);
        REQUIRE(parsed->to_hex() == "4bf92f3577b34da6a3ce929d0e0e4736");
    }

    SECTION("Uppercase input is accepted and normalised") {
        auto parsed = TraceId::from_hex("4BF92F3577B34DA6A3CE929D0E0E4736");
        REQUIRE(parsed.has_value());
        REQUIRE(parsed->to_hex() == "4bf92f3577b34da6a3ce929d0e0e4736");
    }

    SECTION("Malformed input is rejected") {
        REQUIRE_FALSE(TraceId::from_hex("").has_value());
        REQUIRE_FALSE(TraceId::from_hex("4bf92f3577b34da6").has_value());
        REQUIRE_FALSE(TraceId::from_hex("zzf92f3577b34da6a3ce929d0e0e4736").has_value());
    }

    SECTION("All-zero identifier is invalid") {
        auto zero = TraceId::from_hex("00000000000000000000000000000000");
        REQUIRE(zero.has_value());
        REQUIRE_FALSE(zero->is_valid());
        REQUIRE_FALSE(TraceId{}.is_valid());
    }
}

TEST_CASE("SpanId hex encoding", "[model][ids]") {
    SpanId id{0x00f067aa0ba902b7ULL};
    REQUIRE(id.to_hex() == "00f067aa0ba902b7");

    auto parsed = SpanId::from_hex("00f067aa0ba902b7");
    REQUIRE(parsed.has_value());
    REQUIRE(*parsed == id);

    REQUIRE_FALSE(SpanId::from_hex("00f067aa0ba902b").has_value());
    REQUIRE_FALSE(SpanId::from_hex("00f067aa0ba902bg").has_value());
    REQUIRE_FALSE(SpanId{}.is_valid());
}

TEST_CASE("Random identifiers", "[model][ids]") {
    std::unordered_set<TraceId, TraceIdHash> traces;
    std::set<SpanId> spans;
    for (int i = 0; i < 64; ++i) {
        auto trace_id = TraceId::random();
        auto span_id = SpanId::random();
        REQUIRE(trace_id.is_valid());
        REQUIRE(span_id.is_valid());
        traces.insert(trace_id);
        spans.insert(span_id);
    }
    REQUIRE(traces.size() == 64);
    REQUIRE(spans.size() == 64);
}

TEST_CASE("TraceIdHash hashes raw bytes", "[model][ids]") {
    auto a = TraceId::from_hex("0af7651916cd43dd8448eb211c80319c");
    auto b = TraceId::from_hex("0af7651916cd43dd8448eb211c80319c");
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    REQUIRE(*a == *b);
    REQUIRE(TraceIdHash{}(*a) == TraceIdHash{}(*b));
}

TEST_CASE("traceparent header", "[model][ids][traceparent]") {
    SECTION("Parse a sampled header") {
        auto context = parse_traceparent("00-4bf92f3577b34da6a3ce929d0e0e4736-00f067aa0ba902b7-01");
        REQUIRE(context.has_value());
        REQUIRE(context->trace_id.to_hex() == "4bf92f3577b34da6a3ce929d0e0e4736");
        REQUIRE(context->span_id.value == 0x00f067aa0ba902b7ULL);
        REQUIRE(context->sampled());
    }

    SECTION("Format reproduces the header") {
        const std::string header = "00-4bf92f3577b34da6a3ce929d0e0e4736-00f067aa0ba902b7-00";
        auto context = parse_traceparent(header);
        REQUIRE(context.has_value());
        REQUIRE_FALSE(context->sampled());
        REQUIRE(format_traceparent(*context) == header);
    }

    SECTION("Reject malformed headers") {
        REQUIRE_FALSE(parse_traceparent("").has_value());
        REQUIRE_FALSE(parse_traceparent("01-4bf92f3577b34da6a3ce929d0e0e4736-00f067aa0ba902b7-01").has_value());
        REQUIRE_FALSE(parse_traceparent("00-00000000000000000000000000000000-00f067aa0ba902b7-01").has_value());
        REQUIRE_FALSE(parse_traceparent("00-4bf92f3577b34da6a3ce929d0e0e4736-0000000000000000-01").has_value());
        REQUIRE_FALSE(parse_traceparent("00_4bf92f3577b34da6a3ce929d0e0e4736-00f067aa0ba902b7-01").has_value());
        REQUIRE_FALSE(parse_traceparent("00-4bf92f3577b34da6a3ce929d0e0e4736-00f067aa0ba902b7-0x").has_value());
    }
}
