#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace hindsight::core::model {

/**
 * @brief 128 位追踪标识 (W3C Trace Context)
 *
 * 相等与哈希均按原始字节计算；全零值视为无效。
 */
struct TraceId {
    std::array<uint8_t, 16> bytes{};

    [[nodiscard]] bool is_valid() const noexcept;
    [[nodiscard]] std::string to_hex() const;

    static std::optional<TraceId> from_hex(std::string_view hex);
    static TraceId random();

    bool operator==(const TraceId& other) const noexcept { return bytes == other.bytes; }
    bool operator!=(const TraceId& other) const noexcept { return bytes != other.bytes; }
    bool operator<(const TraceId& other) const noexcept { return bytes < other.bytes; }
};

/**
 * @brief 64 位跨度标识，在所属 trace 内唯一；0 表示无效
 */
struct SpanId {
    uint64_t value{0};

    [[nodiscard]] bool is_valid() const noexcept { return value != 0; }
    [[nodiscard]] std::string to_hex() const;

    static std::optional<SpanId> from_hex(std::string_view hex);
    static SpanId random();

    bool operator==(const SpanId& other) const noexcept { return value == other.value; }
    bool operator!=(const SpanId& other) const noexcept { return value != other.value; }
    bool operator<(const SpanId& other) const noexcept { return value < other.value; }
};

/**
 * @brief 生产者提供的墙钟时间，单位为自 UNIX 纪元起的纳秒，不做时钟偏移校正
 */
struct Timestamp {
    uint64_t nanos{0};

    static Timestamp now();

    bool operator==(const Timestamp& other) const noexcept { return nanos == other.nanos; }
    bool operator!=(const Timestamp& other) const noexcept { return nanos != other.nanos; }
    bool operator<(const Timestamp& other) const noexcept { return nanos < other.nanos; }
    bool operator<=(const Timestamp& other) const noexcept { return nanos <= other.nanos; }
    bool operator>(const Timestamp& other) const noexcept { return nanos > other.nanos; }
};

/**
 * @brief traceparent 头部解析结果
 */
struct TraceContext {
    TraceId trace_id;
    SpanId span_id;
    uint8_t flags{0};

    [[nodiscard]] bool sampled() const noexcept { return (flags & 0x01) != 0; }
};

// "00-<32 hex trace id>-<16 hex span id>-<2 hex flags>"
std::optional<TraceContext> parse_traceparent(std::string_view header);
std::string format_traceparent(const TraceContext& context);

struct TraceIdHash {
    std::size_t operator()(const TraceId& id) const noexcept;
};

struct SpanIdHash {
    std::size_t operator()(const SpanId& id) const noexcept {
        return std::hash<uint64_t>{}(id.value);
    }
};

}  // namespace hindsight::core::model
