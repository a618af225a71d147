#include "hindsight/core/model/ids.hpp"

#include <chrono>
#include <stdexcept>

#include <openssl/rand.h>

namespace hindsight::core::model {
namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

int hex_value(char ch) {
    if (ch >= '0' && ch <= '9') return ch - '0';
    if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
    if (ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
    return -1;
}

void fill_random(uint8_t* out, std::size_t size) {
    if (RAND_bytes(out, static_cast<int>(size)) != 1) {
        throw std::runtime_error("RAND_bytes failed to produce identifier bytes");
    }
}

}  // namespace

bool TraceId::is_valid() const noexcept {
    for (auto b : bytes) {
        if (b != 0) {
            return true;
        }
    }
    return false;
}

std::string TraceId::to_hex() const {
    std::string out;
    out.reserve(bytes.size() * 2);
    for (auto b : bytes) {
        out.push_back(kHexDigits[b >> 4]);
        out.push_back(kHexDigits[b & 0x0f]);
    }
    return out;
}

std::optional<TraceId> TraceId::from_hex(std::string_view hex) {
    if (hex.size() != 32) {
        return std::nullopt;
    }
    TraceId id;
    for (std::size_t i = 0; i < id.bytes.size(); ++i) {
        int hi = hex_value(hex[i * 2]);
        int lo = hex_value(hex[i * 2 + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        id.bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return id;
}

TraceId TraceId::random() {
    TraceId id;
    do {
        fill_random(id.bytes.data(), id.bytes.size());
    } while (!id.is_valid());
    return id;
}

std::string SpanId::to_hex() const {
    std::string out(16, '0');
    for (int i = 15; i >= 0; --i) {
        out[static_cast<std::size_t>(i)] = kHexDigits[(value >> ((15 - i) * 4)) & 0x0f];
    }
    return out;
}

std::optional<SpanId> SpanId::from_hex(std::string_view hex) {
    if (hex.size() != 16) {
        return std::nullopt;
    }
    uint64_t value = 0;
    for (char ch : hex) {
        int v = hex_value(ch);
        if (v < 0) {
            return std::nullopt;
        }
        value = (value << 4) | static_cast<uint64_t>(v);
    }
    return SpanId{value};
}

SpanId SpanId::random() {
    SpanId id;
    do {
        uint8_t raw[8];
        fill_random(raw, sizeof(raw));
        id.value = 0;
        for (auto b : raw) {
            id.value = (id.value << 8) | b;
        }
    } while (!id.is_valid());
    return id;
}

Timestamp Timestamp::now() {
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return Timestamp{static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch).count())};
}

std::optional<TraceContext> parse_traceparent(std::string_view header) {
    // version(2) - trace(32) - span(16) - flags(2)
    if (header.size() != 55 || header[2] != '-' || header[35] != '-' || header[52] != '-') {
        return std::nullopt;
    }
    if (header.substr(0, 2) != "00") {
        return std::nullopt;
    }

    auto trace_id = TraceId::from_hex(header.substr(3, 32));
    auto span_id = SpanId::from_hex(header.substr(36, 16));
    int flags_hi = hex_value(header[53]);
    int flags_lo = hex_value(header[54]);
    if (!trace_id || !span_id || flags_hi < 0 || flags_lo < 0) {
        return std::nullopt;
    }
    if (!trace_id->is_valid() || !span_id->is_valid()) {
        return std::nullopt;
    }

    TraceContext context;
    context.trace_id = *trace_id;
    context.span_id = *span_id;
    context.flags = static_cast<uint8_t>((flags_hi << 4) | flags_lo);
    return context;
}

std::string format_traceparent(const TraceContext& context) {
    std::string out = "00-";
    out += context.trace_id.to_hex();
    out += '-';
    out += context.span_id.to_hex();
    out += '-';
    out.push_back(kHexDigits[context.flags >> 4]);
    out.push_back(kHexDigits[context.flags & 0x0f]);
    return out;
}

std::size_t TraceIdHash::operator()(const TraceId& id) const noexcept {
    // FNV-1a over the raw bytes
    uint64_t hash = 0xcbf29ce484222325ULL;
    for (auto b : id.bytes) {
        hash ^= static_cast<uint64_t>(b);
        hash *= 0x100000001b3ULL;
    }
    return static_cast<std::size_t>(hash);
}

}  // namespace hindsight::core::model
