#include "hindsight/core/logging/config.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "hindsight/core/config/configuration.hpp"

namespace hindsight::core::logging {

namespace {

constexpr int kMaxSinks = 16;

std::string lowercase(const std::string& str) {
    std::string lower;
    lower.reserve(str.size());
    std::transform(str.begin(), str.end(), std::back_inserter(lower),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

LogFormat format_from_string(const std::string& str) {
    auto lower = lowercase(str);
    if (lower == "json") return LogFormat::Json;
    if (lower == "custom") return LogFormat::Custom;
    return LogFormat::Simple;
}

SinkType sink_type_from_string(const std::string& str) {
    auto lower = lowercase(str);
    if (lower == "file") return SinkType::File;
    if (lower == "rotating_file" || lower == "rotating") return SinkType::RotatingFile;
    if (lower == "daily_file" || lower == "daily") return SinkType::DailyFile;
    return SinkType::Console;
}

// "10MB", "512KB", "1GB" or a plain byte count; 0 on failure.
std::size_t parse_size(const std::string& str) {
    std::size_t pos = 0;
    while (pos < str.size() && std::isdigit(static_cast<unsigned char>(str[pos]))) {
        ++pos;
    }
    if (pos == 0) {
        return 0;
    }

    std::size_t value = 0;
    try {
        value = static_cast<std::size_t>(std::stoull(str.substr(0, pos)));
    } catch (const std::exception&) {
        return 0;
    }

    auto unit = lowercase(config::Configuration::trim(str.substr(pos)));
    if (unit.empty() || unit == "b") return value;
    if (unit == "kb" || unit == "k") return value * 1024;
    if (unit == "mb" || unit == "m") return value * 1024 * 1024;
    if (unit == "gb" || unit == "g") return value * 1024 * 1024 * 1024;
    return 0;
}

}  // namespace

Level level_from_string(const std::string& str) {
    auto lower = lowercase(str);
    if (lower == "trace") return Level::trace;
    if (lower == "debug") return Level::debug;
    if (lower == "info") return Level::info;
    if (lower == "warn" || lower == "warning") return Level::warn;
    if (lower == "error") return Level::error;
    if (lower == "critical") return Level::critical;
    return Level::info;
}

LogConfig LogConfig::default_config() {
    LogConfig config;
    config.add_default_sinks();
    return config;
}

LogConfig LogConfig::from_toml(const config::Configuration& config) {
    LogConfig log_config;

    if (config.contains("logging.level")) {
        log_config.level = level_from_string(config.get_string("logging.level"));
    }
    if (config.contains("logging.format")) {
        log_config.format = format_from_string(config.get_string("logging.format"));
    }
    if (config.contains("logging.pattern")) {
        log_config.pattern = config.get_string("logging.pattern");
    }
    log_config.async = config.get_bool("logging.async", log_config.async);
    log_config.queue_size = static_cast<std::size_t>(
        config.get_uint64("logging.queue_size", log_config.queue_size));
    log_config.flush_interval = std::chrono::seconds(
        config.get_int("logging.flush_interval", static_cast<int>(log_config.flush_interval.count())));

    // [[logging.sinks]] tables are flattened to logging.sinks[i].*
    for (int i = 0; i < kMaxSinks; ++i) {
        std::string prefix = "logging.sinks[" + std::to_string(i) + "]";
        if (!config.contains(prefix + ".type")) {
            break;
        }

        SinkConfig sink;
        sink.type = sink_type_from_string(config.get_string(prefix + ".type"));
        sink.enabled = config.get_bool(prefix + ".enabled", true);
        sink.level = config.contains(prefix + ".level")
                         ? level_from_string(config.get_string(prefix + ".level"))
                         : log_config.level;
        sink.path = config.get_string(prefix + ".path");
        if (config.contains(prefix + ".max_size")) {
            sink.max_size = parse_size(config.get_string(prefix + ".max_size"));
        }
        sink.max_files = static_cast<std::size_t>(
            config.get_int(prefix + ".max_files", static_cast<int>(sink.max_files)));
        sink.rotation_time = config.get_string(prefix + ".rotation_time", sink.rotation_time);
        sink.pattern = config.get_string(prefix + ".pattern");

        log_config.sinks.push_back(std::move(sink));
    }

    if (log_config.sinks.empty()) {
        log_config.add_default_sinks();
    }

    return log_config;
}

bool LogConfig::validate() const {
    if (level < Level::trace || level > Level::critical) {
        return false;
    }
    if (async && queue_size == 0) {
        return false;
    }

    for (const auto& sink : sinks) {
        if (!sink.enabled) {
            continue;
        }
        if (sink.type != SinkType::Console && sink.path.empty()) {
            return false;
        }
        if (sink.type == SinkType::RotatingFile && (sink.max_size == 0 || sink.max_files == 0)) {
            return false;
        }
    }

    return true;
}

void LogConfig::add_default_sinks() {
    SinkConfig console;
    console.type = SinkType::Console;
    console.level = level;
    sinks.push_back(console);
}

}  // namespace hindsight::core::logging
