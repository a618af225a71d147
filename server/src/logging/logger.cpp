#include "hindsight/core/logging/logger.hpp"

#include <algorithm>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "hindsight/core/config/configuration.hpp"

namespace hindsight::core::logging {
namespace {

constexpr const char* kDefaultPattern = "%Y-%m-%d %H:%M:%S.%e [%n] [%l] %v";
constexpr const char* kJsonPattern =
    R"({"time":"%Y-%m-%dT%H:%M:%S.%e","logger":"%n","level":"%l","thread":%t,"msg":"%v"})";

spdlog::level::level_enum to_spdlog_level(Level level) {
    switch (level) {
        case Level::trace:    return spdlog::level::trace;
        case Level::debug:    return spdlog::level::debug;
        case Level::info:     return spdlog::level::info;
        case Level::warn:     return spdlog::level::warn;
        case Level::error:    return spdlog::level::err;
        case Level::critical: return spdlog::level::critical;
    }
    return spdlog::level::info;
}

Level from_spdlog_level(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace:    return Level::trace;
        case spdlog::level::debug:    return Level::debug;
        case spdlog::level::info:     return Level::info;
        case spdlog::level::warn:     return Level::warn;
        case spdlog::level::err:      return Level::error;
        case spdlog::level::critical: return Level::critical;
        default:                      return Level::info;
    }
}

std::string effective_pattern(const LogConfig& config) {
    if (config.format == LogFormat::Json) {
        return kJsonPattern;
    }
    return config.pattern.empty() ? std::string{kDefaultPattern} : config.pattern;
}

// "HH:MM" -> (hour, minute); malformed values fall back to midnight.
std::pair<int, int> parse_rotation_time(const std::string& text) {
    auto colon = text.find(':');
    if (colon == std::string::npos) {
        return {0, 0};
    }
    try {
        int hour = std::stoi(text.substr(0, colon));
        int minute = std::stoi(text.substr(colon + 1));
        if (hour < 0 || hour > 23 || minute < 0 || minute > 59) {
            return {0, 0};
        }
        return {hour, minute};
    } catch (const std::exception&) {
        return {0, 0};
    }
}

std::shared_ptr<spdlog::sinks::sink> make_sink(const SinkConfig& config) {
    if (!config.enabled) {
        return nullptr;
    }

    std::shared_ptr<spdlog::sinks::sink> sink;
    switch (config.type) {
        case SinkType::Console:
            sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            break;
        case SinkType::File:
            sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.path.string(), false);
            break;
        case SinkType::RotatingFile:
            sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.path.string(), config.max_size, config.max_files);
            break;
        case SinkType::DailyFile: {
            auto [hour, minute] = parse_rotation_time(config.rotation_time);
            sink = std::make_shared<spdlog::sinks::daily_file_sink_mt>(
                config.path.string(), hour, minute, false, static_cast<uint16_t>(config.max_files));
            break;
        }
    }

    if (!sink) {
        throw std::runtime_error("Unknown sink type");
    }

    sink->set_level(to_spdlog_level(config.level));
    if (!config.pattern.empty()) {
        sink->set_pattern(config.pattern);
    }
    return sink;
}

std::vector<std::shared_ptr<spdlog::sinks::sink>> make_sinks(const LogConfig& config) {
    std::vector<std::shared_ptr<spdlog::sinks::sink>> sinks;
    for (const auto& sink_config : config.sinks) {
        if (auto sink = make_sink(sink_config)) {
            sinks.push_back(std::move(sink));
        }
    }
    return sinks;
}

std::mutex g_init_mutex;
bool g_logging_initialized = false;
bool g_thread_pool_initialized = false;

void ensure_thread_pool(std::size_t queue_size) {
    if (!g_thread_pool_initialized) {
        spdlog::init_thread_pool(queue_size, 1);
        g_thread_pool_initialized = true;
    }
}

std::shared_ptr<spdlog::logger> build_logger(const std::string& name, const LogConfig& config) {
    auto sinks = make_sinks(config);
    std::shared_ptr<spdlog::logger> logger;
    if (config.async) {
        {
            std::lock_guard<std::mutex> lock(g_init_mutex);
            ensure_thread_pool(config.queue_size);
        }
        // Log records are never dropped; a full queue blocks the caller.
        logger = std::make_shared<spdlog::async_logger>(
            name, sinks.begin(), sinks.end(), spdlog::thread_pool(), spdlog::async_overflow_policy::block);
    } else {
        logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    }
    logger->set_pattern(effective_pattern(config));
    logger->set_level(to_spdlog_level(config.level));
    logger->flush_on(spdlog::level::warn);
    return logger;
}

}  // namespace

class Logger::Impl {
public:
    explicit Impl(const std::string& name, const LogConfig* config = nullptr)
        : name_(name) {
        if (config) {
            spdlog_logger_ = build_logger(name, *config);
            return;
        }
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern(kDefaultPattern);
        spdlog_logger_ = std::make_shared<spdlog::logger>(name, std::move(console_sink));
        spdlog_logger_->set_level(spdlog::level::info);
    }

    void set_level(Level level) { spdlog_logger_->set_level(to_spdlog_level(level)); }
    Level level() const { return from_spdlog_level(spdlog_logger_->level()); }
    const std::string& name() const { return name_; }
    void log(Level level, const std::string& message) { spdlog_logger_->log(to_spdlog_level(level), message); }
    void flush() { spdlog_logger_->flush(); }

private:
    std::string name_;
    std::shared_ptr<spdlog::logger> spdlog_logger_;
};

Logger::Logger(std::string name)
    : impl_(std::make_unique<Impl>(name)) {
}

Logger::Logger(std::string name, const LogConfig* config)
    : impl_(std::make_unique<Impl>(name, config)) {
}

Logger::~Logger() = default;

void Logger::set_level(Level level) noexcept {
    impl_->set_level(level);
}

Level Logger::level() const noexcept {
    return impl_->level();
}

const std::string& Logger::name() const noexcept {
    return impl_->name();
}

void Logger::log(Level level, const std::string& message) {
    impl_->log(level, message);
}

void Logger::flush() {
    impl_->flush();
}

const char* Logger::level_to_string(Level level) noexcept {
    switch (level) {
        case Level::trace:    return "TRACE";
        case Level::debug:    return "DEBUG";
        case Level::info:     return "INFO";
        case Level::warn:     return "WARN";
        case Level::error:    return "ERROR";
        case Level::critical: return "CRITICAL";
    }
    return "UNKNOWN";
}

LoggerPtr create_logger(const std::string& name) {
    return std::make_shared<Logger>(name);
}

LoggerPtr create_logger(const std::string& name, const LogConfig& config) {
    return std::make_shared<Logger>(name, &config);
}

void initialize_logging(const LogConfig& config) {
    if (!config.validate()) {
        throw std::invalid_argument("Invalid logging configuration");
    }

    {
        std::lock_guard<std::mutex> lock(g_init_mutex);
        if (g_logging_initialized) {
            return;
        }
        g_logging_initialized = true;
    }

    auto default_logger = build_logger("hindsight", config);
    spdlog::set_default_logger(default_logger);
    spdlog::set_level(to_spdlog_level(config.level));
    if (config.async) {
        spdlog::flush_every(config.flush_interval);
    }
}

void initialize_logging(const config::Configuration& config) {
    initialize_logging(LogConfig::from_toml(config));
}

void shutdown_logging() {
    spdlog::shutdown();
    std::lock_guard<std::mutex> lock(g_init_mutex);
    g_logging_initialized = false;
    g_thread_pool_initialized = false;
}

std::string level_to_string(Level level) {
    return Logger::level_to_string(level);
}

}  // namespace hindsight::core::logging
