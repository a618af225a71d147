#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace hindsight::core::config {
class Configuration;
}

namespace hindsight::core::logging {

enum class Level {
    trace = 0,
    debug,
    info,
    warn,
    error,
    critical
};

enum class LogFormat {
    Simple,
    Json,
    Custom
};

enum class SinkType {
    Console,
    File,
    RotatingFile,
    DailyFile
};

struct SinkConfig {
    SinkType type{SinkType::Console};
    bool enabled{true};
    Level level{Level::info};

    // File sinks only
    std::filesystem::path path;
    std::size_t max_size{10 * 1024 * 1024};
    std::size_t max_files{5};
    std::string rotation_time{"00:00"};  // "HH:MM" for daily sinks

    std::string pattern;
};

struct LogConfig {
    Level level{Level::info};
    LogFormat format{LogFormat::Simple};
    std::string pattern{"%Y-%m-%d %H:%M:%S.%e [%n] [%l] %v"};

    bool async{true};
    std::size_t queue_size{8192};
    std::chrono::seconds flush_interval{3};

    std::vector<SinkConfig> sinks;

    static LogConfig default_config();
    static LogConfig from_toml(const config::Configuration& config);

    [[nodiscard]] bool validate() const;

private:
    void add_default_sinks();
};

Level level_from_string(const std::string& str);
std::string level_to_string(Level level);

}  // namespace hindsight::core::logging
