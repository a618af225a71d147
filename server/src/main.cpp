#include "hindsight/core/application.hpp"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>

namespace {

std::atomic<hindsight::core::Application*> g_app_ptr{nullptr};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        if (auto* app = g_app_ptr.load()) {
            app->request_stop();
        }
    }
}

std::filesystem::path parse_config_path(int argc, char** argv, std::filesystem::path default_path) {
    std::filesystem::path path = std::move(default_path);
    if (const char* env = std::getenv("HINDSIGHT_CONFIG_PATH")) {
        path = env;
    }
    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            path = argv[++i];
        }
    }
    return path;
}

void parse_extra_flags(int argc, char** argv, hindsight::core::ApplicationOptions& options) {
    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if ((arg == "--log-level" || arg == "-l") && i + 1 < argc) {
            options.log_level = hindsight::core::logging::level_from_string(argv[++i]);
        } else if (arg == "--seed") {
            options.seed_data = true;
        }
    }
}

}  // namespace

int main(int argc, char** argv) {
    hindsight::core::ApplicationOptions options;
    options.config_path = parse_config_path(argc, argv, options.config_path);
    parse_extra_flags(argc, argv, options);

    hindsight::core::Application app{options};
    g_app_ptr.store(&app);
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    int status = 0;
    try {
        app.initialize();
        app.run();
    } catch (const std::exception& ex) {
        std::cerr << "hindsight failed: " << ex.what() << std::endl;
        status = 1;
    }

    app.shutdown();
    g_app_ptr.store(nullptr);
    hindsight::core::logging::shutdown_logging();
    return status;
}
