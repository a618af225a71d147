#include "hindsight/core/application.hpp"

#include <chrono>
#include <iostream>
#include <thread>

int main() {
    hindsight::core::ApplicationOptions options;
    options.identity = "hindsight-smoke";
    options.poll_interval = std::chrono::milliseconds(10);
    options.seed_data = true;

    hindsight::core::Application app{options};
    app.initialize();
    std::cout << "Loaded config entries: " << app.configuration().size() << std::endl;

    std::thread app_thread([&app]() {
        app.run();
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    std::vector<hindsight::core::model::TraceSummary> summaries;
    auto ec = app.service()->list_traces({}, summaries);
    std::cout << "Seeded traces listed: " << summaries.size() << std::endl;

    app.shutdown();
    if (app_thread.joinable()) {
        app_thread.join();
    }

    if (ec || summaries.empty()) {
        std::cerr << "Smoke test failed: no traces listed" << std::endl;
        return 1;
    }
    std::cout << "Smoke test completed" << std::endl;
    return 0;
}
