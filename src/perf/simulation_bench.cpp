#include <chrono>
#include <iostream>
#include <string>
#include "../core/errors.hpp"
#include "../core/logging.hpp"
#include "../core/simulation_engine.hpp"

using namespace trade_analytics;

int main(int argc, char* argv[]) {
    int paths = 10000;
    int length = 250;
    int threads = 1;
    if (argc > 1) {
        paths = std::stoi(argv[1]);
    }
    if (argc > 2) {
        length = std::stoi(argv[2]);
    }
    if (argc > 3) {
        threads = std::stoi(argv[3]);
    }

    LoggingConfig log_cfg;
    log_cfg.level = "warn";
    init_logging(log_cfg);

    ReturnSeries returns;
    for (int i = 0; i < 500; ++i) {
        returns.push_back((i % 7 == 0) ? -0.012 : 0.004 + 0.0001 * (i % 5));
    }

    SimulationParams params;
    params.paths = paths;
    params.path_length = length;
    params.initial_capital = 100000.0;
    params.seed = 42;
    params.threads = threads;

    SimulationEngine engine;
    auto start = std::chrono::steady_clock::now();
    SimulationResult result;
    try {
        result = engine.run(returns, params);
    } catch (const InvalidInput& e) {
        std::cerr << "invalid parameters: " << e.what() << "\n";
        return 1;
    }
    auto end = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    double seconds = elapsed / 1000.0;
    double steps = static_cast<double>(paths) * static_cast<double>(length);
    double rate = seconds > 0 ? steps / seconds : 0.0;
    std::cout << "paths=" << result.paths << " length=" << result.path_length
              << " threads=" << threads << " elapsed_ms=" << elapsed
              << " steps_per_sec=" << static_cast<long long>(rate)
              << " median_terminal=" << result.median_terminal << "\n";
    return 0;
}
