#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <thread>
#include <vector>
#include "config.hpp"
#include "metrics_engine.hpp"

namespace trade_analytics {

struct SimulationParams {
    int paths{1000};
    int path_length{50};
    double initial_capital{0.0};
    EquityMode mode{EquityMode::ADDITIVE};
    std::optional<uint64_t> seed;
    std::vector<double> percentiles{5.0, 50.0, 95.0};
    double target_multiple{2.0};
    int sample_paths{0};
    int threads{1};
    SamplingMethod method{SamplingMethod::BOOTSTRAP};
};

struct PercentileBand {
    double percentile{0.0};
    std::vector<double> values;   // path_length + 1 points
};

struct SimulationResult {
    int paths{0};
    int path_length{0};
    double initial_capital{0.0};
    EquityMode mode{EquityMode::ADDITIVE};
    SamplingMethod method{SamplingMethod::BOOTSTRAP};
    uint64_t seed{0};             // base seed actually used

    std::vector<double> terminal_values;
    std::vector<PercentileBand> bands;

    double mean_terminal{0.0};
    double median_terminal{0.0};
    double min_terminal{0.0};
    double max_terminal{0.0};
    double probability_of_loss{0.0};     // terminal < initial capital
    double target_multiple{0.0};
    double probability_of_target{0.0};  // terminal >= target_multiple * initial capital
    double median_max_drawdown{0.0};     // <= 0

    std::vector<std::vector<double>> sample_paths;
};

/**
 * Monte Carlo projection by resampling historical per-trade returns.
 *
 * Each path owns a generator seeded from (seed, path index), so a seeded run
 * is reproducible regardless of the worker thread count.
 */
class SimulationEngine {
public:
    virtual ~SimulationEngine() = default;

    // returns are profit_loss / initial_capital, as produced by trade_returns().
    SimulationResult run(const ReturnSeries& returns, const SimulationParams& params) const;

protected:
    // Paths a worker failed to start for run on the calling thread instead.
    virtual std::thread start_worker(std::function<void()> work) const;

private:
    void validate(const ReturnSeries& returns, const SimulationParams& params) const;
    void run_paths(const ReturnSeries& returns,
                   const SimulationParams& params,
                   uint64_t base_seed,
                   size_t first_path,
                   size_t last_path,
                   std::vector<double>& equity,
                   std::vector<double>& path_drawdowns) const;
};

// Throws InvalidInput when resolved params exceed the configured limits;
// sample_paths is capped at limits.max_sample_paths.
void enforce_simulation_limits(SimulationParams& params, const SimulationConfig& limits);

// Merge configured defaults with the analytics settings used for the history.
SimulationParams make_simulation_params(const SimulationConfig& sim,
                                        const AnalyticsConfig& analytics,
                                        size_t history_length);

} // namespace trade_analytics
