#include "simulation_engine.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>
#include <string>
#include <system_error>
#include <thread>
#include <spdlog/spdlog.h>

namespace trade_analytics {

namespace {

std::mt19937_64 path_generator(uint64_t base_seed, uint64_t path_index) {
    std::seed_seq seq{static_cast<uint32_t>(base_seed),
                      static_cast<uint32_t>(base_seed >> 32),
                      static_cast<uint32_t>(path_index),
                      static_cast<uint32_t>(path_index >> 32)};
    return std::mt19937_64(seq);
}

uint64_t fresh_seed() {
    std::random_device rd;
    return (static_cast<uint64_t>(rd()) << 32) ^ static_cast<uint64_t>(rd());
}

} // namespace

void SimulationEngine::validate(const ReturnSeries& returns, const SimulationParams& params) const {
    if (returns.empty()) {
        throw InvalidInput("simulation needs a non-empty return series");
    }
    if (params.paths < 1) {
        throw InvalidInput("simulation path count must be at least 1");
    }
    if (params.path_length < 1) {
        throw InvalidInput("simulation path length must be at least 1");
    }
    if (!(params.initial_capital > 0.0) || !std::isfinite(params.initial_capital)) {
        throw InvalidInput("initial capital must be positive");
    }
    for (double p : params.percentiles) {
        if (!(p >= 0.0 && p <= 100.0)) {
            throw InvalidInput("percentiles must be within [0, 100]");
        }
    }
    if (params.method == SamplingMethod::PERMUTATION &&
        static_cast<size_t>(params.path_length) > returns.size()) {
        throw InvalidInput("permutation path length cannot exceed the historical series length");
    }
    for (double r : returns) {
        if (!std::isfinite(r)) {
            throw InvalidInput("historical return series contains non-finite values");
        }
    }
}

void SimulationEngine::run_paths(const ReturnSeries& returns,
                                 const SimulationParams& params,
                                 uint64_t base_seed,
                                 size_t first_path,
                                 size_t last_path,
                                 std::vector<double>& equity,
                                 std::vector<double>& path_drawdowns) const {
    const size_t steps = static_cast<size_t>(params.path_length) + 1;
    const size_t n = returns.size();
    std::vector<size_t> order;
    if (params.method == SamplingMethod::PERMUTATION) order.resize(n);

    for (size_t p = first_path; p < last_path; ++p) {
        auto rng = path_generator(base_seed, p);
        std::uniform_int_distribution<size_t> pick(0, n - 1);
        if (params.method == SamplingMethod::PERMUTATION) {
            std::iota(order.begin(), order.end(), size_t{0});
        }
        double* row = equity.data() + p * steps;
        double current = params.initial_capital;
        double peak = current;
        double worst = 0.0;
        row[0] = current;
        for (size_t t = 1; t < steps; ++t) {
            size_t idx;
            if (params.method == SamplingMethod::BOOTSTRAP) {
                idx = pick(rng);
            } else {
                // Partial Fisher-Yates: position t-1 receives a draw from the unused tail.
                std::uniform_int_distribution<size_t> tail(t - 1, n - 1);
                std::swap(order[t - 1], order[tail(rng)]);
                idx = order[t - 1];
            }
            double r = returns[idx];
            if (params.mode == EquityMode::ADDITIVE) {
                current += r * params.initial_capital;
            } else {
                current *= 1.0 + r;
            }
            row[t] = current;
            if (current > peak) peak = current;
            if (peak > 0.0) {
                double dd = (current - peak) / peak;
                if (dd < worst) worst = dd;
            }
        }
        path_drawdowns[p] = worst;
    }
}

std::thread SimulationEngine::start_worker(std::function<void()> work) const {
    return std::thread(std::move(work));
}

SimulationResult SimulationEngine::run(const ReturnSeries& returns, const SimulationParams& params) const {
    validate(returns, params);

    const size_t paths = static_cast<size_t>(params.paths);
    const size_t steps = static_cast<size_t>(params.path_length) + 1;
    const uint64_t base_seed = params.seed ? *params.seed : fresh_seed();

    std::vector<double> equity(paths * steps);
    std::vector<double> path_drawdowns(paths, 0.0);

    size_t workers = static_cast<size_t>(std::max(1, params.threads));
    workers = std::min(workers, paths);
    if (workers == 1) {
        run_paths(returns, params, base_seed, 0, paths, equity, path_drawdowns);
    } else {
        std::vector<std::thread> pool;
        pool.reserve(workers);
        size_t chunk = (paths + workers - 1) / workers;
        size_t dispatched = 0;
        try {
            for (size_t w = 0; w < workers; ++w) {
                size_t first = w * chunk;
                size_t last = std::min(paths, first + chunk);
                if (first >= last) break;
                pool.push_back(start_worker([&, first, last] {
                    run_paths(returns, params, base_seed, first, last, equity, path_drawdowns);
                }));
                dispatched = last;
            }
        } catch (const std::system_error& e) {
            spdlog::warn("simulation: started {} of {} workers ({}), finishing inline",
                         pool.size(), workers, e.what());
        }
        for (auto& th : pool) th.join();
        if (dispatched < paths) {
            run_paths(returns, params, base_seed, dispatched, paths, equity, path_drawdowns);
        }
    }

    SimulationResult out;
    out.paths = params.paths;
    out.path_length = params.path_length;
    out.initial_capital = params.initial_capital;
    out.mode = params.mode;
    out.method = params.method;
    out.seed = base_seed;
    out.target_multiple = params.target_multiple;

    out.terminal_values.reserve(paths);
    size_t losses = 0;
    size_t hits = 0;
    double sum = 0.0;
    const double target = params.target_multiple * params.initial_capital;
    for (size_t p = 0; p < paths; ++p) {
        double v = equity[p * steps + steps - 1];
        out.terminal_values.push_back(v);
        sum += v;
        if (v < params.initial_capital) ++losses;
        if (v >= target) ++hits;
    }
    out.mean_terminal = sum / static_cast<double>(paths);
    out.median_terminal = percentile(out.terminal_values, 50.0);
    auto [mn, mx] = std::minmax_element(out.terminal_values.begin(), out.terminal_values.end());
    out.min_terminal = *mn;
    out.max_terminal = *mx;
    out.probability_of_loss = static_cast<double>(losses) / static_cast<double>(paths);
    out.probability_of_target = static_cast<double>(hits) / static_cast<double>(paths);
    out.median_max_drawdown = percentile(path_drawdowns, 50.0);

    out.bands.reserve(params.percentiles.size());
    for (double pct : params.percentiles) {
        PercentileBand band;
        band.percentile = pct;
        band.values.reserve(steps);
        out.bands.push_back(std::move(band));
    }
    std::vector<double> column(paths);
    for (size_t t = 0; t < steps; ++t) {
        for (size_t p = 0; p < paths; ++p) column[p] = equity[p * steps + t];
        for (auto& band : out.bands) {
            band.values.push_back(percentile(column, band.percentile));
        }
    }

    size_t keep = std::min(paths, static_cast<size_t>(std::max(0, params.sample_paths)));
    out.sample_paths.reserve(keep);
    for (size_t p = 0; p < keep; ++p) {
        auto begin = equity.begin() + static_cast<std::ptrdiff_t>(p * steps);
        out.sample_paths.emplace_back(begin, begin + static_cast<std::ptrdiff_t>(steps));
    }

    spdlog::debug("simulation: paths={} length={} seed={} workers={} p_loss={:.4f}",
                  params.paths, params.path_length, base_seed, workers, out.probability_of_loss);
    return out;
}

void enforce_simulation_limits(SimulationParams& params, const SimulationConfig& limits) {
    if (params.paths > limits.max_paths) {
        throw InvalidInput("paths exceeds limit of " + std::to_string(limits.max_paths));
    }
    if (params.path_length > limits.max_path_length) {
        throw InvalidInput("path_length exceeds limit of " + std::to_string(limits.max_path_length));
    }
    if (params.paths > 0 && params.path_length > 0) {
        int64_t cells = static_cast<int64_t>(params.paths) * (static_cast<int64_t>(params.path_length) + 1);
        if (cells > limits.max_cells) {
            throw InvalidInput("paths * (path_length + 1) exceeds limit of " + std::to_string(limits.max_cells));
        }
    }
    params.sample_paths = std::clamp(params.sample_paths, 0, std::max(0, limits.max_sample_paths));
}

SimulationParams make_simulation_params(const SimulationConfig& sim,
                                        const AnalyticsConfig& analytics,
                                        size_t history_length) {
    SimulationParams p;
    p.paths = sim.paths;
    p.path_length = sim.path_length > 0 ? sim.path_length : static_cast<int>(history_length);
    p.initial_capital = analytics.initial_capital;
    p.mode = analytics.mode;
    p.seed = sim.seed;
    p.percentiles = sim.percentiles;
    p.target_multiple = sim.target_multiple;
    p.sample_paths = sim.sample_paths;
    p.threads = sim.threads;
    p.method = sim.method;
    return p;
}

} // namespace trade_analytics
