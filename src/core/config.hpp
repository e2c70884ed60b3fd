#pragma once

#include <cstdint>
#include <fstream>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "trade.hpp"

namespace trade_analytics {

using json = nlohmann::json;

enum class ReturnBasis {
    PER_TRADE,  // one observation per closed trade
    DAILY       // calendar-day P&L, zero-filled between exits
};

enum class SamplingMethod {
    BOOTSTRAP,   // draw with replacement
    PERMUTATION  // shuffle without replacement
};

struct AnalyticsConfig {
    double initial_capital{125000.0};
    double risk_free_rate{0.0};            // annual, decimal (0.05 = 5%)
    int periods_per_year{252};             // annualization factor for Sharpe/Sortino
    EquityMode mode{EquityMode::ADDITIVE};
    ReturnBasis return_basis{ReturnBasis::PER_TRADE};
    double slippage_per_trade{0.0};        // fixed cost deducted from every trade
    double tax_rate_pct{0.0};              // yearly projection only
    int rolling_window_days{90};
    std::vector<double> loss_thresholds{3000.0, 5000.0, 10000.0};
};

struct SimulationConfig {
    int paths{1000};
    int path_length{0};                    // 0 = length of the historical series
    std::optional<uint64_t> seed;
    std::vector<double> percentiles{5.0, 50.0, 95.0};
    double target_multiple{2.0};
    int sample_paths{50};
    int threads{1};
    SamplingMethod method{SamplingMethod::BOOTSTRAP};
    // Request guards for the HTTP layer.
    int max_paths{100000};
    int max_path_length{10000};
    int64_t max_cells{20000000};           // paths * (path_length + 1) equity points held in memory
    int max_sample_paths{200};
};

struct SourceConfig {
    std::string directory{"./data"};
};

struct ServiceConfig {
    uint16_t port{8501};
    std::string bind_address{"127.0.0.1"};
    int threads{0};                        // 0 = hardware concurrency
};

struct LoggingConfig {
    std::string level{"info"};
    std::string file{};                    // empty = console only
    size_t max_file_bytes{10 * 1024 * 1024};
    size_t max_files{3};
};

struct AuthConfig {
    std::string token{};
};

struct Config {
    AnalyticsConfig analytics;
    SimulationConfig simulation;
    SourceConfig source;
    ServiceConfig services;
    LoggingConfig logging;
    AuthConfig auth;
};

inline void parse_return_basis(const std::string& s, ReturnBasis& out) {
    if (s == "daily") out = ReturnBasis::DAILY;
    else if (s == "per_trade" || s == "trade") out = ReturnBasis::PER_TRADE;
    else spdlog::warn("Unknown return_basis '{}', keeping default", s);
}

inline void parse_sampling_method(const std::string& s, SamplingMethod& out) {
    if (s == "bootstrap") out = SamplingMethod::BOOTSTRAP;
    else if (s == "permutation" || s == "shuffle") out = SamplingMethod::PERMUTATION;
    else spdlog::warn("Unknown sampling method '{}', keeping default", s);
}

inline void load_config(Config& cfg, const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        spdlog::warn("Config file {} not found, using defaults", path);
        return;
    }
    json j = json::parse(f, nullptr, true, true);
    if (j.contains("analytics")) {
        auto& a = j["analytics"];
        cfg.analytics.initial_capital = a.value("initial_capital", cfg.analytics.initial_capital);
        cfg.analytics.risk_free_rate = a.value("risk_free_rate", cfg.analytics.risk_free_rate);
        cfg.analytics.periods_per_year = a.value("periods_per_year", cfg.analytics.periods_per_year);
        if (a.contains("mode")) {
            auto mode = a["mode"].get<std::string>();
            if (!parse_equity_mode(mode, cfg.analytics.mode)) {
                spdlog::warn("Unknown equity mode '{}', keeping {}", mode,
                             equity_mode_to_string(cfg.analytics.mode));
            }
        }
        if (a.contains("return_basis")) {
            parse_return_basis(a["return_basis"].get<std::string>(), cfg.analytics.return_basis);
        }
        cfg.analytics.slippage_per_trade = a.value("slippage_per_trade", cfg.analytics.slippage_per_trade);
        cfg.analytics.tax_rate_pct = a.value("tax_rate_pct", cfg.analytics.tax_rate_pct);
        cfg.analytics.rolling_window_days = a.value("rolling_window_days", cfg.analytics.rolling_window_days);
        cfg.analytics.loss_thresholds = a.value("loss_thresholds", cfg.analytics.loss_thresholds);
    }
    if (j.contains("simulation")) {
        auto& s = j["simulation"];
        cfg.simulation.paths = s.value("paths", cfg.simulation.paths);
        cfg.simulation.path_length = s.value("path_length", cfg.simulation.path_length);
        if (s.contains("seed") && !s["seed"].is_null()) {
            cfg.simulation.seed = s["seed"].get<uint64_t>();
        }
        cfg.simulation.percentiles = s.value("percentiles", cfg.simulation.percentiles);
        cfg.simulation.target_multiple = s.value("target_multiple", cfg.simulation.target_multiple);
        cfg.simulation.sample_paths = s.value("sample_paths", cfg.simulation.sample_paths);
        cfg.simulation.threads = s.value("threads", cfg.simulation.threads);
        if (s.contains("method")) {
            parse_sampling_method(s["method"].get<std::string>(), cfg.simulation.method);
        }
        cfg.simulation.max_paths = s.value("max_paths", cfg.simulation.max_paths);
        cfg.simulation.max_path_length = s.value("max_path_length", cfg.simulation.max_path_length);
        cfg.simulation.max_cells = s.value("max_cells", cfg.simulation.max_cells);
        cfg.simulation.max_sample_paths = s.value("max_sample_paths", cfg.simulation.max_sample_paths);
    }
    if (j.contains("source")) {
        auto& src = j["source"];
        cfg.source.directory = src.value("directory", cfg.source.directory);
    }
    if (j.contains("services")) {
        auto& svc = j["services"];
        cfg.services.port = svc.value("port", cfg.services.port);
        cfg.services.bind_address = svc.value("bind_address", cfg.services.bind_address);
        cfg.services.threads = svc.value("threads", cfg.services.threads);
    }
    if (j.contains("logging")) {
        auto& l = j["logging"];
        cfg.logging.level = l.value("level", cfg.logging.level);
        cfg.logging.file = l.value("file", cfg.logging.file);
        cfg.logging.max_file_bytes = l.value("max_file_bytes", cfg.logging.max_file_bytes);
        cfg.logging.max_files = l.value("max_files", cfg.logging.max_files);
    }
    if (j.contains("auth")) {
        auto& a = j["auth"];
        cfg.auth.token = a.value("token", cfg.auth.token);
    }
}

} // namespace trade_analytics
