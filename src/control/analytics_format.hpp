#pragma once

#include <cmath>
#include <limits>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../core/config.hpp"
#include "../core/errors.hpp"
#include "../core/performance_report.hpp"
#include "../core/simulation_engine.hpp"
#include "../core/utils.hpp"

namespace trade_analytics {
namespace analytics_format {

// Undefined -> null, unbounded -> "unbounded", otherwise the number.
inline nlohmann::json metric(const Metric& m) {
    switch (m.state()) {
        case Metric::State::VALUE: return m.value();
        case Metric::State::UNBOUNDED: return "unbounded";
        case Metric::State::UNDEFINED: return nullptr;
    }
    return nullptr;
}

inline const char* sampling_method_to_string(SamplingMethod m) {
    switch (m) {
        case SamplingMethod::BOOTSTRAP: return "bootstrap";
        case SamplingMethod::PERMUTATION: return "permutation";
    }
    return "bootstrap";
}

inline nlohmann::json format_summary(const MetricsSummary& s) {
    nlohmann::json out;
    for (const auto& [name, value] : s.entries()) {
        out[name] = metric(value);
    }
    out["initial_capital"] = s.initial_capital;
    out["years"] = s.years;
    return out;
}

inline nlohmann::json format_equity(const EquityReport& r) {
    nlohmann::json points = nlohmann::json::array();
    for (size_t i = 0; i < r.equity.size(); ++i) {
        points.push_back({
            {"time", utils::ts_to_iso(r.times[i])},
            {"equity", r.equity[i]},
            {"drawdown", r.drawdown[i]}
        });
    }
    return nlohmann::json{
        {"points", points},
        {"max_drawdown", max_drawdown(r.drawdown)}
    };
}

inline nlohmann::json format_simulation(const SimulationResult& r) {
    nlohmann::json bands = nlohmann::json::array();
    for (const auto& b : r.bands) {
        bands.push_back({{"percentile", b.percentile}, {"values", b.values}});
    }
    return nlohmann::json{
        {"paths", r.paths},
        {"path_length", r.path_length},
        {"initial_capital", r.initial_capital},
        {"mode", equity_mode_to_string(r.mode)},
        {"method", sampling_method_to_string(r.method)},
        {"seed", r.seed},
        {"terminal_values", r.terminal_values},
        {"bands", bands},
        {"mean_terminal", r.mean_terminal},
        {"median_terminal", r.median_terminal},
        {"min_terminal", r.min_terminal},
        {"max_terminal", r.max_terminal},
        {"probability_of_loss", r.probability_of_loss},
        {"target_multiple", r.target_multiple},
        {"probability_of_target", r.probability_of_target},
        {"median_max_drawdown", r.median_max_drawdown},
        {"sample_paths", r.sample_paths}
    };
}

inline nlohmann::json format_matrix(const std::vector<MonthlyRow>& rows) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& row : rows) {
        nlohmann::json months;
        for (int m = 0; m < 12; ++m) {
            months[utils::month_name(m)] = row.months[static_cast<size_t>(m)];
        }
        arr.push_back({
            {"year", row.label},
            {"months", months},
            {"total", row.total},
            {"return_pct", row.return_pct}
        });
    }
    return arr;
}

inline nlohmann::json format_losses(const std::vector<LossBucket>& buckets) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& b : buckets) {
        arr.push_back({
            {"severity", b.label},
            {"lower", b.lower},
            {"upper", b.upper ? nlohmann::json(*b.upper) : nlohmann::json(nullptr)},
            {"count", b.count},
            {"total_loss", b.total_loss}
        });
    }
    return arr;
}

inline nlohmann::json format_weekdays(const std::vector<WeekdayStats>& days) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& d : days) {
        arr.push_back({
            {"day", d.day},
            {"count", d.count},
            {"net_pnl", d.net_pnl},
            {"win_rate", metric(d.win_rate)}
        });
    }
    return arr;
}

inline nlohmann::json format_projection(const std::vector<YearlyProjectionRow>& rows) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& r : rows) {
        arr.push_back({
            {"year", r.year},
            {"start_balance", r.start_balance},
            {"scaling_factor", r.scaling_factor},
            {"raw_profit", r.raw_profit},
            {"tax", r.tax},
            {"net_profit", r.net_profit},
            {"end_balance", r.end_balance},
            {"growth_pct", metric(r.growth_pct)},
            {"linear_equity", r.linear_equity}
        });
    }
    return arr;
}

inline nlohmann::json format_rolling(const std::vector<RollingPoint>& points) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& p : points) {
        arr.push_back({{"date", utils::ts_to_date(p.day)}, {"sortino", metric(p.value)}});
    }
    return arr;
}

inline nlohmann::json format_leaderboard(const std::vector<LeaderboardEntry>& entries) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& e : entries) {
        auto row = format_summary(e.summary);
        row["strategy"] = e.strategy;
        arr.push_back(row);
    }
    return arr;
}

// Whole number within [lo, hi] from a query or body value; InvalidInput otherwise.
inline int checked_int(double v, const std::string& name, int lo, int hi) {
    if (!(v >= static_cast<double>(lo) && v <= static_cast<double>(hi)) || v != std::floor(v)) {
        throw InvalidInput(name + " must be a whole number in [" + std::to_string(lo) + ", " +
                           std::to_string(hi) + "]");
    }
    return static_cast<int>(v);
}

inline int json_int(const nlohmann::json& body, const std::string& key, int fallback, int lo, int hi) {
    if (!body.contains(key) || body[key].is_null()) return fallback;
    if (!body[key].is_number()) throw InvalidInput(key + " must be a number");
    return checked_int(body[key].get<double>(), key, lo, hi);
}

/**
 * Inline trade rows for /analyze. Throws InvalidInput naming the bad row.
 * profit_loss is derived from prices and size when absent.
 */
inline std::vector<Trade> parse_trades(const nlohmann::json& arr) {
    if (!arr.is_array()) {
        throw InvalidInput("trades must be an array");
    }
    std::vector<Trade> out;
    out.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        const auto& row = arr[i];
        auto bad = [i](const std::string& why) {
            return InvalidInput("trade " + std::to_string(i) + ": " + why);
        };
        if (!row.is_object()) throw bad("not an object");
        Trade t;
        if (!row.contains("exit_time") || !row["exit_time"].is_string()) throw bad("exit_time required");
        auto ts = utils::parse_ts_any(row["exit_time"].get<std::string>());
        if (!ts) throw bad("unparsable exit_time");
        t.exit_time = *ts;
        t.symbol = row.value("symbol", std::string{});
        t.entry_price = row.value("entry_price", 0.0);
        t.exit_price = row.value("exit_price", 0.0);
        t.size = row.value("size", 0.0);
        if (row.contains("profit_loss") && row["profit_loss"].is_number()) {
            t.profit_loss = row["profit_loss"].get<double>();
        } else if (row.contains("entry_price") && row.contains("exit_price") && row.contains("size")) {
            t.profit_loss = (t.exit_price - t.entry_price) * t.size;
        } else {
            throw bad("profit_loss required");
        }
        out.push_back(std::move(t));
    }
    return out;
}

} // namespace analytics_format
} // namespace trade_analytics
