#pragma once

#include <array>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "config.hpp"
#include "metrics_engine.hpp"
#include "trade_source.hpp"

namespace trade_analytics {

/**
 * Scalar results for one trade table. Every field is recomputed from the
 * trades on each call; a metric that cannot be evaluated is UNDEFINED without
 * affecting the others.
 */
struct MetricsSummary {
    size_t total_trades{0};
    double initial_capital{0.0};
    double years{0.0};

    Metric final_capital;
    Metric net_profit;
    Metric roi;                 // net_profit / initial_capital
    Metric profit_per_trade;
    Metric cagr;
    Metric sharpe;
    Metric sortino;
    Metric calmar;
    Metric omega;
    Metric tail_ratio;
    Metric profit_factor;
    Metric risk_reward;
    Metric win_rate;            // fraction
    Metric avg_win;
    Metric avg_loss;            // positive magnitude
    Metric max_drawdown;        // fraction <= 0
    int64_t max_drawdown_duration_days{0};
    Metric trades_per_year;

    // Flat name -> value view, in display order.
    std::vector<std::pair<std::string, Metric>> entries() const;
};

struct EquityReport {
    std::vector<Timestamp> times;   // times[0] is the first exit; the rest align with trades
    EquityCurve equity;
    DrawdownSeries drawdown;
};

struct RollingPoint {
    Timestamp day;
    Metric value;
};

struct MonthlyRow {
    std::string label;                  // year, or "Grand Total"
    std::array<double, 12> months{};
    double total{0.0};
    double return_pct{0.0};
};

struct LossBucket {
    std::string label;
    double lower{0.0};                  // magnitude, exclusive (inclusive for the first bucket)
    std::optional<double> upper;        // magnitude, inclusive; none for the last bucket
    size_t count{0};
    double total_loss{0.0};             // signed sum (<= 0)
};

struct WeekdayStats {
    std::string day;
    size_t count{0};
    double net_pnl{0.0};
    Metric win_rate;
};

struct YearlyProjectionRow {
    int year{0};
    double start_balance{0.0};
    double scaling_factor{1.0};
    double raw_profit{0.0};
    double tax{0.0};
    double net_profit{0.0};
    double end_balance{0.0};
    Metric growth_pct;
    double linear_equity{0.0};          // unscaled reference path
};

struct LeaderboardEntry {
    std::string strategy;
    MetricsSummary summary;
};

// Subtract a fixed cost from every trade's profit_loss.
std::vector<Trade> apply_slippage(const std::vector<Trade>& trades, double cost_per_trade);

// Keep trades whose exit_time falls within [start, end]; either bound may be open.
std::vector<Trade> filter_by_date(const std::vector<Trade>& trades,
                                  std::optional<Timestamp> start,
                                  std::optional<Timestamp> end);

// Sort by exit_time and apply the configured slippage.
std::vector<Trade> prepare_trades(const std::vector<Trade>& trades, const AnalyticsConfig& cfg);

// Throws InvalidInput for an empty table or non-positive capital.
MetricsSummary summarize(const std::vector<Trade>& trades, const AnalyticsConfig& cfg);

EquityReport build_equity_report(const std::vector<Trade>& trades, const AnalyticsConfig& cfg);

// The per-trade or daily return series selected by cfg.return_basis.
ReturnSeries select_returns(const std::vector<Trade>& ordered, const AnalyticsConfig& cfg);

// Longest continuous underwater stretch, in days between exit times.
// ordered must be sorted by exit_time and drawdown must come from its equity curve.
int64_t max_drawdown_duration_days(const std::vector<Trade>& ordered, const DrawdownSeries& drawdown);

std::vector<RollingPoint> rolling_sortino(const std::vector<Trade>& trades,
                                          int window_days,
                                          int periods_per_year);

// One row per calendar year plus a trailing "Grand Total" row.
std::vector<MonthlyRow> monthly_matrix(const std::vector<Trade>& trades, double initial_capital);

// thresholds are increasing loss magnitudes; N thresholds give N + 1 buckets.
std::vector<LossBucket> loss_breakdown(const std::vector<Trade>& trades,
                                       const std::vector<double>& thresholds);

// Monday first.
std::vector<WeekdayStats> weekday_breakdown(const std::vector<Trade>& trades);

/**
 * Replays each calendar year's P&L with position sizing that grows over time.
 * ADDITIVE scales year i by (1 + i); COMPOUNDING scales by equity / initial
 * capital, floored at 0.1. Tax is taken from positive yearly profit only.
 */
std::vector<YearlyProjectionRow> yearly_projection(const std::vector<Trade>& trades,
                                                   double initial_capital,
                                                   EquityMode mode,
                                                   double tax_rate_pct);

// Tables that fail to load or have no trades in the window are left out.
std::vector<LeaderboardEntry> leaderboard(TradeSource& source,
                                          const std::vector<std::string>& tables,
                                          const AnalyticsConfig& cfg,
                                          std::optional<Timestamp> start,
                                          std::optional<Timestamp> end);

} // namespace trade_analytics
