#pragma once

#include <cstddef>
#include <utility>
#include <vector>
#include "trade.hpp"
#include "metric.hpp"

namespace trade_analytics {

using EquityCurve = std::vector<double>;
using DrawdownSeries = std::vector<double>;
using ReturnSeries = std::vector<double>;

/**
 * Cumulative capital after each trade, ordered by exit_time.
 * Length is trades.size() + 1; element 0 is initial_capital.
 * Throws InvalidInput if trades is empty or initial_capital <= 0.
 */
EquityCurve build_equity_curve(const std::vector<Trade>& trades,
                               double initial_capital,
                               EquityMode mode);

/**
 * Fractional decline from the running peak, one value per equity point (<= 0).
 * A non-positive running peak yields 0 for that point.
 */
DrawdownSeries compute_drawdown(const EquityCurve& equity);

// Minimum of the drawdown series, 0 when empty.
double max_drawdown(const DrawdownSeries& drawdown);

// profit_loss / initial_capital per trade, ordered by exit_time.
ReturnSeries trade_returns(const std::vector<Trade>& trades, double initial_capital);

// Calendar-day (UTC) P&L from the first to the last exit day, zero-filled.
std::vector<std::pair<Timestamp, double>> daily_pnl(const std::vector<Trade>& trades);

// daily_pnl() divided by initial_capital.
ReturnSeries daily_returns(const std::vector<Trade>& trades, double initial_capital);

Metric sharpe_ratio(const ReturnSeries& returns, double risk_free_rate, int periods_per_year);
Metric sortino_ratio(const ReturnSeries& returns, double risk_free_rate, int periods_per_year);
Metric calmar_ratio(const Metric& cagr, double max_drawdown);
Metric cagr(double initial_capital, double final_capital, double total_years);

// Sum of gains over absolute sum of losses.
Metric omega_ratio(const ReturnSeries& returns);

// 95th percentile over absolute 5th percentile.
Metric tail_ratio(const ReturnSeries& returns);

struct WinLossStats {
    size_t total{0};
    size_t wins{0};
    size_t losses{0};
    double gross_profit{0.0};
    double gross_loss{0.0};     // positive magnitude
    Metric win_rate;            // fraction in [0, 1]
    Metric avg_win;
    Metric avg_loss;            // positive magnitude
    Metric profit_factor;
    Metric risk_reward;
};

WinLossStats win_loss_stats(const std::vector<Trade>& trades);

// Years between the first and last exit (365.25-day years).
double years_spanned(const std::vector<Trade>& trades);

// Linear interpolation between order statistics; pct in [0, 100].
double percentile(std::vector<double> data, double pct);

} // namespace trade_analytics
