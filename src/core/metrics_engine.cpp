#include "metrics_engine.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <spdlog/spdlog.h>

namespace trade_analytics {

namespace {

constexpr int64_t kSecondsPerDay = 86400;
constexpr double kDaysPerYear = 365.25;

bool all_finite(const std::vector<double>& v) {
    return std::all_of(v.begin(), v.end(), [](double x) { return std::isfinite(x); });
}

double mean_of(const std::vector<double>& v) {
    double sum = 0.0;
    for (double x : v) sum += x;
    return sum / static_cast<double>(v.size());
}

// Sample standard deviation (n - 1).
double stdev_of(const std::vector<double>& v, double mean) {
    double var = 0.0;
    for (double x : v) {
        double d = x - mean;
        var += d * d;
    }
    var /= static_cast<double>(v.size() - 1);
    return std::sqrt(var);
}

ReturnSeries excess_returns(const ReturnSeries& returns, double risk_free_rate, int periods_per_year) {
    if (periods_per_year <= 0) {
        throw InvalidInput("periods_per_year must be positive");
    }
    double rf_period = risk_free_rate / static_cast<double>(periods_per_year);
    ReturnSeries out;
    out.reserve(returns.size());
    for (double r : returns) out.push_back(r - rf_period);
    return out;
}

int64_t day_index(Timestamp ts) {
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
    int64_t day = secs / kSecondsPerDay;
    if (secs < 0 && secs % kSecondsPerDay != 0) --day;
    return day;
}

} // namespace

std::vector<Trade> sorted_by_exit(std::vector<Trade> trades) {
    std::stable_sort(trades.begin(), trades.end(), [](const Trade& a, const Trade& b) {
        return a.exit_time < b.exit_time;
    });
    return trades;
}

EquityCurve build_equity_curve(const std::vector<Trade>& trades,
                               double initial_capital,
                               EquityMode mode) {
    if (trades.empty()) {
        throw InvalidInput("cannot build equity curve: no trades");
    }
    if (!(initial_capital > 0.0) || !std::isfinite(initial_capital)) {
        throw InvalidInput("initial capital must be positive");
    }
    auto ordered = sorted_by_exit(trades);
    EquityCurve equity;
    equity.reserve(ordered.size() + 1);
    equity.push_back(initial_capital);
    double current = initial_capital;
    for (const auto& t : ordered) {
        if (mode == EquityMode::ADDITIVE) {
            current += t.profit_loss;
        } else {
            current *= 1.0 + t.profit_loss / initial_capital;
        }
        equity.push_back(current);
    }
    return equity;
}

DrawdownSeries compute_drawdown(const EquityCurve& equity) {
    if (equity.empty()) {
        throw InvalidInput("cannot compute drawdown of an empty equity curve");
    }
    DrawdownSeries dd;
    dd.reserve(equity.size());
    double running_max = equity.front();
    bool first = true;
    for (double e : equity) {
        if (!std::isfinite(e)) {
            dd.push_back(0.0);
            continue;
        }
        if (first || e > running_max) {
            running_max = e;
            first = false;
        }
        if (running_max <= 0.0) {
            dd.push_back(0.0);
        } else {
            dd.push_back((e - running_max) / running_max);
        }
    }
    return dd;
}

double max_drawdown(const DrawdownSeries& drawdown) {
    double out = 0.0;
    for (double d : drawdown) {
        if (d < out) out = d;
    }
    return out;
}

ReturnSeries trade_returns(const std::vector<Trade>& trades, double initial_capital) {
    if (!(initial_capital > 0.0)) {
        throw InvalidInput("initial capital must be positive");
    }
    auto ordered = sorted_by_exit(trades);
    ReturnSeries out;
    out.reserve(ordered.size());
    for (const auto& t : ordered) out.push_back(t.profit_loss / initial_capital);
    return out;
}

std::vector<std::pair<Timestamp, double>> daily_pnl(const std::vector<Trade>& trades) {
    std::vector<std::pair<Timestamp, double>> out;
    if (trades.empty()) return out;
    std::map<int64_t, double> by_day;
    for (const auto& t : trades) by_day[day_index(t.exit_time)] += t.profit_loss;
    int64_t first = by_day.begin()->first;
    int64_t last = by_day.rbegin()->first;
    out.reserve(static_cast<size_t>(last - first + 1));
    for (int64_t d = first; d <= last; ++d) {
        auto it = by_day.find(d);
        out.emplace_back(Timestamp{} + std::chrono::seconds(d * kSecondsPerDay),
                         it == by_day.end() ? 0.0 : it->second);
    }
    return out;
}

ReturnSeries daily_returns(const std::vector<Trade>& trades, double initial_capital) {
    if (!(initial_capital > 0.0)) {
        throw InvalidInput("initial capital must be positive");
    }
    ReturnSeries out;
    for (const auto& [day, pnl] : daily_pnl(trades)) {
        (void)day;
        out.push_back(pnl / initial_capital);
    }
    return out;
}

Metric sharpe_ratio(const ReturnSeries& returns, double risk_free_rate, int periods_per_year) {
    auto excess = excess_returns(returns, risk_free_rate, periods_per_year);
    if (excess.size() < 2 || !all_finite(excess)) return Metric::undefined();
    double mean = mean_of(excess);
    double sd = stdev_of(excess, mean);
    if (!(sd > 0.0)) return Metric::undefined();
    return Metric::of(mean / sd * std::sqrt(static_cast<double>(periods_per_year)));
}

Metric sortino_ratio(const ReturnSeries& returns, double risk_free_rate, int periods_per_year) {
    auto excess = excess_returns(returns, risk_free_rate, periods_per_year);
    if (excess.size() < 2 || !all_finite(excess)) return Metric::undefined();
    double sum_sq = 0.0;
    size_t negatives = 0;
    for (double e : excess) {
        if (e < 0.0) {
            sum_sq += e * e;
            ++negatives;
        }
    }
    // No downside observed.
    if (negatives == 0) return Metric::undefined();
    double downside = std::sqrt(sum_sq / static_cast<double>(negatives));
    if (!(downside > 0.0)) return Metric::undefined();
    return Metric::of(mean_of(excess) / downside * std::sqrt(static_cast<double>(periods_per_year)));
}

Metric calmar_ratio(const Metric& cagr_value, double max_dd) {
    if (!cagr_value.has_value() || !std::isfinite(max_dd) || max_dd == 0.0) {
        return Metric::undefined();
    }
    return Metric::of(cagr_value.value() / std::fabs(max_dd));
}

Metric cagr(double initial_capital, double final_capital, double total_years) {
    if (!std::isfinite(initial_capital) || !std::isfinite(final_capital) || !std::isfinite(total_years)) {
        return Metric::undefined();
    }
    if (initial_capital <= 0.0) return Metric::undefined();
    // Total loss: -100%, not NaN from a fractional power of a negative base.
    if (final_capital <= 0.0) return Metric::of(-1.0);
    if (total_years <= 0.0) return Metric::undefined();
    return Metric::of(std::pow(final_capital / initial_capital, 1.0 / total_years) - 1.0);
}

Metric omega_ratio(const ReturnSeries& returns) {
    if (returns.empty() || !all_finite(returns)) return Metric::undefined();
    double gains = 0.0;
    double losses = 0.0;
    for (double r : returns) {
        if (r > 0.0) gains += r;
        else if (r < 0.0) losses -= r;
    }
    if (losses == 0.0) {
        return gains > 0.0 ? Metric::unbounded() : Metric::undefined();
    }
    return Metric::of(gains / losses);
}

Metric tail_ratio(const ReturnSeries& returns) {
    if (returns.empty() || !all_finite(returns)) return Metric::undefined();
    double p95 = percentile(returns, 95.0);
    double p05 = std::fabs(percentile(returns, 5.0));
    if (p05 == 0.0) return Metric::undefined();
    return Metric::of(p95 / p05);
}

WinLossStats win_loss_stats(const std::vector<Trade>& trades) {
    WinLossStats s;
    s.total = trades.size();
    bool anomaly = false;
    for (const auto& t : trades) {
        if (!std::isfinite(t.profit_loss)) {
            anomaly = true;
            continue;
        }
        if (t.profit_loss > 0.0) {
            ++s.wins;
            s.gross_profit += t.profit_loss;
        } else if (t.profit_loss < 0.0) {
            ++s.losses;
            s.gross_loss -= t.profit_loss;
        }
    }
    if (s.total == 0) return s;

    s.win_rate = Metric::of(static_cast<double>(s.wins) / static_cast<double>(s.total));
    if (anomaly) {
        spdlog::debug("win_loss_stats: non-finite profit_loss present, ratios undefined");
        return s;
    }
    if (s.wins > 0) s.avg_win = Metric::of(s.gross_profit / static_cast<double>(s.wins));
    if (s.losses > 0) s.avg_loss = Metric::of(s.gross_loss / static_cast<double>(s.losses));

    if (s.losses == 0) {
        s.profit_factor = s.wins > 0 ? Metric::unbounded() : Metric::undefined();
        s.risk_reward = s.wins > 0 ? Metric::unbounded() : Metric::undefined();
    } else {
        s.profit_factor = Metric::of(s.gross_profit / s.gross_loss);
        if (s.avg_win.has_value()) {
            s.risk_reward = Metric::of(s.avg_win.value() / s.avg_loss.value());
        }
    }
    return s;
}

double years_spanned(const std::vector<Trade>& trades) {
    if (trades.size() < 2) return 0.0;
    auto [lo, hi] = std::minmax_element(trades.begin(), trades.end(), [](const Trade& a, const Trade& b) {
        return a.exit_time < b.exit_time;
    });
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(hi->exit_time - lo->exit_time).count();
    return static_cast<double>(secs) / (kSecondsPerDay * kDaysPerYear);
}

double percentile(std::vector<double> data, double pct) {
    if (data.empty()) {
        throw InvalidInput("percentile of an empty series");
    }
    if (!(pct >= 0.0 && pct <= 100.0)) {
        throw InvalidInput("percentile must be within [0, 100]");
    }
    double pos = pct / 100.0 * static_cast<double>(data.size() - 1);
    auto lo = static_cast<size_t>(std::floor(pos));
    double frac = pos - static_cast<double>(lo);
    std::nth_element(data.begin(), data.begin() + static_cast<std::ptrdiff_t>(lo), data.end());
    double lo_val = data[lo];
    if (frac == 0.0 || lo + 1 >= data.size()) return lo_val;
    double hi_val = *std::min_element(data.begin() + static_cast<std::ptrdiff_t>(lo) + 1, data.end());
    return lo_val + (hi_val - lo_val) * frac;
}

} // namespace trade_analytics
