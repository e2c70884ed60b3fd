#include "performance_report.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <map>
#include <spdlog/spdlog.h>

namespace trade_analytics {

namespace {

constexpr int64_t kSecondsPerDay = 86400;

std::string format_amount(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%g", v);
    return std::string(buf);
}

} // namespace

std::vector<std::pair<std::string, Metric>> MetricsSummary::entries() const {
    return {
        {"net_profit", net_profit},
        {"roi", roi},
        {"profit_per_trade", profit_per_trade},
        {"final_capital", final_capital},
        {"cagr", cagr},
        {"sharpe", sharpe},
        {"sortino", sortino},
        {"calmar", calmar},
        {"omega", omega},
        {"tail_ratio", tail_ratio},
        {"profit_factor", profit_factor},
        {"risk_reward", risk_reward},
        {"win_rate", win_rate},
        {"avg_win", avg_win},
        {"avg_loss", avg_loss},
        {"max_drawdown", max_drawdown},
        {"max_drawdown_duration_days", Metric::of(static_cast<double>(max_drawdown_duration_days))},
        {"total_trades", Metric::of(static_cast<double>(total_trades))},
        {"trades_per_year", trades_per_year},
    };
}

std::vector<Trade> apply_slippage(const std::vector<Trade>& trades, double cost_per_trade) {
    std::vector<Trade> out = trades;
    if (cost_per_trade == 0.0) return out;
    for (auto& t : out) t.profit_loss -= cost_per_trade;
    return out;
}

std::vector<Trade> filter_by_date(const std::vector<Trade>& trades,
                                  std::optional<Timestamp> start,
                                  std::optional<Timestamp> end) {
    std::vector<Trade> out;
    out.reserve(trades.size());
    for (const auto& t : trades) {
        if (start && t.exit_time < *start) continue;
        if (end && t.exit_time > *end) continue;
        out.push_back(t);
    }
    return out;
}

std::vector<Trade> prepare_trades(const std::vector<Trade>& trades, const AnalyticsConfig& cfg) {
    return sorted_by_exit(apply_slippage(trades, cfg.slippage_per_trade));
}

ReturnSeries select_returns(const std::vector<Trade>& ordered, const AnalyticsConfig& cfg) {
    if (cfg.return_basis == ReturnBasis::DAILY) {
        return daily_returns(ordered, cfg.initial_capital);
    }
    return trade_returns(ordered, cfg.initial_capital);
}

int64_t max_drawdown_duration_days(const std::vector<Trade>& ordered, const DrawdownSeries& drawdown) {
    if (ordered.empty() || drawdown.size() != ordered.size() + 1) return 0;
    int64_t longest = 0;
    std::optional<Timestamp> run_start;
    Timestamp run_end{};
    auto close_run = [&]() {
        if (!run_start) return;
        auto secs = std::chrono::duration_cast<std::chrono::seconds>(run_end - *run_start).count();
        longest = std::max<int64_t>(longest, secs / kSecondsPerDay);
        run_start.reset();
    };
    // drawdown[0] is the starting capital and never underwater.
    for (size_t i = 1; i < drawdown.size(); ++i) {
        const Timestamp ts = ordered[i - 1].exit_time;
        if (drawdown[i] < 0.0) {
            if (!run_start) run_start = ts;
            run_end = ts;
        } else {
            close_run();
        }
    }
    close_run();
    return longest;
}

MetricsSummary summarize(const std::vector<Trade>& trades, const AnalyticsConfig& cfg) {
    if (trades.empty()) {
        throw InvalidInput("insufficient data: no trades to summarize");
    }
    if (!(cfg.initial_capital > 0.0)) {
        throw InvalidInput("initial capital must be positive");
    }
    if (cfg.periods_per_year <= 0) {
        throw InvalidInput("periods_per_year must be positive");
    }

    auto ordered = prepare_trades(trades, cfg);
    MetricsSummary s;
    s.total_trades = ordered.size();
    s.initial_capital = cfg.initial_capital;
    s.years = years_spanned(ordered);

    auto equity = build_equity_curve(ordered, cfg.initial_capital, cfg.mode);
    auto drawdown = compute_drawdown(equity);
    bool equity_finite = std::all_of(equity.begin(), equity.end(), [](double e) { return std::isfinite(e); });

    double final_capital = equity.back();
    s.final_capital = Metric::of(final_capital);
    s.net_profit = Metric::of(final_capital - cfg.initial_capital);
    if (s.net_profit.has_value()) {
        s.roi = Metric::of(s.net_profit.value() / cfg.initial_capital);
        s.profit_per_trade = Metric::of(s.net_profit.value() / static_cast<double>(s.total_trades));
    }

    s.max_drawdown = equity_finite ? Metric::of(max_drawdown(drawdown)) : Metric::undefined();
    s.max_drawdown_duration_days = max_drawdown_duration_days(ordered, drawdown);

    s.cagr = cagr(cfg.initial_capital, final_capital, s.years);
    s.calmar = s.max_drawdown.has_value() ? calmar_ratio(s.cagr, s.max_drawdown.value())
                                          : Metric::undefined();

    auto returns = select_returns(ordered, cfg);
    s.sharpe = sharpe_ratio(returns, cfg.risk_free_rate, cfg.periods_per_year);
    s.sortino = sortino_ratio(returns, cfg.risk_free_rate, cfg.periods_per_year);
    s.omega = omega_ratio(returns);
    s.tail_ratio = tail_ratio(returns);

    auto wl = win_loss_stats(ordered);
    s.win_rate = wl.win_rate;
    s.avg_win = wl.avg_win;
    s.avg_loss = wl.avg_loss;
    s.profit_factor = wl.profit_factor;
    s.risk_reward = wl.risk_reward;

    s.trades_per_year = s.years > 0.0 ? Metric::of(static_cast<double>(s.total_trades) / s.years)
                                      : Metric::of(static_cast<double>(s.total_trades));

    spdlog::debug("summarize: trades={} years={:.3f} final={} mode={}",
                  s.total_trades, s.years, final_capital, equity_mode_to_string(cfg.mode));
    return s;
}

EquityReport build_equity_report(const std::vector<Trade>& trades, const AnalyticsConfig& cfg) {
    auto ordered = prepare_trades(trades, cfg);
    EquityReport r;
    r.equity = build_equity_curve(ordered, cfg.initial_capital, cfg.mode);
    r.drawdown = compute_drawdown(r.equity);
    r.times.reserve(r.equity.size());
    r.times.push_back(ordered.front().exit_time);
    for (const auto& t : ordered) r.times.push_back(t.exit_time);
    return r;
}

std::vector<RollingPoint> rolling_sortino(const std::vector<Trade>& trades,
                                          int window_days,
                                          int periods_per_year) {
    if (window_days < 1) {
        throw InvalidInput("rolling window must be at least one day");
    }
    if (periods_per_year <= 0) {
        throw InvalidInput("periods_per_year must be positive");
    }
    auto days = daily_pnl(trades);
    std::vector<RollingPoint> out;
    out.reserve(days.size());
    const size_t w = static_cast<size_t>(window_days);
    const double annualize = std::sqrt(static_cast<double>(periods_per_year));
    double sum = 0.0;
    double downside_sq = 0.0;
    for (size_t i = 0; i < days.size(); ++i) {
        double v = days[i].second;
        sum += v;
        if (v < 0.0) downside_sq += v * v;
        if (i >= w) {
            double old = days[i - w].second;
            sum -= old;
            if (old < 0.0) downside_sq -= old * old;
        }
        RollingPoint p{days[i].first, Metric::undefined()};
        if (i + 1 >= w) {
            double mean = sum / static_cast<double>(w);
            // Positive days count as zero downside.
            double downside = std::sqrt(std::max(0.0, downside_sq) / static_cast<double>(w));
            if (downside > 1e-12) p.value = Metric::of(mean / downside * annualize);
        }
        out.push_back(p);
    }
    return out;
}

std::vector<MonthlyRow> monthly_matrix(const std::vector<Trade>& trades, double initial_capital) {
    if (!(initial_capital > 0.0)) {
        throw InvalidInput("initial capital must be positive");
    }
    std::map<int, MonthlyRow> years;
    for (const auto& t : trades) {
        std::tm tm = utils::ts_to_tm(t.exit_time);
        int year = tm.tm_year + 1900;
        auto& row = years[year];
        row.label = std::to_string(year);
        row.months[static_cast<size_t>(tm.tm_mon)] += t.profit_loss;
    }
    std::vector<MonthlyRow> out;
    MonthlyRow grand;
    grand.label = "Grand Total";
    for (auto& [year, row] : years) {
        (void)year;
        for (size_t m = 0; m < 12; ++m) {
            row.total += row.months[m];
            grand.months[m] += row.months[m];
        }
        row.return_pct = row.total / initial_capital * 100.0;
        grand.total += row.total;
        out.push_back(row);
    }
    grand.return_pct = grand.total / initial_capital * 100.0;
    out.push_back(grand);
    return out;
}

std::vector<LossBucket> loss_breakdown(const std::vector<Trade>& trades,
                                       const std::vector<double>& thresholds) {
    for (size_t i = 0; i < thresholds.size(); ++i) {
        if (!(thresholds[i] > 0.0) || (i > 0 && thresholds[i] <= thresholds[i - 1])) {
            throw InvalidInput("loss thresholds must be positive and strictly increasing");
        }
    }
    std::vector<LossBucket> buckets;
    double lower = 0.0;
    for (double th : thresholds) {
        LossBucket b;
        b.label = format_amount(lower) + " - " + format_amount(th);
        b.lower = lower;
        b.upper = th;
        buckets.push_back(b);
        lower = th;
    }
    LossBucket last;
    last.label = "> " + format_amount(lower);
    last.lower = lower;
    buckets.push_back(last);

    for (const auto& t : trades) {
        if (!(t.profit_loss < 0.0)) continue;
        double magnitude = -t.profit_loss;
        auto it = std::find_if(buckets.begin(), buckets.end(), [magnitude](const LossBucket& b) {
            return !b.upper || magnitude <= *b.upper;
        });
        it->count += 1;
        it->total_loss += t.profit_loss;
    }
    return buckets;
}

std::vector<WeekdayStats> weekday_breakdown(const std::vector<Trade>& trades) {
    std::array<WeekdayStats, 7> by_wday;
    std::array<size_t, 7> wins{};
    for (int d = 0; d < 7; ++d) by_wday[static_cast<size_t>(d)].day = utils::weekday_name(d);
    for (const auto& t : trades) {
        auto wday = static_cast<size_t>(utils::ts_to_tm(t.exit_time).tm_wday);
        by_wday[wday].count += 1;
        by_wday[wday].net_pnl += t.profit_loss;
        if (t.profit_loss > 0.0) wins[wday] += 1;
    }
    std::vector<WeekdayStats> out;
    out.reserve(7);
    // tm_wday is Sunday-based; report Monday first.
    for (int i = 1; i <= 7; ++i) {
        auto d = static_cast<size_t>(i % 7);
        auto stats = by_wday[d];
        if (stats.count > 0) {
            stats.win_rate = Metric::of(static_cast<double>(wins[d]) / static_cast<double>(stats.count));
        }
        out.push_back(stats);
    }
    return out;
}

std::vector<YearlyProjectionRow> yearly_projection(const std::vector<Trade>& trades,
                                                   double initial_capital,
                                                   EquityMode mode,
                                                   double tax_rate_pct) {
    if (!(initial_capital > 0.0)) {
        throw InvalidInput("initial capital must be positive");
    }
    if (tax_rate_pct < 0.0 || tax_rate_pct > 100.0) {
        throw InvalidInput("tax rate must be within [0, 100]");
    }
    std::map<int, double> by_year;
    for (const auto& t : trades) {
        by_year[utils::ts_to_tm(t.exit_time).tm_year + 1900] += t.profit_loss;
    }

    std::vector<YearlyProjectionRow> out;
    double current = initial_capital;
    double linear = initial_capital;
    size_t index = 0;
    for (const auto& [year, raw] : by_year) {
        YearlyProjectionRow row;
        row.year = year;
        if (mode == EquityMode::ADDITIVE) {
            row.scaling_factor = 1.0 + static_cast<double>(index);
        } else {
            row.scaling_factor = std::max(0.1, current / initial_capital);
        }
        double gross = raw * row.scaling_factor;
        row.raw_profit = raw;
        row.tax = gross > 0.0 ? gross * tax_rate_pct / 100.0 : 0.0;
        row.net_profit = gross - row.tax;
        row.start_balance = current;
        row.end_balance = current + row.net_profit;
        row.growth_pct = current > 0.0 ? Metric::of(row.net_profit / current * 100.0) : Metric::undefined();
        linear += raw;
        row.linear_equity = linear;
        out.push_back(row);
        current = row.end_balance;
        ++index;
    }
    return out;
}

std::vector<LeaderboardEntry> leaderboard(TradeSource& source,
                                          const std::vector<std::string>& tables,
                                          const AnalyticsConfig& cfg,
                                          std::optional<Timestamp> start,
                                          std::optional<Timestamp> end) {
    std::vector<LeaderboardEntry> out;
    for (const auto& table : tables) {
        std::vector<Trade> trades;
        try {
            trades = filter_by_date(source.fetch(table), start, end);
        } catch (const SourceError& e) {
            spdlog::error("leaderboard: skipping {}: {}", table, e.what());
            continue;
        }
        if (trades.empty()) {
            spdlog::debug("leaderboard: {} has no trades in range", table);
            continue;
        }
        out.push_back({table, summarize(trades, cfg)});
    }
    return out;
}

} // namespace trade_analytics
