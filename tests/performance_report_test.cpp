#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include "../src/core/errors.hpp"
#include "../src/core/performance_report.hpp"

using namespace trade_analytics;

namespace {

// 2024-01-01 00:00:00 UTC, a Monday.
Timestamp day(int offset) {
    return Timestamp{} + std::chrono::seconds(1704067200LL + static_cast<int64_t>(offset) * 86400);
}

Trade trade(int offset, double pnl) {
    Trade t;
    t.exit_time = day(offset);
    t.symbol = "NQ";
    t.profit_loss = pnl;
    return t;
}

AnalyticsConfig config(double capital) {
    AnalyticsConfig cfg;
    cfg.initial_capital = capital;
    return cfg;
}

std::vector<Trade> scenario_a() {
    return {trade(0, 100.0), trade(1, -50.0), trade(2, 200.0), trade(3, -100.0)};
}

} // namespace

TEST(PerformanceReportTest, SummaryScenarioA) {
    auto s = summarize(scenario_a(), config(1000.0));
    EXPECT_EQ(s.total_trades, 4u);
    EXPECT_DOUBLE_EQ(s.final_capital.value(), 1150.0);
    EXPECT_DOUBLE_EQ(s.net_profit.value(), 150.0);
    EXPECT_NEAR(s.roi.value(), 0.15, 1e-12);
    EXPECT_NEAR(s.profit_per_trade.value(), 37.5, 1e-12);
    EXPECT_NEAR(s.max_drawdown.value(), -0.08, 1e-12);
    EXPECT_DOUBLE_EQ(s.profit_factor.value(), 2.0);
    EXPECT_DOUBLE_EQ(s.win_rate.value(), 0.5);
    EXPECT_TRUE(s.sharpe.has_value());
    EXPECT_TRUE(s.cagr.has_value());
    EXPECT_TRUE(s.calmar.has_value());
    EXPECT_NEAR(s.years, 3.0 / 365.25, 1e-12);
}

TEST(PerformanceReportTest, SummaryIsDeterministic) {
    auto cfg = config(1000.0);
    auto a = summarize(scenario_a(), cfg).entries();
    auto b = summarize(scenario_a(), cfg).entries();
    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].first, b[i].first);
        EXPECT_EQ(a[i].second, b[i].second) << a[i].first;
    }
}

TEST(PerformanceReportTest, AllWinnersDoNotThrow) {
    auto s = summarize({trade(0, 10.0), trade(5, 20.0), trade(9, 30.0)}, config(1000.0));
    EXPECT_TRUE(s.profit_factor.is_unbounded());
    EXPECT_TRUE(s.sortino.is_undefined());
    EXPECT_TRUE(s.calmar.is_undefined());
    EXPECT_DOUBLE_EQ(s.max_drawdown.value(), 0.0);
}

TEST(PerformanceReportTest, SummaryRejectsBadInput) {
    EXPECT_THROW(summarize({}, config(1000.0)), InvalidInput);
    EXPECT_THROW(summarize(scenario_a(), config(0.0)), InvalidInput);
    auto cfg = config(1000.0);
    cfg.periods_per_year = 0;
    EXPECT_THROW(summarize(scenario_a(), cfg), InvalidInput);
}

TEST(PerformanceReportTest, SlippageReducesEveryTrade) {
    auto cfg = config(1000.0);
    cfg.slippage_per_trade = 10.0;
    auto s = summarize(scenario_a(), cfg);
    EXPECT_DOUBLE_EQ(s.net_profit.value(), 110.0);

    auto adjusted = apply_slippage(scenario_a(), 2.5);
    EXPECT_DOUBLE_EQ(adjusted[0].profit_loss, 97.5);
    EXPECT_DOUBLE_EQ(adjusted[1].profit_loss, -52.5);
}

TEST(PerformanceReportTest, FilterByDateIsInclusive) {
    auto kept = filter_by_date(scenario_a(), day(1), day(2));
    ASSERT_EQ(kept.size(), 2u);
    EXPECT_DOUBLE_EQ(kept[0].profit_loss, -50.0);
    EXPECT_DOUBLE_EQ(kept[1].profit_loss, 200.0);
    EXPECT_EQ(filter_by_date(scenario_a(), std::nullopt, day(0)).size(), 1u);
    EXPECT_EQ(filter_by_date(scenario_a(), std::nullopt, std::nullopt).size(), 4u);
}

TEST(PerformanceReportTest, DailyReturnBasis) {
    auto cfg = config(1000.0);
    cfg.return_basis = ReturnBasis::DAILY;
    std::vector<Trade> trades{trade(0, 100.0), trade(0, -30.0), trade(2, -20.0), trade(4, 50.0)};
    auto returns = select_returns(sorted_by_exit(trades), cfg);
    ASSERT_EQ(returns.size(), 5u);
    EXPECT_NEAR(returns[0], 0.07, 1e-12);
    EXPECT_DOUBLE_EQ(returns[1], 0.0);
    EXPECT_TRUE(summarize(trades, cfg).sharpe.has_value());
}

TEST(PerformanceReportTest, EquityReportAlignsTimes) {
    auto r = build_equity_report(scenario_a(), config(1000.0));
    ASSERT_EQ(r.times.size(), r.equity.size());
    ASSERT_EQ(r.drawdown.size(), r.equity.size());
    EXPECT_EQ(r.times[0], day(0));
    EXPECT_EQ(r.times[4], day(3));
    EXPECT_DOUBLE_EQ(r.equity.back(), 1150.0);
}

TEST(PerformanceReportTest, MaxDrawdownDuration) {
    std::vector<Trade> trades{trade(0, 100.0), trade(5, -50.0), trade(12, -10.0), trade(20, 200.0)};
    auto ordered = sorted_by_exit(trades);
    auto dd = compute_drawdown(build_equity_curve(ordered, 1000.0, EquityMode::ADDITIVE));
    EXPECT_EQ(max_drawdown_duration_days(ordered, dd), 7);
    EXPECT_EQ(summarize(trades, config(1000.0)).max_drawdown_duration_days, 7);
}

TEST(PerformanceReportTest, RollingSortino) {
    std::vector<Trade> trades{trade(0, 10.0), trade(1, 20.0), trade(2, -5.0), trade(3, 15.0)};
    auto points = rolling_sortino(trades, 2, 252);
    ASSERT_EQ(points.size(), 4u);
    EXPECT_TRUE(points[0].value.is_undefined());
    // Window without a losing day.
    EXPECT_TRUE(points[1].value.is_undefined());
    double downside = std::sqrt(25.0 / 2.0);
    EXPECT_NEAR(points[2].value.value(), 7.5 / downside * std::sqrt(252.0), 1e-9);
    EXPECT_NEAR(points[3].value.value(), 5.0 / downside * std::sqrt(252.0), 1e-9);
    EXPECT_THROW(rolling_sortino(trades, 0, 252), InvalidInput);
}

TEST(PerformanceReportTest, MonthlyMatrixGrandTotal) {
    std::vector<Trade> trades{trade(0, 100.0), trade(10, -40.0), trade(31, 250.0), trade(366, 75.0)};
    auto rows = monthly_matrix(trades, 1000.0);
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0].label, "2024");
    EXPECT_DOUBLE_EQ(rows[0].months[0], 60.0);
    EXPECT_DOUBLE_EQ(rows[0].months[1], 250.0);
    EXPECT_DOUBLE_EQ(rows[0].total, 310.0);
    EXPECT_NEAR(rows[0].return_pct, 31.0, 1e-12);
    EXPECT_EQ(rows[1].label, "2025");
    EXPECT_DOUBLE_EQ(rows[1].months[0], 75.0);
    EXPECT_EQ(rows[2].label, "Grand Total");
    EXPECT_DOUBLE_EQ(rows[2].months[0], 135.0);
    EXPECT_DOUBLE_EQ(rows[2].total, 385.0);

    auto s = summarize(trades, config(1000.0));
    EXPECT_NEAR(rows[2].total, s.net_profit.value(), 1e-9);
}

TEST(PerformanceReportTest, LossBreakdownBuckets) {
    std::vector<Trade> trades{trade(0, -1000.0), trade(1, -3000.0), trade(2, -4000.0),
                              trade(3, -12000.0), trade(4, 500.0)};
    auto buckets = loss_breakdown(trades, {3000.0, 5000.0, 10000.0});
    ASSERT_EQ(buckets.size(), 4u);
    EXPECT_EQ(buckets[0].label, "0 - 3000");
    EXPECT_EQ(buckets[0].count, 2u);
    EXPECT_DOUBLE_EQ(buckets[0].total_loss, -4000.0);
    EXPECT_EQ(buckets[1].label, "3000 - 5000");
    EXPECT_EQ(buckets[1].count, 1u);
    EXPECT_EQ(buckets[2].count, 0u);
    EXPECT_EQ(buckets[3].label, "> 10000");
    EXPECT_FALSE(buckets[3].upper.has_value());
    EXPECT_EQ(buckets[3].count, 1u);
    EXPECT_DOUBLE_EQ(buckets[3].total_loss, -12000.0);

    EXPECT_THROW(loss_breakdown(trades, {5000.0, 3000.0}), InvalidInput);
    EXPECT_THROW(loss_breakdown(trades, {0.0}), InvalidInput);
}

TEST(PerformanceReportTest, WeekdayBreakdownStartsMonday) {
    std::vector<Trade> trades{trade(0, 10.0), trade(0, -5.0), trade(1, 20.0), trade(6, -1.0)};
    auto days = weekday_breakdown(trades);
    ASSERT_EQ(days.size(), 7u);
    EXPECT_EQ(days[0].day, "Monday");
    EXPECT_EQ(days[0].count, 2u);
    EXPECT_DOUBLE_EQ(days[0].net_pnl, 5.0);
    EXPECT_DOUBLE_EQ(days[0].win_rate.value(), 0.5);
    EXPECT_EQ(days[1].day, "Tuesday");
    EXPECT_DOUBLE_EQ(days[1].win_rate.value(), 1.0);
    EXPECT_TRUE(days[2].win_rate.is_undefined());
    EXPECT_EQ(days[6].day, "Sunday");
    EXPECT_EQ(days[6].count, 1u);
}

TEST(PerformanceReportTest, YearlyProjectionAdditive) {
    std::vector<Trade> trades{trade(10, 1000.0), trade(400, 500.0)};
    auto rows = yearly_projection(trades, 10000.0, EquityMode::ADDITIVE, 10.0);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].year, 2024);
    EXPECT_DOUBLE_EQ(rows[0].scaling_factor, 1.0);
    EXPECT_DOUBLE_EQ(rows[0].tax, 100.0);
    EXPECT_DOUBLE_EQ(rows[0].end_balance, 10900.0);
    EXPECT_DOUBLE_EQ(rows[1].scaling_factor, 2.0);
    EXPECT_DOUBLE_EQ(rows[1].net_profit, 900.0);
    EXPECT_DOUBLE_EQ(rows[1].end_balance, 11800.0);
    EXPECT_DOUBLE_EQ(rows[1].linear_equity, 11500.0);
}

TEST(PerformanceReportTest, YearlyProjectionCompounding) {
    std::vector<Trade> trades{trade(10, 1000.0), trade(400, 500.0), trade(800, -200.0)};
    auto rows = yearly_projection(trades, 10000.0, EquityMode::COMPOUNDING, 10.0);
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_NEAR(rows[1].scaling_factor, 1.09, 1e-12);
    EXPECT_NEAR(rows[1].tax, 54.5, 1e-9);
    EXPECT_NEAR(rows[1].net_profit, 490.5, 1e-9);
    // Losing years are not taxed.
    EXPECT_DOUBLE_EQ(rows[2].tax, 0.0);
    EXPECT_LT(rows[2].net_profit, 0.0);
    EXPECT_THROW(yearly_projection(trades, 10000.0, EquityMode::ADDITIVE, 150.0), InvalidInput);
}

TEST(PerformanceReportTest, LeaderboardSkipsMissingAndEmpty) {
    MemoryTradeSource source;
    source.put("alpha", scenario_a());
    source.put("beta", {trade(0, 50.0), trade(40, 75.0)});
    source.put("empty", {});

    auto entries = leaderboard(source, {"alpha", "beta", "empty", "missing"}, config(1000.0),
                               std::nullopt, std::nullopt);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].strategy, "alpha");
    EXPECT_EQ(entries[1].strategy, "beta");
    EXPECT_DOUBLE_EQ(entries[1].summary.net_profit.value(), 125.0);

    auto windowed = leaderboard(source, source.list_tables(), config(1000.0), day(10), std::nullopt);
    ASSERT_EQ(windowed.size(), 1u);
    EXPECT_EQ(windowed[0].strategy, "beta");
    EXPECT_EQ(windowed[0].summary.total_trades, 1u);
}

TEST(PerformanceReportTest, NonFinitePnlLeavesCountsDefined) {
    std::vector<Trade> trades{trade(0, 100.0), trade(1, std::nan("")), trade(2, -50.0),
                              trade(3, std::numeric_limits<double>::infinity()), trade(4, 30.0)};
    MetricsSummary s;
    ASSERT_NO_THROW(s = summarize(trades, config(1000.0)));
    EXPECT_FALSE(s.sharpe.has_value());
    EXPECT_FALSE(s.max_drawdown.has_value());
    EXPECT_FALSE(s.final_capital.has_value());
    EXPECT_FALSE(s.profit_factor.has_value());
    ASSERT_TRUE(s.win_rate.has_value());
    EXPECT_DOUBLE_EQ(s.win_rate.value(), 0.4);
    EXPECT_EQ(s.total_trades, 5u);
    EXPECT_TRUE(s.trades_per_year.has_value());
}
