#include <gtest/gtest.h>
#include <cmath>
#include "../src/control/analytics_format.hpp"

using namespace trade_analytics;

TEST(AnalyticsFormatTest, MetricSentinels) {
    EXPECT_TRUE(analytics_format::metric(Metric::undefined()).is_null());
    EXPECT_EQ(analytics_format::metric(Metric::unbounded()).get<std::string>(), "unbounded");
    EXPECT_DOUBLE_EQ(analytics_format::metric(Metric::of(1.5)).get<double>(), 1.5);
}

TEST(AnalyticsFormatTest, SummaryCarriesEveryMetric) {
    AnalyticsConfig cfg;
    cfg.initial_capital = 1000.0;
    auto trades = analytics_format::parse_trades(nlohmann::json::parse(R"([
        {"exit_time": "2024-01-01T10:00:00Z", "symbol": "ES", "profit_loss": 10},
        {"exit_time": "2024-01-02T10:00:00Z", "symbol": "ES", "profit_loss": 20}
    ])"));
    auto out = analytics_format::format_summary(summarize(trades, cfg));
    EXPECT_EQ(out["profit_factor"].get<std::string>(), "unbounded");
    EXPECT_TRUE(out["sortino"].is_null());
    EXPECT_DOUBLE_EQ(out["net_profit"].get<double>(), 30.0);
    EXPECT_DOUBLE_EQ(out["initial_capital"].get<double>(), 1000.0);
    for (const auto& [name, value] : MetricsSummary{}.entries()) {
        (void)value;
        EXPECT_TRUE(out.contains(name)) << name;
    }
}

TEST(AnalyticsFormatTest, ParseTradesDerivesPnl) {
    auto trades = analytics_format::parse_trades(nlohmann::json::parse(R"([
        {"exit_time": "2024-03-04", "symbol": "CL", "entry_price": 70, "exit_price": 72, "size": 10}
    ])"));
    ASSERT_EQ(trades.size(), 1u);
    EXPECT_DOUBLE_EQ(trades[0].profit_loss, 20.0);
    EXPECT_EQ(trades[0].symbol, "CL");
}

TEST(AnalyticsFormatTest, ParseTradesRejectsBadRows) {
    EXPECT_THROW(analytics_format::parse_trades(nlohmann::json::object()), InvalidInput);
    EXPECT_THROW(analytics_format::parse_trades(nlohmann::json::parse(R"([{"symbol": "ES"}])")),
                 InvalidInput);
    EXPECT_THROW(analytics_format::parse_trades(nlohmann::json::parse(
                     R"([{"exit_time": "yesterday", "profit_loss": 1}])")),
                 InvalidInput);
    EXPECT_THROW(analytics_format::parse_trades(nlohmann::json::parse(
                     R"([{"exit_time": "2024-01-01", "symbol": "ES"}])")),
                 InvalidInput);
}

TEST(AnalyticsFormatTest, EquityPoints) {
    AnalyticsConfig cfg;
    cfg.initial_capital = 1000.0;
    auto trades = analytics_format::parse_trades(nlohmann::json::parse(R"([
        {"exit_time": "2024-01-01 10:00:00", "symbol": "ES", "profit_loss": 100},
        {"exit_time": "2024-01-02 10:00:00", "symbol": "ES", "profit_loss": -50}
    ])"));
    auto out = analytics_format::format_equity(build_equity_report(trades, cfg));
    ASSERT_EQ(out["points"].size(), 3u);
    EXPECT_EQ(out["points"][0]["time"].get<std::string>(), "2024-01-01T10:00:00Z");
    EXPECT_DOUBLE_EQ(out["points"][2]["equity"].get<double>(), 1050.0);
    EXPECT_NEAR(out["max_drawdown"].get<double>(), -50.0 / 1100.0, 1e-12);
}

TEST(AnalyticsFormatTest, LossBucketUpperBoundIsNullForLast) {
    auto out = analytics_format::format_losses(loss_breakdown({}, {3000.0}));
    ASSERT_EQ(out.size(), 2u);
    EXPECT_DOUBLE_EQ(out[0]["upper"].get<double>(), 3000.0);
    EXPECT_TRUE(out[1]["upper"].is_null());
    EXPECT_EQ(out[1]["severity"].get<std::string>(), "> 3000");
}

TEST(AnalyticsFormatTest, CheckedIntRejectsOutOfRange) {
    EXPECT_EQ(analytics_format::checked_int(252.0, "periods_per_year", 1, 1000000), 252);
    EXPECT_THROW(analytics_format::checked_int(1e20, "periods_per_year", 1, 1000000), InvalidInput);
    EXPECT_THROW(analytics_format::checked_int(-1e20, "window", 1, 36600), InvalidInput);
    EXPECT_THROW(analytics_format::checked_int(0.0, "window", 1, 36600), InvalidInput);
    EXPECT_THROW(analytics_format::checked_int(30.5, "window", 1, 36600), InvalidInput);
    EXPECT_THROW(analytics_format::checked_int(std::nan(""), "window", 1, 36600), InvalidInput);
}

TEST(AnalyticsFormatTest, JsonIntReadsBodyFields) {
    auto body = nlohmann::json::parse(R"({"paths": 500, "path_length": 1e12, "sample_paths": "ten"})");
    EXPECT_EQ(analytics_format::json_int(body, "paths", 1000, 1, 2147483647), 500);
    EXPECT_EQ(analytics_format::json_int(body, "seed", 7, 0, 10), 7);
    EXPECT_THROW(analytics_format::json_int(body, "path_length", 50, 0, 2147483647), InvalidInput);
    EXPECT_THROW(analytics_format::json_int(body, "sample_paths", 0, 0, 2147483647), InvalidInput);
}
