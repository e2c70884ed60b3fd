#include "analytics_server.hpp"
#include "analytics_format.hpp"
#include "../core/errors.hpp"
#include "../core/performance_report.hpp"
#include "../core/utils.hpp"
#include <limits>
#include <spdlog/spdlog.h>
#include <drogon/drogon.h>

using json = nlohmann::json;

namespace trade_analytics {

namespace {

constexpr int kMaxPeriodsPerYear = 1000000;
constexpr int kMaxWindowDays = 36600;
constexpr int kIntMax = std::numeric_limits<int>::max();

std::optional<double> query_double(const drogon::HttpRequestPtr& req, const std::string& key) {
    auto raw = req->getParameter(key);
    if (raw.empty()) return std::nullopt;
    auto v = utils::parse_double(raw);
    if (!v) throw InvalidInput("query parameter " + key + " is not a number");
    return v;
}

std::optional<Timestamp> query_time(const drogon::HttpRequestPtr& req, const std::string& key) {
    auto raw = req->getParameter(key);
    if (raw.empty()) return std::nullopt;
    auto ts = utils::parse_ts_any(raw);
    if (!ts) throw InvalidInput("query parameter " + key + " is not a date or timestamp");
    return ts;
}

} // namespace

AnalyticsServer::AnalyticsServer(std::shared_ptr<TradeSource> source, const Config& cfg)
    : source_(std::move(source))
    , cfg_(cfg) {}

drogon::HttpResponsePtr AnalyticsServer::unauthorized() {
    return json_resp(json{{"error", "unauthorized"}}, 401);
}

drogon::HttpResponsePtr AnalyticsServer::json_resp(json body, int code) {
    auto resp = drogon::HttpResponse::newHttpResponse();
    resp->setStatusCode(static_cast<drogon::HttpStatusCode>(code));
    resp->setContentTypeCode(drogon::CT_APPLICATION_JSON);
    resp->setBody(body.dump());
    return resp;
}

bool AnalyticsServer::authorize(const drogon::HttpRequestPtr& req) const {
    if (cfg_.auth.token.empty()) return true;
    auto auth = req->getHeader("authorization");
    std::string expected = "Bearer " + cfg_.auth.token;
    return auth == expected;
}

void AnalyticsServer::respond(const std::string& route, Callback& callback, const std::function<json()>& fn) {
    try {
        callback(json_resp(fn()));
    } catch (const InvalidInput& e) {
        callback(json_resp(json{{"error", e.what()}, {"kind", "invalid_input"}}, 400));
    } catch (const SourceError& e) {
        if (e.not_found()) {
            callback(json_resp(json{{"error", e.what()}}, 404));
        } else {
            spdlog::error("{}: source failure: {}", route, e.what());
            callback(json_resp(json{{"error", e.what()}}, 500));
        }
    } catch (const json::exception& e) {
        callback(json_resp(json{{"error", std::string("invalid json: ") + e.what()}}, 400));
    } catch (const std::exception& e) {
        spdlog::error("{} failed: {}", route, e.what());
        callback(json_resp(json{{"error", e.what()}}, 500));
    }
}

AnalyticsConfig AnalyticsServer::analytics_from(const drogon::HttpRequestPtr& req) const {
    AnalyticsConfig a = cfg_.analytics;
    if (auto v = query_double(req, "capital")) a.initial_capital = *v;
    if (auto v = query_double(req, "risk_free_rate")) a.risk_free_rate = *v;
    if (auto v = query_double(req, "periods_per_year")) {
        a.periods_per_year = analytics_format::checked_int(*v, "periods_per_year", 1, kMaxPeriodsPerYear);
    }
    if (auto v = query_double(req, "slippage")) a.slippage_per_trade = *v;
    if (auto v = query_double(req, "tax_rate")) a.tax_rate_pct = *v;
    if (auto v = query_double(req, "window")) {
        a.rolling_window_days = analytics_format::checked_int(*v, "window", 1, kMaxWindowDays);
    }
    auto mode = req->getParameter("mode");
    if (!mode.empty() && !parse_equity_mode(mode, a.mode)) {
        throw InvalidInput("unknown equity mode: " + mode);
    }
    auto basis = req->getParameter("basis");
    if (basis == "daily") a.return_basis = ReturnBasis::DAILY;
    else if (basis == "per_trade") a.return_basis = ReturnBasis::PER_TRADE;
    else if (!basis.empty()) throw InvalidInput("unknown return basis: " + basis);
    return a;
}

std::vector<Trade> AnalyticsServer::load_trades(const drogon::HttpRequestPtr& req, const std::string& name) {
    auto start = query_time(req, "start");
    auto end = query_time(req, "end");
    auto trades = filter_by_date(source_->fetch(name), start, end);
    if (trades.empty()) {
        throw InvalidInput("insufficient data: no trades for " + name + " in the selected range");
    }
    return trades;
}

SimulationParams AnalyticsServer::simulation_from(const json& body,
                                                  const AnalyticsConfig& analytics,
                                                  size_t history_length) const {
    SimulationConfig sim = cfg_.simulation;
    sim.paths = analytics_format::json_int(body, "paths", sim.paths, 1, kIntMax);
    sim.path_length = analytics_format::json_int(body, "path_length", sim.path_length, 0, kIntMax);
    if (body.contains("seed")) {
        if (body["seed"].is_null()) sim.seed.reset();
        else sim.seed = body["seed"].get<uint64_t>();
    }
    sim.percentiles = body.value("percentiles", sim.percentiles);
    sim.target_multiple = body.value("target_multiple", sim.target_multiple);
    sim.sample_paths = analytics_format::json_int(body, "sample_paths", sim.sample_paths, 0, kIntMax);
    if (body.contains("method")) {
        auto method = body["method"].get<std::string>();
        if (method == "bootstrap") sim.method = SamplingMethod::BOOTSTRAP;
        else if (method == "permutation") sim.method = SamplingMethod::PERMUTATION;
        else throw InvalidInput("unknown sampling method: " + method);
    }
    auto params = make_simulation_params(sim, analytics, history_length);
    if (body.contains("initial_capital")) {
        params.initial_capital = body["initial_capital"].get<double>();
    }
    // Checked after path_length 0 has been resolved to the history length.
    enforce_simulation_limits(params, cfg_.simulation);
    return params;
}

void AnalyticsServer::health(const drogon::HttpRequestPtr& req, Callback &&callback) {
    (void)req;
    callback(json_resp(json{{"status", "ok"}}));
}

void AnalyticsServer::listStrategies(const drogon::HttpRequestPtr& req, Callback &&callback) {
    if (!authorize(req)) { callback(unauthorized()); return; }
    respond("strategies", callback, [&] {
        return json{{"strategies", source_->list_tables()}};
    });
}

void AnalyticsServer::metrics(const drogon::HttpRequestPtr& req, Callback &&callback, std::string name) {
    if (!authorize(req)) { callback(unauthorized()); return; }
    respond("metrics", callback, [&] {
        auto cfg = analytics_from(req);
        auto out = analytics_format::format_summary(summarize(load_trades(req, name), cfg));
        out["strategy"] = name;
        out["mode"] = equity_mode_to_string(cfg.mode);
        return out;
    });
}

void AnalyticsServer::equity(const drogon::HttpRequestPtr& req, Callback &&callback, std::string name) {
    if (!authorize(req)) { callback(unauthorized()); return; }
    respond("equity", callback, [&] {
        auto cfg = analytics_from(req);
        return analytics_format::format_equity(build_equity_report(load_trades(req, name), cfg));
    });
}

void AnalyticsServer::matrix(const drogon::HttpRequestPtr& req, Callback &&callback, std::string name) {
    if (!authorize(req)) { callback(unauthorized()); return; }
    respond("matrix", callback, [&] {
        auto cfg = analytics_from(req);
        auto trades = prepare_trades(load_trades(req, name), cfg);
        return analytics_format::format_matrix(monthly_matrix(trades, cfg.initial_capital));
    });
}

void AnalyticsServer::losses(const drogon::HttpRequestPtr& req, Callback &&callback, std::string name) {
    if (!authorize(req)) { callback(unauthorized()); return; }
    respond("losses", callback, [&] {
        auto cfg = analytics_from(req);
        auto trades = prepare_trades(load_trades(req, name), cfg);
        return analytics_format::format_losses(loss_breakdown(trades, cfg.loss_thresholds));
    });
}

void AnalyticsServer::weekdays(const drogon::HttpRequestPtr& req, Callback &&callback, std::string name) {
    if (!authorize(req)) { callback(unauthorized()); return; }
    respond("weekdays", callback, [&] {
        auto cfg = analytics_from(req);
        return analytics_format::format_weekdays(weekday_breakdown(prepare_trades(load_trades(req, name), cfg)));
    });
}

void AnalyticsServer::projection(const drogon::HttpRequestPtr& req, Callback &&callback, std::string name) {
    if (!authorize(req)) { callback(unauthorized()); return; }
    respond("projection", callback, [&] {
        auto cfg = analytics_from(req);
        auto scaling = req->getParameter("scaling");
        EquityMode mode = cfg.mode;
        if (scaling == "linear") mode = EquityMode::ADDITIVE;
        else if (scaling == "proportional") mode = EquityMode::COMPOUNDING;
        else if (!scaling.empty()) throw InvalidInput("unknown scaling: " + scaling);
        auto trades = prepare_trades(load_trades(req, name), cfg);
        return analytics_format::format_projection(
            yearly_projection(trades, cfg.initial_capital, mode, cfg.tax_rate_pct));
    });
}

void AnalyticsServer::rollingSortino(const drogon::HttpRequestPtr& req, Callback &&callback, std::string name) {
    if (!authorize(req)) { callback(unauthorized()); return; }
    respond("rolling_sortino", callback, [&] {
        auto cfg = analytics_from(req);
        auto trades = prepare_trades(load_trades(req, name), cfg);
        return analytics_format::format_rolling(
            rolling_sortino(trades, cfg.rolling_window_days, cfg.periods_per_year));
    });
}

void AnalyticsServer::simulate(const drogon::HttpRequestPtr& req, Callback &&callback, std::string name) {
    if (!authorize(req)) { callback(unauthorized()); return; }
    respond("simulate", callback, [&] {
        auto cfg = analytics_from(req);
        auto body_raw = req->getBody();
        json body = body_raw.empty() ? json::object() : json::parse(body_raw);
        auto trades = prepare_trades(load_trades(req, name), cfg);
        auto returns = trade_returns(trades, cfg.initial_capital);
        auto params = simulation_from(body, cfg, returns.size());
        auto result = engine_.run(returns, params);
        spdlog::info("simulate {}: paths={} length={} seed={}", name, result.paths, result.path_length, result.seed);
        auto out = analytics_format::format_simulation(result);
        out["strategy"] = name;
        return out;
    });
}

void AnalyticsServer::leaderboard(const drogon::HttpRequestPtr& req, Callback &&callback) {
    if (!authorize(req)) { callback(unauthorized()); return; }
    respond("leaderboard", callback, [&] {
        auto cfg = analytics_from(req);
        auto start = query_time(req, "start");
        auto end = query_time(req, "end");
        auto entries = trade_analytics::leaderboard(*source_, source_->list_tables(), cfg, start, end);
        return json{{"strategies", analytics_format::format_leaderboard(entries)}};
    });
}

void AnalyticsServer::analyze(const drogon::HttpRequestPtr& req, Callback &&callback) {
    if (!authorize(req)) { callback(unauthorized()); return; }
    respond("analyze", callback, [&] {
        auto body = json::parse(req->getBody());
        AnalyticsConfig cfg = analytics_from(req);
        cfg.initial_capital = body.value("initial_capital", cfg.initial_capital);
        cfg.risk_free_rate = body.value("risk_free_rate", cfg.risk_free_rate);
        cfg.periods_per_year = analytics_format::json_int(body, "periods_per_year", cfg.periods_per_year,
                                                          1, kMaxPeriodsPerYear);
        cfg.slippage_per_trade = body.value("slippage_per_trade", cfg.slippage_per_trade);
        if (body.contains("mode")) {
            auto mode = body["mode"].get<std::string>();
            if (!parse_equity_mode(mode, cfg.mode)) throw InvalidInput("unknown equity mode: " + mode);
        }
        auto trades = analytics_format::parse_trades(body.at("trades"));

        json out;
        out["metrics"] = analytics_format::format_summary(summarize(trades, cfg));
        out["equity"] = analytics_format::format_equity(build_equity_report(trades, cfg));
        if (body.contains("simulation")) {
            auto returns = trade_returns(prepare_trades(trades, cfg), cfg.initial_capital);
            auto params = simulation_from(body["simulation"], cfg, returns.size());
            out["simulation"] = analytics_format::format_simulation(engine_.run(returns, params));
        }
        return out;
    });
}

} // namespace trade_analytics
