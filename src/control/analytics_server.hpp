#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <drogon/HttpController.h>
#include <nlohmann/json.hpp>
#include "../core/config.hpp"
#include "../core/simulation_engine.hpp"
#include "../core/trade_source.hpp"

namespace trade_analytics {

class AnalyticsServer : public drogon::HttpController<AnalyticsServer> {
public:
    static const bool isAutoCreation = false;
    METHOD_LIST_BEGIN
    ADD_METHOD_TO(AnalyticsServer::health, "/health", drogon::Get);
    ADD_METHOD_TO(AnalyticsServer::listStrategies, "/strategies", drogon::Get);
    ADD_METHOD_TO(AnalyticsServer::metrics, "/strategies/{1}/metrics", drogon::Get);
    ADD_METHOD_TO(AnalyticsServer::equity, "/strategies/{1}/equity", drogon::Get);
    ADD_METHOD_TO(AnalyticsServer::matrix, "/strategies/{1}/matrix", drogon::Get);
    ADD_METHOD_TO(AnalyticsServer::losses, "/strategies/{1}/losses", drogon::Get);
    ADD_METHOD_TO(AnalyticsServer::weekdays, "/strategies/{1}/weekdays", drogon::Get);
    ADD_METHOD_TO(AnalyticsServer::projection, "/strategies/{1}/projection", drogon::Get);
    ADD_METHOD_TO(AnalyticsServer::rollingSortino, "/strategies/{1}/rolling_sortino", drogon::Get);
    ADD_METHOD_TO(AnalyticsServer::simulate, "/strategies/{1}/simulate", drogon::Post);
    ADD_METHOD_TO(AnalyticsServer::leaderboard, "/leaderboard", drogon::Get);
    ADD_METHOD_TO(AnalyticsServer::analyze, "/analyze", drogon::Post);
    METHOD_LIST_END

    using Callback = std::function<void (const drogon::HttpResponsePtr &)>;

    AnalyticsServer(std::shared_ptr<TradeSource> source, const Config& cfg);

    void health(const drogon::HttpRequestPtr& req, Callback &&callback);
    void listStrategies(const drogon::HttpRequestPtr& req, Callback &&callback);
    void metrics(const drogon::HttpRequestPtr& req, Callback &&callback, std::string name);
    void equity(const drogon::HttpRequestPtr& req, Callback &&callback, std::string name);
    void matrix(const drogon::HttpRequestPtr& req, Callback &&callback, std::string name);
    void losses(const drogon::HttpRequestPtr& req, Callback &&callback, std::string name);
    void weekdays(const drogon::HttpRequestPtr& req, Callback &&callback, std::string name);
    void projection(const drogon::HttpRequestPtr& req, Callback &&callback, std::string name);
    void rollingSortino(const drogon::HttpRequestPtr& req, Callback &&callback, std::string name);
    void simulate(const drogon::HttpRequestPtr& req, Callback &&callback, std::string name);
    void leaderboard(const drogon::HttpRequestPtr& req, Callback &&callback);
    void analyze(const drogon::HttpRequestPtr& req, Callback &&callback);

private:
    bool authorize(const drogon::HttpRequestPtr& req) const;
    drogon::HttpResponsePtr unauthorized();
    drogon::HttpResponsePtr json_resp(nlohmann::json body, int code = 200);

    // Runs fn and maps InvalidInput/SourceError/parse failures to HTTP errors.
    void respond(const std::string& route, Callback& callback, const std::function<nlohmann::json()>& fn);

    // Config defaults overridden by query parameters.
    AnalyticsConfig analytics_from(const drogon::HttpRequestPtr& req) const;
    std::vector<Trade> load_trades(const drogon::HttpRequestPtr& req, const std::string& name);
    SimulationParams simulation_from(const nlohmann::json& body,
                                     const AnalyticsConfig& analytics,
                                     size_t history_length) const;

    std::shared_ptr<TradeSource> source_;
    Config cfg_;
    SimulationEngine engine_;
};

} // namespace trade_analytics
