#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <drogon/drogon.h>
#include "core/config.hpp"
#include "core/csv_trade_source.hpp"
#include "core/logging.hpp"
#include "control/analytics_server.hpp"

int main(int argc, char* argv[]) {
    std::string config_path = "config/settings.json";
    if (argc > 1) {
        config_path = argv[1];
    }

    trade_analytics::Config cfg;
    try {
        trade_analytics::load_config(cfg, config_path);
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Invalid config {}: {}", config_path, e.what());
        return 1;
    }

    trade_analytics::init_logging(cfg.logging);
    spdlog::info("Trade analytics starting. port={} bind={} data={}",
                 cfg.services.port, cfg.services.bind_address, cfg.source.directory);

    auto source = std::make_shared<trade_analytics::CsvTradeSource>(cfg.source.directory);
    auto ctrl = std::make_shared<trade_analytics::AnalyticsServer>(source, cfg);
    drogon::app().addListener(cfg.services.bind_address, cfg.services.port);
    // 0 lets Drogon use one IO thread per core
    drogon::app().setThreadNum(cfg.services.threads > 0 ? static_cast<size_t>(cfg.services.threads) : 0);
    drogon::app().registerController(ctrl);
    spdlog::info("Starting Drogon listener on {}:{}", cfg.services.bind_address, cfg.services.port);
    drogon::app().run();
    return 0;
}
