#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace trade_analytics {

using Timestamp = std::chrono::system_clock::time_point;

// One closed position, already normalized by the ingestion layer.
struct Trade {
    Timestamp exit_time;
    std::string symbol;
    double entry_price{0.0};
    double exit_price{0.0};
    double size{0.0};
    double profit_loss{0.0};
};

enum class EquityMode {
    ADDITIVE,     // equity[i] = equity[i-1] + profit_loss[i]
    COMPOUNDING   // equity[i] = equity[i-1] * (1 + profit_loss[i] / initial_capital)
};

inline const char* equity_mode_to_string(EquityMode mode) {
    switch (mode) {
        case EquityMode::ADDITIVE: return "additive";
        case EquityMode::COMPOUNDING: return "compounding";
    }
    return "additive";
}

inline bool parse_equity_mode(const std::string& s, EquityMode& out) {
    if (s == "additive" || s == "linear") {
        out = EquityMode::ADDITIVE;
        return true;
    }
    if (s == "compounding" || s == "compound" || s == "proportional") {
        out = EquityMode::COMPOUNDING;
        return true;
    }
    return false;
}

// Stable sort by exit_time so trades closing at the same instant keep input order.
std::vector<Trade> sorted_by_exit(std::vector<Trade> trades);

} // namespace trade_analytics
