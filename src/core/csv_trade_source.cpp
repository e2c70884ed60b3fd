#include "csv_trade_source.hpp"
#include "utils.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <unordered_map>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace trade_analytics {

namespace {

const char* kExcludedMarkers[] = {"MASTER", "Matrix", "Combined", "Processed", "Graph", "Heatmap"};

struct ColumnMap {
    int exit_time{-1};
    int symbol{-1};
    int entry_price{-1};
    int exit_price{-1};
    int size{-1};
    int profit_loss{-1};
    int type{-1};

    bool can_derive_pnl() const { return entry_price >= 0 && exit_price >= 0 && size >= 0; }
};

ColumnMap map_header(const std::vector<std::string>& header) {
    static const std::unordered_map<std::string, int ColumnMap::*> names{
        {"exit_time", &ColumnMap::exit_time},
        {"symbol", &ColumnMap::symbol},
        {"entry_price", &ColumnMap::entry_price},
        {"exit_price", &ColumnMap::exit_price},
        {"size", &ColumnMap::size},
        {"profit_loss", &ColumnMap::profit_loss},
        {"type", &ColumnMap::type},
    };
    ColumnMap cols;
    for (size_t i = 0; i < header.size(); ++i) {
        auto it = names.find(utils::to_lower(header[i]));
        if (it != names.end() && cols.*(it->second) < 0) {
            cols.*(it->second) = static_cast<int>(i);
        }
    }
    return cols;
}

const std::string& field(const std::vector<std::string>& row, int idx) {
    static const std::string empty;
    if (idx < 0 || static_cast<size_t>(idx) >= row.size()) return empty;
    return row[static_cast<size_t>(idx)];
}

} // namespace

CsvTradeSource::CsvTradeSource(std::string directory)
    : directory_(std::move(directory)) {}

bool CsvTradeSource::is_strategy_file(const std::string& filename) {
    if (filename.empty() || filename.front() == '~') return false;
    for (const char* marker : kExcludedMarkers) {
        if (filename.find(marker) != std::string::npos) return false;
    }
    return true;
}

std::vector<std::string> CsvTradeSource::list_tables() {
    std::vector<std::string> out;
    std::error_code ec;
    if (!fs::is_directory(directory_, ec)) {
        spdlog::warn("Trade directory {} does not exist", directory_);
        return out;
    }
    try {
        for (const auto& entry : fs::directory_iterator(directory_, ec)) {
            if (!entry.is_regular_file()) continue;
            const auto path = entry.path();
            if (utils::to_lower(path.extension().string()) != ".csv") continue;
            auto name = path.filename().string();
            if (!is_strategy_file(name)) continue;
            out.push_back(path.stem().string());
        }
    } catch (const fs::filesystem_error& e) {
        throw SourceError("cannot list " + directory_ + ": " + e.what());
    }
    if (ec) {
        throw SourceError("cannot list " + directory_ + ": " + ec.message());
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::vector<Trade> CsvTradeSource::fetch(const std::string& table) {
    if (table.empty() || table.find('/') != std::string::npos || table.find("..") != std::string::npos) {
        throw SourceError("invalid trade table name: " + table, true);
    }
    fs::path path = fs::path(directory_) / (table + ".csv");
    if (!is_strategy_file(path.filename().string())) {
        throw SourceError("not a strategy table: " + table, true);
    }
    std::ifstream f(path);
    if (!f.is_open()) {
        throw SourceError("unknown trade table: " + table, true);
    }
    CsvParseStats stats;
    auto trades = parse(f, table, &stats);
    spdlog::info("Loaded {} trades from {} ({} rejected, {} non-exit rows skipped)",
                 stats.accepted, path.string(), stats.rejected, stats.skipped_non_exit);
    return trades;
}

std::vector<Trade> CsvTradeSource::parse(std::istream& in, const std::string& table, CsvParseStats* stats) {
    CsvParseStats local;
    CsvParseStats& st = stats ? *stats : local;

    std::string line;
    if (!std::getline(in, line)) {
        throw SourceError("trade table " + table + " is empty");
    }
    // UTF-8 byte order mark from spreadsheet exports.
    if (line.size() >= 3 && line.compare(0, 3, "\xEF\xBB\xBF") == 0) line.erase(0, 3);

    ColumnMap cols = map_header(utils::split_csv_line(line));
    if (cols.exit_time < 0 || cols.symbol < 0) {
        throw SourceError("trade table " + table + " lacks exit_time or symbol column");
    }
    if (cols.profit_loss < 0 && !cols.can_derive_pnl()) {
        throw SourceError("trade table " + table +
                          " needs profit_loss or entry_price, exit_price and size columns");
    }

    std::vector<Trade> trades;
    size_t line_no = 1;
    while (std::getline(in, line)) {
        ++line_no;
        if (utils::trim(line).empty()) continue;
        ++st.rows;
        auto row = utils::split_csv_line(line);

        if (cols.type >= 0 && utils::to_lower(field(row, cols.type)).find("exit") == std::string::npos) {
            ++st.skipped_non_exit;
            continue;
        }

        auto exit_time = utils::parse_ts_any(field(row, cols.exit_time));
        const auto& symbol = field(row, cols.symbol);
        if (!exit_time || symbol.empty()) {
            spdlog::warn("{}:{} rejected: missing exit_time or symbol", table, line_no);
            ++st.rejected;
            continue;
        }

        Trade t;
        t.exit_time = *exit_time;
        t.symbol = symbol;
        auto entry = utils::parse_double(field(row, cols.entry_price));
        auto exit = utils::parse_double(field(row, cols.exit_price));
        auto size = utils::parse_double(field(row, cols.size));
        if (entry) t.entry_price = *entry;
        if (exit) t.exit_price = *exit;
        if (size) t.size = *size;

        auto pnl = utils::parse_double(field(row, cols.profit_loss));
        if (pnl) {
            t.profit_loss = *pnl;
        } else if (entry && exit && size) {
            t.profit_loss = (*exit - *entry) * *size;
        } else {
            spdlog::warn("{}:{} rejected: profit_loss missing and not derivable", table, line_no);
            ++st.rejected;
            continue;
        }
        if ((entry && *entry <= 0.0) || (exit && *exit <= 0.0)) {
            spdlog::warn("{}:{} rejected: non-positive price", table, line_no);
            ++st.rejected;
            continue;
        }
        trades.push_back(std::move(t));
        ++st.accepted;
    }
    return trades;
}

} // namespace trade_analytics
