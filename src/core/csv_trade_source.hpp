#pragma once

#include <istream>
#include <string>
#include <vector>
#include "trade_source.hpp"

namespace trade_analytics {

struct CsvParseStats {
    size_t rows{0};
    size_t accepted{0};
    size_t rejected{0};
    size_t skipped_non_exit{0};
};

/**
 * Reads one trade table per *.csv file in a directory.
 *
 * Header columns (case-insensitive): exit_time, symbol, entry_price,
 * exit_price, size, profit_loss, and optionally type. profit_loss may be
 * omitted when entry_price, exit_price and size are all present; it is then
 * derived as (exit_price - entry_price) * size. With a type column only rows
 * whose type mentions "exit" are kept.
 */
class CsvTradeSource : public TradeSource {
public:
    explicit CsvTradeSource(std::string directory);

    std::vector<std::string> list_tables() override;
    std::vector<Trade> fetch(const std::string& table) override;

    // Working files, exports and editor lock files are not strategy tables.
    static bool is_strategy_file(const std::string& filename);

    // Parse a whole CSV document. Throws SourceError when the header is unusable.
    static std::vector<Trade> parse(std::istream& in, const std::string& table, CsvParseStats* stats = nullptr);

private:
    std::string directory_;
};

} // namespace trade_analytics
