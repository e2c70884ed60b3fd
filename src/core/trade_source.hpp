#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "errors.hpp"
#include "trade.hpp"

namespace trade_analytics {

/**
 * Where trade tables come from. The engines only see the vectors this returns.
 */
class TradeSource {
public:
    virtual ~TradeSource() = default;

    // Names accepted by fetch(), sorted.
    virtual std::vector<std::string> list_tables() = 0;

    // Throws SourceError (not_found() == true for unknown tables).
    virtual std::vector<Trade> fetch(const std::string& table) = 0;
};

class MemoryTradeSource : public TradeSource {
public:
    void put(const std::string& table, std::vector<Trade> trades) {
        std::lock_guard<std::mutex> lock(mutex_);
        tables_[table] = std::move(trades);
    }

    std::vector<std::string> list_tables() override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> out;
        out.reserve(tables_.size());
        for (const auto& kv : tables_) out.push_back(kv.first);
        return out;
    }

    std::vector<Trade> fetch(const std::string& table) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tables_.find(table);
        if (it == tables_.end()) {
            throw SourceError("unknown trade table: " + table, true);
        }
        return it->second;
    }

private:
    std::mutex mutex_;
    std::map<std::string, std::vector<Trade>> tables_;
};

} // namespace trade_analytics
