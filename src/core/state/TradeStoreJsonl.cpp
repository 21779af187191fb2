#include "core/state/TradeStoreJsonl.h"
#include "common/Logger.h"

#include <cstdio>
#include <fstream>

namespace daypilot {
namespace core {

namespace {
std::string formatDate(int yyyymmdd) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d",
                  yyyymmdd / 10000, (yyyymmdd / 100) % 100, yyyymmdd % 100);
    return buffer;
}
}

TradeStoreJsonl::TradeStoreJsonl(std::filesystem::path directory, MarketClock clock, bool truncate_on_start)
    : trades_path_(directory / "trades.jsonl")
    , daily_log_path_(directory / "trade_log.jsonl")
    , clock_(clock)
{
    std::filesystem::create_directories(directory);
    if (truncate_on_start) {
        std::ofstream out(trades_path_, std::ios::binary | std::ios::trunc);
        if (out.is_open()) {
            LOG_INFO("Trades table truncated at startup ({})", trades_path_.string());
        } else {
            LOG_ERROR("Failed to truncate trades: cannot open {}", trades_path_.string());
        }
    }
}

nlohmann::json TradeStoreJsonl::toJson(const TradeRecord& record) const {
    nlohmann::json line;
    line["trade_id"] = record.trade_id;
    line["time"] = record.time > 0 ? clock_.formatIso(record.time) : std::string();
    line["type"] = toString(record.type);
    line["price"] = roundTo2(record.price);
    line["sl"] = roundTo2(record.sl);
    line["exited"] = record.exited;
    line["pnl"] = roundTo2(record.pnl);
    line["strategy"] = record.strategy;
    line["meta_data"] = {{"source", record.source}, {"notes", record.notes}};
    line["symbol"] = record.symbol;
    line["exitprice"] = roundTo2(record.exit_price);
    line["exittime"] = record.exit_time > 0 ? clock_.formatIso(record.exit_time) : std::string();
    line["lots"] = record.lots;
    return line;
}

TradeRecord TradeStoreJsonl::fromJson(const nlohmann::json& line) const {
    TradeRecord record;
    record.trade_id = line.value("trade_id", std::string());
    record.time = clock_.parseTimestamp(line.value("time", std::string())).value_or(0);
    record.type = parseDirection(line.value("type", std::string())).value_or(Direction::NONE);
    record.price = line.value("price", 0.0);
    record.sl = line.value("sl", 0.0);
    record.exited = line.value("exited", false);
    record.pnl = line.value("pnl", 0.0);
    record.strategy = line.value("strategy", std::string());
    const auto meta = line.value("meta_data", nlohmann::json::object());
    record.source = meta.value("source", std::string());
    record.notes = meta.value("notes", std::string());
    record.symbol = line.value("symbol", std::string());
    record.exit_price = line.value("exitprice", 0.0);
    record.exit_time = clock_.parseTimestamp(line.value("exittime", std::string())).value_or(0);
    record.lots = line.value("lots", 0);
    return record;
}

bool TradeStoreJsonl::recordTrade(const TradeRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::ofstream out(trades_path_, std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        LOG_ERROR("Failed to record trade {}: cannot open {}", record.trade_id, trades_path_.string());
        return false;
    }

    out << toJson(record).dump() << "\n";
    out.flush();
    if (!out) {
        LOG_ERROR("Failed to record trade {}: write error", record.trade_id);
        return false;
    }
    return true;
}

std::vector<TradeRecord> TradeStoreJsonl::readAll() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return readAllLocked();
}

std::vector<TradeRecord> TradeStoreJsonl::readAllLocked() const {
    std::vector<TradeRecord> out;
    std::ifstream in(trades_path_, std::ios::binary);
    if (!in.is_open()) {
        return out;
    }

    std::string row;
    size_t line_no = 0;
    while (std::getline(in, row)) {
        ++line_no;
        if (row.empty()) {
            continue;
        }
        try {
            out.push_back(fromJson(nlohmann::json::parse(row)));
        } catch (const nlohmann::json::exception& e) {
            LOG_WARN("Skipping malformed trade row {}: {}", line_no, e.what());
        }
    }
    return out;
}

double TradeStoreJsonl::fetchPnlToday(int today) {
    std::lock_guard<std::mutex> lock(mutex_);

    double total = 0.0;
    for (const auto& record : readAllLocked()) {
        if (record.time > 0 && clock_.localDate(record.time) == today) {
            total += record.pnl;
        }
    }
    return total;
}

bool TradeStoreJsonl::populateDailyLog(int today) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::ofstream out(daily_log_path_, std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        LOG_ERROR("Failed to populate logs: cannot open {}", daily_log_path_.string());
        return false;
    }

    int written = 0;
    for (const auto& record : readAllLocked()) {
        if (!record.exited || record.time <= 0 || clock_.localDate(record.time) != today) {
            continue;
        }
        nlohmann::json line;
        line["tr_date"] = formatDate(record.exit_time > 0 ? clock_.localDate(record.exit_time) : today);
        line["action"] = toString(record.type);
        line["entry_price"] = roundTo2(record.price);
        line["exit_price"] = roundTo2(record.exit_price);
        line["pnl"] = roundTo2(record.pnl);
        line["lots"] = record.lots;
        out << line.dump() << "\n";
        ++written;
    }
    out.flush();
    if (!out) {
        LOG_ERROR("Failed to populate logs: write error");
        return false;
    }
    LOG_INFO("Daily log populated with {} trades for {}", written, formatDate(today));
    return true;
}

TradeSummary TradeStoreJsonl::fetchSummary() {
    std::lock_guard<std::mutex> lock(mutex_);

    TradeSummary summary;
    int wins = 0;
    int losses = 0;
    double win_sum = 0.0;
    double loss_sum = 0.0;
    for (const auto& record : readAllLocked()) {
        if (!record.exited) continue;
        ++summary.total_trades;
        summary.total_pnl += record.pnl;
        if (record.pnl > 0) {
            ++wins;
            win_sum += record.pnl;
        } else if (record.pnl < 0) {
            ++losses;
            loss_sum += record.pnl;
        }
    }
    if (wins > 0) summary.avg_win = win_sum / wins;
    if (losses > 0) summary.avg_loss = loss_sum / losses;
    if (summary.total_trades > 0) {
        summary.win_pct = 100.0 * wins / summary.total_trades;
    }
    return summary;
}

} // namespace core
} // namespace daypilot
