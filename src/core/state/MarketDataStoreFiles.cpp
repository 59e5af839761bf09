#include "core/state/MarketDataStoreFiles.h"

#include <algorithm>
#include <fstream>
#include <system_error>

#include "backtest/DataHistory.h"
#include "common/Logger.h"
#include "core/model/PhaseJson.h"

namespace trendphase {
namespace core {

namespace {

std::filesystem::file_time_type modifiedAt(const std::filesystem::path& path) {
    std::error_code ec;
    auto mtime = std::filesystem::last_write_time(path, ec);
    if (ec) {
        return std::filesystem::file_time_type::min();
    }
    return mtime;
}
} // namespace

MarketDataStoreFiles::MarketDataStoreFiles(std::filesystem::path root_dir)
    : root_dir_(std::move(root_dir)) {}

std::filesystem::path MarketDataStoreFiles::assetDir(const std::string& contract,
                                                     const std::string& chain) const {
    return root_dir_ / chain / contract;
}

const std::vector<MarketDataStoreFiles::TimedRecord>& MarketDataStoreFiles::timedRecords(
    const std::filesystem::path& path,
    const char* body_key
) {
    const auto key = path.string();
    const auto mtime = modifiedAt(path);
    auto it = record_cache_.find(key);
    if (it != record_cache_.end() && it->second.mtime == mtime) {
        return it->second.data;
    }

    std::vector<TimedRecord> records;
    std::ifstream in(path, std::ios::binary);
    std::string row;
    while (in.is_open() && std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }
        try {
            auto line = nlohmann::json::parse(row);
            if (!line.is_object() || !line.contains(body_key)) {
                continue;
            }
            TimedRecord record;
            record.ts_ms = line.value("ts_ms", 0LL);
            record.body = line[body_key];
            records.push_back(std::move(record));
        } catch (const nlohmann::json::exception& e) {
            LOG_WARN("Skipping malformed line in {}: {}", key, e.what());
        }
    }
    std::stable_sort(records.begin(), records.end(), [](const TimedRecord& a, const TimedRecord& b) {
        return a.ts_ms < b.ts_ms;
    });

    auto& entry = record_cache_[key];
    entry.mtime = mtime;
    entry.data = std::move(records);
    return entry.data;
}

const std::vector<Candle>& MarketDataStoreFiles::candles(const std::filesystem::path& path) {
    const auto key = path.string();
    const auto mtime = modifiedAt(path);
    auto it = candle_cache_.find(key);
    if (it != candle_cache_.end() && it->second.mtime == mtime) {
        return it->second.data;
    }

    auto& entry = candle_cache_[key];
    entry.mtime = mtime;
    entry.data = backtest::DataHistory::loadCSV(key);
    return entry.data;
}

const MarketDataStoreFiles::TimedRecord* MarketDataStoreFiles::latestAtOrBefore(
    const std::vector<TimedRecord>& records,
    long long as_of_ms
) {
    auto it = std::upper_bound(
        records.begin(), records.end(), as_of_ms,
        [](long long ts, const TimedRecord& r) { return ts < r.ts_ms; }
    );
    if (it == records.begin()) {
        return nullptr;
    }
    return &*std::prev(it);
}

std::optional<IndicatorSnapshot> MarketDataStoreFiles::latest(const std::string& contract,
                                                              const std::string& chain,
                                                              long long as_of_ms) {
    std::lock_guard<std::mutex> lock(mutex_);

    const auto& records = timedRecords(assetDir(contract, chain) / "indicators.jsonl", "ta");
    const auto* record = latestAtOrBefore(records, as_of_ms);
    if (record == nullptr) {
        return std::nullopt;
    }

    auto snapshot = indicatorsFromJson(record->body);
    if (!snapshot.valid) {
        return std::nullopt;
    }
    if (snapshot.ts_ms == 0) {
        snapshot.ts_ms = record->ts_ms;
    }
    return snapshot;
}

std::vector<SrLevel> MarketDataStoreFiles::levels(const std::string& contract,
                                                  const std::string& chain,
                                                  long long as_of_ms) {
    std::lock_guard<std::mutex> lock(mutex_);

    const auto& records = timedRecords(assetDir(contract, chain) / "geometry.jsonl", "sr_levels");
    const auto* record = latestAtOrBefore(records, as_of_ms);
    if (record == nullptr) {
        return {};
    }
    return levelsFromJson(record->body);
}

std::vector<Candle> MarketDataStoreFiles::bars(const std::string& contract,
                                               const std::string& chain,
                                               const std::string& timeframe,
                                               long long as_of_ms,
                                               int limit) {
    std::lock_guard<std::mutex> lock(mutex_);

    const auto path = assetDir(contract, chain) / ("bars_" + timeframe + ".csv");
    if (!std::filesystem::exists(path)) {
        return {};
    }
    return backtest::DataHistory::filterUntil(candles(path), as_of_ms, limit);
}

} // namespace core
} // namespace trendphase
