#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/contracts/IBarSource.h"
#include "core/contracts/IGeometrySource.h"
#include "core/contracts/IIndicatorSource.h"

namespace trendphase {
namespace core {

// 자산별 디렉터리 <root>/<chain>/<contract>/
//   bars_1h.csv      timestamp_ms,open,high,low,close,volume
//   indicators.jsonl {"ts_ms":..., "ta":{...}}
//   geometry.jsonl   {"ts_ms":..., "sr_levels":[...]}
// 모든 조회는 as_of 이하 데이터만 반환
class MarketDataStoreFiles : public IIndicatorSource, public IGeometrySource, public IBarSource {
public:
    explicit MarketDataStoreFiles(std::filesystem::path root_dir);

    std::optional<IndicatorSnapshot> latest(const std::string& contract,
                                            const std::string& chain,
                                            long long as_of_ms) override;

    std::vector<SrLevel> levels(const std::string& contract,
                                const std::string& chain,
                                long long as_of_ms) override;

    std::vector<Candle> bars(const std::string& contract,
                             const std::string& chain,
                             const std::string& timeframe,
                             long long as_of_ms,
                             int limit) override;

    std::filesystem::path assetDir(const std::string& contract, const std::string& chain) const;

private:
    struct TimedRecord {
        long long ts_ms = 0;
        nlohmann::json body;
    };

    template <typename T>
    struct CacheEntry {
        std::filesystem::file_time_type mtime;
        T data;
    };

    // 파일 mtime 이 바뀌면 다시 읽음
    const std::vector<TimedRecord>& timedRecords(const std::filesystem::path& path, const char* body_key);
    const std::vector<Candle>& candles(const std::filesystem::path& path);

    static const TimedRecord* latestAtOrBefore(const std::vector<TimedRecord>& records, long long as_of_ms);

    std::filesystem::path root_dir_;
    std::mutex mutex_;
    std::map<std::string, CacheEntry<std::vector<TimedRecord>>> record_cache_;
    std::map<std::string, CacheEntry<std::vector<Candle>>> candle_cache_;
};

} // namespace core
} // namespace trendphase
