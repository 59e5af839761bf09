#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>

#include "core/contracts/IScoreLog.h"

namespace trendphase {
namespace core {

class ScoreLogJsonl : public IScoreLog {
public:
    explicit ScoreLogJsonl(std::filesystem::path file_path);

    bool append(const ScoreLogRow& row) override;
    std::vector<ScoreLogRow> readAll() override;

private:
    std::filesystem::path file_path_;
    std::mutex mutex_;
    std::uint64_t last_seq_ = 0;
};

} // namespace core
} // namespace trendphase
