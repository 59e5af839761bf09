#pragma once

#include <cstdint>
#include <vector>

#include "core/model/PhaseTypes.h"

namespace trendphase {
namespace core {

// 점수 로그: 기본 행은 매 사이클, diagnostics 포함 행은 전이/emergency 변화 시에만
class IScoreLog {
public:
    virtual ~IScoreLog() = default;

    virtual bool append(const ScoreLogRow& row) = 0;
    virtual std::vector<ScoreLogRow> readAll() = 0;
};

} // namespace core
} // namespace trendphase
