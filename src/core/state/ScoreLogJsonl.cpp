#include "core/state/ScoreLogJsonl.h"

#include <algorithm>
#include <fstream>

namespace trendphase {
namespace core {

namespace {
nlohmann::json mapToJson(const std::map<std::string, double>& values) {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& kv : values) {
        out[kv.first] = kv.second;
    }
    return out;
}

std::map<std::string, double> mapFromJson(const nlohmann::json& raw) {
    std::map<std::string, double> out;
    if (!raw.is_object()) {
        return out;
    }
    for (auto it = raw.begin(); it != raw.end(); ++it) {
        if (it.value().is_number()) {
            out[it.key()] = it.value().get<double>();
        }
    }
    return out;
}
} // namespace

ScoreLogJsonl::ScoreLogJsonl(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return;
    }

    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }
        try {
            auto line = nlohmann::json::parse(row);
            last_seq_ = (std::max)(last_seq_, line.value("seq", static_cast<std::uint64_t>(0)));
        } catch (const nlohmann::json::exception&) {
            // 깨진 행은 무시
        }
    }
}

bool ScoreLogJsonl::append(const ScoreLogRow& row) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (file_path_.has_parent_path()) {
        std::filesystem::create_directories(file_path_.parent_path());
    }
    std::ofstream out(file_path_, std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        return false;
    }

    const std::uint64_t next_seq = last_seq_ + 1;
    nlohmann::json line;
    line["seq"] = next_seq;
    line["ts_ms"] = row.ts_ms;
    line["token_contract"] = row.contract;
    line["chain"] = row.chain;
    line["state"] = phaseName(row.state);
    line["scores"] = mapToJson(row.scores);
    if (row.diagnostics) {
        line["diagnostics"] = mapToJson(*row.diagnostics);
        line["event_type"] = row.event_type;
    }

    out << line.dump() << "\n";
    if (!out) {
        return false;
    }
    last_seq_ = next_seq;
    return true;
}

std::vector<ScoreLogRow> ScoreLogJsonl::readAll() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<ScoreLogRow> rows;
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return rows;
    }

    std::string raw;
    while (std::getline(in, raw)) {
        if (raw.empty()) {
            continue;
        }

        nlohmann::json line;
        try {
            line = nlohmann::json::parse(raw);
        } catch (const nlohmann::json::exception&) {
            continue;
        }

        ScoreLogRow row;
        row.seq = line.value("seq", static_cast<std::uint64_t>(0));
        row.ts_ms = line.value("ts_ms", 0LL);
        row.contract = line.value("token_contract", std::string());
        row.chain = line.value("chain", std::string());
        row.state = parsePhase(line.value("state", std::string("S0"))).value_or(Phase::S0);
        row.scores = mapFromJson(line.value("scores", nlohmann::json::object()));
        if (line.contains("diagnostics")) {
            row.diagnostics = mapFromJson(line["diagnostics"]);
            row.event_type = line.value("event_type", std::string());
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

} // namespace core
} // namespace trendphase
