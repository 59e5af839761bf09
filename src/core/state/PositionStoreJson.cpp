#include "core/state/PositionStoreJson.h"

#include <fstream>
#include <system_error>

#include "core/model/PhaseJson.h"

namespace trendphase {
namespace core {

namespace {
constexpr int kSchemaVersion = 1;

PositionRecord recordFromJson(const nlohmann::json& raw) {
    PositionRecord record;
    record.id = raw.value("id", std::string());
    record.contract = raw.value("token_contract", std::string());
    record.chain = raw.value("token_chain", std::string());
    record.status = raw.value("status", std::string("active"));

    const auto features = raw.value("features", nlohmann::json::object());
    if (features.contains("uptrend_engine") && features["uptrend_engine"].is_object()) {
        record.payload = payloadFromJson(features["uptrend_engine"]);
    }
    if (features.contains("uptrend_engine_meta") && features["uptrend_engine_meta"].is_object()) {
        record.meta = metaFromJson(features["uptrend_engine_meta"]);
    }
    return record;
}

nlohmann::json recordToJson(const PositionRecord& record) {
    nlohmann::json raw;
    raw["id"] = record.id;
    raw["token_contract"] = record.contract;
    raw["token_chain"] = record.chain;
    raw["status"] = record.status;
    raw["features"] = nlohmann::json::object();
    if (record.payload) {
        raw["features"]["uptrend_engine"] = payloadToJson(*record.payload);
    }
    raw["features"]["uptrend_engine_meta"] = metaToJson(record.meta);
    return raw;
}
} // namespace

PositionStoreJson::PositionStoreJson(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {}

nlohmann::json PositionStoreJson::readDocument() const {
    nlohmann::json document = {
        {"schema_version", kSchemaVersion},
        {"positions", nlohmann::json::array()}
    };
    if (!std::filesystem::exists(file_path_)) {
        return document;
    }

    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return document;
    }

    // 파싱 실패는 호출자에게 전파
    nlohmann::json raw;
    in >> raw;
    if (!raw.contains("positions") || !raw["positions"].is_array()) {
        raw["positions"] = nlohmann::json::array();
    }
    return raw;
}

bool PositionStoreJson::writeDocument(const nlohmann::json& document) const {
    if (file_path_.has_parent_path()) {
        std::filesystem::create_directories(file_path_.parent_path());
    }

    auto tmp_path = file_path_;
    tmp_path += ".tmp";

    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return false;
        }
        out << document.dump(2);
        if (!out) {
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, file_path_, ec);
    if (!ec) {
        return true;
    }

    // rename 실패 시 copy + remove
    ec.clear();
    std::filesystem::copy_file(
        tmp_path,
        file_path_,
        std::filesystem::copy_options::overwrite_existing,
        ec
    );
    if (ec) {
        return false;
    }

    std::filesystem::remove(tmp_path, ec);
    return true;
}

std::vector<PositionRef> PositionStoreJson::listActive() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<PositionRef> refs;
    const auto document = readDocument();
    for (const auto& raw : document["positions"]) {
        if (raw.value("status", std::string("active")) != "active") {
            continue;
        }
        PositionRef ref;
        ref.id = raw.value("id", std::string());
        ref.contract = raw.value("token_contract", std::string());
        ref.chain = raw.value("token_chain", std::string());
        if (!ref.id.empty()) {
            refs.push_back(std::move(ref));
        }
    }
    return refs;
}

std::optional<PositionRecord> PositionStoreJson::load(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);

    const auto document = readDocument();
    for (const auto& raw : document["positions"]) {
        if (raw.value("id", std::string()) == id) {
            return recordFromJson(raw);
        }
    }
    return std::nullopt;
}

bool PositionStoreJson::save(const std::string& id, const EnginePayload& payload, const EngineMeta& meta) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto document = readDocument();
    for (auto& raw : document["positions"]) {
        if (raw.value("id", std::string()) != id) {
            continue;
        }
        if (!raw.contains("features") || !raw["features"].is_object()) {
            raw["features"] = nlohmann::json::object();
        }
        // payload 와 meta 는 같은 문서 쓰기로 함께 교체
        raw["features"]["uptrend_engine"] = payloadToJson(payload);
        raw["features"]["uptrend_engine_meta"] = metaToJson(meta);
        return writeDocument(document);
    }
    return false;
}

bool PositionStoreJson::upsert(const PositionRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto document = readDocument();
    for (auto& raw : document["positions"]) {
        if (raw.value("id", std::string()) == record.id) {
            raw = recordToJson(record);
            return writeDocument(document);
        }
    }
    document["positions"].push_back(recordToJson(record));
    return writeDocument(document);
}

} // namespace core
} // namespace trendphase
