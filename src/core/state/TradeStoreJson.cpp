#include "core/state/TradeStoreJson.h"
#include "core/state/JsonFileIO.h"
#include "common/Errors.h"

namespace patternedge {
namespace core {

TradeStoreJson::TradeStoreJson(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {}

std::optional<TradeBook> TradeStoreJson::load() {
    const auto raw = readJsonFile(file_path_);
    if (!raw) {
        return std::nullopt;
    }

    try {
        TradeBook book;
        book.version = raw->value("version", static_cast<std::uint64_t>(0));
        book.next_id = raw->value("next_id", 1LL);
        for (const auto& t : raw->value("trades", nlohmann::json::array())) {
            book.trades.push_back(tradeFromJson(t));
        }
        for (const auto& d : raw->value("scanned_dates", nlohmann::json::array())) {
            book.scanned_dates.insert(d.get<std::string>());
        }
        book.next_shadow_id = raw->value("next_shadow_id", 1LL);
        for (const auto& t : raw->value("shadow_trades", nlohmann::json::array())) {
            book.shadow_trades.push_back(tradeFromJson(t));
        }
        return book;
    } catch (const nlohmann::json::exception& e) {
        throw PersistenceError("invalid trade book " + file_path_.string() + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        throw PersistenceError("invalid trade book " + file_path_.string() + ": " + e.what());
    }
}

bool TradeStoreJson::save(const TradeBook& book, std::uint64_t expected_version) {
    checkStoredVersion(file_path_, expected_version);

    nlohmann::json raw;
    raw["version"] = book.version;
    raw["next_id"] = book.next_id;
    raw["trades"] = nlohmann::json::array();
    for (const auto& t : book.trades) {
        raw["trades"].push_back(tradeToJson(t));
    }
    raw["scanned_dates"] = book.scanned_dates;
    raw["next_shadow_id"] = book.next_shadow_id;
    raw["shadow_trades"] = nlohmann::json::array();
    for (const auto& t : book.shadow_trades) {
        raw["shadow_trades"].push_back(tradeToJson(t));
    }
    return writeJsonAtomically(file_path_, raw);
}

nlohmann::json TradeStoreJson::tradeToJson(const Trade& t) {
    nlohmann::json j;
    j["id"] = t.id;
    j["instrument"] = t.instrument;
    j["sector"] = t.sector;
    j["direction"] = toString(t.direction);
    j["patterns"] = t.patterns;
    j["horizon_days"] = t.horizon_days;
    j["horizon_label"] = t.horizon_label;
    j["signal_date"] = t.signal_date;
    j["trend_at_entry"] = t.trend_at_entry;
    j["vol_ratio"] = t.volume_ratio;
    j["regime"] = t.regime;
    j["filled"] = t.filled;
    j["signal_price"] = t.signal_price;
    j["entry_price"] = t.entry_price;
    j["entry_date"] = t.entry_date;
    j["sl_price"] = t.sl_price;
    j["sl_pct"] = t.sl_pct;
    j["target_price"] = t.target_price;
    j["target_pct"] = t.target_pct;
    j["rr_ratio"] = t.rr_ratio;
    j["expiry_date"] = t.expiry_date;
    j["position_pct"] = t.position_pct;
    j["position_value"] = t.position_value;
    j["predicted_win_rate"] = t.predicted_win_rate;
    j["predicted_pf"] = t.predicted_pf;
    j["confidence"] = t.confidence;
    j["confidence_level"] = toString(t.confidence_level);
    j["tier"] = toString(t.tier);
    j["n_matches"] = t.n_matches;
    j["status"] = toString(t.status);
    j["exit_price"] = t.exit_price;
    j["exit_date"] = t.exit_date;
    j["exit_reason"] = t.exit_reason;
    j["return_pct"] = t.return_pct;
    j["pnl"] = t.pnl;
    j["mfe_pct"] = t.mfe_pct;
    j["mae_pct"] = t.mae_pct;
    j["last_checked_date"] = t.last_checked_date;
    j["feedback_recorded"] = t.feedback_recorded;
    if (!t.skip_reasons.empty()) {
        j["skip_reasons"] = t.skip_reasons;
    }
    j["created_at_ms"] = t.created_at_ms;
    j["updated_at_ms"] = t.updated_at_ms;
    return j;
}

Trade TradeStoreJson::tradeFromJson(const nlohmann::json& j) {
    Trade t;
    t.id = j.at("id").get<std::string>();
    t.instrument = j.at("instrument").get<std::string>();
    t.sector = j.value("sector", std::string("unknown"));
    t.direction = directionFromString(j.value("direction", std::string()));
    t.patterns = j.value("patterns", std::vector<std::string>());
    t.horizon_days = j.at("horizon_days").get<int>();
    t.horizon_label = j.value("horizon_label", horizonLabel(t.horizon_days));
    t.signal_date = j.at("signal_date").get<std::string>();
    t.trend_at_entry = j.value("trend_at_entry", std::string("unknown"));
    t.volume_ratio = j.value("vol_ratio", 1.0);
    t.regime = j.value("regime", std::string());
    t.filled = j.value("filled", false);
    t.signal_price = j.value("signal_price", 0.0);
    t.entry_price = j.value("entry_price", 0.0);
    t.entry_date = j.value("entry_date", std::string());
    t.sl_price = j.value("sl_price", 0.0);
    t.sl_pct = j.value("sl_pct", 0.0);
    t.target_price = j.value("target_price", 0.0);
    t.target_pct = j.value("target_pct", 0.0);
    t.rr_ratio = j.value("rr_ratio", 0.0);
    t.expiry_date = j.value("expiry_date", std::string());
    t.position_pct = j.value("position_pct", 0.0);
    t.position_value = j.value("position_value", 0.0);
    t.predicted_win_rate = j.value("predicted_win_rate", 0.0);
    t.predicted_pf = j.value("predicted_pf", 0.0);
    t.confidence = j.value("confidence", 0.0);
    t.confidence_level = confidenceLevelFromString(j.value("confidence_level", std::string("low")));
    t.tier = tierFromString(j.value("tier", std::string("tier_1"))).value_or(Tier::TIER_1);
    t.n_matches = j.value("n_matches", 0);
    t.status = tradeStatusFromString(j.value("status", std::string("OPEN")));
    t.exit_price = j.value("exit_price", 0.0);
    t.exit_date = j.value("exit_date", std::string());
    t.exit_reason = j.value("exit_reason", std::string());
    t.return_pct = j.value("return_pct", 0.0);
    t.pnl = j.value("pnl", 0.0);
    t.mfe_pct = j.value("mfe_pct", 0.0);
    t.mae_pct = j.value("mae_pct", 0.0);
    t.last_checked_date = j.value("last_checked_date", std::string());
    t.feedback_recorded = j.value("feedback_recorded", false);
    t.skip_reasons = j.value("skip_reasons", std::vector<std::string>());
    t.created_at_ms = j.value("created_at_ms", 0LL);
    t.updated_at_ms = j.value("updated_at_ms", 0LL);
    return t;
}

} // namespace core
} // namespace patternedge
