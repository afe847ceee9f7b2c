#include "core/state/RiskStateStoreJson.h"
#include "core/state/JsonFileIO.h"
#include "common/Errors.h"

namespace patternedge {
namespace core {

RiskStateStoreJson::RiskStateStoreJson(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {}

std::optional<risk::RiskState> RiskStateStoreJson::load() {
    const auto raw = readJsonFile(file_path_);
    if (!raw) {
        return std::nullopt;
    }
    try {
        return fromJson(*raw);
    } catch (const nlohmann::json::exception& e) {
        throw PersistenceError("invalid risk state in " + file_path_.string() + ": " + e.what());
    }
}

bool RiskStateStoreJson::save(const risk::RiskState& state, std::uint64_t expected_version) {
    checkStoredVersion(file_path_, expected_version);
    return writeJsonAtomically(file_path_, toJson(state));
}

nlohmann::json RiskStateStoreJson::toJson(const risk::RiskState& s) {
    nlohmann::json raw;
    raw["version"] = s.version;
    raw["initial_capital"] = s.initial_capital;
    raw["capital"] = s.capital;
    raw["peak_capital"] = s.peak_capital;
    raw["realized_pnl_total"] = s.realized_pnl_total;
    raw["current_date"] = s.current_date;
    raw["day_start_capital"] = s.day_start_capital;
    raw["trades_today"] = s.trades_today;
    raw["daily_pnl"] = s.daily_pnl;
    raw["current_month"] = s.current_month;
    raw["monthly_pnl"] = s.monthly_pnl;
    raw["monthly_trades"] = s.monthly_trades;
    raw["consecutive_losses"] = s.consecutive_losses;
    raw["total_trades"] = s.total_trades;
    raw["total_wins"] = s.total_wins;
    raw["breakers"] = {
        {"daily_loss", s.breakers.daily_loss},
        {"consecutive_losses", s.breakers.consecutive_losses},
        {"drawdown", s.breakers.drawdown},
        {"daily_trades", s.breakers.daily_trades},
        {"monthly_loss", s.breakers.monthly_loss}};
    if (s.cooldown_until_ms > 0) {
        raw["cooldown_until_ms"] = s.cooldown_until_ms;
    } else {
        raw["cooldown_until_ms"] = nullptr;
    }
    raw["applied_trade_ids"] = s.applied_trade_ids;

    nlohmann::json closes = nlohmann::json::array();
    for (const auto& c : s.recent_closes) {
        closes.push_back({
            {"trade_id", c.trade_id},
            {"instrument", c.instrument},
            {"sector", c.sector},
            {"horizon_days", c.horizon_days},
            {"pnl", c.pnl},
            {"return_pct", c.return_pct},
            {"exit_date", c.exit_date},
            {"recorded_at_ms", c.recorded_at_ms}});
    }
    raw["recent_closes"] = closes;
    raw["updated_at_ms"] = s.updated_at_ms;
    return raw;
}

risk::RiskState RiskStateStoreJson::fromJson(const nlohmann::json& raw) {
    risk::RiskState s;
    s.version = raw.value("version", static_cast<std::uint64_t>(0));
    s.initial_capital = raw.at("initial_capital").get<double>();
    s.capital = raw.at("capital").get<double>();
    s.peak_capital = raw.value("peak_capital", s.capital);
    s.realized_pnl_total = raw.value("realized_pnl_total", 0.0);
    s.current_date = raw.value("current_date", std::string());
    s.day_start_capital = raw.value("day_start_capital", s.capital);
    s.trades_today = raw.value("trades_today", 0);
    s.daily_pnl = raw.value("daily_pnl", 0.0);
    s.current_month = raw.value("current_month", std::string());
    s.monthly_pnl = raw.value("monthly_pnl", 0.0);
    s.monthly_trades = raw.value("monthly_trades", 0);
    s.consecutive_losses = raw.value("consecutive_losses", 0);
    s.total_trades = raw.value("total_trades", 0);
    s.total_wins = raw.value("total_wins", 0);

    const auto breakers = raw.value("breakers", nlohmann::json::object());
    s.breakers.daily_loss = breakers.value("daily_loss", false);
    s.breakers.consecutive_losses = breakers.value("consecutive_losses", false);
    s.breakers.drawdown = breakers.value("drawdown", false);
    s.breakers.daily_trades = breakers.value("daily_trades", false);
    s.breakers.monthly_loss = breakers.value("monthly_loss", false);

    const auto cooldown = raw.find("cooldown_until_ms");
    if (cooldown != raw.end() && cooldown->is_number()) {
        s.cooldown_until_ms = cooldown->get<long long>();
    }

    if (raw.contains("applied_trade_ids")) {
        for (const auto& id : raw.at("applied_trade_ids")) {
            s.applied_trade_ids.insert(id.get<std::string>());
        }
    }
    for (const auto& c : raw.value("recent_closes", nlohmann::json::array())) {
        risk::ClosedTradeRecord record;
        record.trade_id = c.value("trade_id", std::string());
        record.instrument = c.value("instrument", std::string());
        record.sector = c.value("sector", std::string());
        record.horizon_days = c.value("horizon_days", 0);
        record.pnl = c.value("pnl", 0.0);
        record.return_pct = c.value("return_pct", 0.0);
        record.exit_date = c.value("exit_date", std::string());
        record.recorded_at_ms = c.value("recorded_at_ms", 0LL);
        s.recent_closes.push_back(std::move(record));
    }
    s.updated_at_ms = raw.value("updated_at_ms", 0LL);
    return s;
}

} // namespace core
} // namespace patternedge
