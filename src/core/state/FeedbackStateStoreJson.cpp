#include "core/state/FeedbackStateStoreJson.h"
#include "core/state/JsonFileIO.h"
#include "common/Errors.h"

namespace patternedge {
namespace core {

namespace {

using engine::AdjustmentKey;
using engine::AdjustmentKind;

// Document section per segment kind
const char* sectionName(AdjustmentKind kind) {
    switch (kind) {
        case AdjustmentKind::PATTERN: return "pattern_adjustments";
        case AdjustmentKind::PATTERN_TREND: return "regime_adjustments";
        case AdjustmentKind::PATTERN_HORIZON: return "horizon_adjustments";
        case AdjustmentKind::PATTERN_TREND_HORIZON: return "triple_adjustments";
        case AdjustmentKind::PATTERN_SECTOR: return "sector_adjustments";
    }
    return "pattern_adjustments";
}

const char* filterSectionName(AdjustmentKind kind, engine::FilterAction action) {
    const bool reject = action == engine::FilterAction::REJECT;
    switch (kind) {
        case AdjustmentKind::PATTERN_HORIZON:
            return reject ? "horizon_filter_penalties" : "horizon_filter_boosts";
        case AdjustmentKind::PATTERN_SECTOR:
            return reject ? "sector_filter_penalties" : "sector_filter_boosts";
        default:
            return reject ? "filter_penalties" : "filter_boosts";
    }
}

nlohmann::json keyFields(const AdjustmentKey& key) {
    nlohmann::json j;
    j["pattern"] = key.pattern;
    if (key.trend) j["trend"] = *key.trend;
    if (key.horizon) j["horizon"] = *key.horizon;
    if (key.sector) j["sector"] = *key.sector;
    return j;
}

AdjustmentKey keyFromJson(AdjustmentKind kind, const nlohmann::json& j) {
    const auto pattern = j.at("pattern").get<std::string>();
    switch (kind) {
        case AdjustmentKind::PATTERN:
            return AdjustmentKey::forPattern(pattern);
        case AdjustmentKind::PATTERN_TREND:
            return AdjustmentKey::forTrend(pattern, j.at("trend").get<std::string>());
        case AdjustmentKind::PATTERN_HORIZON:
            return AdjustmentKey::forHorizon(pattern, j.at("horizon").get<std::string>());
        case AdjustmentKind::PATTERN_TREND_HORIZON:
            return AdjustmentKey::forTriple(pattern, j.at("trend").get<std::string>(),
                                            j.at("horizon").get<std::string>());
        case AdjustmentKind::PATTERN_SECTOR:
            return AdjustmentKey::forSector(pattern, j.at("sector").get<std::string>());
    }
    return AdjustmentKey::forPattern(pattern);
}

// "p__trend__horizon" style map keys keep the document readable by hand
std::string mapKey(const AdjustmentKey& key) {
    std::string out = key.pattern;
    if (key.trend) out += "__" + *key.trend;
    if (key.horizon) out += "__" + *key.horizon;
    if (key.sector) out += "__" + *key.sector;
    return out;
}

const AdjustmentKind kAllKinds[] = {
    AdjustmentKind::PATTERN, AdjustmentKind::PATTERN_TREND, AdjustmentKind::PATTERN_HORIZON,
    AdjustmentKind::PATTERN_TREND_HORIZON, AdjustmentKind::PATTERN_SECTOR};

} // namespace

FeedbackStateStoreJson::FeedbackStateStoreJson(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {}

std::optional<engine::FeedbackSnapshot> FeedbackStateStoreJson::load() {
    const auto raw = readJsonFile(file_path_);
    if (!raw) {
        return std::nullopt;
    }
    try {
        return fromJson(*raw);
    } catch (const nlohmann::json::exception& e) {
        throw PersistenceError("invalid feedback document " + file_path_.string() + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        throw PersistenceError("invalid feedback document " + file_path_.string() + ": " + e.what());
    }
}

bool FeedbackStateStoreJson::save(const engine::FeedbackSnapshot& snapshot, std::uint64_t expected_version) {
    checkStoredVersion(file_path_, expected_version);
    return writeJsonAtomically(file_path_, toJson(snapshot));
}

nlohmann::json FeedbackStateStoreJson::outcomeToJson(const engine::OutcomeRecord& o) {
    return {
        {"trade_id", o.trade_id},
        {"instrument", o.instrument},
        {"sector", o.sector},
        {"direction", toString(o.direction)},
        {"patterns", o.patterns},
        {"horizon_days", o.horizon_days},
        {"horizon_label", o.horizon_label},
        {"trend_at_entry", o.trend_at_entry},
        {"vol_ratio", o.volume_ratio},
        {"outcome", o.won ? "win" : "loss"},
        {"actual_return_pct", o.actual_return_pct},
        {"exit_reason", o.exit_reason},
        {"stop_loss_triggered", o.stop_loss_triggered},
        {"entry_date", o.entry_date},
        {"exit_date", o.exit_date},
        {"predicted_win_rate", o.predicted_win_rate},
        {"confidence", o.confidence_level}};
}

engine::OutcomeRecord FeedbackStateStoreJson::outcomeFromJson(const nlohmann::json& raw) {
    engine::OutcomeRecord o;
    o.trade_id = raw.value("trade_id", std::string());
    o.instrument = raw.value("instrument", std::string());
    o.sector = raw.value("sector", std::string());
    o.direction = directionFromString(raw.value("direction", std::string("bullish")));
    o.patterns = raw.value("patterns", std::vector<std::string>());
    o.horizon_days = raw.value("horizon_days", 0);
    o.horizon_label = raw.value("horizon_label", std::string());
    o.trend_at_entry = raw.value("trend_at_entry", std::string());
    o.volume_ratio = raw.value("vol_ratio", 1.0);
    o.won = raw.value("outcome", std::string()) == "win";
    o.actual_return_pct = raw.value("actual_return_pct", 0.0);
    o.exit_reason = raw.value("exit_reason", std::string());
    o.stop_loss_triggered = raw.value("stop_loss_triggered", false);
    o.entry_date = raw.value("entry_date", std::string());
    o.exit_date = raw.value("exit_date", std::string());
    o.predicted_win_rate = raw.value("predicted_win_rate", 0.0);
    o.confidence_level = raw.value("confidence", std::string());
    return o;
}

nlohmann::json FeedbackStateStoreJson::toJson(const engine::FeedbackSnapshot& s) {
    nlohmann::json raw;
    raw["version"] = s.version;
    raw["updated_at"] = s.updated_at;

    raw["outcomes"] = nlohmann::json::array();
    for (const auto& o : s.outcomes) {
        raw["outcomes"].push_back(outcomeToJson(o));
    }

    for (const auto kind : kAllKinds) {
        raw[sectionName(kind)] = nlohmann::json::object();
    }
    for (const auto& [key, rec] : s.adjustments) {
        nlohmann::json entry = keyFields(key);
        entry["total_trades"] = rec.total_trades;
        entry["wins"] = rec.wins;
        entry["actual_win_rate"] = rec.win_rate;
        entry["decay_weighted_win_rate"] = rec.decay_weighted_win_rate;
        entry["avg_return"] = rec.avg_return;
        if (key.kind == AdjustmentKind::PATTERN) {
            const auto vb = s.volume_breakdown.find(key.pattern);
            if (vb != s.volume_breakdown.end()) {
                entry["volume_breakdown"] = {
                    {"vol_confirmed_n", vb->second.confirmed_trades},
                    {"vol_confirmed_wins", vb->second.confirmed_wins},
                    {"vol_unconfirmed_n", vb->second.unconfirmed_trades},
                    {"vol_unconfirmed_wins", vb->second.unconfirmed_wins}};
            }
        }
        raw[sectionName(key.kind)][mapKey(key)] = entry;
    }

    raw["rules"] = nlohmann::json::array();
    for (const auto& r : s.rules) {
        raw["rules"].push_back({
            {"context", r.context},
            {"confidence", r.confidence},
            {"type", r.type},
            {"rule", r.description}});
    }

    for (const auto& [key, f] : s.filters) {
        nlohmann::json entry = keyFields(key);
        entry["kind"] = engine::toString(key.kind);
        entry["action"] = f.action == engine::FilterAction::REJECT ? "reject" : "relax";
        entry["actual_wr"] = f.actual_win_rate;
        entry["trades"] = f.trades;
        entry["reason"] = f.reason;
        raw[filterSectionName(key.kind, f.action)][mapKey(key)] = entry;
    }
    return raw;
}

engine::FeedbackSnapshot FeedbackStateStoreJson::fromJson(const nlohmann::json& raw) {
    engine::FeedbackSnapshot s;
    s.version = raw.value("version", static_cast<std::uint64_t>(0));
    s.updated_at = raw.value("updated_at", std::string());

    for (const auto& o : raw.value("outcomes", nlohmann::json::array())) {
        s.outcomes.push_back(outcomeFromJson(o));
    }

    for (const auto kind : kAllKinds) {
        const auto section = raw.value(sectionName(kind), nlohmann::json::object());
        for (const auto& [name, entry] : section.items()) {
            const AdjustmentKey key = keyFromJson(kind, entry);
            engine::AdjustmentRecord rec;
            rec.total_trades = entry.value("total_trades", 0);
            rec.wins = entry.value("wins", 0);
            rec.win_rate = entry.value("actual_win_rate", 0.0);
            rec.decay_weighted_win_rate = entry.value("decay_weighted_win_rate", rec.win_rate);
            rec.avg_return = entry.value("avg_return", 0.0);
            s.adjustments[key] = rec;

            if (kind == AdjustmentKind::PATTERN && entry.contains("volume_breakdown")) {
                const auto& vb = entry.at("volume_breakdown");
                engine::VolumeBreakdown b;
                b.confirmed_trades = vb.value("vol_confirmed_n", 0);
                b.confirmed_wins = vb.value("vol_confirmed_wins", 0);
                b.unconfirmed_trades = vb.value("vol_unconfirmed_n", 0);
                b.unconfirmed_wins = vb.value("vol_unconfirmed_wins", 0);
                s.volume_breakdown[key.pattern] = b;
            }
        }
    }

    for (const auto& r : raw.value("rules", nlohmann::json::array())) {
        engine::FeedbackRule rule;
        rule.context = r.value("context", std::string());
        rule.confidence = r.value("confidence", 0.0);
        rule.type = r.value("type", std::string());
        rule.description = r.value("rule", std::string());
        s.rules.push_back(std::move(rule));
    }

    const std::pair<const char*, AdjustmentKind> filter_sections[] = {
        {"filter_penalties", AdjustmentKind::PATTERN},
        {"filter_boosts", AdjustmentKind::PATTERN},
        {"horizon_filter_penalties", AdjustmentKind::PATTERN_HORIZON},
        {"horizon_filter_boosts", AdjustmentKind::PATTERN_HORIZON},
        {"sector_filter_penalties", AdjustmentKind::PATTERN_SECTOR},
        {"sector_filter_boosts", AdjustmentKind::PATTERN_SECTOR}};
    for (const auto& [section_name, kind] : filter_sections) {
        const auto section = raw.value(section_name, nlohmann::json::object());
        for (const auto& [name, entry] : section.items()) {
            engine::FilterAdjustment f;
            f.action = entry.value("action", std::string("reject")) == "relax"
                ? engine::FilterAction::RELAX : engine::FilterAction::REJECT;
            f.actual_win_rate = entry.value("actual_wr", 0.0);
            f.trades = entry.value("trades", 0);
            f.reason = entry.value("reason", std::string());
            s.filters[keyFromJson(kind, entry)] = f;
        }
    }
    return s;
}

} // namespace core
} // namespace patternedge
