#include "common/Config.h"
#include "common/Errors.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace patternedge {

namespace {
std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

void require(bool condition, const std::string& message) {
    if (!condition) {
        throw ConfigError("invalid config: " + message);
    }
}

void requireScale(double v, const std::string& name) {
    require(v >= 0.0 && v <= 1.0, name + " must be within [0, 1]");
}

void parsePredictor(const nlohmann::json& p, engine::PredictorConfig& cfg) {
    cfg.min_matches = p.value("min_matches", cfg.min_matches);
    cfg.top_k = p.value("top_k", cfg.top_k);
    cfg.max_per_instrument = p.value("max_per_instrument", cfg.max_per_instrument);
    cfg.max_per_sector = p.value("max_per_sector", cfg.max_per_sector);
    cfg.primary_horizon = p.value("primary_horizon", cfg.primary_horizon);
    cfg.horizons = p.value("horizons", cfg.horizons);
    cfg.edge_threshold_pct = p.value("edge_threshold_pct", cfg.edge_threshold_pct);
    cfg.weight_edge = p.value("weight_edge", cfg.weight_edge);
    cfg.weight_sample = p.value("weight_sample", cfg.weight_sample);
    cfg.weight_tier = p.value("weight_tier", cfg.weight_tier);
    cfg.weight_profit_factor = p.value("weight_profit_factor", cfg.weight_profit_factor);
    cfg.sample_saturation = p.value("sample_saturation", cfg.sample_saturation);
    cfg.high_confidence_threshold = p.value("high_confidence_threshold", cfg.high_confidence_threshold);
    cfg.medium_confidence_threshold = p.value("medium_confidence_threshold", cfg.medium_confidence_threshold);
    cfg.gross_loss_floor = p.value("gross_loss_floor", cfg.gross_loss_floor);
    cfg.sl_floor_pct = p.value("sl_floor_pct", cfg.sl_floor_pct);
    cfg.sl_cap_pct = p.value("sl_cap_pct", cfg.sl_cap_pct);
    cfg.structural_sl_multiplier = p.value("structural_sl_multiplier", cfg.structural_sl_multiplier);
    cfg.standard_sl_multiplier = p.value("standard_sl_multiplier", cfg.standard_sl_multiplier);
    cfg.structural_patterns = p.value("structural_patterns", cfg.structural_patterns);
    cfg.allowed_patterns = p.value("allowed_patterns", cfg.allowed_patterns);
    cfg.excluded_patterns = p.value("excluded_patterns", cfg.excluded_patterns);

    if (p.contains("tier_quality")) {
        const auto values = p["tier_quality"].get<std::vector<double>>();
        require(values.size() == 4, "predictor.tier_quality needs 4 entries");
        std::copy(values.begin(), values.end(), cfg.tier_quality.begin());
    }
    if (p.contains("accepted_tiers")) {
        cfg.accepted_tiers.clear();
        for (const auto& name : p["accepted_tiers"].get<std::vector<std::string>>()) {
            const auto tier = tierFromString(name);
            require(tier.has_value(), "unknown tier '" + name + "'");
            cfg.accepted_tiers.push_back(*tier);
        }
    }
}

void parseFeedback(const nlohmann::json& f, engine::FeedbackConfig& cfg) {
    cfg.max_blend_weight = f.value("max_blend_weight", cfg.max_blend_weight);
    cfg.blend_prior_trades = f.value("blend_prior_trades", cfg.blend_prior_trades);
    cfg.min_triple_trades = f.value("min_triple_trades", cfg.min_triple_trades);
    cfg.min_horizon_trades = f.value("min_horizon_trades", cfg.min_horizon_trades);
    cfg.min_sector_trades = f.value("min_sector_trades", cfg.min_sector_trades);
    cfg.min_trend_trades = f.value("min_trend_trades", cfg.min_trend_trades);
    cfg.min_pattern_trades = f.value("min_pattern_trades", cfg.min_pattern_trades);
    cfg.decay_half_life_days = f.value("decay_half_life_days", cfg.decay_half_life_days);
    cfg.unknown_age_weight = f.value("unknown_age_weight", cfg.unknown_age_weight);
    cfg.min_segment_trades = f.value("min_segment_trades", cfg.min_segment_trades);
    cfg.volume_confirm_ratio = f.value("volume_confirm_ratio", cfg.volume_confirm_ratio);
    cfg.trend_aligned_boost = f.value("trend_aligned_boost", cfg.trend_aligned_boost);
    cfg.counter_trend_penalty = f.value("counter_trend_penalty", cfg.counter_trend_penalty);
    cfg.volume_confirmation_boost = f.value("volume_confirmation_boost", cfg.volume_confirmation_boost);
    cfg.volume_pattern_boost = f.value("volume_pattern_boost", cfg.volume_pattern_boost);
    cfg.stop_loss_penalty = f.value("stop_loss_penalty", cfg.stop_loss_penalty);
    cfg.volume_edge_threshold = f.value("volume_edge_threshold", cfg.volume_edge_threshold);
    cfg.volume_edge_gain = f.value("volume_edge_gain", cfg.volume_edge_gain);
    cfg.pattern_reject_min_trades = f.value("pattern_reject_min_trades", cfg.pattern_reject_min_trades);
    cfg.pattern_reject_below_pct = f.value("pattern_reject_below_pct", cfg.pattern_reject_below_pct);
    cfg.pattern_relax_min_trades = f.value("pattern_relax_min_trades", cfg.pattern_relax_min_trades);
    cfg.pattern_relax_above_pct = f.value("pattern_relax_above_pct", cfg.pattern_relax_above_pct);
    cfg.segment_reject_min_trades = f.value("segment_reject_min_trades", cfg.segment_reject_min_trades);
    cfg.segment_reject_below_pct = f.value("segment_reject_below_pct", cfg.segment_reject_below_pct);
    cfg.segment_relax_min_trades = f.value("segment_relax_min_trades", cfg.segment_relax_min_trades);
    cfg.segment_relax_above_pct = f.value("segment_relax_above_pct", cfg.segment_relax_above_pct);
    cfg.max_age_days = f.value("max_age_days", cfg.max_age_days);
    cfg.min_outcomes_for_rebuild = f.value("min_outcomes_for_rebuild", cfg.min_outcomes_for_rebuild);
}

void parseRegime(const nlohmann::json& r, engine::RegimeConfig& cfg) {
    cfg.dma_period = r.value("dma_period", cfg.dma_period);
    cfg.vix_high = r.value("vix_high", cfg.vix_high);
    cfg.vix_extreme = r.value("vix_extreme", cfg.vix_extreme);
    if (r.contains("scales")) {
        for (const auto& item : r["scales"].items()) {
            cfg.scales[item.key()] = item.value().get<double>();
        }
    }
    if (r.contains("horizon_scales")) {
        for (const auto& horizon : r["horizon_scales"].items()) {
            auto& table = cfg.horizon_scales[horizon.key()];
            for (const auto& item : horizon.value().items()) {
                table[item.key()] = item.value().get<double>();
            }
        }
    }
}

void parseSizing(const nlohmann::json& s, engine::SizingConfig& cfg) {
    cfg.kelly_fraction = s.value("kelly_fraction", cfg.kelly_fraction);
    cfg.min_position_pct = s.value("min_position_pct", cfg.min_position_pct);
    cfg.max_position_pct = s.value("max_position_pct", cfg.max_position_pct);
    cfg.high_confidence_multiplier = s.value("high_confidence_multiplier", cfg.high_confidence_multiplier);
    cfg.medium_confidence_multiplier = s.value("medium_confidence_multiplier", cfg.medium_confidence_multiplier);
    cfg.low_confidence_multiplier = s.value("low_confidence_multiplier", cfg.low_confidence_multiplier);
    cfg.default_multiplier = s.value("default_multiplier", cfg.default_multiplier);
    if (s.contains("horizon_multipliers")) {
        // JSON object keys are strings: {"1": 1.2, "3": 1.0}
        for (const auto& item : s["horizon_multipliers"].items()) {
            cfg.horizon_multipliers[std::stoi(item.key())] = item.value().get<double>();
        }
    }
    if (s.contains("sector_multipliers")) {
        for (const auto& item : s["sector_multipliers"].items()) {
            cfg.sector_multipliers[toLowerCopy(item.key())] = item.value().get<double>();
        }
    }
}

void parseRisk(const nlohmann::json& r, engine::RiskConfig& cfg) {
    cfg.initial_capital = r.value("initial_capital", cfg.initial_capital);
    cfg.max_daily_loss_pct = r.value("max_daily_loss_pct", cfg.max_daily_loss_pct);
    cfg.max_consecutive_losses = r.value("max_consecutive_losses", cfg.max_consecutive_losses);
    cfg.max_drawdown_pct = r.value("max_drawdown_pct", cfg.max_drawdown_pct);
    cfg.max_monthly_loss_pct = r.value("max_monthly_loss_pct", cfg.max_monthly_loss_pct);
    cfg.max_daily_trades = r.value("max_daily_trades", cfg.max_daily_trades);
    cfg.cooldown_minutes = r.value("cooldown_minutes", cfg.cooldown_minutes);
    cfg.max_positions_per_sector = r.value("max_positions_per_sector", cfg.max_positions_per_sector);
    cfg.max_concurrent_positions = r.value("max_concurrent_positions", cfg.max_concurrent_positions);
    cfg.recent_history_limit = r.value("recent_history_limit", cfg.recent_history_limit);
}

void parseLifecycle(const nlohmann::json& l, engine::LifecycleConfig& cfg) {
    if (l.contains("horizons")) {
        cfg.horizons.clear();
        for (const auto& h : l["horizons"]) {
            engine::HorizonProfile profile;
            profile.days = h.at("days").get<int>();
            profile.sl_multiplier_scale = h.value("sl_multiplier_scale", profile.sl_multiplier_scale);
            profile.sl_cap_pct = h.value("sl_cap_pct", profile.sl_cap_pct);
            profile.rr_min = h.value("rr_min", profile.rr_min);
            cfg.horizons.push_back(profile);
        }
    }
    const std::string timing = toLowerCopy(l.value("entry_timing", std::string("signal_close")));
    require(timing == "signal_close" || timing == "next_open",
            "lifecycle.entry_timing must be signal_close or next_open");
    cfg.entry_timing = (timing == "next_open") ? engine::EntryTiming::NEXT_OPEN
                                               : engine::EntryTiming::SIGNAL_CLOSE;
    cfg.min_win_rate = l.value("min_win_rate", cfg.min_win_rate);
    cfg.min_rr_ratio = l.value("min_rr_ratio", cfg.min_rr_ratio);
    cfg.reject_low_confidence = l.value("reject_low_confidence", cfg.reject_low_confidence);
    cfg.max_catch_up_days = l.value("max_catch_up_days", cfg.max_catch_up_days);
    cfg.shadow_sample_pct = l.value("shadow_sample_pct", cfg.shadow_sample_pct);
}

void parseDomain(const nlohmann::json& d, engine::DomainConfig& cfg) {
    if (d.contains("instrument_sectors")) {
        for (const auto& item : d["instrument_sectors"].items()) {
            cfg.instrument_sectors[toLowerCopy(item.key())] = toLowerCopy(item.value().get<std::string>());
        }
    }
    cfg.allowed_instruments = d.value("allowed_instruments", cfg.allowed_instruments);
    cfg.excluded_instruments = d.value("excluded_instruments", cfg.excluded_instruments);
    cfg.allowed_timeframes = d.value("allowed_timeframes", cfg.allowed_timeframes);
    for (auto& v : cfg.allowed_instruments) v = toLowerCopy(v);
    for (auto& v : cfg.excluded_instruments) v = toLowerCopy(v);
}

void parseStorage(const nlohmann::json& s, engine::StorageConfig& cfg) {
    cfg.state_dir = s.value("state_dir", cfg.state_dir);
    cfg.log_dir = s.value("log_dir", cfg.log_dir);
    cfg.log_level = s.value("log_level", cfg.log_level);
    cfg.observations_file = s.value("observations_file", cfg.observations_file);
    cfg.live_file = s.value("live_file", cfg.live_file);
    cfg.bars_dir = s.value("bars_dir", cfg.bars_dir);
    cfg.index_instrument = s.value("index_instrument", cfg.index_instrument);
    cfg.volatility_instrument = s.value("volatility_instrument", cfg.volatility_instrument);
    cfg.prediction_workers = s.value("prediction_workers", cfg.prediction_workers);
}
} // namespace

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::load(const std::string& path) {
    std::filesystem::path config_path;
    if (std::filesystem::path(path).is_absolute()) {
        config_path = path;
    } else {
        config_path = utils::PathUtils::resolveRelativePath(path);
    }

    std::cout << "Config path: " << config_path << std::endl;

    std::ifstream file(config_path);
    if (!file.is_open()) {
        throw ConfigError("cannot open config file: " + config_path.string());
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("malformed config file " + config_path.string() + ": " + e.what());
    }

    engine::EngineConfig parsed;
    try {
        parsed = parse(j);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("config type error: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw ConfigError(std::string("config value error: ") + e.what());
    }
    validate(parsed);

    engine_config_ = parsed;
    loaded_path_ = config_path.string();
    std::cout << "Config loaded: capital=" << engine_config_.risk.initial_capital
              << ", min_matches=" << engine_config_.predictor.min_matches << std::endl;
}

engine::EngineConfig Config::parse(const nlohmann::json& j) {
    engine::EngineConfig cfg;
    if (j.contains("predictor")) parsePredictor(j["predictor"], cfg.predictor);
    if (j.contains("feedback")) parseFeedback(j["feedback"], cfg.feedback);
    if (j.contains("regime")) parseRegime(j["regime"], cfg.regime);
    if (j.contains("sizing")) parseSizing(j["sizing"], cfg.sizing);
    if (j.contains("risk")) parseRisk(j["risk"], cfg.risk);
    if (j.contains("lifecycle")) parseLifecycle(j["lifecycle"], cfg.lifecycle);
    if (j.contains("domain")) parseDomain(j["domain"], cfg.domain);
    if (j.contains("storage")) parseStorage(j["storage"], cfg.storage);
    return cfg;
}

void Config::validate(const engine::EngineConfig& c) {
    const auto& p = c.predictor;
    require(p.min_matches >= 1, "predictor.min_matches must be >= 1");
    require(p.top_k >= p.min_matches, "predictor.top_k must be >= min_matches");
    require(p.max_per_instrument >= 1, "predictor.max_per_instrument must be >= 1");
    require(p.max_per_sector >= p.max_per_instrument, "predictor.max_per_sector must be >= max_per_instrument");
    require(!p.horizons.empty(), "predictor.horizons must not be empty");
    require(std::find(p.horizons.begin(), p.horizons.end(), p.primary_horizon) != p.horizons.end(),
            "predictor.primary_horizon must be one of predictor.horizons");
    for (int h : p.horizons) {
        require(h > 0, "predictor.horizons must be positive");
    }
    require(!p.accepted_tiers.empty(), "predictor.accepted_tiers must not be empty");
    require(p.edge_threshold_pct >= 0.0, "predictor.edge_threshold_pct must be >= 0");
    for (double w : {p.weight_edge, p.weight_sample, p.weight_tier, p.weight_profit_factor}) {
        require(w >= 0.0, "predictor confidence weights must be >= 0");
    }
    require(p.weight_edge + p.weight_sample + p.weight_tier + p.weight_profit_factor <= 1.0 + 1e-9,
            "predictor confidence weights must sum to <= 1");
    for (double q : p.tier_quality) {
        requireScale(q, "predictor.tier_quality");
    }
    require(p.sample_saturation > 0.0, "predictor.sample_saturation must be > 0");
    require(p.medium_confidence_threshold < p.high_confidence_threshold,
            "predictor.medium_confidence_threshold must be < high_confidence_threshold");
    require(p.sl_floor_pct > 0.0 && p.sl_floor_pct <= p.sl_cap_pct,
            "predictor stop-loss floor must be > 0 and <= cap");
    require(p.gross_loss_floor > 0.0, "predictor.gross_loss_floor must be > 0");

    const auto& f = c.feedback;
    require(f.max_blend_weight >= 0.0 && f.max_blend_weight <= 1.0, "feedback.max_blend_weight must be within [0, 1]");
    require(f.blend_prior_trades > 0.0, "feedback.blend_prior_trades must be > 0");
    require(f.decay_half_life_days > 0.0, "feedback.decay_half_life_days must be > 0");
    requireScale(f.unknown_age_weight, "feedback.unknown_age_weight");
    require(f.min_segment_trades >= 1, "feedback.min_segment_trades must be >= 1");
    require(f.max_age_days >= 0, "feedback.max_age_days must be >= 0");
    require(f.min_outcomes_for_rebuild >= 1, "feedback.min_outcomes_for_rebuild must be >= 1");

    const auto& r = c.regime;
    require(r.dma_period >= 1, "regime.dma_period must be >= 1");
    require(r.vix_high > 0.0 && r.vix_high < r.vix_extreme, "regime.vix_high must be > 0 and < vix_extreme");
    for (const char* label : {"bull_low_vol", "bull_high_vol", "bear_low_vol", "bear_high_vol", "extreme"}) {
        const auto it = r.scales.find(label);
        require(it != r.scales.end(), std::string("regime.scales missing ") + label);
        requireScale(it->second, std::string("regime.scales.") + label);
    }
    for (const auto& table : r.horizon_scales) {
        for (const auto& entry : table.second) {
            requireScale(entry.second, "regime.horizon_scales." + table.first + "." + entry.first);
        }
    }

    const auto& s = c.sizing;
    require(s.kelly_fraction > 0.0 && s.kelly_fraction <= 1.0, "sizing.kelly_fraction must be within (0, 1]");
    require(s.min_position_pct >= 0.0, "sizing.min_position_pct must be >= 0");
    require(s.max_position_pct > 0.0 && s.max_position_pct <= 100.0, "sizing.max_position_pct must be within (0, 100]");
    require(s.min_position_pct <= s.max_position_pct, "sizing.min_position_pct must be <= max_position_pct");
    for (double m : {s.high_confidence_multiplier, s.medium_confidence_multiplier,
                     s.low_confidence_multiplier, s.default_multiplier}) {
        require(m >= 0.0, "sizing multipliers must be >= 0");
    }
    for (const auto& h : s.horizon_multipliers) {
        require(h.first > 0 && h.second >= 0.0, "sizing.horizon_multipliers must be positive");
    }
    for (const auto& sec : s.sector_multipliers) {
        require(sec.second >= 0.0, "sizing.sector_multipliers must be >= 0");
    }

    const auto& k = c.risk;
    require(k.initial_capital > 0.0, "risk.initial_capital must be > 0");
    require(k.max_daily_loss_pct > 0.0, "risk.max_daily_loss_pct must be > 0");
    require(k.max_consecutive_losses >= 1, "risk.max_consecutive_losses must be >= 1");
    require(k.max_drawdown_pct > 0.0 && k.max_drawdown_pct <= 100.0, "risk.max_drawdown_pct must be within (0, 100]");
    require(k.max_monthly_loss_pct > 0.0, "risk.max_monthly_loss_pct must be > 0");
    require(k.max_daily_trades >= 1, "risk.max_daily_trades must be >= 1");
    require(k.cooldown_minutes >= 0, "risk.cooldown_minutes must be >= 0");
    require(k.max_positions_per_sector >= 1, "risk.max_positions_per_sector must be >= 1");
    require(k.max_concurrent_positions > 0.0, "risk.max_concurrent_positions must be > 0");
    require(k.recent_history_limit >= 0, "risk.recent_history_limit must be >= 0");

    const auto& l = c.lifecycle;
    require(!l.horizons.empty(), "lifecycle.horizons must not be empty");
    for (const auto& h : l.horizons) {
        require(h.days > 0, "lifecycle horizon days must be > 0");
        require(h.sl_multiplier_scale > 0.0, "lifecycle sl_multiplier_scale must be > 0");
        require(h.sl_cap_pct >= p.sl_floor_pct, "lifecycle sl_cap_pct must be >= predictor.sl_floor_pct");
        require(h.rr_min > 0.0, "lifecycle rr_min must be > 0");
    }
    require(l.min_win_rate >= 0.0 && l.min_win_rate <= 100.0, "lifecycle.min_win_rate must be within [0, 100]");
    require(l.min_rr_ratio >= 0.0, "lifecycle.min_rr_ratio must be >= 0");
    require(l.max_catch_up_days >= 0, "lifecycle.max_catch_up_days must be >= 0");
    require(l.shadow_sample_pct >= 0 && l.shadow_sample_pct <= 100,
            "lifecycle.shadow_sample_pct must be within [0, 100]");

    require(!c.storage.state_dir.empty(), "storage.state_dir must not be empty");
    require(c.storage.prediction_workers >= 1, "storage.prediction_workers must be >= 1");
}

} // namespace patternedge
