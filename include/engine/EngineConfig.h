#pragma once

#include <array>
#include <map>
#include <string>
#include <vector>

#include "common/Types.h"

namespace patternedge {
namespace engine {

struct PredictorConfig {
    int min_matches = 5;
    int top_k = 50;
    int max_per_instrument = 5;
    int max_per_sector = 15;
    int primary_horizon = 5;
    std::vector<int> horizons{1, 3, 5, 10, 25};
    std::vector<Tier> accepted_tiers{Tier::TIER_1, Tier::TIER_2};

    // Direction is neutral when both edges are under this (percentage points)
    double edge_threshold_pct = 3.0;

    // Confidence = w_edge*edge + w_sample*min(1, n/saturation) + w_tier*tier_quality + w_pf*pf_factor
    double weight_edge = 0.30;
    double weight_sample = 0.20;
    double weight_tier = 0.25;
    double weight_profit_factor = 0.25;
    double sample_saturation = 30.0;
    std::array<double, 4> tier_quality{1.0, 0.8, 0.5, 0.3};
    double high_confidence_threshold = 0.55;
    double medium_confidence_threshold = 0.35;
    double gross_loss_floor = 0.001;

    // ATR stop used for SL-adjusted metrics
    double sl_floor_pct = 0.3;
    double sl_cap_pct = 5.0;
    double structural_sl_multiplier = 2.0;
    double standard_sl_multiplier = 1.5;
    std::vector<std::string> structural_patterns{
        "bullish_harami", "belt_hold_bearish", "bullish_kicker", "ladder_bottom", "mat_hold"};

    // Empty whitelist means every non-excluded pattern is tradeable
    std::vector<std::string> allowed_patterns;
    std::vector<std::string> excluded_patterns{
        "hanging_man", "doji", "three_outside_up", "three_inside_up",
        "three_outside_down", "bearish_harami"};
};

struct FeedbackConfig {
    double max_blend_weight = 0.50;
    double blend_prior_trades = 20.0;

    // Cascade minimum sample counts
    int min_triple_trades = 3;
    int min_horizon_trades = 2;
    int min_sector_trades = 2;
    int min_trend_trades = 3;
    int min_pattern_trades = 2;

    double decay_half_life_days = 60.0;
    double unknown_age_weight = 0.5;
    int min_segment_trades = 2;
    // Segments, rules and filters are derived only once this many outcomes exist
    int min_outcomes_for_rebuild = 3;
    double volume_confirm_ratio = 1.2;

    // Rule confidence adjustments, each scaled by rule confidence and min(3, 1 + 2.5*conf)
    double trend_aligned_boost = 0.05;
    double counter_trend_penalty = 0.04;
    double volume_confirmation_boost = 0.03;
    double volume_pattern_boost = 0.04;
    double stop_loss_penalty = 0.04;
    double volume_edge_threshold = 0.10;
    double volume_edge_gain = 0.15;

    // Filter penalties/boosts
    int pattern_reject_min_trades = 5;
    double pattern_reject_below_pct = 45.0;
    int pattern_relax_min_trades = 10;
    double pattern_relax_above_pct = 70.0;
    int segment_reject_min_trades = 3;
    double segment_reject_below_pct = 40.0;
    int segment_relax_min_trades = 5;
    double segment_relax_above_pct = 70.0;

    // Feedback older than this is ignored, 0 disables the check
    int max_age_days = 30;
};

struct RegimeConfig {
    int dma_period = 200;
    double vix_high = 20.0;
    double vix_extreme = 30.0;
    std::map<std::string, double> scales{
        {"bull_low_vol", 1.0},
        {"bull_high_vol", 0.7},
        {"bear_low_vol", 0.5},
        {"bear_high_vol", 0.3},
        {"extreme", 0.0}};
    // Horizon label -> regime label -> scale. Missing horizons use `scales`.
    std::map<std::string, std::map<std::string, double>> horizon_scales{
        {"BTST_1d", {{"bull_low_vol", 1.0}, {"bull_high_vol", 0.85}, {"bear_low_vol", 0.7},
                     {"bear_high_vol", 0.5}, {"extreme", 0.0}}},
        {"Swing_3d", {{"bull_low_vol", 1.0}, {"bull_high_vol", 0.75}, {"bear_low_vol", 0.6},
                      {"bear_high_vol", 0.4}, {"extreme", 0.0}}},
        {"Swing_10d", {{"bull_low_vol", 1.0}, {"bull_high_vol", 0.6}, {"bear_low_vol", 0.4},
                       {"bear_high_vol", 0.2}, {"extreme", 0.0}}},
        {"Swing_25d", {{"bull_low_vol", 1.0}, {"bull_high_vol", 0.5}, {"bear_low_vol", 0.3},
                       {"bear_high_vol", 0.1}, {"extreme", 0.0}}}};
};

struct SizingConfig {
    double kelly_fraction = 0.5;
    double min_position_pct = 0.5;
    double max_position_pct = 3.0;
    double high_confidence_multiplier = 1.0;
    double medium_confidence_multiplier = 0.7;
    double low_confidence_multiplier = 0.4;
    std::map<int, double> horizon_multipliers{{1, 1.2}, {3, 1.0}, {5, 0.9}, {10, 0.8}, {25, 0.7}};
    std::map<std::string, double> sector_multipliers{
        {"banking", 0.85}, {"finance", 0.85}, {"metals", 0.80}, {"realty", 0.75},
        {"energy", 0.90}, {"it", 0.95}, {"pharma", 1.0}, {"fmcg", 1.05},
        {"auto", 0.90}, {"infra", 0.85}, {"index", 1.0}};
    double default_multiplier = 1.0;
};

struct RiskConfig {
    double initial_capital = 1000000.0;
    double max_daily_loss_pct = 2.0;
    int max_consecutive_losses = 5;
    double max_drawdown_pct = 10.0;
    double max_monthly_loss_pct = 5.0;
    int max_daily_trades = 10;
    int cooldown_minutes = 60;
    int max_positions_per_sector = 2;
    double max_concurrent_positions = 10.0;
    int recent_history_limit = 500;
};

struct HorizonProfile {
    int days = 5;
    double sl_multiplier_scale = 1.0;
    double sl_cap_pct = 5.0;
    double rr_min = 2.0;
};

enum class EntryTiming { SIGNAL_CLOSE, NEXT_OPEN };

struct LifecycleConfig {
    std::vector<HorizonProfile> horizons{
        {1, 0.7, 2.5, 1.5},
        {3, 0.8, 3.5, 1.8},
        {5, 1.0, 5.0, 2.0},
        {10, 1.2, 5.0, 2.0}};
    EntryTiming entry_timing = EntryTiming::SIGNAL_CLOSE;

    // Signal filters
    double min_win_rate = 55.0;
    double min_rr_ratio = 1.5;
    bool reject_low_confidence = true;

    // Relaxed thresholds when feedback marks a pattern as strong
    double horizon_boost_win_rate_step = 8.0;
    double horizon_boost_win_rate_floor = 40.0;
    double horizon_boost_rr_step = 0.3;
    double horizon_boost_rr_floor = 1.0;
    double pattern_boost_win_rate_step = 5.0;
    double pattern_boost_win_rate_floor = 45.0;
    double pattern_boost_rr_step = 0.2;
    double pattern_boost_rr_floor = 1.2;

    // Catch-up never replays more than this many calendar days
    int max_catch_up_days = 30;

    // Share of filtered signals (duplicates excluded) followed as shadow trades, 0 disables
    int shadow_sample_pct = 20;
};

struct DomainConfig {
    std::map<std::string, std::string> instrument_sectors;
    std::vector<std::string> allowed_instruments;
    std::vector<std::string> excluded_instruments{"vix", "indiavix"};
    std::vector<std::string> allowed_timeframes;
};

struct StorageConfig {
    std::string state_dir = "state";
    std::string log_dir = "logs";
    std::string log_level = "info";
    std::string observations_file = "data/observations.json";
    // Today's observations, same format without forward outcomes
    std::string live_file = "data/live_observations.json";
    std::string bars_dir = "data/bars";
    std::string index_instrument = "nifty50";
    std::string volatility_instrument = "indiavix";
    int prediction_workers = 4;
};

struct EngineConfig {
    PredictorConfig predictor;
    FeedbackConfig feedback;
    RegimeConfig regime;
    SizingConfig sizing;
    RiskConfig risk;
    LifecycleConfig lifecycle;
    DomainConfig domain;
    StorageConfig storage;
};

} // namespace engine
} // namespace patternedge
