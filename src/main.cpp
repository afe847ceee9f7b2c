#include "common/Logger.h"
#include "common/Config.h"
#include "common/DateUtils.h"
#include "common/Errors.h"
#include "analytics/ObservationIndex.h"
#include "analytics/RegimeDetector.h"
#include "analytics/TieredPredictor.h"
#include "core/orchestration/TradingCycleCoordinator.h"
#include "core/state/EventJournalJsonl.h"
#include "core/state/FeedbackStateStoreJson.h"
#include "core/state/RiskStateStoreJson.h"
#include "core/state/TradeStoreJson.h"
#include "data/DataHistory.h"
#include "data/ObservationFeed.h"
#include "engine/FeedbackStore.h"
#include "engine/PerformanceStore.h"
#include "engine/TradeLifecycleEngine.h"
#include "risk/RiskManager.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace patternedge;

namespace {

struct CliOptions {
    std::string command;
    std::string config_path = "config/config.json";
    std::string date;
    std::string live_file;
    bool dry_run = false;
    bool confirm = false;
    bool json = false;
};

void printUsage() {
    std::cout << "Usage: patternedge <command> [options]\n\n"
              << "Commands:\n"
              << "  run             reconcile, catch-up, scan, monitor and feedback for one date\n"
              << "  scan            evaluate live observations and open trades\n"
              << "  monitor         check open trades against daily bars\n"
              << "  feedback        rebuild and save the feedback document\n"
              << "  status          print risk state and open trades\n"
              << "  reset-breakers  clear tripped breakers (needs --confirm)\n"
              << "  regime          print the market regime\n\n"
              << "Options:\n"
              << "  --config <path>   config file (default config/config.json)\n"
              << "  --date <date>     session date YYYY-MM-DD (default today)\n"
              << "  --live <path>     live observations file\n"
              << "  --dry-run         scan without opening trades\n"
              << "  --confirm         confirm reset-breakers\n"
              << "  --json            machine readable output\n";
}

// 잘못된 인자는 false
bool parseArgs(int argc, char* argv[], CliOptions& out) {
    if (argc < 2) {
        return false;
    }
    out.command = argv[1];
    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            out.config_path = argv[++i];
        } else if (arg == "--date" && i + 1 < argc) {
            out.date = argv[++i];
        } else if (arg == "--live" && i + 1 < argc) {
            out.live_file = argv[++i];
        } else if (arg == "--dry-run") {
            out.dry_run = true;
        } else if (arg == "--confirm") {
            out.confirm = true;
        } else if (arg == "--json") {
            out.json = true;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            return false;
        }
    }
    return true;
}

// Everything one command needs, wired from the config
struct Runtime {
    engine::EngineConfig config;
    std::shared_ptr<data::DataHistory> market_data;
    std::shared_ptr<analytics::RegimeDetector> regime;
    std::shared_ptr<core::EventJournalJsonl> journal;
    std::shared_ptr<risk::RiskManager> risk;
    std::shared_ptr<engine::TradeLifecycleEngine> lifecycle;
    std::shared_ptr<engine::FeedbackStore> feedback;
    std::shared_ptr<analytics::TieredPredictor> predictor;
    std::unique_ptr<core::TradingCycleCoordinator> coordinator;
};

Runtime buildRuntime(const engine::EngineConfig& config, bool with_predictor) {
    Runtime rt;
    rt.config = config;
    const auto& storage = config.storage;
    const std::filesystem::path state_dir(storage.state_dir);

    rt.market_data = std::make_shared<data::DataHistory>(storage.bars_dir);
    rt.regime = std::make_shared<analytics::RegimeDetector>(
        config.regime,
        rt.market_data->history(storage.index_instrument),
        rt.market_data->history(storage.volatility_instrument));
    if (!rt.regime->hasIndexData()) {
        LOG_WARN("No {} bars under {} - regime defaults to bull", storage.index_instrument, storage.bars_dir);
    }

    rt.journal = std::make_shared<core::EventJournalJsonl>(state_dir / "journal.jsonl");
    rt.risk = std::make_shared<risk::RiskManager>(
        config.risk,
        std::make_shared<core::RiskStateStoreJson>(state_dir / "risk_state.json"),
        risk::RiskManager::Clock(),
        config.predictor.primary_horizon);
    rt.lifecycle = std::make_shared<engine::TradeLifecycleEngine>(
        config.lifecycle,
        std::make_shared<core::TradeStoreJson>(state_dir / "trades.json"),
        *rt.risk,
        rt.journal);
    rt.feedback = std::make_shared<engine::FeedbackStore>(
        config.feedback,
        std::make_shared<core::FeedbackStateStoreJson>(state_dir / "feedback.json"));
    rt.feedback->load();

    if (with_predictor) {
        data::ObservationFeed feed(config.domain, config.predictor.horizons, config.predictor.primary_horizon);
        data::FeedStats stats;
        auto history = feed.loadHistory(storage.observations_file, &stats);
        LOG_INFO("Loaded {} historical observations ({} excluded, {} without outcome, {} malformed)",
                 stats.loaded, stats.excluded_instrument + stats.excluded_timeframe,
                 stats.missing_outcome, stats.malformed);
        auto index = std::make_shared<analytics::ObservationIndex>(std::move(history),
                                                                   config.predictor.primary_horizon);
        rt.predictor = std::make_shared<analytics::TieredPredictor>(index, config.predictor, config.feedback);
    }

    rt.coordinator = std::make_unique<core::TradingCycleCoordinator>(
        config, rt.predictor, rt.feedback, rt.regime, rt.risk, rt.lifecycle, rt.market_data, rt.journal);
    return rt;
}

std::vector<analytics::Observation> loadLive(const Runtime& rt, const CliOptions& opts) {
    const std::string path = opts.live_file.empty() ? rt.config.storage.live_file : opts.live_file;
    if (!std::filesystem::exists(path)) {
        LOG_WARN("Live observations file not found: {}", path);
        return {};
    }
    data::ObservationFeed feed(rt.config.domain, rt.config.predictor.horizons, rt.config.predictor.primary_horizon);
    return feed.loadLive(path);
}

constexpr std::size_t kStatusEvents = 10;
constexpr std::size_t kStatusSegments = 10;

nlohmann::json segmentJson(const engine::SegmentPerformance& s) {
    return {{"key", s.key}, {"closed", s.closed}, {"wins", s.wins}, {"losses", s.losses},
            {"win_rate", s.winRate()}, {"avg_return_pct", s.avgReturn()},
            {"total_return_pct", s.total_return_pct}, {"profit_factor", s.profitFactor()}};
}

void printSegments(const char* title, const std::vector<engine::SegmentPerformance>& segments) {
    std::cout << title << "\n";
    for (std::size_t i = 0; i < segments.size() && i < kStatusSegments; ++i) {
        const auto& s = segments[i];
        std::cout << "  " << std::left << std::setw(24) << s.key << std::right
                  << " " << s.closed << " closed, win " << s.winRate() << "%, avg "
                  << s.avgReturn() << "%, pf " << s.profitFactor() << "\n";
    }
}

void printStatus(const Runtime& rt, bool json_mode) {
    const auto state = rt.risk->state();
    const auto decision = rt.risk->evaluate();
    const auto open = rt.lifecycle->openTrades();
    const auto recent = rt.journal->tail(kStatusEvents);
    engine::PerformanceStore perf;
    perf.rebuild(rt.lifecycle->trades(), rt.lifecycle->shadowTrades());

    if (json_mode) {
        nlohmann::json j;
        j["capital"] = state.capital;
        j["peak_capital"] = state.peak_capital;
        j["drawdown_pct"] = state.drawdownPct();
        j["daily_pnl"] = state.daily_pnl;
        j["monthly_pnl"] = state.monthly_pnl;
        j["trades_today"] = state.trades_today;
        j["consecutive_losses"] = state.consecutive_losses;
        j["total_trades"] = state.total_trades;
        j["total_wins"] = state.total_wins;
        j["can_trade"] = decision.allowed;
        j["blocked_by"] = nlohmann::json::array();
        for (const auto& r : decision.reasons) {
            j["blocked_by"].push_back(risk::toString(r.breaker));
        }
        j["open_trades"] = nlohmann::json::array();
        for (const auto& t : open) {
            j["open_trades"].push_back({{"id", t.id}, {"instrument", t.instrument},
                                        {"horizon", t.horizon_label}, {"filled", t.filled},
                                        {"expiry", t.expiry_date}});
        }
        j["performance"] = {{"overall", segmentJson(perf.overall())}, {"open", perf.openTrades()},
                            {"by_horizon", nlohmann::json::array()}, {"by_pattern", nlohmann::json::array()},
                            {"by_instrument", nlohmann::json::array()}};
        for (const auto& s : perf.byHorizon()) {
            j["performance"]["by_horizon"].push_back(segmentJson(s));
        }
        for (const auto& s : perf.byPattern()) {
            j["performance"]["by_pattern"].push_back(segmentJson(s));
        }
        for (const auto& s : perf.byInstrument()) {
            j["performance"]["by_instrument"].push_back(segmentJson(s));
        }
        const auto& shadows = perf.shadows();
        j["shadow"] = {{"open", shadows.shadow_open}, {"closed", shadows.shadow.closed},
                       {"win_rate", shadows.shadow.winRate()}, {"real_win_rate", shadows.real.winRate()},
                       {"filter_alpha", shadows.filter_alpha}, {"per_horizon", nlohmann::json::object()}};
        for (const auto& entry : shadows.per_horizon) {
            auto& hz = j["shadow"]["per_horizon"][entry.first];
            hz = {{"closed", entry.second.closed}, {"wins", entry.second.wins},
                  {"win_rate", entry.second.win_rate}};
            hz["real_win_rate"] = entry.second.real_win_rate ? nlohmann::json(*entry.second.real_win_rate) : nullptr;
            hz["filter_alpha"] = entry.second.filter_alpha ? nlohmann::json(*entry.second.filter_alpha) : nullptr;
        }
        j["recent_events"] = nlohmann::json::array();
        for (const auto& e : recent) {
            j["recent_events"].push_back(core::toJson(e));
        }
        std::cout << j.dump(2) << "\n";
        return;
    }

    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Capital        : " << state.capital << " (peak " << state.peak_capital << ")\n";
    std::cout << "Drawdown       : " << state.drawdownPct() << "%\n";
    std::cout << "Daily P&L      : " << state.daily_pnl << " (" << state.trades_today << " trades)\n";
    std::cout << "Monthly P&L    : " << state.monthly_pnl << "\n";
    std::cout << "Loss streak    : " << state.consecutive_losses << "\n";
    std::cout << "Closed trades  : " << state.total_trades << " (" << state.total_wins << " wins)\n";
    std::cout << "Can trade      : " << (decision.allowed ? "yes" : "no") << "\n";
    for (const auto& r : decision.reasons) {
        std::cout << "  - " << r.message << "\n";
    }
    std::cout << "Open trades    : " << open.size() << "\n";
    for (const auto& t : open) {
        std::cout << "  " << t.id << " " << t.instrument << " " << t.horizon_label
                  << (t.filled ? " entry " + std::to_string(t.entry_price) : std::string(" pending fill"))
                  << " sl " << t.sl_price << " target " << t.target_price
                  << " expiry " << t.expiry_date << "\n";
    }
    const auto& overall = perf.overall();
    std::cout << "Performance    : " << overall.closed << " closed, win " << overall.winRate()
              << "%, avg " << overall.avgReturn() << "%, total " << overall.total_return_pct
              << "%, pf " << overall.profitFactor() << "\n";
    printSegments("By horizon     :", perf.byHorizon());
    printSegments("By pattern     :", perf.byPattern());
    printSegments("By instrument  :", perf.byInstrument());

    const auto& shadows = perf.shadows();
    std::cout << "Shadow trades  : " << shadows.shadow.closed << " closed, " << shadows.shadow_open
              << " open, win " << shadows.shadow.winRate() << "% vs real " << shadows.real.winRate()
              << "% (filter alpha " << std::showpos << shadows.filter_alpha << std::noshowpos << ")\n";
    for (const auto& entry : shadows.per_horizon) {
        std::cout << "  " << std::left << std::setw(24) << entry.first << std::right
                  << " shadow " << entry.second.win_rate << "% (" << entry.second.closed << ")";
        if (entry.second.filter_alpha) {
            std::cout << " real " << *entry.second.real_win_rate << "% alpha "
                      << std::showpos << *entry.second.filter_alpha << std::noshowpos;
        }
        std::cout << "\n";
    }
    std::cout << "Recent events  :\n";
    for (const auto& e : recent) {
        std::cout << "  #" << e.seq << " " << core::toString(e.type) << " "
                  << e.instrument << " " << e.entity_id << "\n";
    }
}

int runCommand(const CliOptions& opts, const engine::EngineConfig& config) {
    const std::string date = opts.date.empty()
        ? utils::DateUtils::dateFromMs(getCurrentTimestampMs())
        : opts.date;
    if (!utils::DateUtils::isValidDate(date)) {
        std::cerr << "Invalid --date: " << date << "\n";
        return 2;
    }

    const bool needs_predictor = opts.command == "run" || opts.command == "scan";
    Runtime rt = buildRuntime(config, needs_predictor);

    if (opts.command == "run") {
        const auto report = rt.coordinator->runSession(date, loadLive(rt, opts));
        if (opts.json) {
            nlohmann::json j{{"date", report.date}, {"regime", report.regime},
                             {"reconciled", report.reconciled}, {"catch_up_days", report.catch_up_days},
                             {"scanned", report.scanned}, {"signals", report.signals},
                             {"accepted", report.accepted}, {"rejected", report.rejected},
                             {"duplicates", report.duplicates}, {"filled", report.filled},
                             {"cancelled", report.cancelled}, {"closed", report.closed},
                             {"outcomes_ingested", report.outcomes_ingested},
                             {"shadows_tracked", report.shadows_tracked},
                             {"shadows_closed", report.shadows_closed}};
            const auto& daily = report.daily;
            j["daily"] = {{"opened", daily.trades_opened}, {"closed", daily.trades_closed},
                          {"wins", daily.wins}, {"losses", daily.losses},
                          {"expired_wins", daily.expired_wins}, {"expired_losses", daily.expired_losses},
                          {"total_return_pct", daily.total_return_pct}, {"win_rate", daily.win_rate},
                          {"avg_win_pct", daily.avg_win_pct}, {"avg_loss_pct", daily.avg_loss_pct},
                          {"best", daily.best_trade}, {"worst", daily.worst_trade}};
            std::cout << j.dump(2) << "\n";
        }
        return 0;
    }

    if (opts.command == "scan") {
        rt.coordinator->reconcile();
        const auto decisions = rt.coordinator->scan(date, loadLive(rt, opts), opts.dry_run);
        for (const auto& d : decisions) {
            std::cout << (d.accepted ? "ACCEPT " : "REJECT ") << d.instrument << " " << d.pattern
                      << " " << d.plan.horizon_label << " " << toString(d.plan.direction)
                      << std::fixed << std::setprecision(2)
                      << " wr=" << d.win_rate << " rr=" << d.plan.rr_ratio
                      << " sl=" << d.plan.sl_pct << "% size=" << d.sizing.position_pct << "%";
            if (!d.trade_id.empty()) {
                std::cout << " id=" << d.trade_id;
            }
            for (const auto& r : d.reasons) {
                std::cout << " [" << r << "]";
            }
            if (d.shadow) {
                std::cout << " shadow";
            }
            std::cout << "\n";
        }
        return 0;
    }

    if (opts.command == "monitor") {
        rt.coordinator->reconcile();
        rt.coordinator->monitor(date);
        rt.coordinator->flushFeedback(date);
        return 0;
    }

    if (opts.command == "feedback") {
        rt.feedback->rebuild(date);
        if (!rt.feedback->save()) {
            std::cerr << "Failed to save feedback document\n";
            return 4;
        }
        const auto snap = rt.feedback->snapshot();
        std::cout << "Feedback v" << snap->version << ": " << snap->outcomes.size() << " outcomes, "
                  << snap->adjustments.size() << " segments, " << snap->rules.size() << " rules, "
                  << snap->filters.size() << " filters\n";
        for (const auto& rule : snap->rules) {
            std::cout << "  [" << rule.type << "] " << rule.context << ": " << rule.description << "\n";
        }
        return 0;
    }

    if (opts.command == "status") {
        printStatus(rt, opts.json);
        return 0;
    }

    if (opts.command == "reset-breakers") {
        if (!opts.confirm) {
            std::cerr << "reset-breakers needs --confirm\n";
            return 2;
        }
        const auto before = rt.risk->evaluate();
        rt.risk->resetBreakers(true);
        core::JournalEvent event;
        event.ts_ms = getCurrentTimestampMs();
        event.type = core::JournalEventType::BREAKERS_RESET;
        event.entity_id = date;
        event.payload["cleared"] = nlohmann::json::array();
        for (const auto& r : before.reasons) {
            event.payload["cleared"].push_back(risk::toString(r.breaker));
        }
        if (!rt.journal->append(event)) {
            LOG_WARN("Breaker reset not journaled");
        }
        std::cout << "Breakers reset\n";
        return 0;
    }

    if (opts.command == "regime") {
        const auto a = rt.regime->detect(date);
        std::cout << "Regime " << a.as_of << ": " << analytics::toString(a.regime)
                  << std::fixed << std::setprecision(2) << " (scale " << a.scale << ")";
        if (a.index_close && a.dma) {
            std::cout << " index " << *a.index_close << " vs dma " << *a.dma;
        }
        if (a.vix_value) {
            std::cout << " vix " << *a.vix_value;
        }
        std::cout << "\n";
        return 0;
    }

    printUsage();
    return 2;
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions opts;
    if (!parseArgs(argc, argv, opts)) {
        printUsage();
        return 2;
    }

    try {
        Config::getInstance().load(opts.config_path);
        const auto config = Config::getInstance().getEngineConfig();
        Logger::getInstance().initialize(config.storage.log_dir, config.storage.log_level);

        LOG_INFO("PatternEdge {} ({})", opts.command, Config::getInstance().getLoadedPath());
        return runCommand(opts, config);
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 3;
    } catch (const PersistenceError& e) {
        LOG_ERROR("Persistence failure: {}", e.what());
        std::cerr << "Persistence failure: " << e.what() << "\n";
        return 4;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
