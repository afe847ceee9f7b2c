#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/contracts/IEventJournal.h"
#include "core/contracts/IMarketDataSource.h"
#include "core/contracts/ITradeStore.h"
#include "core/model/Trade.h"
#include "engine/EngineConfig.h"
#include "engine/FeedbackTypes.h"
#include "risk/RiskManager.h"

namespace patternedge {
namespace engine {

// Sized, risk-cleared signal ready to become a trade
struct TradeSignal {
    std::string instrument;
    std::string sector;
    Direction direction = Direction::BULLISH;
    std::vector<std::string> patterns;
    int horizon_days = 5;
    std::string signal_date;
    double signal_close = 0.0;

    double sl_pct = 0.0;
    double target_pct = 0.0;
    double rr_ratio = 0.0;
    double position_pct = 0.0;
    double position_value = 0.0;

    double predicted_win_rate = 0.0;
    double predicted_pf = 0.0;
    double confidence = 0.0;
    ConfidenceLevel confidence_level = ConfidenceLevel::LOW;
    Tier tier = Tier::TIER_1;
    int n_matches = 0;

    std::string trend;
    double volume_ratio = 1.0;
    std::string regime;
};

enum class AcceptStatus { ACCEPTED, PENDING_FILL, DUPLICATE, REJECTED_RISK };

std::string toString(AcceptStatus status);

struct AcceptResult {
    AcceptStatus status = AcceptStatus::REJECTED_RISK;
    std::string trade_id;
    std::string reason;
};

struct MonitorReport {
    int checked = 0;
    int filled = 0;
    int cancelled = 0;
    int closed = 0;
    int shadow_closed = 0;
    std::vector<std::string> closed_ids;
};

struct ExitCheck {
    TradeStatus status = TradeStatus::OPEN;
    double exit_price = 0.0;
    std::string reason;
};

// Owns the trade book. Each trade moves OPEN -> closed/cancelled exactly once;
// closes are persisted, then applied to the RiskManager, then queued as outcomes.
class TradeLifecycleEngine {
public:
    using Clock = std::function<long long()>;

    TradeLifecycleEngine(LifecycleConfig config,
                         std::shared_ptr<core::ITradeStore> store,
                         risk::RiskManager& risk,
                         std::shared_ptr<core::IEventJournal> journal = nullptr,
                         Clock clock = Clock());

    AcceptResult accept(const TradeSignal& signal);

    // Follows a filtered signal without capital or risk checks.
    // False when the same instrument/horizon/date is already tracked.
    bool recordShadow(const TradeSignal& signal, const std::vector<std::string>& reasons);

    // Idempotent for a given check_date and market data
    MonitorReport monitor(const std::string& check_date, const core::IMarketDataSource& data);

    // Re-applies closed trades missing from the risk state and re-queues unrecorded outcomes
    int reconcile();

    std::vector<OutcomeRecord> drainOutcomes();
    void markFeedbackRecorded(const std::vector<std::string>& trade_ids);

    std::vector<core::Trade> trades() const;
    std::vector<core::Trade> openTrades() const;
    std::vector<core::Trade> shadowTrades() const;
    std::optional<core::Trade> find(const std::string& trade_id) const;
    std::vector<risk::OpenPositionView> openPositions() const;

    bool wasScanned(const std::string& date) const;
    void markScanned(const std::string& date);
    std::string lastScanDate() const;

    static std::optional<ExitCheck> checkExit(const core::Trade& trade, const DailyBar& bar);
    static double returnPct(const core::Trade& trade, double exit_price);
    static OutcomeRecord toOutcome(const core::Trade& trade);

private:
    std::vector<risk::OpenPositionView> openPositionsLocked(const std::string& exclude_id) const;
    void commit(core::TradeBook next);
    void closeTrade(core::Trade& trade, const ExitCheck& exit, const std::string& exit_date);
    bool advance(core::Trade& trade, const std::string& check_date, const core::IMarketDataSource& data);
    void applyClose(const core::Trade& trade);
    void journal(core::JournalEventType type, const core::Trade& trade, nlohmann::json payload);

    LifecycleConfig config_;
    std::shared_ptr<core::ITradeStore> store_;
    risk::RiskManager& risk_;
    std::shared_ptr<core::IEventJournal> journal_;
    Clock clock_;

    mutable std::mutex mutex_;
    core::TradeBook book_;
    std::vector<OutcomeRecord> pending_outcomes_;
};

} // namespace engine
} // namespace patternedge
