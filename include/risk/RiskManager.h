#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "core/contracts/IRiskStateStore.h"
#include "engine/EngineConfig.h"
#include "risk/RiskState.h"

namespace patternedge {
namespace risk {

enum class Breaker {
    DAILY_LOSS,
    CONSECUTIVE_LOSSES,
    DRAWDOWN,
    DAILY_TRADES,
    MONTHLY_LOSS,
    COOLDOWN
};

std::string toString(Breaker breaker);

struct BreakerTrip {
    Breaker breaker = Breaker::DAILY_LOSS;
    double value = 0.0;
    double threshold = 0.0;
    std::string message;
};

struct RiskDecision {
    bool allowed = true;
    std::vector<BreakerTrip> reasons;
};

// Realized result of one closed trade
struct TradeClose {
    std::string trade_id;
    std::string instrument;
    std::string sector;
    int horizon_days = 0;
    double pnl = 0.0;
    double return_pct = 0.0;
    std::string exit_date;
};

struct CloseResult {
    bool applied = false;               // false when the trade id was already recorded
    std::vector<BreakerTrip> tripped;   // breakers that switched on with this close
};

// Pre-entry gate verdict; reason is set when allowed == false
struct EntryCheck {
    bool allowed = false;
    std::string reason;
};

struct OpenPositionView {
    std::string sector;
    int horizon_days = 0;
};

// Account-level circuit breakers and pre-entry concentration gates.
// All mutations go copy -> mutate -> durable save -> commit.
class RiskManager {
public:
    using Clock = std::function<long long()>;

    RiskManager(const engine::RiskConfig& config,
                std::shared_ptr<core::IRiskStateStore> store,
                Clock clock = Clock(),
                int primary_horizon = 5);

    bool canTrade() const;
    RiskDecision evaluate() const;

    // Throws PersistenceError / VersionConflictError; state is unchanged on throw.
    CloseResult recordTradeClose(const TradeClose& close);

    EntryCheck checkSectorLimit(const std::string& sector,
                                         const std::vector<OpenPositionView>& open) const;
    EntryCheck checkHorizonLimit(int horizon_days,
                                          const std::vector<OpenPositionView>& open) const;
    EntryCheck validateEntry(const std::string& sector, int horizon_days,
                                      const std::vector<OpenPositionView>& open) const;

    // Manual override. Requires confirm == true.
    bool resetBreakers(bool confirm);

    // Current state with date/month rollover and elapsed cooldowns applied
    RiskState state() const;
    bool isApplied(const std::string& trade_id) const;
    const engine::RiskConfig& config() const { return config_; }

    static RiskState rollover(const RiskState& state, long long now_ms,
                              const engine::RiskConfig& config);
    static RiskDecision evaluateState(const RiskState& state, long long now_ms,
                                      const engine::RiskConfig& config);

private:
    long long now() const;
    void persist(RiskState& next);

    engine::RiskConfig config_;
    std::shared_ptr<core::IRiskStateStore> store_;
    Clock clock_;
    int primary_horizon_;

    mutable std::mutex mutex_;
    RiskState state_;
};

} // namespace risk
} // namespace patternedge
