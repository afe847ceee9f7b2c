#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "core/contracts/IFeedbackStateStore.h"
#include "engine/EngineConfig.h"
#include "engine/FeedbackTypes.h"

namespace patternedge {
namespace engine {

// Holds the learned feedback as an immutable snapshot.
// Readers grab the current shared_ptr; ingest/rebuild publish a fresh one.
// Concurrent ingest/rebuild calls are safe: a writer whose base snapshot was
// replaced meanwhile rebuilds on top of the newer one, so no batch is lost.
class FeedbackStore {
public:
    FeedbackStore(FeedbackConfig config, std::shared_ptr<core::IFeedbackStateStore> store);

    // Replaces the in-memory snapshot with the persisted one (if any)
    void load();

    std::shared_ptr<const FeedbackSnapshot> snapshot() const;

    // nullptr (with a warning) when there is no feedback or it is older than max_age_days
    std::shared_ptr<const FeedbackSnapshot> usableSnapshot(const std::string& as_of) const;

    // Validates every record first, so a bad batch leaves the store untouched.
    // Returns the number of new (non-duplicate) outcomes.
    int ingest(const std::vector<OutcomeRecord>& outcomes, const std::string& as_of);

    // Re-derives segments, rules and filters with decay relative to as_of
    void rebuild(const std::string& as_of);

    // Throws VersionConflictError when the document changed on disk since load()
    bool save();

    bool isStale(const std::string& as_of) const;
    std::uint64_t persistedVersion() const;

    static FeedbackSnapshot build(const std::vector<OutcomeRecord>& outcomes,
                                  const std::string& as_of,
                                  const FeedbackConfig& config);
    static double decayWeight(const std::string& exit_date, const std::string& as_of,
                              const FeedbackConfig& config);

private:
    // Swaps in next only when base is still current
    bool publishIfCurrent(const std::shared_ptr<const FeedbackSnapshot>& base, FeedbackSnapshot next);

    FeedbackConfig config_;
    std::shared_ptr<core::IFeedbackStateStore> store_;

    mutable std::mutex mutex_;
    std::shared_ptr<const FeedbackSnapshot> current_;
    std::uint64_t persisted_version_ = 0;
};

} // namespace engine
} // namespace patternedge
