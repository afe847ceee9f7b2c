#pragma once

#include <filesystem>
#include <optional>

#include <nlohmann/json.hpp>

#include "core/contracts/IFeedbackStateStore.h"

namespace patternedge {
namespace core {

// feedback.json: outcomes plus the derived segment maps, rules and filters
class FeedbackStateStoreJson : public IFeedbackStateStore {
public:
    explicit FeedbackStateStoreJson(std::filesystem::path file_path);

    std::optional<engine::FeedbackSnapshot> load() override;
    bool save(const engine::FeedbackSnapshot& snapshot, std::uint64_t expected_version) override;

    static nlohmann::json toJson(const engine::FeedbackSnapshot& snapshot);
    static engine::FeedbackSnapshot fromJson(const nlohmann::json& raw);

    static nlohmann::json outcomeToJson(const engine::OutcomeRecord& outcome);
    static engine::OutcomeRecord outcomeFromJson(const nlohmann::json& raw);

private:
    std::filesystem::path file_path_;
};

} // namespace core
} // namespace patternedge
