#pragma once

#include <filesystem>
#include <optional>

#include <nlohmann/json.hpp>

#include "core/contracts/IRiskStateStore.h"

namespace patternedge {
namespace core {

class RiskStateStoreJson : public IRiskStateStore {
public:
    explicit RiskStateStoreJson(std::filesystem::path file_path);

    std::optional<risk::RiskState> load() override;
    bool save(const risk::RiskState& state, std::uint64_t expected_version) override;

    static nlohmann::json toJson(const risk::RiskState& state);
    static risk::RiskState fromJson(const nlohmann::json& raw);

private:
    std::filesystem::path file_path_;
};

} // namespace core
} // namespace patternedge
