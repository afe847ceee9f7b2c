#pragma once

#include <filesystem>
#include <optional>

#include <nlohmann/json.hpp>

#include "core/contracts/ITradeStore.h"

namespace patternedge {
namespace core {

class TradeStoreJson : public ITradeStore {
public:
    explicit TradeStoreJson(std::filesystem::path file_path);

    std::optional<TradeBook> load() override;
    bool save(const TradeBook& book, std::uint64_t expected_version) override;

    static nlohmann::json tradeToJson(const Trade& trade);
    static Trade tradeFromJson(const nlohmann::json& raw);

private:
    std::filesystem::path file_path_;
};

} // namespace core
} // namespace patternedge
