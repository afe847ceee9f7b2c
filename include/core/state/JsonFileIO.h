#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>

#include <nlohmann/json.hpp>

namespace patternedge {
namespace core {

// nullopt when the file does not exist. Throws PersistenceError when it exists but cannot be read or parsed.
std::optional<nlohmann::json> readJsonFile(const std::filesystem::path& path);

// Writes and fsyncs <path>.tmp, renames it over <path>, then fsyncs the directory
bool writeJsonAtomically(const std::filesystem::path& path, const nlohmann::json& document);

// Throws VersionConflictError unless the stored "version" equals expected (a missing file counts as 0)
void checkStoredVersion(const std::filesystem::path& path, std::uint64_t expected);

} // namespace core
} // namespace patternedge
