#include "common/PathUtils.h"

#include <system_error>

namespace patternedge {
namespace utils {

std::filesystem::path PathUtils::getExecutableDir() {
    std::error_code ec;
    const auto exe_path = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) {
        return std::filesystem::current_path();
    }
    return exe_path.parent_path();
}

std::filesystem::path PathUtils::resolveRelativePath(const std::string& relative_path) {
    const auto beside_exe = getExecutableDir() / relative_path;
    if (std::filesystem::exists(beside_exe)) {
        return beside_exe;
    }
    return std::filesystem::current_path() / relative_path;
}

} // namespace utils
} // namespace patternedge
