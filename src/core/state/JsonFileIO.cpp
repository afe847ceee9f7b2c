#include "core/state/JsonFileIO.h"
#include "common/Errors.h"

#include <cerrno>
#include <fstream>
#include <string>
#include <system_error>

#ifdef _WIN32
#include <fcntl.h>
#include <io.h>
#include <sys/stat.h>
#else
#include <fcntl.h>
#include <unistd.h>
#endif

namespace patternedge {
namespace core {
namespace {
// Writes the whole buffer and syncs it to the device before returning
bool writeDurably(const std::filesystem::path& path, const std::string& data) {
#ifdef _WIN32
    const int fd = ::_wopen(path.c_str(), _O_CREAT | _O_TRUNC | _O_WRONLY | _O_BINARY, _S_IREAD | _S_IWRITE);
#else
    const int fd = ::open(path.c_str(), O_CREAT | O_TRUNC | O_WRONLY, 0644);
#endif
    if (fd < 0) {
        return false;
    }

    std::size_t written = 0;
    bool ok = true;
    while (written < data.size()) {
#ifdef _WIN32
        const int n = ::_write(fd, data.data() + written, static_cast<unsigned int>(data.size() - written));
#else
        const ssize_t n = ::write(fd, data.data() + written, data.size() - written);
#endif
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            ok = false;
            break;
        }
        written += static_cast<std::size_t>(n);
    }

#ifdef _WIN32
    ok = ok && ::_commit(fd) == 0;
    ok = (::_close(fd) == 0) && ok;
#else
    ok = ok && ::fsync(fd) == 0;
    ok = (::close(fd) == 0) && ok;
#endif
    return ok;
}

// Persists the rename itself. No-op where directories cannot be opened.
bool syncDirectory(const std::filesystem::path& dir) {
#ifdef _WIN32
    (void)dir;
    return true;
#else
    const int fd = ::open(dir.empty() ? "." : dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        return false;
    }
    const bool ok = ::fsync(fd) == 0;
    ::close(fd);
    return ok;
#endif
}
}

std::optional<nlohmann::json> readJsonFile(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return std::nullopt;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw PersistenceError("cannot open " + path.string());
    }

    try {
        nlohmann::json raw;
        in >> raw;
        return raw;
    } catch (const nlohmann::json::parse_error& e) {
        throw PersistenceError("corrupt state file " + path.string() + ": " + e.what());
    }
}

bool writeJsonAtomically(const std::filesystem::path& path, const nlohmann::json& document) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return false;
        }
    }

    auto tmp_path = path;
    tmp_path += ".tmp";

    if (!writeDurably(tmp_path, document.dump(2))) {
        std::filesystem::remove(tmp_path, ec);
        return false;
    }

    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        std::filesystem::remove(tmp_path, ec);
        return false;
    }
    // 디렉터리 엔트리까지 동기화해야 rename 이 전원 차단 후에도 남는다
    if (!syncDirectory(path.parent_path())) {
        return false;
    }
    return true;
}

void checkStoredVersion(const std::filesystem::path& path, std::uint64_t expected) {
    const auto stored = readJsonFile(path);
    const std::uint64_t on_disk = stored ? stored->value("version", static_cast<std::uint64_t>(0)) : 0;
    if (on_disk != expected) {
        throw VersionConflictError(
            path.string() + ": stored version " + std::to_string(on_disk) +
            " differs from expected " + std::to_string(expected));
    }
}

} // namespace core
} // namespace patternedge
