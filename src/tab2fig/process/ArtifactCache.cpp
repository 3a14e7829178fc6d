#include "tab2fig/process/ArtifactCache.hpp"
#include "tab2fig/core/Path.hpp"
#include "tab2fig/process/ScopedWorkingDirectory.hpp"
#include "tab2fig/utils/ModuleLoggers.hpp"

#include <fmt/format.h>

#include <vector>

namespace fs = std::filesystem;

namespace tab2fig {
namespace process {

namespace {

// FNV-1a 64 位
constexpr uint64_t kFnvOffsetBasis = 14695981039346656037ULL;
constexpr uint64_t kFnvPrime = 1099511628211ULL;

void fnvAppend(uint64_t& hash, const std::string& text) {
    for (char c : text) {
        hash ^= static_cast<uint64_t>(static_cast<unsigned char>(c));
        hash *= kFnvPrime;
    }
}

std::string resolveDirectory(const std::string& directory) {
    std::lock_guard<std::recursive_mutex> lock(ScopedWorkingDirectory::globalMutex());
    return core::Path(directory).absolute().string();
}

std::vector<fs::path> listFiles(const std::string& directory) {
    std::vector<fs::path> files;
    std::error_code ec;
    for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_regular_file(type_ec)) files.push_back(it->path());
    }
    if (ec) {
        PROC_WARN("Cannot list cache directory '{}': {}", directory, ec.message());
    }
    return files;
}

} // namespace

ArtifactCache::ArtifactCache() : directory_(defaultDirectory()) {}

ArtifactCache::ArtifactCache(const std::string& directory) : directory_(resolveDirectory(directory)) {}

ArtifactCache& ArtifactCache::global() {
    static ArtifactCache instance;
    return instance;
}

std::string ArtifactCache::defaultDirectory() {
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec) base = "/tmp";
    return (base / "tab2fig_cache").string();
}

std::string ArtifactCache::directory(bool create) const {
    std::string directory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        directory = directory_;
    }
    if (create) {
        std::string error;
        if (!core::Path(directory).createDirectories(&error)) {
            PROC_WARN("Cannot create cache directory '{}': {}", directory, error);
        }
    }
    return directory;
}

std::string ArtifactCache::setDirectory(const std::optional<std::string>& directory) {
    const std::string resolved = directory ? resolveDirectory(*directory) : defaultDirectory();
    std::lock_guard<std::mutex> lock(mutex_);
    std::string previous = std::move(directory_);
    directory_ = resolved;
    PROC_DEBUG("Cache directory -> {}", directory_);
    return previous;
}

std::string ArtifactCache::computeKey(const std::string& source, const std::string& settings) {
    uint64_t hash = kFnvOffsetBasis;
    fnvAppend(hash, source);
    fnvAppend(hash, std::string(1, '\0'));
    fnvAppend(hash, settings);
    return fmt::format("{:016x}", hash);
}

std::optional<std::string> ArtifactCache::lookup(const std::string& key, const std::string& suffix) const {
    const core::Path entry = core::Path(directory(false)) / (key + suffix);
    if (!entry.isFile()) return std::nullopt;
    return entry.string();
}

std::optional<std::string> ArtifactCache::store(const std::string& artifact, const std::string& key,
                                                const std::string& suffix) const {
    const core::Path source(artifact);
    if (!source.isFile()) {
        PROC_WARN("Cannot cache '{}': file does not exist", artifact);
        return std::nullopt;
    }
    const core::Path entry = core::Path(directory(true)) / (key + suffix);
    if (!source.copyTo(entry)) {
        PROC_WARN("Cannot copy '{}' into cache", artifact);
        return std::nullopt;
    }
    PROC_DEBUG("Cached {} as {}", artifact, entry.string());
    return entry.string();
}

bool ArtifactCache::retrieve(const std::string& cached, const std::string& target) const {
    const core::Path entry(cached);
    if (!entry.isFile()) return false;

    const core::Path destination(target);
    const core::Path parent = destination.parent();
    if (!parent.empty() && !parent.createDirectories()) {
        return false;
    }
    return entry.copyTo(destination);
}

size_t ArtifactCache::clear(std::optional<std::chrono::hours> older_than) const {
    const std::string dir = directory(false);
    if (!core::Path(dir).isDirectory()) {
        PROC_INFO("Cache directory does not exist: {}", dir);
        return 0;
    }

    const auto cutoff = fs::file_time_type::clock::now() -
                        (older_than ? *older_than : std::chrono::hours(0));
    size_t removed = 0;
    for (const auto& file : listFiles(dir)) {
        if (older_than) {
            std::error_code ec;
            const auto mtime = fs::last_write_time(file, ec);
            if (ec || mtime >= cutoff) continue;
        }
        if (core::Path(file.string()).remove()) ++removed;
    }
    PROC_INFO("Removed {} cached file(s) from {}", removed, dir);
    return removed;
}

CacheInfo ArtifactCache::info() const {
    CacheInfo info;
    info.path = directory(false);
    info.exists = core::Path(info.path).isDirectory();
    if (!info.exists) return info;

    for (const auto& file : listFiles(info.path)) {
        ++info.files;
        info.bytes += core::Path(file.string()).fileSize();
        std::error_code ec;
        const auto mtime = fs::last_write_time(file, ec);
        if (ec) continue;
        if (!info.oldest || mtime < *info.oldest) info.oldest = mtime;
        if (!info.newest || mtime > *info.newest) info.newest = mtime;
    }
    return info;
}

}} // namespace tab2fig::process
