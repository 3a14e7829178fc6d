#include "tab2fig/core/Path.hpp"
#include "tab2fig/utils/Logger.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace tab2fig {
namespace core {

Path::Path(const std::string& path) : utf8_path_(path) {}

Path::Path(const char* path) : utf8_path_(path ? path : "") {}

Path Path::operator/(const std::string& child) const {
    if (utf8_path_.empty()) return Path(child);
    return Path((fs::path(utf8_path_) / child).string());
}

Path Path::parent() const {
    return Path(fs::path(utf8_path_).parent_path().string());
}

std::string Path::filename() const {
    return fs::path(utf8_path_).filename().string();
}

std::string Path::stem() const {
    return fs::path(utf8_path_).stem().string();
}

std::string Path::extension() const {
    return fs::path(utf8_path_).extension().string();
}

Path Path::withExtension(const std::string& ext) const {
    fs::path p(utf8_path_);
    p.replace_extension(ext);
    return Path(p.string());
}

Path Path::absolute() const {
    std::error_code ec;
    fs::path abs = fs::absolute(utf8_path_, ec);
    if (ec) {
        TAB2FIG_LOG_DEBUG("Cannot make '{}' absolute: {}", utf8_path_, ec.message());
        return *this;
    }
    return Path(abs.lexically_normal().string());
}

bool Path::exists() const {
    if (utf8_path_.empty()) return false;
    std::error_code ec;
    return fs::exists(utf8_path_, ec);
}

bool Path::isFile() const {
    if (utf8_path_.empty()) return false;
    std::error_code ec;
    return fs::is_regular_file(utf8_path_, ec);
}

bool Path::isDirectory() const {
    if (utf8_path_.empty()) return false;
    std::error_code ec;
    return fs::is_directory(utf8_path_, ec);
}

uintmax_t Path::fileSize() const {
    if (utf8_path_.empty()) return 0;
    std::error_code ec;
    const uintmax_t size = fs::file_size(utf8_path_, ec);
    if (ec) {
        TAB2FIG_LOG_DEBUG("Filesystem error getting file size '{}': {}", utf8_path_, ec.message());
        return 0;
    }
    return size;
}

bool Path::remove() const {
    if (utf8_path_.empty()) return false;
    std::error_code ec;
    const bool removed = fs::remove(utf8_path_, ec);
    if (ec) {
        TAB2FIG_LOG_DEBUG("Filesystem error removing file '{}': {}", utf8_path_, ec.message());
        return false;
    }
    return removed;
}

bool Path::copyTo(const Path& target) const {
    if (utf8_path_.empty() || target.empty()) return false;
    std::error_code ec;
    fs::copy_file(utf8_path_, target.utf8_path_, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        TAB2FIG_LOG_DEBUG("Filesystem error copying '{}' to '{}': {}", utf8_path_, target.utf8_path_,
                          ec.message());
        return false;
    }
    return true;
}

bool Path::createDirectories(std::string* error) const {
    if (utf8_path_.empty()) {
        if (error) *error = "empty path";
        return false;
    }
    std::error_code ec;
    if (fs::is_directory(utf8_path_, ec)) {
        return true;
    }
    fs::create_directories(utf8_path_, ec);
    if (ec) {
        if (error) *error = ec.message();
        return false;
    }
    if (!fs::is_directory(utf8_path_, ec)) {
        if (error) *error = "path exists but is not a directory";
        return false;
    }
    return true;
}

bool Path::isWritable() const {
    if (utf8_path_.empty()) return false;
    return ::access(utf8_path_.c_str(), W_OK) == 0;
}

bool Path::isExecutable() const {
    return isFile() && ::access(utf8_path_.c_str(), X_OK) == 0;
}

bool Path::readText(std::string& out) const {
    std::ifstream in(utf8_path_, std::ios::in | std::ios::binary);
    if (!in.is_open()) {
        return false;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    out = buffer.str();
    return !in.bad();
}

bool Path::writeText(const std::string& content) const {
    std::ofstream out(utf8_path_, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!out.is_open()) {
        return false;
    }
    out << content;
    out.flush();
    return static_cast<bool>(out);
}

} // namespace core
} // namespace tab2fig
