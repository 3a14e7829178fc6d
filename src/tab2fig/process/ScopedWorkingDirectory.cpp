#include "tab2fig/process/ScopedWorkingDirectory.hpp"
#include "tab2fig/core/Exception.hpp"
#include "tab2fig/utils/ModuleLoggers.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace tab2fig {
namespace process {

std::recursive_mutex& ScopedWorkingDirectory::globalMutex() {
    static std::recursive_mutex mutex;
    return mutex;
}

ScopedWorkingDirectory::ScopedWorkingDirectory(const std::string& directory)
    : lock_(globalMutex()) {
    std::error_code ec;
    const fs::path before = fs::current_path(ec);
    if (ec) {
        throw core::FilesystemException("Cannot determine current working directory: " + ec.message(),
                                        directory, core::ErrorCode::DirectoryNotWritable,
                                        __FILE__, __LINE__);
    }
    previous_ = before.string();

    fs::current_path(directory, ec);
    if (ec) {
        throw core::FilesystemException("Cannot change working directory: " + ec.message(),
                                        directory, core::ErrorCode::DirectoryNotWritable,
                                        __FILE__, __LINE__);
    }
    current_ = fs::current_path(ec).string();
    PROC_DEBUG("Working directory -> {}", current_);
}

ScopedWorkingDirectory::~ScopedWorkingDirectory() {
    std::error_code ec;
    fs::current_path(previous_, ec);
    if (ec) {
        PROC_ERROR("Failed to restore working directory '{}': {}", previous_, ec.message());
    } else {
        PROC_DEBUG("Working directory restored -> {}", previous_);
    }
}

}} // namespace tab2fig::process
