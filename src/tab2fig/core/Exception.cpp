/**
 * @file Exception.cpp
 * @brief tab2fig 异常类实现
 */

#include "tab2fig/core/Exception.hpp"
#include <sstream>
#include <fmt/format.h>

namespace tab2fig {
namespace core {

Tab2FigException::Tab2FigException(const std::string& message,
                                   ErrorCode code,
                                   const char* file,
                                   int line)
    : std::runtime_error(message)
    , error_code_(code)
    , file_(file)
    , line_(line) {
}

std::string Tab2FigException::getDetailedMessage() const {
    std::ostringstream oss;
    oss << "[" << getErrorCodeString() << "] " << what();

    if (file_ && line_ > 0) {
        oss << " (at " << file_ << ":" << line_ << ")";
    }

    if (!context_.empty()) {
        oss << "\nContext:";
        for (const auto& ctx : context_) {
            oss << "\n  - " << ctx;
        }
    }

    return oss.str();
}

void Tab2FigException::addContext(const std::string& context) {
    context_.push_back(context);
}

InputValidationException::InputValidationException(const std::string& message, ErrorCode code,
                                                   const char* file, int line)
    : Tab2FigException(message, code, file, line) {
}

ConfigurationException::ConfigurationException(const std::string& message, ErrorCode code,
                                               const char* file, int line)
    : Tab2FigException(message, code, file, line) {
}

FilesystemException::FilesystemException(const std::string& message, const std::string& path,
                                         ErrorCode code, const char* file, int line)
    : Tab2FigException(fmt::format("{} (path: {})", message, path), code, file, line)
    , path_(path) {
}

namespace {
std::string composeToolMessage(const std::string& message, const std::string& tool,
                               int exit_code, const std::string& detail) {
    std::string out = fmt::format("{} [{}", message, tool);
    if (exit_code >= 0) {
        out += fmt::format(", exit code {}", exit_code);
    }
    out += "]";
    if (!detail.empty()) {
        out += "\n" + detail;
    }
    return out;
}
} // namespace

ExternalToolException::ExternalToolException(const std::string& message,
                                             const std::string& tool,
                                             int exit_code,
                                             const std::string& detail,
                                             ErrorCode code,
                                             const char* file, int line)
    : Tab2FigException(composeToolMessage(message, tool, exit_code, detail), code, file, line)
    , tool_(tool)
    , exit_code_(exit_code)
    , detail_(detail) {
}

}} // namespace tab2fig::core
