#include "tab2fig/Tab2Fig.hpp"
#include "tab2fig/utils/Logger.hpp"

#include <iostream>

namespace tab2fig {

bool initialize(const std::string& log_file_path, bool enable_console, bool verbose) {
    try {
        Logger::getInstance().initialize(log_file_path,
                                         verbose ? Logger::Level::DEBUG : Logger::Level::INFO,
                                         enable_console);
        TAB2FIG_LOG_DEBUG("tab2fig library initialized, version {}", getVersion());
        return true;
    } catch (const std::exception& e) {
        // 日志系统初始化失败时只能输出到标准错误
        if (enable_console) {
            std::cerr << "Failed to initialize tab2fig: " << e.what() << std::endl;
        }
        return false;
    }
}

void cleanup() {
    TAB2FIG_LOG_DEBUG("tab2fig library cleanup completed");
    Logger::getInstance().flush();
}

GenerationResult generate(const Table& table, const GenerationOptions& options) {
    const api::TableGenerator generator;
    return generator.generate(table, options);
}

std::vector<BatchItem> generateBatch(const std::vector<std::pair<std::string, Table>>& tables,
                                     const GenerationOptions& options) {
    const api::TableGenerator generator;
    return generator.generateBatch(tables, options);
}

} // namespace tab2fig
