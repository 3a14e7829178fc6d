#pragma once

#include <algorithm>
#include <atomic>
#include <cstring>
#include <fstream>
#include <mutex>
#include <string>
#include <fmt/format.h>

#ifdef ERROR
#undef ERROR
#endif

namespace tab2fig {

/**
 * @brief 全局日志器
 *
 * 控制台 + 可选日志文件，基于 {fmt} 格式化。未显式初始化时，
 * 第一次写日志会以默认参数（仅控制台）初始化。
 */
class Logger {
public:
    enum class Level {
        TRACE = 0,
        DEBUG = 1,
        INFO = 2,
        WARN = 3,
        ERROR = 4,
        CRITICAL = 5,
        OFF = 6
    };

    enum class WriteMode {
        TRUNCATE = 0,  // 覆盖模式（默认）
        APPEND = 1     // 追加模式
    };

    static Logger& getInstance();

    /**
     * @brief 初始化日志系统
     * @param log_file_path 日志文件路径，为空时只输出到控制台
     * @param level 最低输出级别
     * @param enable_console 是否输出到控制台（stderr）
     * @param max_file_size 单个日志文件的最大字节数，超过后轮转
     * @param max_files 保留的轮转文件数量
     */
    void initialize(const std::string& log_file_path = "",
                    Level level = Level::INFO,
                    bool enable_console = true,
                    size_t max_file_size = 10 * 1024 * 1024,
                    size_t max_files = 5,
                    WriteMode write_mode = WriteMode::TRUNCATE);

    void setLevel(Level level);
    Level getLevel() const;
    bool isEnabled(Level level) const { return should_log(level); }

    void log(Level level, const std::string& message);

    template<typename... Args>
    void logf(Level level, const std::string& fmt_str, Args&&... args) {
        if (!should_log(level)) return;
        try {
            log(level, fmt::vformat(fmt_str, fmt::make_format_args(args...)));
        } catch (const fmt::format_error&) {
            log(level, fmt_str);
        }
    }

    // 带源码位置信息的接口（在宏中使用）
    template<typename... Args>
    void logCtx(Level level, const char* file, int line, const char* func,
                const std::string& fmt_str, Args&&... args) {
        if (!should_log(level)) return;
        const std::string fmt_with_ctx =
            fmt::format("[{}:{}:{}] {}", baseFilename(file), line, func ? func : "", fmt_str);
        logf(level, fmt_with_ctx, std::forward<Args>(args)...);
    }

    void flush();
    void shutdown();

private:
    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    bool should_log(Level level) const;
    void log_to_console(Level level, const std::string& message);
    void log_to_file(const std::string& message);
    std::string format_message(Level level, const std::string& message) const;
    static const char* level_to_string(Level level);
    void rotate_file_if_needed();
    std::string get_rotated_filename(size_t index) const;

    static const char* baseFilename(const char* path) {
        if (!path) return "";
        const char* slash1 = std::strrchr(path, '/');
        const char* slash2 = std::strrchr(path, '\\');
        const char* p = (slash1 && slash2) ? (std::max(slash1, slash2)) : (slash1 ? slash1 : slash2);
        return p ? (p + 1) : path;
    }

    mutable std::mutex mutex_;
    std::atomic<Level> current_level_{Level::INFO};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> enable_console_{true};
    std::atomic<bool> shutting_down_{false};

    std::string log_file_path_;
    std::ofstream file_stream_;
    size_t current_file_size_ = 0;
    size_t max_file_size_ = 10 * 1024 * 1024;
    size_t max_files_ = 5;
    WriteMode write_mode_ = WriteMode::TRUNCATE;
};

} // namespace tab2fig

#define TAB2FIG_FUNC __func__

#define TAB2FIG_LOG_TRACE(fmt, ...)    ::tab2fig::Logger::getInstance().logCtx(::tab2fig::Logger::Level::TRACE,    __FILE__, __LINE__, TAB2FIG_FUNC, fmt, ##__VA_ARGS__)
#define TAB2FIG_LOG_DEBUG(fmt, ...)    ::tab2fig::Logger::getInstance().logCtx(::tab2fig::Logger::Level::DEBUG,    __FILE__, __LINE__, TAB2FIG_FUNC, fmt, ##__VA_ARGS__)
#define TAB2FIG_LOG_INFO(fmt, ...)     ::tab2fig::Logger::getInstance().logCtx(::tab2fig::Logger::Level::INFO,     __FILE__, __LINE__, TAB2FIG_FUNC, fmt, ##__VA_ARGS__)
#define TAB2FIG_LOG_WARN(fmt, ...)     ::tab2fig::Logger::getInstance().logCtx(::tab2fig::Logger::Level::WARN,     __FILE__, __LINE__, TAB2FIG_FUNC, fmt, ##__VA_ARGS__)
#define TAB2FIG_LOG_ERROR(fmt, ...)    ::tab2fig::Logger::getInstance().logCtx(::tab2fig::Logger::Level::ERROR,    __FILE__, __LINE__, TAB2FIG_FUNC, fmt, ##__VA_ARGS__)
#define TAB2FIG_LOG_CRITICAL(fmt, ...) ::tab2fig::Logger::getInstance().logCtx(::tab2fig::Logger::Level::CRITICAL, __FILE__, __LINE__, TAB2FIG_FUNC, fmt, ##__VA_ARGS__)
