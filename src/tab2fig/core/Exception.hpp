/**
 * @file Exception.hpp
 * @brief tab2fig 异常类定义
 */

#ifndef TAB2FIG_EXCEPTION_HPP
#define TAB2FIG_EXCEPTION_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include "tab2fig/core/ErrorCode.hpp"

namespace tab2fig {
namespace core {

/**
 * @brief tab2fig 基础异常类
 */
class Tab2FigException : public std::runtime_error {
public:
    /**
     * @brief 构造函数
     * @param message 错误消息
     * @param code 错误代码
     * @param file 发生错误的文件名
     * @param line 发生错误的行号
     */
    Tab2FigException(const std::string& message,
                     ErrorCode code = ErrorCode::InternalError,
                     const char* file = nullptr,
                     int line = 0);

    ErrorCode getErrorCode() const noexcept { return error_code_; }
    std::string getErrorCodeString() const { return toString(error_code_); }

    /**
     * @brief 获取详细错误信息（错误码、位置、上下文）
     */
    std::string getDetailedMessage() const;

    const char* getFile() const noexcept { return file_; }
    int getLine() const noexcept { return line_; }

    void addContext(const std::string& context);
    const std::vector<std::string>& getContext() const { return context_; }

private:
    ErrorCode error_code_;
    const char* file_;
    int line_;
    std::vector<std::string> context_;
};

/**
 * @brief 输入校验异常：非表格输入、空表、行长度不一致
 */
class InputValidationException : public Tab2FigException {
public:
    InputValidationException(const std::string& message,
                             ErrorCode code = ErrorCode::EmptyTable,
                             const char* file = nullptr, int line = 0);
};

/**
 * @brief 配置异常：未知主题、列规格不匹配、表头分组跨度错误等
 */
class ConfigurationException : public Tab2FigException {
public:
    ConfigurationException(const std::string& message,
                           ErrorCode code = ErrorCode::InvalidArgument,
                           const char* file = nullptr, int line = 0);
};

/**
 * @brief 文件系统异常
 */
class FilesystemException : public Tab2FigException {
public:
    FilesystemException(const std::string& message, const std::string& path,
                        ErrorCode code = ErrorCode::DirectoryNotWritable,
                        const char* file = nullptr, int line = 0);

    const std::string& getPath() const { return path_; }

private:
    std::string path_;
};

/**
 * @brief 外部工具异常：找不到可执行文件、非零退出、超时
 *
 * detail 保存从工具日志中提取的最具体的错误信息。
 */
class ExternalToolException : public Tab2FigException {
public:
    ExternalToolException(const std::string& message,
                          const std::string& tool,
                          int exit_code = -1,
                          const std::string& detail = "",
                          ErrorCode code = ErrorCode::ToolFailed,
                          const char* file = nullptr, int line = 0);

    const std::string& getTool() const { return tool_; }
    int getExitCode() const noexcept { return exit_code_; }
    const std::string& getDetail() const { return detail_; }

private:
    std::string tool_;
    int exit_code_;
    std::string detail_;
};

} // namespace core
} // namespace tab2fig

// 便捷宏定义
#define TAB2FIG_THROW(ExceptionType, code, message) \
    throw ExceptionType((message), (code), __FILE__, __LINE__)

#define TAB2FIG_THROW_IF(condition, ExceptionType, code, message) \
    do { if (condition) { TAB2FIG_THROW(ExceptionType, code, message); } } while (0)

#endif // TAB2FIG_EXCEPTION_HPP
