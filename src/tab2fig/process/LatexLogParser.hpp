#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace tab2fig {
namespace process {

/**
 * @brief 从 LaTeX 日志中提取的错误
 */
struct LatexError {
    std::string message;            // "! " 之后的第一行
    std::optional<int> line;        // l.<N> 行号
    std::string block;              // 完整错误块
};

/**
 * @brief LaTeX 编译日志解析
 *
 * 错误块从第一条以 "! " 开头（或 file:line: 形式）的行开始，
 * 到 "l.<N>" 行（含）或空行为止，最多 kMaxBlockLines 行。
 */
class LatexLogParser {
public:
    static constexpr size_t kMaxBlockLines = 12;
    static constexpr size_t kTailLines = 20;

    static std::optional<LatexError> firstError(const std::string& log);

    /**
     * @brief 所有错误消息行（"! " 开头），最多 max_errors 条
     */
    static std::vector<std::string> errorMessages(const std::string& log, size_t max_errors = 3);

    static std::string tail(const std::string& log, size_t lines = kTailLines);

    /**
     * @brief 失败详情：优先第一个错误块，否则日志末尾
     */
    static std::string failureDetail(const std::string& log);
};

}} // namespace tab2fig::process
