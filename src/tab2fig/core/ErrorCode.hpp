#pragma once

#include <cstdint>

namespace tab2fig {
namespace core {

/**
 * @brief tab2fig 统一错误码
 *
 * 按错误类别分段编码，异常对象携带其中之一。
 */
enum class ErrorCode : uint8_t {
    Ok = 0,

    // 通用错误 (1-19)
    InvalidArgument = 1,
    InternalError = 2,

    // 输入校验 (20-39)
    NotTabular = 20,
    EmptyTable = 21,
    RaggedRows = 22,
    MalformedInput = 23,

    // 配置错误 (40-59)
    UnknownTheme = 40,
    DuplicateTheme = 41,
    BuiltinThemeName = 42,
    ColumnSpecMismatch = 43,
    InvalidColumnToken = 44,
    HeaderSpanMismatch = 45,
    InvalidPackageOption = 46,
    UnknownAdapter = 47,

    // 文件系统 (60-79)
    DirectoryNotCreatable = 60,
    DirectoryNotWritable = 61,
    FileWriteError = 62,
    FileReadError = 63,

    // 外部工具 (80-99)
    ToolNotFound = 80,
    ToolFailed = 81,
    ToolTimeout = 82,
    ToolSpawnFailed = 83,
    ArtifactMissing = 84
};

/**
 * @brief 错误码转字符串
 */
const char* toString(ErrorCode code) noexcept;

}} // namespace tab2fig::core
