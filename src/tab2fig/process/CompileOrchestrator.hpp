#pragma once

#include "tab2fig/core/ErrorCode.hpp"
#include "tab2fig/process/ProcessRunner.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace tab2fig {
namespace process {

/**
 * @brief 编译/裁剪状态机
 *
 * Prepared -> Compiling -> {Compiled | CompileFailed} -> Cropping -> {Cropped | CropFailed}
 */
enum class CompileState {
    Prepared,
    Compiling,
    Compiled,
    CompileFailed,
    Cropping,
    Cropped,
    CropFailed
};

const char* toString(CompileState state);

/**
 * @brief 外部工具配置
 */
struct ToolchainOptions {
    std::string compiler = "pdflatex";
    std::vector<std::string> compiler_args = {"-interaction=batchmode"};
    std::string cropper = "pdfcrop";
    std::optional<std::chrono::milliseconds> timeout;   // 每次外部调用的超时，未设置则不限
};

/**
 * @brief 一次编译请求
 */
struct CompileRequest {
    std::string output_directory = "output";
    std::string name;           // 已清理的文件名（不含扩展名）
    std::string source;         // 完整 LaTeX 文档
    bool compile = true;        // false 时只写出源文件
    bool crop = true;
    int crop_margin = 10;
    bool verbose = false;
};

/**
 * @brief 编译结果
 *
 * cropped_artifact 与 full_artifact 永远是不同的文件；
 * 裁剪失败时 cropped_artifact 为空，full_artifact 仍然有效。
 */
struct CompileResult {
    std::string source_path;
    std::string full_artifact;
    std::string cropped_artifact;
    CompileState state = CompileState::Prepared;
    bool success = false;
    std::string log_text;           // 编译器日志（<name>.log，读不到时为进程输出）
    std::string error_detail;
    core::ErrorCode error_code = core::ErrorCode::Ok;
    int exit_code = 0;

    bool hasCroppedArtifact() const { return !cropped_artifact.empty(); }
};

/**
 * @brief 工具可用性
 */
struct ToolAvailability {
    bool compiler = false;
    bool cropper = false;
    std::string compiler_path;
    std::string cropper_path;
};

/**
 * @brief 编译并裁剪 LaTeX 文档
 *
 * 编译在输出目录中进行（ScopedWorkingDirectory 保证恢复原工作目录），
 * 编译失败时从 <name>.log 中提取第一个错误块作为失败详情。
 */
class CompileOrchestrator {
public:
    explicit CompileOrchestrator(ToolchainOptions options = ToolchainOptions{});

    const ToolchainOptions& options() const { return options_; }

    ToolAvailability checkTools(bool need_cropper) const;

    /**
     * @brief 执行完整流程
     *
     * 编译失败与裁剪失败通过返回值的 state 报告，不抛异常。
     * 相对的 output_directory 在开始时一次性解析为绝对路径，
     * 返回的所有路径均为绝对路径，可以在多个线程中并发调用。
     *
     * @throws FilesystemException 输出目录不可创建/不可写，源文件写入失败
     * @throws ExternalToolException 预检时找不到编译器或裁剪工具
     */
    CompileResult run(const CompileRequest& original) const;

private:
    void prepare(const CompileRequest& request, CompileResult& result) const;
    void compile(const CompileRequest& request, CompileResult& result) const;
    void crop(const CompileRequest& request, CompileResult& result) const;

    ToolchainOptions options_;
    ProcessRunner runner_;
};

}} // namespace tab2fig::process
