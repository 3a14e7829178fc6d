#include "tab2fig/process/CompileOrchestrator.hpp"
#include "tab2fig/core/Exception.hpp"
#include "tab2fig/core/Path.hpp"
#include "tab2fig/process/LatexLogParser.hpp"
#include "tab2fig/process/ScopedWorkingDirectory.hpp"
#include "tab2fig/utils/ModuleLoggers.hpp"

#include <fmt/format.h>

#include <mutex>
#include <utility>

namespace tab2fig {
namespace process {

const char* toString(CompileState state) {
    switch (state) {
        case CompileState::Prepared: return "Prepared";
        case CompileState::Compiling: return "Compiling";
        case CompileState::Compiled: return "Compiled";
        case CompileState::CompileFailed: return "CompileFailed";
        case CompileState::Cropping: return "Cropping";
        case CompileState::Cropped: return "Cropped";
        case CompileState::CropFailed: return "CropFailed";
    }
    return "Unknown";
}

namespace {

// 其它线程可能正处于切换后的工作目录中，相对路径只能在持有切换锁时解析
std::string absoluteUnderLock(const std::string& path) {
    std::lock_guard<std::recursive_mutex> lock(ScopedWorkingDirectory::globalMutex());
    return core::Path(path).absolute().string();
}

std::string resolveTool(const std::string& tool) {
    std::lock_guard<std::recursive_mutex> lock(ScopedWorkingDirectory::globalMutex());
    const std::string found = ProcessRunner::findExecutable(tool);
    if (found.empty()) return found;
    return core::Path(found).absolute().string();
}

std::string describeFailure(const ProcessResult& result) {
    if (!result.spawned) return result.spawn_error;
    if (result.timed_out) return fmt::format("timed out after {} ms", result.elapsed.count());
    if (result.term_signal != 0) return fmt::format("terminated by signal {}", result.term_signal);
    return fmt::format("exit code {}", result.exit_code);
}

core::ErrorCode failureCode(const ProcessResult& result) {
    if (!result.spawned) return core::ErrorCode::ToolSpawnFailed;
    if (result.timed_out) return core::ErrorCode::ToolTimeout;
    return core::ErrorCode::ToolFailed;
}

} // namespace

CompileOrchestrator::CompileOrchestrator(ToolchainOptions options)
    : options_(std::move(options)) {}

ToolAvailability CompileOrchestrator::checkTools(bool need_cropper) const {
    ToolAvailability availability;
    availability.compiler_path = resolveTool(options_.compiler);
    availability.compiler = !availability.compiler_path.empty();
    if (need_cropper) {
        availability.cropper_path = resolveTool(options_.cropper);
        availability.cropper = !availability.cropper_path.empty();
    }
    return availability;
}

CompileResult CompileOrchestrator::run(const CompileRequest& original) const {
    // 之后的所有文件操作与目录切换都只使用绝对输出目录
    CompileRequest request = original;
    request.output_directory = absoluteUnderLock(original.output_directory);

    CompileResult result;
    prepare(request, result);
    if (!request.compile) {
        result.success = true;
        return result;
    }

    compile(request, result);
    if (result.state != CompileState::Compiled) {
        return result;
    }

    if (!request.crop) {
        result.success = true;
        return result;
    }

    crop(request, result);
    return result;
}

void CompileOrchestrator::prepare(const CompileRequest& request, CompileResult& result) const {
    result.state = CompileState::Prepared;
    const core::Path directory(request.output_directory);

    std::string error;
    if (!directory.createDirectories(&error)) {
        throw core::FilesystemException(
            fmt::format("Cannot create output directory '{}': {}", directory.string(), error),
            directory.string(), core::ErrorCode::DirectoryNotCreatable, __FILE__, __LINE__);
    }
    if (!directory.isWritable()) {
        throw core::FilesystemException(
            fmt::format("Output directory '{}' is not writable", directory.string()),
            directory.string(), core::ErrorCode::DirectoryNotWritable, __FILE__, __LINE__);
    }

    // 工具预检在写入任何文件之前完成
    const ToolAvailability tools = checkTools(request.compile && request.crop);
    if (request.compile && !tools.compiler) {
        throw core::ExternalToolException(
            fmt::format("LaTeX compiler '{}' not found on PATH", options_.compiler),
            options_.compiler, -1, "", core::ErrorCode::ToolNotFound, __FILE__, __LINE__);
    }
    if (request.compile && request.crop && !tools.cropper) {
        throw core::ExternalToolException(
            fmt::format("PDF crop tool '{}' not found on PATH", options_.cropper),
            options_.cropper, -1, "", core::ErrorCode::ToolNotFound, __FILE__, __LINE__);
    }

    // 清理同名旧产物，避免把上一次的结果当作本次输出
    for (const std::string suffix : {".pdf", "_cropped.pdf", ".log", ".aux"}) {
        const core::Path stale = directory / (request.name + suffix);
        if (stale.exists() && !stale.remove()) {
            PROC_WARN("Cannot remove stale artifact {}", stale.string());
        }
    }

    const core::Path source = directory / (request.name + ".tex");
    if (!source.writeText(request.source)) {
        throw core::FilesystemException(
            fmt::format("Cannot write LaTeX source '{}'", source.string()),
            source.string(), core::ErrorCode::FileWriteError, __FILE__, __LINE__);
    }
    result.source_path = source.string();
    TAB2FIG_PROGRESS(request.verbose, "LaTeX source written to {}", result.source_path);
}

void CompileOrchestrator::compile(const CompileRequest& request, CompileResult& result) const {
    result.state = CompileState::Compiling;
    const core::Path directory(request.output_directory);
    const std::string compiler = resolveTool(options_.compiler);

    std::vector<std::string> args = options_.compiler_args;
    args.push_back(request.name + ".tex");

    TAB2FIG_PROGRESS(request.verbose, "Compiling {} with {}", request.name + ".tex", options_.compiler);
    ProcessResult process;
    {
        ScopedWorkingDirectory cwd(directory.string());
        process = runner_.run(compiler, args, options_.timeout);
    }
    result.exit_code = process.exit_code;

    const core::Path log_path = directory / (request.name + ".log");
    if (!log_path.exists() || !log_path.readText(result.log_text)) {
        result.log_text = process.output;
    }

    if (!process.succeeded()) {
        result.state = CompileState::CompileFailed;
        result.error_code = failureCode(process);
        const std::string detail = LatexLogParser::failureDetail(result.log_text);
        result.error_detail = detail.empty() ? describeFailure(process) : detail;
        PROC_ERROR("LaTeX compilation of {} failed ({}): {}", request.name, describeFailure(process),
                   result.error_detail);
        return;
    }

    const core::Path pdf = directory / (request.name + ".pdf");
    if (!pdf.isFile()) {
        result.state = CompileState::CompileFailed;
        result.error_code = core::ErrorCode::ArtifactMissing;
        result.error_detail = fmt::format("Compiler exited successfully but {} was not produced", pdf.string());
        PROC_ERROR("{}", result.error_detail);
        return;
    }

    result.full_artifact = pdf.string();
    result.state = CompileState::Compiled;
    TAB2FIG_PROGRESS(request.verbose, "PDF written to {} ({} ms)", result.full_artifact,
                     process.elapsed.count());
}

void CompileOrchestrator::crop(const CompileRequest& request, CompileResult& result) const {
    result.state = CompileState::Cropping;
    const core::Path directory(request.output_directory);
    const std::string cropper = resolveTool(options_.cropper);

    const std::string full_name = request.name + ".pdf";
    const std::string cropped_name = request.name + "_cropped.pdf";
    const std::vector<std::string> args = {"--margins", std::to_string(request.crop_margin),
                                           full_name, cropped_name};

    TAB2FIG_PROGRESS(request.verbose, "Cropping {} with margin {}", full_name, request.crop_margin);
    ProcessResult process;
    {
        ScopedWorkingDirectory cwd(directory.string());
        process = runner_.run(cropper, args, options_.timeout);
    }

    const core::Path cropped = directory / cropped_name;
    if (!process.succeeded() || !cropped.isFile()) {
        result.state = CompileState::CropFailed;
        result.error_code = process.succeeded() ? core::ErrorCode::ArtifactMissing : failureCode(process);
        result.error_detail = process.succeeded()
            ? fmt::format("{} was not produced", cropped.string())
            : fmt::format("{} failed: {}", options_.cropper, describeFailure(process));
        if (!process.output.empty()) {
            result.error_detail += "\n" + LatexLogParser::tail(process.output, 5);
        }
        PROC_ERROR("Cropping {} failed, returning uncropped PDF: {}", full_name, result.error_detail);
        return;
    }

    result.cropped_artifact = cropped.string();
    result.state = CompileState::Cropped;
    result.success = true;
    TAB2FIG_PROGRESS(request.verbose, "Cropped PDF written to {}", result.cropped_artifact);
}

}} // namespace tab2fig::process
