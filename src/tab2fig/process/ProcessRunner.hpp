#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace tab2fig {
namespace process {

/**
 * @brief 外部进程执行结果
 */
struct ProcessResult {
    bool spawned = false;           // 进程是否成功启动
    int exit_code = -1;             // 正常退出时的退出码，被信号终止时为 -1
    int term_signal = 0;            // 终止信号（0 表示正常退出）
    bool timed_out = false;
    std::string output;             // stdout + stderr（截断到 max_output）
    std::string spawn_error;
    std::chrono::milliseconds elapsed{0};

    bool succeeded() const { return spawned && !timed_out && exit_code == 0; }
};

/**
 * @brief 同步执行外部命令
 *
 * 使用 posix_spawn 启动子进程，stdin 重定向到 /dev/null，stdout/stderr 合并到管道。
 * 设置超时后，到期会向子进程发送 SIGKILL 并回收。
 * 子进程继承当前工作目录。
 */
class ProcessRunner {
public:
    ProcessRunner() = default;
    explicit ProcessRunner(size_t max_output) : max_output_(max_output) {}

    /**
     * @brief 查找可执行文件
     * @param command 命令名或路径（含 '/' 时直接检查该路径）
     * @return 可执行文件路径，找不到返回空字符串
     */
    static std::string findExecutable(const std::string& command);

    /**
     * @brief 可用性预检
     */
    static bool isAvailable(const std::string& command) { return !findExecutable(command).empty(); }

    /**
     * @brief 执行命令并等待结束
     *
     * 启动失败不抛异常，通过 spawned / spawn_error 报告。
     */
    ProcessResult run(const std::string& command,
                      const std::vector<std::string>& args,
                      std::optional<std::chrono::milliseconds> timeout = std::nullopt) const;

private:
    size_t max_output_ = 256 * 1024;
};

/**
 * @brief 把命令行拼成便于日志阅读的字符串
 */
std::string formatCommandLine(const std::string& command, const std::vector<std::string>& args);

}} // namespace tab2fig::process
