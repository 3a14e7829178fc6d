#pragma once

#include <mutex>
#include <string>

namespace tab2fig {
namespace process {

/**
 * @brief 作用域内切换当前工作目录
 *
 * 构造时获取进程级互斥锁并切换目录，析构时恢复原目录并释放锁，
 * 异常路径同样恢复。同一线程内可以嵌套使用。
 *
 * @code
 * {
 *     ScopedWorkingDirectory cwd(output_dir);
 *     runner.run("pdflatex", {"table.tex"});
 * }   // 此处已恢复
 * @endcode
 */
class ScopedWorkingDirectory {
public:
    /**
     * @throws FilesystemException 无法读取当前目录或切换到目标目录
     */
    explicit ScopedWorkingDirectory(const std::string& directory);
    ~ScopedWorkingDirectory();

    ScopedWorkingDirectory(const ScopedWorkingDirectory&) = delete;
    ScopedWorkingDirectory& operator=(const ScopedWorkingDirectory&) = delete;

    const std::string& previous() const { return previous_; }
    const std::string& current() const { return current_; }

    /**
     * @brief 所有工作目录切换共享的锁
     */
    static std::recursive_mutex& globalMutex();

private:
    std::unique_lock<std::recursive_mutex> lock_;
    std::string previous_;
    std::string current_;
};

}} // namespace tab2fig::process
