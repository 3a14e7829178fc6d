#include "tab2fig/process/ProcessRunner.hpp"
#include "tab2fig/utils/ModuleLoggers.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <sstream>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace tab2fig {
namespace process {

namespace {

using Clock = std::chrono::steady_clock;

bool isExecutableFile(const std::filesystem::path& candidate) {
    std::error_code ec;
    return std::filesystem::is_regular_file(candidate, ec) && !ec &&
           ::access(candidate.c_str(), X_OK) == 0;
}

/**
 * @brief posix_spawn 所需资源的 RAII 封装
 */
class SpawnResources {
public:
    SpawnResources() = default;
    ~SpawnResources() {
        if (attr_ready_) ::posix_spawnattr_destroy(&attr_);
        if (actions_ready_) ::posix_spawn_file_actions_destroy(&actions_);
        closeFd(dev_null_);
        closeFd(pipe_[0]);
        closeFd(pipe_[1]);
    }

    SpawnResources(const SpawnResources&) = delete;
    SpawnResources& operator=(const SpawnResources&) = delete;

    bool setup(std::string& error) {
        dev_null_ = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (dev_null_ < 0) {
            error = std::string("cannot open /dev/null: ") + std::strerror(errno);
            return false;
        }
        if (::pipe2(pipe_, O_CLOEXEC) != 0) {
            error = std::string("cannot create pipe: ") + std::strerror(errno);
            return false;
        }
        if (::posix_spawn_file_actions_init(&actions_) != 0) {
            error = "posix_spawn_file_actions_init failed";
            return false;
        }
        actions_ready_ = true;
        if (::posix_spawn_file_actions_adddup2(&actions_, dev_null_, STDIN_FILENO) != 0 ||
            ::posix_spawn_file_actions_adddup2(&actions_, pipe_[1], STDOUT_FILENO) != 0 ||
            ::posix_spawn_file_actions_adddup2(&actions_, pipe_[1], STDERR_FILENO) != 0) {
            error = "posix_spawn_file_actions_adddup2 failed";
            return false;
        }
        if (::posix_spawnattr_init(&attr_) != 0) {
            error = "posix_spawnattr_init failed";
            return false;
        }
        attr_ready_ = true;

        short spawn_flags = 0;
#ifdef POSIX_SPAWN_CLOEXEC_DEFAULT
        spawn_flags |= POSIX_SPAWN_CLOEXEC_DEFAULT;
#endif
        if (spawn_flags != 0 && ::posix_spawnattr_setflags(&attr_, spawn_flags) != 0) {
            error = "posix_spawnattr_setflags failed";
            return false;
        }
        return true;
    }

    // 父进程关闭写端，读端在子进程退出前持续读取
    void closeWriteEnd() { closeFd(pipe_[1]); }
    int readFd() const { return pipe_[0]; }

    posix_spawn_file_actions_t* actions() { return &actions_; }
    posix_spawnattr_t* attr() { return &attr_; }

private:
    static void closeFd(int& fd) {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }

    int dev_null_ = -1;
    int pipe_[2] = {-1, -1};
    posix_spawn_file_actions_t actions_;
    posix_spawnattr_t attr_;
    bool actions_ready_ = false;
    bool attr_ready_ = false;
};

void fillExitStatus(int status, ProcessResult& result) {
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.term_signal = WTERMSIG(status);
        result.exit_code = -1;
    }
}

} // namespace

std::string ProcessRunner::findExecutable(const std::string& command) {
    if (command.empty()) return "";

    if (command.find('/') != std::string::npos) {
        return isExecutableFile(command) ? command : "";
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env) return "";

    std::stringstream ss{std::string(path_env)};
    std::string token;
    while (std::getline(ss, token, ':')) {
        if (token.empty()) token = ".";
        const std::filesystem::path candidate = std::filesystem::path(token) / command;
        if (isExecutableFile(candidate)) {
            return candidate.string();
        }
    }
    return "";
}

ProcessResult ProcessRunner::run(const std::string& command,
                                 const std::vector<std::string>& args,
                                 std::optional<std::chrono::milliseconds> timeout) const {
    ProcessResult result;
    const auto start = Clock::now();

    const std::string executable = findExecutable(command);
    if (executable.empty()) {
        result.spawn_error = "executable not found: " + command;
        return result;
    }

    SpawnResources resources;
    if (!resources.setup(result.spawn_error)) {
        return result;
    }

    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(command.c_str()));
    for (const auto& arg : args) argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    pid_t pid = -1;
    const int spawn_rc = ::posix_spawn(&pid, executable.c_str(), resources.actions(), resources.attr(),
                                       argv.data(), environ);
    resources.closeWriteEnd();
    if (spawn_rc != 0 || pid <= 0) {
        result.spawn_error = std::string("posix_spawn failed: ") + std::strerror(spawn_rc);
        return result;
    }
    result.spawned = true;
    PROC_DEBUG("Spawned pid {}: {}", pid, formatCommandLine(command, args));

    const auto deadline = timeout ? std::optional<Clock::time_point>(start + *timeout) : std::nullopt;
    auto remainingMs = [&deadline]() -> int {
        if (!deadline) return -1;
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - Clock::now());
        return left.count() > 0 ? static_cast<int>(left.count()) : 0;
    };

    // 读取输出直到 EOF 或超时
    char buffer[4096];
    bool eof = false;
    while (!eof) {
        const int wait_ms = remainingMs();
        if (deadline && wait_ms == 0) {
            result.timed_out = true;
            break;
        }
        pollfd pfd{resources.readFd(), POLLIN, 0};
        const int rc = ::poll(&pfd, 1, wait_ms);
        if (rc < 0) {
            if (errno == EINTR) continue;
            PROC_WARN("poll failed on child output: {}", std::strerror(errno));
            break;
        }
        if (rc == 0) continue;
        const ssize_t n = ::read(resources.readFd(), buffer, sizeof(buffer));
        if (n > 0) {
            const size_t room = max_output_ > result.output.size() ? max_output_ - result.output.size() : 0;
            result.output.append(buffer, std::min(room, static_cast<size_t>(n)));
        } else if (n == 0) {
            eof = true;
        } else if (errno != EINTR && errno != EAGAIN) {
            PROC_WARN("read failed on child output: {}", std::strerror(errno));
            break;
        }
    }

    // 回收子进程（子进程可能关闭了输出但仍在运行）
    int status = 0;
    while (!result.timed_out) {
        const pid_t waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            fillExitStatus(status, result);
            break;
        }
        if (waited < 0 && errno != EINTR) {
            result.spawn_error = std::string("waitpid failed: ") + std::strerror(errno);
            result.exit_code = -1;
            break;
        }
        if (deadline && remainingMs() == 0) {
            result.timed_out = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    if (result.timed_out) {
        ::kill(pid, SIGKILL);
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        result.exit_code = -1;
        result.term_signal = SIGKILL;
        PROC_WARN("Process {} killed after timeout of {} ms", command, timeout ? timeout->count() : 0);
    }

    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
    PROC_DEBUG("Process {} finished: exit={}, signal={}, {} ms", command, result.exit_code,
               result.term_signal, result.elapsed.count());
    return result;
}

std::string formatCommandLine(const std::string& command, const std::vector<std::string>& args) {
    std::string line = command;
    for (const auto& arg : args) {
        line += ' ';
        if (arg.find_first_of(" \t'\"") != std::string::npos) {
            line += '\'' + arg + '\'';
        } else {
            line += arg;
        }
    }
    return line;
}

}} // namespace tab2fig::process
