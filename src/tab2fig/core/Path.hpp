#pragma once

#include <cstdint>
#include <ostream>
#include <string>

namespace tab2fig {
namespace core {

/**
 * @brief UTF-8 路径封装
 *
 * 对 std::filesystem 的薄封装，所有操作不抛异常，失败时返回 false / 空值
 * 并记录调试日志，由调用方决定是否转换为 FilesystemException。
 */
class Path {
private:
    std::string utf8_path_;

public:
    Path() = default;
    explicit Path(const std::string& path);
    explicit Path(const char* path);

    const std::string& string() const { return utf8_path_; }
    const char* c_str() const { return utf8_path_.c_str(); }
    bool empty() const { return utf8_path_.empty(); }

    // 路径组合
    Path operator/(const std::string& child) const;
    Path parent() const;
    std::string filename() const;
    std::string stem() const;
    std::string extension() const;
    Path withExtension(const std::string& ext) const;
    Path absolute() const;

    // 文件操作
    bool exists() const;
    bool isFile() const;
    bool isDirectory() const;
    uintmax_t fileSize() const;
    bool remove() const;

    /**
     * @brief 复制为 target，已存在时覆盖
     */
    bool copyTo(const Path& target) const;

    /**
     * @brief 递归创建目录
     * @param error 失败时写入原因
     * @return 目录已存在或创建成功返回 true
     */
    bool createDirectories(std::string* error = nullptr) const;

    /**
     * @brief 当前进程是否可以在该目录/文件写入
     */
    bool isWritable() const;

    /**
     * @brief 是否为当前用户可执行的普通文件
     */
    bool isExecutable() const;

    bool readText(std::string& out) const;
    bool writeText(const std::string& content) const;

    bool operator==(const Path& other) const { return utf8_path_ == other.utf8_path_; }
    bool operator!=(const Path& other) const { return utf8_path_ != other.utf8_path_; }
    bool operator<(const Path& other) const { return utf8_path_ < other.utf8_path_; }

    friend std::ostream& operator<<(std::ostream& os, const Path& path) {
        return os << path.utf8_path_;
    }
};

} // namespace core
} // namespace tab2fig
