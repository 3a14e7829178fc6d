#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

namespace tab2fig {
namespace process {

/**
 * @brief 缓存目录状态
 */
struct CacheInfo {
    bool exists = false;
    std::string path;
    size_t files = 0;
    uintmax_t bytes = 0;
    std::optional<std::filesystem::file_time_type> oldest;
    std::optional<std::filesystem::file_time_type> newest;
};

/**
 * @brief 已编译 PDF 的缓存
 *
 * 条目以键命名：<key>.pdf 为完整 PDF，<key>_cropped.pdf 为裁剪结果。
 * 键是 LaTeX 源文件与编译设置的 FNV-1a 64 位哈希，输入不变时可以跳过编译。
 *
 * 目录操作由一把互斥锁保护；相对目录在设置时解析为绝对路径。
 */
class ArtifactCache {
public:
    ArtifactCache();
    explicit ArtifactCache(const std::string& directory);

    ArtifactCache(const ArtifactCache&) = delete;
    ArtifactCache& operator=(const ArtifactCache&) = delete;

    static ArtifactCache& global();

    /// 默认缓存目录：<临时目录>/tab2fig_cache
    static std::string defaultDirectory();

    /**
     * @brief 当前缓存目录
     * @param create 不存在时是否创建
     */
    std::string directory(bool create = true) const;

    /**
     * @brief 设置缓存目录（std::nullopt 恢复默认）
     * @return 之前的目录
     */
    std::string setDirectory(const std::optional<std::string>& directory);

    /**
     * @brief 计算缓存键（16 位十六进制）
     * @param source 完整 LaTeX 文档
     * @param settings 影响产物的编译设置，如编译器、裁剪边距
     */
    static std::string computeKey(const std::string& source, const std::string& settings);

    /**
     * @brief 查找缓存条目
     * @param suffix ".pdf" 或 "_cropped.pdf"
     */
    std::optional<std::string> lookup(const std::string& key, const std::string& suffix) const;

    /**
     * @brief 把产物复制进缓存
     * @return 缓存中的路径；源文件不存在或复制失败时为 std::nullopt
     */
    std::optional<std::string> store(const std::string& artifact, const std::string& key,
                                     const std::string& suffix) const;

    /**
     * @brief 把缓存条目复制到目标位置，必要时创建目标目录
     */
    bool retrieve(const std::string& cached, const std::string& target) const;

    /**
     * @brief 删除缓存文件
     * @param older_than 只删除修改时间早于该时长的文件；缺省删除全部
     * @return 删除的文件数
     */
    size_t clear(std::optional<std::chrono::hours> older_than = std::nullopt) const;

    CacheInfo info() const;

private:
    mutable std::mutex mutex_;
    std::string directory_;
};

}} // namespace tab2fig::process
