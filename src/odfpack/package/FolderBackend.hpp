#pragma once

#include "odfpack/package/IPartBackend.hpp"
#include <string>

namespace odfpack {
namespace package {

/**
 * @brief 展开目录后端
 *
 * 每个部件对应目录下的一个文件；只包含隐藏文件或为空的目录
 * 以 "name/" 形式列出。缓存是否过期只看文件 mtime（秒）。
 */
class FolderBackend : public IPartBackend {
public:
    explicit FolderBackend(const core::Path& root);
    
    Packaging packaging() const override { return Packaging::Folder; }
    const core::Path& path() const override { return root_; }
    
    std::vector<std::string> listParts() const override;
    
    /**
     * @throws core::FileException 文件存在但无法读取时
     */
    std::optional<LoadedPart> readPart(const std::string& part_name) const override;
    
    /**
     * @brief 磁盘文件不存在时保留缓存；否则 mtime 不同或缓存无时间戳即为过期
     */
    bool isStale(const std::string& part_name, int64_t cached_timestamp) const override;
    
    size_t materialize(PartStore& store) const override;
    
    /**
     * @brief 部件在磁盘上的 mtime（秒），无法获取时返回 -1
     */
    int64_t partTimestamp(const std::string& part_name) const;
    
    /**
     * @brief 把所有未删除的部件写入目录
     *
     * 以 '/' 结尾的部件创建为目录，文件权限设为 0666。
     * 含 ".." 段的部件不写出，只报告警告。
     * @throws core::FileException 创建目录或写文件失败时
     * @return 写出的部件数
     */
    static size_t write(const PartStore& store, const core::Path& folder);

private:
    core::Path root_;
    
    core::Path partPath(const std::string& part_name) const;
    void collect(const core::Path& dir, const std::string& prefix,
                 std::vector<std::string>& parts) const;
};

}} // namespace odfpack::package
