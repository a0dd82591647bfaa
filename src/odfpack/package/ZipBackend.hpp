#pragma once

#include "odfpack/package/IPartBackend.hpp"
#include <string>

namespace odfpack {
namespace package {

/**
 * @brief ZIP 文件后端
 *
 * 每次访问都重新打开归档，读完即关闭。
 * 单个部件读取时归档损坏只记录警告并返回 std::nullopt；
 * 列举和整体加载时归档损坏抛出 FileException。
 */
class ZipBackend : public IPartBackend {
public:
    explicit ZipBackend(const core::Path& path);
    
    Packaging packaging() const override { return Packaging::Zip; }
    const core::Path& path() const override { return path_; }
    
    std::vector<std::string> listParts() const override;
    std::optional<LoadedPart> readPart(const std::string& part_name) const override;
    
    /**
     * @brief ZIP 内容打开后视为不可变，缓存永不过期
     */
    bool isStale(const std::string&, int64_t) const override { return false; }
    
    size_t materialize(PartStore& store) const override;
    
    /**
     * @brief 一次性读取内存中的整个归档
     * @throws core::FileException 归档无法解析时
     */
    static size_t loadFromBuffer(std::string buffer, PartStore& store);

private:
    core::Path path_;
};

}} // namespace odfpack::package
