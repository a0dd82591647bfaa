#pragma once

#include "odfpack/core/Path.hpp"
#include "odfpack/package/Packaging.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace odfpack {
namespace package {

class PartStore;

/**
 * @brief 从后端读出的部件内容
 */
struct LoadedPart {
    std::string data;
    int64_t timestamp = -1;   // 文件夹后端为 mtime（秒），ZIP 后端为 -1
};

/**
 * @brief 部件后端接口
 *
 * 后端绑定到一个磁盘位置，只负责读取；写出由 Container 的保存流程完成。
 * 不持有打开的文件句柄。
 */
class IPartBackend {
public:
    virtual ~IPartBackend() = default;
    
    virtual Packaging packaging() const = 0;
    virtual const core::Path& path() const = 0;
    
    /**
     * @brief 列出后端当前包含的部件（每次都重新读取）
     */
    virtual std::vector<std::string> listParts() const = 0;
    
    /**
     * @brief 读取单个部件
     * @return 部件不存在或无法读取时返回 std::nullopt
     */
    virtual std::optional<LoadedPart> readPart(const std::string& part_name) const = 0;
    
    /**
     * @brief 缓存是否已过期
     * @param cached_timestamp 缓存中记录的时间戳
     */
    virtual bool isStale(const std::string& part_name, int64_t cached_timestamp) const = 0;
    
    /**
     * @brief 把所有尚未加载的部件读入存储，已有条目（含墓碑）保持不变
     * @return 新加载的部件数
     */
    virtual size_t materialize(PartStore& store) const = 0;
};

}} // namespace odfpack::package
