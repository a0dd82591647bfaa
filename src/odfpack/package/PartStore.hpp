#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace odfpack {
namespace package {

/**
 * @brief 规范化部件路径
 *
 * 反斜杠转为 '/'，合并重复分隔符，去掉开头的 "./" 与 '/'，
 * 保留末尾 '/'（目录占位部件）。
 */
std::string normalizePartPath(const std::string& path);

/**
 * @brief 部件路径能否安全地映射到包目录之内
 *
 * 规范化后为空或含有 ".." 段的路径不能写入或读取文件夹。
 */
bool isSafePartPath(const std::string& path);

/**
 * @brief 部件路径是否表示目录占位
 */
inline bool isDirectoryPart(const std::string& path) {
    return !path.empty() && path.back() == '/';
}

/**
 * @brief 单个部件的缓存状态
 *
 * 没有条目表示"尚未加载"；Loaded 与 Deleted 是显式的两种状态。
 */
struct PartEntry {
    enum class State {
        Loaded,
        Deleted
    };
    
    State state = State::Loaded;
    std::string data;
    int64_t timestamp = -1;   // 来自文件夹时的 mtime（秒），-1 表示无记录
    bool pinned = false;      // 调用方显式写入，优先于磁盘内容
    
    bool isLoaded() const { return state == State::Loaded; }
    bool isDeleted() const { return state == State::Deleted; }
};

/**
 * @brief 部件存储：部件路径 -> 三态缓存
 *
 * 所有接口都先规范化路径。不加锁，单个实例只能在一个线程中使用。
 */
class PartStore {
public:
    PartStore() = default;
    
    // 复制只通过 clone() 显式进行
    PartStore(const PartStore&) = delete;
    PartStore& operator=(const PartStore&) = delete;
    PartStore(PartStore&&) noexcept = default;
    PartStore& operator=(PartStore&&) noexcept = default;
    
    const PartEntry* find(const std::string& path) const;
    
    bool contains(const std::string& path) const;
    bool isDeleted(const std::string& path) const;
    
    /**
     * @brief 写入调用方提供的内容（pinned）
     */
    void setLoaded(const std::string& path, std::string data, int64_t timestamp = -1);
    
    /**
     * @brief 写入从后端读取的内容（未 pinned）
     */
    void setCached(const std::string& path, std::string data, int64_t timestamp);
    
    /**
     * @brief 标记为已删除（墓碑）
     */
    void markDeleted(const std::string& path);
    
    /**
     * @brief 移除条目，回到"尚未加载"
     */
    bool erase(const std::string& path);
    
    /**
     * @brief 所有已跟踪的路径（含已删除），按字典序
     */
    std::vector<std::string> keys() const;
    
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    void clear() { entries_.clear(); }
    
    /**
     * @brief 结构化深拷贝：逐条复制状态与内容
     */
    PartStore clone() const;

private:
    std::map<std::string, PartEntry> entries_;
};

}} // namespace odfpack::package
