#pragma once

#include <string>
#include <vector>
#include <cstdio>
#include <cstdint>
#include <filesystem>
#include <ostream>

namespace odfpack {
namespace core {

/**
 * @brief UTF-8路径处理类，封装文件系统操作
 *
 * 所有查询类操作都不抛出异常：失败时记录调试日志并返回 false / 空值 / -1，
 * 由调用方决定是否升级为错误。
 */
class Path {
private:
    std::string utf8_path_;

public:
    /**
     * @brief 构造函数
     * @param path UTF-8编码的路径字符串
     */
    explicit Path(const std::string& path);
    explicit Path(const char* path);
    explicit Path(const std::filesystem::path& path);
    
    Path() = default;
    Path(const Path& other) = default;
    Path(Path&& other) noexcept = default;
    Path& operator=(const Path& other) = default;
    Path& operator=(Path&& other) noexcept = default;
    ~Path() = default;
    
    // 路径操作
    const std::string& string() const { return utf8_path_; }
    const char* c_str() const { return utf8_path_.c_str(); }
    bool empty() const { return utf8_path_.empty(); }
    void clear() { utf8_path_.clear(); }
    
    std::filesystem::path native() const { return std::filesystem::path(utf8_path_); }
    
    /**
     * @brief 拼接子路径（子路径中的 '/' 作为分隔符）
     */
    Path operator/(const std::string& child) const;
    
    Path parent() const;
    std::string filename() const;
    std::string stem() const;
    std::string extension() const;
    
    /**
     * @brief 转换为绝对路径，失败时返回原路径
     */
    Path absolute() const;
    
    // 文件操作
    bool exists() const;
    bool isFile() const;
    bool isDirectory() const;
    
    /**
     * @brief 获取文件大小
     * @return 文件大小（字节），失败返回0
     */
    uintmax_t fileSize() const;
    
    /**
     * @brief 获取最后修改时间（Unix 秒，向下取整）
     * @return 失败返回 -1
     */
    int64_t lastWriteTime() const;
    
    /**
     * @brief 删除文件或空目录
     */
    bool remove() const;
    
    /**
     * @brief 递归删除目录树
     */
    bool removeAll() const;
    
    /**
     * @brief 创建目录及其所有父目录
     * @return 目录存在（或已创建）时返回 true
     */
    bool createDirectories() const;
    
    /**
     * @brief 移动/重命名到目标路径
     */
    bool moveTo(const Path& target) const;
    
    /**
     * @brief 设置文件权限位（如 0666）
     */
    bool setPermissions(unsigned int mode) const;
    
    /**
     * @brief 列出目录的直接子项，按名称排序
     */
    std::vector<Path> listDirectory() const;
    
    // 文件流操作
    FILE* openForRead(bool binary = true) const;
    FILE* openForWrite(bool binary = true) const;
    
    // 比较操作符
    bool operator==(const Path& other) const { return utf8_path_ == other.utf8_path_; }
    bool operator!=(const Path& other) const { return utf8_path_ != other.utf8_path_; }
    bool operator<(const Path& other) const { return utf8_path_ < other.utf8_path_; }
    
    operator const std::string&() const { return utf8_path_; }
    
    friend std::ostream& operator<<(std::ostream& os, const Path& path) {
        return os << path.utf8_path_;
    }
};

} // namespace core
} // namespace odfpack
