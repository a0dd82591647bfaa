#pragma once

#include "odfpack/core/Path.hpp"
#include "odfpack/archive/ZipError.hpp"
#include <string>
#include <vector>
#include <cstdint>
#include <string_view>
#include <unordered_set>

namespace odfpack {
namespace archive {

/**
 * @brief ZIP写入器
 * 
 * 写入磁盘文件或内存缓冲区；每个条目可单独指定存储方式，
 * 条目按 addFile 的调用顺序写入归档。
 */
class ZipWriter {
public:
    enum class Method {
        Store,    // 不压缩
        Deflate   // DEFLATE 压缩
    };
    
    /**
     * @brief 写入磁盘文件（已存在的文件会被替换）
     */
    explicit ZipWriter(const core::Path& path);
    
    /**
     * @brief 写入内存，close() 之后通过 getBuffer() 取得归档字节
     */
    ZipWriter();
    
    ~ZipWriter();
    
    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;
    
    ZipWriter(ZipWriter&& other) noexcept;
    ZipWriter& operator=(ZipWriter&& other) noexcept;
    
    bool open();
    
    /**
     * 写入中央目录并关闭
     * @return 归档未能正确完成时返回 false
     */
    bool close();
    
    bool isOpen() const { return is_open_; }
    bool isMemory() const { return to_memory_; }
    
    /**
     * 添加条目
     * @param internal_path ZIP内部路径
     * @param content 条目内容
     * @param method 存储方式
     * @return 错误码
     */
    ZipError addFile(std::string_view internal_path, std::string_view content,
                     Method method = Method::Deflate);
    
    /**
     * 设置 DEFLATE 压缩级别（1-9）
     */
    ZipError setCompressionLevel(int level);
    int getCompressionLevel() const { return compression_level_; }
    
    bool hasEntry(const std::string& internal_path) const {
        return written_paths_.count(internal_path) > 0;
    }
    
    /**
     * 已写入的条目，按写入顺序
     */
    const std::vector<std::string>& getWrittenPaths() const { return written_order_; }
    
    /**
     * 内存模式下 close() 之后的归档字节
     */
    const std::string& getBuffer() const { return buffer_; }
    
    struct Stats {
        size_t entries_written = 0;
        size_t bytes_written = 0;
    };
    Stats getStats() const { return stats_; }
    
    const core::Path& getPath() const { return filepath_; }
    
private:
    void* zip_handle_ = nullptr;
    void* mem_stream_ = nullptr;
    core::Path filepath_;
    bool to_memory_ = false;
    std::string description_;
    std::string buffer_;
    bool is_open_ = false;
    int compression_level_ = 6;
    std::unordered_set<std::string> written_paths_;  // 防止重复写入
    std::vector<std::string> written_order_;
    Stats stats_;
    
    bool initializeWriter();
    void cleanup();
    void initializeFileInfo(void* file_info, const std::string& path, size_t size, Method method);
    ZipError writeFileEntry(const std::string& internal_path, const void* data, size_t size, Method method);
};

}} // namespace odfpack::archive
