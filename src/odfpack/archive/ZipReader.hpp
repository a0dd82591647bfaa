#pragma once

#include "odfpack/core/Path.hpp"
#include "odfpack/archive/ZipError.hpp"
#include <string>
#include <vector>
#include <cstdint>
#include <ctime>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace odfpack {
namespace archive {

/**
 * @brief ZIP读取器
 * 
 * 数据源可以是磁盘上的文件，也可以是内存中的完整归档。
 * 条目按归档中的顺序保存（中央目录顺序）。
 */
class ZipReader {
public:
    struct EntryInfo {
        std::string path;
        uint64_t compressed_size = 0;
        uint64_t uncompressed_size = 0;
        uint32_t crc32 = 0;
        int compression_method = 0;
        time_t modified_date = 0;
        bool is_directory = false;
    };
    
    /**
     * @brief 从文件读取
     */
    explicit ZipReader(const core::Path& path);
    
    /**
     * @brief 从内存读取，归档字节由读取器持有
     */
    explicit ZipReader(std::string buffer);
    
    ~ZipReader();
    
    ZipReader(const ZipReader&) = delete;
    ZipReader& operator=(const ZipReader&) = delete;
    
    ZipReader(ZipReader&& other) noexcept;
    ZipReader& operator=(ZipReader&& other) noexcept;
    
    /**
     * 打开归档并读取中央目录
     * @return 归档无法解析时返回 false
     */
    bool open();
    
    bool close();
    
    bool isOpen() const { return is_open_; }
    
    /**
     * 所有条目名，按归档顺序
     *
     * 同名条目只保留中央目录中的第一个；extractFile 与 extractAll 遵循同一规则。
     */
    std::vector<std::string> listFiles() const;
    
    const std::vector<EntryInfo>& listEntriesInfo() const { return entries_; }
    
    bool hasEntry(std::string_view internal_path) const;
    
    bool getEntryInfo(std::string_view internal_path, EntryInfo& info) const;
    
    /**
     * 提取单个条目
     * @param internal_path ZIP内部路径
     * @param content 输出内容
     * @return 错误码
     */
    ZipError extractFile(std::string_view internal_path, std::string& content);
    
    /**
     * 按归档顺序提取所有条目（目录条目以空内容返回，同名条目只取第一个）
     */
    ZipError extractAll(std::vector<std::pair<std::string, std::string>>& entries);
    
    /**
     * 检测文件是否以 ZIP 本地文件头 "PK\x03\x04" 开始
     */
    static bool isZipFile(const core::Path& path);
    
    /**
     * 检测内存数据是否以 ZIP 本地文件头开始
     */
    static bool isZipData(std::string_view data);
    
    const std::string& getDescription() const { return description_; }
    
private:
    void* unzip_handle_ = nullptr;
    core::Path filepath_;
    std::string buffer_;
    bool from_memory_ = false;
    std::string description_;  // 日志中使用的来源描述
    bool is_open_ = false;
    
    std::vector<EntryInfo> entries_;
    std::unordered_map<std::string, size_t> entry_index_;
    
    bool initializeReader();
    void cleanup();
    void buildEntryIndex();
    ZipError readCurrentEntry(const std::string& internal_path, std::string& content);
};

}} // namespace odfpack::archive
