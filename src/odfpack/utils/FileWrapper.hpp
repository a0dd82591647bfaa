/**
 * @file FileWrapper.hpp
 * @brief RAII文件句柄包装器，提供异常安全的文件管理
 */

#pragma once

#include <memory>
#include <cstdio>
#include <cstring>
#include <string>
#include "odfpack/core/Exception.hpp"
#include "odfpack/core/Path.hpp"

namespace odfpack {
namespace utils {

/**
 * @brief RAII文件句柄包装器
 * 
 * 自动关闭文件句柄；打开失败时抛出 FileException。
 */
class FileWrapper {
public:
    /**
     * @brief 打开文件
     * @param path 文件路径
     * @param mode "rb" 或 "wb"
     * @throws FileException 文件打开失败时
     */
    FileWrapper(const core::Path& path, const char* mode) {
        const bool for_write = std::strchr(mode, 'w') != nullptr;
        FILE* raw_file = for_write ? path.openForWrite(true) : path.openForRead(true);
        
        if (raw_file) {
            file_.reset(raw_file);
            file_.get_deleter() = &fclose;
        }
        
        if (!file_) {
            throw core::FileException(
                for_write ? "Failed to open file for writing" : "Failed to open file for reading",
                path.string(),
                for_write ? core::ErrorCode::FileWriteError : core::ErrorCode::FileReadError,
                __FILE__, __LINE__
            );
        }
    }
    
    FileWrapper(FileWrapper&& other) noexcept = default;
    FileWrapper& operator=(FileWrapper&& other) noexcept = default;
    
    FileWrapper(const FileWrapper&) = delete;
    FileWrapper& operator=(const FileWrapper&) = delete;
    
    FILE* get() const noexcept { 
        return file_.get(); 
    }
    
    explicit operator bool() const noexcept { 
        return file_ != nullptr; 
    }
    
    /**
     * @brief 读取文件的全部内容
     * @throws FileException 读取失败时
     */
    std::string readAll(const std::string& filename) {
        std::string data;
        char buffer[8192];
        size_t n = 0;
        while ((n = std::fread(buffer, 1, sizeof(buffer), file_.get())) > 0) {
            data.append(buffer, n);
        }
        if (std::ferror(file_.get())) {
            throw core::FileException("Failed to read file", filename,
                                      core::ErrorCode::FileReadError, __FILE__, __LINE__);
        }
        return data;
    }
    
    /**
     * @brief 写入全部数据并刷新
     * @throws FileException 写入失败时
     */
    void writeAll(const std::string& data, const std::string& filename) {
        if (!data.empty() &&
            std::fwrite(data.data(), 1, data.size(), file_.get()) != data.size()) {
            throw core::FileException("Failed to write file", filename,
                                      core::ErrorCode::FileWriteError, __FILE__, __LINE__);
        }
        if (std::fflush(file_.get()) != 0) {
            throw core::FileException("Failed to flush file", filename,
                                      core::ErrorCode::FileWriteError, __FILE__, __LINE__);
        }
    }

private:
    std::unique_ptr<FILE, int(*)(FILE*)> file_{nullptr, nullptr};
};

} // namespace utils
} // namespace odfpack
