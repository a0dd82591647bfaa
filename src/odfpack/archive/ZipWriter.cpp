#include "odfpack/archive/ZipWriter.hpp"
#include "odfpack/utils/ModuleLoggers.hpp"
#include "odfpack/utils/TimeUtils.hpp"
#include <mz.h>
#include <mz_strm.h>
#include <mz_strm_mem.h>
#include <mz_zip.h>
#include <mz_zip_rw.h>
#include <climits>
#include <cstring>

namespace odfpack {
namespace archive {

ZipWriter::ZipWriter(const core::Path& path)
    : filepath_(path), description_(path.string()) {
}

ZipWriter::ZipWriter()
    : to_memory_(true), description_("<memory>") {
}

ZipWriter::~ZipWriter() {
    cleanup();
}

ZipWriter::ZipWriter(ZipWriter&& other) noexcept
    : zip_handle_(other.zip_handle_),
      mem_stream_(other.mem_stream_),
      filepath_(std::move(other.filepath_)),
      to_memory_(other.to_memory_),
      description_(std::move(other.description_)),
      buffer_(std::move(other.buffer_)),
      is_open_(other.is_open_),
      compression_level_(other.compression_level_),
      written_paths_(std::move(other.written_paths_)),
      written_order_(std::move(other.written_order_)),
      stats_(other.stats_) {
    other.zip_handle_ = nullptr;
    other.mem_stream_ = nullptr;
    other.is_open_ = false;
}

ZipWriter& ZipWriter::operator=(ZipWriter&& other) noexcept {
    if (this != &other) {
        cleanup();
        zip_handle_ = other.zip_handle_;
        mem_stream_ = other.mem_stream_;
        filepath_ = std::move(other.filepath_);
        to_memory_ = other.to_memory_;
        description_ = std::move(other.description_);
        buffer_ = std::move(other.buffer_);
        is_open_ = other.is_open_;
        compression_level_ = other.compression_level_;
        written_paths_ = std::move(other.written_paths_);
        written_order_ = std::move(other.written_order_);
        stats_ = other.stats_;
        
        other.zip_handle_ = nullptr;
        other.mem_stream_ = nullptr;
        other.is_open_ = false;
    }
    return *this;
}

bool ZipWriter::open() {
    cleanup();
    written_paths_.clear();
    written_order_.clear();
    buffer_.clear();
    stats_ = {};
    return initializeWriter();
}

bool ZipWriter::close() {
    // 幂等：已经关闭时直接返回成功
    if (!is_open_ || !zip_handle_) {
        return true;
    }
    
    bool success = true;
    
    int32_t result = mz_zip_writer_close(zip_handle_);
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to finalize ZIP archive: {}, error code: {}", description_, result);
        success = false;
    } else {
        ARCHIVE_DEBUG("ZIP archive finalized: {} ({} entries)", description_, stats_.entries_written);
    }
    
    mz_zip_writer_delete(&zip_handle_);
    zip_handle_ = nullptr;
    
    if (mem_stream_) {
        if (success) {
            const void* data = nullptr;
            int32_t length = 0;
            if (mz_stream_mem_get_buffer(mem_stream_, &data) == MZ_OK &&
                mz_stream_mem_get_buffer_length(mem_stream_, &length) == MZ_OK && data) {
                buffer_.assign(static_cast<const char*>(data), static_cast<size_t>(length));
            } else {
                ARCHIVE_ERROR("Failed to retrieve in-memory ZIP buffer");
                success = false;
            }
        }
        mz_stream_mem_delete(&mem_stream_);
        mem_stream_ = nullptr;
    }
    
    is_open_ = false;
    return success;
}

ZipError ZipWriter::addFile(std::string_view internal_path, std::string_view content, Method method) {
    if (!is_open_ || !zip_handle_) {
        ARCHIVE_ERROR("Zip archive not opened for writing");
        return ZipError::NotOpen;
    }
    
    if (internal_path.empty()) {
        return ZipError::InvalidParameter;
    }
    
    return writeFileEntry(std::string(internal_path), content.data(), content.size(), method);
}

ZipError ZipWriter::setCompressionLevel(int level) {
    if (level < 1 || level > 9) {
        ARCHIVE_ERROR("Invalid compression level: {}. Valid range: 1 to 9", level);
        return ZipError::InvalidParameter;
    }
    
    compression_level_ = level;
    if (is_open_ && zip_handle_) {
        mz_zip_writer_set_compress_level(zip_handle_, static_cast<int16_t>(compression_level_));
    }
    return ZipError::Ok;
}

bool ZipWriter::initializeWriter() {
    zip_handle_ = mz_zip_writer_create();
    if (!zip_handle_) {
        ARCHIVE_ERROR("Failed to create zip writer");
        return false;
    }
    
    mz_zip_writer_set_compress_method(zip_handle_, MZ_COMPRESS_METHOD_DEFLATE);
    mz_zip_writer_set_compress_level(zip_handle_, static_cast<int16_t>(compression_level_));
    
    int32_t result = MZ_OK;
    if (to_memory_) {
        mem_stream_ = mz_stream_mem_create();
        if (!mem_stream_) {
            ARCHIVE_ERROR("Failed to create memory stream");
            mz_zip_writer_delete(&zip_handle_);
            zip_handle_ = nullptr;
            return false;
        }
        mz_stream_mem_set_grow_size(mem_stream_, 128 * 1024);
        result = mz_stream_open(mem_stream_, nullptr, MZ_OPEN_MODE_CREATE);
        if (result == MZ_OK) {
            result = mz_zip_writer_open(zip_handle_, mem_stream_, 0);
        }
    } else {
        // 已存在的文件先删除
        if (filepath_.exists()) {
            filepath_.remove();
            ARCHIVE_DEBUG("Removed existing zip file: {}", description_);
        }
        result = mz_zip_writer_open_file(zip_handle_, filepath_.c_str(), 0, 0);
    }
    
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to open zip archive for writing: {}, error: {}", description_, result);
        mz_zip_writer_delete(&zip_handle_);
        zip_handle_ = nullptr;
        if (mem_stream_) {
            mz_stream_mem_delete(&mem_stream_);
            mem_stream_ = nullptr;
        }
        return false;
    }
    
    // 禁用 Data Descriptor，保证 mimetype 条目的本地头完整
    void* zip_handle = nullptr;
    if (mz_zip_writer_get_zip_handle(zip_handle_, &zip_handle) == MZ_OK && zip_handle) {
        mz_zip_set_data_descriptor(zip_handle, 0);
    }
    
    is_open_ = true;
    ARCHIVE_DEBUG("ZIP archive opened for writing: {}", description_);
    return true;
}

void ZipWriter::cleanup() {
    if (is_open_ && zip_handle_) {
        close();
    } else if (zip_handle_) {
        mz_zip_writer_delete(&zip_handle_);
        zip_handle_ = nullptr;
    }
    if (mem_stream_) {
        mz_stream_mem_delete(&mem_stream_);
        mem_stream_ = nullptr;
    }
    is_open_ = false;
}

void ZipWriter::initializeFileInfo(void* file_info_ptr, const std::string& path, size_t size, Method method) {
    mz_zip_file& file_info = *static_cast<mz_zip_file*>(file_info_ptr);
    file_info = {};
    file_info.filename = path.c_str();
    file_info.uncompressed_size = static_cast<int64_t>(size);
    file_info.compressed_size = 0; // 由minizip计算
    file_info.compression_method = (method == Method::Store)
        ? MZ_COMPRESS_METHOD_STORE
        : MZ_COMPRESS_METHOD_DEFLATE;
    
    std::time_t now = static_cast<std::time_t>(utils::TimeUtils::currentUnixSeconds());
    file_info.modified_date = now;
    file_info.creation_date = now;
    file_info.flag = 0;  // 不使用Data Descriptor
    
#ifdef _WIN32
    file_info.version_madeby = (MZ_HOST_SYSTEM_WINDOWS_NTFS << 8) | 20;
#else
    file_info.version_madeby = (MZ_HOST_SYSTEM_UNIX << 8) | 20;
#endif
}

ZipError ZipWriter::writeFileEntry(const std::string& internal_path, const void* data, size_t size, Method method) {
    if (written_paths_.find(internal_path) != written_paths_.end()) {
        ARCHIVE_WARN("Entry {} already exists in zip, skipping duplicate entry", internal_path);
        return ZipError::Ok;
    }
    
    if (size > INT32_MAX) {
        ARCHIVE_ERROR("Entry {} is too large ({} bytes)", internal_path, size);
        return ZipError::TooLarge;
    }
    
    mz_zip_file file_info;
    initializeFileInfo(&file_info, internal_path, size, method);
    
    int32_t result = mz_zip_writer_entry_open(zip_handle_, &file_info);
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to open entry {} in zip, error: {}", internal_path, result);
        return ZipError::IoFail;
    }
    
    if (size > 0) {
        int32_t bytes_written = mz_zip_writer_entry_write(zip_handle_, data, static_cast<int32_t>(size));
        if (bytes_written != static_cast<int32_t>(size)) {
            ARCHIVE_ERROR("Failed to write complete data for entry {}", internal_path);
            mz_zip_writer_entry_close(zip_handle_);
            return ZipError::IoFail;
        }
    }
    
    result = mz_zip_writer_entry_close(zip_handle_);
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to close entry {} in zip, error: {}", internal_path, result);
        return ZipError::IoFail;
    }
    
    written_paths_.insert(internal_path);
    written_order_.push_back(internal_path);
    stats_.entries_written++;
    stats_.bytes_written += size;
    
    ODFPACK_LOG_ZIP_DEBUG("Added entry {} ({} bytes, {})", internal_path, size,
                          method == Method::Store ? "stored" : "deflated");
    return ZipError::Ok;
}

}} // namespace odfpack::archive
