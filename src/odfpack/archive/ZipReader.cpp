#include "odfpack/archive/ZipReader.hpp"
#include "odfpack/utils/ModuleLoggers.hpp"
#include "odfpack/utils/FileWrapper.hpp"
#include <mz.h>
#include <mz_strm.h>
#include <mz_zip.h>
#include <mz_zip_rw.h>
#include <array>
#include <cstring>
#include <unordered_set>

namespace odfpack {
namespace archive {

namespace {
constexpr char kZipMagic[4] = {'P', 'K', '\x03', '\x04'};
}

ZipReader::ZipReader(const core::Path& path) 
    : filepath_(path), description_(path.string()) {
}

ZipReader::ZipReader(std::string buffer)
    : buffer_(std::move(buffer)), from_memory_(true), description_("<memory>") {
}

ZipReader::~ZipReader() {
    cleanup();
}

ZipReader::ZipReader(ZipReader&& other) noexcept
    : unzip_handle_(other.unzip_handle_),
      filepath_(std::move(other.filepath_)),
      buffer_(std::move(other.buffer_)),
      from_memory_(other.from_memory_),
      description_(std::move(other.description_)),
      is_open_(other.is_open_),
      entries_(std::move(other.entries_)),
      entry_index_(std::move(other.entry_index_)) {
    other.unzip_handle_ = nullptr;
    other.is_open_ = false;
}

ZipReader& ZipReader::operator=(ZipReader&& other) noexcept {
    if (this != &other) {
        cleanup();
        unzip_handle_ = other.unzip_handle_;
        filepath_ = std::move(other.filepath_);
        buffer_ = std::move(other.buffer_);
        from_memory_ = other.from_memory_;
        description_ = std::move(other.description_);
        is_open_ = other.is_open_;
        entries_ = std::move(other.entries_);
        entry_index_ = std::move(other.entry_index_);
        
        other.unzip_handle_ = nullptr;
        other.is_open_ = false;
    }
    return *this;
}

bool ZipReader::open() {
    cleanup();
    return initializeReader();
}

bool ZipReader::close() {
    cleanup();
    return true;
}

std::vector<std::string> ZipReader::listFiles() const {
    std::vector<std::string> files;
    files.reserve(entries_.size());
    for (const auto& info : entries_) {
        files.push_back(info.path);
    }
    return files;
}

bool ZipReader::hasEntry(std::string_view internal_path) const {
    return entry_index_.find(std::string(internal_path)) != entry_index_.end();
}

bool ZipReader::getEntryInfo(std::string_view internal_path, EntryInfo& info) const {
    auto it = entry_index_.find(std::string(internal_path));
    if (it == entry_index_.end()) {
        return false;
    }
    info = entries_[it->second];
    return true;
}

ZipError ZipReader::extractFile(std::string_view internal_path, std::string& content) {
    if (!is_open_ || !unzip_handle_) {
        ARCHIVE_ERROR("Zip archive not opened for reading: {}", description_);
        return ZipError::NotOpen;
    }
    
    std::string path_str(internal_path);
    if (!hasEntry(path_str)) {
        ARCHIVE_DEBUG("Entry {} not found in {}", path_str, description_);
        return ZipError::FileNotFound;
    }
    
    if (mz_zip_reader_locate_entry(unzip_handle_, path_str.c_str(), 0) != MZ_OK) {
        return ZipError::FileNotFound;
    }
    
    return readCurrentEntry(path_str, content);
}

ZipError ZipReader::extractAll(std::vector<std::pair<std::string, std::string>>& entries) {
    if (!is_open_ || !unzip_handle_) {
        ARCHIVE_ERROR("Zip archive not opened for reading: {}", description_);
        return ZipError::NotOpen;
    }
    
    entries.clear();
    entries.reserve(entries_.size());
    std::unordered_set<std::string> seen;
    
    int32_t err = mz_zip_reader_goto_first_entry(unzip_handle_);
    if (err == MZ_END_OF_LIST) {
        return ZipError::Ok;
    }
    if (err != MZ_OK) {
        return ZipError::BadFormat;
    }
    
    do {
        mz_zip_file* info = nullptr;
        if (mz_zip_reader_entry_get_info(unzip_handle_, &info) != MZ_OK || !info || !info->filename) {
            return ZipError::BadFormat;
        }
        std::string name(info->filename);
        if (seen.insert(name).second) {
            std::string content;
            ZipError result = readCurrentEntry(name, content);
            if (isError(result)) {
                return result;
            }
            entries.emplace_back(std::move(name), std::move(content));
        }
        err = mz_zip_reader_goto_next_entry(unzip_handle_);
    } while (err == MZ_OK);
    
    if (err != MZ_END_OF_LIST) {
        ARCHIVE_ERROR("Failed to iterate entries of {}, error: {}", description_, err);
        return ZipError::BadFormat;
    }
    
    ARCHIVE_DEBUG("Extracted {} entries from {}", entries.size(), description_);
    return ZipError::Ok;
}

bool ZipReader::isZipFile(const core::Path& path) {
    if (!path.isFile()) {
        return false;
    }
    
    try {
        utils::FileWrapper file(path, "rb");
        std::array<char, 4> header{};
        if (std::fread(header.data(), 1, header.size(), file.get()) != header.size()) {
            return false;
        }
        return std::memcmp(header.data(), kZipMagic, sizeof(kZipMagic)) == 0;
    } catch (const core::FileException& e) {
        ARCHIVE_DEBUG("ZIP detection failed for {}: {}", path.string(), e.what());
        return false;
    }
}

bool ZipReader::isZipData(std::string_view data) {
    return data.size() >= sizeof(kZipMagic) &&
           std::memcmp(data.data(), kZipMagic, sizeof(kZipMagic)) == 0;
}

bool ZipReader::initializeReader() {
    unzip_handle_ = mz_zip_reader_create();
    if (!unzip_handle_) {
        ARCHIVE_ERROR("Failed to create zip reader");
        return false;
    }
    
    int32_t result = MZ_OK;
    if (from_memory_) {
        // copy=1：minizip 持有自己的副本
        result = mz_zip_reader_open_buffer(unzip_handle_,
                                           reinterpret_cast<uint8_t*>(buffer_.data()),
                                           static_cast<int32_t>(buffer_.size()), 1);
    } else {
        result = mz_zip_reader_open_file(unzip_handle_, filepath_.c_str());
    }
    
    if (result != MZ_OK) {
        ARCHIVE_DEBUG("Failed to open zip archive for reading: {}, error: {}", description_, result);
        mz_zip_reader_delete(&unzip_handle_);
        unzip_handle_ = nullptr;
        return false;
    }
    
    is_open_ = true;
    buildEntryIndex();
    ARCHIVE_DEBUG("Zip archive opened for reading: {} ({} entries)", description_, entries_.size());
    return true;
}

void ZipReader::cleanup() {
    if (unzip_handle_) {
        mz_zip_reader_close(unzip_handle_);
        mz_zip_reader_delete(&unzip_handle_);
        unzip_handle_ = nullptr;
    }
    
    is_open_ = false;
    entries_.clear();
    entry_index_.clear();
}

void ZipReader::buildEntryIndex() {
    entries_.clear();
    entry_index_.clear();
    
    if (!unzip_handle_ || mz_zip_reader_goto_first_entry(unzip_handle_) != MZ_OK) {
        return;
    }
    
    do {
        mz_zip_file* file_info = nullptr;
        if (mz_zip_reader_entry_get_info(unzip_handle_, &file_info) == MZ_OK && file_info) {
            if (file_info->filename && file_info->filename[0] != '\0') {
                EntryInfo info;
                info.path = file_info->filename;
                info.compressed_size = static_cast<uint64_t>(file_info->compressed_size);
                info.uncompressed_size = static_cast<uint64_t>(file_info->uncompressed_size);
                info.crc32 = file_info->crc;
                info.compression_method = file_info->compression_method;
                info.modified_date = file_info->modified_date;
                info.is_directory = (info.path.back() == '/');
                
                // 重复条目以中央目录中的第一个为准，与 mz_zip_reader_locate_entry 一致
                if (entry_index_.count(info.path) != 0) {
                    ARCHIVE_DEBUG("Ignoring duplicate entry {} in {}", info.path, description_);
                } else {
                    entry_index_.emplace(info.path, entries_.size());
                    entries_.push_back(std::move(info));
                }
            }
        }
    } while (mz_zip_reader_goto_next_entry(unzip_handle_) == MZ_OK);
}

ZipError ZipReader::readCurrentEntry(const std::string& internal_path, std::string& content) {
    if (mz_zip_reader_entry_open(unzip_handle_) != MZ_OK) {
        ARCHIVE_ERROR("Failed to open entry {} in {}", internal_path, description_);
        return ZipError::IoFail;
    }
    
    std::string data;
    std::array<char, 16384> buffer;
    int32_t bytes_read = 0;
    do {
        bytes_read = mz_zip_reader_entry_read(unzip_handle_, buffer.data(),
                                              static_cast<int32_t>(buffer.size()));
        if (bytes_read > 0) {
            data.append(buffer.data(), static_cast<size_t>(bytes_read));
        }
    } while (bytes_read > 0);
    
    int32_t close_result = mz_zip_reader_entry_close(unzip_handle_);
    if (bytes_read < 0 || close_result != MZ_OK) {
        ARCHIVE_ERROR("Failed to read entry {} in {}, error: {}", internal_path, description_,
                      bytes_read < 0 ? bytes_read : close_result);
        return ZipError::BadFormat;
    }
    
    ODFPACK_LOG_ZIP_DEBUG("Read entry {} ({} bytes)", internal_path, data.size());
    content.swap(data);
    return ZipError::Ok;
}

}} // namespace odfpack::archive
