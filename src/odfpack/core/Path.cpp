#include "odfpack/core/Path.hpp"
#include "odfpack/utils/Logger.hpp"
#include <algorithm>
#include <cstdio>
#include <sys/stat.h>

namespace odfpack {
namespace core {

namespace fs = std::filesystem;

Path::Path(const std::string& path) : utf8_path_(path) {}

Path::Path(const char* path) : utf8_path_(path ? path : "") {}

Path::Path(const fs::path& path) : utf8_path_(path.generic_string()) {}

Path Path::operator/(const std::string& child) const {
    if (utf8_path_.empty()) return Path(child);
    if (child.empty()) return *this;
    if (utf8_path_.back() == '/') return Path(utf8_path_ + child);
    return Path(utf8_path_ + "/" + child);
}

Path Path::parent() const {
    return Path(native().parent_path());
}

std::string Path::filename() const {
    return native().filename().string();
}

std::string Path::stem() const {
    return native().stem().string();
}

std::string Path::extension() const {
    return native().extension().string();
}

Path Path::absolute() const {
    if (utf8_path_.empty()) return *this;
    std::error_code ec;
    fs::path abs = fs::absolute(native(), ec);
    if (ec) {
        ODFPACK_LOG_DEBUG("Cannot make path '{}' absolute: {}", utf8_path_, ec.message());
        return *this;
    }
    return Path(abs.lexically_normal());
}

bool Path::exists() const {
    if (utf8_path_.empty()) return false;
    std::error_code ec;
    return fs::exists(native(), ec);
}

bool Path::isFile() const {
    if (utf8_path_.empty()) return false;
    std::error_code ec;
    return fs::is_regular_file(native(), ec);
}

bool Path::isDirectory() const {
    if (utf8_path_.empty()) return false;
    std::error_code ec;
    return fs::is_directory(native(), ec);
}

uintmax_t Path::fileSize() const {
    if (utf8_path_.empty()) return 0;
    
    try {
        return fs::file_size(native());
    } catch (const fs::filesystem_error& e) {
        ODFPACK_LOG_DEBUG("Filesystem error getting file size '{}': {}", utf8_path_, e.what());
        return 0;
    }
}

int64_t Path::lastWriteTime() const {
    if (utf8_path_.empty()) return -1;
    
#ifdef _WIN32
    struct _stat64 st;
    if (::_stat64(utf8_path_.c_str(), &st) != 0) {
        return -1;
    }
#else
    struct stat st;
    if (::stat(utf8_path_.c_str(), &st) != 0) {
        return -1;
    }
#endif
    return static_cast<int64_t>(st.st_mtime);
}

bool Path::remove() const {
    if (utf8_path_.empty()) return false;
    
    try {
        return fs::remove(native());
    } catch (const fs::filesystem_error& e) {
        ODFPACK_LOG_DEBUG("Filesystem error removing '{}': {}", utf8_path_, e.what());
        return false;
    }
}

bool Path::removeAll() const {
    if (utf8_path_.empty()) return false;
    
    try {
        fs::remove_all(native());
        return true;
    } catch (const fs::filesystem_error& e) {
        ODFPACK_LOG_DEBUG("Filesystem error removing tree '{}': {}", utf8_path_, e.what());
        return false;
    }
}

bool Path::createDirectories() const {
    if (utf8_path_.empty()) return false;
    
    try {
        fs::create_directories(native());
        return fs::is_directory(native());
    } catch (const fs::filesystem_error& e) {
        ODFPACK_LOG_DEBUG("Filesystem error creating directories '{}': {}", utf8_path_, e.what());
        return false;
    }
}

bool Path::moveTo(const Path& target) const {
    if (utf8_path_.empty() || target.utf8_path_.empty()) return false;
    
    try {
        fs::rename(native(), target.native());
        return true;
    } catch (const fs::filesystem_error& e) {
        ODFPACK_LOG_DEBUG("Filesystem error moving '{}' to '{}': {}", 
                          utf8_path_, target.utf8_path_, e.what());
        return false;
    }
}

bool Path::setPermissions(unsigned int mode) const {
    if (utf8_path_.empty()) return false;
    
    std::error_code ec;
    fs::permissions(native(), static_cast<fs::perms>(mode) & fs::perms::mask,
                    fs::perm_options::replace, ec);
    if (ec) {
        ODFPACK_LOG_DEBUG("Cannot set permissions on '{}': {}", utf8_path_, ec.message());
        return false;
    }
    return true;
}

std::vector<Path> Path::listDirectory() const {
    std::vector<Path> children;
    if (utf8_path_.empty()) return children;
    
    try {
        for (const auto& entry : fs::directory_iterator(native())) {
            children.emplace_back(entry.path());
        }
    } catch (const fs::filesystem_error& e) {
        ODFPACK_LOG_DEBUG("Filesystem error listing '{}': {}", utf8_path_, e.what());
        children.clear();
        return children;
    }
    
    std::sort(children.begin(), children.end());
    return children;
}

FILE* Path::openForRead(bool binary) const {
    if (utf8_path_.empty()) return nullptr;
    return std::fopen(utf8_path_.c_str(), binary ? "rb" : "r");
}

FILE* Path::openForWrite(bool binary) const {
    if (utf8_path_.empty()) return nullptr;
    return std::fopen(utf8_path_.c_str(), binary ? "wb" : "w");
}

} // namespace core
} // namespace odfpack
