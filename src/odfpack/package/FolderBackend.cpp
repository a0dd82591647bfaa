#include "odfpack/package/FolderBackend.hpp"
#include "odfpack/package/PartStore.hpp"
#include "odfpack/core/Constants.hpp"
#include "odfpack/core/Exception.hpp"
#include "odfpack/utils/FileWrapper.hpp"
#include "odfpack/utils/ModuleLoggers.hpp"
#include <fmt/format.h>

namespace odfpack {
namespace package {

FolderBackend::FolderBackend(const core::Path& root)
    : root_(root) {
}

core::Path FolderBackend::partPath(const std::string& part_name) const {
    std::string name = normalizePartPath(part_name);
    while (isDirectoryPart(name)) {
        name.pop_back();
    }
    return root_ / name;
}

std::vector<std::string> FolderBackend::listParts() const {
    std::vector<std::string> parts;
    collect(root_, std::string(), parts);
    return parts;
}

void FolderBackend::collect(const core::Path& dir, const std::string& prefix,
                            std::vector<std::string>& parts) const {
    for (const auto& child : dir.listDirectory()) {
        const std::string name = child.filename();
        if (name.empty() || name[0] == '.') {
            continue;
        }
        
        const std::string relative = prefix + name;
        if (child.isDirectory()) {
            const size_t before = parts.size();
            collect(child, relative + "/", parts);
            if (parts.size() == before) {
                parts.push_back(relative + "/");
            }
        } else if (child.isFile()) {
            parts.push_back(relative);
        }
    }
}

std::optional<LoadedPart> FolderBackend::readPart(const std::string& part_name) const {
    if (!isSafePartPath(part_name)) {
        PACKAGE_WARN("Refusing to read part outside folder: '{}'", part_name);
        return std::nullopt;
    }
    const core::Path file = partPath(part_name);
    
    if (file.isDirectory()) {
        LoadedPart part;
        part.timestamp = file.lastWriteTime();
        return part;
    }
    if (!file.isFile()) {
        return std::nullopt;
    }
    
    LoadedPart part;
    part.timestamp = file.lastWriteTime();
    utils::FileWrapper input(file, "rb");
    part.data = input.readAll(file.string());
    ODFPACK_LOG_CACHE_DEBUG("Read part '{}' from folder ({} bytes, mtime {})",
                            part_name, part.data.size(), part.timestamp);
    return part;
}

int64_t FolderBackend::partTimestamp(const std::string& part_name) const {
    if (!isSafePartPath(part_name)) {
        return -1;
    }
    return partPath(part_name).lastWriteTime();
}

bool FolderBackend::isStale(const std::string& part_name, int64_t cached_timestamp) const {
    const int64_t disk_timestamp = partTimestamp(part_name);
    if (disk_timestamp < 0) {
        return false;
    }
    return cached_timestamp < 0 || disk_timestamp != cached_timestamp;
}

size_t FolderBackend::materialize(PartStore& store) const {
    size_t loaded = 0;
    for (const auto& name : listParts()) {
        if (store.contains(name)) {
            continue;
        }
        auto part = readPart(name);
        if (!part) {
            continue;
        }
        store.setCached(name, std::move(part->data), part->timestamp);
        ++loaded;
    }
    PACKAGE_DEBUG("Materialized {} parts from folder {}", loaded, root_.string());
    return loaded;
}

size_t FolderBackend::write(const PartStore& store, const core::Path& folder) {
    size_t written = 0;
    
    for (const auto& name : store.keys()) {
        const PartEntry* entry = store.find(name);
        if (!entry || entry->isDeleted()) {
            continue;
        }
        if (!isSafePartPath(name)) {
            ODFPACK_HANDLE_WARNING(fmt::format("Skipping part outside target folder: '{}'", name),
                                   folder.string());
            continue;
        }
        
        if (isDirectoryPart(name)) {
            const core::Path dir = folder / name.substr(0, name.size() - 1);
            if (!dir.createDirectories()) {
                ODFPACK_THROW(core::FileException, "Cannot create directory", dir.string(),
                              core::ErrorCode::FileWriteError);
            }
            ++written;
            continue;
        }
        
        const core::Path file = folder / name;
        const core::Path parent = file.parent();
        if (!parent.isDirectory() && !parent.createDirectories()) {
            ODFPACK_THROW(core::FileException, "Cannot create directory", parent.string(),
                          core::ErrorCode::FileWriteError);
        }
        
        {
            utils::FileWrapper output(file, "wb");
            output.writeAll(entry->data, file.string());
        }
        if (!file.setPermissions(core::Constants::kFolderFileMode)) {
            PACKAGE_DEBUG("Cannot set mode on {}", file.string());
        }
        ++written;
    }
    
    PACKAGE_DEBUG("Wrote {} parts to folder {}", written, folder.string());
    return written;
}

}} // namespace odfpack::package
