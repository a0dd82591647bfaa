#include "odfpack/package/ZipBackend.hpp"
#include "odfpack/package/PartStore.hpp"
#include "odfpack/archive/ZipReader.hpp"
#include "odfpack/core/Exception.hpp"
#include "odfpack/utils/ModuleLoggers.hpp"

namespace odfpack {
namespace package {

namespace {

size_t loadEntries(archive::ZipReader& reader, PartStore& store) {
    std::vector<std::pair<std::string, std::string>> entries;
    archive::ZipError result = reader.extractAll(entries);
    if (archive::isError(result)) {
        ODFPACK_THROW(core::FileException,
                      fmt::format("Cannot read ZIP archive: {}", archive::toString(result)),
                      reader.getDescription(), core::ErrorCode::FileCorrupted);
    }
    
    size_t loaded = 0;
    for (auto& [name, data] : entries) {
        if (store.contains(name)) {
            continue;
        }
        store.setCached(name, std::move(data), -1);
        ++loaded;
    }
    return loaded;
}

} // namespace

ZipBackend::ZipBackend(const core::Path& path)
    : path_(path) {
}

std::vector<std::string> ZipBackend::listParts() const {
    archive::ZipReader reader(path_);
    if (!reader.open()) {
        ODFPACK_THROW(core::FileException, "Bad ZIP file", path_.string(),
                      core::ErrorCode::FileCorrupted);
    }
    
    std::vector<std::string> parts;
    for (const auto& name : reader.listFiles()) {
        parts.push_back(normalizePartPath(name));
    }
    return parts;
}

std::optional<LoadedPart> ZipBackend::readPart(const std::string& part_name) const {
    archive::ZipReader reader(path_);
    if (!reader.open()) {
        PACKAGE_WARN("Cannot open {} as ZIP while reading part '{}'", path_.string(), part_name);
        return std::nullopt;
    }
    
    LoadedPart part;
    archive::ZipError result = reader.extractFile(normalizePartPath(part_name), part.data);
    if (result == archive::ZipError::FileNotFound) {
        return std::nullopt;
    }
    if (archive::isError(result)) {
        PACKAGE_WARN("Cannot read part '{}' from {}: {}", part_name, path_.string(),
                     archive::toString(result));
        return std::nullopt;
    }
    return part;
}

size_t ZipBackend::materialize(PartStore& store) const {
    archive::ZipReader reader(path_);
    if (!reader.open()) {
        ODFPACK_THROW(core::FileException, "Bad ZIP file", path_.string(),
                      core::ErrorCode::FileCorrupted);
    }
    
    size_t loaded = loadEntries(reader, store);
    PACKAGE_DEBUG("Materialized {} parts from {}", loaded, path_.string());
    return loaded;
}

size_t ZipBackend::loadFromBuffer(std::string buffer, PartStore& store) {
    archive::ZipReader reader(std::move(buffer));
    if (!reader.open()) {
        ODFPACK_THROW(core::FileException, "Bad ZIP file", reader.getDescription(),
                      core::ErrorCode::FileCorrupted);
    }
    return loadEntries(reader, store);
}

}} // namespace odfpack::package
