#include "odfpack/package/ZipLayout.hpp"
#include "odfpack/package/PartStore.hpp"
#include "odfpack/core/Constants.hpp"
#include "odfpack/core/Exception.hpp"
#include "odfpack/utils/ModuleLoggers.hpp"
#include <algorithm>
#include <array>

namespace odfpack {
namespace package {

namespace {

bool isPresent(const PartStore& store, const std::string& name) {
    const PartEntry* entry = store.find(name);
    return entry && entry->isLoaded();
}

} // namespace

std::vector<ZipLayout::Entry> ZipLayout::plan(const PartStore& store) {
    using Method = archive::ZipWriter::Method;
    using core::Constants;
    
    const std::array<std::string, 4> canonical = {
        Constants::kContentPart, Constants::kMetaPart,
        Constants::kSettingsPart, Constants::kStylesPart
    };
    const std::string mimetype = Constants::kMimetypePart;
    const std::string manifest = Constants::kManifestPart;
    
    std::vector<Entry> entries;
    
    if (!isPresent(store, mimetype)) {
        ODFPACK_THROW(core::FormatException, "Mimetype is not defined",
                      core::ErrorCode::MissingMimetype);
    }
    entries.push_back({mimetype, Method::Store});
    
    for (const auto& name : canonical) {
        if (isPresent(store, name)) {
            entries.push_back({name, Method::Deflate});
        } else {
            ODFPACK_HANDLE_WARNING(fmt::format("Missing '{}'", name), "zip save");
        }
    }
    
    for (const auto& name : store.keys()) {
        if (name == mimetype || name == manifest ||
            std::find(canonical.begin(), canonical.end(), name) != canonical.end()) {
            continue;
        }
        if (isPresent(store, name)) {
            entries.push_back({name, Method::Deflate});
        }
    }
    
    if (isPresent(store, manifest)) {
        entries.push_back({manifest, Method::Deflate});
    } else {
        ODFPACK_HANDLE_WARNING(fmt::format("Missing '{}'", manifest), "zip save");
    }
    
    return entries;
}

void ZipLayout::write(const PartStore& store, const std::vector<Entry>& entries,
                      archive::ZipWriter& writer) {
    for (const auto& entry : entries) {
        const PartEntry* part = store.find(entry.name);
        if (!part || !part->isLoaded()) {
            continue;
        }
        archive::ZipError result = writer.addFile(entry.name, part->data, entry.method);
        if (archive::isError(result)) {
            ODFPACK_THROW(core::FileException,
                          fmt::format("Cannot write part '{}': {}", entry.name, archive::toString(result)),
                          writer.isMemory() ? std::string("<memory>") : writer.getPath().string(),
                          core::ErrorCode::FileWriteError);
        }
    }
    
    PACKAGE_DEBUG("Wrote {} parts in ODF ZIP order", entries.size());
}

}} // namespace odfpack::package
