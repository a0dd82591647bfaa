#include "odfpack/package/Container.hpp"
#include "odfpack/package/FolderBackend.hpp"
#include "odfpack/package/ZipBackend.hpp"
#include "odfpack/package/ZipLayout.hpp"
#include "odfpack/archive/ZipReader.hpp"
#include "odfpack/archive/ZipWriter.hpp"
#include "odfpack/core/Constants.hpp"
#include "odfpack/core/Exception.hpp"
#include "odfpack/xml/Manifest.hpp"
#include "odfpack/utils/ModuleLoggers.hpp"
#include "odfpack/utils/TimeUtils.hpp"
#include <istream>
#include <iterator>
#include <ostream>
#include <fmt/format.h>

namespace odfpack {
namespace package {

namespace {

constexpr const char* kOfficeVersion = "1.2";

bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

Container::Container(const core::Path& path) {
    open(path);
}

Container::Container(std::istream& stream) {
    open(stream);
}

Container::~Container() = default;
Container::Container(Container&&) noexcept = default;
Container& Container::operator=(Container&&) noexcept = default;

void Container::reset() {
    store_.clear();
    backend_.reset();
    path_.clear();
    packaging_ = Packaging::Zip;
}

void Container::open(const core::Path& path) {
    reset();
    
    core::Path absolute = path.absolute();
    if (!absolute.exists()) {
        ODFPACK_THROW(core::FileException,
                      fmt::format("No such file or directory: '{}'", absolute.string()),
                      absolute.string(), core::ErrorCode::FileNotFound);
    }
    
    try {
        path_ = absolute;
        if (absolute.isFile() && archive::ZipReader::isZipFile(absolute)) {
            packaging_ = Packaging::Zip;
            backend_ = std::make_unique<ZipBackend>(absolute);
            // 先读一次中央目录，损坏的归档在打开时即失败
            auto parts = backend_->listParts();
            PACKAGE_DEBUG("Opened ZIP {} with {} parts", absolute.string(), parts.size());
        } else if (absolute.isDirectory()) {
            packaging_ = Packaging::Folder;
            backend_ = std::make_unique<FolderBackend>(absolute);
            openFolder();
            PACKAGE_DEBUG("Opened folder {}", absolute.string());
        } else {
            ODFPACK_THROW(core::OperationException,
                          fmt::format("Unsupported source type: '{}'", absolute.string()),
                          "open", core::ErrorCode::UnsupportedSource);
        }
        validateMimetype();
    } catch (...) {
        reset();
        throw;
    }
}

void Container::open(std::istream& stream) {
    reset();
    
    std::istream::pos_type start = stream.tellg();
    if (start == std::istream::pos_type(-1)) {
        ODFPACK_THROW(core::OperationException, "Unsupported source type: stream is not seekable",
                      "open", core::ErrorCode::UnsupportedSource);
    }
    
    char magic[4] = {0, 0, 0, 0};
    stream.read(magic, sizeof(magic));
    std::streamsize got = stream.gcount();
    stream.clear();
    stream.seekg(start);
    
    if (got != 4 || !archive::ZipReader::isZipData(std::string_view(magic, 4))) {
        ODFPACK_THROW(core::OperationException, "Unsupported source type: stream is not a ZIP archive",
                      "open", core::ErrorCode::UnsupportedSource);
    }
    
    std::string buffer((std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>());
    
    try {
        packaging_ = Packaging::Zip;
        size_t loaded = ZipBackend::loadFromBuffer(std::move(buffer), store_);
        PACKAGE_DEBUG("Loaded {} parts from stream", loaded);
        validateMimetype();
    } catch (...) {
        reset();
        throw;
    }
}

void Container::openFolder() {
    const std::string name = core::Constants::kMimetypePart;
    std::optional<std::string> mimetype;
    try {
        mimetype = getPart(name);
    } catch (const core::FileException& e) {
        PACKAGE_DEBUG("Cannot read folder mimetype: {}", e.what());
    }
    
    if (!mimetype) {
        ODFPACK_HANDLE_WARNING("corrupted or not an OpenDocument folder (missing mimetype)",
                               path_.string());
        store_.setCached(name, core::mimetypeForExtension(core::Constants::kDefaultDocumentType),
                         utils::TimeUtils::currentUnixSeconds());
    }
}

void Container::validateMimetype() {
    const PartEntry* entry = store_.find(core::Constants::kMimetypePart);
    std::string value;
    if (entry && entry->isLoaded()) {
        value = entry->data;
    } else if (!entry && backend_) {
        value = getPart(core::Constants::kMimetypePart).value_or("");
    }
    
    if (!core::isKnownMimetype(value)) {
        ODFPACK_THROW(core::FormatException,
                      fmt::format("Document of unknown type {}", value),
                      core::ErrorCode::UnknownMimetype);
    }
}

std::optional<std::string> Container::getPart(const std::string& path) {
    const std::string name = normalizePartPath(path);
    const PartEntry* entry = store_.find(name);
    
    if (entry && entry->isDeleted()) {
        ODFPACK_THROW(core::PartException, fmt::format("Part is deleted: '{}'", name), name,
                      core::ErrorCode::PartDeleted);
    }
    
    if (!backend_) {
        if (!entry) {
            return std::nullopt;
        }
        return entry->data;
    }
    
    if (entry) {
        if (entry->pinned || !backend_->isStale(name, entry->timestamp)) {
            return entry->data;
        }
        auto part = backend_->readPart(name);
        if (!part) {
            // 磁盘文件已消失，保留缓存
            return entry->data;
        }
        ODFPACK_LOG_CACHE_DEBUG("Refreshing stale part '{}' ({} -> {})", name, entry->timestamp,
                                part->timestamp);
        store_.setCached(name, part->data, part->timestamp);
        return std::move(part->data);
    }
    
    auto part = backend_->readPart(name);
    if (!part) {
        return std::nullopt;
    }
    store_.setCached(name, part->data, part->timestamp);
    return std::move(part->data);
}

void Container::setPart(const std::string& path, std::string data) {
    ODFPACK_THROW_IF(!isSafePartPath(path), core::ParameterException,
                     fmt::format("Invalid part path: '{}'", path), "path",
                     core::ErrorCode::InvalidPartPath);
    store_.setLoaded(path, std::move(data));
}

void Container::delPart(const std::string& path) {
    store_.markDeleted(path);
}

std::vector<std::string> Container::getParts() const {
    if (!backend_) {
        return store_.keys();
    }
    return backend_->listParts();
}

std::string Container::mimetype() {
    return getPart(core::Constants::kMimetypePart).value_or("");
}

void Container::setMimetype(const std::string& mimetype) {
    store_.setLoaded(core::Constants::kMimetypePart, mimetype);
}

void Container::materialize() {
    if (!backend_) {
        return;
    }
    size_t loaded = backend_->materialize(store_);
    
    // 文件夹缓存可能已过期，保存前刷新
    if (backend_->packaging() == Packaging::Folder) {
        for (const auto& name : store_.keys()) {
            const PartEntry* entry = store_.find(name);
            if (entry && entry->isLoaded() && !entry->pinned) {
                getPart(name);
            }
        }
    }
    PACKAGE_DEBUG("Materialized {} parts from {}", loaded, backend_->path().string());
}

Packaging Container::resolvePackaging(const std::string& requested) const {
    if (requested.empty()) {
        return packaging_;
    }
    return parsePackaging(requested);
}

void Container::save(const SaveOptions& options) {
    if (path_.empty()) {
        ODFPACK_THROW(core::ParameterException,
                      "No save target: container is not bound to a path", "target",
                      core::ErrorCode::InvalidArgument);
    }
    save(path_, options);
}

void Container::save(const core::Path& target, const SaveOptions& options) {
    Packaging packaging = resolvePackaging(options.packaging);
    materialize();
    
    core::Path cleaned = cleanTarget(target);
    if (cleaned.empty()) {
        ODFPACK_THROW(core::ParameterException,
                      fmt::format("Invalid save target: '{}'", target.string()), "target",
                      core::ErrorCode::InvalidArgument);
    }
    saveToPath(cleaned, packaging, options.backup);
}

void Container::save(std::ostream& stream, const SaveOptions& options) {
    Packaging packaging = resolvePackaging(options.packaging);
    if (packaging == Packaging::Folder) {
        ODFPACK_THROW(core::OperationException,
                      "Saving in folder format requires a folder name, not a stream", "save",
                      core::ErrorCode::UnsupportedTarget);
    }
    materialize();
    
    auto entries = ZipLayout::plan(store_);
    archive::ZipWriter writer;
    if (!writer.open()) {
        ODFPACK_THROW(core::FileException, "Cannot create in-memory ZIP archive", "<memory>",
                      core::ErrorCode::FileWriteError);
    }
    ZipLayout::write(store_, entries, writer);
    if (!writer.close()) {
        ODFPACK_THROW(core::FileException, "Cannot finalize in-memory ZIP archive", "<memory>",
                      core::ErrorCode::FileWriteError);
    }
    
    const std::string& buffer = writer.getBuffer();
    stream.write(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    if (!stream) {
        ODFPACK_THROW(core::FileException, "Cannot write ZIP archive to stream", "<stream>",
                      core::ErrorCode::FileWriteError);
    }
    PACKAGE_INFO("Saved {} parts ({} bytes) to stream", entries.size(), buffer.size());
}

void Container::saveToPath(const core::Path& target, Packaging packaging, bool backup) {
    if (packaging == Packaging::Folder) {
        core::Path folder(target.string() + core::Constants::kFolderSuffix);
        if (backup) {
            backupTarget(folder);
        } else if (folder.exists() && !folder.removeAll()) {
            ODFPACK_HANDLE_WARNING(fmt::format("Cannot remove existing folder '{}'", folder.string()),
                                   "folder save");
        }
        size_t written = FolderBackend::write(store_, folder);
        PACKAGE_INFO("Saved {} parts to folder {}", written, folder.string());
        return;
    }
    
    // 先检查布局，mimetype 缺失时不触碰目标文件
    auto entries = ZipLayout::plan(store_);
    if (backup) {
        backupTarget(target);
    }
    
    archive::ZipWriter writer(target);
    if (!writer.open()) {
        ODFPACK_THROW(core::FileException, "Cannot create ZIP archive", target.string(),
                      core::ErrorCode::FileWriteError);
    }
    ZipLayout::write(store_, entries, writer);
    if (!writer.close()) {
        ODFPACK_THROW(core::FileException, "Cannot finalize ZIP archive", target.string(),
                      core::ErrorCode::FileWriteError);
    }
    PACKAGE_INFO("Saved {} parts to {}", entries.size(), target.string());
}

core::Path Container::cleanTarget(const core::Path& target) {
    std::string value = target.string();
    while (value.size() > 1 && (value.back() == '/' || value.back() == '\\')) {
        value.pop_back();
    }
    const std::string suffix = core::Constants::kFolderSuffix;
    while (endsWith(value, suffix)) {
        value.erase(value.size() - suffix.size());
    }
    return core::Path(value);
}

void Container::backupTarget(const core::Path& target) {
    if (!target.exists()) {
        return;
    }
    
    std::string ext = target.extension();
    if (ext.size() <= 1) {
        ext.clear();
    }
    const std::string& value = target.string();
    core::Path backup(value.substr(0, value.size() - ext.size()) + core::Constants::kBackupInfix + ext);
    
    if (backup.isDirectory() && !backup.removeAll()) {
        ODFPACK_HANDLE_WARNING(fmt::format("Cannot remove old backup '{}'", backup.string()), "backup");
    }
    if (!target.moveTo(backup)) {
        ODFPACK_HANDLE_WARNING(fmt::format("Cannot move '{}' to '{}'", target.string(), backup.string()),
                               "backup");
        return;
    }
    PACKAGE_DEBUG("Backed up {} to {}", target.string(), backup.string());
}

std::unique_ptr<Container> Container::clone() {
    // 副本不绑定后端，先把尚未读取的部件全部读入
    materialize();
    
    auto copy = std::make_unique<Container>();
    copy->store_ = store_.clone();
    copy->packaging_ = packaging_;
    return copy;
}

std::unique_ptr<Container> Container::fromTemplate(const core::Path& template_path) {
    Container source(template_path);
    auto document = source.clone();
    
    std::string mimetype = document->mimetype();
    const std::string marker(core::Constants::kTemplateSuffix);
    auto pos = mimetype.find(marker);
    if (pos != std::string::npos) {
        mimetype.erase(pos, marker.size());
    }
    document->setMimetype(mimetype);
    
    auto manifest_data = document->getPart(core::Constants::kManifestPart);
    if (manifest_data) {
        xml::Manifest manifest = xml::Manifest::parse(*manifest_data);
        manifest.addFullPath("/", mimetype);
        document->setPart(core::Constants::kManifestPart, manifest.serialize());
    }
    
    PACKAGE_INFO("Created {} document from template {}", mimetype, template_path.string());
    return document;
}

std::string Container::defaultManifestRdf() {
    return fmt::format(
        "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
        "<rdf:RDF xmlns:rdf=\"http://www.w3.org/1999/02/22-rdf-syntax-ns#\">\n"
        "  <rdf:Description rdf:about=\"styles.xml\">\n"
        "    <rdf:type rdf:resource=\"http://docs.oasis-open.org/ns/office/{0}/meta/odf#StylesFile\"/>\n"
        "  </rdf:Description>\n"
        "  <rdf:Description rdf:about=\"\">\n"
        "    <ns0:hasPart xmlns:ns0=\"http://docs.oasis-open.org/ns/office/{0}/meta/pkg#\" rdf:resource=\"styles.xml\"/>\n"
        "  </rdf:Description>\n"
        "  <rdf:Description rdf:about=\"content.xml\">\n"
        "    <rdf:type rdf:resource=\"http://docs.oasis-open.org/ns/office/{0}/meta/odf#ContentFile\"/>\n"
        "  </rdf:Description>\n"
        "  <rdf:Description rdf:about=\"\">\n"
        "    <ns0:hasPart xmlns:ns0=\"http://docs.oasis-open.org/ns/office/{0}/meta/pkg#\" rdf:resource=\"content.xml\"/>\n"
        "  </rdf:Description>\n"
        "  <rdf:Description rdf:about=\"\">\n"
        "    <rdf:type rdf:resource=\"http://docs.oasis-open.org/ns/office/{0}/meta/pkg#Document\"/>\n"
        "  </rdf:Description>\n"
        "</rdf:RDF>\n",
        kOfficeVersion);
}

std::string Container::toString() {
    std::string type;
    if (store_.isDeleted(core::Constants::kMimetypePart)) {
        type = "<deleted>";
    } else {
        type = mimetype();
    }
    return fmt::format("<Container type={} path={}>", type,
                       path_.empty() ? std::string("None") : path_.string());
}

}} // namespace odfpack::package
