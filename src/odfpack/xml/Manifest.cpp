#include "odfpack/xml/Manifest.hpp"
#include "odfpack/xml/XMLStreamReader.hpp"
#include "odfpack/xml/XMLStreamWriter.hpp"
#include "odfpack/core/Constants.hpp"
#include "odfpack/core/Exception.hpp"
#include "odfpack/utils/ModuleLoggers.hpp"
#include <algorithm>
#include <stdexcept>
#include <fmt/format.h>

namespace odfpack {
namespace xml {

namespace {

constexpr const char* kRootElement = "manifest:manifest";
constexpr const char* kFileEntryElement = "manifest:file-entry";
constexpr const char* kFullPathAttr = "manifest:full-path";
constexpr const char* kMediaTypeAttr = "manifest:media-type";

const std::string* findAttribute(const Manifest::Attributes& attributes, std::string_view name) {
    for (const auto& attr : attributes) {
        if (attr.first == name) {
            return &attr.second;
        }
    }
    return nullptr;
}

bool isBlank(std::string_view text) {
    return text.find_first_not_of(" \t\r\n") == std::string_view::npos;
}

void writeElement(XMLStreamWriter& writer, const Manifest::Element& element, int depth) {
    writer.startElement(element.name);
    for (const auto& attr : element.attributes) {
        writer.writeAttribute(attr.first, attr.second);
    }
    if (!element.text.empty()) {
        writer.writeText(element.text);
    }
    const std::string indent = "\n" + std::string(static_cast<size_t>(depth) + 1, ' ');
    for (const auto& child : element.children) {
        writer.writeText(indent);
        writeElement(writer, child, depth + 1);
    }
    if (!element.children.empty()) {
        writer.writeText("\n" + std::string(static_cast<size_t>(depth), ' '));
    }
    writer.endElement();
}

} // namespace

std::string Manifest::FileEntry::fullPath() const {
    const std::string* value = findAttribute(attributes, kFullPathAttr);
    return value ? *value : std::string();
}

std::optional<std::string> Manifest::FileEntry::mediaType() const {
    const std::string* value = findAttribute(attributes, kMediaTypeAttr);
    if (!value) {
        return std::nullopt;
    }
    return *value;
}

void Manifest::FileEntry::setAttribute(const std::string& name, const std::string& value) {
    for (auto& attr : attributes) {
        if (attr.first == name) {
            attr.second = value;
            return;
        }
    }
    attributes.emplace_back(name, value);
}

Manifest::Manifest()
    : root_attributes_{
          {"xmlns:manifest", "urn:oasis:names:tc:opendocument:xmlns:manifest:1.0"},
          {"manifest:version", "1.2"}} {}

Manifest Manifest::parse(const std::string& xml) {
    Manifest manifest;
    manifest.root_attributes_.clear();
    bool root_seen = false;
    bool in_entry = false;
    std::vector<Element*> open_elements;   // 当前文件条目下尚未结束的嵌套元素

    XMLStreamReader reader;
    reader.setStartElementCallback(
        [&](std::string_view name, const std::vector<XMLAttribute>& attributes, int depth) {
            if (depth == 0) {
                if (name != kRootElement) {
                    throw std::runtime_error(fmt::format("Unexpected root element '{}'", name));
                }
                root_seen = true;
                for (const auto& attr : attributes) {
                    manifest.root_attributes_.emplace_back(std::string(attr.name), std::string(attr.value));
                }
                return;
            }
            if (depth == 1) {
                // 只收集根元素下的直接文件条目
                in_entry = name == kFileEntryElement;
                if (!in_entry) {
                    return;
                }
                FileEntry entry;
                entry.attributes.reserve(attributes.size());
                for (const auto& attr : attributes) {
                    entry.attributes.emplace_back(std::string(attr.name), std::string(attr.value));
                }
                manifest.entries_.push_back(std::move(entry));
                open_elements.clear();
                return;
            }
            if (!in_entry) {
                return;
            }
            
            auto& siblings = open_elements.empty() ? manifest.entries_.back().children
                                                   : open_elements.back()->children;
            Element element;
            element.name = std::string(name);
            for (const auto& attr : attributes) {
                element.attributes.emplace_back(std::string(attr.name), std::string(attr.value));
            }
            siblings.push_back(std::move(element));
            open_elements.push_back(&siblings.back());
        });
    reader.setTextCallback([&](std::string_view text, int depth) {
        if (in_entry && depth >= 2 && !open_elements.empty() && !isBlank(text)) {
            open_elements.back()->text.append(text);
        }
    });
    reader.setEndElementCallback([&](std::string_view, int depth) {
        if (depth == 1) {
            in_entry = false;
        } else if (in_entry && depth >= 2 && !open_elements.empty()) {
            open_elements.pop_back();
        }
    });

    XMLParseError result = reader.parseFromString(xml);
    if (isError(result)) {
        ODFPACK_THROW(core::XMLException,
                      fmt::format("Failed to parse manifest: {}", reader.getLastErrorMessage()),
                      core::Constants::kManifestPart, reader.getLastErrorLine());
    }
    if (!root_seen) {
        ODFPACK_THROW(core::XMLException, "Manifest has no root element",
                      core::Constants::kManifestPart, -1);
    }

    XML_DEBUG("Parsed manifest with {} entries", manifest.entries_.size());
    return manifest;
}

std::vector<std::string> Manifest::getPaths() const {
    std::vector<std::string> paths;
    paths.reserve(entries_.size());
    for (const auto& entry : entries_) {
        if (findAttribute(entry.attributes, kFullPathAttr)) {
            paths.push_back(entry.fullPath());
        }
    }
    return paths;
}

std::vector<std::pair<std::string, std::string>> Manifest::getPathMedias() const {
    std::vector<std::pair<std::string, std::string>> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.emplace_back(entry.fullPath(), entry.mediaType().value_or(""));
    }
    return result;
}

std::optional<std::string> Manifest::getMediaType(std::string_view full_path) const {
    auto it = findEntry(full_path);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->mediaType();
}

void Manifest::setMediaType(std::string_view full_path, const std::string& media_type) {
    auto it = findEntry(full_path);
    if (it == entries_.end()) {
        ODFPACK_THROW(core::ParameterException,
                      fmt::format("Path not found: '{}'", full_path), "full_path",
                      core::ErrorCode::ManifestEntryNotFound);
    }
    it->setAttribute(kMediaTypeAttr, media_type);
}

void Manifest::addFullPath(const std::string& full_path, const std::string& media_type) {
    auto it = findEntry(full_path);
    if (it != entries_.end()) {
        it->setAttribute(kMediaTypeAttr, media_type);
        return;
    }
    FileEntry entry;
    entry.attributes.emplace_back(kMediaTypeAttr, media_type);
    entry.attributes.emplace_back(kFullPathAttr, full_path);
    entries_.push_back(std::move(entry));
}

void Manifest::delFullPath(std::string_view full_path) {
    auto it = findEntry(full_path);
    if (it == entries_.end()) {
        ODFPACK_THROW(core::ParameterException,
                      fmt::format("Path not found: '{}'", full_path), "full_path",
                      core::ErrorCode::ManifestEntryNotFound);
    }
    entries_.erase(it);
}

bool Manifest::hasPath(std::string_view full_path) const {
    return findEntry(full_path) != entries_.end();
}

std::string Manifest::serialize() const {
    XMLStreamWriter writer;
    writer.startDocument();
    writer.startElement(kRootElement);
    for (const auto& attr : root_attributes_) {
        writer.writeAttribute(attr.first, attr.second);
    }
    for (const auto& entry : entries_) {
        writer.writeText("\n ");
        writer.startElement(kFileEntryElement);
        for (const auto& attr : entry.attributes) {
            writer.writeAttribute(attr.first, attr.second);
        }
        for (const auto& child : entry.children) {
            writer.writeText("\n  ");
            writeElement(writer, child, 2);
        }
        if (!entry.children.empty()) {
            writer.writeText("\n ");
        }
        writer.endElement();
    }
    if (!entries_.empty()) {
        writer.writeText("\n");
    }
    writer.endElement();
    writer.endDocument();
    return writer.toString();
}

std::vector<Manifest::FileEntry>::iterator Manifest::findEntry(std::string_view full_path) {
    return std::find_if(entries_.begin(), entries_.end(), [&](const FileEntry& entry) {
        const std::string* value = findAttribute(entry.attributes, kFullPathAttr);
        return value && *value == full_path;
    });
}

std::vector<Manifest::FileEntry>::const_iterator Manifest::findEntry(std::string_view full_path) const {
    return std::find_if(entries_.begin(), entries_.end(), [&](const FileEntry& entry) {
        const std::string* value = findAttribute(entry.attributes, kFullPathAttr);
        return value && *value == full_path;
    });
}

}} // namespace odfpack::xml
