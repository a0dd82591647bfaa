#include "odfpack/utils/ModuleLoggers.hpp"
/**
 * @file 01_basic_usage.cpp
 * @brief OdfPack 基本用法示例
 * 
 * 这个示例展示了：
 * - 在内存中组装一个最小的文本文档
 * - 保存为 ZIP 和展开目录两种格式
 * - 重新打开并读取、修改、删除部件
 */

#include "odfpack/OdfPack.hpp"
#include <iostream>
#include <string>

namespace {

const char* kContent =
    "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
    "<office:document-content xmlns:office=\"urn:oasis:names:tc:opendocument:xmlns:office:1.0\" "
    "xmlns:text=\"urn:oasis:names:tc:opendocument:xmlns:text:1.0\" office:version=\"1.2\">"
    "<office:body><office:text><text:p>Hello OdfPack</text:p></office:text></office:body>"
    "</office:document-content>";

std::string emptyPart(const char* root) {
    return fmt::format("<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
                       "<office:{} xmlns:office=\"urn:oasis:names:tc:opendocument:xmlns:office:1.0\" "
                       "office:version=\"1.2\"/>", root);
}

} // namespace

int main() {
    using namespace odfpack;
    
    if (!odfpack::initialize("logs/basic_usage.log", true)) {
        return 1;
    }
    
    try {
        const std::string mimetype = core::mimetypeForExtension("odt");
        
        // 1. 组装文档
        auto document = createDocument();
        document->setMimetype(mimetype);
        document->setPart(core::Constants::kContentPart, kContent);
        document->setPart(core::Constants::kStylesPart, emptyPart("document-styles"));
        document->setPart(core::Constants::kMetaPart, emptyPart("document-meta"));
        document->setPart(core::Constants::kSettingsPart, emptyPart("document-settings"));
        document->setPart(core::Constants::kManifestRdfPart, package::Container::defaultManifestRdf());
        
        xml::Manifest manifest;
        manifest.addFullPath("/", mimetype);
        for (const char* part : {"content.xml", "styles.xml", "meta.xml", "settings.xml", "manifest.rdf"}) {
            manifest.addFullPath(part, "text/xml");
        }
        document->setPart(core::Constants::kManifestPart, manifest.serialize());
        EXAMPLE_INFO("1. Assembled document with {} parts", document->getParts().size());
        
        // 2. 保存为两种格式
        document->save(core::Path("hello.odt"));
        package::Container::SaveOptions folder_options;
        folder_options.packaging = "folder";
        document->save(core::Path("hello"), folder_options);
        EXAMPLE_INFO("2. Saved hello.odt and hello.folder");
        
        // 3. 重新打开
        auto reopened = openDocument(core::Path("hello.odt"));
        EXAMPLE_INFO("3. Reopened {}", reopened->toString());
        for (const auto& name : reopened->getParts()) {
            auto data = reopened->getPart(name);
            EXAMPLE_INFO("   - {} ({} bytes)", name, data ? data->size() : 0);
        }
        
        // 4. 删除部件后读取会失败
        reopened->delPart(core::Constants::kSettingsPart);
        try {
            reopened->getPart(core::Constants::kSettingsPart);
        } catch (const core::PartException& e) {
            EXAMPLE_INFO("4. Reading deleted part fails: {}", e.what());
        }
        reopened->save(core::Path("hello-no-settings.odt"));
        EXAMPLE_INFO("   Saved hello-no-settings.odt");
    } catch (const core::OdfPackException& e) {
        EXAMPLE_ERROR("Error: {}", e.getDetailedMessage());
        odfpack::cleanup();
        return 1;
    }
    
    odfpack::cleanup();
    return 0;
}
