#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace odfpack {
namespace core {

// 通用常量集中定义
struct Constants {
    // 部件名
    static constexpr const char* kMimetypePart = "mimetype";
    static constexpr const char* kContentPart = "content.xml";
    static constexpr const char* kMetaPart = "meta.xml";
    static constexpr const char* kSettingsPart = "settings.xml";
    static constexpr const char* kStylesPart = "styles.xml";
    static constexpr const char* kManifestPart = "META-INF/manifest.xml";
    static constexpr const char* kManifestRdfPart = "manifest.rdf";
    
    // 文件夹打包
    static constexpr const char* kFolderSuffix = ".folder";
    static constexpr const char* kBackupInfix = ".backup";
    static constexpr unsigned int kFolderFileMode = 0666;
    
    static constexpr const char* kDefaultDocumentType = "odt";
    static constexpr std::string_view kTemplateSuffix = "-template";
    
    static constexpr size_t kIOBufferSize = 8192;
};

/**
 * @brief 文档扩展名与 mimetype 的对应关系
 */
struct OdfDocumentType {
    const char* extension;
    const char* mimetype;
};

inline constexpr OdfDocumentType kOdfDocumentTypes[] = {
    {"odt", "application/vnd.oasis.opendocument.text"},
    {"ott", "application/vnd.oasis.opendocument.text-template"},
    {"ods", "application/vnd.oasis.opendocument.spreadsheet"},
    {"ots", "application/vnd.oasis.opendocument.spreadsheet-template"},
    {"odp", "application/vnd.oasis.opendocument.presentation"},
    {"otp", "application/vnd.oasis.opendocument.presentation-template"},
    {"odg", "application/vnd.oasis.opendocument.graphics"},
    {"otg", "application/vnd.oasis.opendocument.graphics-template"},
    {"odc", "application/vnd.oasis.opendocument.chart"},
    {"otc", "application/vnd.oasis.opendocument.chart-template"},
    {"odf", "application/vnd.oasis.opendocument.formula"},
    {"otf", "application/vnd.oasis.opendocument.formula-template"},
    {"odi", "application/vnd.oasis.opendocument.image"},
    {"oti", "application/vnd.oasis.opendocument.image-template"},
    {"odm", "application/vnd.oasis.opendocument.text-master"},
    {"oth", "application/vnd.oasis.opendocument.text-web"},
};

/**
 * @brief 是否为已知的 ODF mimetype
 */
inline bool isKnownMimetype(std::string_view mimetype) {
    for (const auto& type : kOdfDocumentTypes) {
        if (mimetype == type.mimetype) {
            return true;
        }
    }
    return false;
}

/**
 * @brief 根据扩展名（不带点）查找 mimetype
 * @return 未知扩展名返回空字符串
 */
inline std::string mimetypeForExtension(std::string_view extension) {
    for (const auto& type : kOdfDocumentTypes) {
        if (extension == type.extension) {
            return type.mimetype;
        }
    }
    return std::string();
}

} // namespace core
} // namespace odfpack
