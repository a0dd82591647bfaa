#pragma once

#include "odfpack/archive/ZipWriter.hpp"
#include "odfpack/core/Exception.hpp"
#include "odfpack/core/Path.hpp"
#include "odfpack/utils/Logger.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace odfpack {
namespace test {

inline const std::string kTextMimetype = "application/vnd.oasis.opendocument.text";

inline const std::string kContentXml =
    "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
    "<office:document-content xmlns:office=\"urn:oasis:names:tc:opendocument:xmlns:office:1.0\" "
    "office:version=\"1.2\"><office:body><office:text/></office:body></office:document-content>";
inline const std::string kStylesXml =
    "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
    "<office:document-styles xmlns:office=\"urn:oasis:names:tc:opendocument:xmlns:office:1.0\"/>";
inline const std::string kMetaXml =
    "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
    "<office:document-meta xmlns:office=\"urn:oasis:names:tc:opendocument:xmlns:office:1.0\"/>";
inline const std::string kSettingsXml =
    "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
    "<office:document-settings xmlns:office=\"urn:oasis:names:tc:opendocument:xmlns:office:1.0\"/>";

inline std::string manifestXml(const std::string& mimetype) {
    return "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
           "<manifest:manifest xmlns:manifest=\"urn:oasis:names:tc:opendocument:xmlns:manifest:1.0\" "
           "manifest:version=\"1.2\">\n"
           " <manifest:file-entry manifest:full-path=\"/\" manifest:version=\"1.2\" manifest:media-type=\"" +
           mimetype + "\"/>\n"
           " <manifest:file-entry manifest:full-path=\"content.xml\" manifest:media-type=\"text/xml\"/>\n"
           " <manifest:file-entry manifest:full-path=\"styles.xml\" manifest:media-type=\"text/xml\"/>\n"
           " <manifest:file-entry manifest:full-path=\"meta.xml\" manifest:media-type=\"text/xml\"/>\n"
           " <manifest:file-entry manifest:full-path=\"settings.xml\" manifest:media-type=\"text/xml\"/>\n"
           "</manifest:manifest>\n";
}

using PartList = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief 最小 ODF 文档的部件（mimetype 在前）
 */
inline PartList minimalParts(const std::string& mimetype = kTextMimetype) {
    return {
        {"mimetype", mimetype},
        {"content.xml", kContentXml},
        {"styles.xml", kStylesXml},
        {"meta.xml", kMetaXml},
        {"settings.xml", kSettingsXml},
        {"META-INF/manifest.xml", manifestXml(mimetype)},
    };
}

/**
 * @brief 按给定顺序写一个 ZIP，mimetype 不压缩
 */
inline void writeZip(const std::string& path, const PartList& parts) {
    archive::ZipWriter writer{core::Path(path)};
    ASSERT_TRUE(writer.open());
    for (const auto& [name, data] : parts) {
        auto method = name == "mimetype" ? archive::ZipWriter::Method::Store
                                         : archive::ZipWriter::Method::Deflate;
        ASSERT_EQ(writer.addFile(name, data, method), archive::ZipError::Ok);
    }
    ASSERT_TRUE(writer.close());
}

/**
 * @brief 生成含同名条目的 ZIP（写入时用同长度占位名，再改回原名）
 *
 * 返回的归档中 parts 之后依次是 name=first、name=second 两个条目，均不压缩。
 */
inline std::string zipWithDuplicateEntry(const PartList& parts, const std::string& name,
                                         const std::string& first, const std::string& second) {
    std::string placeholder = name;
    placeholder.back() = '#';
    
    archive::ZipWriter writer;
    EXPECT_TRUE(writer.open());
    for (const auto& [part, data] : parts) {
        EXPECT_EQ(writer.addFile(part, data, archive::ZipWriter::Method::Store), archive::ZipError::Ok);
    }
    EXPECT_EQ(writer.addFile(name, first, archive::ZipWriter::Method::Store), archive::ZipError::Ok);
    EXPECT_EQ(writer.addFile(placeholder, second, archive::ZipWriter::Method::Store), archive::ZipError::Ok);
    EXPECT_TRUE(writer.close());
    
    std::string buffer = writer.getBuffer();
    for (size_t pos = buffer.find(placeholder); pos != std::string::npos;
         pos = buffer.find(placeholder, pos + placeholder.size())) {
        buffer.replace(pos, placeholder.size(), name);
    }
    return buffer;
}

inline std::string readFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

inline void writeFile(const std::filesystem::path& path, const std::string& data) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << data;
}

/**
 * @brief 每个测试使用独立的临时目录
 */
class ScratchDirTest : public ::testing::Test {
protected:
    void SetUp() override {
        odfpack::Logger::getInstance().initialize("", odfpack::Logger::Level::WARN, false);
        core::ErrorManager::getInstance().resetStatistics();
        
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        scratch_ = std::filesystem::temp_directory_path() /
                   (std::string("odfpack_") + info->test_suite_name() + "_" + info->name());
        std::filesystem::remove_all(scratch_);
        std::filesystem::create_directories(scratch_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(scratch_, ec);
    }

    std::string scratch(const std::string& name) const {
        return (scratch_ / name).generic_string();
    }

    size_t warningCount() const {
        return core::ErrorManager::getInstance().getStatistics().total_warnings;
    }

    std::filesystem::path scratch_;
};

}} // namespace odfpack::test
