#include "odfpack/OdfPack.hpp"
#include "odfpack/xml/XMLStreamReader.hpp"
#include "OdfTestSupport.hpp"
#include <gtest/gtest.h>
#include <iterator>

namespace odfpack {
namespace package {

class ContainerMemoryTest : public test::ScratchDirTest {};

TEST_F(ContainerMemoryTest, EmptyContainer) {
    Container container;
    EXPECT_FALSE(container.isPathBound());
    EXPECT_TRUE(container.path().empty());
    EXPECT_EQ(container.packaging(), Packaging::Zip);
    EXPECT_TRUE(container.getParts().empty());
    EXPECT_EQ(container.mimetype(), "");
    EXPECT_FALSE(container.getPart("content.xml").has_value());
}

TEST_F(ContainerMemoryTest, SetGetDelete) {
    Container container;
    container.setPart("content.xml", "<doc/>");
    container.setPart("Pictures\\img.png", "png");
    EXPECT_EQ(container.getPart("content.xml").value(), "<doc/>");
    EXPECT_EQ(container.getPart("Pictures/img.png").value(), "png");
    
    container.delPart("content.xml");
    EXPECT_THROW(container.getPart("content.xml"), core::PartException);
    // 删除只影响该部件，容器仍可使用
    EXPECT_EQ(container.getPart("Pictures/img.png").value(), "png");
    
    // 内存容器的列举直接来自存储，已删除的部件仍在键中
    std::vector<std::string> expected = {"Pictures/img.png", "content.xml"};
    EXPECT_EQ(container.getParts(), expected);
}

TEST_F(ContainerMemoryTest, MimetypeProperty) {
    Container container;
    container.setMimetype("application/vnd.oasis.opendocument.spreadsheet");
    EXPECT_EQ(container.mimetype(), "application/vnd.oasis.opendocument.spreadsheet");
    EXPECT_EQ(container.getPart("mimetype").value(), "application/vnd.oasis.opendocument.spreadsheet");
    
    container.delPart("mimetype");
    EXPECT_THROW(container.mimetype(), core::PartException);
    EXPECT_EQ(container.toString(), "<Container type=<deleted> path=None>");
    
    container.setMimetype("application/vnd.oasis.opendocument.text");
    EXPECT_EQ(container.mimetype(), "application/vnd.oasis.opendocument.text");
}

TEST_F(ContainerMemoryTest, SaveWithoutAnyTargetFails) {
    Container container;
    container.setMimetype(test::kTextMimetype);
    try {
        container.save();
        FAIL() << "expected ParameterException";
    } catch (const core::ParameterException& e) {
        EXPECT_EQ(e.getParameterName(), "target");
    }
}

TEST_F(ContainerMemoryTest, BuildDocumentFromScratch) {
    auto document = createDocument();
    for (const auto& [name, data] : test::minimalParts()) {
        document->setPart(name, data);
    }
    document->setPart(core::Constants::kManifestRdfPart, Container::defaultManifestRdf());
    
    const std::string out = scratch("scratch.odt");
    const size_t before = warningCount();
    document->save(core::Path(out));
    EXPECT_EQ(warningCount(), before);
    
    auto reopened = openDocument(core::Path(out));
    EXPECT_EQ(reopened->mimetype(), test::kTextMimetype);
    EXPECT_EQ(reopened->getPart("manifest.rdf").value(), Container::defaultManifestRdf());
}

TEST_F(ContainerMemoryTest, MoveTransfersState) {
    Container source;
    source.setPart("content.xml", "<moved/>");
    
    Container target(std::move(source));
    EXPECT_EQ(target.getPart("content.xml").value(), "<moved/>");
}

TEST_F(ContainerMemoryTest, FromTemplate) {
    const std::string ott = scratch("letter.ott");
    test::writeZip(ott, test::minimalParts("application/vnd.oasis.opendocument.text-template"));
    
    auto document = Container::fromTemplate(core::Path(ott));
    EXPECT_FALSE(document->isPathBound());
    EXPECT_EQ(document->mimetype(), test::kTextMimetype);
    
    auto manifest = xml::Manifest::parse(document->getPart("META-INF/manifest.xml").value());
    EXPECT_EQ(manifest.getMediaType("/").value(), test::kTextMimetype);
    EXPECT_EQ(manifest.getMediaType("content.xml").value(), "text/xml");
    
    const std::string out = scratch("letter.odt");
    document->save(core::Path(out));
    Container saved{core::Path(out)};
    EXPECT_EQ(saved.mimetype(), test::kTextMimetype);
    
    // 模板本身不受影响
    Container original{core::Path(ott)};
    EXPECT_EQ(original.mimetype(), "application/vnd.oasis.opendocument.text-template");
}

TEST_F(ContainerMemoryTest, DefaultManifestRdf) {
    const std::string rdf = Container::defaultManifestRdf();
    EXPECT_EQ(rdf.rfind("<?xml version=\"1.0\" encoding=\"utf-8\"?>\n", 0), 0u);
    EXPECT_NE(rdf.find("http://docs.oasis-open.org/ns/office/1.2/meta/odf#StylesFile"), std::string::npos);
    EXPECT_NE(rdf.find("http://docs.oasis-open.org/ns/office/1.2/meta/odf#ContentFile"), std::string::npos);
    EXPECT_NE(rdf.find("http://docs.oasis-open.org/ns/office/1.2/meta/pkg#Document"), std::string::npos);
    
    xml::XMLStreamReader reader;
    EXPECT_EQ(reader.parseFromString(rdf), xml::XMLParseError::Ok);
}

TEST(PackagingTest, ParseAndFormat) {
    EXPECT_EQ(parsePackaging("zip"), Packaging::Zip);
    EXPECT_EQ(parsePackaging(" Folder\n"), Packaging::Folder);
    EXPECT_STREQ(toString(Packaging::Zip), "zip");
    EXPECT_STREQ(toString(Packaging::Folder), "folder");
    EXPECT_THROW(parsePackaging("flat"), core::ParameterException);
    EXPECT_THROW(parsePackaging(""), core::ParameterException);
}

TEST(ConstantsTest, MimetypeTable) {
    EXPECT_EQ(core::mimetypeForExtension("odt"), "application/vnd.oasis.opendocument.text");
    EXPECT_EQ(core::mimetypeForExtension("oth"), "application/vnd.oasis.opendocument.text-web");
    EXPECT_EQ(core::mimetypeForExtension("docx"), "");
    EXPECT_TRUE(core::isKnownMimetype("application/vnd.oasis.opendocument.graphics-template"));
    EXPECT_FALSE(core::isKnownMimetype("application/vnd.oasis.opendocument"));
    EXPECT_EQ(std::size(core::kOdfDocumentTypes), 16u);
}

}} // namespace odfpack::package
