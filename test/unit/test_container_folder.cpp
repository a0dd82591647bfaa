#include "odfpack/package/Container.hpp"
#include "odfpack/package/FolderBackend.hpp"
#include "odfpack/archive/ZipReader.hpp"
#include "odfpack/core/Exception.hpp"
#include "OdfTestSupport.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>
#include <sstream>

namespace odfpack {
namespace package {

namespace fs = std::filesystem;

class ContainerFolderTest : public test::ScratchDirTest {
protected:
    void SetUp() override {
        test::ScratchDirTest::SetUp();
        odt_path_ = scratch("minimal.odt");
        test::writeZip(odt_path_, test::minimalParts());
    }

    // 把最小文档展开为 <name>.folder
    fs::path makeFolder(const std::string& name) {
        fs::path folder = scratch_ / (name + ".folder");
        for (const auto& [part, data] : test::minimalParts()) {
            test::writeFile(folder / part, data);
        }
        return folder;
    }

    // 修改文件内容并显式设置 mtime，避免同一秒内的写入无法区分
    static void rewrite(const fs::path& file, const std::string& data, fs::file_time_type mtime) {
        test::writeFile(file, data);
        fs::last_write_time(file, mtime);
    }

    std::string odt_path_;
};

TEST_F(ContainerFolderTest, SaveAsFolderWritesEveryPart) {
    Container container{core::Path(odt_path_)};
    EXPECT_EQ(container.mimetype(), test::kTextMimetype);
    
    Container::SaveOptions options;
    options.packaging = "folder";
    container.save(core::Path(scratch("out")), options);
    
    const fs::path folder = scratch_ / "out.folder";
    for (const char* name : {"mimetype", "content.xml", "meta.xml", "styles.xml", "settings.xml",
                             "META-INF/manifest.xml"}) {
        EXPECT_TRUE(fs::is_regular_file(folder / name)) << name;
    }
    EXPECT_EQ(test::readFile(folder / "mimetype"), test::kTextMimetype);
    EXPECT_EQ(test::readFile(folder / "content.xml"), test::kContentXml);
    
    auto perms = fs::status(folder / "content.xml").permissions();
    EXPECT_EQ(perms & fs::perms::all, static_cast<fs::perms>(0666));
}

TEST_F(ContainerFolderTest, OpenFolder) {
    const fs::path folder = makeFolder("doc");
    test::writeFile(folder / ".hidden", "skip me");
    fs::create_directories(folder / "Configurations2" / "toolbar");
    fs::create_directories(folder / "Pictures");
    test::writeFile(folder / "Pictures" / "a.png", "png");
    
    Container container{core::Path(folder)};
    EXPECT_EQ(container.packaging(), Packaging::Folder);
    EXPECT_EQ(container.mimetype(), test::kTextMimetype);
    EXPECT_EQ(container.getPart("styles.xml").value(), test::kStylesXml);
    EXPECT_EQ(container.getPart("Configurations2/toolbar/").value(), "");
    EXPECT_FALSE(container.getPart("missing.xml").has_value());
    
    std::vector<std::string> expected = {"Configurations2/toolbar/", "META-INF/manifest.xml",
                                         "Pictures/a.png", "content.xml", "meta.xml",
                                         "mimetype", "settings.xml", "styles.xml"};
    EXPECT_EQ(container.getParts(), expected);
}

TEST_F(ContainerFolderTest, ListingReflectsDiskChanges) {
    const fs::path folder = makeFolder("live");
    Container container{core::Path(folder)};
    EXPECT_EQ(container.getParts().size(), 6u);
    
    test::writeFile(folder / "Pictures" / "new.png", "png");
    fs::remove(folder / "settings.xml");
    
    auto parts = container.getParts();
    EXPECT_EQ(parts.size(), 6u);
    EXPECT_NE(std::find(parts.begin(), parts.end(), "Pictures/new.png"), parts.end());
    EXPECT_EQ(std::find(parts.begin(), parts.end(), "settings.xml"), parts.end());
}

TEST_F(ContainerFolderTest, ChangedFileIsReRead) {
    const fs::path folder = makeFolder("cache");
    const fs::path content = folder / "content.xml";
    
    Container container{core::Path(folder)};
    ASSERT_EQ(container.getPart("content.xml").value(), test::kContentXml);
    
    const auto original_mtime = fs::last_write_time(content);
    rewrite(content, "<edited/>", original_mtime + std::chrono::seconds(10));
    
    EXPECT_EQ(container.getPart("content.xml").value(), "<edited/>");
    EXPECT_EQ(container.getPart("content.xml").value(), "<edited/>");
}

TEST_F(ContainerFolderTest, UnchangedMtimeReturnsCachedBytes) {
    const fs::path folder = makeFolder("cache");
    const fs::path content = folder / "content.xml";
    
    Container container{core::Path(folder)};
    ASSERT_EQ(container.getPart("content.xml").value(), test::kContentXml);
    
    // 内容变化但 mtime 保持不变：不会重新读取
    const auto original_mtime = fs::last_write_time(content);
    rewrite(content, "<sneaky/>", original_mtime);
    
    EXPECT_EQ(container.getPart("content.xml").value(), test::kContentXml);
}

TEST_F(ContainerFolderTest, VanishedFileKeepsCachedBytes) {
    const fs::path folder = makeFolder("vanish");
    Container container{core::Path(folder)};
    ASSERT_EQ(container.getPart("meta.xml").value(), test::kMetaXml);
    
    fs::remove(folder / "meta.xml");
    EXPECT_EQ(container.getPart("meta.xml").value(), test::kMetaXml);
}

TEST_F(ContainerFolderTest, ExplicitValueWinsOverDisk) {
    const fs::path folder = makeFolder("pinned");
    const fs::path content = folder / "content.xml";
    
    Container container{core::Path(folder)};
    container.setPart("content.xml", "<mine/>");
    rewrite(content, "<disk/>", fs::last_write_time(content) + std::chrono::seconds(10));
    
    EXPECT_EQ(container.getPart("content.xml").value(), "<mine/>");
}

TEST_F(ContainerFolderTest, MissingMimetypeFallsBackToText) {
    const fs::path folder = makeFolder("nomime");
    fs::remove(folder / "mimetype");
    
    const size_t before = warningCount();
    Container container{core::Path(folder)};
    EXPECT_EQ(warningCount() - before, 1u);
    EXPECT_EQ(container.mimetype(), test::kTextMimetype);
}

TEST_F(ContainerFolderTest, UnknownFolderMimetypeIsRejected) {
    const fs::path folder = makeFolder("badmime");
    test::writeFile(folder / "mimetype", "text/html");
    EXPECT_THROW(Container{core::Path(folder)}, core::FormatException);
}

TEST_F(ContainerFolderTest, CrossFormatRoundTrip) {
    Container::SaveOptions to_folder;
    to_folder.packaging = "folder";
    {
        Container container{core::Path(odt_path_)};
        container.save(core::Path(scratch("trip")), to_folder);
    }
    
    Container::SaveOptions to_zip;
    to_zip.packaging = "zip";
    {
        Container folder{core::Path(scratch("trip.folder"))};
        EXPECT_EQ(folder.packaging(), Packaging::Folder);
        folder.save(core::Path(scratch("trip.odt")), to_zip);
    }
    
    archive::ZipReader reader{core::Path(scratch("trip.odt"))};
    ASSERT_TRUE(reader.open());
    ASSERT_FALSE(reader.listEntriesInfo().empty());
    EXPECT_EQ(reader.listEntriesInfo().front().path, "mimetype");
    EXPECT_EQ(reader.listEntriesInfo().front().compression_method, 0);
    
    Container reopened{core::Path(scratch("trip.odt"))};
    Container original{core::Path(odt_path_)};
    EXPECT_EQ(reopened.mimetype(), original.mimetype());
    for (const char* name : {"content.xml", "meta.xml", "styles.xml", "settings.xml"}) {
        EXPECT_EQ(reopened.getPart(name), original.getPart(name)) << name;
    }
}

TEST_F(ContainerFolderTest, FolderSuffixIsNotDuplicated) {
    Container container{core::Path(odt_path_)};
    Container::SaveOptions options;
    options.packaging = "folder";
    container.save(core::Path(scratch("name.folder/")), options);
    container.save(core::Path(scratch("name.folder.folder")), options);
    
    EXPECT_TRUE(fs::is_directory(scratch_ / "name.folder"));
    EXPECT_FALSE(fs::exists(scratch_ / "name.folder.folder"));
}

TEST_F(ContainerFolderTest, FolderSaveIsCleanOverwrite) {
    const fs::path folder = makeFolder("target");
    test::writeFile(folder / "stale.txt", "left over");
    
    Container container{core::Path(odt_path_)};
    Container::SaveOptions options;
    options.packaging = "folder";
    container.save(core::Path(scratch("target")), options);
    
    EXPECT_FALSE(fs::exists(folder / "stale.txt"));
    EXPECT_TRUE(fs::exists(folder / "content.xml"));
}

TEST_F(ContainerFolderTest, FolderBackupKeepsPreviousTree) {
    const fs::path folder = makeFolder("kept");
    test::writeFile(folder / "old.txt", "previous");
    
    const fs::path old_backup = scratch_ / "kept.backup.folder";
    test::writeFile(old_backup / "ancient.txt", "older");
    
    Container container{core::Path(odt_path_)};
    Container::SaveOptions options;
    options.packaging = "folder";
    options.backup = true;
    container.save(core::Path(scratch("kept")), options);
    
    EXPECT_TRUE(fs::exists(old_backup / "old.txt"));
    EXPECT_FALSE(fs::exists(old_backup / "ancient.txt"));
    EXPECT_FALSE(fs::exists(folder / "old.txt"));
    EXPECT_TRUE(fs::exists(folder / "mimetype"));
}

TEST_F(ContainerFolderTest, DirectoryPartsRoundTrip) {
    Container container;
    container.setMimetype(test::kTextMimetype);
    container.setPart("Configurations2/accelerator/", "");
    container.setPart("content.xml", test::kContentXml);
    
    Container::SaveOptions options;
    options.packaging = "folder";
    container.save(core::Path(scratch("dirs")), options);
    EXPECT_TRUE(fs::is_directory(scratch_ / "dirs.folder" / "Configurations2" / "accelerator"));
    
    Container reopened{core::Path(scratch("dirs.folder"))};
    auto parts = reopened.getParts();
    EXPECT_NE(std::find(parts.begin(), parts.end(), "Configurations2/accelerator/"), parts.end());
}

TEST_F(ContainerFolderTest, SaveReloadsStalePartsFirst) {
    const fs::path folder = makeFolder("stale");
    const fs::path content = folder / "content.xml";
    
    Container container{core::Path(folder)};
    ASSERT_EQ(container.getPart("content.xml").value(), test::kContentXml);
    rewrite(content, "<latest/>", fs::last_write_time(content) + std::chrono::seconds(10));
    
    container.save(core::Path(scratch("stale.odt")), Container::SaveOptions{"zip", false});
    Container saved{core::Path(scratch("stale.odt"))};
    EXPECT_EQ(saved.getPart("content.xml").value(), "<latest/>");
}

TEST_F(ContainerFolderTest, FolderCannotBeSavedToStream) {
    const fs::path folder = makeFolder("stream");
    Container container{core::Path(folder)};
    std::ostringstream out;
    try {
        container.save(out);
        FAIL() << "expected OperationException";
    } catch (const core::OperationException& e) {
        EXPECT_EQ(e.getErrorCode(), core::ErrorCode::UnsupportedTarget);
    }
    
    Container::SaveOptions options;
    options.packaging = "zip";
    container.save(out, options);
    EXPECT_TRUE(archive::ZipReader::isZipData(out.str()));
}

TEST_F(ContainerFolderTest, CloneLoadsEveryPart) {
    const fs::path folder = makeFolder("clone");
    Container container{core::Path(folder)};
    auto copy = container.clone();
    
    EXPECT_EQ(copy->packaging(), Packaging::Folder);
    EXPECT_EQ(copy->getParts().size(), 6u);
    
    fs::remove_all(folder);
    EXPECT_EQ(copy->getPart("styles.xml").value(), test::kStylesXml);
}

TEST_F(ContainerFolderTest, PartTimestampProbe) {
    const fs::path folder = makeFolder("probe");
    FolderBackend backend{core::Path(folder)};
    EXPECT_GT(backend.partTimestamp("content.xml"), 0);
    EXPECT_EQ(backend.partTimestamp("absent.xml"), -1);
    EXPECT_FALSE(backend.isStale("absent.xml", 5));
    EXPECT_TRUE(backend.isStale("content.xml", -1));
    EXPECT_FALSE(backend.isStale("content.xml", backend.partTimestamp("content.xml")));
}

TEST_F(ContainerFolderTest, ParentSegmentsStayInsideTarget) {
    auto parts = test::minimalParts();
    parts.insert(parts.end() - 1, {"../escaped.txt", "outside"});
    parts.insert(parts.end() - 1, {"Pictures/../../deep.txt", "outside"});
    const std::string hostile = scratch("hostile.odt");
    test::writeZip(hostile, parts);
    
    fs::create_directories(scratch_ / "nested");
    
    Container container{core::Path(hostile)};
    Container::SaveOptions options;
    options.packaging = "folder";
    container.save(core::Path(scratch("nested/out")), options);
    
    EXPECT_TRUE(fs::is_regular_file(scratch_ / "nested" / "out.folder" / "content.xml"));
    EXPECT_FALSE(fs::exists(scratch_ / "nested" / "escaped.txt"));
    EXPECT_FALSE(fs::exists(scratch_ / "nested" / "deep.txt"));
    EXPECT_EQ(warningCount(), 2u);
}

TEST_F(ContainerFolderTest, ParentSegmentsAreNotReadFromDisk) {
    const fs::path folder = makeFolder("doc");
    test::writeFile(scratch_ / "secret.txt", "outside");
    
    FolderBackend backend{core::Path(folder.generic_string())};
    EXPECT_FALSE(backend.readPart("../secret.txt").has_value());
    EXPECT_EQ(backend.partTimestamp("../secret.txt"), -1);
    
    Container container{core::Path(folder.generic_string())};
    EXPECT_FALSE(container.getPart("../secret.txt").has_value());
    EXPECT_THROW(container.setPart("../secret.txt", "x"), core::ParameterException);
    EXPECT_THROW(container.setPart("", "x"), core::ParameterException);
}

}} // namespace odfpack::package
