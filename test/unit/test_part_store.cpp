#include "odfpack/package/PartStore.hpp"
#include <gtest/gtest.h>

namespace odfpack {
namespace package {

TEST(PartStoreTest, NormalizePartPath) {
    EXPECT_EQ(normalizePartPath("content.xml"), "content.xml");
    EXPECT_EQ(normalizePartPath("Pictures\\a.png"), "Pictures/a.png");
    EXPECT_EQ(normalizePartPath("./META-INF//manifest.xml"), "META-INF/manifest.xml");
    EXPECT_EQ(normalizePartPath("/styles.xml"), "styles.xml");
    EXPECT_EQ(normalizePartPath("Configurations2/"), "Configurations2/");
    EXPECT_TRUE(isDirectoryPart("Configurations2/"));
    EXPECT_FALSE(isDirectoryPart("mimetype"));
    EXPECT_FALSE(isDirectoryPart(""));
}

TEST(PartStoreTest, SafePartPathRejectsParentSegments) {
    EXPECT_TRUE(isSafePartPath("content.xml"));
    EXPECT_TRUE(isSafePartPath("Pictures/..png"));
    EXPECT_TRUE(isSafePartPath("Configurations2/"));
    EXPECT_FALSE(isSafePartPath(""));
    EXPECT_FALSE(isSafePartPath("/"));
    EXPECT_FALSE(isSafePartPath(".."));
    EXPECT_FALSE(isSafePartPath("../escaped.txt"));
    EXPECT_FALSE(isSafePartPath("Pictures\\..\\..\\x"));
    EXPECT_FALSE(isSafePartPath("a/b/../../../x"));
    EXPECT_FALSE(isSafePartPath("dir/../"));
}

TEST(PartStoreTest, AbsentLoadedDeletedAreDistinct) {
    PartStore store;
    EXPECT_EQ(store.find("content.xml"), nullptr);
    EXPECT_FALSE(store.contains("content.xml"));
    EXPECT_FALSE(store.isDeleted("content.xml"));
    
    store.setCached("content.xml", "<a/>", 42);
    const PartEntry* entry = store.find("content.xml");
    ASSERT_NE(entry, nullptr);
    EXPECT_TRUE(entry->isLoaded());
    EXPECT_EQ(entry->data, "<a/>");
    EXPECT_EQ(entry->timestamp, 42);
    EXPECT_FALSE(entry->pinned);
    
    store.markDeleted("content.xml");
    EXPECT_TRUE(store.contains("content.xml"));
    EXPECT_TRUE(store.isDeleted("content.xml"));
    EXPECT_TRUE(store.find("content.xml")->data.empty());
    
    EXPECT_TRUE(store.erase("content.xml"));
    EXPECT_FALSE(store.contains("content.xml"));
    EXPECT_FALSE(store.erase("content.xml"));
}

TEST(PartStoreTest, SetLoadedPinsAndRevivesDeletedPart) {
    PartStore store;
    store.markDeleted("meta.xml");
    store.setLoaded("meta.xml", "<meta/>");
    
    const PartEntry* entry = store.find("meta.xml");
    ASSERT_NE(entry, nullptr);
    EXPECT_TRUE(entry->isLoaded());
    EXPECT_TRUE(entry->pinned);
    EXPECT_EQ(entry->timestamp, -1);
}

TEST(PartStoreTest, PathsAreNormalizedOnEveryAccess) {
    PartStore store;
    store.setLoaded("Pictures\\logo.png", "png");
    EXPECT_TRUE(store.contains("Pictures/logo.png"));
    EXPECT_TRUE(store.contains("./Pictures//logo.png"));
    
    store.markDeleted("/Pictures/logo.png");
    EXPECT_TRUE(store.isDeleted("Pictures/logo.png"));
}

TEST(PartStoreTest, KeysAreSortedAndIncludeDeleted) {
    PartStore store;
    store.setLoaded("styles.xml", "s");
    store.setLoaded("content.xml", "c");
    store.markDeleted("meta.xml");
    
    std::vector<std::string> expected = {"content.xml", "meta.xml", "styles.xml"};
    EXPECT_EQ(store.keys(), expected);
    EXPECT_EQ(store.size(), 3u);
    
    store.clear();
    EXPECT_TRUE(store.empty());
}

TEST(PartStoreTest, CloneIsIndependent) {
    PartStore original;
    original.setCached("content.xml", "v1", 10);
    original.markDeleted("meta.xml");
    
    PartStore copy = original.clone();
    ASSERT_EQ(copy.size(), 2u);
    EXPECT_TRUE(copy.isDeleted("meta.xml"));
    EXPECT_EQ(copy.find("content.xml")->timestamp, 10);
    
    copy.setLoaded("content.xml", "v2");
    copy.setLoaded("meta.xml", "restored");
    EXPECT_EQ(original.find("content.xml")->data, "v1");
    EXPECT_TRUE(original.isDeleted("meta.xml"));
}

}} // namespace odfpack::package
