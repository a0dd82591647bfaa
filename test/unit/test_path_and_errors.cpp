#include "odfpack/core/Path.hpp"
#include "odfpack/core/ErrorCode.hpp"
#include "odfpack/core/Exception.hpp"
#include "odfpack/utils/Logger.hpp"
#include "odfpack/utils/TimeUtils.hpp"
#include "OdfTestSupport.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace odfpack {
namespace core {

class PathTest : public test::ScratchDirTest {};

TEST_F(PathTest, Components) {
    Path path("docs/report.backup.odt");
    EXPECT_EQ(path.filename(), "report.backup.odt");
    EXPECT_EQ(path.stem(), "report.backup");
    EXPECT_EQ(path.extension(), ".odt");
    EXPECT_EQ(path.parent().string(), "docs");
    EXPECT_EQ((Path("docs") / "a.xml").string(), "docs/a.xml");
    EXPECT_TRUE(Path("relative/x.odt").absolute().native().is_absolute());
}

TEST_F(PathTest, FilesystemOperations) {
    Path dir(scratch("a/b/c"));
    EXPECT_FALSE(dir.exists());
    EXPECT_TRUE(dir.createDirectories());
    EXPECT_TRUE(dir.isDirectory());
    
    Path file = dir / "part.xml";
    test::writeFile(file.native(), "12345");
    EXPECT_TRUE(file.isFile());
    EXPECT_EQ(file.fileSize(), 5u);
    EXPECT_GT(file.lastWriteTime(), 0);
    EXPECT_EQ(Path(scratch("missing")).lastWriteTime(), -1);
    
    Path moved = dir / "moved.xml";
    EXPECT_TRUE(file.moveTo(moved));
    EXPECT_FALSE(file.exists());
    EXPECT_TRUE(moved.exists());
    
    auto children = dir.listDirectory();
    ASSERT_EQ(children.size(), 1u);
    EXPECT_EQ(children[0].filename(), "moved.xml");
    
    EXPECT_TRUE(Path(scratch("a")).removeAll());
    EXPECT_FALSE(dir.exists());
}

TEST(ErrorCodeTest, NamesAndMessages) {
    EXPECT_STREQ(toName(ErrorCode::PartDeleted), "PartDeleted");
    EXPECT_STREQ(toString(ErrorCode::FileNotFound), "File not found");
    
    Error error = makeError(ErrorCode::ZipError, "bad archive", "doc.odt");
    EXPECT_TRUE(error.isError());
    EXPECT_EQ(error.fullMessage(), "bad archive (Context: doc.odt)");
    EXPECT_FALSE(Error().isError());
}

TEST(ExceptionTest, CarriesCodeAndLocation) {
    bool caught = false;
    try {
        ODFPACK_THROW(PartException, "Part is deleted: 'content.xml'", "content.xml",
                      ErrorCode::PartDeleted);
    } catch (const OdfPackException& e) {
        caught = true;
        EXPECT_EQ(e.getErrorCode(), ErrorCode::PartDeleted);
        EXPECT_NE(e.getFile(), nullptr);
        EXPECT_GT(e.getLine(), 0);
        EXPECT_NE(e.getDetailedMessage().find("content.xml"), std::string::npos);
        EXPECT_NE(e.getDetailedMessage().find("[PartDeleted]"), std::string::npos);
    }
    EXPECT_TRUE(caught);
}

TEST(ExceptionTest, ThrowIfOnlyThrowsWhenConditionHolds) {
    EXPECT_NO_THROW(ODFPACK_THROW_IF(false, ParameterException, "unused", "x",
                                     ErrorCode::InvalidArgument));
    EXPECT_THROW(ODFPACK_THROW_IF(true, ParameterException, "bad value", "x",
                                  ErrorCode::InvalidArgument),
                 ParameterException);
}

namespace {

class CollectingWarningHandler : public WarningHandler {
public:
    explicit CollectingWarningHandler(std::vector<std::string>& sink) : sink_(sink) {}
    
    void handleWarning(const std::string& message, const std::string& context) override {
        sink_.push_back(context + ": " + message);
    }

private:
    std::vector<std::string>& sink_;
};

} // namespace

class WarningChannelTest : public test::ScratchDirTest {
protected:
    void TearDown() override {
        ErrorManager::getInstance().setWarningHandler(std::make_unique<StderrWarningHandler>());
        test::ScratchDirTest::TearDown();
    }
};

TEST_F(WarningChannelTest, RoutesToInstalledHandlerAndCounts) {
    std::vector<std::string> seen;
    ErrorManager::getInstance().setWarningHandler(
        std::make_unique<CollectingWarningHandler>(seen));
    
    ODFPACK_HANDLE_WARNING("missing part", "styles.xml");
    ODFPACK_HANDLE_WARNING("missing part", "meta.xml");
    
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], "styles.xml: missing part");
    EXPECT_EQ(warningCount(), 2u);
}

TEST_F(WarningChannelTest, CountsWithoutHandler) {
    ErrorManager::getInstance().setWarningHandler(nullptr);
    ODFPACK_HANDLE_WARNING("dropped", "");
    EXPECT_EQ(warningCount(), 1u);
}

class LoggerTest : public test::ScratchDirTest {
protected:
    void TearDown() override {
        Logger::getInstance().setLevel(Logger::Level::WARN);
        test::ScratchDirTest::TearDown();
    }
};

TEST_F(LoggerTest, LevelIsAdjustableAfterInitialization) {
    Logger& logger = Logger::getInstance();
    EXPECT_TRUE(logger.isInitialized());
    
    logger.setLevel(Logger::Level::ERROR);
    EXPECT_EQ(logger.getLevel(), Logger::Level::ERROR);
    EXPECT_NO_THROW(ODFPACK_LOG_INFO("filtered {}", 1));
    EXPECT_NO_THROW(ODFPACK_LOG_ERROR("emitted {} {}", "to", "file sink"));
}

TEST(TimeUtilsTest, CurrentUnixSecondsMatchesSystemClock) {
    const auto before = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    const int64_t now = utils::TimeUtils::currentUnixSeconds();
    const auto after = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    EXPECT_GE(now, static_cast<int64_t>(before));
    EXPECT_LE(now, static_cast<int64_t>(after));
}

}} // namespace odfpack::core
