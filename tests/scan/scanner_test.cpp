#include "scan/scanner.hpp"
#include "support/recordinglogger.hpp"
#include "support/treebuilder.hpp"
#include "test_config.h"
#include <gtest/gtest.h>
#include <unistd.h>
#include <algorithm>

using namespace cleanbook;
using namespace cleanbook::scan;
using cleanbook::testing::MB;
using cleanbook::testing::RecordingLogger;
using cleanbook::testing::writeFile;

namespace {
    const char* CATALOG = R"({
        "caches": {"generic": ["*.cache"]},
        "build_artifacts": {"javascript": ["node_modules"], "python": ["__pycache__"]}
    })";
}

class ScannerTest : public ::testing::Test {
protected:
    void SetUp() override {
        testOutputPath = fs::path(TEST_OUTPUT_DIR) / "scanner";
        fs::remove_all(testOutputPath);
        fs::create_directories(testOutputPath);
        testOutputPath = fs::canonical(testOutputPath);
        catalog_ = core::PatternCatalog::parse(CATALOG);
    }

    void TearDown() override {
        fs::remove_all(testOutputPath);
    }

    Scanner makeScanner(std::vector<fs::path> whitelist = {}, ScannerOptions options = {},
                        std::shared_ptr<audit::Logger> logger = nullptr) {
        return Scanner(catalog_, Whitelist(whitelist), options, std::move(logger));
    }

    static bool contains(const ScanResult& result, const fs::path& path) {
        return std::any_of(result.artifacts.begin(), result.artifacts.end(),
                           [&](const Artifact& a) { return a.path == path; });
    }

    fs::path testOutputPath;
    core::PatternCatalog catalog_;
};

TEST_F(ScannerTest, FindsMatchingFileAndIgnoresOthers) {
    writeFile(testOutputPath / "a.cache", 2 * MB);
    writeFile(testOutputPath / "b.txt", 2 * MB);

    auto result = makeScanner().scan(testOutputPath, 1.0);

    ASSERT_EQ(result.artifacts.size(), 1u);
    const auto& artifact = result.artifacts[0];
    EXPECT_EQ(artifact.path, testOutputPath / "a.cache");
    EXPECT_EQ(artifact.category, "caches.generic");
    EXPECT_EQ(artifact.pattern, "*.cache");
    EXPECT_EQ(artifact.sizeBytes, 2 * MB);
    EXPECT_DOUBLE_EQ(artifact.sizeMb(), 2.0);
    EXPECT_EQ(artifact.depth, 0);
    EXPECT_TRUE(result.errors.empty());
}

TEST_F(ScannerTest, WhitelistedSubtreeIsNeverReported) {
    writeFile(testOutputPath / "Protected" / "sub" / "app.cache", 2 * MB);
    writeFile(testOutputPath / "Work" / "app.cache", 2 * MB);

    auto logger = std::make_shared<RecordingLogger>();
    auto result = makeScanner({testOutputPath / "Protected"}, {}, logger).scan(testOutputPath);

    EXPECT_FALSE(contains(result, testOutputPath / "Protected" / "sub" / "app.cache"));
    EXPECT_TRUE(contains(result, testOutputPath / "Work" / "app.cache"));
    EXPECT_FALSE(logger->whitelistSkips().empty());
}

TEST_F(ScannerTest, WhitelistedRootYieldsNothing) {
    writeFile(testOutputPath / "a.cache", MB);

    auto result = makeScanner({testOutputPath}).scan(testOutputPath);
    EXPECT_TRUE(result.artifacts.empty());
}

TEST_F(ScannerTest, MatchedSanctuaryIsNotAnArtifact) {
    writeFile(testOutputPath / "keep" / "node_modules" / "x.js", MB);
    writeFile(testOutputPath / "app" / "node_modules" / "y.js", MB);
    writeFile(testOutputPath / "top.cache", MB);

    auto logger = std::make_shared<RecordingLogger>();
    auto scanner = makeScanner({testOutputPath / "keep" / "node_modules",
                                testOutputPath / "top.cache"}, {}, logger);
    auto result = scanner.scan(testOutputPath);

    ASSERT_EQ(result.artifacts.size(), 1u);
    EXPECT_EQ(result.artifacts[0].path, testOutputPath / "app" / "node_modules");
    for (const auto& artifact : result.artifacts) {
        EXPECT_FALSE(scanner.isWhitelisted(artifact.path));
    }

    auto skips = logger->whitelistSkips();
    EXPECT_NE(std::find(skips.begin(), skips.end(), testOutputPath / "keep" / "node_modules"),
              skips.end());
    EXPECT_NE(std::find(skips.begin(), skips.end(), testOutputPath / "top.cache"), skips.end());
}

TEST_F(ScannerTest, MatchedDirectoryIsOneArtifact) {
    writeFile(testOutputPath / "web" / "node_modules" / "left" / "index.cache", MB);
    writeFile(testOutputPath / "web" / "node_modules" / "right.js", MB);

    auto result = makeScanner().scan(testOutputPath);

    ASSERT_EQ(result.artifacts.size(), 1u);
    EXPECT_EQ(result.artifacts[0].path, testOutputPath / "web" / "node_modules");
    EXPECT_EQ(result.artifacts[0].category, "build_artifacts.javascript");
    EXPECT_EQ(result.artifacts[0].sizeBytes, 2 * MB);
    EXPECT_EQ(result.artifacts[0].depth, 1);
}

TEST_F(ScannerTest, ThresholdFiltersAndOrderIsLargestFirst) {
    writeFile(testOutputPath / "p1" / "small.cache", MB / 2);
    writeFile(testOutputPath / "p2" / "big.cache", 3 * MB);
    writeFile(testOutputPath / "p3" / "mid.cache", 2 * MB);
    writeFile(testOutputPath / "p4" / "same.cache", 2 * MB);

    auto result = makeScanner().scan(testOutputPath, 1.0);

    ASSERT_EQ(result.artifacts.size(), 3u);
    EXPECT_EQ(result.artifacts[0].path, testOutputPath / "p2" / "big.cache");
    // Equal sizes are ordered by path
    EXPECT_EQ(result.artifacts[1].path, testOutputPath / "p3" / "mid.cache");
    EXPECT_EQ(result.artifacts[2].path, testOutputPath / "p4" / "same.cache");
}

TEST_F(ScannerTest, RepeatedScansAreIdentical) {
    for (int i = 0; i < 6; ++i) {
        writeFile(testOutputPath / ("proj" + std::to_string(i)) / "__pycache__" / "m.pyc",
                  MB + i * 1000);
        writeFile(testOutputPath / ("proj" + std::to_string(i)) / "x.cache", MB);
    }

    ScannerOptions options;
    options.workers = 3;
    auto scanner = makeScanner({}, options);
    auto first = scanner.scan(testOutputPath);
    auto second = scanner.scan(testOutputPath);

    ASSERT_EQ(first.artifacts.size(), 12u);
    ASSERT_EQ(first.artifacts.size(), second.artifacts.size());
    for (size_t i = 0; i < first.artifacts.size(); ++i) {
        EXPECT_EQ(first.artifacts[i].path, second.artifacts[i].path);
        EXPECT_EQ(first.artifacts[i].sizeBytes, second.artifacts[i].sizeBytes);
        EXPECT_EQ(first.artifacts[i].category, second.artifacts[i].category);
    }
}

TEST_F(ScannerTest, SymlinksAreSkippedByDefault) {
    writeFile(testOutputPath / "outside" / "hidden" / "x.cache", MB);
    fs::create_directories(testOutputPath / "root");
    fs::create_directory_symlink(testOutputPath / "outside", testOutputPath / "root" / "link");
    fs::create_symlink(testOutputPath / "outside" / "hidden" / "x.cache",
                       testOutputPath / "root" / "direct.cache");

    auto result = makeScanner().scan(testOutputPath / "root");
    EXPECT_TRUE(result.artifacts.empty());
}

TEST_F(ScannerTest, FollowedSymlinkCycleTerminates) {
    writeFile(testOutputPath / "root" / "d" / "x.cache", MB);
    fs::create_directory_symlink(testOutputPath / "root" / "d",
                                 testOutputPath / "root" / "d" / "loop");

    ScannerOptions options;
    options.followSymlinks = true;
    auto result = makeScanner({}, options).scan(testOutputPath / "root");

    EXPECT_TRUE(contains(result, testOutputPath / "root" / "d" / "x.cache"));
    EXPECT_EQ(std::count_if(result.artifacts.begin(), result.artifacts.end(),
                            [](const Artifact& a) { return a.path.filename() == "x.cache"; }),
              1);
}

TEST_F(ScannerTest, DepthCapRecordsError) {
    writeFile(testOutputPath / "a" / "b" / "shallow.cache", MB);
    writeFile(testOutputPath / "a" / "b" / "c" / "deep.cache", MB);

    ScannerOptions options;
    options.maxDepth = 2;
    auto result = makeScanner({}, options).scan(testOutputPath);

    EXPECT_TRUE(contains(result, testOutputPath / "a" / "b" / "shallow.cache"));
    EXPECT_FALSE(contains(result, testOutputPath / "a" / "b" / "c" / "deep.cache"));
    ASSERT_FALSE(result.errors.empty());
    EXPECT_EQ(result.errors[0].message, "maximum scan depth exceeded");
}

TEST_F(ScannerTest, MissingRootIsReportedNotThrown) {
    auto result = makeScanner().scan(testOutputPath / "does-not-exist");
    EXPECT_TRUE(result.artifacts.empty());
    ASSERT_EQ(result.errors.size(), 1u);
}

TEST_F(ScannerTest, UnreadableDirectoryIsRecorded) {
    if (geteuid() == 0) {
        GTEST_SKIP() << "permission checks do not apply to root";
    }
    writeFile(testOutputPath / "locked" / "x.cache", MB);
    writeFile(testOutputPath / "open" / "y.cache", MB);
    fs::permissions(testOutputPath / "locked", fs::perms::none);

    auto result = makeScanner().scan(testOutputPath);
    fs::permissions(testOutputPath / "locked", fs::perms::owner_all);

    EXPECT_TRUE(contains(result, testOutputPath / "open" / "y.cache"));
    EXPECT_FALSE(result.errors.empty());
}

TEST_F(ScannerTest, DiscoveriesAreLogged) {
    writeFile(testOutputPath / "a.cache", MB);
    writeFile(testOutputPath / "sub" / "b.cache", MB);

    auto logger = std::make_shared<RecordingLogger>();
    auto result = makeScanner({}, {}, logger).scan(testOutputPath);

    EXPECT_EQ(logger->found().size(), result.artifacts.size());
    EXPECT_EQ(result.artifacts.size(), 2u);
}
