#include "core/patterncatalog.hpp"
#include "core/errors.hpp"
#include "test_config.h"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace cleanbook::core;
namespace fs = std::filesystem;

namespace {
    const char* CATALOG = R"({
        "caches": {
            "generic": ["*.cache", ".cache"],
            "ide": ["*.swp"]
        },
        "build_artifacts": {
            "javascript": ["node_modules"],
            "everything": ["*"]
        },
        "size_thresholds": {"minimum_file_size": "1MB"},
        "system_exclusions": {"paths": ["/System"]}
    })";
}

TEST(PatternCatalogTest, ReservedKeysAreNotCategories) {
    auto catalog = PatternCatalog::parse(CATALOG);

    ASSERT_EQ(catalog.categoryCount(), 2u);
    EXPECT_EQ(catalog.categories()[0].name, "caches");
    EXPECT_EQ(catalog.categories()[1].name, "build_artifacts");
    EXPECT_EQ(catalog.patternCount(), 5u);
}

TEST(PatternCatalogTest, FirstMatchInFileOrderWins) {
    auto catalog = PatternCatalog::parse(CATALOG);

    auto cache = catalog.match("app.cache");
    ASSERT_TRUE(cache.has_value());
    EXPECT_EQ(cache->qualifiedCategory(), "caches.generic");
    EXPECT_EQ(cache->pattern, "*.cache");

    // Matches both javascript and the catch-all; javascript comes first
    auto modules = catalog.match("node_modules");
    ASSERT_TRUE(modules.has_value());
    EXPECT_EQ(modules->qualifiedCategory(), "build_artifacts.javascript");

    auto other = catalog.match("README.md");
    ASSERT_TRUE(other.has_value());
    EXPECT_EQ(other->qualifiedCategory(), "build_artifacts.everything");
}

TEST(PatternCatalogTest, NoMatchWithoutCatchAll) {
    auto catalog = PatternCatalog::parse(R"({"caches": {"generic": ["*.cache"]}})");
    EXPECT_FALSE(catalog.match("b.txt").has_value());
    EXPECT_TRUE(catalog.match(".cache").has_value());
}

TEST(PatternCatalogTest, MalformedCatalogsThrow) {
    EXPECT_THROW(PatternCatalog::parse("{not json"), ConfigError);
    EXPECT_THROW(PatternCatalog::parse("[1, 2]"), ConfigError);
    EXPECT_THROW(PatternCatalog::parse(R"({"caches": ["*.cache"]})"), ConfigError);
    EXPECT_THROW(PatternCatalog::parse(R"({"caches": {"generic": "*.cache"}})"), ConfigError);
    EXPECT_THROW(PatternCatalog::parse(R"({"caches": {"generic": [1]}})"), ConfigError);
}

TEST(PatternCatalogTest, LoadFromFile) {
    fs::path dir = fs::path(TEST_OUTPUT_DIR) / "patterncatalog";
    fs::create_directories(dir);
    fs::path file = dir / "patterns.json";
    {
        std::ofstream out(file);
        out << CATALOG;
    }

    auto catalog = PatternCatalog::loadFromFile(file);
    EXPECT_EQ(catalog.categoryCount(), 2u);

    EXPECT_THROW(PatternCatalog::loadFromFile(dir / "missing.json"), ConfigError);
    fs::remove_all(dir);
}
