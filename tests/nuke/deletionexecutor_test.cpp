#include "nuke/deletionexecutor.hpp"
#include "support/recordinglogger.hpp"
#include "support/treebuilder.hpp"
#include "test_config.h"
#include <gtest/gtest.h>
#include <chrono>
#include <fstream>

using namespace cleanbook;
using namespace cleanbook::nuke;
using cleanbook::testing::MB;
using cleanbook::testing::RecordingLogger;
using cleanbook::testing::writeFile;

class DeletionExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        testOutputPath = fs::path(TEST_OUTPUT_DIR) / "deletionexecutor";
        fs::remove_all(testOutputPath);
        fs::create_directories(testOutputPath);
        testOutputPath = fs::canonical(testOutputPath);

        logger_ = std::make_shared<RecordingLogger>();
        validator_ = std::make_unique<SafetyValidator>(ProtectedPaths(), logger_);
        executor_ = std::make_unique<DeletionExecutor>(*validator_, logger_);
    }

    void TearDown() override {
        executor_.reset();
        validator_.reset();
        fs::remove_all(testOutputPath);
    }

    fs::path testOutputPath;
    std::shared_ptr<RecordingLogger> logger_;
    std::unique_ptr<SafetyValidator> validator_;
    std::unique_ptr<DeletionExecutor> executor_;
};

TEST_F(DeletionExecutorTest, DryRunMeasuresWithoutDeleting) {
    fs::path file = testOutputPath / "proj" / "a.cache";
    writeFile(file, 2 * MB);

    auto result = executor_->executeDeletion(file, true);

    EXPECT_TRUE(result.success);
    EXPECT_DOUBLE_EQ(result.sizeMb, 2.0);
    EXPECT_FALSE(result.error.has_value());
    EXPECT_TRUE(fs::exists(file));

    auto deletions = logger_->deletions();
    ASSERT_EQ(deletions.size(), 1u);
    EXPECT_TRUE(deletions[0].dryRun);
}

TEST_F(DeletionExecutorTest, DeletesDirectoryTree) {
    fs::path dir = testOutputPath / "proj" / "node_modules";
    writeFile(dir / "a" / "index.js", MB);
    writeFile(dir / "b" / "c" / "lib.js", MB);

    auto result = executor_->executeDeletion(dir, false);

    ASSERT_TRUE(result.success) << result.error->message;
    EXPECT_DOUBLE_EQ(result.sizeMb, 2.0);
    EXPECT_FALSE(fs::exists(dir));
    EXPECT_TRUE(fs::exists(testOutputPath / "proj"));
    EXPECT_GE(result.durationMs, 0.0);
}

TEST_F(DeletionExecutorTest, RemovesLinkNotTarget) {
    writeFile(testOutputPath / "keep" / "data.bin", MB);
    fs::create_directories(testOutputPath / "proj");
    fs::create_directory_symlink(testOutputPath / "keep", testOutputPath / "proj" / "link");

    auto result = executor_->executeDeletion(testOutputPath / "proj" / "link", false);

    ASSERT_TRUE(result.success);
    EXPECT_DOUBLE_EQ(result.sizeMb, 0.0);
    EXPECT_FALSE(fs::exists(fs::symlink_status(testOutputPath / "proj" / "link")));
    EXPECT_TRUE(fs::exists(testOutputPath / "keep" / "data.bin"));
}

TEST_F(DeletionExecutorTest, MissingPathIsNotFound) {
    auto result = executor_->executeDeletion(testOutputPath / "nothing", false);

    EXPECT_FALSE(result.success);
    EXPECT_DOUBLE_EQ(result.sizeMb, 0.0);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind, DeletionErrorKind::NOT_FOUND);
}

TEST_F(DeletionExecutorTest, GrowthBeforeRemovalAbortsAndKeepsFile) {
    fs::path file = testOutputPath / "proj" / "grow.cache";
    writeFile(file, MB);

    executor_->setPreDestroyHook([](const fs::path& path) {
        std::ofstream out(path, std::ios::app);
        out << "more data";
    });

    auto result = executor_->executeDeletion(file, false);

    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind, DeletionErrorKind::MODIFIED_DURING_DELETION);
    EXPECT_NE(result.error->message.find("modified during deletion"), std::string::npos);
    EXPECT_TRUE(fs::exists(file));
    EXPECT_EQ(logger_->countErrorsContaining("modified during deletion"), 1u);
}

TEST_F(DeletionExecutorTest, TouchedTimestampAbortsRemoval) {
    fs::path file = testOutputPath / "proj" / "touched.cache";
    writeFile(file, MB);

    executor_->setPreDestroyHook([](const fs::path& path) {
        fs::last_write_time(path, fs::last_write_time(path) + std::chrono::hours(1));
    });

    auto result = executor_->executeDeletion(file, false);

    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind, DeletionErrorKind::MODIFIED_DURING_DELETION);
    EXPECT_TRUE(fs::exists(file));
    EXPECT_EQ(fs::file_size(file), MB);
}

TEST_F(DeletionExecutorTest, NewEntryInDirectoryAbortsRemoval) {
    fs::path dir = testOutputPath / "proj" / "build";
    writeFile(dir / "obj.o", MB);

    executor_->setPreDestroyHook([](const fs::path& path) {
        std::ofstream(path / "fresh.o") << "x";
    });

    auto result = executor_->executeDeletion(dir, false);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error->kind, DeletionErrorKind::MODIFIED_DURING_DELETION);
    EXPECT_TRUE(fs::exists(dir / "obj.o"));
}

TEST_F(DeletionExecutorTest, ReplacementWithLinkAbortsRemoval) {
    fs::path dir = testOutputPath / "proj" / "cache";
    writeFile(dir / "entry", 10);
    writeFile(testOutputPath / "precious" / "entry", 10);

    executor_->setPreDestroyHook([this](const fs::path& path) {
        fs::remove_all(path);
        fs::create_directory_symlink(testOutputPath / "precious", path);
    });

    auto result = executor_->executeDeletion(dir, false);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error->kind, DeletionErrorKind::MODIFIED_DURING_DELETION);
    EXPECT_TRUE(fs::exists(testOutputPath / "precious" / "entry"));
}

TEST_F(DeletionExecutorTest, DryRunDoesNotCallHook) {
    fs::path file = testOutputPath / "proj" / "a.cache";
    writeFile(file, 10);

    bool called = false;
    executor_->setPreDestroyHook([&called](const fs::path&) { called = true; });

    EXPECT_TRUE(executor_->executeDeletion(file, true).success);
    EXPECT_FALSE(called);
}

TEST_F(DeletionExecutorTest, FingerprintTracksContent) {
    fs::path file = testOutputPath / "proj" / "f.bin";
    writeFile(file, 100);

    std::string error;
    bool missing = false;
    auto first = DeletionExecutor::fingerprint(file, error, missing);
    auto second = DeletionExecutor::fingerprint(file, error, missing);
    ASSERT_TRUE(first && second);
    EXPECT_EQ(*first, *second);
    EXPECT_EQ(first->totalBytes, 100u);

    writeFile(file, 200);
    auto third = DeletionExecutor::fingerprint(file, error, missing);
    ASSERT_TRUE(third);
    EXPECT_NE(*first, *third);

    EXPECT_FALSE(DeletionExecutor::fingerprint(testOutputPath / "none", error, missing));
    EXPECT_TRUE(missing);
}
