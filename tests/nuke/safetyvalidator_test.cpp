#include "nuke/safetyvalidator.hpp"
#include "support/recordinglogger.hpp"
#include "support/treebuilder.hpp"
#include "test_config.h"
#include <gtest/gtest.h>
#include <unistd.h>

using namespace cleanbook::nuke;
using cleanbook::testing::RecordingLogger;
using cleanbook::testing::writeFile;
namespace fs = std::filesystem;

class SafetyValidatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        testOutputPath = fs::path(TEST_OUTPUT_DIR) / "safetyvalidator";
        fs::remove_all(testOutputPath);
        fs::create_directories(testOutputPath / "protected");
        testOutputPath = fs::canonical(testOutputPath);
    }

    void TearDown() override {
        fs::remove_all(testOutputPath);
    }

    SafetyValidator makeValidator() {
        return SafetyValidator(ProtectedPaths({testOutputPath / "protected"}));
    }

    fs::path testOutputPath;
};

TEST_F(SafetyValidatorTest, FilesystemRootIsUnsafe) {
    auto validator = makeValidator();
    EXPECT_FALSE(validator.isSafeToDelete("/"));
    EXPECT_FALSE(validator.check("/").isSafe());
}

TEST_F(SafetyValidatorTest, DeepOwnedPathIsSafe) {
    writeFile(testOutputPath / "project" / "build" / "out.cache", 100);

    auto validator = makeValidator();
    auto verdict = validator.check(testOutputPath / "project" / "build" / "out.cache");
    EXPECT_TRUE(verdict.isSafe()) << verdict.detail;
    EXPECT_TRUE(validator.isSafeToDelete(testOutputPath / "project"));
}

TEST_F(SafetyValidatorTest, MissingPathIsUnresolvable) {
    auto verdict = makeValidator().check(testOutputPath / "gone");
    EXPECT_FALSE(verdict.isSafe());
    EXPECT_EQ(verdict.reason, UnsafeReason::UNRESOLVABLE);
}

TEST_F(SafetyValidatorTest, RejectionsAreLogged) {
    writeFile(testOutputPath / "project" / "build" / "out.cache", 100);
    auto logger = std::make_shared<RecordingLogger>();
    SafetyValidator validator(ProtectedPaths({testOutputPath / "protected"}), logger);

    EXPECT_FALSE(validator.isSafeToDelete(testOutputPath / "gone"));
    EXPECT_TRUE(validator.isSafeToDelete(testOutputPath / "project" / "build" / "out.cache"));

    auto errors = logger->errors();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].context, "safety_check");
    EXPECT_NE(errors[0].error.find("unresolvable"), std::string::npos);
    EXPECT_NE(errors[0].error.find((testOutputPath / "gone").string()), std::string::npos);
}

TEST_F(SafetyValidatorTest, ProtectedSubtreeIsRejected) {
    writeFile(testOutputPath / "protected" / "inner" / "x.cache", 10);
    auto validator = makeValidator();

    EXPECT_EQ(validator.check(testOutputPath / "protected").reason, UnsafeReason::PROTECTED);
    EXPECT_EQ(validator.check(testOutputPath / "protected" / "inner" / "x.cache").reason,
              UnsafeReason::PROTECTED);
    // Removing a parent would remove the protected directory too
    EXPECT_EQ(validator.check(testOutputPath).reason, UnsafeReason::PROTECTED);
}

TEST_F(SafetyValidatorTest, LinkIntoProtectedAreaIsRejected) {
    writeFile(testOutputPath / "protected" / "secret.key", 10);
    fs::create_directories(testOutputPath / "work");
    fs::create_symlink(testOutputPath / "protected" / "secret.key",
                       testOutputPath / "work" / "innocent.cache");

    auto verdict = makeValidator().check(testOutputPath / "work" / "innocent.cache");
    EXPECT_EQ(verdict.reason, UnsafeReason::PROTECTED);
}

TEST_F(SafetyValidatorTest, ForeignOwnerIsRejected) {
    if (geteuid() != 0) {
        GTEST_SKIP() << "changing file ownership requires root";
    }
    fs::path file = testOutputPath / "work" / "foreign.cache";
    writeFile(file, 10);
    ASSERT_EQ(chown(file.c_str(), 65534, 65534), 0);

    EXPECT_EQ(makeValidator().check(file).reason, UnsafeReason::FOREIGN_OWNER);
}

TEST_F(SafetyValidatorTest, ShallowPathIsRejected) {
    // "/" is the only path guaranteed to be shallow and reachable
    SafetyValidator validator(ProtectedPaths({}, false));
    auto verdict = validator.check("/");
    EXPECT_FALSE(verdict.isSafe());
    if (geteuid() == 0) {
        EXPECT_EQ(verdict.reason, UnsafeReason::TOO_SHALLOW);
    }
}

TEST_F(SafetyValidatorTest, SystemDefaultsAreResolved) {
    ProtectedPaths paths;
    if (fs::exists("/usr")) {
        EXPECT_TRUE(paths.covers(fs::canonical("/usr")));
    }
    if (fs::exists("/etc")) {
        EXPECT_TRUE(paths.covers(fs::canonical("/etc")));
    }
    EXPECT_FALSE(paths.covers(testOutputPath / "work"));

    for (const auto& entry : paths.entries()) {
        EXPECT_TRUE(entry.is_absolute());
        EXPECT_TRUE(fs::exists(entry));
    }
}

TEST_F(SafetyValidatorTest, MissingExtrasAreDropped) {
    ProtectedPaths paths({testOutputPath / "not-there"}, false);
    EXPECT_TRUE(paths.entries().empty());
}
