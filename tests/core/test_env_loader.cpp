#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include "shroud/core/env_loader.hpp"

using namespace shroud;

class EnvLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        env_path = std::filesystem::temp_directory_path() / "shroud_env_loader_test.env";
        unsetenv("SHROUD_TEST_PLAIN");
        unsetenv("SHROUD_TEST_QUOTED");
        unsetenv("SHROUD_TEST_KEPT");
    }

    void TearDown() override {
        std::filesystem::remove(env_path);
        unsetenv("SHROUD_TEST_PLAIN");
        unsetenv("SHROUD_TEST_QUOTED");
        unsetenv("SHROUD_TEST_KEPT");
    }

    void write_env(const std::string& content) {
        std::ofstream file(env_path);
        file << content;
    }

    std::filesystem::path env_path;
};

TEST_F(EnvLoaderTest, ParsesQuotedAndTrimmedValues) {
    write_env(
        "# executor settings\n"
        "SHROUD_TEST_PLAIN = abc123 \n"
        "SHROUD_TEST_QUOTED=\"with spaces\"\n"
        "not a pair\n");

    ASSERT_TRUE(EnvLoader::load(env_path.string()).is_ok());
    EXPECT_EQ(EnvLoader::get("SHROUD_TEST_PLAIN"), "abc123");
    EXPECT_EQ(EnvLoader::get("SHROUD_TEST_QUOTED"), "with spaces");
}

TEST_F(EnvLoaderTest, ExistingValuesWinUnlessOverwrite) {
    setenv("SHROUD_TEST_KEPT", "from-shell", 1);
    write_env("SHROUD_TEST_KEPT=from-file\n");

    ASSERT_TRUE(EnvLoader::load(env_path.string()).is_ok());
    EXPECT_EQ(EnvLoader::get("SHROUD_TEST_KEPT"), "from-shell");

    ASSERT_TRUE(EnvLoader::load(env_path.string(), true).is_ok());
    EXPECT_EQ(EnvLoader::get("SHROUD_TEST_KEPT"), "from-file");
}

TEST_F(EnvLoaderTest, MissingFileIsFileError) {
    auto result = EnvLoader::load("/nonexistent/shroud.env");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::FILE_IO_ERROR);
}

TEST_F(EnvLoaderTest, RequireReportsUnsetVariable) {
    auto missing = EnvLoader::require("SHROUD_TEST_PLAIN");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error()->code(), ErrorCode::NOT_INITIALIZED);
    EXPECT_EQ(EnvLoader::get("SHROUD_TEST_PLAIN", "fallback"), "fallback");

    setenv("SHROUD_TEST_PLAIN", "value", 1);
    auto present = EnvLoader::require("SHROUD_TEST_PLAIN");
    ASSERT_TRUE(present.is_ok());
    EXPECT_EQ(present.value(), "value");
}
