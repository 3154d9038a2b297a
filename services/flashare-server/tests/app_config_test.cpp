/**
 * @file app_config_test.cpp
 * @brief Unit tests for AppConfig environment and flag loading
 */

#include <gtest/gtest.h>
#include "../src/infrastructure/app_config.h"

#include <cstdlib>
#include <string>
#include <vector>

namespace {

const char* kVars[] = {
    "FLASHARE_HOST", "FLASHARE_PORT", "FLASHARE_THREAD_NUM", "FLASHARE_MAX_BODY_SIZE_MB",
    "FLASHARE_UPLOADS_DIR", "FLASHARE_STATIC_DIR", "FLASHARE_CHUNK_SIZE", "FLASHARE_ZSTD_LEVEL",
    "FLASHARE_BATCH_WORKERS", "FLASHARE_PUBLIC_URL", "FLASHARE_LOG_LEVEL", "FLASHARE_LOG_FILE",
};

/// argv builder that owns its strings
class Args {
public:
    Args(std::initializer_list<std::string> args) : storage_(args) {
        storage_.insert(storage_.begin(), "flashare-server");
        for (auto& s : storage_) ptrs_.push_back(s.data());
    }
    int argc() const { return static_cast<int>(ptrs_.size()); }
    char** argv() { return ptrs_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> ptrs_;
};

} // anonymous namespace

class AppConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clearEnv(); }
    void TearDown() override { clearEnv(); }

    static void clearEnv() {
        for (const char* v : kVars) ::unsetenv(v);
    }
};

// ============================================================================
// Defaults and environment
// ============================================================================

TEST_F(AppConfigTest, Defaults) {
    AppConfig config = AppConfig::fromEnvironment();
    EXPECT_EQ(config.host, "0.0.0.0");
    EXPECT_EQ(config.serverPort, 8000);
    EXPECT_EQ(config.uploadsDir, "./uploads");
    EXPECT_EQ(config.chunkSize, 65536);
    EXPECT_EQ(config.zstdLevel, 3);
    EXPECT_EQ(config.batchWorkers, 4);
    EXPECT_EQ(config.logLevel, "info");
    EXPECT_TRUE(config.logFile.empty());
    EXPECT_FALSE(config.helpRequested);
}

TEST_F(AppConfigTest, Environment_Overrides) {
    ::setenv("FLASHARE_PORT", "9000", 1);
    ::setenv("FLASHARE_UPLOADS_DIR", "/srv/share", 1);
    ::setenv("FLASHARE_ZSTD_LEVEL", "19", 1);
    ::setenv("FLASHARE_PUBLIC_URL", "http://nas.local:9000", 1);

    AppConfig config = AppConfig::fromEnvironment();
    EXPECT_EQ(config.serverPort, 9000);
    EXPECT_EQ(config.uploadsDir, "/srv/share");
    EXPECT_EQ(config.zstdLevel, 19);
    EXPECT_EQ(config.serverUrl(), "http://nas.local:9000");
}

TEST_F(AppConfigTest, Environment_OutOfRangeClamped) {
    ::setenv("FLASHARE_ZSTD_LEVEL", "99", 1);
    ::setenv("FLASHARE_CHUNK_SIZE", "1", 1);
    ::setenv("FLASHARE_BATCH_WORKERS", "0", 1);

    AppConfig config = AppConfig::fromEnvironment();
    EXPECT_EQ(config.zstdLevel, 22);
    EXPECT_EQ(config.chunkSize, 4096);
    EXPECT_EQ(config.batchWorkers, 1);
}

TEST_F(AppConfigTest, Environment_GarbageFallsBackToDefault) {
    ::setenv("FLASHARE_PORT", "eighty", 1);
    AppConfig config = AppConfig::fromEnvironment();
    EXPECT_EQ(config.serverPort, 8000);
}

// ============================================================================
// Flags
// ============================================================================

TEST_F(AppConfigTest, Flags_OverrideEnvironment) {
    ::setenv("FLASHARE_PORT", "9000", 1);
    AppConfig config = AppConfig::fromEnvironment();

    Args args{"--port", "8080", "--dir=/tmp/share", "--level", "5", "--workers=8"};
    config.applyArguments(args.argc(), args.argv());

    EXPECT_EQ(config.serverPort, 8080);
    EXPECT_EQ(config.uploadsDir, "/tmp/share");
    EXPECT_EQ(config.zstdLevel, 5);
    EXPECT_EQ(config.batchWorkers, 8);
}

TEST_F(AppConfigTest, Flags_ShortForms) {
    AppConfig config;
    Args args{"-p", "7000", "-d", "files"};
    config.applyArguments(args.argc(), args.argv());
    EXPECT_EQ(config.serverPort, 7000);
    EXPECT_EQ(config.uploadsDir, "files");
}

TEST_F(AppConfigTest, Flags_Help) {
    AppConfig config;
    Args args{"--help"};
    config.applyArguments(args.argc(), args.argv());
    EXPECT_TRUE(config.helpRequested);
    EXPECT_NE(AppConfig::usage().find("--chunk-size"), std::string::npos);
}

TEST_F(AppConfigTest, Flags_UnknownOptionRejected) {
    AppConfig config;
    Args args{"--bogus", "1"};
    EXPECT_THROW(config.applyArguments(args.argc(), args.argv()), flashare::common::ConfigException);
}

TEST_F(AppConfigTest, Flags_MissingValueRejected) {
    AppConfig config;
    Args args{"--port"};
    EXPECT_THROW(config.applyArguments(args.argc(), args.argv()), flashare::common::ConfigException);
}

TEST_F(AppConfigTest, Flags_BadIntegersRejected) {
    AppConfig config;
    Args notNumber{"--port", "80x"};
    EXPECT_THROW(config.applyArguments(notNumber.argc(), notNumber.argv()), flashare::common::ConfigException);

    Args outOfRange{"--level", "23"};
    EXPECT_THROW(config.applyArguments(outOfRange.argc(), outOfRange.argv()), flashare::common::ConfigException);
}

// ============================================================================
// Derived values
// ============================================================================

TEST_F(AppConfigTest, ServerUrl_DerivedFromListener) {
    AppConfig config;
    config.host = "192.168.1.20";
    config.serverPort = 8000;
    EXPECT_EQ(config.serverUrl(), "http://192.168.1.20:8000");
}

TEST_F(AppConfigTest, ToTransferConfig) {
    AppConfig config;
    config.uploadsDir = "/data";
    config.chunkSize = 8192;
    config.zstdLevel = 7;
    config.batchWorkers = 2;

    auto tc = config.toTransferConfig();
    EXPECT_EQ(tc.storageRoot, std::filesystem::path("/data"));
    EXPECT_EQ(tc.chunkSize, 8192u);
    EXPECT_EQ(tc.compressionLevel, 7);
    EXPECT_EQ(tc.batchWorkers, 2);
}

TEST_F(AppConfigTest, Validate_EmptyUploadsDirRejected) {
    AppConfig config;
    config.uploadsDir.clear();
    EXPECT_THROW(config.validate(), flashare::common::ConfigException);
}
