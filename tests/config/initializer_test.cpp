#include "agentcfg/config/initializer.hpp"
#include "agentcfg/config/loader.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

namespace fs = std::filesystem;
using agentcfg::ErrorKind;
using agentcfg::config::InitOptions;
using agentcfg::config::InitResult;
using agentcfg::config::init_config;
using agentcfg::sync::ConflictPolicy;
using agentcfg::testing::TempDirTest;
using agentcfg::testing::read_file;
using agentcfg::testing::write_file;

class InitializerTest : public TempDirTest {
protected:
    fs::path source() const { return root_ / "source"; }
};

TEST_F(InitializerTest, CreatesConfigAndSourceLayout) {
    auto result = init_config(source());
    ASSERT_TRUE(result.is_ok()) << result.error().message;
    EXPECT_EQ(result.value().action, InitResult::Action::Created);
    EXPECT_TRUE(fs::is_regular_file(source() / "agentconfig.yml"));

    EXPECT_TRUE(fs::is_directory(source() / "skills"));
    EXPECT_TRUE(fs::is_directory(source() / "rules"));
    EXPECT_TRUE(fs::is_directory(source() / "claude" / "agents"));
    EXPECT_TRUE(fs::is_directory(source() / "cursor" / "hooks"));
    // File mappings only get their parent directory
    EXPECT_TRUE(fs::is_directory(source() / "claude"));
    EXPECT_FALSE(fs::exists(source() / "agent.md"));
    EXPECT_FALSE(fs::exists(source() / "claude" / "settings.json"));

    EXPECT_TRUE(agentcfg::config::read_config(source()).is_ok());
}

TEST_F(InitializerTest, ExistingConfigWithoutPolicyIsConflict) {
    write_file(source() / "agentconfig.yml", "keep me");

    auto result = init_config(source());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Conflict);
    EXPECT_EQ(read_file(source() / "agentconfig.yml"), "keep me");
}

TEST_F(InitializerTest, SkipLeavesExistingConfig) {
    write_file(source() / "agentconfig.yml", "keep me");

    InitOptions options;
    options.conflict_policy = ConflictPolicy::Skip;
    auto result = init_config(source(), options);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().action, InitResult::Action::Skipped);
    EXPECT_EQ(read_file(source() / "agentconfig.yml"), "keep me");
}

TEST_F(InitializerTest, CancelIsConflict) {
    write_file(source() / "agentconfig.yml", "keep me");

    InitOptions options;
    options.conflict_policy = ConflictPolicy::Cancel;
    auto result = init_config(source(), options);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Conflict);
}

TEST_F(InitializerTest, BackupCopiesOldConfigBeforeOverwrite) {
    write_file(source() / "agentconfig.yml", "old contents");

    InitOptions options;
    options.conflict_policy = ConflictPolicy::Backup;
    auto result = init_config(source(), options);
    ASSERT_TRUE(result.is_ok()) << result.error().message;
    EXPECT_EQ(result.value().action, InitResult::Action::Overwritten);
    EXPECT_NE(read_file(source() / "agentconfig.yml"), "old contents");

    std::vector<fs::path> stamps;
    for (const auto& entry : fs::directory_iterator(source() / "backup")) {
        stamps.push_back(entry.path());
    }
    ASSERT_EQ(stamps.size(), 1u);
    EXPECT_EQ(read_file(stamps.front() / "agentconfig.yml"), "old contents");
}

TEST_F(InitializerTest, ForceOverwrites) {
    write_file(source() / "agentconfig.yml", "old contents");

    InitOptions options;
    options.force = true;
    auto result = init_config(source(), options);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().action, InitResult::Action::Overwritten);
    EXPECT_FALSE(fs::exists(source() / "backup"));
}
