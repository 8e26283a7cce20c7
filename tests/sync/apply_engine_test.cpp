#include "agentcfg/sync/apply.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <sys/stat.h>

namespace fs = std::filesystem;
using agentcfg::ErrorKind;
using agentcfg::sync::ApplyEngine;
using agentcfg::sync::FilesystemProbe;
using agentcfg::sync::ResolvedMapping;
using agentcfg::sync::SyncMode;
using agentcfg::testing::TempDirTest;
using agentcfg::testing::read_file;
using agentcfg::testing::write_file;

class ApplyEngineTest : public TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        source_root_ = root_ / "source";
        write_file(source_root_ / "agent.md", "hello");
        write_file(source_root_ / "skills" / "one.md", "one");
        write_file(source_root_ / "skills" / "nested" / "two.md", "two");
        fs::create_symlink("one.md", source_root_ / "skills" / "alias.md");
        fs::create_directories(root_ / "target");
    }

    ResolvedMapping file_mapping(SyncMode mode) const {
        return ResolvedMapping{"testagent", source_root_ / "agent.md", root_ / "target" / "AGENT.md", mode};
    }

    ResolvedMapping dir_mapping(SyncMode mode) const {
        return ResolvedMapping{"testagent", source_root_ / "skills", root_ / "target" / "skills", mode};
    }

    FilesystemProbe probe_;
    fs::path source_root_;
    std::vector<std::string> warnings_;
};

TEST_F(ApplyEngineTest, LinkModeCreatesSymlink) {
    ApplyEngine engine(probe_);
    const auto m = file_mapping(SyncMode::Link);
    auto result = engine.apply(m, false, warnings_);
    ASSERT_TRUE(result.is_ok()) << result.error().message;

    EXPECT_TRUE(fs::is_symlink(m.target));
    EXPECT_EQ(fs::read_symlink(m.target).string(), m.source.string());
    EXPECT_EQ(read_file(m.target), "hello");
    EXPECT_TRUE(warnings_.empty());
}

TEST_F(ApplyEngineTest, LinkAlreadyInPlaceIsLeftAlone) {
    int created = 0;
    ApplyEngine engine(probe_, [&](const fs::path& source, const fs::path& target, bool) {
        ++created;
        std::error_code ec;
        fs::create_symlink(source, target, ec);
        return ec;
    });
    const auto m = file_mapping(SyncMode::Link);
    ASSERT_TRUE(engine.apply(m, false, warnings_).is_ok());
    ASSERT_TRUE(engine.apply(m, false, warnings_).is_ok());
    EXPECT_EQ(created, 1);
    EXPECT_TRUE(fs::is_symlink(m.target));
}

TEST_F(ApplyEngineTest, LinkReplacesLinkToOtherSource) {
    const auto m = file_mapping(SyncMode::Link);
    write_file(root_ / "other.md", "other");
    fs::create_symlink(root_ / "other.md", m.target);

    ApplyEngine engine(probe_);
    ASSERT_TRUE(engine.apply(m, false, warnings_).is_ok());
    EXPECT_EQ(fs::read_symlink(m.target).string(), m.source.string());
    EXPECT_EQ(read_file(root_ / "other.md"), "other");
}

TEST_F(ApplyEngineTest, CopyModeCopiesFile) {
    ApplyEngine engine(probe_);
    const auto m = file_mapping(SyncMode::Copy);
    write_file(m.target, "stale");
    ASSERT_TRUE(engine.apply(m, false, warnings_).is_ok());

    EXPECT_FALSE(fs::is_symlink(m.target));
    EXPECT_EQ(read_file(m.target), "hello");
}

TEST_F(ApplyEngineTest, CopyModeCopiesTreeAndRecreatesNestedLinks) {
    ApplyEngine engine(probe_);
    const auto m = dir_mapping(SyncMode::Copy);
    auto result = engine.apply(m, false, warnings_);
    ASSERT_TRUE(result.is_ok()) << result.error().message;

    EXPECT_EQ(read_file(m.target / "one.md"), "one");
    EXPECT_EQ(read_file(m.target / "nested" / "two.md"), "two");
    ASSERT_TRUE(fs::is_symlink(m.target / "alias.md"));
    EXPECT_EQ(fs::read_symlink(m.target / "alias.md").string(), "one.md");

    auto source_hash = probe_.content_hash(m.source);
    auto target_hash = probe_.content_hash(m.target);
    ASSERT_TRUE(source_hash.is_ok());
    ASSERT_TRUE(target_hash.is_ok());
    EXPECT_EQ(source_hash.value(), target_hash.value());
}

TEST_F(ApplyEngineTest, CopyTreeLeavesOutSpecialFiles) {
    ASSERT_EQ(::mkfifo((source_root_ / "skills" / "pipe").c_str(), 0600), 0);
    ApplyEngine engine(probe_);
    const auto m = dir_mapping(SyncMode::Copy);

    auto result = engine.apply(m, false, warnings_);
    ASSERT_TRUE(result.is_ok()) << result.error().message;
    EXPECT_EQ(read_file(m.target / "one.md"), "one");
    EXPECT_FALSE(fs::exists(fs::symlink_status(m.target / "pipe")));

    auto record = engine.snapshot(m);
    ASSERT_TRUE(record.is_ok()) << record.error().message;
    EXPECT_TRUE(record.value().hash.has_value());
}

TEST_F(ApplyEngineTest, RefusesNonEmptyDirectoryWithoutPermission) {
    ApplyEngine engine(probe_);
    const auto m = dir_mapping(SyncMode::Link);
    write_file(m.target / "keep.md", "keep");

    auto result = engine.apply(m, false, warnings_);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Filesystem);
    EXPECT_EQ(result.error().message, "Refusing to replace non-empty directory: " + m.target.string());
    EXPECT_EQ(read_file(m.target / "keep.md"), "keep");
}

TEST_F(ApplyEngineTest, ReplacesNonEmptyDirectoryWhenPermitted) {
    ApplyEngine engine(probe_);
    const auto m = dir_mapping(SyncMode::Link);
    write_file(m.target / "keep.md", "keep");

    ASSERT_TRUE(engine.apply(m, true, warnings_).is_ok());
    EXPECT_TRUE(fs::is_symlink(m.target));
    EXPECT_EQ(read_file(m.target / "one.md"), "one");
}

TEST_F(ApplyEngineTest, ReplacesEmptyDirectory) {
    ApplyEngine engine(probe_);
    const auto m = file_mapping(SyncMode::Copy);
    fs::create_directories(m.target);

    ASSERT_TRUE(engine.apply(m, false, warnings_).is_ok());
    EXPECT_TRUE(fs::is_regular_file(m.target));
    EXPECT_EQ(read_file(m.target), "hello");
}

TEST_F(ApplyEngineTest, FallsBackToCopyWhenSymlinkFails) {
    ApplyEngine engine(probe_, [](const fs::path&, const fs::path&, bool) {
        return std::make_error_code(std::errc::operation_not_permitted);
    });
    const auto m = dir_mapping(SyncMode::Link);
    ASSERT_TRUE(engine.apply(m, false, warnings_).is_ok());

    EXPECT_FALSE(fs::is_symlink(m.target));
    EXPECT_EQ(read_file(m.target / "nested" / "two.md"), "two");
    ASSERT_EQ(warnings_.size(), 1u);
    EXPECT_EQ(warnings_[0].rfind("Symlink failed for " + m.target.string(), 0), 0u);
    EXPECT_NE(warnings_[0].find("falling back to copy"), std::string::npos);
}

TEST_F(ApplyEngineTest, WarnsWhenCreatingTargetParent) {
    ApplyEngine engine(probe_);
    auto m = file_mapping(SyncMode::Link);
    m.target = root_ / "fresh" / "deeper" / "AGENT.md";

    ASSERT_TRUE(engine.apply(m, false, warnings_).is_ok());
    ASSERT_EQ(warnings_.size(), 1u);
    EXPECT_EQ(warnings_[0], "Created target parent directory: " + m.target.parent_path().string() + " (for "
                                + m.target.string() + ")");
}

TEST_F(ApplyEngineTest, BackupCopiesTargetUnderStamp) {
    ApplyEngine engine(probe_);
    const auto target = root_ / "target" / "AGENT.md";
    write_file(target, "precious");

    auto result = engine.backup_target(target, source_root_, "2026-01-01T00-00-00-000Z");
    ASSERT_TRUE(result.is_ok()) << result.error().message;

    const auto expected = source_root_ / "backup" / "2026-01-01T00-00-00-000Z" / target.relative_path();
    EXPECT_EQ(result.value().string(), expected.string());
    EXPECT_EQ(read_file(expected), "precious");
    EXPECT_EQ(read_file(target), "precious");
}

TEST_F(ApplyEngineTest, BackupKeepsFirstCopyUnderSameStamp) {
    ApplyEngine engine(probe_);
    const auto target = root_ / "target" / "AGENTS.md";
    write_file(target, "precious");
    ASSERT_TRUE(engine.backup_target(target, source_root_, "stamp").is_ok());

    write_file(target, "synced");
    auto again = engine.backup_target(target, source_root_, "stamp");
    ASSERT_TRUE(again.is_ok()) << again.error().message;
    EXPECT_EQ(read_file(again.value()), "precious");

    fs::remove(target);
    fs::create_symlink(source_root_ / "agent.md", target);
    auto linked = engine.backup_target(target, source_root_, "stamp");
    ASSERT_TRUE(linked.is_ok()) << linked.error().message;
    EXPECT_EQ(read_file(linked.value()), "precious");
}

TEST_F(ApplyEngineTest, BackupOfDirectoryKeepsTree) {
    ApplyEngine engine(probe_);
    const auto target = root_ / "target" / "rules";
    write_file(target / "a.md", "a");
    write_file(target / "sub" / "b.md", "b");

    auto result = engine.backup_target(target, source_root_, "stamp");
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(read_file(result.value() / "a.md"), "a");
    EXPECT_EQ(read_file(result.value() / "sub" / "b.md"), "b");
}

TEST_F(ApplyEngineTest, SnapshotRecordsLinkTarget) {
    ApplyEngine engine(probe_);
    const auto m = file_mapping(SyncMode::Link);
    ASSERT_TRUE(engine.apply(m, false, warnings_).is_ok());

    auto record = engine.snapshot(m);
    ASSERT_TRUE(record.is_ok());
    EXPECT_EQ(record.value().mode, SyncMode::Link);
    EXPECT_EQ(record.value().path, m.target.string());
    EXPECT_EQ(record.value().source, m.source.string());
    EXPECT_EQ(record.value().agent, "testagent");
    EXPECT_EQ(record.value().link_target, std::optional<std::string>(m.source.string()));
    EXPECT_FALSE(record.value().hash.has_value());
}

TEST_F(ApplyEngineTest, SnapshotRecordsCopyHash) {
    ApplyEngine engine(probe_);
    const auto m = file_mapping(SyncMode::Copy);
    ASSERT_TRUE(engine.apply(m, false, warnings_).is_ok());

    auto record = engine.snapshot(m);
    ASSERT_TRUE(record.is_ok());
    EXPECT_EQ(record.value().mode, SyncMode::Copy);
    EXPECT_EQ(record.value().size, 5u);
    EXPECT_EQ(record.value().hash,
              std::optional<std::string>("2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824"));
    EXPECT_FALSE(record.value().link_target.has_value());
}

TEST_F(ApplyEngineTest, SnapshotOfMissingTargetFails) {
    ApplyEngine engine(probe_);
    auto record = engine.snapshot(file_mapping(SyncMode::Copy));
    ASSERT_TRUE(record.is_error());
    EXPECT_EQ(record.error().kind, ErrorKind::Filesystem);
}
