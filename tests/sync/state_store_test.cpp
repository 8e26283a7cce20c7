#include "agentcfg/sync/state_store.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <chrono>

namespace fs = std::filesystem;
using agentcfg::ErrorKind;
using agentcfg::sync::Scope;
using agentcfg::sync::StateStore;
using agentcfg::sync::SyncMode;
using agentcfg::sync::SyncRecord;
using agentcfg::sync::SyncState;
using agentcfg::testing::TempDirTest;
using agentcfg::testing::read_file;
using agentcfg::testing::write_file;

namespace {

SyncRecord make_record(const std::string& path, SyncMode mode) {
    SyncRecord record;
    record.path = path;
    record.source = "/src" + path;
    record.agent = "claude";
    record.mode = mode;
    record.size = 42;
    record.mtime_ms = 1700000000123.5;
    if (mode == SyncMode::Link) {
        record.link_target = record.source;
    } else {
        record.hash = "abc123";
    }
    return record;
}

} // namespace

class StateStoreTest : public TempDirTest {};

TEST_F(StateStoreTest, MissingStateLoadsAsEmpty) {
    StateStore store(root_);
    auto loaded = store.load();
    ASSERT_TRUE(loaded.is_ok());
    EXPECT_FALSE(loaded.value().has_value());
}

TEST_F(StateStoreTest, SaveAndLoadPreserveRecords) {
    SyncState state;
    state.updated_at = "2026-01-02T03:04:05.678Z";
    state.mode = Scope::Project;
    state.project_root = "/repo";
    state.files["/t/link.md"] = make_record("/t/link.md", SyncMode::Link);
    state.files["/t/copy.md"] = make_record("/t/copy.md", SyncMode::Copy);

    StateStore store(root_ / "source");
    ASSERT_TRUE(store.save(state).is_ok());
    EXPECT_TRUE(fs::exists(root_ / "source" / ".sync-state.json"));

    auto loaded = store.load();
    ASSERT_TRUE(loaded.is_ok()) << loaded.error().message;
    ASSERT_TRUE(loaded.value().has_value());
    const auto& restored = *loaded.value();

    EXPECT_EQ(restored.version, 1);
    EXPECT_EQ(restored.updated_at, state.updated_at);
    EXPECT_EQ(restored.mode, Scope::Project);
    EXPECT_EQ(restored.project_root, std::optional<std::string>("/repo"));
    ASSERT_EQ(restored.files.size(), 2u);

    const auto& link = restored.files.at("/t/link.md");
    EXPECT_EQ(link.mode, SyncMode::Link);
    EXPECT_EQ(link.link_target, std::optional<std::string>("/src/t/link.md"));
    EXPECT_FALSE(link.hash.has_value());
    EXPECT_EQ(link.size, 42u);
    EXPECT_DOUBLE_EQ(link.mtime_ms, 1700000000123.5);

    const auto& copy = restored.files.at("/t/copy.md");
    EXPECT_EQ(copy.hash, std::optional<std::string>("abc123"));
    EXPECT_FALSE(copy.link_target.has_value());
    EXPECT_EQ(copy.agent, "claude");
}

TEST_F(StateStoreTest, SerializesWithNullIdentityFields) {
    SyncState state;
    state.files["/t/a"] = make_record("/t/a", SyncMode::Link);
    const auto text = StateStore::serialize(state);

    EXPECT_NE(text.find("\"hash\": null"), std::string::npos);
    EXPECT_NE(text.find("\"projectRoot\": null"), std::string::npos);
    EXPECT_NE(text.find("\"linkTarget\": \"/src/t/a\""), std::string::npos);
    EXPECT_NE(text.find("\"mtimeMs\""), std::string::npos);

    auto reparsed = StateStore::parse(text, "inline");
    ASSERT_TRUE(reparsed.is_ok());
    EXPECT_EQ(StateStore::serialize(reparsed.value()), text);
}

TEST_F(StateStoreTest, InvalidJsonIsValidationError) {
    write_file(root_ / ".sync-state.json", "{ not json");
    StateStore store(root_);
    auto loaded = store.load();
    ASSERT_TRUE(loaded.is_error());
    EXPECT_EQ(loaded.error().kind, ErrorKind::Validation);
    EXPECT_NE(loaded.error().message.find("Invalid JSON"), std::string::npos);
}

TEST_F(StateStoreTest, WrongShapeIsValidationError) {
    auto parsed = StateStore::parse(R"({"version": 1, "mode": "global", "files": {"/x": {"mode": "sideways", "source": "/s"}}})",
                                    "inline");
    ASSERT_TRUE(parsed.is_error());
    EXPECT_EQ(parsed.error().kind, ErrorKind::Validation);
}

TEST_F(StateStoreTest, ReadsLegacyAutoMode) {
    auto parsed = StateStore::parse(
        R"({"version": 1, "updatedAt": "x", "mode": "global", "projectRoot": null,
            "files": {"/x": {"path": "/x", "source": "/s", "agent": "a", "mode": "auto",
                             "size": 1, "mtimeMs": 2, "hash": null, "linkTarget": "/s"}}})",
        "inline");
    ASSERT_TRUE(parsed.is_ok()) << parsed.error().message;
    EXPECT_EQ(parsed.value().files.at("/x").mode, SyncMode::Auto);
}

TEST_F(StateStoreTest, MergeKeepsUnrelatedRecordsAndReplacesSameKeys) {
    SyncState previous;
    previous.files["/t/old"] = make_record("/t/old", SyncMode::Copy);
    previous.files["/t/shared"] = make_record("/t/shared", SyncMode::Copy);

    SyncState fresh;
    fresh.updated_at = "now";
    fresh.files["/t/shared"] = make_record("/t/shared", SyncMode::Link);
    fresh.files["/t/new"] = make_record("/t/new", SyncMode::Link);

    const auto merged = StateStore::merge(previous, fresh);
    EXPECT_EQ(merged.updated_at, "now");
    ASSERT_EQ(merged.files.size(), 3u);
    EXPECT_TRUE(merged.files.count("/t/old"));
    EXPECT_EQ(merged.files.at("/t/shared").mode, SyncMode::Link);
}

TEST(TimestampTest, FormatsIsoAndBackupStamps) {
    const auto when = std::chrono::system_clock::time_point(std::chrono::milliseconds(1234));
    EXPECT_EQ(agentcfg::sync::iso_timestamp(when), "1970-01-01T00:00:01.234Z");
    EXPECT_EQ(agentcfg::sync::backup_stamp(when), "1970-01-01T00-00-01-234Z");
}
