/**
 * @file workspace_store_test.cpp
 * @brief Tests for workspace path safety, metadata and file access
 *
 * @date 2025
 */

#include "wasmbox/core/errors.hpp"
#include "wasmbox/storage/workspace_store.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <string>

namespace fs = std::filesystem;

using wasmbox::core::PathTraversalError;
using wasmbox::storage::MetadataStatus;
using wasmbox::storage::SessionMetadata;
using wasmbox::storage::WorkspaceStore;
using wasmbox::testing::TempDir;

namespace {

std::vector<std::uint8_t> Bytes(const std::string& text) {
    return std::vector<std::uint8_t>(text.begin(), text.end());
}

class WorkspaceStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_unique<WorkspaceStore>(root_.Path());
        store_->CreateWorkspace("alpha");
    }

    TempDir root_;
    std::unique_ptr<WorkspaceStore> store_;
};

} // anonymous namespace

TEST(WorkspaceStoreValidationTest, RejectsUnsafeSessionIds) {
    for (const std::string id : {"", ".", "..", "a/b", "a\\b", "x..y", ".hidden", "site-packages"}) {
        EXPECT_THROW(WorkspaceStore::ValidateSessionId(id), PathTraversalError) << "'" << id << "'";
    }
    EXPECT_THROW(WorkspaceStore::ValidateSessionId(std::string("a\0b", 3)), PathTraversalError);
    EXPECT_NO_THROW(WorkspaceStore::ValidateSessionId("3f2b9c1e-5d44-4c1a-9a0e-6b1d2c3e4f50"));
    EXPECT_NO_THROW(WorkspaceStore::ValidateSessionId("analysis_01"));
}

TEST(WorkspaceStoreValidationTest, RejectsUnsafeRelativePaths) {
    EXPECT_THROW(WorkspaceStore::ValidateRelativePath(""), PathTraversalError);
    EXPECT_THROW(WorkspaceStore::ValidateRelativePath("/etc/passwd"), PathTraversalError);
    EXPECT_THROW(WorkspaceStore::ValidateRelativePath("../escape.txt"), PathTraversalError);
    EXPECT_THROW(WorkspaceStore::ValidateRelativePath("out/../../escape.txt"), PathTraversalError);
    EXPECT_THROW(WorkspaceStore::ValidateRelativePath("out\\..\\x"), PathTraversalError);
    EXPECT_NO_THROW(WorkspaceStore::ValidateRelativePath("out/report.csv"));
    EXPECT_NO_THROW(WorkspaceStore::ValidateRelativePath("notes..txt"));
}

TEST_F(WorkspaceStoreTest, WriteReadAndDelete) {
    store_->WriteFile("alpha", "out/data.txt", Bytes("hello"));
    EXPECT_TRUE(fs::is_regular_file(root_.Path() / "alpha" / "out" / "data.txt"));
    EXPECT_EQ(store_->ReadFile("alpha", "out/data.txt"), Bytes("hello"));

    EXPECT_THROW(store_->DeletePath("alpha", "out"), std::runtime_error);
    EXPECT_TRUE(fs::is_regular_file(root_.Path() / "alpha" / "out" / "data.txt"));

    EXPECT_TRUE(store_->DeletePath("alpha", "out", true));
    EXPECT_FALSE(store_->DeletePath("alpha", "out", true));
    EXPECT_THROW(store_->ReadFile("alpha", "out/data.txt"), std::runtime_error);
}

TEST_F(WorkspaceStoreTest, DeleteFileAndEmptyDirectoryWithoutRecursive) {
    store_->WriteFile("alpha", "notes.txt", Bytes("n"));
    fs::create_directories(root_.Path() / "alpha" / "empty");

    EXPECT_TRUE(store_->DeletePath("alpha", "notes.txt"));
    EXPECT_TRUE(store_->DeletePath("alpha", "empty"));
    EXPECT_FALSE(fs::exists(root_.Path() / "alpha" / "notes.txt"));
    EXPECT_FALSE(fs::exists(root_.Path() / "alpha" / "empty"));
}

TEST_F(WorkspaceStoreTest, WriteWithoutOverwriteKeepsExistingFile) {
    store_->WriteFile("alpha", "config.json", Bytes("{}"));
    EXPECT_THROW(store_->WriteFile("alpha", "config.json", Bytes("[]"), false), std::runtime_error);
    EXPECT_EQ(store_->ReadFile("alpha", "config.json"), Bytes("{}"));

    store_->WriteFile("alpha", "fresh.json", Bytes("[]"), false);
    EXPECT_EQ(store_->ReadFile("alpha", "fresh.json"), Bytes("[]"));
    store_->WriteFile("alpha", "config.json", Bytes("[1]"));
    EXPECT_EQ(store_->ReadFile("alpha", "config.json"), Bytes("[1]"));
}

TEST_F(WorkspaceStoreTest, BinaryPayloadSurvivesUnchanged) {
    std::vector<std::uint8_t> payload(256);
    for (std::size_t i = 0; i < payload.size(); ++i) {
        payload[i] = static_cast<std::uint8_t>(i);
    }
    store_->WriteFile("alpha", "blob.bin", payload);
    EXPECT_EQ(store_->ReadFile("alpha", "blob.bin"), payload);
    EXPECT_EQ(fs::file_size(root_.Path() / "alpha" / "blob.bin"), 256u);
}

TEST_F(WorkspaceStoreTest, SymlinkOutsideWorkspaceIsRejected) {
    TempDir outside;
    outside.Write("secret.txt", "s3cr3t");
    fs::create_directory_symlink(outside.Path(), root_.Path() / "alpha" / "link");

    EXPECT_THROW(store_->ReadFile("alpha", "link/secret.txt"), PathTraversalError);
    EXPECT_THROW(store_->WriteFile("alpha", "link/new.txt", Bytes("x")), PathTraversalError);
    EXPECT_FALSE(fs::exists(outside.Path() / "new.txt"));
}

TEST_F(WorkspaceStoreTest, ListFilesIsSortedAndFiltered) {
    store_->WriteFile("alpha", "b.csv", Bytes("1"));
    store_->WriteFile("alpha", "a.txt", Bytes("2"));
    store_->WriteFile("alpha", "out/c.csv", Bytes("3"));

    auto all = store_->ListFiles("alpha");
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0], "a.txt");
    EXPECT_EQ(all[1], "b.csv");
    EXPECT_EQ(all[2], "out/c.csv");

    auto csv = store_->ListFiles("alpha", "*.csv");
    ASSERT_EQ(csv.size(), 2u);
    EXPECT_EQ(csv[1], "out/c.csv");

    auto nested = store_->ListFiles("alpha", "out/*.csv");
    ASSERT_EQ(nested.size(), 1u);
    EXPECT_EQ(nested[0], "out/c.csv");

    EXPECT_TRUE(store_->ListFiles("missing-session").empty());
}

TEST_F(WorkspaceStoreTest, MetadataRoundTripAndCorruption) {
    EXPECT_EQ(store_->ReadMetadata("alpha").status, MetadataStatus::MISSING);

    SessionMetadata metadata;
    metadata.session_id = "alpha";
    metadata.created_at = "2025-03-01T12:00:00.000000Z";
    metadata.updated_at = "2025-03-01T12:30:00.000000Z";
    store_->WriteMetadata("alpha", metadata);

    auto lookup = store_->ReadMetadata("alpha");
    ASSERT_EQ(lookup.status, MetadataStatus::OK);
    EXPECT_EQ(lookup.metadata.updated_at, metadata.updated_at);
    EXPECT_EQ(lookup.metadata.version, 1);

    root_.Write("alpha/.metadata.json", "{\"session_id\": ");
    lookup = store_->ReadMetadata("alpha");
    EXPECT_EQ(lookup.status, MetadataStatus::CORRUPT);
    EXPECT_FALSE(lookup.detail.empty());
}

TEST_F(WorkspaceStoreTest, EnumerateSkipsHiddenAndReserved) {
    store_->CreateWorkspace("beta");
    fs::create_directories(root_.Path() / "site-packages");
    fs::create_directories(root_.Path() / ".trash");
    root_.Write("stray.txt", "not a session");

    auto sessions = store_->EnumerateSessions();
    ASSERT_EQ(sessions.size(), 2u);
    EXPECT_EQ(sessions[0], "alpha");
    EXPECT_EQ(sessions[1], "beta");
}

TEST_F(WorkspaceStoreTest, SizeAndSnapshot) {
    store_->WriteFile("alpha", "a.bin", Bytes("12345"));
    store_->WriteFile("alpha", "user_code.py", Bytes("print(1)"));
    store_->WriteFile("alpha", "site-packages/pkg/__init__.py", Bytes("#"));

    EXPECT_EQ(store_->GetWorkspaceSize("alpha"), 5u + 8u + 1u);

    auto snapshot = WorkspaceStore::Snapshot(store_->WorkspacePath("alpha"),
                                             {"user_code.py"}, {"site-packages"});
    ASSERT_EQ(snapshot.size(), 1u);
    EXPECT_EQ(snapshot.begin()->first, "a.bin");
    EXPECT_EQ(snapshot.begin()->second.size, 5u);
}

TEST_F(WorkspaceStoreTest, HydrateSitePackagesCopiesOnce) {
    TempDir shared;
    shared.Write("numpy_stub/__init__.py", "VERSION = 1");

    EXPECT_TRUE(store_->HydrateSitePackages("alpha", shared.Path()));
    EXPECT_TRUE(fs::is_regular_file(root_.Path() / "alpha" / "site-packages" / "numpy_stub" / "__init__.py"));
    EXPECT_FALSE(store_->HydrateSitePackages("alpha", shared.Path()));
    EXPECT_FALSE(store_->HydrateSitePackages("alpha", shared.Path() / "absent"));
}

TEST_F(WorkspaceStoreTest, DeleteWorkspace) {
    EXPECT_TRUE(store_->Exists("alpha"));
    EXPECT_TRUE(store_->DeleteWorkspace("alpha"));
    EXPECT_FALSE(store_->Exists("alpha"));
    EXPECT_FALSE(store_->DeleteWorkspace("alpha"));
}

TEST(AtomicWriteFileTest, ReplacesContentsWithoutLeavingTempFiles) {
    TempDir dir;
    auto target = dir.Path() / "state.json";
    wasmbox::storage::AtomicWriteFile(target, "{\"a\":1}");
    wasmbox::storage::AtomicWriteFile(target, "{\"a\":2}");
    EXPECT_EQ(dir.Read("state.json"), "{\"a\":2}");

    int entries = 0;
    for (const auto& entry : fs::directory_iterator(dir.Path())) {
        (void)entry;
        ++entries;
    }
    EXPECT_EQ(entries, 1);

    EXPECT_THROW(wasmbox::storage::AtomicWriteFile(dir.Path() / "no" / "such" / "dir.json", "x"),
                 std::runtime_error);
}
