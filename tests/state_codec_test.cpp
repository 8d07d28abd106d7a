/**
 * @file state_codec_test.cpp
 * @brief Tests for `_state` sanitizing, loading and pending commits
 *
 * @date 2025
 */

#include "wasmbox/core/state_codec.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <filesystem>
#include <limits>

namespace fs = std::filesystem;

using json = nlohmann::json;
using wasmbox::core::StateCodec;
using wasmbox::testing::TempDir;

TEST(StateCodecTest, SanitizeDropsNonFiniteNumbers) {
    json state = {
        {"count", 3},
        {"ratio", 0.5},
        {"bad", std::numeric_limits<double>::infinity()},
        {"list", json::array({1, std::nan(""), "x"})},
    };

    json clean = StateCodec::Sanitize(state);
    EXPECT_EQ(clean["count"], 3);
    EXPECT_FALSE(clean.contains("bad"));
    ASSERT_EQ(clean["list"].size(), 2u);
    EXPECT_EQ(clean["list"][1], "x");
}

TEST(StateCodecTest, SanitizeRequiresObjectTopLevel) {
    EXPECT_EQ(StateCodec::Sanitize(json::array({1, 2})), json::object());
    EXPECT_EQ(StateCodec::Sanitize(42), json::object());
}

TEST(StateCodecTest, SanitizeCutsExcessiveNesting) {
    json deep = "leaf";
    for (int i = 0; i < StateCodec::kMaxDepth + 5; ++i) {
        deep = json::array({deep});
    }
    json clean = StateCodec::Sanitize({{"deep", deep}});
    EXPECT_TRUE(clean.contains("deep"));
    EXPECT_NE(clean.dump().find("[]"), std::string::npos);
    EXPECT_EQ(clean.dump().find("leaf"), std::string::npos);
}

TEST(StateCodecTest, LoadMissingOrCorruptGivesEmptyObject) {
    TempDir workspace;
    EXPECT_EQ(StateCodec::Load(workspace.Path()), json::object());

    workspace.Write(StateCodec::kStateFile, "{truncated");
    EXPECT_EQ(StateCodec::Load(workspace.Path()), json::object());

    workspace.Write(StateCodec::kStateFile, "[1, 2, 3]");
    EXPECT_EQ(StateCodec::Load(workspace.Path()), json::object());
}

TEST(StateCodecTest, SaveThenLoad) {
    TempDir workspace;
    StateCodec::Save(workspace.Path(), {{"total", 10}, {"names", {"a", "b"}}});

    json loaded = StateCodec::Load(workspace.Path());
    EXPECT_EQ(loaded["total"], 10);
    EXPECT_EQ(loaded["names"][1], "b");
}

TEST(StateCodecTest, CommitPendingPromotesObject) {
    TempDir workspace;
    workspace.Write(StateCodec::kPendingFile, R"({"counter": 2})");

    EXPECT_TRUE(StateCodec::CommitPending(workspace.Path()));
    EXPECT_FALSE(fs::exists(workspace.Path() / StateCodec::kPendingFile));
    EXPECT_EQ(StateCodec::Load(workspace.Path())["counter"], 2);
}

TEST(StateCodecTest, CommitPendingKeepsOldStateOnGarbage) {
    TempDir workspace;
    StateCodec::Save(workspace.Path(), {{"counter", 1}});
    workspace.Write(StateCodec::kPendingFile, "{\"counter\": ");

    EXPECT_FALSE(StateCodec::CommitPending(workspace.Path()));
    EXPECT_FALSE(fs::exists(workspace.Path() / StateCodec::kPendingFile));
    EXPECT_EQ(StateCodec::Load(workspace.Path())["counter"], 1);

    workspace.Write(StateCodec::kPendingFile, "\"just a string\"");
    EXPECT_FALSE(StateCodec::CommitPending(workspace.Path()));
    EXPECT_EQ(StateCodec::Load(workspace.Path())["counter"], 1);
}

TEST(StateCodecTest, CommitWithoutPendingIsNoop) {
    TempDir workspace;
    EXPECT_FALSE(StateCodec::CommitPending(workspace.Path()));
    EXPECT_FALSE(fs::exists(workspace.Path() / StateCodec::kStateFile));
}
