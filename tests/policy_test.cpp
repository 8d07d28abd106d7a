/**
 * @file policy_test.cpp
 * @brief Tests for ExecutionPolicy validation and JSON loading
 *
 * @date 2025
 */

#include "wasmbox/core/errors.hpp"
#include "wasmbox/core/execution_policy.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using wasmbox::core::ExecutionPolicy;
using wasmbox::core::HostSetupError;
using wasmbox::testing::TempDir;

TEST(ExecutionPolicyTest, DefaultsAreValid) {
    ExecutionPolicy policy;
    EXPECT_NO_THROW(policy.Validate());
    EXPECT_EQ(policy.MemoryPages(), 2048u);
    EXPECT_EQ(policy.guest_mount_path, "/app");
    EXPECT_FALSE(policy.timeout.has_value());
    EXPECT_EQ(policy.env.at("PYTHONHASHSEED"), "0");
}

TEST(ExecutionPolicyTest, RejectsZeroAndOversizedBudgets) {
    ExecutionPolicy policy;
    policy.fuel_budget = 0;
    EXPECT_THROW(policy.Validate(), HostSetupError);

    policy.fuel_budget = wasmbox::core::kMaxFuelBudget + 1;
    EXPECT_THROW(policy.Validate(), HostSetupError);

    policy.fuel_budget = wasmbox::core::kMaxFuelBudget;
    EXPECT_NO_THROW(policy.Validate());
}

TEST(ExecutionPolicyTest, MemoryMustBePageAligned) {
    ExecutionPolicy policy;
    policy.memory_bytes = 100000;
    EXPECT_THROW(policy.Validate(), HostSetupError);

    policy.memory_bytes = 0;
    EXPECT_THROW(policy.Validate(), HostSetupError);

    policy.memory_bytes = 3 * wasmbox::core::kWasmPageSize;
    EXPECT_NO_THROW(policy.Validate());
    EXPECT_EQ(policy.MemoryPages(), 3u);
}

TEST(ExecutionPolicyTest, RejectsNegativeTimeout) {
    ExecutionPolicy policy;
    policy.timeout = -1.0;
    EXPECT_THROW(policy.Validate(), HostSetupError);
    policy.timeout = 2.5;
    EXPECT_NO_THROW(policy.Validate());
}

TEST(ExecutionPolicyTest, MountPathsMustBeDistinctAndAbsolute) {
    ExecutionPolicy policy;
    policy.additional_readonly_mounts.push_back({"/srv/data", "external"});
    EXPECT_THROW(policy.Validate(), HostSetupError);

    policy.additional_readonly_mounts = {{"/srv/data", "/app"}};
    EXPECT_THROW(policy.Validate(), HostSetupError);

    policy.additional_readonly_mounts = {{"/srv/data", "/external/../app"}};
    EXPECT_THROW(policy.Validate(), HostSetupError);

    policy.additional_readonly_mounts = {{"/srv/data", "/external"}};
    EXPECT_NO_THROW(policy.Validate());
}

TEST(ExecutionPolicyTest, FromJsonOverridesOnlyGivenKeys) {
    auto policy = ExecutionPolicy::FromJson({
        {"fuel_budget", 5000000000ULL},
        {"timeout", 30},
        {"unknown_key", "ignored"},
        {"additional_readonly_mounts", {{{"host_path", "/srv/ext"}, {"guest_path", "/external"}}}},
    });

    EXPECT_EQ(policy.fuel_budget, 5000000000ULL);
    ASSERT_TRUE(policy.timeout.has_value());
    EXPECT_DOUBLE_EQ(*policy.timeout, 30.0);
    EXPECT_EQ(policy.memory_bytes, 128ULL * 1024 * 1024);
    ASSERT_EQ(policy.additional_readonly_mounts.size(), 1u);
    EXPECT_EQ(policy.additional_readonly_mounts[0].guest_path, "/external");
}

TEST(ExecutionPolicyTest, FromJsonRejectsWrongTypes) {
    EXPECT_THROW(ExecutionPolicy::FromJson({{"fuel_budget", "lots"}}), HostSetupError);
    EXPECT_THROW(ExecutionPolicy::FromJson(nlohmann::json::array()), HostSetupError);
    EXPECT_THROW(ExecutionPolicy::FromJson({{"memory_bytes", 12345}}), HostSetupError);
    EXPECT_THROW(ExecutionPolicy::FromJson({{"fuel_budget", 1.5}}), HostSetupError);
}

TEST(ExecutionPolicyTest, FromJsonRejectsNegativeLimits) {
    EXPECT_THROW(ExecutionPolicy::FromJson({{"stdout_max_bytes", -1}}), HostSetupError);
    EXPECT_THROW(ExecutionPolicy::FromJson({{"stderr_max_bytes", -5}}), HostSetupError);
    EXPECT_THROW(ExecutionPolicy::FromJson({{"fuel_budget", -1000}}), HostSetupError);
    EXPECT_THROW(ExecutionPolicy::FromJson(nlohmann::json::parse(R"({"memory_bytes": -65536})")),
                 HostSetupError);

    auto policy = ExecutionPolicy::FromJson({{"stdout_max_bytes", 4096}});
    EXPECT_EQ(policy.stdout_max_bytes, 4096u);
}

TEST(ExecutionPolicyTest, ToJsonLoadsBack) {
    ExecutionPolicy original;
    original.fuel_budget = 123456789;
    original.timeout = 4.0;
    original.mount_data_dir = std::filesystem::path("/opt/wasmbox/data");
    original.inject_setup = false;

    auto restored = ExecutionPolicy::FromJson(original.ToJson());
    EXPECT_EQ(restored.fuel_budget, original.fuel_budget);
    EXPECT_EQ(restored.timeout, original.timeout);
    EXPECT_EQ(restored.mount_data_dir, original.mount_data_dir);
    EXPECT_FALSE(restored.inject_setup);
}

TEST(ExecutionPolicyTest, LoadFromFile) {
    TempDir dir;
    auto file = dir.Write("policy.json", R"({"memory_bytes": 65536, "stdout_max_bytes": 100})");
    auto policy = ExecutionPolicy::LoadFromFile(file);
    EXPECT_EQ(policy.MemoryPages(), 1u);
    EXPECT_EQ(policy.stdout_max_bytes, 100u);

    auto broken = dir.Write("broken.json", "{not json");
    EXPECT_THROW(ExecutionPolicy::LoadFromFile(broken), HostSetupError);
    EXPECT_THROW(ExecutionPolicy::LoadFromFile(dir.Path() / "missing.json"), HostSetupError);
}
