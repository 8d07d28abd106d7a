/**
 * @file wasi_host_test.cpp
 * @brief Tests for the capability filesystem and stdio of the WASI host
 *
 * Drives WasiHost directly against a plain byte buffer standing in for guest
 * linear memory.
 *
 * @date 2025
 */

#include "wasmbox/core/errors.hpp"
#include "wasmbox/wasm/wasi_host.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using namespace wasmbox::wasm;
using wasmbox::testing::TempDir;

namespace {

constexpr std::uint32_t kOflagCreat = 1;
constexpr std::uint32_t kOflagTrunc = 8;
constexpr std::uint64_t kRightFdRead = 1ULL << 1;
constexpr std::uint64_t kRightFdWrite = 1ULL << 6;

// Guest memory layout used by the helpers
constexpr std::uint32_t kPathAddr = 0x100;
constexpr std::uint32_t kFdOut = 0x40;
constexpr std::uint32_t kIovAddr = 0x80;
constexpr std::uint32_t kCountOut = 0x90;
constexpr std::uint32_t kDataAddr = 0x1000;

class WasiHostTest : public ::testing::Test {
protected:
    void SetUp() override {
        data_.Write("input.csv", "a,b\n1,2\n");

        WasiHost::Config config;
        config.args = {"python", "-I", "/app/user_code.py"};
        config.env = {"PYTHONHASHSEED=0", "HOME=/app"};
        config.preopens = {
            {"/app", workspace_.Path(), false},
            {"/data", data_.Path(), true},
        };
        config.stdout_max_bytes = 16;
        host_ = std::make_unique<WasiHost>(config);

        memory_.assign(64 * 1024, 0);
        mem_ = std::make_unique<GuestMemory>(memory_.data(), memory_.size());
    }

    std::uint32_t AppFd() const { return *host_->FindPreopenFd("/app"); }
    std::uint32_t DataFd() const { return *host_->FindPreopenFd("/data"); }

    std::uint16_t Open(std::uint32_t dirfd, const std::string& path, std::uint32_t oflags,
                       std::uint64_t rights, std::uint32_t& fd) {
        EXPECT_TRUE(mem_->Write(kPathAddr, path.data(), path.size()));
        std::uint16_t err = host_->PathOpen(*mem_, dirfd, 0, kPathAddr, static_cast<std::uint32_t>(path.size()),
                                            oflags, rights, rights, 0, kFdOut);
        std::uint32_t opened = 0;
        mem_->Load(kFdOut, opened);
        fd = opened;
        return err;
    }

    std::uint16_t Write(std::uint32_t fd, const std::string& text, std::uint32_t& written) {
        EXPECT_TRUE(mem_->Write(kDataAddr, text.data(), text.size()));
        EXPECT_TRUE(mem_->Store<std::uint32_t>(kIovAddr, kDataAddr));
        EXPECT_TRUE(mem_->Store<std::uint32_t>(kIovAddr + 4, static_cast<std::uint32_t>(text.size())));
        std::uint16_t err = host_->FdWrite(*mem_, fd, kIovAddr, 1, kCountOut);
        mem_->Load(kCountOut, written);
        return err;
    }

    std::string Read(std::uint32_t fd, std::uint32_t length) {
        EXPECT_TRUE(mem_->Store<std::uint32_t>(kIovAddr, kDataAddr));
        EXPECT_TRUE(mem_->Store<std::uint32_t>(kIovAddr + 4, length));
        EXPECT_EQ(host_->FdRead(*mem_, fd, kIovAddr, 1, kCountOut), wasi_errno::kSuccess);
        std::uint32_t count = 0;
        mem_->Load(kCountOut, count);
        return *mem_->ReadString(kDataAddr, count);
    }

    TempDir workspace_;
    TempDir data_;
    std::unique_ptr<WasiHost> host_;
    std::vector<std::uint8_t> memory_;
    std::unique_ptr<GuestMemory> mem_;
};

} // anonymous namespace

TEST_F(WasiHostTest, PreopensStartAtThree) {
    EXPECT_EQ(AppFd(), 3u);
    EXPECT_EQ(DataFd(), 4u);
    EXPECT_FALSE(host_->FindPreopenFd("/tmp").has_value());

    ASSERT_EQ(host_->FdPrestatGet(*mem_, 4, kCountOut), wasi_errno::kSuccess);
    std::uint32_t name_len = 0;
    mem_->Load(kCountOut + 4, name_len);
    EXPECT_EQ(name_len, 5u);
    EXPECT_EQ(host_->FdPrestatGet(*mem_, 1, kCountOut), wasi_errno::kBadf);
}

TEST_F(WasiHostTest, ResolveGuestPathConfinesToPreopen) {
    std::size_t preopen = 0;
    std::vector<std::string> components;

    EXPECT_EQ(host_->ResolveGuestPath(AppFd(), "out/./report.txt", preopen, components), wasi_errno::kSuccess);
    ASSERT_EQ(components.size(), 2u);
    EXPECT_EQ(components[1], "report.txt");

    EXPECT_EQ(host_->ResolveGuestPath(AppFd(), "out/../x", preopen, components), wasi_errno::kSuccess);
    ASSERT_EQ(components.size(), 1u);

    EXPECT_EQ(host_->ResolveGuestPath(AppFd(), "../etc/passwd", preopen, components), wasi_errno::kNotcapable);
    EXPECT_EQ(host_->ResolveGuestPath(AppFd(), "a/../../b", preopen, components), wasi_errno::kNotcapable);
    EXPECT_EQ(host_->ResolveGuestPath(AppFd(), "/etc/passwd", preopen, components), wasi_errno::kNotcapable);
    EXPECT_EQ(host_->ResolveGuestPath(AppFd(), "", preopen, components), wasi_errno::kNoent);
    EXPECT_EQ(host_->ResolveGuestPath(1, "x", preopen, components), wasi_errno::kNotdir);
    EXPECT_EQ(host_->ResolveGuestPath(99, "x", preopen, components), wasi_errno::kBadf);
}

TEST_F(WasiHostTest, CreateWriteAndReadBack) {
    std::uint32_t fd = 0;
    ASSERT_EQ(Open(AppFd(), "result.txt", kOflagCreat | kOflagTrunc, kRightFdRead | kRightFdWrite, fd),
              wasi_errno::kSuccess);
    EXPECT_GE(fd, 5u);

    std::uint32_t written = 0;
    ASSERT_EQ(Write(fd, "42\n", written), wasi_errno::kSuccess);
    EXPECT_EQ(written, 3u);
    EXPECT_EQ(host_->FdClose(fd), wasi_errno::kSuccess);
    EXPECT_EQ(workspace_.Read("result.txt"), "42\n");

    ASSERT_EQ(Open(DataFd(), "input.csv", 0, kRightFdRead, fd), wasi_errno::kSuccess);
    EXPECT_EQ(Read(fd, 64), "a,b\n1,2\n");
}

TEST_F(WasiHostTest, ReadOnlyPreopenRefusesMutation) {
    std::uint32_t fd = 0;
    EXPECT_EQ(Open(DataFd(), "new.txt", kOflagCreat, kRightFdWrite, fd), wasi_errno::kRofs);
    EXPECT_EQ(Open(DataFd(), "input.csv", kOflagTrunc, kRightFdWrite, fd), wasi_errno::kRofs);
    EXPECT_EQ(Open(DataFd(), "input.csv", 0, kRightFdWrite, fd), wasi_errno::kRofs);
    EXPECT_FALSE(fs::exists(data_.Path() / "new.txt"));

    const std::string name = "input.csv";
    ASSERT_TRUE(mem_->Write(kPathAddr, name.data(), name.size()));
    EXPECT_EQ(host_->PathUnlinkFile(*mem_, DataFd(), kPathAddr, static_cast<std::uint32_t>(name.size())),
              wasi_errno::kRofs);
    EXPECT_EQ(host_->PathCreateDirectory(*mem_, DataFd(), kPathAddr, static_cast<std::uint32_t>(name.size())),
              wasi_errno::kRofs);
    EXPECT_EQ(data_.Read("input.csv"), "a,b\n1,2\n");
}

TEST_F(WasiHostTest, SymlinksAreNeverFollowed) {
    TempDir outside;
    outside.Write("secret.txt", "s3cr3t");
    fs::create_symlink(outside.Path() / "secret.txt", workspace_.Path() / "leak.txt");
    fs::create_directory_symlink(outside.Path(), workspace_.Path() / "escape");

    std::uint32_t fd = 0;
    EXPECT_EQ(Open(AppFd(), "leak.txt", 0, kRightFdRead, fd), wasi_errno::kNotcapable);
    EXPECT_EQ(Open(AppFd(), "escape/secret.txt", 0, kRightFdRead, fd), wasi_errno::kNotcapable);
    EXPECT_EQ(Open(AppFd(), "escape/planted.txt", kOflagCreat, kRightFdWrite, fd), wasi_errno::kNotcapable);
    EXPECT_FALSE(fs::exists(outside.Path() / "planted.txt"));
}

TEST_F(WasiHostTest, StdoutIsCappedButWritesReportFullLength) {
    std::uint32_t written = 0;
    ASSERT_EQ(Write(1, "0123456789abcdefXYZ", written), wasi_errno::kSuccess);
    EXPECT_EQ(written, 19u);
    EXPECT_EQ(host_->Stdout().GetContents(), "0123456789abcdef");
    EXPECT_TRUE(host_->Stdout().IsTruncated());

    ASSERT_EQ(Write(2, "warning\n", written), wasi_errno::kSuccess);
    EXPECT_EQ(host_->Stderr().GetContents(), "warning\n");

    EXPECT_EQ(Write(0, "x", written), wasi_errno::kBadf);
}

TEST_F(WasiHostTest, ArgsAndEnvironment) {
    ASSERT_EQ(host_->ArgsSizesGet(*mem_, kCountOut, kCountOut + 4), wasi_errno::kSuccess);
    std::uint32_t argc = 0, argv_size = 0;
    mem_->Load(kCountOut, argc);
    mem_->Load(kCountOut + 4, argv_size);
    EXPECT_EQ(argc, 3u);
    EXPECT_EQ(argv_size, std::string("python -I /app/user_code.py").size() + 1);

    ASSERT_EQ(host_->ArgsGet(*mem_, kIovAddr, kDataAddr), wasi_errno::kSuccess);
    std::uint32_t third = 0;
    mem_->Load(kIovAddr + 8, third);
    EXPECT_EQ(*mem_->ReadString(third, 17), "/app/user_code.py");

    ASSERT_EQ(host_->EnvironSizesGet(*mem_, kCountOut, kCountOut + 4), wasi_errno::kSuccess);
    std::uint32_t envc = 0;
    mem_->Load(kCountOut, envc);
    EXPECT_EQ(envc, 2u);
}

TEST_F(WasiHostTest, OutOfBoundsPointersFault) {
    std::uint32_t beyond = static_cast<std::uint32_t>(memory_.size() - 2);
    EXPECT_EQ(host_->ArgsSizesGet(*mem_, beyond, kCountOut), wasi_errno::kFault);
    EXPECT_EQ(host_->RandomGet(*mem_, beyond, 16), wasi_errno::kFault);
    EXPECT_EQ(host_->RandomGet(*mem_, kDataAddr, 16), wasi_errno::kSuccess);
}

TEST_F(WasiHostTest, ProcExitAndCancel) {
    EXPECT_FALSE(host_->GetExitCode().has_value());
    host_->ProcExit(3);
    ASSERT_TRUE(host_->GetExitCode().has_value());
    EXPECT_EQ(*host_->GetExitCode(), 3);

    EXPECT_FALSE(host_->IsCancelled());
    host_->Cancel();
    EXPECT_TRUE(host_->IsCancelled());
}

TEST_F(WasiHostTest, LinksAreRefused) {
    EXPECT_EQ(host_->PathLink(), wasi_errno::kPerm);
    EXPECT_EQ(host_->PathSymlink(), wasi_errno::kPerm);
}

TEST(WasiHostSetupTest, MissingPreopenThrows) {
    WasiHost::Config config;
    config.preopens = {{"/app", "/nonexistent/wasmbox/workspace", false}};
    EXPECT_THROW(WasiHost host(config), wasmbox::core::HostSetupError);
}
