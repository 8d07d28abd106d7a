/**
 * @file module_instrumenter_test.cpp
 * @brief Tests for fuel metering injection and memory clamping
 *
 * @date 2025
 */

#include "wasmbox/wasm/module_instrumenter.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>

using wasmbox::testing::kI32;
using wasmbox::testing::WasmModuleBuilder;
using wasmbox::wasm::InstrumentationError;
using wasmbox::wasm::ModuleInstrumenter;

namespace {

bool Contains(const std::vector<std::uint8_t>& haystack, const std::string& needle) {
    return std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end()) != haystack.end();
}

/// `_start` spinning in `loop br 0 end`
std::vector<std::uint8_t> LoopModule() {
    WasmModuleBuilder builder;
    auto type = builder.AddType({}, {});
    auto start = builder.AddFunction(type, {}, {0x03, 0x40, 0x0C, 0x00, 0x0B, 0x0B});
    builder.ExportFunction("_start", start);
    return builder.Build();
}

std::vector<std::uint8_t> MemoryModule(std::uint32_t min, std::optional<std::uint32_t> max) {
    WasmModuleBuilder builder;
    auto type = builder.AddType({}, {});
    auto start = builder.AddFunction(type, {}, {0x0B});
    builder.SetMemory(min, max);
    builder.ExportMemory("memory");
    builder.ExportFunction("_start", start);
    return builder.Build();
}

} // anonymous namespace

TEST(ModuleInstrumenterTest, RejectsNonWasmInput) {
    ModuleInstrumenter instrumenter;
    EXPECT_THROW(instrumenter.Instrument({}, 16), InstrumentationError);
    EXPECT_THROW(instrumenter.Instrument({'\x7f', 'E', 'L', 'F', 2, 1, 1, 0}, 16), InstrumentationError);
}

TEST(ModuleInstrumenterTest, RejectsTruncatedModule) {
    auto bytes = LoopModule();
    bytes.resize(bytes.size() - 3);
    EXPECT_THROW(ModuleInstrumenter().Instrument(bytes, 16), InstrumentationError);
}

TEST(ModuleInstrumenterTest, AppendsAndExportsFuelGlobal) {
    auto result = ModuleInstrumenter().Instrument(LoopModule(), 16);

    EXPECT_EQ(result.fuel_global_index, 0u);
    EXPECT_EQ(result.function_count, 1u);
    EXPECT_TRUE(Contains(result.bytes, "__wasmbox_fuel"));
    EXPECT_TRUE(Contains(result.bytes, "_start"));
    EXPECT_GT(result.bytes.size(), LoopModule().size());
    EXPECT_FALSE(result.has_memory);
    EXPECT_FALSE(result.has_start_section);
}

TEST(ModuleInstrumenterTest, MetersEveryControlSegment) {
    auto result = ModuleInstrumenter().Instrument(LoopModule(), 16);
    // loop | br | end | end
    EXPECT_EQ(result.metered_segments, 4u);
}

TEST(ModuleInstrumenterTest, OutputIsStillParseable) {
    ModuleInstrumenter instrumenter;
    auto once = instrumenter.Instrument(LoopModule(), 16);
    // A second pass parses every section and then trips on its own export
    EXPECT_THROW(instrumenter.Instrument(once.bytes, 16), InstrumentationError);

    ModuleInstrumenter::Config config;
    config.fuel_export_name = "__second_counter";
    auto twice = ModuleInstrumenter(config).Instrument(once.bytes, 16);
    EXPECT_EQ(twice.fuel_global_index, 1u);
}

TEST(ModuleInstrumenterTest, ExistingExportNameCollides) {
    WasmModuleBuilder builder;
    auto type = builder.AddType({}, {});
    auto fn = builder.AddFunction(type, {}, {0x0B});
    builder.ExportFunction("__wasmbox_fuel", fn);
    EXPECT_THROW(ModuleInstrumenter().Instrument(builder.Build(), 16), InstrumentationError);
}

TEST(ModuleInstrumenterTest, RewriteIsDeterministic) {
    ModuleInstrumenter instrumenter;
    EXPECT_EQ(instrumenter.Instrument(LoopModule(), 16).bytes,
              instrumenter.Instrument(LoopModule(), 16).bytes);
}

TEST(ModuleInstrumenterTest, ClampsMemoryMaximum) {
    ModuleInstrumenter instrumenter;

    auto unbounded = instrumenter.Instrument(MemoryModule(1, std::nullopt), 4);
    EXPECT_TRUE(unbounded.has_memory);
    EXPECT_EQ(unbounded.initial_memory_pages, 1u);
    EXPECT_EQ(unbounded.max_memory_pages, 4u);
    EXPECT_FALSE(unbounded.initial_exceeds_ceiling);

    auto generous = instrumenter.Instrument(MemoryModule(2, 100), 4);
    EXPECT_EQ(generous.max_memory_pages, 4u);

    auto tight = instrumenter.Instrument(MemoryModule(2, 3), 4);
    EXPECT_EQ(tight.max_memory_pages, 3u);
}

TEST(ModuleInstrumenterTest, FlagsInitialMemoryAboveCeiling) {
    auto result = ModuleInstrumenter().Instrument(MemoryModule(8, std::nullopt), 4);
    EXPECT_TRUE(result.initial_exceeds_ceiling);
    EXPECT_EQ(result.initial_memory_pages, 8u);
}

TEST(ModuleInstrumenterTest, HandlesLocalsAndImmediates) {
    WasmModuleBuilder builder;
    auto type = builder.AddType({}, {kI32});
    // local.set 0 (i32.const 300); block; local.get 0; br_if 0; end; local.get 0
    auto body = wasmbox::testing::Concat({
        WasmModuleBuilder::I32Const(300),
        {0x21, 0x00, 0x02, 0x40, 0x20, 0x00, 0x0D, 0x00, 0x0B, 0x20, 0x00, 0x0B},
    });
    auto fn = builder.AddFunction(type, {{1, kI32}}, body);
    builder.ExportFunction("compute", fn);

    auto result = ModuleInstrumenter().Instrument(builder.Build(), 16);
    EXPECT_EQ(result.function_count, 1u);
    EXPECT_GE(result.metered_segments, 4u);
}

TEST(LebEncodingTest, SignedAndUnsigned) {
    std::vector<std::uint8_t> out;
    wasmbox::wasm::WriteVarU32(out, 624485);
    EXPECT_EQ(out, (std::vector<std::uint8_t>{0xE5, 0x8E, 0x26}));

    out.clear();
    wasmbox::wasm::WriteVarS64(out, -123456);
    EXPECT_EQ(out, (std::vector<std::uint8_t>{0xC0, 0xBB, 0x78}));

    out.clear();
    wasmbox::wasm::WriteVarS64(out, 64);
    EXPECT_EQ(out, (std::vector<std::uint8_t>{0xC0, 0x00}));
}
