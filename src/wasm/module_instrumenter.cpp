/**
 * @file module_instrumenter.cpp
 * @brief Implementation of fuel and memory instrumentation
 *
 * **Pipeline**:
 * 1. Split the binary into sections
 * 2. Count imported functions/globals and defined globals
 * 3. Append the fuel global and its export
 * 4. Clamp memory limits
 * 5. Decode every function body and inject charges at segment starts
 * 6. Reassemble sections in canonical order with recomputed sizes
 *
 * Opcode coverage: MVP, sign extension, saturating truncation, bulk memory,
 * reference types, tail calls, exceptions, SIMD (0xFD) and atomics (0xFE).
 *
 * @date 2025
 */

#include "wasmbox/wasm/module_instrumenter.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdio>

namespace wasmbox {
namespace wasm {

namespace {

// ============================================================================
// BINARY FORMAT CONSTANTS
// ============================================================================

constexpr std::uint8_t kMagic[] = {0x00, 0x61, 0x73, 0x6D};
constexpr std::uint8_t kVersion[] = {0x01, 0x00, 0x00, 0x00};

enum SectionId : std::uint8_t {
    kCustomSection = 0,
    kTypeSection = 1,
    kImportSection = 2,
    kFunctionSection = 3,
    kTableSection = 4,
    kMemorySection = 5,
    kGlobalSection = 6,
    kExportSection = 7,
    kStartSection = 8,
    kElementSection = 9,
    kCodeSection = 10,
    kDataSection = 11,
    kDataCountSection = 12,
    kTagSection = 13,
};

enum ExternalKind : std::uint8_t {
    kExternFunction = 0,
    kExternTable = 1,
    kExternMemory = 2,
    kExternGlobal = 3,
    kExternTag = 4,
};

constexpr std::uint8_t kOpUnreachable = 0x00;
constexpr std::uint8_t kOpIf = 0x04;
constexpr std::uint8_t kOpEnd = 0x0B;
constexpr std::uint8_t kOpGlobalGet = 0x23;
constexpr std::uint8_t kOpGlobalSet = 0x24;
constexpr std::uint8_t kOpI64Const = 0x42;
constexpr std::uint8_t kOpI64LtS = 0x53;
constexpr std::uint8_t kOpI64Sub = 0x7D;
constexpr std::uint8_t kBlockTypeEmpty = 0x40;
constexpr std::uint8_t kValTypeI64 = 0x7E;

/// Canonical position of each known section (custom sections float)
int SectionRank(std::uint8_t id) {
    switch (id) {
        case kTypeSection: return 1;
        case kImportSection: return 2;
        case kFunctionSection: return 3;
        case kTableSection: return 4;
        case kMemorySection: return 5;
        case kTagSection: return 6;
        case kGlobalSection: return 7;
        case kExportSection: return 8;
        case kStartSection: return 9;
        case kElementSection: return 10;
        case kDataCountSection: return 11;
        case kCodeSection: return 12;
        case kDataSection: return 13;
        default: return 0;
    }
}

// ============================================================================
// BYTE READER
// ============================================================================

class ByteReader {
public:
    ByteReader(const std::uint8_t* data, std::size_t size)
        : data_(data), size_(size) {}

    std::size_t Position() const { return pos_; }
    bool AtEnd() const { return pos_ >= size_; }
    std::size_t Remaining() const { return size_ - pos_; }

    std::uint8_t ReadU8() {
        if (pos_ >= size_) {
            throw InstrumentationError("unexpected end of input");
        }
        return data_[pos_++];
    }

    void Skip(std::size_t count) {
        if (count > Remaining()) {
            throw InstrumentationError("unexpected end of input");
        }
        pos_ += count;
    }

    std::uint64_t ReadVarUnsigned(unsigned max_bits) {
        std::uint64_t result = 0;
        unsigned shift = 0;
        while (true) {
            std::uint8_t byte = ReadU8();
            if (shift >= max_bits) {
                throw InstrumentationError("LEB128 value too long");
            }
            result |= static_cast<std::uint64_t>(byte & 0x7F) << shift;
            shift += 7;
            if ((byte & 0x80) == 0) {
                break;
            }
        }
        return result;
    }

    std::int64_t ReadVarSigned(unsigned max_bits) {
        const unsigned max_bytes = (max_bits + 6) / 7;
        std::int64_t result = 0;
        unsigned shift = 0;
        unsigned count = 0;
        std::uint8_t byte = 0;
        do {
            if (++count > max_bytes) {
                throw InstrumentationError("LEB128 value too long");
            }
            byte = ReadU8();
            if (shift < 64) {
                result |= static_cast<std::int64_t>(static_cast<std::uint64_t>(byte & 0x7F) << shift);
            }
            shift += 7;
        } while (byte & 0x80);

        if (shift < 64 && (byte & 0x40)) {
            result |= static_cast<std::int64_t>(~std::uint64_t{0} << shift);
        }
        return result;
    }

    std::uint32_t ReadVarU32() { return static_cast<std::uint32_t>(ReadVarUnsigned(35)); }

private:
    const std::uint8_t* data_;
    std::size_t size_;
    std::size_t pos_{0};
};

// ============================================================================
// INSTRUCTION DECODING
// ============================================================================

void SkipMemArg(ByteReader& r) {
    std::uint32_t align = r.ReadVarU32();
    if (align & 0x40) {
        r.ReadVarU32();   // multi-memory index
    }
    r.ReadVarUnsigned(70); // offset (u64 for memory64)
}

void SkipBlockType(ByteReader& r) {
    r.ReadVarSigned(33);
}

void SkipValType(ByteReader& r) {
    std::uint8_t type = r.ReadU8();
    // (ref ht) / (ref null ht)
    if (type == 0x63 || type == 0x64) {
        r.ReadVarSigned(33);
    }
}

void SkipPrefixedFC(ByteReader& r) {
    std::uint32_t sub = r.ReadVarU32();
    switch (sub) {
        case 0: case 1: case 2: case 3: case 4: case 5: case 6: case 7:
            break;                                  // trunc_sat
        case 8: r.ReadVarU32(); r.ReadVarU32(); break;   // memory.init
        case 9: r.ReadVarU32(); break;                   // data.drop
        case 10: r.ReadVarU32(); r.ReadVarU32(); break;  // memory.copy
        case 11: r.ReadVarU32(); break;                  // memory.fill
        case 12: r.ReadVarU32(); r.ReadVarU32(); break;  // table.init
        case 13: r.ReadVarU32(); break;                  // elem.drop
        case 14: r.ReadVarU32(); r.ReadVarU32(); break;  // table.copy
        case 15: case 16: case 17: r.ReadVarU32(); break; // table.grow/size/fill
        default:
            throw InstrumentationError("unknown 0xFC opcode " + std::to_string(sub));
    }
}

void SkipPrefixedFD(ByteReader& r) {
    std::uint32_t sub = r.ReadVarU32();
    if (sub <= 11) {
        SkipMemArg(r);                              // v128 loads/stores
    } else if (sub == 12 || sub == 13) {
        r.Skip(16);                                 // v128.const, i8x16.shuffle
    } else if (sub >= 21 && sub <= 34) {
        r.Skip(1);                                  // extract/replace lane
    } else if (sub >= 84 && sub <= 91) {
        SkipMemArg(r);                              // load/store lane
        r.Skip(1);
    } else if (sub == 92 || sub == 93) {
        SkipMemArg(r);                              // load32_zero/load64_zero
    } else if (sub > 0x113) {
        throw InstrumentationError("unknown 0xFD opcode " + std::to_string(sub));
    }
}

void SkipPrefixedFE(ByteReader& r) {
    std::uint32_t sub = r.ReadVarU32();
    if (sub == 0x03) {
        r.Skip(1);                                  // atomic.fence
    } else if (sub <= 0x4E) {
        SkipMemArg(r);
    } else {
        throw InstrumentationError("unknown 0xFE opcode " + std::to_string(sub));
    }
}

/**
 * Consume the immediates of one instruction whose opcode has been read.
 */
void SkipImmediates(ByteReader& r, std::uint8_t op) {
    switch (op) {
        case 0x00: case 0x01: case 0x05: case 0x0B: case 0x0F:
        case 0x19: case 0x1A: case 0x1B: case 0xD1:
            return;

        case 0x02: case 0x03: case 0x04: case 0x06:
            SkipBlockType(r);
            return;

        case 0x07: case 0x08: case 0x09: case 0x18:
        case 0x0C: case 0x0D:
        case 0x10: case 0x12:
        case 0x20: case 0x21: case 0x22: case 0x23: case 0x24:
        case 0x25: case 0x26:
        case 0x3F: case 0x40:
        case 0xD2:
            r.ReadVarU32();
            return;

        case 0x0E: {
            std::uint32_t count = r.ReadVarU32();
            for (std::uint32_t i = 0; i <= count; ++i) {
                r.ReadVarU32();
            }
            return;
        }

        case 0x11: case 0x13:
            r.ReadVarU32();
            r.ReadVarU32();
            return;

        case 0x1C: {
            std::uint32_t count = r.ReadVarU32();
            for (std::uint32_t i = 0; i < count; ++i) {
                SkipValType(r);
            }
            return;
        }

        case 0x41: r.ReadVarSigned(32); return;
        case 0x42: r.ReadVarSigned(64); return;
        case 0x43: r.Skip(4); return;
        case 0x44: r.Skip(8); return;

        case 0xD0:
            r.ReadVarSigned(33);   // heap type
            return;

        case 0xFC: SkipPrefixedFC(r); return;
        case 0xFD: SkipPrefixedFD(r); return;
        case 0xFE: SkipPrefixedFE(r); return;

        default:
            break;
    }

    if (op >= 0x28 && op <= 0x3E) {
        SkipMemArg(r);
        return;
    }
    if (op >= 0x45 && op <= 0xC4) {
        return;   // numeric, no immediates
    }

    char hex[8];
    std::snprintf(hex, sizeof(hex), "0x%02x", op);
    throw InstrumentationError(std::string("unknown opcode ") + hex);
}

/// Instructions after which a new metered segment starts
bool EndsSegment(std::uint8_t op) {
    switch (op) {
        case 0x00:  // unreachable
        case 0x02:  // block
        case 0x03:  // loop
        case 0x04:  // if
        case 0x05:  // else
        case 0x06:  // try
        case 0x07:  // catch
        case 0x08:  // throw
        case 0x09:  // rethrow
        case 0x0B:  // end
        case 0x0C:  // br
        case 0x0D:  // br_if
        case 0x0E:  // br_table
        case 0x0F:  // return
        case 0x12:  // return_call
        case 0x13:  // return_call_indirect
        case 0x18:  // delegate
        case 0x19:  // catch_all
            return true;
        default:
            return false;
    }
}

struct Instruction {
    std::size_t start;
    std::size_t end;
    std::uint8_t opcode;
};

void EmitCharge(std::vector<std::uint8_t>& out, std::uint32_t global, std::int64_t cost) {
    out.push_back(kOpGlobalGet);
    WriteVarU32(out, global);
    out.push_back(kOpI64Const);
    WriteVarS64(out, cost);
    out.push_back(kOpI64Sub);
    out.push_back(kOpGlobalSet);
    WriteVarU32(out, global);

    out.push_back(kOpGlobalGet);
    WriteVarU32(out, global);
    out.push_back(kOpI64Const);
    out.push_back(0x00);
    out.push_back(kOpI64LtS);
    out.push_back(kOpIf);
    out.push_back(kBlockTypeEmpty);
    out.push_back(kOpUnreachable);
    out.push_back(kOpEnd);
}

std::vector<std::uint8_t> InstrumentBody(const std::uint8_t* body, std::size_t size,
                                         std::uint32_t fuel_global, std::size_t& segments) {
    ByteReader r(body, size);

    std::uint32_t local_groups = r.ReadVarU32();
    for (std::uint32_t i = 0; i < local_groups; ++i) {
        r.ReadVarU32();
        SkipValType(r);
    }
    std::size_t expr_start = r.Position();

    std::vector<Instruction> instructions;
    while (!r.AtEnd()) {
        Instruction instr;
        instr.start = r.Position();
        instr.opcode = r.ReadU8();
        SkipImmediates(r, instr.opcode);
        instr.end = r.Position();
        instructions.push_back(instr);
    }

    if (instructions.empty() || instructions.back().opcode != kOpEnd) {
        throw InstrumentationError("function body does not end with 'end'");
    }

    std::vector<std::uint8_t> out;
    out.reserve(size + size / 2);
    out.insert(out.end(), body, body + expr_start);

    bool at_segment_start = true;
    for (std::size_t i = 0; i < instructions.size(); ++i) {
        if (at_segment_start) {
            std::size_t j = i;
            while (j < instructions.size() && !EndsSegment(instructions[j].opcode)) {
                ++j;
            }
            std::size_t last = std::min(j, instructions.size() - 1);
            EmitCharge(out, fuel_global, static_cast<std::int64_t>(last - i + 1));
            ++segments;
            at_segment_start = false;
        }

        const auto& instr = instructions[i];
        out.insert(out.end(), body + instr.start, body + instr.end);

        if (EndsSegment(instr.opcode) && i + 1 < instructions.size()) {
            at_segment_start = true;
        }
    }

    return out;
}

// ============================================================================
// SECTION HELPERS
// ============================================================================

struct Section {
    std::uint8_t id;
    std::vector<std::uint8_t> payload;
};

void SkipName(ByteReader& r) {
    std::uint32_t length = r.ReadVarU32();
    r.Skip(length);
}

std::string ReadName(ByteReader& r, const std::uint8_t* base) {
    std::uint32_t length = r.ReadVarU32();
    std::size_t start = r.Position();
    r.Skip(length);
    return std::string(reinterpret_cast<const char*>(base + start), length);
}

struct Limits {
    std::uint8_t flags{0};
    std::uint64_t min{0};
    std::uint64_t max{0};
    bool has_max{false};
};

Limits ReadLimits(ByteReader& r) {
    Limits limits;
    limits.flags = r.ReadU8();
    if (limits.flags & 0x04) {
        throw InstrumentationError("64-bit memories are not supported");
    }
    limits.min = r.ReadVarU32();
    limits.has_max = (limits.flags & 0x01) != 0;
    if (limits.has_max) {
        limits.max = r.ReadVarU32();
    }
    return limits;
}

void AppendPayload(std::vector<std::uint8_t>& out, const std::uint8_t* data, std::size_t from, std::size_t to) {
    out.insert(out.end(), data + from, data + to);
}

} // anonymous namespace

// ============================================================================
// LEB128 ENCODING
// ============================================================================

void WriteVarU32(std::vector<std::uint8_t>& out, std::uint32_t value) {
    do {
        std::uint8_t byte = value & 0x7F;
        value >>= 7;
        if (value != 0) {
            byte |= 0x80;
        }
        out.push_back(byte);
    } while (value != 0);
}

void WriteVarS64(std::vector<std::uint8_t>& out, std::int64_t value) {
    bool more = true;
    while (more) {
        std::uint8_t byte = value & 0x7F;
        value >>= 7;   // arithmetic shift
        bool sign_bit = (byte & 0x40) != 0;
        if ((value == 0 && !sign_bit) || (value == -1 && sign_bit)) {
            more = false;
        } else {
            byte |= 0x80;
        }
        out.push_back(byte);
    }
}

// ============================================================================
// INSTRUMENTER
// ============================================================================

ModuleInstrumenter::ModuleInstrumenter(const Config& config)
    : config_(config) {
}

ModuleInstrumenter::ModuleInstrumenter()
    : ModuleInstrumenter(Config{}) {
}

InstrumentedModule ModuleInstrumenter::Instrument(const std::vector<std::uint8_t>& module,
                                                  std::uint32_t memory_max_pages) const {
    if (module.size() < 8 ||
        !std::equal(std::begin(kMagic), std::end(kMagic), module.begin()) ||
        !std::equal(std::begin(kVersion), std::end(kVersion), module.begin() + 4)) {
        throw InstrumentationError("not a WebAssembly 1.0 binary");
    }

    // ------------------------------------------------------------------
    // Split sections
    // ------------------------------------------------------------------
    std::vector<Section> sections;
    {
        ByteReader r(module.data() + 8, module.size() - 8);
        int last_rank = 0;
        while (!r.AtEnd()) {
            Section section;
            section.id = r.ReadU8();
            std::uint32_t size = r.ReadVarU32();
            if (size > r.Remaining()) {
                throw InstrumentationError("section " + std::to_string(section.id) + " overruns the module");
            }
            const std::uint8_t* start = module.data() + 8 + r.Position();
            section.payload.assign(start, start + size);
            r.Skip(size);

            if (section.id > kTagSection) {
                throw InstrumentationError("unknown section id " + std::to_string(section.id));
            }
            int rank = SectionRank(section.id);
            if (rank != 0) {
                if (rank <= last_rank) {
                    throw InstrumentationError("sections out of order");
                }
                last_rank = rank;
            }
            sections.push_back(std::move(section));
        }
    }

    auto find_section = [&sections](std::uint8_t id) -> Section* {
        for (auto& section : sections) {
            if (section.id == id) {
                return &section;
            }
        }
        return nullptr;
    };

    InstrumentedModule result;
    std::uint32_t imported_globals = 0;

    // ------------------------------------------------------------------
    // Imports
    // ------------------------------------------------------------------
    if (Section* imports = find_section(kImportSection)) {
        ByteReader r(imports->payload.data(), imports->payload.size());
        std::uint32_t count = r.ReadVarU32();
        for (std::uint32_t i = 0; i < count; ++i) {
            SkipName(r);
            SkipName(r);
            std::uint8_t kind = r.ReadU8();
            switch (kind) {
                case kExternFunction:
                    r.ReadVarU32();
                    break;
                case kExternTable:
                    SkipValType(r);
                    ReadLimits(r);
                    break;
                case kExternMemory:
                    throw InstrumentationError("imported memories are not supported");
                case kExternGlobal:
                    SkipValType(r);
                    r.ReadU8();
                    ++imported_globals;
                    break;
                case kExternTag:
                    r.ReadU8();
                    r.ReadVarU32();
                    break;
                default:
                    throw InstrumentationError("unknown import kind " + std::to_string(kind));
            }
        }
    }

    result.has_start_section = find_section(kStartSection) != nullptr;

    // ------------------------------------------------------------------
    // Globals: append the fuel counter
    // ------------------------------------------------------------------
    std::uint32_t defined_globals = 0;
    std::vector<std::uint8_t> global_payload;
    {
        std::vector<std::uint8_t> existing_entries;
        if (Section* globals = find_section(kGlobalSection)) {
            ByteReader r(globals->payload.data(), globals->payload.size());
            defined_globals = r.ReadVarU32();
            AppendPayload(existing_entries, globals->payload.data(), r.Position(), globals->payload.size());
        }

        WriteVarU32(global_payload, defined_globals + 1);
        global_payload.insert(global_payload.end(), existing_entries.begin(), existing_entries.end());
        global_payload.push_back(kValTypeI64);
        global_payload.push_back(0x01);          // mutable
        global_payload.push_back(kOpI64Const);
        global_payload.push_back(0x00);
        global_payload.push_back(kOpEnd);
    }
    result.fuel_global_index = imported_globals + defined_globals;

    // ------------------------------------------------------------------
    // Exports: publish the fuel counter
    // ------------------------------------------------------------------
    std::vector<std::uint8_t> export_payload;
    {
        std::uint32_t count = 0;
        std::vector<std::uint8_t> existing_entries;
        if (Section* exports = find_section(kExportSection)) {
            ByteReader r(exports->payload.data(), exports->payload.size());
            count = r.ReadVarU32();
            std::size_t entries_start = r.Position();
            for (std::uint32_t i = 0; i < count; ++i) {
                std::string name = ReadName(r, exports->payload.data());
                if (name == config_.fuel_export_name) {
                    throw InstrumentationError("module already exports '" + name + "'");
                }
                r.ReadU8();
                r.ReadVarU32();
            }
            AppendPayload(existing_entries, exports->payload.data(), entries_start, exports->payload.size());
        }

        WriteVarU32(export_payload, count + 1);
        export_payload.insert(export_payload.end(), existing_entries.begin(), existing_entries.end());
        WriteVarU32(export_payload, static_cast<std::uint32_t>(config_.fuel_export_name.size()));
        export_payload.insert(export_payload.end(), config_.fuel_export_name.begin(), config_.fuel_export_name.end());
        export_payload.push_back(kExternGlobal);
        WriteVarU32(export_payload, result.fuel_global_index);
    }

    // ------------------------------------------------------------------
    // Memory: clamp the maximum
    // ------------------------------------------------------------------
    if (Section* memories = find_section(kMemorySection)) {
        ByteReader r(memories->payload.data(), memories->payload.size());
        std::uint32_t count = r.ReadVarU32();

        std::vector<std::uint8_t> payload;
        WriteVarU32(payload, count);
        for (std::uint32_t i = 0; i < count; ++i) {
            Limits limits = ReadLimits(r);

            std::uint64_t new_max = limits.has_max ? std::min<std::uint64_t>(limits.max, memory_max_pages)
                                                   : memory_max_pages;
            if (limits.min > memory_max_pages) {
                result.initial_exceeds_ceiling = true;
                new_max = limits.min;
            }

            if (i == 0) {
                result.has_memory = true;
                result.initial_memory_pages = static_cast<std::uint32_t>(limits.min);
                result.max_memory_pages = static_cast<std::uint32_t>(new_max);
            }

            payload.push_back(static_cast<std::uint8_t>(limits.flags | 0x01));
            WriteVarU32(payload, static_cast<std::uint32_t>(limits.min));
            WriteVarU32(payload, static_cast<std::uint32_t>(new_max));
        }
        memories->payload = std::move(payload);
    }

    // ------------------------------------------------------------------
    // Code: meter every function body
    // ------------------------------------------------------------------
    if (Section* code = find_section(kCodeSection)) {
        ByteReader r(code->payload.data(), code->payload.size());
        std::uint32_t count = r.ReadVarU32();

        std::vector<std::uint8_t> payload;
        WriteVarU32(payload, count);
        for (std::uint32_t i = 0; i < count; ++i) {
            std::uint32_t body_size = r.ReadVarU32();
            std::size_t start = r.Position();
            r.Skip(body_size);

            auto body = InstrumentBody(code->payload.data() + start, body_size,
                                       result.fuel_global_index, result.metered_segments);
            WriteVarU32(payload, static_cast<std::uint32_t>(body.size()));
            payload.insert(payload.end(), body.begin(), body.end());
        }
        if (!r.AtEnd()) {
            throw InstrumentationError("trailing bytes in code section");
        }

        result.function_count = count;
        code->payload = std::move(payload);
    }

    // ------------------------------------------------------------------
    // Reassemble
    // ------------------------------------------------------------------
    auto upsert = [&sections](std::uint8_t id, std::vector<std::uint8_t> payload) {
        for (auto& section : sections) {
            if (section.id == id) {
                section.payload = std::move(payload);
                return;
            }
        }
        int rank = SectionRank(id);
        auto pos = std::find_if(sections.begin(), sections.end(), [rank](const Section& s) {
            return SectionRank(s.id) > rank;
        });
        sections.insert(pos, Section{id, std::move(payload)});
    };

    upsert(kGlobalSection, std::move(global_payload));
    upsert(kExportSection, std::move(export_payload));

    result.bytes.reserve(module.size() + module.size() / 2);
    result.bytes.insert(result.bytes.end(), std::begin(kMagic), std::end(kMagic));
    result.bytes.insert(result.bytes.end(), std::begin(kVersion), std::end(kVersion));
    for (const auto& section : sections) {
        result.bytes.push_back(section.id);
        WriteVarU32(result.bytes, static_cast<std::uint32_t>(section.payload.size()));
        result.bytes.insert(result.bytes.end(), section.payload.begin(), section.payload.end());
    }

    spdlog::debug("Instrumented module: {} functions, {} metered segments, fuel global #{}",
                  result.function_count, result.metered_segments, result.fuel_global_index);
    return result;
}

} // namespace wasm
} // namespace wasmbox
