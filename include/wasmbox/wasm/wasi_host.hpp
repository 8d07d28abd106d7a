/**
 * @file wasi_host.hpp
 * @brief Capability-based WASI preview1 host for sandboxed guests
 *
 * Implements the wasi_snapshot_preview1 system interface on top of POSIX
 * `*at()` calls. The guest sees only its preopened directories; every path
 * is resolved host-side relative to a preopen:
 *
 * - absolute guest paths are rejected
 * - `..` may never climb above the preopen
 * - every component is opened with O_NOFOLLOW, so symlinks are never followed
 * - read-only preopens refuse create, write, truncate, rename and unlink
 *
 * The class itself does not depend on the interpreter. Guest memory is passed
 * in as a bounds-checked GuestMemory view; the wasm3 bindings in
 * wasi_bindings.cpp unpack arguments and forward here.
 *
 * @date 2025
 */

#pragma once

#include "wasmbox/wasm/output_sink.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <sys/stat.h>

namespace wasmbox {
namespace wasm {

/// WASI errno values (wasi_snapshot_preview1 ABI)
namespace wasi_errno {
constexpr std::uint16_t kSuccess = 0;
constexpr std::uint16_t kAccess = 2;
constexpr std::uint16_t kAgain = 6;
constexpr std::uint16_t kBadf = 8;
constexpr std::uint16_t kBusy = 10;
constexpr std::uint16_t kExist = 20;
constexpr std::uint16_t kFault = 21;
constexpr std::uint16_t kFbig = 22;
constexpr std::uint16_t kIntr = 27;
constexpr std::uint16_t kInval = 28;
constexpr std::uint16_t kIo = 29;
constexpr std::uint16_t kIsdir = 31;
constexpr std::uint16_t kLoop = 32;
constexpr std::uint16_t kMfile = 33;
constexpr std::uint16_t kNametoolong = 37;
constexpr std::uint16_t kNfile = 41;
constexpr std::uint16_t kNoent = 44;
constexpr std::uint16_t kNomem = 48;
constexpr std::uint16_t kNospc = 51;
constexpr std::uint16_t kNosys = 52;
constexpr std::uint16_t kNotdir = 54;
constexpr std::uint16_t kNotempty = 55;
constexpr std::uint16_t kNotsup = 58;
constexpr std::uint16_t kOverflow = 61;
constexpr std::uint16_t kPerm = 63;
constexpr std::uint16_t kRange = 68;
constexpr std::uint16_t kRofs = 69;
constexpr std::uint16_t kSpipe = 70;
constexpr std::uint16_t kXdev = 75;
constexpr std::uint16_t kNotcapable = 76;
} // namespace wasi_errno

/// WASI file types
namespace wasi_filetype {
constexpr std::uint8_t kUnknown = 0;
constexpr std::uint8_t kBlockDevice = 1;
constexpr std::uint8_t kCharacterDevice = 2;
constexpr std::uint8_t kDirectory = 3;
constexpr std::uint8_t kRegularFile = 4;
constexpr std::uint8_t kSocketStream = 6;
constexpr std::uint8_t kSymbolicLink = 7;
} // namespace wasi_filetype

/**
 * @struct Preopen
 * @brief Host directory exposed to the guest at a fixed path
 */
struct Preopen {
    std::string guest_path;              ///< e.g. "/app"
    std::filesystem::path host_path;     ///< Directory on the host
    bool read_only{false};
};

/**
 * @class GuestMemory
 * @brief Bounds-checked view of a guest's linear memory
 */
class GuestMemory {
public:
    GuestMemory(std::uint8_t* base, std::uint64_t size)
        : base_(base), size_(size) {}

    bool Contains(std::uint32_t offset, std::uint64_t length) const {
        return static_cast<std::uint64_t>(offset) + length <= size_;
    }

    /// Unchecked pointer; call Contains first
    std::uint8_t* At(std::uint32_t offset) const { return base_ + offset; }

    template <typename T>
    bool Load(std::uint32_t offset, T& out) const {
        if (!Contains(offset, sizeof(T))) {
            return false;
        }
        std::memcpy(&out, base_ + offset, sizeof(T));
        return true;
    }

    template <typename T>
    bool Store(std::uint32_t offset, T value) {
        if (!Contains(offset, sizeof(T))) {
            return false;
        }
        std::memcpy(base_ + offset, &value, sizeof(T));
        return true;
    }

    bool Write(std::uint32_t offset, const void* data, std::size_t length) {
        if (!Contains(offset, length)) {
            return false;
        }
        if (length > 0) {
            std::memcpy(base_ + offset, data, length);
        }
        return true;
    }

    std::optional<std::string> ReadString(std::uint32_t offset, std::uint32_t length) const {
        if (!Contains(offset, length)) {
            return std::nullopt;
        }
        return std::string(reinterpret_cast<const char*>(base_ + offset), length);
    }

    std::uint64_t Size() const { return size_; }

private:
    std::uint8_t* base_;
    std::uint64_t size_;
};

/**
 * @class WasiHost
 * @brief Per-execution WASI state: arguments, environment, fds, output
 *
 * One instance serves exactly one guest run. All WASI calls return a WASI
 * errno; results are written into guest memory.
 */
class WasiHost {
public:
    /**
     * @struct Config
     */
    struct Config {
        std::vector<std::string> args;                ///< argv[0..]
        std::vector<std::string> env;                 ///< "KEY=VALUE"
        std::vector<Preopen> preopens;                ///< fds 3, 4, ...
        std::uint64_t stdout_max_bytes{2'000'000};
        std::uint64_t stderr_max_bytes{1'000'000};
    };

    /**
     * @brief Open every preopen directory
     * @throws core::HostSetupError if a preopen cannot be opened
     */
    explicit WasiHost(const Config& config);
    ~WasiHost();

    WasiHost(const WasiHost&) = delete;
    WasiHost& operator=(const WasiHost&) = delete;

    /***************************************************************************
     * Host Control
     ***************************************************************************/

    /**
     * @brief Wake blocking host calls and make them return promptly
     */
    void Cancel();
    bool IsCancelled() const { return cancelled_.load(); }

    std::optional<std::int32_t> GetExitCode() const;

    OutputSink& Stdout() { return stdout_; }
    OutputSink& Stderr() { return stderr_; }
    const OutputSink& Stdout() const { return stdout_; }
    const OutputSink& Stderr() const { return stderr_; }

    /***************************************************************************
     * Arguments, Environment, Clocks, Random
     ***************************************************************************/

    std::uint16_t ArgsGet(GuestMemory& mem, std::uint32_t argv, std::uint32_t argv_buf);
    std::uint16_t ArgsSizesGet(GuestMemory& mem, std::uint32_t argc_out, std::uint32_t buf_size_out);
    std::uint16_t EnvironGet(GuestMemory& mem, std::uint32_t environ_ptrs, std::uint32_t environ_buf);
    std::uint16_t EnvironSizesGet(GuestMemory& mem, std::uint32_t count_out, std::uint32_t buf_size_out);
    std::uint16_t ClockResGet(GuestMemory& mem, std::uint32_t clock_id, std::uint32_t resolution_out);
    std::uint16_t ClockTimeGet(GuestMemory& mem, std::uint32_t clock_id, std::uint64_t precision,
                               std::uint32_t time_out);
    std::uint16_t RandomGet(GuestMemory& mem, std::uint32_t buf, std::uint32_t buf_len);
    std::uint16_t SchedYield();
    std::uint16_t PollOneoff(GuestMemory& mem, std::uint32_t in, std::uint32_t out,
                             std::uint32_t nsubscriptions, std::uint32_t nevents_out);

    /**
     * @brief Record the exit status; the caller then traps the guest
     */
    void ProcExit(std::int32_t code);

    /***************************************************************************
     * File Descriptors
     ***************************************************************************/

    std::uint16_t FdAdvise(std::uint32_t fd);
    std::uint16_t FdAllocate(std::uint32_t fd);
    std::uint16_t FdClose(std::uint32_t fd);
    std::uint16_t FdDatasync(std::uint32_t fd);
    std::uint16_t FdSync(std::uint32_t fd);
    std::uint16_t FdFdstatGet(GuestMemory& mem, std::uint32_t fd, std::uint32_t stat_out);
    std::uint16_t FdFdstatSetFlags(std::uint32_t fd, std::uint32_t flags);
    std::uint16_t FdFilestatGet(GuestMemory& mem, std::uint32_t fd, std::uint32_t stat_out);
    std::uint16_t FdFilestatSetSize(std::uint32_t fd, std::uint64_t size);
    std::uint16_t FdFilestatSetTimes(std::uint32_t fd, std::uint64_t atim, std::uint64_t mtim,
                                     std::uint32_t fst_flags);
    std::uint16_t FdPread(GuestMemory& mem, std::uint32_t fd, std::uint32_t iovs, std::uint32_t iovs_len,
                          std::uint64_t offset, std::uint32_t nread_out);
    std::uint16_t FdPwrite(GuestMemory& mem, std::uint32_t fd, std::uint32_t iovs, std::uint32_t iovs_len,
                           std::uint64_t offset, std::uint32_t nwritten_out);
    std::uint16_t FdRead(GuestMemory& mem, std::uint32_t fd, std::uint32_t iovs, std::uint32_t iovs_len,
                         std::uint32_t nread_out);
    std::uint16_t FdWrite(GuestMemory& mem, std::uint32_t fd, std::uint32_t iovs, std::uint32_t iovs_len,
                          std::uint32_t nwritten_out);
    std::uint16_t FdPrestatGet(GuestMemory& mem, std::uint32_t fd, std::uint32_t prestat_out);
    std::uint16_t FdPrestatDirName(GuestMemory& mem, std::uint32_t fd, std::uint32_t path, std::uint32_t path_len);
    std::uint16_t FdReaddir(GuestMemory& mem, std::uint32_t fd, std::uint32_t buf, std::uint32_t buf_len,
                            std::uint64_t cookie, std::uint32_t bufused_out);
    std::uint16_t FdRenumber(std::uint32_t from, std::uint32_t to);
    std::uint16_t FdSeek(GuestMemory& mem, std::uint32_t fd, std::int64_t offset, std::uint32_t whence,
                         std::uint32_t newoffset_out);
    std::uint16_t FdTell(GuestMemory& mem, std::uint32_t fd, std::uint32_t offset_out);

    /***************************************************************************
     * Paths
     ***************************************************************************/

    std::uint16_t PathCreateDirectory(GuestMemory& mem, std::uint32_t fd, std::uint32_t path, std::uint32_t path_len);
    std::uint16_t PathFilestatGet(GuestMemory& mem, std::uint32_t fd, std::uint32_t flags,
                                  std::uint32_t path, std::uint32_t path_len, std::uint32_t stat_out);
    std::uint16_t PathFilestatSetTimes(GuestMemory& mem, std::uint32_t fd, std::uint32_t flags,
                                       std::uint32_t path, std::uint32_t path_len,
                                       std::uint64_t atim, std::uint64_t mtim, std::uint32_t fst_flags);
    std::uint16_t PathOpen(GuestMemory& mem, std::uint32_t dirfd, std::uint32_t dirflags,
                           std::uint32_t path, std::uint32_t path_len, std::uint32_t oflags,
                           std::uint64_t rights_base, std::uint64_t rights_inheriting,
                           std::uint32_t fdflags, std::uint32_t fd_out);
    std::uint16_t PathReadlink(GuestMemory& mem, std::uint32_t fd, std::uint32_t path, std::uint32_t path_len,
                               std::uint32_t buf, std::uint32_t buf_len, std::uint32_t bufused_out);
    std::uint16_t PathRemoveDirectory(GuestMemory& mem, std::uint32_t fd, std::uint32_t path, std::uint32_t path_len);
    std::uint16_t PathRename(GuestMemory& mem, std::uint32_t old_fd, std::uint32_t old_path, std::uint32_t old_len,
                             std::uint32_t new_fd, std::uint32_t new_path, std::uint32_t new_len);
    std::uint16_t PathUnlinkFile(GuestMemory& mem, std::uint32_t fd, std::uint32_t path, std::uint32_t path_len);

    /// Hard and symbolic links are never created inside the sandbox
    std::uint16_t PathLink() const { return wasi_errno::kPerm; }
    std::uint16_t PathSymlink() const { return wasi_errno::kPerm; }

    /***************************************************************************
     * Path Resolution (exposed for tests)
     ***************************************************************************/

    /**
     * @brief Normalize a guest path relative to a directory fd
     *
     * @param fd Directory fd (a preopen or a directory opened beneath one)
     * @param path Guest path
     * @param[out] preopen_index Preopen that owns the result
     * @param[out] components Components relative to the preopen root
     * @return kSuccess, or kNotcapable for absolute paths and escapes
     */
    std::uint16_t ResolveGuestPath(std::uint32_t fd, const std::string& path,
                                   std::size_t& preopen_index,
                                   std::vector<std::string>& components) const;

    /**
     * @brief First fd of a preopen, by guest path
     */
    std::optional<std::uint32_t> FindPreopenFd(const std::string& guest_path) const;

private:
    enum class FdKind { STDIN, STDOUT, STDERR, DIRECTORY, FILE };

    struct FdEntry {
        FdKind kind{FdKind::FILE};
        int host_fd{-1};
        std::size_t preopen_index{0};
        std::vector<std::string> components;  ///< Relative to the preopen root
        bool is_preopen{false};
        bool read_only{false};
        std::uint64_t rights_base{0};
        std::uint64_t rights_inheriting{0};
        std::uint16_t fdflags{0};
    };

    struct OpenedParent;

    FdEntry* GetEntry(std::uint32_t fd);
    const FdEntry* GetEntry(std::uint32_t fd) const;
    std::uint32_t AllocateFd();

    std::uint16_t OpenParent(std::uint32_t dirfd, GuestMemory& mem, std::uint32_t path, std::uint32_t path_len,
                             OpenedParent& parent);
    std::uint16_t WriteFilestat(GuestMemory& mem, std::uint32_t out, const struct stat& st) const;
    std::uint16_t DoWrite(GuestMemory& mem, FdEntry& entry, std::uint32_t iovs, std::uint32_t iovs_len,
                          const std::int64_t* offset, std::uint32_t& written);
    std::uint16_t DoRead(GuestMemory& mem, FdEntry& entry, std::uint32_t iovs, std::uint32_t iovs_len,
                         const std::int64_t* offset, std::uint32_t& read_total);

    Config config_;
    std::vector<int> preopen_fds_;            ///< Root fds, parallel to config_.preopens
    std::map<std::uint32_t, FdEntry> fds_;
    std::uint32_t next_fd_{3};

    OutputSink stdout_;
    OutputSink stderr_;

    std::optional<std::int32_t> exit_code_;
    mutable std::mutex state_mutex_;

    std::atomic<bool> cancelled_{false};
    std::mutex cancel_mutex_;
    std::condition_variable cancel_cv_;
};

/**
 * @brief Map a host errno to the WASI errno space
 */
std::uint16_t ErrnoToWasi(int error);

} // namespace wasm
} // namespace wasmbox
