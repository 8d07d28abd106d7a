/**
 * @file wasi_host.cpp
 * @brief POSIX implementation of the capability-based WASI host
 *
 * **Descriptor Layout**:
 * - 0: stdin (always at EOF)
 * - 1, 2: capped stdout/stderr sinks
 * - 3..: preopened directories in configuration order
 * - further fds: files and directories opened by the guest
 *
 * **Resolution**:
 * Every descriptor remembers its path relative to the owning preopen as a
 * component list. A guest path is folded onto that list (`.` skipped, `..`
 * popped, never past the root) and the result is opened from the preopen's
 * root fd one component at a time with O_NOFOLLOW.
 *
 * @date 2025
 */

#include "wasmbox/wasm/wasi_host.hpp"
#include "wasmbox/core/errors.hpp"
#include "wasmbox/utils/hash_utils.hpp"
#include "wasmbox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <thread>

#include <dirent.h>
#include <fcntl.h>
#include <sys/types.h>
#include <time.h>
#include <unistd.h>

namespace wasmbox {
namespace wasm {

namespace {

// ============================================================================
// WASI ABI CONSTANTS
// ============================================================================

constexpr std::uint32_t kOflagCreat = 1;
constexpr std::uint32_t kOflagDirectory = 2;
constexpr std::uint32_t kOflagExcl = 4;
constexpr std::uint32_t kOflagTrunc = 8;

constexpr std::uint16_t kFdflagAppend = 1;
constexpr std::uint16_t kFdflagDsync = 2;
constexpr std::uint16_t kFdflagNonblock = 4;
constexpr std::uint16_t kFdflagSync = 16;

constexpr std::uint64_t kRightFdDatasync = 1ULL << 0;
constexpr std::uint64_t kRightFdRead = 1ULL << 1;
constexpr std::uint64_t kRightFdWrite = 1ULL << 6;
constexpr std::uint64_t kRightFdAllocate = 1ULL << 8;
constexpr std::uint64_t kRightPathCreateDirectory = 1ULL << 9;
constexpr std::uint64_t kRightPathCreateFile = 1ULL << 10;
constexpr std::uint64_t kRightPathLinkSource = 1ULL << 11;
constexpr std::uint64_t kRightPathLinkTarget = 1ULL << 12;
constexpr std::uint64_t kRightFdReaddir = 1ULL << 14;
constexpr std::uint64_t kRightPathRenameSource = 1ULL << 16;
constexpr std::uint64_t kRightPathRenameTarget = 1ULL << 17;
constexpr std::uint64_t kRightPathFilestatSetSize = 1ULL << 19;
constexpr std::uint64_t kRightPathFilestatSetTimes = 1ULL << 20;
constexpr std::uint64_t kRightFdFilestatSetSize = 1ULL << 22;
constexpr std::uint64_t kRightFdFilestatSetTimes = 1ULL << 23;
constexpr std::uint64_t kRightPathSymlink = 1ULL << 24;
constexpr std::uint64_t kRightPathRemoveDirectory = 1ULL << 25;
constexpr std::uint64_t kRightPathUnlinkFile = 1ULL << 26;

constexpr std::uint64_t kRightsAll = (1ULL << 30) - 1;
constexpr std::uint64_t kRightsMutating =
    kRightFdDatasync | kRightFdWrite | kRightFdAllocate | kRightPathCreateDirectory |
    kRightPathCreateFile | kRightPathLinkSource | kRightPathLinkTarget | kRightPathRenameSource |
    kRightPathRenameTarget | kRightPathFilestatSetSize | kRightPathFilestatSetTimes |
    kRightFdFilestatSetSize | kRightFdFilestatSetTimes | kRightPathSymlink |
    kRightPathRemoveDirectory | kRightPathUnlinkFile;
constexpr std::uint64_t kRightsReadOnly = kRightsAll & ~kRightsMutating;

/// Rights whose presence on path_open means the guest intends to write
constexpr std::uint64_t kWriteIntentRights = kRightFdWrite | kRightFdAllocate | kRightFdFilestatSetSize;

constexpr std::uint32_t kWhenceSet = 0;
constexpr std::uint32_t kWhenceCur = 1;
constexpr std::uint32_t kWhenceEnd = 2;

constexpr std::uint32_t kClockRealtime = 0;
constexpr std::uint32_t kClockMonotonic = 1;
constexpr std::uint32_t kClockProcessCputime = 2;
constexpr std::uint32_t kClockThreadCputime = 3;

constexpr std::uint8_t kEventClock = 0;
constexpr std::uint8_t kEventFdRead = 1;
constexpr std::uint8_t kEventFdWrite = 2;
constexpr std::uint16_t kSubclockAbstime = 1;

constexpr std::uint32_t kFstAtim = 1;
constexpr std::uint32_t kFstAtimNow = 2;
constexpr std::uint32_t kFstMtim = 4;
constexpr std::uint32_t kFstMtimNow = 8;

constexpr std::uint32_t kFilestatSize = 64;
constexpr std::uint32_t kFdstatSize = 24;
constexpr std::uint32_t kDirentHeaderSize = 24;
constexpr std::uint32_t kSubscriptionSize = 48;
constexpr std::uint32_t kEventSize = 32;

// ============================================================================
// HELPERS
// ============================================================================

/**
 * Owning wrapper around a host file descriptor.
 */
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { Reset(); }

    UniqueFd(UniqueFd&& other) noexcept : fd_(other.Release()) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            Reset(other.Release());
        }
        return *this;
    }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    int Get() const { return fd_; }
    bool Valid() const { return fd_ >= 0; }

    int Release() {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void Reset(int fd = -1) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_{-1};
};

std::uint8_t FiletypeFromMode(mode_t mode) {
    if (S_ISDIR(mode)) return wasi_filetype::kDirectory;
    if (S_ISREG(mode)) return wasi_filetype::kRegularFile;
    if (S_ISLNK(mode)) return wasi_filetype::kSymbolicLink;
    if (S_ISCHR(mode)) return wasi_filetype::kCharacterDevice;
    if (S_ISBLK(mode)) return wasi_filetype::kBlockDevice;
    if (S_ISSOCK(mode)) return wasi_filetype::kSocketStream;
    return wasi_filetype::kUnknown;
}

std::uint8_t FiletypeFromDirent(unsigned char d_type) {
    switch (d_type) {
        case DT_DIR: return wasi_filetype::kDirectory;
        case DT_REG: return wasi_filetype::kRegularFile;
        case DT_LNK: return wasi_filetype::kSymbolicLink;
        case DT_CHR: return wasi_filetype::kCharacterDevice;
        case DT_BLK: return wasi_filetype::kBlockDevice;
        case DT_SOCK: return wasi_filetype::kSocketStream;
        default: return wasi_filetype::kUnknown;
    }
}

std::uint64_t ToNanoseconds(const struct timespec& ts) {
    return static_cast<std::uint64_t>(ts.tv_sec) * 1000000000ULL + static_cast<std::uint64_t>(ts.tv_nsec);
}

struct timespec FromNanoseconds(std::uint64_t ns) {
    struct timespec ts;
    ts.tv_sec = static_cast<time_t>(ns / 1000000000ULL);
    ts.tv_nsec = static_cast<long>(ns % 1000000000ULL);
    return ts;
}

void BuildTimes(std::uint64_t atim, std::uint64_t mtim, std::uint32_t fst_flags, struct timespec times[2]) {
    times[0].tv_sec = 0;
    times[0].tv_nsec = UTIME_OMIT;
    times[1].tv_sec = 0;
    times[1].tv_nsec = UTIME_OMIT;

    if (fst_flags & kFstAtimNow) {
        times[0].tv_nsec = UTIME_NOW;
    } else if (fst_flags & kFstAtim) {
        times[0] = FromNanoseconds(atim);
    }
    if (fst_flags & kFstMtimNow) {
        times[1].tv_nsec = UTIME_NOW;
    } else if (fst_flags & kFstMtim) {
        times[1] = FromNanoseconds(mtim);
    }
}

bool MapClock(std::uint32_t clock_id, clockid_t& out) {
    switch (clock_id) {
        case kClockRealtime: out = CLOCK_REALTIME; return true;
        case kClockMonotonic: out = CLOCK_MONOTONIC; return true;
        case kClockProcessCputime: out = CLOCK_PROCESS_CPUTIME_ID; return true;
        case kClockThreadCputime: out = CLOCK_THREAD_CPUTIME_ID; return true;
        default: return false;
    }
}

/**
 * Open the directory reached by the first `count` components, starting at
 * root_fd. Every step refuses symlinks.
 */
std::uint16_t WalkDirectories(int root_fd, const std::vector<std::string>& components, std::size_t count,
                              UniqueFd& out) {
    UniqueFd current(::fcntl(root_fd, F_DUPFD_CLOEXEC, 0));
    if (!current.Valid()) {
        return ErrnoToWasi(errno);
    }

    for (std::size_t i = 0; i < count; ++i) {
        int next = ::openat(current.Get(), components[i].c_str(),
                            O_RDONLY | O_DIRECTORY | O_NOFOLLOW | O_CLOEXEC);
        if (next < 0) {
            int error = errno;
            // A symlinked component would lead outside the capability
            if (error == ELOOP) {
                return wasi_errno::kNotcapable;
            }
            return ErrnoToWasi(error);
        }
        current.Reset(next);
    }

    out = std::move(current);
    return wasi_errno::kSuccess;
}

} // anonymous namespace

struct WasiHost::OpenedParent {
    UniqueFd dir;
    std::string leaf;
    std::vector<std::string> components;   ///< Full path relative to the preopen
    std::size_t preopen_index{0};
    bool read_only{false};
    bool is_root{false};
};

// ============================================================================
// ERRNO MAPPING
// ============================================================================

std::uint16_t ErrnoToWasi(int error) {
    switch (error) {
        case 0: return wasi_errno::kSuccess;
        case EACCES: return wasi_errno::kAccess;
        case EAGAIN: return wasi_errno::kAgain;
        case EBADF: return wasi_errno::kBadf;
        case EBUSY: return wasi_errno::kBusy;
        case EEXIST: return wasi_errno::kExist;
        case EFAULT: return wasi_errno::kFault;
        case EFBIG: return wasi_errno::kFbig;
        case EINTR: return wasi_errno::kIntr;
        case EINVAL: return wasi_errno::kInval;
        case EIO: return wasi_errno::kIo;
        case EISDIR: return wasi_errno::kIsdir;
        case ELOOP: return wasi_errno::kLoop;
        case EMFILE: return wasi_errno::kMfile;
        case ENAMETOOLONG: return wasi_errno::kNametoolong;
        case ENFILE: return wasi_errno::kNfile;
        case ENOENT: return wasi_errno::kNoent;
        case ENOMEM: return wasi_errno::kNomem;
        case ENOSPC: return wasi_errno::kNospc;
        case ENOSYS: return wasi_errno::kNosys;
        case ENOTDIR: return wasi_errno::kNotdir;
        case ENOTEMPTY: return wasi_errno::kNotempty;
        case ENOTSUP: return wasi_errno::kNotsup;
        case EOVERFLOW: return wasi_errno::kOverflow;
        case EPERM: return wasi_errno::kPerm;
        case ERANGE: return wasi_errno::kRange;
        case EROFS: return wasi_errno::kRofs;
        case ESPIPE: return wasi_errno::kSpipe;
        case EXDEV: return wasi_errno::kXdev;
        default: return wasi_errno::kIo;
    }
}

// ============================================================================
// CONSTRUCTION
// ============================================================================

WasiHost::WasiHost(const Config& config)
    : config_(config)
    , stdout_(config.stdout_max_bytes)
    , stderr_(config.stderr_max_bytes) {

    fds_[0] = FdEntry{FdKind::STDIN};
    fds_[1] = FdEntry{FdKind::STDOUT};
    fds_[2] = FdEntry{FdKind::STDERR};

    for (std::size_t i = 0; i < config_.preopens.size(); ++i) {
        const auto& preopen = config_.preopens[i];

        int root = ::open(preopen.host_path.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
        if (root < 0) {
            int error = errno;
            for (int fd : preopen_fds_) {
                ::close(fd);
            }
            throw core::HostSetupError("Cannot open preopen " + preopen.host_path.string() +
                                       " for " + preopen.guest_path + ": " + std::strerror(error));
        }
        preopen_fds_.push_back(root);

        FdEntry entry;
        entry.kind = FdKind::DIRECTORY;
        entry.host_fd = ::fcntl(root, F_DUPFD_CLOEXEC, 0);
        entry.preopen_index = i;
        entry.is_preopen = true;
        entry.read_only = preopen.read_only;
        entry.rights_base = preopen.read_only ? kRightsReadOnly : kRightsAll;
        entry.rights_inheriting = entry.rights_base;
        fds_[AllocateFd()] = std::move(entry);

        spdlog::debug("Preopen fd {}: {} -> {}{}", next_fd_ - 1, preopen.guest_path,
                      preopen.host_path.string(), preopen.read_only ? " (read-only)" : "");
    }
}

WasiHost::~WasiHost() {
    for (auto& [fd, entry] : fds_) {
        if (entry.host_fd >= 0) {
            ::close(entry.host_fd);
        }
    }
    for (int fd : preopen_fds_) {
        ::close(fd);
    }
}

std::uint32_t WasiHost::AllocateFd() {
    while (fds_.count(next_fd_) > 0) {
        ++next_fd_;
    }
    return next_fd_++;
}

WasiHost::FdEntry* WasiHost::GetEntry(std::uint32_t fd) {
    auto it = fds_.find(fd);
    return it == fds_.end() ? nullptr : &it->second;
}

const WasiHost::FdEntry* WasiHost::GetEntry(std::uint32_t fd) const {
    auto it = fds_.find(fd);
    return it == fds_.end() ? nullptr : &it->second;
}

// ============================================================================
// HOST CONTROL
// ============================================================================

void WasiHost::Cancel() {
    {
        std::lock_guard<std::mutex> lock(cancel_mutex_);
        cancelled_.store(true);
    }
    cancel_cv_.notify_all();
}

std::optional<std::int32_t> WasiHost::GetExitCode() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return exit_code_;
}

void WasiHost::ProcExit(std::int32_t code) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    exit_code_ = code;
}

// ============================================================================
// PATH RESOLUTION
// ============================================================================

std::optional<std::uint32_t> WasiHost::FindPreopenFd(const std::string& guest_path) const {
    for (const auto& [fd, entry] : fds_) {
        if (entry.is_preopen && config_.preopens[entry.preopen_index].guest_path == guest_path) {
            return fd;
        }
    }
    return std::nullopt;
}

std::uint16_t WasiHost::ResolveGuestPath(std::uint32_t fd, const std::string& path,
                                         std::size_t& preopen_index,
                                         std::vector<std::string>& components) const {
    const FdEntry* dir = GetEntry(fd);
    if (dir == nullptr) {
        return wasi_errno::kBadf;
    }
    if (dir->kind != FdKind::DIRECTORY) {
        return wasi_errno::kNotdir;
    }
    if (path.empty()) {
        return wasi_errno::kNoent;
    }
    if (path.find('\0') != std::string::npos) {
        return wasi_errno::kInval;
    }
    if (path.front() == '/') {
        return wasi_errno::kNotcapable;
    }

    std::vector<std::string> result = dir->components;
    for (const auto& part : utils::StringUtils::Split(path, '/')) {
        if (part == ".") {
            continue;
        }
        if (part == "..") {
            if (result.empty()) {
                return wasi_errno::kNotcapable;
            }
            result.pop_back();
            continue;
        }
        result.push_back(part);
    }

    preopen_index = dir->preopen_index;
    components = std::move(result);
    return wasi_errno::kSuccess;
}

std::uint16_t WasiHost::OpenParent(std::uint32_t dirfd, GuestMemory& mem, std::uint32_t path,
                                   std::uint32_t path_len, OpenedParent& parent) {
    auto guest_path = mem.ReadString(path, path_len);
    if (!guest_path) {
        return wasi_errno::kFault;
    }

    std::uint16_t err = ResolveGuestPath(dirfd, *guest_path, parent.preopen_index, parent.components);
    if (err != wasi_errno::kSuccess) {
        return err;
    }

    parent.read_only = config_.preopens[parent.preopen_index].read_only;
    int root = preopen_fds_[parent.preopen_index];
    const auto& components = parent.components;

    if (components.empty()) {
        parent.is_root = true;
        parent.leaf = ".";
        return WalkDirectories(root, components, 0, parent.dir);
    }

    parent.leaf = components.back();
    return WalkDirectories(root, components, components.size() - 1, parent.dir);
}

// ============================================================================
// ARGUMENTS AND ENVIRONMENT
// ============================================================================

namespace {

std::uint16_t WriteStringList(GuestMemory& mem, const std::vector<std::string>& items,
                              std::uint32_t pointers, std::uint32_t buffer) {
    std::uint32_t cursor = buffer;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (!mem.Store<std::uint32_t>(pointers + static_cast<std::uint32_t>(i * 4), cursor)) {
            return wasi_errno::kFault;
        }
        const auto& item = items[i];
        if (!mem.Write(cursor, item.c_str(), item.size() + 1)) {
            return wasi_errno::kFault;
        }
        cursor += static_cast<std::uint32_t>(item.size() + 1);
    }
    return wasi_errno::kSuccess;
}

std::uint16_t WriteStringListSizes(GuestMemory& mem, const std::vector<std::string>& items,
                                   std::uint32_t count_out, std::uint32_t size_out) {
    std::uint32_t total = 0;
    for (const auto& item : items) {
        total += static_cast<std::uint32_t>(item.size() + 1);
    }
    if (!mem.Store<std::uint32_t>(count_out, static_cast<std::uint32_t>(items.size())) ||
        !mem.Store<std::uint32_t>(size_out, total)) {
        return wasi_errno::kFault;
    }
    return wasi_errno::kSuccess;
}

} // anonymous namespace

std::uint16_t WasiHost::ArgsGet(GuestMemory& mem, std::uint32_t argv, std::uint32_t argv_buf) {
    return WriteStringList(mem, config_.args, argv, argv_buf);
}

std::uint16_t WasiHost::ArgsSizesGet(GuestMemory& mem, std::uint32_t argc_out, std::uint32_t buf_size_out) {
    return WriteStringListSizes(mem, config_.args, argc_out, buf_size_out);
}

std::uint16_t WasiHost::EnvironGet(GuestMemory& mem, std::uint32_t environ_ptrs, std::uint32_t environ_buf) {
    return WriteStringList(mem, config_.env, environ_ptrs, environ_buf);
}

std::uint16_t WasiHost::EnvironSizesGet(GuestMemory& mem, std::uint32_t count_out, std::uint32_t buf_size_out) {
    return WriteStringListSizes(mem, config_.env, count_out, buf_size_out);
}

// ============================================================================
// CLOCKS, RANDOM, SCHEDULING
// ============================================================================

std::uint16_t WasiHost::ClockResGet(GuestMemory& mem, std::uint32_t clock_id, std::uint32_t resolution_out) {
    clockid_t clock;
    if (!MapClock(clock_id, clock)) {
        return wasi_errno::kInval;
    }
    struct timespec ts;
    if (::clock_getres(clock, &ts) != 0) {
        return ErrnoToWasi(errno);
    }
    return mem.Store<std::uint64_t>(resolution_out, ToNanoseconds(ts)) ? wasi_errno::kSuccess : wasi_errno::kFault;
}

std::uint16_t WasiHost::ClockTimeGet(GuestMemory& mem, std::uint32_t clock_id, std::uint64_t /*precision*/,
                                     std::uint32_t time_out) {
    clockid_t clock;
    if (!MapClock(clock_id, clock)) {
        return wasi_errno::kInval;
    }
    struct timespec ts;
    if (::clock_gettime(clock, &ts) != 0) {
        return ErrnoToWasi(errno);
    }
    return mem.Store<std::uint64_t>(time_out, ToNanoseconds(ts)) ? wasi_errno::kSuccess : wasi_errno::kFault;
}

std::uint16_t WasiHost::RandomGet(GuestMemory& mem, std::uint32_t buf, std::uint32_t buf_len) {
    if (!mem.Contains(buf, buf_len)) {
        return wasi_errno::kFault;
    }
    return utils::HashUtils::FillRandom(mem.At(buf), buf_len) ? wasi_errno::kSuccess : wasi_errno::kIo;
}

std::uint16_t WasiHost::SchedYield() {
    std::this_thread::yield();
    return wasi_errno::kSuccess;
}

std::uint16_t WasiHost::PollOneoff(GuestMemory& mem, std::uint32_t in, std::uint32_t out,
                                   std::uint32_t nsubscriptions, std::uint32_t nevents_out) {
    if (nsubscriptions == 0) {
        return wasi_errno::kInval;
    }
    if (!mem.Contains(in, static_cast<std::uint64_t>(nsubscriptions) * kSubscriptionSize) ||
        !mem.Contains(out, static_cast<std::uint64_t>(nsubscriptions) * kEventSize)) {
        return wasi_errno::kFault;
    }

    struct Subscription {
        std::uint64_t userdata;
        std::uint8_t tag;
        std::uint64_t relative_ns;   // clock subscriptions only
    };

    std::vector<Subscription> subscriptions;
    bool has_fd_subscription = false;
    std::uint64_t min_wait = UINT64_MAX;

    for (std::uint32_t i = 0; i < nsubscriptions; ++i) {
        std::uint32_t base = in + i * kSubscriptionSize;
        Subscription sub{};
        mem.Load(base, sub.userdata);
        mem.Load(base + 8, sub.tag);

        if (sub.tag == kEventClock) {
            std::uint32_t clock_id = 0;
            std::uint64_t timeout = 0;
            std::uint16_t flags = 0;
            mem.Load(base + 16, clock_id);
            mem.Load(base + 24, timeout);
            mem.Load(base + 40, flags);

            clockid_t clock;
            if (!MapClock(clock_id, clock)) {
                return wasi_errno::kInval;
            }
            if (flags & kSubclockAbstime) {
                struct timespec now;
                ::clock_gettime(clock, &now);
                std::uint64_t now_ns = ToNanoseconds(now);
                sub.relative_ns = timeout > now_ns ? timeout - now_ns : 0;
            } else {
                sub.relative_ns = timeout;
            }
            min_wait = std::min(min_wait, sub.relative_ns);
        } else if (sub.tag == kEventFdRead || sub.tag == kEventFdWrite) {
            has_fd_subscription = true;
        } else {
            return wasi_errno::kInval;
        }
        subscriptions.push_back(sub);
    }

    // Descriptors are always ready; only pure clock waits block
    if (!has_fd_subscription && min_wait != UINT64_MAX && min_wait > 0) {
        std::unique_lock<std::mutex> lock(cancel_mutex_);
        constexpr std::uint64_t kMaxSleepNs = 24ULL * 3600 * 1000000000ULL;
        auto wait = std::chrono::nanoseconds(static_cast<std::int64_t>(std::min(min_wait, kMaxSleepNs)));
        cancel_cv_.wait_for(lock, wait, [this]() { return cancelled_.load(); });
    }

    std::uint32_t nevents = 0;
    for (const auto& sub : subscriptions) {
        bool fire = (sub.tag != kEventClock) ||
                    (has_fd_subscription ? sub.relative_ns == 0 : sub.relative_ns <= min_wait);
        if (!fire) {
            continue;
        }

        std::uint8_t event[kEventSize] = {};
        std::memcpy(event, &sub.userdata, sizeof(sub.userdata));
        event[10] = sub.tag;
        mem.Write(out + nevents * kEventSize, event, sizeof(event));
        ++nevents;
    }

    return mem.Store<std::uint32_t>(nevents_out, nevents) ? wasi_errno::kSuccess : wasi_errno::kFault;
}

// ============================================================================
// FILE DESCRIPTORS
// ============================================================================

std::uint16_t WasiHost::FdAdvise(std::uint32_t fd) {
    return GetEntry(fd) ? wasi_errno::kSuccess : wasi_errno::kBadf;
}

std::uint16_t WasiHost::FdAllocate(std::uint32_t fd) {
    return GetEntry(fd) ? wasi_errno::kNotsup : wasi_errno::kBadf;
}

std::uint16_t WasiHost::FdClose(std::uint32_t fd) {
    auto it = fds_.find(fd);
    if (it == fds_.end()) {
        return wasi_errno::kBadf;
    }
    if (it->second.host_fd >= 0) {
        ::close(it->second.host_fd);
    }
    fds_.erase(it);
    return wasi_errno::kSuccess;
}

std::uint16_t WasiHost::FdDatasync(std::uint32_t fd) {
    FdEntry* entry = GetEntry(fd);
    if (!entry) {
        return wasi_errno::kBadf;
    }
    if (entry->kind != FdKind::FILE) {
        return wasi_errno::kSuccess;
    }
    return ::fdatasync(entry->host_fd) == 0 ? wasi_errno::kSuccess : ErrnoToWasi(errno);
}

std::uint16_t WasiHost::FdSync(std::uint32_t fd) {
    FdEntry* entry = GetEntry(fd);
    if (!entry) {
        return wasi_errno::kBadf;
    }
    if (entry->kind != FdKind::FILE) {
        return wasi_errno::kSuccess;
    }
    return ::fsync(entry->host_fd) == 0 ? wasi_errno::kSuccess : ErrnoToWasi(errno);
}

std::uint16_t WasiHost::FdFdstatGet(GuestMemory& mem, std::uint32_t fd, std::uint32_t stat_out) {
    FdEntry* entry = GetEntry(fd);
    if (!entry) {
        return wasi_errno::kBadf;
    }
    if (!mem.Contains(stat_out, kFdstatSize)) {
        return wasi_errno::kFault;
    }

    std::uint8_t filetype = wasi_filetype::kUnknown;
    std::uint16_t flags = entry->fdflags;
    std::uint64_t rights_base = entry->rights_base;
    std::uint64_t rights_inheriting = entry->rights_inheriting;

    switch (entry->kind) {
        case FdKind::STDIN:
            filetype = wasi_filetype::kCharacterDevice;
            rights_base = kRightFdRead;
            rights_inheriting = 0;
            break;
        case FdKind::STDOUT:
        case FdKind::STDERR:
            filetype = wasi_filetype::kCharacterDevice;
            rights_base = kRightFdWrite;
            rights_inheriting = 0;
            break;
        case FdKind::DIRECTORY:
            filetype = wasi_filetype::kDirectory;
            break;
        case FdKind::FILE: {
            struct stat st;
            if (::fstat(entry->host_fd, &st) != 0) {
                return ErrnoToWasi(errno);
            }
            filetype = FiletypeFromMode(st.st_mode);
            int fl = ::fcntl(entry->host_fd, F_GETFL);
            if (fl >= 0 && (fl & O_APPEND)) {
                flags |= kFdflagAppend;
            }
            break;
        }
    }

    std::uint8_t stat[kFdstatSize] = {};
    stat[0] = filetype;
    std::memcpy(stat + 2, &flags, sizeof(flags));
    std::memcpy(stat + 8, &rights_base, sizeof(rights_base));
    std::memcpy(stat + 16, &rights_inheriting, sizeof(rights_inheriting));
    mem.Write(stat_out, stat, sizeof(stat));
    return wasi_errno::kSuccess;
}

std::uint16_t WasiHost::FdFdstatSetFlags(std::uint32_t fd, std::uint32_t flags) {
    FdEntry* entry = GetEntry(fd);
    if (!entry) {
        return wasi_errno::kBadf;
    }
    if (entry->kind != FdKind::FILE) {
        entry->fdflags = static_cast<std::uint16_t>(flags);
        return wasi_errno::kSuccess;
    }
    if ((flags & kFdflagAppend) && entry->read_only) {
        return wasi_errno::kRofs;
    }

    int fl = ::fcntl(entry->host_fd, F_GETFL);
    if (fl < 0) {
        return ErrnoToWasi(errno);
    }
    fl &= ~(O_APPEND | O_NONBLOCK);
    if (flags & kFdflagAppend) fl |= O_APPEND;
    if (flags & kFdflagNonblock) fl |= O_NONBLOCK;
    if (::fcntl(entry->host_fd, F_SETFL, fl) != 0) {
        return ErrnoToWasi(errno);
    }
    entry->fdflags = static_cast<std::uint16_t>(flags);
    return wasi_errno::kSuccess;
}

std::uint16_t WasiHost::WriteFilestat(GuestMemory& mem, std::uint32_t out, const struct stat& st) const {
    if (!mem.Contains(out, kFilestatSize)) {
        return wasi_errno::kFault;
    }

    std::uint8_t buf[kFilestatSize] = {};
    std::uint64_t dev = st.st_dev;
    std::uint64_t ino = st.st_ino;
    std::uint64_t nlink = st.st_nlink;
    std::uint64_t size = static_cast<std::uint64_t>(st.st_size);
    std::uint64_t atim = ToNanoseconds(st.st_atim);
    std::uint64_t mtim = ToNanoseconds(st.st_mtim);
    std::uint64_t ctim = ToNanoseconds(st.st_ctim);

    std::memcpy(buf + 0, &dev, 8);
    std::memcpy(buf + 8, &ino, 8);
    buf[16] = FiletypeFromMode(st.st_mode);
    std::memcpy(buf + 24, &nlink, 8);
    std::memcpy(buf + 32, &size, 8);
    std::memcpy(buf + 40, &atim, 8);
    std::memcpy(buf + 48, &mtim, 8);
    std::memcpy(buf + 56, &ctim, 8);

    mem.Write(out, buf, sizeof(buf));
    return wasi_errno::kSuccess;
}

std::uint16_t WasiHost::FdFilestatGet(GuestMemory& mem, std::uint32_t fd, std::uint32_t stat_out) {
    FdEntry* entry = GetEntry(fd);
    if (!entry) {
        return wasi_errno::kBadf;
    }

    if (entry->host_fd < 0) {
        // stdio: an empty character device
        struct stat st{};
        st.st_mode = S_IFCHR;
        return WriteFilestat(mem, stat_out, st);
    }

    struct stat st;
    if (::fstat(entry->host_fd, &st) != 0) {
        return ErrnoToWasi(errno);
    }
    return WriteFilestat(mem, stat_out, st);
}

std::uint16_t WasiHost::FdFilestatSetSize(std::uint32_t fd, std::uint64_t size) {
    FdEntry* entry = GetEntry(fd);
    if (!entry) {
        return wasi_errno::kBadf;
    }
    if (entry->kind != FdKind::FILE) {
        return wasi_errno::kInval;
    }
    if (entry->read_only) {
        return wasi_errno::kRofs;
    }
    return ::ftruncate(entry->host_fd, static_cast<off_t>(size)) == 0 ? wasi_errno::kSuccess : ErrnoToWasi(errno);
}

std::uint16_t WasiHost::FdFilestatSetTimes(std::uint32_t fd, std::uint64_t atim, std::uint64_t mtim,
                                           std::uint32_t fst_flags) {
    FdEntry* entry = GetEntry(fd);
    if (!entry) {
        return wasi_errno::kBadf;
    }
    if (entry->host_fd < 0) {
        return wasi_errno::kSuccess;
    }
    if (entry->read_only) {
        return wasi_errno::kRofs;
    }
    struct timespec times[2];
    BuildTimes(atim, mtim, fst_flags, times);
    return ::futimens(entry->host_fd, times) == 0 ? wasi_errno::kSuccess : ErrnoToWasi(errno);
}

std::uint16_t WasiHost::DoRead(GuestMemory& mem, FdEntry& entry, std::uint32_t iovs, std::uint32_t iovs_len,
                               const std::int64_t* offset, std::uint32_t& read_total) {
    read_total = 0;

    if (entry.kind == FdKind::STDIN) {
        return wasi_errno::kSuccess;   // EOF
    }
    if (entry.kind == FdKind::DIRECTORY) {
        return wasi_errno::kIsdir;
    }
    if (entry.kind != FdKind::FILE) {
        return wasi_errno::kBadf;
    }

    std::int64_t position = offset ? *offset : 0;
    for (std::uint32_t i = 0; i < iovs_len; ++i) {
        std::uint32_t buf = 0, len = 0;
        if (!mem.Load(iovs + i * 8, buf) || !mem.Load(iovs + i * 8 + 4, len)) {
            return wasi_errno::kFault;
        }
        if (!mem.Contains(buf, len)) {
            return wasi_errno::kFault;
        }
        if (len == 0) {
            continue;
        }

        ssize_t n = offset ? ::pread(entry.host_fd, mem.At(buf), len, static_cast<off_t>(position))
                           : ::read(entry.host_fd, mem.At(buf), len);
        if (n < 0) {
            if (read_total > 0) {
                break;
            }
            return ErrnoToWasi(errno);
        }
        read_total += static_cast<std::uint32_t>(n);
        position += n;
        if (static_cast<std::uint32_t>(n) < len) {
            break;
        }
    }
    return wasi_errno::kSuccess;
}

std::uint16_t WasiHost::DoWrite(GuestMemory& mem, FdEntry& entry, std::uint32_t iovs, std::uint32_t iovs_len,
                                const std::int64_t* offset, std::uint32_t& written) {
    written = 0;

    if (entry.kind == FdKind::DIRECTORY) {
        return wasi_errno::kIsdir;
    }
    if (entry.kind == FdKind::STDIN) {
        return wasi_errno::kBadf;
    }

    std::int64_t position = offset ? *offset : 0;
    for (std::uint32_t i = 0; i < iovs_len; ++i) {
        std::uint32_t buf = 0, len = 0;
        if (!mem.Load(iovs + i * 8, buf) || !mem.Load(iovs + i * 8 + 4, len)) {
            return wasi_errno::kFault;
        }
        if (!mem.Contains(buf, len)) {
            return wasi_errno::kFault;
        }
        if (len == 0) {
            continue;
        }

        if (entry.kind == FdKind::STDOUT || entry.kind == FdKind::STDERR) {
            OutputSink& sink = (entry.kind == FdKind::STDOUT) ? stdout_ : stderr_;
            sink.Write(reinterpret_cast<const char*>(mem.At(buf)), len);
            written += len;
            continue;
        }

        if (entry.read_only) {
            return wasi_errno::kRofs;
        }

        ssize_t n = offset ? ::pwrite(entry.host_fd, mem.At(buf), len, static_cast<off_t>(position))
                           : ::write(entry.host_fd, mem.At(buf), len);
        if (n < 0) {
            if (written > 0) {
                break;
            }
            return ErrnoToWasi(errno);
        }
        written += static_cast<std::uint32_t>(n);
        position += n;
        if (static_cast<std::uint32_t>(n) < len) {
            break;
        }
    }
    return wasi_errno::kSuccess;
}

std::uint16_t WasiHost::FdPread(GuestMemory& mem, std::uint32_t fd, std::uint32_t iovs, std::uint32_t iovs_len,
                                std::uint64_t offset, std::uint32_t nread_out) {
    FdEntry* entry = GetEntry(fd);
    if (!entry) {
        return wasi_errno::kBadf;
    }
    if (entry->kind != FdKind::FILE) {
        return entry->kind == FdKind::DIRECTORY ? wasi_errno::kIsdir : wasi_errno::kSpipe;
    }
    std::int64_t pos = static_cast<std::int64_t>(offset);
    std::uint32_t total = 0;
    std::uint16_t err = DoRead(mem, *entry, iovs, iovs_len, &pos, total);
    if (err != wasi_errno::kSuccess) {
        return err;
    }
    return mem.Store(nread_out, total) ? wasi_errno::kSuccess : wasi_errno::kFault;
}

std::uint16_t WasiHost::FdPwrite(GuestMemory& mem, std::uint32_t fd, std::uint32_t iovs, std::uint32_t iovs_len,
                                 std::uint64_t offset, std::uint32_t nwritten_out) {
    FdEntry* entry = GetEntry(fd);
    if (!entry) {
        return wasi_errno::kBadf;
    }
    if (entry->kind != FdKind::FILE) {
        return entry->kind == FdKind::DIRECTORY ? wasi_errno::kIsdir : wasi_errno::kSpipe;
    }
    std::int64_t pos = static_cast<std::int64_t>(offset);
    std::uint32_t total = 0;
    std::uint16_t err = DoWrite(mem, *entry, iovs, iovs_len, &pos, total);
    if (err != wasi_errno::kSuccess) {
        return err;
    }
    return mem.Store(nwritten_out, total) ? wasi_errno::kSuccess : wasi_errno::kFault;
}

std::uint16_t WasiHost::FdRead(GuestMemory& mem, std::uint32_t fd, std::uint32_t iovs, std::uint32_t iovs_len,
                               std::uint32_t nread_out) {
    FdEntry* entry = GetEntry(fd);
    if (!entry) {
        return wasi_errno::kBadf;
    }
    std::uint32_t total = 0;
    std::uint16_t err = DoRead(mem, *entry, iovs, iovs_len, nullptr, total);
    if (err != wasi_errno::kSuccess) {
        return err;
    }
    return mem.Store(nread_out, total) ? wasi_errno::kSuccess : wasi_errno::kFault;
}

std::uint16_t WasiHost::FdWrite(GuestMemory& mem, std::uint32_t fd, std::uint32_t iovs, std::uint32_t iovs_len,
                                std::uint32_t nwritten_out) {
    FdEntry* entry = GetEntry(fd);
    if (!entry) {
        return wasi_errno::kBadf;
    }
    std::uint32_t total = 0;
    std::uint16_t err = DoWrite(mem, *entry, iovs, iovs_len, nullptr, total);
    if (err != wasi_errno::kSuccess) {
        return err;
    }
    return mem.Store(nwritten_out, total) ? wasi_errno::kSuccess : wasi_errno::kFault;
}

std::uint16_t WasiHost::FdPrestatGet(GuestMemory& mem, std::uint32_t fd, std::uint32_t prestat_out) {
    FdEntry* entry = GetEntry(fd);
    if (!entry || !entry->is_preopen) {
        return wasi_errno::kBadf;
    }
    const auto& name = config_.preopens[entry->preopen_index].guest_path;

    std::uint8_t prestat[8] = {};
    prestat[0] = 0;   // preopentype dir
    std::uint32_t name_len = static_cast<std::uint32_t>(name.size());
    std::memcpy(prestat + 4, &name_len, sizeof(name_len));
    return mem.Write(prestat_out, prestat, sizeof(prestat)) ? wasi_errno::kSuccess : wasi_errno::kFault;
}

std::uint16_t WasiHost::FdPrestatDirName(GuestMemory& mem, std::uint32_t fd, std::uint32_t path,
                                         std::uint32_t path_len) {
    FdEntry* entry = GetEntry(fd);
    if (!entry || !entry->is_preopen) {
        return wasi_errno::kBadf;
    }
    const auto& name = config_.preopens[entry->preopen_index].guest_path;
    std::size_t length = std::min<std::size_t>(path_len, name.size());
    return mem.Write(path, name.data(), length) ? wasi_errno::kSuccess : wasi_errno::kFault;
}

std::uint16_t WasiHost::FdReaddir(GuestMemory& mem, std::uint32_t fd, std::uint32_t buf, std::uint32_t buf_len,
                                  std::uint64_t cookie, std::uint32_t bufused_out) {
    FdEntry* entry = GetEntry(fd);
    if (!entry) {
        return wasi_errno::kBadf;
    }
    if (entry->kind != FdKind::DIRECTORY) {
        return wasi_errno::kNotdir;
    }
    if (!mem.Contains(buf, buf_len)) {
        return wasi_errno::kFault;
    }

    int dup_fd = ::fcntl(entry->host_fd, F_DUPFD_CLOEXEC, 0);
    if (dup_fd < 0) {
        return ErrnoToWasi(errno);
    }
    DIR* dir = ::fdopendir(dup_fd);
    if (dir == nullptr) {
        int error = errno;
        ::close(dup_fd);
        return ErrnoToWasi(error);
    }
    ::rewinddir(dir);

    struct Entry {
        std::string name;
        std::uint64_t ino;
        std::uint8_t type;
    };
    std::vector<Entry> entries;
    while (struct dirent* de = ::readdir(dir)) {
        entries.push_back(Entry{de->d_name, static_cast<std::uint64_t>(de->d_ino), FiletypeFromDirent(de->d_type)});
    }
    ::closedir(dir);

    std::uint32_t used = 0;
    for (std::uint64_t i = cookie; i < entries.size() && used < buf_len; ++i) {
        const auto& e = entries[i];
        std::vector<std::uint8_t> record(kDirentHeaderSize + e.name.size(), 0);
        std::uint64_t next = i + 1;
        std::uint32_t namlen = static_cast<std::uint32_t>(e.name.size());
        std::memcpy(record.data() + 0, &next, 8);
        std::memcpy(record.data() + 8, &e.ino, 8);
        std::memcpy(record.data() + 16, &namlen, 4);
        record[20] = e.type;
        std::memcpy(record.data() + kDirentHeaderSize, e.name.data(), e.name.size());

        std::uint32_t chunk = std::min<std::uint32_t>(static_cast<std::uint32_t>(record.size()), buf_len - used);
        mem.Write(buf + used, record.data(), chunk);
        used += chunk;
    }

    return mem.Store(bufused_out, used) ? wasi_errno::kSuccess : wasi_errno::kFault;
}

std::uint16_t WasiHost::FdRenumber(std::uint32_t from, std::uint32_t to) {
    auto src = fds_.find(from);
    auto dst = fds_.find(to);
    if (src == fds_.end() || dst == fds_.end()) {
        return wasi_errno::kBadf;
    }
    if (from == to) {
        return wasi_errno::kSuccess;
    }
    if (dst->second.host_fd >= 0) {
        ::close(dst->second.host_fd);
    }
    dst->second = std::move(src->second);
    fds_.erase(src);
    return wasi_errno::kSuccess;
}

std::uint16_t WasiHost::FdSeek(GuestMemory& mem, std::uint32_t fd, std::int64_t offset, std::uint32_t whence,
                               std::uint32_t newoffset_out) {
    FdEntry* entry = GetEntry(fd);
    if (!entry) {
        return wasi_errno::kBadf;
    }
    if (entry->kind != FdKind::FILE) {
        return entry->kind == FdKind::DIRECTORY ? wasi_errno::kBadf : wasi_errno::kSpipe;
    }

    int host_whence;
    switch (whence) {
        case kWhenceSet: host_whence = SEEK_SET; break;
        case kWhenceCur: host_whence = SEEK_CUR; break;
        case kWhenceEnd: host_whence = SEEK_END; break;
        default: return wasi_errno::kInval;
    }

    off_t result = ::lseek(entry->host_fd, static_cast<off_t>(offset), host_whence);
    if (result < 0) {
        return ErrnoToWasi(errno);
    }
    return mem.Store<std::uint64_t>(newoffset_out, static_cast<std::uint64_t>(result))
               ? wasi_errno::kSuccess : wasi_errno::kFault;
}

std::uint16_t WasiHost::FdTell(GuestMemory& mem, std::uint32_t fd, std::uint32_t offset_out) {
    return FdSeek(mem, fd, 0, kWhenceCur, offset_out);
}

// ============================================================================
// PATHS
// ============================================================================

std::uint16_t WasiHost::PathCreateDirectory(GuestMemory& mem, std::uint32_t fd, std::uint32_t path,
                                            std::uint32_t path_len) {
    OpenedParent parent;
    std::uint16_t err = OpenParent(fd, mem, path, path_len, parent);
    if (err != wasi_errno::kSuccess) {
        return err;
    }
    if (parent.read_only) {
        return wasi_errno::kRofs;
    }
    if (parent.is_root) {
        return wasi_errno::kExist;
    }
    return ::mkdirat(parent.dir.Get(), parent.leaf.c_str(), 0755) == 0 ? wasi_errno::kSuccess : ErrnoToWasi(errno);
}

std::uint16_t WasiHost::PathFilestatGet(GuestMemory& mem, std::uint32_t fd, std::uint32_t /*flags*/,
                                        std::uint32_t path, std::uint32_t path_len, std::uint32_t stat_out) {
    OpenedParent parent;
    std::uint16_t err = OpenParent(fd, mem, path, path_len, parent);
    if (err != wasi_errno::kSuccess) {
        return err;
    }

    // Symlinks are reported as links, never followed
    struct stat st;
    if (::fstatat(parent.dir.Get(), parent.leaf.c_str(), &st, AT_SYMLINK_NOFOLLOW) != 0) {
        return ErrnoToWasi(errno);
    }
    return WriteFilestat(mem, stat_out, st);
}

std::uint16_t WasiHost::PathFilestatSetTimes(GuestMemory& mem, std::uint32_t fd, std::uint32_t /*flags*/,
                                             std::uint32_t path, std::uint32_t path_len,
                                             std::uint64_t atim, std::uint64_t mtim, std::uint32_t fst_flags) {
    OpenedParent parent;
    std::uint16_t err = OpenParent(fd, mem, path, path_len, parent);
    if (err != wasi_errno::kSuccess) {
        return err;
    }
    if (parent.read_only) {
        return wasi_errno::kRofs;
    }

    struct timespec times[2];
    BuildTimes(atim, mtim, fst_flags, times);
    return ::utimensat(parent.dir.Get(), parent.leaf.c_str(), times, AT_SYMLINK_NOFOLLOW) == 0
               ? wasi_errno::kSuccess : ErrnoToWasi(errno);
}

std::uint16_t WasiHost::PathOpen(GuestMemory& mem, std::uint32_t dirfd, std::uint32_t /*dirflags*/,
                                 std::uint32_t path, std::uint32_t path_len, std::uint32_t oflags,
                                 std::uint64_t rights_base, std::uint64_t rights_inheriting,
                                 std::uint32_t fdflags, std::uint32_t fd_out) {
    const FdEntry* dir_entry = GetEntry(dirfd);
    if (!dir_entry) {
        return wasi_errno::kBadf;
    }
    std::uint64_t parent_inheriting = dir_entry->rights_inheriting;

    OpenedParent parent;
    std::uint16_t err = OpenParent(dirfd, mem, path, path_len, parent);
    if (err != wasi_errno::kSuccess) {
        return err;
    }

    bool wants_write = (oflags & (kOflagCreat | kOflagTrunc)) != 0 ||
                       (fdflags & kFdflagAppend) != 0 ||
                       (rights_base & kWriteIntentRights) != 0;
    if (parent.read_only && wants_write) {
        return wasi_errno::kRofs;
    }

    bool writable = (rights_base & kRightFdWrite) != 0 || (oflags & kOflagTrunc) != 0;
    bool readable = (rights_base & (kRightFdRead | kRightFdReaddir)) != 0;

    int flags = O_CLOEXEC | O_NOFOLLOW;
    if (writable && readable) {
        flags |= O_RDWR;
    } else if (writable) {
        flags |= O_WRONLY;
    } else {
        flags |= O_RDONLY;
    }
    if (oflags & kOflagCreat) flags |= O_CREAT;
    if (oflags & kOflagExcl) flags |= O_EXCL;
    if (oflags & kOflagTrunc) flags |= O_TRUNC;
    if (oflags & kOflagDirectory) flags |= O_DIRECTORY;
    if (fdflags & kFdflagAppend) flags |= O_APPEND;
    if (fdflags & kFdflagSync) flags |= O_SYNC;
    if (fdflags & kFdflagDsync) flags |= O_DSYNC;

    int host_fd = -1;
    if (parent.is_root) {
        if ((oflags & (kOflagCreat | kOflagExcl)) == (kOflagCreat | kOflagExcl)) {
            return wasi_errno::kExist;
        }
        if (writable) {
            return wasi_errno::kIsdir;
        }
        host_fd = ::openat(parent.dir.Get(), ".", O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    } else {
        host_fd = ::openat(parent.dir.Get(), parent.leaf.c_str(), flags, 0644);
    }

    if (host_fd < 0) {
        int error = errno;
        if (error == ELOOP) {
            return wasi_errno::kNotcapable;
        }
        return ErrnoToWasi(error);
    }
    UniqueFd opened(host_fd);

    struct stat st;
    if (::fstat(opened.Get(), &st) != 0) {
        return ErrnoToWasi(errno);
    }

    FdEntry entry;
    entry.kind = S_ISDIR(st.st_mode) ? FdKind::DIRECTORY : FdKind::FILE;
    entry.host_fd = opened.Release();
    entry.preopen_index = parent.preopen_index;
    entry.components = std::move(parent.components);
    entry.read_only = parent.read_only;
    entry.rights_base = rights_base & parent_inheriting;
    entry.rights_inheriting = rights_inheriting & parent_inheriting;
    if (parent.read_only) {
        entry.rights_base &= kRightsReadOnly;
        entry.rights_inheriting &= kRightsReadOnly;
    }
    entry.fdflags = static_cast<std::uint16_t>(fdflags);

    std::uint32_t new_fd = AllocateFd();
    if (!mem.Store(fd_out, new_fd)) {
        ::close(entry.host_fd);
        return wasi_errno::kFault;
    }
    fds_[new_fd] = std::move(entry);
    return wasi_errno::kSuccess;
}

std::uint16_t WasiHost::PathReadlink(GuestMemory& mem, std::uint32_t fd, std::uint32_t path,
                                     std::uint32_t path_len, std::uint32_t buf, std::uint32_t buf_len,
                                     std::uint32_t bufused_out) {
    OpenedParent parent;
    std::uint16_t err = OpenParent(fd, mem, path, path_len, parent);
    if (err != wasi_errno::kSuccess) {
        return err;
    }
    if (!mem.Contains(buf, buf_len)) {
        return wasi_errno::kFault;
    }

    ssize_t n = ::readlinkat(parent.dir.Get(), parent.leaf.c_str(), reinterpret_cast<char*>(mem.At(buf)), buf_len);
    if (n < 0) {
        return ErrnoToWasi(errno);
    }
    return mem.Store<std::uint32_t>(bufused_out, static_cast<std::uint32_t>(n))
               ? wasi_errno::kSuccess : wasi_errno::kFault;
}

std::uint16_t WasiHost::PathRemoveDirectory(GuestMemory& mem, std::uint32_t fd, std::uint32_t path,
                                            std::uint32_t path_len) {
    OpenedParent parent;
    std::uint16_t err = OpenParent(fd, mem, path, path_len, parent);
    if (err != wasi_errno::kSuccess) {
        return err;
    }
    if (parent.read_only) {
        return wasi_errno::kRofs;
    }
    if (parent.is_root) {
        return wasi_errno::kBusy;
    }
    return ::unlinkat(parent.dir.Get(), parent.leaf.c_str(), AT_REMOVEDIR) == 0
               ? wasi_errno::kSuccess : ErrnoToWasi(errno);
}

std::uint16_t WasiHost::PathRename(GuestMemory& mem, std::uint32_t old_fd, std::uint32_t old_path,
                                   std::uint32_t old_len, std::uint32_t new_fd, std::uint32_t new_path,
                                   std::uint32_t new_len) {
    OpenedParent from;
    std::uint16_t err = OpenParent(old_fd, mem, old_path, old_len, from);
    if (err != wasi_errno::kSuccess) {
        return err;
    }
    OpenedParent to;
    err = OpenParent(new_fd, mem, new_path, new_len, to);
    if (err != wasi_errno::kSuccess) {
        return err;
    }

    if (from.read_only || to.read_only) {
        return wasi_errno::kRofs;
    }
    if (from.preopen_index != to.preopen_index) {
        return wasi_errno::kXdev;
    }
    if (from.is_root || to.is_root) {
        return wasi_errno::kBusy;
    }

    return ::renameat(from.dir.Get(), from.leaf.c_str(), to.dir.Get(), to.leaf.c_str()) == 0
               ? wasi_errno::kSuccess : ErrnoToWasi(errno);
}

std::uint16_t WasiHost::PathUnlinkFile(GuestMemory& mem, std::uint32_t fd, std::uint32_t path,
                                       std::uint32_t path_len) {
    OpenedParent parent;
    std::uint16_t err = OpenParent(fd, mem, path, path_len, parent);
    if (err != wasi_errno::kSuccess) {
        return err;
    }
    if (parent.read_only) {
        return wasi_errno::kRofs;
    }
    if (parent.is_root) {
        return wasi_errno::kIsdir;
    }
    return ::unlinkat(parent.dir.Get(), parent.leaf.c_str(), 0) == 0 ? wasi_errno::kSuccess : ErrnoToWasi(errno);
}

} // namespace wasm
} // namespace wasmbox
