/**
 * @file wasi_bindings.cpp
 * @brief wasm3 raw-function wrappers around WasiHost
 *
 * Each wrapper unpacks the interpreter stack, builds a bounds-checked view
 * of linear memory and forwards to the host. Pointer arguments arrive as
 * 32-bit guest offsets and are validated by GuestMemory, never by wasm3.
 *
 * @date 2025
 */

#include "wasmbox/wasm/wasi_bindings.hpp"
#include "wasmbox/wasm/wasi_host.hpp"

#include "m3_api_defs.h"

#include <cstdint>

namespace wasmbox {
namespace wasm {

namespace {

WasiHost* HostOf(IM3Runtime runtime) {
    return static_cast<WasiHost*>(m3_GetUserData(runtime));
}

GuestMemory MemoryOf(IM3Runtime runtime, void* mem) {
    return GuestMemory(static_cast<std::uint8_t*>(mem), m3_GetMemorySize(runtime));
}

// ============================================================================
// ARGUMENTS, ENVIRONMENT, CLOCKS
// ============================================================================

m3ApiRawFunction(wasi_args_get) {
    m3ApiReturnType(uint32_t);
    m3ApiGetArg(uint32_t, argv);
    m3ApiGetArg(uint32_t, argv_buf);
    GuestMemory mem = MemoryOf(runtime, _mem);
    m3ApiReturn(HostOf(runtime)->ArgsGet(mem, argv, argv_buf));
}

m3ApiRawFunction(wasi_args_sizes_get) {
    m3ApiReturnType(uint32_t);
    m3ApiGetArg(uint32_t, argc_out);
    m3ApiGetArg(uint32_t, buf_size_out);
    GuestMemory mem = MemoryOf(runtime, _mem);
    m3ApiReturn(HostOf(runtime)->ArgsSizesGet(mem, argc_out, buf_size_out));
}

m3ApiRawFunction(wasi_environ_get) {
    m3ApiReturnType(uint32_t);
    m3ApiGetArg(uint32_t, environ_ptrs);
    m3ApiGetArg(uint32_t, environ_buf);
    GuestMemory mem = MemoryOf(runtime, _mem);
    m3ApiReturn(HostOf(runtime)->EnvironGet(mem, environ_ptrs, environ_buf));
}

m3ApiRawFunction(wasi_environ_sizes_get) {
    m3ApiReturnType(uint32_t);
    m3ApiGetArg(uint32_t, count_out);
    m3ApiGetArg(uint32_t, buf_size_out);
    GuestMemory mem = MemoryOf(runtime, _mem);
    m3ApiReturn(HostOf(runtime)->EnvironSizesGet(mem, count_out, buf_size_out));
}

m3ApiRawFunction(wasi_clock_res_get) {
    m3ApiReturnType(uint32_t);
    m3ApiGetArg(uint32_t, clock_id);
    m3ApiGetArg(uint32_t, resolution_out);
    GuestMemory mem = MemoryOf(runtime, _mem);
    m3ApiReturn(HostOf(runtime)->ClockResGet(mem, clock_id, resolution_out));
}

m3ApiRawFunction(wasi_clock_time_get) {
    m3ApiReturnType(uint32_t);
    m3ApiGetArg(uint32_t, clock_id);
    m3ApiGetArg(uint64_t, precision);
    m3ApiGetArg(uint32_t, time_out);
    GuestMemory mem = MemoryOf(runtime, _mem);
    m3ApiReturn(HostOf(runtime)->ClockTimeGet(mem, clock_id, precision, time_out));
}

m3ApiRawFunction(wasi_random_get) {
    m3ApiReturnType(uint32_t);
    m3ApiGetArg(uint32_t, buf);
    m3ApiGetArg(uint32_t, buf_len);
    GuestMemory mem = MemoryOf(runtime, _mem);
    m3ApiReturn(HostOf(runtime)->RandomGet(mem, buf, buf_len));
}

m3ApiRawFunction(wasi_sched_yield) {
    m3ApiReturnType(uint32_t);
    m3ApiReturn(HostOf(runtime)->SchedYield());
}

m3ApiRawFunction(wasi_poll_oneoff) {
    m3ApiReturnType(uint32_t);
    m3ApiGetArg(uint32_t, in);
    m3ApiGetArg(uint32_t, out);
    m3ApiGetArg(uint32_t, nsubscriptions);
    m3ApiGetArg(uint32_t, nevents_out);
    GuestMemory mem = MemoryOf(runtime, _mem);
    WasiHost* host = HostOf(runtime);
    uint16_t result = host->PollOneoff(mem, in, out, nsubscriptions, nevents_out);
    if (host->IsCancelled()) {
        m3ApiTrap(m3Err_trapExit);
    }
    m3ApiReturn(result);
}

m3ApiRawFunction(wasi_proc_exit) {
    m3ApiGetArg(uint32_t, code);
    HostOf(runtime)->ProcExit(static_cast<int32_t>(code));
    m3ApiTrap(m3Err_trapExit);
}

m3ApiRawFunction(wasi_proc_raise) {
    m3ApiReturnType(uint32_t);
    m3ApiGetArg(uint32_t, signal);
    (void)signal;
    m3ApiReturn(wasi_errno::kNosys);
}

// ============================================================================
// FILE DESCRIPTORS
// ============================================================================

m3ApiRawFunction(wasi_fd_advise) {
    m3ApiReturnType(uint32_t);
    m3ApiGetArg(uint32_t, fd);
    m3ApiGetArg(uint64_t, offset);
    m3ApiGetArg(uint64_t, length);
    m3ApiGetArg(uint32_t, advice);
    (void)offset; (void)length; (void)advice;
    m3ApiReturn(HostOf(runtime)->FdAdvise(fd));
}

m3ApiRawFunction(wasi_fd_allocate) {
    m3ApiReturnType(uint32_t);
    m3ApiGetArg(uint32_t, fd);
    m3ApiGetArg(uint64_t, offset);
    m3ApiGetArg(uint64_t, length);
    (void)offset; (void)length;
    m3ApiReturn(HostOf(runtime)->FdAllocate(fd));
}

m3ApiRawFunction(wasi_fd_close) {
    m3ApiReturnType(uint32_t);
    m3ApiGetArg(uint32_t, fd);
    m3ApiReturn(HostOf(runtime)->FdClose(fd));
}

m3ApiRawFunction(wasi_fd_datasync) {
    m3ApiReturnType(uint32_t);
    m3ApiGetArg(uint32_t, fd);
    m3ApiReturn(HostOf(runtime)->FdDatasync(fd));
}

m3ApiRawFunction(wasi_fd_sync) {
    m3ApiReturnType(uint32_t);
    m3ApiGetArg(uint32_t, fd);
    m3ApiReturn(HostOf(runtime)->FdSync(fd));
}

m3ApiRawFunction(wasi_fd_fdstat_get) {
    m3ApiReturnType(uint32_t);
    m3ApiGetArg(uint32_t, fd);
    m3ApiGetArg(uint32_t, stat_out);
    GuestMemory mem = MemoryOf(runtime, _mem);
    m3ApiReturn(HostOf(runtime)->FdFdstatGet(mem, fd, stat_out));
}

m3ApiRawFunction(wasi_fd_fdstat_set_flags) {
    m3ApiReturnType(uint32_t);
    m3ApiGetArg(uint32_t, fd);
    m3ApiGetArg(uint32_t, flags);
    m3ApiReturn(HostOf(runtime)->FdFdstatSetFlags(fd, flags));
}

m3ApiRawFunction(wasi_fd_fdstat_set_rights) {
    m3ApiReturnType(uint32_t);
    m3ApiGetArg(uint32_t, fd);
    (void)fd;
    m3ApiReturn(wasi_errno::kNotsup);
}

m3ApiRawFunction(wasi_fd_filestat_get) {
    m3ApiReturnType(uint32_t);
    m3ApiGetArg(uint32_t, fd);
    m3ApiGetArg(uint32_t, stat_out);
    GuestMemory mem = MemoryOf(runtime, _mem);
    m3ApiReturn(HostOf(runtime)->FdFilestatGet(mem, fd, stat_out));
}

m3ApiRawFunction(wasi_fd_filestat_set_size) {
    m3ApiReturnType(uint32_t);
    m3ApiGetArg(uint32_t, fd);
    m3ApiGetArg(uint64_t, size);
    m3ApiReturn(HostOf(runtime)->FdFilestatSetSize(fd, size));
}

m3ApiRawFunction(wasi_fd_filestat_set_times) {
    m3ApiReturnType(uint32_t);
    m3ApiGetArg(uint32_t, fd);
    m3ApiGetArg(uint64_t, atim);
    m3ApiGetArg(uint64_t, mtim);
    m3ApiGetArg(uint32_t, fst_flags);
    m3ApiReturn(HostOf(runtime)->FdFilestatSetTimes(fd, atim, mtim, fst_flags));
}

m3ApiRawFunction(wasi_fd_pread) {
    m3ApiReturnType(uint32_t);
    m3ApiGetArg(uint32_t, fd);
    m3ApiGetArg(uint32_t, iovs);
    m3ApiGetArg(uint32_t, iovs_len);
    m3ApiGetArg(uint64_t, offset);
    m3ApiGetArg(uint32_t, nread_out);
    GuestMemory mem = MemoryOf(runtime, _mem);
    m3ApiReturn(HostOf(runtime)->FdPread(mem, fd, iovs, iovs_len, offset, nread_out));
}

m3ApiRawFunction(wasi_fd_pwrite) {
    m3ApiReturnType(uint32_t);
    m3ApiGetArg(uint32_t, fd);
    m3ApiGetArg(uint32_t, iovs);
    m3ApiGetArg(uint32_t, iovs_len);
    m3ApiGetArg(uint64_t, offset);
    m3ApiGetArg(uint32_t, nwritten_out);
    GuestMemory mem = MemoryOf(runtime, _mem);
    m3ApiReturn(HostOf(runtime)->FdPwrite(mem, fd, iovs, iovs_len, offset, nwritten_out));
}

m3ApiRawFunction(wasi_fd_read) {
    m3ApiReturnType(uint32_t);
    m3ApiGetArg(uint32_t, fd);
    m3ApiGetArg(uint32_t, iovs);
    m3ApiGetArg(uint32_t, iovs_len);
    m3ApiGetArg(uint32_t, nread_out);
    GuestMemory mem = MemoryOf(runtime, _mem);
    m3ApiReturn(HostOf(runtime)->FdRead(mem, fd, iovs, iovs_len, nread_out));
}

m3ApiRawFunction(wasi_fd_write) {
    m3ApiReturnType(uint32_t);
    m3ApiGetArg(uint32_t, fd);
    m3ApiGetArg(uint32_t, iovs);
    m3ApiGetArg(uint32_t, iovs_len);
    m3ApiGetArg(uint32_t, nwritten_out);
    GuestMemory mem = MemoryOf(runtime, _mem);
    m3ApiReturn(HostOf(runtime)->FdWrite(mem, fd, iovs, iovs_len, nwritten_out));
}

m3ApiRawFunction(wasi_fd_prestat_get) {
    m3ApiReturnType(uint32_t);
    m3ApiGetArg(uint32_t, fd);
    m3ApiGetArg(uint32_t, prestat_out);
    GuestMemory mem = MemoryOf(runtime, _mem);
    m3ApiReturn(HostOf(runtime)->FdPrestatGet(mem, fd, prestat_out));
}

m3ApiRawFunction(wasi_fd_prestat_dir_name) {
    m3ApiReturnType(uint32_t);
    m3ApiGetArg(uint32_t, fd);
    m3ApiGetArg(uint32_t, path);
    m3ApiGetArg(uint32_t, path_len);
    GuestMemory mem = MemoryOf(runtime, _mem);
    m3ApiReturn(HostOf(runtime)->FdPrestatDirName(mem, fd, path, path_len));
}

m3ApiRawFunction(wasi_fd_readdir) {
    m3ApiReturnType(uint32_t);
    m3ApiGetArg(uint32_t, fd);
    m3ApiGetArg(uint32_t, buf);
    m3ApiGetArg(uint32_t, buf_len);
    m3ApiGetArg(uint64_t, cookie);
    m3ApiGetArg(uint32_t, bufused_out);
    GuestMemory mem = MemoryOf(runtime, _mem);
    m3ApiReturn(HostOf(runtime)->FdReaddir(mem, fd, buf, buf_len, cookie, bufused_out));
}

m3ApiRawFunction(wasi_fd_renumber) {
    m3ApiReturnType(uint32_t);
    m3ApiGetArg(uint32_t, from);
    m3ApiGetArg(uint32_t, to);
    m3ApiReturn(HostOf(runtime)->FdRenumber(from, to));
}

m3ApiRawFunction(wasi_fd_seek) {
    m3ApiReturnType(uint32_t);
    m3ApiGetArg(uint32_t, fd);
    m3ApiGetArg(int64_t, offset);
    m3ApiGetArg(uint32_t, whence);
    m3ApiGetArg(uint32_t, newoffset_out);
    GuestMemory mem = MemoryOf(runtime, _mem);
    m3ApiReturn(HostOf(runtime)->FdSeek(mem, fd, offset, whence, newoffset_out));
}

m3ApiRawFunction(wasi_fd_tell) {
    m3ApiReturnType(uint32_t);
    m3ApiGetArg(uint32_t, fd);
    m3ApiGetArg(uint32_t, offset_out);
    GuestMemory mem = MemoryOf(runtime, _mem);
    m3ApiReturn(HostOf(runtime)->FdTell(mem, fd, offset_out));
}

// ============================================================================
// PATHS
// ============================================================================

m3ApiRawFunction(wasi_path_create_directory) {
    m3ApiReturnType(uint32_t);
    m3ApiGetArg(uint32_t, fd);
    m3ApiGetArg(uint32_t, path);
    m3ApiGetArg(uint32_t, path_len);
    GuestMemory mem = MemoryOf(runtime, _mem);
    m3ApiReturn(HostOf(runtime)->PathCreateDirectory(mem, fd, path, path_len));
}

m3ApiRawFunction(wasi_path_filestat_get) {
    m3ApiReturnType(uint32_t);
    m3ApiGetArg(uint32_t, fd);
    m3ApiGetArg(uint32_t, flags);
    m3ApiGetArg(uint32_t, path);
    m3ApiGetArg(uint32_t, path_len);
    m3ApiGetArg(uint32_t, stat_out);
    GuestMemory mem = MemoryOf(runtime, _mem);
    m3ApiReturn(HostOf(runtime)->PathFilestatGet(mem, fd, flags, path, path_len, stat_out));
}

m3ApiRawFunction(wasi_path_filestat_set_times) {
    m3ApiReturnType(uint32_t);
    m3ApiGetArg(uint32_t, fd);
    m3ApiGetArg(uint32_t, flags);
    m3ApiGetArg(uint32_t, path);
    m3ApiGetArg(uint32_t, path_len);
    m3ApiGetArg(uint64_t, atim);
    m3ApiGetArg(uint64_t, mtim);
    m3ApiGetArg(uint32_t, fst_flags);
    GuestMemory mem = MemoryOf(runtime, _mem);
    m3ApiReturn(HostOf(runtime)->PathFilestatSetTimes(mem, fd, flags, path, path_len, atim, mtim, fst_flags));
}

m3ApiRawFunction(wasi_path_link) {
    m3ApiReturnType(uint32_t);
    m3ApiReturn(HostOf(runtime)->PathLink());
}

m3ApiRawFunction(wasi_path_open) {
    m3ApiReturnType(uint32_t);
    m3ApiGetArg(uint32_t, dirfd);
    m3ApiGetArg(uint32_t, dirflags);
    m3ApiGetArg(uint32_t, path);
    m3ApiGetArg(uint32_t, path_len);
    m3ApiGetArg(uint32_t, oflags);
    m3ApiGetArg(uint64_t, rights_base);
    m3ApiGetArg(uint64_t, rights_inheriting);
    m3ApiGetArg(uint32_t, fdflags);
    m3ApiGetArg(uint32_t, fd_out);
    GuestMemory mem = MemoryOf(runtime, _mem);
    m3ApiReturn(HostOf(runtime)->PathOpen(mem, dirfd, dirflags, path, path_len, oflags,
                                          rights_base, rights_inheriting, fdflags, fd_out));
}

m3ApiRawFunction(wasi_path_readlink) {
    m3ApiReturnType(uint32_t);
    m3ApiGetArg(uint32_t, fd);
    m3ApiGetArg(uint32_t, path);
    m3ApiGetArg(uint32_t, path_len);
    m3ApiGetArg(uint32_t, buf);
    m3ApiGetArg(uint32_t, buf_len);
    m3ApiGetArg(uint32_t, bufused_out);
    GuestMemory mem = MemoryOf(runtime, _mem);
    m3ApiReturn(HostOf(runtime)->PathReadlink(mem, fd, path, path_len, buf, buf_len, bufused_out));
}

m3ApiRawFunction(wasi_path_remove_directory) {
    m3ApiReturnType(uint32_t);
    m3ApiGetArg(uint32_t, fd);
    m3ApiGetArg(uint32_t, path);
    m3ApiGetArg(uint32_t, path_len);
    GuestMemory mem = MemoryOf(runtime, _mem);
    m3ApiReturn(HostOf(runtime)->PathRemoveDirectory(mem, fd, path, path_len));
}

m3ApiRawFunction(wasi_path_rename) {
    m3ApiReturnType(uint32_t);
    m3ApiGetArg(uint32_t, old_fd);
    m3ApiGetArg(uint32_t, old_path);
    m3ApiGetArg(uint32_t, old_len);
    m3ApiGetArg(uint32_t, new_fd);
    m3ApiGetArg(uint32_t, new_path);
    m3ApiGetArg(uint32_t, new_len);
    GuestMemory mem = MemoryOf(runtime, _mem);
    m3ApiReturn(HostOf(runtime)->PathRename(mem, old_fd, old_path, old_len, new_fd, new_path, new_len));
}

m3ApiRawFunction(wasi_path_symlink) {
    m3ApiReturnType(uint32_t);
    m3ApiReturn(HostOf(runtime)->PathSymlink());
}

m3ApiRawFunction(wasi_path_unlink_file) {
    m3ApiReturnType(uint32_t);
    m3ApiGetArg(uint32_t, fd);
    m3ApiGetArg(uint32_t, path);
    m3ApiGetArg(uint32_t, path_len);
    GuestMemory mem = MemoryOf(runtime, _mem);
    m3ApiReturn(HostOf(runtime)->PathUnlinkFile(mem, fd, path, path_len));
}

// ============================================================================
// SOCKETS (no network inside the sandbox)
// ============================================================================

m3ApiRawFunction(wasi_sock_unsupported) {
    m3ApiReturnType(uint32_t);
    m3ApiReturn(wasi_errno::kNotsup);
}

// ============================================================================
// LINKING
// ============================================================================

M3Result SuppressLookupFailure(M3Result result) {
    return result == m3Err_functionLookupFailed ? m3Err_none : result;
}

struct Binding {
    const char* name;
    const char* signature;
    M3RawCall function;
};

const Binding kBindings[] = {
    {"args_get", "i(**)", &wasi_args_get},
    {"args_sizes_get", "i(**)", &wasi_args_sizes_get},
    {"environ_get", "i(**)", &wasi_environ_get},
    {"environ_sizes_get", "i(**)", &wasi_environ_sizes_get},
    {"clock_res_get", "i(i*)", &wasi_clock_res_get},
    {"clock_time_get", "i(iI*)", &wasi_clock_time_get},
    {"random_get", "i(*i)", &wasi_random_get},
    {"sched_yield", "i()", &wasi_sched_yield},
    {"poll_oneoff", "i(**i*)", &wasi_poll_oneoff},
    {"proc_exit", "v(i)", &wasi_proc_exit},
    {"proc_raise", "i(i)", &wasi_proc_raise},

    {"fd_advise", "i(iIIi)", &wasi_fd_advise},
    {"fd_allocate", "i(iII)", &wasi_fd_allocate},
    {"fd_close", "i(i)", &wasi_fd_close},
    {"fd_datasync", "i(i)", &wasi_fd_datasync},
    {"fd_sync", "i(i)", &wasi_fd_sync},
    {"fd_fdstat_get", "i(i*)", &wasi_fd_fdstat_get},
    {"fd_fdstat_set_flags", "i(ii)", &wasi_fd_fdstat_set_flags},
    {"fd_fdstat_set_rights", "i(iII)", &wasi_fd_fdstat_set_rights},
    {"fd_filestat_get", "i(i*)", &wasi_fd_filestat_get},
    {"fd_filestat_set_size", "i(iI)", &wasi_fd_filestat_set_size},
    {"fd_filestat_set_times", "i(iIIi)", &wasi_fd_filestat_set_times},
    {"fd_pread", "i(i*iI*)", &wasi_fd_pread},
    {"fd_pwrite", "i(i*iI*)", &wasi_fd_pwrite},
    {"fd_read", "i(i*i*)", &wasi_fd_read},
    {"fd_write", "i(i*i*)", &wasi_fd_write},
    {"fd_prestat_get", "i(i*)", &wasi_fd_prestat_get},
    {"fd_prestat_dir_name", "i(i*i)", &wasi_fd_prestat_dir_name},
    {"fd_readdir", "i(i*iI*)", &wasi_fd_readdir},
    {"fd_renumber", "i(ii)", &wasi_fd_renumber},
    {"fd_seek", "i(iIi*)", &wasi_fd_seek},
    {"fd_tell", "i(i*)", &wasi_fd_tell},

    {"path_create_directory", "i(i*i)", &wasi_path_create_directory},
    {"path_filestat_get", "i(ii*i*)", &wasi_path_filestat_get},
    {"path_filestat_set_times", "i(ii*iIIi)", &wasi_path_filestat_set_times},
    {"path_link", "i(ii*ii*i)", &wasi_path_link},
    {"path_open", "i(ii*iiIIi*)", &wasi_path_open},
    {"path_readlink", "i(i*i*i*)", &wasi_path_readlink},
    {"path_remove_directory", "i(i*i)", &wasi_path_remove_directory},
    {"path_rename", "i(i*ii*i)", &wasi_path_rename},
    {"path_symlink", "i(*ii*i)", &wasi_path_symlink},
    {"path_unlink_file", "i(i*i)", &wasi_path_unlink_file},

    {"sock_accept", "i(ii*)", &wasi_sock_unsupported},
    {"sock_recv", "i(i*ii**)", &wasi_sock_unsupported},
    {"sock_send", "i(i*ii*)", &wasi_sock_unsupported},
    {"sock_shutdown", "i(ii)", &wasi_sock_unsupported},
};

} // anonymous namespace

M3Result LinkWasi(IM3Module module) {
    static const char* const kNamespaces[] = {"wasi_unstable", "wasi_snapshot_preview1"};

    for (const char* ns : kNamespaces) {
        for (const auto& binding : kBindings) {
            M3Result result = SuppressLookupFailure(
                m3_LinkRawFunction(module, ns, binding.name, binding.signature, binding.function));
            if (result != m3Err_none) {
                return result;
            }
        }
    }
    return m3Err_none;
}

} // namespace wasm
} // namespace wasmbox
