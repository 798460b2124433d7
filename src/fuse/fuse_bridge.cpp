#define FUSE_USE_VERSION 31

#include "fuse/fuse_bridge.hpp"
#include "overlay/filesystem_operations.hpp"

#include <fuse.h>

#include <cerrno>
#include <cstring>
#include <exception>
#include <pwd.h>
#include <spdlog/spdlog.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <unistd.h>
#include <vector>

namespace bpfs::fuse {

namespace {

overlay::FilesystemOperations& ops() {
    return *static_cast<overlay::FilesystemOperations*>(
        fuse_get_context()->private_data);
}

overlay::Caller current_caller() {
    auto* context = fuse_get_context();
    overlay::Caller caller;
    caller.uid = static_cast<u32>(context->uid);
    caller.gid = static_cast<u32>(context->gid);
    caller.name = user_name(caller.uid);
    return caller;
}

/// Run one callback body. Nothing may unwind into libfuse.
template <typename Fn>
int guarded(const char* op, const char* path, Fn&& fn) {
    try {
        return fn();
    } catch (const std::exception& e) {
        spdlog::error("event=bridge_fault op={} path={} error=\"{}\"", op,
                      path, e.what());
        return -EIO;
    }
}

template <typename T>
int status(const Result<T>& result) {
    return result ? 0 : -result.error().to_errno();
}

void fill_stat(const vfs::FileInfo& info, struct stat* st) {
    std::memset(st, 0, sizeof(*st));
    st->st_mode = static_cast<mode_t>(info.mode);
    st->st_nlink = static_cast<nlink_t>(info.nlink);
    st->st_uid = static_cast<uid_t>(info.uid);
    st->st_gid = static_cast<gid_t>(info.gid);
    st->st_size = static_cast<off_t>(info.size_bytes);
    st->st_blocks = static_cast<blkcnt_t>((info.size_bytes + 511) / 512);
    st->st_atime = static_cast<time_t>(info.atime);
    st->st_mtime = static_cast<time_t>(info.mtime);
    st->st_ctime = static_cast<time_t>(info.ctime);
}

int bpfs_getattr(const char* path, struct stat* st, struct fuse_file_info*) {
    return guarded("getattr", path, [&] {
        auto info = ops().getattr(path);
        if (!info) return status(info);
        fill_stat(info.value(), st);
        return 0;
    });
}

int bpfs_readdir(const char* path, void* buf, fuse_fill_dir_t filler, off_t,
                 struct fuse_file_info*, enum fuse_readdir_flags) {
    return guarded("readdir", path, [&] {
        auto entries = ops().readdir(path);
        if (!entries) return status(entries);
        for (const auto& entry : entries.value()) {
            if (filler(buf, entry.name.c_str(), nullptr, 0,
                       static_cast<fuse_fill_dir_flags>(0)) != 0) {
                break; // buffer full
            }
        }
        return 0;
    });
}

int bpfs_mkdir(const char* path, mode_t mode) {
    return guarded("mkdir", path, [&] {
        return status(ops().mkdir(path, mode, current_caller()));
    });
}

int bpfs_create(const char* path, mode_t mode, struct fuse_file_info* fi) {
    return guarded("create", path, [&] {
        auto handle = ops().create(path, mode, fi->flags, current_caller());
        if (!handle) return status(handle);
        fi->fh = handle.value();
        return 0;
    });
}

int bpfs_open(const char* path, struct fuse_file_info* fi) {
    return guarded("open", path, [&] {
        auto handle = ops().open(path, fi->flags, current_caller());
        if (!handle) return status(handle);
        fi->fh = handle.value();
        return 0;
    });
}

int bpfs_read(const char* path, char* buf, size_t size, off_t offset,
              struct fuse_file_info* fi) {
    return guarded("read", path, [&] {
        std::optional<vfs::FileHandle> handle;
        if (fi) handle = fi->fh;
        auto count = ops().read(path, buf, size, static_cast<u64>(offset), handle);
        if (!count) return status(count);
        return static_cast<int>(count.value());
    });
}

int bpfs_write(const char* path, const char* buf, size_t size, off_t offset,
               struct fuse_file_info* fi) {
    return guarded("write", path, [&] {
        std::optional<vfs::FileHandle> handle;
        if (fi) handle = fi->fh;
        auto count = ops().write(path, buf, size, static_cast<u64>(offset), handle);
        if (!count) return status(count);
        return static_cast<int>(count.value());
    });
}

int bpfs_release(const char* path, struct fuse_file_info* fi) {
    return guarded("release", path, [&] {
        return status(ops().release(path, fi->fh));
    });
}

int bpfs_access(const char* path, int mask) {
    return guarded("access", path, [&] {
        return status(ops().access(path, mask, current_caller()));
    });
}

int bpfs_statfs(const char* path, struct statvfs* out) {
    return guarded("statfs", path, [&] {
        auto stats = ops().statfs(path);
        if (!stats) return status(stats);
        const auto& s = stats.value();
        std::memset(out, 0, sizeof(*out));
        out->f_bsize = s.block_size;
        out->f_frsize = s.fragment_size;
        out->f_blocks = s.blocks;
        out->f_bfree = s.blocks_free;
        out->f_bavail = s.blocks_available;
        out->f_files = s.files;
        out->f_ffree = s.files_free;
        out->f_favail = s.files_free;
        out->f_namemax = s.name_max;
        return 0;
    });
}

int bpfs_truncate(const char* path, off_t size, struct fuse_file_info*) {
    return guarded("truncate", path, [&] {
        return status(ops().truncate(path, static_cast<u64>(size),
                                     current_caller()));
    });
}

int bpfs_unlink(const char* path) {
    return guarded("unlink", path, [&] {
        return status(ops().unlink(path, current_caller()));
    });
}

int bpfs_rmdir(const char* path) {
    return guarded("rmdir", path, [&] {
        return status(ops().rmdir(path, current_caller()));
    });
}

int bpfs_utimens(const char* path, const struct timespec tv[2],
                 struct fuse_file_info*) {
    return guarded("utimens", path, [&] {
        return status(ops().utimens(path, tv[0].tv_sec, tv[0].tv_nsec,
                                    tv[1].tv_sec, tv[1].tv_nsec,
                                    current_caller()));
    });
}

void* bpfs_init(struct fuse_conn_info*, struct fuse_config* config) {
    // Virtual entries can appear and vanish behind the kernel's back.
    config->entry_timeout = 0;
    config->attr_timeout = 0;
    config->negative_timeout = 0;
    return fuse_get_context()->private_data;
}

} // namespace

std::string user_name(u32 uid) {
    struct passwd entry {};
    struct passwd* found = nullptr;
    long size = sysconf(_SC_GETPW_R_SIZE_MAX);
    std::vector<char> buffer(size > 0 ? static_cast<size_t>(size) : 4096);
    if (getpwuid_r(static_cast<uid_t>(uid), &entry, buffer.data(),
                   buffer.size(), &found) == 0 &&
        found) {
        return found->pw_name;
    }
    return std::to_string(uid);
}

int run(overlay::FilesystemOperations& filesystem, const MountOptions& options) {
    struct fuse_operations operations {};
    operations.init = bpfs_init;
    operations.getattr = bpfs_getattr;
    operations.readdir = bpfs_readdir;
    operations.mkdir = bpfs_mkdir;
    operations.create = bpfs_create;
    operations.open = bpfs_open;
    operations.read = bpfs_read;
    operations.write = bpfs_write;
    operations.release = bpfs_release;
    operations.access = bpfs_access;
    operations.statfs = bpfs_statfs;
    operations.truncate = bpfs_truncate;
    operations.unlink = bpfs_unlink;
    operations.rmdir = bpfs_rmdir;
    operations.utimens = bpfs_utimens;

    std::string mount_point = options.mount_point.string();
    std::vector<std::string> args = {"bpfs", mount_point, "-o",
                                     "fsname=blueprintfs"};
    if (options.foreground) args.push_back("-f");
    if (options.debug) args.push_back("-d");

    std::vector<char*> argv;
    for (auto& arg : args) argv.push_back(arg.data());

    spdlog::info("Mounting at {} ({})", mount_point,
                 options.foreground ? "foreground" : "background");
    return fuse_main(static_cast<int>(argv.size()), argv.data(), &operations,
                     &filesystem);
}

} // namespace bpfs::fuse
