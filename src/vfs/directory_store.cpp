#include "vfs/directory_store.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <unistd.h>

namespace bpfs::vfs {

std::string join_path(std::string_view parent, std::string_view name) {
    if (parent.empty()) return std::string(name);
    if (name.empty()) return std::string(parent);
    std::string result(parent);
    if (result.back() != '/') result += '/';
    result += name;
    return result;
}

static Error system_error(std::string_view what, const fs::path& path) {
    int err = errno;
    return Error::from_errno(
        err, std::string(what) + " " + path.string() + ": " + std::strerror(err));
}

DirectoryStore::DirectoryStore(std::filesystem::path root)
    : root_(std::move(root)) {}

fs::path DirectoryStore::resolve(std::string_view relative_path) const {
    // Strip leading slash if present
    while (!relative_path.empty() && relative_path.front() == '/') {
        relative_path.remove_prefix(1);
    }
    if (relative_path.empty()) return root_;
    return root_ / std::filesystem::path(relative_path);
}

bool DirectoryStore::exists(std::string_view relative_path) const {
    struct stat st {};
    return ::lstat(resolve(relative_path).c_str(), &st) == 0;
}

std::optional<FileInfo> DirectoryStore::get_file_info(
    std::string_view relative_path) const {
    struct stat st {};
    if (::lstat(resolve(relative_path).c_str(), &st) != 0) {
        return std::nullopt;
    }

    FileInfo info;
    info.is_folder = S_ISDIR(st.st_mode);
    info.size_bytes = static_cast<u64>(st.st_size);
    info.mode = st.st_mode;
    info.nlink = static_cast<u32>(st.st_nlink);
    info.uid = st.st_uid;
    info.gid = st.st_gid;
    info.atime = st.st_atime;
    info.mtime = st.st_mtime;
    info.ctime = st.st_ctime;
    return info;
}

Result<std::vector<std::string>> DirectoryStore::list_directory(
    std::string_view relative_path) const {
    auto dir_path = resolve(relative_path);
    std::error_code ec;

    std::vector<std::string> names;
    std::filesystem::directory_iterator it(dir_path, ec);
    if (ec) {
        return Error::from_errno(ec.value(), "list " + dir_path.string() +
                                                 ": " + ec.message());
    }
    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        names.push_back(it->path().filename().string());
    }
    if (ec) {
        return Error::from_errno(ec.value(), "list " + dir_path.string() +
                                                 ": " + ec.message());
    }
    std::sort(names.begin(), names.end());
    return names;
}

Result<void> DirectoryStore::make_directory(std::string_view relative_path,
                                            u32 mode) {
    auto full_path = resolve(relative_path);
    if (::mkdir(full_path.c_str(), static_cast<mode_t>(mode)) != 0) {
        return system_error("mkdir", full_path);
    }
    return {};
}

Result<void> DirectoryStore::create_file(std::string_view relative_path,
                                         u32 mode) {
    auto full_path = resolve(relative_path);
    int fd = ::open(full_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC,
                    static_cast<mode_t>(mode));
    if (fd < 0) {
        return system_error("create", full_path);
    }
    ::close(fd);
    return {};
}

Result<FileHandle> DirectoryStore::open_file(std::string_view relative_path,
                                             int flags, u32 mode) {
    auto full_path = resolve(relative_path);
    int fd = ::open(full_path.c_str(), flags | O_CLOEXEC,
                    static_cast<mode_t>(mode));
    if (fd < 0) {
        return system_error("open", full_path);
    }
    return static_cast<FileHandle>(fd);
}

Result<u64> DirectoryStore::read(FileHandle handle, char* buffer, u64 size,
                                 u64 offset) {
    ssize_t n = ::pread(static_cast<int>(handle), buffer,
                        static_cast<size_t>(size), static_cast<off_t>(offset));
    if (n < 0) {
        int err = errno;
        return Error::from_errno(err, std::string("pread: ") +
                                          std::strerror(err));
    }
    return static_cast<u64>(n);
}

Result<u64> DirectoryStore::write(FileHandle handle, const char* data,
                                  u64 size, u64 offset) {
    ssize_t n = ::pwrite(static_cast<int>(handle), data,
                         static_cast<size_t>(size), static_cast<off_t>(offset));
    if (n < 0) {
        int err = errno;
        return Error::from_errno(err, std::string("pwrite: ") +
                                          std::strerror(err));
    }
    return static_cast<u64>(n);
}

Result<void> DirectoryStore::close(FileHandle handle) {
    if (::close(static_cast<int>(handle)) != 0) {
        int err = errno;
        return Error::from_errno(err, std::string("close: ") +
                                          std::strerror(err));
    }
    return {};
}

Result<void> DirectoryStore::truncate(std::string_view relative_path,
                                      u64 size) {
    auto full_path = resolve(relative_path);
    if (::truncate(full_path.c_str(), static_cast<off_t>(size)) != 0) {
        return system_error("truncate", full_path);
    }
    return {};
}

Result<void> DirectoryStore::set_times(std::string_view relative_path,
                                       i64 atime_sec, i64 atime_nsec,
                                       i64 mtime_sec, i64 mtime_nsec) {
    auto full_path = resolve(relative_path);
    struct timespec times[2];
    times[0].tv_sec = static_cast<time_t>(atime_sec);
    times[0].tv_nsec = static_cast<long>(atime_nsec);
    times[1].tv_sec = static_cast<time_t>(mtime_sec);
    times[1].tv_nsec = static_cast<long>(mtime_nsec);
    if (::utimensat(AT_FDCWD, full_path.c_str(), times, AT_SYMLINK_NOFOLLOW) !=
        0) {
        return system_error("utimensat", full_path);
    }
    return {};
}

Result<void> DirectoryStore::remove_file(std::string_view relative_path) {
    auto full_path = resolve(relative_path);
    if (::unlink(full_path.c_str()) != 0) {
        return system_error("unlink", full_path);
    }
    return {};
}

Result<void> DirectoryStore::remove_directory(std::string_view relative_path) {
    auto full_path = resolve(relative_path);
    if (::rmdir(full_path.c_str()) != 0) {
        return system_error("rmdir", full_path);
    }
    return {};
}

Result<void> DirectoryStore::check_access(std::string_view relative_path,
                                          int mode) const {
    auto full_path = resolve(relative_path);
    if (::access(full_path.c_str(), mode) != 0) {
        return system_error("access", full_path);
    }
    return {};
}

Result<StoreStats> DirectoryStore::stats() const {
    struct statvfs st {};
    if (::statvfs(root_.c_str(), &st) != 0) {
        return system_error("statvfs", root_);
    }

    StoreStats out;
    out.block_size = st.f_bsize;
    out.fragment_size = st.f_frsize;
    out.blocks = st.f_blocks;
    out.blocks_free = st.f_bfree;
    out.blocks_available = st.f_bavail;
    out.files = st.f_files;
    out.files_free = st.f_ffree;
    out.name_max = st.f_namemax;
    return out;
}

} // namespace bpfs::vfs
