#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bpfs::vfs {

/// Attributes of a physical object, as reported by lstat.
struct FileInfo {
    u64 size_bytes = 0;
    bool is_folder = false;
    u32 mode = 0; ///< Full st_mode, type bits included
    u32 nlink = 1;
    u32 uid = 0;
    u32 gid = 0;
    i64 atime = 0;
    i64 mtime = 0;
    i64 ctime = 0;
};

/// Aggregate figures for the filesystem holding the store root.
struct StoreStats {
    u64 block_size = 0;
    u64 fragment_size = 0;
    u64 blocks = 0;
    u64 blocks_free = 0;
    u64 blocks_available = 0;
    u64 files = 0;
    u64 files_free = 0;
    u64 name_max = 0;
};

/// Open file descriptor handed out by open_file().
using FileHandle = u64;

/// Abstract file I/O under one root directory. All paths are relative to
/// the root, '/'-separated, and must already have been validated by the
/// caller; the store performs no traversal checks of its own.
class PhysicalStore {
public:
    virtual ~PhysicalStore() = default;

    /// Absolute root directory of the store.
    virtual const fs::path& root() const = 0;

    /// Concrete on-disk path for a relative path.
    virtual fs::path resolve(std::string_view relative_path) const = 0;

    /// Check if anything exists at the path (symlinks are not followed).
    virtual bool exists(std::string_view relative_path) const = 0;

    /// Get file info or nullopt if not found.
    virtual std::optional<FileInfo> get_file_info(
        std::string_view relative_path) const = 0;

    /// Names of the entries of a directory, lexically sorted.
    virtual Result<std::vector<std::string>> list_directory(
        std::string_view relative_path) const = 0;

    /// Create one directory. AlreadyExists when anything is in the way.
    virtual Result<void> make_directory(std::string_view relative_path,
                                        u32 mode) = 0;

    /// Create an empty file exclusively. AlreadyExists when present.
    virtual Result<void> create_file(std::string_view relative_path,
                                     u32 mode) = 0;

    /// open(2) with the given flags. mode is used when O_CREAT is set.
    virtual Result<FileHandle> open_file(std::string_view relative_path,
                                         int flags, u32 mode) = 0;

    virtual Result<u64> read(FileHandle handle, char* buffer, u64 size,
                             u64 offset) = 0;
    virtual Result<u64> write(FileHandle handle, const char* data, u64 size,
                              u64 offset) = 0;
    virtual Result<void> close(FileHandle handle) = 0;

    virtual Result<void> truncate(std::string_view relative_path,
                                  u64 size) = 0;

    /// Set access and modification times (seconds, nanoseconds pairs).
    virtual Result<void> set_times(std::string_view relative_path,
                                   i64 atime_sec, i64 atime_nsec,
                                   i64 mtime_sec, i64 mtime_nsec) = 0;

    /// Remove a file.
    virtual Result<void> remove_file(std::string_view relative_path) = 0;

    /// Remove an empty directory.
    virtual Result<void> remove_directory(std::string_view relative_path) = 0;

    /// access(2) against the on-disk object.
    virtual Result<void> check_access(std::string_view relative_path,
                                      int mode) const = 0;

    virtual Result<StoreStats> stats() const = 0;
};

/// Join two relative paths with a single '/'. Either side may be empty.
std::string join_path(std::string_view parent, std::string_view name);

} // namespace bpfs::vfs
