#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "vfs/physical_store.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bpfs::overlay {

/// Identity of the process issuing a filesystem call.
struct Caller {
    u32 uid = 0;
    u32 gid = 0;
    std::string name; ///< Role handed to the permission oracle
};

struct DirEntry {
    std::string name;
    bool is_virtual = false;
};

/// The operation set a kernel-facing bridge drives. Every operation
/// returns a payload or one Error of the five ErrorKinds; implementations
/// must be callable from many threads at once.
class FilesystemOperations {
public:
    virtual ~FilesystemOperations() = default;

    virtual Result<vfs::FileInfo> getattr(std::string_view path) = 0;

    /// Includes "." and "..".
    virtual Result<std::vector<DirEntry>> readdir(std::string_view path) = 0;

    virtual Result<vfs::FileHandle> create(std::string_view path, u32 mode,
                                           int flags, const Caller& caller) = 0;
    virtual Result<void> mkdir(std::string_view path, u32 mode,
                               const Caller& caller) = 0;
    virtual Result<vfs::FileHandle> open(std::string_view path, int flags,
                                         const Caller& caller) = 0;

    /// Without a handle the file is opened for the duration of the call.
    virtual Result<u64> read(std::string_view path, char* buffer, u64 size,
                             u64 offset,
                             std::optional<vfs::FileHandle> handle) = 0;
    virtual Result<u64> write(std::string_view path, const char* data,
                              u64 size, u64 offset,
                              std::optional<vfs::FileHandle> handle) = 0;
    virtual Result<void> release(std::string_view path,
                                 vfs::FileHandle handle) = 0;

    virtual Result<void> access(std::string_view path, int mode,
                                const Caller& caller) = 0;
    virtual Result<vfs::StoreStats> statfs(std::string_view path) = 0;

    virtual Result<void> truncate(std::string_view path, u64 size,
                                  const Caller& caller) = 0;
    virtual Result<void> unlink(std::string_view path,
                                const Caller& caller) = 0;
    virtual Result<void> rmdir(std::string_view path,
                               const Caller& caller) = 0;
    virtual Result<void> utimens(std::string_view path, i64 atime_sec,
                                 i64 atime_nsec, i64 mtime_sec,
                                 i64 mtime_nsec, const Caller& caller) = 0;
};

} // namespace bpfs::overlay
