#pragma once

#include "vfs/physical_store.hpp"

#include <filesystem>

namespace bpfs::vfs {

/// Physical store backed by a real filesystem directory.
class DirectoryStore : public PhysicalStore {
public:
    explicit DirectoryStore(std::filesystem::path root);

    const fs::path& root() const override { return root_; }
    fs::path resolve(std::string_view relative_path) const override;

    bool exists(std::string_view relative_path) const override;
    std::optional<FileInfo> get_file_info(
        std::string_view relative_path) const override;
    Result<std::vector<std::string>> list_directory(
        std::string_view relative_path) const override;

    Result<void> make_directory(std::string_view relative_path,
                                u32 mode) override;
    Result<void> create_file(std::string_view relative_path,
                             u32 mode) override;
    Result<FileHandle> open_file(std::string_view relative_path, int flags,
                                 u32 mode) override;

    Result<u64> read(FileHandle handle, char* buffer, u64 size,
                     u64 offset) override;
    Result<u64> write(FileHandle handle, const char* data, u64 size,
                      u64 offset) override;
    Result<void> close(FileHandle handle) override;

    Result<void> truncate(std::string_view relative_path, u64 size) override;
    Result<void> set_times(std::string_view relative_path, i64 atime_sec,
                           i64 atime_nsec, i64 mtime_sec,
                           i64 mtime_nsec) override;
    Result<void> remove_file(std::string_view relative_path) override;
    Result<void> remove_directory(std::string_view relative_path) override;
    Result<void> check_access(std::string_view relative_path,
                              int mode) const override;

    Result<StoreStats> stats() const override;

private:
    std::filesystem::path root_;
};

} // namespace bpfs::vfs
