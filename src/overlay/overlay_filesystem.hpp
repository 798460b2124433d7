#pragma once

#include "overlay/filesystem_operations.hpp"
#include "overlay/materialized_memo.hpp"
#include "overlay/materializer.hpp"
#include "overlay/path_classifier.hpp"
#include "overlay/permission_oracle.hpp"
#include "overlay/project_registry.hpp"
#include "overlay/segment_predicate.hpp"

namespace bpfs::overlay {

/// Merges every project's potential tree over the physical store and
/// materializes potential entries on the first write below them.
///
/// Read-only calls classify the path and answer from the store, falling
/// back to the potential tree. Write-intent calls ask the permission
/// oracle, materialize any virtual ancestors and then hit the store. No
/// state is kept beyond what is on disk except the bounded memo.
class OverlayFilesystem : public FilesystemOperations {
public:
    /// oracle == nullptr allows everything; predicate == nullptr uses
    /// TreeMembershipPredicate.
    OverlayFilesystem(vfs::PhysicalStore& store, ProjectRegistry& registry,
                      const PermissionOracle* oracle = nullptr,
                      const VirtualSegmentPredicate* predicate = nullptr,
                      size_t memo_capacity = 4096);

    Result<vfs::FileInfo> getattr(std::string_view path) override;
    Result<std::vector<DirEntry>> readdir(std::string_view path) override;

    Result<vfs::FileHandle> create(std::string_view path, u32 mode, int flags,
                                   const Caller& caller) override;
    Result<void> mkdir(std::string_view path, u32 mode,
                       const Caller& caller) override;
    Result<vfs::FileHandle> open(std::string_view path, int flags,
                                 const Caller& caller) override;

    Result<u64> read(std::string_view path, char* buffer, u64 size, u64 offset,
                     std::optional<vfs::FileHandle> handle) override;
    Result<u64> write(std::string_view path, const char* data, u64 size,
                      u64 offset,
                      std::optional<vfs::FileHandle> handle) override;
    Result<void> release(std::string_view path,
                         vfs::FileHandle handle) override;

    Result<void> access(std::string_view path, int mode,
                        const Caller& caller) override;
    Result<vfs::StoreStats> statfs(std::string_view path) override;

    Result<void> truncate(std::string_view path, u64 size,
                          const Caller& caller) override;
    Result<void> unlink(std::string_view path, const Caller& caller) override;
    Result<void> rmdir(std::string_view path, const Caller& caller) override;
    Result<void> utimens(std::string_view path, i64 atime_sec, i64 atime_nsec,
                         i64 mtime_sec, i64 mtime_nsec,
                         const Caller& caller) override;

    const PathClassifier& classifier() const { return classifier_; }
    const Materializer& materializer() const { return materializer_; }
    const MaterializedMemo& memo() const { return memo_; }

private:
    vfs::PhysicalStore& store_;
    ProjectRegistry& registry_;
    const PermissionOracle* oracle_;
    TreeMembershipPredicate default_predicate_;
    PathClassifier classifier_;
    MaterializedMemo memo_;
    Materializer materializer_;
    PathLockTable create_locks_; // keyed by mount path
    vfs::FileInfo synthetic_dir_;

    /// The file at store_path exists and was created by a materialization.
    bool born_file(const std::string& store_path) const;

    Result<void> check_permission(const Caller& caller,
                                  const VirtualPathClassification& cls,
                                  Operation op) const;

    /// Shared front half of truncate/unlink/rmdir/utimens: the path must
    /// name a physical object inside a project.
    Result<VirtualPathClassification> physical_target(std::string_view path,
                                                      const char* op) const;
};

} // namespace bpfs::overlay
