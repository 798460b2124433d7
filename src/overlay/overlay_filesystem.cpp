#include "overlay/overlay_filesystem.hpp"

#include <algorithm>
#include <cerrno>
#include <ctime>
#include <fcntl.h>
#include <set>
#include <spdlog/spdlog.h>
#include <sys/stat.h>
#include <unistd.h>

namespace bpfs::overlay {

static bool has_write_intent(int flags) {
    return (flags & O_ACCMODE) != O_RDONLY || (flags & O_TRUNC) != 0;
}

static Error read_only(std::string_view path) {
    return Error(ErrorKind::PermissionDenied,
                 "read-only entry: " + std::string(path));
}

static Error not_found(std::string_view path) {
    return Error(ErrorKind::NotFound, "no such entry: " + std::string(path));
}

static Error is_directory(std::string_view path) {
    return Error(ErrorKind::IOFailure, "is a directory: " + std::string(path),
                 EISDIR);
}

OverlayFilesystem::OverlayFilesystem(vfs::PhysicalStore& store,
                                     ProjectRegistry& registry,
                                     const PermissionOracle* oracle,
                                     const VirtualSegmentPredicate* predicate,
                                     size_t memo_capacity)
    : store_(store), registry_(registry), oracle_(oracle),
      classifier_(store, registry, predicate ? *predicate : default_predicate_),
      memo_(memo_capacity), materializer_(store, &memo_) {
    auto now = static_cast<i64>(std::time(nullptr));
    synthetic_dir_.is_folder = true;
    synthetic_dir_.mode = S_IFDIR | 0555;
    synthetic_dir_.nlink = 2;
    synthetic_dir_.size_bytes = 4096;
    synthetic_dir_.uid = static_cast<u32>(getuid());
    synthetic_dir_.gid = static_cast<u32>(getgid());
    synthetic_dir_.atime = now;
    synthetic_dir_.mtime = now;
    synthetic_dir_.ctime = now;
}

Result<void> OverlayFilesystem::check_permission(
    const Caller& caller, const VirtualPathClassification& cls,
    Operation op) const {
    if (!oracle_) return {};
    auto path = cls.oracle_path();
    auto roles = oracle_->roles_for(caller.name);
    for (const auto& role : roles) {
        if (oracle_->allows(role, path, op)) return {};
    }

    spdlog::info("event=permission_denied user={} roles={} project={} path={} "
                 "op={}",
                 caller.name, roles.size(), cls.project, path,
                 operation_name(op));
    return Error(ErrorKind::PermissionDenied,
                 std::string(operation_name(op)) + " denied on " + path);
}

Result<vfs::FileInfo> OverlayFilesystem::getattr(std::string_view path) {
    auto classified = classifier_.classify(path);
    if (!classified) return classified.error();
    const auto& cls = classified.value();

    switch (cls.zone) {
    case Zone::Root:
    case Zone::ProjectList:
        return synthetic_dir_;
    case Zone::Viewport:
        if (!cls.project_present || !cls.node) return not_found(path);
        return synthetic_dir_;
    case Zone::ProjectRelative:
        break;
    }

    switch (cls.leaf_state()) {
    case SegmentState::Virtual:
        return synthetic_dir_;
    case SegmentState::Physical: {
        auto info = store_.get_file_info(cls.store_path);
        if (!info) return not_found(path);
        return *info;
    }
    case SegmentState::Absent:
        break;
    }
    return not_found(path);
}

Result<std::vector<DirEntry>> OverlayFilesystem::readdir(std::string_view path) {
    auto classified = classifier_.classify(path);
    if (!classified) return classified.error();
    const auto& cls = classified.value();

    std::vector<DirEntry> entries = {{".", false}, {"..", false}};

    switch (cls.zone) {
    case Zone::Root:
        entries.push_back({registry_.collection(), false});
        return entries;
    case Zone::ProjectList: {
        auto projects = registry_.list_projects();
        if (!projects) return projects.error();
        for (auto& name : projects.value()) {
            entries.push_back({std::move(name), false});
        }
        return entries;
    }
    case Zone::Viewport:
        // Only the potential tree, never the live directory.
        if (!cls.project_present || !cls.node) return not_found(path);
        for (const auto& name : cls.node->names()) {
            entries.push_back({name, true});
        }
        return entries;
    case Zone::ProjectRelative:
        break;
    }

    auto state = cls.leaf_state();
    if (state == SegmentState::Absent) return not_found(path);

    std::set<std::string> physical;
    if (state == SegmentState::Physical) {
        auto info = store_.get_file_info(cls.store_path);
        if (!info) return not_found(path);
        if (!info->is_folder) {
            return Error(ErrorKind::IOFailure,
                         "not a directory: " + std::string(path), ENOTDIR);
        }
        auto listed = store_.list_directory(cls.store_path);
        if (!listed) return listed.error();
        for (auto& name : listed.value()) {
            if (!name.empty() && name[0] != '.') physical.insert(std::move(name));
        }
    }

    std::vector<DirEntry> merged;
    for (const auto& name : physical) merged.push_back({name, false});
    if (cls.node) {
        for (const auto& name : cls.node->names()) {
            if (!physical.count(name)) merged.push_back({name, true});
        }
    }
    std::sort(merged.begin(), merged.end(),
              [](const DirEntry& a, const DirEntry& b) { return a.name < b.name; });

    entries.insert(entries.end(), std::make_move_iterator(merged.begin()),
                   std::make_move_iterator(merged.end()));
    return entries;
}

bool OverlayFilesystem::born_file(const std::string& store_path) const {
    if (!memo_.contains(store_path)) return false;
    auto info = store_.get_file_info(store_path);
    return info && !info->is_folder;
}

Result<vfs::FileHandle> OverlayFilesystem::create(std::string_view path,
                                                  u32 mode, int flags,
                                                  const Caller& caller) {
    // Creators of one path classify and open one at a time, so a late
    // racer sees the birth recorded by the one that won.
    auto guard = create_locks_.lock(std::string(path));

    auto classified = classifier_.classify(path);
    if (!classified) return classified.error();
    const auto& cls = classified.value();

    if (cls.zone != Zone::ProjectRelative) return read_only(path);
    if (cls.is_project_root()) {
        if (cls.project_present) return is_directory(path);
        return read_only(path);
    }
    if (!cls.ancestors_present()) return not_found(path);
    if (cls.leaf_is_virtual()) return is_directory(path);

    if (cls.has_virtual_segment()) {
        auto allowed = check_permission(caller, cls, Operation::Materialize);
        if (!allowed) return allowed.error();

        auto born = materializer_.materialize(cls.project_store_path,
                                              cls.relative_path, LeafKind::File);
        if (!born) return born.error();

        // The file exists now, whoever created it.
        return store_.open_file(cls.store_path, flags & ~(O_CREAT | O_EXCL),
                                mode);
    }

    auto allowed = check_permission(caller, cls, Operation::Write);
    if (!allowed) return allowed.error();

    int open_flags = flags | O_CREAT;
    // An exclusive create that lost the race to a birth of this file.
    if ((flags & O_EXCL) != 0 && born_file(cls.store_path)) {
        open_flags &= ~O_EXCL;
    }
    return store_.open_file(cls.store_path, open_flags, mode);
}

Result<void> OverlayFilesystem::mkdir(std::string_view path, u32 mode,
                                      const Caller& caller) {
    auto classified = classifier_.classify(path);
    if (!classified) return classified.error();
    const auto& cls = classified.value();

    if (cls.zone != Zone::ProjectRelative) return read_only(path);

    if (cls.is_project_root()) {
        if (cls.project_present) {
            return Error(ErrorKind::AlreadyExists,
                         "project already exists: " + cls.project);
        }
        auto allowed = check_permission(caller, cls, Operation::Write);
        if (!allowed) return allowed;
        auto made = store_.make_directory(cls.project_store_path, mode);
        if (!made) return made;
        registry_.forget(cls.project);
        spdlog::info("event=project_created project={}", cls.project);
        return {};
    }

    if (!cls.ancestors_present()) return not_found(path);

    switch (cls.leaf_state()) {
    case SegmentState::Virtual: {
        auto allowed = check_permission(caller, cls, Operation::Materialize);
        if (!allowed) return allowed;
        auto born = materializer_.materialize(
            cls.project_store_path, cls.relative_path, LeafKind::Directory);
        if (!born) return born.error();
        return {};
    }
    case SegmentState::Physical: {
        // A template folder that is already born is what every racing
        // mkdir asked for.
        if (cls.node) {
            auto info = store_.get_file_info(cls.store_path);
            if (info && info->is_folder) return {};
        }
        return Error(ErrorKind::AlreadyExists,
                     "already exists: " + std::string(path));
    }
    case SegmentState::Absent:
        break;
    }

    if (cls.has_virtual_segment()) {
        auto allowed = check_permission(caller, cls, Operation::Materialize);
        if (!allowed) return allowed;
        auto born = materializer_.materialize(cls.project_store_path,
                                              cls.parent_relative_path(),
                                              LeafKind::Directory);
        if (!born) return born.error();
    } else {
        auto allowed = check_permission(caller, cls, Operation::Write);
        if (!allowed) return allowed;
    }

    return store_.make_directory(cls.store_path, mode);
}

Result<vfs::FileHandle> OverlayFilesystem::open(std::string_view path,
                                                int flags,
                                                const Caller& caller) {
    auto classified = classifier_.classify(path);
    if (!classified) return classified.error();
    const auto& cls = classified.value();

    bool writing = has_write_intent(flags);
    if (cls.zone != Zone::ProjectRelative) {
        if (writing) return read_only(path);
        return is_directory(path);
    }

    switch (cls.leaf_state()) {
    case SegmentState::Absent:
        return not_found(path);
    case SegmentState::Virtual:
        // Opening never gives birth; create or mkdir does.
        if (writing) return read_only(path);
        return is_directory(path);
    case SegmentState::Physical:
        break;
    }

    auto allowed = check_permission(caller, cls,
                                    writing ? Operation::Write : Operation::Read);
    if (!allowed) return allowed.error();
    return store_.open_file(cls.store_path, flags & ~(O_CREAT | O_EXCL), 0);
}

Result<u64> OverlayFilesystem::read(std::string_view path, char* buffer,
                                    u64 size, u64 offset,
                                    std::optional<vfs::FileHandle> handle) {
    if (handle) return store_.read(*handle, buffer, size, offset);

    auto classified = classifier_.classify(path);
    if (!classified) return classified.error();
    const auto& cls = classified.value();

    if (cls.zone != Zone::ProjectRelative) return is_directory(path);
    switch (cls.leaf_state()) {
    case SegmentState::Absent: return not_found(path);
    case SegmentState::Virtual: return is_directory(path);
    case SegmentState::Physical: break;
    }

    auto opened = store_.open_file(cls.store_path, O_RDONLY, 0);
    if (!opened) return opened.error();
    auto result = store_.read(opened.value(), buffer, size, offset);
    auto closed = store_.close(opened.value());
    if (result && !closed) return closed.error();
    return result;
}

Result<u64> OverlayFilesystem::write(std::string_view path, const char* data,
                                     u64 size, u64 offset,
                                     std::optional<vfs::FileHandle> handle) {
    if (handle) return store_.write(*handle, data, size, offset);

    auto classified = classifier_.classify(path);
    if (!classified) return classified.error();
    const auto& cls = classified.value();

    if (cls.zone != Zone::ProjectRelative) return read_only(path);
    // Writing never materializes: the file must have been created first.
    if (cls.leaf_state() != SegmentState::Physical) return not_found(path);

    auto opened = store_.open_file(cls.store_path, O_WRONLY, 0);
    if (!opened) return opened.error();
    auto result = store_.write(opened.value(), data, size, offset);
    auto closed = store_.close(opened.value());
    if (result && !closed) return closed.error();
    return result;
}

Result<void> OverlayFilesystem::release(std::string_view /*path*/,
                                        vfs::FileHandle handle) {
    return store_.close(handle);
}

Result<void> OverlayFilesystem::access(std::string_view path, int mode,
                                       const Caller& caller) {
    auto classified = classifier_.classify(path);
    if (!classified) return classified.error();
    const auto& cls = classified.value();

    bool wants_write = (mode & W_OK) != 0;
    switch (cls.zone) {
    case Zone::Root:
        if (wants_write) return read_only(path);
        return {};
    case Zone::ProjectList:
        return {}; // writable: mkdir creates projects
    case Zone::Viewport:
        if (!cls.project_present || !cls.node) return not_found(path);
        if (wants_write) return read_only(path);
        return {};
    case Zone::ProjectRelative:
        break;
    }

    switch (cls.leaf_state()) {
    case SegmentState::Absent:
        return not_found(path);
    case SegmentState::Virtual:
        // Write access to a virtual entry is permission to give birth.
        if (wants_write) return check_permission(caller, cls, Operation::Materialize);
        if (mode & R_OK) return check_permission(caller, cls, Operation::Read);
        return {};
    case SegmentState::Physical:
        break;
    }

    auto checked = store_.check_access(cls.store_path, mode);
    if (!checked) return checked;
    if (wants_write) return check_permission(caller, cls, Operation::Write);
    if (mode & R_OK) return check_permission(caller, cls, Operation::Read);
    return {};
}

Result<vfs::StoreStats> OverlayFilesystem::statfs(std::string_view /*path*/) {
    return store_.stats();
}

Result<VirtualPathClassification> OverlayFilesystem::physical_target(
    std::string_view path, const char* op) const {
    auto classified = classifier_.classify(path);
    if (!classified) return classified.error();
    auto& cls = classified.value();

    if (cls.zone != Zone::ProjectRelative) return read_only(path);
    switch (cls.leaf_state()) {
    case SegmentState::Absent:
        return not_found(path);
    case SegmentState::Virtual:
        // Potential entries belong to their template until born.
        spdlog::debug("event=path_rejected path=\"{}\" op={} reason=virtual",
                      path, op);
        return read_only(path);
    case SegmentState::Physical:
        break;
    }
    return classified;
}

Result<void> OverlayFilesystem::truncate(std::string_view path, u64 size,
                                         const Caller& caller) {
    auto target = physical_target(path, "truncate");
    if (!target) return target.error();
    auto allowed = check_permission(caller, target.value(), Operation::Write);
    if (!allowed) return allowed;
    return store_.truncate(target.value().store_path, size);
}

Result<void> OverlayFilesystem::unlink(std::string_view path,
                                       const Caller& caller) {
    auto target = physical_target(path, "unlink");
    if (!target) return target.error();
    const auto& cls = target.value();
    auto allowed = check_permission(caller, cls, Operation::Write);
    if (!allowed) return allowed;

    auto removed = store_.remove_file(cls.store_path);
    if (!removed) return removed;
    memo_.invalidate(cls.store_path);
    return {};
}

Result<void> OverlayFilesystem::rmdir(std::string_view path,
                                      const Caller& caller) {
    auto target = physical_target(path, "rmdir");
    if (!target) return target.error();
    const auto& cls = target.value();
    auto allowed = check_permission(caller, cls, Operation::Write);
    if (!allowed) return allowed;

    auto removed = store_.remove_directory(cls.store_path);
    if (!removed) return removed;

    // A removed template directory is virtual again from the next call on.
    memo_.invalidate_prefix(cls.store_path);
    if (cls.is_project_root()) registry_.forget(cls.project);
    return {};
}

Result<void> OverlayFilesystem::utimens(std::string_view path, i64 atime_sec,
                                        i64 atime_nsec, i64 mtime_sec,
                                        i64 mtime_nsec, const Caller& caller) {
    auto target = physical_target(path, "utimens");
    if (!target) return target.error();
    auto allowed = check_permission(caller, target.value(), Operation::Write);
    if (!allowed) return allowed;
    return store_.set_times(target.value().store_path, atime_sec, atime_nsec,
                            mtime_sec, mtime_nsec);
}

} // namespace bpfs::overlay
