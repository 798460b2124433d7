#include "overlay/materializer.hpp"
#include "overlay/materialized_memo.hpp"
#include "vfs/physical_store.hpp"

#include <cerrno>
#include <spdlog/spdlog.h>

namespace bpfs::overlay {

// --- PathLockTable ---

PathLockTable::Guard::Guard(PathLockTable& table, std::string path)
    : table_(table), path_(std::move(path)) {
    {
        std::lock_guard lock(table_.table_mutex_);
        auto& entry = table_.entries_[path_];
        if (!entry) entry = std::make_unique<Entry>();
        entry->users++;
        mutex_ = &entry->mutex;
    }
    mutex_->lock();
}

PathLockTable::Guard::~Guard() {
    mutex_->unlock();
    std::lock_guard lock(table_.table_mutex_);
    auto it = table_.entries_.find(path_);
    if (it != table_.entries_.end() && --it->second->users == 0) {
        table_.entries_.erase(it);
    }
}

size_t PathLockTable::active_count() const {
    std::lock_guard lock(table_mutex_);
    return entries_.size();
}

// --- Materializer ---

Materializer::Materializer(vfs::PhysicalStore& store, MaterializedMemo* memo,
                           u32 directory_mode, u32 file_mode)
    : store_(store), memo_(memo), directory_mode_(directory_mode),
      file_mode_(file_mode) {}

bool Materializer::looks_like_file(std::string_view name) {
    auto dot = name.rfind('.');
    return dot != std::string_view::npos && dot > 0 && dot + 1 < name.size();
}

Result<bool> Materializer::ensure_directory(const std::string& store_path) {
    // The memo lets an already-born directory skip the lock, but the hit
    // is only trusted once the store confirms it.
    if (memo_ && memo_->contains(store_path)) {
        auto info = store_.get_file_info(store_path);
        if (info && info->is_folder) return false;
        memo_->invalidate(store_path);
    }

    auto guard = locks_.lock(store_path);

    auto info = store_.get_file_info(store_path);
    if (info) {
        if (!info->is_folder) {
            return Error(ErrorKind::IOFailure,
                         "not a directory: " + store_path, ENOTDIR);
        }
        if (memo_) memo_->record(store_path);
        return false;
    }

    auto made = store_.make_directory(store_path, directory_mode_);
    if (!made) {
        // Someone outside this process may have won the race.
        if (made.error().kind == ErrorKind::AlreadyExists) {
            auto existing = store_.get_file_info(store_path);
            if (existing && existing->is_folder) {
                if (memo_) memo_->record(store_path);
                return false;
            }
        }
        return made.error();
    }

    created_++;
    if (memo_) memo_->record(store_path);
    return true;
}

Result<bool> Materializer::ensure_file(const std::string& store_path) {
    auto guard = locks_.lock(store_path);

    auto info = store_.get_file_info(store_path);
    if (info) {
        if (info->is_folder) {
            return Error(ErrorKind::IOFailure,
                         "is a directory: " + store_path, EISDIR);
        }
        return false;
    }

    auto made = store_.create_file(store_path, file_mode_);
    if (!made) {
        if (made.error().kind == ErrorKind::AlreadyExists) {
            auto existing = store_.get_file_info(store_path);
            if (existing && !existing->is_folder) {
                if (memo_) memo_->record(store_path);
                return false;
            }
        }
        return made.error();
    }

    created_++;
    if (memo_) memo_->record(store_path);
    return true;
}

Result<fs::path> Materializer::materialize(std::string_view base,
                                           std::string_view relative_path,
                                           LeafKind kind) {
    std::string current(base);
    size_t created_here = 0;
    size_t start = 0;

    while (start <= relative_path.size()) {
        auto slash = relative_path.find('/', start);
        bool leaf = slash == std::string_view::npos;
        auto name = relative_path.substr(
            start, leaf ? std::string_view::npos : slash - start);
        if (name.empty()) {
            if (leaf) break;
            start = slash + 1;
            continue;
        }
        current = vfs::join_path(current, name);

        bool as_file = leaf && (kind == LeafKind::File ||
                                (kind == LeafKind::Auto && looks_like_file(name)));
        auto result = as_file ? ensure_file(current) : ensure_directory(current);
        if (!result) {
            spdlog::warn("event=materialize_failed path={} failed_at={} "
                         "kind={} errno={} error=\"{}\"",
                         vfs::join_path(base, relative_path), current,
                         error_kind_name(result.error().kind),
                         result.error().sys_errno, result.error().message);
            return result.error();
        }
        if (result.value()) created_here++;

        if (leaf) break;
        start = slash + 1;
    }

    if (created_here > 0) {
        spdlog::info("event=materialized path={} created={}", current,
                     created_here);
    }
    return store_.resolve(current);
}

} // namespace bpfs::overlay
