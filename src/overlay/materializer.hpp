#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace bpfs::vfs {
class PhysicalStore;
}

namespace bpfs::overlay {

class MaterializedMemo;

/// What the last segment of a materialized path becomes.
enum class LeafKind {
    Auto,      ///< File when the name has an extension, else directory
    Directory,
    File,
};

/// Mutexes keyed by exact store path. Entries live only while someone
/// holds or waits for them; unrelated paths never share a mutex.
class PathLockTable {
public:
    class Guard {
    public:
        Guard(PathLockTable& table, std::string path);
        ~Guard();
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

    private:
        PathLockTable& table_;
        std::string path_;
        std::mutex* mutex_ = nullptr;
    };

    Guard lock(std::string path) { return Guard(*this, std::move(path)); }

    /// Paths with a live lock entry.
    size_t active_count() const;

private:
    struct Entry {
        std::mutex mutex;
        size_t users = 0;
    };

    mutable std::mutex table_mutex_; // guards entries_ only, never held over I/O
    std::unordered_map<std::string, std::unique_ptr<Entry>> entries_;
};

/// Gives birth to virtual entries: creates the physical directory chain
/// (and the leaf file) below an existing base directory. Concurrent callers
/// on the same path see exactly one creation and all succeed.
class Materializer {
public:
    explicit Materializer(vfs::PhysicalStore& store,
                          MaterializedMemo* memo = nullptr,
                          u32 directory_mode = 0755, u32 file_mode = 0644);

    /// Materialize base/relative_path. base must already exist. Returns the
    /// on-disk path of the leaf. An already fully physical path is a no-op.
    /// On failure, directories created before the failing segment remain.
    Result<fs::path> materialize(std::string_view base,
                                 std::string_view relative_path,
                                 LeafKind kind = LeafKind::Auto);

    /// Name looks like a file: it has a non-empty extension and stem.
    static bool looks_like_file(std::string_view name);

    /// Number of objects this materializer created on disk.
    u64 created_count() const { return created_.load(); }

private:
    vfs::PhysicalStore& store_;
    MaterializedMemo* memo_;
    u32 directory_mode_;
    u32 file_mode_;
    PathLockTable locks_;
    std::atomic<u64> created_{0};

    // true when this call created the object
    Result<bool> ensure_directory(const std::string& store_path);
    Result<bool> ensure_file(const std::string& store_path);
};

} // namespace bpfs::overlay
