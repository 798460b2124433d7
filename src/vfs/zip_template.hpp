#pragma once

#include "vfs/template_source.hpp"

#include <filesystem>
#include <map>
#include <set>

namespace bpfs::vfs {

/// Template backed by a ZIP archive. The central directory is read once on
/// construction; only directory names are kept.
class ZipTemplate : public TemplateSource {
public:
    /// Opens the ZIP file and indexes its directories.
    ZipTemplate(std::string id, const std::filesystem::path& archive_path);

    // Non-copyable
    ZipTemplate(const ZipTemplate&) = delete;
    ZipTemplate& operator=(const ZipTemplate&) = delete;

    const std::string& id() const override { return id_; }
    std::vector<std::string> list_directories(
        std::string_view relative_dir) const override;

    /// False when the archive could not be opened.
    bool is_open() const { return open_; }

private:
    std::string id_;
    std::filesystem::path archive_path_;
    bool open_ = false;

    /// Child directory names keyed by parent directory ("" = archive root).
    std::map<std::string, std::set<std::string>, std::less<>> children_;

    /// Record every directory implied by an archive entry name.
    void index_entry(std::string_view name);
};

} // namespace bpfs::vfs
