#include "vfs/directory_template.hpp"
#include "vfs/zip_template.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>

namespace bpfs::vfs {

bool is_valid_template_id(std::string_view id) {
    if (id.empty() || id.front() == '.') return false;
    if (id.find('/') != std::string_view::npos) return false;
    if (id.find('\\') != std::string_view::npos) return false;
    if (id.find("..") != std::string_view::npos) return false;
    return id.find('\0') == std::string_view::npos;
}

std::unique_ptr<TemplateSource> open_template(std::string_view id,
                                              const fs::path& templates_root) {
    std::error_code ec;
    auto dir_path = templates_root / std::string(id);
    if (fs::is_directory(dir_path, ec)) {
        return std::make_unique<DirectoryTemplate>(std::string(id), dir_path);
    }

    auto archive_path = templates_root / (std::string(id) + ".zip");
    if (fs::is_regular_file(archive_path, ec)) {
        auto archive = std::make_unique<ZipTemplate>(std::string(id),
                                                     archive_path);
        if (archive->is_open()) return archive;
    }

    return nullptr;
}

DirectoryTemplate::DirectoryTemplate(std::string id,
                                     std::filesystem::path root)
    : id_(std::move(id)), root_(std::move(root)) {}

std::vector<std::string> DirectoryTemplate::list_directories(
    std::string_view relative_dir) const {
    std::vector<std::string> names;
    auto dir_path =
        relative_dir.empty() ? root_ : root_ / std::filesystem::path(relative_dir);

    std::error_code ec;
    std::filesystem::directory_iterator it(dir_path, ec);
    if (ec) {
        spdlog::warn("event=template_scan_failed template={} path={} error={}",
                     id_, dir_path.string(), ec.message());
        return names;
    }

    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec) {
            spdlog::warn("event=template_scan_failed template={} path={} "
                         "error={}",
                         id_, dir_path.string(), ec.message());
            break;
        }
        const auto& entry = *it;
        std::string name = entry.path().filename().string();
        if (name.empty() || name[0] == '.') continue;

        std::error_code type_ec;
        if (entry.is_symlink(type_ec)) {
            spdlog::warn("event=template_symlink_skipped template={} path={}",
                         id_, entry.path().string());
            continue;
        }
        if (entry.is_directory(type_ec)) {
            names.push_back(std::move(name));
        }
    }

    std::sort(names.begin(), names.end());
    return names;
}

} // namespace bpfs::vfs
