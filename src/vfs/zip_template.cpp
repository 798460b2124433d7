#include "vfs/zip_template.hpp"

#include <algorithm>
#include <minizip/unzip.h>
#include <spdlog/spdlog.h>
#include <vector>

namespace bpfs::vfs {

ZipTemplate::ZipTemplate(std::string id,
                         const std::filesystem::path& archive_path)
    : id_(std::move(id)), archive_path_(archive_path) {
    unzFile zip = unzOpen(archive_path.string().c_str());
    if (!zip) {
        spdlog::error("event=template_scan_failed template={} archive={}",
                      id_, archive_path.string());
        return;
    }

    // Read central directory
    int ret = unzGoToFirstFile(zip);
    std::vector<char> filename;
    while (ret == UNZ_OK) {
        unz_file_info file_info;
        // Size the name buffer from the entry; minizip leaves a name that
        // fills the buffer unterminated.
        if (unzGetCurrentFileInfo(zip, &file_info, nullptr, 0, nullptr, 0,
                                  nullptr, 0) == UNZ_OK) {
            filename.resize(static_cast<size_t>(file_info.size_filename) + 1);
            if (unzGetCurrentFileInfo(zip, nullptr, filename.data(),
                                      static_cast<uLong>(filename.size()),
                                      nullptr, 0, nullptr, 0) == UNZ_OK) {
                index_entry(std::string_view(filename.data(),
                                             file_info.size_filename));
            }
        }
        ret = unzGoToNextFile(zip);
    }

    unzClose(zip);
    open_ = true;

    spdlog::debug("ZIP template {}: {} directories indexed",
                  archive_path.filename().string(), children_.size());
}

void ZipTemplate::index_entry(std::string_view name) {
    std::string entry(name);
    // Forward slashes
    std::replace(entry.begin(), entry.end(), '\\', '/');

    // The last component of a file entry is not a directory
    bool is_dir_entry = !entry.empty() && entry.back() == '/';
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= entry.size()) {
        size_t slash = entry.find('/', start);
        if (slash == std::string::npos) slash = entry.size();
        parts.push_back(entry.substr(start, slash - start));
        start = slash + 1;
    }
    if (!is_dir_entry && !parts.empty()) parts.pop_back();
    while (!parts.empty() && parts.back().empty()) parts.pop_back();

    std::string parent;
    for (const auto& part : parts) {
        if (part.empty() || part == ".." || part.find(':') != std::string::npos) {
            spdlog::warn("event=template_invalid template={} entry={}", id_,
                         std::string(name));
            return;
        }
        if (part[0] == '.') return;

        children_[parent].insert(part);
        parent = parent.empty() ? part : parent + "/" + part;
    }
}

std::vector<std::string> ZipTemplate::list_directories(
    std::string_view relative_dir) const {
    auto it = children_.find(relative_dir);
    if (it == children_.end()) return {};
    return {it->second.begin(), it->second.end()};
}

} // namespace bpfs::vfs
