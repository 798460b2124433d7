#pragma once

#include "vfs/template_source.hpp"

#include <filesystem>

namespace bpfs::vfs {

/// Template backed by a real directory tree. Symlinked directories are
/// never followed.
class DirectoryTemplate : public TemplateSource {
public:
    DirectoryTemplate(std::string id, std::filesystem::path root);

    const std::string& id() const override { return id_; }
    std::vector<std::string> list_directories(
        std::string_view relative_dir) const override;

private:
    std::string id_;
    std::filesystem::path root_;
};

} // namespace bpfs::vfs
