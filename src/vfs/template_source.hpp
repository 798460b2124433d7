#pragma once

#include "core/types.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace bpfs::vfs {

/// Abstract base class for a template's directory shape (a directory or
/// an archive). Only directories matter; files are never reported.
class TemplateSource {
public:
    virtual ~TemplateSource() = default;

    /// Identifier the template was opened under.
    virtual const std::string& id() const = 0;

    /// Names of the non-hidden subdirectories directly under relative_dir
    /// ("" for the template root), lexically sorted.
    virtual std::vector<std::string> list_directories(
        std::string_view relative_dir) const = 0;
};

/// True when a template identifier is usable as a single path component.
bool is_valid_template_id(std::string_view id);

/// Locate a template under templates_root: the directory <id> first, then
/// the archive <id>.zip. Returns nullptr when neither exists.
std::unique_ptr<TemplateSource> open_template(std::string_view id,
                                              const fs::path& templates_root);

} // namespace bpfs::vfs
