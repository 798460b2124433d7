#pragma once

#include "overlay/potential_tree.hpp"

#include <string>
#include <vector>

namespace bpfs::vfs {
class TemplateSource;
}

namespace bpfs::overlay {

/// What happened to each requested template during a build.
struct BuildReport {
    std::vector<std::string> loaded;
    std::vector<std::string> missing;
    std::vector<std::string> invalid;
};

/// Builds the merged potential tree of a project from its templates.
class TreeBuilder {
public:
    explicit TreeBuilder(fs::path templates_root);

    /// Scan every template and union-merge the results. Missing and
    /// invalid identifiers are skipped with a warning, never fatal.
    PotentialTree build(const std::vector<std::string>& template_ids,
                        BuildReport* report = nullptr) const;

    /// Scan one template's directory shape recursively.
    static PotentialTree scan(const vfs::TemplateSource& source);

    const fs::path& templates_root() const { return templates_root_; }

private:
    fs::path templates_root_;
};

} // namespace bpfs::overlay
