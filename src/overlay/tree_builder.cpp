#include "overlay/tree_builder.hpp"
#include "vfs/physical_store.hpp"
#include "vfs/template_source.hpp"

#include <spdlog/spdlog.h>

namespace bpfs::overlay {

// Template nesting deeper than this is treated as a loop.
static constexpr size_t MAX_TEMPLATE_DEPTH = 64;

static void scan_into(const vfs::TemplateSource& source,
                      const std::string& relative_dir, PotentialTree& node,
                      size_t depth) {
    if (depth >= MAX_TEMPLATE_DEPTH) {
        spdlog::warn("event=template_scan_failed template={} path={} "
                     "reason=too_deep",
                     source.id(), relative_dir);
        return;
    }
    for (const auto& name : source.list_directories(relative_dir)) {
        scan_into(source, vfs::join_path(relative_dir, name),
                  node.add_child(name), depth + 1);
    }
}

TreeBuilder::TreeBuilder(fs::path templates_root)
    : templates_root_(std::move(templates_root)) {}

PotentialTree TreeBuilder::scan(const vfs::TemplateSource& source) {
    PotentialTree tree;
    scan_into(source, "", tree, 0);
    return tree;
}

PotentialTree TreeBuilder::build(const std::vector<std::string>& template_ids,
                                 BuildReport* report) const {
    PotentialTree combined;

    for (const auto& id : template_ids) {
        if (!vfs::is_valid_template_id(id)) {
            spdlog::warn("event=template_invalid template='{}'", id);
            if (report) report->invalid.push_back(id);
            continue;
        }

        auto source = vfs::open_template(id, templates_root_);
        if (!source) {
            spdlog::warn("event=template_missing template={} root={}", id,
                         templates_root_.string());
            if (report) report->missing.push_back(id);
            continue;
        }

        combined.merge_from(scan(*source));
        if (report) report->loaded.push_back(id);
    }

    spdlog::debug("event=tree_built templates={} top_level={} nodes={}",
                  template_ids.size(), combined.size(), combined.node_count());
    return combined;
}

} // namespace bpfs::overlay
