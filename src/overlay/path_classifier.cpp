#include "overlay/path_classifier.hpp"
#include "overlay/segment_predicate.hpp"
#include "vfs/physical_store.hpp"

#include <spdlog/spdlog.h>

namespace bpfs::overlay {

const char* zone_name(Zone zone) {
    switch (zone) {
    case Zone::Root: return "root";
    case Zone::ProjectList: return "project_list";
    case Zone::Viewport: return "viewport";
    case Zone::ProjectRelative: return "project_relative";
    }
    return "root";
}

SegmentState VirtualPathClassification::leaf_state() const {
    if (segments.empty()) {
        return project_present ? SegmentState::Physical : SegmentState::Absent;
    }
    return segments.back().state;
}

bool VirtualPathClassification::has_virtual_segment() const {
    return first_virtual().has_value();
}

bool VirtualPathClassification::has_virtual_ancestor() const {
    auto first = first_virtual();
    return first && *first + 1 < segments.size();
}

bool VirtualPathClassification::ancestors_present() const {
    if (!project_present) return false;
    for (size_t i = 0; i + 1 < segments.size(); i++) {
        if (segments[i].state == SegmentState::Absent) return false;
    }
    return true;
}

std::optional<size_t> VirtualPathClassification::first_virtual() const {
    for (size_t i = 0; i < segments.size(); i++) {
        if (segments[i].state == SegmentState::Virtual) return i;
    }
    return std::nullopt;
}

std::string VirtualPathClassification::parent_relative_path() const {
    auto slash = relative_path.rfind('/');
    if (slash == std::string::npos) return {};
    return relative_path.substr(0, slash);
}

PathClassifier::PathClassifier(const vfs::PhysicalStore& store,
                               ProjectRegistry& registry,
                               const VirtualSegmentPredicate& predicate)
    : store_(store), registry_(registry), predicate_(predicate) {}

static Error reject(std::string_view path, const char* reason) {
    spdlog::debug("event=path_rejected path=\"{}\" reason={}", path, reason);
    return Error(ErrorKind::InvalidPath,
                 "invalid path '" + std::string(path) + "': " + reason);
}

Result<std::vector<std::string>> PathClassifier::split(std::string_view path) {
    if (path.find('\0') != std::string_view::npos) return reject(path, "nul");
    if (path.find('\\') != std::string_view::npos) {
        return reject(path, "backslash");
    }

    std::string_view rest = path;
    if (!rest.empty() && rest[0] == '/') rest.remove_prefix(1);

    std::vector<std::string> segments;
    if (rest.empty()) return segments;

    size_t start = 0;
    while (true) {
        auto slash = rest.find('/', start);
        auto segment = rest.substr(start, slash == std::string_view::npos
                                              ? std::string_view::npos
                                              : slash - start);
        if (segment.empty()) return reject(path, "empty_segment");
        if (segment == "..") return reject(path, "traversal");
        // "C:" style segments look absolute on other platforms
        if (segment.size() == 2 && segment[1] == ':') {
            return reject(path, "absolute");
        }
        segments.emplace_back(segment);
        if (slash == std::string_view::npos) break;
        start = slash + 1;
    }

    // Hidden names are allowed only for the viewport, directly inside a
    // project: /<collection>/<project>/.blueprint
    for (size_t i = 0; i < segments.size(); i++) {
        if (segments[i][0] != '.') continue;
        if (i == 2 && segments[i] == VIEWPORT_NAME) continue;
        return reject(path, "hidden");
    }
    return segments;
}

Result<VirtualPathClassification> PathClassifier::classify(
    std::string_view path) const {
    auto split_result = split(path);
    if (!split_result) return split_result.error();
    auto& parts = split_result.value();

    VirtualPathClassification result;
    if (parts.empty()) {
        result.zone = Zone::Root;
        return result;
    }

    if (parts[0] != registry_.collection()) {
        return Error(ErrorKind::NotFound,
                     "no such top-level entry: " + parts[0]);
    }
    if (parts.size() == 1) {
        result.zone = Zone::ProjectList;
        result.store_path = registry_.collection();
        return result;
    }

    result.project = parts[1];
    result.project_store_path = registry_.project_store_path(result.project);
    result.session = registry_.session(result.project);
    result.project_present = result.session != nullptr;

    const PotentialTree* tree =
        result.session ? &result.session->tree : nullptr;

    bool viewport = parts.size() > 2 && parts[2] == VIEWPORT_NAME;
    size_t first = viewport ? 3 : 2;
    for (size_t i = first; i < parts.size(); i++) {
        if (!result.relative_path.empty()) result.relative_path += '/';
        result.relative_path += parts[i];
        result.segments.push_back({parts[i], SegmentState::Absent});
    }

    if (viewport) {
        result.zone = Zone::Viewport;
        const PotentialTree* node = tree;
        for (auto& segment : result.segments) {
            node = node ? node->child(segment.name) : nullptr;
            if (node) segment.state = SegmentState::Virtual;
        }
        result.node = result.project_present ? node : nullptr;
        return result;
    }

    result.zone = Zone::ProjectRelative;
    result.store_path =
        vfs::join_path(result.project_store_path, result.relative_path);
    result.node = tree;
    if (result.project_present) classify_project_relative(result);
    return result;
}

void PathClassifier::classify_project_relative(
    VirtualPathClassification& result) const {
    std::string parent_path = result.project_store_path;
    SegmentState parent_state = SegmentState::Physical;
    const PotentialTree* node = result.node;

    for (size_t depth = 0; depth < result.segments.size(); depth++) {
        auto& segment = result.segments[depth];
        auto segment_path = vfs::join_path(parent_path, segment.name);

        if (parent_state == SegmentState::Absent) {
            segment.state = SegmentState::Absent;
        } else if (predicate_.is_virtual_segment(
                       segment.name, depth, node, parent_path,
                       parent_state == SegmentState::Virtual, store_)) {
            segment.state = SegmentState::Virtual;
        } else if (parent_state == SegmentState::Physical &&
                   store_.exists(segment_path)) {
            segment.state = SegmentState::Physical;
        } else {
            segment.state = SegmentState::Absent;
        }

        node = node ? node->child(segment.name) : nullptr;
        parent_state = segment.state;
        parent_path = std::move(segment_path);
    }
    result.node = node;
}

} // namespace bpfs::overlay
