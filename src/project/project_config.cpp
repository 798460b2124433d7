#include "project/project_config.hpp"

#include <algorithm>
#include <cctype>

namespace bpfs::project {

const char* inherit_mode_name(InheritMode mode) {
    switch (mode) {
    case InheritMode::Fixed: return "fix";
    case InheritMode::Dynamic: return "dynamic";
    case InheritMode::Excluded: return "not";
    }
    return "dynamic";
}

std::optional<InheritMode> parse_inherit_mode(std::string_view value) {
    std::string lower(value);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    // Trim surrounding whitespace and quotes
    auto first = lower.find_first_not_of(" \t\"'");
    if (first == std::string::npos) return std::nullopt;
    lower = lower.substr(first, lower.find_last_not_of(" \t\"'") - first + 1);

    if (lower == "fix" || lower == "fixed") return InheritMode::Fixed;
    if (lower == "dynamic") return InheritMode::Dynamic;
    if (lower == "not" || lower == "excluded") return InheritMode::Excluded;
    return std::nullopt;
}

InheritMode ProjectRoot::inherit_mode(std::string_view section) const {
    auto it = sections.find(section);
    return it != sections.end() ? it->second : InheritMode::Dynamic;
}

fs::path marker_path(const fs::path& project_dir) {
    return project_dir / MARKER_DIR / MARKER_FILE;
}

} // namespace bpfs::project
