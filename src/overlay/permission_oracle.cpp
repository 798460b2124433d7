#include "overlay/permission_oracle.hpp"

#include <algorithm>
#include <cctype>

namespace bpfs::overlay {

static std::string lowercase(std::string_view text) {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

static std::string trim(std::string_view text) {
    auto first = text.find_first_not_of(" \t");
    if (first == std::string_view::npos) return {};
    auto last = text.find_last_not_of(" \t");
    return std::string(text.substr(first, last - first + 1));
}

/// Leading '/', no trailing '/'. "/*" is kept as is.
static std::string normalize_rule_path(std::string_view path) {
    std::string result = trim(path);
    if (result == "/*") return result;
    if (result.empty() || result[0] != '/') result = "/" + result;
    while (result.size() > 1 && result.back() == '/') result.pop_back();
    return result;
}

const char* operation_name(Operation op) {
    switch (op) {
    case Operation::Read: return "read";
    case Operation::Write: return "write";
    case Operation::Materialize: return "materialize";
    }
    return "read";
}

RulePermissionOracle::RulePermissionOracle(std::vector<PermissionRule> rules,
                                           const UserRoles& users) {
    for (const auto& [user, roles] : users) {
        auto& held = users_[lowercase(trim(user))];
        for (const auto& role : roles) {
            auto key = lowercase(trim(role));
            if (key.empty()) continue;
            if (std::find(held.begin(), held.end(), key) == held.end()) {
                held.push_back(std::move(key));
            }
        }
    }

    for (auto& rule : rules) {
        PermissionRule normalized;
        normalized.role = lowercase(trim(rule.role));
        normalized.path = normalize_rule_path(rule.path);
        for (const auto& right : rule.rights) {
            normalized.rights.push_back(lowercase(trim(right)));
        }
        rules_.push_back(std::move(normalized));
    }
}

bool RulePermissionOracle::path_matches(std::string_view rule_path,
                                        std::string_view path) {
    if (rule_path == "/*" || rule_path == "/") return true;
    if (path == rule_path) return true;
    return path.size() > rule_path.size() &&
           path.compare(0, rule_path.size(), rule_path) == 0 &&
           path[rule_path.size()] == '/';
}

bool RulePermissionOracle::allows(std::string_view role, std::string_view path,
                                  Operation op) const {
    auto role_key = lowercase(trim(role));
    auto path_key = normalize_rule_path(path);
    std::string right = operation_name(op);

    for (const auto& rule : rules_) {
        if (rule.role != role_key) continue;
        if (!path_matches(rule.path, path_key)) continue;

        for (const auto& granted : rule.rights) {
            if (granted == "*" || granted == right) return true;
            if (op == Operation::Materialize && granted == "write") return true;
        }
    }

    return false;
}

std::vector<std::string> RulePermissionOracle::roles_for(
    std::string_view user) const {
    if (users_.empty()) return {std::string(user)};
    auto it = users_.find(lowercase(trim(user)));
    if (it == users_.end()) return {};
    return it->second;
}

} // namespace bpfs::overlay
