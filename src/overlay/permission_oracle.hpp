#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace bpfs::overlay {

enum class Operation {
    Read,
    Write,
    Materialize, ///< A write that gives birth to virtual entries
};

const char* operation_name(Operation op);

/// Decides whether a role may perform an operation on a project path.
/// Paths are project-relative with a leading '/'.
class PermissionOracle {
public:
    virtual ~PermissionOracle() = default;

    virtual bool allows(std::string_view role, std::string_view path,
                        Operation op) const = 0;

    /// Roles held by a user. By default the user name is its only role.
    virtual std::vector<std::string> roles_for(std::string_view user) const {
        return {std::string(user)};
    }
};

/// User name -> roles it holds.
using UserRoles = std::map<std::string, std::vector<std::string>>;

/// One configured grant: role may exercise rights under path.
struct PermissionRule {
    std::string role;
    std::string path;                ///< "/*" matches everything
    std::vector<std::string> rights; ///< "read", "write", "materialize", "*"
};

/// Oracle over a static rule list. Roles no rule names are denied; a
/// "write" right also grants "materialize". Role and user names ignore
/// case, paths do not.
///
/// With a user table a user holds exactly the roles listed for it, and an
/// unlisted user holds none. Without one the user name is the role.
class RulePermissionOracle : public PermissionOracle {
public:
    explicit RulePermissionOracle(std::vector<PermissionRule> rules,
                                  const UserRoles& users = {});

    bool allows(std::string_view role, std::string_view path,
                Operation op) const override;

    std::vector<std::string> roles_for(std::string_view user) const override;

    size_t rule_count() const { return rules_.size(); }
    size_t user_count() const { return users_.size(); }

private:
    std::vector<PermissionRule> rules_; // normalized
    UserRoles users_;                   // normalized

    static bool path_matches(std::string_view rule_path, std::string_view path);
};

} // namespace bpfs::overlay
