#include <catch2/catch_test_macros.hpp>
#include "overlay/permission_oracle.hpp"

#include <string>
#include <vector>

using namespace bpfs::overlay;

TEST_CASE("Rule oracle matches role, path prefix and rights", "[oracle]") {
    RulePermissionOracle oracle({
        {"Admin", "/*", {"*"}},
        {"alice", "/finance/", {"read", "write"}},
        {"bob", "legal", {"read"}},
        {"carol", "/shared", {"materialize"}},
    });
    CHECK(oracle.rule_count() == 4);

    // Wildcard role rule; role comparison ignores case
    CHECK(oracle.allows("admin", "/anything/at/all", Operation::Write));

    CHECK(oracle.allows("alice", "/finance", Operation::Read));
    CHECK(oracle.allows("alice", "/finance/2024/budget.txt", Operation::Write));
    CHECK(oracle.allows("ALICE", "/finance/x", Operation::Materialize));
    // Paths are case-sensitive like the store behind them
    CHECK_FALSE(oracle.allows("alice", "/FINANCE/x", Operation::Read));
    CHECK_FALSE(oracle.allows("alice", "/Finance", Operation::Write));
    CHECK_FALSE(oracle.allows("alice", "/financial", Operation::Read));
    CHECK_FALSE(oracle.allows("alice", "/admin", Operation::Read));

    // Missing leading slash in the rule is normalized
    CHECK(oracle.allows("bob", "/legal/contracts", Operation::Read));
    CHECK_FALSE(oracle.allows("bob", "/legal", Operation::Write));
    CHECK_FALSE(oracle.allows("bob", "/legal", Operation::Materialize));

    // Materialize alone does not grant ordinary writes
    CHECK(oracle.allows("carol", "/shared/new", Operation::Materialize));
    CHECK_FALSE(oracle.allows("carol", "/shared/new", Operation::Write));
}

TEST_CASE("Unknown roles are denied", "[oracle]") {
    RulePermissionOracle oracle({{"alice", "/*", {"*"}}});
    CHECK_FALSE(oracle.allows("mallory", "/", Operation::Read));
    CHECK_FALSE(oracle.allows("", "/", Operation::Read));
}

TEST_CASE("User table maps users to their roles", "[oracle]") {
    RulePermissionOracle oracle(
        {{"accounting", "/finance", {"write"}}, {"office", "/admin", {"*"}}},
        {{"Alice", {"Accounting", "office", "office", " "}}, {"bob", {}}});
    CHECK(oracle.user_count() == 2);

    CHECK(oracle.roles_for("alice") ==
          std::vector<std::string>{"accounting", "office"});
    CHECK(oracle.roles_for("bob").empty());
    CHECK(oracle.roles_for("mallory").empty());
}

TEST_CASE("Without a user table the user name is the role", "[oracle]") {
    RulePermissionOracle oracle({{"alice", "/*", {"read"}}});
    CHECK(oracle.user_count() == 0);
    CHECK(oracle.roles_for("alice") == std::vector<std::string>{"alice"});
}

TEST_CASE("Operation names", "[oracle]") {
    CHECK(std::string(operation_name(Operation::Read)) == "read");
    CHECK(std::string(operation_name(Operation::Write)) == "write");
    CHECK(std::string(operation_name(Operation::Materialize)) == "materialize");
}
