#include "test_common.hpp"
#include "branch_inventory.hpp"

using stalebranch::test_support::FakeBackend;
using stalebranch::test_support::days_ago;

TEST_CASE("parse_branch_listing strips markers and detached entries") {
    std::string listing = "* main\n"
                          "  feature-x\n"
                          "+ linked-worktree\r\n"
                          "  (HEAD detached at 1a2b3c4)\n"
                          "  (no branch)\n"
                          "\n"
                          "  feature-x\n";
    REQUIRE(parse_branch_listing(listing) ==
            std::vector<std::string>{"main", "feature-x", "linked-worktree"});
    REQUIRE(parse_branch_listing("").empty());
}

TEST_CASE("is_remote_tracking") {
    REQUIRE(is_remote_tracking("remotes/origin/main"));
    REQUIRE(is_remote_tracking("refs/remotes/origin/feature"));
    REQUIRE_FALSE(is_remote_tracking("feature/remotes"));
    REQUIRE_FALSE(is_remote_tracking("main"));
}

TEST_CASE("Inventory excludes protected and remote names") {
    FakeBackend fake;
    fake.raw_listing = "* main\n  develop\n  feature-a\n  remotes/origin/feature-a\n"
                       "  refs/remotes/origin/x\n  Main\n  production\n";
    InventorySettings settings{default_protected_branches(), {}};
    auto names = list_candidate_branches(fake, settings);
    REQUIRE(names == std::vector<std::string>{"feature-a", "Main"});
}

TEST_CASE("Inventory applies branch patterns") {
    FakeBackend fake;
    fake.raw_listing = "  main-issue-1\n  main-issue-22\n  feature-a\n  main\n";
    InventorySettings settings{{"main"}, {"main-issue-*"}};
    REQUIRE(list_candidate_branches(fake, settings) ==
            std::vector<std::string>{"main-issue-1", "main-issue-22"});
}

TEST_CASE("Inventory survives a failed or empty listing") {
    FakeBackend fake;
    fake.fail_listing = true;
    InventorySettings settings{default_protected_branches(), {}};
    REQUIRE(list_candidate_branches(fake, settings).empty());

    FakeBackend empty;
    REQUIRE(list_candidate_branches(empty, settings).empty());
}

TEST_CASE("Inventory reports a failed listing on the diagnostics stream") {
    FakeBackend fake;
    fake.fail_listing = true;
    InventorySettings settings{default_protected_branches(), {}};
    std::ostringstream diag;
    REQUIRE(list_candidate_branches(fake, settings, &diag).empty());
    REQUIRE(diag.str() == "Warning: cannot list branches: fatal: not a git repository\n");

    fake.fail_listing = false;
    std::ostringstream quiet;
    list_candidate_branches(fake, settings, &quiet);
    REQUIRE(quiet.str().empty());
}

TEST_CASE("Inventory preserves listing order") {
    FakeBackend fake;
    fake.add("zeta", "a", days_ago(1), false, 0);
    fake.add("alpha", "b", days_ago(1), false, 0);
    fake.add("mid", "c", days_ago(1), false, 0);
    InventorySettings settings;
    REQUIRE(list_candidate_branches(fake, settings) ==
            std::vector<std::string>{"zeta", "alpha", "mid"});
}
