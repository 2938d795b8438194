#include "test_common.hpp"
#include "branch_inventory.hpp"
#include "cli_commands.hpp"
#include <nlohmann/json.hpp>

#ifndef _WIN32

using stalebranch::test_support::make_sample_repo;

namespace {

std::vector<std::string> branches_of(const fs::path& dir) {
    auto backend = vcs::open_backend(vcs::BackendKind::GitCli, dir);
    auto names = parse_branch_listing(backend->list_local_branches().output);
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace

TEST_CASE("Dry run against a real repository deletes nothing") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    const std::time_t now = std::time(nullptr);
    for (auto kind : {vcs::BackendKind::Libgit2, vcs::BackendKind::GitCli}) {
        INFO("backend " << vcs::to_string(kind));
        fs::path dir = fs::temp_directory_path() / (std::string("sb_dry_") + vcs::to_string(kind));
        FS_REMOVE_ALL(dir);
        REQUIRE(make_sample_repo(dir, now));

        Options opts;
        opts.repo = dir;
        opts.backend = kind;
        opts.dry_run = true;
        opts.protected_names = default_protected_branches();
        std::ostringstream out, err;
        {
            auto backend = vcs::open_backend(kind, dir);
            REQUIRE(cli::run_cleanup_command(opts, *backend, now, out, err) == cli::EXIT_DRY_RUN);
        }
        REQUIRE(out.str().find("[DRY RUN] Would delete branch: feature-x") != std::string::npos);
        REQUIRE(out.str().find("Skipping unmerged branch: feature-y (1 commits ahead of trunk)") !=
                std::string::npos);
        REQUIRE(out.str().find("recent-done") == std::string::npos);
        REQUIRE(branches_of(dir) ==
                std::vector<std::string>{"feature-x", "feature-y", "main", "recent-done"});
        FS_REMOVE_ALL(dir);
    }
}

TEST_CASE("Live run removes only stale merged branches") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    const std::time_t now = std::time(nullptr);
    for (auto kind : {vcs::BackendKind::Libgit2, vcs::BackendKind::GitCli}) {
        INFO("backend " << vcs::to_string(kind));
        fs::path dir = fs::temp_directory_path() / (std::string("sb_live_") + vcs::to_string(kind));
        FS_REMOVE_ALL(dir);
        REQUIRE(make_sample_repo(dir, now));

        Options opts;
        opts.repo = dir;
        opts.backend = kind;
        opts.silent = true;
        opts.protected_names = default_protected_branches();
        opts.summary_json = dir.parent_path() / (dir.filename().string() + ".json");
        std::ostringstream out, err;
        {
            auto backend = vcs::open_backend(kind, dir);
            REQUIRE(cli::run_cleanup_command(opts, *backend, now, out, err) == cli::EXIT_LIVE_RUN);
        }
        REQUIRE(branches_of(dir) ==
                std::vector<std::string>{"feature-y", "main", "recent-done"});
        auto doc = nlohmann::json::parse(stalebranch::test_support::slurp(opts.summary_json));
        REQUIRE(doc["summary"]["total_stale"] == 2);
        REQUIRE(doc["summary"]["deletable"] == nlohmann::json::array({"feature-x"}));
        REQUIRE(doc["summary"]["unmerged"][0]["branch"] == "feature-y");
        REQUIRE(doc["summary"]["unmerged"][0]["commits_ahead"] == 1);

        // A second run finds feature-y only and leaves it alone.
        std::ostringstream out2, err2;
        {
            auto backend = vcs::open_backend(kind, dir);
            cli::run_cleanup_command(opts, *backend, now, out2, err2);
        }
        REQUIRE(branches_of(dir) ==
                std::vector<std::string>{"feature-y", "main", "recent-done"});
        FS_REMOVE(opts.summary_json);
        FS_REMOVE_ALL(dir);
    }
}

TEST_CASE("Require clean stops before touching a dirty repository") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    const std::time_t now = std::time(nullptr);
    fs::path dir = fs::temp_directory_path() / "sb_dirty_repo";
    FS_REMOVE_ALL(dir);
    REQUIRE(make_sample_repo(dir, now));
    std::ofstream(dir / "notes.txt") << "scratch";

    Options opts;
    opts.repo = dir;
    opts.require_clean = true;
    opts.protected_names = default_protected_branches();
    REQUIRE_THROWS_AS(cli::handle_cleanup_run(opts), vcs::SetupError);
    REQUIRE(branches_of(dir).size() == 4);
    FS_REMOVE_ALL(dir);
}

#endif // _WIN32
