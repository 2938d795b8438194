#include "test_common.hpp"
#include "pattern_utils.hpp"

using stalebranch::test_support::NOW;

TEST_CASE("format_iso_utc renders UTC") {
    REQUIRE(format_iso_utc(0) == "1970-01-01T00:00:00Z");
    REQUIRE(format_iso_utc(NOW) == "2023-11-14T22:13:20Z");
}

TEST_CASE("format_commit_timestamp uses git layout") {
    REQUIRE(format_commit_timestamp(NOW, 0) == "2023-11-14 22:13:20 +0000");
    REQUIRE(format_commit_timestamp(NOW, 90) == "2023-11-14 23:43:20 +0130");
    REQUIRE(format_commit_timestamp(NOW, -300) == "2023-11-14 17:13:20 -0500");
}

TEST_CASE("parse_commit_timestamp honours offsets") {
    REQUIRE(parse_commit_timestamp("2023-11-14 22:13:20 +0000") == NOW);
    REQUIRE(parse_commit_timestamp("2023-11-14 23:43:20 +0130") == NOW);
    REQUIRE(parse_commit_timestamp("2023-11-14 17:13:20 -0500") == NOW);
    REQUIRE(parse_commit_timestamp("  2023-11-14 22:13:20 +0000\n") == NOW);
    REQUIRE(parse_commit_timestamp("2023-11-14 22:13:20") == NOW);
}

TEST_CASE("parse_commit_timestamp rejects malformed text") {
    REQUIRE_FALSE(parse_commit_timestamp("").has_value());
    REQUIRE_FALSE(parse_commit_timestamp("yesterday").has_value());
    REQUIRE_FALSE(parse_commit_timestamp("2023-13-14 22:13:20 +0000").has_value());
    REQUIRE_FALSE(parse_commit_timestamp("2023-11-14 22:13:20 UTC").has_value());
    REQUIRE_FALSE(parse_commit_timestamp("2023/11/14 22:13:20").has_value());
}

TEST_CASE("whole_days_between truncates and clamps") {
    REQUIRE(whole_days_between(NOW, NOW) == 0);
    REQUIRE(whole_days_between(NOW - 86399, NOW) == 0);
    REQUIRE(whole_days_between(NOW - 86400, NOW) == 1);
    REQUIRE(whole_days_between(NOW - 31 * 86400 - 5, NOW) == 31);
    REQUIRE(whole_days_between(NOW + 3 * 86400, NOW) == 0);
}

TEST_CASE("patterns match exact names and globs") {
    std::vector<std::string> pats{"release", "main-issue-*", "hotfix/?.?"};
    REQUIRE(patterns::matches("release", pats));
    REQUIRE_FALSE(patterns::matches("release-2", pats));
    REQUIRE(patterns::matches("main-issue-42", pats));
    REQUIRE_FALSE(patterns::matches("feature-main-issue-42", pats));
    REQUIRE(patterns::matches("hotfix/1.2", pats));
    REQUIRE_FALSE(patterns::matches("hotfix/1.22", pats));
    REQUIRE_FALSE(patterns::matches("anything", {}));
    REQUIRE(patterns::matches("release/1.2/rc", {"release/*"}));
}

TEST_CASE("patterns is_glob") {
    REQUIRE(patterns::is_glob("feat-*"));
    REQUIRE(patterns::is_glob("v?"));
    REQUIRE(patterns::is_glob("[ab]x"));
    REQUIRE_FALSE(patterns::is_glob("plain-name"));
}

TEST_CASE("read_pattern_file skips comments and blanks") {
    fs::path file = fs::temp_directory_path() / "sb_patterns.txt";
    {
        std::ofstream ofs(file, std::ios::binary);
        ofs << "# protected\r\n  release  \r\n\r\nqa-*\n#tail\n";
    }
    auto entries = patterns::read_pattern_file(file);
    REQUIRE(entries == std::vector<std::string>{"release", "qa-*"});
    FS_REMOVE(file);
    REQUIRE(patterns::read_pattern_file(file).empty());
}

TEST_CASE("CleanupResult helpers") {
    CleanupResult result;
    result.outcomes.push_back({"a", "1111111", DeletionStatus::Deleted, ""});
    result.outcomes.push_back({"b", "2222222", DeletionStatus::Failed, "gone"});
    result.outcomes.push_back({"c", "3333333", DeletionStatus::Deleted, ""});
    REQUIRE(result.deleted() == std::vector<std::string>{"a", "c"});
    REQUIRE(result.failed_count() == 1);
    REQUIRE(std::string(to_string(DeletionStatus::WouldDelete)) == "would_delete");
}

TEST_CASE("BranchRecord flags disagreeing merge signals") {
    BranchRecord rec;
    rec.is_merged = true;
    REQUIRE_FALSE(rec.merge_signals_disagree());
    rec.commits_ahead = 2;
    REQUIRE(rec.merge_signals_disagree());
    rec.is_merged = false;
    REQUIRE_FALSE(rec.merge_signals_disagree());
}

TEST_CASE("Backend kind names") {
    REQUIRE(vcs::parse_backend_kind("libgit2") == vcs::BackendKind::Libgit2);
    REQUIRE(vcs::parse_backend_kind("git") == vcs::BackendKind::GitCli);
    REQUIRE(vcs::parse_backend_kind("cli") == vcs::BackendKind::GitCli);
    REQUIRE_FALSE(vcs::parse_backend_kind("hg").has_value());
    REQUIRE(std::string(vcs::to_string(vcs::BackendKind::GitCli)) == "git");
}
