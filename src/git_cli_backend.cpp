#include "git_cli_backend.hpp"

namespace vcs {

namespace {

std::string first_line(const std::string& text) {
    std::string line = text.substr(0, text.find('\n'));
    if (!line.empty() && line.back() == '\r')
        line.pop_back();
    return line;
}

} // namespace

GitCliBackend::GitCliBackend(const fs::path& repo, std::string executable)
    : repo_(repo), git_(std::move(executable)) {
    auto probe = run_git({"rev-parse", "--git-dir"});
    if (probe.exit_code < 0 || probe.exit_code == 127)
        throw SetupError("Cannot run " + git_ + ": " + first_line(probe.stderr_text));
    if (!probe.succeeded())
        throw SetupError("Not a git repository: " + repo.string() + ": " +
                         first_line(probe.stderr_text));
}

procutil::CommandResult GitCliBackend::run_git(const std::vector<std::string>& args) const {
    std::vector<std::string> argv{git_, "-C", repo_.string()};
    argv.insert(argv.end(), args.begin(), args.end());
    return procutil::run_command(argv);
}

QueryResult GitCliBackend::query(const std::vector<std::string>& args) const {
    auto res = run_git(args);
    if (!res.succeeded()) {
        std::string msg = first_line(res.stderr_text);
        if (msg.empty())
            msg = "git " + args.front() + " exited with status " + std::to_string(res.exit_code);
        return QueryResult::failure(msg);
    }
    return QueryResult::success(res.stdout_text);
}

std::string GitCliBackend::qualify(const std::string& ref) const {
    const std::string full = "refs/heads/" + ref;
    if (run_git({"show-ref", "--verify", "--quiet", full}).succeeded())
        return full;
    return ref;
}

QueryResult GitCliBackend::list_local_branches() {
    return query({"branch", "--list", "--format=%(refname:short)"});
}

QueryResult GitCliBackend::resolve_commit(const std::string& ref) {
    return query({"rev-parse", "--verify", "--quiet", qualify(ref) + "^{commit}"});
}

QueryResult GitCliBackend::commit_timestamp(const std::string& ref) {
    return query({"log", "-1", "--format=%ai", qualify(ref), "--"});
}

QueryResult GitCliBackend::merged_branches(const std::string& trunk) {
    return query({"branch", "--merged", qualify(trunk)});
}

QueryResult GitCliBackend::count_commits_ahead(const std::string& trunk,
                                               const std::string& branch) {
    return query({"rev-list", "--count", qualify(trunk) + ".." + qualify(branch), "--"});
}

QueryResult GitCliBackend::force_delete_branch(const std::string& name) {
    return query({"branch", "-D", name});
}

QueryResult GitCliBackend::worktree_status() { return query({"status", "--porcelain"}); }

} // namespace vcs
