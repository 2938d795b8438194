#ifndef GIT_CLI_BACKEND_HPP
#define GIT_CLI_BACKEND_HPP
#include <vector>
#include "process_utils.hpp"
#include "vcs_backend.hpp"

namespace vcs {

/**
 * @brief VcsBackend that runs the `git` executable for every query.
 *
 * Useful where libgit2 lags behind repository features (new index or ref
 * formats) that the installed git understands.
 */
class GitCliBackend : public VcsBackend {
  public:
    /**
     * @param repo Repository path passed to `git -C`.
     * @param executable Executable to run; looked up in `PATH`.
     * @throws SetupError if git cannot run or @p repo is not a repository.
     */
    explicit GitCliBackend(const fs::path& repo, std::string executable = "git");

    QueryResult list_local_branches() override;
    QueryResult resolve_commit(const std::string& ref) override;
    QueryResult commit_timestamp(const std::string& ref) override;
    QueryResult merged_branches(const std::string& trunk) override;
    QueryResult count_commits_ahead(const std::string& trunk, const std::string& branch) override;
    QueryResult force_delete_branch(const std::string& name) override;
    QueryResult worktree_status() override;
    std::string name() const override { return "git"; }

  private:
    procutil::CommandResult run_git(const std::vector<std::string>& args) const;
    QueryResult query(const std::vector<std::string>& args) const;
    /// `refs/heads/<ref>` when such a branch exists, otherwise @p ref unchanged.
    std::string qualify(const std::string& ref) const;

    fs::path repo_;
    std::string git_;
};

} // namespace vcs

#endif // GIT_CLI_BACKEND_HPP
