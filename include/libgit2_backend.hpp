#ifndef LIBGIT2_BACKEND_HPP
#define LIBGIT2_BACKEND_HPP
#include "git_utils.hpp"
#include "vcs_backend.hpp"

namespace vcs {

/**
 * @brief VcsBackend answering every query in-process through libgit2.
 *
 * Output mirrors what the equivalent `git` command prints, so the parsing in
 * the inspector does not depend on which backend is active.
 */
class Libgit2Backend : public VcsBackend {
  public:
    /**
     * @throws SetupError if no repository contains @p repo.
     */
    explicit Libgit2Backend(const fs::path& repo);

    QueryResult list_local_branches() override;
    QueryResult resolve_commit(const std::string& ref) override;
    QueryResult commit_timestamp(const std::string& ref) override;
    QueryResult merged_branches(const std::string& trunk) override;
    QueryResult count_commits_ahead(const std::string& trunk, const std::string& branch) override;
    QueryResult force_delete_branch(const std::string& name) override;
    QueryResult worktree_status() override;
    std::string name() const override { return "libgit2"; }

  private:
    git::GitInitGuard guard_; // must outlive repo_
    git::repo_ptr repo_;
};

} // namespace vcs

#endif // LIBGIT2_BACKEND_HPP
