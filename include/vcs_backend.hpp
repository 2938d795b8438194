#ifndef VCS_BACKEND_HPP
#define VCS_BACKEND_HPP
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace vcs {
namespace fs = std::filesystem;

/**
 * @brief Raw answer to one version-control query.
 *
 * `output` holds the text the query printed; it may be empty even when `ok`
 * is set. `error` carries a human-readable reason when `ok` is false.
 */
struct QueryResult {
    bool ok = false;
    std::string output;
    std::string error;

    static QueryResult success(std::string out) { return {true, std::move(out), {}}; }
    static QueryResult failure(std::string err) { return {false, {}, std::move(err)}; }
};

/**
 * @brief Thrown when a repository cannot be opened at all.
 */
class SetupError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

enum class BackendKind { Libgit2, GitCli };

std::optional<BackendKind> parse_backend_kind(const std::string& name);
const char* to_string(BackendKind kind);

/**
 * @brief Text-in/text-out boundary to the repository.
 *
 * Every query mirrors the output of a plain `git` command so callers can
 * parse it the same way regardless of the backend. Implementations report
 * per-query problems through QueryResult and must not throw for them.
 */
class VcsBackend {
  public:
    virtual ~VcsBackend() = default;

    /// `git branch --list --format=%(refname:short)`: one name per line.
    virtual QueryResult list_local_branches() = 0;

    /// `git rev-parse --verify <ref>`: full hexadecimal commit id.
    virtual QueryResult resolve_commit(const std::string& ref) = 0;

    /// `git log -1 --format=%ai <ref>`: `YYYY-MM-DD HH:MM:SS +ZZZZ`.
    virtual QueryResult commit_timestamp(const std::string& ref) = 0;

    /// `git branch --merged <trunk>`: listing with `* ` / two-space markers.
    virtual QueryResult merged_branches(const std::string& trunk) = 0;

    /// `git rev-list --count <trunk>..<branch>`: decimal count.
    virtual QueryResult count_commits_ahead(const std::string& trunk,
                                            const std::string& branch) = 0;

    /// `git branch -D <name>`.
    virtual QueryResult force_delete_branch(const std::string& name) = 0;

    /// `git status --porcelain`: empty output means a clean worktree.
    virtual QueryResult worktree_status() = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief Open the repository at @p repo with the requested backend.
 *
 * @throws SetupError if @p repo is not a usable repository.
 */
std::unique_ptr<VcsBackend> open_backend(BackendKind kind, const fs::path& repo);

/**
 * @brief Pick the ref to compare against: @p trunk if it resolves, otherwise
 *        `origin/<trunk>`.
 *
 * @return The resolvable ref or `std::nullopt` when neither exists.
 */
std::optional<std::string> resolve_trunk(VcsBackend& backend, const std::string& trunk);

} // namespace vcs

#endif // VCS_BACKEND_HPP
