#ifndef GIT_UTILS_HPP
#define GIT_UTILS_HPP

#include <git2.h>
#include <filesystem>
#include <string>

namespace git {
namespace fs = std::filesystem;

/**
 * @brief RAII helper managing global libgit2 initialization.
 *
 * libgit2 reference-counts init/shutdown, so guards may nest.
 */
struct GitInitGuard {
    GitInitGuard();  ///< Calls `git_libgit2_init()`
    ~GitInitGuard(); ///< Calls `git_libgit2_shutdown()`
    GitInitGuard(const GitInitGuard&) = delete;
    GitInitGuard& operator=(const GitInitGuard&) = delete;
};

// RAII wrappers for libgit2 resources
template <typename T, void (*Free)(T*)> struct GitHandle {
    T* h;
    explicit GitHandle(T* h_ = nullptr) : h(h_) {}
    ~GitHandle() {
        if (h)
            Free(h);
    }
    GitHandle(const GitHandle&) = delete;
    GitHandle& operator=(const GitHandle&) = delete;
    GitHandle(GitHandle&& o) noexcept : h(o.h) { o.h = nullptr; }
    GitHandle& operator=(GitHandle&& o) noexcept {
        if (this != &o) {
            if (h)
                Free(h);
            h = o.h;
            o.h = nullptr;
        }
        return *this;
    }
    T* get() const { return h; }
};

using repo_ptr = GitHandle<git_repository, git_repository_free>;
using object_ptr = GitHandle<git_object, git_object_free>;
using commit_ptr = GitHandle<git_commit, git_commit_free>;
using reference_ptr = GitHandle<git_reference, git_reference_free>;
using revwalk_ptr = GitHandle<git_revwalk, git_revwalk_free>;
using status_list_ptr = GitHandle<git_status_list, git_status_list_free>;
using branch_iterator_ptr = GitHandle<git_branch_iterator, git_branch_iterator_free>;

// The utility functions below assume libgit2 is already initialized.

/**
 * @brief Message of the most recent libgit2 error, or a generic fallback.
 */
std::string last_error_message();

/**
 * @brief Convert a libgit2 object ID to a hexadecimal string.
 */
std::string oid_to_hex(const git_oid& oid);

/**
 * @brief Open the repository containing @p path, searching parent directories.
 *
 * @param error Optional output string receiving a libgit2 error message.
 * @return Owning handle; `get()` is null on failure.
 */
repo_ptr open_repository(const fs::path& path, std::string* error = nullptr);

/**
 * @brief Peel @p ref to a commit.
 *
 * Local branch names are looked up under `refs/heads/` first so a tag with the
 * same name cannot shadow the branch; anything else goes through revparse.
 *
 * @return Owning handle; `get()` is null when @p ref does not name a commit.
 */
commit_ptr lookup_commit(git_repository* repo, const std::string& ref);

} // namespace git

#endif // GIT_UTILS_HPP
