#include "git_utils.hpp"

namespace git {

GitInitGuard::GitInitGuard() { git_libgit2_init(); }

GitInitGuard::~GitInitGuard() { git_libgit2_shutdown(); }

std::string last_error_message() {
    const git_error* e = git_error_last();
    if (e && e->message)
        return e->message;
    return "Unknown libgit2 error";
}

std::string oid_to_hex(const git_oid& oid) {
    char buf[GIT_OID_HEXSZ + 1];
    git_oid_tostr(buf, sizeof(buf), &oid);
    return std::string(buf);
}

repo_ptr open_repository(const fs::path& path, std::string* error) {
    git_repository* raw = nullptr;
    if (git_repository_open_ext(&raw, path.string().c_str(), 0, nullptr) != 0) {
        if (error)
            *error = last_error_message();
        return repo_ptr();
    }
    return repo_ptr(raw);
}

commit_ptr lookup_commit(git_repository* repo, const std::string& ref) {
    git_object* peeled = nullptr;
    git_reference* raw_ref = nullptr;
    if (git_branch_lookup(&raw_ref, repo, ref.c_str(), GIT_BRANCH_LOCAL) == 0) {
        reference_ptr branch(raw_ref);
        if (git_reference_peel(&peeled, branch.get(), GIT_OBJECT_COMMIT) != 0)
            return commit_ptr();
        return commit_ptr(reinterpret_cast<git_commit*>(peeled));
    }
    git_object* raw_obj = nullptr;
    if (git_revparse_single(&raw_obj, repo, ref.c_str()) != 0)
        return commit_ptr();
    object_ptr obj(raw_obj);
    if (git_object_peel(&peeled, obj.get(), GIT_OBJECT_COMMIT) != 0)
        return commit_ptr();
    return commit_ptr(reinterpret_cast<git_commit*>(peeled));
}

} // namespace git
