#include "libgit2_backend.hpp"
#include <vector>
#include "time_utils.hpp"

namespace vcs {

namespace {

// Local branch names in iteration order, with the HEAD flag.
struct LocalBranch {
    std::string name;
    bool is_head = false;
    git_oid tip{};
    bool has_tip = false;
};

bool collect_local_branches(git_repository* repo, std::vector<LocalBranch>& out,
                            std::string& error) {
    git_branch_iterator* raw_it = nullptr;
    if (git_branch_iterator_new(&raw_it, repo, GIT_BRANCH_LOCAL) != 0) {
        error = git::last_error_message();
        return false;
    }
    git::branch_iterator_ptr it(raw_it);
    git_reference* raw_ref = nullptr;
    git_branch_t type;
    int rc = 0;
    while ((rc = git_branch_next(&raw_ref, &type, it.get())) == 0) {
        git::reference_ptr ref(raw_ref);
        const char* name = nullptr;
        if (git_branch_name(&name, ref.get()) != 0 || !name)
            continue;
        LocalBranch b;
        b.name = name;
        b.is_head = git_branch_is_head(ref.get()) == 1;
        git_object* peeled = nullptr;
        if (git_reference_peel(&peeled, ref.get(), GIT_OBJECT_COMMIT) == 0) {
            git::object_ptr obj(peeled);
            git_oid_cpy(&b.tip, git_object_id(obj.get()));
            b.has_tip = true;
        }
        out.push_back(std::move(b));
    }
    if (rc != GIT_ITEROVER) {
        error = git::last_error_message();
        return false;
    }
    return true;
}

char status_letter(unsigned int flags, bool index_side) {
    if (index_side) {
        if (flags & GIT_STATUS_INDEX_NEW)
            return 'A';
        if (flags & GIT_STATUS_INDEX_MODIFIED)
            return 'M';
        if (flags & GIT_STATUS_INDEX_DELETED)
            return 'D';
        if (flags & GIT_STATUS_INDEX_RENAMED)
            return 'R';
        if (flags & GIT_STATUS_INDEX_TYPECHANGE)
            return 'T';
        return ' ';
    }
    if (flags & GIT_STATUS_WT_MODIFIED)
        return 'M';
    if (flags & GIT_STATUS_WT_DELETED)
        return 'D';
    if (flags & GIT_STATUS_WT_RENAMED)
        return 'R';
    if (flags & GIT_STATUS_WT_TYPECHANGE)
        return 'T';
    return ' ';
}

} // namespace

Libgit2Backend::Libgit2Backend(const fs::path& repo) {
    std::string err;
    repo_ = git::open_repository(repo, &err);
    if (!repo_.get())
        throw SetupError("Cannot open repository at " + repo.string() + ": " + err);
}

QueryResult Libgit2Backend::list_local_branches() {
    std::vector<LocalBranch> branches;
    std::string err;
    if (!collect_local_branches(repo_.get(), branches, err))
        return QueryResult::failure(err);
    std::string out;
    for (const auto& b : branches)
        out += b.name + "\n";
    return QueryResult::success(out);
}

QueryResult Libgit2Backend::resolve_commit(const std::string& ref) {
    git::commit_ptr commit = git::lookup_commit(repo_.get(), ref);
    if (!commit.get())
        return QueryResult::failure("Cannot resolve " + ref + ": " + git::last_error_message());
    return QueryResult::success(git::oid_to_hex(*git_commit_id(commit.get())));
}

QueryResult Libgit2Backend::commit_timestamp(const std::string& ref) {
    git::commit_ptr commit = git::lookup_commit(repo_.get(), ref);
    if (!commit.get())
        return QueryResult::failure("Cannot resolve " + ref + ": " + git::last_error_message());
    const git_signature* author = git_commit_author(commit.get());
    if (!author)
        return QueryResult::failure("Commit " + ref + " has no author");
    return QueryResult::success(format_commit_timestamp(static_cast<std::time_t>(author->when.time),
                                                        author->when.offset));
}

QueryResult Libgit2Backend::merged_branches(const std::string& trunk) {
    git::commit_ptr trunk_commit = git::lookup_commit(repo_.get(), trunk);
    if (!trunk_commit.get())
        return QueryResult::failure("Cannot resolve " + trunk + ": " + git::last_error_message());
    const git_oid* trunk_oid = git_commit_id(trunk_commit.get());
    std::vector<LocalBranch> branches;
    std::string err;
    if (!collect_local_branches(repo_.get(), branches, err))
        return QueryResult::failure(err);
    std::string out;
    for (const auto& b : branches) {
        if (!b.has_tip)
            continue;
        bool merged = git_oid_equal(&b.tip, trunk_oid) != 0 ||
                      git_graph_descendant_of(repo_.get(), trunk_oid, &b.tip) == 1;
        if (merged)
            out += (b.is_head ? "* " : "  ") + b.name + "\n";
    }
    return QueryResult::success(out);
}

QueryResult Libgit2Backend::count_commits_ahead(const std::string& trunk,
                                                const std::string& branch) {
    git::commit_ptr trunk_commit = git::lookup_commit(repo_.get(), trunk);
    if (!trunk_commit.get())
        return QueryResult::failure("Cannot resolve " + trunk + ": " + git::last_error_message());
    git::commit_ptr branch_commit = git::lookup_commit(repo_.get(), branch);
    if (!branch_commit.get())
        return QueryResult::failure("Cannot resolve " + branch + ": " + git::last_error_message());
    git_revwalk* raw_walk = nullptr;
    if (git_revwalk_new(&raw_walk, repo_.get()) != 0)
        return QueryResult::failure(git::last_error_message());
    git::revwalk_ptr walk(raw_walk);
    if (git_revwalk_push(walk.get(), git_commit_id(branch_commit.get())) != 0 ||
        git_revwalk_hide(walk.get(), git_commit_id(trunk_commit.get())) != 0)
        return QueryResult::failure(git::last_error_message());
    size_t count = 0;
    git_oid oid;
    int rc = 0;
    while ((rc = git_revwalk_next(&oid, walk.get())) == 0)
        ++count;
    if (rc != GIT_ITEROVER)
        return QueryResult::failure(git::last_error_message());
    return QueryResult::success(std::to_string(count));
}

QueryResult Libgit2Backend::force_delete_branch(const std::string& name) {
    git_reference* raw_ref = nullptr;
    if (git_branch_lookup(&raw_ref, repo_.get(), name.c_str(), GIT_BRANCH_LOCAL) != 0)
        return QueryResult::failure("branch '" + name + "' not found");
    git::reference_ptr ref(raw_ref);
    // git_branch_delete does not consult merge state, matching `git branch -D`.
    if (git_branch_delete(ref.get()) != 0)
        return QueryResult::failure(git::last_error_message());
    return QueryResult::success("Deleted branch " + name + "\n");
}

QueryResult Libgit2Backend::worktree_status() {
    git_status_options opts = GIT_STATUS_OPTIONS_INIT;
    opts.show = GIT_STATUS_SHOW_INDEX_AND_WORKDIR;
    opts.flags = GIT_STATUS_OPT_INCLUDE_UNTRACKED | GIT_STATUS_OPT_RENAMES_HEAD_TO_INDEX;
    git_status_list* raw_list = nullptr;
    if (git_status_list_new(&raw_list, repo_.get(), &opts) != 0)
        return QueryResult::failure(git::last_error_message());
    git::status_list_ptr list(raw_list);
    std::string out;
    const size_t n = git_status_list_entrycount(list.get());
    for (size_t i = 0; i < n; ++i) {
        const git_status_entry* e = git_status_byindex(list.get(), i);
        if (!e || e->status == GIT_STATUS_CURRENT || (e->status & GIT_STATUS_IGNORED))
            continue;
        const git_diff_delta* delta = e->index_to_workdir ? e->index_to_workdir : e->head_to_index;
        std::string path = delta && delta->new_file.path ? delta->new_file.path : "";
        if (e->status & GIT_STATUS_WT_NEW) {
            out += "?? " + path + "\n";
            continue;
        }
        out += std::string(1, status_letter(e->status, true)) +
               status_letter(e->status, false) + " " + path + "\n";
    }
    return QueryResult::success(out);
}

} // namespace vcs
