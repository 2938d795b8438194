#include "vcs_backend.hpp"
#include <algorithm>
#include <cctype>
#include "git_cli_backend.hpp"
#include "libgit2_backend.hpp"
#include "logger.hpp"

namespace vcs {

std::optional<BackendKind> parse_backend_kind(const std::string& name) {
    std::string v = name;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "libgit2")
        return BackendKind::Libgit2;
    if (v == "git" || v == "cli")
        return BackendKind::GitCli;
    return std::nullopt;
}

const char* to_string(BackendKind kind) {
    return kind == BackendKind::GitCli ? "git" : "libgit2";
}

std::unique_ptr<VcsBackend> open_backend(BackendKind kind, const fs::path& repo) {
    log_debug("Opening repository", {{"path", repo.string()}, {"backend", to_string(kind)}});
    if (kind == BackendKind::GitCli)
        return std::make_unique<GitCliBackend>(repo);
    return std::make_unique<Libgit2Backend>(repo);
}

std::optional<std::string> resolve_trunk(VcsBackend& backend, const std::string& trunk) {
    for (const std::string& candidate : {trunk, "origin/" + trunk}) {
        auto res = backend.resolve_commit(candidate);
        if (res.ok && !res.output.empty())
            return candidate;
        log_debug("Trunk candidate not found", {{"ref", candidate}, {"error", res.error}});
    }
    return std::nullopt;
}

} // namespace vcs
