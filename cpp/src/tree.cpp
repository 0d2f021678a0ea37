#include "internal.h"
#include "histofy/error.h"
#include "histofy/types.h"

#include <git2.h>

#include <set>
#include <string>
#include <vector>

namespace histofy {

// ---------------------------------------------------------------------------
// Internal helpers
// ---------------------------------------------------------------------------

namespace {

/// Convert a raw OID to a 40-char lowercase hex string.
std::string oid_to_hex(const git_oid* oid) {
    char buf[GIT_OID_HEXSZ + 1];
    git_oid_tostr(buf, sizeof(buf), oid);
    return std::string(buf, GIT_OID_HEXSZ);
}

/// Parse a 40-char hex string into a git_oid.
/// @throws ValidationError on failure.
git_oid hex_to_oid(const std::string& hex) {
    git_oid oid;
    if (hex.size() != GIT_OID_HEXSZ || git_oid_fromstr(&oid, hex.c_str()) != 0) {
        throw ValidationError("invalid object id: " + hex, "commit");
    }
    return oid;
}

/// RAII wrapper for git_tree*.
struct TreeGuard {
    git_tree* t = nullptr;
    ~TreeGuard() { if (t) git_tree_free(t); }
};

/// RAII wrapper for git_commit*.
struct CommitGuard {
    git_commit* c = nullptr;
    ~CommitGuard() { if (c) git_commit_free(c); }
};

/// RAII wrapper for git_index*.
struct IndexGuard {
    git_index* i = nullptr;
    ~IndexGuard() { if (i) git_index_free(i); }
};

/// RAII wrapper for git_diff*.
struct DiffGuard {
    git_diff* d = nullptr;
    ~DiffGuard() { if (d) git_diff_free(d); }
};

void lookup_tree(git_repository* repo, const std::string& hex, TreeGuard& out,
                 const char* ctx) {
    git_oid oid = hex_to_oid(hex);
    if (git_tree_lookup(&out.t, repo, &oid) != 0) tree::throw_git(ctx);
}

} // anonymous namespace

namespace tree {

[[noreturn]] void throw_git(const std::string& operation) {
    const git_error* err = git_error_last();
    std::string msg = err && err->message ? err->message : "unknown error";
    throw GitError(operation, msg);
}

CommitInfo read_commit(git_repository* repo, const std::string& commit_hex) {
    git_oid commit_oid = hex_to_oid(commit_hex);
    CommitGuard cg;
    if (git_commit_lookup(&cg.c, repo, &commit_oid) != 0) {
        throw_git("read_commit");
    }

    CommitInfo info;
    info.hash = oid_to_hex(git_commit_id(cg.c));
    info.tree = oid_to_hex(git_commit_tree_id(cg.c));
    for (unsigned i = 0; i < git_commit_parentcount(cg.c); ++i) {
        info.parents.push_back(oid_to_hex(git_commit_parent_id(cg.c, i)));
    }

    const char* msg = git_commit_message(cg.c);
    info.message = msg ? msg : "";
    // Strip trailing newline
    while (!info.message.empty() && info.message.back() == '\n') {
        info.message.pop_back();
    }

    const git_signature* author = git_commit_author(cg.c);
    if (author) {
        info.author_name   = author->name  ? author->name  : "";
        info.author_email  = author->email ? author->email : "";
        info.author_time   = static_cast<int64_t>(author->when.time);
        info.author_offset = author->when.offset;
    }
    info.committer_time = static_cast<int64_t>(git_commit_time(cg.c));
    return info;
}

std::string write_commit(git_repository* repo,
                         const std::string& tree_hex,
                         const std::vector<std::string>& parent_hexes,
                         const git_signature* author,
                         const git_signature* committer,
                         const std::string& message) {
    TreeGuard tg;
    lookup_tree(repo, tree_hex, tg, "write_commit");

    std::vector<CommitGuard> guards(parent_hexes.size());
    std::vector<const git_commit*> parents_vec;
    for (size_t i = 0; i < parent_hexes.size(); ++i) {
        git_oid parent_oid = hex_to_oid(parent_hexes[i]);
        if (git_commit_lookup(&guards[i].c, repo, &parent_oid) != 0) {
            throw_git("write_commit");
        }
        parents_vec.push_back(guards[i].c);
    }

    git_oid new_commit_oid;
    int rc = git_commit_create(
        &new_commit_oid,
        repo,
        nullptr, // refs are moved by the caller
        author,
        committer,
        "UTF-8",
        message.c_str(),
        tg.t,
        parents_vec.size(),
        parents_vec.empty() ? nullptr : parents_vec.data()
    );
    if (rc != 0) throw_git("write_commit");

    return oid_to_hex(&new_commit_oid);
}

std::vector<std::string> diff_paths(git_repository* repo,
                                    const std::string& tree_a_hex,
                                    const std::string& tree_b_hex) {
    if (tree_a_hex == tree_b_hex) return {};

    TreeGuard a, b;
    lookup_tree(repo, tree_a_hex, a, "diff_trees");
    lookup_tree(repo, tree_b_hex, b, "diff_trees");

    DiffGuard dg;
    if (git_diff_tree_to_tree(&dg.d, repo, a.t, b.t, nullptr) != 0) {
        throw_git("diff_trees");
    }

    std::set<std::string> paths;
    size_t n = git_diff_num_deltas(dg.d);
    for (size_t i = 0; i < n; ++i) {
        const git_diff_delta* delta = git_diff_get_delta(dg.d, i);
        if (delta->new_file.path) paths.insert(delta->new_file.path);
        else if (delta->old_file.path) paths.insert(delta->old_file.path);
    }
    return {paths.begin(), paths.end()};
}

MergeResult merge_trees(git_repository* repo,
                        const std::string& ancestor_hex,
                        const std::string& ours_hex,
                        const std::string& theirs_hex,
                        std::optional<ConflictStrategy> favor) {
    TreeGuard base, ours, theirs;
    lookup_tree(repo, ancestor_hex, base, "merge_trees");
    lookup_tree(repo, ours_hex, ours, "merge_trees");
    lookup_tree(repo, theirs_hex, theirs, "merge_trees");

    git_merge_options opts = GIT_MERGE_OPTIONS_INIT;
    if (favor) {
        opts.file_favor = *favor == ConflictStrategy::Ours
            ? GIT_MERGE_FILE_FAVOR_OURS
            : GIT_MERGE_FILE_FAVOR_THEIRS;
    }

    IndexGuard ig;
    if (git_merge_trees(&ig.i, repo, base.t, ours.t, theirs.t, &opts) != 0) {
        throw_git("merge_trees");
    }

    MergeResult result;
    if (git_index_has_conflicts(ig.i)) {
        git_index_conflict_iterator* it = nullptr;
        if (git_index_conflict_iterator_new(&it, ig.i) != 0) {
            throw_git("merge_trees");
        }
        std::set<std::string> paths;
        const git_index_entry* anc = nullptr;
        const git_index_entry* our = nullptr;
        const git_index_entry* their = nullptr;
        while (git_index_conflict_next(&anc, &our, &their, it) == 0) {
            const git_index_entry* any = our ? our : (their ? their : anc);
            if (any && any->path) paths.insert(any->path);
        }
        git_index_conflict_iterator_free(it);
        result.conflicts.assign(paths.begin(), paths.end());
        return result;
    }

    git_oid tree_oid;
    if (git_index_write_tree_to(&tree_oid, ig.i, repo) != 0) {
        throw_git("merge_trees");
    }
    result.tree_hex = oid_to_hex(&tree_oid);
    return result;
}

} // namespace tree
} // namespace histofy
