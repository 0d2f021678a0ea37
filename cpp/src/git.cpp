#include "histofy/git.h"
#include "internal.h"

#include <git2.h>

#include <algorithm>
#include <string>
#include <vector>

namespace histofy {

// ---------------------------------------------------------------------------
// libgit2 lifecycle: initialise once per process
// ---------------------------------------------------------------------------

namespace {
struct LibGit2Init {
    LibGit2Init()  { git_libgit2_init(); }
    ~LibGit2Init() { git_libgit2_shutdown(); }
};
static LibGit2Init s_libgit2;

std::string oid_hex(const git_oid* o) {
    char buf[GIT_OID_HEXSZ + 1];
    git_oid_tostr(buf, sizeof(buf), o);
    return std::string(buf, GIT_OID_HEXSZ);
}

struct ObjectGuard {
    git_object* o = nullptr;
    ~ObjectGuard() { if (o) git_object_free(o); }
};

struct RefGuard {
    git_reference* r = nullptr;
    ~RefGuard() { if (r) git_reference_free(r); }
};

struct IndexGuard {
    git_index* i = nullptr;
    ~IndexGuard() { if (i) git_index_free(i); }
};

struct SigGuard {
    git_signature* s = nullptr;
    ~SigGuard() { if (s) git_signature_free(s); }
};

std::filesystem::path strip_slash(const char* p) {
    std::string s = p ? p : "";
    while (s.size() > 1 && s.back() == '/') s.pop_back();
    return s;
}

/// Peel @p rev to a commit object.
/// @throws ValidationError if it does not name a commit.
void peel_commit(git_repository* repo, const std::string& rev, ObjectGuard& out) {
    ObjectGuard any;
    if (git_revparse_single(&any.o, repo, rev.c_str()) != 0 ||
        git_object_peel(&out.o, any.o, GIT_OBJECT_COMMIT) != 0) {
        throw ValidationError("cannot resolve revision '" + rev + "'",
                              "commit_range",
                              "check the hash or ref name");
    }
}

Signature default_signature(git_repository* repo) {
    SigGuard sg;
    if (git_signature_default(&sg.s, repo) == 0) {
        return {sg.s->name ? sg.s->name : "", sg.s->email ? sg.s->email : ""};
    }
    return {"histofy", "histofy@localhost"};
}

/// Symbolic target of HEAD ("refs/heads/main"), or empty if detached.
std::string head_target(git_repository* repo) {
    RefGuard head;
    if (git_reference_lookup(&head.r, repo, "HEAD") != 0)
        tree::throw_git("current_branch");
    if (git_reference_type(head.r) != GIT_REFERENCE_SYMBOLIC) return {};
    const char* t = git_reference_symbolic_target(head.r);
    return t ? t : "";
}

/// Point HEAD's branch (or a detached HEAD) at @p hex, recording @p msg in
/// the reflog.
void move_head(git_repository* repo, const std::string& hex, const std::string& msg) {
    git_oid oid;
    if (git_oid_fromstr(&oid, hex.c_str()) != 0)
        throw GitError("update_ref", "invalid commit id " + hex);
    std::string target = head_target(repo);
    if (target.empty()) {
        if (git_repository_set_head_detached(repo, &oid) != 0)
            tree::throw_git("update_ref");
        return;
    }
    RefGuard out;
    if (git_reference_create(&out.r, repo, target.c_str(), &oid, 1, msg.c_str()) != 0)
        tree::throw_git("update_ref");
}
} // anonymous namespace

// ---------------------------------------------------------------------------
// LibGit2Inner
// ---------------------------------------------------------------------------

LibGit2Inner::LibGit2Inner(git_repository* r, std::filesystem::path wd,
                           std::filesystem::path gd, Signature sig)
    : repo(r), workdir(std::move(wd)), gitdir(std::move(gd)),
      signature(std::move(sig)) {}

LibGit2Inner::~LibGit2Inner() {
    if (repo) git_repository_free(repo);
}

// ---------------------------------------------------------------------------
// LibGit2Git::open / init
// ---------------------------------------------------------------------------

std::shared_ptr<LibGit2Git> LibGit2Git::open(const std::filesystem::path& path) {
    git_repository* repo = nullptr;
    if (git_repository_open_ext(&repo, path.string().c_str(), 0, nullptr) != 0) {
        throw ConfigurationError("not a git repository: " + path.string(),
                                 "repository");
    }
    if (git_repository_is_bare(repo)) {
        git_repository_free(repo);
        throw ConfigurationError("bare repositories are not supported: " +
                                     path.string(),
                                 "repository");
    }
    auto inner = std::make_shared<LibGit2Inner>(
        repo, strip_slash(git_repository_workdir(repo)),
        strip_slash(git_repository_path(repo)), default_signature(repo));
    return std::shared_ptr<LibGit2Git>(new LibGit2Git(std::move(inner)));
}

std::shared_ptr<LibGit2Git> LibGit2Git::init(const std::filesystem::path& path,
                                             const std::string& branch) {
    git_repository_init_options opts = GIT_REPOSITORY_INIT_OPTIONS_INIT;
    opts.flags |= GIT_REPOSITORY_INIT_MKPATH;
    opts.initial_head = branch.c_str();

    git_repository* repo = nullptr;
    if (git_repository_init_ext(&repo, path.string().c_str(), &opts) != 0)
        tree::throw_git("init");
    auto inner = std::make_shared<LibGit2Inner>(
        repo, strip_slash(git_repository_workdir(repo)),
        strip_slash(git_repository_path(repo)), default_signature(repo));
    return std::shared_ptr<LibGit2Git>(new LibGit2Git(std::move(inner)));
}

LibGit2Git::LibGit2Git(std::shared_ptr<LibGit2Inner> inner)
    : inner_(std::move(inner)) {}

LibGit2Git::~LibGit2Git() = default;

void LibGit2Git::set_default_signature(Signature sig) {
    inner_->signature = std::move(sig);
}

std::filesystem::path LibGit2Git::path() const { return inner_->workdir; }

std::filesystem::path LibGit2Git::git_dir() const { return inner_->gitdir; }

// ---------------------------------------------------------------------------
// Inspection
// ---------------------------------------------------------------------------

RepoStatus LibGit2Git::status() {
    RepoStatus st;
    st.branch = current_branch();
    git_oid head_oid;
    if (git_reference_name_to_id(&head_oid, inner_->repo, "HEAD") == 0)
        st.head = oid_hex(&head_oid);

    git_status_options opts = GIT_STATUS_OPTIONS_INIT;
    opts.show  = GIT_STATUS_SHOW_INDEX_AND_WORKDIR;
    opts.flags = GIT_STATUS_OPT_INCLUDE_UNTRACKED |
                 GIT_STATUS_OPT_RECURSE_UNTRACKED_DIRS |
                 GIT_STATUS_OPT_RENAMES_HEAD_TO_INDEX;

    git_status_list* list = nullptr;
    if (git_status_list_new(&list, inner_->repo, &opts) != 0)
        tree::throw_git("status");

    const size_t n = git_status_list_entrycount(list);
    for (size_t i = 0; i < n; ++i) {
        const git_status_entry* e = git_status_byindex(list, i);
        const git_diff_delta* d = e->head_to_index ? e->head_to_index
                                                   : e->index_to_workdir;
        std::string p;
        if (d) p = d->new_file.path ? d->new_file.path
                                    : (d->old_file.path ? d->old_file.path : "");

        const unsigned s = e->status;
        if (s & GIT_STATUS_CONFLICTED) {
            st.conflicted.push_back(p);
            continue;
        }
        if (s & (GIT_STATUS_INDEX_NEW | GIT_STATUS_INDEX_MODIFIED |
                 GIT_STATUS_INDEX_DELETED | GIT_STATUS_INDEX_RENAMED |
                 GIT_STATUS_INDEX_TYPECHANGE))
            st.staged.push_back(p);
        if (s & GIT_STATUS_WT_NEW)
            st.untracked.push_back(p);
        else if (s & (GIT_STATUS_WT_MODIFIED | GIT_STATUS_WT_DELETED |
                      GIT_STATUS_WT_TYPECHANGE | GIT_STATUS_WT_RENAMED))
            st.modified.push_back(p);
    }
    git_status_list_free(list);
    return st;
}

std::string LibGit2Git::head_commit() {
    git_oid oid;
    if (git_reference_name_to_id(&oid, inner_->repo, "HEAD") != 0)
        throw GitError("head_commit", "HEAD does not point at a commit");
    return oid_hex(&oid);
}

std::optional<std::string> LibGit2Git::current_branch() {
    std::string target = head_target(inner_->repo);
    const std::string prefix = "refs/heads/";
    if (target.compare(0, prefix.size(), prefix) != 0) return std::nullopt;
    return target.substr(prefix.size());
}

std::string LibGit2Git::resolve(const std::string& rev) {
    ObjectGuard commit;
    peel_commit(inner_->repo, rev, commit);
    return oid_hex(git_object_id(commit.o));
}

std::vector<CommitInfo> LibGit2Git::log(const std::string& range) {
    auto dots = range.find("..");
    if (dots == std::string::npos) {
        return {read_commit(resolve(range))};
    }
    std::string from = range.substr(0, dots);
    std::string to   = range.substr(dots + 2);
    if (to.empty()) to = "HEAD";

    const std::string to_hex = resolve(to);
    git_oid to_oid;
    git_oid_fromstr(&to_oid, to_hex.c_str());

    git_revwalk* walk = nullptr;
    if (git_revwalk_new(&walk, inner_->repo) != 0) tree::throw_git("log");
    struct WalkGuard {
        git_revwalk* w;
        ~WalkGuard() { git_revwalk_free(w); }
    } wg{walk};

    git_revwalk_sorting(walk, GIT_SORT_TOPOLOGICAL | GIT_SORT_REVERSE);
    git_revwalk_simplify_first_parent(walk);
    if (git_revwalk_push(walk, &to_oid) != 0) tree::throw_git("log");
    if (!from.empty()) {
        const std::string from_hex = resolve(from);
        git_oid from_oid;
        git_oid_fromstr(&from_oid, from_hex.c_str());
        if (git_revwalk_hide(walk, &from_oid) != 0) tree::throw_git("log");
    }

    std::vector<CommitInfo> out;
    git_oid oid;
    while (git_revwalk_next(&oid, walk) == 0) {
        out.push_back(tree::read_commit(inner_->repo, oid_hex(&oid)));
    }
    return out;
}

CommitInfo LibGit2Git::read_commit(const std::string& hash) {
    return tree::read_commit(inner_->repo, resolve(hash));
}

// ---------------------------------------------------------------------------
// Mutation
// ---------------------------------------------------------------------------

void LibGit2Git::add_all() {
    IndexGuard ig;
    if (git_repository_index(&ig.i, inner_->repo) != 0) tree::throw_git("add_all");
    if (git_index_add_all(ig.i, nullptr, GIT_INDEX_ADD_DEFAULT, nullptr, nullptr) != 0)
        tree::throw_git("add_all");
    // Stage deletions of tracked files too.
    if (git_index_update_all(ig.i, nullptr, nullptr, nullptr) != 0)
        tree::throw_git("add_all");
    if (git_index_write(ig.i) != 0) tree::throw_git("add_all");
}

std::string LibGit2Git::commit_with_date(const CommitSpec& spec) {
    IndexGuard ig;
    if (git_repository_index(&ig.i, inner_->repo) != 0) tree::throw_git("commit");
    git_oid tree_oid;
    if (git_index_write_tree(&tree_oid, ig.i) != 0) tree::throw_git("commit");
    const std::string tree_hex = oid_hex(&tree_oid);

    std::vector<std::string> parents;
    git_oid head_oid;
    if (git_reference_name_to_id(&head_oid, inner_->repo, "HEAD") == 0)
        parents.push_back(oid_hex(&head_oid));

    if (!spec.allow_empty) {
        bool empty = parents.empty()
            ? git_index_entrycount(ig.i) == 0
            : tree::read_commit(inner_->repo, parents.front()).tree == tree_hex;
        if (empty) throw GitError("commit", "nothing to commit");
    }

    const Signature who = spec.author ? *spec.author : inner_->signature;
    SigGuard sig;
    if (git_signature_new(&sig.s, who.name.c_str(), who.email.c_str(),
                          static_cast<git_time_t>(spec.timestamp),
                          spec.tz_offset) != 0)
        tree::throw_git("commit");

    std::string hex = tree::write_commit(inner_->repo, tree_hex, parents,
                                         sig.s, sig.s, spec.message);
    std::string first_line = spec.message.substr(0, spec.message.find('\n'));
    move_head(inner_->repo, hex, "commit: " + first_line);
    return hex;
}

void LibGit2Git::create_branch(const std::string& name,
                               const std::string& target) {
    ObjectGuard commit;
    peel_commit(inner_->repo, target, commit);
    RefGuard out;
    if (git_branch_create(&out.r, inner_->repo, name.c_str(),
                          reinterpret_cast<git_commit*>(commit.o), 0) != 0)
        tree::throw_git("create_branch");
}

bool LibGit2Git::branch_exists(const std::string& name) {
    RefGuard ref;
    return git_branch_lookup(&ref.r, inner_->repo, name.c_str(),
                             GIT_BRANCH_LOCAL) == 0;
}

void LibGit2Git::delete_branch(const std::string& name) {
    RefGuard ref;
    if (git_branch_lookup(&ref.r, inner_->repo, name.c_str(), GIT_BRANCH_LOCAL) != 0)
        tree::throw_git("delete_branch");
    if (git_branch_delete(ref.r) != 0) tree::throw_git("delete_branch");
}

std::vector<std::string> LibGit2Git::list_branches(const std::string& prefix) {
    git_branch_iterator* it = nullptr;
    if (git_branch_iterator_new(&it, inner_->repo, GIT_BRANCH_LOCAL) != 0)
        tree::throw_git("list_branches");

    std::vector<std::string> names;
    git_reference* ref = nullptr;
    git_branch_t type;
    while (git_branch_next(&ref, &type, it) == 0) {
        const char* name = nullptr;
        if (git_branch_name(&name, ref) == 0 && name) {
            std::string n = name;
            if (n.compare(0, prefix.size(), prefix) == 0) names.push_back(n);
        }
        git_reference_free(ref);
    }
    git_branch_iterator_free(it);
    std::sort(names.begin(), names.end());
    return names;
}

std::unique_ptr<RewriteSession>
LibGit2Git::rebase_with_dates(const MigrationPlan& plan) {
    return rewrite::start(inner_, plan);
}

void LibGit2Git::reset_hard(const std::string& rev) {
    ObjectGuard commit;
    peel_commit(inner_->repo, rev, commit);
    git_checkout_options co = GIT_CHECKOUT_OPTIONS_INIT;
    co.checkout_strategy = GIT_CHECKOUT_FORCE;
    if (git_reset(inner_->repo, commit.o, GIT_RESET_HARD, &co) != 0)
        tree::throw_git("reset_hard");
}

void LibGit2Git::reset_soft(const std::string& rev) {
    ObjectGuard commit;
    peel_commit(inner_->repo, rev, commit);
    if (git_reset(inner_->repo, commit.o, GIT_RESET_SOFT, nullptr) != 0)
        tree::throw_git("reset_soft");
}

std::vector<std::string> LibGit2Git::diff_trees(const std::string& a,
                                                const std::string& b) {
    auto ca = read_commit(a);
    auto cb = read_commit(b);
    return tree::diff_paths(inner_->repo, ca.tree, cb.tree);
}

void LibGit2Git::push(const std::string& remote, const std::string& branch) {
    git_remote* rem = nullptr;
    if (git_remote_lookup(&rem, inner_->repo, remote.c_str()) != 0) {
        const git_error* e = git_error_last();
        throw NetworkError("remote '" + remote + "': " +
                               (e && e->message ? e->message : "not found"),
                           false);
    }
    struct RemoteGuard {
        git_remote* r;
        ~RemoteGuard() { git_remote_free(r); }
    } rg{rem};

    std::string refspec = "refs/heads/" + branch + ":refs/heads/" + branch;
    char* specs[] = {const_cast<char*>(refspec.c_str())};
    git_strarray arr = {specs, 1};
    git_push_options opts = GIT_PUSH_OPTIONS_INIT;
    if (git_remote_push(rem, &arr, &opts) != 0) {
        const git_error* e = git_error_last();
        throw NetworkError("push to '" + remote + "' failed: " +
                           (e && e->message ? e->message : "unknown error"));
    }
}

} // namespace histofy
