#include "internal.h"

#include <git2.h>

#include <map>
#include <string>
#include <vector>

namespace histofy {
namespace rewrite {

namespace {

std::string oid_to_hex(const git_oid* oid) {
    char buf[GIT_OID_HEXSZ + 1];
    git_oid_tostr(buf, sizeof(buf), oid);
    return std::string(buf, GIT_OID_HEXSZ);
}

struct CommitGuard {
    git_commit* c = nullptr;
    ~CommitGuard() { if (c) git_commit_free(c); }
};

struct SigGuard {
    git_signature* s = nullptr;
    ~SigGuard() { if (s) git_signature_free(s); }
};

void lookup_commit(git_repository* repo, const std::string& hex, CommitGuard& out) {
    git_oid oid;
    if (git_oid_fromstr(&oid, hex.c_str()) != 0 ||
        git_commit_lookup(&out.c, repo, &oid) != 0)
        tree::throw_git("rebase");
}

// ---------------------------------------------------------------------------
// LibGit2RewriteSession
// ---------------------------------------------------------------------------

/// Replays the planned commits and every descendant up to HEAD as new
/// commit objects. The branch only moves in finish().
class LibGit2RewriteSession : public RewriteSession {
public:
    LibGit2RewriteSession(std::shared_ptr<LibGit2Inner> inner,
                          std::string branch_ref,
                          std::vector<std::string> steps,
                          std::string start_head,
                          std::map<std::string, CommitMigration> planned,
                          std::optional<std::string> base)
        : inner_(std::move(inner)), branch_ref_(std::move(branch_ref)),
          steps_(std::move(steps)), start_head_(std::move(start_head)),
          planned_(std::move(planned)), parent_(std::move(base)) {}

    size_t total_steps() const override { return steps_.size(); }

    RewriteStep next() override {
        ensure_open("next");
        if (conflict_)
            throw GitError("rebase", "step " + steps_[pos_] +
                                         " is in conflict and must be resolved");
        if (pos_ >= steps_.size()) return done();
        return replay(std::nullopt);
    }

    RewriteStep resolve(ConflictStrategy strategy) override {
        ensure_open("resolve");
        if (!conflict_) throw GitError("resolve", "no step is in conflict");
        return replay(strategy);
    }

    std::string finish() override {
        ensure_open("finish");
        if (conflict_ || pos_ < steps_.size())
            throw GitError("finish", "rewrite is incomplete");
        if (!parent_) throw GitError("finish", "nothing was rewritten");

        git_oid oid, expected;
        if (git_oid_fromstr(&oid, parent_->c_str()) != 0 ||
            git_oid_fromstr(&expected, start_head_.c_str()) != 0)
            tree::throw_git("finish");

        // Compare-and-swap: refuse if the branch moved since start().
        git_reference* out = nullptr;
        int rc = git_reference_create_matching(&out, inner_->repo, branch_ref_.c_str(),
                                               &oid, 1, &expected,
                                               "histofy: migrate commit dates");
        if (out) git_reference_free(out);
        if (rc == GIT_EMODIFIED) throw StaleBranchError(branch_ref_, start_head_);
        if (rc != 0) tree::throw_git("finish");

        git_object* obj = nullptr;
        if (git_object_lookup(&obj, inner_->repo, &oid, GIT_OBJECT_COMMIT) != 0)
            tree::throw_git("finish");
        git_checkout_options co = GIT_CHECKOUT_OPTIONS_INIT;
        co.checkout_strategy = GIT_CHECKOUT_FORCE;
        rc = git_reset(inner_->repo, obj, GIT_RESET_HARD, &co);
        git_object_free(obj);
        if (rc != 0) tree::throw_git("finish");

        closed_ = true;
        return *parent_;
    }

    void abort() override { closed_ = true; }

    std::vector<std::pair<std::string, std::string>> rewritten() const override {
        return rewritten_;
    }

private:
    void ensure_open(const char* op) const {
        if (closed_) throw GitError(op, "rewrite session is closed");
    }

    RewriteStep done() const {
        RewriteStep s;
        s.status = RewriteStepStatus::Done;
        s.index  = pos_;
        return s;
    }

    /// Replay steps_[pos_] onto parent_. Trees are reused verbatim when the
    /// new parent has the same content as the original one; otherwise the
    /// change is cherry-picked with a three-way merge.
    RewriteStep replay(std::optional<ConflictStrategy> favor) {
        git_repository* repo = inner_->repo;
        const std::string& orig_hex = steps_[pos_];
        CommitGuard orig;
        lookup_commit(repo, orig_hex, orig);

        RewriteStep step;
        step.original_hash = orig_hex;
        step.index         = pos_;

        std::optional<std::string> orig_parent;
        if (git_commit_parentcount(orig.c) > 0)
            orig_parent = oid_to_hex(git_commit_parent_id(orig.c, 0));
        const std::string orig_tree = oid_to_hex(git_commit_tree_id(orig.c));

        std::string new_tree = orig_tree;
        if (parent_ != orig_parent) {
            if (!parent_ || !orig_parent)
                throw GitError("rebase", "cannot replay root commit " + orig_hex);
            const std::string base_tree = tree::read_commit(repo, *orig_parent).tree;
            const std::string ours_tree = tree::read_commit(repo, *parent_).tree;
            if (base_tree != ours_tree) {
                auto merged = tree::merge_trees(repo, base_tree, ours_tree,
                                                orig_tree, favor);
                if (!merged.tree_hex) {
                    conflict_ = true;
                    step.status    = RewriteStepStatus::Conflict;
                    step.conflicts = std::move(merged.conflicts);
                    return step;
                }
                new_tree = *merged.tree_hex;
            }
        }

        std::vector<std::string> parents;
        if (parent_) parents.push_back(*parent_);
        for (unsigned i = 1; i < git_commit_parentcount(orig.c); ++i)
            parents.push_back(oid_to_hex(git_commit_parent_id(orig.c, i)));

        const char* raw = git_commit_message_raw(orig.c);
        const std::string message = raw ? raw : "";
        const git_signature* author    = git_commit_author(orig.c);
        const git_signature* committer = git_commit_committer(orig.c);

        std::string new_hex;
        auto it = planned_.find(orig_hex);
        if (it != planned_.end()) {
            const auto& m = it->second;
            SigGuard a, c;
            if (git_signature_new(&a.s, author->name, author->email,
                                  static_cast<git_time_t>(m.new_timestamp),
                                  m.tz_offset) != 0 ||
                git_signature_new(&c.s, committer->name, committer->email,
                                  static_cast<git_time_t>(m.new_timestamp),
                                  m.tz_offset) != 0)
                tree::throw_git("rebase");
            new_hex = tree::write_commit(repo, new_tree, parents, a.s, c.s, message);
            rewritten_.emplace_back(orig_hex, new_hex);
        } else {
            new_hex = tree::write_commit(repo, new_tree, parents, author,
                                         committer, message);
        }

        parent_   = new_hex;
        conflict_ = false;
        ++pos_;

        step.status   = RewriteStepStatus::Applied;
        step.new_hash = new_hex;
        return step;
    }

    std::shared_ptr<LibGit2Inner>                     inner_;
    std::string                                       branch_ref_;
    std::vector<std::string>                          steps_;
    std::string                                       start_head_;
    std::map<std::string, CommitMigration>            planned_;
    std::optional<std::string>                        parent_;
    std::vector<std::pair<std::string, std::string>>  rewritten_;
    size_t                                            pos_      = 0;
    bool                                              conflict_ = false;
    bool                                              closed_   = false;
};

} // anonymous namespace

std::unique_ptr<RewriteSession> start(std::shared_ptr<LibGit2Inner> inner,
                                      const MigrationPlan& plan) {
    git_repository* repo = inner->repo;
    if (plan.commits.empty()) throw GitError("rebase", "plan has no commits");
    if (git_repository_head_detached(repo) == 1)
        throw GitError("rebase", "HEAD is detached; check out a branch first");

    git_reference* head = nullptr;
    if (git_repository_head(&head, repo) != 0) tree::throw_git("rebase");
    const std::string branch_ref = git_reference_name(head);
    git_oid head_oid = *git_reference_target(head);
    git_reference_free(head);

    // Walk first parents from HEAD down to the oldest planned commit.
    const std::string& first = plan.commits.front().original_hash;
    std::vector<std::string> chain;
    std::string cur = oid_to_hex(&head_oid);
    while (true) {
        chain.push_back(cur);
        if (cur == first) break;
        CommitGuard cg;
        lookup_commit(repo, cur, cg);
        if (git_commit_parentcount(cg.c) == 0)
            throw GitError("rebase", "commit " + first +
                                         " is not on the current branch");
        cur = oid_to_hex(git_commit_parent_id(cg.c, 0));
    }
    std::vector<std::string> steps(chain.rbegin(), chain.rend());

    if (steps.size() < plan.commits.size())
        throw GitError("rebase", "planned range extends past HEAD");
    std::map<std::string, CommitMigration> planned;
    for (size_t i = 0; i < plan.commits.size(); ++i) {
        if (steps[i] != plan.commits[i].original_hash)
            throw GitError("rebase", "planned commits are not a contiguous "
                                     "first-parent range of HEAD");
        planned.emplace(steps[i], plan.commits[i]);
    }

    std::optional<std::string> base;
    {
        CommitGuard cg;
        lookup_commit(repo, first, cg);
        if (git_commit_parentcount(cg.c) > 0)
            base = oid_to_hex(git_commit_parent_id(cg.c, 0));
    }

    return std::make_unique<LibGit2RewriteSession>(
        std::move(inner), branch_ref, std::move(steps), oid_to_hex(&head_oid),
        std::move(planned), std::move(base));
}

} // namespace rewrite
} // namespace histofy
