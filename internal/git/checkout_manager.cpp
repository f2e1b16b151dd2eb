#include "internal/git/checkout_manager.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace assetdiff::git {

namespace {

using observability::StringField;

constexpr const char* kRemote      = "origin";
constexpr const char* kReflogEntry = "assetdiff: update job branch";

void ForceCheckout(git_repository* repo, const std::string& what) {
  git_checkout_options opts = GIT_CHECKOUT_OPTIONS_INIT;
  opts.checkout_strategy    = GIT_CHECKOUT_FORCE | GIT_CHECKOUT_REMOVE_UNTRACKED | GIT_CHECKOUT_REMOVE_IGNORED;
  CheckGit(git_checkout_head(repo, &opts), "git_checkout_head " + what);
}

// only a full object id names a commit; refs and revision expressions do not
bool IsFullSha(const std::string& value) {
  if (value.size() != GIT_OID_HEXSZ) return false;
  return std::all_of(value.begin(), value.end(), [](char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; });
}

bool StartsWith(const std::string& value, const std::string& prefix) {
  return value.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

CheckoutManager::CheckoutManager(std::filesystem::path clone_path, const assetdiff::runtime::config::RepositoryConfig& config)
    : clone_path_(std::move(clone_path)), branch_prefix_(config.branch_prefix()) {
  if (branch_prefix_.empty()) {
    throw util::InvalidArgument("repositories.branch_prefix must not be empty");
  }
}

bool CheckoutManager::HasClone() const {
  return std::filesystem::exists(clone_path_ / ".git");
}

void CheckoutManager::Open() {
  git_repository* raw = nullptr;
  CheckGit(git_repository_open(&raw, clone_path_.c_str()), "git_repository_open " + clone_path_.string());
  repo_.reset(raw);
}

void CheckoutManager::EnsureClone(const std::string& remote_url) {
  if (repo_) return;
  if (HasClone()) {
    Open();
    return;
  }

  std::filesystem::create_directories(clone_path_.parent_path());

  git_clone_options opts              = GIT_CLONE_OPTIONS_INIT;
  opts.checkout_opts.checkout_strategy = GIT_CHECKOUT_SAFE;

  git_repository* raw = nullptr;
  CheckGit(git_clone(&raw, remote_url.c_str(), clone_path_.c_str(), &opts), "git_clone " + remote_url);
  repo_.reset(raw);

  ASSETDIFF_LOG_INFO("cloned repository", {StringField("url", remote_url), StringField("path", clone_path_.string())});
}

git_repository* CheckoutManager::Repo() const {
  if (!repo_) {
    throw util::GitError("repository not opened: " + clone_path_.string());
  }
  return repo_.get();
}

std::filesystem::path CheckoutManager::Workdir() const {
  return clone_path_;
}

std::filesystem::path CheckoutManager::WorktreeRoot() const {
  return std::filesystem::path(clone_path_.string() + ".worktrees");
}

std::string CheckoutManager::ExpandFetchRef(const std::string& ref) {
  if (StartsWith(ref, "refs/")) return ref;
  if (StartsWith(ref, "pull/")) return "refs/" + ref;
  return "refs/heads/" + ref;
}

std::string CheckoutManager::JobBranchName(const std::string& base_sha, const std::string& head_sha) const {
  return branch_prefix_ + "-pull-" + base_sha + "-" + head_sha;
}

std::string CheckoutManager::WorktreeNameFor(const RevisionPair& pair) const {
  return branch_prefix_ + "-wt-" + pair.base.sha.substr(0, 12) + "-" + pair.head.sha.substr(0, 12);
}

// ------------------------------------------------------------
// Fetch / branch plumbing
// ------------------------------------------------------------

git_oid CheckoutManager::Fetch(const std::string& refspec) {
  git_remote* remote_raw = nullptr;
  CheckGit(git_remote_lookup(&remote_raw, Repo(), kRemote), "git_remote_lookup");
  RemoteHandle remote(remote_raw);

  git_fetch_options opts = GIT_FETCH_OPTIONS_INIT;
  opts.prune             = GIT_FETCH_PRUNE;

  std::string  spec    = refspec;
  char*        specs[] = {spec.data()};
  git_strarray refspecs{specs, 1};

  CheckGit(git_remote_fetch(remote.get(), &refspecs, &opts, "fetch"), "git_remote_fetch " + refspec);

  struct FetchHead {
    git_oid oid{};
    bool    found = false;
    bool    merge = false;
  } head;

  auto on_entry = [](const char*, const char*, const git_oid* oid, unsigned int is_merge, void* payload) -> int {
    auto* fh = static_cast<FetchHead*>(payload);
    if (!fh->found || (is_merge && !fh->merge)) {
      git_oid_cpy(&fh->oid, oid);
      fh->found = true;
      fh->merge = is_merge != 0;
    }
    return 0;
  };

  CheckGit(git_repository_fetchhead_foreach(Repo(), on_entry, &head), "reading FETCH_HEAD");
  if (!head.found) {
    throw util::GitError("fetch of " + refspec + " produced no FETCH_HEAD entry");
  }
  return head.oid;
}

git_oid CheckoutManager::ResolveOrFallback(const std::string& sha, const git_oid& fallback, const std::string& what) {
  git_oid oid;
  if (IsFullSha(sha) && git_oid_fromstr(&oid, sha.c_str()) == 0) {
    git_commit* raw = nullptr;
    if (git_commit_lookup(&raw, Repo(), &oid) == 0) {
      CommitHandle commit(raw);
      return oid;
    }
  }

  ASSETDIFF_LOG_WARN("commit not found, using fetched tip",
                     {StringField("side", what), StringField("sha", sha), StringField("tip", OidToString(fallback))});
  return fallback;
}

void CheckoutManager::PointBranchAt(const std::string& branch, const git_oid& target) {
  git_reference* existing_raw = nullptr;
  const int      rc           = git_branch_lookup(&existing_raw, Repo(), branch.c_str(), GIT_BRANCH_LOCAL);

  if (rc == 0) {
    // set_target also works for the branch HEAD points at, where a forced create would not
    ReferenceHandle existing(existing_raw);
    git_reference*  updated = nullptr;
    CheckGit(git_reference_set_target(&updated, existing.get(), &target, kReflogEntry), "git_reference_set_target " + branch);
    ReferenceHandle keep(updated);
    return;
  }
  if (rc != GIT_ENOTFOUND) ThrowGit("git_branch_lookup " + branch);

  git_commit* commit_raw = nullptr;
  CheckGit(git_commit_lookup(&commit_raw, Repo(), &target), "git_commit_lookup " + OidToString(target));
  CommitHandle commit(commit_raw);

  git_reference* created = nullptr;
  CheckGit(git_branch_create(&created, Repo(), branch.c_str(), commit.get(), 0), "git_branch_create " + branch);
  ReferenceHandle keep(created);
}

void CheckoutManager::CheckoutInClone(const std::string& reference) {
  CheckGit(git_repository_set_head(Repo(), reference.c_str()), "git_repository_set_head " + reference);
  ForceCheckout(Repo(), reference);
}

// ------------------------------------------------------------
// Revision pair
// ------------------------------------------------------------

RevisionPair CheckoutManager::OpenRevisionPair(const std::string& base_sha,
                                               const std::string& head_sha,
                                               const std::string& base_branch,
                                               const std::string& head_fetch_ref) {
  if (base_branch.empty() || head_fetch_ref.empty()) {
    throw util::InvalidArgument("revision pair requires base and head refs");
  }

  const std::string base_reference = "refs/heads/" + base_branch;
  const git_oid     base_tip       = Fetch(base_reference);
  PointBranchAt(base_branch, base_tip);
  CheckGit(git_repository_set_head(Repo(), base_reference.c_str()), "git_repository_set_head " + base_reference);

  const git_oid base_commit = ResolveOrFallback(base_sha, base_tip, "base");
  PointBranchAt(base_branch, base_commit);

  const git_oid     head_tip    = Fetch(ExpandFetchRef(head_fetch_ref));
  const git_oid     head_commit = ResolveOrFallback(head_sha, head_tip, "head");
  const std::string head_branch = JobBranchName(base_sha, head_sha);
  PointBranchAt(head_branch, head_commit);

  CheckoutInClone(base_reference);

  RevisionPair pair;
  pair.base = {base_branch, base_reference, OidToString(base_commit)};
  pair.head = {head_branch, "refs/heads/" + head_branch, OidToString(head_commit)};

  ASSETDIFF_LOG_DEBUG("opened revision pair",
                      {StringField("base", pair.base.sha), StringField("head", pair.head.sha), StringField("branch", head_branch)});
  return pair;
}

// ------------------------------------------------------------
// Worktrees
// ------------------------------------------------------------

std::filesystem::path CheckoutManager::PrepareWorktree(const std::string& reference, const std::string& name) {
  git_worktree* found = nullptr;
  const int     rc    = git_worktree_lookup(&found, Repo(), name.c_str());

  if (rc == 0) {
    WorktreeHandle worktree(found);
    if (git_worktree_validate(worktree.get()) == 0) {
      git_repository* wt_raw = nullptr;
      CheckGit(git_repository_open_from_worktree(&wt_raw, worktree.get()), "git_repository_open_from_worktree " + name);
      RepositoryHandle wt_repo(wt_raw);

      CheckGit(git_repository_set_head(wt_repo.get(), reference.c_str()), "git_repository_set_head " + reference);
      ForceCheckout(wt_repo.get(), "worktree " + name);
      return std::filesystem::path(git_worktree_path(worktree.get()));
    }

    ASSETDIFF_LOG_WARN("worktree is stale, recreating", {StringField("worktree", name)});
    worktree.reset();
    PruneWorktree(name, false);
  } else if (rc != GIT_ENOTFOUND) {
    ThrowGit("git_worktree_lookup " + name);
  }

  const std::filesystem::path path = WorktreeRoot() / name;
  std::filesystem::create_directories(path.parent_path());

  std::error_code ec;
  std::filesystem::remove_all(path, ec);
  if (ec) {
    throw util::GitError("cannot clear worktree directory " + path.string() + ": " + ec.message());
  }

  git_reference* ref_raw = nullptr;
  CheckGit(git_reference_lookup(&ref_raw, Repo(), reference.c_str()), "git_reference_lookup " + reference);
  ReferenceHandle ref(ref_raw);

  git_worktree_add_options opts = GIT_WORKTREE_ADD_OPTIONS_INIT;
  opts.ref                      = ref.get();

  git_worktree* created = nullptr;
  if (git_worktree_add(&created, Repo(), name.c_str(), path.c_str(), &opts) < 0) {
    const std::string msg = GitErrorMessage("git_worktree_add " + name);
    try {
      PruneWorktree(name, true);
    } catch (const util::GitError& e) {
      ASSETDIFF_LOG_WARN("failed to prune half-created worktree", {StringField("worktree", name), StringField("error", e.what())});
    }
    if (std::filesystem::remove_all(path, ec); ec) {
      ASSETDIFF_LOG_WARN("failed to remove worktree directory", {StringField("path", path.string()), StringField("error", ec.message())});
    }
    throw util::GitError(msg);
  }
  WorktreeHandle keep(created);

  ASSETDIFF_LOG_DEBUG("created worktree", {StringField("worktree", name), StringField("ref", reference)});
  return path;
}

void CheckoutManager::PruneWorktree(const std::string& name, bool valid_too) {
  git_worktree* raw = nullptr;
  const int     rc  = git_worktree_lookup(&raw, Repo(), name.c_str());
  if (rc == GIT_ENOTFOUND) return;
  CheckGit(rc, "git_worktree_lookup " + name);
  WorktreeHandle worktree(raw);

  git_worktree_prune_options opts = GIT_WORKTREE_PRUNE_OPTIONS_INIT;
  opts.flags                      = GIT_WORKTREE_PRUNE_WORKING_TREE;
  if (valid_too) opts.flags |= GIT_WORKTREE_PRUNE_VALID;

  CheckGit(git_worktree_prune(worktree.get(), &opts), "git_worktree_prune " + name);
}

// ------------------------------------------------------------
// Cleanup
// ------------------------------------------------------------

std::vector<std::string> CheckoutManager::JobWorktrees() const {
  git_strarray names{};
  CheckGit(git_worktree_list(&names, Repo()), "git_worktree_list");

  const std::string        prefix = branch_prefix_ + "-wt-";
  std::vector<std::string> out;
  for (size_t i = 0; i < names.count; ++i) {
    std::string name = names.strings[i];
    if (StartsWith(name, prefix)) out.push_back(std::move(name));
  }
  git_strarray_dispose(&names);
  return out;
}

std::vector<std::string> CheckoutManager::JobBranches() const {
  git_branch_iterator* it_raw = nullptr;
  CheckGit(git_branch_iterator_new(&it_raw, Repo(), GIT_BRANCH_LOCAL), "git_branch_iterator_new");
  BranchIteratorHandle it(it_raw);

  const std::string        marker = branch_prefix_ + "-pull-";
  std::vector<std::string> out;

  git_reference* ref_raw = nullptr;
  git_branch_t   type;
  int            rc = 0;
  while ((rc = git_branch_next(&ref_raw, &type, it.get())) == 0) {
    ReferenceHandle ref(ref_raw);
    const char*     name = nullptr;
    CheckGit(git_branch_name(&name, ref.get()), "git_branch_name");
    if (std::string(name).find(marker) != std::string::npos) out.emplace_back(name);
  }
  if (rc != GIT_ITEROVER) ThrowGit("git_branch_next");
  return out;
}

std::string CheckoutManager::HeadReference() const {
  git_reference* raw = nullptr;
  CheckGit(git_repository_head(&raw, Repo()), "git_repository_head");
  ReferenceHandle head(raw);
  return git_reference_name(head.get());
}

void CheckoutManager::PruneJobState() {
  // worktrees first: a branch checked out in a worktree cannot be deleted
  for (const auto& name : JobWorktrees()) {
    PruneWorktree(name, true);
  }

  for (const auto& branch : JobBranches()) {
    git_reference* raw = nullptr;
    CheckGit(git_branch_lookup(&raw, Repo(), branch.c_str(), GIT_BRANCH_LOCAL), "git_branch_lookup " + branch);
    ReferenceHandle ref(raw);
    CheckGit(git_branch_delete(ref.get()), "git_branch_delete " + branch);
  }
}

void CheckoutManager::CleanUpReferences(const std::string& base_branch) {
  CheckoutInClone("refs/heads/" + base_branch);
  PruneJobState();
}

} // namespace assetdiff::git
