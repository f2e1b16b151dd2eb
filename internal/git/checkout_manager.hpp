#pragma once

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "internal/git/git_handle.hpp"

namespace assetdiff::runtime::config {
class RepositoryConfig;
}

namespace assetdiff::git {

struct RevisionRef {
  std::string branch;    // short name, e.g. "main"
  std::string reference; // full name, e.g. "refs/heads/main"
  std::string sha;       // resolved commit
};

struct RevisionPair {
  RevisionRef base;
  RevisionRef head;
};

/*
  Owns one physical clone and the transient branches/worktrees jobs create in it.

  Not thread-safe. Exactly one caller may mutate a clone at a time; the queue's
  single consumer guarantees this for the daemon.

  Layout:
      <clone>                          base view (the clone's own HEAD)
      <clone>.worktrees/<name>         head views, one per sha pair
*/
class CheckoutManager {
 public:
  CheckoutManager(std::filesystem::path clone_path, const assetdiff::runtime::config::RepositoryConfig& config);

  bool HasClone() const;

  // Clones on first use, otherwise opens the existing clone.
  void EnsureClone(const std::string& remote_url);

  // Opens an existing clone; throws GitError if there is none.
  void Open();

  /*
    Fetches both revisions and points local branches at them.

    `head_fetch_ref` accepts a short branch name, "pull/<n>/head" or a full
    "refs/..." name. Unresolvable shas fall back to the fetched tip. Returns with
    the clone checked out on the base branch and a forcefully cleaned tree.
  */
  RevisionPair OpenRevisionPair(const std::string& base_sha,
                                const std::string& head_sha,
                                const std::string& base_branch,
                                const std::string& head_fetch_ref);

  std::string WorktreeNameFor(const RevisionPair& pair) const;
  std::string JobBranchName(const std::string& base_sha, const std::string& head_sha) const;

  template <typename Fn>
  auto WithCheckout(const std::string& reference, Fn&& body) {
    CheckoutInClone(reference);
    return std::forward<Fn>(body)(Workdir());
  }

  template <typename Fn>
  auto WithCheckoutWorktree(const std::string& reference, const std::string& worktree_name, Fn&& body) {
    const std::filesystem::path path = PrepareWorktree(reference, worktree_name);
    return std::forward<Fn>(body)(path);
  }

  // Resets HEAD to `base_branch`, then prunes job worktrees and branches.
  void CleanUpReferences(const std::string& base_branch);

  // Prunes job worktrees and branches without moving HEAD.
  void PruneJobState();

  std::vector<std::string> JobBranches() const;
  std::vector<std::string> JobWorktrees() const;
  std::string              HeadReference() const;

  const std::filesystem::path& ClonePath() const {
    return clone_path_;
  }

  std::filesystem::path Workdir() const;
  std::filesystem::path WorktreeRoot() const;

  static std::string ExpandFetchRef(const std::string& ref);

 private:
  git_repository* Repo() const;

  git_oid Fetch(const std::string& refspec);
  git_oid ResolveOrFallback(const std::string& sha, const git_oid& fallback, const std::string& what);
  void    PointBranchAt(const std::string& branch, const git_oid& target);
  void    CheckoutInClone(const std::string& reference);

  std::filesystem::path PrepareWorktree(const std::string& reference, const std::string& name);
  void                  PruneWorktree(const std::string& name, bool valid_too);

  GitLibrary            library_;
  std::filesystem::path clone_path_;
  std::string           branch_prefix_;
  RepositoryHandle      repo_;
};

} // namespace assetdiff::git
