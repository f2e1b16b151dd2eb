#pragma once

#include <git2.h>

#include <memory>
#include <string>

namespace assetdiff::git {

/*
  Owning wrappers for libgit2 objects.

  libgit2 hands out raw pointers paired with a type-specific free function; the
  deleter template binds the two so every handle is released on all paths.
*/

template <typename T, void (*FreeFn)(T*)>
struct GitDeleter {
  void operator()(T* ptr) const noexcept {
    if (ptr) FreeFn(ptr);
  }
};

template <typename T, void (*FreeFn)(T*)>
using GitHandle = std::unique_ptr<T, GitDeleter<T, FreeFn>>;

using RepositoryHandle     = GitHandle<git_repository, git_repository_free>;
using ReferenceHandle      = GitHandle<git_reference, git_reference_free>;
using CommitHandle         = GitHandle<git_commit, git_commit_free>;
using ObjectHandle         = GitHandle<git_object, git_object_free>;
using RemoteHandle         = GitHandle<git_remote, git_remote_free>;
using WorktreeHandle       = GitHandle<git_worktree, git_worktree_free>;
using BranchIteratorHandle = GitHandle<git_branch_iterator, git_branch_iterator_free>;
using IndexHandle          = GitHandle<git_index, git_index_free>;
using TreeHandle           = GitHandle<git_tree, git_tree_free>;
using SignatureHandle      = GitHandle<git_signature, git_signature_free>;

// Keeps the library initialized for as long as any owner is alive.
class GitLibrary {
 public:
  GitLibrary();
  ~GitLibrary();

  GitLibrary(const GitLibrary&)            = delete;
  GitLibrary& operator=(const GitLibrary&) = delete;
};

// `context` followed by libgit2's last error message, if any.
std::string GitErrorMessage(const std::string& context);

// Throws util::GitError carrying libgit2's last error message.
[[noreturn]] void ThrowGit(const std::string& context);

inline void CheckGit(int rc, const std::string& context) {
  if (rc < 0) ThrowGit(context);
}

std::string OidToString(const git_oid& oid);

} // namespace assetdiff::git
