#include "internal/git/git_handle.hpp"

#include "internal/util/errors.hpp"

namespace assetdiff::git {

GitLibrary::GitLibrary() {
  if (git_libgit2_init() < 0) {
    ThrowGit("git_libgit2_init");
  }
}

GitLibrary::~GitLibrary() {
  git_libgit2_shutdown();
}

std::string GitErrorMessage(const std::string& context) {
  const git_error* error = git_error_last();
  std::string      msg   = context;
  if (error && error->message) {
    msg += ": ";
    msg += error->message;
  }
  return msg;
}

void ThrowGit(const std::string& context) {
  throw util::GitError(GitErrorMessage(context));
}

std::string OidToString(const git_oid& oid) {
  char buf[GIT_OID_HEXSZ + 1];
  git_oid_tostr(buf, sizeof(buf), &oid);
  return std::string(buf);
}

} // namespace assetdiff::git
