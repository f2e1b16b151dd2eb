#pragma once

#include <stdexcept>
#include <string>

namespace assetdiff::util {

/*
  Central error types.

  Per-asset errors (DecodeError, RenderError) are caught by the diff engines and
  reported inline. Everything else fails the job, and gets translated to gRPC
  status codes at the transport boundary.
*/

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class GitError : public std::runtime_error {
 public:
  explicit GitError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DecodeError : public std::runtime_error {
 public:
  explicit DecodeError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class RenderError : public std::runtime_error {
 public:
  explicit RenderError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvariantViolation : public std::runtime_error {
 public:
  explicit InvariantViolation(const std::string& msg) : std::runtime_error(msg) {
  }
};

class CleanupFailed : public std::runtime_error {
 public:
  explicit CleanupFailed(const std::string& msg) : std::runtime_error(msg) {
  }
};

class QueueCorrupted : public std::runtime_error {
 public:
  explicit QueueCorrupted(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace assetdiff::util
