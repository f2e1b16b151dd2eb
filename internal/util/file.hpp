#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace assetdiff::util {

// Owns a POSIX file descriptor.
class UniqueFd {
 public:
  UniqueFd() = default;
  explicit UniqueFd(int fd) : fd_(fd) {
  }
  ~UniqueFd() {
    Reset();
  }

  UniqueFd(const UniqueFd&)            = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;

  UniqueFd(UniqueFd&& other) noexcept : fd_(other.fd_) {
    other.fd_ = -1;
  }
  UniqueFd& operator=(UniqueFd&& other) noexcept {
    if (this != &other) {
      Reset();
      fd_       = other.fd_;
      other.fd_ = -1;
    }
    return *this;
  }

  int Get() const {
    return fd_;
  }
  bool Valid() const {
    return fd_ >= 0;
  }
  void Reset();

 private:
  int fd_ = -1;
};

// Writes all of `data`, retrying short writes; throws std::system_error.
void WriteAll(int fd, std::string_view data, const std::filesystem::path& what);

/*
  Replaces `path` with `data`:
      write tmp -> fsync -> rename -> fsync(dir)

  Throws std::system_error on failure; the previous contents stay intact.
*/
void WriteFileAtomic(const std::filesystem::path& path, std::string_view data, bool fsync = true);

// Whole file; throws std::system_error if it cannot be opened.
std::string ReadFile(const std::filesystem::path& path);

void FsyncDirectory(const std::filesystem::path& dir);

} // namespace assetdiff::util
