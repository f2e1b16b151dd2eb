#include "internal/util/file.hpp"

#include <cerrno>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

namespace assetdiff::util {

namespace {

std::system_error Errno(const std::string& what, const std::filesystem::path& path) {
  return std::system_error(errno, std::generic_category(), what + " " + path.string());
}

} // namespace

void UniqueFd::Reset() {
  if (fd_ >= 0) ::close(fd_);
  fd_ = -1;
}

void WriteAll(int fd, std::string_view data, const std::filesystem::path& what) {
  const char* cursor    = data.data();
  std::size_t remaining = data.size();
  while (remaining > 0) {
    const ssize_t n = ::write(fd, cursor, remaining);
    if (n < 0) {
      if (errno == EINTR) continue;
      throw Errno("write", what);
    }
    cursor += n;
    remaining -= static_cast<std::size_t>(n);
  }
}

void FsyncDirectory(const std::filesystem::path& dir) {
  UniqueFd fd(::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
  if (fd.Get() < 0) throw Errno("open", dir);
  if (::fsync(fd.Get()) != 0) throw Errno("fsync", dir);
}

void WriteFileAtomic(const std::filesystem::path& path, std::string_view data, bool fsync) {
  const std::filesystem::path tmp = path.string() + ".tmp";
  {
    UniqueFd fd(::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
    if (fd.Get() < 0) throw Errno("open", tmp);

    WriteAll(fd.Get(), data, tmp);
    if (fsync && ::fsync(fd.Get()) != 0) throw Errno("fsync", tmp);
  }

  std::filesystem::rename(tmp, path);
  if (fsync) {
    FsyncDirectory(path.has_parent_path() ? path.parent_path() : std::filesystem::path("."));
  }
}

std::string ReadFile(const std::filesystem::path& path) {
  UniqueFd fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
  if (fd.Get() < 0) throw Errno("open", path);

  std::string out;
  char        buffer[65536];
  for (;;) {
    const ssize_t n = ::read(fd.Get(), buffer, sizeof(buffer));
    if (n < 0) {
      if (errno == EINTR) continue;
      throw Errno("read", path);
    }
    if (n == 0) break;
    out.append(buffer, static_cast<std::size_t>(n));
  }
  return out;
}

} // namespace assetdiff::util
