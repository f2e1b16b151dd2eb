#include "internal/assets/subprocess.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace assetdiff::assets {

namespace {

std::runtime_error SysError(const std::string& what) {
  return std::runtime_error(what + ": " + std::strerror(errno));
}

class Pipe {
 public:
  Pipe() {
    if (::pipe2(fds_, O_CLOEXEC) != 0) throw SysError("pipe");
  }
  ~Pipe() {
    CloseRead();
    CloseWrite();
  }

  Pipe(const Pipe&)            = delete;
  Pipe& operator=(const Pipe&) = delete;

  int Read() const {
    return fds_[0];
  }
  int Write() const {
    return fds_[1];
  }
  void CloseRead() {
    if (fds_[0] >= 0) ::close(fds_[0]);
    fds_[0] = -1;
  }
  void CloseWrite() {
    if (fds_[1] >= 0) ::close(fds_[1]);
    fds_[1] = -1;
  }

 private:
  int fds_[2] = {-1, -1};
};

void Drain(Pipe& out_pipe, Pipe& err_pipe, std::string& out, std::string& err) {
  pollfd fds[2] = {{out_pipe.Read(), POLLIN, 0}, {err_pipe.Read(), POLLIN, 0}};
  std::string* sinks[2] = {&out, &err};
  int open = 2;
  char buffer[65536];

  while (open > 0) {
    if (::poll(fds, 2, -1) < 0) {
      if (errno == EINTR) continue;
      throw SysError("poll");
    }
    for (int i = 0; i < 2; ++i) {
      if (fds[i].fd < 0 || fds[i].revents == 0) continue;
      const ssize_t n = ::read(fds[i].fd, buffer, sizeof(buffer));
      if (n > 0) {
        sinks[i]->append(buffer, static_cast<size_t>(n));
      } else if (n == 0 || errno != EINTR) {
        fds[i].fd = -1;
        --open;
      }
    }
  }
}

} // namespace

ProcessResult RunProcess(const std::vector<std::string>& argv, const std::filesystem::path& cwd) {
  if (argv.empty()) {
    throw std::invalid_argument("missing command");
  }

  Pipe out_pipe;
  Pipe err_pipe;

  std::vector<char*> cargs;
  cargs.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    cargs.push_back(const_cast<char*>(arg.c_str()));
  }
  cargs.push_back(nullptr);

  const pid_t pid = ::fork();
  if (pid < 0) throw SysError("fork");

  if (pid == 0) {
    if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) _exit(126);
    ::dup2(out_pipe.Write(), STDOUT_FILENO);
    ::dup2(err_pipe.Write(), STDERR_FILENO);
    ::execvp(cargs[0], cargs.data());
    _exit(127);
  }

  out_pipe.CloseWrite();
  err_pipe.CloseWrite();

  ProcessResult result;
  Drain(out_pipe, err_pipe, result.out, result.err);

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) throw SysError("waitpid");
  }

  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }
  return result;
}

} // namespace assetdiff::assets
