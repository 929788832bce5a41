/**
 * @file command_runner.cpp
 * @brief posix_spawn based command execution with captured output.
 */

#include "command_runner.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <memory>

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

extern char **environ;

namespace gpm {

namespace {

std::shared_ptr<spdlog::logger> process_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("process");
  }();
  return logger;
}

/**
 * RAII wrapper owning both ends of a pipe.
 */
class Pipe {
public:
  Pipe() {
    if (::pipe(fds_.data()) != 0) {
      throw ExternalError(std::string("pipe() failed: ") +
                          std::strerror(errno));
    }
    ::fcntl(fds_[0], F_SETFD, FD_CLOEXEC);
    ::fcntl(fds_[1], F_SETFD, FD_CLOEXEC);
  }
  ~Pipe() {
    close_read();
    close_write();
  }
  Pipe(const Pipe &) = delete;
  Pipe &operator=(const Pipe &) = delete;

  int read_end() const { return fds_[0]; }
  int write_end() const { return fds_[1]; }

  void close_read() { close_fd(fds_[0]); }
  void close_write() { close_fd(fds_[1]); }

private:
  static void close_fd(int &fd) {
    if (fd >= 0) {
      ::close(fd);
      fd = -1;
    }
  }

  std::array<int, 2> fds_{-1, -1};
};

/**
 * RAII wrapper for posix_spawn_file_actions_t.
 */
class SpawnActions {
public:
  SpawnActions() { posix_spawn_file_actions_init(&actions_); }
  ~SpawnActions() { posix_spawn_file_actions_destroy(&actions_); }
  SpawnActions(const SpawnActions &) = delete;
  SpawnActions &operator=(const SpawnActions &) = delete;

  posix_spawn_file_actions_t *get() { return &actions_; }

private:
  posix_spawn_file_actions_t actions_;
};

/**
 * Drain both pipes until the child closes them.
 */
void drain(Pipe &out_pipe, Pipe &err_pipe, CommandResult &result) {
  std::array<pollfd, 2> fds{};
  fds[0] = {out_pipe.read_end(), POLLIN, 0};
  fds[1] = {err_pipe.read_end(), POLLIN, 0};
  std::array<std::string *, 2> sinks{&result.out, &result.err};
  int open_count = 2;
  char buffer[4096];
  while (open_count > 0) {
    int rc = ::poll(fds.data(), fds.size(), -1);
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw ExternalError(std::string("poll() failed: ") +
                          std::strerror(errno));
    }
    for (std::size_t i = 0; i < fds.size(); ++i) {
      if (fds[i].fd < 0 || fds[i].revents == 0) {
        continue;
      }
      ssize_t n = ::read(fds[i].fd, buffer, sizeof(buffer));
      if (n > 0) {
        sinks[i]->append(buffer, static_cast<std::size_t>(n));
      } else if (n == 0 || errno != EINTR) {
        fds[i].fd = -1;
        --open_count;
      }
    }
  }
}

int wait_for(pid_t pid) {
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      throw ExternalError(std::string("waitpid() failed: ") +
                          std::strerror(errno));
    }
  }
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

std::string join_argv(const std::vector<std::string> &argv) {
  std::string out;
  for (const auto &arg : argv) {
    if (!out.empty()) {
      out += ' ';
    }
    out += arg;
  }
  return out;
}

} // namespace

CommandResult PosixCommandRunner::run(const std::vector<std::string> &argv) {
  if (argv.empty()) {
    throw ExternalError("Cannot run an empty command");
  }
  const std::string command_line = join_argv(argv);
  process_log()->debug("Running: {}", command_line);

  std::vector<char *> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto &s : argv) {
    cargv.push_back(const_cast<char *>(s.c_str()));
  }
  cargv.push_back(nullptr);

  Pipe out_pipe;
  Pipe err_pipe;
  SpawnActions actions;
  posix_spawn_file_actions_adddup2(actions.get(), out_pipe.write_end(),
                                   STDOUT_FILENO);
  posix_spawn_file_actions_adddup2(actions.get(), err_pipe.write_end(),
                                   STDERR_FILENO);

  pid_t pid = 0;
  int rc = posix_spawnp(&pid, cargv[0], actions.get(), nullptr, cargv.data(),
                        environ);
  if (rc != 0) {
    throw ExternalError("Failed to start '" + argv[0] +
                        "': " + std::strerror(rc));
  }
  out_pipe.close_write();
  err_pipe.close_write();

  CommandResult result;
  try {
    drain(out_pipe, err_pipe, result);
  } catch (const ExternalError &) {
    out_pipe.close_read();
    err_pipe.close_read();
    wait_for(pid);
    throw;
  }
  result.exit_code = wait_for(pid);
  process_log()->debug("'{}' exited with {}", command_line, result.exit_code);
  return result;
}

} // namespace gpm
