// tierflow/tooling/process.cpp - fork/exec with pipes and a deadline
//
#include "tierflow/tooling/process.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>

namespace tierflow
{

namespace
{

using Clock = std::chrono::steady_clock;

struct Pipe
{
  int read_fd = -1;
  int write_fd = -1;

  bool open()
  {
    int fds[2] = {-1, -1};
    if (::pipe2(fds, O_CLOEXEC) != 0) return false;
    read_fd = fds[0];
    write_fd = fds[1];
    return true;
  }

  void close_read()
  {
    if (read_fd >= 0) ::close(read_fd);
    read_fd = -1;
  }

  void close_write()
  {
    if (write_fd >= 0) ::close(write_fd);
    write_fd = -1;
  }

  ~Pipe()
  {
    close_read();
    close_write();
  }
};

[[noreturn]] void exec_child(const std::vector<std::string> & argv, Pipe & out, Pipe & err)
{
  // Own process group so a timeout can take down grandchildren too.
  ::setpgid(0, 0);

  const int devnull = ::open("/dev/null", O_RDONLY);
  if (devnull >= 0) {
    ::dup2(devnull, STDIN_FILENO);
    ::close(devnull);
  }
  ::dup2(out.write_fd, STDOUT_FILENO);
  ::dup2(err.write_fd, STDERR_FILENO);

  std::vector<char *> args;
  args.reserve(argv.size() + 1);
  for (const auto & a : argv) {
    args.push_back(const_cast<char *>(a.c_str()));
  }
  args.push_back(nullptr);

  ::execvp(args[0], args.data());

  // exec failed; only async-signal-safe calls from here on.
  const char * msg = "exec failed: ";
  const char * reason = std::strerror(errno);
  (void)!::write(STDERR_FILENO, msg, std::strlen(msg));
  (void)!::write(STDERR_FILENO, reason, std::strlen(reason));
  (void)!::write(STDERR_FILENO, "\n", 1);
  ::_exit(127);
}

int remaining_ms(Clock::time_point deadline)
{
  const auto left =
    std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
  return left > 0 ? static_cast<int>(left) : 0;
}

void kill_child(pid_t pid)
{
  ::kill(-pid, SIGKILL);
  ::kill(pid, SIGKILL);
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
  }
}

void fill_exit_status(ProcessResult & result, int status)
{
  if (WIFEXITED(status)) {
    result.termination = ProcessResult::Termination::Exited;
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.termination = ProcessResult::Termination::Signaled;
    result.signal = WTERMSIG(status);
  }
}

}  // namespace

ProcessResult run_process(const std::vector<std::string> & argv, std::chrono::milliseconds timeout)
{
  ProcessResult result;
  const auto start = Clock::now();
  const auto deadline = start + timeout;

  if (argv.empty()) {
    result.spawn_error = "empty command line";
    return result;
  }

  Pipe out;
  Pipe err;
  if (!out.open() || !err.open()) {
    result.spawn_error = std::string("pipe failed: ") + std::strerror(errno);
    return result;
  }

  const pid_t pid = ::fork();
  if (pid < 0) {
    result.spawn_error = std::string("fork failed: ") + std::strerror(errno);
    return result;
  }
  if (pid == 0) {
    exec_child(argv, out, err);
  }

  // parent
  out.close_write();
  err.close_write();

  std::array<pollfd, 2> fds{};
  fds[0] = {out.read_fd, POLLIN, 0};
  fds[1] = {err.read_fd, POLLIN, 0};
  std::array<std::string *, 2> sinks = {&result.stdout_text, &result.stderr_text};
  int open_streams = 2;
  std::array<char, 4096> buf{};

  while (open_streams > 0) {
    const int wait_ms = remaining_ms(deadline);
    if (wait_ms == 0) {
      kill_child(pid);
      result.termination = ProcessResult::Termination::TimedOut;
      result.duration = Clock::now() - start;
      return result;
    }

    const int pr = ::poll(fds.data(), fds.size(), wait_ms);
    if (pr < 0) {
      if (errno == EINTR) continue;
      kill_child(pid);
      result.termination = ProcessResult::Termination::SpawnFailed;
      result.spawn_error = std::string("poll failed: ") + std::strerror(errno);
      result.duration = Clock::now() - start;
      return result;
    }

    for (size_t i = 0; i < fds.size(); ++i) {
      if (fds[i].fd < 0 || fds[i].revents == 0) continue;

      const ssize_t r = ::read(fds[i].fd, buf.data(), buf.size());
      if (r > 0) {
        sinks[i]->append(buf.data(), static_cast<size_t>(r));
      } else if (r == 0 || errno != EINTR) {
        // EOF (or an unrecoverable read error): stop watching this stream.
        fds[i].fd = -1;
        --open_streams;
      }
    }
  }

  // Both streams closed; the child may still be running.
  int status = 0;
  for (;;) {
    const pid_t r = ::waitpid(pid, &status, WNOHANG);
    if (r == pid) break;
    if (r < 0 && errno != EINTR) {
      result.spawn_error = std::string("waitpid failed: ") + std::strerror(errno);
      result.duration = Clock::now() - start;
      return result;
    }
    if (remaining_ms(deadline) == 0) {
      kill_child(pid);
      result.termination = ProcessResult::Termination::TimedOut;
      result.duration = Clock::now() - start;
      return result;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }

  fill_exit_status(result, status);
  result.duration = Clock::now() - start;
  return result;
}

}  // namespace tierflow
