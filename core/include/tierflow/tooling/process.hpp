// tierflow/tooling/process.hpp - Run a child process with captured output
//
// POSIX fork/exec with stdout and stderr captured through pipes and a hard
// wall-clock deadline. On expiry the child's process group is killed.
//
#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace tierflow
{

struct ProcessResult
{
  enum class Termination {
    Exited,       ///< exited normally; see exit_code
    Signaled,     ///< killed by a signal it did not handle; see signal
    TimedOut,     ///< deadline expired, killed by us
    SpawnFailed,  ///< pipe/fork failed; see spawn_error
  };

  Termination termination = Termination::SpawnFailed;
  int exit_code = -1;
  int signal = 0;

  std::string stdout_text;
  std::string stderr_text;
  std::string spawn_error;

  std::chrono::duration<double> duration{0.0};
};

/**
 * Run `argv` (argv[0] is looked up on PATH when it has no slash) and wait for
 * it to finish or for `timeout` to expire. Blocks the caller.
 *
 * The child's stdin is /dev/null. If exec fails the child exits with 127.
 */
[[nodiscard]] ProcessResult run_process(
  const std::vector<std::string> & argv, std::chrono::milliseconds timeout);

}  // namespace tierflow
