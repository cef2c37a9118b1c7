#ifndef RUNBOX_SANDBOX_EXEC_H_
#define RUNBOX_SANDBOX_EXEC_H_

#include <string>
#include <vector>

class ExecOptions {
 public:
  std::vector<std::string> command; // argv; command[0] is looked up in PATH
  long timeout_ms; // 0 for no limit
  size_t capture_limit; // bytes kept per stream; the rest is read and discarded

  ExecOptions() : timeout_ms(0), capture_limit(1 << 20) {}
};

class ExecResult {
 public:
  std::string stdout_bytes, stderr_bytes;
  bool exited; // normal exit; exit_code is valid
  int exit_code;
  int term_signal; // valid if !exited && !timed_out && error == 0
  bool timed_out; // the process group was killed at the deadline
  int error; // errno if the command could not be started
  long elapsed_ms;

  ExecResult() :
      exited(false), exit_code(-1), term_signal(0),
      timed_out(false), error(0), elapsed_ms(0) {}
};

// Runs the command in its own process group with stdin from /dev/null,
// collecting stdout & stderr until both are closed and the process is reaped.
// At the deadline the whole process group receives SIGKILL and is reaped before returning.
// The child keeps only stdin, stdout & stderr; every other inherited descriptor is closed before exec.
// Thread-safe: the pipes are close-on-exec so concurrent children never inherit each other's.
ExecResult SandboxExec(const ExecOptions&);

#endif  // RUNBOX_SANDBOX_EXEC_H_
