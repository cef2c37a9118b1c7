#ifndef RUNBOX_LAUNCHER_H_
#define RUNBOX_LAUNCHER_H_

#include <string>
#include <vector>
#include <optional>

#include <runbox/config.h>
#include "workspace.h"

// exit status of coreutils timeout when the command timed out
constexpr int kInnerTimeoutExitCode = 124;
extern const char kInnerTimeoutMessage[];

struct RawOutcome {
  std::string stdout_bytes, stderr_bytes;
  std::optional<int> exit_code; // nullopt if killed by the supervisor or by a signal
  bool supervisor_timeout;
  bool inner_timeout;
  bool launch_error;
  std::string launch_message;
  long elapsed_ms;

  RawOutcome() :
      supervisor_timeout(false), inner_timeout(false), launch_error(false),
      elapsed_ms(0) {}
};

std::string ContainerName(const Workspace&);
std::vector<std::string> BuildRunCommand(const Workspace&, const SandboxSpec&);
std::vector<std::string> BuildRemoveCommand(const Workspace&, const SandboxSpec&);

// Exactly one container is created for the call and none survives it
RawOutcome RunSandbox(const Workspace&, const SandboxSpec&);

#endif  // RUNBOX_LAUNCHER_H_
