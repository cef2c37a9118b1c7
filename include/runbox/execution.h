#ifndef INCLUDE_RUNBOX_EXECUTION_H_
#define INCLUDE_RUNBOX_EXECUTION_H_

#include <string>
#include <optional>

#include "config.h"

// OK and the two timeouts are caused by the submitted code;
// the rest are faults of the service itself
#define ENUM_OUTCOME_ \
  X(OK, "Completed") \
  X(TIMEOUT, "Execution timed out") \
  X(SUPERVISOR_TIMEOUT, "Sandbox invocation timed out") \
  /* service errors */ \
  X(LAUNCH_ERROR, "Sandbox launch failed") \
  X(WORKSPACE_ERROR, "Workspace creation failed")
enum class Outcome {
#define X(name, desc) name,
  ENUM_OUTCOME_
#undef X
};

class ExecutionResult {
 public:
  Outcome outcome;
  std::string stdout_text, stderr_text;
  std::optional<int> exit_code; // nullopt if the program never produced one
  bool stdout_truncated, stderr_truncated;
  std::string error_message; // only for service errors
  long elapsed_ms;

  ExecutionResult() :
      outcome(Outcome::OK),
      stdout_truncated(false), stderr_truncated(false),
      elapsed_ms(0) {}
};

// Checks every caller applies before Execute: non-empty, at most max_chars code points.
// Returns the message for the client, or an empty string if the source is acceptable
std::string CheckSource(const std::string& source, long max_chars);

// Runs one untrusted source inside a fresh sandbox.
// Blocks the calling thread for at most spec.outer_timeout (plus the forced-removal bound);
// safe to call from several threads at once.
ExecutionResult Execute(const std::string& source, const SandboxSpec& spec);

// Whether the container runtime answers `<runtime> version` within spec.kill_timeout
bool RuntimeAvailable(const SandboxSpec& spec);

#endif  // INCLUDE_RUNBOX_EXECUTION_H_
