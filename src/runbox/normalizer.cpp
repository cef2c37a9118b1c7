#include "normalizer.h"

const char kTruncationMarker[] = "\n... (truncated)\n";

bool TruncateOutput(std::string& str, size_t limit) {
  if (str.size() <= limit) return false;
  str.resize(limit);
  str += kTruncationMarker;
  return true;
}

ExecutionResult Normalize(RawOutcome&& raw, const SandboxSpec& spec) {
  ExecutionResult ret;
  ret.elapsed_ms = raw.elapsed_ms;
  if (raw.launch_error) {
    ret.outcome = Outcome::LAUNCH_ERROR;
    ret.error_message = std::move(raw.launch_message);
    return ret;
  }
  // timed out runs produce no trustworthy output
  if (raw.supervisor_timeout) {
    ret.outcome = Outcome::SUPERVISOR_TIMEOUT;
    return ret;
  }
  if (raw.inner_timeout) {
    ret.outcome = Outcome::TIMEOUT;
    return ret;
  }
  ret.outcome = Outcome::OK;
  ret.exit_code = raw.exit_code;
  ret.stdout_text = std::move(raw.stdout_bytes);
  ret.stderr_text = std::move(raw.stderr_bytes);
  ret.stdout_truncated = TruncateOutput(ret.stdout_text, spec.max_output);
  ret.stderr_truncated = TruncateOutput(ret.stderr_text, spec.max_output);
  return ret;
}
