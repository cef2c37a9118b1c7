#include "launcher.h"

#include <cstring>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <runbox/paths.h>
#include <runbox/execution.h>
#include "sandbox_exec.h"

const char kInnerTimeoutMessage[] = "Command terminated";

namespace {

// docker run: 125 daemon error, 126 command cannot be invoked, 127 command not found.
// timeout uses 126 & 127 the same way when the interpreter is missing from the image
bool IsRuntimeFailure(int exit_code, const std::string& err) {
  if (exit_code < 125 || exit_code > 127) return false;
  if (exit_code != 125 && err.rfind("timeout: failed to run command", 0) == 0) return true;
  return err.rfind("docker: ", 0) == 0 ||
         err.find("Error response from daemon") != std::string::npos;
}

void ForceRemove(const Workspace& ws, const SandboxSpec& spec) {
  ExecOptions opt;
  opt.command = BuildRemoveCommand(ws, spec);
  opt.timeout_ms = spec.kill_timeout * 1000;
  opt.capture_limit = 4096;
  ExecResult res = SandboxExec(opt);
  if (res.error || res.timed_out || !res.exited) {
    spdlog::error("Failed removing container {}; it may still be running", ContainerName(ws));
  } else if (res.exit_code != 0) {
    // normal if the container never started or was already removed
    spdlog::info("Container {} removal exited with {}: {}",
                 ContainerName(ws), res.exit_code, res.stderr_bytes);
  } else {
    spdlog::info("Container {} removed", ContainerName(ws));
  }
}

} // namespace

std::string ContainerName(const Workspace& ws) {
  return "runbox-" + ws.Id();
}

std::vector<std::string> BuildRunCommand(const Workspace& ws, const SandboxSpec& spec) {
  std::vector<std::string> ret = {
    spec.runtime, "run", "--rm",
    "--name", ContainerName(ws),
    "--network", "none",
    "--memory", spec.memory,
    "--memory-swap", spec.memory, // no swap on top of the memory limit
    "--pids-limit", std::to_string(spec.pids_limit),
    "--cpus", fmt::format("{}", spec.cpus),
    "--read-only",
    "--cap-drop", "ALL",
    "--security-opt", "no-new-privileges",
  };
  if (!spec.user.empty()) ret.insert(ret.end(), {"--user", spec.user});
  ret.insert(ret.end(), {
    "-v", ws.Script().string() + ":" + kSandboxScript + ":ro",
    // in memory, so nothing written by the program lands on the host
    "--tmpfs", std::string(kSandboxScratch) + ":rw,size=" + spec.scratch_size,
    "-w", kSandboxScratch,
    spec.image,
    "timeout", std::to_string(spec.inner_timeout),
    spec.interpreter, "-u", kSandboxScript,
  });
  return ret;
}

std::vector<std::string> BuildRemoveCommand(const Workspace& ws, const SandboxSpec& spec) {
  return {spec.runtime, "rm", "-f", ContainerName(ws)};
}

RawOutcome RunSandbox(const Workspace& ws, const SandboxSpec& spec) {
  ExecOptions opt;
  opt.command = BuildRunCommand(ws, spec);
  opt.timeout_ms = spec.outer_timeout * 1000;
  // one extra byte tells the normalizer that the stream overflowed
  opt.capture_limit = spec.max_output + 1;
  spdlog::debug("Launching container {}", ContainerName(ws));
  ExecResult res = SandboxExec(opt);

  RawOutcome ret;
  ret.stdout_bytes = std::move(res.stdout_bytes);
  ret.stderr_bytes = std::move(res.stderr_bytes);
  ret.elapsed_ms = res.elapsed_ms;
  if (res.error) {
    ret.launch_error = true;
    ret.launch_message = fmt::format("cannot run {}: {}", spec.runtime, strerror(res.error));
    return ret;
  }
  if (res.timed_out) {
    spdlog::warn("Container {} exceeded the supervisory timeout of {}s; removing",
                 ContainerName(ws), spec.outer_timeout);
    ret.supervisor_timeout = true;
    ForceRemove(ws, spec);
    return ret;
  }
  if (!res.exited) {
    // the runtime client itself was killed by a signal
    ret.launch_error = true;
    ret.launch_message = fmt::format("{} terminated by signal {}", spec.runtime, res.term_signal);
    ForceRemove(ws, spec);
    return ret;
  }
  ret.exit_code = res.exit_code;
  if (IsRuntimeFailure(res.exit_code, ret.stderr_bytes)) {
    ret.launch_error = true;
    ret.launch_message = ret.stderr_bytes.substr(0, ret.stderr_bytes.find('\n'));
    return ret;
  }
  ret.inner_timeout = res.exit_code == kInnerTimeoutExitCode ||
      ret.stderr_bytes.find(kInnerTimeoutMessage) != std::string::npos;
  return ret;
}

bool RuntimeAvailable(const SandboxSpec& spec) {
  ExecOptions opt;
  opt.command = {spec.runtime, "version"};
  opt.timeout_ms = spec.kill_timeout * 1000;
  opt.capture_limit = 4096;
  ExecResult res = SandboxExec(opt);
  bool ok = !res.error && !res.timed_out && res.exited && res.exit_code == 0;
  if (!ok) {
    spdlog::debug("{} version failed: exit={} {}", spec.runtime, res.exit_code, res.stderr_bytes);
  }
  return ok;
}
