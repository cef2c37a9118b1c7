#include <runbox/execution.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <runbox/utils.h>
#include "launcher.h"
#include "normalizer.h"
#include "workspace.h"

std::string CheckSource(const std::string& source, long max_chars) {
  if (source.empty()) return "No code provided.";
  if ((long)Utf8Length(source) > max_chars) {
    return fmt::format("Code too long. Max {} characters allowed.", max_chars);
  }
  return "";
}

ExecutionResult Execute(const std::string& source, const SandboxSpec& spec) {
  ExecutionResult ret;
  std::string id;
  {
    std::optional<Workspace> ws = Workspace::Create(source);
    if (!ws) {
      ret.outcome = Outcome::WORKSPACE_ERROR;
      ret.error_message = "cannot create workspace";
      spdlog::error("Run aborted: {}", ret.error_message);
      return ret;
    }
    id = ws->Id();
    spdlog::debug("Run {} started, source size {}", id, source.size());
    ret = Normalize(RunSandbox(*ws, spec), spec);
    // ws is destroyed here on every path; failures are only logged
  }

  switch (ret.outcome) {
    case Outcome::OK:
      spdlog::info("Run {} finished: exit={} stdout={}B stderr={}B elapsed={}ms",
                   id, ret.exit_code.value_or(-1), ret.stdout_text.size(), ret.stderr_text.size(),
                   ret.elapsed_ms);
      break;
    case Outcome::TIMEOUT:
      spdlog::info("Run {} timed out after {}s", id, spec.inner_timeout);
      break;
    case Outcome::SUPERVISOR_TIMEOUT:
      spdlog::warn("Run {} hit the supervisory timeout ({}s); sandbox runtime may be unhealthy",
                   id, spec.outer_timeout);
      break;
    case Outcome::LAUNCH_ERROR: [[fallthrough]];
    case Outcome::WORKSPACE_ERROR:
      spdlog::error("Run {} failed: {}: {}", id, OutcomeToDesc(ret.outcome), ret.error_message);
      break;
  }
  return ret;
}
