#include <runbox/report.h>

#include <fmt/format.h>
#include <runbox/utils.h>

std::string TimeoutMessage(const SandboxSpec& spec) {
  return fmt::format("Execution timed out after {} seconds.", spec.inner_timeout);
}

nlohmann::json ResultToJson(const ExecutionResult& res, const SandboxSpec& spec) {
  using nlohmann::json;
  switch (res.outcome) {
    case Outcome::OK:
      return {
        {"stdout", res.stdout_text},
        {"stderr", res.stderr_text},
        {"exit_code", res.exit_code ? json(*res.exit_code) : json(nullptr)},
      };
    case Outcome::TIMEOUT: [[fallthrough]];
    case Outcome::SUPERVISOR_TIMEOUT:
      return {{"error", TimeoutMessage(spec)}};
    case Outcome::LAUNCH_ERROR: [[fallthrough]];
    case Outcome::WORKSPACE_ERROR:
      return {{"error", fmt::format("{}: {}", OutcomeToDesc(res.outcome), res.error_message)}};
  }
  __builtin_unreachable();
}

int ResultHttpStatus(const ExecutionResult& res) {
  return IsServiceError(res.outcome) ? 500 : 200;
}
