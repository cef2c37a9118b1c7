#ifndef INCLUDE_RUNBOX_REPORT_H_
#define INCLUDE_RUNBOX_REPORT_H_

#include <string>

#include <nlohmann/json.hpp>
#include "execution.h"

std::string TimeoutMessage(const SandboxSpec&);

// {stdout, stderr, exit_code} for completed runs, {error} otherwise
nlohmann::json ResultToJson(const ExecutionResult&, const SandboxSpec&);
// timeouts are reported as success
int ResultHttpStatus(const ExecutionResult&);

#endif  // INCLUDE_RUNBOX_REPORT_H_
