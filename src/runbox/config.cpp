#include <runbox/config.h>

#include <fstream>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <runbox/paths.h>

bool LoadConfig(const std::filesystem::path& conf_path, Config& conf) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  std::string workspace_root = ini[""]["workspace_root"] | "";
  if (workspace_root.size()) kWorkspaceRoot = workspace_root;
  conf.host = ini[""]["host"] | conf.host;
  conf.port = ini[""]["port"] | conf.port;
  conf.max_source_chars = ini[""]["max_source_chars"] | conf.max_source_chars;

  SandboxSpec& spec = conf.sandbox;
  spec.runtime = ini[""]["runtime"] | spec.runtime;
  spec.image = ini[""]["image"] | spec.image;
  spec.interpreter = ini[""]["interpreter"] | spec.interpreter;
  spec.inner_timeout = ini[""]["inner_timeout_sec"] | spec.inner_timeout;
  // keep the margin unless the outer timeout is given explicitly
  spec.outer_timeout = ini[""]["outer_timeout_sec"] | (spec.inner_timeout + kOuterTimeoutMargin);
  spec.memory = ini[""]["memory"] | spec.memory;
  spec.pids_limit = ini[""]["pids_limit"] | spec.pids_limit;
  spec.cpus = ini[""]["cpus"] | spec.cpus;
  spec.scratch_size = ini[""]["scratch_size"] | spec.scratch_size;
  spec.max_output = ini[""]["max_output_bytes"] | spec.max_output;
  spec.user = ini[""]["user"] | spec.user;
  spec.kill_timeout = ini[""]["kill_timeout_sec"] | spec.kill_timeout;
  return true;
}

bool ValidateConfig(const Config& conf) {
  const SandboxSpec& spec = conf.sandbox;
  const char* err = nullptr;
  if (spec.runtime.empty()) {
    err = "runtime must not be empty";
  } else if (spec.image.empty()) {
    err = "image must not be empty";
  } else if (spec.interpreter.empty()) {
    err = "interpreter must not be empty";
  } else if (spec.inner_timeout <= 0) {
    err = "inner_timeout_sec must be positive";
  } else if (spec.outer_timeout < spec.inner_timeout + kOuterTimeoutMargin) {
    err = "outer_timeout_sec must exceed inner_timeout_sec by the fixed margin";
  } else if (spec.memory.empty()) {
    err = "memory must not be empty";
  } else if (spec.pids_limit <= 0) {
    err = "pids_limit must be positive";
  } else if (spec.cpus <= 0) {
    err = "cpus must be positive";
  } else if (spec.scratch_size.empty()) {
    err = "scratch_size must not be empty";
  } else if (spec.max_output <= 0) {
    err = "max_output_bytes must be positive";
  } else if (spec.kill_timeout <= 0) {
    err = "kill_timeout_sec must be positive";
  } else if (conf.max_source_chars <= 0) {
    err = "max_source_chars must be positive";
  } else if (conf.port <= 0 || conf.port > 65535) {
    err = "port out of range";
  }
  if (err) {
    spdlog::error("Invalid configuration: {} (inner={}s outer={}s margin={}s)",
                  err, spec.inner_timeout, spec.outer_timeout, kOuterTimeoutMargin);
    return false;
  }
  return true;
}
