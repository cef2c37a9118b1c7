#ifndef INCLUDE_RUNBOX_CONFIG_H_
#define INCLUDE_RUNBOX_CONFIG_H_

#include <string>
#include <filesystem>

// minimal distance between the inner and the supervisory timeout
constexpr long kOuterTimeoutMargin = 2; // s

// Sandbox policy applied to every run; never derived from the submitted source
class SandboxSpec {
 public:
  std::string runtime; // container runtime client
  std::string image;
  std::string interpreter; // resolved inside the image
  long inner_timeout, outer_timeout; // s
  std::string memory; // runtime syntax, e.g. 128m
  int pids_limit;
  double cpus;
  std::string scratch_size; // tmpfs at the writable mount point, runtime syntax
  long max_output; // bytes per stream
  std::string user; // empty: image default
  long kill_timeout; // s; bounds the forced container removal

  SandboxSpec() :
      runtime("docker"),
      image("python:3.11-slim"),
      interpreter("python"),
      inner_timeout(10), outer_timeout(10 + kOuterTimeoutMargin),
      memory("128m"),
      pids_limit(64),
      cpus(0.5),
      scratch_size("64m"),
      max_output(10000),
      kill_timeout(5) {}
};

class Config {
 public:
  SandboxSpec sandbox;
  std::string host;
  int port;
  long max_source_chars;

  Config() :
      host("0.0.0.0"),
      port(5000),
      max_source_chars(5000) {}
};

// Keys absent from the file keep their current values; workspace_root goes to kWorkspaceRoot.
// Returns false if the file cannot be read
bool LoadConfig(const std::filesystem::path&, Config&);
// Logs the first violated constraint
bool ValidateConfig(const Config&);

#endif  // INCLUDE_RUNBOX_CONFIG_H_
