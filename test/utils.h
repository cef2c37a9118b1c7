#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <sys/types.h>
#include <string>
#include <vector>
#include <filesystem>

#include <gtest/gtest.h>
#include <runbox/config.h>

namespace fs = std::filesystem;

// Fresh directory removed at destruction
class TempDir {
  fs::path path_;
 public:
  TempDir();
  ~TempDir();
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;
  const fs::path& Path() const { return path_; }
};

// Stand-in for the container runtime client.
// `run` executes the source mounted at /app/script.py with sh, so test sources are shell scripts.
// The working directory stands in for the tmpfs; it is private to the run and outside the workspace.
// `rm` and `version` succeed. Every invocation is appended to Calls().
class FakeRuntime {
  TempDir dir_;
 public:
  FakeRuntime();
  fs::path Binary() const { return dir_.Path() / "runtime"; }
  std::vector<std::string> Calls() const;
  // defaults with short timeouts, pointed at this runtime
  SandboxSpec Spec(long inner_timeout = 1) const;
};

// not running (absent or zombie)
bool ProcessGone(pid_t pid);
// waits up to timeout_ms for ProcessGone
bool WaitProcessGone(pid_t pid, long timeout_ms = 2000);

bool IsEmptyOrMissing(const fs::path&);

#endif  // TEST_UTILS_H_
