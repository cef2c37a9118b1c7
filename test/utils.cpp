#include "utils.h"

#include <stdlib.h>
#include <chrono>
#include <thread>
#include <fstream>
#include <iterator>

namespace {

const char kFakeRuntime[] = R"SH(#!/bin/sh
echo "$*" >> "$(dirname "$0")/calls.log"
case "$1" in
  version|rm) exit 0 ;;
  run) ;;
  *) echo "docker: unknown command $1" >&2; exit 125 ;;
esac
script=""
tmpfs=""
prev=""
for arg in "$@"; do
  if [ "$prev" = "-v" ]; then
    case "$arg" in
      *:/app/script.py:ro) script="${arg%:/app/script.py:ro}" ;;
    esac
  elif [ "$prev" = "--tmpfs" ]; then
    tmpfs="$arg"
  fi
  prev="$arg"
done
case "$tmpfs" in
  /app/writable:rw,size=*) ;;
  *) script="" ;;
esac
if [ -z "$script" ]; then
  echo "docker: invalid mount specification." >&2
  exit 125
fi
# the writable area lives beside this script, never in the workspace
scratch="$(mktemp -d "$(dirname "$0")/tmpfs.XXXXXX")"
cd "$scratch" || exit 125
sh "$script"
status=$?
cd / && rm -rf "$scratch"
exit $status
)SH";

} // namespace

TempDir::TempDir() {
  std::string tmpl = fs::temp_directory_path() / "runbox-testdir-XXXXXX";
  if (char* dir = mkdtemp(tmpl.data())) path_ = dir;
}

TempDir::~TempDir() {
  std::error_code ec;
  fs::remove_all(path_, ec);
}

FakeRuntime::FakeRuntime() {
  {
    std::ofstream fout(Binary());
    fout << kFakeRuntime;
  }
  fs::permissions(Binary(), fs::perms::owner_all);
}

std::vector<std::string> FakeRuntime::Calls() const {
  std::vector<std::string> ret;
  std::ifstream fin(dir_.Path() / "calls.log");
  for (std::string line; std::getline(fin, line);) ret.push_back(line);
  return ret;
}

SandboxSpec FakeRuntime::Spec(long inner_timeout) const {
  SandboxSpec spec;
  spec.runtime = Binary();
  spec.inner_timeout = inner_timeout;
  spec.outer_timeout = inner_timeout + kOuterTimeoutMargin;
  spec.kill_timeout = 2;
  return spec;
}

bool ProcessGone(pid_t pid) {
  std::ifstream fin("/proc/" + std::to_string(pid) + "/stat");
  if (!fin) return true;
  std::string content((std::istreambuf_iterator<char>(fin)), std::istreambuf_iterator<char>());
  // pid (comm) state ...
  auto pos = content.rfind(')');
  return pos == std::string::npos || pos + 2 >= content.size() || content[pos + 2] == 'Z';
}

bool WaitProcessGone(pid_t pid, long timeout_ms) {
  auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  while (!ProcessGone(pid)) {
    if (std::chrono::steady_clock::now() > deadline) return false;
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  return true;
}

bool IsEmptyOrMissing(const fs::path& path) {
  std::error_code ec;
  if (!fs::exists(path, ec)) return true;
  return fs::is_empty(path, ec);
}
