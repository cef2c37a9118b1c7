#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <csignal>
#include <algorithm>

#include <runbox/execution.h>
#include <runbox/paths.h>
#include "../src/runbox/launcher.h"
#include "../src/runbox/sandbox_exec.h"
#include "utils.h"

namespace {

bool HasPair(const std::vector<std::string>& cmd, const std::string& key, const std::string& val) {
  for (size_t i = 0; i + 1 < cmd.size(); i++) {
    if (cmd[i] == key && cmd[i + 1] == val) return true;
  }
  return false;
}

ExecResult Shell(const std::string& script, long timeout_ms = 5000, size_t limit = 1 << 20) {
  ExecOptions opt;
  opt.command = {"/bin/sh", "-c", script};
  opt.timeout_ms = timeout_ms;
  opt.capture_limit = limit;
  return SandboxExec(opt);
}

} // namespace

TEST(BuildRunCommand, HardenedFlags) {
  SandboxSpec spec;
  auto ws = Workspace::Create("print('hi')");
  ASSERT_TRUE(ws);
  auto cmd = BuildRunCommand(*ws, spec);
  ASSERT_GE(cmd.size(), 3u);
  EXPECT_EQ(cmd[0], "docker");
  EXPECT_EQ(cmd[1], "run");
  EXPECT_NE(std::find(cmd.begin(), cmd.end(), "--rm"), cmd.end());
  EXPECT_NE(std::find(cmd.begin(), cmd.end(), "--read-only"), cmd.end());
  EXPECT_TRUE(HasPair(cmd, "--name", ContainerName(*ws)));
  EXPECT_TRUE(HasPair(cmd, "--network", "none"));
  EXPECT_TRUE(HasPair(cmd, "--memory", "128m"));
  EXPECT_TRUE(HasPair(cmd, "--memory-swap", "128m"));
  EXPECT_TRUE(HasPair(cmd, "--pids-limit", "64"));
  EXPECT_TRUE(HasPair(cmd, "--cpus", "0.5"));
  EXPECT_TRUE(HasPair(cmd, "--cap-drop", "ALL"));
  EXPECT_TRUE(HasPair(cmd, "-v", ws->Script().string() + ":/app/script.py:ro"));
  EXPECT_TRUE(HasPair(cmd, "--tmpfs", "/app/writable:rw,size=64m"));
  EXPECT_TRUE(HasPair(cmd, "-w", "/app/writable"));
  EXPECT_EQ(std::find(cmd.begin(), cmd.end(), "--user"), cmd.end());
  std::vector<std::string> tail(cmd.end() - 6, cmd.end());
  EXPECT_EQ(tail, (std::vector<std::string>{
      "python:3.11-slim", "timeout", "10", "python", "-u", "/app/script.py"}));
}

TEST(BuildRunCommand, SourceNeverReachesCommand) {
  SandboxSpec spec;
  spec.user = "65534:65534";
  const std::string source = "--privileged --network host";
  auto ws = Workspace::Create(source);
  ASSERT_TRUE(ws);
  auto cmd = BuildRunCommand(*ws, spec);
  for (auto& i : cmd) EXPECT_EQ(i.find("--privileged"), std::string::npos);
  EXPECT_FALSE(HasPair(cmd, "--network", "host"));
  EXPECT_TRUE(HasPair(cmd, "--user", "65534:65534"));
}

TEST(BuildRunCommand, NoWritableHostMount) {
  SandboxSpec spec;
  spec.scratch_size = "8m";
  auto ws = Workspace::Create("x");
  ASSERT_TRUE(ws);
  auto cmd = BuildRunCommand(*ws, spec);
  int mounts = 0;
  for (size_t i = 0; i + 1 < cmd.size(); i++) {
    if (cmd[i] != "-v") continue;
    mounts++;
    EXPECT_EQ(cmd[i + 1].substr(cmd[i + 1].size() - 3), ":ro") << cmd[i + 1];
  }
  EXPECT_EQ(mounts, 1);
  EXPECT_TRUE(HasPair(cmd, "--tmpfs", "/app/writable:rw,size=8m"));
}

TEST(BuildRemoveCommand, TargetsContainer) {
  SandboxSpec spec;
  auto ws = Workspace::Create("x");
  ASSERT_TRUE(ws);
  EXPECT_EQ(BuildRemoveCommand(*ws, spec),
            (std::vector<std::string>{"docker", "rm", "-f", ContainerName(*ws)}));
}

TEST(SandboxExec, CapturesStreamsAndExitCode) {
  auto res = Shell("printf out; printf err >&2; exit 7");
  EXPECT_EQ(res.error, 0);
  EXPECT_FALSE(res.timed_out);
  ASSERT_TRUE(res.exited);
  EXPECT_EQ(res.exit_code, 7);
  EXPECT_EQ(res.stdout_bytes, "out");
  EXPECT_EQ(res.stderr_bytes, "err");
}

TEST(SandboxExec, StdinIsEmpty) {
  auto res = Shell("cat; echo done");
  ASSERT_TRUE(res.exited);
  EXPECT_EQ(res.stdout_bytes, "done\n");
}

TEST(SandboxExec, Signal) {
  auto res = Shell("kill -9 $$");
  EXPECT_FALSE(res.exited);
  EXPECT_FALSE(res.timed_out);
  EXPECT_EQ(res.term_signal, SIGKILL);
}

TEST(SandboxExec, CaptureLimitDrainsRest) {
  // the writer must not block once the limit is reached
  auto res = Shell("head -c 1000000 /dev/zero", 5000, 10);
  ASSERT_TRUE(res.exited);
  EXPECT_EQ(res.exit_code, 0);
  EXPECT_EQ(res.stdout_bytes.size(), 10u);
}

TEST(SandboxExec, OnlyStdioInherited) {
  // a descriptor opened elsewhere in the process without O_CLOEXEC
  int fd = open("/dev/null", O_RDONLY);
  ASSERT_GE(fd, 0);
  ASSERT_EQ(dup2(fd, 42), 42);
  // the trailing command keeps the shell from exec'ing ls
  auto res = Shell("ls /proc/$$/fd; :");
  close(42);
  close(fd);
  ASSERT_TRUE(res.exited);
  EXPECT_EQ(res.exit_code, 0);
  EXPECT_EQ(res.stdout_bytes, "0\n1\n2\n");
}

TEST(SandboxExec, MissingBinary) {
  ExecOptions opt;
  opt.command = {"/nonexistent/runbox-runtime"};
  auto res = SandboxExec(opt);
  EXPECT_EQ(res.error, ENOENT);
  EXPECT_FALSE(res.exited);
}

TEST(SandboxExec, DeadlineKillsProcessGroup) {
  // the background child keeps the pipes open, so only the kill can end this
  auto res = Shell("sleep 30 & echo $!; wait", 300);
  EXPECT_TRUE(res.timed_out);
  EXPECT_FALSE(res.exited);
  EXPECT_LT(res.elapsed_ms, 3000);
  pid_t child = std::stoi(res.stdout_bytes);
  EXPECT_TRUE(WaitProcessGone(child));
}

TEST(SandboxExec, DeadlineWithIgnoredTerm) {
  auto res = Shell("trap '' TERM; while :; do :; done", 300);
  EXPECT_TRUE(res.timed_out);
  EXPECT_LT(res.elapsed_ms, 3000);
}

TEST(RunSandbox, InnerTimeoutByExitCode) {
  FakeRuntime rt;
  auto ws = Workspace::Create("echo partial; exit 124");
  ASSERT_TRUE(ws);
  RawOutcome raw = RunSandbox(*ws, rt.Spec());
  EXPECT_TRUE(raw.inner_timeout);
  EXPECT_FALSE(raw.supervisor_timeout);
  EXPECT_FALSE(raw.launch_error);
}

TEST(RunSandbox, InnerTimeoutByMessage) {
  FakeRuntime rt;
  auto ws = Workspace::Create("echo 'Command terminated by signal 9' >&2; exit 137");
  ASSERT_TRUE(ws);
  RawOutcome raw = RunSandbox(*ws, rt.Spec());
  EXPECT_TRUE(raw.inner_timeout);
}

TEST(RunSandbox, RuntimeDiagnosticIsLaunchError) {
  FakeRuntime rt;
  auto ws = Workspace::Create(
      "echo 'docker: Error response from daemon: No such image: python:3.11-slim.' >&2; exit 125");
  ASSERT_TRUE(ws);
  RawOutcome raw = RunSandbox(*ws, rt.Spec());
  EXPECT_TRUE(raw.launch_error);
  EXPECT_EQ(raw.launch_message, "docker: Error response from daemon: No such image: python:3.11-slim.");
}

TEST(RunSandbox, MissingInterpreterIsLaunchError) {
  FakeRuntime rt;
  auto ws = Workspace::Create(
      "echo \"timeout: failed to run command 'python': No such file or directory\" >&2; exit 127");
  ASSERT_TRUE(ws);
  RawOutcome raw = RunSandbox(*ws, rt.Spec());
  EXPECT_TRUE(raw.launch_error);
  EXPECT_EQ(raw.launch_message, "timeout: failed to run command 'python': No such file or directory");
  EXPECT_FALSE(raw.inner_timeout);
}

TEST(RunSandbox, ProgramExit125IsNotLaunchError) {
  FakeRuntime rt;
  auto ws = Workspace::Create("echo 'plain failure' >&2; exit 125");
  ASSERT_TRUE(ws);
  RawOutcome raw = RunSandbox(*ws, rt.Spec());
  EXPECT_FALSE(raw.launch_error);
  EXPECT_EQ(raw.exit_code, 125);
}

TEST(RunSandbox, SupervisorTimeoutRemovesContainer) {
  FakeRuntime rt;
  auto ws = Workspace::Create("sleep 30 & echo $!; wait");
  ASSERT_TRUE(ws);
  SandboxSpec spec = rt.Spec();
  RawOutcome raw = RunSandbox(*ws, spec);
  EXPECT_TRUE(raw.supervisor_timeout);
  EXPECT_FALSE(raw.exit_code);
  EXPECT_LT(raw.elapsed_ms, (spec.outer_timeout + 2) * 1000);
  EXPECT_TRUE(WaitProcessGone(std::stoi(raw.stdout_bytes)));
  auto calls = rt.Calls();
  ASSERT_EQ(calls.size(), 2u);
  EXPECT_EQ(calls[0].rfind("run ", 0), 0u);
  EXPECT_EQ(calls[1], "rm -f " + ContainerName(*ws));
}

TEST(RunSandbox, MissingRuntimeIsLaunchError) {
  SandboxSpec spec;
  spec.runtime = "/nonexistent/runbox-runtime";
  auto ws = Workspace::Create("x");
  ASSERT_TRUE(ws);
  RawOutcome raw = RunSandbox(*ws, spec);
  EXPECT_TRUE(raw.launch_error);
  EXPECT_NE(raw.launch_message.find("/nonexistent/runbox-runtime"), std::string::npos);
}

TEST(RuntimeAvailable, FakeAndMissing) {
  FakeRuntime rt;
  EXPECT_TRUE(RuntimeAvailable(rt.Spec()));
  SandboxSpec spec;
  spec.runtime = "/nonexistent/runbox-runtime";
  EXPECT_FALSE(RuntimeAvailable(spec));
}
