#include "sandbox_exec.h"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <cstdlib>
#include <cstring>
#include <algorithm>
#include <chrono>
#include <thread>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include "utils.h"

namespace {

using Clock = std::chrono::steady_clock;

constexpr size_t kReadBufferSize = 65536;
// the exec error pipe is moved here in the child; everything above it is closed
constexpr int kExecErrorFd = 3;

#if __has_include(<linux/close_range.h>)
#include <linux/close_range.h>
int CloseFrom(int minfd) {
  return close_range(minfd, ~0U, 0);
}
#else
#include <dirent.h>
int CloseFrom(int minfd) {
  DIR *fddir = opendir("/proc/self/fd");
  if (!fddir) goto error;
  {
    int dfd = dirfd(fddir);
    for (struct dirent *dent; (dent = readdir(fddir));) {
      if (!strcmp(dent->d_name, ".") || !strcmp(dent->d_name, "..")) continue;
      int fd = strtol(dent->d_name, NULL, 10);
      if (fd >= minfd && fd != dfd) {
        if (close(fd) && errno != EBADF) goto error_dir;
      }
    }
  }
  closedir(fddir);
  return 0;

error_dir:
  closedir(fddir);
error:
  return -1;
}
#endif // has_include(<linux/close_range.h>)

[[noreturn]] void ChildFail(int fd) {
  int e = errno;
  IGNORE_RETURN(write(fd, &e, sizeof(e)));
  _exit(127);
}

void CloseFd(int& fd) {
  if (fd >= 0) close(fd);
  fd = -1;
}

long MsSince(Clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
}

// -1 for no deadline
int PollTimeout(bool has_deadline, Clock::time_point deadline) {
  if (!has_deadline) return -1;
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
  return left < 0 ? 0 : (int)left + 1;
}

// returns false on EOF or unrecoverable error
bool ReadInto(int fd, std::string& out, size_t limit) {
  char buf[kReadBufferSize];
  ssize_t len = read(fd, buf, sizeof(buf));
  if (len < 0) return errno == EINTR || errno == EAGAIN;
  if (len == 0) return false;
  if (out.size() < limit) out.append(buf, std::min((size_t)len, limit - out.size()));
  return true;
}

void KillGroup(pid_t pid) {
  // the child may not have called setpgid yet; kill it directly as well
  kill(-pid, SIGKILL);
  kill(pid, SIGKILL);
}

} // namespace

ExecResult SandboxExec(const ExecOptions& opt) {
  ExecResult ret;
  auto start = Clock::now();
  bool has_deadline = opt.timeout_ms > 0;
  auto deadline = start + std::chrono::milliseconds(opt.timeout_ms);
  int outpipe[2] = {-1, -1}, errpipe[2] = {-1, -1}, execpipe[2] = {-1, -1};
  int status = 0;
  bool reaped = false;
  pid_t pid;

  if (opt.command.empty()) {
    ret.error = EINVAL;
    return ret;
  }
  // prepare argv before fork; the child must not allocate
  std::vector<char*> argv;
  for (auto& i : opt.command) argv.push_back(const_cast<char*>(i.c_str()));
  argv.push_back(nullptr);

  spdlog::debug("SandboxExec command={} timeout={}ms", fmt::format("{}", opt.command), opt.timeout_ms);
  if (pipe2(outpipe, O_CLOEXEC) < 0 || pipe2(errpipe, O_CLOEXEC) < 0 ||
      pipe2(execpipe, O_CLOEXEC) < 0) {
    goto err;
  }
  pid = fork();
  if (pid < 0) goto err;
  if (pid == 0) {
    setpgid(0, 0);
    int devnull = open("/dev/null", O_RDONLY);
    if (devnull < 0 || dup2(devnull, 0) < 0 ||
        dup2(outpipe[1], 1) < 0 || dup2(errpipe[1], 2) < 0) {
      ChildFail(execpipe[1]);
    }
    // descriptors opened elsewhere without O_CLOEXEC must not reach the runtime
    if (execpipe[1] != kExecErrorFd && dup3(execpipe[1], kExecErrorFd, O_CLOEXEC) < 0) {
      ChildFail(execpipe[1]);
    }
    if (CloseFrom(kExecErrorFd + 1) < 0) ChildFail(kExecErrorFd);
    execvp(argv[0], argv.data());
    ChildFail(kExecErrorFd);
  }
  setpgid(pid, pid); // whichever of parent and child runs first
  CloseFd(outpipe[1]);
  CloseFd(errpipe[1]);
  CloseFd(execpipe[1]);

  {
    // EOF means exec succeeded
    int child_errno = 0;
    ssize_t len;
    while ((len = read(execpipe[0], &child_errno, sizeof(child_errno))) < 0 && errno == EINTR);
    CloseFd(execpipe[0]);
    if (len == sizeof(child_errno)) {
      waitpid(pid, nullptr, 0);
      spdlog::warn("Failed executing {}: {}", opt.command[0], strerror(child_errno));
      ret.error = child_errno;
      goto done;
    }
  }

  {
    struct pollfd fds[2] = {{outpipe[0], POLLIN, 0}, {errpipe[0], POLLIN, 0}};
    std::string* outs[2] = {&ret.stdout_bytes, &ret.stderr_bytes};
    int open_fds = 2;
    while (open_fds > 0) {
      if (has_deadline && Clock::now() >= deadline) {
        ret.timed_out = true;
        break;
      }
      int res = poll(fds, 2, PollTimeout(has_deadline, deadline));
      if (res < 0) {
        if (errno == EINTR) continue;
        spdlog::warn("poll failed: {}", strerror(errno));
        ret.timed_out = true; // cannot supervise anymore; treat as a forced stop
        break;
      }
      for (int i = 0; i < 2; i++) {
        if (fds[i].fd < 0 || !fds[i].revents) continue;
        if (!ReadInto(fds[i].fd, *outs[i], opt.capture_limit)) {
          close(fds[i].fd);
          fds[i].fd = -1; // poll ignores negative descriptors
          open_fds--;
        }
      }
    }
    outpipe[0] = fds[0].fd;
    errpipe[0] = fds[1].fd;
  }

  // both streams are closed; the process should be exiting
  while (!ret.timed_out) {
    pid_t res = waitpid(pid, &status, WNOHANG);
    if (res == pid) {
      reaped = true;
      break;
    }
    if (res < 0 && errno != EINTR) {
      spdlog::warn("waitpid failed: {}", strerror(errno));
      break;
    }
    if (has_deadline && Clock::now() >= deadline) {
      ret.timed_out = true;
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  if (ret.timed_out) {
    spdlog::debug("Killing process group {}", pid);
    KillGroup(pid);
  }
  if (!reaped) {
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR);
  }
  if (!ret.timed_out) {
    if (WIFEXITED(status)) {
      ret.exited = true;
      ret.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
      ret.term_signal = WTERMSIG(status);
    }
  }
  goto done;

err:
  ret.error = errno;
  spdlog::warn("SandboxExec error: errno={} {}", errno, strerror(errno));
done:
  CloseFd(outpipe[0]);
  CloseFd(outpipe[1]);
  CloseFd(errpipe[0]);
  CloseFd(errpipe[1]);
  CloseFd(execpipe[0]);
  CloseFd(execpipe[1]);
  ret.elapsed_ms = MsSince(start);
  return ret;
}
