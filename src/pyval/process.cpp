#include "process.h"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <chrono>
#include <cstring>
#include <algorithm>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include "utils.h"

namespace {

inline long MonotonicUs() {
  auto now = std::chrono::steady_clock::now().time_since_epoch();
  return std::chrono::duration_cast<std::chrono::microseconds>(now).count();
}

inline void CloseFd(int& fd) {
  if (fd >= 0) close(fd);
  fd = -1;
}

// An unlinked temp file, so that a large input never blocks on a full pipe
int InputFile(const std::string& input) {
  char path[] = "/tmp/pyval_input.XXXXXX";
  int fd = mkstemp(path);
  if (fd < 0) return -1;
  unlink(path);
  for (size_t written = 0; written < input.size();) {
    ssize_t ret = write(fd, input.data() + written, input.size() - written);
    if (ret < 0) {
      if (errno == EINTR) continue;
      goto err;
    }
    written += ret;
  }
  if (lseek(fd, 0, SEEK_SET) < 0) goto err;
  return fd;
err:
  int saved_errno = errno;
  close(fd);
  errno = saved_errno;
  return -1;
}

// false on EOF or error
bool Drain(int fd, std::string& buf, size_t limit, bool& truncated) {
  char tmp[65536];
  ssize_t ret = read(fd, tmp, sizeof(tmp));
  if (ret < 0 && (errno == EINTR || errno == EAGAIN)) return true;
  if (ret <= 0) return false;
  size_t room = buf.size() < limit ? limit - buf.size() : 0;
  if (static_cast<size_t>(ret) > room) truncated = true;
  buf.append(tmp, std::min(room, static_cast<size_t>(ret)));
  return true;
}

} // namespace

ProcessResult RunProcess(const ProcessOptions& opt) {
  ProcessResult ret{};
  int infd = -1, outpipe[2] = {-1, -1}, errpipe[2] = {-1, -1};
  std::vector<char*> argv;
  pid_t pid;
  if (opt.command.empty()) {
    errno = EINVAL;
    goto err;
  }
  for (auto& i : opt.command) argv.push_back(const_cast<char*>(i.c_str()));
  argv.push_back(nullptr);
  if ((infd = InputFile(opt.input)) < 0) goto err;
  if (pipe2(outpipe, O_CLOEXEC) < 0 || pipe2(errpipe, O_CLOEXEC) < 0) goto err;
  pid = fork();
  if (pid < 0) goto err;
  if (pid == 0) {
    setpgid(0, 0);
    signal(SIGPIPE, SIG_DFL);
    if (dup2(infd, 0) < 0 || dup2(outpipe[1], 1) < 0 || dup2(errpipe[1], 2) < 0) _exit(127);
    CloseFrom(3);
    execvp(argv[0], argv.data());
    _exit(127);
  }
  {
    // both sides set the group to avoid racing the child's exec
    setpgid(pid, pid);
    CloseFd(infd);
    CloseFd(outpipe[1]);
    CloseFd(errpipe[1]);
    spdlog::debug("RunProcess pid={} command={}", pid, fmt::format("{}", opt.command));

    long start = MonotonicUs();
    long deadline = opt.wall_time > 0 ? start + opt.wall_time : 0;
    struct pollfd fds[2] = {{outpipe[0], POLLIN, 0}, {errpipe[0], POLLIN, 0}};
    int open_streams = 2;
    int status = 0;
    bool reaped = false;
    while (true) {
      long now = MonotonicUs();
      if (deadline && now >= deadline) {
        ret.timed_out = true;
        break;
      }
      if (!open_streams) {
        pid_t wret = waitpid(pid, &status, WNOHANG);
        if (wret == pid) {
          reaped = true;
          break;
        }
        if (wret < 0 && errno != EINTR) {
          spdlog::warn("waitpid failed on {}: {}", pid, strerror(errno));
          break;
        }
        usleep(deadline ? std::min(10'000L, deadline - now) : 10'000L);
        continue;
      }
      int timeout_ms = deadline ? static_cast<int>(std::max(1L, (deadline - now + 999) / 1000)) : -1;
      int pret = poll(fds, 2, timeout_ms);
      if (pret < 0) {
        if (errno == EINTR) continue;
        spdlog::warn("poll failed on {}: {}", pid, strerror(errno));
        break;
      }
      for (int i = 0; i < 2; i++) {
        if (fds[i].fd < 0 || !fds[i].revents) continue;
        std::string& buf = i == 0 ? ret.out : ret.err;
        if (!Drain(fds[i].fd, buf, opt.max_output, ret.output_truncated)) {
          close(fds[i].fd);
          fds[i].fd = -1;
          open_streams--;
        }
      }
    }
    if (!reaped) {
      kill(-pid, SIGKILL);
      kill(pid, SIGKILL);
      while (waitpid(pid, &status, 0) < 0 && errno == EINTR);
    }
    for (auto& i : fds) CloseFd(i.fd);
    ret.status = status;
    ret.elapsed = MonotonicUs() - start;
    if (ret.timed_out) {
      spdlog::info("Process {} killed after {} ms", pid, ret.elapsed / 1000);
    } else {
      spdlog::debug("Process {} finished: status={} elapsed={}us", pid, status, ret.elapsed);
    }
  }
  return ret;
err:
  ret.error = errno;
  ret.spawn_failed = true;
  spdlog::warn("RunProcess error: errno={} {}", errno, strerror(errno));
  CloseFd(infd);
  for (int* i : {&outpipe[0], &outpipe[1], &errpipe[0], &errpipe[1]}) CloseFd(*i);
  return ret;
}
