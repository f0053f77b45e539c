#include "util/Subprocess.hpp"

#ifndef _WIN32
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <thread>
#endif

namespace wattrec::util {

#ifdef _WIN32

// Only the macOS power backend spawns helpers; nothing to run here.
CommandResult run_with_timeout(const std::vector<std::string>&, std::chrono::milliseconds) {
  return CommandResult{};
}

#else

static int decode_status(int status) {
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return -1;
}

CommandResult run_with_timeout(const std::vector<std::string>& argv,
                               std::chrono::milliseconds timeout) {
  CommandResult res;
  if (argv.empty()) return res;

  int fds[2];
  if (::pipe(fds) != 0) return res;

  std::vector<char*> args;
  args.reserve(argv.size() + 1);
  for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
  args.push_back(nullptr);

  pid_t pid = ::fork();
  if (pid < 0) {
    ::close(fds[0]); ::close(fds[1]);
    return res;
  }
  if (pid == 0) {
    // own process group, so a timeout also reaches whatever sudo spawned
    ::setpgid(0, 0);
    int devnull = ::open("/dev/null", O_RDWR);
    if (devnull >= 0) {
      ::dup2(devnull, STDIN_FILENO);
      ::dup2(devnull, STDERR_FILENO);
    }
    ::dup2(fds[1], STDOUT_FILENO);
    ::close(fds[0]); ::close(fds[1]);
    ::execvp(args[0], args.data());
    ::_exit(127);
  }

  ::setpgid(pid, pid); // either side may win the race; both set the same group
  ::close(fds[1]);
  res.started = true;
  using clock = std::chrono::steady_clock;
  const auto deadline = clock::now() + timeout;

  bool eof = false;
  char buf[4096];
  while (!eof) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now()).count();
    if (left <= 0) { res.timed_out = true; break; }
    struct pollfd pfd{fds[0], POLLIN, 0};
    int rv = ::poll(&pfd, 1, static_cast<int>(left));
    if (rv < 0) {
      if (errno == EINTR) continue;
      break;
    }
    if (rv == 0) continue; // re-evaluates the deadline
    ssize_t n = ::read(fds[0], buf, sizeof(buf));
    if (n > 0) res.out.append(buf, static_cast<size_t>(n));
    else if (n == 0) eof = true;
    else if (errno != EINTR && errno != EAGAIN) break;
  }
  ::close(fds[0]);

  // stdout closed; give the child until the deadline to exit
  int status = 0;
  while (!res.timed_out) {
    pid_t w = ::waitpid(pid, &status, WNOHANG);
    if (w == pid) { res.exit_code = decode_status(status); return res; }
    if (w < 0 && errno != EINTR) { res.exit_code = -1; return res; }
    if (clock::now() >= deadline) { res.timed_out = true; break; }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }

  ::kill(-pid, SIGKILL);
  while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
  res.exit_code = decode_status(status);
  res.out.clear();
  return res;
}

#endif

} // namespace wattrec::util
