#pragma once
#include <chrono>
#include <string>
#include <vector>

namespace wattrec::util {

struct CommandResult {
  bool started{false};    // fork/exec succeeded
  bool timed_out{false};  // child was killed at the deadline
  int  exit_code{-1};     // 128+signal when terminated by a signal
  std::string out;        // captured stdout (stderr is discarded)

  [[nodiscard]] bool ok() const { return started && !timed_out && exit_code == 0; }
};

// Run argv[0] (PATH lookup) with stdin and stderr on /dev/null, collecting
// stdout. The child runs in its own process group, which is killed with
// SIGKILL once 'timeout' elapses.
[[nodiscard]] CommandResult run_with_timeout(const std::vector<std::string>& argv,
                                             std::chrono::milliseconds timeout);

} // namespace wattrec::util
