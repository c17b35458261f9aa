#pragma once
#include <string>
#include <vector>

namespace sdcron {

struct CommandResult {
  int exit_code{-1};
  std::string out;
  std::string err;

  bool ok() const { return exit_code == 0; }
};

// fork/execvp argv[0] (PATH lookup), capturing both output streams.
// Throws std::runtime_error when the program cannot be started.
CommandResult run_command(const std::vector<std::string> &argv);

// Replaces the current process image; only returns by throwing.
[[noreturn]] void exec_replace(const std::vector<std::string> &argv);

} // namespace sdcron
