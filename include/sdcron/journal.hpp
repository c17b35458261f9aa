#pragma once
#include <optional>
#include <string>
#include <vector>

namespace sdcron {

struct LogOptions {
  bool follow = false;
  unsigned lines = 50;
  std::optional<std::string> priority; // journalctl -p
};

std::vector<std::string> journal_argv(const std::string &journalctl,
                                      const std::string &unit,
                                      const LogOptions &opt);

// Replaces the process with journalctl; only returns by throwing.
[[noreturn]] void tail_logs(const std::string &journalctl,
                            const std::string &unit, const LogOptions &opt);

} // namespace sdcron
