#include <sdcron/journal.hpp>
#include <sdcron/process.hpp>

#include <spdlog/spdlog.h>

namespace sdcron {

std::vector<std::string> journal_argv(const std::string &journalctl,
                                      const std::string &unit,
                                      const LogOptions &opt) {
  std::vector<std::string> argv{journalctl,  "--user-unit", unit, "-n",
                                std::to_string(opt.lines), "--no-pager"};
  if (opt.follow)
    argv.push_back("-f");
  if (opt.priority) {
    argv.push_back("-p");
    argv.push_back(*opt.priority);
  }
  return argv;
}

void tail_logs(const std::string &journalctl, const std::string &unit,
               const LogOptions &opt) {
  spdlog::debug("[unit={}] tailing logs (follow={})", unit, opt.follow);
  exec_replace(journal_argv(journalctl, unit, opt));
}

} // namespace sdcron
