#include <sdcron/process.hpp>
#include <sdcron/systemctl.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

namespace sdcron {

static std::string trim(std::string s) {
  auto ws = " \t\r\n";
  auto b = s.find_first_not_of(ws);
  if (b == std::string::npos)
    return {};
  auto e = s.find_last_not_of(ws);
  return s.substr(b, e - b + 1);
}

std::string SystemctlControl::run(const std::vector<std::string> &args) {
  std::vector<std::string> argv{binary_, "--user"};
  argv.insert(argv.end(), args.begin(), args.end());
  CommandResult r;
  try {
    r = run_command(argv);
  } catch (const std::runtime_error &e) {
    throw ControlError(e.what());
  }
  if (!r.ok())
    throw ControlError(fmt::format("systemctl --user {} failed: {}",
                                   fmt::join(args, " "), trim(r.err)));
  return trim(r.out);
}

void SystemctlControl::daemon_reload() {
  spdlog::debug("[systemctl] daemon-reload");
  run({"daemon-reload"});
}

void SystemctlControl::enable(const std::string &unit) {
  spdlog::debug("[systemctl] enable --now {}", unit);
  run({"enable", "--now", unit});
}

void SystemctlControl::disable(const std::string &unit) {
  spdlog::debug("[systemctl] disable --now {}", unit);
  run({"disable", "--now", unit});
}

void SystemctlControl::restart(const std::string &unit) {
  spdlog::debug("[systemctl] restart {}", unit);
  run({"restart", unit});
}

std::string SystemctlControl::status(const std::string &unit) {
  // exit code 3 only means "not running"
  CommandResult r;
  try {
    r = run_command({binary_, "--user", "status", "--no-pager", unit});
  } catch (const std::runtime_error &e) {
    throw ControlError(e.what());
  }
  if (r.out.empty() && !r.ok())
    throw ControlError(fmt::format("systemctl --user status {} failed: {}",
                                   unit, trim(r.err)));
  return r.out;
}

void SystemctlControl::remove_runtime_state(const std::string &unit) {
  CommandResult r;
  try {
    r = run_command({binary_, "--user", "reset-failed", unit});
  } catch (const std::runtime_error &e) {
    throw ControlError(e.what());
  }
  // a unit that never failed or is already unloaded has nothing to reset
  if (!r.ok())
    spdlog::debug("[systemctl] reset-failed {}: {}", unit, trim(r.err));
}

std::string SystemctlControl::show_property(const std::string &unit,
                                            const std::string &property) {
  return run({"show", "-p", property, "--value", unit});
}

void enable_linger(const std::string &user) {
  CommandResult r;
  try {
    r = run_command({"loginctl", "enable-linger", user});
  } catch (const std::runtime_error &e) {
    throw ControlError(e.what());
  }
  if (!r.ok())
    throw ControlError(fmt::format("loginctl enable-linger {} failed: {}", user,
                                   trim(r.err)));
}

} // namespace sdcron
