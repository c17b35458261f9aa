#include <sdcron/config.hpp>

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <stdexcept>

namespace fs = std::filesystem;

namespace sdcron {

static const char *env_or_null(const char *name) {
  const char *v = ::getenv(name);
  return (v && *v) ? v : nullptr;
}

Config Config::from_env() {
  Config c;
  if (const char *d = env_or_null("SDCRON_UNIT_DIR"))
    c.unit_dir = d;
  else if (const char *x = env_or_null("XDG_CONFIG_HOME"))
    c.unit_dir = fs::path(x) / "systemd" / "user";
  else if (const char *h = env_or_null("HOME"))
    c.unit_dir = fs::path(h) / ".config" / "systemd" / "user";
  else
    throw std::runtime_error(
        "cannot locate the unit directory: set HOME or SDCRON_UNIT_DIR");

  if (const char *l = env_or_null("SDCRON_LOG_LEVEL")) {
    auto lvl = spdlog::level::from_str(l);
    // from_str maps anything unknown to off
    if (lvl == spdlog::level::off && std::string(l) != "off") {
      spdlog::warn("SDCRON_LOG_LEVEL={} is not a level, using info", l);
      lvl = spdlog::level::info;
    }
    c.log_level = lvl;
  }
  if (const char *s = env_or_null("SDCRON_SYSTEMCTL"))
    c.systemctl = s;
  if (const char *j = env_or_null("SDCRON_JOURNALCTL"))
    c.journalctl = j;
  return c;
}

void setup_logging(const Config &cfg) {
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  spdlog::set_level(cfg.log_level);
}

} // namespace sdcron
