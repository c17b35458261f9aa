#pragma once
#include <filesystem>
#include <string>

#include <spdlog/common.h>

namespace sdcron {

struct Config {
  std::filesystem::path unit_dir;
  spdlog::level::level_enum log_level = spdlog::level::info;
  std::string systemctl = "systemctl";
  std::string journalctl = "journalctl";

  // SDCRON_UNIT_DIR, XDG_CONFIG_HOME, HOME, SDCRON_LOG_LEVEL,
  // SDCRON_SYSTEMCTL, SDCRON_JOURNALCTL.  Throws std::runtime_error when
  // no unit directory can be derived.
  static Config from_env();
};

void setup_logging(const Config &cfg);

} // namespace sdcron
