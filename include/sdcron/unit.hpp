#pragma once
#include <sdcron/schedule.hpp>

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace sdcron {

inline constexpr const char *kUnitPrefix = "sdcron-";

using MetadataEntry = std::pair<std::string, std::optional<std::string>>;

enum class RestartPolicy { Always, OnFailure, Never };
enum class UnitKind { Timer, Service };

const char *to_string(RestartPolicy r);
const char *to_string(UnitKind k);
// "always" | "on-failure" | "no" (also "never")
std::optional<RestartPolicy> parse_restart(std::string v);

struct TimerJob {
  std::string cron; // verbatim expression, kept for lossless re-editing
  Schedule schedule; // Calendar or Reboot
  std::optional<std::string> random_delay;

  // Throws ScheduleError; std::invalid_argument for "@service".
  static TimerJob compile(std::string cron);

  bool operator==(const TimerJob &o) const {
    return cron == o.cron && schedule == o.schedule &&
           random_delay == o.random_delay;
  }
};

struct ServiceJob {
  std::optional<std::string> env_file;
  RestartPolicy restart = RestartPolicy::Always;

  bool operator==(const ServiceJob &o) const {
    return env_file == o.env_file && restart == o.restart;
  }
};

struct ManagedUnit {
  std::string name;
  std::variant<TimerJob, ServiceJob> job;

  std::string command;
  std::string workdir;
  std::optional<std::string> description;

  // resource limits; unset means the scheduler's own default
  std::optional<std::string> memory_max;
  std::optional<std::string> cpu_quota;
  std::optional<unsigned> io_weight;
  std::optional<std::string> stop_timeout;

  std::optional<std::string> exec_start_pre;
  std::optional<std::string> exec_stop_post;
  std::optional<std::string> log_level_max;
  std::vector<std::string> environment; // KEY=VALUE

  // metadata keys this version does not understand, kept verbatim;
  // no value for a line that carried no '='
  std::vector<MetadataEntry> extra_metadata;

  UnitKind kind() const {
    return std::holds_alternative<ServiceJob>(job) ? UnitKind::Service
                                                   : UnitKind::Timer;
  }
  bool is_service() const { return kind() == UnitKind::Service; }
  const TimerJob *timer() const { return std::get_if<TimerJob>(&job); }
  const ServiceJob *service() const { return std::get_if<ServiceJob>(&job); }

  Schedule schedule() const;
  // "@service" for services, the cron expression otherwise
  std::string schedule_expr() const;

  std::string exec_unit() const;    // sdcron-<name>.service
  std::string trigger_unit() const; // sdcron-<name>.timer
  // the unit systemctl enables: the timer for timers, the service otherwise
  std::string control_unit() const;

  // Throws std::invalid_argument describing the first invalid field.
  void validate() const;

  bool operator==(const ManagedUnit &o) const;
  bool operator!=(const ManagedUnit &o) const { return !(*this == o); }
};

using DesiredManifest = std::map<std::string, ManagedUnit>;

std::string exec_file_name(const std::string &name);
std::string trigger_file_name(const std::string &name);
bool valid_unit_name(const std::string &name);
// Unit name guessed from a command: "uv run ./report.py" -> "report".
// Interpreters are skipped, the script extension dropped; "task" when
// nothing usable remains.
std::string derive_name(const std::string &command);

// shell-like word split honouring quotes and backslashes
std::vector<std::string> split_command(const std::string &s);
// one argument quoted for ExecStart= and friends
std::string quote_exec_arg(const std::string &arg);
std::string quote_exec_line(const std::string &command);

} // namespace sdcron
