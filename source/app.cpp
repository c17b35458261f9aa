#include <sdcron/app.hpp>
#include <sdcron/cli.hpp>
#include <sdcron/config.hpp>
#include <sdcron/io.hpp>
#include <sdcron/journal.hpp>
#include <sdcron/manifest.hpp>
#include <sdcron/reconciler.hpp>
#include <sdcron/schedule.hpp>
#include <sdcron/state.hpp>
#include <sdcron/systemctl.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

#ifndef SDCRON_VERSION
#define SDCRON_VERSION "unknown"
#endif
#ifndef SDCRON_COMMIT
#define SDCRON_COMMIT "unknown"
#endif

namespace fs = std::filesystem;

namespace sdcron {

static void print_help() {
  std::cout <<
      R"(sdcron - crontab-style jobs as systemd user units

Usage:
  sdcron add <schedule> <command> [--name N] [--workdir D]
             [--description T] [--env-file F] [--restart P]
  sdcron apply <manifest.toml> [--prune] [--dry-run]
  sdcron export [--output <file>]
  sdcron list
  sdcron status <name>
  sdcron logs <name> [--follow] [--lines N] [--priority P]
  sdcron restart|enable|disable|remove <name>
  sdcron schedule <expression>
  sdcron init

Schedules: "m h dom mon dow", @reboot, @service, @hourly, @daily[/H[:M]],
  @weekly, @monthly, @yearly, @monday..@sunday[/H[:M]], @1st..@31st[/H[:M]]

Environment: SDCRON_UNIT_DIR, SDCRON_LOG_LEVEL, SDCRON_SYSTEMCTL,
  SDCRON_JOURNALCTL
)";
}

static std::string unit_detail(const ManagedUnit &u) {
  return fmt::format("{} [{}] {}", to_string(u.kind()), u.schedule_expr(),
                     u.command);
}

static void print_plan(const Plan &plan) {
  for (const auto &e : plan.entries) {
    const auto &u = e.after ? *e.after : *e.before;
    std::cout << fmt::format("{} {:<20} {}\n", diff_symbol(e.status), e.name,
                             unit_detail(u));
  }
  for (const auto &n : plan.unmanaged)
    std::cout << fmt::format("? {:<20} not in manifest (--prune removes it)\n",
                             n);
  for (const auto &c : plan.corrupt)
    std::cout << fmt::format("! {:<20} {}\n", c.name, c.reason);
}

// Plan against an empty state when the directory does not exist yet.
static InstalledState scan_or_empty(const UnitStore &store) {
  std::error_code ec;
  if (!fs::exists(store.dir(), ec))
    return {};
  return store.scan();
}

static const ManagedUnit &find_unit(const InstalledState &st,
                                    const std::string &name) {
  auto it = st.units.find(name);
  if (it == st.units.end())
    throw std::runtime_error(st.is_corrupt(name)
                                 ? fmt::format("'{}' is corrupt; see list", name)
                                 : fmt::format("'{}' not found", name));
  return it->second;
}

static std::string property_or(ServiceControl &ctl, const std::string &unit,
                               const char *prop, const char *fallback) {
  try {
    auto v = ctl.show_property(unit, prop);
    return v.empty() ? fallback : v;
  } catch (const ControlError &e) {
    spdlog::debug("[unit={}] {}: {}", unit, prop, e.what());
    return fallback;
  }
}

static int cmd_apply(const Config &cfg, const CmdApply &c) {
  auto desired = load_manifest(c.file);
  SystemctlControl ctl(cfg.systemctl);
  UnitStore store(cfg.unit_dir);
  if (!c.dry_run)
    io::ensure_dir(store.dir());
  Reconciler rec(store, ctl);

  auto plan = plan_changes(desired, scan_or_empty(store), c.prune);
  print_plan(plan);
  if (c.dry_run) {
    rec.apply(plan, {true, c.prune});
    std::cout << "(dry run: nothing changed)\n";
    return 0;
  }

  ApplySummary sum;
  try {
    sum = rec.apply(plan, {false, c.prune});
  } catch (const ApplyError &e) {
    std::cerr << "apply failed: " << e.what() << "\n";
    for (const auto &f : e.failures())
      std::cerr << fmt::format("  {}: {}\n", f.name, f.reason);
    return 1;
  }

  std::cout << fmt::format("{} added, {} changed, {} unchanged, {} removed\n",
                           sum.added, sum.changed, sum.unchanged, sum.removed);
  for (const auto &w : sum.warnings)
    std::cerr << fmt::format("warning {}: {}\n", w.name, w.reason);
  for (const auto &f : sum.failures)
    std::cerr << fmt::format("failed {}: {}\n", f.name, f.reason);
  return sum.ok() ? 0 : 1;
}

// Builds the unit for `add`; the workdir defaults to the current directory.
static ManagedUnit unit_from_add(const CmdAdd &c) {
  ManagedUnit u;
  u.name = c.name ? *c.name : derive_name(c.command);
  u.command = c.command;
  u.workdir = c.workdir ? *c.workdir : fs::current_path().string();
  u.description = c.description;

  if (is_persistent_service(compile_schedule(c.schedule))) {
    ServiceJob job;
    if (c.restart) {
      auto p = parse_restart(*c.restart);
      if (!p)
        throw std::runtime_error(fmt::format(
            "invalid restart policy '{}': use always, on-failure or no",
            *c.restart));
      job.restart = *p;
    }
    if (c.env_file) {
      std::error_code ec;
      if (!fs::is_regular_file(*c.env_file, ec))
        throw std::runtime_error(
            fmt::format("environment file not found: {}", *c.env_file));
      job.env_file = fs::absolute(*c.env_file).lexically_normal().string();
    }
    u.job = std::move(job);
  } else {
    if (c.restart || c.env_file)
      throw std::runtime_error("--restart and --env-file need '@service'");
    u.job = TimerJob::compile(c.schedule);
  }

  u.validate();
  return u;
}

static int cmd_add(const Config &cfg, const CmdAdd &c) {
  auto u = unit_from_add(c);
  io::ensure_dir(cfg.unit_dir);
  SystemctlControl ctl(cfg.systemctl);
  UnitStore store(cfg.unit_dir);
  Reconciler rec(store, ctl);

  try {
    rec.add(u);
  } catch (const ApplyError &e) {
    std::cerr << "add failed: " << e.what() << "\n";
    for (const auto &f : e.failures())
      std::cerr << fmt::format("  {}: {}\n", f.name, f.reason);
    return 1;
  }

  std::cout << fmt::format("Created: {}\n", store.exec_path(u.name).string());
  if (!u.is_service())
    std::cout << fmt::format("Created: {}\n",
                             store.trigger_path(u.name).string());
  std::cout << fmt::format("{} '{}' is now active.\n",
                           u.is_service() ? "Service" : "Timer", u.name);
  std::cout << fmt::format("  Schedule: {}\n", u.schedule_expr());
  std::cout << fmt::format("  Command:  {}\n", u.command);
  if (auto *s = u.service())
    std::cout << fmt::format("  Restart:  {}\n", to_string(s->restart));
  return 0;
}

static int cmd_export(const Config &cfg, const CmdExport &c) {
  auto st = scan_or_empty(UnitStore(cfg.unit_dir));
  for (const auto &bad : st.corrupt)
    spdlog::warn("[unit={}] skipped: {}", bad.name, bad.reason);
  auto text = export_manifest(st.units);
  if (c.output) {
    io::write_file(*c.output, text);
    std::cout << fmt::format("exported {} units to {}\n", st.units.size(),
                             *c.output);
  } else {
    std::cout << text;
  }
  return 0;
}

static int cmd_list(const Config &cfg) {
  auto st = scan_or_empty(UnitStore(cfg.unit_dir));
  if (st.units.empty() && st.corrupt.empty()) {
    std::cout << "No timers or services found.\n";
    return 0;
  }

  SystemctlControl ctl(cfg.systemctl);
  struct Row {
    std::string name, type, schedule, command, status;
  };
  std::vector<Row> rows;
  for (const auto &[name, u] : st.units) {
    std::string status =
        u.is_service()
            ? property_or(ctl, u.exec_unit(), "ActiveState", "unknown")
            : property_or(ctl, u.trigger_unit(), "NextElapseUSecRealtime", "-");
    rows.push_back({name, to_string(u.kind()), u.schedule_expr(), u.command,
                    status});
  }
  for (const auto &c : st.corrupt)
    rows.push_back({c.name, "corrupt", "-", c.reason, "-"});

  size_t nw = 4, sw = 8, cw = 7;
  for (const auto &r : rows) {
    nw = std::max(nw, r.name.size());
    sw = std::max(sw, r.schedule.size());
    cw = std::max(cw, r.command.size());
  }
  std::cout << fmt::format("{:<{}}  {:<7}  {:<{}}  {:<{}}  STATUS\n", "NAME", nw,
                           "TYPE", "SCHEDULE", sw, "COMMAND", cw);
  for (const auto &r : rows)
    std::cout << fmt::format("{:<{}}  {:<7}  {:<{}}  {:<{}}  {}\n", r.name, nw,
                             r.type, r.schedule, sw, r.command, cw, r.status);
  return 0;
}

static int cmd_status(const Config &cfg, const CmdStatus &c) {
  auto st = UnitStore(cfg.unit_dir).scan();
  const auto &u = find_unit(st, c.name);
  SystemctlControl ctl(cfg.systemctl);

  std::cout << fmt::format("Name:     {}\n", u.name);
  std::cout << fmt::format("Type:     {}\n", to_string(u.kind()));
  std::cout << fmt::format("Schedule: {}\n", u.schedule_expr());
  if (auto line = trigger_line(u.schedule()))
    std::cout << fmt::format("Trigger:  {}\n", *line);
  std::cout << fmt::format("Command:  {}\n", u.command);
  std::cout << fmt::format("WorkDir:  {}\n", u.workdir);
  if (u.is_service()) {
    std::cout << fmt::format(
        "Status:   {} ({})\n",
        property_or(ctl, u.exec_unit(), "ActiveState", "unknown"),
        property_or(ctl, u.exec_unit(), "SubState", "unknown"));
  } else {
    std::cout << fmt::format(
        "Status:   {}\n",
        property_or(ctl, u.trigger_unit(), "ActiveState", "unknown"));
    std::cout << fmt::format(
        "Next:     {}\n",
        property_or(ctl, u.trigger_unit(), "NextElapseUSecRealtime", "n/a"));
    std::cout << fmt::format(
        "Result:   {}\n", property_or(ctl, u.exec_unit(), "Result", "n/a"));
  }
  std::cout << "\n" << ctl.status(u.control_unit());
  return 0;
}

static int cmd_remove(const Config &cfg, const CmdRemove &c) {
  UnitStore store(cfg.unit_dir);
  SystemctlControl ctl(cfg.systemctl);
  auto st = store.scan();

  if (st.units.count(c.name) == 0 && st.is_corrupt(c.name)) {
    store.remove(c.name);
    ctl.daemon_reload();
    std::cout << fmt::format("removed corrupt unit {}\n", c.name);
    return 0;
  }

  Plan plan;
  plan.entries.push_back(
      {c.name, DiffStatus::Removed, find_unit(st, c.name), std::nullopt});
  Reconciler rec(store, ctl);
  auto sum = rec.apply(plan, {false, true});
  for (const auto &w : sum.warnings)
    std::cerr << fmt::format("warning: {}\n", w.reason);
  if (!sum.ok())
    return 1;
  std::cout << fmt::format("removed {}\n", c.name);
  return 0;
}

template <typename Action>
static int control_one(const Config &cfg, const std::string &name,
                       const char *verb, Action action) {
  auto st = UnitStore(cfg.unit_dir).scan();
  const auto &u = find_unit(st, name);
  SystemctlControl ctl(cfg.systemctl);
  action(ctl, u.control_unit());
  std::cout << fmt::format("{} {}\n", verb, u.control_unit());
  return 0;
}

static int cmd_schedule(const CmdSchedule &c) {
  Schedule s;
  try {
    s = compile_schedule(c.expr);
  } catch (const ScheduleError &e) {
    std::cerr << fmt::format("invalid schedule '{}': {}\n", c.expr, e.what());
    return 1;
  }
  if (auto line = trigger_line(s))
    std::cout << *line << "\n";
  else
    std::cout << "(no trigger: persistent service)\n";
  return 0;
}

static int cmd_init(const Config &cfg) {
  const char *user = ::getenv("USER");
  if (!user || !*user)
    throw std::runtime_error("cannot determine the current user ($USER)");

  std::cout << fmt::format("Enabling linger for user '{}'...\n", user);
  enable_linger(user);
  std::cout << fmt::format("Creating directory: {}\n", cfg.unit_dir.string());
  io::ensure_dir(cfg.unit_dir);
  SystemctlControl ctl(cfg.systemctl);
  ctl.daemon_reload();
  std::cout << "sdcron initialized.\n";
  return 0;
}

int App::run(int argc, char **argv) {
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

  auto pr = parse_cli(argc, argv);
  if (!pr.cmd) {
    if (!pr.error.empty())
      spdlog::error("{}", pr.error);
    print_help();
    return pr.error.empty() ? 0 : 2;
  }

  try {
    return std::visit(
        [&](auto &&c) -> int {
          using T = std::decay_t<decltype(c)>;

          if constexpr (std::is_same_v<T, CmdHelp>) {
            print_help();
            return 0;
          } else if constexpr (std::is_same_v<T, CmdVersion>) {
            std::cout << fmt::format("sdcron {} ({})\n", SDCRON_VERSION,
                                     SDCRON_COMMIT);
            return 0;
          } else if constexpr (std::is_same_v<T, CmdSchedule>) {
            return cmd_schedule(c);
          } else {
            auto cfg = Config::from_env();
            setup_logging(cfg);
            spdlog::debug("unit dir {}", cfg.unit_dir.string());

            if constexpr (std::is_same_v<T, CmdApply>) {
              return cmd_apply(cfg, c);
            } else if constexpr (std::is_same_v<T, CmdAdd>) {
              return cmd_add(cfg, c);
            } else if constexpr (std::is_same_v<T, CmdExport>) {
              return cmd_export(cfg, c);
            } else if constexpr (std::is_same_v<T, CmdList>) {
              return cmd_list(cfg);
            } else if constexpr (std::is_same_v<T, CmdStatus>) {
              return cmd_status(cfg, c);
            } else if constexpr (std::is_same_v<T, CmdLogs>) {
              auto st = UnitStore(cfg.unit_dir).scan();
              const auto &u = find_unit(st, c.name);
              tail_logs(cfg.journalctl, u.exec_unit(),
                        LogOptions{c.follow, c.lines, c.priority});
            } else if constexpr (std::is_same_v<T, CmdRemove>) {
              return cmd_remove(cfg, c);
            } else if constexpr (std::is_same_v<T, CmdRestart>) {
              return control_one(cfg, c.name, "restarted",
                                 [](ServiceControl &ctl, const std::string &u) {
                                   ctl.restart(u);
                                 });
            } else if constexpr (std::is_same_v<T, CmdEnable>) {
              return control_one(cfg, c.name, "enabled",
                                 [](ServiceControl &ctl, const std::string &u) {
                                   ctl.enable(u);
                                 });
            } else if constexpr (std::is_same_v<T, CmdDisable>) {
              return control_one(cfg, c.name, "disabled",
                                 [](ServiceControl &ctl, const std::string &u) {
                                   ctl.disable(u);
                                 });
            } else {
              static_assert(std::is_same_v<T, CmdInit>);
              return cmd_init(cfg);
            }
          }
        },
        *pr.cmd);
  } catch (const std::exception &e) {
    spdlog::error("{}", e.what());
    return 1;
  }
}

} // namespace sdcron
