#include <sdcron/generator.hpp>
#include <sdcron/metadata.hpp>

#include <fmt/format.h>
#include <xxhash.h>

#include <new>
#include <sstream>

namespace sdcron {

// systemd expands %-specifiers in most settings
static std::string escape_specifiers(const std::string &s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    if (c == '%')
      out += "%%";
    else
      out.push_back(c);
  }
  return out;
}

static std::string quote_environment(const std::string &entry) {
  std::string out = "\"";
  for (char c : entry) {
    if (c == '"' || c == '\\')
      out.push_back('\\');
    if (c == '%')
      out += "%%";
    else
      out.push_back(c);
  }
  out.push_back('"');
  return out;
}

static std::string render_exec(const ManagedUnit &u) {
  const auto *svc = u.service();
  std::ostringstream o;

  o << "[Unit]\n";
  o << "Description=" << kUnitPrefix << u.name << ": "
    << escape_specifiers(u.description ? *u.description : u.command) << "\n";
  if (svc)
    o << "After=network-online.target\n";
  o << "\n[Service]\n";
  o << "Type=" << (svc ? "simple" : "oneshot") << "\n";
  if (u.exec_start_pre)
    o << "ExecStartPre=" << quote_exec_line(*u.exec_start_pre) << "\n";
  o << "ExecStart=" << quote_exec_line(u.command) << "\n";
  if (u.exec_stop_post)
    o << "ExecStopPost=" << quote_exec_line(*u.exec_stop_post) << "\n";
  o << "WorkingDirectory=" << escape_specifiers(u.workdir) << "\n";
  if (svc) {
    o << "Restart=" << to_string(svc->restart) << "\n";
    o << "RestartSec=5\n";
    if (svc->env_file)
      o << "EnvironmentFile=" << escape_specifiers(*svc->env_file) << "\n";
  }
  for (const auto &e : u.environment)
    o << "Environment=" << quote_environment(e) << "\n";
  if (u.memory_max)
    o << "MemoryMax=" << *u.memory_max << "\n";
  if (u.cpu_quota)
    o << "CPUQuota=" << *u.cpu_quota << "\n";
  if (u.io_weight)
    o << "IOWeight=" << *u.io_weight << "\n";
  if (u.stop_timeout)
    o << "TimeoutStopSec=" << *u.stop_timeout << "\n";
  if (u.log_level_max)
    o << "LogLevelMax=" << *u.log_level_max << "\n";
  if (svc)
    o << "\n[Install]\nWantedBy=default.target\n";

  o << "\n" << encode_metadata(u);
  return o.str();
}

static std::string render_trigger(const ManagedUnit &u, const TimerJob &t,
                                  const std::string &trigger) {
  std::ostringstream o;
  o << "[Unit]\n";
  o << "Description=" << kUnitPrefix << u.name << " timer\n";
  o << "\n[Timer]\n";
  o << trigger << "\n";
  o << "Persistent=true\n";
  if (t.random_delay)
    o << "RandomizedDelaySec=" << *t.random_delay << "\n";
  o << "\n[Install]\nWantedBy=timers.target\n";
  return o.str();
}

UnitFiles generate_unit_files(const ManagedUnit &u) {
  UnitFiles f;
  f.exec_text = render_exec(u);
  if (auto *t = u.timer()) {
    if (auto line = trigger_line(t->schedule))
      f.trigger_text = render_trigger(u, *t, *line);
  }
  return f;
}

std::uint64_t fingerprint(const UnitFiles &f) {
  XXH3_state_t *st = XXH3_createState();
  if (!st)
    throw std::bad_alloc();
  XXH3_64bits_reset(st);
  XXH3_64bits_update(st, f.exec_text.data(), f.exec_text.size());
  if (f.trigger_text) {
    const char sep = '\0';
    XXH3_64bits_update(st, &sep, 1);
    XXH3_64bits_update(st, f.trigger_text->data(), f.trigger_text->size());
  }
  auto h = XXH3_64bits_digest(st);
  XXH3_freeState(st);
  return h;
}

std::string fingerprint_hex(const UnitFiles &f) {
  return fmt::format("{:016x}", fingerprint(f));
}

} // namespace sdcron
