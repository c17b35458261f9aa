#include <sdcron/unit.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <iterator>
#include <stdexcept>
#include <string_view>

namespace sdcron {

const char *to_string(RestartPolicy r) {
  switch (r) {
  case RestartPolicy::Always:
    return "always";
  case RestartPolicy::OnFailure:
    return "on-failure";
  case RestartPolicy::Never:
    return "no";
  }
  return "always";
}

const char *to_string(UnitKind k) {
  return k == UnitKind::Service ? "service" : "timer";
}

std::optional<RestartPolicy> parse_restart(std::string v) {
  for (auto &ch : v)
    ch = (char)std::tolower((unsigned char)ch);
  if (v == "always")
    return RestartPolicy::Always;
  if (v == "on-failure" || v == "onfailure")
    return RestartPolicy::OnFailure;
  if (v == "no" || v == "never")
    return RestartPolicy::Never;
  return std::nullopt;
}

TimerJob TimerJob::compile(std::string cron) {
  TimerJob t;
  t.schedule = compile_schedule(cron);
  if (is_persistent_service(t.schedule))
    throw std::invalid_argument("'@service' is not a timer schedule");
  t.cron = std::move(cron);
  return t;
}

Schedule ManagedUnit::schedule() const {
  if (auto *t = timer())
    return t->schedule;
  return PersistentService{};
}

std::string ManagedUnit::schedule_expr() const {
  if (auto *t = timer())
    return t->cron;
  return "@service";
}

std::string exec_file_name(const std::string &name) {
  return kUnitPrefix + name + ".service";
}

std::string trigger_file_name(const std::string &name) {
  return kUnitPrefix + name + ".timer";
}

std::string ManagedUnit::exec_unit() const { return exec_file_name(name); }
std::string ManagedUnit::trigger_unit() const { return trigger_file_name(name); }

std::string ManagedUnit::control_unit() const {
  return is_service() ? exec_unit() : trigger_unit();
}

bool valid_unit_name(const std::string &name) {
  if (name.empty() || name.front() == '.' || name.front() == '-')
    return false;
  return std::all_of(name.begin(), name.end(), [](char c) {
    return std::isalnum((unsigned char)c) || c == '_' || c == '-' || c == '.';
  });
}

std::string derive_name(const std::string &command) {
  static const char *runners[] = {"python", "python3", "uv",   "node",
                                  "bash",   "sh",      "ruby", "perl"};
  static const char *extensions[] = {".py", ".sh", ".rb", ".js", ".ts"};

  auto base = [](const std::string &p) {
    auto slash = p.rfind('/');
    return slash == std::string::npos ? p : p.substr(slash + 1);
  };

  auto words = split_command(command);
  if (words.empty())
    return "task";

  std::string candidate = words[0];
  if (words.size() >= 2) {
    auto first = base(words[0]);
    if (std::find(std::begin(runners), std::end(runners), first) !=
        std::end(runners))
      candidate = (first == "uv" && words.size() >= 3 && words[1] == "run")
                      ? words[2]
                      : words[1];
  }

  std::string name = base(candidate);
  for (auto *ext : extensions) {
    std::string_view e(ext);
    if (name.size() >= e.size() &&
        name.compare(name.size() - e.size(), e.size(), e) == 0) {
      name.resize(name.size() - e.size());
      break;
    }
  }
  name.erase(0, name.find_first_not_of('.'));
  name.erase(0, name.find_first_not_of('-'));
  for (auto &c : name)
    if (!std::isalnum((unsigned char)c) && c != '_' && c != '-' && c != '.')
      c = '_';
  return name.empty() ? "task" : name;
}

static bool has_newline(const std::string &s) {
  return s.find_first_of("\r\n") != std::string::npos;
}

static bool all_digits(const std::string &s) {
  return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) {
    return std::isdigit((unsigned char)c);
  });
}

static bool valid_memory(const std::string &v) {
  if (v == "infinity")
    return true;
  std::string n = v;
  if (!n.empty() && (n.back() == '%' || std::strchr("KMGTkmgt", n.back())))
    n.pop_back();
  return all_digits(n);
}

static bool valid_cpu_quota(const std::string &v) {
  return v.size() > 1 && v.back() == '%' && all_digits(v.substr(0, v.size() - 1));
}

static bool valid_log_level(const std::string &v) {
  static const char *levels[] = {"emerg",  "alert", "crit", "err",
                                 "warning", "notice", "info", "debug"};
  for (auto *l : levels)
    if (v == l)
      return true;
  return v.size() == 1 && v[0] >= '0' && v[0] <= '7';
}

static bool valid_env(const std::string &e) {
  auto eq = e.find('=');
  if (eq == std::string::npos || eq == 0)
    return false;
  if (std::isdigit((unsigned char)e[0]))
    return false;
  return std::all_of(e.begin(), e.begin() + eq, [](char c) {
    return std::isalnum((unsigned char)c) || c == '_';
  });
}

// every quote closed and no dangling backslash
static bool balanced_command(const std::string &s) {
  bool in_single = false, in_double = false, esc = false;
  for (char c : s) {
    if (esc)
      esc = false;
    else if (c == '\\' && !in_single)
      esc = true;
    else if (c == '\'' && !in_double)
      in_single = !in_single;
    else if (c == '"' && !in_single)
      in_double = !in_double;
  }
  return !in_single && !in_double && !esc;
}

void ManagedUnit::validate() const {
  auto fail = [&](const std::string &msg) {
    throw std::invalid_argument(fmt::format("unit '{}': {}", name, msg));
  };

  if (!valid_unit_name(name))
    fail("invalid name (allowed: letters, digits, '_', '-', '.')");

  auto single_line = [&](const char *field, const std::optional<std::string> &v) {
    if (v && has_newline(*v))
      fail(fmt::format("{} must be a single line", field));
    if (v && v->empty())
      fail(fmt::format("{} must not be empty", field));
  };

  if (has_newline(command))
    fail("command must be a single line");
  if (split_command(command).empty())
    fail("command is empty");
  if (!balanced_command(command))
    fail("command has an unterminated quote or trailing backslash");
  if (workdir.empty() || workdir.front() != '/' || has_newline(workdir))
    fail(fmt::format("workdir '{}' must be an absolute path", workdir));
  if (description && has_newline(*description))
    fail("description must be a single line");

  single_line("memory_max", memory_max);
  single_line("cpu_quota", cpu_quota);
  single_line("stop_timeout", stop_timeout);
  single_line("exec_start_pre", exec_start_pre);
  single_line("exec_stop_post", exec_stop_post);
  single_line("log_level_max", log_level_max);

  if (memory_max && !valid_memory(*memory_max))
    fail(fmt::format("memory_max '{}' is not a size", *memory_max));
  if (cpu_quota && !valid_cpu_quota(*cpu_quota))
    fail(fmt::format("cpu_quota '{}' must look like '50%'", *cpu_quota));
  if (io_weight && (*io_weight < 1 || *io_weight > 10000))
    fail(fmt::format("io_weight {} is outside 1-10000", *io_weight));
  if (log_level_max && !valid_log_level(*log_level_max))
    fail(fmt::format("log_level_max '{}' is not a syslog level",
                     *log_level_max));
  if (exec_start_pre && split_command(*exec_start_pre).empty())
    fail("exec_start_pre is empty");
  if (exec_stop_post && split_command(*exec_stop_post).empty())
    fail("exec_stop_post is empty");
  if (exec_start_pre && !balanced_command(*exec_start_pre))
    fail("exec_start_pre has an unterminated quote or trailing backslash");
  if (exec_stop_post && !balanced_command(*exec_stop_post))
    fail("exec_stop_post has an unterminated quote or trailing backslash");

  for (const auto &e : environment)
    if (has_newline(e) || !valid_env(e))
      fail(fmt::format("environment entry '{}' must be KEY=VALUE", e));

  for (const auto &[k, v] : extra_metadata)
    if (k.empty() || k.find('=') != std::string::npos || has_newline(k) ||
        (v && has_newline(*v)))
      fail(fmt::format("metadata key '{}' is malformed", k));

  if (auto *t = timer()) {
    if (has_newline(t->cron))
      fail("schedule must be a single line");
    if (is_persistent_service(t->schedule))
      fail("a timer cannot use '@service'");
    single_line("random_delay", t->random_delay);
  } else if (auto *s = service()) {
    single_line("env_file", s->env_file);
    if (s->env_file && s->env_file->front() != '/')
      fail(fmt::format("env_file '{}' must be an absolute path", *s->env_file));
  }
}

bool ManagedUnit::operator==(const ManagedUnit &o) const {
  return name == o.name && job == o.job && command == o.command &&
         workdir == o.workdir && description == o.description &&
         memory_max == o.memory_max && cpu_quota == o.cpu_quota &&
         io_weight == o.io_weight && stop_timeout == o.stop_timeout &&
         exec_start_pre == o.exec_start_pre &&
         exec_stop_post == o.exec_stop_post &&
         log_level_max == o.log_level_max && environment == o.environment &&
         extra_metadata == o.extra_metadata;
}

std::vector<std::string> split_command(const std::string &s) {
  std::vector<std::string> out;
  std::string cur;
  bool in_single = false, in_double = false, esc = false, have = false;
  for (char c : s) {
    if (esc) { cur.push_back(c); esc = false; continue; }
    if (c == '\\' && !in_single) { esc = true; have = true; continue; }
    if (c == '\'' && !in_double) { in_single = !in_single; have = true; continue; }
    if (c == '"' && !in_single) { in_double = !in_double; have = true; continue; }
    if (!in_single && !in_double && (c == ' ' || c == '\t')) {
      if (have) { out.push_back(cur); cur.clear(); have = false; }
      continue;
    }
    cur.push_back(c);
    have = true;
  }
  if (have)
    out.push_back(cur);
  return out;
}

static bool safe_exec_char(char c) {
  return std::isalnum((unsigned char)c) ||
         std::strchr("-_./=:,+@~$%", c) != nullptr;
}

std::string quote_exec_arg(const std::string &arg) {
  bool plain = !arg.empty() && std::all_of(arg.begin(), arg.end(), safe_exec_char);
  std::string out;
  if (!plain)
    out.push_back('"');
  for (char c : arg) {
    if (c == '%')
      out += "%%";
    else if (!plain && (c == '"' || c == '\\'))
      out += {'\\', c};
    else
      out.push_back(c);
  }
  if (!plain)
    out.push_back('"');
  return out;
}

std::string quote_exec_line(const std::string &command) {
  std::string out;
  for (const auto &arg : split_command(command)) {
    if (!out.empty())
      out.push_back(' ');
    out += quote_exec_arg(arg);
  }
  return out;
}

} // namespace sdcron
