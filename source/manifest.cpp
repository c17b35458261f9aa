#include <sdcron/io.hpp>
#include <sdcron/manifest.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <toml++/toml.h>

#include <charconv>
#include <cstdint>
#include <optional>
#include <set>
#include <sstream>

namespace sdcron {

namespace {

const std::set<std::string> kCommonKeys = {
    "command",        "workdir",       "description",  "memory_max",
    "cpu_quota",      "io_weight",     "stop_timeout", "timeout_stop",
    "exec_start_pre", "exec_stop_post", "log_level_max", "env"};
const std::set<std::string> kTimerOnly = {"schedule", "random_delay"};
const std::set<std::string> kServiceOnly = {"restart", "env_file"};

class UnitReader {
public:
  UnitReader(std::string name, const toml::table &t, UnitKind kind)
      : name_(std::move(name)), t_(t), kind_(kind) {}

  ManagedUnit read() const {
    check_keys();

    ManagedUnit u;
    u.name = name_;
    if (kind_ == UnitKind::Timer) {
      auto expr = require_str("schedule");
      TimerJob job;
      try {
        job = TimerJob::compile(expr);
      } catch (const ScheduleError &e) {
        fail(fmt::format("schedule '{}': {}", expr, e.what()));
      } catch (const std::invalid_argument &) {
        fail("'@service' is only valid under [services]");
      }
      job.random_delay = get_str("random_delay");
      u.job = std::move(job);
    } else {
      ServiceJob job;
      if (auto s = get_str("schedule"); s && *s != "@service")
        fail("key 'schedule' is not allowed for a service");
      job.env_file = get_str("env_file");
      if (auto r = get_str("restart")) {
        auto p = parse_restart(*r);
        if (!p)
          fail(fmt::format("restart '{}' must be always, on-failure or no", *r));
        job.restart = *p;
      }
      u.job = std::move(job);
    }

    u.command = require_str("command");
    u.workdir = require_str("workdir");
    u.description = get_str("description");
    u.memory_max = get_str("memory_max");
    u.cpu_quota = get_str("cpu_quota");
    u.stop_timeout = get_str("stop_timeout");
    if (auto alias = get_str("timeout_stop")) {
      if (u.stop_timeout)
        fail("set either stop_timeout or timeout_stop, not both");
      u.stop_timeout = alias;
    }
    u.exec_start_pre = get_str("exec_start_pre");
    u.exec_stop_post = get_str("exec_stop_post");
    u.log_level_max = get_str("log_level_max");
    if (auto *n = t_.get("io_weight"))
      u.io_weight = read_io_weight(*n);
    if (auto *n = t_.get("env")) {
      auto *arr = n->as_array();
      if (!arr)
        fail("env must be an array of \"KEY=VALUE\" strings");
      for (auto &&el : *arr) {
        auto s = el.value<std::string>();
        if (!el.is_string() || !s)
          fail("env must be an array of \"KEY=VALUE\" strings");
        u.environment.push_back(*s);
      }
    }

    try {
      u.validate();
    } catch (const std::invalid_argument &e) {
      throw ManifestError(name_, e.what());
    }
    return u;
  }

private:
  [[noreturn]] void fail(const std::string &msg) const {
    throw ManifestError(name_, fmt::format("unit '{}': {}", name_, msg));
  }

  void check_keys() const {
    const auto &own = kind_ == UnitKind::Timer ? kTimerOnly : kServiceOnly;
    const auto &other = kind_ == UnitKind::Timer ? kServiceOnly : kTimerOnly;
    for (auto &&[k, v] : t_) {
      std::string key(k.str());
      if (kCommonKeys.count(key) || own.count(key))
        continue;
      // [services] may spell out schedule = "@service"
      if (key == "schedule" && kind_ == UnitKind::Service)
        continue;
      if (other.count(key))
        fail(fmt::format("key '{}' is not allowed for a {}", key,
                         to_string(kind_)));
      fail(fmt::format("unknown key '{}'", key));
    }
  }

  // an integer, or a string of digits as older manifests wrote it
  unsigned read_io_weight(const toml::node &n) const {
    std::optional<int64_t> v;
    if (n.is_integer()) {
      v = n.value<int64_t>();
    } else if (auto s = n.value<std::string>(); n.is_string() && s &&
                                                 !s->empty() && s->size() <= 5) {
      int64_t parsed = 0;
      auto [p, ec] = std::from_chars(s->data(), s->data() + s->size(), parsed);
      if (ec == std::errc{} && p == s->data() + s->size())
        v = parsed;
    }
    if (!v || *v < 1 || *v > 10000)
      fail("io_weight must be an integer in 1-10000");
    return static_cast<unsigned>(*v);
  }

  std::optional<std::string> get_str(const char *key) const {
    auto *n = t_.get(key);
    if (!n)
      return std::nullopt;
    auto s = n->value<std::string>();
    if (!n->is_string() || !s)
      fail(fmt::format("{} must be a string", key));
    return s;
  }

  std::string require_str(const char *key) const {
    auto v = get_str(key);
    if (!v)
      fail(fmt::format("missing required key '{}'", key));
    return *v;
  }

  std::string name_;
  const toml::table &t_;
  UnitKind kind_;
};

} // namespace

DesiredManifest parse_manifest(std::string_view text, std::string_view source) {
  toml::table root;
  try {
    root = toml::parse(text, source);
  } catch (const toml::parse_error &e) {
    throw ManifestError("", fmt::format("{}:{}:{}: {}", source,
                                        e.source().begin.line,
                                        e.source().begin.column,
                                        e.description()));
  }

  DesiredManifest out;
  for (auto &&[k, v] : root) {
    std::string section(k.str());
    UnitKind kind;
    if (section == "timers")
      kind = UnitKind::Timer;
    else if (section == "services")
      kind = UnitKind::Service;
    else
      throw ManifestError("", fmt::format("{}: unknown table [{}]", source,
                                          section));

    auto *units = v.as_table();
    if (!units)
      throw ManifestError("", fmt::format("{}: [{}] must be a table", source,
                                          section));
    for (auto &&[uk, uv] : *units) {
      std::string name(uk.str());
      auto *t = uv.as_table();
      if (!t)
        throw ManifestError(name, fmt::format("unit '{}': expected a table",
                                              name));
      if (!valid_unit_name(name))
        throw ManifestError(name, fmt::format("unit '{}': invalid name", name));
      if (out.count(name))
        throw ManifestError(name,
                            fmt::format("unit '{}' is declared more than once",
                                        name));
      out.emplace(name, UnitReader(name, *t, kind).read());
    }
  }
  spdlog::debug("[manifest] {}: {} units", source, out.size());
  return out;
}

DesiredManifest load_manifest(const std::filesystem::path &file) {
  auto text = io::read_file(file);
  if (!text)
    throw ManifestError("", "cannot read " + file.string());
  return parse_manifest(*text, file.string());
}

static void put(toml::table &t, const char *key,
                const std::optional<std::string> &v) {
  if (v)
    t.insert_or_assign(key, *v);
}

std::string export_manifest(const std::map<std::string, ManagedUnit> &units) {
  toml::table timers, services;
  for (const auto &[name, u] : units) {
    toml::table t;
    if (auto *tj = u.timer()) {
      t.insert_or_assign("schedule", tj->cron);
      put(t, "random_delay", tj->random_delay);
    }
    t.insert_or_assign("command", u.command);
    t.insert_or_assign("workdir", u.workdir);
    put(t, "description", u.description);
    if (auto *sj = u.service()) {
      t.insert_or_assign("restart", std::string(to_string(sj->restart)));
      put(t, "env_file", sj->env_file);
    }
    put(t, "memory_max", u.memory_max);
    put(t, "cpu_quota", u.cpu_quota);
    if (u.io_weight)
      t.insert_or_assign("io_weight", static_cast<int64_t>(*u.io_weight));
    put(t, "stop_timeout", u.stop_timeout);
    put(t, "exec_start_pre", u.exec_start_pre);
    put(t, "exec_stop_post", u.exec_stop_post);
    put(t, "log_level_max", u.log_level_max);
    if (!u.environment.empty()) {
      toml::array env;
      for (const auto &e : u.environment)
        env.push_back(e);
      t.insert_or_assign("env", std::move(env));
    }
    (u.is_service() ? services : timers).insert_or_assign(name, std::move(t));
  }

  toml::table root;
  if (!timers.empty())
    root.insert_or_assign("timers", std::move(timers));
  if (!services.empty())
    root.insert_or_assign("services", std::move(services));
  std::ostringstream o;
  o << root << "\n";
  return o.str();
}

} // namespace sdcron
