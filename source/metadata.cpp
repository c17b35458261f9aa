#include <sdcron/metadata.hpp>

#include <fmt/format.h>

#include <charconv>

namespace sdcron {

static void put(std::string &out, std::string_view key,
                const std::string &value) {
  out += kMetadataPrefix;
  out += key;
  out += '=';
  out += value;
  out += '\n';
}

static void put(std::string &out, std::string_view key,
                const std::optional<std::string> &value) {
  if (value)
    put(out, key, *value);
}

std::string encode_metadata(const ManagedUnit &u) {
  std::string out;
  put(out, "version", std::to_string(kMetadataVersion));
  put(out, "type", std::string(to_string(u.kind())));
  if (auto *t = u.timer())
    put(out, "cron", t->cron);
  if (auto *s = u.service())
    put(out, "restart", std::string(to_string(s->restart)));
  put(out, "command", u.command);
  put(out, "workdir", u.workdir);
  put(out, "description", u.description);
  if (auto *s = u.service())
    put(out, "env_file", s->env_file);
  put(out, "memory_max", u.memory_max);
  put(out, "cpu_quota", u.cpu_quota);
  if (u.io_weight)
    put(out, "io_weight", std::to_string(*u.io_weight));
  put(out, "stop_timeout", u.stop_timeout);
  put(out, "exec_start_pre", u.exec_start_pre);
  put(out, "exec_stop_post", u.exec_stop_post);
  put(out, "log_level_max", u.log_level_max);
  if (auto *t = u.timer())
    put(out, "random_delay", t->random_delay);
  for (const auto &e : u.environment)
    put(out, "env", e);
  for (const auto &[k, v] : u.extra_metadata) {
    if (v) {
      put(out, k, *v);
    } else {
      out += kMetadataPrefix;
      out += k;
      out += '\n';
    }
  }
  return out;
}

static std::optional<unsigned> parse_uint(std::string_view s) {
  unsigned v = 0;
  auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (s.empty() || ec != std::errc{} || p != s.data() + s.size())
    return std::nullopt;
  return v;
}

static CodecError bad_value(const std::string &key, std::string_view value) {
  return CodecError(key, fmt::format("metadata {}: bad value '{}'", key, value));
}

MetadataFields decode_metadata(std::string_view text) {
  MetadataFields f;
  const std::string_view prefix = kMetadataPrefix;

  size_t pos = 0;
  while (pos < text.size()) {
    auto nl = text.find('\n', pos);
    auto line = text.substr(pos, nl == std::string_view::npos ? std::string_view::npos
                                                               : nl - pos);
    pos = nl == std::string_view::npos ? text.size() : nl + 1;
    if (!line.empty() && line.back() == '\r')
      line.remove_suffix(1);
    if (line.substr(0, prefix.size()) != prefix)
      continue;
    line.remove_prefix(prefix.size());

    f.present = true;
    auto eq = line.find('=');
    std::string key(line.substr(0, eq));
    std::string value(eq == std::string_view::npos ? std::string_view{}
                                                   : line.substr(eq + 1));
    bool has_value = eq != std::string_view::npos;

    auto text_field = [&](std::optional<std::string> &dst) {
      if (!has_value)
        throw bad_value(key, value);
      dst = value;
    };

    if (key == "version") {
      auto v = parse_uint(value);
      if (!v || *v == 0)
        throw bad_value(key, value);
      f.version = v;
    } else if (key == "type") {
      if (value == "timer")
        f.type = UnitKind::Timer;
      else if (value == "service")
        f.type = UnitKind::Service;
      else
        throw bad_value(key, value);
    } else if (key == "restart") {
      auto r = parse_restart(value);
      if (!r)
        throw bad_value(key, value);
      f.restart = r;
    } else if (key == "io_weight") {
      auto v = parse_uint(value);
      if (!v)
        throw bad_value(key, value);
      f.io_weight = v;
    } else if (key == "cron") {
      text_field(f.cron);
    } else if (key == "command") {
      text_field(f.command);
    } else if (key == "workdir") {
      text_field(f.workdir);
    } else if (key == "description") {
      text_field(f.description);
    } else if (key == "env_file") {
      text_field(f.env_file);
    } else if (key == "memory_max") {
      text_field(f.memory_max);
    } else if (key == "cpu_quota") {
      text_field(f.cpu_quota);
    } else if (key == "stop_timeout") {
      text_field(f.stop_timeout);
    } else if (key == "exec_start_pre") {
      text_field(f.exec_start_pre);
    } else if (key == "exec_stop_post") {
      text_field(f.exec_stop_post);
    } else if (key == "log_level_max") {
      text_field(f.log_level_max);
    } else if (key == "random_delay") {
      text_field(f.random_delay);
    } else if (key == "env") {
      if (!has_value)
        throw bad_value(key, value);
      f.env.push_back(value);
    } else if (!key.empty()) {
      f.extra.emplace_back(key, has_value ? std::optional<std::string>(value)
                                          : std::nullopt);
    }
  }
  return f;
}

ManagedUnit unit_from_metadata(const std::string &name, const MetadataFields &f) {
  auto missing = [&](const char *key) {
    return CodecError(key, fmt::format("unit '{}': metadata key '{}' missing",
                                       name, key));
  };
  auto misplaced = [&](const char *key, UnitKind k) {
    return CodecError(key, fmt::format("unit '{}': key '{}' not allowed for a {}",
                                       name, key, to_string(k)));
  };

  if (!f.present)
    throw CodecError("", fmt::format("unit '{}': no sdcron metadata", name));
  if (!f.type)
    throw missing("type");
  if (!f.command)
    throw missing("command");
  if (!f.workdir)
    throw missing("workdir");

  ManagedUnit u;
  u.name = name;
  if (*f.type == UnitKind::Timer) {
    if (!f.cron)
      throw missing("cron");
    if (f.restart)
      throw misplaced("restart", UnitKind::Timer);
    if (f.env_file)
      throw misplaced("env_file", UnitKind::Timer);
    TimerJob t;
    try {
      t = TimerJob::compile(*f.cron);
    } catch (const std::exception &e) {
      throw CodecError("cron", fmt::format("unit '{}': {}", name, e.what()));
    }
    t.random_delay = f.random_delay;
    u.job = std::move(t);
  } else {
    if (f.cron && *f.cron != "@service")
      throw misplaced("cron", UnitKind::Service);
    if (f.random_delay)
      throw misplaced("random_delay", UnitKind::Service);
    ServiceJob s;
    s.env_file = f.env_file;
    if (f.restart)
      s.restart = *f.restart;
    u.job = std::move(s);
  }

  u.command = *f.command;
  u.workdir = *f.workdir;
  u.description = f.description;
  u.memory_max = f.memory_max;
  u.cpu_quota = f.cpu_quota;
  u.io_weight = f.io_weight;
  u.stop_timeout = f.stop_timeout;
  u.exec_start_pre = f.exec_start_pre;
  u.exec_stop_post = f.exec_stop_post;
  u.log_level_max = f.log_level_max;
  u.environment = f.env;
  u.extra_metadata = f.extra;

  try {
    u.validate();
  } catch (const std::invalid_argument &e) {
    throw CodecError("", e.what());
  }
  return u;
}

} // namespace sdcron
