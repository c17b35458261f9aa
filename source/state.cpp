#include <sdcron/io.hpp>
#include <sdcron/metadata.hpp>
#include <sdcron/state.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <string_view>

namespace fs = std::filesystem;

namespace sdcron {

bool InstalledState::is_corrupt(const std::string &name) const {
  return std::any_of(corrupt.begin(), corrupt.end(),
                     [&](const CorruptUnit &c) { return c.name == name; });
}

fs::path UnitStore::exec_path(const std::string &name) const {
  return dir_ / exec_file_name(name);
}
fs::path UnitStore::trigger_path(const std::string &name) const {
  return dir_ / trigger_file_name(name);
}

fs::path UnitStore::temp_path(const fs::path &target) const {
  return dir_ / ("." + target.filename().string() + ".tmp");
}

namespace {
struct Found {
  bool exec = false;
  bool trigger = false;
};

bool ends_with(std::string_view s, std::string_view suffix) {
  return s.size() >= suffix.size() &&
         s.substr(s.size() - suffix.size()) == suffix;
}
} // namespace

InstalledState UnitStore::scan() const {
  std::error_code ec;
  if (!fs::is_directory(dir_, ec))
    throw ScanError("unit directory not found: " + dir_.string());

  std::map<std::string, Found> found;
  const std::string_view prefix = kUnitPrefix;
  fs::directory_iterator it(dir_, ec);
  if (ec)
    throw ScanError("cannot read " + dir_.string() + ": " + ec.message());
  for (; it != fs::directory_iterator(); it.increment(ec)) {
    auto file = it->path().filename().string();
    if (file.compare(0, prefix.size(), prefix) != 0)
      continue;
    std::string_view rest(file);
    rest.remove_prefix(prefix.size());
    if (ends_with(rest, ".service")) {
      rest.remove_suffix(8);
      found[std::string(rest)].exec = true;
    } else if (ends_with(rest, ".timer")) {
      rest.remove_suffix(6);
      found[std::string(rest)].trigger = true;
    }
  }
  if (ec)
    throw ScanError("cannot read " + dir_.string() + ": " + ec.message());

  InstalledState st;
  auto corrupt = [&](const std::string &name, std::string reason) {
    spdlog::warn("[scan] [unit={}] corrupt: {}", name, reason);
    st.corrupt.push_back({name, std::move(reason)});
  };

  for (const auto &[name, f] : found) {
    if (!valid_unit_name(name)) {
      corrupt(name, "invalid unit name");
      continue;
    }
    if (!f.exec) {
      corrupt(name, "trigger file without an exec unit");
      continue;
    }
    auto exec_text = io::read_file(exec_path(name));
    if (!exec_text) {
      corrupt(name, "cannot read " + exec_path(name).string());
      continue;
    }

    ManagedUnit u;
    try {
      u = unit_from_metadata(name, decode_metadata(*exec_text));
    } catch (const CodecError &e) {
      corrupt(name, e.what());
      continue;
    }

    UnitFiles files{*exec_text, std::nullopt};
    if (!u.is_service()) {
      if (!f.trigger) {
        corrupt(name, "timer without its trigger file");
        continue;
      }
      files.trigger_text = io::read_file(trigger_path(name));
      if (!files.trigger_text) {
        corrupt(name, "cannot read " + trigger_path(name).string());
        continue;
      }
    } else if (f.trigger) {
      corrupt(name, "service with a stray trigger file");
      continue;
    }

    spdlog::debug("[scan] [unit={}] {} ok", name, to_string(u.kind()));
    st.files.emplace(name, std::move(files));
    st.units.emplace(name, std::move(u));
  }
  return st;
}

void UnitStore::write(const std::string &name, const UnitFiles &files) const {
  const auto exec = exec_path(name);
  const auto trigger = trigger_path(name);
  const auto exec_tmp = temp_path(exec);
  const auto trigger_tmp = temp_path(trigger);

  auto cleanup = [&] {
    std::error_code ec;
    fs::remove(exec_tmp, ec);
    fs::remove(trigger_tmp, ec);
  };

  try {
    io::write_file(exec_tmp, files.exec_text);
    if (files.trigger_text)
      io::write_file(trigger_tmp, *files.trigger_text);

    if (files.trigger_text)
      io::rename_file(trigger_tmp, trigger);
    io::rename_file(exec_tmp, exec);
  } catch (const std::exception &) {
    cleanup();
    throw;
  }

  if (!files.trigger_text && io::remove_file(trigger))
    spdlog::info("[unit={}] removed stale {}", name, trigger.filename().string());
}

bool UnitStore::remove(const std::string &name) const {
  bool t = io::remove_file(trigger_path(name));
  bool e = io::remove_file(exec_path(name));
  return t || e;
}

bool UnitStore::writable() const { return io::dir_writable(dir_); }

} // namespace sdcron
