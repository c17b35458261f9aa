#include <sdcron/generator.hpp>
#include <sdcron/reconciler.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>

namespace sdcron {

const char *to_string(DiffStatus s) {
  switch (s) {
  case DiffStatus::Added:
    return "added";
  case DiffStatus::Changed:
    return "changed";
  case DiffStatus::Unchanged:
    return "unchanged";
  case DiffStatus::Removed:
    return "removed";
  }
  return "unchanged";
}

char diff_symbol(DiffStatus s) {
  switch (s) {
  case DiffStatus::Added:
    return '+';
  case DiffStatus::Changed:
    return '~';
  case DiffStatus::Unchanged:
    return '=';
  case DiffStatus::Removed:
    return '-';
  }
  return '=';
}

std::size_t Plan::count(DiffStatus s) const {
  return static_cast<std::size_t>(
      std::count_if(entries.begin(), entries.end(),
                    [&](const DiffEntry &e) { return e.status == s; }));
}

bool Plan::has_changes() const {
  return std::any_of(entries.begin(), entries.end(), [](const DiffEntry &e) {
    return e.status != DiffStatus::Unchanged;
  });
}

// Metadata keys the installed unit carries but this version does not
// understand survive the rewrite.
static ManagedUnit carry_metadata(ManagedUnit desired,
                                  const ManagedUnit &installed) {
  for (const auto &kv : installed.extra_metadata) {
    bool known = std::any_of(
        desired.extra_metadata.begin(), desired.extra_metadata.end(),
        [&](const auto &d) { return d.first == kv.first; });
    if (!known)
      desired.extra_metadata.push_back(kv);
  }
  return desired;
}

Plan plan_changes(const DesiredManifest &desired,
                  const InstalledState &installed, bool prune) {
  Plan plan;
  plan.corrupt = installed.corrupt;

  std::set<std::string> names;
  for (const auto &kv : desired)
    names.insert(kv.first);
  for (const auto &kv : installed.units)
    names.insert(kv.first);

  for (const auto &name : names) {
    auto d = desired.find(name);
    auto i = installed.units.find(name);

    if (d != desired.end() && i == installed.units.end()) {
      plan.entries.push_back({name, DiffStatus::Added, std::nullopt, d->second});
      continue;
    }
    if (d == desired.end()) {
      if (prune)
        plan.entries.push_back(
            {name, DiffStatus::Removed, i->second, std::nullopt});
      else
        plan.unmanaged.push_back(name);
      continue;
    }

    ManagedUnit after = carry_metadata(d->second, i->second);
    auto want = generate_unit_files(after);
    auto f = installed.files.find(name);
    auto have = f != installed.files.end() ? f->second
                                           : generate_unit_files(i->second);
    auto status = want == have ? DiffStatus::Unchanged : DiffStatus::Changed;
    plan.entries.push_back({name, status, i->second, std::move(after)});
  }
  return plan;
}

Plan Reconciler::plan(const DesiredManifest &desired, bool prune) const {
  return plan_changes(desired, store_.scan(), prune);
}

void Reconciler::retire(const ManagedUnit &u,
                        std::vector<ApplyFailure> &warnings) {
  auto tolerate = [&](const char *step, auto &&call) {
    try {
      call();
    } catch (const ControlError &e) {
      spdlog::warn("[unit={}] {} failed, continuing: {}", u.name, step,
                   e.what());
      warnings.push_back({u.name, fmt::format("{}: {}", step, e.what())});
    }
  };

  tolerate("disable", [&] { control_.disable(u.control_unit()); });
  store_.remove(u.name);
  tolerate("reset-failed",
           [&] { control_.remove_runtime_state(u.control_unit()); });
  if (!u.is_service())
    tolerate("reset-failed",
             [&] { control_.remove_runtime_state(u.exec_unit()); });
}

void Reconciler::install(const DiffEntry &e,
                         std::vector<ApplyFailure> &warnings) {
  const ManagedUnit &u = *e.after;
  auto files = generate_unit_files(u);

  if (e.before && e.before->kind() != u.kind()) {
    spdlog::info("[unit={}] kind changes {} -> {}", u.name,
                 to_string(e.before->kind()), to_string(u.kind()));
    retire(*e.before, warnings);
  }

  store_.write(u.name, files);
  control_.daemon_reload();
  control_.enable(u.control_unit());
  if (e.status == DiffStatus::Changed)
    control_.restart(u.control_unit());
  spdlog::info("[unit={}] {} ({}) fp={}", u.name, to_string(e.status),
               to_string(u.kind()), fingerprint_hex(files));
}

ApplySummary Reconciler::add(const ManagedUnit &u) {
  auto st = store_.scan();
  if (st.units.count(u.name) || st.is_corrupt(u.name))
    throw ApplyError(fmt::format(
        "unit '{}' already exists; remove it first with: sdcron remove {}",
        u.name, u.name));

  Plan plan;
  plan.entries.push_back({u.name, DiffStatus::Added, std::nullopt, u});
  return apply(plan, {});
}

ApplySummary Reconciler::apply(const Plan &plan, const ApplyOptions &opt) {
  ApplySummary sum;
  sum.unchanged = plan.count(DiffStatus::Unchanged);

  if (opt.dry_run) {
    sum.added = plan.count(DiffStatus::Added);
    sum.changed = plan.count(DiffStatus::Changed);
    if (opt.prune)
      sum.removed = plan.count(DiffStatus::Removed);
    spdlog::info("[apply] dry run: {} to add, {} to change, {} to remove",
                 sum.added, sum.changed, sum.removed);
    return sum;
  }

  if (!plan.has_changes())
    return sum;

  if (!store_.writable())
    throw ApplyError(fmt::format("unit directory {} is not writable",
                                 store_.dir().string()));

  std::size_t attempted = 0;
  for (const auto &e : plan.entries) {
    if (e.status == DiffStatus::Unchanged)
      continue;
    if (e.status == DiffStatus::Removed && !opt.prune) {
      spdlog::warn("[unit={}] removal skipped: prune not requested", e.name);
      continue;
    }
    ++attempted;
    try {
      if (e.status == DiffStatus::Removed) {
        retire(*e.before, sum.warnings);
        control_.daemon_reload();
        spdlog::info("[unit={}] removed", e.name);
        ++sum.removed;
      } else {
        install(e, sum.warnings);
        ++(e.status == DiffStatus::Added ? sum.added : sum.changed);
      }
    } catch (const std::exception &ex) {
      spdlog::error("[unit={}] {} failed: {}", e.name, to_string(e.status),
                    ex.what());
      sum.failures.push_back({e.name, ex.what()});
    }
  }

  if (attempted > 0 && sum.failures.size() == attempted)
    throw ApplyError(fmt::format("all {} unit operations failed", attempted),
                     sum.failures);
  return sum;
}

} // namespace sdcron
