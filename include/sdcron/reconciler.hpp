#pragma once
#include <sdcron/state.hpp>
#include <sdcron/systemctl.hpp>
#include <sdcron/unit.hpp>

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace sdcron {

enum class DiffStatus { Added, Changed, Unchanged, Removed };

const char *to_string(DiffStatus s);
// '+' added, '~' changed, '=' unchanged, '-' removed
char diff_symbol(DiffStatus s);

struct DiffEntry {
  std::string name;
  DiffStatus status = DiffStatus::Unchanged;
  std::optional<ManagedUnit> before; // installed
  std::optional<ManagedUnit> after;  // desired
};

struct Plan {
  std::vector<DiffEntry> entries;     // ascending by name
  std::vector<std::string> unmanaged; // installed only, left alone
  std::vector<CorruptUnit> corrupt;

  std::size_t count(DiffStatus s) const;
  bool has_changes() const;
};

// Pure diff of desired against installed.  Installed-only units are
// Removed under prune and listed as unmanaged otherwise.
Plan plan_changes(const DesiredManifest &desired,
                  const InstalledState &installed, bool prune);

struct ApplyOptions {
  bool dry_run = false;
  bool prune = false;
};

struct ApplyFailure {
  std::string name;
  std::string reason;
};

struct ApplySummary {
  std::size_t added = 0;
  std::size_t changed = 0;
  std::size_t unchanged = 0;
  std::size_t removed = 0;
  std::vector<ApplyFailure> failures;
  // service-control steps that failed while the unit itself went through
  std::vector<ApplyFailure> warnings;

  bool ok() const { return failures.empty(); }
};

class ApplyError : public std::runtime_error {
public:
  ApplyError(const std::string &what, std::vector<ApplyFailure> failures = {})
      : std::runtime_error(what), failures_(std::move(failures)) {}
  const std::vector<ApplyFailure> &failures() const { return failures_; }

private:
  std::vector<ApplyFailure> failures_;
};

class Reconciler {
public:
  Reconciler(UnitStore store, ServiceControl &control)
      : store_(std::move(store)), control_(control) {}

  // Scans the store afresh.  Throws ScanError.
  Plan plan(const DesiredManifest &desired, bool prune) const;

  // Applies entries in order, collecting per-unit failures.  Throws
  // ApplyError when the directory is not writable or every attempted
  // entry failed.
  ApplySummary apply(const Plan &plan, const ApplyOptions &opt);

  // Installs a single new unit.  Throws ApplyError when the name is
  // already taken, installed or corrupt, or when installing fails.
  ApplySummary add(const ManagedUnit &u);

  const UnitStore &store() const { return store_; }

private:
  void install(const DiffEntry &e, std::vector<ApplyFailure> &warnings);
  // Stop, delete and forget a unit.  Service-control errors are recorded
  // in warnings; the files are removed regardless.
  void retire(const ManagedUnit &u, std::vector<ApplyFailure> &warnings);

  UnitStore store_;
  ServiceControl &control_;
};

} // namespace sdcron
