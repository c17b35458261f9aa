#pragma once
#include <sdcron/unit.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace sdcron {

struct UnitFiles {
  std::string exec_text;                  // sdcron-<name>.service
  std::optional<std::string> trigger_text; // sdcron-<name>.timer, timers only

  bool operator==(const UnitFiles &o) const {
    return exec_text == o.exec_text && trigger_text == o.trigger_text;
  }
  bool operator!=(const UnitFiles &o) const { return !(*this == o); }
};

// Pure and byte-stable: equal units always render to equal text.
UnitFiles generate_unit_files(const ManagedUnit &u);

std::uint64_t fingerprint(const UnitFiles &f);
std::string fingerprint_hex(const UnitFiles &f);

} // namespace sdcron
