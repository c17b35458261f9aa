#pragma once
#include <sdcron/unit.hpp>

#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>

namespace sdcron {

class ManifestError : public std::runtime_error {
public:
  ManifestError(std::string unit, const std::string &what)
      : std::runtime_error(what), unit_(std::move(unit)) {}
  // empty for errors not tied to one unit (syntax, unknown tables)
  const std::string &unit() const { return unit_; }

private:
  std::string unit_;
};

/**
 * Parse a TOML manifest with [timers.<name>] and [services.<name>]
 * tables into validated units.  Throws ManifestError.
 */
DesiredManifest parse_manifest(std::string_view text,
                               std::string_view source = "manifest");
DesiredManifest load_manifest(const std::filesystem::path &file);

// Inverse of parse_manifest(); pass-through metadata is not exported.
std::string export_manifest(const std::map<std::string, ManagedUnit> &units);

} // namespace sdcron
