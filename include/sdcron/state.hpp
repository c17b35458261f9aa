#pragma once
#include <sdcron/generator.hpp>
#include <sdcron/unit.hpp>

#include <filesystem>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace sdcron {

struct CorruptUnit {
  std::string name;
  std::string reason;
};

struct InstalledState {
  std::map<std::string, ManagedUnit> units;
  // on-disk text of every decodable unit, keyed like units
  std::map<std::string, UnitFiles> files;
  std::vector<CorruptUnit> corrupt;

  bool is_corrupt(const std::string &name) const;
};

class ScanError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Reader/writer pair over the unit directory.  Nothing is cached:
// every scan() reads the directory afresh.
class UnitStore {
public:
  explicit UnitStore(std::filesystem::path dir) : dir_(std::move(dir)) {}

  const std::filesystem::path &dir() const { return dir_; }
  std::filesystem::path exec_path(const std::string &name) const;
  std::filesystem::path trigger_path(const std::string &name) const;

  // Throws ScanError when the directory is missing or unreadable.
  InstalledState scan() const;

  // Temp files first, then rename trigger, then exec; a trigger the
  // new files do not carry is deleted.  Throws std::runtime_error.
  void write(const std::string &name, const UnitFiles &files) const;
  // false when neither file existed
  bool remove(const std::string &name) const;

  bool writable() const;

private:
  std::filesystem::path temp_path(const std::filesystem::path &target) const;

  std::filesystem::path dir_;
};

} // namespace sdcron
