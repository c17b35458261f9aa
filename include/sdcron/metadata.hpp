#pragma once
#include <sdcron/unit.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sdcron {

inline constexpr const char *kMetadataPrefix = "# sdcron:";
inline constexpr unsigned kMetadataVersion = 1;

class CodecError : public std::runtime_error {
public:
  CodecError(std::string key, const std::string &what)
      : std::runtime_error(what), key_(std::move(key)) {}
  // offending metadata key, empty when the unit as a whole is invalid
  const std::string &key() const { return key_; }

private:
  std::string key_;
};

// Decoded metadata block, before kind checks.
struct MetadataFields {
  bool present = false; // at least one metadata line was seen
  std::optional<unsigned> version;
  std::optional<UnitKind> type;
  std::optional<std::string> cron;
  std::optional<RestartPolicy> restart;
  std::optional<std::string> command;
  std::optional<std::string> workdir;
  std::optional<std::string> description;
  std::optional<std::string> env_file;
  std::optional<std::string> memory_max;
  std::optional<std::string> cpu_quota;
  std::optional<unsigned> io_weight;
  std::optional<std::string> stop_timeout;
  std::optional<std::string> exec_start_pre;
  std::optional<std::string> exec_stop_post;
  std::optional<std::string> log_level_max;
  std::optional<std::string> random_delay;
  std::vector<std::string> env;
  std::vector<MetadataEntry> extra;
};

// "# sdcron:key=value" lines, one per field, newline terminated.
std::string encode_metadata(const ManagedUnit &u);

// Scans every line of a unit file; non-metadata lines are ignored.
// Throws CodecError when a recognized key carries a malformed value.
MetadataFields decode_metadata(std::string_view text);

// Throws CodecError on missing required keys, kind-incompatible keys,
// an uncompilable cron expression or a field that fails validation.
ManagedUnit unit_from_metadata(const std::string &name,
                               const MetadataFields &f);

} // namespace sdcron
