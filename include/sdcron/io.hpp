#pragma once
#include <filesystem>
#include <optional>
#include <string>

namespace sdcron {
namespace io {
  void ensure_dir(const std::filesystem::path& p);
  std::optional<std::string> read_file(const std::filesystem::path& p);

  // Writes and fsyncs p; throws std::runtime_error.
  void write_file(const std::filesystem::path& p, const std::string& text);
  void rename_file(const std::filesystem::path& from,
                   const std::filesystem::path& to);
  // false when p did not exist; throws on any other failure
  bool remove_file(const std::filesystem::path& p);

  bool dir_writable(const std::filesystem::path& p);
}
} // namespace sdcron
