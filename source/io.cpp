#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <sdcron/io.hpp>
#include <stdexcept>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <iterator>

namespace fs = std::filesystem;

namespace sdcron {
namespace io {

void ensure_dir(const fs::path &p) {
  if (!fs::exists(p))
    fs::create_directories(p);
}

std::optional<std::string> read_file(const fs::path &p) {
  std::ifstream in(p, std::ios::binary);
  if (!in)
    return std::nullopt;
  std::string data((std::istreambuf_iterator<char>(in)),
                   std::istreambuf_iterator<char>());
  if (in.bad())
    return std::nullopt;
  return data;
}

static std::runtime_error sys_error(const char *op, const fs::path &p) {
  return std::runtime_error(std::string(op) + " " + p.string() + ": " +
                            std::strerror(errno));
}

void write_file(const fs::path &p, const std::string &text) {
  int fd = ::open(p.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0)
    throw sys_error("open", p);
  const char *data = text.data();
  size_t left = text.size();
  while (left > 0) {
    ssize_t n = ::write(fd, data, left);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      auto err = sys_error("write", p);
      ::close(fd);
      throw err;
    }
    data += n;
    left -= static_cast<size_t>(n);
  }
  if (::fsync(fd) != 0) {
    auto err = sys_error("fsync", p);
    ::close(fd);
    throw err;
  }
  if (::close(fd) != 0)
    throw sys_error("close", p);
}

void rename_file(const fs::path &from, const fs::path &to) {
  if (::rename(from.c_str(), to.c_str()) != 0)
    throw sys_error("rename", from);
}

bool remove_file(const fs::path &p) {
  if (::unlink(p.c_str()) == 0)
    return true;
  if (errno == ENOENT)
    return false;
  throw sys_error("unlink", p);
}

bool dir_writable(const fs::path &p) {
  std::error_code ec;
  if (!fs::is_directory(p, ec))
    return false;
  return ::access(p.c_str(), W_OK | X_OK) == 0;
}

} // namespace io
} // namespace sdcron
