#pragma once
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace sdcron {

class ControlError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Boundary to the service manager.  Every mutating call throws
// ControlError on failure.
class ServiceControl {
public:
  virtual ~ServiceControl() = default;

  virtual void daemon_reload() = 0;
  virtual void enable(const std::string &unit) = 0;  // and start now
  virtual void disable(const std::string &unit) = 0; // and stop now
  virtual void restart(const std::string &unit) = 0;
  virtual std::string status(const std::string &unit) = 0;
  // forget failed/runtime state of a unit whose files are gone
  virtual void remove_runtime_state(const std::string &unit) = 0;
  virtual std::string show_property(const std::string &unit,
                                    const std::string &property) = 0;
};

// `systemctl --user ...`
class SystemctlControl : public ServiceControl {
public:
  explicit SystemctlControl(std::string binary = "systemctl")
      : binary_(std::move(binary)) {}

  void daemon_reload() override;
  void enable(const std::string &unit) override;
  void disable(const std::string &unit) override;
  void restart(const std::string &unit) override;
  std::string status(const std::string &unit) override;
  void remove_runtime_state(const std::string &unit) override;
  std::string show_property(const std::string &unit,
                            const std::string &property) override;

private:
  std::string run(const std::vector<std::string> &args);

  std::string binary_;
};

// `loginctl enable-linger <user>`; throws ControlError.
void enable_linger(const std::string &user);

} // namespace sdcron
