#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace sdcron {

enum class Field { Minute, Hour, DayOfMonth, Month, DayOfWeek };

const char *field_name(Field f);
unsigned field_min(Field f);
unsigned field_max(Field f);

struct FieldConstraint {
  enum class Kind { Any, Values, Range, Step };

  Kind kind = Kind::Any;
  std::vector<unsigned> values; // Values: sorted, unique
  unsigned first = 0;           // Range start, Step start
  unsigned last = 0;            // Range end (inclusive)
  unsigned stride = 1;          // Step only

  static FieldConstraint any() { return {}; }
  static FieldConstraint of_values(std::vector<unsigned> v);
  static FieldConstraint range(unsigned a, unsigned b);
  static FieldConstraint step(unsigned start, unsigned stride);

  bool is_any() const { return kind == Kind::Any; }

  bool operator==(const FieldConstraint &o) const;
  bool operator!=(const FieldConstraint &o) const { return !(*this == o); }
};

struct Calendar {
  FieldConstraint minute;
  FieldConstraint hour;
  FieldConstraint day_of_month;
  FieldConstraint month;
  FieldConstraint day_of_week;

  bool operator==(const Calendar &o) const {
    return minute == o.minute && hour == o.hour &&
           day_of_month == o.day_of_month && month == o.month &&
           day_of_week == o.day_of_week;
  }
  bool operator!=(const Calendar &o) const { return !(*this == o); }
};

struct Reboot {
  bool operator==(const Reboot &) const { return true; }
  bool operator!=(const Reboot &) const { return false; }
};

struct PersistentService {
  bool operator==(const PersistentService &) const { return true; }
  bool operator!=(const PersistentService &) const { return false; }
};

using Schedule = std::variant<Calendar, Reboot, PersistentService>;

class ScheduleError : public std::runtime_error {
public:
  enum class Kind { Syntax, OutOfRange };

  ScheduleError(Kind kind, std::string field, const std::string &what);

  Kind kind() const { return kind_; }
  // "minute", "day-of-month", ..., "expression" or the alias text
  const std::string &field() const { return field_; }

private:
  Kind kind_;
  std::string field_;
};

/**
 * Compile a crontab-style expression or an alias (@daily/9:30,
 * @monday/9, @1st/8, @reboot, @service, ...) into a Schedule.
 *
 * Throws ScheduleError naming the offending field or alias.
 */
Schedule compile_schedule(std::string_view expr);

// "[DOW ]*-MM-DD HH:MM:00", the OnCalendar= form
std::string format_calendar(const Calendar &c);

// Inverse of format_calendar().  Throws ScheduleError.
Calendar parse_calendar(std::string_view text);

// OnCalendar=/OnBootSec= line for a timer; nullopt for a persistent service
std::optional<std::string> trigger_line(const Schedule &s);

inline bool is_persistent_service(const Schedule &s) {
  return std::holds_alternative<PersistentService>(s);
}

} // namespace sdcron
