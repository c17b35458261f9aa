#include <sdcron/schedule.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <climits>
#include <set>
#include <utility>

namespace sdcron {

static constexpr const char *kDowNames[] = {"Sun", "Mon", "Tue", "Wed",
                                            "Thu", "Fri", "Sat"};
static constexpr const char *kMonthNames[] = {"jan", "feb", "mar", "apr",
                                              "may", "jun", "jul", "aug",
                                              "sep", "oct", "nov", "dec"};
static constexpr const char *kWeekdayAliases[] = {
    "sunday", "monday", "tuesday", "wednesday", "thursday", "friday",
    "saturday"};

const char *field_name(Field f) {
  switch (f) {
  case Field::Minute:
    return "minute";
  case Field::Hour:
    return "hour";
  case Field::DayOfMonth:
    return "day-of-month";
  case Field::Month:
    return "month";
  case Field::DayOfWeek:
    return "day-of-week";
  }
  return "?";
}

unsigned field_min(Field f) {
  return (f == Field::DayOfMonth || f == Field::Month) ? 1 : 0;
}

unsigned field_max(Field f) {
  switch (f) {
  case Field::Minute:
    return 59;
  case Field::Hour:
    return 23;
  case Field::DayOfMonth:
    return 31;
  case Field::Month:
    return 12;
  case Field::DayOfWeek:
    return 6;
  }
  return 0;
}

FieldConstraint FieldConstraint::of_values(std::vector<unsigned> v) {
  std::sort(v.begin(), v.end());
  v.erase(std::unique(v.begin(), v.end()), v.end());
  FieldConstraint fc;
  fc.kind = Kind::Values;
  fc.values = std::move(v);
  return fc;
}

FieldConstraint FieldConstraint::range(unsigned a, unsigned b) {
  FieldConstraint fc;
  fc.kind = Kind::Range;
  fc.first = a;
  fc.last = b;
  return fc;
}

FieldConstraint FieldConstraint::step(unsigned start, unsigned stride) {
  FieldConstraint fc;
  fc.kind = Kind::Step;
  fc.first = start;
  fc.stride = stride;
  return fc;
}

bool FieldConstraint::operator==(const FieldConstraint &o) const {
  if (kind != o.kind)
    return false;
  switch (kind) {
  case Kind::Any:
    return true;
  case Kind::Values:
    return values == o.values;
  case Kind::Range:
    return first == o.first && last == o.last;
  case Kind::Step:
    return first == o.first && stride == o.stride;
  }
  return false;
}

ScheduleError::ScheduleError(Kind kind, std::string field,
                             const std::string &what)
    : std::runtime_error(what), kind_(kind), field_(std::move(field)) {}

static ScheduleError syntax(const std::string &field, const std::string &msg) {
  return ScheduleError(ScheduleError::Kind::Syntax, field,
                       fmt::format("{}: {}", field, msg));
}

static ScheduleError out_of_range(const std::string &field,
                                  const std::string &msg) {
  return ScheduleError(ScheduleError::Kind::OutOfRange, field,
                       fmt::format("{}: {}", field, msg));
}

static std::string lower(std::string_view s) {
  std::string out(s);
  for (auto &ch : out)
    ch = (char)std::tolower((unsigned char)ch);
  return out;
}

static std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace((unsigned char)s.front()))
    s.remove_prefix(1);
  while (!s.empty() && std::isspace((unsigned char)s.back()))
    s.remove_suffix(1);
  return s;
}

static std::vector<std::string_view> split(std::string_view s, char sep) {
  std::vector<std::string_view> out;
  size_t pos = 0;
  while (true) {
    auto next = s.find(sep, pos);
    if (next == std::string_view::npos) {
      out.push_back(s.substr(pos));
      return out;
    }
    out.push_back(s.substr(pos, next - pos));
    pos = next + 1;
  }
}

static std::vector<std::string_view> split_ws(std::string_view s) {
  std::vector<std::string_view> out;
  size_t i = 0;
  while (i < s.size()) {
    while (i < s.size() && std::isspace((unsigned char)s[i]))
      ++i;
    size_t j = i;
    while (j < s.size() && !std::isspace((unsigned char)s[j]))
      ++j;
    if (j > i)
      out.push_back(s.substr(i, j - i));
    i = j;
  }
  return out;
}

static bool all_digits(std::string_view s) {
  return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) {
    return std::isdigit((unsigned char)c);
  });
}

// digits only; saturates at UINT_MAX so callers report it as out of range
static unsigned to_uint(std::string_view s) {
  unsigned v = 0;
  auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  (void)p;
  if (ec == std::errc::result_out_of_range)
    return UINT_MAX;
  return v;
}

// ------------------------ cron fields ------------------------

static unsigned parse_value(std::string_view tok, Field f) {
  const std::string field = field_name(f);
  if (all_digits(tok)) {
    unsigned v = to_uint(tok);
    // cron allows 7 for Sunday
    unsigned max = f == Field::DayOfWeek ? 7 : field_max(f);
    if (v < field_min(f) || v > max)
      throw out_of_range(field, fmt::format("value {} is outside {}-{}", tok,
                                            field_min(f), max));
    return v;
  }
  auto name = lower(tok);
  if (f == Field::Month) {
    for (unsigned i = 0; i < 12; ++i)
      if (name == kMonthNames[i])
        return i + 1;
  } else if (f == Field::DayOfWeek) {
    for (unsigned i = 0; i < 7; ++i)
      if (name == lower(kDowNames[i]))
        return i;
  }
  throw syntax(field, fmt::format("invalid value '{}'", tok));
}

static unsigned normalize(unsigned v, Field f) {
  return (f == Field::DayOfWeek && v == 7) ? 0 : v;
}

static FieldConstraint compile_field(std::string_view text, Field f) {
  const std::string field = field_name(f);
  auto parts = split(text, ',');
  const bool single = parts.size() == 1;
  std::set<unsigned> acc;

  for (auto part : parts) {
    if (part.empty())
      throw syntax(field, fmt::format("empty list element in '{}'", text));

    std::string_view base = part;
    std::optional<unsigned> stride;
    auto slash = part.find('/');
    if (slash != std::string_view::npos) {
      base = part.substr(0, slash);
      auto st = part.substr(slash + 1);
      if (!all_digits(st))
        throw syntax(field, fmt::format("invalid step '{}'", part));
      unsigned n = to_uint(st);
      if (n == 0)
        throw out_of_range(field, fmt::format("step in '{}' must be at least 1",
                                              part));
      if (n > field_max(f) - field_min(f) + 1)
        throw out_of_range(field, fmt::format("step in '{}' is wider than "
                                              "the {} range",
                                              part, field));
      stride = n;
    }

    if (base == "*") {
      if (!single)
        throw syntax(field, "'*' cannot be part of a list");
      if (!stride)
        return FieldConstraint::any();
      if (f != Field::DayOfWeek)
        return FieldConstraint::step(field_min(f), *stride);
      // weekday steps have no calendar form; expand them
      for (unsigned long v = 0; v <= 6; v += *stride)
        acc.insert((unsigned)v);
      continue;
    }

    auto dash = base.find('-');
    if (dash == std::string_view::npos) {
      if (stride)
        throw syntax(field,
                     fmt::format("step base in '{}' must be '*' or a range",
                                 part));
      unsigned v = normalize(parse_value(base, f), f);
      if (single)
        return FieldConstraint::of_values({v});
      acc.insert(v);
      continue;
    }

    unsigned a = parse_value(base.substr(0, dash), f);
    unsigned b = parse_value(base.substr(dash + 1), f);
    if (a > b)
      throw syntax(field, fmt::format("range '{}' is reversed", base));
    if (single && !stride && !(f == Field::DayOfWeek && b == 7))
      return FieldConstraint::range(a, b);
    for (unsigned long v = a; v <= b; v += stride.value_or(1))
      acc.insert(normalize((unsigned)v, f));
  }

  return FieldConstraint::of_values({acc.begin(), acc.end()});
}

// ------------------------ aliases ------------------------

static Calendar at_time(unsigned hour, unsigned minute) {
  Calendar c;
  c.minute = FieldConstraint::of_values({minute});
  c.hour = FieldConstraint::of_values({hour});
  return c;
}

static std::pair<unsigned, unsigned>
parse_time_suffix(std::string_view s, const std::string &alias) {
  auto colon = s.find(':');
  auto h = s.substr(0, colon);
  std::string_view m = colon == std::string_view::npos ? std::string_view("0")
                                                       : s.substr(colon + 1);
  if (!all_digits(h) || !all_digits(m))
    throw syntax(alias, fmt::format("invalid time '{}', expected H or H:M", s));
  unsigned hour = to_uint(h), minute = to_uint(m);
  if (hour > 23 || minute > 59)
    throw syntax(alias, fmt::format("invalid time '{}'", s));
  return {hour, minute};
}

static std::string ordinal_suffix(unsigned n) {
  if (n % 100 >= 11 && n % 100 <= 13)
    return "th";
  switch (n % 10) {
  case 1:
    return "st";
  case 2:
    return "nd";
  case 3:
    return "rd";
  default:
    return "th";
  }
}

static Schedule compile_alias(std::string_view expr) {
  auto body = expr.substr(1);
  auto slash = body.find('/');
  auto name = lower(body.substr(0, slash));
  std::optional<std::string_view> suffix;
  if (slash != std::string_view::npos)
    suffix = body.substr(slash + 1);
  const std::string alias = "@" + name;

  auto no_suffix = [&]() {
    if (suffix)
      throw syntax(alias, "alias takes no time suffix");
  };
  auto time_of_day = [&]() -> std::pair<unsigned, unsigned> {
    if (!suffix)
      return {0, 0};
    return parse_time_suffix(*suffix, alias);
  };

  if (name == "reboot") {
    no_suffix();
    return Reboot{};
  }
  if (name == "service") {
    no_suffix();
    return PersistentService{};
  }
  if (name == "hourly") {
    no_suffix();
    Calendar c;
    c.minute = FieldConstraint::of_values({0});
    return c;
  }
  if (name == "midnight") {
    no_suffix();
    return at_time(0, 0);
  }
  if (name == "daily") {
    auto [h, m] = time_of_day();
    return at_time(h, m);
  }
  if (name == "weekly") {
    no_suffix();
    Calendar c = at_time(0, 0);
    c.day_of_week = FieldConstraint::of_values({1});
    return c;
  }
  if (name == "monthly") {
    no_suffix();
    Calendar c = at_time(0, 0);
    c.day_of_month = FieldConstraint::of_values({1});
    return c;
  }
  if (name == "yearly" || name == "annually") {
    no_suffix();
    Calendar c = at_time(0, 0);
    c.day_of_month = FieldConstraint::of_values({1});
    c.month = FieldConstraint::of_values({1});
    return c;
  }
  for (unsigned i = 0; i < 7; ++i) {
    if (name == kWeekdayAliases[i]) {
      auto [h, m] = time_of_day();
      Calendar c = at_time(h, m);
      c.day_of_week = FieldConstraint::of_values({i});
      return c;
    }
  }

  // @1st .. @31st
  size_t digits = 0;
  while (digits < name.size() && std::isdigit((unsigned char)name[digits]))
    ++digits;
  if (digits > 0) {
    unsigned day = to_uint(std::string_view(name).substr(0, digits));
    if (day < 1 || day > 31)
      throw out_of_range(field_name(Field::DayOfMonth),
                         fmt::format("alias '{}' names day {}", alias, day));
    if (name.substr(digits) != ordinal_suffix(day))
      throw syntax(alias, fmt::format("expected @{}{}", day,
                                      ordinal_suffix(day)));
    auto [h, m] = time_of_day();
    Calendar c = at_time(h, m);
    c.day_of_month = FieldConstraint::of_values({day});
    return c;
  }

  throw syntax(alias, "unknown alias");
}

Schedule compile_schedule(std::string_view expr) {
  expr = trim(expr);
  if (expr.empty())
    throw syntax("expression", "empty schedule");
  if (expr.front() == '@')
    return compile_alias(expr);

  auto fields = split_ws(expr);
  if (fields.size() != 5)
    throw syntax("expression",
                 fmt::format("expected 5 fields, got {}", fields.size()));

  Calendar c;
  c.minute = compile_field(fields[0], Field::Minute);
  c.hour = compile_field(fields[1], Field::Hour);
  c.day_of_month = compile_field(fields[2], Field::DayOfMonth);
  c.month = compile_field(fields[3], Field::Month);
  c.day_of_week = compile_field(fields[4], Field::DayOfWeek);
  return c;
}

// ------------------------ calendar text ------------------------

static std::string format_field(const FieldConstraint &fc) {
  switch (fc.kind) {
  case FieldConstraint::Kind::Any:
    return "*";
  case FieldConstraint::Kind::Values: {
    std::string out;
    for (size_t i = 0; i < fc.values.size(); ++i) {
      if (i)
        out += ',';
      out += fmt::format("{:02}", fc.values[i]);
    }
    return out;
  }
  case FieldConstraint::Kind::Range:
    return fmt::format("{:02}..{:02}", fc.first, fc.last);
  case FieldConstraint::Kind::Step:
    return fmt::format("{}/{}", fc.first, fc.stride);
  }
  return "*";
}

static std::string format_dow(const FieldConstraint &fc) {
  std::vector<unsigned> days;
  switch (fc.kind) {
  case FieldConstraint::Kind::Any:
    return "";
  case FieldConstraint::Kind::Range:
    return fmt::format("{}..{}", kDowNames[fc.first % 7],
                       kDowNames[fc.last % 7]);
  case FieldConstraint::Kind::Values:
    days = fc.values;
    break;
  case FieldConstraint::Kind::Step:
    for (unsigned long v = fc.first; v <= 6; v += std::max(1u, fc.stride))
      days.push_back((unsigned)v);
    break;
  }
  std::string out;
  for (size_t i = 0; i < days.size(); ++i) {
    if (i)
      out += ',';
    out += kDowNames[days[i] % 7];
  }
  return out;
}

std::string format_calendar(const Calendar &c) {
  std::string out;
  if (!c.day_of_week.is_any())
    out = format_dow(c.day_of_week) + " ";
  out += fmt::format("*-{}-{} {}:{}:00", format_field(c.month),
                     format_field(c.day_of_month), format_field(c.hour),
                     format_field(c.minute));
  return out;
}

static unsigned calendar_value(std::string_view tok, Field f) {
  const std::string field = field_name(f);
  if (!all_digits(tok))
    throw syntax(field, fmt::format("invalid value '{}'", tok));
  unsigned v = to_uint(tok);
  if (v < field_min(f) || v > field_max(f))
    throw out_of_range(field, fmt::format("value {} is outside {}-{}", tok,
                                          field_min(f), field_max(f)));
  return v;
}

static FieldConstraint parse_calendar_field(std::string_view s, Field f) {
  const std::string field = field_name(f);
  if (s == "*")
    return FieldConstraint::any();
  if (auto slash = s.find('/'); slash != std::string_view::npos) {
    unsigned start = calendar_value(s.substr(0, slash), f);
    auto st = s.substr(slash + 1);
    if (!all_digits(st))
      throw syntax(field, fmt::format("invalid step '{}'", s));
    unsigned n = to_uint(st);
    if (n == 0)
      throw out_of_range(field, "step must be at least 1");
    return FieldConstraint::step(start, n);
  }
  if (auto dots = s.find(".."); dots != std::string_view::npos) {
    unsigned a = calendar_value(s.substr(0, dots), f);
    unsigned b = calendar_value(s.substr(dots + 2), f);
    if (a > b)
      throw syntax(field, fmt::format("range '{}' is reversed", s));
    return FieldConstraint::range(a, b);
  }
  std::vector<unsigned> values;
  for (auto tok : split(s, ','))
    values.push_back(calendar_value(tok, f));
  return FieldConstraint::of_values(std::move(values));
}

static unsigned dow_index(std::string_view name) {
  auto l = lower(name);
  for (unsigned i = 0; i < 7; ++i)
    if (l == lower(kDowNames[i]))
      return i;
  throw syntax(field_name(Field::DayOfWeek),
               fmt::format("invalid weekday '{}'", name));
}

static FieldConstraint parse_calendar_dow(std::string_view s) {
  if (auto dots = s.find(".."); dots != std::string_view::npos) {
    unsigned a = dow_index(s.substr(0, dots));
    unsigned b = dow_index(s.substr(dots + 2));
    if (a > b)
      throw syntax(field_name(Field::DayOfWeek),
                   fmt::format("range '{}' is reversed", s));
    return FieldConstraint::range(a, b);
  }
  std::vector<unsigned> values;
  for (auto tok : split(s, ','))
    values.push_back(dow_index(tok));
  return FieldConstraint::of_values(std::move(values));
}

Calendar parse_calendar(std::string_view text) {
  auto tokens = split_ws(trim(text));
  if (tokens.size() != 2 && tokens.size() != 3)
    throw syntax("expression",
                 fmt::format("malformed calendar '{}'", text));

  Calendar c;
  size_t i = 0;
  if (tokens.size() == 3)
    c.day_of_week = parse_calendar_dow(tokens[i++]);

  auto date = split(tokens[i++], '-');
  if (date.size() != 3 || date[0] != "*")
    throw syntax("expression", fmt::format("malformed date in '{}'", text));
  c.month = parse_calendar_field(date[1], Field::Month);
  c.day_of_month = parse_calendar_field(date[2], Field::DayOfMonth);

  auto time = split(tokens[i], ':');
  if (time.size() != 3 || time[2] != "00")
    throw syntax("expression", fmt::format("malformed time in '{}'", text));
  c.hour = parse_calendar_field(time[0], Field::Hour);
  c.minute = parse_calendar_field(time[1], Field::Minute);
  return c;
}

std::optional<std::string> trigger_line(const Schedule &s) {
  if (auto *c = std::get_if<Calendar>(&s))
    return "OnCalendar=" + format_calendar(*c);
  if (std::holds_alternative<Reboot>(s))
    return std::string("OnBootSec=1min");
  return std::nullopt;
}

} // namespace sdcron
