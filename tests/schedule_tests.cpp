#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include <sdcron/schedule.hpp>

#include <string>
#include <vector>

using namespace sdcron;

static Calendar cal(const std::string &expr) {
  auto s = compile_schedule(expr);
  REQUIRE(std::holds_alternative<Calendar>(s));
  return std::get<Calendar>(s);
}

static ScheduleError compile_error(const std::string &expr) {
  try {
    compile_schedule(expr);
  } catch (const ScheduleError &e) {
    return e;
  }
  FAIL("expected ScheduleError for '" << expr << "'");
  throw std::logic_error("unreachable");
}

TEST_CASE("step in minute field") {
  auto c = cal("*/5 * * * *");
  REQUIRE(c.minute == FieldConstraint::step(0, 5));
  REQUIRE(c.hour.is_any());
  REQUIRE(c.day_of_month.is_any());
  REQUIRE(c.month.is_any());
  REQUIRE(c.day_of_week.is_any());
  REQUIRE(format_calendar(c) == "*-*-* *:0/5:00");
}

TEST_CASE("weekday range with fixed time") {
  auto c = cal("0 9 * * 1-5");
  REQUIRE(c.minute == FieldConstraint::of_values({0}));
  REQUIRE(c.hour == FieldConstraint::of_values({9}));
  REQUIRE(c.day_of_week == FieldConstraint::range(1, 5));
  REQUIRE(format_calendar(c) == "Mon..Fri *-*-* 09:00:00");
}

TEST_CASE("daily alias with hour and minute") {
  auto c = cal("@daily/9:30");
  REQUIRE(c.hour == FieldConstraint::of_values({9}));
  REQUIRE(c.minute == FieldConstraint::of_values({30}));
  REQUIRE(c.day_of_week.is_any());
  REQUIRE(cal("@daily") == cal("0 0 * * *"));
  REQUIRE(cal("@daily/9") == cal("0 9 * * *"));
  REQUIRE(cal("@daily/9:30") == cal("30 9 * * *"));
}

TEST_CASE("weekday alias") {
  auto c = cal("@monday/9");
  REQUIRE(c.day_of_week == FieldConstraint::of_values({1}));
  REQUIRE(c.hour == FieldConstraint::of_values({9}));
  REQUIRE(c.minute == FieldConstraint::of_values({0}));
  REQUIRE(format_calendar(c) == "Mon *-*-* 09:00:00");
  REQUIRE(cal("@sunday") == cal("0 0 * * 0"));
  REQUIRE(cal("@friday/17:45") == cal("45 17 * * 5"));
}

TEST_CASE("day-of-month alias") {
  auto c = cal("@1st/8");
  REQUIRE(c.day_of_month == FieldConstraint::of_values({1}));
  REQUIRE(c.hour == FieldConstraint::of_values({8}));
  REQUIRE(c.minute == FieldConstraint::of_values({0}));
  REQUIRE(cal("@2nd") == cal("0 0 2 * *"));
  REQUIRE(cal("@3rd/6:15") == cal("15 6 3 * *"));
  REQUIRE(cal("@11th") == cal("0 0 11 * *"));
  REQUIRE(cal("@22nd") == cal("0 0 22 * *"));
  REQUIRE(cal("@31st") == cal("0 0 31 * *"));
}

TEST_CASE("fixed aliases") {
  REQUIRE(cal("@hourly") == cal("0 * * * *"));
  REQUIRE(cal("@midnight") == cal("0 0 * * *"));
  REQUIRE(cal("@weekly") == cal("0 0 * * 1"));
  REQUIRE(cal("@monthly") == cal("0 0 1 * *"));
  REQUIRE(cal("@yearly") == cal("0 0 1 1 *"));
  REQUIRE(cal("@annually") == cal("@yearly"));
}

TEST_CASE("reboot and service aliases") {
  auto r = compile_schedule("@reboot");
  REQUIRE(std::holds_alternative<Reboot>(r));
  REQUIRE(trigger_line(r) == std::optional<std::string>("OnBootSec=1min"));

  auto s = compile_schedule("@service");
  REQUIRE(is_persistent_service(s));
  REQUIRE_FALSE(trigger_line(s).has_value());
}

TEST_CASE("lists, names and sunday as 7") {
  auto c = cal("0,30 8-18/2 * jan,JUL sun,sat");
  REQUIRE(c.minute == FieldConstraint::of_values({0, 30}));
  REQUIRE(c.hour == FieldConstraint::of_values({8, 10, 12, 14, 16, 18}));
  REQUIRE(c.month == FieldConstraint::of_values({1, 7}));
  REQUIRE(c.day_of_week == FieldConstraint::of_values({0, 6}));

  REQUIRE(cal("0 0 * * 7") == cal("0 0 * * 0"));
  REQUIRE(cal("0 0 * * 5-7").day_of_week == FieldConstraint::of_values({0, 5, 6}));
  REQUIRE(cal("0 0 * * */2").day_of_week ==
          FieldConstraint::of_values({0, 2, 4, 6}));
  REQUIRE(cal("5,5,1 * * * *").minute == FieldConstraint::of_values({1, 5}));
}

TEST_CASE("out of range values name their field") {
  auto e = compile_error("0 0 32 * *");
  REQUIRE(e.kind() == ScheduleError::Kind::OutOfRange);
  REQUIRE(e.field() == "day-of-month");

  REQUIRE(compile_error("60 * * * *").field() == "minute");
  REQUIRE(compile_error("0 24 * * *").field() == "hour");
  REQUIRE(compile_error("0 0 0 * *").field() == "day-of-month");
  REQUIRE(compile_error("0 0 * 13 *").field() == "month");
  REQUIRE(compile_error("0 0 * * 8").field() == "day-of-week");
  REQUIRE(compile_error("*/0 * * * *").kind() == ScheduleError::Kind::OutOfRange);
  REQUIRE(compile_error("99999999999 * * * *").kind() ==
          ScheduleError::Kind::OutOfRange);
}

TEST_CASE("step wider than its field is out of range") {
  auto e = compile_error("*/70 * * * *");
  REQUIRE(e.kind() == ScheduleError::Kind::OutOfRange);
  REQUIRE(e.field() == "minute");
  REQUIRE(compile_error("0 */25 * * *").field() == "hour");
  REQUIRE(compile_error("0 0 * * */8").field() == "day-of-week");
  REQUIRE(compile_error("0 0 1-10/40 * *").field() == "day-of-month");
  REQUIRE(std::get<Calendar>(compile_schedule("*/60 * * * *")).minute ==
          FieldConstraint::step(0, 60));
}

TEST_CASE("malformed expressions are syntax errors") {
  for (const char *expr :
       {"", "* * * *", "* * * * * *", "a * * * *", "1- * * * *", "5-1 * * * *",
        "1,,2 * * * *", "*,1 * * * *", "3/2 * * * *", "* * * foo *"}) {
    INFO(expr);
    REQUIRE(compile_error(expr).kind() == ScheduleError::Kind::Syntax);
  }
  REQUIRE(compile_error("* * * * *x").field() == "day-of-week");
  REQUIRE(compile_error("* * * * * *").field() == "expression");
}

TEST_CASE("alias errors") {
  REQUIRE(compile_error("@daily/25").kind() == ScheduleError::Kind::Syntax);
  REQUIRE(compile_error("@daily/9:60").kind() == ScheduleError::Kind::Syntax);
  REQUIRE(compile_error("@daily/x").kind() == ScheduleError::Kind::Syntax);
  REQUIRE(compile_error("@hourly/3").kind() == ScheduleError::Kind::Syntax);
  REQUIRE(compile_error("@reboot/1").kind() == ScheduleError::Kind::Syntax);
  REQUIRE(compile_error("@1th").kind() == ScheduleError::Kind::Syntax);
  REQUIRE(compile_error("@12nd").kind() == ScheduleError::Kind::Syntax);
  REQUIRE(compile_error("@32nd").kind() == ScheduleError::Kind::OutOfRange);
  REQUIRE(compile_error("@fortnightly").field() == "@fortnightly");
}

TEST_CASE("calendar rendering") {
  REQUIRE(format_calendar(cal("* * * * *")) == "*-*-* *:*:00");
  REQUIRE(format_calendar(cal("5 4 1-15 * *")) == "*-*-01..15 04:05:00");
  REQUIRE(format_calendar(cal("0 */6 * * *")) == "*-*-* 0/6:00:00");
  REQUIRE(format_calendar(cal("0 0 */2 * *")) == "*-*-1/2 00:00:00");
  REQUIRE(format_calendar(cal("@yearly")) == "*-01-01 00:00:00");
  REQUIRE(format_calendar(cal("0 9 * * 1,3,5")) == "Mon,Wed,Fri *-*-* 09:00:00");
  REQUIRE(trigger_line(compile_schedule("@daily/9:30")) ==
          std::optional<std::string>("OnCalendar=*-*-* 09:30:00"));
}

TEST_CASE("calendar round-trip") {
  const std::vector<std::string> exprs = {
      "* * * * *",         "*/5 * * * *",      "0 9 * * 1-5",
      "0,15,30,45 * * * *", "0 8-18/2 * * *",  "30 2 1 * *",
      "0 0 1 1 *",          "0 0 * * 0",       "0 0 * * 6,0",
      "*/10 */3 */2 */4 *", "0 12 10-20 6-8 *", "0 0 * * 1-7",
      "@daily/9:30",        "@monday/9",       "@1st/8",
      "@hourly",            "@weekly",         "@31st/23:59",
      "0 0 * jan-mar mon-fri"};
  for (const auto &e : exprs) {
    INFO(e);
    auto c = cal(e);
    auto text = format_calendar(c);
    REQUIRE(parse_calendar(text) == c);
  }
}

TEST_CASE("parse_calendar rejects garbage") {
  REQUIRE_THROWS_AS(parse_calendar("tomorrow"), ScheduleError);
  REQUIRE_THROWS_AS(parse_calendar("*-*-* 09:00"), ScheduleError);
  REQUIRE_THROWS_AS(parse_calendar("Xyz *-*-* 09:00:00"), ScheduleError);
  REQUIRE_THROWS_AS(parse_calendar("*-13-* 09:00:00"), ScheduleError);
}
