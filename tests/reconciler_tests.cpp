#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include <sdcron/generator.hpp>
#include <sdcron/reconciler.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <set>
#include <string>
#include <vector>

using namespace sdcron;
namespace fs = std::filesystem;

static fs::path mkd(const char* name){
  auto d = fs::temp_directory_path() / (std::string("sdcron_rec_")+name);
  fs::remove_all(d);
  fs::create_directories(d);
  return d;
}

// Records every call; units listed in fail_on make enable/disable throw.
struct FakeControl : ServiceControl {
  std::vector<std::string> calls;
  std::set<std::string> fail_on;

  void check(const std::string& unit){
    if (fail_on.count(unit)) throw ControlError("refused: " + unit);
  }
  void daemon_reload() override { calls.push_back("daemon-reload"); }
  void enable(const std::string& u) override { calls.push_back("enable " + u); check(u); }
  void disable(const std::string& u) override { calls.push_back("disable " + u); check(u); }
  void restart(const std::string& u) override { calls.push_back("restart " + u); }
  std::string status(const std::string& u) override { calls.push_back("status " + u); return "active"; }
  void remove_runtime_state(const std::string& u) override { calls.push_back("reset " + u); }
  std::string show_property(const std::string& u, const std::string& p) override {
    calls.push_back("show " + u + " " + p);
    return "";
  }
};

static ManagedUnit timer(const std::string& name, const std::string& cron = "0 9 * * *"){
  ManagedUnit u;
  u.name = name;
  u.job = TimerJob::compile(cron);
  u.command = "/usr/bin/" + name;
  u.workdir = "/tmp";
  return u;
}

static ManagedUnit service(const std::string& name){
  ManagedUnit u;
  u.name = name;
  u.job = ServiceJob{};
  u.command = "/usr/bin/" + name + "d";
  u.workdir = "/tmp";
  return u;
}

static DesiredManifest manifest(std::initializer_list<ManagedUnit> units){
  DesiredManifest m;
  for (auto& u : units) m.emplace(u.name, u);
  return m;
}

static std::vector<std::string> listing(const fs::path& dir){
  std::vector<std::string> out;
  for (auto& e : fs::directory_iterator(dir)) out.push_back(e.path().filename().string());
  std::sort(out.begin(), out.end());
  return out;
}

static std::string slurp(const fs::path& p){
  std::ifstream in(p, std::ios::binary);
  return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

TEST_CASE("plan classifies every name in order") {
  InstalledState installed;
  installed.units.emplace("keep", timer("keep"));
  installed.units.emplace("edit", timer("edit"));
  installed.units.emplace("gone", timer("gone"));

  auto edited = timer("edit", "0 10 * * *");
  auto desired = manifest({timer("keep"), edited, service("new")});

  auto plan = plan_changes(desired, installed, false);
  REQUIRE(plan.entries.size() == 3);
  REQUIRE(plan.entries[0].name == "edit");
  REQUIRE(plan.entries[0].status == DiffStatus::Changed);
  REQUIRE(plan.entries[1].name == "keep");
  REQUIRE(plan.entries[1].status == DiffStatus::Unchanged);
  REQUIRE(plan.entries[2].name == "new");
  REQUIRE(plan.entries[2].status == DiffStatus::Added);
  REQUIRE_FALSE(plan.entries[2].before.has_value());
  REQUIRE(plan.unmanaged == std::vector<std::string>{"gone"});
  REQUIRE(plan.count(DiffStatus::Removed) == 0);

  auto pruned = plan_changes(desired, installed, true);
  REQUIRE(pruned.entries.size() == 4);
  REQUIRE(pruned.entries[1].name == "gone");
  REQUIRE(pruned.entries[1].status == DiffStatus::Removed);
  REQUIRE_FALSE(pruned.entries[1].after.has_value());
  REQUIRE(pruned.unmanaged.empty());
}

TEST_CASE("diff symbols") {
  REQUIRE(diff_symbol(DiffStatus::Added) == '+');
  REQUIRE(diff_symbol(DiffStatus::Changed) == '~');
  REQUIRE(diff_symbol(DiffStatus::Unchanged) == '=');
  REQUIRE(diff_symbol(DiffStatus::Removed) == '-');
}

TEST_CASE("prune only removes installed names absent from desired") {
  InstalledState installed;
  for (auto n : {"a", "b", "c"}) installed.units.emplace(n, timer(n));
  auto desired = manifest({timer("b"), timer("d")});

  auto plan = plan_changes(desired, installed, true);
  std::set<std::string> removed;
  for (auto& e : plan.entries)
    if (e.status == DiffStatus::Removed) removed.insert(e.name);
  REQUIRE(removed == std::set<std::string>{"a", "c"});
}

TEST_CASE("unknown metadata of installed units is carried forward") {
  InstalledState installed;
  auto old = timer("job");
  old.extra_metadata = {{"owner", "ops"}};
  installed.units.emplace("job", old);

  auto plan = plan_changes(manifest({timer("job")}), installed, false);
  REQUIRE(plan.entries[0].status == DiffStatus::Unchanged);
  REQUIRE(plan.entries[0].after->extra_metadata == old.extra_metadata);
}

TEST_CASE("corrupt installed units count as absent") {
  InstalledState installed;
  installed.corrupt.push_back({"broken", "no sdcron metadata"});
  auto plan = plan_changes(manifest({timer("broken")}), installed, true);
  REQUIRE(plan.entries.size() == 1);
  REQUIRE(plan.entries[0].status == DiffStatus::Added);
  REQUIRE(plan.corrupt.size() == 1);
}

TEST_CASE("apply then plan again is idempotent") {
  auto dir = mkd("idem");
  FakeControl ctl;
  Reconciler rec(UnitStore(dir), ctl);
  auto desired = manifest({timer("report", "@daily/9:30"), service("web")});

  auto plan = rec.plan(desired, false);
  REQUIRE(plan.count(DiffStatus::Added) == 2);
  auto sum = rec.apply(plan, {});
  REQUIRE(sum.ok());
  REQUIRE(sum.added == 2);

  REQUIRE(std::count(ctl.calls.begin(), ctl.calls.end(), "enable sdcron-report.timer") == 1);
  REQUIRE(std::count(ctl.calls.begin(), ctl.calls.end(), "enable sdcron-web.service") == 1);
  REQUIRE(listing(dir) == std::vector<std::string>{
      "sdcron-report.service", "sdcron-report.timer", "sdcron-web.service"});

  auto again = rec.plan(desired, true);
  REQUIRE(again.entries.size() == 2);
  for (auto& e : again.entries) REQUIRE(e.status == DiffStatus::Unchanged);
  REQUIRE_FALSE(again.has_changes());

  ctl.calls.clear();
  auto sum2 = rec.apply(again, {false, true});
  REQUIRE(sum2.unchanged == 2);
  REQUIRE(ctl.calls.empty());
}

TEST_CASE("changed units are rewritten and restarted") {
  auto dir = mkd("changed");
  FakeControl ctl;
  Reconciler rec(UnitStore(dir), ctl);
  rec.apply(rec.plan(manifest({timer("report")}), false), {});

  ctl.calls.clear();
  auto edited = timer("report", "*/30 * * * *");
  auto plan = rec.plan(manifest({edited}), false);
  REQUIRE(plan.entries[0].status == DiffStatus::Changed);
  auto sum = rec.apply(plan, {});
  REQUIRE(sum.changed == 1);
  REQUIRE(ctl.calls == std::vector<std::string>{
      "daemon-reload", "enable sdcron-report.timer", "restart sdcron-report.timer"});
  REQUIRE(slurp(dir / "sdcron-report.timer").find("OnCalendar=*-*-* *:0/30:00") !=
          std::string::npos);
}

TEST_CASE("kind change retires the old unit first") {
  auto dir = mkd("kind");
  FakeControl ctl;
  Reconciler rec(UnitStore(dir), ctl);
  rec.apply(rec.plan(manifest({timer("job")}), false), {});

  ctl.calls.clear();
  rec.apply(rec.plan(manifest({service("job")}), false), {});
  REQUIRE(ctl.calls.front() == "disable sdcron-job.timer");
  REQUIRE(std::count(ctl.calls.begin(), ctl.calls.end(), "enable sdcron-job.service") == 1);
  REQUIRE(listing(dir) == std::vector<std::string>{"sdcron-job.service"});
}

TEST_CASE("prune removes files and runtime state") {
  auto dir = mkd("prune");
  FakeControl ctl;
  Reconciler rec(UnitStore(dir), ctl);
  rec.apply(rec.plan(manifest({timer("old"), timer("keep")}), false), {});

  ctl.calls.clear();
  auto plan = rec.plan(manifest({timer("keep")}), true);
  auto sum = rec.apply(plan, {false, true});
  REQUIRE(sum.removed == 1);
  REQUIRE(ctl.calls == std::vector<std::string>{
      "disable sdcron-old.timer", "reset sdcron-old.timer",
      "reset sdcron-old.service", "daemon-reload"});
  REQUIRE(listing(dir) == std::vector<std::string>{
      "sdcron-keep.service", "sdcron-keep.timer"});
}

TEST_CASE("removal deletes files even when disable is refused") {
  auto dir = mkd("prune_refused");
  FakeControl ctl;
  Reconciler rec(UnitStore(dir), ctl);
  rec.apply(rec.plan(manifest({timer("old")}), false), {});

  ctl.calls.clear();
  ctl.fail_on = {"sdcron-old.timer"};
  ApplySummary sum;
  REQUIRE_NOTHROW(sum = rec.apply(rec.plan(manifest({}), true), {false, true}));
  REQUIRE(sum.removed == 1);
  REQUIRE(sum.ok());
  REQUIRE(sum.warnings.size() == 1);
  REQUIRE(sum.warnings[0].name == "old");
  REQUIRE_FALSE(fs::exists(dir / "sdcron-old.service"));
  REQUIRE_FALSE(fs::exists(dir / "sdcron-old.timer"));
  REQUIRE(ctl.calls.back() == "daemon-reload");
}

TEST_CASE("kind change survives a refused disable of the old unit") {
  auto dir = mkd("kind_refused");
  FakeControl ctl;
  Reconciler rec(UnitStore(dir), ctl);
  rec.apply(rec.plan(manifest({timer("job")}), false), {});

  ctl.fail_on = {"sdcron-job.timer"};
  auto sum = rec.apply(rec.plan(manifest({service("job")}), false), {});
  REQUIRE(sum.changed == 1);
  REQUIRE(sum.warnings.size() == 1);
  REQUIRE(listing(dir) == std::vector<std::string>{"sdcron-job.service"});
}

TEST_CASE("add installs one new unit and refuses to overwrite") {
  auto dir = mkd("add");
  FakeControl ctl;
  Reconciler rec(UnitStore(dir), ctl);

  auto sum = rec.add(timer("report"));
  REQUIRE(sum.added == 1);
  REQUIRE(ctl.calls == std::vector<std::string>{"daemon-reload", "enable sdcron-report.timer"});
  REQUIRE(listing(dir) == std::vector<std::string>{
      "sdcron-report.service", "sdcron-report.timer"});

  auto before = slurp(dir / "sdcron-report.service");
  ctl.calls.clear();
  REQUIRE_THROWS_AS(rec.add(timer("report", "@hourly")), ApplyError);
  REQUIRE_THROWS_AS(rec.add(service("report")), ApplyError);
  REQUIRE(ctl.calls.empty());
  REQUIRE(slurp(dir / "sdcron-report.service") == before);
}

TEST_CASE("add refuses the name of a corrupt unit") {
  auto dir = mkd("add_corrupt");
  { std::ofstream(dir / "sdcron-broken.service") << "[Service]\nExecStart=/bin/true\n"; }
  FakeControl ctl;
  Reconciler rec(UnitStore(dir), ctl);
  REQUIRE_THROWS_AS(rec.add(service("broken")), ApplyError);
  REQUIRE(ctl.calls.empty());
}

TEST_CASE("dry run touches neither disk nor service control") {
  auto dir = mkd("dry");
  FakeControl ctl;
  Reconciler rec(UnitStore(dir), ctl);
  rec.apply(rec.plan(manifest({timer("old")}), false), {});
  auto before = slurp(dir / "sdcron-old.service");
  ctl.calls.clear();

  auto plan = rec.plan(manifest({timer("new"), timer("old", "@hourly")}), true);
  auto sum = rec.apply(plan, {true, true});
  REQUIRE(sum.added == 1);
  REQUIRE(sum.changed == 1);
  REQUIRE(ctl.calls.empty());
  REQUIRE(listing(dir) == std::vector<std::string>{
      "sdcron-old.service", "sdcron-old.timer"});
  REQUIRE(slurp(dir / "sdcron-old.service") == before);
}

TEST_CASE("one failing unit does not stop the others") {
  auto dir = mkd("partial");
  FakeControl ctl;
  ctl.fail_on = {"sdcron-b.timer"};
  Reconciler rec(UnitStore(dir), ctl);

  auto sum = rec.apply(rec.plan(manifest({timer("a"), timer("b"), timer("c")}), false), {});
  REQUIRE(sum.added == 2);
  REQUIRE(sum.failures.size() == 1);
  REQUIRE(sum.failures[0].name == "b");
  REQUIRE_FALSE(sum.ok());
}

TEST_CASE("every unit failing is an apply error") {
  auto dir = mkd("allfail");
  FakeControl ctl;
  ctl.fail_on = {"sdcron-a.timer", "sdcron-b.timer"};
  Reconciler rec(UnitStore(dir), ctl);
  auto plan = rec.plan(manifest({timer("a"), timer("b")}), false);
  try {
    rec.apply(plan, {});
    FAIL("expected ApplyError");
  } catch (const ApplyError& e) {
    REQUIRE(e.failures().size() == 2);
  }
}

TEST_CASE("unwritable directory fails before any entry") {
  auto dir = mkd("unwritable") / "missing";
  FakeControl ctl;
  Reconciler rec(UnitStore(dir), ctl);
  auto plan = plan_changes(manifest({timer("a")}), InstalledState{}, false);
  REQUIRE_THROWS_AS(rec.apply(plan, {}), ApplyError);
  REQUIRE(ctl.calls.empty());
  REQUIRE_NOTHROW(rec.apply(plan, {true, false}));
}
