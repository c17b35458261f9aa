#include <sdcron/cli.hpp>

#include <charconv>
#include <string_view>
#include <vector>

namespace sdcron {

static bool has_arg(int i, int argc) { return i + 1 < argc; }

static bool parse_lines(std::string_view s, unsigned &out) {
  auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return !s.empty() && ec == std::errc{} && p == s.data() + s.size();
}

ParseResult parse_cli(int argc, char **argv) {
  ParseResult r{};
  if (argc < 2) {
    r.cmd = CmdHelp{};
    return r;
  }

  std::string cmd = argv[1];
  if (cmd == "--help" || cmd == "-h" || cmd == "help") {
    r.cmd = CmdHelp{};
    return r;
  }
  if (cmd == "--version" || cmd == "version") {
    r.cmd = CmdVersion{};
    return r;
  }

  // commands taking exactly one unit name
  auto parse_named = [&](auto ctor) -> ParseResult {
    ParseResult pr{};
    if (argc < 3) {
      pr.error = cmd + ": name required";
      return pr;
    }
    if (argc > 3) {
      pr.error = cmd + ": unexpected argument " + std::string(argv[3]);
      return pr;
    }
    pr.cmd = ctor(std::string(argv[2]));
    return pr;
  };

  if (cmd == "apply") {
    CmdApply c{};
    for (int i = 2; i < argc; i++) {
      std::string_view a = argv[i];
      if (a == "--prune")
        c.prune = true;
      else if (a == "--dry-run" || a == "-n")
        c.dry_run = true;
      else if (!a.empty() && a[0] == '-') {
        r.error = "apply: unknown option " + std::string(a);
        return r;
      } else if (c.file.empty())
        c.file = a;
      else {
        r.error = "apply: only one manifest file allowed";
        return r;
      }
    }
    if (c.file.empty()) {
      r.error = "apply: manifest file required";
      return r;
    }
    r.cmd = c;
    return r;
  }

  if (cmd == "add") {
    CmdAdd c{};
    std::vector<std::string> pos;
    for (int i = 2; i < argc; i++) {
      std::string_view a = argv[i];
      std::optional<std::string> *dst = nullptr;
      if (a == "--name")
        dst = &c.name;
      else if (a == "--workdir" || a == "-w")
        dst = &c.workdir;
      else if (a == "--description" || a == "-d")
        dst = &c.description;
      else if (a == "--env-file")
        dst = &c.env_file;
      else if (a == "--restart")
        dst = &c.restart;
      else if (a.size() > 1 && a[0] == '-') {
        r.error = "add: unknown option " + std::string(a);
        return r;
      } else {
        pos.emplace_back(a);
        continue;
      }
      if (!has_arg(i, argc)) {
        r.error = "add: " + std::string(a) + " expects a value";
        return r;
      }
      *dst = argv[++i];
    }
    if (pos.size() != 2) {
      r.error = "add: expected <schedule> <command>";
      return r;
    }
    c.schedule = pos[0];
    c.command = pos[1];
    r.cmd = c;
    return r;
  }

  if (cmd == "export") {
    CmdExport c{};
    for (int i = 2; i < argc; i++) {
      std::string_view a = argv[i];
      if ((a == "--output" || a == "-o") && has_arg(i, argc))
        c.output = argv[++i];
      else {
        r.error = "export: unexpected argument " + std::string(a);
        return r;
      }
    }
    r.cmd = c;
    return r;
  }

  if (cmd == "list" || cmd == "ls") {
    r.cmd = CmdList{};
    return r;
  }

  if (cmd == "status")
    return parse_named([](std::string n) { return CmdStatus{n}; });
  if (cmd == "remove" || cmd == "rm")
    return parse_named([](std::string n) { return CmdRemove{n}; });
  if (cmd == "restart")
    return parse_named([](std::string n) { return CmdRestart{n}; });
  if (cmd == "enable")
    return parse_named([](std::string n) { return CmdEnable{n}; });
  if (cmd == "disable")
    return parse_named([](std::string n) { return CmdDisable{n}; });

  if (cmd == "logs") {
    if (argc < 3) {
      r.error = "logs: name required";
      return r;
    }
    CmdLogs c{argv[2]};
    for (int i = 3; i < argc; i++) {
      std::string_view a = argv[i];
      if (a == "--follow" || a == "-f")
        c.follow = true;
      else if ((a == "--lines" || a == "-n") && has_arg(i, argc)) {
        if (!parse_lines(argv[++i], c.lines)) {
          r.error = "logs: --lines expects a number";
          return r;
        }
      } else if ((a == "--priority" || a == "-p") && has_arg(i, argc))
        c.priority = argv[++i];
      else {
        r.error = "logs: unexpected argument " + std::string(a);
        return r;
      }
    }
    r.cmd = c;
    return r;
  }

  if (cmd == "schedule") {
    if (argc < 3) {
      r.error = "schedule: expression required";
      return r;
    }
    CmdSchedule c{};
    for (int i = 2; i < argc; i++) {
      if (!c.expr.empty())
        c.expr += ' ';
      c.expr += argv[i];
    }
    r.cmd = c;
    return r;
  }

  if (cmd == "init") {
    r.cmd = CmdInit{};
    return r;
  }

  r.error = "unknown command: " + cmd;
  return r;
}

} // namespace sdcron
