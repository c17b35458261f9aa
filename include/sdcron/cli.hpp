#pragma once
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sdcron {

struct CmdApply {
  std::string file;
  bool prune = false;
  bool dry_run = false;
};
struct CmdAdd {
  std::string schedule;
  std::string command;
  std::optional<std::string> name; // derived from the command when unset
  std::optional<std::string> workdir;
  std::optional<std::string> description;
  std::optional<std::string> env_file;
  std::optional<std::string> restart;
};
struct CmdExport {
  std::optional<std::string> output;
};
struct CmdList {};
struct CmdStatus {
  std::string name;
};
struct CmdLogs {
  std::string name;
  bool follow = false;
  unsigned lines = 50;
  std::optional<std::string> priority;
};
struct CmdRemove {
  std::string name;
};
struct CmdRestart {
  std::string name;
};
struct CmdEnable {
  std::string name;
};
struct CmdDisable {
  std::string name;
};
struct CmdSchedule {
  std::string expr;
};
struct CmdInit {};
struct CmdHelp {};
struct CmdVersion {};

using Command =
    std::variant<CmdApply, CmdAdd, CmdExport, CmdList, CmdStatus, CmdLogs, CmdRemove,
                 CmdRestart, CmdEnable, CmdDisable, CmdSchedule, CmdInit,
                 CmdHelp, CmdVersion>;

struct ParseResult {
  std::optional<Command> cmd;
  std::string error;
};

ParseResult parse_cli(int argc, char **argv);

} // namespace sdcron
