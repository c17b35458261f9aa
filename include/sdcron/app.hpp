#pragma once

namespace sdcron {

struct App {
  // Exit codes: 0 success, 1 operational failure, 2 usage error.
  int run(int argc, char **argv);
};

} // namespace sdcron
