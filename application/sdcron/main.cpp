#include <sdcron/app.hpp>
#include <spdlog/spdlog.h>

int main(int argc, char** argv) {
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  return sdcron::App{}.run(argc, argv);
}
