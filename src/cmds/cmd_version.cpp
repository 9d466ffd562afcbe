#include "cmd_version.h"

#include "tui.h"

#include "CLI11.hpp"
#include "sol/sol.hpp"

#include <tbb/version.h>

#ifndef SDKGRAPH_VERSION_STR
#error "SDKGRAPH_VERSION_STR must be defined by the build system"
#endif

namespace sdkgraph {

cmd_version::cmd_version(cmd_version::cfg cfg) : cfg_{ cfg } {}

bool cmd_version::execute() {
  tui::info("sdkgraph version %s", SDKGRAPH_VERSION_STR);
  tui::info("");
  tui::info("Third-party component versions:");
  tui::info("  oneTBB: %d.%d", TBB_VERSION_MAJOR, TBB_VERSION_MINOR);
  tui::info("  Lua: %s", LUA_RELEASE);
  tui::info("  Sol2: %s", SOL_VERSION_STRING);
  tui::info("  CLI11: %s", CLI11_VERSION);
  return true;
}

}  // namespace sdkgraph
