#pragma once

#include "cmd.h"

#include <filesystem>
#include <optional>
#include <string>

namespace sdkgraph {

class module_graph;

// Loads the build file, runs the sdk pipeline and prints each sdk's snapshot path.
class cmd_resolve : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_resolve> {
    std::optional<std::filesystem::path> build_file;  // discovered when absent
    std::optional<std::filesystem::path> out_dir;     // overrides the out-dir directive
    bool print_graph{ false };
  };

  explicit cmd_resolve(cfg cfg);

  bool execute() override;

  // One block per module: header line, sdk state if sdk-aware, then one line per edge.
  static std::string format_graph(module_graph const &graph);

 private:
  cfg cfg_;
};

}  // namespace sdkgraph
