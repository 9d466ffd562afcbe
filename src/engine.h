#pragma once

#include "diagnostic.h"
#include "member_list_registry.h"
#include "util.h"

#include <filesystem>
#include <string>
#include <vector>

namespace sdkgraph {

class module_graph;
class snapshot_builder;

struct snapshot_output {
  std::string sdk;      // module name
  std::string variant;
  std::filesystem::path file;
};

struct build_result {
  std::vector<diagnostic> diagnostics;
  std::vector<snapshot_output> snapshots;  // only when build actions ran

  bool ok() const { return diagnostics.empty(); }
};

// Runs the full pipeline over a populated graph: pre-deps mutators, each module's
// declared deps, post-deps mutators, then build actions if nothing failed.
class engine : unmovable {
 public:
  engine(module_graph &graph,
         member_list_registry const &members,
         snapshot_builder const &snapshots);

  // Diagnostics are returned, not thrown. Host faults such as a dependency cycle throw
  // std::runtime_error.
  build_result run();

 private:
  module_graph &graph_;
  member_list_registry const &members_;
  snapshot_builder const &snapshots_;
};

}  // namespace sdkgraph
