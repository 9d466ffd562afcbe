#pragma once

#include <string_view>

namespace sdkgraph {

// Global order in which the module graph is mutated. Every mutator registered for a
// phase completes for the whole graph before the next phase starts.
enum class graph_phase : int {
  pre_deps = 0,
  deps = 1,
  post_deps = 2,
  build_actions = 3,
};

std::string_view graph_phase_name(graph_phase p);

}  // namespace sdkgraph
