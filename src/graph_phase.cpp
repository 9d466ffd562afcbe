#include "graph_phase.h"

#include <array>

namespace sdkgraph {

namespace {

// Index = enum value
constinit std::array<std::string_view, 4> const graph_phase_name_table{ {
    "pre_deps",
    "deps",
    "post_deps",
    "build_actions",
} };

}  // namespace

std::string_view graph_phase_name(graph_phase p) {
  auto const idx{ static_cast<std::size_t>(p) };
  if (idx >= graph_phase_name_table.size()) { return "unknown"; }
  return graph_phase_name_table[idx];
}

}  // namespace sdkgraph
