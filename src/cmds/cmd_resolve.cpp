#include "cmd_resolve.h"

#include "build_file.h"
#include "engine.h"
#include "member_list_registry.h"
#include "module_graph.h"
#include "sdk_aware.h"
#include "snapshot_builder.h"
#include "tui.h"

#include <utility>

namespace sdkgraph {

cmd_resolve::cmd_resolve(cmd_resolve::cfg cfg) : cfg_{ std::move(cfg) } {}

bool cmd_resolve::execute() {
  auto const path{ build_file::find_path(cfg_.build_file) };
  auto bf{ build_file::load(path) };

  auto const out_dir{ [&]() -> std::filesystem::path {
    if (cfg_.out_dir) { return *cfg_.out_dir; }
    if (bf->meta.out_dir) { return path.parent_path() / *bf->meta.out_dir; }
    return path.parent_path() / "out";
  }() };

  module_graph graph;
  bf->populate(graph);

  output_dir_snapshot_builder const snapshots{ out_dir };
  engine eng{ graph, member_list_registry::standard(), snapshots };
  auto const result{ eng.run() };

  if (cfg_.print_graph) { tui::print_stdout("%s", format_graph(graph).c_str()); }

  for (auto const &d : result.diagnostics) { tui::error("%s", d.to_string().c_str()); }
  if (!result.ok()) {
    tui::error("%zu error(s) in %s", result.diagnostics.size(), path.string().c_str());
    return false;
  }

  for (auto const &s : result.snapshots) {
    auto const label{ s.variant.empty() ? s.sdk : s.sdk + " [" + s.variant + "]" };
    tui::print_stdout("%s: %s\n", label.c_str(), s.file.string().c_str());
  }
  return true;
}

std::string cmd_resolve::format_graph(module_graph const &graph) {
  std::string out;
  for (auto const &m : graph.modules()) {
    out += m->display_name() + " (" + std::string{ m->type_name() } + ")\n";

    if (auto const *aware{ m->as_sdk_aware() }) {
      auto const sdk{ aware->contained_sdk() };
      auto const required{ aware->required_sdks() };
      if (sdk.is_set()) { out += "  sdk: " + sdk.to_string() + "\n"; }
      if (!required.empty()) { out += "  required_sdks: " + required.to_string() + "\n"; }
    }

    for (auto const &dep : m->dependencies()) {
      out += "  -> " + dep.target->display_name() + " [" + dependency_tag_name(dep.tag) +
             "]\n";
    }
  }
  return out;
}

}  // namespace sdkgraph
