#include "engine.h"

#include "module_graph.h"
#include "module_types/package.h"
#include "mutator_registry.h"
#include "sdk.h"
#include "sdk_mutators.h"
#include "snapshot_builder.h"
#include "tui.h"

namespace sdkgraph {

engine::engine(module_graph &graph,
               member_list_registry const &members,
               snapshot_builder const &snapshots)
    : graph_{ graph }, members_{ members }, snapshots_{ snapshots } {}

build_result engine::run() {
  register_mutators_ctx pre_deps;
  register_sdk_pre_deps_mutators(pre_deps, members_);

  register_mutators_ctx post_deps;
  register_package_post_deps_mutators(post_deps);
  register_sdk_post_deps_mutators(post_deps);

  tui::debug("resolving %zu modules", graph_.size());

  graph_.run_mutators(pre_deps, graph_phase::pre_deps);
  graph_.run_deps();
  graph_.run_mutators(post_deps, graph_phase::post_deps);

  build_result result;
  if (graph_.has_errors()) {
    result.diagnostics = graph_.diagnostics();
    tui::debug("skipping build actions: %zu errors", result.diagnostics.size());
    return result;
  }

  graph_.run_build_actions(snapshots_);
  result.diagnostics = graph_.diagnostics();

  for (auto const &m : graph_.modules()) {
    auto *sdk{ m->as_sdk() };
    if (!sdk || !sdk->snapshot_file()) { continue; }
    result.snapshots.push_back(snapshot_output{ .sdk = sdk->name(),
                                                .variant = sdk->variant(),
                                                .file = *sdk->snapshot_file() });
  }

  return result;
}

}  // namespace sdkgraph
