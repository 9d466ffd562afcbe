#include "mutator_ctx.h"

#include "module.h"
#include "module_graph.h"

#include <utility>

namespace sdkgraph {

module_ctx::module_ctx(module_graph &graph, module &m) : graph_{ graph }, module_{ m } {}

std::string const &module_ctx::module_name() const { return module_.name(); }

std::string const &module_ctx::variant() const { return module_.variant(); }

void module_ctx::property_error(std::string_view property, std::string message) {
  errors_.push_back(diagnostic{ .module = module_.name(),
                                .variant = module_.variant(),
                                .property = std::string{ property },
                                .message = std::move(message) });
}

void module_ctx::module_error(std::string message) {
  errors_.push_back(diagnostic{ .module = module_.name(),
                                .variant = module_.variant(),
                                .property = {},
                                .message = std::move(message) });
}

void module_ctx::visit_direct_deps(
    std::function<void(module &, dependency_tag const &)> const &fn) const {
  for (auto const &dep : module_.dependencies()) { fn(*dep.target, dep.tag); }
}

module *module_ctx::find_module(std::string_view name) const {
  return graph_.resolve(name, module_.variant());
}

void module_ctx::defer(deferred_t fn) { deferred_.push_back(std::move(fn)); }

void module_ctx::run_deferred() {
  auto pending{ std::move(deferred_) };
  deferred_.clear();
  if (failed()) { return; }
  for (auto const &fn : pending) { fn(*this); }
}

void bottom_up_ctx::add_dependencies(dependency_tag const &tag,
                                     std::vector<std::string> const &names) {
  for (auto const &name : names) {
    intents_.emplace_back(add_intent{ .tag = tag, .name = name });
  }
}

void bottom_up_ctx::add_reverse_dependency(dependency_tag const &tag, std::string name) {
  intents_.emplace_back(reverse_intent{ .tag = tag, .name = std::move(name) });
}

void bottom_up_ctx::replace_dependencies(std::string name, replace_predicate_t accepts) {
  intents_.emplace_back(replace_intent{ .name = std::move(name), .accepts = std::move(accepts) });
}

build_ctx::build_ctx(module_graph &graph, module &m, snapshot_builder const &snapshots)
    : module_ctx{ graph, m }, snapshots_{ snapshots } {}

}  // namespace sdkgraph
