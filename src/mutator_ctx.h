#pragma once

#include "dependency_tag.h"
#include "diagnostic.h"
#include "util.h"

#include <functional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace sdkgraph {

class module;
class module_graph;
class snapshot_builder;

// Per-module view handed to a pass. Errors are buffered here and merged into the graph
// after the pass barrier; the module is marked failed if any were recorded.
class module_ctx : unmovable {
 public:
  module_ctx(module_graph &graph, module &m);

  module &this_module() const { return module_; }
  std::string const &module_name() const;
  std::string const &variant() const;

  void property_error(std::string_view property, std::string message);
  void module_error(std::string message);
  bool failed() const { return !errors_.empty(); }

  void visit_direct_deps(std::function<void(module &, dependency_tag const &)> const &fn) const;

  // Same-variant module named `name`, falling back to the common ("") variant.
  module *find_module(std::string_view name) const;

  // Runs after the pass barrier, serially and in module registration order. Dropped if
  // this context recorded an error during the pass.
  using deferred_t = std::function<void(module_ctx &)>;
  void defer(deferred_t fn);
  void run_deferred();

  std::vector<diagnostic> const &errors() const { return errors_; }

 protected:
  module_graph &graph_;
  module &module_;

 private:
  std::vector<diagnostic> errors_;
  std::vector<deferred_t> deferred_;
};

class top_down_ctx : public module_ctx {
 public:
  using module_ctx::module_ctx;
};

// Edge changes requested here are applied after the pass barrier, in module order.
class bottom_up_ctx : public module_ctx {
 public:
  using module_ctx::module_ctx;

  // Edges from this module to each named module.
  void add_dependencies(dependency_tag const &tag, std::vector<std::string> const &names);

  // Edge from the named module to this module.
  void add_reverse_dependency(dependency_tag const &tag, std::string name);

  // Rewire edges that point at a module named `name` so they point here. Only
  // dependents that would resolve this module's name to this module are considered,
  // and of those only the ones `accepts` admits (all of them if empty).
  using replace_predicate_t = std::function<bool(module &dependent)>;
  void replace_dependencies(std::string name, replace_predicate_t accepts = {});

  struct add_intent {
    dependency_tag tag;
    std::string name;
  };

  struct reverse_intent {
    dependency_tag tag;
    std::string name;
  };

  struct replace_intent {
    std::string name;
    replace_predicate_t accepts;
  };

  using intent_t = std::variant<add_intent, reverse_intent, replace_intent>;

  std::vector<intent_t> const &intents() const { return intents_; }

 private:
  std::vector<intent_t> intents_;
};

class build_ctx : public module_ctx {
 public:
  build_ctx(module_graph &graph, module &m, snapshot_builder const &snapshots);

  snapshot_builder const &snapshots() const { return snapshots_; }

 private:
  snapshot_builder const &snapshots_;
};

}  // namespace sdkgraph
