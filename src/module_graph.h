#pragma once

#include "dependency_tag.h"
#include "diagnostic.h"
#include "graph_phase.h"
#include "module.h"
#include "mutator_registry.h"
#include "util.h"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sdkgraph {

class bottom_up_ctx;
class snapshot_builder;

// Owns every module and drives passes over them. Each pass is one TBB flow graph with a
// node per module; wait_for_all() is the barrier between passes. Deferred actions and
// the edge changes requested by bottom-up passes are applied after the barrier,
// serially, in registration order.
class module_graph : unmovable {
 public:
  module_graph() = default;

  // Throws std::runtime_error if (name, variant) is already registered.
  module &add(std::unique_ptr<module> m);

  module *find(std::string_view name, std::string_view variant) const;

  // Exact variant first, then the common ("") variant.
  module *resolve(std::string_view name, std::string_view variant) const;

  std::vector<module *> modules_named(std::string_view name) const;
  std::vector<std::unique_ptr<module>> const &modules() const { return modules_; }
  std::size_t size() const { return modules_.size(); }

  void add_dependency(module &from, dependency_tag tag, module &to);

  // Children before parents.
  void run_bottom_up(std::string const &pass,
                     graph_phase phase,
                     bottom_up_mutator_t const &fn,
                     bool parallel = true);

  // Parents before children.
  void run_top_down(std::string const &pass,
                    graph_phase phase,
                    top_down_mutator_t const &fn,
                    bool parallel = true);

  void run_mutators(register_mutators_ctx const &mutators, graph_phase phase);

  // Each module adds the dependencies it declares.
  void run_deps();

  void run_build_actions(snapshot_builder const &snapshots);

  std::vector<diagnostic> const &diagnostics() const { return diagnostics_; }
  bool has_errors() const { return !diagnostics_.empty(); }

  // Indices with dependencies before dependents. Throws std::runtime_error on a cycle.
  std::vector<std::size_t> topological_order() const;

 private:
  enum class direction { bottom_up, top_down };

  template <typename ctx_t>
  void traverse(std::string const &pass,
                graph_phase phase,
                direction dir,
                bool parallel,
                std::function<std::unique_ptr<ctx_t>(module &)> const &make_ctx,
                std::function<void(ctx_t &)> const &fn);

  std::vector<std::size_t> unique_targets(module const &m) const;

  void record_errors(module &m, std::vector<diagnostic> const &errors);
  void apply_intents(bottom_up_ctx const &ctx);

  static std::string key(std::string_view name, std::string_view variant);

  std::vector<std::unique_ptr<module>> modules_;
  std::unordered_map<std::string, module *> by_key_;
  std::vector<diagnostic> diagnostics_;
};

}  // namespace sdkgraph
