#include "module_graph.h"

#include "mutator_ctx.h"
#include "trace.h"
#include "tui.h"

#include <tbb/flow_graph.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace sdkgraph {

std::string module_graph::key(std::string_view name, std::string_view variant) {
  std::string result{ name };
  result.push_back('\0');
  result.append(variant);
  return result;
}

module &module_graph::add(std::unique_ptr<module> m) {
  if (!m) { throw std::logic_error("module_graph::add called with null module"); }

  auto const k{ key(m->name(), m->variant()) };
  if (by_key_.contains(k)) {
    throw std::runtime_error("module " + util_quote(m->display_name()) +
                             " is defined more than once");
  }

  m->index_ = modules_.size();
  SDKGRAPH_TRACE_MODULE_REGISTERED(m->name(), m->variant(), std::string{ m->type_name() });

  auto &result{ *m };
  by_key_.emplace(k, m.get());
  modules_.push_back(std::move(m));
  return result;
}

module *module_graph::find(std::string_view name, std::string_view variant) const {
  auto const it{ by_key_.find(key(name, variant)) };
  return it == by_key_.end() ? nullptr : it->second;
}

module *module_graph::resolve(std::string_view name, std::string_view variant) const {
  if (auto *m{ find(name, variant) }) { return m; }
  if (variant.empty()) { return nullptr; }
  return find(name, "");
}

std::vector<module *> module_graph::modules_named(std::string_view name) const {
  std::vector<module *> result;
  for (auto const &m : modules_) {
    if (m->name() == name) { result.push_back(m.get()); }
  }
  return result;
}

void module_graph::add_dependency(module &from, dependency_tag tag, module &to) {
  SDKGRAPH_TRACE_DEPENDENCY_ADDED(from.name(),
                                  to.name(),
                                  from.variant(),
                                  dependency_tag_name(tag));
  from.deps_.push_back(dependency{ .target = &to, .tag = std::move(tag) });
}

std::vector<std::size_t> module_graph::unique_targets(module const &m) const {
  std::vector<std::size_t> result;
  result.reserve(m.deps_.size());
  for (auto const &dep : m.deps_) {
    auto const index{ dep.target->index_ };
    if (std::ranges::find(result, index) == result.end()) { result.push_back(index); }
  }
  return result;
}

std::vector<std::size_t> module_graph::topological_order() const {
  enum class mark : unsigned char { unvisited, visiting, done };

  struct frame {
    std::size_t index;
    std::vector<std::size_t> targets;
    std::size_t next;
  };

  std::vector<mark> marks(modules_.size(), mark::unvisited);
  std::vector<std::size_t> order;
  order.reserve(modules_.size());

  for (std::size_t root{ 0 }; root < modules_.size(); ++root) {
    if (marks[root] != mark::unvisited) { continue; }

    std::vector<frame> stack;
    marks[root] = mark::visiting;
    stack.push_back(frame{ root, unique_targets(*modules_[root]), 0 });

    while (!stack.empty()) {
      auto &top{ stack.back() };
      if (top.next == top.targets.size()) {
        marks[top.index] = mark::done;
        order.push_back(top.index);
        stack.pop_back();
        continue;
      }

      auto const target{ top.targets[top.next++] };
      if (marks[target] == mark::done) { continue; }

      if (marks[target] == mark::visiting) {
        std::vector<std::string> cycle;
        auto it{ std::ranges::find_if(stack,
                                      [&](frame const &f) { return f.index == target; }) };
        for (; it != stack.end(); ++it) {
          cycle.push_back(modules_[it->index]->display_name());
        }
        cycle.push_back(modules_[target]->display_name());
        throw std::runtime_error("Cycle detected: " + util_join(cycle, " -> "));
      }

      marks[target] = mark::visiting;
      stack.push_back(frame{ target, unique_targets(*modules_[target]), 0 });
    }
  }

  return order;
}

template <typename ctx_t>
void module_graph::traverse(std::string const &pass,
                            graph_phase phase,
                            direction dir,
                            bool parallel,
                            std::function<std::unique_ptr<ctx_t>(module &)> const &make_ctx,
                            std::function<void(ctx_t &)> const &fn) {
  auto const order{ topological_order() };
  pass_trace_scope trace_scope{ pass, phase, std::chrono::steady_clock::now() };

  std::vector<std::unique_ptr<ctx_t>> ctxs;
  ctxs.reserve(modules_.size());
  for (auto const &m : modules_) { ctxs.push_back(make_ctx(*m)); }

  std::atomic<std::int64_t> visited{ 0 };
  auto const visit{ [&](std::size_t i) {
    if (modules_[i]->failed_) { return; }
    visited.fetch_add(1, std::memory_order_relaxed);
    try {
      fn(*ctxs[i]);
    } catch (std::exception const &e) {
      ctxs[i]->module_error(pass + ": " + e.what());
    }
  } };

  if (parallel) {
    using node_t = tbb::flow::continue_node<tbb::flow::continue_msg>;

    tbb::flow::graph g;
    std::vector<std::unique_ptr<node_t>> nodes;
    nodes.reserve(modules_.size());
    for (std::size_t i{ 0 }; i < modules_.size(); ++i) {
      nodes.push_back(std::make_unique<node_t>(
          g,
          [&visit, i](tbb::flow::continue_msg const &) { visit(i); }));
    }

    std::vector<bool> has_predecessor(modules_.size(), false);
    for (std::size_t i{ 0 }; i < modules_.size(); ++i) {
      for (auto const target : unique_targets(*modules_[i])) {
        if (dir == direction::bottom_up) {
          tbb::flow::make_edge(*nodes[target], *nodes[i]);
          has_predecessor[i] = true;
        } else {
          tbb::flow::make_edge(*nodes[i], *nodes[target]);
          has_predecessor[target] = true;
        }
      }
    }

    for (std::size_t i{ 0 }; i < nodes.size(); ++i) {
      if (!has_predecessor[i]) { nodes[i]->try_put(tbb::flow::continue_msg{}); }
    }
    g.wait_for_all();
  } else if (dir == direction::bottom_up) {
    for (auto const i : order) { visit(i); }
  } else {
    for (auto it{ order.rbegin() }; it != order.rend(); ++it) { visit(*it); }
  }

  trace_scope.modules_visited = visited.load();

  for (std::size_t i{ 0 }; i < modules_.size(); ++i) {
    auto &ctx{ *ctxs[i] };
    if (!modules_[i]->failed_) { ctx.run_deferred(); }
    record_errors(*modules_[i], ctx.errors());
    if constexpr (std::is_same_v<ctx_t, bottom_up_ctx>) {
      if (!ctx.failed()) { apply_intents(ctx); }
    }
  }
}

void module_graph::run_bottom_up(std::string const &pass,
                                 graph_phase phase,
                                 bottom_up_mutator_t const &fn,
                                 bool parallel) {
  traverse<bottom_up_ctx>(
      pass,
      phase,
      direction::bottom_up,
      parallel,
      [this](module &m) { return std::make_unique<bottom_up_ctx>(*this, m); },
      fn);
}

void module_graph::run_top_down(std::string const &pass,
                                graph_phase phase,
                                top_down_mutator_t const &fn,
                                bool parallel) {
  traverse<top_down_ctx>(
      pass,
      phase,
      direction::top_down,
      parallel,
      [this](module &m) { return std::make_unique<top_down_ctx>(*this, m); },
      fn);
}

void module_graph::run_mutators(register_mutators_ctx const &mutators, graph_phase phase) {
  for (auto const &registration : mutators.mutators()) {
    tui::debug("running %s mutator %s",
               std::string{ graph_phase_name(phase) }.c_str(),
               registration.name.c_str());
    std::visit(match{
                   [&](top_down_mutator_t const &fn) {
                     run_top_down(registration.name, phase, fn, registration.run_parallel);
                   },
                   [&](bottom_up_mutator_t const &fn) {
                     run_bottom_up(registration.name, phase, fn, registration.run_parallel);
                   },
               },
               registration.fn);
  }
}

void module_graph::run_deps() {
  run_bottom_up("deps", graph_phase::deps, [](bottom_up_ctx &ctx) {
    ctx.this_module().declare_deps(ctx);
  });
}

void module_graph::run_build_actions(snapshot_builder const &snapshots) {
  traverse<build_ctx>(
      "build_actions",
      graph_phase::build_actions,
      direction::bottom_up,
      true,
      [this, &snapshots](module &m) {
        return std::make_unique<build_ctx>(*this, m, snapshots);
      },
      [](build_ctx &ctx) { ctx.this_module().generate_build_actions(ctx); });
}

void module_graph::record_errors(module &m, std::vector<diagnostic> const &errors) {
  if (errors.empty()) { return; }

  m.failed_ = true;
  for (auto const &error : errors) {
    SDKGRAPH_TRACE_MODULE_FAILED(m.name(), m.variant(), error.message);
    tui::debug("%s", error.to_string().c_str());
    diagnostics_.push_back(error);
  }
}

void module_graph::apply_intents(bottom_up_ctx const &ctx) {
  auto &self{ ctx.this_module() };

  std::vector<diagnostic> errors;
  auto const fail{ [&](std::string message) {
    errors.push_back(diagnostic{ .module = self.name(),
                                 .variant = self.variant(),
                                 .property = {},
                                 .message = std::move(message) });
  } };

  for (auto const &intent : ctx.intents()) {
    std::visit(
        match{
            [&](bottom_up_ctx::add_intent const &i) {
              if (auto *target{ resolve(i.name, self.variant()) }) {
                add_dependency(self, i.tag, *target);
              } else {
                fail("depends on undefined module " + util_quote(i.name));
              }
            },
            [&](bottom_up_ctx::reverse_intent const &i) {
              auto *source{ resolve(i.name, self.variant()) };
              if (!source) {
                fail("reverse dependency on undefined module " + util_quote(i.name));
              } else if (source == &self) {
                fail("module cannot depend on itself");
              } else {
                add_dependency(*source, i.tag, self);
              }
            },
            [&](bottom_up_ctx::replace_intent const &i) {
              for (auto const &m : modules_) {
                if (m.get() == &self) { continue; }
                if (resolve(self.name(), m->variant()) != &self) { continue; }
                if (i.accepts && !i.accepts(*m)) { continue; }
                for (auto &dep : m->deps_) {
                  if (dep.target == &self || dependency_tag_is_sdk_structural(dep.tag)) {
                    continue;
                  }
                  if (dep.target->name() != i.name) { continue; }
                  SDKGRAPH_TRACE_DEPENDENCY_REPLACED(m->name(),
                                                     dep.target->name(),
                                                     self.name(),
                                                     self.variant());
                  dep.target = &self;
                }
              }
            },
        },
        intent);
  }

  record_errors(self, errors);
}

}  // namespace sdkgraph
