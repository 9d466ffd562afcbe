#include "module_graph.h"

#include "mutator_ctx.h"
#include "test_support.h"

#include "doctest.h"

#include <cstddef>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

using sdkgraph::test::graph_fixture;

namespace {

// Records the order in which a pass visits modules.
struct visit_log {
  std::mutex mutex;
  std::vector<std::string> names;

  void push(std::string const &name) {
    std::lock_guard const lock{ mutex };
    names.push_back(name);
  }
};

}  // namespace

TEST_CASE_FIXTURE(graph_fixture, "module_graph finds modules by name and variant") {
  auto &common{ cc({ .name = "libfoo" }) };
  auto &in_apex{ cc({ .name = "libfoo" }, "myapex") };
  auto &other{ cc({ .name = "libbar" }, "otherapex") };

  CHECK(graph.size() == 3);
  CHECK(graph.find("libfoo", "") == &common);
  CHECK(graph.find("libfoo", "myapex") == &in_apex);
  CHECK(graph.find("libbar", "") == nullptr);
  CHECK(graph.modules_named("libfoo").size() == 2);

  CHECK(graph.resolve("libfoo", "myapex") == &in_apex);
  CHECK(graph.resolve("libfoo", "otherapex") == &common);
  CHECK(graph.resolve("libbar", "otherapex") == &other);
  CHECK(graph.resolve("libbar", "myapex") == nullptr);
}

TEST_CASE_FIXTURE(graph_fixture, "module_graph rejects duplicate name and variant") {
  cc({ .name = "libfoo" }, "myapex");
  CHECK_NOTHROW(cc({ .name = "libfoo" }, "otherapex"));
  CHECK_THROWS_WITH_AS(cc({ .name = "libfoo" }, "myapex"),
                       "module \"libfoo [myapex]\" is defined more than once",
                       std::runtime_error);
}

TEST_CASE_FIXTURE(graph_fixture, "module_graph reports dependency cycles") {
  cc({ .name = "a", .deps = { "b" } });
  cc({ .name = "b", .deps = { "a" } });
  run_deps();

  CHECK_THROWS_WITH_AS(graph.topological_order(),
                       "Cycle detected: a -> b -> a",
                       std::runtime_error);
}

TEST_CASE_FIXTURE(graph_fixture, "module_graph orders a self-contained graph") {
  cc({ .name = "a", .deps = { "b", "c" } });
  cc({ .name = "b", .deps = { "c" } });
  cc({ .name = "c" });
  run_deps();

  auto const order{ graph.topological_order() };
  REQUIRE(order.size() == 3);
  CHECK(graph.modules()[order[0]]->name() == "c");
  CHECK(graph.modules()[order[1]]->name() == "b");
  CHECK(graph.modules()[order[2]]->name() == "a");
}

TEST_CASE_FIXTURE(graph_fixture, "bottom-up passes visit dependencies first") {
  cc({ .name = "a", .deps = { "b" } });
  cc({ .name = "b", .deps = { "c" } });
  cc({ .name = "c" });
  run_deps();

  for (bool const parallel : { true, false }) {
    CAPTURE(parallel);
    visit_log log;
    graph.run_bottom_up(
        "record",
        sdkgraph::graph_phase::post_deps,
        [&](sdkgraph::bottom_up_ctx &ctx) { log.push(ctx.module_name()); },
        parallel);
    CHECK(log.names == std::vector<std::string>{ "c", "b", "a" });
  }
}

TEST_CASE_FIXTURE(graph_fixture, "top-down passes visit dependents first") {
  cc({ .name = "a", .deps = { "b" } });
  cc({ .name = "b", .deps = { "c" } });
  cc({ .name = "c" });
  run_deps();

  for (bool const parallel : { true, false }) {
    CAPTURE(parallel);
    visit_log log;
    graph.run_top_down(
        "record",
        sdkgraph::graph_phase::post_deps,
        [&](sdkgraph::top_down_ctx &ctx) { log.push(ctx.module_name()); },
        parallel);
    CHECK(log.names == std::vector<std::string>{ "a", "b", "c" });
  }
}

TEST_CASE_FIXTURE(graph_fixture, "diamond dependencies are visited once per pass") {
  cc({ .name = "top", .deps = { "left", "right" } });
  cc({ .name = "left", .deps = { "bottom" } });
  cc({ .name = "right", .deps = { "bottom", "bottom" } });
  cc({ .name = "bottom" });
  run_deps();

  visit_log log;
  graph.run_top_down("record",
                     sdkgraph::graph_phase::post_deps,
                     [&](sdkgraph::top_down_ctx &ctx) { log.push(ctx.module_name()); });

  REQUIRE(log.names.size() == 4);
  CHECK(log.names.front() == "top");
  CHECK(log.names.back() == "bottom");
}

TEST_CASE_FIXTURE(graph_fixture, "exceptions in a pass become module errors") {
  cc({ .name = "a" });
  cc({ .name = "b" });

  graph.run_bottom_up("Explode",
                      sdkgraph::graph_phase::pre_deps,
                      [](sdkgraph::bottom_up_ctx &ctx) {
                        if (ctx.module_name() == "a") { throw std::runtime_error("boom"); }
                      });

  CHECK(errors() == std::vector<std::string>{ "module \"a\": Explode: boom" });
  CHECK(get("a").failed());
  CHECK_FALSE(get("b").failed());
}

TEST_CASE_FIXTURE(graph_fixture, "failed modules are skipped by later passes") {
  cc({ .name = "a" });
  cc({ .name = "b" });

  graph.run_top_down("Fail",
                     sdkgraph::graph_phase::pre_deps,
                     [](sdkgraph::top_down_ctx &ctx) {
                       if (ctx.module_name() == "a") { ctx.property_error("deps", "bad"); }
                     });

  visit_log log;
  graph.run_top_down("record",
                     sdkgraph::graph_phase::post_deps,
                     [&](sdkgraph::top_down_ctx &ctx) { log.push(ctx.module_name()); });

  CHECK(errors() == std::vector<std::string>{ "module \"a\": deps: bad" });
  CHECK(log.names == std::vector<std::string>{ "b" });
}

TEST_CASE_FIXTURE(graph_fixture, "edge requests are applied after the pass") {
  cc({ .name = "a" });
  cc({ .name = "b" });
  cc({ .name = "c" });

  visit_log seen_edges;
  graph.run_bottom_up("Link",
                      sdkgraph::graph_phase::pre_deps,
                      [&](sdkgraph::bottom_up_ctx &ctx) {
                        if (ctx.module_name() == "a") {
                          ctx.add_dependencies(sdkgraph::dependency_tags::plain{}, { "b" });
                          ctx.add_reverse_dependency(sdkgraph::dependency_tags::stubs{}, "c");
                        }
                        ctx.visit_direct_deps([&](sdkgraph::module &dep,
                                                  sdkgraph::dependency_tag const &) {
                          seen_edges.push(dep.name());
                        });
                      });

  CHECK(seen_edges.names.empty());
  CHECK(edges_of("a") == std::vector<std::string>{ "b plain" });
  CHECK(edges_of("c") == std::vector<std::string>{ "a stubs" });
}

TEST_CASE_FIXTURE(graph_fixture, "edge requests resolve through the common variant") {
  cc({ .name = "libcommon" });
  cc({ .name = "libfoo", .deps = { "libcommon", "libvariant" } }, "myapex");
  cc({ .name = "libvariant" }, "myapex");
  cc({ .name = "libvariant" });

  run_deps();

  CHECK(errors().empty());
  CHECK(edges_of("libfoo", "myapex") ==
        std::vector<std::string>{ "libcommon plain", "libvariant [myapex] plain" });
}

TEST_CASE_FIXTURE(graph_fixture, "edge requests report missing and self targets") {
  cc({ .name = "a" });

  graph.run_bottom_up("Link",
                      sdkgraph::graph_phase::pre_deps,
                      [](sdkgraph::bottom_up_ctx &ctx) {
                        ctx.add_dependencies(sdkgraph::dependency_tags::plain{}, { "nope" });
                        ctx.add_reverse_dependency(sdkgraph::dependency_tags::plain{}, "gone");
                        ctx.add_reverse_dependency(sdkgraph::dependency_tags::plain{}, "a");
                      });

  CHECK(errors() == std::vector<std::string>{
                        "module \"a\": depends on undefined module \"nope\"",
                        "module \"a\": reverse dependency on undefined module \"gone\"",
                        "module \"a\": module cannot depend on itself",
                    });
  CHECK(edges_of("a").empty());
}

TEST_CASE_FIXTURE(graph_fixture, "edge requests from a failed module are dropped") {
  cc({ .name = "a" });
  cc({ .name = "b" });

  graph.run_bottom_up("Link",
                      sdkgraph::graph_phase::pre_deps,
                      [](sdkgraph::bottom_up_ctx &ctx) {
                        if (ctx.module_name() != "a") { return; }
                        ctx.add_dependencies(sdkgraph::dependency_tags::plain{}, { "b" });
                        ctx.module_error("rejected");
                      });

  CHECK(errors() == std::vector<std::string>{ "module \"a\": rejected" });
  CHECK(edges_of("a").empty());
}

TEST_CASE_FIXTURE(graph_fixture, "replacement rewires ordinary edges in the same variant") {
  cc({ .name = "consumer", .deps = { "libfoo" }, .stub_deps = { "libfoo" } }, "v");
  cc({ .name = "elsewhere", .deps = { "libfoo" } }, "w");
  cc({ .name = "libfoo" }, "v");
  cc({ .name = "libfoo" }, "w");
  cc({ .name = "libfoo_copy" }, "v");
  run_deps();

  graph.run_bottom_up("Replace",
                      sdkgraph::graph_phase::post_deps,
                      [](sdkgraph::bottom_up_ctx &ctx) {
                        if (ctx.module_name() == "libfoo_copy") {
                          ctx.replace_dependencies("libfoo");
                        }
                      });

  CHECK(errors().empty());
  CHECK(edges_of("consumer", "v") == std::vector<std::string>{ "libfoo_copy [v] plain",
                                                               "libfoo_copy [v] stubs" });
  CHECK(edges_of("elsewhere", "w") == std::vector<std::string>{ "libfoo [w] plain" });
}

TEST_CASE_FIXTURE(graph_fixture, "replacement leaves sdk structure intact") {
  sdk("mysdk", { .native_shared_libs = { "libfoo" } });
  cc({ .name = "libfoo" });
  cc({ .name = "libfoo_copy" });
  run_pre_deps();

  graph.run_bottom_up("Replace",
                      sdkgraph::graph_phase::post_deps,
                      [](sdkgraph::bottom_up_ctx &ctx) {
                        if (ctx.module_name() == "libfoo_copy") {
                          ctx.replace_dependencies("libfoo");
                        }
                      });

  CHECK(edges_of("mysdk") ==
        std::vector<std::string>{ "libfoo sdk_member(native_shared_libs)" });
}

TEST_CASE_FIXTURE(graph_fixture, "replacement from the common variant reaches variant dependents") {
  cc({ .name = "consumer", .deps = { "libfoo" } }, "v");
  cc({ .name = "shadowed", .deps = { "libfoo" } }, "w");
  cc({ .name = "libfoo_copy" }, "w");
  cc({ .name = "libfoo" });
  cc({ .name = "libfoo_copy" });
  run_deps();

  graph.run_bottom_up("Replace",
                      sdkgraph::graph_phase::post_deps,
                      [](sdkgraph::bottom_up_ctx &ctx) {
                        if (ctx.module_name() == "libfoo_copy" && ctx.variant().empty()) {
                          ctx.replace_dependencies("libfoo");
                        }
                      });

  CHECK(edges_of("consumer", "v") == std::vector<std::string>{ "libfoo_copy plain" });
  CHECK(edges_of("shadowed", "w") == std::vector<std::string>{ "libfoo plain" });
}

TEST_CASE_FIXTURE(graph_fixture, "replacement honors the dependent filter") {
  cc({ .name = "wanted", .deps = { "libfoo" } });
  cc({ .name = "unwanted", .deps = { "libfoo" } });
  cc({ .name = "libfoo" });
  cc({ .name = "libfoo_copy" });
  run_deps();

  graph.run_bottom_up("Replace",
                      sdkgraph::graph_phase::post_deps,
                      [](sdkgraph::bottom_up_ctx &ctx) {
                        if (ctx.module_name() != "libfoo_copy") { return; }
                        ctx.replace_dependencies("libfoo", [](sdkgraph::module &dependent) {
                          return dependent.name() == "wanted";
                        });
                      });

  CHECK(edges_of("wanted") == std::vector<std::string>{ "libfoo_copy plain" });
  CHECK(edges_of("unwanted") == std::vector<std::string>{ "libfoo plain" });
}

TEST_CASE_FIXTURE(graph_fixture, "deferred actions run in registration order after the pass") {
  for (int i{ 0 }; i < 16; ++i) { cc({ .name = "lib" + std::to_string(i) }); }

  std::vector<std::string> order;
  graph.run_top_down("Defer",
                     sdkgraph::graph_phase::pre_deps,
                     [&order](sdkgraph::top_down_ctx &ctx) {
                       ctx.defer([&order](sdkgraph::module_ctx &c) {
                         order.push_back(c.module_name());
                       });
                     });

  REQUIRE(order.size() == 16);
  for (std::size_t i{ 0 }; i < order.size(); ++i) {
    CHECK(order[i] == "lib" + std::to_string(i));
  }
}

TEST_CASE_FIXTURE(graph_fixture, "deferred actions of a failed module are dropped") {
  cc({ .name = "a" });
  cc({ .name = "b" });

  std::vector<std::string> ran;
  graph.run_top_down("Defer",
                     sdkgraph::graph_phase::pre_deps,
                     [&ran](sdkgraph::top_down_ctx &ctx) {
                       ctx.defer([&ran](sdkgraph::module_ctx &c) {
                         ran.push_back(c.module_name());
                         if (c.module_name() == "b") { c.module_error("late"); }
                       });
                       if (ctx.module_name() == "a") { ctx.module_error("early"); }
                     });

  CHECK(ran == std::vector<std::string>{ "b" });
  CHECK(errors() == std::vector<std::string>{ "module \"a\": early", "module \"b\": late" });
  CHECK(get("b").failed());
}
